#include "convert/Transform.hpp"
#include "convert/PathClassifier.hpp"
#include "convert/Slashify.hpp"

#include <vector>

namespace w2n {

static bool isQuote(char c) { return c == '"' || c == '\''; }

static bool isAsciiLetter(char c) {
  return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
}

// [A-Za-z0-9_.-]
static bool isTokenChar(char c) {
  return isPathyChar(c) && c != ' ';
}

// Length of a quoted literal opening at `start`, or 0 if it never closes.
static size_t quotedLengthAt(const std::string& text, size_t start) {
  const char quote = text[start];
  size_t i = start + 1;
  while (i < text.size()) {
    char c = text[i];
    if (c == '\\') {
      if (i + 1 >= text.size()) return 0; // dangling escape
      i += 2;
    } else if (c == quote) {
      return i + 1 - start;
    } else {
      ++i;
    }
  }
  return 0;
}

std::optional<CandidateSpan> findQuotedSpan(const std::string& text, size_t from) {
  for (size_t i = from; i < text.size(); ++i) {
    if (!isQuote(text[i])) continue;
    if (size_t len = quotedLengthAt(text, i)) {
      CandidateSpan span;
      span.offset = i;
      span.length = len;
      span.quote = text[i];
      return span;
    }
  }
  return std::nullopt;
}

static bool quoteAt(const std::string& text, size_t pos) {
  return pos < text.size() && isQuote(text[pos]);
}

// Byte length of the whitespace character at `pos`, or 0. Besides ASCII
// \t\n\v\f\r and space this covers the \x1c-\x1f separators and the
// UTF-8 encoded Unicode spaces (U+0085, U+00A0, U+1680, U+2000-U+200A,
// U+2028, U+2029, U+202F, U+205F, U+3000).
static size_t whitespaceLengthAt(const std::string& text, size_t pos) {
  auto byte = [&](size_t k) -> unsigned char {
    return pos + k < text.size() ? (unsigned char)text[pos + k] : 0;
  };
  unsigned char b0 = byte(0);
  if (b0 == ' ' || (b0 >= 0x09 && b0 <= 0x0D) || (b0 >= 0x1C && b0 <= 0x1F))
    return 1;
  if (b0 == 0xC2 && (byte(1) == 0x85 || byte(1) == 0xA0)) return 2;
  if (b0 == 0xE1 && byte(1) == 0x9A && byte(2) == 0x80) return 3;
  if (b0 == 0xE2 && byte(1) == 0x80) {
    unsigned char b2 = byte(2);
    if ((b2 >= 0x80 && b2 <= 0x8A) || b2 == 0xA8 || b2 == 0xA9 || b2 == 0xAF)
      return 3;
  }
  if (b0 == 0xE2 && byte(1) == 0x81 && byte(2) == 0x9F) return 3;
  if (b0 == 0xE3 && byte(1) == 0x80 && byte(2) == 0x80) return 3;
  return 0;
}

static bool isContinuationByte(char c) {
  return ((unsigned char)c & 0xC0) == 0x80;
}

// Drive form: X:\ followed by a maximal run of non-space, non-quote
// characters. On a trailing quote, back off one character (not one byte)
// as a backtracking matcher would.
static size_t driveTokenEnd(const std::string& text, size_t start) {
  if (start + 3 >= text.size()) return 0;
  if (!isAsciiLetter(text[start]) || text[start + 1] != ':' || text[start + 2] != '\\')
    return 0;
  size_t runBegin = start + 3;
  size_t runEnd = runBegin;
  while (runEnd < text.size() && !whitespaceLengthAt(text, runEnd) &&
         !isQuote(text[runEnd]))
    ++runEnd;
  if (runEnd == runBegin) return 0;
  if (!quoteAt(text, runEnd)) return runEnd;
  size_t lastChar = runEnd - 1;
  while (lastChar > runBegin && isContinuationByte(text[lastChar])) --lastChar;
  return lastChar > runBegin ? lastChar : 0;
}

// Segment form: (seg\)+seg. Tries the most segments first, then shorter
// final segments, rejecting ends that sit right before a quote.
static size_t segmentTokenEnd(const std::string& text, size_t start) {
  // groupEnds[k] = offset just past the (k+1)-th "seg\" group
  std::vector<size_t> groupEnds;
  size_t i = start;
  for (;;) {
    size_t segEnd = i;
    while (segEnd < text.size() && isTokenChar(text[segEnd])) ++segEnd;
    if (segEnd == i || segEnd >= text.size() || text[segEnd] != '\\') break;
    i = segEnd + 1;
    groupEnds.push_back(i);
  }
  for (size_t g = groupEnds.size(); g > 0; --g) {
    size_t finalBegin = groupEnds[g - 1];
    size_t finalEnd = finalBegin;
    while (finalEnd < text.size() && isTokenChar(text[finalEnd])) ++finalEnd;
    size_t run = finalEnd - finalBegin;
    if (run == 0) continue;
    if (!quoteAt(text, finalEnd)) return finalEnd;
    if (run >= 2) return finalEnd - 1;
  }
  return 0;
}

std::optional<CandidateSpan> findUnquotedToken(const std::string& text, size_t from) {
  for (size_t i = from; i < text.size(); ++i) {
    if (i > 0 && isQuote(text[i - 1])) continue;
    size_t end = driveTokenEnd(text, i);
    if (!end) end = segmentTokenEnd(text, i);
    if (!end) continue;
    CandidateSpan span;
    span.offset = i;
    span.length = end - i;
    return span;
  }
  return std::nullopt;
}

TransformResult transformQuoted(const std::string& text) {
  TransformResult res;
  res.text.reserve(text.size());
  size_t lastEnd = 0;
  while (auto span = findQuotedSpan(text, lastEnd)) {
    res.text.append(text, lastEnd, span->offset - lastEnd);
    std::string content = span->content(text);
    if (looksLikePath(content)) {
      std::string converted = slashify(content);
      if (converted != content) {
        ++res.replacements;
        content = std::move(converted);
      }
    }
    res.text += span->quote;
    res.text += content;
    res.text += span->quote;
    lastEnd = span->end();
  }
  res.text.append(text, lastEnd, std::string::npos);
  return res;
}

TransformResult transformAggressive(const std::string& text) {
  TransformResult quoted = transformQuoted(text);
  const std::string& mid = quoted.text;

  TransformResult res;
  res.replacements = quoted.replacements;
  res.text.reserve(mid.size());
  size_t lastEnd = 0;
  while (auto span = findUnquotedToken(mid, lastEnd)) {
    res.text.append(mid, lastEnd, span->offset - lastEnd);
    std::string token = span->content(mid);
    if (looksLikePath(token)) {
      res.text += slashify(token);
      ++res.replacements;
    } else {
      res.text += token;
    }
    lastEnd = span->end();
  }
  res.text.append(mid, lastEnd, std::string::npos);
  return res;
}

} // namespace w2n
