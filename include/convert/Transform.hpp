#pragma once
#include <cstddef>
#include <optional>
#include <string>

namespace w2n {

struct TransformResult {
  std::string text;
  unsigned    replacements = 0;
};

// A candidate match inside a text buffer. offset/length cover the whole
// match, delimiting quotes included; quote is '\0' for unquoted tokens.
struct CandidateSpan {
  size_t offset = 0;
  size_t length = 0;
  char   quote  = '\0';

  size_t end() const { return offset + length; }
  // Content between the delimiters (the whole token when unquoted).
  std::string content(const std::string& text) const {
    if (!quote) return text.substr(offset, length);
    return text.substr(offset + 1, length - 2);
  }
};

// Leftmost quoted string literal starting at or after `from`.
std::optional<CandidateSpan> findQuotedSpan(const std::string& text, size_t from);

// Leftmost unquoted path-like token starting at or after `from`: either
// X:\<non-space, non-quote>+ or seg\seg[\seg...] with seg = [A-Za-z0-9_.-]+.
// Never starts right after a quote and never ends right before one.
std::optional<CandidateSpan> findUnquotedToken(const std::string& text, size_t from);

// Convert path-like contents of quoted strings. Counts only contents that
// actually changed.
TransformResult transformQuoted(const std::string& text);

// transformQuoted, then convert unquoted tokens too. Every unquoted token
// accepted by looksLikePath is counted, changed or not.
TransformResult transformAggressive(const std::string& text);

} // namespace w2n
