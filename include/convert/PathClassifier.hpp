#pragma once
#include <string>

namespace w2n {

// Heuristic: does `s` plausibly hold a Windows path worth converting?
// Accepts a drive prefix (C:\ or C:/), any two "pathy" segments joined by a
// single backslash, or a segment\segment.ext file shape. Segments are runs of
// letters, digits, '_', '-', ' ' and '.'; anything else (eg. '@', '+') is
// not recognized, so some exotic paths are rejected and some non-paths pass.
bool looksLikePath(const std::string& s);

// True for the characters allowed inside a pathy segment.
inline bool isPathyChar(char c) {
  return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
         (c >= '0' && c <= '9') || c == '_' || c == '-' || c == ' ' || c == '.';
}

} // namespace w2n
