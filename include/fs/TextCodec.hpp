#pragma once
#include <optional>
#include <string>

namespace w2n {

// Strict UTF-8 validation (no overlongs, no surrogates).
bool isUtf8(const std::string& bytes);

// Decode raw file bytes into UTF-8 text: strict UTF-8 first, Latin-1 as a
// fallback. nullopt means the buffer could not be decoded at all.
std::optional<std::string> decodeText(const std::string& bytes);

// Re-encode single-byte Latin-1 into UTF-8.
std::string latin1ToUtf8(const std::string& bytes);

} // namespace w2n
