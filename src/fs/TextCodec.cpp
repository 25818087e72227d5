#include "fs/TextCodec.hpp"

#include "llvm/Support/ConvertUTF.h"

namespace w2n {

bool isUtf8(const std::string& bytes) {
  const auto* begin = reinterpret_cast<const llvm::UTF8*>(bytes.data());
  const auto* end = begin + bytes.size();
  return llvm::isLegalUTF8String(&begin, end);
}

std::string latin1ToUtf8(const std::string& bytes) {
  std::string out;
  out.reserve(bytes.size() + bytes.size() / 8);
  for (unsigned char c : bytes) {
    if (c < 0x80) {
      out.push_back((char)c);
    } else {
      out.push_back((char)(0xC0 | (c >> 6)));
      out.push_back((char)(0x80 | (c & 0x3F)));
    }
  }
  return out;
}

std::optional<std::string> decodeText(const std::string& bytes) {
  if (isUtf8(bytes)) return bytes;
  // Every byte is a valid Latin-1 code point.
  return latin1ToUtf8(bytes);
}

} // namespace w2n
