#include "convert/PathClassifier.hpp"

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Regex.h"

namespace w2n {

namespace {

// Pathy segment: [A-Za-z0-9_ .-]
const llvm::Regex& driveRe() {
  static const llvm::Regex re("^[A-Za-z]:[\\/]");
  return re;
}

const llvm::Regex& backslashSegRe() {
  static const llvm::Regex re("[A-Za-z0-9_ .-]+\\\\[A-Za-z0-9_ .-]+");
  return re;
}

const llvm::Regex& typicalFileRe() {
  static const llvm::Regex re(
      "[A-Za-z0-9_ .-]+\\\\[A-Za-z0-9_ .-]+\\.[A-Za-z0-9]{1,6}$");
  return re;
}

} // namespace

bool looksLikePath(const std::string& s) {
  if (s.find('\\') == std::string::npos || s.size() < 3) return false;
  if (driveRe().match(s)) return true;
  if (backslashSegRe().match(s)) return true;
  if (typicalFileRe().match(s)) return true;
  return false;
}

} // namespace w2n
