#include "convert/Slashify.hpp"
#include "convert/PathClassifier.hpp"

namespace w2n {

static bool isEscapeLetter(char c) {
  switch (c) {
  case '"': case '\'': case 'n': case 'r': case 't': case 'b': case 'f':
    return true;
  default:
    return false;
  }
}

std::string slashify(const std::string& content) {
  std::string out;
  out.reserve(content.size());
  const size_t n = content.size();
  size_t i = 0;
  while (i < n) {
    char c = content[i];
    if (c != '\\') {
      out.push_back(c);
      ++i;
      continue;
    }
    bool hasNext = i + 1 < n;
    char next = hasNext ? content[i + 1] : '\0';
    if (hasNext && next == '\\') {
      out.push_back('/');
      i += 2;
    } else if (hasNext && isEscapeLetter(next)) {
      out.push_back('\\');
      out.push_back(next);
      i += 2;
    } else if (hasNext && isPathyChar(next)) {
      out.push_back('/');
      ++i;
    } else {
      out.push_back('\\');
      ++i;
    }
  }
  return out;
}

} // namespace w2n
