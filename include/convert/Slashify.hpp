#pragma once
#include <string>

namespace w2n {

// Rewrite path backslashes in `content` to '/', one left-to-right pass:
//   "\\"             -> "/"
//   \" \' \n \r \t \b \f  kept verbatim
//   '\' + pathy char -> '/' (the pathy char is examined again)
//   any other '\'    kept
// Total over all inputs; never throws.
std::string slashify(const std::string& content);

} // namespace w2n
