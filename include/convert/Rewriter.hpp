#pragma once
#include "convert/Transform.hpp"
#include <memory>
#include <string>

namespace w2n {

// What the file layer runs over each decoded buffer.
class Rewriter {
public:
  virtual ~Rewriter() = default;
  virtual TransformResult rewrite(const std::string& text) const = 0;
  virtual const char* name() const = 0;
};

// Quoted strings only (default).
std::unique_ptr<Rewriter> makeQuotedRewriter();

// Quoted strings, then unquoted path-like tokens.
std::unique_ptr<Rewriter> makeAggressiveRewriter();

inline std::unique_ptr<Rewriter> makeRewriter(bool aggressive) {
  return aggressive ? makeAggressiveRewriter() : makeQuotedRewriter();
}

} // namespace w2n
