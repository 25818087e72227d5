#include "convert/Rewriter.hpp"

namespace w2n {

namespace {

class QuotedRewriter final : public Rewriter {
public:
  TransformResult rewrite(const std::string& text) const override {
    return transformQuoted(text);
  }
  const char* name() const override { return "quoted"; }
};

class AggressiveRewriter final : public Rewriter {
public:
  TransformResult rewrite(const std::string& text) const override {
    return transformAggressive(text);
  }
  const char* name() const override { return "aggressive"; }
};

} // namespace

std::unique_ptr<Rewriter> makeQuotedRewriter() {
  return std::make_unique<QuotedRewriter>();
}

std::unique_ptr<Rewriter> makeAggressiveRewriter() {
  return std::make_unique<AggressiveRewriter>();
}

} // namespace w2n
