// semtok/highlight/token_merger.cpp - Injection splicing
#include "semtok/highlight/token_merger.hpp"

#include <algorithm>

namespace semtok
{

namespace
{

/// Parent tokens with `region` carved out.
std::vector<Token> carve_out(std::vector<Token> tokens, SourceRange region)
{
  std::vector<Token> out;
  out.reserve(tokens.size());
  for (auto & t : tokens) {
    if (region.contains(t.range)) {
      continue;
    }
    if (!t.range.intersects(region)) {
      out.push_back(std::move(t));
      continue;
    }
    if (t.range.start < region.start) {
      out.push_back(Token{t.range.before(region), t.type, t.modifiers});
    }
    if (region.end < t.range.end) {
      out.push_back(Token{t.range.after(region), t.type, t.modifiers});
    }
  }
  return out;
}

}  // namespace

std::vector<Token> merge_injections(
  std::vector<Token> parent_tokens, gsl::span<const Injection> injections)
{
  std::vector<Token> merged = std::move(parent_tokens);
  for (const auto & inj : injections) {
    // An injection that resolved to nothing keeps the base highlighting.
    if (inj.tokens.empty()) continue;
    merged = carve_out(std::move(merged), inj.range);
  }
  for (const auto & inj : injections) {
    merged.insert(merged.end(), inj.tokens.begin(), inj.tokens.end());
  }
  return merged;
}

void sort_tokens(std::vector<Token> & tokens)
{
  std::stable_sort(tokens.begin(), tokens.end(), [](const Token & a, const Token & b) {
    return a.range.start < b.range.start;
  });
}

}  // namespace semtok
