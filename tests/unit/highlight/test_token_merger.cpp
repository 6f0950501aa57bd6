#include <gtest/gtest.h>

#include <vector>

#include "semtok/highlight/token_merger.hpp"

using semtok::Injection;
using semtok::merge_injections;
using semtok::sort_tokens;
using semtok::SourceRange;
using semtok::Token;

namespace
{

Token tok(uint32_t sl, uint32_t sc, uint32_t el, uint32_t ec, std::string type)
{
  return Token{SourceRange(sl, sc, el, ec), std::move(type), {}};
}

}  // namespace

TEST(HighlightTokenMerger, InjectionSplitsStraddlingParentToken)
{
  const std::vector<Injection> injections = {
    Injection{SourceRange(1, 5, 1, 10), {tok(1, 5, 1, 10, "embedded")}},
  };
  auto out = merge_injections({tok(1, 0, 1, 20, "string")}, injections);

  const std::vector<Token> unsorted = {
    tok(1, 0, 1, 5, "string"),
    tok(1, 10, 1, 20, "string"),
    tok(1, 5, 1, 10, "embedded"),
  };
  EXPECT_EQ(out, unsorted);

  sort_tokens(out);
  const std::vector<Token> sorted = {
    tok(1, 0, 1, 5, "string"),
    tok(1, 5, 1, 10, "embedded"),
    tok(1, 10, 1, 20, "string"),
  };
  EXPECT_EQ(out, sorted);
}

TEST(HighlightTokenMerger, ParentTokensInsideInjectionAreDropped)
{
  const std::vector<Injection> injections = {
    Injection{SourceRange(0, 4, 2, 0), {tok(1, 0, 1, 3, "keyword")}},
  };
  const auto out = merge_injections(
    {tok(0, 0, 0, 3, "keyword"), tok(0, 5, 0, 9, "variable"), tok(1, 0, 1, 6, "string")},
    injections);

  const std::vector<Token> expected = {
    tok(0, 0, 0, 3, "keyword"),
    tok(1, 0, 1, 3, "keyword"),
  };
  EXPECT_EQ(out, expected);
}

TEST(HighlightTokenMerger, OneSidedOverlapYieldsOneFragment)
{
  const std::vector<Injection> injections = {
    Injection{SourceRange(0, 5, 0, 10), {tok(0, 6, 0, 8, "number")}},
  };
  const auto out =
    merge_injections({tok(0, 0, 0, 7, "string"), tok(0, 8, 0, 15, "comment")}, injections);

  const std::vector<Token> expected = {
    tok(0, 0, 0, 5, "string"),
    tok(0, 10, 0, 15, "comment"),
    tok(0, 6, 0, 8, "number"),
  };
  EXPECT_EQ(out, expected);
}

TEST(HighlightTokenMerger, EmptyInjectionKeepsParentTokens)
{
  const std::vector<Injection> injections = {Injection{SourceRange(1, 5, 1, 10), {}}};
  const std::vector<Token> parent = {tok(1, 0, 1, 20, "string"), tok(1, 6, 1, 8, "number")};
  EXPECT_EQ(merge_injections(parent, injections), parent);
}

TEST(HighlightTokenMerger, InjectionsAppendInDiscoveryOrder)
{
  const std::vector<Injection> injections = {
    Injection{SourceRange(3, 0, 3, 4), {tok(3, 0, 3, 4, "function")}},
    Injection{SourceRange(1, 0, 1, 4), {tok(1, 0, 1, 4, "macro")}},
  };
  const auto out = merge_injections({tok(0, 0, 0, 2, "keyword")}, injections);

  ASSERT_EQ(out.size(), 3U);
  EXPECT_EQ(out[1].type, "function");
  EXPECT_EQ(out[2].type, "macro");
}

TEST(HighlightTokenMerger, SortIsStableForEqualStarts)
{
  std::vector<Token> tokens = {
    tok(2, 0, 2, 1, "a"),
    tok(0, 3, 0, 4, "b"),
    tok(0, 3, 0, 9, "c"),
    tok(0, 1, 0, 2, "d"),
  };
  sort_tokens(tokens);
  EXPECT_EQ(tokens[0].type, "d");
  EXPECT_EQ(tokens[1].type, "b");
  EXPECT_EQ(tokens[2].type, "c");
  EXPECT_EQ(tokens[3].type, "a");
}
