#include <gtest/gtest.h>

#include <nlohmann/json.hpp>
#include <vector>

#include "semtok/highlight/legend.hpp"
#include "semtok/highlight/semantic_tokens.hpp"

using semtok::default_legend;
using semtok::encode_semantic_tokens;
using semtok::SourceRange;
using semtok::Token;

TEST(HighlightLegend, DefaultLegendIsPositional)
{
  const auto & legend = default_legend();
  ASSERT_EQ(legend.token_types.size(), 23U);
  ASSERT_EQ(legend.token_modifiers.size(), 10U);
  EXPECT_EQ(legend.token_types.front(), "namespace");
  EXPECT_EQ(legend.token_types.back(), "operator");
  EXPECT_EQ(legend.type_index("keyword").value_or(999U), 19U);
  EXPECT_FALSE(legend.type_index("punctuation").has_value());

  EXPECT_TRUE(legend.has_modifier("readonly"));
  EXPECT_EQ(legend.modifier_bitmask({"declaration", "readonly", "bogus"}), 0b101U);
}

TEST(HighlightSemanticTokens, EncodesRelativePositions)
{
  const std::vector<Token> tokens = {
    Token{SourceRange(0, 0, 0, 3), "keyword", {}},
    Token{SourceRange(0, 4, 0, 5), "variable", {"declaration"}},
    Token{SourceRange(2, 2, 2, 8), "string", {}},
  };
  const auto data = encode_semantic_tokens(tokens, default_legend());

  const std::vector<uint32_t> expected = {
    0, 0, 3, 19, 0,  //
    0, 4, 1, 8, 1,   //
    2, 2, 6, 18, 0,  //
  };
  EXPECT_EQ(data, expected);
}

TEST(HighlightSemanticTokens, SkipsUnencodableTokens)
{
  const std::vector<Token> tokens = {
    Token{SourceRange(0, 0, 1, 3), "comment", {}},  // multi-line
    Token{SourceRange(0, 4, 0, 4), "keyword", {}},  // empty
    Token{SourceRange(0, 5, 0, 6), "mystery", {}},  // not in legend
    Token{SourceRange(1, 1, 1, 2), "number", {}},
  };
  const auto data = encode_semantic_tokens(tokens, default_legend());
  const std::vector<uint32_t> expected = {1, 1, 1, 20, 0};
  EXPECT_EQ(data, expected);
}

TEST(HighlightSemanticTokens, TokenJsonUsesLspPositionNames)
{
  const Token t{SourceRange(1, 2, 1, 5), "function", {"async"}};
  const nlohmann::json j = t;

  EXPECT_EQ(j["type"], "function");
  EXPECT_EQ(j["modifiers"], nlohmann::json::array({"async"}));
  EXPECT_EQ(j["range"]["start"]["line"], 1);
  EXPECT_EQ(j["range"]["start"]["character"], 2);
  EXPECT_EQ(j["range"]["end"]["character"], 5);

  const auto legend = semtok::legend_to_json(default_legend());
  EXPECT_EQ(legend["tokenTypes"].size(), 23U);
  EXPECT_EQ(legend["tokenModifiers"][0], "declaration");
}
