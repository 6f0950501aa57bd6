#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "semtok/basic/error.hpp"
#include "semtok/highlight/highlighter.hpp"
#include "semtok/test_support/language_fixture.hpp"
#include "semtok/test_support/scripted_engine.hpp"

using semtok::HighlighterConfig;
using semtok::SourceRange;
using semtok::Token;
using semtok::test_support::make_language;
using semtok::test_support::ScriptedEngine;
using semtok::test_support::TempWorkspace;

namespace
{

// A host language that embeds "js" between <js> tags and in {{ }} blocks.
constexpr std::string_view k_host_highlights = R"q(\b(let)\b -> @keyword
"[^"]*" -> @string
)q";

constexpr std::string_view k_host_injections = R"q(<js>([^<]*)</js> -> @js
\{\{([^}]*)\}\} -> @content #set! injection.language js
)q";

constexpr std::string_view k_js_highlights = R"q(\b(foo)\b -> @function
[0-9]+ -> @number
)q";

// js embeds "calc" in ${ } blocks.
constexpr std::string_view k_js_injections = R"q(\$\[([^\]]*)\] -> @calc
)q";

constexpr std::string_view k_calc_highlights = R"q([+*] -> @operator
[0-9]+ -> @number
)q";

Token tok(uint32_t line, uint32_t sc, uint32_t ec, std::string type)
{
  return Token{SourceRange(line, sc, line, ec), std::move(type), {}};
}

bool overlaps(const Token & a, const Token & b)
{
  return a.range.start < b.range.end && b.range.start < a.range.end;
}

struct HighlighterFixture : ::testing::Test
{
  TempWorkspace ws;
  std::shared_ptr<ScriptedEngine> engine = std::make_shared<ScriptedEngine>();

  HighlighterConfig make_config(bool js_injection_only = true)
  {
    HighlighterConfig cfg;
    cfg.languages.push_back(make_language(ws, "host", k_host_highlights, k_host_injections));
    auto js = make_language(ws, "js", k_js_highlights, k_js_injections);
    js.injection_only = js_injection_only;
    cfg.languages.push_back(std::move(js));
    auto calc = make_language(ws, "calc", k_calc_highlights);
    calc.injection_only = true;
    cfg.languages.push_back(std::move(calc));
    return cfg;
  }

  std::vector<Token> highlight(semtok::Highlighter & h, std::string_view lang, std::string_view text)
  {
    auto tokens = h.highlight(lang, text);
    EXPECT_TRUE(tokens.has_value());
    return tokens ? *tokens : std::vector<Token>{};
  }
};

}  // namespace

TEST_F(HighlighterFixture, InjectionReplacesParentTokensInsideItsRange)
{
  semtok::Highlighter h(make_config(), engine);
  const auto tokens = highlight(h, "host", R"(let s = "a <js>foo(12)</js> b";)");

  const std::vector<Token> expected = {
    tok(0, 0, 3, "keyword"),  tok(0, 8, 15, "string"),  tok(0, 15, 18, "function"),
    tok(0, 19, 21, "number"), tok(0, 22, 30, "string"),
  };
  EXPECT_EQ(tokens, expected);
}

TEST_F(HighlighterFixture, OutputIsSortedSingleLineAndDisjoint)
{
  semtok::Highlighter h(make_config(), engine);
  const std::string text =
    "let a = \"x\";\n"
    "<js>\n"
    "foo 1\n"
    "</js>\n"
    "let b = \"multi\n"
    "line\";\n";
  const auto tokens = highlight(h, "host", text);

  ASSERT_FALSE(tokens.empty());
  for (size_t i = 0; i < tokens.size(); ++i) {
    EXPECT_TRUE(tokens[i].range.is_single_line());
    if (i > 0) {
      EXPECT_LE(tokens[i - 1].range.start, tokens[i].range.start);
      EXPECT_FALSE(overlaps(tokens[i - 1], tokens[i]));
    }
  }

  // Content starts right after "<js>" on line 1; tokens on later lines keep their columns.
  EXPECT_NE(std::find(tokens.begin(), tokens.end(), tok(2, 0, 3, "function")), tokens.end());
  EXPECT_NE(std::find(tokens.begin(), tokens.end(), tok(2, 4, 5, "number")), tokens.end());
}

TEST_F(HighlighterFixture, HighlightIsIdempotent)
{
  semtok::Highlighter h(make_config(), engine);
  const std::string text = "let x = \"<js>foo 1</js>\"; {{foo}}";

  const auto first = highlight(h, "host", text);
  const auto second = highlight(h, "host", text);
  EXPECT_EQ(first, second);
  EXPECT_EQ(engine->load_count("js"), 1);
}

TEST_F(HighlighterFixture, DirectiveSetsInjectedLanguage)
{
  semtok::Highlighter h(make_config(), engine);
  const auto tokens = highlight(h, "host", "{{ foo 7 }}");

  const std::vector<Token> expected = {tok(0, 3, 6, "function"), tok(0, 7, 8, "number")};
  EXPECT_EQ(tokens, expected);
}

TEST_F(HighlighterFixture, NestedInjectionsShiftThroughEveryLevel)
{
  semtok::Highlighter h(make_config(), engine);
  // host -> js (col 4) -> calc (col 4 + 6)
  const auto tokens = highlight(h, "host", "<js>foo $[1+2]</js>");

  const std::vector<Token> expected = {
    tok(0, 4, 7, "function"),
    tok(0, 10, 11, "number"),
    tok(0, 11, 12, "operator"),
    tok(0, 12, 13, "number"),
  };
  EXPECT_EQ(tokens, expected);
}

TEST_F(HighlighterFixture, InjectionDepthCeilingIsEnforced)
{
  auto cfg = make_config();
  cfg.max_injection_depth = 1;
  semtok::Highlighter h(std::move(cfg), engine);

  // One level is fine.
  EXPECT_NO_THROW((void)h.highlight("host", "<js>foo</js>"));
  EXPECT_THROW((void)h.highlight("host", "<js>$[1]</js>"), semtok::InjectionDepthExceeded);
}

TEST_F(HighlighterFixture, SelfInjectingLanguageFailsPredictably)
{
  HighlighterConfig cfg;
  cfg.languages.push_back(make_language(ws, "rec", "x -> @variable\n", R"q(\((.*)\) -> @rec
)q"));
  semtok::Highlighter h(std::move(cfg), engine);

  EXPECT_NO_THROW((void)h.highlight("rec", "((x))"));
  EXPECT_THROW(
    (void)h.highlight("rec", std::string(40, '(') + "x" + std::string(40, ')')),
    semtok::InjectionDepthExceeded);
}

TEST_F(HighlighterFixture, ParallelSelfInjectionHitsDepthCeilingQuickly)
{
  // Two matches per level: unbounded fan-out would need 2^16 workers.
  HighlighterConfig cfg;
  cfg.languages.push_back(make_language(ws, "rec", "x -> @variable\n", R"q(^(.+)$ -> @rec
^(.+)$ -> @rec
)q"));
  cfg.parallel_injections = true;
  semtok::Highlighter h(std::move(cfg), engine);

  const auto started = std::chrono::steady_clock::now();
  EXPECT_THROW((void)h.highlight("rec", "x"), semtok::InjectionDepthExceeded);
  EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(5));
}

TEST_F(HighlighterFixture, UnconfiguredInjectionLeavesParentUntouched)
{
  HighlighterConfig cfg;
  cfg.languages.push_back(
    make_language(ws, "md", "`[^`]*` -> @string\n", "`([^`]*)` -> @python\n"));
  semtok::Highlighter h(std::move(cfg), engine);

  const auto tokens = highlight(h, "md", "see `print(1)`");
  const std::vector<Token> expected = {tok(0, 4, 14, "string")};
  EXPECT_EQ(tokens, expected);
}

TEST_F(HighlighterFixture, BrokenInjectedLanguageIsSkipped)
{
  auto cfg = make_config();
  engine->set_failing("js", true);

  std::vector<std::string> warnings;
  const semtok::Logger logger(
    [&](semtok::LogLevel level, std::string_view msg) {
      if (level == semtok::LogLevel::Warning) warnings.emplace_back(msg);
    },
    semtok::LogLevel::Warning);
  semtok::Highlighter h(std::move(cfg), engine, semtok::default_legend(), logger);

  const auto tokens = highlight(h, "host", R"(let s = "<js>foo</js>";)");
  const std::vector<Token> expected = {tok(0, 0, 3, "keyword"), tok(0, 8, 22, "string")};
  EXPECT_EQ(tokens, expected);
  ASSERT_EQ(warnings.size(), 1U);
  EXPECT_NE(warnings[0].find("js"), std::string::npos);

  // Not cached: the next request retries and succeeds.
  engine->set_failing("js", false);
  EXPECT_EQ(highlight(h, "host", R"(let s = "<js>foo</js>";)").size(), 4U);
}

TEST_F(HighlighterFixture, DocumentLanguageLoadErrorPropagates)
{
  engine->set_failing("host", true);
  semtok::Highlighter h(make_config(), engine);
  EXPECT_THROW((void)h.highlight("host", "let"), semtok::LanguageLoadError);
}

TEST_F(HighlighterFixture, UnconfiguredAndInjectionOnlyLanguagesAreRejected)
{
  semtok::Highlighter h(make_config(), engine);
  EXPECT_THROW((void)h.highlight("cobol", "x"), semtok::UnconfiguredLanguage);
  EXPECT_THROW((void)h.highlight("js", "foo"), semtok::UnconfiguredLanguage);
  EXPECT_EQ(h.document_languages(), std::vector<std::string>{"host"});
}

TEST_F(HighlighterFixture, CancelledRequestReturnsNothing)
{
  semtok::Highlighter h(make_config(), engine);
  const semtok::CancellationToken cancel;
  cancel.cancel();

  EXPECT_FALSE(h.highlight("host", "let <js>foo</js>", cancel).has_value());

  // The registry stays usable.
  EXPECT_TRUE(h.highlight("host", "let <js>foo</js>").has_value());
}

TEST_F(HighlighterFixture, ParallelInjectionsMatchSequentialResult)
{
  const std::string text = "<js>foo 1</js> <js>2 foo</js>\n{{foo $[3*4]}}\n<js>foo</js>";

  semtok::Highlighter sequential(make_config(), engine);
  auto cfg = make_config();
  cfg.parallel_injections = true;
  semtok::Highlighter parallel(std::move(cfg), std::make_shared<ScriptedEngine>());

  EXPECT_EQ(highlight(sequential, "host", text), highlight(parallel, "host", text));
}

TEST_F(HighlighterFixture, TypeMappingIsThreadedPerLanguage)
{
  auto cfg = make_config();
  cfg.languages[1].semantic_token_type_mappings =
    semtok::TypeMapping{{"function", {"method", {"defaultLibrary"}}}};
  semtok::Highlighter h(std::move(cfg), engine);

  // "foo" in host text is not a function capture; inside js it is remapped.
  const auto tokens = highlight(h, "host", "<js>foo</js>");
  ASSERT_EQ(tokens.size(), 1U);
  EXPECT_EQ(tokens[0].type, "method");
  EXPECT_EQ(tokens[0].modifiers, std::vector<std::string>{"defaultLibrary"});
}

TEST_F(HighlighterFixture, ReloadPicksUpChangedQueries)
{
  semtok::Highlighter h(make_config(), engine);
  EXPECT_EQ(highlight(h, "host", "let").size(), 1U);

  ws.write("host/highlights.scm", "\\b(let)\\b -> @variable\n");
  EXPECT_EQ(highlight(h, "host", "let")[0].type, "keyword");

  h.reload();
  EXPECT_EQ(highlight(h, "host", "let")[0].type, "variable");
}
