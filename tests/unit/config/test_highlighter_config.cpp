#include <gtest/gtest.h>

#include <filesystem>
#include <nlohmann/json.hpp>

#include "semtok/basic/error.hpp"
#include "semtok/config/highlighter_config.hpp"
#include "semtok/test_support/temp_workspace.hpp"

using json = nlohmann::json;
namespace fs = std::filesystem;

using semtok::find_highlighter_config;
using semtok::load_highlighter_config;
using semtok::parse_language_configs;
using semtok::resolve_asset_path;
using semtok::test_support::TempWorkspace;

TEST(ConfigAssetPath, AbsolutePathsAreKept)
{
  EXPECT_EQ(resolve_asset_path("/opt/grammars/a.so", std::nullopt), fs::path("/opt/grammars/a.so"));
  EXPECT_EQ(resolve_asset_path("/opt/a.so", fs::path("/ws")), fs::path("/opt/a.so"));
}

TEST(ConfigAssetPath, RelativePathsResolveAgainstRoot)
{
  EXPECT_EQ(resolve_asset_path("queries/../q/h.scm", fs::path("/ws")), fs::path("/ws/q/h.scm"));
  EXPECT_THROW((void)resolve_asset_path("h.scm", std::nullopt), semtok::PathResolutionError);
}

TEST(ConfigLanguageConfigs, ParsesHostSettings)
{
  const json settings = json::parse(R"([
    {
      "lang": "html",
      "parser": "grammars/html.so",
      "highlights": "/abs/html/highlights.scm",
      "injections": "html/injections.scm"
    },
    {
      "lang": "js",
      "parser": "grammars/js.so",
      "highlights": "js/highlights.scm",
      "injectionOnly": true,
      "semanticTokenTypeMappings": {
        "constant": {"targetTokenType": "variable", "targetTokenModifiers": ["readonly"]},
        "variable.parameter": {"targetTokenType": "parameter"}
      }
    }
  ])");

  const auto result = parse_language_configs(settings, fs::path("/ws"));
  ASSERT_TRUE(result.success) << result.error;
  ASSERT_EQ(result.config.languages.size(), 2U);

  const auto & html = result.config.languages[0];
  EXPECT_EQ(html.lang, "html");
  EXPECT_EQ(html.parser, fs::path("/ws/grammars/html.so"));
  EXPECT_EQ(html.highlights, fs::path("/abs/html/highlights.scm"));
  ASSERT_TRUE(html.injections.has_value());
  EXPECT_EQ(*html.injections, fs::path("/ws/html/injections.scm"));
  EXPECT_FALSE(html.injection_only);
  EXPECT_FALSE(html.semantic_token_type_mappings.has_value());

  const auto & js = result.config.languages[1];
  EXPECT_TRUE(js.injection_only);
  EXPECT_FALSE(js.injections.has_value());
  ASSERT_TRUE(js.semantic_token_type_mappings.has_value());
  const auto & mapping = *js.semantic_token_type_mappings;
  EXPECT_EQ(mapping.at("constant").target_token_type, "variable");
  EXPECT_EQ(mapping.at("constant").target_token_modifiers, std::vector<std::string>{"readonly"});
  EXPECT_TRUE(mapping.at("variable.parameter").target_token_modifiers.empty());

  EXPECT_EQ(result.config.find_language("js"), &js);
  EXPECT_EQ(result.config.find_language("css"), nullptr);
}

TEST(ConfigLanguageConfigs, ReportsTheOffendingField)
{
  EXPECT_EQ(parse_language_configs(json::object(), fs::path("/ws")).error, "Expected a list.");

  const auto no_lang = parse_language_configs(
    json::parse(R"([{"parser": "a.so", "highlights": "h.scm"}])"), fs::path("/ws"));
  EXPECT_FALSE(no_lang.success);
  EXPECT_EQ(no_lang.error, "Expected `lang` to be a string.");

  const auto bad_parser = parse_language_configs(
    json::parse(R"([{"lang": "x", "parser": 3, "highlights": "h.scm"}])"), fs::path("/ws"));
  EXPECT_EQ(bad_parser.error, "Expected `parser` to be a string.");

  const auto bad_only = parse_language_configs(
    json::parse(R"([{"lang": "x", "parser": "a.so", "highlights": "h.scm", "injectionOnly": "yes"}])"),
    fs::path("/ws"));
  EXPECT_EQ(bad_only.error, "Expected `injectionOnly` to be a boolean.");

  const auto bad_mapping = parse_language_configs(
    json::parse(
      R"([{"lang": "x", "parser": "a.so", "highlights": "h.scm", "semanticTokenTypeMappings": []}])"),
    fs::path("/ws"));
  EXPECT_EQ(bad_mapping.error, "Expected `semanticTokenTypeMappings` to be an object.");
}

TEST(ConfigLanguageConfigs, RelativePathWithoutRootFails)
{
  const auto result = parse_language_configs(
    json::parse(R"([{"lang": "x", "parser": "a.so", "highlights": "/h.scm"}])"), std::nullopt);
  EXPECT_FALSE(result.success);
  EXPECT_NE(result.error.find("a.so"), std::string::npos);
}

TEST(ConfigYaml, LoadsFileAndResolvesAgainstItsDirectory)
{
  TempWorkspace ws;
  const auto path = ws.write(
    "project/semtok.yaml",
    "debug: true\n"
    "parallelInjections: true\n"
    "maxInjectionDepth: 4\n"
    "languageConfigs:\n"
    "  - lang: html\n"
    "    parser: grammars/html.so\n"
    "    highlights: queries/html/highlights.scm\n"
    "    injections: queries/html/injections.scm\n"
    "  - lang: js\n"
    "    parser: /usr/lib/js.so\n"
    "    highlights: queries/js/highlights.scm\n"
    "    injectionOnly: true\n"
    "    semanticTokenTypeMappings:\n"
    "      constant:\n"
    "        targetTokenType: variable\n"
    "        targetTokenModifiers: [readonly]\n");

  const auto result = load_highlighter_config(path);
  ASSERT_TRUE(result.success) << result.error;

  const auto & cfg = result.config;
  EXPECT_TRUE(cfg.debug);
  EXPECT_TRUE(cfg.parallel_injections);
  EXPECT_EQ(cfg.max_injection_depth, 4U);
  ASSERT_EQ(cfg.languages.size(), 2U);

  const fs::path dir = ws.root() / "project";
  EXPECT_EQ(cfg.languages[0].parser, (dir / "grammars/html.so").lexically_normal());
  EXPECT_EQ(*cfg.languages[0].injections, (dir / "queries/html/injections.scm").lexically_normal());
  EXPECT_EQ(cfg.languages[1].parser, fs::path("/usr/lib/js.so"));
  EXPECT_TRUE(cfg.languages[1].injection_only);
  EXPECT_EQ(
    cfg.languages[1].semantic_token_type_mappings->at("constant").target_token_modifiers,
    std::vector<std::string>{"readonly"});
}

TEST(ConfigYaml, DefaultsWhenKeysAreAbsent)
{
  TempWorkspace ws;
  const auto result = load_highlighter_config(ws.write("semtok.yaml", "languageConfigs: []\n"));
  ASSERT_TRUE(result.success) << result.error;
  EXPECT_FALSE(result.config.debug);
  EXPECT_FALSE(result.config.parallel_injections);
  EXPECT_EQ(result.config.max_injection_depth, 16U);
  EXPECT_TRUE(result.config.languages.empty());
}

TEST(ConfigYaml, ReportsErrors)
{
  TempWorkspace ws;

  EXPECT_FALSE(load_highlighter_config(ws.root() / "missing.yaml").success);

  const auto missing_key =
    load_highlighter_config(ws.write("a.yaml", "languageConfigs:\n  - lang: x\n    parser: p.so\n"));
  EXPECT_FALSE(missing_key.success);
  EXPECT_NE(missing_key.error.find("highlights"), std::string::npos);

  const auto not_list = load_highlighter_config(ws.write("b.yaml", "languageConfigs: 3\n"));
  EXPECT_FALSE(not_list.success);

  const auto bad_yaml = load_highlighter_config(ws.write("c.yaml", "languageConfigs: [\n"));
  EXPECT_FALSE(bad_yaml.success);

  const auto bad_bool = load_highlighter_config(ws.write("d.yaml", "debug: maybe\n"));
  EXPECT_FALSE(bad_bool.success);
}

TEST(ConfigYaml, FindsNearestConfigUpwards)
{
  TempWorkspace ws;
  const auto config = ws.write("semtok.yaml", "languageConfigs: []\n");
  const auto nested = ws.write("src/deep/file.txt", "x");

  const auto found = find_highlighter_config(nested.parent_path());
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(fs::canonical(*found), fs::canonical(config));

  // A file argument starts from its directory.
  const auto from_file = find_highlighter_config(nested);
  ASSERT_TRUE(from_file.has_value());
  EXPECT_EQ(fs::canonical(*from_file), fs::canonical(config));
}
