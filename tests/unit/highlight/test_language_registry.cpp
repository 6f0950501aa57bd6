#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <thread>
#include <vector>

#include "semtok/basic/error.hpp"
#include "semtok/highlight/language_registry.hpp"
#include "semtok/test_support/language_fixture.hpp"
#include "semtok/test_support/scripted_engine.hpp"

using semtok::HighlighterConfig;
using semtok::LanguageRegistry;
using semtok::test_support::make_language;
using semtok::test_support::ScriptedEngine;
using semtok::test_support::TempWorkspace;

namespace
{

constexpr std::string_view k_highlights = "\\b(let)\\b -> @keyword\n";

struct RegistryFixture : ::testing::Test
{
  TempWorkspace ws;
  std::shared_ptr<ScriptedEngine> engine = std::make_shared<ScriptedEngine>();

  HighlighterConfig config_with(std::vector<semtok::LanguageConfig> langs)
  {
    HighlighterConfig cfg;
    cfg.languages = std::move(langs);
    return cfg;
  }
};

}  // namespace

TEST_F(RegistryFixture, ResolvesOnceAndCaches)
{
  LanguageRegistry registry(
    engine, config_with({make_language(ws, "toy", k_highlights, "x -> @js\n")}), {});

  EXPECT_FALSE(registry.is_loaded("toy"));
  const auto first = registry.resolve("toy");
  const auto second = registry.resolve("toy");

  EXPECT_EQ(first, second);
  EXPECT_TRUE(registry.is_loaded("toy"));
  EXPECT_EQ(engine->load_count("toy"), 1);
  EXPECT_GE(engine->initialize_calls(), 1);

  ASSERT_NE(first->highlight_query, nullptr);
  EXPECT_NE(first->injection_query, nullptr);
  EXPECT_EQ(first->mapping(), nullptr);
}

TEST_F(RegistryFixture, KeepsTypeMapping)
{
  auto lang = make_language(ws, "toy", k_highlights);
  lang.semantic_token_type_mappings = semtok::TypeMapping{{"constant", {"variable", {"readonly"}}}};
  LanguageRegistry registry(engine, config_with({lang}), {});

  const auto binding = registry.resolve("toy");
  ASSERT_NE(binding->mapping(), nullptr);
  EXPECT_EQ(binding->mapping()->at("constant").target_token_type, "variable");
  EXPECT_EQ(binding->injection_query, nullptr);
}

TEST_F(RegistryFixture, UnconfiguredLanguageIsRejected)
{
  LanguageRegistry registry(engine, config_with({make_language(ws, "toy", k_highlights)}), {});
  EXPECT_FALSE(registry.is_configured("other"));
  EXPECT_THROW((void)registry.resolve("other"), semtok::UnconfiguredLanguage);
  EXPECT_EQ(engine->load_count("other"), 0);
}

TEST_F(RegistryFixture, FailedLoadIsNotCached)
{
  LanguageRegistry registry(engine, config_with({make_language(ws, "toy", k_highlights)}), {});

  engine->set_failing("toy", true);
  EXPECT_THROW((void)registry.resolve("toy"), semtok::LanguageLoadError);
  EXPECT_FALSE(registry.is_loaded("toy"));

  engine->set_failing("toy", false);
  EXPECT_NE(registry.resolve("toy"), nullptr);
  EXPECT_EQ(engine->load_count("toy"), 2);
}

TEST_F(RegistryFixture, MissingAssetsRaiseLanguageLoadError)
{
  auto no_grammar = make_language(ws, "a", k_highlights);
  no_grammar.parser = ws.root() / "missing.so";
  auto no_query = make_language(ws, "b", k_highlights);
  no_query.highlights = ws.root() / "missing.scm";
  auto bad_query = make_language(ws, "c", "( -> @keyword\n");

  LanguageRegistry registry(engine, config_with({no_grammar, no_query, bad_query}), {});

  EXPECT_THROW((void)registry.resolve("a"), semtok::LanguageLoadError);
  EXPECT_THROW((void)registry.resolve("b"), semtok::LanguageLoadError);
  EXPECT_THROW((void)registry.resolve("c"), semtok::QueryCompileError);
}

TEST_F(RegistryFixture, ConcurrentResolveConstructsOnce)
{
  LanguageRegistry registry(engine, config_with({make_language(ws, "toy", k_highlights)}), {});
  engine->set_load_delay(std::chrono::milliseconds(50));

  constexpr int k_threads = 8;
  std::vector<std::shared_ptr<const semtok::LanguageBinding>> results(k_threads);
  std::vector<std::thread> threads;
  threads.reserve(k_threads);
  for (int i = 0; i < k_threads; ++i) {
    threads.emplace_back([&, i] { results[i] = registry.resolve("toy"); });
  }
  for (auto & t : threads) {
    t.join();
  }

  EXPECT_EQ(engine->load_count("toy"), 1);
  for (const auto & r : results) {
    EXPECT_EQ(r, results.front());
  }
}

TEST_F(RegistryFixture, ReloadDiscardsBindings)
{
  LanguageRegistry registry(engine, config_with({make_language(ws, "toy", k_highlights)}), {});

  const auto before = registry.resolve("toy");
  registry.reload();
  EXPECT_FALSE(registry.is_loaded("toy"));

  const auto after = registry.resolve("toy");
  EXPECT_NE(before, after);
  EXPECT_EQ(engine->load_count("toy"), 2);

  // Bindings handed out earlier stay usable.
  EXPECT_NE(before->highlight_query, nullptr);
}

TEST_F(RegistryFixture, ReloadWithConfigReplacesLanguages)
{
  LanguageRegistry registry(engine, config_with({make_language(ws, "toy", k_highlights)}), {});
  (void)registry.resolve("toy");

  auto next = config_with({make_language(ws, "other", k_highlights)});
  next.parallel_injections = true;
  next.max_injection_depth = 3;
  registry.reload(std::move(next));

  EXPECT_THROW((void)registry.resolve("toy"), semtok::UnconfiguredLanguage);
  EXPECT_NE(registry.resolve("other"), nullptr);
  EXPECT_TRUE(registry.injection_settings().parallel);
  EXPECT_EQ(registry.injection_settings().max_depth, 3U);
}

TEST_F(RegistryFixture, DocumentLanguagesExcludeInjectionOnly)
{
  auto embedded = make_language(ws, "js", k_highlights);
  embedded.injection_only = true;
  LanguageRegistry registry(
    engine, config_with({make_language(ws, "html", k_highlights), embedded}), {});

  EXPECT_EQ(registry.document_languages(), std::vector<std::string>{"html"});
  EXPECT_TRUE(registry.is_configured("js"));
}
