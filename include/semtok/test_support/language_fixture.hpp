// semtok/test_support/language_fixture.hpp - Language configurations backed by scratch files
#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "semtok/config/highlighter_config.hpp"
#include "semtok/test_support/temp_workspace.hpp"

namespace semtok::test_support
{

/**
 * Write a grammar stub and query files for `lang` under `ws` and return the
 * matching configuration. The grammar file is only checked for existence by
 * ScriptedEngine.
 */
[[nodiscard]] inline LanguageConfig make_language(
  const TempWorkspace & ws, const std::string & lang, std::string_view highlights,
  std::optional<std::string_view> injections = std::nullopt)
{
  LanguageConfig cfg;
  cfg.lang = lang;
  cfg.parser = ws.write(lang + "/parser.so", "");
  cfg.highlights = ws.write(lang + "/highlights.scm", highlights);
  if (injections) {
    cfg.injections = ws.write(lang + "/injections.scm", *injections);
  }
  return cfg;
}

}  // namespace semtok::test_support
