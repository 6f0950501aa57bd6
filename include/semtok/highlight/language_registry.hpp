// semtok/highlight/language_registry.hpp - Lazy cache of loaded languages
#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "semtok/basic/logger.hpp"
#include "semtok/config/highlighter_config.hpp"
#include "semtok/highlight/capture_classifier.hpp"
#include "semtok/syntax/grammar_engine.hpp"

namespace semtok
{

/**
 * Everything needed to highlight one language. Immutable once built.
 */
struct LanguageBinding
{
  std::string language_id;
  std::shared_ptr<const Grammar> grammar;
  std::unique_ptr<const Query> highlight_query;
  std::unique_ptr<const Query> injection_query;  ///< null when not configured
  std::optional<TypeMapping> type_mapping;

  [[nodiscard]] const TypeMapping * mapping() const noexcept
  {
    return type_mapping ? &*type_mapping : nullptr;
  }
};

/// Per-request injection behaviour taken from the configuration.
struct InjectionSettings
{
  bool parallel = false;
  uint32_t max_depth = 16;
};

/**
 * Cache from language identifier to LanguageBinding.
 *
 * resolve() builds a binding at most once per identifier: concurrent callers
 * for the same identifier wait for the first one, callers for different
 * identifiers load in parallel. A failed load leaves nothing behind and the
 * next call retries. reload() is exclusive with every resolve().
 */
class LanguageRegistry
{
public:
  LanguageRegistry(std::shared_ptr<GrammarEngine> engine, HighlighterConfig config, Logger logger);

  LanguageRegistry(const LanguageRegistry &) = delete;
  LanguageRegistry & operator=(const LanguageRegistry &) = delete;

  /**
   * @throws UnconfiguredLanguage if no configuration names `language_id`
   * @throws LanguageLoadError if the grammar or a query fails to load
   */
  [[nodiscard]] std::shared_ptr<const LanguageBinding> resolve(std::string_view language_id);

  [[nodiscard]] bool is_configured(std::string_view language_id) const;

  /// Configured languages that may highlight a whole document.
  [[nodiscard]] std::vector<std::string> document_languages() const;

  /// True if a binding for `language_id` is currently cached.
  [[nodiscard]] bool is_loaded(std::string_view language_id) const;

  /// Drop every cached binding.
  void reload();

  /// Drop every cached binding and replace the configuration.
  void reload(HighlighterConfig config);

  [[nodiscard]] InjectionSettings injection_settings() const;

private:
  struct Slot
  {
    std::mutex mutex;
    std::shared_ptr<const LanguageBinding> binding;
  };

  [[nodiscard]] std::shared_ptr<const LanguageBinding> load(const LanguageConfig & config) const;

  std::shared_ptr<GrammarEngine> engine_;
  Logger logger_;

  // Held shared by resolve(), exclusive by reload().
  mutable std::shared_mutex generation_mutex_;
  HighlighterConfig config_;

  // Guards the slot table only; loads happen under the per-slot mutex.
  mutable std::mutex slots_mutex_;
  std::unordered_map<std::string, std::shared_ptr<Slot>> slots_;
};

}  // namespace semtok
