// semtok/highlight/highlighter.hpp - Whole-document semantic token provider
#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "semtok/basic/cancellation.hpp"
#include "semtok/basic/logger.hpp"
#include "semtok/config/highlighter_config.hpp"
#include "semtok/highlight/language_registry.hpp"
#include "semtok/highlight/legend.hpp"
#include "semtok/highlight/token.hpp"
#include "semtok/syntax/grammar_engine.hpp"

namespace semtok
{

/**
 * Turns a document into a flat, sorted, non-overlapping, single-line token
 * stream: parse, match the highlight query, classify, normalize, resolve
 * injections recursively and merge them in.
 *
 * highlight() may be called from several threads; reload() waits for them.
 */
class Highlighter
{
public:
  Highlighter(
    HighlighterConfig config, std::shared_ptr<GrammarEngine> engine,
    TokenLegend legend = default_legend(), Logger logger = {});

  Highlighter(const Highlighter &) = delete;
  Highlighter & operator=(const Highlighter &) = delete;

  /**
   * Tokens for a whole document.
   *
   * @return nullopt if `cancel` was observed before completion
   * @throws UnconfiguredLanguage if `language_id` is not configured for
   *         whole documents
   * @throws LanguageLoadError if the document's language fails to load
   * @throws InvalidRange on an inverted range from the matching layer
   * @throws InjectionDepthExceeded on runaway injection nesting
   */
  [[nodiscard]] std::optional<std::vector<Token>> highlight(
    std::string_view language_id, std::string_view text,
    const CancellationToken & cancel = CancellationToken());

  /// Discard every loaded language; the next highlight() loads afresh.
  void reload();

  /// As reload(), also replacing the configuration.
  void reload(HighlighterConfig config);

  [[nodiscard]] std::vector<std::string> document_languages() const;

  [[nodiscard]] const TokenLegend & legend() const noexcept { return legend_; }

  [[nodiscard]] LanguageRegistry & registry() noexcept { return registry_; }

private:
  [[nodiscard]] std::vector<Token> tokenize(
    const LanguageBinding & binding, std::string_view text, uint32_t depth,
    const CancellationToken & cancel);

  [[nodiscard]] std::vector<Token> captures_to_tokens(
    const LanguageBinding & binding, const std::vector<QueryMatch> & matches) const;

  TokenLegend legend_;
  Logger logger_;
  LanguageRegistry registry_;
};

/// Logger honouring the configuration's debug flag.
[[nodiscard]] Logger make_logger(const HighlighterConfig & config, Logger::Sink sink);

}  // namespace semtok
