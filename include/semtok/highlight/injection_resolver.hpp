// semtok/highlight/injection_resolver.hpp - Embedded-language discovery and resolution
#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "semtok/basic/cancellation.hpp"
#include "semtok/basic/logger.hpp"
#include "semtok/highlight/language_registry.hpp"
#include "semtok/highlight/token.hpp"
#include "semtok/syntax/grammar_engine.hpp"

namespace semtok
{

/// Where an injection match points: the language to use and the node to reparse.
struct InjectionTarget
{
  std::string language;
  const QueryCapture * content = nullptr;  ///< points into the match
};

/**
 * Determine the language and content capture of one injection match.
 *
 * Precedence:
 *  1. a `injection.language` property set by a directive; the content is the
 *     match's first capture,
 *  2. an `injection.language` capture whose text names the language, with an
 *     `injection.content` capture holding the content,
 *  3. a capture whose name is itself a configured language.
 *
 * Returns nullopt if no rule yields a language for which `is_configured`
 * holds, or if the rule's content capture is missing.
 */
[[nodiscard]] std::optional<InjectionTarget> find_injection_target(
  const QueryMatch & match, std::string_view text,
  const std::function<bool(std::string_view)> & is_configured);

class InjectionResolver
{
public:
  /// Runs the whole pipeline for `text` in `binding`'s language at nesting `depth`.
  using Tokenizer = std::function<std::vector<Token>(
    const LanguageBinding & binding, std::string_view text, uint32_t depth)>;

  InjectionResolver(
    LanguageRegistry & registry, Tokenizer tokenizer, InjectionSettings settings, Logger logger,
    CancellationToken cancel);

  /**
   * Match `injection_query` against `tree` and resolve every match that names
   * a configured language. Results are in parent coordinates and in match
   * order. With parallel injections enabled, the document's own injections
   * are tokenized by at most 8 concurrent workers; nested levels are
   * resolved sequentially.
   *
   * @param depth nesting level of `tree` (0 for the document itself)
   * @throws InjectionDepthExceeded if resolving would exceed the depth limit
   */
  [[nodiscard]] std::vector<Injection> resolve(
    const Query & injection_query, const SyntaxTree & tree, uint32_t depth) const;

private:
  [[nodiscard]] std::optional<Injection> resolve_one(
    const InjectionTarget & target, std::string_view text, uint32_t depth) const;

  LanguageRegistry & registry_;
  Tokenizer tokenizer_;
  InjectionSettings settings_;
  Logger logger_;
  CancellationToken cancel_;
};

}  // namespace semtok
