// semtok/highlight/highlighter.cpp - Highlight pipeline
#include "semtok/highlight/highlighter.hpp"

#include <algorithm>
#include <utility>

#include "semtok/basic/error.hpp"
#include "semtok/highlight/capture_classifier.hpp"
#include "semtok/highlight/injection_resolver.hpp"
#include "semtok/highlight/token_merger.hpp"
#include "semtok/highlight/token_normalizer.hpp"

namespace semtok
{

Logger make_logger(const HighlighterConfig & config, Logger::Sink sink)
{
  return Logger(std::move(sink), config.debug ? LogLevel::Debug : LogLevel::Warning);
}

Highlighter::Highlighter(
  HighlighterConfig config, std::shared_ptr<GrammarEngine> engine, TokenLegend legend,
  Logger logger)
: legend_(std::move(legend)),
  logger_(std::move(logger)),
  registry_(std::move(engine), std::move(config), logger_)
{
  logger_.debug([&] {
    std::string names;
    for (const auto & lang : registry_.document_languages()) {
      if (!names.empty()) names += ", ";
      names += lang;
    }
    return "document languages: " + names;
  });
}

std::optional<std::vector<Token>> Highlighter::highlight(
  std::string_view language_id, std::string_view text, const CancellationToken & cancel)
{
  const auto doc_langs = registry_.document_languages();
  if (std::find(doc_langs.begin(), doc_langs.end(), language_id) == doc_langs.end()) {
    throw UnconfiguredLanguage(std::string(language_id));
  }

  try {
    const auto binding = registry_.resolve(language_id);
    std::vector<Token> tokens = tokenize(*binding, text, 0, cancel);
    sort_tokens(tokens);
    return tokens;
  } catch (const RequestCancelled &) {
    logger_.debug("highlight request cancelled");
    return std::nullopt;
  }
}

void Highlighter::reload() { registry_.reload(); }

void Highlighter::reload(HighlighterConfig config) { registry_.reload(std::move(config)); }

std::vector<std::string> Highlighter::document_languages() const
{
  return registry_.document_languages();
}

std::vector<Token> Highlighter::tokenize(
  const LanguageBinding & binding, std::string_view text, uint32_t depth,
  const CancellationToken & cancel)
{
  throw_if_cancelled(cancel);

  const std::unique_ptr<SyntaxTree> tree = binding.grammar->parse(text);
  if (!tree) {
    logger_.debug("no syntax tree for " + binding.language_id);
    return {};
  }

  std::vector<Token> tokens =
    normalize_tokens(captures_to_tokens(binding, binding.highlight_query->matches(*tree)));

  if (!binding.injection_query) {
    return tokens;
  }
  throw_if_cancelled(cancel);

  const InjectionResolver resolver(
    registry_,
    [this, &cancel](const LanguageBinding & b, std::string_view t, uint32_t d) {
      return tokenize(b, t, d, cancel);
    },
    registry_.injection_settings(), logger_, cancel);

  const std::vector<Injection> injections =
    resolver.resolve(*binding.injection_query, *tree, depth);
  return merge_injections(std::move(tokens), injections);
}

std::vector<Token> Highlighter::captures_to_tokens(
  const LanguageBinding & binding, const std::vector<QueryMatch> & matches) const
{
  std::vector<Token> tokens;
  for (const auto & match : matches) {
    for (const auto & capture : match.captures) {
      std::optional<TokenClass> cls;
      try {
        cls = classify_capture(capture.name, binding.mapping(), legend_, logger_);
      } catch (const InvalidCapture & e) {
        logger_.debug(std::string("dropping capture: ") + e.what());
        continue;
      }
      if (!cls) continue;
      tokens.push_back(Token{capture.range, std::move(cls->type), std::move(cls->modifiers)});
    }
  }
  return tokens;
}

}  // namespace semtok
