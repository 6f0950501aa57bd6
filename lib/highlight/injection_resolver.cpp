// semtok/highlight/injection_resolver.cpp - Embedded-language resolution
#include "semtok/highlight/injection_resolver.hpp"

#include <algorithm>
#include <future>
#include <system_error>
#include <utility>

#include "semtok/basic/error.hpp"

namespace semtok
{

namespace
{

constexpr std::string_view k_language_key = "injection.language";
constexpr std::string_view k_content_capture = "injection.content";
constexpr size_t k_max_parallel_injections = 8;

std::string_view capture_text(const QueryCapture & c, std::string_view text)
{
  if (c.start_byte >= text.size() || c.end_byte <= c.start_byte) {
    return {};
  }
  return text.substr(c.start_byte, c.end_byte - c.start_byte);
}

const QueryCapture * find_capture(const QueryMatch & match, std::string_view name)
{
  for (const auto & c : match.captures) {
    if (c.name == name) return &c;
  }
  return nullptr;
}

}  // namespace

std::optional<InjectionTarget> find_injection_target(
  const QueryMatch & match, std::string_view text,
  const std::function<bool(std::string_view)> & is_configured)
{
  // 1. Language fixed by a directive.
  const auto prop = match.properties.find(std::string(k_language_key));
  if (prop != match.properties.end() && !prop->second.empty()) {
    if (match.captures.empty() || !is_configured(prop->second)) {
      return std::nullopt;
    }
    return InjectionTarget{prop->second, &match.captures.front()};
  }

  // 2. Language named by the text of a capture.
  if (const QueryCapture * lang_capture = find_capture(match, k_language_key)) {
    const std::string_view lang = capture_text(*lang_capture, text);
    if (!lang.empty()) {
      const QueryCapture * content = find_capture(match, k_content_capture);
      if (content == nullptr || !is_configured(lang)) {
        return std::nullopt;
      }
      return InjectionTarget{std::string(lang), content};
    }
  }

  // 3. A capture named after a configured language.
  for (const auto & c : match.captures) {
    if (is_configured(c.name)) {
      return InjectionTarget{c.name, &c};
    }
  }
  return std::nullopt;
}

InjectionResolver::InjectionResolver(
  LanguageRegistry & registry, Tokenizer tokenizer, InjectionSettings settings, Logger logger,
  CancellationToken cancel)
: registry_(registry),
  tokenizer_(std::move(tokenizer)),
  settings_(settings),
  logger_(std::move(logger)),
  cancel_(std::move(cancel))
{
}

std::vector<Injection> InjectionResolver::resolve(
  const Query & injection_query, const SyntaxTree & tree, uint32_t depth) const
{
  const std::vector<QueryMatch> matches = injection_query.matches(tree);
  const std::string_view text = tree.text();

  // Discovery and the depth check run on the calling thread; only matches
  // that name a configured language are tokenized.
  std::vector<InjectionTarget> targets;
  for (const auto & m : matches) {
    throw_if_cancelled(cancel_);
    auto target = find_injection_target(
      m, text, [this](std::string_view lang) { return registry_.is_configured(lang); });
    if (target) targets.push_back(std::move(*target));
  }
  if (targets.empty()) {
    return {};
  }
  if (depth + 1 > settings_.max_depth) {
    throw InjectionDepthExceeded(settings_.max_depth);
  }

  std::vector<std::optional<Injection>> resolved;
  resolved.reserve(targets.size());

  // Only the document's own injections fan out; nested levels stay on the
  // worker that reached them.
  if (settings_.parallel && depth == 0 && targets.size() > 1) {
    for (size_t batch = 0; batch < targets.size(); batch += k_max_parallel_injections) {
      const size_t batch_end = std::min(targets.size(), batch + k_max_parallel_injections);
      std::vector<std::future<std::optional<Injection>>> pending;
      pending.reserve(batch_end - batch);
      for (size_t i = batch; i < batch_end; ++i) {
        const InjectionTarget & target = targets[i];
        try {
          pending.push_back(std::async(std::launch::async, [this, &target, text, depth] {
            return resolve_one(target, text, depth);
          }));
        } catch (const std::system_error & e) {
          logger_.debug(std::string("resolving injection inline: ") + e.what());
          std::promise<std::optional<Injection>> inline_result;
          inline_result.set_value(resolve_one(target, text, depth));
          pending.push_back(inline_result.get_future());
        }
      }
      for (auto & f : pending) {
        resolved.push_back(f.get());
      }
    }
  } else {
    for (const auto & target : targets) {
      resolved.push_back(resolve_one(target, text, depth));
    }
  }

  std::vector<Injection> out;
  for (auto & r : resolved) {
    if (r) out.push_back(std::move(*r));
  }
  return out;
}

std::optional<Injection> InjectionResolver::resolve_one(
  const InjectionTarget & target, std::string_view text, uint32_t depth) const
{
  throw_if_cancelled(cancel_);

  std::shared_ptr<const LanguageBinding> binding;
  try {
    binding = registry_.resolve(target.language);
  } catch (const LanguageLoadError & e) {
    logger_.warning(std::string("skipping injection: ") + e.what());
    return std::nullopt;
  } catch (const UnconfiguredLanguage & e) {
    // Configuration replaced between discovery and resolution.
    logger_.debug(std::string("skipping injection: ") + e.what());
    return std::nullopt;
  }

  const QueryCapture & content = *target.content;
  const std::string_view content_text = capture_text(content, text);

  std::vector<Token> tokens = tokenizer_(*binding, content_text, depth + 1);
  for (auto & t : tokens) {
    t.range = shift_range(t.range, content.range.start);
  }

  logger_.debug([&] {
    return "injection of " + target.language + " at line " +
           std::to_string(content.range.start.line) + " produced " +
           std::to_string(tokens.size()) + " tokens";
  });

  return Injection{content.range, std::move(tokens)};
}

}  // namespace semtok
