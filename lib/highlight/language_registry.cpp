// semtok/highlight/language_registry.cpp - Lazy language loading
#include "semtok/highlight/language_registry.hpp"

#include <fstream>
#include <sstream>
#include <utility>

#include "semtok/basic/error.hpp"

namespace semtok
{

namespace
{

std::string read_query_source(const std::string & lang, const std::filesystem::path & path)
{
  std::ifstream f(path, std::ios::in | std::ios::binary);
  if (!f.is_open()) {
    throw LanguageLoadError(lang, "cannot read query file " + path.string());
  }
  std::ostringstream ss;
  ss << f.rdbuf();
  return ss.str();
}

}  // namespace

LanguageRegistry::LanguageRegistry(
  std::shared_ptr<GrammarEngine> engine, HighlighterConfig config, Logger logger)
: engine_(std::move(engine)), logger_(std::move(logger)), config_(std::move(config))
{
}

std::shared_ptr<const LanguageBinding> LanguageRegistry::resolve(std::string_view language_id)
{
  const std::shared_lock<std::shared_mutex> generation(generation_mutex_);

  const LanguageConfig * cfg = config_.find_language(language_id);
  if (cfg == nullptr) {
    throw UnconfiguredLanguage(std::string(language_id));
  }

  std::shared_ptr<Slot> slot;
  {
    const std::lock_guard<std::mutex> lock(slots_mutex_);
    auto & entry = slots_[cfg->lang];
    if (!entry) {
      entry = std::make_shared<Slot>();
    }
    slot = entry;
  }

  // First caller loads, concurrent callers for the same language wait here.
  const std::lock_guard<std::mutex> lock(slot->mutex);
  if (slot->binding) {
    return slot->binding;
  }
  slot->binding = load(*cfg);
  return slot->binding;
}

std::shared_ptr<const LanguageBinding> LanguageRegistry::load(const LanguageConfig & config) const
{
  logger_.info("initializing language: " + config.lang);

  engine_->initialize();

  auto binding = std::make_shared<LanguageBinding>();
  binding->language_id = config.lang;
  binding->grammar = engine_->load_grammar(config.parser, config.lang);
  if (!binding->grammar) {
    throw LanguageLoadError(config.lang, "grammar engine returned no grammar");
  }
  logger_.debug([&] {
    return "grammar ABI version for " + config.lang + " is " +
           std::to_string(binding->grammar->abi_version());
  });

  binding->highlight_query =
    binding->grammar->compile_query(read_query_source(config.lang, config.highlights));
  if (config.injections) {
    binding->injection_query =
      binding->grammar->compile_query(read_query_source(config.lang, *config.injections));
  }
  binding->type_mapping = config.semantic_token_type_mappings;
  return binding;
}

bool LanguageRegistry::is_configured(std::string_view language_id) const
{
  const std::shared_lock<std::shared_mutex> generation(generation_mutex_);
  return config_.find_language(language_id) != nullptr;
}

std::vector<std::string> LanguageRegistry::document_languages() const
{
  const std::shared_lock<std::shared_mutex> generation(generation_mutex_);
  std::vector<std::string> out;
  for (const auto & lang : config_.languages) {
    if (!lang.injection_only) {
      out.push_back(lang.lang);
    }
  }
  return out;
}

bool LanguageRegistry::is_loaded(std::string_view language_id) const
{
  const std::shared_lock<std::shared_mutex> generation(generation_mutex_);
  std::shared_ptr<Slot> slot;
  {
    const std::lock_guard<std::mutex> lock(slots_mutex_);
    const auto it = slots_.find(std::string(language_id));
    if (it == slots_.end()) {
      return false;
    }
    slot = it->second;
  }
  const std::lock_guard<std::mutex> lock(slot->mutex);
  return slot->binding != nullptr;
}

void LanguageRegistry::reload()
{
  const std::unique_lock<std::shared_mutex> generation(generation_mutex_);
  const std::lock_guard<std::mutex> lock(slots_mutex_);
  slots_.clear();
  logger_.info("language cache cleared");
}

void LanguageRegistry::reload(HighlighterConfig config)
{
  const std::unique_lock<std::shared_mutex> generation(generation_mutex_);
  const std::lock_guard<std::mutex> lock(slots_mutex_);
  slots_.clear();
  config_ = std::move(config);
  logger_.info("configuration replaced, language cache cleared");
}

InjectionSettings LanguageRegistry::injection_settings() const
{
  const std::shared_lock<std::shared_mutex> generation(generation_mutex_);
  return InjectionSettings{config_.parallel_injections, config_.max_injection_depth};
}

}  // namespace semtok
