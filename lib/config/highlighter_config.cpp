// semtok/config/highlighter_config.cpp - Configuration loading and validation
//
#include "semtok/config/highlighter_config.hpp"

#include <yaml-cpp/yaml.h>

#include "semtok/basic/error.hpp"

namespace fs = std::filesystem;

namespace semtok
{

namespace
{

using json = nlohmann::json;

// ----------------------------------------------------------------------------
// Host settings (JSON)
// ----------------------------------------------------------------------------

std::optional<TypeMapping> mapping_from_json(const json & j, std::string & error)
{
  TypeMapping mapping;
  for (const auto & [source, target] : j.items()) {
    if (!target.is_object()) {
      error = "Expected mapping for `" + source + "` to be an object.";
      return std::nullopt;
    }
    TypeMappingTarget t;
    const auto type_it = target.find("targetTokenType");
    if (type_it == target.end() || !type_it->is_string()) {
      error = "Expected `targetTokenType` of `" + source + "` to be a string.";
      return std::nullopt;
    }
    t.target_token_type = type_it->get<std::string>();

    const auto mods_it = target.find("targetTokenModifiers");
    if (mods_it != target.end() && !mods_it->is_null()) {
      if (!mods_it->is_array()) {
        error = "Expected `targetTokenModifiers` of `" + source + "` to be a list.";
        return std::nullopt;
      }
      for (const auto & m : *mods_it) {
        if (!m.is_string()) {
          error = "Expected `targetTokenModifiers` of `" + source + "` to contain strings.";
          return std::nullopt;
        }
        t.target_token_modifiers.push_back(m.get<std::string>());
      }
    }
    mapping.emplace(source, std::move(t));
  }
  return mapping;
}

std::optional<LanguageConfig> language_from_json(const json & j, std::string & error)
{
  if (!j.is_object()) {
    error = "Expected each language config to be an object.";
    return std::nullopt;
  }

  auto required_string = [&](const char * key, std::string & out) {
    const auto it = j.find(key);
    if (it == j.end() || !it->is_string()) {
      error = std::string("Expected `") + key + "` to be a string.";
      return false;
    }
    out = it->get<std::string>();
    return true;
  };

  LanguageConfig cfg;
  std::string parser;
  std::string highlights;
  if (
    !required_string("lang", cfg.lang) || !required_string("parser", parser) ||
    !required_string("highlights", highlights)) {
    return std::nullopt;
  }
  cfg.parser = parser;
  cfg.highlights = highlights;

  if (const auto it = j.find("injections"); it != j.end() && !it->is_null()) {
    if (!it->is_string()) {
      error = "Expected `injections` to be a string.";
      return std::nullopt;
    }
    cfg.injections = fs::path(it->get<std::string>());
  }

  if (const auto it = j.find("injectionOnly"); it != j.end() && !it->is_null()) {
    if (!it->is_boolean()) {
      error = "Expected `injectionOnly` to be a boolean.";
      return std::nullopt;
    }
    cfg.injection_only = it->get<bool>();
  }

  if (const auto it = j.find("semanticTokenTypeMappings"); it != j.end()) {
    if (!it->is_object()) {
      error = "Expected `semanticTokenTypeMappings` to be an object.";
      return std::nullopt;
    }
    auto mapping = mapping_from_json(*it, error);
    if (!mapping) {
      return std::nullopt;
    }
    cfg.semantic_token_type_mappings = std::move(*mapping);
  }

  return cfg;
}

// ----------------------------------------------------------------------------
// semtok.yaml
// ----------------------------------------------------------------------------

std::optional<TypeMapping> mapping_from_yaml(const YAML::Node & node, std::string & error)
{
  TypeMapping mapping;
  for (const auto & entry : node) {
    const auto source = entry.first.as<std::string>();
    const YAML::Node & target = entry.second;
    if (!target.IsMap() || !target["targetTokenType"]) {
      error = "mapping for '" + source + "' must have 'targetTokenType'";
      return std::nullopt;
    }
    TypeMappingTarget t;
    t.target_token_type = target["targetTokenType"].as<std::string>();
    if (target["targetTokenModifiers"]) {
      if (!target["targetTokenModifiers"].IsSequence()) {
        error = "targetTokenModifiers of '" + source + "' must be a list";
        return std::nullopt;
      }
      for (const auto & m : target["targetTokenModifiers"]) {
        t.target_token_modifiers.push_back(m.as<std::string>());
      }
    }
    mapping.emplace(source, std::move(t));
  }
  return mapping;
}

/// Parse a single language entry
std::optional<LanguageConfig> language_from_yaml(const YAML::Node & node, std::string & error)
{
  if (!node.IsMap()) {
    error = "language entry must be a map";
    return std::nullopt;
  }

  for (const char * key : {"lang", "parser", "highlights"}) {
    if (!node[key]) {
      error = std::string("language entry is missing '") + key + "'";
      return std::nullopt;
    }
  }

  LanguageConfig cfg;
  cfg.lang = node["lang"].as<std::string>();
  cfg.parser = node["parser"].as<std::string>();
  cfg.highlights = node["highlights"].as<std::string>();

  if (node["injections"] && !node["injections"].IsNull()) {
    cfg.injections = fs::path(node["injections"].as<std::string>());
  }
  if (node["injectionOnly"]) {
    cfg.injection_only = node["injectionOnly"].as<bool>();
  }
  if (node["semanticTokenTypeMappings"]) {
    if (!node["semanticTokenTypeMappings"].IsMap()) {
      error = "semanticTokenTypeMappings of '" + cfg.lang + "' must be a map";
      return std::nullopt;
    }
    auto mapping = mapping_from_yaml(node["semanticTokenTypeMappings"], error);
    if (!mapping) {
      return std::nullopt;
    }
    cfg.semantic_token_type_mappings = std::move(*mapping);
  }
  return cfg;
}

/// Make every asset path of `cfg` absolute.
void resolve_paths(LanguageConfig & cfg, const std::optional<fs::path> & root)
{
  cfg.parser = resolve_asset_path(cfg.parser, root);
  cfg.highlights = resolve_asset_path(cfg.highlights, root);
  if (cfg.injections) {
    cfg.injections = resolve_asset_path(*cfg.injections, root);
  }
}

}  // namespace

const LanguageConfig * HighlighterConfig::find_language(std::string_view lang) const noexcept
{
  for (const auto & l : languages) {
    if (l.lang == lang) return &l;
  }
  return nullptr;
}

fs::path resolve_asset_path(const fs::path & path, const std::optional<fs::path> & workspace_root)
{
  if (path.is_absolute()) {
    return path;
  }
  if (!workspace_root || workspace_root->empty()) {
    throw PathResolutionError(
      "cannot resolve relative path '" + path.string() + "': no workspace root is available");
  }
  return (*workspace_root / path).lexically_normal();
}

ConfigLoadResult parse_language_configs(
  const json & configs, const std::optional<fs::path> & workspace_root)
{
  if (!configs.is_array()) {
    return ConfigLoadResult::fail("Expected a list.");
  }

  HighlighterConfig config;
  config.workspace_root = workspace_root;

  for (const auto & entry : configs) {
    std::string error;
    auto lang = language_from_json(entry, error);
    if (!lang) {
      return ConfigLoadResult::fail(error);
    }
    try {
      resolve_paths(*lang, workspace_root);
    } catch (const PathResolutionError & e) {
      return ConfigLoadResult::fail(e.what());
    }
    config.languages.push_back(std::move(*lang));
  }

  return ConfigLoadResult::ok(std::move(config));
}

ConfigLoadResult load_highlighter_config(const fs::path & config_path)
{
  // Check if file exists
  if (!fs::exists(config_path)) {
    return ConfigLoadResult::fail("configuration file not found: " + config_path.string());
  }

  // Load YAML
  YAML::Node root;
  try {
    root = YAML::LoadFile(config_path.string());
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }

  HighlighterConfig config;
  config.workspace_root = fs::absolute(config_path).parent_path();

  try {
    if (root["debug"]) {
      config.debug = root["debug"].as<bool>();
    }
    if (root["parallelInjections"]) {
      config.parallel_injections = root["parallelInjections"].as<bool>();
    }
    if (root["maxInjectionDepth"]) {
      config.max_injection_depth = root["maxInjectionDepth"].as<uint32_t>();
    }

    if (root["languageConfigs"]) {
      if (!root["languageConfigs"].IsSequence()) {
        return ConfigLoadResult::fail("languageConfigs must be a list");
      }
      for (const auto & node : root["languageConfigs"]) {
        std::string error;
        auto lang = language_from_yaml(node, error);
        if (!lang) {
          return ConfigLoadResult::fail("invalid language config: " + error);
        }
        resolve_paths(*lang, config.workspace_root);
        config.languages.push_back(std::move(*lang));
      }
    }
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("invalid configuration: " + std::string(e.what()));
  }

  return ConfigLoadResult::ok(std::move(config));
}

std::optional<fs::path> find_highlighter_config(const fs::path & start_dir)
{
  fs::path current = fs::absolute(start_dir);

  // If start_dir is a file, start from its parent
  if (fs::is_regular_file(current)) {
    current = current.parent_path();
  }

  while (true) {
    fs::path candidate = current / k_config_file_name;
    if (fs::exists(candidate)) {
      return candidate;
    }

    const fs::path parent = current.parent_path();
    if (parent == current) {
      // Reached filesystem root
      break;
    }
    current = parent;
  }

  return std::nullopt;
}

}  // namespace semtok
