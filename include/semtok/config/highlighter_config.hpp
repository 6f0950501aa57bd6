// semtok/config/highlighter_config.hpp - Language configuration (semtok.yaml / host settings)
//
// Parses and validates the per-language configuration consumed by the
// highlighter. Designed for reuse in both CLI and LSP.
//
#pragma once

#include <cstdint>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "semtok/highlight/capture_classifier.hpp"

namespace semtok
{

// ============================================================================
// Configuration Structures
// ============================================================================

/**
 * One configured language. Asset paths are absolute once loaded.
 */
struct LanguageConfig
{
  /// Language identifier, matched against the document/content language
  std::string lang;

  /// Grammar artifact (shared library)
  std::filesystem::path parser;

  /// Highlight query source
  std::filesystem::path highlights;

  /// Injection query source
  std::optional<std::filesystem::path> injections;

  /// Only reachable through injections, never offered for whole documents
  bool injection_only = false;

  /// Capture name remapping
  std::optional<TypeMapping> semantic_token_type_mappings;
};

/**
 * Complete highlighter configuration.
 */
struct HighlighterConfig
{
  std::vector<LanguageConfig> languages;

  /// Enables debug logging
  bool debug = false;

  /// Resolve sibling injections concurrently
  bool parallel_injections = false;

  /// Injection nesting ceiling
  uint32_t max_injection_depth = 16;

  /// Directory that relative asset paths were resolved against
  std::optional<std::filesystem::path> workspace_root;

  [[nodiscard]] const LanguageConfig * find_language(std::string_view lang) const noexcept;
};

// ============================================================================
// Configuration Loading Result
// ============================================================================

struct ConfigLoadResult
{
  /// Loaded configuration (only valid if success == true)
  HighlighterConfig config;

  bool success = false;

  /// Error message if loading failed
  std::string error;

  static ConfigLoadResult ok(HighlighterConfig cfg)
  {
    ConfigLoadResult r;
    r.config = std::move(cfg);
    r.success = true;
    return r;
  }

  static ConfigLoadResult fail(std::string msg)
  {
    ConfigLoadResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

// ============================================================================
// Configuration Loading API
// ============================================================================

/**
 * Resolve an asset path.
 *
 * @return `path` if absolute, otherwise `workspace_root / path`
 * @throws PathResolutionError if `path` is relative and there is no root
 */
[[nodiscard]] std::filesystem::path resolve_asset_path(
  const std::filesystem::path & path, const std::optional<std::filesystem::path> & workspace_root);

/**
 * Validate a list of language configurations in host-settings form (a JSON
 * array of objects with camelCase keys) and resolve their asset paths.
 */
[[nodiscard]] ConfigLoadResult parse_language_configs(
  const nlohmann::json & configs, const std::optional<std::filesystem::path> & workspace_root);

/**
 * Load a semtok.yaml file. Relative asset paths resolve against the
 * directory containing the file.
 *
 * @param config_path Path to semtok.yaml
 */
[[nodiscard]] ConfigLoadResult load_highlighter_config(const std::filesystem::path & config_path);

/**
 * Search for semtok.yaml from start_dir up to the filesystem root.
 */
[[nodiscard]] std::optional<std::filesystem::path> find_highlighter_config(
  const std::filesystem::path & start_dir);

inline constexpr const char * k_config_file_name = "semtok.yaml";

}  // namespace semtok
