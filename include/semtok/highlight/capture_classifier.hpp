// semtok/highlight/capture_classifier.hpp - Capture name to token classification
#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "semtok/basic/logger.hpp"
#include "semtok/highlight/legend.hpp"

namespace semtok
{

/// A capture name split at '.': first segment and the remaining ones in order.
struct CaptureName
{
  std::string base_type;
  std::vector<std::string> modifiers;
};

struct TypeMappingTarget
{
  std::string target_token_type;
  std::vector<std::string> target_token_modifiers;
};

/// Keyed by a full capture name ("variable.parameter") or a base type ("variable").
using TypeMapping = std::unordered_map<std::string, TypeMappingTarget>;

/// Type and modifiers of a capture that survived classification.
struct TokenClass
{
  std::string type;
  std::vector<std::string> modifiers;

  [[nodiscard]] bool operator==(const TokenClass & other) const
  {
    return type == other.type && modifiers == other.modifiers;
  }
};

/**
 * Split a capture name on '.'.
 *
 * @throws InvalidCapture if the name is empty
 */
[[nodiscard]] CaptureName parse_capture_name(std::string_view name);

/**
 * Classify a capture against an optional mapping table and the legend.
 *
 * A mapping keyed by the full capture name takes precedence over one keyed
 * by the base type; either replaces type and modifiers wholesale. Returns
 * nullopt when the resulting type is not in the legend; modifiers outside the
 * legend are dropped individually.
 *
 * @throws InvalidCapture if the name is empty
 */
[[nodiscard]] std::optional<TokenClass> classify_capture(
  std::string_view capture_name, const TypeMapping * mapping, const TokenLegend & legend,
  const Logger & logger = {});

}  // namespace semtok
