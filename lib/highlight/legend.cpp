// semtok/highlight/legend.cpp - Token legend lookups
#include "semtok/highlight/legend.hpp"

#include <algorithm>

namespace semtok
{

bool TokenLegend::has_type(std::string_view type) const noexcept
{
  return type_index(type).has_value();
}

bool TokenLegend::has_modifier(std::string_view modifier) const noexcept
{
  return std::find(token_modifiers.begin(), token_modifiers.end(), modifier) !=
         token_modifiers.end();
}

std::optional<uint32_t> TokenLegend::type_index(std::string_view type) const noexcept
{
  const auto it = std::find(token_types.begin(), token_types.end(), type);
  if (it == token_types.end()) {
    return std::nullopt;
  }
  return static_cast<uint32_t>(it - token_types.begin());
}

uint32_t TokenLegend::modifier_bitmask(const std::vector<std::string> & modifiers) const noexcept
{
  uint32_t mask = 0;
  for (size_t i = 0; i < token_modifiers.size() && i < 32; ++i) {
    if (std::find(modifiers.begin(), modifiers.end(), token_modifiers[i]) != modifiers.end()) {
      mask |= (1U << i);
    }
  }
  return mask;
}

const TokenLegend & default_legend()
{
  static const TokenLegend legend{
    {
      "namespace", "class",    "enum",     "interface", "struct",    "typeParameter",
      "type",      "parameter", "variable", "property",  "enumMember", "decorator",
      "event",     "function", "method",   "macro",     "label",     "comment",
      "string",    "keyword",  "number",   "regexp",    "operator",
    },
    {
      "declaration", "definition", "readonly",      "static",       "deprecated",
      "abstract",    "async",      "modification",  "documentation", "defaultLibrary",
    },
  };
  return legend;
}

}  // namespace semtok
