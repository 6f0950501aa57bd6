// semtok/highlight/legend.hpp - Token type/modifier vocabulary shared with the renderer
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace semtok
{

/**
 * The closed, positionally addressed vocabulary of token types and
 * modifiers.
 *
 * The order of both lists is part of the contract with the renderer: the
 * encoded token stream refers to types by index and to modifiers by bit.
 */
struct TokenLegend
{
  std::vector<std::string> token_types;
  std::vector<std::string> token_modifiers;

  [[nodiscard]] bool has_type(std::string_view type) const noexcept;
  [[nodiscard]] bool has_modifier(std::string_view modifier) const noexcept;

  [[nodiscard]] std::optional<uint32_t> type_index(std::string_view type) const noexcept;

  /// Bit i is set when token_modifiers[i] is in `modifiers`; unknown names are ignored.
  [[nodiscard]] uint32_t modifier_bitmask(const std::vector<std::string> & modifiers) const noexcept;
};

/// The editor's standard semantic token types and modifiers.
[[nodiscard]] const TokenLegend & default_legend();

}  // namespace semtok
