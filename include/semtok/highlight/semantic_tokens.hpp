// semtok/highlight/semantic_tokens.hpp - Renderer encodings of a token stream
#pragma once

#include <cstdint>
#include <gsl/span>
#include <nlohmann/json.hpp>
#include <vector>

#include "semtok/highlight/legend.hpp"
#include "semtok/highlight/token.hpp"

namespace semtok
{

/**
 * Relative integer encoding used by LSP `textDocument/semanticTokens`:
 * five integers per token (deltaLine, deltaStart, length, type index,
 * modifier bitmask).
 *
 * Tokens must be single-line and sorted by start position. Tokens whose type
 * is not in the legend, and empty tokens, are skipped.
 */
[[nodiscard]] std::vector<uint32_t> encode_semantic_tokens(
  gsl::span<const Token> tokens, const TokenLegend & legend);

/// `{"tokenTypes": [...], "tokenModifiers": [...]}` as announced to LSP clients.
[[nodiscard]] nlohmann::json legend_to_json(const TokenLegend & legend);

void to_json(nlohmann::json & j, const SourcePosition & pos);
void to_json(nlohmann::json & j, const SourceRange & range);
void to_json(nlohmann::json & j, const Token & token);

}  // namespace semtok
