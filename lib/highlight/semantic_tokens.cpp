// semtok/highlight/semantic_tokens.cpp - LSP encoding and JSON views of tokens
#include "semtok/highlight/semantic_tokens.hpp"

namespace semtok
{

std::vector<uint32_t> encode_semantic_tokens(
  gsl::span<const Token> tokens, const TokenLegend & legend)
{
  std::vector<uint32_t> data;
  data.reserve(tokens.size() * 5);

  uint32_t prev_line = 0;
  uint32_t prev_char = 0;

  for (const Token & t : tokens) {
    const SourceRange & r = t.range;
    if (!r.is_single_line() || r.end.column <= r.start.column) {
      continue;
    }
    const auto type_index = legend.type_index(t.type);
    if (!type_index) {
      continue;
    }

    const uint32_t delta_line = r.start.line - prev_line;
    const uint32_t delta_char = (delta_line == 0) ? (r.start.column - prev_char) : r.start.column;

    data.push_back(delta_line);
    data.push_back(delta_char);
    data.push_back(r.end.column - r.start.column);
    data.push_back(*type_index);
    data.push_back(legend.modifier_bitmask(t.modifiers));

    prev_line = r.start.line;
    prev_char = r.start.column;
  }

  return data;
}

nlohmann::json legend_to_json(const TokenLegend & legend)
{
  return nlohmann::json{
    {"tokenTypes", legend.token_types},
    {"tokenModifiers", legend.token_modifiers},
  };
}

void to_json(nlohmann::json & j, const SourcePosition & pos)
{
  j = nlohmann::json{{"line", pos.line}, {"character", pos.column}};
}

void to_json(nlohmann::json & j, const SourceRange & range)
{
  j = nlohmann::json{{"start", range.start}, {"end", range.end}};
}

void to_json(nlohmann::json & j, const Token & token)
{
  j = nlohmann::json{
    {"range", token.range},
    {"type", token.type},
    {"modifiers", token.modifiers},
  };
}

}  // namespace semtok
