// semtok/highlight/token_normalizer.cpp - Containment resolution and line splitting
#include "semtok/highlight/token_normalizer.hpp"

#include <algorithm>
#include <numeric>

#include "semtok/basic/error.hpp"

namespace semtok
{

namespace
{

std::string describe(SourceRange r)
{
  return std::to_string(r.start.line) + ":" + std::to_string(r.start.column) + "-" +
         std::to_string(r.end.line) + ":" + std::to_string(r.end.column);
}

/// Indices of `tokens` ordered by start ascending, then end descending, then index.
std::vector<size_t> nesting_order(const std::vector<Token> & tokens)
{
  std::vector<size_t> order(tokens.size());
  std::iota(order.begin(), order.end(), size_t{0});
  std::sort(order.begin(), order.end(), [&](size_t a, size_t b) {
    const SourceRange & ra = tokens[a].range;
    const SourceRange & rb = tokens[b].range;
    if (ra.start != rb.start) return ra.start < rb.start;
    if (ra.end != rb.end) return rb.end < ra.end;
    return a < b;
  });
  return order;
}

/// Gaps of `outer` not covered by `inner`, which is sorted by start.
std::vector<Token> gap_fragments(const Token & outer, const std::vector<const Token *> & inner)
{
  std::vector<Token> out;
  SourcePosition cursor = outer.range.start;
  for (const Token * t : inner) {
    if (cursor < t->range.start) {
      out.push_back(Token{{cursor, t->range.start}, outer.type, outer.modifiers});
    }
    if (cursor < t->range.end) {
      cursor = t->range.end;
    }
  }
  if (cursor < outer.range.end) {
    out.push_back(Token{{cursor, outer.range.end}, outer.type, outer.modifiers});
  }
  return out;
}

}  // namespace

std::vector<Token> resolve_containment(const std::vector<Token> & tokens)
{
  const std::vector<size_t> order = nesting_order(tokens);

  // Fragments per original index, so that output keeps input order.
  std::vector<std::vector<Token>> fragments(tokens.size());
  std::vector<bool> split(tokens.size(), false);

  for (size_t pos = 0; pos < order.size(); ++pos) {
    const Token & outer = tokens[order[pos]];

    // Every token starting inside `outer` follows it in nesting order.
    std::vector<const Token *> inner;
    for (size_t k = pos + 1; k < order.size(); ++k) {
      const Token & cand = tokens[order[k]];
      if (outer.range.end <= cand.range.start) break;
      if (outer.range.strictly_contains(cand.range)) {
        inner.push_back(&cand);
      }
    }

    if (!inner.empty()) {
      fragments[order[pos]] = gap_fragments(outer, inner);
      split[order[pos]] = true;
    }
  }

  std::vector<Token> out;
  out.reserve(tokens.size());
  for (size_t i = 0; i < tokens.size(); ++i) {
    if (!split[i]) {
      out.push_back(tokens[i]);
      continue;
    }
    for (auto & f : fragments[i]) {
      out.push_back(std::move(f));
    }
  }
  return out;
}

std::vector<Token> split_multiline(const Token & token)
{
  const SourcePosition start = token.range.start;
  const SourcePosition end = token.range.end;

  if (end.line < start.line) {
    throw InvalidRange("token range ends before it starts: " + describe(token.range));
  }
  if (start.line == end.line) {
    return {token};
  }

  std::vector<Token> out;
  out.reserve(end.line - start.line + 1);
  if (start.column < k_rest_of_line_column) {
    out.push_back(Token{{start, {start.line, k_rest_of_line_column}}, token.type, token.modifiers});
  }
  for (uint32_t line = start.line + 1; line < end.line; ++line) {
    out.push_back(Token{{line, 0, line, k_rest_of_line_column}, token.type, token.modifiers});
  }
  if (end.column > 0) {
    out.push_back(Token{{{end.line, 0}, end}, token.type, token.modifiers});
  }
  return out;
}

std::vector<Token> normalize_tokens(std::vector<Token> tokens)
{
  for (const auto & t : tokens) {
    if (t.range.end < t.range.start) {
      throw InvalidRange("token range ends before it starts: " + describe(t.range));
    }
  }

  // Zero-width captures cannot be rendered.
  tokens.erase(
    std::remove_if(
      tokens.begin(), tokens.end(), [](const Token & t) { return t.range.is_empty(); }),
    tokens.end());

  // Several captures on one node: the last one wins.
  {
    const std::vector<size_t> order = nesting_order(tokens);
    std::vector<bool> keep(tokens.size(), true);
    for (size_t pos = 0; pos + 1 < order.size(); ++pos) {
      if (tokens[order[pos]].range == tokens[order[pos + 1]].range) {
        keep[order[pos]] = false;
      }
    }
    std::vector<Token> unique;
    unique.reserve(tokens.size());
    for (size_t i = 0; i < tokens.size(); ++i) {
      if (keep[i]) unique.push_back(std::move(tokens[i]));
    }
    tokens = std::move(unique);
  }

  std::vector<Token> out;
  out.reserve(tokens.size());
  for (const auto & t : resolve_containment(tokens)) {
    for (auto & piece : split_multiline(t)) {
      out.push_back(std::move(piece));
    }
  }
  return out;
}

}  // namespace semtok
