// semtok/highlight/token_merger.hpp - Splicing injection tokens into a parent stream
#pragma once

#include <gsl/span>
#include <vector>

#include "semtok/highlight/token.hpp"

namespace semtok
{

/**
 * Combine parent tokens with resolved injections.
 *
 * For each injection with at least one token, parent tokens inside its range
 * are dropped and parent tokens overlapping it are clipped to the parts
 * before and after it. Injections without tokens leave the parent untouched.
 * The result is the surviving parent fragments followed by every injection's
 * tokens, in discovery order; it is not sorted.
 */
[[nodiscard]] std::vector<Token> merge_injections(
  std::vector<Token> parent_tokens, gsl::span<const Injection> injections);

/// Stable sort by start position (line, then column).
void sort_tokens(std::vector<Token> & tokens);

}  // namespace semtok
