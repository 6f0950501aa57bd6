// semtok/highlight/token_normalizer.hpp - Overlap resolution and line splitting
#pragma once

#include <cstdint>
#include <vector>

#include "semtok/highlight/token.hpp"

namespace semtok
{

/**
 * Column used as "end of line" for fragments of multi-line tokens.
 *
 * Renderers clip it to the real line length. It must stay finite: some
 * renderers mishandle the maximum of the column type.
 */
inline constexpr uint32_t k_rest_of_line_column = 100000;

/**
 * Replace every token that strictly contains other tokens by the gaps that
 * those tokens leave uncovered, keeping the outer token's classification.
 *
 * Identical ranges do not contain each other. Nested containment of any
 * depth comes out non-overlapping because the gap walk skips past the
 * furthest end seen so far.
 */
[[nodiscard]] std::vector<Token> resolve_containment(const std::vector<Token> & tokens);

/**
 * Split a token spanning several lines into one fragment per line. A token
 * ending at column 0 gets no fragment on its last line, and one starting at
 * or past k_rest_of_line_column gets none on its first.
 *
 * @throws InvalidRange if the token ends on a line before it starts
 */
[[nodiscard]] std::vector<Token> split_multiline(const Token & token);

/**
 * Full normalization of one grammar pass: drop zero-width tokens, keep the
 * last of several tokens sharing an identical range, resolve containment,
 * split multi-line tokens. Input order is otherwise preserved.
 *
 * @throws InvalidRange on an inverted token range
 */
[[nodiscard]] std::vector<Token> normalize_tokens(std::vector<Token> tokens);

}  // namespace semtok
