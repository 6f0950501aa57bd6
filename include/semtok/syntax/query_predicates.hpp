// semtok/syntax/query_predicates.hpp - Text predicates and directives of queries
//
// Queries carry `#eq?`, `#match?`, `#any-of?` style predicates and `#set!`
// directives that the matching runtime evaluates itself.
//
#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace semtok
{

struct PredicateArg
{
  enum class Kind : uint8_t { Capture, String };

  Kind kind = Kind::String;
  uint32_t capture_id = 0;  ///< valid for Kind::Capture
  std::string value;        ///< string literal, or the capture name

  [[nodiscard]] bool is_capture() const noexcept { return kind == Kind::Capture; }
};

struct QueryPredicate
{
  std::string name;  ///< without the leading '#', e.g. "eq?" or "set!"
  std::vector<PredicateArg> args;
  std::shared_ptr<const std::regex> regex;  ///< compiled pattern of match? variants
};

/// Texts of every node captured under a capture id in one match.
using CaptureTexts = std::function<std::vector<std::string_view>(uint32_t capture_id)>;

/**
 * Validate predicate arity and compile regular expressions.
 *
 * @return an error message, empty on success
 */
[[nodiscard]] std::string prepare_predicate(QueryPredicate & predicate);

/// True if every recognised text predicate holds. Unknown predicates are ignored.
[[nodiscard]] bool predicates_hold(
  const std::vector<QueryPredicate> & predicates, const CaptureTexts & texts);

/// Apply `set!` directives to a match's property map.
void apply_directives(
  const std::vector<QueryPredicate> & predicates, std::map<std::string, std::string> & properties);

}  // namespace semtok
