// semtok/highlight/token.hpp - Classified text ranges
#pragma once

#include <string>
#include <vector>

#include "semtok/basic/source_range.hpp"

namespace semtok
{

struct Token
{
  SourceRange range;
  std::string type;
  std::vector<std::string> modifiers;

  [[nodiscard]] bool operator==(const Token & other) const
  {
    return range == other.range && type == other.type && modifiers == other.modifiers;
  }
  [[nodiscard]] bool operator!=(const Token & other) const { return !(*this == other); }
};

/// An embedded-language region and its resolved tokens, both in parent coordinates.
struct Injection
{
  SourceRange range;
  std::vector<Token> tokens;
};

}  // namespace semtok
