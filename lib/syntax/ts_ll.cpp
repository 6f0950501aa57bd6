// semtok/syntax/ts_ll.cpp - Low-level Tree-sitter wrapper implementation
#include "semtok/syntax/ts_ll.hpp"

#include <cassert>

namespace semtok::ts_ll
{

Parser::Parser(const TSLanguage * language)
{
  parser_ = ts_parser_new();
  assert(parser_ && "ts_parser_new() failed");

  // Fails when the grammar's ABI is outside what the runtime accepts.
  ok_ = language != nullptr && ts_parser_set_language(parser_, language);
}

Parser::~Parser()
{
  if (parser_) ts_parser_delete(parser_);
  parser_ = nullptr;
}

TSTree * Parser::parse_string(std::string_view source) const
{
  if (!ok_) return nullptr;
  // Tree-sitter consumes bytes; the grammars expect UTF-8.
  return ts_parser_parse_string(
    parser_, /*old_tree*/ nullptr, source.data(), static_cast<uint32_t>(source.size()));
}

}  // namespace semtok::ts_ll
