// semtok/syntax/ts_ll.hpp - Low-level Tree-sitter wrapper (RAII handles)
#pragma once

#include <tree_sitter/api.h>

#include <cstdint>
#include <string_view>

namespace semtok::ts_ll
{

//------------------------------------------------------------------------------
// Node - thin wrapper around TSNode
//------------------------------------------------------------------------------
class Node
{
public:
  Node() : node_{} {}
  explicit Node(TSNode n) : node_(n) {}

  [[nodiscard]] bool is_null() const noexcept { return ts_node_is_null(node_); }

  [[nodiscard]] std::string_view kind() const noexcept
  {
    const char * t = ts_node_type(node_);
    return t ? std::string_view(t) : std::string_view();
  }

  [[nodiscard]] uint32_t start_byte() const noexcept { return ts_node_start_byte(node_); }
  [[nodiscard]] uint32_t end_byte() const noexcept { return ts_node_end_byte(node_); }

  /// Row and byte column.
  [[nodiscard]] TSPoint start_point() const noexcept { return ts_node_start_point(node_); }
  [[nodiscard]] TSPoint end_point() const noexcept { return ts_node_end_point(node_); }

  [[nodiscard]] std::string_view text(std::string_view source) const noexcept
  {
    const uint32_t s = start_byte();
    const uint32_t e = end_byte();
    if (s >= source.size() || e <= s) return {};
    return source.substr(s, e - s);
  }

  [[nodiscard]] TSNode raw() const noexcept { return node_; }

private:
  TSNode node_;
};

//------------------------------------------------------------------------------
// Parser/Tree - RAII wrappers
//------------------------------------------------------------------------------
class Parser
{
public:
  /// Check ok() before use: the language may be ABI-incompatible.
  explicit Parser(const TSLanguage * language);
  Parser(const Parser &) = delete;
  Parser & operator=(const Parser &) = delete;
  ~Parser();

  [[nodiscard]] bool ok() const noexcept { return ok_; }

  [[nodiscard]] TSTree * parse_string(std::string_view source) const;

private:
  TSParser * parser_ = nullptr;
  bool ok_ = false;
};

class Tree
{
public:
  explicit Tree(TSTree * t = nullptr) : tree_(t) {}
  Tree(const Tree &) = delete;
  Tree & operator=(const Tree &) = delete;

  Tree(Tree && other) noexcept : tree_(other.tree_) { other.tree_ = nullptr; }
  Tree & operator=(Tree && other) noexcept
  {
    if (this != &other) {
      reset();
      tree_ = other.tree_;
      other.tree_ = nullptr;
    }
    return *this;
  }

  ~Tree() { reset(); }

  void reset(TSTree * t = nullptr)
  {
    if (tree_) ts_tree_delete(tree_);
    tree_ = t;
  }

  [[nodiscard]] bool is_null() const noexcept { return tree_ == nullptr; }

  [[nodiscard]] Node root_node() const noexcept
  {
    return tree_ ? Node(ts_tree_root_node(tree_)) : Node();
  }

private:
  TSTree * tree_ = nullptr;
};

//------------------------------------------------------------------------------
// Query/QueryCursor - RAII wrappers
//------------------------------------------------------------------------------
class Query
{
public:
  explicit Query(TSQuery * q = nullptr) : query_(q) {}
  Query(const Query &) = delete;
  Query & operator=(const Query &) = delete;

  Query(Query && other) noexcept : query_(other.query_) { other.query_ = nullptr; }
  Query & operator=(Query && other) noexcept
  {
    if (this != &other) {
      if (query_) ts_query_delete(query_);
      query_ = other.query_;
      other.query_ = nullptr;
    }
    return *this;
  }

  ~Query()
  {
    if (query_) ts_query_delete(query_);
  }

  [[nodiscard]] bool is_null() const noexcept { return query_ == nullptr; }
  [[nodiscard]] const TSQuery * raw() const noexcept { return query_; }

  [[nodiscard]] uint32_t pattern_count() const noexcept { return ts_query_pattern_count(query_); }
  [[nodiscard]] uint32_t capture_count() const noexcept { return ts_query_capture_count(query_); }

  [[nodiscard]] std::string_view capture_name(uint32_t id) const noexcept
  {
    uint32_t len = 0;
    const char * name = ts_query_capture_name_for_id(query_, id, &len);
    return name ? std::string_view(name, len) : std::string_view();
  }

  [[nodiscard]] std::string_view string_value(uint32_t id) const noexcept
  {
    uint32_t len = 0;
    const char * value = ts_query_string_value_for_id(query_, id, &len);
    return value ? std::string_view(value, len) : std::string_view();
  }

private:
  TSQuery * query_ = nullptr;
};

class QueryCursor
{
public:
  QueryCursor() : cursor_(ts_query_cursor_new()) {}
  QueryCursor(const QueryCursor &) = delete;
  QueryCursor & operator=(const QueryCursor &) = delete;
  ~QueryCursor() { ts_query_cursor_delete(cursor_); }

  void exec(const Query & query, Node node) noexcept
  {
    ts_query_cursor_exec(cursor_, query.raw(), node.raw());
  }

  [[nodiscard]] bool next_match(TSQueryMatch & match) noexcept
  {
    return ts_query_cursor_next_match(cursor_, &match);
  }

private:
  TSQueryCursor * cursor_;
};

}  // namespace semtok::ts_ll
