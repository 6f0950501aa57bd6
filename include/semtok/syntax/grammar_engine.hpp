// semtok/syntax/grammar_engine.hpp - Parser and query-matching services
//
// The highlight pipeline only sees these interfaces. The production backend
// is tree-sitter (semtok/syntax/tree_sitter_engine.hpp); tests use a scripted
// stand-in.
//
#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "semtok/basic/source_range.hpp"

namespace semtok
{

struct QueryCapture
{
  std::string name;
  SourceRange range;  ///< UTF-16 positions in the parsed text
  uint32_t start_byte = 0;
  uint32_t end_byte = 0;
};

struct QueryMatch
{
  uint32_t pattern_index = 0;
  std::vector<QueryCapture> captures;
  /// Key/value pairs set by directives such as `(#set! injection.language "x")`.
  std::map<std::string, std::string> properties;
};

/// Result of parsing one text. Opaque to the pipeline.
class SyntaxTree
{
public:
  virtual ~SyntaxTree() = default;

  /// The text the tree was parsed from.
  [[nodiscard]] virtual std::string_view text() const noexcept = 0;
};

/// A compiled query. Must be safe to match from several threads at once.
class Query
{
public:
  virtual ~Query() = default;

  [[nodiscard]] virtual std::vector<QueryMatch> matches(const SyntaxTree & tree) const = 0;
};

/// A loaded grammar. parse() and compile_query() may be called concurrently.
class Grammar
{
public:
  virtual ~Grammar() = default;

  /// Returns nullptr when the engine produced no tree.
  [[nodiscard]] virtual std::unique_ptr<SyntaxTree> parse(std::string_view text) const = 0;

  /**
   * @throws QueryCompileError if the source does not compile for this grammar
   */
  [[nodiscard]] virtual std::unique_ptr<Query> compile_query(std::string_view source) const = 0;

  [[nodiscard]] virtual uint32_t abi_version() const noexcept = 0;
};

class GrammarEngine
{
public:
  virtual ~GrammarEngine() = default;

  /// Process-wide engine setup. Idempotent and thread-safe.
  virtual void initialize() = 0;

  /**
   * Load a grammar artifact.
   *
   * @throws LanguageLoadError if the artifact is missing or incompatible
   */
  [[nodiscard]] virtual std::shared_ptr<const Grammar> load_grammar(
    const std::filesystem::path & artifact, std::string_view language_id) = 0;
};

}  // namespace semtok
