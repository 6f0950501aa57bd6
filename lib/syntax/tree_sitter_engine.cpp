// semtok/syntax/tree_sitter_engine.cpp - Tree-sitter implementation of GrammarEngine
#include "semtok/syntax/tree_sitter_engine.hpp"

#include <dlfcn.h>
#include <tree_sitter/api.h>

#include <algorithm>
#include <cctype>
#include <stdexcept>

#include "semtok/basic/error.hpp"
#include "semtok/basic/line_index.hpp"
#include "semtok/syntax/query_predicates.hpp"
#include "semtok/syntax/ts_ll.hpp"

namespace semtok
{

namespace
{

using LanguageFn = const TSLanguage * (*)();

// ============================================================================
// Syntax tree
// ============================================================================

class TreeSitterTree : public SyntaxTree
{
public:
  TreeSitterTree(ts_ll::Tree tree, std::string text)
  : tree_(std::move(tree)), text_(std::move(text)), lines_(text_)
  {
  }

  TreeSitterTree(const TreeSitterTree &) = delete;
  TreeSitterTree & operator=(const TreeSitterTree &) = delete;

  [[nodiscard]] std::string_view text() const noexcept override { return text_; }
  [[nodiscard]] const ts_ll::Tree & tree() const noexcept { return tree_; }
  [[nodiscard]] const LineIndex & lines() const noexcept { return lines_; }

private:
  ts_ll::Tree tree_;
  std::string text_;
  LineIndex lines_;  // views text_
};

// ============================================================================
// Query
// ============================================================================

class TreeSitterQuery : public Query
{
public:
  TreeSitterQuery(ts_ll::Query query, std::vector<std::vector<QueryPredicate>> predicates)
  : query_(std::move(query)), predicates_(std::move(predicates))
  {
    capture_names_.reserve(query_.capture_count());
    for (uint32_t i = 0; i < query_.capture_count(); ++i) {
      capture_names_.emplace_back(query_.capture_name(i));
    }
  }

  [[nodiscard]] std::vector<QueryMatch> matches(const SyntaxTree & tree) const override
  {
    const auto * ts_tree = dynamic_cast<const TreeSitterTree *>(&tree);
    if (!ts_tree) {
      throw std::invalid_argument("tree-sitter query matched against a foreign syntax tree");
    }

    const std::string_view text = ts_tree->text();
    const LineIndex & lines = ts_tree->lines();

    // TSQuery is immutable once built; each call owns its cursor.
    ts_ll::QueryCursor cursor;
    cursor.exec(query_, ts_tree->tree().root_node());

    std::vector<QueryMatch> out;
    TSQueryMatch match;
    while (cursor.next_match(match)) {
      const auto & predicates = predicates_[match.pattern_index];

      const CaptureTexts texts = [&](uint32_t capture_id) {
        std::vector<std::string_view> found;
        for (uint16_t i = 0; i < match.capture_count; ++i) {
          if (match.captures[i].index == capture_id) {
            found.push_back(ts_ll::Node(match.captures[i].node).text(text));
          }
        }
        return found;
      };
      if (!predicates_hold(predicates, texts)) continue;

      QueryMatch m;
      m.pattern_index = match.pattern_index;
      m.captures.reserve(match.capture_count);
      for (uint16_t i = 0; i < match.capture_count; ++i) {
        const ts_ll::Node node(match.captures[i].node);
        const TSPoint start = node.start_point();
        const TSPoint end = node.end_point();

        QueryCapture c;
        c.name = capture_names_[match.captures[i].index];
        c.range = {lines.position_at(start.row, start.column), lines.position_at(end.row, end.column)};
        c.start_byte = node.start_byte();
        c.end_byte = node.end_byte();
        m.captures.push_back(std::move(c));
      }
      apply_directives(predicates, m.properties);
      out.push_back(std::move(m));
    }
    return out;
  }

private:
  ts_ll::Query query_;
  std::vector<std::vector<QueryPredicate>> predicates_;  // per pattern
  std::vector<std::string> capture_names_;               // per capture id
};

// ============================================================================
// Grammar
// ============================================================================

const char * query_error_kind(TSQueryError error)
{
  switch (error) {
    case TSQueryErrorSyntax:
      return "syntax";
    case TSQueryErrorNodeType:
      return "node type";
    case TSQueryErrorField:
      return "field";
    case TSQueryErrorCapture:
      return "capture";
    case TSQueryErrorStructure:
      return "structure";
    case TSQueryErrorLanguage:
      return "language";
    default:
      return "unknown";
  }
}

std::vector<std::vector<QueryPredicate>> read_predicates(
  const ts_ll::Query & query, const std::string & language_id)
{
  std::vector<std::vector<QueryPredicate>> per_pattern(query.pattern_count());

  for (uint32_t pattern = 0; pattern < query.pattern_count(); ++pattern) {
    uint32_t step_count = 0;
    const TSQueryPredicateStep * steps =
      ts_query_predicates_for_pattern(query.raw(), pattern, &step_count);

    QueryPredicate current;
    bool has_name = false;
    for (uint32_t i = 0; i < step_count; ++i) {
      const TSQueryPredicateStep & step = steps[i];
      if (step.type == TSQueryPredicateStepTypeDone) {
        if (has_name) {
          std::string error = prepare_predicate(current);
          if (!error.empty()) {
            throw QueryCompileError(language_id, error, 0, "predicate");
          }
          per_pattern[pattern].push_back(std::move(current));
        }
        current = QueryPredicate{};
        has_name = false;
        continue;
      }

      if (!has_name) {
        // The first step of every predicate is its name.
        current.name = std::string(query.string_value(step.value_id));
        has_name = true;
        continue;
      }

      PredicateArg arg;
      if (step.type == TSQueryPredicateStepTypeCapture) {
        arg.kind = PredicateArg::Kind::Capture;
        arg.capture_id = step.value_id;
        arg.value = std::string(query.capture_name(step.value_id));
      } else {
        arg.kind = PredicateArg::Kind::String;
        arg.value = std::string(query.string_value(step.value_id));
      }
      current.args.push_back(std::move(arg));
    }
  }
  return per_pattern;
}

class TreeSitterGrammar : public Grammar
{
public:
  TreeSitterGrammar(std::shared_ptr<void> library, const TSLanguage * language, std::string id)
  : library_(std::move(library)), language_(language), language_id_(std::move(id))
  {
  }

  [[nodiscard]] std::unique_ptr<SyntaxTree> parse(std::string_view text) const override
  {
    // A parser per call: TSParser is not thread-safe.
    const ts_ll::Parser parser(language_);
    ts_ll::Tree tree(parser.parse_string(text));
    if (tree.is_null()) return nullptr;
    return std::make_unique<TreeSitterTree>(std::move(tree), std::string(text));
  }

  [[nodiscard]] std::unique_ptr<Query> compile_query(std::string_view source) const override
  {
    uint32_t error_offset = 0;
    TSQueryError error_type = TSQueryErrorNone;
    ts_ll::Query query(ts_query_new(
      language_, source.data(), static_cast<uint32_t>(source.size()), &error_offset, &error_type));
    if (query.is_null()) {
      throw QueryCompileError(
        language_id_, "invalid query", error_offset, query_error_kind(error_type));
    }

    auto predicates = read_predicates(query, language_id_);
    return std::make_unique<TreeSitterQuery>(std::move(query), std::move(predicates));
  }

  [[nodiscard]] uint32_t abi_version() const noexcept override
  {
    return ts_language_version(language_);
  }

private:
  std::shared_ptr<void> library_;  // keeps the grammar's code mapped
  const TSLanguage * language_;
  std::string language_id_;
};

std::string symbol_suffix(std::string_view name)
{
  std::string out;
  out.reserve(name.size());
  for (const char c : name) {
    const auto uc = static_cast<unsigned char>(c);
    out.push_back(std::isalnum(uc) ? static_cast<char>(std::tolower(uc)) : '_');
  }
  return out;
}

bool starts_with(std::string_view s, std::string_view prefix)
{
  return s.substr(0, prefix.size()) == prefix;
}

}  // namespace

void TreeSitterEngine::initialize()
{
  // The C runtime needs no global setup. Kept for engines that do.
  std::call_once(init_once_, [this]() { initialized_ = true; });
}

std::vector<std::string> TreeSitterEngine::language_symbols(
  const std::filesystem::path & artifact, std::string_view language_id)
{
  std::string stem = artifact.stem().string();
  std::string_view name = stem;
  if (starts_with(name, "lib")) name.remove_prefix(3);
  if (starts_with(name, "tree-sitter-")) name.remove_prefix(12);
  if (starts_with(name, "tree_sitter_")) name.remove_prefix(12);

  std::vector<std::string> symbols;
  if (!name.empty()) symbols.push_back("tree_sitter_" + symbol_suffix(name));
  std::string from_id = "tree_sitter_" + symbol_suffix(language_id);
  if (std::find(symbols.begin(), symbols.end(), from_id) == symbols.end()) {
    symbols.push_back(std::move(from_id));
  }
  return symbols;
}

std::shared_ptr<const Grammar> TreeSitterEngine::load_grammar(
  const std::filesystem::path & artifact, std::string_view language_id)
{
  initialize();

  const std::string id(language_id);
  if (artifact.extension() == ".wasm") {
    throw LanguageLoadError(
      id, "WebAssembly grammars are not supported; build '" + artifact.string() +
            "' as a shared library");
  }

  std::error_code ec;
  if (!std::filesystem::is_regular_file(artifact, ec)) {
    throw LanguageLoadError(id, "grammar not found: " + artifact.string());
  }

  void * handle = dlopen(artifact.c_str(), RTLD_NOW | RTLD_LOCAL);
  if (!handle) {
    const char * err = dlerror();
    throw LanguageLoadError(id, err ? err : "dlopen failed for " + artifact.string());
  }
  std::shared_ptr<void> library(handle, [](void * h) { dlclose(h); });

  LanguageFn fn = nullptr;
  const auto symbols = language_symbols(artifact, language_id);
  for (const auto & symbol : symbols) {
    fn = reinterpret_cast<LanguageFn>(dlsym(handle, symbol.c_str()));
    if (fn) break;
  }
  if (!fn) {
    std::string tried;
    for (const auto & symbol : symbols) {
      if (!tried.empty()) tried += ", ";
      tried += symbol;
    }
    throw LanguageLoadError(id, "no language function in " + artifact.string() + " (tried " + tried + ")");
  }

  const TSLanguage * language = fn();
  if (!language) {
    throw LanguageLoadError(id, "language function returned null");
  }

  const uint32_t version = ts_language_version(language);
  if (
    version < TREE_SITTER_MIN_COMPATIBLE_LANGUAGE_VERSION ||
    version > TREE_SITTER_LANGUAGE_VERSION) {
    throw LanguageLoadError(
      id, "incompatible language ABI version " + std::to_string(version) + " (supported " +
            std::to_string(TREE_SITTER_MIN_COMPATIBLE_LANGUAGE_VERSION) + ".." +
            std::to_string(TREE_SITTER_LANGUAGE_VERSION) + ")");
  }

  return std::make_shared<TreeSitterGrammar>(std::move(library), language, id);
}

}  // namespace semtok
