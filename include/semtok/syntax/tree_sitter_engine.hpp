// semtok/syntax/tree_sitter_engine.hpp - Tree-sitter implementation of GrammarEngine
#pragma once

#include <filesystem>
#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include "semtok/syntax/grammar_engine.hpp"

namespace semtok
{

/**
 * Loads grammars compiled as shared libraries (`.so`, `.dylib`).
 *
 * The language function is looked up as `tree_sitter_<name>`, where `<name>`
 * comes from the file stem (`libtree-sitter-rust.so` -> `rust`) and then from
 * the language id.
 */
class TreeSitterEngine : public GrammarEngine
{
public:
  TreeSitterEngine() = default;

  void initialize() override;

  [[nodiscard]] std::shared_ptr<const Grammar> load_grammar(
    const std::filesystem::path & artifact, std::string_view language_id) override;

  [[nodiscard]] bool is_initialized() const noexcept { return initialized_; }

  /// Candidate `tree_sitter_*` symbol names for an artifact, in lookup order.
  [[nodiscard]] static std::vector<std::string> language_symbols(
    const std::filesystem::path & artifact, std::string_view language_id);

private:
  std::once_flag init_once_;
  std::atomic<bool> initialized_{false};
};

}  // namespace semtok
