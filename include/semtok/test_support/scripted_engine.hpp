// semtok/test_support/scripted_engine.hpp - Regex-driven GrammarEngine for tests
//
// Stands in for tree-sitter so the pipeline can be tested without compiled
// grammars. A query source holds one pattern per line:
//
//   <ECMAScript regex> -> @capture [@capture...] [#set! key value]
//
// Each capture name binds to the regex group of the same position (group 1
// for the first name); a pattern without groups binds its single name to the
// whole match. Blank lines and lines starting with ';' are ignored.
//
#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <regex>
#include <set>
#include <sstream>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

#include "semtok/basic/error.hpp"
#include "semtok/basic/line_index.hpp"
#include "semtok/syntax/grammar_engine.hpp"

namespace semtok::test_support
{

class ScriptedTree : public SyntaxTree
{
public:
  explicit ScriptedTree(std::string text) : text_(std::move(text)), lines_(text_) {}

  ScriptedTree(const ScriptedTree &) = delete;
  ScriptedTree & operator=(const ScriptedTree &) = delete;

  [[nodiscard]] std::string_view text() const noexcept override { return text_; }
  [[nodiscard]] const LineIndex & lines() const noexcept { return lines_; }

private:
  std::string text_;
  LineIndex lines_;
};

struct ScriptedPattern
{
  std::regex regex;
  std::vector<std::string> captures;
  std::map<std::string, std::string> properties;
};

class ScriptedQuery : public Query
{
public:
  explicit ScriptedQuery(std::vector<ScriptedPattern> patterns) : patterns_(std::move(patterns)) {}

  [[nodiscard]] std::vector<QueryMatch> matches(const SyntaxTree & tree) const override
  {
    const auto & scripted = dynamic_cast<const ScriptedTree &>(tree);
    const std::string_view text = scripted.text();

    std::vector<QueryMatch> out;
    for (uint32_t p = 0; p < patterns_.size(); ++p) {
      const auto & pattern = patterns_[p];
      using Iter = std::regex_iterator<std::string_view::const_iterator>;
      for (Iter it(text.begin(), text.end(), pattern.regex), end; it != end; ++it) {
        const auto & m = *it;
        QueryMatch qm;
        qm.pattern_index = p;
        qm.properties = pattern.properties;
        for (size_t i = 0; i < pattern.captures.size(); ++i) {
          const size_t group = m.size() > 1 ? i + 1 : 0;
          if (group >= m.size() || !m[group].matched) continue;
          const auto begin = static_cast<uint32_t>(m.position(group));
          const auto finish = begin + static_cast<uint32_t>(m.length(group));
          QueryCapture c;
          c.name = pattern.captures[i];
          c.start_byte = begin;
          c.end_byte = finish;
          c.range = {scripted.lines().position_at(begin), scripted.lines().position_at(finish)};
          qm.captures.push_back(std::move(c));
        }
        out.push_back(std::move(qm));
      }
    }
    return out;
  }

private:
  std::vector<ScriptedPattern> patterns_;
};

class ScriptedGrammar : public Grammar
{
public:
  explicit ScriptedGrammar(std::string language_id) : language_id_(std::move(language_id)) {}

  [[nodiscard]] std::unique_ptr<SyntaxTree> parse(std::string_view text) const override
  {
    return std::make_unique<ScriptedTree>(std::string(text));
  }

  [[nodiscard]] std::unique_ptr<Query> compile_query(std::string_view source) const override
  {
    std::vector<ScriptedPattern> patterns;
    std::istringstream in{std::string(source)};
    std::string line;
    uint32_t offset = 0;
    while (std::getline(in, line)) {
      const uint32_t line_offset = offset;
      offset += static_cast<uint32_t>(line.size()) + 1;
      if (line.empty() || line[0] == ';') continue;

      const auto arrow = line.rfind(" -> ");
      if (arrow == std::string::npos) {
        throw QueryCompileError(language_id_, "missing ' -> '", line_offset, "syntax");
      }

      ScriptedPattern pattern;
      try {
        pattern.regex = std::regex(line.substr(0, arrow));
      } catch (const std::regex_error & e) {
        throw QueryCompileError(language_id_, e.what(), line_offset, "syntax");
      }

      std::istringstream fields(line.substr(arrow + 4));
      std::string field;
      while (fields >> field) {
        if (field == "#set!") {
          std::string key;
          std::string value;
          fields >> key >> value;
          pattern.properties[key] = value;
        } else if (field.size() > 1 && field[0] == '@') {
          pattern.captures.push_back(field.substr(1));
        } else {
          throw QueryCompileError(
            language_id_, "unexpected '" + field + "'", line_offset, "capture");
        }
      }
      patterns.push_back(std::move(pattern));
    }
    return std::make_unique<ScriptedQuery>(std::move(patterns));
  }

  [[nodiscard]] uint32_t abi_version() const noexcept override { return 14; }

private:
  std::string language_id_;
};

/**
 * Engine whose grammars accept any existing file. Counts calls so tests can
 * observe caching, and can be told to fail or to stall a load.
 */
class ScriptedEngine : public GrammarEngine
{
public:
  void initialize() override { ++initialize_calls_; }

  [[nodiscard]] std::shared_ptr<const Grammar> load_grammar(
    const std::filesystem::path & artifact, std::string_view language_id) override
  {
    const std::string id(language_id);
    {
      const std::lock_guard<std::mutex> lock(mutex_);
      ++load_counts_[id];
      if (failing_.count(id) != 0) {
        throw LanguageLoadError(id, "scripted failure");
      }
    }
    if (load_delay_.count() > 0) {
      std::this_thread::sleep_for(load_delay_);
    }
    if (!std::filesystem::exists(artifact)) {
      throw LanguageLoadError(id, "grammar not found: " + artifact.string());
    }
    return std::make_shared<ScriptedGrammar>(id);
  }

  [[nodiscard]] int initialize_calls() const noexcept { return initialize_calls_; }

  [[nodiscard]] int load_count(const std::string & language_id) const
  {
    const std::lock_guard<std::mutex> lock(mutex_);
    const auto it = load_counts_.find(language_id);
    return it == load_counts_.end() ? 0 : it->second;
  }

  void set_failing(const std::string & language_id, bool failing)
  {
    const std::lock_guard<std::mutex> lock(mutex_);
    if (failing) {
      failing_.insert(language_id);
    } else {
      failing_.erase(language_id);
    }
  }

  void set_load_delay(std::chrono::milliseconds delay) { load_delay_ = delay; }

private:
  std::atomic<int> initialize_calls_{0};
  mutable std::mutex mutex_;
  std::map<std::string, int> load_counts_;
  std::set<std::string> failing_;
  std::chrono::milliseconds load_delay_{0};
};

}  // namespace semtok::test_support
