// semtok/syntax/query_predicates.cpp - Text predicates and directives of queries
#include "semtok/syntax/query_predicates.hpp"

#include <algorithm>
#include <initializer_list>

namespace semtok
{

namespace
{

bool is_one_of(std::string_view name, std::initializer_list<std::string_view> names)
{
  return std::find(names.begin(), names.end(), name) != names.end();
}

bool is_eq(std::string_view n) { return is_one_of(n, {"eq?", "not-eq?", "any-eq?", "any-not-eq?"}); }

bool is_match(std::string_view n)
{
  return is_one_of(n, {"match?", "not-match?", "any-match?", "any-not-match?"});
}

bool is_any_of(std::string_view n) { return is_one_of(n, {"any-of?", "not-any-of?"}); }

bool is_negated(std::string_view n)
{
  return n.find("not-") != std::string_view::npos;
}

bool is_quantified_any(std::string_view n) { return n.rfind("any-", 0) == 0 && !is_any_of(n); }

// `every` over the captured nodes, or `some` for the any- variants.
template <typename Test>
bool check_nodes(const std::vector<std::string_view> & nodes, bool match_any, Test && test)
{
  if (match_any) return std::any_of(nodes.begin(), nodes.end(), test);
  return std::all_of(nodes.begin(), nodes.end(), test);
}

bool holds(const QueryPredicate & p, const CaptureTexts & texts)
{
  const bool negated = is_negated(p.name);

  if (is_eq(p.name)) {
    const auto nodes = texts(p.args[0].capture_id);
    if (p.args[1].is_capture()) {
      // Capture against capture compares the first node of each.
      const auto others = texts(p.args[1].capture_id);
      if (nodes.empty() || others.empty()) return true;
      return (nodes.front() == others.front()) != negated;
    }
    const std::string & expected = p.args[1].value;
    return check_nodes(nodes, is_quantified_any(p.name), [&](std::string_view text) {
      return (text == expected) != negated;
    });
  }

  if (is_match(p.name)) {
    const auto nodes = texts(p.args[0].capture_id);
    return check_nodes(nodes, is_quantified_any(p.name), [&](std::string_view text) {
      return std::regex_search(text.begin(), text.end(), *p.regex) != negated;
    });
  }

  if (is_any_of(p.name)) {
    const auto nodes = texts(p.args[0].capture_id);
    return std::all_of(nodes.begin(), nodes.end(), [&](std::string_view text) {
      const bool found = std::any_of(p.args.begin() + 1, p.args.end(), [&](const PredicateArg & a) {
        return a.value == text;
      });
      return found != negated;
    });
  }

  return true;
}

}  // namespace

std::string prepare_predicate(QueryPredicate & predicate)
{
  const std::string & name = predicate.name;
  const auto & args = predicate.args;

  if (is_eq(name) || is_match(name)) {
    if (args.size() != 2) {
      return "wrong number of arguments to `#" + name + "` predicate. Expected 2, got " +
             std::to_string(args.size());
    }
    if (!args[0].is_capture()) {
      return "first argument of `#" + name + "` predicate must be a capture. Got \"" +
             args[0].value + "\"";
    }
    if (is_match(name)) {
      if (args[1].is_capture()) {
        return "second argument of `#" + name + "` predicate must be a string. Got @" +
               args[1].value;
      }
      try {
        predicate.regex = std::make_shared<const std::regex>(args[1].value);
      } catch (const std::regex_error & e) {
        return "invalid regular expression \"" + args[1].value + "\": " + e.what();
      }
    }
    return {};
  }

  if (is_any_of(name)) {
    if (args.size() < 2) {
      return "wrong number of arguments to `#" + name +
             "` predicate. Expected at least 1. Got 0";
    }
    if (!args[0].is_capture()) {
      return "first argument of `#" + name + "` predicate must be a capture. Got \"" +
             args[0].value + "\"";
    }
    for (size_t i = 1; i < args.size(); ++i) {
      if (args[i].is_capture()) {
        return "arguments to `#" + name + "` predicate must be strings.";
      }
    }
    return {};
  }

  if (name == "set!") {
    if (args.empty() || args.size() > 2) {
      return "wrong number of arguments to `#set!` predicate. Expected 1 or 2. Got " +
             std::to_string(args.size());
    }
    if (std::any_of(args.begin(), args.end(), [](const PredicateArg & a) { return a.is_capture(); })) {
      return "arguments to `#set!` predicate must be strings.";
    }
    return {};
  }

  return {};
}

bool predicates_hold(const std::vector<QueryPredicate> & predicates, const CaptureTexts & texts)
{
  return std::all_of(predicates.begin(), predicates.end(), [&](const QueryPredicate & p) {
    return holds(p, texts);
  });
}

void apply_directives(
  const std::vector<QueryPredicate> & predicates, std::map<std::string, std::string> & properties)
{
  for (const auto & p : predicates) {
    if (p.name != "set!" || p.args.empty()) continue;
    properties[p.args[0].value] = p.args.size() > 1 ? p.args[1].value : std::string();
  }
}

}  // namespace semtok
