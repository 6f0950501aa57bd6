// semtok - Semantic token command line interface
//
// Usage:
//   semtok tokens <file> --lang <id> [--config semtok.yaml] [--encoded]
//   semtok legend
//   semtok check [--config semtok.yaml]
//
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "semtok/basic/error.hpp"
#include "semtok/basic/logger.hpp"
#include "semtok/config/highlighter_config.hpp"
#include "semtok/highlight/highlighter.hpp"
#include "semtok/highlight/semantic_tokens.hpp"
#include "semtok/syntax/tree_sitter_engine.hpp"

namespace fs = std::filesystem;
using nlohmann::json;

namespace
{

// ============================================================================
// Output Formatting
// ============================================================================

void print_usage(const char * program_name)
{
  std::cerr << "semtok v0.1.0\n\n"
            << "Usage: " << program_name << " <command> [options]\n\n"
            << "Commands:\n"
            << "  tokens <file>            Print the semantic tokens of a file\n"
            << "  legend                   Print the token legend\n"
            << "  check                    Load every configured language\n\n"
            << "Options:\n"
            << "  --lang <id>              Language of the input file (tokens)\n"
            << "  -c, --config <path>      Configuration file (default: nearest semtok.yaml)\n"
            << "  --encoded                Print the relative integer encoding\n"
            << "  -v, --verbose            Debug logging\n"
            << "  -h, --help               Show this help message\n";
}

// ============================================================================
// Argument Parsing
// ============================================================================

struct CommandArgs
{
  std::string command;
  std::string input_file;
  std::string language;
  std::string config_path;
  bool encoded = false;
  bool verbose = false;
  bool show_help = false;
};

CommandArgs parse_args(int argc, char * argv[])
{
  CommandArgs args;

  if (argc < 2) {
    args.show_help = true;
    return args;
  }

  args.command = argv[1];

  if (args.command == "-h" || args.command == "--help") {
    args.show_help = true;
    return args;
  }

  for (int i = 2; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "--lang") {
      if (i + 1 < argc) {
        args.language = argv[++i];
      }
    } else if (arg == "-c" || arg == "--config") {
      if (i + 1 < argc) {
        args.config_path = argv[++i];
      }
    } else if (arg == "--encoded") {
      args.encoded = true;
    } else if (arg == "-v" || arg == "--verbose") {
      args.verbose = true;
    } else if (arg == "-h" || arg == "--help") {
      args.show_help = true;
    } else if (arg[0] != '-' && args.input_file.empty()) {
      args.input_file = arg;
    }
  }

  return args;
}

// ============================================================================
// Helpers
// ============================================================================

std::optional<semtok::HighlighterConfig> load_config(
  const CommandArgs & args, const fs::path & search_from)
{
  std::optional<fs::path> config_path;
  if (!args.config_path.empty()) {
    config_path = fs::absolute(args.config_path);
  } else {
    config_path = semtok::find_highlighter_config(search_from);
  }
  if (!config_path) {
    std::cerr << "error: no " << semtok::k_config_file_name
              << " found in " << search_from.string() << " or parents\n";
    return std::nullopt;
  }

  auto result = semtok::load_highlighter_config(*config_path);
  if (!result.success) {
    std::cerr << "error: " << config_path->string() << ": " << result.error << "\n";
    return std::nullopt;
  }
  if (args.verbose) {
    result.config.debug = true;
  }
  return std::move(result.config);
}

std::optional<std::string> read_file(const fs::path & path)
{
  std::ifstream f(path, std::ios::in | std::ios::binary);
  if (!f.is_open()) {
    return std::nullopt;
  }
  std::ostringstream ss;
  ss << f.rdbuf();
  return ss.str();
}

// ============================================================================
// Commands
// ============================================================================

int cmd_tokens(const CommandArgs & args)
{
  if (args.input_file.empty() || args.language.empty()) {
    std::cerr << "error: input file and --lang are required\n";
    std::cerr << "usage: semtok tokens <file> --lang <id> [--config semtok.yaml] [--encoded]\n";
    return 1;
  }

  const fs::path input_path = fs::absolute(args.input_file);
  const auto text = read_file(input_path);
  if (!text) {
    std::cerr << "error: failed to open file: " << input_path.string() << "\n";
    return 1;
  }

  auto config = load_config(args, input_path.parent_path());
  if (!config) {
    return 1;
  }

  try {
    const semtok::Logger logger = semtok::make_logger(*config, semtok::make_stderr_sink("semtok"));
    semtok::Highlighter highlighter(
      std::move(*config), std::make_shared<semtok::TreeSitterEngine>(), semtok::default_legend(),
      logger);

    const auto tokens = highlighter.highlight(args.language, *text);
    if (!tokens) {
      std::cerr << "error: request cancelled\n";
      return 1;
    }

    if (args.encoded) {
      std::cout << json(semtok::encode_semantic_tokens(*tokens, highlighter.legend())).dump()
                << "\n";
    } else {
      std::cout << json(*tokens).dump(2) << "\n";
    }
    return 0;
  } catch (const semtok::Error & e) {
    std::cerr << "error: " << e.what() << "\n";
    return 1;
  }
}

int cmd_legend()
{
  std::cout << semtok::legend_to_json(semtok::default_legend()).dump(2) << "\n";
  return 0;
}

int cmd_check(const CommandArgs & args)
{
  auto config = load_config(args, fs::current_path());
  if (!config) {
    return 1;
  }

  std::vector<std::string> languages;
  languages.reserve(config->languages.size());
  for (const auto & lang : config->languages) {
    languages.push_back(lang.lang);
  }

  const semtok::Logger logger = semtok::make_logger(*config, semtok::make_stderr_sink("semtok"));
  semtok::LanguageRegistry registry(
    std::make_shared<semtok::TreeSitterEngine>(), std::move(*config), logger);

  int failures = 0;
  for (const auto & lang : languages) {
    try {
      (void)registry.resolve(lang);
      std::cout << "ok: " << lang << "\n";
    } catch (const semtok::Error & e) {
      std::cerr << "error: " << e.what() << "\n";
      ++failures;
    }
  }

  if (failures > 0) {
    std::cerr << failures << " of " << languages.size() << " languages failed to load\n";
    return 1;
  }
  return 0;
}

}  // namespace

int main(int argc, char * argv[])
{
  const CommandArgs args = parse_args(argc, argv);

  if (args.show_help) {
    print_usage(argv[0]);
    return 0;
  }

  if (args.command == "tokens") {
    return cmd_tokens(args);
  }

  if (args.command == "legend") {
    return cmd_legend();
  }

  if (args.command == "check") {
    return cmd_check(args);
  }

  std::cerr << "error: unknown command '" << args.command << "'\n";
  print_usage(argv[0]);
  return 1;
}
