// semtok LSP server (stdio JSON-RPC)
//
// Thin wrapper around semtok::Highlighter. It implements the subset of LSP
// needed to serve full-document semantic tokens.
//
#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>

#include "semtok/basic/error.hpp"
#include "semtok/basic/logger.hpp"
#include "semtok/config/highlighter_config.hpp"
#include "semtok/highlight/highlighter.hpp"
#include "semtok/highlight/semantic_tokens.hpp"
#include "semtok/syntax/tree_sitter_engine.hpp"

using nlohmann::json;

namespace
{

constexpr std::string_view k_reload_command = "semtok.reload";

struct DocState
{
  std::string uri;
  std::string language_id;
  std::string text;
};

bool starts_with(std::string_view s, std::string_view prefix)
{
  return s.size() >= prefix.size() && s.substr(0, prefix.size()) == prefix;
}

int hex_to_int(char c)
{
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
  if (c >= 'A' && c <= 'F') return 10 + (c - 'A');
  return -1;
}

std::string url_decode(std::string_view s)
{
  std::string out;
  out.reserve(s.size());
  for (size_t i = 0; i < s.size(); ++i) {
    const char c = s[i];
    if (c == '%' && i + 2 < s.size()) {
      const int hi = hex_to_int(s[i + 1]);
      const int lo = hex_to_int(s[i + 2]);
      if (hi >= 0 && lo >= 0) {
        out.push_back(static_cast<char>((hi << 4) | lo));
        i += 2;
        continue;
      }
    }
    out.push_back(c);
  }
  return out;
}

std::optional<std::filesystem::path> file_uri_to_path(std::string_view uri)
{
  // Minimal file URI decoding for Linux/macOS paths.
  //   file:///home/user/project
  if (!starts_with(uri, "file:")) {
    return std::nullopt;
  }

  std::string_view rest = uri.substr(std::string_view("file:").size());
  if (starts_with(rest, "///")) {
    rest = rest.substr(2);  // keep one leading slash
  } else if (starts_with(rest, "//")) {
    // file://hostname/path is not supported here.
    return std::nullopt;
  }
  return std::filesystem::path(url_decode(rest));
}

// rootUri, else the first workspace folder.
std::optional<std::filesystem::path> workspace_root_from(const json & params)
{
  if (params.contains("rootUri") && params["rootUri"].is_string()) {
    if (auto p = file_uri_to_path(params["rootUri"].get<std::string>())) {
      return p;
    }
  }
  if (params.contains("workspaceFolders") && params["workspaceFolders"].is_array()) {
    for (const auto & folder : params["workspaceFolders"]) {
      if (!folder.is_object() || !folder.contains("uri") || !folder["uri"].is_string()) continue;
      if (auto p = file_uri_to_path(folder["uri"].get<std::string>())) {
        return p;
      }
    }
  }
  return std::nullopt;
}

void write_message(const json & msg)
{
  const std::string body = msg.dump();
  std::cout << "Content-Length: " << body.size() << "\r\n\r\n";
  std::cout << body;
  std::cout.flush();
}

std::optional<json> read_message()
{
  std::string line;
  size_t content_length = 0;
  bool saw_length = false;

  while (std::getline(std::cin, line)) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }

    if (line.empty()) {
      break;
    }

    const std::string_view sv(line);
    if (starts_with(sv, "Content-Length:")) {
      const std::string_view rest = sv.substr(std::string_view("Content-Length:").size());
      content_length = static_cast<size_t>(std::strtoul(std::string(rest).c_str(), nullptr, 10));
      saw_length = true;
    }
  }

  if (!saw_length || content_length == 0) {
    // EOF or malformed header block.
    return std::nullopt;
  }

  std::string body(content_length, '\0');
  std::cin.read(body.data(), static_cast<std::streamsize>(content_length));
  if (std::cin.gcount() != static_cast<std::streamsize>(content_length)) {
    return std::nullopt;
  }

  try {
    return json::parse(body);
  } catch (const json::parse_error &) {
    return std::nullopt;
  }
}

void show_error(const std::string & message)
{
  json notif;
  notif["jsonrpc"] = "2.0";
  notif["method"] = "window/showMessage";
  notif["params"] = json{{"type", 1}, {"message", message}};
  write_message(notif);
}

// Configuration from host settings ({languageConfigs, debug}); without
// languageConfigs, the nearest semtok.yaml under the workspace root is used.
semtok::HighlighterConfig load_settings(
  const json & settings, const std::optional<std::filesystem::path> & root)
{
  semtok::HighlighterConfig config;

  if (settings.is_object() && settings.contains("languageConfigs")) {
    auto result = semtok::parse_language_configs(settings["languageConfigs"], root);
    if (result.success) {
      config = std::move(result.config);
    } else {
      show_error("semtok: invalid languageConfigs: " + result.error);
    }
  } else if (root) {
    if (auto path = semtok::find_highlighter_config(*root)) {
      auto result = semtok::load_highlighter_config(*path);
      if (result.success) {
        config = std::move(result.config);
      } else {
        show_error("semtok: " + path->string() + ": " + result.error);
      }
    }
  }

  if (settings.is_object() && settings.contains("debug") && settings["debug"].is_boolean()) {
    config.debug = settings["debug"].get<bool>();
  }
  return config;
}

}  // namespace

int main()
{
  try {
    const auto engine = std::make_shared<semtok::TreeSitterEngine>();
    std::unique_ptr<semtok::Highlighter> highlighter;
    std::optional<std::filesystem::path> workspace_root;
    std::unordered_map<std::string, DocState> docs;

    auto rebuild = [&](semtok::HighlighterConfig config) {
      const semtok::Logger logger =
        semtok::make_logger(config, semtok::make_stderr_sink("semtok_lsp_server"));
      highlighter = std::make_unique<semtok::Highlighter>(
        std::move(config), engine, semtok::default_legend(), logger);
    };

    auto respond = [](const json & id, const json & result) {
      json resp;
      resp["jsonrpc"] = "2.0";
      resp["id"] = id;
      resp["result"] = result;
      write_message(resp);
    };

    auto respond_error = [](const json & id, int code, std::string message) {
      json resp;
      resp["jsonrpc"] = "2.0";
      resp["id"] = id;
      resp["error"] = json{{"code", code}, {"message", std::move(message)}};
      write_message(resp);
    };

    bool running = true;
    while (running) {
      const auto msg_opt = read_message();
      if (!msg_opt) {
        if (!std::cin.good()) {
          break;
        }
        continue;
      }

      const json & msg = *msg_opt;
      const bool is_request = msg.is_object() && msg.contains("id");

      // A failing handler answers its own request; the server keeps running.
      try {
        if (!msg.is_object() || !msg.contains("method") || !msg["method"].is_string()) {
          if (is_request) {
            respond_error(msg["id"], -32600, "Invalid request");
          }
          continue;
        }
        const std::string method = msg["method"].get<std::string>();
        const json params = msg.value("params", json::object());

        if (method == "initialize" && is_request) {
          workspace_root = workspace_root_from(params);
          rebuild(load_settings(params.value("initializationOptions", json::object()), workspace_root));

          json caps;
          caps["textDocumentSync"] = json{{"openClose", true}, {"change", 1}};  // Full sync
          caps["semanticTokensProvider"] =
            json{{"legend", semtok::legend_to_json(highlighter->legend())}, {"full", true}};
          caps["executeCommandProvider"] = json{{"commands", json::array({std::string(k_reload_command)})}};

          respond(msg["id"], json{{"capabilities", caps}});
          continue;
        }

        if (method == "initialized") {
          // no-op
          continue;
        }

        if (method == "shutdown" && is_request) {
          respond(msg["id"], json());
          continue;
        }

        if (method == "exit") {
          running = false;
          continue;
        }

        if (method == "textDocument/didOpen") {
          const auto td = params.value("textDocument", json::object());
          const std::string uri = td.value("uri", "");
          if (!uri.empty()) {
            auto & doc = docs[uri];
            doc.uri = uri;
            doc.language_id = td.value("languageId", "");
            doc.text = td.value("text", "");
          }
          continue;
        }

        if (method == "textDocument/didChange") {
          const auto td = params.value("textDocument", json::object());
          const std::string uri = td.value("uri", "");
          auto it = docs.find(uri);
          if (it == docs.end()) {
            continue;
          }

          // Full sync: take first change text
          const auto changes = params.value("contentChanges", json::array());
          if (!changes.is_array() || changes.empty()) {
            continue;
          }
          const auto & c0 = changes.at(0);
          if (!c0.is_object() || !c0.contains("text") || !c0["text"].is_string()) {
            continue;
          }
          it->second.text = c0["text"].get<std::string>();
          continue;
        }

        if (method == "textDocument/didClose") {
          const auto td = params.value("textDocument", json::object());
          docs.erase(td.value("uri", ""));
          continue;
        }

        if (method == "textDocument/semanticTokens/full" && is_request) {
          const auto td = params.value("textDocument", json::object());
          auto it = docs.find(td.value("uri", ""));
          if (it == docs.end() || !highlighter) {
            respond(msg["id"], json{{"data", json::array()}});
            continue;
          }
          const DocState & doc = it->second;

          const auto doc_langs = highlighter->document_languages();
          if (std::find(doc_langs.begin(), doc_langs.end(), doc.language_id) == doc_langs.end()) {
            respond(msg["id"], json{{"data", json::array()}});
            continue;
          }

          try {
            const auto tokens = highlighter->highlight(doc.language_id, doc.text);
            if (!tokens) {
              respond_error(msg["id"], -32800, "Request cancelled");
              continue;
            }
            respond(
              msg["id"],
              json{{"data", semtok::encode_semantic_tokens(*tokens, highlighter->legend())}});
          } catch (const semtok::Error & e) {
            std::cerr << "semtok_lsp_server: " << doc.uri << ": " << e.what() << "\n";
            respond_error(msg["id"], -32603, e.what());
          }
          continue;
        }

        if (method == "workspace/didChangeConfiguration") {
          const auto settings = params.value("settings", json::object());
          // Accept both {"semtok": {...}} and the bare section.
          const json section = settings.contains("semtok") ? settings["semtok"] : settings;
          rebuild(load_settings(section, workspace_root));
          continue;
        }

        if (method == "workspace/executeCommand" && is_request) {
          const std::string command = params.value("command", "");
          if (command != k_reload_command) {
            respond_error(msg["id"], -32602, "Unknown command: " + command);
            continue;
          }
          if (highlighter) {
            highlighter->reload();
          }
          respond(msg["id"], json());
          continue;
        }

        // Unknown method
        if (is_request) {
          respond_error(msg["id"], -32601, "Method not found");
        }
      } catch (const std::exception & e) {
        std::cerr << "semtok_lsp_server: request failed: " << e.what() << "\n";
        if (is_request) {
          respond_error(msg["id"], -32603, e.what());
        }
      }
    }

    return 0;
  } catch (const std::exception & e) {
    std::cerr << "semtok_lsp_server: fatal error: " << e.what() << "\n";
    return 1;
  }
}
