// semtok/basic/logger.hpp - Minimal leveled logging with an injectable sink
//
// The library never writes to a stream directly; hosts (CLI, LSP server)
// install a sink. Debug messages may be passed as callables so that nothing
// is formatted unless debug logging is enabled.
//
#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace semtok
{

enum class LogLevel : uint8_t {
  Debug,
  Info,
  Warning,
  Error,
};

[[nodiscard]] std::string_view to_string(LogLevel level) noexcept;

class Logger
{
public:
  using Sink = std::function<void(LogLevel, std::string_view)>;

  /// A logger without a sink discards everything.
  Logger() = default;
  Logger(Sink sink, LogLevel min_level) : sink_(std::move(sink)), min_level_(min_level) {}

  [[nodiscard]] bool enabled(LogLevel level) const noexcept
  {
    return sink_ && level >= min_level_;
  }

  void log(LogLevel level, std::string_view message) const
  {
    if (enabled(level)) sink_(level, message);
  }

  template <typename MessageFn>
  auto debug(MessageFn && make_message) const
    -> std::enable_if_t<std::is_invocable_v<MessageFn>>
  {
    if (enabled(LogLevel::Debug)) {
      const std::string message = std::forward<MessageFn>(make_message)();
      sink_(LogLevel::Debug, message);
    }
  }

  void debug(std::string_view message) const { log(LogLevel::Debug, message); }
  void info(std::string_view message) const { log(LogLevel::Info, message); }
  void warning(std::string_view message) const { log(LogLevel::Warning, message); }
  void error(std::string_view message) const { log(LogLevel::Error, message); }

private:
  Sink sink_;
  LogLevel min_level_ = LogLevel::Info;
};

/**
 * Sink writing "[timestamp] [level] prefix: message" lines to std::cerr.
 */
[[nodiscard]] Logger::Sink make_stderr_sink(std::string prefix);

}  // namespace semtok
