// semtok/basic/logger.cpp - Logging sinks
#include "semtok/basic/logger.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>

namespace semtok
{

namespace
{

std::string iso_timestamp()
{
  const auto now = std::chrono::system_clock::now();
  const std::time_t t = std::chrono::system_clock::to_time_t(now);
  const auto ms =
    std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;

  std::tm utc{};
  gmtime_r(&t, &utc);

  std::ostringstream ss;
  ss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
     << ms << 'Z';
  return ss.str();
}

}  // namespace

std::string_view to_string(LogLevel level) noexcept
{
  switch (level) {
    case LogLevel::Debug:
      return "debug";
    case LogLevel::Info:
      return "info";
    case LogLevel::Warning:
      return "warning";
    case LogLevel::Error:
      return "error";
  }
  return "unknown";
}

Logger::Sink make_stderr_sink(std::string prefix)
{
  // Injections may be resolved on worker threads; keep lines whole.
  auto mutex = std::make_shared<std::mutex>();
  return [prefix = std::move(prefix), mutex](LogLevel level, std::string_view message) {
    const std::lock_guard<std::mutex> lock(*mutex);
    std::cerr << "[" << iso_timestamp() << "] [" << to_string(level) << "] " << prefix << ": "
              << message << "\n";
  };
}

}  // namespace semtok
