// semtok/basic/error.hpp - Error taxonomy of the highlight pipeline
#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>

namespace semtok
{

/// Base class of every error raised by the highlight pipeline.
class Error : public std::runtime_error
{
public:
  using std::runtime_error::runtime_error;
};

/// Malformed (empty) capture name. Local to classification.
class InvalidCapture : public Error
{
public:
  using Error::Error;
};

/// A token whose end precedes its start. Fatal to the current request.
class InvalidRange : public Error
{
public:
  using Error::Error;
};

/// Grammar or query asset missing or failing to compile. Never cached.
class LanguageLoadError : public Error
{
public:
  LanguageLoadError(std::string language_id, const std::string & message)
  : Error("failed to load language '" + language_id + "': " + message),
    language_id_(std::move(language_id))
  {
  }

  [[nodiscard]] const std::string & language_id() const noexcept { return language_id_; }

private:
  std::string language_id_;
};

/// A query source that the grammar engine rejected.
class QueryCompileError : public LanguageLoadError
{
public:
  QueryCompileError(
    std::string language_id, const std::string & message, uint32_t offset, std::string kind)
  : LanguageLoadError(
      std::move(language_id),
      message + " (" + kind + " error at offset " + std::to_string(offset) + ")"),
    offset_(offset),
    kind_(std::move(kind))
  {
  }

  [[nodiscard]] uint32_t offset() const noexcept { return offset_; }
  [[nodiscard]] const std::string & kind() const noexcept { return kind_; }

private:
  uint32_t offset_ = 0;
  std::string kind_;
};

/// No configuration entry for the requested language.
class UnconfiguredLanguage : public Error
{
public:
  explicit UnconfiguredLanguage(std::string language_id)
  : Error("no configuration for language '" + language_id + "'"),
    language_id_(std::move(language_id))
  {
  }

  [[nodiscard]] const std::string & language_id() const noexcept { return language_id_; }

private:
  std::string language_id_;
};

/// Relative asset path with no workspace root to resolve it against.
class PathResolutionError : public Error
{
public:
  using Error::Error;
};

/// Injections nested deeper than the configured ceiling.
class InjectionDepthExceeded : public Error
{
public:
  explicit InjectionDepthExceeded(uint32_t limit)
  : Error("injection nesting exceeds the limit of " + std::to_string(limit)), limit_(limit)
  {
  }

  [[nodiscard]] uint32_t limit() const noexcept { return limit_; }

private:
  uint32_t limit_ = 0;
};

}  // namespace semtok
