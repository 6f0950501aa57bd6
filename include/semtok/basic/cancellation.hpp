// semtok/basic/cancellation.hpp - Cooperative cancellation of a request
#pragma once

#include <atomic>
#include <exception>
#include <memory>

namespace semtok
{

/**
 * Shared cancellation flag.
 *
 * Copies observe the same flag. A default-constructed token is never
 * cancelled unless cancel() is called on it or one of its copies.
 */
class CancellationToken
{
public:
  CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

  void cancel() const noexcept { flag_->store(true, std::memory_order_relaxed); }

  [[nodiscard]] bool is_cancelled() const noexcept
  {
    return flag_->load(std::memory_order_relaxed);
  }

private:
  std::shared_ptr<std::atomic<bool>> flag_;
};

/// Thrown inside the pipeline when cancellation is observed; never escapes
/// Highlighter::highlight().
class RequestCancelled : public std::exception
{
public:
  [[nodiscard]] const char * what() const noexcept override { return "request cancelled"; }
};

inline void throw_if_cancelled(const CancellationToken & token)
{
  if (token.is_cancelled()) throw RequestCancelled{};
}

}  // namespace semtok
