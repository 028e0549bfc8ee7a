#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <exception>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

#include "uv/error.h"

namespace uv::orchestrator {

struct RetryPolicy {
  int max_retries{3};  // additional attempts after the first
  std::chrono::milliseconds initial_delay{1000};
  std::chrono::milliseconds max_delay{30000};
  double backoff_factor{2.0};
};

// min(max_delay, initial_delay * backoff_factor^attempt)
std::chrono::milliseconds ComputeBackoffDelay(const RetryPolicy& policy, int attempt);

// True when the error matches one of the transient failure signatures
// (connection reset, timeout, temporary failure, broken pipe, ...).
bool MatchesTransientSignature(std::string_view message);
bool IsRetryable(const Error& err);
bool IsRetryable(const std::exception& err);

// Deadline plus explicit cancellation. Waiters are woken as soon as either fires.
class CancellationToken {
public:
  CancellationToken() = default;
  explicit CancellationToken(std::chrono::steady_clock::time_point deadline);
  CancellationToken(const CancellationToken&) = delete;
  CancellationToken& operator=(const CancellationToken&) = delete;

  static CancellationToken WithTimeout(std::chrono::milliseconds timeout) {
    return CancellationToken(std::chrono::steady_clock::now() + timeout);
  }

  void Cancel();
  [[nodiscard]] bool cancelled() const;
  [[nodiscard]] bool expired() const;
  [[nodiscard]] std::optional<std::chrono::steady_clock::time_point> deadline() const { return deadline_; }

  // Sleeps for `delay`; returns false if cancelled or the deadline passed first.
  [[nodiscard]] bool WaitFor(std::chrono::milliseconds delay) const;
  // Throws Error (Cancelled) if cancelled or past the deadline.
  void ThrowIfCancelled() const;

private:
  std::optional<std::chrono::steady_clock::time_point> deadline_;
  mutable std::mutex mutex_;
  mutable std::condition_variable cv_;
  bool cancelled_{false};
};

namespace detail {
void ReportRetry(std::string_view label, int attempt, std::chrono::milliseconds delay, std::string_view reason);
[[noreturn]] void ThrowRetriesExhausted(std::string_view label, int attempts, const Error& last);
[[noreturn]] void ThrowRetriesExhausted(std::string_view label, int attempts, const std::exception& last);
bool SleepOrCancel(const CancellationToken* cancel, std::chrono::milliseconds delay);
}  // namespace detail

// Runs `operation`, retrying transient failures under exponential backoff.
// Non-retryable errors propagate unchanged on first occurrence; exhaustion
// throws Error (IO, kRetriesExhausted) wrapping the last failure; cancellation
// throws Error (Cancelled) without consuming further attempts.
template <typename Func>
auto RetryWithBackoff(Func&& operation, const RetryPolicy& policy,
                      const CancellationToken* cancel = nullptr,
                      std::string_view label = "operation") -> std::invoke_result_t<Func&> {
  const int max_retries = policy.max_retries < 0 ? 0 : policy.max_retries;
  for (int attempt = 0;; ++attempt) {
    if (cancel) {
      cancel->ThrowIfCancelled();
    }
    std::chrono::milliseconds delay{0};
    try {
      return operation();
    } catch (const Error& err) {
      if (!IsRetryable(err)) {
        throw;
      }
      if (attempt >= max_retries) {
        detail::ThrowRetriesExhausted(label, attempt + 1, err);
      }
      delay = ComputeBackoffDelay(policy, attempt);
      detail::ReportRetry(label, attempt + 1, delay, err.what());
    } catch (const std::exception& err) {
      if (!IsRetryable(err)) {
        throw;
      }
      if (attempt >= max_retries) {
        detail::ThrowRetriesExhausted(label, attempt + 1, err);
      }
      delay = ComputeBackoffDelay(policy, attempt);
      detail::ReportRetry(label, attempt + 1, delay, err.what());
    }
    if (!detail::SleepOrCancel(cancel, delay)) {
      cancel->ThrowIfCancelled();
    }
  }
}

enum class CircuitState : std::uint8_t { kClosed, kOpen, kHalfOpen };

const char* CircuitStateToString(CircuitState state);

// Rejects calls once consecutive failures reach the threshold; after the reset
// timeout a single trial call is let through to decide between closing and
// reopening.
class CircuitBreaker {
public:
  CircuitBreaker(int failure_threshold, std::chrono::milliseconds reset_timeout);

  [[nodiscard]] bool AllowRequest();
  void RecordSuccess();
  void RecordFailure();

  [[nodiscard]] CircuitState state() const;
  [[nodiscard]] int consecutive_failures() const;

  template <typename Func>
  auto Execute(Func&& fn) -> std::invoke_result_t<Func&> {
    if (!AllowRequest()) {
      ThrowOpen();
    }
    try {
      if constexpr (std::is_void_v<std::invoke_result_t<Func&>>) {
        fn();
        RecordSuccess();
        return;
      } else {
        auto result = fn();
        RecordSuccess();
        return result;
      }
    } catch (...) {
      RecordFailure();
      throw;
    }
  }

private:
  [[noreturn]] void ThrowOpen() const;

  const int failure_threshold_;
  const std::chrono::milliseconds reset_timeout_;
  mutable std::mutex mutex_;
  CircuitState state_{CircuitState::kClosed};
  int failures_{0};
  bool trial_in_flight_{false};
  std::chrono::steady_clock::time_point opened_at_{};
};

}  // namespace uv::orchestrator
