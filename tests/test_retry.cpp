#include "uv/orchestrator/retry.h"

#include <cerrno>
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <thread>

#include "test_support.h"
#include "uv/error.h"

namespace {

  using uv::orchestrator::CancellationToken;
  using uv::orchestrator::CircuitBreaker;
  using uv::orchestrator::CircuitState;
  using uv::orchestrator::ComputeBackoffDelay;
  using uv::orchestrator::RetryPolicy;
  using uv::orchestrator::RetryWithBackoff;
  using uv::testing::Check;
  using namespace std::chrono_literals;

  RetryPolicy FastPolicy(int max_retries) {
    return RetryPolicy{max_retries, 5ms, 20ms, 2.0};
  }

  uv::Error TransientError() {
    return uv::Error{uv::ErrorDomain::IO, EIO, "disk hiccup", EIO, uv::Retryability::kTransient};
  }

  void TestBackoffSchedule() {
    RetryPolicy policy{3, 1000ms, 30000ms, 2.0};
    Check(ComputeBackoffDelay(policy, 0) == 1000ms, "attempt 0 waits the initial delay");
    Check(ComputeBackoffDelay(policy, 1) == 2000ms, "attempt 1 doubles");
    Check(ComputeBackoffDelay(policy, 3) == 8000ms, "attempt 3 is 8s");
    Check(ComputeBackoffDelay(policy, 10) == 30000ms, "delay caps at max_delay");
  }

  void TestSucceedsAfterTransientFailures() {
    int calls = 0;
    int value = RetryWithBackoff(
        [&]() {
          ++calls;
          if (calls < 3) {
            throw TransientError();
          }
          return 42;
        },
        FastPolicy(3));
    Check(value == 42, "Result of the successful attempt must be returned");
    Check(calls == 3, "Two failures then success means three calls");
  }

  void TestExhaustionMakesMaxPlusOneAttempts() {
    int calls = 0;
    const auto started = std::chrono::steady_clock::now();
    bool exhausted = false;
    try {
      RetryWithBackoff(
          [&]() {
            ++calls;
            throw TransientError();
          },
          FastPolicy(3), nullptr, "flaky write");
    } catch (const uv::Error& err) {
      exhausted = err.domain == uv::ErrorDomain::IO && err.code == uv::errors::io::kRetriesExhausted;
    }
    const auto elapsed = std::chrono::steady_clock::now() - started;
    Check(exhausted, "Exhaustion must raise kRetriesExhausted");
    Check(calls == 4, "max_retries=3 allows four attempts");
    // 5 + 10 + 20 ms of backoff
    Check(elapsed >= 35ms, "Backoff delays must be honoured");
    Check(elapsed < 5s, "Backoff must stay bounded by max_delay");
  }

  void TestNonRetryablePropagatesImmediately() {
    int calls = 0;
    bool integrity = false;
    try {
      RetryWithBackoff(
          [&]() {
            ++calls;
            throw uv::Error{uv::ErrorDomain::Integrity, uv::errors::integrity::kChecksumMismatch, "bad digest"};
          },
          FastPolicy(5));
    } catch (const uv::Error& err) {
      integrity = err.domain == uv::ErrorDomain::Integrity;
    }
    Check(integrity, "Non-retryable errors must propagate unchanged");
    Check(calls == 1, "Non-retryable errors must not be retried");

    calls = 0;
    bool plain = false;
    try {
      RetryWithBackoff(
          [&]() {
            ++calls;
            throw std::runtime_error("permission denied");
          },
          FastPolicy(5));
    } catch (const std::runtime_error&) {
      plain = true;
    }
    Check(plain && calls == 1, "Unrecognised std::exception must not be retried");

    calls = 0;
    try {
      RetryWithBackoff(
          [&]() {
            ++calls;
            if (calls == 1) {
              throw std::runtime_error("connection reset by peer");
            }
          },
          FastPolicy(2));
    } catch (const std::exception&) {
      Check(false, "Transient message must be retried to success");
    }
    Check(calls == 2, "Transient signature must trigger one retry");
  }

  void TestCancellationStopsRetries() {
    CancellationToken token;
    int calls = 0;
    bool cancelled = false;
    try {
      RetryWithBackoff(
          [&]() {
            ++calls;
            token.Cancel();
            throw TransientError();
          },
          RetryPolicy{10, 1000ms, 1000ms, 1.0}, &token);
    } catch (const uv::Error& err) {
      cancelled = err.domain == uv::ErrorDomain::Cancelled;
    }
    Check(cancelled, "Cancellation must surface as Cancelled");
    Check(calls == 1, "No attempt may start after cancellation");

    auto expired = CancellationToken::WithTimeout(10ms);
    const auto started = std::chrono::steady_clock::now();
    bool deadline = false;
    try {
      RetryWithBackoff([&]() -> int { throw TransientError(); }, RetryPolicy{10, 500ms, 500ms, 1.0}, &expired);
    } catch (const uv::Error& err) {
      deadline = err.domain == uv::ErrorDomain::Cancelled && err.code == uv::errors::cancelled::kDeadlineExceeded;
    }
    Check(deadline, "Deadline must surface as kDeadlineExceeded");
    Check(std::chrono::steady_clock::now() - started < 400ms, "Backoff sleep must be cut short by the deadline");
  }

  void TestCircuitBreakerTransitions() {
    CircuitBreaker breaker(2, 30ms);
    Check(breaker.state() == CircuitState::kClosed, "Breaker starts closed");

    auto failing = []() -> int { throw TransientError(); };
    int failures = 0;
    for (int i = 0; i < 2; ++i) {
      try {
        breaker.Execute(failing);
      } catch (const uv::Error& err) {
        failures += err.domain == uv::ErrorDomain::IO ? 1 : 0;
      }
    }
    Check(failures == 2, "Closed breaker must pass failures through");
    Check(breaker.state() == CircuitState::kOpen, "Threshold failures must open the breaker");

    bool rejected = false;
    try {
      breaker.Execute([]() { return 1; });
    } catch (const uv::Error& err) {
      rejected = err.domain == uv::ErrorDomain::Conflict && err.code == uv::errors::conflict::kCircuitOpen;
    }
    Check(rejected, "Open breaker must reject calls");

    std::this_thread::sleep_for(40ms);
    Check(breaker.AllowRequest(), "Reset timeout must admit one trial");
    Check(breaker.state() == CircuitState::kHalfOpen, "Trial runs half-open");
    Check(!breaker.AllowRequest(), "Only one trial may be in flight");
    breaker.RecordFailure();
    Check(breaker.state() == CircuitState::kOpen, "Failed trial reopens the breaker");

    std::this_thread::sleep_for(40ms);
    Check(breaker.Execute([]() { return 7; }) == 7, "Successful trial returns its value");
    Check(breaker.state() == CircuitState::kClosed, "Successful trial closes the breaker");
    Check(breaker.consecutive_failures() == 0, "Success resets the failure count");
  }

} // namespace

int main() {
  TestBackoffSchedule();
  TestSucceedsAfterTransientFailures();
  TestExhaustionMakesMaxPlusOneAttempts();
  TestNonRetryablePropagatesImmediately();
  TestCancellationStopsRetries();
  TestCircuitBreakerTransitions();
  std::cout << "retry tests ok\n";
  return 0;
}
