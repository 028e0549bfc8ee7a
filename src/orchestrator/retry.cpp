#include "uv/orchestrator/retry.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <string>
#include <system_error>
#include <thread>

#include "uv/errors.h"
#include "uv/orchestrator/event_bus.h"

namespace uv::orchestrator {
namespace {

constexpr std::array<std::string_view, 13> kTransientSignatures = {
    "connection refused", "connection reset",     "connection timeout", "network is unreachable",
    "temporary failure",  "server error",         "service unavailable", "timeout",
    "deadline exceeded",  "i/o timeout",          "broken pipe",         "no route to host",
    "operation timed out"};

std::string ToLower(std::string_view text) {
  std::string lowered(text);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return lowered;
}

bool IsTransientErrno(int err) {
  switch (err) {
  case EAGAIN:
  case EINTR:
  case EBUSY:
  case ETIMEDOUT:
  case ECONNRESET:
  case ECONNREFUSED:
  case ENETUNREACH:
  case EHOSTUNREACH:
  case EPIPE:
    return true;
  default:
    return false;
  }
}

}  // namespace

std::chrono::milliseconds ComputeBackoffDelay(const RetryPolicy& policy, int attempt) {
  if (attempt < 0) {
    attempt = 0;
  }
  const double base = static_cast<double>(policy.initial_delay.count());
  const double scaled = base * std::pow(policy.backoff_factor, static_cast<double>(attempt));
  const double cap = static_cast<double>(policy.max_delay.count());
  if (!std::isfinite(scaled) || scaled >= cap) {
    return policy.max_delay;
  }
  return std::chrono::milliseconds(static_cast<long long>(scaled));
}

bool MatchesTransientSignature(std::string_view message) {
  const std::string lowered = ToLower(message);
  for (auto signature : kTransientSignatures) {
    if (lowered.find(signature) != std::string::npos) {
      return true;
    }
  }
  return false;
}

bool IsRetryable(const Error& err) {
  switch (err.domain) {
  case ErrorDomain::Validation:
  case ErrorDomain::NotFound:
  case ErrorDomain::Conflict:
  case ErrorDomain::Integrity:
  case ErrorDomain::Cancelled:
  case ErrorDomain::State:
  case ErrorDomain::Config:
    return false;
  case ErrorDomain::IO:
  case ErrorDomain::Persistence:
  case ErrorDomain::Internal:
    break;
  }
  if (err.retryability != Retryability::kFatal) {
    return true;
  }
  if (err.native_code && IsTransientErrno(*err.native_code)) {
    return true;
  }
  return MatchesTransientSignature(err.what());
}

bool IsRetryable(const std::exception& err) {
  if (const auto* typed = dynamic_cast<const Error*>(&err)) {
    return IsRetryable(*typed);
  }
  if (const auto* sys = dynamic_cast<const std::system_error*>(&err)) {
    if (sys->code().category() == std::generic_category() ||
        sys->code().category() == std::system_category()) {
      if (IsTransientErrno(sys->code().value())) {
        return true;
      }
    }
  }
  return MatchesTransientSignature(err.what());
}

CancellationToken::CancellationToken(std::chrono::steady_clock::time_point deadline) : deadline_(deadline) {}

void CancellationToken::Cancel() {
  {
    std::lock_guard<std::mutex> guard(mutex_);
    cancelled_ = true;
  }
  cv_.notify_all();
}

bool CancellationToken::cancelled() const {
  std::lock_guard<std::mutex> guard(mutex_);
  return cancelled_;
}

bool CancellationToken::expired() const {
  return deadline_ && std::chrono::steady_clock::now() >= *deadline_;
}

bool CancellationToken::WaitFor(std::chrono::milliseconds delay) const {
  auto wake = std::chrono::steady_clock::now() + delay;
  bool cut_short = false;
  if (deadline_ && *deadline_ < wake) {
    wake = *deadline_;
    cut_short = true;
  }
  std::unique_lock<std::mutex> lock(mutex_);
  if (cv_.wait_until(lock, wake, [this] { return cancelled_; })) {
    return false;
  }
  return !cut_short;
}

void CancellationToken::ThrowIfCancelled() const {
  if (cancelled()) {
    throw Error{ErrorDomain::Cancelled, errors::cancelled::kCancelled, std::string(errors::msg::kOperationCancelled)};
  }
  if (expired()) {
    throw Error{ErrorDomain::Cancelled, errors::cancelled::kDeadlineExceeded,
                std::string(errors::msg::kDeadlineExceeded)};
  }
}

namespace detail {

void ReportRetry(std::string_view label, int attempt, std::chrono::milliseconds delay, std::string_view reason) {
  Event event;
  event.category = EventCategory::kDiagnostics;
  event.severity = EventSeverity::kWarning;
  event.event_id = "retry_scheduled";
  event.message = "Transient failure, retrying";
  event.fields.emplace_back("operation", std::string(label));
  event.fields.emplace_back("attempt", std::to_string(attempt), FieldPrivacy::kPublic, true);
  event.fields.emplace_back("delay_ms", std::to_string(delay.count()), FieldPrivacy::kPublic, true);
  event.fields.emplace_back("reason", std::string(reason));
  EventBus::Instance().Publish(event);
}

void ThrowRetriesExhausted(std::string_view label, int attempts, const Error& last) {
  auto context = last.context;
  context.push_back(std::string(label) + " attempts=" + std::to_string(attempts));
  throw Error{ErrorDomain::IO,
              errors::io::kRetriesExhausted,
              std::string(errors::msg::kRetriesExhausted) + " (" + std::to_string(attempts) +
                  " attempts): " + last.what(),
              last.native_code,
              Retryability::kFatal,
              std::move(context)};
}

void ThrowRetriesExhausted(std::string_view label, int attempts, const std::exception& last) {
  throw Error{ErrorDomain::IO,
              errors::io::kRetriesExhausted,
              std::string(errors::msg::kRetriesExhausted) + " (" + std::to_string(attempts) +
                  " attempts): " + last.what(),
              std::nullopt,
              Retryability::kFatal,
              {std::string(label) + " attempts=" + std::to_string(attempts)}};
}

bool SleepOrCancel(const CancellationToken* cancel, std::chrono::milliseconds delay) {
  if (cancel) {
    return cancel->WaitFor(delay);
  }
  std::this_thread::sleep_for(delay);
  return true;
}

}  // namespace detail

const char* CircuitStateToString(CircuitState state) {
  switch (state) {
  case CircuitState::kClosed:
    return "closed";
  case CircuitState::kOpen:
    return "open";
  case CircuitState::kHalfOpen:
    return "half-open";
  }
  return "closed";
}

CircuitBreaker::CircuitBreaker(int failure_threshold, std::chrono::milliseconds reset_timeout)
    : failure_threshold_(failure_threshold < 1 ? 1 : failure_threshold), reset_timeout_(reset_timeout) {}

bool CircuitBreaker::AllowRequest() {
  std::lock_guard<std::mutex> guard(mutex_);
  switch (state_) {
  case CircuitState::kClosed:
    return true;
  case CircuitState::kOpen:
    if (std::chrono::steady_clock::now() - opened_at_ < reset_timeout_) {
      return false;
    }
    state_ = CircuitState::kHalfOpen;
    trial_in_flight_ = true;
    return true;
  case CircuitState::kHalfOpen:
    if (trial_in_flight_) {
      return false;
    }
    trial_in_flight_ = true;
    return true;
  }
  return false;
}

void CircuitBreaker::RecordSuccess() {
  std::lock_guard<std::mutex> guard(mutex_);
  state_ = CircuitState::kClosed;
  failures_ = 0;
  trial_in_flight_ = false;
}

void CircuitBreaker::RecordFailure() {
  std::lock_guard<std::mutex> guard(mutex_);
  ++failures_;
  trial_in_flight_ = false;
  if (state_ == CircuitState::kHalfOpen || failures_ >= failure_threshold_) {
    state_ = CircuitState::kOpen;
    opened_at_ = std::chrono::steady_clock::now();
  }
}

CircuitState CircuitBreaker::state() const {
  std::lock_guard<std::mutex> guard(mutex_);
  return state_;
}

int CircuitBreaker::consecutive_failures() const {
  std::lock_guard<std::mutex> guard(mutex_);
  return failures_;
}

void CircuitBreaker::ThrowOpen() const {
  throw Error{ErrorDomain::Conflict, errors::conflict::kCircuitOpen, std::string(errors::msg::kCircuitOpen)};
}

}  // namespace uv::orchestrator
