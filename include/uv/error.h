#pragma once
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace uv {
  enum class ErrorDomain : std::uint16_t {
    Validation = 0x01,
    NotFound = 0x02,
    Conflict = 0x03,
    Integrity = 0x04,
    IO = 0x05,
    Persistence = 0x06,
    Cancelled = 0x07,
    State = 0x08,
    Config = 0x09,
    Internal = 0x7F
  };

  // Each domain reserves a span of codes to avoid collisions with propagated
  // platform error numbers. Codes inside the reserved range are stable across
  // releases.
  inline constexpr int kErrorDomainSpan = 0x0100;

  inline constexpr int ErrorDomainBase(ErrorDomain domain) {
    switch (domain) {
    case ErrorDomain::Validation:
      return 0x0100;
    case ErrorDomain::NotFound:
      return 0x0200;
    case ErrorDomain::Conflict:
      return 0x0300;
    case ErrorDomain::Integrity:
      return 0x0400;
    case ErrorDomain::IO:
      return 0x0500;
    case ErrorDomain::Persistence:
      return 0x0600;
    case ErrorDomain::Cancelled:
      return 0x0700;
    case ErrorDomain::State:
      return 0x0800;
    case ErrorDomain::Config:
      return 0x0900;
    case ErrorDomain::Internal:
      return 0x7F00;
    }
    return 0; // unreachable but placates compilers without warnings enabled
  }

  inline constexpr int ErrorDomainMax(ErrorDomain domain) {
    return ErrorDomainBase(domain) + kErrorDomainSpan - 1;
  }

  inline constexpr bool IsFrameworkErrorCode(ErrorDomain domain, int code) {
    return code >= ErrorDomainBase(domain) && code <= ErrorDomainMax(domain);
  }

  enum class Retryability : std::uint8_t {
    kFatal = 0,
    kTransient,
    kRetryable
  };

  namespace errors {
    // Helper to construct reserved error codes.
    inline constexpr int Make(ErrorDomain domain, int offset) {
      return ErrorDomainBase(domain) + offset;
    }

    namespace validation {
      inline constexpr int kMissingArgument = Make(ErrorDomain::Validation, 0x01);
      inline constexpr int kChunkTooLarge = Make(ErrorDomain::Validation, 0x02);
      inline constexpr int kPathTraversal = Make(ErrorDomain::Validation, 0x03);
      inline constexpr int kEmptyFolder = Make(ErrorDomain::Validation, 0x04);
      inline constexpr int kInvalidIndex = Make(ErrorDomain::Validation, 0x05);
      inline constexpr int kDuplicateFile = Make(ErrorDomain::Validation, 0x06);
      inline constexpr int kFileTooLarge = Make(ErrorDomain::Validation, 0x07);
    } // namespace validation

    namespace not_found {
      inline constexpr int kTask = Make(ErrorDomain::NotFound, 0x01);
    } // namespace not_found

    namespace conflict {
      inline constexpr int kLockHeld = Make(ErrorDomain::Conflict, 0x01);
      inline constexpr int kMergeInProgress = Make(ErrorDomain::Conflict, 0x02);
      inline constexpr int kCircuitOpen = Make(ErrorDomain::Conflict, 0x03);
    } // namespace conflict

    namespace integrity {
      inline constexpr int kChecksumMismatch = Make(ErrorDomain::Integrity, 0x01);
      inline constexpr int kMissingChunk = Make(ErrorDomain::Integrity, 0x02);
      inline constexpr int kSizeMismatch = Make(ErrorDomain::Integrity, 0x03);
    } // namespace integrity

    namespace io {
      inline constexpr int kRetriesExhausted = Make(ErrorDomain::IO, 0x01);
      inline constexpr int kTempCreateFailed = Make(ErrorDomain::IO, 0x02);
      inline constexpr int kChunkReadFailed = Make(ErrorDomain::IO, 0x03);
      inline constexpr int kWriterNotOpen = Make(ErrorDomain::IO, 0x04);
    } // namespace io

    namespace persistence {
      inline constexpr int kRecordWriteFailed = Make(ErrorDomain::Persistence, 0x01);
      inline constexpr int kRecordRemoveFailed = Make(ErrorDomain::Persistence, 0x02);
      inline constexpr int kRecordCorrupt = Make(ErrorDomain::Persistence, 0x03);
    } // namespace persistence

    namespace cancelled {
      inline constexpr int kDeadlineExceeded = Make(ErrorDomain::Cancelled, 0x01);
      inline constexpr int kCancelled = Make(ErrorDomain::Cancelled, 0x02);
    } // namespace cancelled

    namespace state {
      inline constexpr int kIncompleteUpload = Make(ErrorDomain::State, 0x01);
      inline constexpr int kIllegalTransition = Make(ErrorDomain::State, 0x02);
      inline constexpr int kNotAFolder = Make(ErrorDomain::State, 0x03);
    } // namespace state

    namespace config {
      inline constexpr int kMalformed = Make(ErrorDomain::Config, 0x01);
      inline constexpr int kInvalidValue = Make(ErrorDomain::Config, 0x02);
    } // namespace config

  } // namespace errors

  struct Error : public std::runtime_error {
    ErrorDomain domain;
    int code;
    std::optional<int> native_code;
    Retryability retryability{Retryability::kFatal};
    std::vector<std::string> context;
    explicit Error(ErrorDomain d, int c, std::string msg,
                   std::optional<int> native = std::nullopt,
                   Retryability retry = Retryability::kFatal,
                   std::vector<std::string> ctx = {})
        : std::runtime_error(std::move(msg)),
          domain(d),
          code(c),
          native_code(native),
          retryability(retry),
          context(std::move(ctx)) {}
  };

  const char* ErrorDomainName(ErrorDomain domain) noexcept;
} // namespace uv
