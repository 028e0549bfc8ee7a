#include "uv/orchestrator/io_util.h"

#include "uv/common.h"
#include "uv/crypto/random.h"
#include "uv/errors.h"

#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <mutex>
#include <span>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <type_traits>
#include <unordered_set>
#include <vector>

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>
#if defined(__linux__)
#include <sys/statfs.h>
#elif defined(__APPLE__) || defined(__FreeBSD__)
#include <sys/mount.h>
#include <sys/param.h>
#endif

namespace uv::orchestrator {
namespace {

constexpr const char* kAtomicReplaceErrorMessage = "Atomic file replace failed";
constexpr const char* kAtomicWriteErrorMessage = "Atomic write failed";
constexpr const char* kAtomicUnsupportedMessage = "Filesystem does not support atomic rename";

class ErrorContext { // accumulate nested call context
 public:
  void Push(std::string context) { context_stack_.push_back(std::move(context)); }
  void Pop() {
    if (!context_stack_.empty()) {
      context_stack_.pop_back();
    }
  }
  [[nodiscard]] std::vector<std::string> Stack() const { return context_stack_; }
  [[nodiscard]] std::string Format(std::string_view message) const {
    std::ostringstream oss;
    oss << message;
    for (auto it = context_stack_.rbegin(); it != context_stack_.rend(); ++it) {
      oss << "\n  while: " << *it;
    }
    return oss.str();
  }

 private:
  std::vector<std::string> context_stack_;
};

class ScopedErrorContext {
 public:
  ScopedErrorContext(ErrorContext& ctx, std::string description) : ctx_(ctx) {
    ctx_.Push(std::move(description));
  }
  ScopedErrorContext(const ScopedErrorContext&) = delete;
  ScopedErrorContext& operator=(const ScopedErrorContext&) = delete;
  ~ScopedErrorContext() { ctx_.Pop(); }

 private:
  ErrorContext& ctx_;
};

uv::Retryability ClassifyErrorCode(const std::error_code& ec) {
  return ClassifyNativeError(ec.value());
}

std::vector<std::string> MergeContext(const std::vector<std::string>& existing,
                                      const ErrorContext& ctx) {
  auto merged = existing;
  auto stack = ctx.Stack();
  merged.insert(merged.end(), stack.begin(), stack.end());
  return merged;
}

[[noreturn]] void ThrowIoError(const ErrorContext& ctx, int code, std::string message,
                               std::optional<int> native = std::nullopt,
                               uv::Retryability retry = uv::Retryability::kFatal) {
  auto stack = ctx.Stack();
  std::optional<int> native_value = native;
  if (!native_value.has_value() && code != 0) {
    native_value = code;
  }
  throw Error{ErrorDomain::IO, code, ctx.Format(std::move(message)), native_value, retry, std::move(stack)};
}

[[noreturn]] void ThrowValidationError(const ErrorContext& ctx, std::string message) {
  auto stack = ctx.Stack();
  throw Error{ErrorDomain::Validation, errors::validation::kMissingArgument, ctx.Format(std::move(message)),
              std::nullopt, uv::Retryability::kFatal, std::move(stack)};
}

Error AugmentError(const Error& err, const ErrorContext& ctx) {
  return Error{err.domain,
               err.code,
               ctx.Format(err.what()),
               err.native_code,
               err.retryability,
               MergeContext(err.context, ctx)};
}

[[noreturn]] void RethrowSystemError(const std::system_error& sys_err, const ErrorContext& ctx) {
  auto stack = ctx.Stack();
  throw Error{ErrorDomain::IO,
              sys_err.code().value(),
              ctx.Format(sys_err.what()),
              sys_err.code().value(),
              ClassifyErrorCode(sys_err.code()),
              std::move(stack)};
}

[[noreturn]] void RethrowUnknownError(const std::exception& ex, const ErrorContext& ctx) {
  throw Error{ErrorDomain::Internal, 0, ctx.Format(ex.what()), std::nullopt,
              uv::Retryability::kFatal, ctx.Stack()};
}

template <typename Func>
auto WithContext(ErrorContext& ctx, std::string description, Func&& fn)
    -> std::invoke_result_t<Func&> {
  ScopedErrorContext scoped(ctx, std::move(description));
  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Func&>>) {
      fn();
      return;
    } else {
      return fn();
    }
  } catch (const Error& err) {
    if (err.context.empty()) {
      throw AugmentError(err, ctx);
    }
    throw;
  } catch (const std::system_error& sys_err) {
    RethrowSystemError(sys_err, ctx);
  } catch (const std::exception& ex) {
    RethrowUnknownError(ex, ctx);
  }
}

// Translates whatever escaped a top-level operation into uv::Error with context.
[[noreturn]] void RethrowWithContext(const ErrorContext& ctx) {
  try {
    throw;
  } catch (const Error& err) {
    if (err.context.empty()) {
      throw AugmentError(err, ctx);
    }
    throw;
  } catch (const std::system_error& sys_err) {
    RethrowSystemError(sys_err, ctx);
  } catch (const std::exception& ex) {
    RethrowUnknownError(ex, ctx);
  }
}

bool SupportsAtomicRename(const std::filesystem::path& dir) {
  std::filesystem::path probe = dir;
  if (probe.empty()) {
    probe = std::filesystem::current_path();
  }
  std::error_code ec;
  auto absolute = std::filesystem::weakly_canonical(probe, ec);
  if (ec) {
    absolute = std::filesystem::absolute(probe, ec);
  }
  if (absolute.empty()) {
    return false;
  }

  struct statfs info {
  };
  if (::statfs(absolute.c_str(), &info) != 0) {
    return false;
  }

#if defined(__linux__)
  switch (static_cast<unsigned long>(info.f_type)) {
    case 0x6969:      // NFS_SUPER_MAGIC
    case 0xFF534D42:  // CIFS
    case 0xFE534D42:  // SMB2
    case 0x517B:      // SMB
      return false;
    default:
      return true;
  }
#elif defined(__APPLE__) || defined(__FreeBSD__)
  return (info.f_flags & MNT_LOCAL) != 0;
#else
  return true;
#endif
}

int NativeOpen(const std::filesystem::path& path, bool exclusive) {
  int flags = O_CREAT | O_WRONLY | O_TRUNC | O_CLOEXEC;
  if (exclusive) {
    flags |= O_EXCL;
  }
  return ::open(path.c_str(), flags, 0644);
}

int NativeClose(int fd) { return ::close(fd); }

int NativeFsync(int fd) { return ::fsync(fd); }

ssize_t NativeWrite(int fd, const uint8_t* data, size_t size) {
  return ::write(fd, data, size);
}

bool NativeRename(const std::filesystem::path& from, const std::filesystem::path& to) {
  return ::rename(from.c_str(), to.c_str()) == 0;
}

void SyncDirectory(const std::filesystem::path& dir, const char* error_prefix) {
  int dir_fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY);
  if (dir_fd < 0) {
    const int saved_errno = errno;
    throw Error{ErrorDomain::IO,
                saved_errno,
                std::string(error_prefix) + ": open directory failed",
                saved_errno,
                ClassifyNativeError(saved_errno)};
  }
  if (::fsync(dir_fd) != 0) {
    const int err = errno;
    ::close(dir_fd);
    throw Error{ErrorDomain::IO,
                err,
                std::string(error_prefix) + ": directory flush failed",
                err,
                ClassifyNativeError(err)};
  }
  ::close(dir_fd);
}

bool IsTransientFsyncError(int err) {
  return err == EINTR || err == EAGAIN || err == EBUSY;
}

void SyncFileWithRetry(int fd, ErrorContext& ctx, const char* error_prefix) {
  constexpr int kMaxRetries = 4;
  std::chrono::milliseconds backoff{5};
  for (int attempt = 0;; ++attempt) {
    if (NativeFsync(fd) == 0) {
      return;
    }
    const int saved_errno = errno;
    if (saved_errno == EINTR) {
      continue;
    }
    if (attempt >= kMaxRetries || !IsTransientFsyncError(saved_errno)) {
      ThrowIoError(ctx,
                   saved_errno,
                   std::string(error_prefix) + ": fsync failed",
                   saved_errno,
                   ClassifyNativeError(saved_errno));
    }
    std::this_thread::sleep_for(backoff);
    backoff *= 2;
  }
}

// Writes as much of `payload` as possible. `on_written` sees each accepted
// slice so callers can account for partially written data before a failure.
template <typename OnWritten>
void WriteAll(int fd, std::span<const uint8_t> payload, ErrorContext& ctx, const char* error_prefix,
              OnWritten&& on_written) {
  size_t written = 0;
  while (written < payload.size()) {
    auto chunk = NativeWrite(fd, payload.data() + written, payload.size() - written);
    if (chunk < 0) {
      const int saved_errno = errno;
      if (saved_errno == EINTR) {
        continue;
      }
      ThrowIoError(ctx,
                   saved_errno,
                   std::string(error_prefix) + ": write failed",
                   saved_errno,
                   ClassifyNativeError(saved_errno));
    }
    if (chunk == 0) {
      ThrowIoError(ctx,
                   0,
                   std::string(error_prefix) + ": short write",
                   0,
                   uv::Retryability::kFatal);
    }
    on_written(payload.subspan(written, static_cast<size_t>(chunk)));
    written += static_cast<size_t>(chunk);
  }
}

class TempFileRegistry { // removes abandoned temp files at process exit
 public:
  static TempFileRegistry& Instance() {
    static TempFileRegistry instance;
    return instance;
  }

  void Track(const std::filesystem::path& path) {
    EnsureHandlers();
    std::lock_guard<std::mutex> lock(mutex_);
    tracked_.insert(path);
  }

  void Untrack(const std::filesystem::path& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    tracked_.erase(path);
  }

  void CleanupAll() noexcept {
    std::vector<std::filesystem::path> snapshot;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      snapshot.assign(tracked_.begin(), tracked_.end());
      tracked_.clear();
    }
    for (const auto& candidate : snapshot) {
      std::error_code ec;
      if (!std::filesystem::remove(candidate, ec) && ec) {
        std::cerr << "TempFileRegistry cleanup failed for " << candidate << ": " << ec.message()
                  << '\n';
      }
    }
  }

 private:
  TempFileRegistry() = default;

  void EnsureHandlers() {
    std::call_once(handlers_once_, [] {
      std::atexit([] { TempFileRegistry::Instance().CleanupAll(); });
    });
  }

  std::mutex mutex_;
  std::unordered_set<std::filesystem::path> tracked_;
  std::once_flag handlers_once_;
};

class TempFileGuard { // ensure cleanup on failure
 public:
  explicit TempFileGuard(std::filesystem::path path) : path_(std::move(path)) {
    if (!path_.empty()) {
      TempFileRegistry::Instance().Track(path_);
    }
  }
  TempFileGuard(const TempFileGuard&) = delete;
  TempFileGuard& operator=(const TempFileGuard&) = delete;
  ~TempFileGuard() noexcept {
    if (!path_.empty()) {
      std::error_code ec;
      if (!std::filesystem::remove(path_, ec) && ec) {
        std::cerr << "TempFileGuard cleanup failed for " << path_ << ": " << ec.message()
                  << '\n';
      } else {
        TempFileRegistry::Instance().Untrack(path_);
      }
    }
  }

  void Release() noexcept {
    if (!path_.empty()) {
      TempFileRegistry::Instance().Untrack(path_);
    }
    path_.clear();
  }

 private:
  std::filesystem::path path_;
};

std::filesystem::path MakeTempPath(const std::filesystem::path& dir,
                                   const std::filesystem::path& base) {
  const auto token = uv::crypto::RandomHex(16);
  std::filesystem::path temp_name = base.filename();
  temp_name += ".tmp.";
  temp_name += token;
  return dir / temp_name;
}

std::filesystem::path ResolveParent(const std::filesystem::path& target) {
  auto dir = target.parent_path();
  if (dir.empty()) {
    dir = std::filesystem::current_path();
  }
  return dir;
}

}  // namespace

uv::Retryability ClassifyNativeError(int native) {
  switch (native) {
#if defined(EINTR)
    case EINTR:
#endif
#if defined(EAGAIN)
    case EAGAIN:
#endif
#if defined(EWOULDBLOCK) && EWOULDBLOCK != EAGAIN
    case EWOULDBLOCK:
#endif
      return uv::Retryability::kRetryable;
#if defined(EBUSY)
    case EBUSY:
      return uv::Retryability::kTransient;
#endif
#if defined(ETIMEDOUT)
    case ETIMEDOUT:
      return uv::Retryability::kTransient;
#endif
#if defined(EIO)
    case EIO:
      return uv::Retryability::kTransient;
#endif
    default:
      break;
  }
  return uv::Retryability::kFatal;
}

void EnsureDirectory(const std::filesystem::path& dir) {
  if (dir.empty()) {
    return;
  }
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  if (ec) {
    throw Error{ErrorDomain::IO, ec.value(),
                "Failed to create directory " + uv::PathToUtf8String(dir) + ": " + ec.message(),
                ec.value(), ClassifyErrorCode(ec)};
  }
}

void AtomicReplace(const std::filesystem::path& target, std::span<const uint8_t> payload,
                   const AtomicReplaceHooks& hooks) {
  ErrorContext ctx;
  const std::string target_utf8 = target.empty() ? std::string("<empty>") : uv::PathToUtf8String(target);
  ScopedErrorContext root(ctx, "atomic replace target=" + target_utf8);

  try {
    if (target.empty()) {
      ThrowValidationError(ctx, "Target path required");
    }

    auto dir = WithContext(ctx, "resolving target directory", [&] { return ResolveParent(target); });

    WithContext(ctx, "checking atomic rename support", [&] {
      if (!SupportsAtomicRename(dir)) {
        ThrowIoError(ctx, 0, kAtomicUnsupportedMessage, std::nullopt, uv::Retryability::kFatal);
      }
    });

    auto temp_path = MakeTempPath(dir, target);
    TempFileGuard cleanup(temp_path);

    int fd = WithContext(ctx, "opening temporary payload file", [&]() {
      int handle = NativeOpen(temp_path, true);
      if (handle < 0) {
        const int saved_errno = errno;
        ThrowIoError(ctx,
                     saved_errno,
                     std::string(kAtomicReplaceErrorMessage) + ": open failed",
                     saved_errno,
                     ClassifyNativeError(saved_errno));
      }
      return handle;
    });

    try {
      WithContext(ctx, "writing payload", [&] {
        WriteAll(fd, payload, ctx, kAtomicReplaceErrorMessage, [](std::span<const uint8_t>) {});
      });
      WithContext(ctx, "syncing payload", [&] { SyncFileWithRetry(fd, ctx, kAtomicReplaceErrorMessage); });
    } catch (...) {
      NativeClose(fd);
      throw;
    }

    WithContext(ctx, "closing temporary payload file", [&] {
      if (NativeClose(fd) != 0) {
        const int saved_errno = errno;
        ThrowIoError(ctx,
                     saved_errno,
                     std::string(kAtomicReplaceErrorMessage) + ": close failed",
                     saved_errno,
                     ClassifyNativeError(saved_errno));
      }
    });

    if (hooks.before_rename) {
      WithContext(ctx, "executing before_rename hook", [&] { hooks.before_rename(temp_path, target); });
    }

    WithContext(ctx, "renaming temporary file into place", [&] {
      if (!NativeRename(temp_path, target)) {
        const int err = errno;
        ThrowIoError(ctx,
                     err,
                     std::string(kAtomicReplaceErrorMessage) + ": rename failed",
                     err,
                     ClassifyNativeError(err));
      }
    });

    cleanup.Release();
    WithContext(ctx, "syncing directory metadata", [&] { SyncDirectory(dir, kAtomicReplaceErrorMessage); });
  } catch (...) {
    RethrowWithContext(ctx);
  }
}

AtomicWriter::AtomicWriter(WriteMode mode, AtomicReplaceHooks hooks)
    : mode_(mode), hooks_(std::move(hooks)) {}

AtomicWriter::~AtomicWriter() { Rollback(); }

void AtomicWriter::Open(const std::filesystem::path& target) {
  ErrorContext ctx;
  const std::string target_utf8 = target.empty() ? std::string("<empty>") : uv::PathToUtf8String(target);
  ScopedErrorContext root(ctx, "atomic writer open target=" + target_utf8);

  try {
    if (target.empty()) {
      ThrowValidationError(ctx, "Target path required");
    }
    if (is_open()) {
      ThrowIoError(ctx, errors::io::kTempCreateFailed,
                   std::string(kAtomicWriteErrorMessage) + ": writer already open", std::nullopt);
    }

    WithContext(ctx, "ensuring destination directory", [&] { EnsureDirectory(target.parent_path()); });
    auto dir = WithContext(ctx, "resolving target directory", [&] { return ResolveParent(target); });

    std::filesystem::path staging = target;
    if (mode_ == WriteMode::kAtomic) {
      WithContext(ctx, "checking atomic rename support", [&] {
        if (!SupportsAtomicRename(dir)) {
          ThrowIoError(ctx, 0, kAtomicUnsupportedMessage, std::nullopt, uv::Retryability::kFatal);
        }
      });
      staging = MakeTempPath(dir, target);
    }

    fd_ = WithContext(ctx, "creating staging file", [&]() {
      int handle = NativeOpen(staging, mode_ == WriteMode::kAtomic);
      if (handle < 0) {
        const int saved_errno = errno;
        ThrowIoError(ctx,
                     saved_errno,
                     std::string(kAtomicWriteErrorMessage) + ": open failed",
                     saved_errno,
                     ClassifyNativeError(saved_errno));
      }
      return handle;
    });
    if (mode_ == WriteMode::kAtomic) {
      TempFileRegistry::Instance().Track(staging);
    }
    target_ = target;
    staging_ = std::move(staging);
    hasher_.Reset();
    size_ = 0;
  } catch (...) {
    RethrowWithContext(ctx);
  }
}

size_t AtomicWriter::Write(std::span<const uint8_t> data) {
  if (!is_open()) {
    throw Error{ErrorDomain::IO, errors::io::kWriterNotOpen, std::string(errors::msg::kWriterNotOpen)};
  }
  ErrorContext ctx;
  ScopedErrorContext root(ctx, "atomic writer write target=" + uv::PathToUtf8String(target_));
  size_t accepted = 0;
  WriteAll(fd_, data, ctx, kAtomicWriteErrorMessage, [&](std::span<const uint8_t> slice) {
    hasher_.Update(slice);
    size_ += slice.size();
    accepted += slice.size();
  });
  return accepted;
}

void AtomicWriter::Commit() {
  if (!is_open()) {
    throw Error{ErrorDomain::IO, errors::io::kWriterNotOpen, std::string(errors::msg::kWriterNotOpen)};
  }
  ErrorContext ctx;
  ScopedErrorContext root(ctx, "atomic writer commit target=" + uv::PathToUtf8String(target_));

  try {
    WithContext(ctx, "syncing staged content", [&] { SyncFileWithRetry(fd_, ctx, kAtomicWriteErrorMessage); });

    WithContext(ctx, "closing staging file", [&] {
      const int handle = fd_;
      fd_ = -1;
      if (NativeClose(handle) != 0) {
        const int saved_errno = errno;
        ThrowIoError(ctx,
                     saved_errno,
                     std::string(kAtomicWriteErrorMessage) + ": close failed",
                     saved_errno,
                     ClassifyNativeError(saved_errno));
      }
    });

    if (mode_ == WriteMode::kAtomic) {
      if (hooks_.before_rename) {
        WithContext(ctx, "executing before_rename hook", [&] { hooks_.before_rename(staging_, target_); });
      }
      WithContext(ctx, "renaming staging file into place", [&] {
        if (!NativeRename(staging_, target_)) {
          const int err = errno;
          ThrowIoError(ctx,
                       err,
                       std::string(kAtomicWriteErrorMessage) + ": rename failed",
                       err,
                       ClassifyNativeError(err));
        }
      });
      TempFileRegistry::Instance().Untrack(staging_);
    }
    staging_.clear();

    WithContext(ctx, "syncing directory metadata",
                [&] { SyncDirectory(ResolveParent(target_), kAtomicWriteErrorMessage); });
  } catch (...) {
    Rollback();
    RethrowWithContext(ctx);
  }
}

void AtomicWriter::CloseQuietly() noexcept {
  if (fd_ >= 0) {
    NativeClose(fd_);
    fd_ = -1;
  }
}

void AtomicWriter::Rollback() noexcept {
  CloseQuietly();
  if (staging_.empty()) {
    return;
  }
  // In direct mode the staging path is the target itself, holding a partial file.
  std::error_code ec;
  if (!std::filesystem::remove(staging_, ec) && ec) {
    std::cerr << "AtomicWriter cleanup failed for " << staging_ << ": " << ec.message() << '\n';
  }
  if (mode_ == WriteMode::kAtomic) {
    TempFileRegistry::Instance().Untrack(staging_);
  }
  staging_.clear();
}

}  // namespace uv::orchestrator
