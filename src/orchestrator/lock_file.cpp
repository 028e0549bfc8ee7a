#include "uv/orchestrator/lock_file.h"

#include <cerrno>
#include <charconv>
#include <fstream>
#include <sstream>
#include <string_view>
#include <system_error>

#include <fcntl.h>
#include <signal.h>
#include <sys/stat.h>
#include <unistd.h>

#include "uv/error.h"
#include "uv/errors.h"
#include "uv/orchestrator/event_bus.h"
#include "uv/orchestrator/io_util.h"

namespace uv::orchestrator {
namespace {

constexpr std::string_view kPidPrefix = "PID: ";
constexpr std::string_view kTimePrefix = "Time: ";

std::string BuildLockContent() {
  std::ostringstream oss;
  oss << kPidPrefix << ::getpid() << '\n' << kTimePrefix << uv::FormatTimestamp(Clock::now()) << '\n';
  return oss.str();
}

bool ProcessAlive(long pid) {
  if (pid <= 0) {
    return false;
  }
  if (::kill(static_cast<pid_t>(pid), 0) == 0) {
    return true;
  }
  // EPERM means the process exists but belongs to someone else.
  return errno != ESRCH;
}

std::optional<TimePoint> FileModificationTime(const std::filesystem::path& path) {
  struct stat st {};
  if (::stat(path.c_str(), &st) != 0) {
    return std::nullopt;
  }
  return Clock::from_time_t(st.st_mtime);
}

void PublishLockEvent(EventSeverity severity, const char* event_id, const char* message,
                      const std::filesystem::path& path) {
  Event event;
  event.category = EventCategory::kDiagnostics;
  event.severity = severity;
  event.event_id = event_id;
  event.message = message;
  event.fields.emplace_back("lock_path", uv::PathToUtf8String(path));
  EventBus::Instance().Publish(event);
}

}  // namespace

LockFile::LockFile(std::filesystem::path path, std::chrono::seconds stale_after)
    : path_(std::move(path)), stale_after_(stale_after) {}

LockFile::LockFile(LockFile&& other) noexcept { *this = std::move(other); }

LockFile& LockFile::operator=(LockFile&& other) noexcept {
  if (this == &other) {
    return *this;
  }
  Release();
  path_ = std::move(other.path_);
  stale_after_ = other.stale_after_;
  held_ = other.held_;
  other.held_ = false;
  return *this;
}

LockFile::~LockFile() { Release(); }

bool LockFile::CreateExclusive() {
  EnsureDirectory(path_.parent_path());
  int fd = ::open(path_.c_str(), O_CREAT | O_EXCL | O_WRONLY | O_CLOEXEC, 0644);
  if (fd < 0) {
    const int saved_errno = errno;
    if (saved_errno == EEXIST) {
      return false;
    }
    throw Error{ErrorDomain::IO, saved_errno,
                "Failed to create lock file " + uv::PathToUtf8String(path_), saved_errno,
                ClassifyNativeError(saved_errno)};
  }
  // Content is informational; a short write does not invalidate the lock.
  const std::string content = BuildLockContent();
  ssize_t written = ::write(fd, content.data(), content.size());
  if (written < 0 || static_cast<size_t>(written) != content.size()) {
    PublishLockEvent(EventSeverity::kWarning, "lock_content_write_failed",
                     "Lock file created without owner details", path_);
  }
  ::close(fd);
  return true;
}

LockFile::Staleness LockFile::Inspect() const {
  std::error_code ec;
  auto owner = ReadOwner(path_);
  if (!owner) {
    // Unparseable content may belong to a live holder whose content write failed.
    const bool exists = std::filesystem::exists(path_, ec);
    return !exists && !ec ? Staleness::kVanished : Staleness::kHeld;
  }
  if (ProcessAlive(owner->pid)) {
    return Staleness::kHeld;
  }
  std::optional<TimePoint> acquired = owner->acquired_at;
  if (!acquired) {
    acquired = FileModificationTime(path_);
  }
  if (!acquired) {
    return Staleness::kVanished;
  }
  return Clock::now() - *acquired < stale_after_ ? Staleness::kHeld : Staleness::kStale;
}

void LockFile::DropDeadGuard(const std::filesystem::path& guard) const {
  auto owner = ReadOwner(guard);
  bool dead = owner && !ProcessAlive(owner->pid);
  if (!owner) {
    // A guard lives for microseconds; one this old was left by a crash mid-write.
    auto modified = FileModificationTime(guard);
    dead = modified && Clock::now() - *modified >= stale_after_;
  }
  if (dead) {
    std::error_code ec;
    std::filesystem::remove(guard, ec);
    PublishLockEvent(EventSeverity::kWarning, "lock_guard_dropped", "Removed reclaim guard left by a dead process",
                     guard);
  }
}

bool LockFile::ReclaimIfStale() {
  switch (Inspect()) {
  case Staleness::kHeld:
    return false;
  case Staleness::kVanished:
    return true;
  case Staleness::kStale:
    break;
  }

  // Only the holder of the guard may delete the lock file, so a competing
  // reclaimer can never remove a lock created after its own staleness check.
  std::filesystem::path guard = path_;
  guard += ".reclaim";
  int fd = ::open(guard.c_str(), O_CREAT | O_EXCL | O_WRONLY | O_CLOEXEC, 0644);
  if (fd < 0) {
    const int saved_errno = errno;
    if (saved_errno == EEXIST) {
      DropDeadGuard(guard);
      return false;
    }
    throw Error{ErrorDomain::IO, saved_errno, "Failed to create lock guard " + uv::PathToUtf8String(guard),
                saved_errno, ClassifyNativeError(saved_errno)};
  }
  const std::string content = BuildLockContent();
  ssize_t written = ::write(fd, content.data(), content.size());
  if (written < 0 || static_cast<size_t>(written) != content.size()) {
    PublishLockEvent(EventSeverity::kWarning, "lock_content_write_failed",
                     "Reclaim guard created without owner details", guard);
  }
  ::close(fd);

  const Staleness verdict = Inspect();
  std::error_code ec;
  bool reclaimed = verdict == Staleness::kVanished;
  if (verdict == Staleness::kStale) {
    std::filesystem::remove(path_, ec);
    if (ec) {
      PublishLockEvent(EventSeverity::kWarning, "lock_reclaim_failed", "Unable to remove stale lock file", path_);
    } else {
      PublishLockEvent(EventSeverity::kWarning, "lock_reclaimed", "Reclaimed stale lock left by a dead process",
                       path_);
      reclaimed = true;
    }
  }
  std::filesystem::remove(guard, ec);
  return reclaimed;
}

bool LockFile::TryAcquire() {
  if (held_) {
    return true;
  }
  if (path_.empty()) {
    throw Error{ErrorDomain::Validation, errors::validation::kMissingArgument, "Lock path required"};
  }
  if (CreateExclusive()) {
    held_ = true;
    return true;
  }
  if (ReclaimIfStale() && CreateExclusive()) {
    held_ = true;
    return true;
  }
  return false;
}

void LockFile::Acquire() {
  if (!TryAcquire()) {
    throw Error{ErrorDomain::Conflict, errors::conflict::kLockHeld,
                std::string(errors::msg::kLockHeld) + ": " + uv::PathToUtf8String(path_)};
  }
}

void LockFile::Release() noexcept {
  if (!held_) {
    return;
  }
  held_ = false;
  std::error_code ec;
  std::filesystem::remove(path_, ec);
}

std::optional<LockOwner> LockFile::ReadOwner(const std::filesystem::path& path) {
  std::ifstream in(path);
  if (!in) {
    return std::nullopt;
  }
  LockOwner owner;
  bool have_pid = false;
  std::string line;
  while (std::getline(in, line)) {
    std::string_view view(line);
    if (view.substr(0, kPidPrefix.size()) == kPidPrefix) {
      auto digits = view.substr(kPidPrefix.size());
      auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), owner.pid);
      have_pid = ec == std::errc() && ptr == digits.data() + digits.size();
    } else if (view.substr(0, kTimePrefix.size()) == kTimePrefix) {
      owner.acquired_at = uv::ParseTimestamp(view.substr(kTimePrefix.size()));
    }
  }
  if (!have_pid) {
    return std::nullopt;
  }
  return owner;
}

}  // namespace uv::orchestrator
