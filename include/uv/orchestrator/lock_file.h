#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

#include "uv/common.h"

namespace uv::orchestrator {

struct LockOwner {
  long pid{0};
  std::optional<TimePoint> acquired_at;
};

// Cross-process advisory lock backed by an exclusively created sentinel file.
// Acquisition never waits: a held lock is reported immediately. A lock whose
// recorded owner process is gone and which is older than the stale threshold
// is reclaimed.
class LockFile {
public:
  static constexpr std::chrono::seconds kDefaultStaleAfter{3600};

  LockFile() = default;
  explicit LockFile(std::filesystem::path path, std::chrono::seconds stale_after = kDefaultStaleAfter);
  LockFile(const LockFile&) = delete;
  LockFile& operator=(const LockFile&) = delete;
  LockFile(LockFile&& other) noexcept;
  LockFile& operator=(LockFile&& other) noexcept;
  ~LockFile();

  // false when another holder owns the lock; throws Error (IO) on other failures.
  [[nodiscard]] bool TryAcquire();
  // Throws Error (Conflict, kLockHeld) when another holder owns the lock.
  void Acquire();
  void Release() noexcept;

  [[nodiscard]] bool held() const noexcept { return held_; }
  explicit operator bool() const noexcept { return held_; }
  [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

  static std::optional<LockOwner> ReadOwner(const std::filesystem::path& path);

private:
  enum class Staleness { kHeld, kVanished, kStale };

  bool CreateExclusive();
  Staleness Inspect() const;
  void DropDeadGuard(const std::filesystem::path& guard) const;
  bool ReclaimIfStale();

  std::filesystem::path path_;
  std::chrono::seconds stale_after_{kDefaultStaleAfter};
  bool held_{false};
};

}  // namespace uv::orchestrator
