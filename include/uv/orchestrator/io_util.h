#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <span>
#include <string>

#include "uv/crypto/md5.h"
#include "uv/error.h"

namespace uv::orchestrator {

struct AtomicReplaceHooks { // test seam for crash simulation
  std::function<void(const std::filesystem::path&, const std::filesystem::path&)> before_rename;
};

// Performs an atomic replace of the target file by writing the payload to a
// temporary file on the same filesystem, syncing it to disk, then renaming it
// into place.
void AtomicReplace(const std::filesystem::path& target, std::span<const uint8_t> payload,
                   const AtomicReplaceHooks& hooks = {});

// Creates `dir` and any missing parents. Throws Error (IO) on failure.
void EnsureDirectory(const std::filesystem::path& dir);

uv::Retryability ClassifyNativeError(int native);

enum class WriteMode : std::uint8_t {
  kAtomic,  // temp file + rename; the target is never observed half-written
  kDirect   // writes straight into the target; a crash can leave a truncated file
};

// Streams content into a temporary sibling of the target while hashing it,
// then publishes it with a single rename. Any failure before the rename leaves
// the target untouched and removes the temporary file.
class AtomicWriter {
public:
  explicit AtomicWriter(WriteMode mode = WriteMode::kAtomic, AtomicReplaceHooks hooks = {});
  AtomicWriter(const AtomicWriter&) = delete;
  AtomicWriter& operator=(const AtomicWriter&) = delete;
  ~AtomicWriter();

  void Open(const std::filesystem::path& target);
  size_t Write(std::span<const uint8_t> data);
  void Commit();
  void Rollback() noexcept;

  [[nodiscard]] std::string Digest() const { return hasher_.HexDigest(); }
  [[nodiscard]] uint64_t Size() const noexcept { return size_; }
  [[nodiscard]] bool is_open() const noexcept { return fd_ >= 0; }
  [[nodiscard]] const std::filesystem::path& target() const noexcept { return target_; }
  [[nodiscard]] const std::filesystem::path& staging_path() const noexcept { return staging_; }

private:
  void CloseQuietly() noexcept;

  WriteMode mode_;
  AtomicReplaceHooks hooks_;
  std::filesystem::path target_;
  std::filesystem::path staging_;
  int fd_{-1};
  uv::crypto::Md5 hasher_;
  uint64_t size_{0};
};

}  // namespace uv::orchestrator
