#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <utility>

#include "uv/orchestrator/cleanup_worker.h"
#include "uv/orchestrator/io_util.h"
#include "uv/orchestrator/retry.h"
#include "uv/storage/task_store.h"

namespace uv::orchestrator {

struct MergeRequest {
  std::string file_id;
  std::string file_name;
  std::string relative_path;  // destination below the merged root, file name included
  int total_chunks{0};        // 0 uses the count recorded on the task
  std::string expected_md5;   // optional
};

struct MergeResult {
  std::filesystem::path file_path;
  std::string md5;
  uint64_t size{0};
  std::chrono::milliseconds duration{0};
};

struct MergeOptions {
  std::filesystem::path merged_dir{"merged"};
  bool integrity_check{true};
  WriteMode write_mode{WriteMode::kAtomic};
  RetryPolicy retry{};
  std::chrono::seconds stale_lock_after{3600};
};

// Resolves the destination of a merge below `merged_dir`. A relative path wins
// over the bare file name; absolute paths and ".." segments are rejected with
// Error (Validation).
std::filesystem::path ResolveMergeDestination(const std::filesystem::path& merged_dir, std::string_view file_name,
                                              std::string_view relative_path);

// Concatenates the chunks of a fully uploaded task into its destination file.
class MergeEngine {
public:
  // `cleanup` receives the post-merge artifact removal; without one the
  // artifacts are left in place.
  MergeEngine(storage::TaskStore& store, CleanupWorker* cleanup, MergeOptions options);

  // Throws Error: NotFound, State (kIncompleteUpload), Conflict
  // (kMergeInProgress), Validation, Integrity (kMissingChunk,
  // kChecksumMismatch), Cancelled and IO. Every failure except Cancelled and
  // the pre-merge checks leaves the task failed with its chunks intact.
  MergeResult Merge(const MergeRequest& request, const CancellationToken* cancel = nullptr);

  void set_writer_hooks(AtomicReplaceHooks hooks) { hooks_ = std::move(hooks); }
  [[nodiscard]] const MergeOptions& options() const noexcept { return options_; }

private:
  MergeResult MergeOnce(const std::string& file_id, int total_chunks, const std::filesystem::path& destination,
                        const std::string& expected_md5);
  void ScheduleCleanup(const std::string& file_id);

  storage::TaskStore& store_;
  CleanupWorker* cleanup_;
  MergeOptions options_;
  AtomicReplaceHooks hooks_;
};

}  // namespace uv::orchestrator
