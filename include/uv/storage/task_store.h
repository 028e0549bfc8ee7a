#pragma once

#include <chrono>
#include <cstddef>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

#include "uv/storage/path_layout.h"
#include "uv/storage/task_model.h"

namespace uv::storage {

// Values used to create a file task on its first chunk.
struct FileTaskParams {
  std::string file_id;
  std::string file_name;
  std::string relative_path;
  int total_chunks{0};
  int64_t file_size{0};
};

struct CleanupFilter {
  std::optional<TaskStatus> status;
  std::optional<std::chrono::hours> min_age;  // by updated_at

  [[nodiscard]] bool empty() const noexcept { return !status && !min_age; }
};

// Removes the chunk directory and both lock files of `file_id`. Every path is
// attempted; the first failure is rethrown as Error (IO).
void RemoveUploadArtifacts(const PathLayout& layout, std::string_view file_id);

// Registry of every upload task, mirrored to one JSON record per task under
// the metadata directory. All operations are thread-safe; mutations take the
// exclusive side of a single store-wide lock and write the affected records
// before releasing it.
//
// A failed record write still leaves the in-memory change applied and is
// reported as Error (Persistence).
class TaskStore {
public:
  static constexpr std::chrono::hours kDefaultRetention{24 * 7};

  explicit TaskStore(PathLayout layout, std::chrono::hours retention = kDefaultRetention);
  TaskStore(const TaskStore&) = delete;
  TaskStore& operator=(const TaskStore&) = delete;

  // Reads every record from the metadata directory. Corrupt records are
  // reported and skipped. Returns the number of tasks loaded.
  size_t Load();

  void SaveTask(UploadTask task);
  [[nodiscard]] std::optional<UploadTask> GetTask(std::string_view file_id) const;
  [[nodiscard]] bool Contains(std::string_view file_id) const;

  // Creates the task if absent; otherwise moves it to uploading (completed
  // tasks stay completed) and fills in totals the record does not have yet.
  UploadTask EnsureFileTask(const FileTaskParams& params);

  void UpdateChunk(std::string_view file_id, const ChunkInfo& chunk);
  [[nodiscard]] std::vector<int> GetUploadedChunks(std::string_view file_id) const;

  UploadTask CreateFolderTask(std::string_view folder_name, const std::vector<FileDescriptor>& files);
  [[nodiscard]] FolderTaskSummary GetFolderTaskSummary(std::string_view folder_id) const;
  // Recomputes the folder status from its children and stores it if changed.
  void ReconcileParent(std::string_view folder_id);

  [[nodiscard]] std::vector<UploadTask> GetSubTasks(std::string_view folder_id) const;
  [[nodiscard]] std::vector<UploadTask> GetMainTasks() const;
  [[nodiscard]] std::vector<UploadTask> GetAllTasks() const;

  void MarkCompleted(std::string_view file_id, std::string_view file_md5);
  void MarkFailed(std::string_view file_id, std::string_view reason);

  void PauseTask(std::string_view file_id);
  void ResumeTask(std::string_view file_id);
  std::vector<std::string> ResumeAllFailed();

  // Removes the task, its chunk directory, its lock files and its record.
  // Folder tasks take their children with them. Unknown ids are ignored.
  void DeleteTask(std::string_view file_id);
  // Deletes failed and paused tasks not updated within the retention window.
  std::vector<std::string> CleanupExpiredTasks();
  std::vector<std::string> CleanupTasks(const CleanupFilter& filter);

  [[nodiscard]] const PathLayout& layout() const noexcept { return layout_; }
  [[nodiscard]] std::chrono::hours retention() const noexcept { return retention_; }

private:
  using TaskMap = std::map<std::string, UploadTask, std::less<>>;

  UploadTask& RequireLocked(std::string_view file_id);
  const UploadTask& RequireLocked(std::string_view file_id) const;
  void PersistLocked(const UploadTask& task);
  void TouchAndPersistLocked(UploadTask& task);
  void ReconcileParentLocked(std::string_view folder_id);
  void DeleteLocked(const std::string& file_id);
  void RemoveArtifacts(const std::string& file_id);
  void RemoveRecord(const std::string& file_id);
  void PauseLocked(UploadTask& task);
  void ResumeLocked(UploadTask& task);
  std::vector<std::string> DeleteMatchingLocked(const std::vector<std::string>& ids);
  [[nodiscard]] FolderTaskSummary SummarizeLocked(const UploadTask& folder) const;
  [[nodiscard]] std::vector<TaskStatus> ChildStatusesLocked(const FolderTaskDetail& folder) const;

  PathLayout layout_;
  std::chrono::hours retention_;
  mutable std::shared_mutex mutex_;
  TaskMap tasks_;
};

}  // namespace uv::storage
