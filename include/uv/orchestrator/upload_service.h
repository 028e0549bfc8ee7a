#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

#include "uv/orchestrator/chunk_ingestor.h"
#include "uv/orchestrator/cleanup_worker.h"
#include "uv/orchestrator/config.h"
#include "uv/orchestrator/merge_engine.h"
#include "uv/storage/task_store.h"

namespace uv::orchestrator {

struct StatusReport {
  std::string file_id;
  bool found{false};
  std::string status{"not_found"};
  std::vector<int> uploaded_chunks;  // ascending
  int total_chunks{0};
  int64_t file_size{0};
  double completion_rate{0.0};
  int retry_count{0};
  std::string file_md5;
  std::optional<TimePoint> created_at;
  std::optional<TimePoint> updated_at;
};

struct TaskView {
  storage::UploadTask task;
  std::optional<storage::FolderTaskSummary> summary;  // folders only
  std::vector<storage::UploadTask> sub_tasks;         // filled by GetTask for folders
};

void to_json(nlohmann::json& j, const StatusReport& report);
void to_json(nlohmann::json& j, const TaskView& view);

using Deadline = std::optional<std::chrono::steady_clock::time_point>;

// Wires the task store, the chunk and merge engines and the background
// cleanup pool together for one upload root.
class UploadService {
public:
  explicit UploadService(ServiceConfig config);
  UploadService(const UploadService&) = delete;
  UploadService& operator=(const UploadService&) = delete;
  ~UploadService();

  // Creates directories, configures logging, loads persisted tasks and, with
  // `expiry_timer`, starts the periodic cleanup of expired tasks.
  void Start(bool expiry_timer = true);
  // Stops the timer and drains queued cleanup work. Idempotent.
  void Stop();

  // Without a deadline the configured chunk/merge timeouts apply.
  ChunkResult UploadChunk(const ChunkRequest& request, Deadline deadline = std::nullopt);
  MergeResult Merge(const MergeRequest& request, Deadline deadline = std::nullopt);

  // Falls back to the chunk directory when no task record exists.
  [[nodiscard]] StatusReport Status(std::string_view file_id) const;
  [[nodiscard]] std::vector<TaskView> ListTasks() const;
  [[nodiscard]] TaskView GetTask(std::string_view file_id) const;
  void DeleteTask(std::string_view file_id);
  void PauseTask(std::string_view file_id);
  void ResumeTask(std::string_view file_id);
  std::vector<std::string> ResumeAllFailed();
  [[nodiscard]] std::vector<storage::UploadTask> ListFailed() const;
  std::vector<std::string> Cleanup(const storage::CleanupFilter& filter);

  storage::UploadTask CreateFolderTask(std::string_view folder_name,
                                       const std::vector<storage::FileDescriptor>& files);
  [[nodiscard]] storage::FolderTaskSummary FolderSummary(std::string_view folder_id) const;
  [[nodiscard]] std::vector<storage::UploadTask> SubTasks(std::string_view folder_id) const;

  [[nodiscard]] const ServiceConfig& config() const noexcept { return config_; }
  [[nodiscard]] storage::TaskStore& store() noexcept { return store_; }
  [[nodiscard]] CleanupWorker& cleanup_worker() noexcept { return cleanup_; }
  [[nodiscard]] ChunkIngestor& ingestor() noexcept { return ingestor_; }
  [[nodiscard]] MergeEngine& merge_engine() noexcept { return merger_; }

private:
  void ExpiryLoop();
  [[nodiscard]] const storage::UploadTask& RequireFound(const std::optional<storage::UploadTask>& task,
                                                         std::string_view file_id) const;

  ServiceConfig config_;
  storage::TaskStore store_;
  CleanupWorker cleanup_;
  ChunkIngestor ingestor_;
  MergeEngine merger_;

  std::mutex timer_mutex_;
  std::condition_variable timer_cv_;
  std::thread expiry_thread_;
  bool stopping_{false};
  bool started_{false};
};

}  // namespace uv::orchestrator
