#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

#include "uv/common.h"

namespace uv::storage {

enum class TaskStatus : std::uint8_t { kPending, kUploading, kCompleted, kFailed, kPartialFailed, kPaused };
enum class ChunkStatus : std::uint8_t { kPending, kUploading, kCompleted, kFailed };
enum class TaskType : std::uint8_t { kFile, kFolder };

const char* ToString(TaskStatus status);
const char* ToString(ChunkStatus status);
const char* ToString(TaskType type);
std::optional<TaskStatus> ParseTaskStatus(std::string_view text);
std::optional<ChunkStatus> ParseChunkStatus(std::string_view text);

struct ChunkInfo {
  int index{0};
  int64_t size{0};
  std::string md5;  // empty when the client did not supply one
  ChunkStatus status{ChunkStatus::kPending};
  std::optional<TimePoint> uploaded_at;
  int retry_count{0};
};

struct FileTaskDetail {
  int total_chunks{0};
  int64_t file_size{0};
  std::string file_md5;  // set once the merge succeeds
  std::map<int, ChunkInfo> chunks;
  std::string parent_task_id;  // empty for top-level uploads

  [[nodiscard]] int CompletedChunkCount() const;
  [[nodiscard]] std::vector<int> CompletedIndices() const;
  // True when every index in [0, total_chunks) is present and completed.
  [[nodiscard]] bool HasAllChunks() const;
};

struct FolderTaskDetail {
  std::string folder_name;
  std::vector<std::string> sub_tasks;
};

// One logical upload. The kind-specific state lives in `detail` so a file
// task cannot carry children and a folder task cannot carry chunks.
struct UploadTask {
  std::string file_id;
  std::string file_name;
  std::string relative_path;
  TaskStatus status{TaskStatus::kPending};
  TimePoint created_at{};
  TimePoint updated_at{};
  int retry_count{0};
  std::variant<FileTaskDetail, FolderTaskDetail> detail;

  [[nodiscard]] TaskType type() const noexcept {
    return std::holds_alternative<FolderTaskDetail>(detail) ? TaskType::kFolder : TaskType::kFile;
  }
  [[nodiscard]] bool is_folder() const noexcept { return type() == TaskType::kFolder; }
  [[nodiscard]] bool is_sub_task() const noexcept {
    const auto* file = std::get_if<FileTaskDetail>(&detail);
    return file != nullptr && !file->parent_task_id.empty();
  }
  [[nodiscard]] FileTaskDetail* file() noexcept { return std::get_if<FileTaskDetail>(&detail); }
  [[nodiscard]] const FileTaskDetail* file() const noexcept { return std::get_if<FileTaskDetail>(&detail); }
  [[nodiscard]] FolderTaskDetail* folder() noexcept { return std::get_if<FolderTaskDetail>(&detail); }
  [[nodiscard]] const FolderTaskDetail* folder() const noexcept { return std::get_if<FolderTaskDetail>(&detail); }
};

// One entry of a folder-task creation request.
struct FileDescriptor {
  std::string file_id;  // optional; derived from the folder id when empty
  std::string file_name;
  std::string relative_path;
  int64_t file_size{0};
  int total_chunks{0};
};

struct FolderTaskSummary {
  std::string folder_task_id;
  std::string folder_name;
  int total_files{0};
  int completed_files{0};
  int failed_files{0};
  int64_t total_size{0};
  int64_t uploaded_size{0};
  double completion_rate{0.0};  // percent of bytes
  TaskStatus status{TaskStatus::kPending};
};

// Folder status as a pure function of its children and the stored parent status.
TaskStatus AggregateFolderStatus(const std::vector<TaskStatus>& children, TaskStatus stored_parent);

// Bytes of `task` considered uploaded: exact when completed, proportional to
// completed chunks otherwise.
int64_t EstimateUploadedBytes(const UploadTask& task);

void to_json(nlohmann::json& j, const ChunkInfo& chunk);
void from_json(const nlohmann::json& j, ChunkInfo& chunk);
void to_json(nlohmann::json& j, const UploadTask& task);
void from_json(const nlohmann::json& j, UploadTask& task);
void to_json(nlohmann::json& j, const FileDescriptor& file);
void from_json(const nlohmann::json& j, FileDescriptor& file);
void to_json(nlohmann::json& j, const FolderTaskSummary& summary);

}  // namespace uv::storage
