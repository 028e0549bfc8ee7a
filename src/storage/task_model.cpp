#include "uv/storage/task_model.h"

#include <charconv>

#include "uv/error.h"

namespace uv::storage {
namespace {

std::optional<TimePoint> ReadTime(const nlohmann::json& j, const char* key) {
  auto it = j.find(key);
  if (it == j.end() || !it->is_string()) {
    return std::nullopt;
  }
  return uv::ParseTimestamp(it->get<std::string>());
}

template <typename T>
T ValueOr(const nlohmann::json& j, const char* key, T fallback) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    return fallback;
  }
  return it->get<T>();
}

}  // namespace

const char* ToString(TaskStatus status) {
  switch (status) {
  case TaskStatus::kPending:
    return "pending";
  case TaskStatus::kUploading:
    return "uploading";
  case TaskStatus::kCompleted:
    return "completed";
  case TaskStatus::kFailed:
    return "failed";
  case TaskStatus::kPartialFailed:
    return "partial_failed";
  case TaskStatus::kPaused:
    return "paused";
  }
  return "pending";
}

const char* ToString(ChunkStatus status) {
  switch (status) {
  case ChunkStatus::kPending:
    return "pending";
  case ChunkStatus::kUploading:
    return "uploading";
  case ChunkStatus::kCompleted:
    return "completed";
  case ChunkStatus::kFailed:
    return "failed";
  }
  return "pending";
}

const char* ToString(TaskType type) { return type == TaskType::kFolder ? "folder" : "file"; }

std::optional<TaskStatus> ParseTaskStatus(std::string_view text) {
  if (text == "pending") return TaskStatus::kPending;
  if (text == "uploading") return TaskStatus::kUploading;
  if (text == "completed") return TaskStatus::kCompleted;
  if (text == "failed") return TaskStatus::kFailed;
  if (text == "partial_failed") return TaskStatus::kPartialFailed;
  if (text == "paused") return TaskStatus::kPaused;
  return std::nullopt;
}

std::optional<ChunkStatus> ParseChunkStatus(std::string_view text) {
  if (text == "pending") return ChunkStatus::kPending;
  if (text == "uploading") return ChunkStatus::kUploading;
  if (text == "completed") return ChunkStatus::kCompleted;
  if (text == "failed") return ChunkStatus::kFailed;
  return std::nullopt;
}

int FileTaskDetail::CompletedChunkCount() const {
  int count = 0;
  for (const auto& [index, chunk] : chunks) {
    if (chunk.status == ChunkStatus::kCompleted) {
      ++count;
    }
  }
  return count;
}

std::vector<int> FileTaskDetail::CompletedIndices() const {
  std::vector<int> indices;
  indices.reserve(chunks.size());
  for (const auto& [index, chunk] : chunks) {
    if (chunk.status == ChunkStatus::kCompleted) {
      indices.push_back(index);
    }
  }
  return indices;
}

bool FileTaskDetail::HasAllChunks() const {
  if (total_chunks <= 0) {
    return false;
  }
  for (int index = 0; index < total_chunks; ++index) {
    auto it = chunks.find(index);
    if (it == chunks.end() || it->second.status != ChunkStatus::kCompleted) {
      return false;
    }
  }
  return true;
}

TaskStatus AggregateFolderStatus(const std::vector<TaskStatus>& children, TaskStatus stored_parent) {
  if (children.empty()) {
    return stored_parent;
  }
  size_t completed = 0;
  size_t failed = 0;
  bool active = false;
  for (auto status : children) {
    switch (status) {
    case TaskStatus::kCompleted:
      ++completed;
      active = true;
      break;
    case TaskStatus::kFailed:
    case TaskStatus::kPartialFailed:
      ++failed;
      active = true;
      break;
    case TaskStatus::kUploading:
      active = true;
      break;
    case TaskStatus::kPending:
    case TaskStatus::kPaused:
      break;
    }
  }
  if (completed == children.size()) {
    return TaskStatus::kCompleted;
  }
  if (failed == children.size()) {
    return TaskStatus::kFailed;
  }
  if (completed + failed == children.size()) {
    return TaskStatus::kPartialFailed;
  }
  if (stored_parent == TaskStatus::kPaused) {
    return TaskStatus::kPaused;
  }
  return active ? TaskStatus::kUploading : TaskStatus::kPending;
}

int64_t EstimateUploadedBytes(const UploadTask& task) {
  const auto* file = task.file();
  if (file == nullptr) {
    return 0;
  }
  if (task.status == TaskStatus::kCompleted) {
    return file->file_size;
  }
  if (file->total_chunks <= 0) {
    return 0;
  }
  const int done = file->CompletedChunkCount();
  const double ratio = static_cast<double>(done) / static_cast<double>(file->total_chunks);
  return static_cast<int64_t>(static_cast<double>(file->file_size) * (ratio > 1.0 ? 1.0 : ratio));
}

void to_json(nlohmann::json& j, const ChunkInfo& chunk) {
  j = nlohmann::json{{"index", chunk.index},
                     {"size", chunk.size},
                     {"md5", chunk.md5},
                     {"status", ToString(chunk.status)},
                     {"retry_count", chunk.retry_count}};
  if (chunk.uploaded_at) {
    j["uploaded_at"] = uv::FormatTimestamp(*chunk.uploaded_at);
  }
}

void from_json(const nlohmann::json& j, ChunkInfo& chunk) {
  chunk.index = ValueOr<int>(j, "index", 0);
  chunk.size = ValueOr<int64_t>(j, "size", 0);
  chunk.md5 = ValueOr<std::string>(j, "md5", "");
  chunk.status = ParseChunkStatus(ValueOr<std::string>(j, "status", "pending")).value_or(ChunkStatus::kPending);
  chunk.uploaded_at = ReadTime(j, "uploaded_at");
  chunk.retry_count = ValueOr<int>(j, "retry_count", 0);
}

void to_json(nlohmann::json& j, const UploadTask& task) {
  j = nlohmann::json{{"file_id", task.file_id},
                     {"filename", task.file_name},
                     {"relative_path", task.relative_path},
                     {"status", ToString(task.status)},
                     {"created_at", uv::FormatTimestamp(task.created_at)},
                     {"updated_at", uv::FormatTimestamp(task.updated_at)},
                     {"retry_count", task.retry_count},
                     {"task_type", ToString(task.type())}};
  if (const auto* file = task.file()) {
    j["total_chunks"] = file->total_chunks;
    j["file_size"] = file->file_size;
    j["file_md5"] = file->file_md5;
    auto chunks = nlohmann::json::object();
    for (const auto& [index, chunk] : file->chunks) {
      chunks[std::to_string(index)] = chunk;
    }
    j["chunks"] = std::move(chunks);
    j["is_sub_task"] = !file->parent_task_id.empty();
    if (!file->parent_task_id.empty()) {
      j["parent_task_id"] = file->parent_task_id;
    }
  } else if (const auto* folder = task.folder()) {
    j["folder_name"] = folder->folder_name;
    j["sub_tasks"] = folder->sub_tasks;
  }
}

// Records written before folder support lack task_type, sub_tasks and the
// parent link; they load as top-level file tasks.
void from_json(const nlohmann::json& j, UploadTask& task) {
  task.file_id = j.at("file_id").get<std::string>();
  task.file_name = ValueOr<std::string>(j, "filename", "");
  task.relative_path = ValueOr<std::string>(j, "relative_path", "");
  task.status = ParseTaskStatus(ValueOr<std::string>(j, "status", "pending")).value_or(TaskStatus::kPending);
  task.created_at = ReadTime(j, "created_at").value_or(TimePoint{});
  task.updated_at = ReadTime(j, "updated_at").value_or(task.created_at);
  task.retry_count = ValueOr<int>(j, "retry_count", 0);

  if (ValueOr<std::string>(j, "task_type", "file") == "folder") {
    FolderTaskDetail folder;
    folder.folder_name = ValueOr<std::string>(j, "folder_name", "");
    folder.sub_tasks = ValueOr<std::vector<std::string>>(j, "sub_tasks", {});
    task.detail = std::move(folder);
    return;
  }

  FileTaskDetail file;
  file.total_chunks = ValueOr<int>(j, "total_chunks", 0);
  file.file_size = ValueOr<int64_t>(j, "file_size", 0);
  file.file_md5 = ValueOr<std::string>(j, "file_md5", "");
  file.parent_task_id = ValueOr<std::string>(j, "parent_task_id", "");
  auto chunks = j.find("chunks");
  if (chunks != j.end() && chunks->is_object()) {
    for (auto it = chunks->begin(); it != chunks->end(); ++it) {
      int index = 0;
      const std::string& key = it.key();
      auto [ptr, ec] = std::from_chars(key.data(), key.data() + key.size(), index);
      if (ec != std::errc() || ptr != key.data() + key.size()) {
        throw Error{ErrorDomain::Persistence, errors::persistence::kRecordCorrupt,
                    "Invalid chunk index '" + key + "' in record " + task.file_id};
      }
      ChunkInfo chunk = it.value().get<ChunkInfo>();
      chunk.index = index;
      file.chunks.emplace(index, std::move(chunk));
    }
  }
  task.detail = std::move(file);
}

void to_json(nlohmann::json& j, const FileDescriptor& file) {
  j = nlohmann::json{{"filename", file.file_name},
                     {"relative_path", file.relative_path},
                     {"file_size", file.file_size},
                     {"total_chunks", file.total_chunks}};
  if (!file.file_id.empty()) {
    j["file_id"] = file.file_id;
  }
}

void from_json(const nlohmann::json& j, FileDescriptor& file) {
  file.file_id = ValueOr<std::string>(j, "file_id", "");
  file.file_name = ValueOr<std::string>(j, "filename", ValueOr<std::string>(j, "file_name", ""));
  file.relative_path = ValueOr<std::string>(j, "relative_path", "");
  file.file_size = ValueOr<int64_t>(j, "file_size", 0);
  file.total_chunks = ValueOr<int>(j, "total_chunks", 0);
}

void to_json(nlohmann::json& j, const FolderTaskSummary& summary) {
  j = nlohmann::json{{"folder_task_id", summary.folder_task_id},
                     {"folder_name", summary.folder_name},
                     {"total_files", summary.total_files},
                     {"completed_files", summary.completed_files},
                     {"failed_files", summary.failed_files},
                     {"total_size", summary.total_size},
                     {"uploaded_size", summary.uploaded_size},
                     {"completion_rate", summary.completion_rate},
                     {"status", ToString(summary.status)}};
}

}  // namespace uv::storage
