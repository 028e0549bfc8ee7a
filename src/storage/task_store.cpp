#include "uv/storage/task_store.h"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <string>
#include <system_error>
#include <utility>

#include <nlohmann/json.hpp>

#include "uv/crypto/random.h"
#include "uv/error.h"
#include "uv/errors.h"
#include "uv/orchestrator/event_bus.h"
#include "uv/orchestrator/io_util.h"

namespace uv::storage {
namespace {

using orchestrator::Event;
using orchestrator::EventBus;
using orchestrator::EventCategory;
using orchestrator::EventSeverity;
using orchestrator::FieldPrivacy;

// Keeps going through a multi-record operation and reports the first
// failure once every record has been attempted.
class FirstError {
public:
  template <typename Fn>
  void Capture(Fn&& fn) {
    try {
      fn();
    } catch (const Error& err) {
      if (!first_) {
        first_ = err;
      }
    }
  }
  void RethrowIfAny() const {
    if (first_) {
      throw *first_;
    }
  }

private:
  std::optional<Error> first_;
};

[[noreturn]] void ThrowNotFound(std::string_view file_id) {
  throw Error{ErrorDomain::NotFound, errors::not_found::kTask,
              std::string(errors::msg::kTaskNotFound) + ": " + std::string(file_id)};
}

void PublishTaskEvent(EventSeverity severity, const char* event_id, std::string message, std::string_view file_id,
                      std::vector<orchestrator::EventField> extra = {}) {
  Event event;
  event.category = severity >= EventSeverity::kWarning ? EventCategory::kDiagnostics : EventCategory::kLifecycle;
  event.severity = severity;
  event.event_id = event_id;
  event.message = std::move(message);
  event.fields.emplace_back("file_id", std::string(file_id));
  for (auto& field : extra) {
    event.fields.push_back(std::move(field));
  }
  EventBus::Instance().Publish(event);
}

std::string MakeFolderId() {
  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now().time_since_epoch()).count();
  return "folder_" + std::to_string(ms) + "_" + uv::crypto::RandomHex(4);
}

bool IsResumable(TaskStatus status) {
  return status == TaskStatus::kPaused || status == TaskStatus::kFailed || status == TaskStatus::kPartialFailed;
}

}  // namespace

void RemoveUploadArtifacts(const PathLayout& layout, std::string_view file_id) {
  std::optional<Error> first;
  auto record = [&](const std::filesystem::path& path, const std::error_code& ec) {
    if (!first) {
      first = Error{ErrorDomain::IO, ec.value(), "Failed to remove " + PathToUtf8String(path) + ": " + ec.message(),
                    ec.value(), orchestrator::ClassifyNativeError(ec.value())};
    }
  };
  std::error_code ec;
  const auto chunk_dir = layout.ChunkDir(file_id);
  std::filesystem::remove_all(chunk_dir, ec);
  if (ec) {
    record(chunk_dir, ec);
  }
  for (const auto& lock : {layout.ChunkLockPath(file_id), layout.MergeLockPath(file_id)}) {
    ec.clear();
    std::filesystem::remove(lock, ec);
    if (ec) {
      record(lock, ec);
    }
  }
  if (first) {
    throw *first;
  }
}

TaskStore::TaskStore(PathLayout layout, std::chrono::hours retention)
    : layout_(std::move(layout)), retention_(retention) {}

size_t TaskStore::Load() {
  const auto dir = layout_.MetadataDir();
  orchestrator::EnsureDirectory(dir);

  TaskMap loaded;
  std::error_code ec;
  for (std::filesystem::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
    const auto& path = it->path();
    std::error_code type_ec;
    if (path.extension() != ".json" || !it->is_regular_file(type_ec)) {
      continue;
    }
    try {
      std::ifstream in(path, std::ios::binary);
      if (!in) {
        throw Error{ErrorDomain::Persistence, errors::persistence::kRecordCorrupt,
                    "Unable to open task record " + PathToUtf8String(path)};
      }
      auto task = nlohmann::json::parse(in).get<UploadTask>();
      std::string id = task.file_id;
      loaded.insert_or_assign(std::move(id), std::move(task));
    } catch (const nlohmann::json::exception& ex) {
      PublishTaskEvent(EventSeverity::kWarning, "task_record_corrupt", "Skipping unreadable task record",
                       PathToUtf8String(path.filename()), {{"reason", ex.what()}});
    } catch (const Error& err) {
      PublishTaskEvent(EventSeverity::kWarning, "task_record_corrupt", "Skipping unreadable task record",
                       PathToUtf8String(path.filename()), {{"reason", err.what()}});
    }
  }
  if (ec) {
    throw Error{ErrorDomain::IO, ec.value(), "Failed to scan metadata directory " + PathToUtf8String(dir),
                ec.value(), orchestrator::ClassifyNativeError(ec.value())};
  }

  std::unique_lock lock(mutex_);
  tasks_ = std::move(loaded);
  return tasks_.size();
}

UploadTask& TaskStore::RequireLocked(std::string_view file_id) {
  auto it = tasks_.find(file_id);
  if (it == tasks_.end()) {
    ThrowNotFound(file_id);
  }
  return it->second;
}

const UploadTask& TaskStore::RequireLocked(std::string_view file_id) const {
  auto it = tasks_.find(file_id);
  if (it == tasks_.end()) {
    ThrowNotFound(file_id);
  }
  return it->second;
}

void TaskStore::PersistLocked(const UploadTask& task) {
  const auto path = layout_.RecordPath(task.file_id);
  try {
    const std::string text = nlohmann::json(task).dump(2);
    orchestrator::EnsureDirectory(path.parent_path());
    orchestrator::AtomicReplace(path, AsBytes(text));
  } catch (const Error& err) {
    auto context = err.context;
    context.push_back("persist task " + task.file_id);
    PublishTaskEvent(EventSeverity::kError, "task_persist_failed", "Task record write failed", task.file_id,
                     {{"reason", err.what()}});
    throw Error{ErrorDomain::Persistence, errors::persistence::kRecordWriteFailed,
                std::string(errors::msg::kRecordWriteFailed) + " (" + task.file_id + "): " + err.what(),
                err.native_code, err.retryability, std::move(context)};
  }
}

void TaskStore::TouchAndPersistLocked(UploadTask& task) {
  task.updated_at = Clock::now();
  PersistLocked(task);
}

void TaskStore::SaveTask(UploadTask task) {
  std::unique_lock lock(mutex_);
  const auto now = Clock::now();
  if (task.created_at == TimePoint{}) {
    task.created_at = now;
  }
  task.updated_at = now;
  std::string id = task.file_id;
  auto [it, inserted] = tasks_.insert_or_assign(std::move(id), std::move(task));
  (void)inserted;
  PersistLocked(it->second);
}

std::optional<UploadTask> TaskStore::GetTask(std::string_view file_id) const {
  std::shared_lock lock(mutex_);
  auto it = tasks_.find(file_id);
  if (it == tasks_.end()) {
    return std::nullopt;
  }
  return it->second;
}

bool TaskStore::Contains(std::string_view file_id) const {
  std::shared_lock lock(mutex_);
  return tasks_.find(file_id) != tasks_.end();
}

UploadTask TaskStore::EnsureFileTask(const FileTaskParams& params) {
  std::unique_lock lock(mutex_);
  auto it = tasks_.find(params.file_id);
  if (it == tasks_.end()) {
    UploadTask task;
    task.file_id = params.file_id;
    task.file_name = params.file_name;
    task.relative_path = params.relative_path;
    task.status = TaskStatus::kUploading;
    task.created_at = Clock::now();
    FileTaskDetail detail;
    detail.total_chunks = params.total_chunks;
    detail.file_size = params.file_size;
    task.detail = std::move(detail);
    it = tasks_.emplace(params.file_id, std::move(task)).first;
    TouchAndPersistLocked(it->second);
    PublishTaskEvent(EventSeverity::kInfo, "task_created", "Upload task created", params.file_id,
                     {{"total_chunks", std::to_string(params.total_chunks), FieldPrivacy::kPublic, true}});
    return it->second;
  }

  auto& task = it->second;
  auto* file = task.file();
  if (file == nullptr) {
    throw Error{ErrorDomain::State, errors::state::kIllegalTransition,
                std::string(errors::msg::kNotAFileTask) + ": " + params.file_id};
  }
  bool dirty = false;
  if (file->total_chunks == 0 && params.total_chunks > 0) {
    file->total_chunks = params.total_chunks;
    dirty = true;
  }
  if (file->file_size == 0 && params.file_size > 0) {
    file->file_size = params.file_size;
    dirty = true;
  }
  if (task.relative_path.empty() && !params.relative_path.empty()) {
    task.relative_path = params.relative_path;
    dirty = true;
  }
  if (task.file_name.empty() && !params.file_name.empty()) {
    task.file_name = params.file_name;
    dirty = true;
  }
  if (task.status != TaskStatus::kUploading && task.status != TaskStatus::kCompleted) {
    task.status = TaskStatus::kUploading;
    dirty = true;
  }
  if (dirty) {
    TouchAndPersistLocked(task);
    if (task.is_sub_task()) {
      ReconcileParentLocked(file->parent_task_id);
    }
  }
  return task;
}

void TaskStore::UpdateChunk(std::string_view file_id, const ChunkInfo& chunk) {
  std::unique_lock lock(mutex_);
  auto& task = RequireLocked(file_id);
  auto* file = task.file();
  if (file == nullptr) {
    throw Error{ErrorDomain::State, errors::state::kIllegalTransition,
                std::string(errors::msg::kNotAFileTask) + ": " + std::string(file_id)};
  }

  ChunkInfo stored = chunk;
  if (stored.status == ChunkStatus::kCompleted && !stored.uploaded_at) {
    stored.uploaded_at = Clock::now();
  }
  file->chunks.insert_or_assign(stored.index, std::move(stored));

  if (file->HasAllChunks()) {
    task.status = TaskStatus::kCompleted;
  }
  TouchAndPersistLocked(task);
  if (task.is_sub_task()) {
    ReconcileParentLocked(file->parent_task_id);
  }
}

std::vector<int> TaskStore::GetUploadedChunks(std::string_view file_id) const {
  std::shared_lock lock(mutex_);
  auto it = tasks_.find(file_id);
  if (it == tasks_.end()) {
    return {};
  }
  const auto* file = it->second.file();
  return file ? file->CompletedIndices() : std::vector<int>{};
}

UploadTask TaskStore::CreateFolderTask(std::string_view folder_name, const std::vector<FileDescriptor>& files) {
  if (folder_name.empty()) {
    throw Error{ErrorDomain::Validation, errors::validation::kMissingArgument,
                std::string(errors::msg::kFolderNameRequired)};
  }
  if (files.empty()) {
    throw Error{ErrorDomain::Validation, errors::validation::kEmptyFolder,
                std::string(errors::msg::kFolderFilesEmpty)};
  }

  std::unique_lock lock(mutex_);
  const auto now = Clock::now();
  std::string folder_id = MakeFolderId();
  while (tasks_.find(folder_id) != tasks_.end()) {
    folder_id = MakeFolderId();
  }

  std::vector<UploadTask> children;
  children.reserve(files.size());
  FolderTaskDetail folder;
  folder.folder_name = std::string(folder_name);
  for (const auto& descriptor : files) {
    if (descriptor.file_name.empty() && descriptor.relative_path.empty() && descriptor.file_id.empty()) {
      throw Error{ErrorDomain::Validation, errors::validation::kMissingArgument,
                  std::string(errors::msg::kFilenameRequired)};
    }
    UploadTask child;
    child.file_id = !descriptor.file_id.empty()
                        ? descriptor.file_id
                        : folder_id + "/" + (descriptor.relative_path.empty() ? descriptor.file_name
                                                                                : descriptor.relative_path);
    if (std::find(folder.sub_tasks.begin(), folder.sub_tasks.end(), child.file_id) != folder.sub_tasks.end() ||
        tasks_.find(child.file_id) != tasks_.end()) {
      throw Error{ErrorDomain::Validation, errors::validation::kDuplicateFile,
                  std::string(errors::msg::kDuplicateFolderEntry) + ": " + child.file_id};
    }
    child.file_name = descriptor.file_name;
    child.relative_path = descriptor.relative_path;
    child.status = TaskStatus::kPending;
    child.created_at = now;
    child.updated_at = now;
    FileTaskDetail detail;
    detail.total_chunks = descriptor.total_chunks;
    detail.file_size = descriptor.file_size;
    detail.parent_task_id = folder_id;
    child.detail = std::move(detail);
    folder.sub_tasks.push_back(child.file_id);
    children.push_back(std::move(child));
  }

  UploadTask parent;
  parent.file_id = folder_id;
  parent.file_name = std::string(folder_name);
  parent.status = TaskStatus::kPending;
  parent.created_at = now;
  parent.updated_at = now;
  parent.detail = std::move(folder);

  FirstError failures;
  for (auto& child : children) {
    std::string id = child.file_id;
    auto& stored = tasks_.insert_or_assign(std::move(id), std::move(child)).first->second;
    failures.Capture([&] { PersistLocked(stored); });
  }
  auto& stored_parent = tasks_.insert_or_assign(folder_id, std::move(parent)).first->second;
  failures.Capture([&] { PersistLocked(stored_parent); });

  PublishTaskEvent(EventSeverity::kInfo, "folder_task_created", "Folder task created", folder_id,
                   {{"files", std::to_string(files.size()), FieldPrivacy::kPublic, true}});
  failures.RethrowIfAny();
  return stored_parent;
}

std::vector<TaskStatus> TaskStore::ChildStatusesLocked(const FolderTaskDetail& folder) const {
  std::vector<TaskStatus> statuses;
  statuses.reserve(folder.sub_tasks.size());
  for (const auto& child_id : folder.sub_tasks) {
    auto it = tasks_.find(child_id);
    if (it != tasks_.end()) {
      statuses.push_back(it->second.status);
    }
  }
  return statuses;
}

FolderTaskSummary TaskStore::SummarizeLocked(const UploadTask& task) const {
  const auto* folder = task.folder();
  FolderTaskSummary summary;
  summary.folder_task_id = task.file_id;
  summary.folder_name = folder->folder_name;
  for (const auto& child_id : folder->sub_tasks) {
    auto it = tasks_.find(child_id);
    if (it == tasks_.end()) {
      continue;
    }
    const auto& child = it->second;
    ++summary.total_files;
    if (const auto* file = child.file()) {
      summary.total_size += file->file_size;
    }
    summary.uploaded_size += EstimateUploadedBytes(child);
    if (child.status == TaskStatus::kCompleted) {
      ++summary.completed_files;
    } else if (child.status == TaskStatus::kFailed || child.status == TaskStatus::kPartialFailed) {
      ++summary.failed_files;
    }
  }
  if (summary.total_size > 0) {
    summary.completion_rate =
        static_cast<double>(summary.uploaded_size) / static_cast<double>(summary.total_size) * 100.0;
  }
  summary.status = AggregateFolderStatus(ChildStatusesLocked(*folder), task.status);
  return summary;
}

FolderTaskSummary TaskStore::GetFolderTaskSummary(std::string_view folder_id) const {
  std::shared_lock lock(mutex_);
  const auto& task = RequireLocked(folder_id);
  if (!task.is_folder()) {
    throw Error{ErrorDomain::State, errors::state::kNotAFolder,
                std::string(errors::msg::kNotAFolderTask) + ": " + std::string(folder_id)};
  }
  return SummarizeLocked(task);
}

void TaskStore::ReconcileParent(std::string_view folder_id) {
  std::unique_lock lock(mutex_);
  ReconcileParentLocked(folder_id);
}

void TaskStore::ReconcileParentLocked(std::string_view folder_id) {
  auto it = tasks_.find(folder_id);
  if (it == tasks_.end()) {
    return;
  }
  auto& parent = it->second;
  const auto* folder = parent.folder();
  if (folder == nullptr) {
    return;
  }
  const auto aggregate = AggregateFolderStatus(ChildStatusesLocked(*folder), parent.status);
  if (aggregate == parent.status) {
    return;
  }
  parent.status = aggregate;
  TouchAndPersistLocked(parent);
  if (aggregate == TaskStatus::kCompleted) {
    PublishTaskEvent(EventSeverity::kInfo, "folder_task_completed", "All files of the folder are complete",
                     parent.file_id);
  }
}

std::vector<UploadTask> TaskStore::GetSubTasks(std::string_view folder_id) const {
  std::shared_lock lock(mutex_);
  const auto& task = RequireLocked(folder_id);
  const auto* folder = task.folder();
  if (folder == nullptr) {
    throw Error{ErrorDomain::State, errors::state::kNotAFolder,
                std::string(errors::msg::kNotAFolderTask) + ": " + std::string(folder_id)};
  }
  std::vector<UploadTask> out;
  out.reserve(folder->sub_tasks.size());
  for (const auto& child_id : folder->sub_tasks) {
    auto it = tasks_.find(child_id);
    if (it != tasks_.end()) {
      out.push_back(it->second);
    }
  }
  return out;
}

std::vector<UploadTask> TaskStore::GetMainTasks() const {
  std::shared_lock lock(mutex_);
  std::vector<UploadTask> out;
  for (const auto& [id, task] : tasks_) {
    if (!task.is_sub_task()) {
      out.push_back(task);
    }
  }
  return out;
}

std::vector<UploadTask> TaskStore::GetAllTasks() const {
  std::shared_lock lock(mutex_);
  std::vector<UploadTask> out;
  out.reserve(tasks_.size());
  for (const auto& [id, task] : tasks_) {
    out.push_back(task);
  }
  return out;
}

void TaskStore::MarkCompleted(std::string_view file_id, std::string_view file_md5) {
  std::unique_lock lock(mutex_);
  auto& task = RequireLocked(file_id);
  auto* file = task.file();
  if (file == nullptr) {
    throw Error{ErrorDomain::State, errors::state::kIllegalTransition,
                std::string(errors::msg::kNotAFileTask) + ": " + std::string(file_id)};
  }
  task.status = TaskStatus::kCompleted;
  file->file_md5 = std::string(file_md5);
  TouchAndPersistLocked(task);
  if (task.is_sub_task()) {
    ReconcileParentLocked(file->parent_task_id);
  }
}

void TaskStore::MarkFailed(std::string_view file_id, std::string_view reason) {
  std::unique_lock lock(mutex_);
  auto& task = RequireLocked(file_id);
  task.status = TaskStatus::kFailed;
  TouchAndPersistLocked(task);
  PublishTaskEvent(EventSeverity::kWarning, "task_failed", "Upload task marked failed", file_id,
                   {{"reason", std::string(reason)}});
  if (const auto* file = task.file(); file != nullptr && !file->parent_task_id.empty()) {
    ReconcileParentLocked(file->parent_task_id);
  }
}

void TaskStore::PauseLocked(UploadTask& task) {
  task.status = TaskStatus::kPaused;
  TouchAndPersistLocked(task);
}

void TaskStore::PauseTask(std::string_view file_id) {
  std::unique_lock lock(mutex_);
  auto& task = RequireLocked(file_id);
  if (task.status == TaskStatus::kCompleted) {
    throw Error{ErrorDomain::State, errors::state::kIllegalTransition,
                std::string(errors::msg::kCannotPauseCompleted) + ": " + std::string(file_id)};
  }

  FirstError failures;
  if (const auto* folder = task.folder()) {
    for (const auto& child_id : folder->sub_tasks) {
      auto it = tasks_.find(child_id);
      if (it == tasks_.end()) {
        continue;
      }
      auto& child = it->second;
      if (child.status == TaskStatus::kUploading || child.status == TaskStatus::kPending) {
        failures.Capture([&] { PauseLocked(child); });
      }
    }
  }
  failures.Capture([&] { PauseLocked(task); });
  if (const auto* file = task.file(); file != nullptr && !file->parent_task_id.empty()) {
    failures.Capture([&] { ReconcileParentLocked(file->parent_task_id); });
  }
  PublishTaskEvent(EventSeverity::kInfo, "task_paused", "Upload task paused", file_id);
  failures.RethrowIfAny();
}

void TaskStore::ResumeLocked(UploadTask& task) {
  task.status = TaskStatus::kUploading;
  ++task.retry_count;
  if (auto* file = task.file()) {
    for (auto& [index, chunk] : file->chunks) {
      if (chunk.status == ChunkStatus::kFailed) {
        chunk.status = ChunkStatus::kPending;
        chunk.retry_count = 0;
      }
    }
  }
  TouchAndPersistLocked(task);
}

void TaskStore::ResumeTask(std::string_view file_id) {
  std::unique_lock lock(mutex_);
  auto& task = RequireLocked(file_id);
  if (!IsResumable(task.status)) {
    throw Error{ErrorDomain::State, errors::state::kIllegalTransition,
                std::string(errors::msg::kCannotResume) + ": " + std::string(file_id) + " is " +
                    ToString(task.status)};
  }

  FirstError failures;
  if (const auto* folder = task.folder()) {
    for (const auto& child_id : folder->sub_tasks) {
      auto it = tasks_.find(child_id);
      if (it == tasks_.end()) {
        continue;
      }
      auto& child = it->second;
      if (child.status == TaskStatus::kPaused || child.status == TaskStatus::kFailed) {
        failures.Capture([&] { ResumeLocked(child); });
      }
    }
  }
  failures.Capture([&] { ResumeLocked(task); });
  if (const auto* file = task.file(); file != nullptr && !file->parent_task_id.empty()) {
    failures.Capture([&] { ReconcileParentLocked(file->parent_task_id); });
  }
  PublishTaskEvent(EventSeverity::kInfo, "task_resumed", "Upload task resumed", file_id,
                   {{"retry_count", std::to_string(task.retry_count), FieldPrivacy::kPublic, true}});
  failures.RethrowIfAny();
}

std::vector<std::string> TaskStore::ResumeAllFailed() {
  std::vector<std::string> candidates;
  {
    std::shared_lock lock(mutex_);
    for (const auto& [id, task] : tasks_) {
      if (!task.is_sub_task() && IsResumable(task.status)) {
        candidates.push_back(id);
      }
    }
  }
  std::vector<std::string> resumed;
  FirstError failures;
  for (const auto& id : candidates) {
    failures.Capture([&] {
      try {
        ResumeTask(id);
        resumed.push_back(id);
      } catch (const Error& err) {
        // Another caller resumed or removed it in between.
        if (err.domain != ErrorDomain::NotFound && err.domain != ErrorDomain::State) {
          throw;
        }
      }
    });
  }
  failures.RethrowIfAny();
  return resumed;
}

void TaskStore::RemoveArtifacts(const std::string& file_id) {
  try {
    RemoveUploadArtifacts(layout_, file_id);
  } catch (const Error& err) {
    PublishTaskEvent(EventSeverity::kWarning, "artifact_cleanup_failed", "Failed to remove upload artifacts",
                     file_id, {{"reason", err.what()}});
  }
}

void TaskStore::RemoveRecord(const std::string& file_id) {
  const auto path = layout_.RecordPath(file_id);
  std::error_code ec;
  std::filesystem::remove(path, ec);
  if (ec) {
    throw Error{ErrorDomain::Persistence, errors::persistence::kRecordRemoveFailed,
                std::string(errors::msg::kRecordRemoveFailed) + " (" + file_id + "): " + ec.message(), ec.value(),
                orchestrator::ClassifyNativeError(ec.value())};
  }
}

void TaskStore::DeleteLocked(const std::string& file_id) {
  auto it = tasks_.find(file_id);
  if (it == tasks_.end()) {
    return;
  }
  UploadTask task = std::move(it->second);
  tasks_.erase(it);

  FirstError failures;
  if (const auto* folder = task.folder()) {
    for (const auto& child_id : folder->sub_tasks) {
      failures.Capture([&] { DeleteLocked(child_id); });
    }
  } else if (const auto* file = task.file(); file != nullptr && !file->parent_task_id.empty()) {
    auto parent = tasks_.find(file->parent_task_id);
    if (parent != tasks_.end()) {
      if (auto* parent_folder = parent->second.folder()) {
        auto& subs = parent_folder->sub_tasks;
        subs.erase(std::remove(subs.begin(), subs.end(), file_id), subs.end());
        failures.Capture([&] { TouchAndPersistLocked(parent->second); });
        failures.Capture([&] { ReconcileParentLocked(file->parent_task_id); });
      }
    }
  }
  RemoveArtifacts(file_id);
  failures.Capture([&] { RemoveRecord(file_id); });
  PublishTaskEvent(EventSeverity::kInfo, "task_deleted", "Upload task deleted", file_id,
                   {{"task_type", ToString(task.type())}});
  failures.RethrowIfAny();
}

void TaskStore::DeleteTask(std::string_view file_id) {
  std::unique_lock lock(mutex_);
  DeleteLocked(std::string(file_id));
}

std::vector<std::string> TaskStore::DeleteMatchingLocked(const std::vector<std::string>& ids) {
  FirstError failures;
  std::vector<std::string> removed;
  for (const auto& id : ids) {
    if (tasks_.find(id) == tasks_.end()) {
      continue;  // already taken by a folder cascade
    }
    failures.Capture([&] { DeleteLocked(id); });
    removed.push_back(id);
  }
  failures.RethrowIfAny();
  return removed;
}

std::vector<std::string> TaskStore::CleanupExpiredTasks() {
  std::unique_lock lock(mutex_);
  const auto cutoff = Clock::now() - retention_;
  std::vector<std::string> expired;
  for (const auto& [id, task] : tasks_) {
    if (task.status != TaskStatus::kFailed && task.status != TaskStatus::kPaused) {
      continue;
    }
    if (const auto* file = task.file(); file != nullptr && !file->parent_task_id.empty() &&
                                        tasks_.find(file->parent_task_id) != tasks_.end()) {
      continue;  // owned by its folder
    }
    if (task.updated_at < cutoff) {
      expired.push_back(id);
    }
  }
  auto removed = DeleteMatchingLocked(expired);
  Event event;
  event.category = EventCategory::kLifecycle;
  event.severity = EventSeverity::kInfo;
  event.event_id = "expired_tasks_cleaned";
  event.message = "Expired task cleanup finished";
  event.fields.emplace_back("removed", std::to_string(removed.size()), FieldPrivacy::kPublic, true);
  EventBus::Instance().Publish(event);
  return removed;
}

std::vector<std::string> TaskStore::CleanupTasks(const CleanupFilter& filter) {
  if (filter.empty()) {
    return CleanupExpiredTasks();
  }
  std::unique_lock lock(mutex_);
  const auto now = Clock::now();
  std::vector<std::string> matching;
  for (const auto& [id, task] : tasks_) {
    if (task.is_sub_task()) {
      continue;
    }
    if (filter.status && task.status != *filter.status) {
      continue;
    }
    if (filter.min_age && now - task.updated_at < *filter.min_age) {
      continue;
    }
    matching.push_back(id);
  }
  return DeleteMatchingLocked(matching);
}

}  // namespace uv::storage
