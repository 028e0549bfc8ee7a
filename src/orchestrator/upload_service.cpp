#include "uv/orchestrator/upload_service.h"

#include <algorithm>
#include <filesystem>
#include <system_error>
#include <utility>

#include "uv/common.h"
#include "uv/error.h"
#include "uv/errors.h"
#include "uv/orchestrator/event_bus.h"
#include "uv/storage/path_layout.h"

namespace uv::orchestrator {
namespace {

IngestOptions MakeIngestOptions(const ServiceConfig& config) {
  IngestOptions options;
  options.max_chunk_size = config.max_chunk_size;
  options.max_file_size = config.max_file_size;
  options.integrity_check = config.enable_integrity_check;
  options.write_mode = config.enable_atomic_operations ? WriteMode::kAtomic : WriteMode::kDirect;
  options.retry = config.retry_policy();
  options.stale_lock_after = config.stale_lock_threshold;
  return options;
}

MergeOptions MakeMergeOptions(const ServiceConfig& config) {
  MergeOptions options;
  options.merged_dir = config.merged_dir;
  options.integrity_check = config.enable_integrity_check;
  options.write_mode = config.enable_atomic_operations ? WriteMode::kAtomic : WriteMode::kDirect;
  options.retry = config.retry_policy();
  options.stale_lock_after = config.stale_lock_threshold;
  return options;
}

CancellationToken MakeToken(Deadline deadline, std::chrono::seconds fallback) {
  return CancellationToken(deadline.value_or(std::chrono::steady_clock::now() + fallback));
}

void PublishServiceEvent(EventSeverity severity, const char* event_id, std::string message,
                         std::vector<EventField> fields = {}) {
  Event event;
  event.category = EventCategory::kLifecycle;
  event.severity = severity;
  event.event_id = event_id;
  event.message = std::move(message);
  event.fields = std::move(fields);
  EventBus::Instance().Publish(event);
}

}  // namespace

void to_json(nlohmann::json& j, const StatusReport& report) {
  j = nlohmann::json{{"file_id", report.file_id},
                     {"status", report.status},
                     {"uploaded_chunks", report.uploaded_chunks},
                     {"uploaded_count", report.uploaded_chunks.size()},
                     {"total_chunks", report.total_chunks},
                     {"file_size", report.file_size},
                     {"completion_rate", report.completion_rate},
                     {"retry_count", report.retry_count}};
  if (!report.file_md5.empty()) {
    j["file_md5"] = report.file_md5;
  }
  if (report.created_at) {
    j["created_at"] = FormatTimestamp(*report.created_at);
  }
  if (report.updated_at) {
    j["updated_at"] = FormatTimestamp(*report.updated_at);
  }
}

void to_json(nlohmann::json& j, const TaskView& view) {
  j = view.task;
  if (view.summary) {
    j["summary"] = *view.summary;
  }
  if (!view.sub_tasks.empty()) {
    j["sub_task_details"] = view.sub_tasks;
  }
}

UploadService::UploadService(ServiceConfig config)
    : config_(std::move(config)),
      store_(storage::PathLayout(config_.upload_dir), config_.task_retention),
      cleanup_(config_.cleanup_workers),
      ingestor_(store_, MakeIngestOptions(config_)),
      merger_(store_, &cleanup_, MakeMergeOptions(config_)) {}

UploadService::~UploadService() { Stop(); }

void UploadService::Start(bool expiry_timer) {
  ValidateConfig(config_);
  EnsureDirectories(config_);
  DefaultJsonLogger().Configure(config_.log_dir, ParseSeverity(config_.log_level).value_or(EventSeverity::kInfo));
  const size_t loaded = store_.Load();

  {
    std::lock_guard<std::mutex> guard(timer_mutex_);
    stopping_ = false;
    started_ = true;
  }
  if (expiry_timer && !expiry_thread_.joinable()) {
    expiry_thread_ = std::thread([this]() { ExpiryLoop(); });
  }
  PublishServiceEvent(EventSeverity::kInfo, "service_started", "Upload service started",
                      {{"upload_dir", PathToUtf8String(config_.upload_dir)},
                       {"tasks_loaded", std::to_string(loaded), FieldPrivacy::kPublic, true}});
}

void UploadService::Stop() {
  {
    std::lock_guard<std::mutex> guard(timer_mutex_);
    if (!started_) {
      return;
    }
    started_ = false;
    stopping_ = true;
  }
  timer_cv_.notify_all();
  if (expiry_thread_.joinable()) {
    expiry_thread_.join();
  }
  cleanup_.Shutdown(true);
  PublishServiceEvent(EventSeverity::kInfo, "service_stopped", "Upload service stopped");
}

void UploadService::ExpiryLoop() {
  std::unique_lock<std::mutex> lock(timer_mutex_);
  while (!stopping_) {
    if (timer_cv_.wait_for(lock, config_.cleanup_interval, [this]() { return stopping_; })) {
      break;
    }
    lock.unlock();
    try {
      store_.CleanupExpiredTasks();
    } catch (const Error& err) {
      PublishServiceEvent(EventSeverity::kError, "expiry_cleanup_failed", "Periodic cleanup failed",
                          {{"reason", err.what()}});
    }
    lock.lock();
  }
}

const storage::UploadTask& UploadService::RequireFound(const std::optional<storage::UploadTask>& task,
                                                       std::string_view file_id) const {
  if (!task) {
    throw Error{ErrorDomain::NotFound, errors::not_found::kTask,
                std::string(errors::msg::kTaskNotFound) + ": " + std::string(file_id)};
  }
  return *task;
}

ChunkResult UploadService::UploadChunk(const ChunkRequest& request, Deadline deadline) {
  auto token = MakeToken(deadline, config_.chunk_timeout);
  return ingestor_.IngestChunk(request, &token);
}

MergeResult UploadService::Merge(const MergeRequest& request, Deadline deadline) {
  auto token = MakeToken(deadline, config_.merge_timeout);
  return merger_.Merge(request, &token);
}

StatusReport UploadService::Status(std::string_view file_id) const {
  StatusReport report;
  report.file_id = std::string(file_id);

  if (auto task = store_.GetTask(file_id)) {
    report.found = true;
    report.status = storage::ToString(task->status);
    report.retry_count = task->retry_count;
    report.created_at = task->created_at;
    report.updated_at = task->updated_at;
    if (const auto* file = task->file()) {
      report.uploaded_chunks = file->CompletedIndices();
      report.total_chunks = file->total_chunks;
      report.file_size = file->file_size;
      report.file_md5 = file->file_md5;
      if (file->total_chunks > 0) {
        report.completion_rate = static_cast<double>(report.uploaded_chunks.size()) /
                                 static_cast<double>(file->total_chunks) * 100.0;
      }
    } else {
      const auto summary = store_.GetFolderTaskSummary(file_id);
      report.status = storage::ToString(summary.status);
      report.total_chunks = 0;
      report.file_size = summary.total_size;
      report.completion_rate = summary.completion_rate;
    }
    return report;
  }

  // No record: report whatever chunk artifacts survived.
  const auto chunk_dir = store_.layout().ChunkDir(file_id);
  std::error_code ec;
  if (!std::filesystem::is_directory(chunk_dir, ec)) {
    return report;
  }
  for (std::filesystem::directory_iterator it(chunk_dir, ec), end; !ec && it != end; it.increment(ec)) {
    if (auto index = storage::ParseChunkFileName(PathToUtf8String(it->path().filename()))) {
      report.uploaded_chunks.push_back(*index);
    }
  }
  std::sort(report.uploaded_chunks.begin(), report.uploaded_chunks.end());
  report.found = true;
  report.status = storage::ToString(storage::TaskStatus::kUploading);
  return report;
}

std::vector<TaskView> UploadService::ListTasks() const {
  std::vector<TaskView> views;
  for (auto& task : store_.GetMainTasks()) {
    TaskView view;
    if (task.is_folder()) {
      view.summary = store_.GetFolderTaskSummary(task.file_id);
    }
    view.task = std::move(task);
    views.push_back(std::move(view));
  }
  return views;
}

TaskView UploadService::GetTask(std::string_view file_id) const {
  TaskView view;
  view.task = RequireFound(store_.GetTask(file_id), file_id);
  if (view.task.is_folder()) {
    view.summary = store_.GetFolderTaskSummary(file_id);
    view.sub_tasks = store_.GetSubTasks(file_id);
  }
  return view;
}

void UploadService::DeleteTask(std::string_view file_id) {
  (void)RequireFound(store_.GetTask(file_id), file_id);
  store_.DeleteTask(file_id);
}

void UploadService::PauseTask(std::string_view file_id) { store_.PauseTask(file_id); }

void UploadService::ResumeTask(std::string_view file_id) { store_.ResumeTask(file_id); }

std::vector<std::string> UploadService::ResumeAllFailed() { return store_.ResumeAllFailed(); }

std::vector<storage::UploadTask> UploadService::ListFailed() const {
  std::vector<storage::UploadTask> failed;
  for (auto& task : store_.GetAllTasks()) {
    if (task.status == storage::TaskStatus::kFailed || task.status == storage::TaskStatus::kPartialFailed) {
      failed.push_back(std::move(task));
    }
  }
  return failed;
}

std::vector<std::string> UploadService::Cleanup(const storage::CleanupFilter& filter) {
  return store_.CleanupTasks(filter);
}

storage::UploadTask UploadService::CreateFolderTask(std::string_view folder_name,
                                                    const std::vector<storage::FileDescriptor>& files) {
  return store_.CreateFolderTask(folder_name, files);
}

storage::FolderTaskSummary UploadService::FolderSummary(std::string_view folder_id) const {
  return store_.GetFolderTaskSummary(folder_id);
}

std::vector<storage::UploadTask> UploadService::SubTasks(std::string_view folder_id) const {
  return store_.GetSubTasks(folder_id);
}

}  // namespace uv::orchestrator
