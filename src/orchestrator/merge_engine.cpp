#include "uv/orchestrator/merge_engine.h"

#include <array>
#include <cerrno>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <unistd.h>

#include "uv/common.h"
#include "uv/errors.h"
#include "uv/orchestrator/event_bus.h"
#include "uv/orchestrator/lock_file.h"

namespace uv::orchestrator {
namespace {

constexpr size_t kCopyBufferSize = 64 * 1024;

void PublishMergeEvent(EventSeverity severity, const char* event_id, const char* message, std::string_view file_id,
                       std::vector<EventField> extra = {}) {
  Event event;
  event.category = severity >= EventSeverity::kWarning ? EventCategory::kDiagnostics : EventCategory::kLifecycle;
  event.severity = severity;
  event.event_id = event_id;
  event.message = message;
  event.fields.emplace_back("file_id", std::string(file_id));
  for (auto& field : extra) {
    event.fields.push_back(std::move(field));
  }
  EventBus::Instance().Publish(event);
}

[[noreturn]] void ThrowTraversal(std::string_view relative_path) {
  throw Error{ErrorDomain::Validation, errors::validation::kPathTraversal,
              std::string(errors::msg::kPathTraversal) + ": " + std::string(relative_path)};
}

[[noreturn]] void ThrowChunkRead(const std::filesystem::path& path, int index, int err, const char* what) {
  throw Error{ErrorDomain::IO,
              errors::io::kChunkReadFailed,
              "Failed to " + std::string(what) + " chunk " + std::to_string(index) + " (" +
                  uv::PathToUtf8String(path) + "): " + std::generic_category().message(err),
              err,
              ClassifyNativeError(err)};
}

// Streams one chunk artifact into the writer.
void AppendChunk(AtomicWriter& writer, const std::filesystem::path& path, int index) {
  int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
  if (fd < 0) {
    ThrowChunkRead(path, index, errno, "open");
  }
  std::array<uint8_t, kCopyBufferSize> buffer{};
  try {
    for (;;) {
      const ssize_t got = ::read(fd, buffer.data(), buffer.size());
      if (got < 0) {
        if (errno == EINTR) {
          continue;
        }
        ThrowChunkRead(path, index, errno, "read");
      }
      if (got == 0) {
        break;
      }
      writer.Write(std::span<const uint8_t>(buffer.data(), static_cast<size_t>(got)));
    }
  } catch (...) {
    ::close(fd);
    throw;
  }
  ::close(fd);
}

}  // namespace

std::filesystem::path ResolveMergeDestination(const std::filesystem::path& merged_dir, std::string_view file_name,
                                              std::string_view relative_path) {
  if (!relative_path.empty()) {
    const std::filesystem::path rel(relative_path);
    if (rel.is_absolute() || rel.has_root_name()) {
      ThrowTraversal(relative_path);
    }
    for (const auto& part : rel) {
      if (part == "..") {
        ThrowTraversal(relative_path);
      }
    }
    auto clean = rel.lexically_normal();
    if (clean.empty() || clean == "." || !clean.has_filename()) {
      throw Error{ErrorDomain::Validation, errors::validation::kMissingArgument,
                  std::string(errors::msg::kFilenameRequired)};
    }
    return merged_dir / clean;
  }

  const std::filesystem::path name(file_name);
  if (name.empty() || name == "." || name == "..") {
    throw Error{ErrorDomain::Validation, errors::validation::kMissingArgument,
                std::string(errors::msg::kFilenameRequired)};
  }
  if (name != name.filename()) {
    ThrowTraversal(file_name);
  }
  return merged_dir / name;
}

MergeEngine::MergeEngine(storage::TaskStore& store, CleanupWorker* cleanup, MergeOptions options)
    : store_(store), cleanup_(cleanup), options_(std::move(options)) {}

MergeResult MergeEngine::MergeOnce(const std::string& file_id, int total_chunks,
                                   const std::filesystem::path& destination, const std::string& expected_md5) {
  const auto started = std::chrono::steady_clock::now();
  const auto& layout = store_.layout();

  // Every artifact must be present before a single byte is copied.
  for (int index = 0; index < total_chunks; ++index) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(layout.ChunkPath(file_id, index), ec)) {
      throw Error{ErrorDomain::Integrity, errors::integrity::kMissingChunk,
                  std::string(errors::msg::kMissingChunk) + ": " + storage::ChunkFileName(index)};
    }
  }

  AtomicWriter writer(options_.write_mode, hooks_);
  writer.Open(destination);
  try {
    for (int index = 0; index < total_chunks; ++index) {
      AppendChunk(writer, layout.ChunkPath(file_id, index), index);
    }
  } catch (...) {
    writer.Rollback();
    throw;
  }
  writer.Commit();

  MergeResult result;
  result.file_path = destination;
  result.md5 = writer.Digest();
  result.size = writer.Size();

  if (options_.integrity_check && !expected_md5.empty() && !DigestEquals(result.md5, expected_md5)) {
    std::error_code ec;
    std::filesystem::remove(destination, ec);
    if (ec) {
      PublishMergeEvent(EventSeverity::kError, "merge_output_remove_failed",
                        "Could not remove merged file after digest mismatch", file_id, {{"reason", ec.message()}});
    }
    throw Error{ErrorDomain::Integrity, errors::integrity::kChecksumMismatch,
                std::string(errors::msg::kFileChecksumMismatch) + ": expected=" + expected_md5 +
                    " actual=" + result.md5};
  }

  result.duration =
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
  return result;
}

void MergeEngine::ScheduleCleanup(const std::string& file_id) {
  if (cleanup_ == nullptr) {
    return;
  }
  const auto layout = store_.layout();
  const bool queued = cleanup_->Submit("merge cleanup " + file_id, [layout, file_id]() {
    storage::RemoveUploadArtifacts(layout, file_id);
  });
  if (!queued) {
    PublishMergeEvent(EventSeverity::kWarning, "merge_cleanup_skipped", "Chunk artifacts left in place", file_id);
  }
}

MergeResult MergeEngine::Merge(const MergeRequest& request, const CancellationToken* cancel) {
  if (request.file_id.empty()) {
    throw Error{ErrorDomain::Validation, errors::validation::kMissingArgument,
                std::string(errors::msg::kFileIdRequired)};
  }
  auto task = store_.GetTask(request.file_id);
  if (!task) {
    throw Error{ErrorDomain::NotFound, errors::not_found::kTask,
                std::string(errors::msg::kTaskNotFound) + ": " + request.file_id};
  }
  const auto* file = task->file();
  if (file == nullptr) {
    throw Error{ErrorDomain::State, errors::state::kIllegalTransition,
                std::string(errors::msg::kNotAFileTask) + ": " + request.file_id};
  }

  storage::FileTaskDetail gate = *file;
  if (request.total_chunks > 0) {
    gate.total_chunks = request.total_chunks;
  }
  if (!gate.HasAllChunks()) {
    throw Error{ErrorDomain::State, errors::state::kIncompleteUpload,
                std::string(errors::msg::kIncompleteUpload) + ": uploaded=" +
                    std::to_string(gate.CompletedChunkCount()) + " required=" + std::to_string(gate.total_chunks)};
  }

  LockFile lock(store_.layout().MergeLockPath(request.file_id), options_.stale_lock_after);
  if (!lock.TryAcquire()) {
    PublishMergeEvent(EventSeverity::kInfo, "merge_lock_contended", "Merge already running", request.file_id);
    throw Error{ErrorDomain::Conflict, errors::conflict::kMergeInProgress,
                std::string(errors::msg::kMergeInProgress) + ": " + request.file_id};
  }

  const std::string file_name = request.file_name.empty() ? task->file_name : request.file_name;
  const std::string relative_path = request.relative_path.empty() ? task->relative_path : request.relative_path;
  const auto destination = ResolveMergeDestination(options_.merged_dir, file_name, relative_path);

  PublishMergeEvent(EventSeverity::kInfo, "merge_started", "Merge started", request.file_id,
                    {{"chunks", std::to_string(gate.total_chunks), FieldPrivacy::kPublic, true}});

  MergeResult result;
  try {
    result = RetryWithBackoff([&]() { return MergeOnce(request.file_id, gate.total_chunks, destination,
                                                       request.expected_md5); },
                              options_.retry, cancel, "merge");
  } catch (const Error& err) {
    PublishMergeEvent(EventSeverity::kError, "merge_failed", "Merge failed", request.file_id,
                      {{"reason", err.what()}});
    if (err.domain != ErrorDomain::Cancelled) {
      store_.MarkFailed(request.file_id, err.what());
    }
    throw;
  }

  store_.MarkCompleted(request.file_id, result.md5);
  lock.Release();
  ScheduleCleanup(request.file_id);

  PublishMergeEvent(EventSeverity::kInfo, "merge_completed", "Merge completed", request.file_id,
                    {{"size", std::to_string(result.size), FieldPrivacy::kPublic, true},
                     {"duration_ms", std::to_string(result.duration.count()), FieldPrivacy::kPublic, true},
                     {"md5", result.md5}});
  return result;
}

}  // namespace uv::orchestrator
