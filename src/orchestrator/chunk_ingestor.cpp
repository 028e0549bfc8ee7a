#include "uv/orchestrator/chunk_ingestor.h"

#include <filesystem>
#include <optional>
#include <string>
#include <system_error>
#include <utility>

#include "uv/common.h"
#include "uv/crypto/md5.h"
#include "uv/errors.h"
#include "uv/orchestrator/event_bus.h"
#include "uv/orchestrator/lock_file.h"

namespace uv::orchestrator {
namespace {

void PublishChunkEvent(EventSeverity severity, const char* event_id, const char* message,
                       const ChunkRequest& request, std::string reason = {}) {
  Event event;
  event.category = severity >= EventSeverity::kWarning ? EventCategory::kDiagnostics : EventCategory::kTelemetry;
  event.severity = severity;
  event.event_id = event_id;
  event.message = message;
  event.fields.emplace_back("file_id", request.file_id);
  event.fields.emplace_back("chunk_index", std::to_string(request.index), FieldPrivacy::kPublic, true);
  event.fields.emplace_back("size", std::to_string(request.data.size()), FieldPrivacy::kPublic, true);
  if (!reason.empty()) {
    event.fields.emplace_back("reason", std::move(reason));
  }
  EventBus::Instance().Publish(event);
}

}  // namespace

ChunkIngestor::ChunkIngestor(storage::TaskStore& store, IngestOptions options)
    : store_(store), options_(std::move(options)) {}

void ChunkIngestor::Validate(const ChunkRequest& request) const {
  if (request.file_id.empty()) {
    throw Error{ErrorDomain::Validation, errors::validation::kMissingArgument,
                std::string(errors::msg::kFileIdRequired)};
  }
  if (request.index < 0 || (request.total_chunks > 0 && request.index >= request.total_chunks)) {
    throw Error{ErrorDomain::Validation, errors::validation::kInvalidIndex,
                std::string(errors::msg::kChunkIndexInvalid) + ": " + std::to_string(request.index)};
  }
  if (request.data.size() > options_.max_chunk_size) {
    throw Error{ErrorDomain::Validation, errors::validation::kChunkTooLarge,
                std::string(errors::msg::kChunkTooLarge) + " (" + std::to_string(request.data.size()) + " > " +
                    std::to_string(options_.max_chunk_size) + ")"};
  }
  if (request.file_size > 0 && static_cast<uint64_t>(request.file_size) > options_.max_file_size) {
    throw Error{ErrorDomain::Validation, errors::validation::kFileTooLarge,
                std::string(errors::msg::kFileTooLarge) + " (" + std::to_string(request.file_size) + " > " +
                    std::to_string(options_.max_file_size) + ")"};
  }
}

std::optional<std::string> ChunkIngestor::StoredDigestIfDuplicate(const std::filesystem::path& chunk_path,
                                                                 const ChunkRequest& request) const {
  std::error_code ec;
  const auto existing = std::filesystem::file_size(chunk_path, ec);
  if (ec || existing != request.data.size()) {
    return std::nullopt;
  }
  auto stored = uv::crypto::FileMd5Hex(chunk_path);
  if (!request.expected_md5.empty() && !DigestEquals(stored, request.expected_md5)) {
    return std::nullopt;
  }
  return stored;
}

std::string ChunkIngestor::WriteChunk(const std::filesystem::path& chunk_path, std::span<const uint8_t> data,
                                      const CancellationToken* cancel) {
  return RetryWithBackoff(
      [&]() {
        AtomicWriter writer(options_.write_mode, hooks_);
        writer.Open(chunk_path);
        writer.Write(data);
        writer.Commit();
        return writer.Digest();
      },
      options_.retry, cancel, "chunk write");
}

void ChunkIngestor::RecordFailure(const ChunkRequest& request, const Error& err) {
  storage::ChunkInfo chunk;
  chunk.index = request.index;
  chunk.size = static_cast<int64_t>(request.data.size());
  chunk.md5 = request.expected_md5;
  chunk.status = storage::ChunkStatus::kFailed;
  chunk.retry_count = options_.retry.max_retries;
  store_.UpdateChunk(request.file_id, chunk);
  store_.MarkFailed(request.file_id, err.what());
}

ChunkResult ChunkIngestor::IngestChunk(const ChunkRequest& request, const CancellationToken* cancel) {
  Validate(request);

  store_.EnsureFileTask(storage::FileTaskParams{request.file_id, request.file_name, request.relative_path,
                                              request.total_chunks, request.file_size});

  const auto& layout = store_.layout();
  LockFile lock(layout.ChunkLockPath(request.file_id), options_.stale_lock_after);
  try {
    if (!lock.TryAcquire()) {
      PublishChunkEvent(EventSeverity::kInfo, "chunk_lock_contended", "Chunk lock held elsewhere, continuing",
                        request);
    }
  } catch (const Error& err) {
    PublishChunkEvent(EventSeverity::kWarning, "chunk_lock_failed", "Chunk lock unavailable, continuing", request,
                      err.what());
  }

  const auto chunk_path = layout.ChunkPath(request.file_id, request.index);
  const bool verify = options_.integrity_check && !request.expected_md5.empty();

  ChunkResult result;
  result.index = request.index;
  result.size = request.data.size();
  result.md5_checked = verify;

  if (auto stored = StoredDigestIfDuplicate(chunk_path, request)) {
    // The record describes the artifact on disk, not the retransmitted bytes.
    result.duplicate = true;
    result.md5 = std::move(*stored);
    storage::ChunkInfo chunk;
    chunk.index = request.index;
    chunk.size = static_cast<int64_t>(request.data.size());
    chunk.md5 = result.md5;
    chunk.status = storage::ChunkStatus::kCompleted;
    store_.UpdateChunk(request.file_id, chunk);
    PublishChunkEvent(EventSeverity::kDebug, "chunk_duplicate_skipped", "Chunk already stored", request);
    return result;
  }

  if (verify) {
    const auto actual = uv::crypto::Md5Hex(request.data);
    if (!DigestEquals(actual, request.expected_md5)) {
      PublishChunkEvent(EventSeverity::kWarning, "chunk_checksum_mismatch", "Chunk digest mismatch", request);
      throw Error{ErrorDomain::Integrity, errors::integrity::kChecksumMismatch,
                  std::string(errors::msg::kChunkChecksumMismatch) + ": expected=" + request.expected_md5 +
                      " actual=" + actual};
    }
  }

  try {
    result.md5 = WriteChunk(chunk_path, request.data, cancel);
  } catch (const Error& err) {
    if (err.domain == ErrorDomain::IO) {
      PublishChunkEvent(EventSeverity::kError, "chunk_failed", "Chunk write failed", request, err.what());
      RecordFailure(request, err);
    }
    throw;
  }

  storage::ChunkInfo chunk;
  chunk.index = request.index;
  chunk.size = static_cast<int64_t>(result.size);
  chunk.md5 = request.expected_md5.empty() ? result.md5 : request.expected_md5;
  chunk.status = storage::ChunkStatus::kCompleted;
  store_.UpdateChunk(request.file_id, chunk);
  PublishChunkEvent(EventSeverity::kInfo, "chunk_stored", "Chunk stored", request);
  return result;
}

}  // namespace uv::orchestrator
