#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <utility>

#include "uv/orchestrator/io_util.h"
#include "uv/orchestrator/retry.h"
#include "uv/storage/task_store.h"

namespace uv::orchestrator {

struct ChunkRequest {
  std::string file_id;
  int index{-1};
  std::span<const uint8_t> data;
  std::string expected_md5;  // optional
  std::string file_name;
  std::string relative_path;
  int total_chunks{0};
  int64_t file_size{0};
};

struct ChunkResult {
  int index{0};
  bool md5_checked{false};
  uint64_t size{0};
  bool duplicate{false};  // an identical artifact was already stored
  std::string md5;
};

struct IngestOptions {
  uint64_t max_chunk_size{100ull * 1024 * 1024};
  uint64_t max_file_size{10ull * 1024 * 1024 * 1024};
  bool integrity_check{true};
  WriteMode write_mode{WriteMode::kAtomic};
  RetryPolicy retry{};
  std::chrono::seconds stale_lock_after{3600};
};

// Stores one chunk of an upload and records it in the task store.
class ChunkIngestor {
public:
  ChunkIngestor(storage::TaskStore& store, IngestOptions options);

  // Throws Error: Validation for malformed requests, Integrity when the
  // supplied digest does not match, Cancelled when `cancel` fires, and IO
  // once retries are exhausted (the chunk and its task are then failed).
  ChunkResult IngestChunk(const ChunkRequest& request, const CancellationToken* cancel = nullptr);

  void set_writer_hooks(AtomicReplaceHooks hooks) { hooks_ = std::move(hooks); }
  [[nodiscard]] const IngestOptions& options() const noexcept { return options_; }

private:
  void Validate(const ChunkRequest& request) const;
  // Digest of the stored artifact when it already holds this chunk.
  std::optional<std::string> StoredDigestIfDuplicate(const std::filesystem::path& chunk_path,
                                                     const ChunkRequest& request) const;
  std::string WriteChunk(const std::filesystem::path& chunk_path, std::span<const uint8_t> data,
                         const CancellationToken* cancel);
  void RecordFailure(const ChunkRequest& request, const Error& err);

  storage::TaskStore& store_;
  IngestOptions options_;
  AtomicReplaceHooks hooks_;
};

}  // namespace uv::orchestrator
