#include "uv/orchestrator/chunk_ingestor.h"

#include <chrono>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>

#include "test_support.h"
#include "uv/common.h"
#include "uv/crypto/md5.h"
#include "uv/error.h"

namespace {

  using uv::orchestrator::ChunkIngestor;
  using uv::orchestrator::ChunkRequest;
  using uv::orchestrator::IngestOptions;
  using uv::orchestrator::RetryPolicy;
  using uv::storage::ChunkStatus;
  using uv::storage::PathLayout;
  using uv::storage::TaskStatus;
  using uv::storage::TaskStore;
  using uv::testing::Check;
  using uv::testing::CountEntries;
  using uv::testing::ReadText;
  using uv::testing::TempDir;
  using namespace std::chrono_literals;

  IngestOptions FastOptions() {
    IngestOptions options;
    options.max_chunk_size = 16;
    options.max_file_size = 1024;
    options.retry = RetryPolicy{2, 1ms, 2ms, 2.0};
    return options;
  }

  ChunkRequest MakeRequest(const std::string& file_id, int index, std::string_view payload, int total = 3) {
    ChunkRequest request;
    request.file_id = file_id;
    request.index = index;
    request.data = uv::AsBytes(payload);
    request.file_name = "data.bin";
    request.total_chunks = total;
    request.file_size = 9;
    return request;
  }

  template <typename Fn>
  uv::ErrorDomain DomainOf(Fn&& fn) {
    try {
      fn();
    } catch (const uv::Error& err) {
      return err.domain;
    }
    std::cerr << "Expected an error" << std::endl;
    std::abort();
  }

  void TestStoresChunkAndRecordsProgress() {
    TempDir dir("uv_ingest_store");
    TaskStore store{PathLayout(dir.path())};
    store.Load();
    ChunkIngestor ingestor(store, FastOptions());

    auto request = MakeRequest("file-1", 1, "BBB");
    request.expected_md5 = uv::crypto::Md5Hex(std::string_view("BBB"));
    auto result = ingestor.IngestChunk(request);
    Check(!result.duplicate, "First upload is not a duplicate");
    Check(result.md5_checked, "Supplied digest must be verified");
    Check(result.size == 3, "Result reports chunk size");
    Check(ReadText(store.layout().ChunkPath("file-1", 1)) == "BBB", "Chunk artifact content");
    Check(CountEntries(store.layout().ChunkDir("file-1")) == 1, "No staging files left behind");

    auto task = store.GetTask("file-1");
    Check(task && task->status == TaskStatus::kUploading, "First chunk creates an uploading task");
    Check(task->file()->total_chunks == 3, "Task takes the announced total");
    Check(task->file()->chunks.at(1).status == ChunkStatus::kCompleted, "Chunk recorded as completed");
    Check(!std::filesystem::exists(store.layout().ChunkLockPath("file-1")), "Chunk lock released");
  }

  void TestRepeatedChunkIsIdempotent() {
    TempDir dir("uv_ingest_dup");
    TaskStore store{PathLayout(dir.path())};
    store.Load();
    ChunkIngestor ingestor(store, FastOptions());

    auto request = MakeRequest("file-2", 0, "AAA");
    request.expected_md5 = uv::crypto::Md5Hex(std::string_view("AAA"));
    ingestor.IngestChunk(request);
    auto again = ingestor.IngestChunk(request);
    Check(again.duplicate, "Identical chunk must be reported as duplicate");
    Check(store.GetUploadedChunks("file-2") == std::vector<int>({0}), "Duplicate does not add progress");

    auto unverified = MakeRequest("file-2", 0, "ZZZ");
    auto skipped = ingestor.IngestChunk(unverified);
    Check(skipped.duplicate, "Without a digest a same-size artifact counts as stored");
    Check(ReadText(store.layout().ChunkPath("file-2", 0)) == "AAA", "Duplicate must not rewrite the artifact");
    const auto stored_md5 = uv::crypto::Md5Hex(std::string_view("AAA"));
    Check(skipped.md5 == stored_md5, "Duplicate reports the digest of the stored artifact");
    Check(store.GetTask("file-2")->file()->chunks.at(0).md5 == stored_md5,
          "Recorded digest matches the stored artifact");

    auto changed = MakeRequest("file-2", 0, "ZZZ");
    changed.expected_md5 = uv::crypto::Md5Hex(std::string_view("ZZZ"));
    auto replaced = ingestor.IngestChunk(changed);
    Check(!replaced.duplicate, "Different digest means a new chunk");
    Check(ReadText(store.layout().ChunkPath("file-2", 0)) == "ZZZ", "New chunk replaces the artifact");
  }

  void TestRejectsBadRequests() {
    TempDir dir("uv_ingest_reject");
    TaskStore store{PathLayout(dir.path())};
    store.Load();
    ChunkIngestor ingestor(store, FastOptions());

    Check(DomainOf([&] { ingestor.IngestChunk(MakeRequest("", 0, "A")); }) == uv::ErrorDomain::Validation,
          "Missing file id");
    Check(DomainOf([&] { ingestor.IngestChunk(MakeRequest("f", -1, "A")); }) == uv::ErrorDomain::Validation,
          "Negative index");
    Check(DomainOf([&] { ingestor.IngestChunk(MakeRequest("f", 3, "A")); }) == uv::ErrorDomain::Validation,
          "Index beyond total");
    Check(DomainOf([&] { ingestor.IngestChunk(MakeRequest("f", 0, "0123456789abcdefXYZ")); }) ==
              uv::ErrorDomain::Validation,
          "Oversized chunk");
    auto huge = MakeRequest("f", 0, "A");
    huge.file_size = 4096;
    bool too_large = false;
    try {
      ingestor.IngestChunk(huge);
    } catch (const uv::Error& err) {
      too_large = err.domain == uv::ErrorDomain::Validation && err.code == uv::errors::validation::kFileTooLarge;
    }
    Check(too_large, "Announced file size beyond the limit");
    Check(!store.Contains("f"), "Rejected requests do not create tasks");

    auto corrupt = MakeRequest("f-md5", 0, "AAA");
    corrupt.expected_md5 = uv::crypto::Md5Hex(std::string_view("not it"));
    Check(DomainOf([&] { ingestor.IngestChunk(corrupt); }) == uv::ErrorDomain::Integrity, "Digest mismatch");
    Check(!std::filesystem::exists(store.layout().ChunkPath("f-md5", 0)), "Mismatched chunk is not stored");
    Check(store.GetTask("f-md5")->status == TaskStatus::kUploading, "Digest mismatch leaves the task usable");
  }

  void TestWriteFailureMarksTaskFailed() {
    TempDir dir("uv_ingest_fail");
    TaskStore store{PathLayout(dir.path())};
    store.Load();
    ChunkIngestor ingestor(store, FastOptions());
    int attempts = 0;
    uv::orchestrator::AtomicReplaceHooks hooks;
    hooks.before_rename = [&](const std::filesystem::path&, const std::filesystem::path&) {
      ++attempts;
      throw std::runtime_error("i/o timeout");
    };
    ingestor.set_writer_hooks(hooks);

    Check(DomainOf([&] { ingestor.IngestChunk(MakeRequest("f-io", 0, "AAA")); }) == uv::ErrorDomain::IO,
          "Exhausted retries surface as IO");
    Check(attempts == 3, "Transient write failure is retried max_retries times");
    auto task = store.GetTask("f-io");
    Check(task->status == TaskStatus::kFailed, "Write failure fails the task");
    Check(task->file()->chunks.at(0).status == ChunkStatus::kFailed, "Write failure fails the chunk");
    Check(!std::filesystem::exists(store.layout().ChunkPath("f-io", 0)), "No partial chunk is published");
  }

} // namespace

int main() {
  TestStoresChunkAndRecordsProgress();
  TestRepeatedChunkIsIdempotent();
  TestRejectsBadRequests();
  TestWriteFailureMarksTaskFailed();
  std::cout << "chunk ingestion tests ok\n";
  return 0;
}
