#include "uv/orchestrator/merge_engine.h"

#include <cerrno>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "test_support.h"
#include "uv/common.h"
#include "uv/crypto/md5.h"
#include "uv/error.h"
#include "uv/orchestrator/chunk_ingestor.h"
#include "uv/orchestrator/cleanup_worker.h"
#include "uv/orchestrator/lock_file.h"

namespace {

  using uv::orchestrator::AtomicReplaceHooks;
  using uv::orchestrator::CancellationToken;
  using uv::orchestrator::ChunkIngestor;
  using uv::orchestrator::ChunkRequest;
  using uv::orchestrator::CleanupWorker;
  using uv::orchestrator::IngestOptions;
  using uv::orchestrator::LockFile;
  using uv::orchestrator::MergeEngine;
  using uv::orchestrator::MergeOptions;
  using uv::orchestrator::MergeRequest;
  using uv::orchestrator::ResolveMergeDestination;
  using uv::orchestrator::RetryPolicy;
  using uv::storage::PathLayout;
  using uv::storage::TaskStatus;
  using uv::storage::TaskStore;
  using uv::testing::Check;
  using uv::testing::CountEntries;
  using uv::testing::ReadText;
  using uv::testing::TempDir;
  using uv::testing::WriteText;
  using namespace std::chrono_literals;

  struct Fixture {
    explicit Fixture(std::string_view name)
        : dir(name), store(PathLayout(dir.path() / "upload")), cleanup(1),
          ingestor(store, Ingest()), merger(store, &cleanup, Merge(dir.path() / "merged")) {
      store.Load();
    }

    static IngestOptions Ingest() {
      IngestOptions options;
      options.retry = RetryPolicy{1, 1ms, 1ms, 1.0};
      return options;
    }

    static MergeOptions Merge(const std::filesystem::path& merged) {
      MergeOptions options;
      options.merged_dir = merged;
      options.retry = RetryPolicy{1, 1ms, 1ms, 1.0};
      return options;
    }

    void Upload(const std::string& file_id, int index, std::string_view payload, int total) {
      ChunkRequest request;
      request.file_id = file_id;
      request.index = index;
      request.total_chunks = total;
      request.data = uv::AsBytes(payload);
      request.file_name = "out.txt";
      ingestor.IngestChunk(request);
    }

    std::filesystem::path merged() const { return dir.path() / "merged"; }

    TempDir dir;
    TaskStore store;
    CleanupWorker cleanup;
    ChunkIngestor ingestor;
    MergeEngine merger;
  };

  MergeRequest Request(const std::string& file_id, int total, std::string relative = {}) {
    MergeRequest request;
    request.file_id = file_id;
    request.file_name = "out.txt";
    request.relative_path = std::move(relative);
    request.total_chunks = total;
    return request;
  }

  template <typename Fn>
  uv::Error ErrorOf(Fn&& fn) {
    try {
      fn();
    } catch (const uv::Error& err) {
      return err;
    }
    std::cerr << "Expected an error" << std::endl;
    std::abort();
  }

  void TestMergesInIndexOrder() {
    Fixture fx("uv_merge_order");
    fx.Upload("m1", 1, "B", 3);
    fx.Upload("m1", 2, "C", 3);
    fx.Upload("m1", 0, "A", 3);

    auto request = Request("m1", 3, "docs/out.txt");
    request.expected_md5 = uv::crypto::Md5Hex(std::string_view("ABC"));
    auto result = fx.merger.Merge(request);

    Check(result.file_path == fx.merged() / "docs" / "out.txt", "Relative path places the file");
    Check(ReadText(result.file_path) == "ABC", "Chunks are concatenated by index");
    Check(result.size == 3 && result.md5 == request.expected_md5, "Result reports size and digest");

    auto task = fx.store.GetTask("m1");
    Check(task->status == TaskStatus::kCompleted, "Merge completes the task");
    Check(task->file()->file_md5 == result.md5, "Merged digest recorded on the task");

    fx.cleanup.WaitIdle();
    Check(!std::filesystem::exists(fx.store.layout().ChunkDir("m1")), "Chunk artifacts are cleaned up");
    Check(!std::filesystem::exists(fx.store.layout().MergeLockPath("m1")), "Merge lock released");
  }

  void TestIncompleteUploadIsRefused() {
    Fixture fx("uv_merge_incomplete");
    fx.Upload("m2", 0, "A", 3);
    fx.Upload("m2", 2, "C", 3);

    auto err = ErrorOf([&] { fx.merger.Merge(Request("m2", 3)); });
    Check(err.domain == uv::ErrorDomain::State && err.code == uv::errors::state::kIncompleteUpload,
          "Missing index must refuse the merge");
    Check(fx.store.GetTask("m2")->status == TaskStatus::kUploading, "Refused merge leaves the task alone");
    Check(!std::filesystem::exists(fx.merged() / "out.txt"), "Refused merge writes nothing");

    Check(ErrorOf([&] { fx.merger.Merge(Request("ghost", 1)); }).domain == uv::ErrorDomain::NotFound,
          "Unknown task");
  }

  void TestDigestMismatchRemovesOutput() {
    Fixture fx("uv_merge_mismatch");
    fx.Upload("m3", 0, "AB", 1);

    auto request = Request("m3", 1);
    request.expected_md5 = uv::crypto::Md5Hex(std::string_view("something else"));
    auto err = ErrorOf([&] { fx.merger.Merge(request); });
    Check(err.domain == uv::ErrorDomain::Integrity, "Digest mismatch is an integrity error");
    Check(!std::filesystem::exists(fx.merged() / "out.txt"), "Mismatched output must be removed");
    Check(fx.store.GetTask("m3")->status == TaskStatus::kFailed, "Mismatch fails the task");
    Check(std::filesystem::exists(fx.store.layout().ChunkPath("m3", 0)), "Chunks are kept for a retry");
  }

  void TestConcurrentMergeConflicts() {
    Fixture fx("uv_merge_conflict");
    fx.Upload("m4", 0, "A", 1);

    LockFile held(fx.store.layout().MergeLockPath("m4"));
    Check(held.TryAcquire(), "Test must hold the merge lock");
    auto err = ErrorOf([&] { fx.merger.Merge(Request("m4", 1)); });
    Check(err.domain == uv::ErrorDomain::Conflict && err.code == uv::errors::conflict::kMergeInProgress,
          "Second merge must report a conflict");
    Check(fx.store.GetTask("m4")->status == TaskStatus::kCompleted, "Conflict does not fail the task");
    held.Release();

    fx.merger.Merge(Request("m4", 1));
    Check(ReadText(fx.merged() / "out.txt") == "A", "Merge succeeds once the lock is free");
  }

  void TestMissingArtifactIsReported() {
    Fixture fx("uv_merge_missing");
    fx.Upload("m5", 0, "A", 2);
    fx.Upload("m5", 1, "B", 2);
    std::filesystem::remove(fx.store.layout().ChunkPath("m5", 1));

    auto err = ErrorOf([&] { fx.merger.Merge(Request("m5", 2)); });
    Check(err.domain == uv::ErrorDomain::Integrity && err.code == uv::errors::integrity::kMissingChunk,
          "Missing artifact is an integrity error");
    Check(std::string(err.what()).find("000001.part") != std::string::npos, "Error names the missing chunk");
    Check(!std::filesystem::exists(fx.merged() / "out.txt"), "Nothing is published");
  }

  void TestTraversalIsRejected() {
    Fixture fx("uv_merge_traversal");
    fx.Upload("m6", 0, "A", 1);

    auto err = ErrorOf([&] { fx.merger.Merge(Request("m6", 1, "../escape.txt")); });
    Check(err.domain == uv::ErrorDomain::Validation && err.code == uv::errors::validation::kPathTraversal,
          "Parent segments are rejected");
    Check(!std::filesystem::exists(fx.dir.path() / "escape.txt"), "Nothing escapes the merged root");
    Check(fx.store.GetTask("m6")->status == TaskStatus::kCompleted, "Rejected destination leaves the task alone");

    const std::filesystem::path root("/srv/merged");
    Check(ErrorOf([&] { ResolveMergeDestination(root, "x", "/etc/passwd"); }).code ==
              uv::errors::validation::kPathTraversal,
          "Absolute paths are rejected");
    Check(ErrorOf([&] { ResolveMergeDestination(root, "a/../../b", ""); }).domain == uv::ErrorDomain::Validation,
          "File names may not carry directories");
    Check(ResolveMergeDestination(root, "x.txt", "") == root / "x.txt", "Bare name lands at the root");
    Check(ResolveMergeDestination(root, "x.txt", "a/./b/y.txt") == root / "a" / "b" / "y.txt",
          "Relative path is normalised");
  }

  void TestCrashBeforeRenameKeepsPreviousFile() {
    Fixture fx("uv_merge_crash");
    fx.Upload("m7", 0, "NEW", 1);
    WriteText(fx.merged() / "out.txt", "OLD");

    uv::orchestrator::AtomicReplaceHooks hooks;
    hooks.before_rename = [](const std::filesystem::path&, const std::filesystem::path&) {
      throw std::runtime_error("simulated crash");
    };
    fx.merger.set_writer_hooks(hooks);

    auto err = ErrorOf([&] { fx.merger.Merge(Request("m7", 1)); });
    (void)err;
    Check(ReadText(fx.merged() / "out.txt") == "OLD", "Interrupted merge must keep the previous file");
    Check(CountEntries(fx.merged()) == 1, "Interrupted merge leaves no staging file");
    Check(fx.store.GetTask("m7")->status == TaskStatus::kFailed, "Interrupted merge fails the task");

    fx.merger.set_writer_hooks({});
    fx.store.ResumeTask("m7");
    fx.merger.Merge(Request("m7", 1));
    Check(ReadText(fx.merged() / "out.txt") == "NEW", "Retried merge publishes the new file");
  }

  void TestParallelChunkUploadsThenMerge() {
    Fixture fx("uv_merge_parallel");
    constexpr int kChunks = 24;
    std::vector<std::string> payloads;
    std::string expected;
    for (int i = 0; i < kChunks; ++i) {
      payloads.push_back(std::string(1, static_cast<char>('a' + i)) + std::to_string(i));
      expected += payloads.back();
    }

    std::vector<std::thread> uploaders;
    for (int t = 0; t < 4; ++t) {
      uploaders.emplace_back([&, t]() {
        for (int i = kChunks - 1 - t; i >= 0; i -= 4) {
          fx.Upload("par", i, payloads[i], kChunks);
        }
      });
    }
    for (auto& uploader : uploaders) {
      uploader.join();
    }

    Check(fx.store.GetUploadedChunks("par").size() == static_cast<size_t>(kChunks), "Every parallel chunk recorded");
    auto request = Request("par", kChunks);
    request.expected_md5 = uv::crypto::Md5Hex(std::string_view(expected));
    auto result = fx.merger.Merge(request);
    Check(ReadText(result.file_path) == expected, "Parallel uploads merge in index order");
    Check(fx.store.GetTask("par")->status == TaskStatus::kCompleted, "Merged task completed");
    fx.cleanup.WaitIdle();
  }

  void TestCancelledMergeLeavesTaskUntouched() {
    Fixture fx("uv_merge_cancel");
    fx.Upload("mc", 0, "AB", 2);
    fx.Upload("mc", 1, "CD", 2);

    CancellationToken cancel;
    AtomicReplaceHooks hooks;
    hooks.before_rename = [&cancel](const std::filesystem::path&, const std::filesystem::path&) {
      cancel.Cancel();
      throw uv::Error{uv::ErrorDomain::IO, EAGAIN, "device busy", EAGAIN, uv::Retryability::kTransient};
    };
    fx.merger.set_writer_hooks(hooks);

    auto err = ErrorOf([&] { fx.merger.Merge(Request("mc", 2), &cancel); });
    Check(err.domain == uv::ErrorDomain::Cancelled, "Cancellation during the retry wait surfaces as Cancelled");
    Check(fx.store.GetTask("mc")->status != TaskStatus::kFailed, "Cancelled merge does not fail the task");
    Check(!std::filesystem::exists(fx.merged() / "out.txt"), "Cancelled merge publishes nothing");
    Check(std::filesystem::exists(fx.store.layout().ChunkPath("mc", 1)), "Chunks survive a cancelled merge");
    Check(!std::filesystem::exists(fx.store.layout().MergeLockPath("mc")), "Merge lock released on cancellation");

    fx.merger.set_writer_hooks({});
    fx.merger.Merge(Request("mc", 2));
    Check(ReadText(fx.merged() / "out.txt") == "ABCD", "Merge succeeds after a cancelled attempt");
    fx.cleanup.WaitIdle();
  }

} // namespace

int main() {
  TestMergesInIndexOrder();
  TestIncompleteUploadIsRefused();
  TestDigestMismatchRemovesOutput();
  TestConcurrentMergeConflicts();
  TestMissingArtifactIsReported();
  TestTraversalIsRejected();
  TestCrashBeforeRenameKeepsPreviousFile();
  TestParallelChunkUploadsThenMerge();
  TestCancelledMergeLeavesTaskUntouched();
  std::cout << "merge tests ok\n";
  return 0;
}
