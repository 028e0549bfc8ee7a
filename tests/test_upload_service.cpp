#include "uv/orchestrator/upload_service.h"

#include <chrono>
#include <filesystem>
#include <iostream>
#include <string>

#include <nlohmann/json.hpp>

#include "test_support.h"
#include "uv/common.h"
#include "uv/crypto/md5.h"
#include "uv/error.h"

namespace {

  using uv::orchestrator::ChunkRequest;
  using uv::orchestrator::MergeRequest;
  using uv::orchestrator::ServiceConfig;
  using uv::orchestrator::UploadService;
  using uv::storage::TaskStatus;
  using uv::testing::Check;
  using uv::testing::ReadText;
  using uv::testing::TempDir;
  using uv::testing::WriteText;
  using namespace std::chrono_literals;

  ServiceConfig ConfigFor(const TempDir& dir) {
    ServiceConfig config;
    config.upload_dir = dir.path() / "upload";
    config.merged_dir = dir.path() / "merged";
    config.log_dir = dir.path() / "logs";
    config.retry_max_attempts = 1;
    config.retry_initial_delay = 1ms;
    config.retry_max_delay = 2ms;
    config.cleanup_workers = 1;
    config.log_level = "debug";
    return config;
  }

  ChunkRequest Chunk(const std::string& id, int index, std::string_view payload, int total) {
    ChunkRequest request;
    request.file_id = id;
    request.index = index;
    request.data = uv::AsBytes(payload);
    request.total_chunks = total;
    request.file_name = "movie.bin";
    request.relative_path = "media/movie.bin";
    return request;
  }

  void TestUploadMergeAndStatus() {
    TempDir dir("uv_service_flow");
    UploadService service(ConfigFor(dir));
    service.Start(false);

    service.UploadChunk(Chunk("v1", 0, "he", 3));
    service.UploadChunk(Chunk("v1", 2, "lo", 3));
    auto status = service.Status("v1");
    Check(status.found && status.status == "uploading", "Partial upload reports uploading");
    Check(status.uploaded_chunks == std::vector<int>({0, 2}), "Uploaded indexes reported");
    Check(status.completion_rate > 66.6 && status.completion_rate < 66.7, "Completion by chunks");

    bool incomplete = false;
    try {
      MergeRequest early;
      early.file_id = "v1";
      early.file_name = "movie.bin";
      early.total_chunks = 3;
      service.Merge(early);
    } catch (const uv::Error& err) {
      incomplete = err.domain == uv::ErrorDomain::State;
    }
    Check(incomplete, "Merge before the last chunk is refused");

    service.UploadChunk(Chunk("v1", 1, "l", 3));
    MergeRequest merge;
    merge.file_id = "v1";
    merge.file_name = "movie.bin";
    merge.relative_path = "media/movie.bin";
    merge.total_chunks = 3;
    merge.expected_md5 = uv::crypto::Md5Hex(std::string_view("hello"));
    auto result = service.Merge(merge);
    Check(ReadText(dir.path() / "merged" / "media" / "movie.bin") == "hello", "Merged file content");
    Check(result.md5 == merge.expected_md5, "Merged digest");

    service.cleanup_worker().WaitIdle();
    auto done = service.Status("v1");
    Check(done.status == "completed" && done.file_md5 == result.md5, "Completed status carries the digest");

    nlohmann::json doc = done;
    Check(doc.at("uploaded_count") == 3 && doc.contains("updated_at"), "Status serialises for clients");
    service.Stop();
  }

  void TestStatusFallbackAndNotFound() {
    TempDir dir("uv_service_status");
    auto config = ConfigFor(dir);
    UploadService service(config);
    service.Start(false);

    auto missing = service.Status("nobody");
    Check(!missing.found && missing.status == "not_found", "Unknown id reports not_found");

    // Chunks on disk without a record, e.g. after losing the metadata directory.
    uv::storage::PathLayout layout(config.upload_dir);
    WriteText(layout.ChunkPath("orphan", 1), "b");
    WriteText(layout.ChunkPath("orphan", 0), "a");
    auto orphan = service.Status("orphan");
    Check(orphan.found && orphan.status == "uploading", "Artifacts without a record report uploading");
    Check(orphan.uploaded_chunks == std::vector<int>({0, 1}), "Artifacts are listed in index order");

    bool not_found = false;
    try {
      service.DeleteTask("nobody");
    } catch (const uv::Error& err) {
      not_found = err.domain == uv::ErrorDomain::NotFound;
    }
    Check(not_found, "Deleting an unknown task raises NotFound");

    not_found = false;
    try {
      (void)service.GetTask("nobody");
    } catch (const uv::Error& err) {
      not_found = err.domain == uv::ErrorDomain::NotFound;
    }
    Check(not_found, "Showing an unknown task raises NotFound");
  }

  void TestListingAndFolders() {
    TempDir dir("uv_service_list");
    UploadService service(ConfigFor(dir));
    service.Start(false);

    service.UploadChunk(Chunk("solo", 0, "x", 2));
    auto folder = service.CreateFolderTask(
        "album", {uv::storage::FileDescriptor{"", "1.jpg", "album/1.jpg", 1, 1},
                  uv::storage::FileDescriptor{"", "2.jpg", "album/2.jpg", 1, 1}});

    auto tasks = service.ListTasks();
    Check(tasks.size() == 2, "Main tasks are listed without folder children");
    for (const auto& view : tasks) {
      Check(view.task.is_folder() == view.summary.has_value(), "Folders carry a summary");
    }

    auto view = service.GetTask(folder.file_id);
    Check(view.sub_tasks.size() == 2 && view.summary->total_files == 2, "Folder view lists its children");
    nlohmann::json doc = view;
    Check(doc.contains("summary") && doc.at("sub_task_details").size() == 2, "Folder view serialises");

    auto child = service.SubTasks(folder.file_id).front();
    service.UploadChunk(Chunk(child.file_id, 0, "j", 1));
    service.store().MarkFailed("solo", "client gone");
    auto failed = service.ListFailed();
    Check(failed.size() == 1 && failed.front().file_id == "solo", "Failed tasks are listed");

    auto resumed = service.ResumeAllFailed();
    Check(resumed.size() == 1, "Failed task resumed");
    Check(service.Status("solo").retry_count == 1, "Resume counts a retry");

    service.PauseTask(folder.file_id);
    Check(service.FolderSummary(folder.file_id).status == TaskStatus::kPaused, "Folder paused");
    service.ResumeTask(folder.file_id);
    Check(service.Status(folder.file_id).status == "uploading", "Folder resumed");

    uv::storage::CleanupFilter filter;
    filter.status = TaskStatus::kUploading;
    auto removed = service.Cleanup(filter);
    Check(removed.size() == 2, "Filtered cleanup removes matching main tasks");
    Check(service.ListTasks().empty(), "Nothing left after cleanup");
    service.Stop();
    service.Stop();
  }

} // namespace

int main() {
  TestUploadMergeAndStatus();
  TestStatusFallbackAndNotFound();
  TestListingAndFolders();
  std::cout << "upload service tests ok\n";
  return 0;
}
