#include "uv/storage/task_store.h"

#include <iostream>
#include <string>
#include <vector>

#include "test_support.h"
#include "uv/error.h"

namespace {

  using uv::storage::AggregateFolderStatus;
  using uv::storage::ChunkInfo;
  using uv::storage::ChunkStatus;
  using uv::storage::FileDescriptor;
  using uv::storage::PathLayout;
  using uv::storage::TaskStatus;
  using uv::storage::TaskStore;
  using uv::testing::Check;
  using uv::testing::TempDir;

  std::vector<FileDescriptor> ThreeFiles() {
    return {FileDescriptor{"", "a.txt", "docs/a.txt", 100, 1}, FileDescriptor{"", "b.txt", "docs/b.txt", 200, 2},
            FileDescriptor{"", "c.txt", "c.txt", 300, 1}};
  }

  void CompleteChunk(TaskStore& store, const std::string& id, int index, int64_t size) {
    ChunkInfo chunk;
    chunk.index = index;
    chunk.size = size;
    chunk.status = ChunkStatus::kCompleted;
    store.UpdateChunk(id, chunk);
  }

  void TestAggregateStatus() {
    using S = TaskStatus;
    Check(AggregateFolderStatus({}, S::kPaused) == S::kPaused, "No children keeps the stored status");
    Check(AggregateFolderStatus({S::kCompleted, S::kCompleted}, S::kUploading) == S::kCompleted, "All completed");
    Check(AggregateFolderStatus({S::kFailed, S::kPartialFailed}, S::kUploading) == S::kFailed, "All failed");
    Check(AggregateFolderStatus({S::kCompleted, S::kFailed}, S::kUploading) == S::kPartialFailed,
          "Mixed terminal outcome");
    Check(AggregateFolderStatus({S::kPaused, S::kUploading}, S::kPaused) == S::kPaused, "Paused parent stays paused");
    Check(AggregateFolderStatus({S::kPending, S::kCompleted}, S::kPending) == S::kUploading,
          "Any progress means uploading");
    Check(AggregateFolderStatus({S::kPending, S::kPaused}, S::kPending) == S::kPending, "No progress means pending");
  }

  void TestCreateFolderAndSummary() {
    TempDir dir("uv_folder_create");
    TaskStore store{PathLayout(dir.path())};
    store.Load();

    auto folder = store.CreateFolderTask("docs", ThreeFiles());
    Check(folder.is_folder() && folder.status == TaskStatus::kPending, "Folder starts pending");
    Check(folder.file_id.rfind("folder_", 0) == 0, "Folder ids carry the folder_ prefix");
    Check(folder.folder()->sub_tasks.size() == 3, "One child per file");

    auto children = store.GetSubTasks(folder.file_id);
    Check(children.size() == 3, "Children are listed");
    Check(children[0].file_id == folder.file_id + "/docs/a.txt", "Child id derives from the relative path");
    Check(children[0].is_sub_task() && children[0].file()->parent_task_id == folder.file_id,
          "Child links to its parent");
    Check(store.GetMainTasks().size() == 1, "Children are not main tasks");

    CompleteChunk(store, children[0].file_id, 0, 100);
    CompleteChunk(store, children[1].file_id, 0, 100);
    auto summary = store.GetFolderTaskSummary(folder.file_id);
    Check(summary.total_files == 3 && summary.completed_files == 1, "Completed file counted");
    Check(summary.total_size == 600, "Total size sums the children");
    Check(summary.uploaded_size == 200, "Uploaded bytes: 100 complete plus half of 200");
    Check(summary.completion_rate > 33.3 && summary.completion_rate < 33.4, "Completion by bytes");
    Check(summary.status == TaskStatus::kUploading, "Progress moves the folder to uploading");
    Check(store.GetTask(folder.file_id)->status == TaskStatus::kUploading, "Parent status is reconciled on write");

    store.MarkFailed(children[2].file_id, "gone");
    CompleteChunk(store, children[1].file_id, 1, 100);
    Check(store.GetTask(folder.file_id)->status == TaskStatus::kPartialFailed, "Mixed outcome is partial failure");
    Check(store.GetFolderTaskSummary(folder.file_id).failed_files == 1, "Failed file counted");

    bool not_folder = false;
    try {
      (void)store.GetFolderTaskSummary(children[0].file_id);
    } catch (const uv::Error& err) {
      not_folder = err.domain == uv::ErrorDomain::State;
    }
    Check(not_folder, "Summary of a file task is refused");
  }

  void TestCreateFolderValidation() {
    TempDir dir("uv_folder_validate");
    TaskStore store{PathLayout(dir.path())};
    store.Load();

    auto expect_validation = [&](std::string_view name, const std::vector<FileDescriptor>& files) {
      try {
        store.CreateFolderTask(name, files);
      } catch (const uv::Error& err) {
        return err.domain == uv::ErrorDomain::Validation;
      }
      return false;
    };
    Check(expect_validation("", ThreeFiles()), "Empty folder name");
    Check(expect_validation("docs", {}), "Empty file list");
    Check(expect_validation("docs", {FileDescriptor{"", "a.txt", "x/a.txt", 1, 1},
                                     FileDescriptor{"", "a.txt", "x/a.txt", 1, 1}}),
          "Duplicate destinations");
    Check(store.GetAllTasks().empty(), "Rejected folders leave nothing behind");
  }

  void TestPauseResumeCascade() {
    TempDir dir("uv_folder_cascade");
    TaskStore store{PathLayout(dir.path())};
    store.Load();

    auto folder = store.CreateFolderTask("docs", ThreeFiles());
    auto children = store.GetSubTasks(folder.file_id);
    CompleteChunk(store, children[0].file_id, 0, 100);
    CompleteChunk(store, children[1].file_id, 0, 100);

    store.PauseTask(folder.file_id);
    auto paused = store.GetSubTasks(folder.file_id);
    Check(store.GetTask(folder.file_id)->status == TaskStatus::kPaused, "Folder paused");
    Check(paused[0].status == TaskStatus::kCompleted, "Completed child is not paused");
    Check(paused[1].status == TaskStatus::kPaused && paused[2].status == TaskStatus::kPaused,
          "Active and pending children are paused");

    store.ResumeTask(folder.file_id);
    auto folder_task = store.GetTask(folder.file_id);
    Check(folder_task->status == TaskStatus::kUploading, "Folder resumes uploading");
    Check(folder_task->retry_count == 1, "Folder retry count increments");
    auto resumed = store.GetSubTasks(folder.file_id);
    Check(resumed[0].status == TaskStatus::kCompleted, "Completed child stays completed");
    Check(resumed[1].status == TaskStatus::kUploading && resumed[1].retry_count == 1, "Paused child resumes");
    Check(resumed[2].status == TaskStatus::kUploading && resumed[2].retry_count == 1, "Pending child resumes");
  }

  void TestDeleteCascadeAndChildRemoval() {
    TempDir dir("uv_folder_delete");
    TaskStore store{PathLayout(dir.path())};
    store.Load();

    auto folder = store.CreateFolderTask("docs", ThreeFiles());
    auto children = store.GetSubTasks(folder.file_id);

    store.DeleteTask(children[2].file_id);
    Check(store.GetTask(folder.file_id)->folder()->sub_tasks.size() == 2, "Deleted child leaves the parent list");

    store.DeleteTask(folder.file_id);
    Check(store.GetAllTasks().empty(), "Folder delete takes the children with it");

    TaskStore reloaded{PathLayout(dir.path())};
    Check(reloaded.Load() == 0, "No records survive the cascade");
  }

} // namespace

int main() {
  TestAggregateStatus();
  TestCreateFolderAndSummary();
  TestCreateFolderValidation();
  TestPauseResumeCascade();
  TestDeleteCascadeAndChildRemoval();
  std::cout << "folder task tests ok\n";
  return 0;
}
