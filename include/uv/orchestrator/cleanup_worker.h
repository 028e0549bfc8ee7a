#pragma once

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace uv::orchestrator {

// Fixed-size pool for detached background work such as removing chunk
// artifacts after a merge. Jobs never run on the submitting thread; when the
// queue is full the job is rejected and logged. Failures are logged and never
// reach the submitter.
class CleanupWorker {
public:
  using Job = std::function<void()>;

  static constexpr size_t kDefaultQueueCapacity = 256;

  explicit CleanupWorker(size_t workers, size_t queue_capacity = kDefaultQueueCapacity);
  CleanupWorker(const CleanupWorker&) = delete;
  CleanupWorker& operator=(const CleanupWorker&) = delete;
  ~CleanupWorker();

  // Returns false when the pool is stopped or the queue is at capacity.
  [[nodiscard]] bool Submit(std::string label, Job job);

  // Stops accepting work. With `drain` the queued jobs still run, otherwise
  // they are discarded. Joins every worker thread. Idempotent.
  void Shutdown(bool drain = true);

  // Blocks until the queue is empty and no job is running.
  void WaitIdle();

  [[nodiscard]] size_t pending() const;
  [[nodiscard]] uint64_t completed() const;
  [[nodiscard]] uint64_t failed() const;
  [[nodiscard]] uint64_t rejected() const;

private:
  struct Task {
    std::string label;
    Job job;
  };

  void WorkerLoop();
  void RunTask(Task& task);

  const size_t capacity_;
  mutable std::mutex mutex_;
  std::condition_variable work_cv_;
  std::condition_variable idle_cv_;
  std::deque<Task> queue_;
  std::vector<std::thread> threads_;
  bool stopping_{false};
  bool discard_{false};
  size_t running_{0};
  uint64_t completed_{0};
  uint64_t failed_{0};
  uint64_t rejected_{0};
};

}  // namespace uv::orchestrator
