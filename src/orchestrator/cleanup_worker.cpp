#include "uv/orchestrator/cleanup_worker.h"

#include <exception>
#include <utility>

#include "uv/orchestrator/event_bus.h"

namespace uv::orchestrator {
namespace {

void ReportJob(EventSeverity severity, const char* event_id, std::string message, const std::string& label,
               std::string reason = {}) {
  Event event;
  event.category = EventCategory::kDiagnostics;
  event.severity = severity;
  event.event_id = event_id;
  event.message = std::move(message);
  event.fields.emplace_back("job", label);
  if (!reason.empty()) {
    event.fields.emplace_back("reason", std::move(reason));
  }
  EventBus::Instance().Publish(event);
}

}  // namespace

CleanupWorker::CleanupWorker(size_t workers, size_t queue_capacity)
    : capacity_(queue_capacity == 0 ? 1 : queue_capacity) {
  if (workers == 0) {
    workers = 1;
  }
  threads_.reserve(workers);
  for (size_t i = 0; i < workers; ++i) {
    threads_.emplace_back([this]() { WorkerLoop(); });
  }
}

CleanupWorker::~CleanupWorker() { Shutdown(true); }

bool CleanupWorker::Submit(std::string label, Job job) {
  {
    std::lock_guard<std::mutex> guard(mutex_);
    if (!stopping_ && queue_.size() < capacity_) {
      queue_.push_back(Task{std::move(label), std::move(job)});
      work_cv_.notify_one();
      return true;
    }
    ++rejected_;
  }
  ReportJob(EventSeverity::kWarning, "cleanup_rejected", "Background job rejected", label,
            "queue full or worker stopped");
  return false;
}

void CleanupWorker::Shutdown(bool drain) {
  std::vector<std::thread> threads;
  {
    std::lock_guard<std::mutex> guard(mutex_);
    stopping_ = true;
    if (!drain) {
      discard_ = true;
      queue_.clear();
      idle_cv_.notify_all();
    }
    threads.swap(threads_);
  }
  work_cv_.notify_all();
  for (auto& thread : threads) {
    if (thread.joinable()) {
      thread.join();
    }
  }
}

void CleanupWorker::WaitIdle() {
  std::unique_lock<std::mutex> lock(mutex_);
  idle_cv_.wait(lock, [this]() { return queue_.empty() && running_ == 0; });
}

size_t CleanupWorker::pending() const {
  std::lock_guard<std::mutex> guard(mutex_);
  return queue_.size();
}

uint64_t CleanupWorker::completed() const {
  std::lock_guard<std::mutex> guard(mutex_);
  return completed_;
}

uint64_t CleanupWorker::failed() const {
  std::lock_guard<std::mutex> guard(mutex_);
  return failed_;
}

uint64_t CleanupWorker::rejected() const {
  std::lock_guard<std::mutex> guard(mutex_);
  return rejected_;
}

void CleanupWorker::WorkerLoop() {
  std::unique_lock<std::mutex> lock(mutex_);
  for (;;) {
    work_cv_.wait(lock, [this]() { return stopping_ || !queue_.empty(); });
    if (queue_.empty() || discard_) {
      if (stopping_) {
        break;
      }
      continue;
    }

    Task task = std::move(queue_.front());
    queue_.pop_front();
    ++running_;
    lock.unlock();
    RunTask(task);
    lock.lock();
    --running_;
    if (queue_.empty() && running_ == 0) {
      idle_cv_.notify_all();
    }
  }
}

void CleanupWorker::RunTask(Task& task) {
  bool ok = false;
  std::string reason;
  try {
    task.job();
    ok = true;
  } catch (const std::exception& ex) {
    reason = ex.what();
  } catch (...) {
    // Background failures are reported, never propagated to the worker thread.
    reason = "non-standard exception";
  }
  {
    std::lock_guard<std::mutex> guard(mutex_);
    if (ok) {
      ++completed_;
    } else {
      ++failed_;
    }
  }
  if (ok) {
    ReportJob(EventSeverity::kDebug, "cleanup_completed", "Background job finished", task.label);
  } else {
    ReportJob(EventSeverity::kWarning, "cleanup_failed", "Background job failed", task.label, std::move(reason));
  }
}

}  // namespace uv::orchestrator
