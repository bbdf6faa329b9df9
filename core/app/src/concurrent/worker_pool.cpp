#include "margin/concurrent/worker_pool.hpp"

#include <exception>
#include <iostream>

namespace margin {

WorkerPool::WorkerPool(std::size_t thread_count) {
  if (thread_count == 0) {
    thread_count = 1;
  }
  workers_.reserve(thread_count);
  for (std::size_t i = 0; i < thread_count; ++i) {
    workers_.emplace_back([this] { workerLoop(); });
  }
}

WorkerPool::~WorkerPool() { shutdown(); }

// -----------------------------------------------------------------------------
// post()
// -----------------------------------------------------------------------------
// pending_ is raised before the push so waitIdle() can never observe zero
// while a task is sitting in the queue.
// -----------------------------------------------------------------------------
bool WorkerPool::post(Task task) {
  {
    std::lock_guard lock(idle_mutex_);
    ++pending_;
  }

  if (!tasks_.push(std::move(task))) {
    std::lock_guard lock(idle_mutex_);
    --pending_;
    idle_cv_.notify_all();
    return false;
  }
  return true;
}

void WorkerPool::waitIdle() {
  std::unique_lock lock(idle_mutex_);
  idle_cv_.wait(lock, [this] { return pending_ == 0; });
}

void WorkerPool::shutdown() {
  tasks_.close();
  for (auto& worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
}

// -----------------------------------------------------------------------------
// workerLoop()
// -----------------------------------------------------------------------------
// A task that throws is logged and dropped; the worker keeps serving.
// -----------------------------------------------------------------------------
void WorkerPool::workerLoop() {
  while (std::optional<Task> task = tasks_.pop()) {
    try {
      (*task)();
    } catch (const std::exception& e) {
      std::cerr << "[WorkerPool] task failed: " << e.what() << "\n";
    }

    std::lock_guard lock(idle_mutex_);
    if (--pending_ == 0) {
      idle_cv_.notify_all();
    }
  }
}

}  // namespace margin
