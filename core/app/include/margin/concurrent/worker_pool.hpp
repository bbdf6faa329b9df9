#pragma once

#include "margin/concurrent/thread_safe_queue.hpp"

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace margin {

// -----------------------------------------------------------------------------
// WorkerPool — fixed set of threads draining one task queue
// -----------------------------------------------------------------------------
//
// @brief  Bounded fan-out for liquidation and trigger submissions.
//
// @details
// When a price gap pushes hundreds of positions through maintenance on one
// tick, the LiquidationMonitor must not spawn a thread per position, nor
// run them one after another on the monitor loop. It posts one task per
// submission here; the pool runs at most thread_count of them at once.
// Submissions against different positions proceed in parallel; the
// ExecutionCoordinator serializes those that touch the same position.
//
// waitIdle() blocks until every task posted so far has finished. The
// monitor uses it in tests and during shutdown; the hot path never waits.
//
// Thread model:
//   post() and waitIdle() from any thread. Tasks run on pool threads.
//   A task must not call waitIdle() (it would wait on itself).
//
// Ownership:
//   Owns its threads. The destructor closes the queue, lets the workers
//   finish the backlog, and joins them.
// -----------------------------------------------------------------------------
class WorkerPool {
 public:
  using Task = std::function<void()>;

  explicit WorkerPool(std::size_t thread_count);
  ~WorkerPool();

  WorkerPool(const WorkerPool&) = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;
  WorkerPool(WorkerPool&&) = delete;
  WorkerPool& operator=(WorkerPool&&) = delete;

  // -------------------------------------------------------------------------
  // post(task)
  // -------------------------------------------------------------------------
  // Enqueues a task. Returns false (task not run) after shutdown().
  // -------------------------------------------------------------------------
  bool post(Task task);

  // Blocks until no task is queued or running.
  void waitIdle();

  // Stops accepting tasks, drains the backlog, joins the workers. Idempotent.
  void shutdown();

  std::size_t threadCount() const { return workers_.size(); }

 private:
  void workerLoop();

  ThreadSafeQueue<Task> tasks_;
  std::vector<std::thread> workers_;

  std::mutex idle_mutex_;
  std::condition_variable idle_cv_;
  std::size_t pending_{0};   // Posted but not yet finished
};

}  // namespace margin
