#pragma once

#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

namespace margin {

// -----------------------------------------------------------------------------
// ThreadSafeQueue<T>
// -----------------------------------------------------------------------------
// Responsibility: A closable FIFO queue shared between producer and consumer
// threads. Provides a blocking pop() that returns std::nullopt once the queue
// has been closed and drained, and a non-blocking try_pop().
//
// Why in architecture: Every thread boundary in the engine is a queue. Price
// ticks travel from the feed thread to the monitor loop, liquidation and
// trigger submissions travel from the monitor to the WorkerPool, and
// telemetry travels from the ledger to the IPC thread. Each queue is an
// object owned by the component that drains it; nothing is global.
//
// Thread model: Safe for multiple producers and multiple consumers. All
// methods lock the internal mutex.
// -----------------------------------------------------------------------------
template <typename T>
class ThreadSafeQueue {
 public:
  ThreadSafeQueue() = default;

  // Non-copyable and non-movable: owns a mutex and a condition_variable.
  ThreadSafeQueue(const ThreadSafeQueue&) = delete;
  ThreadSafeQueue& operator=(const ThreadSafeQueue&) = delete;
  ThreadSafeQueue(ThreadSafeQueue&&) = delete;
  ThreadSafeQueue& operator=(ThreadSafeQueue&&) = delete;

  // -------------------------------------------------------------------------
  // push(value)
  // -------------------------------------------------------------------------
  // What: Appends one item and wakes one blocked consumer.
  // Returns false (and drops the item) if the queue has been closed, so a
  // producer racing a shutdown never strands work in a dead queue.
  // Thread-safety: Safe to call from any thread.
  // -------------------------------------------------------------------------
  bool push(T value) {
    {
      std::lock_guard lock(mutex_);
      if (closed_) {
        return false;
      }
      queue_.push_back(std::move(value));
    }
    // Notify outside the lock so the woken consumer does not immediately
    // block on the mutex we still hold.
    condition_.notify_one();
    return true;
  }

  // -------------------------------------------------------------------------
  // pop() — blocking
  // -------------------------------------------------------------------------
  // What: Removes and returns the front item, waiting while the queue is
  // empty. Returns std::nullopt only when the queue is closed AND empty;
  // items pushed before close() are still delivered.
  // Thread-safety: Safe to call from any thread. The wait predicate guards
  // against spurious wakeups.
  // -------------------------------------------------------------------------
  std::optional<T> pop() {
    std::unique_lock lock(mutex_);
    condition_.wait(lock, [this] { return closed_ || !queue_.empty(); });
    if (queue_.empty()) {
      return std::nullopt;
    }
    T value = std::move(queue_.front());
    queue_.pop_front();
    return value;
  }

  // -------------------------------------------------------------------------
  // try_pop() — non-blocking
  // -------------------------------------------------------------------------
  // What: Returns the front item if one is present, otherwise std::nullopt
  // immediately.
  // -------------------------------------------------------------------------
  std::optional<T> try_pop() {
    std::lock_guard lock(mutex_);
    if (queue_.empty()) {
      return std::nullopt;
    }
    T value = std::move(queue_.front());
    queue_.pop_front();
    return value;
  }

  // -------------------------------------------------------------------------
  // close()
  // -------------------------------------------------------------------------
  // What: Rejects further pushes and wakes every blocked consumer. Consumers
  // drain what is left, then pop() returns std::nullopt. Idempotent.
  // -------------------------------------------------------------------------
  void close() {
    {
      std::lock_guard lock(mutex_);
      closed_ = true;
    }
    condition_.notify_all();
  }

  bool closed() const {
    std::lock_guard lock(mutex_);
    return closed_;
  }

  // Snapshot only: another thread may push or pop right after the check.
  bool empty() const {
    std::lock_guard lock(mutex_);
    return queue_.empty();
  }

  std::size_t size() const {
    std::lock_guard lock(mutex_);
    return queue_.size();
  }

 private:
  mutable std::mutex mutex_;
  std::condition_variable condition_;
  std::deque<T> queue_;
  bool closed_{false};
};

}  // namespace margin
