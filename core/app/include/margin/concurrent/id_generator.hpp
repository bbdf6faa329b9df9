#pragma once

#include <atomic>
#include <cstdint>

namespace margin {

// -----------------------------------------------------------------------------
// IdGenerator — thread-safe, monotonically increasing id source
// -----------------------------------------------------------------------------
//
// @brief  Produces unique ids via an atomic counter. Used for position ids
//         and history record ids.
//
// @details
// The generator starts at 1 by default (0 is the "unset" sentinel for every
// id type in the engine). fetch_add with memory_order_relaxed is enough: the
// only requirement is uniqueness, no ordering against other variables.
//
// Position ids are minted concurrently by user open requests arriving on the
// IPC thread and by tests driving the coordinator from many threads, so the
// counter must be atomic.
//
// reseed() exists for the warm-up phase: after positions or records are
// restored, the generator is moved past the highest restored id so fresh ids
// never collide with restored ones.
//
// Ownership:
//   Owned by value by the component that mints the ids (PositionLedger,
//   JournalHistoryRecorder). Not a singleton.
// -----------------------------------------------------------------------------
class IdGenerator {
 public:
  explicit IdGenerator(std::uint64_t first = 1) : next_id_(first) {}

  // Non-copyable, non-movable: copying would create two sources producing
  // duplicate ids.
  IdGenerator(const IdGenerator&) = delete;
  IdGenerator& operator=(const IdGenerator&) = delete;
  IdGenerator(IdGenerator&&) = delete;
  IdGenerator& operator=(IdGenerator&&) = delete;

  // -------------------------------------------------------------------------
  // next_id()
  // -------------------------------------------------------------------------
  // @brief  Returns the next unique id.
  //
  // Thread-safety: Safe to call concurrently from any thread.
  // -------------------------------------------------------------------------
  std::uint64_t next_id() {
    return next_id_.fetch_add(1, std::memory_order_relaxed);
  }

  // -------------------------------------------------------------------------
  // reseed(seen_id)
  // -------------------------------------------------------------------------
  // @brief  Guarantees every future next_id() is greater than seen_id.
  //
  // @details
  // CAS loop so concurrent reseeds with different values keep the maximum.
  // -------------------------------------------------------------------------
  void reseed(std::uint64_t seen_id) {
    std::uint64_t current = next_id_.load(std::memory_order_relaxed);
    while (current <= seen_id &&
           !next_id_.compare_exchange_weak(current, seen_id + 1,
                                           std::memory_order_relaxed)) {
    }
  }

 private:
  std::atomic<std::uint64_t> next_id_;
};

}  // namespace margin
