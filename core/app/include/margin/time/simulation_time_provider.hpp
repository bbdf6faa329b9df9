#pragma once

#include "margin/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>

namespace margin {

// -----------------------------------------------------------------------------
// SimulationTimeProvider — externally-driven clock
// -----------------------------------------------------------------------------
//
// @brief  ITimeProvider whose "current time" is set explicitly with
//         advance_time() rather than read from the system clock.
//
// @details
// Tests construct one, advance it to a known instant, and assert on exact
// record timestamps. Replays advance it to each tick's oracle timestamp.
//
// Internal storage is a std::atomic<int64_t>: advance_time() is called from
// the feed side while ledger mutations on other threads read now_ms(), and
// a mutex would serialize every timestamp read for no gain.
//
// Thread model:
//   advance_time() from any thread (intended single writer).
//   now_ms() from any thread.
// -----------------------------------------------------------------------------
class SimulationTimeProvider final : public ITimeProvider {
 public:
  SimulationTimeProvider() = default;
  explicit SimulationTimeProvider(std::int64_t start_ms)
      : current_time_ms_(start_ms) {}

  // Returns the last value passed to advance_time(), or the start value.
  std::int64_t now_ms() const override;

  // Monotonicity is the caller's responsibility.
  void advance_time(std::int64_t new_time_ms);

 private:
  std::atomic<std::int64_t> current_time_ms_{0};
};

}  // namespace margin
