#pragma once

#include "margin/time/i_time_provider.hpp"

namespace margin {

// -----------------------------------------------------------------------------
// LiveTimeProvider — wall-clock time implementation of ITimeProvider
// -----------------------------------------------------------------------------
// Used by the margin_engine executable. std::chrono::system_clock::now() is
// safe to call from any thread; no internal state.
// -----------------------------------------------------------------------------
class LiveTimeProvider final : public ITimeProvider {
 public:
  std::int64_t now_ms() const override;
};

}  // namespace margin
