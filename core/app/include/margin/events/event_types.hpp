#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace margin {

// -----------------------------------------------------------------------------
// Timestamp
// -----------------------------------------------------------------------------
// Wall-clock time carried by every event for ordering and auditing.
// -----------------------------------------------------------------------------
using Timestamp = std::chrono::system_clock::time_point;

// -----------------------------------------------------------------------------
// PriceTickEvent
// -----------------------------------------------------------------------------
// Responsibility: One mark-price observation from the Price Oracle.
//
// Why in architecture: The price feed thread decodes ticks from ZeroMQ and
// pushes them into the monitor loop's queue. The PriceFeedAdapter decides
// whether the tick is accepted (fresh, positive, known shape) before the
// LiquidationMonitor ever sees it.
//
// timestamp_ms is the oracle's own timestamp, not the local receive time:
// duplicate and out-of-order detection is done on it per symbol.
// -----------------------------------------------------------------------------
struct PriceTickEvent {
  std::string symbol;            // Raw or canonical pair, e.g. "eth-usdt"
  double price{0.0};             // Mark price
  std::int64_t timestamp_ms{0};  // Oracle epoch milliseconds
  std::uint64_t sequence_id{0};
};

}  // namespace margin
