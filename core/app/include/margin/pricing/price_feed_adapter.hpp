#pragma once

#include "margin/events/event_types.hpp"
#include "margin/risk/margin_calculator.hpp"

#include <cstdint>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace margin {

// -----------------------------------------------------------------------------
// PriceFeedAdapter — per-symbol, timestamped mark prices
// -----------------------------------------------------------------------------
//
// @brief  Normalizes oracle ticks into canonical (pair, price, timestamp)
//         and holds the latest accepted mark per pair.
//
// @details
// The oracle is at-least-once: it may repeat a tick or deliver one late.
// ingest() keeps, per canonical pair, the timestamp of the last accepted
// tick and discards any tick whose timestamp is not strictly newer. It also
// discards ticks with an empty symbol or a non-positive price.
//
// This is the only home of "current price" in the engine. Readers never see
// a shared mutable price: latest() and marks() return copies, and those
// copies are what the LiquidationMonitor hands to the MarginCalculator.
//
// Symbol normalization: upper-case, with '-' and '_' turned into '/'.
// "eth-usdt", "ETH_USDT" and "ETH/USDT" are the same pair.
//
// Thread model:
//   ingest() is called on the monitor loop thread. latest() and marks() are
//   called from the IPC thread (open uses the latest mark as entry price)
//   and worker threads. A std::shared_mutex lets readers proceed together.
// -----------------------------------------------------------------------------
class PriceFeedAdapter {
 public:
  PriceFeedAdapter() = default;

  PriceFeedAdapter(const PriceFeedAdapter&) = delete;
  PriceFeedAdapter& operator=(const PriceFeedAdapter&) = delete;

  static std::string normalizeSymbol(const std::string& raw);

  // -------------------------------------------------------------------------
  // ingest(tick)
  // -------------------------------------------------------------------------
  // @brief  Accepts or discards one tick.
  //
  // @return The accepted tick with its symbol in canonical form, or
  //         std::nullopt if the tick was malformed, a duplicate, or older
  //         than the last accepted one for its pair.
  // -------------------------------------------------------------------------
  std::optional<PriceTickEvent> ingest(const PriceTickEvent& tick);

  std::optional<PriceTickEvent> latest(const std::string& pair) const;

  // Copy of the latest mark of every pair seen so far.
  MarkMap marks() const;

  std::uint64_t discardedCount() const;

 private:
  mutable std::shared_mutex mutex_;
  std::unordered_map<std::string, PriceTickEvent> latest_;
  std::uint64_t discarded_{0};
};

}  // namespace margin
