#pragma once

#include "margin/domain/position_types.hpp"
#include "margin/eventbus/event_bus.hpp"
#include "margin/events/position_update_event.hpp"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace margin {

// -----------------------------------------------------------------------------
// PositionIndex
// -----------------------------------------------------------------------------
// Responsibility: Answers "which open positions trade this pair" and "which
// owners hold a cross position on this pair" without scanning the ledger.
//
// Why in architecture: The LiquidationMonitor evaluates only what a tick can
// affect. The index is fed by PositionUpdateEvents, so the ledger stays
// unaware of it.
//
// Updates carrying a version lower than the one already indexed are ignored
// (events from different committing threads may arrive out of order). A
// terminal update removes the position, and its id is remembered in a
// FIFO window of the last `retired_window` retirements so that a delayed
// non-terminal update cannot bring it back. Ids older than the window are
// forgotten.
//
// Thread model: The subscription callback runs on whichever thread committed
// the mutation; queries run on the monitor loop thread. A shared_mutex
// guards the maps.
// -----------------------------------------------------------------------------
class PositionIndex {
 public:
  static constexpr std::size_t kDefaultRetiredWindow = 4096;

  explicit PositionIndex(EventBus& bus,
                         std::size_t retired_window = kDefaultRetiredWindow);
  ~PositionIndex();

  PositionIndex(const PositionIndex&) = delete;
  PositionIndex& operator=(const PositionIndex&) = delete;

  // Open position ids on `pair` (any mode), ascending.
  std::vector<domain::PositionId> positionsForPair(
      const std::string& pair) const;

  // Owners with at least one open cross position on `pair`, sorted.
  std::vector<domain::OwnerId> crossOwnersForPair(
      const std::string& pair) const;

  // Every open cross position of `owner`, ascending.
  std::vector<domain::PositionId> crossPositionsForOwner(
      const domain::OwnerId& owner) const;

  std::size_t size() const;
  std::size_t retiredCount() const;

 private:
  struct Entry {
    std::string pair;
    domain::OwnerId owner;
    domain::MarginMode mode{domain::MarginMode::Isolated};
    std::uint64_t version{0};
  };

  void onUpdate(const PositionUpdateEvent& event);

  EventBus& bus_;
  EventBus::SubscriptionId subscription_{0};

  mutable std::shared_mutex mutex_;
  std::unordered_map<domain::PositionId, Entry> entries_;
  std::size_t retired_window_;
  std::unordered_set<domain::PositionId> retired_;
  std::deque<domain::PositionId> retired_order_;
};

}  // namespace margin
