#pragma once

#include "margin/domain/position.hpp"
#include "margin/events/event_types.hpp"

#include <cstdint>

namespace margin {

// What happened to the position to produce this update.
enum class PositionChange {
  Opened,
  CollateralAdjusted,
  Reduced,
  TriggersSet,
  Closed,
  Liquidated,
  Repriced,    // Cross sibling's liquidation price refreshed, version unchanged
  Hydrated,    // Restored during warm-up
};

inline const char* toString(PositionChange c) {
  switch (c) {
    case PositionChange::Opened:             return "opened";
    case PositionChange::CollateralAdjusted: return "collateral_adjusted";
    case PositionChange::Reduced:            return "reduced";
    case PositionChange::TriggersSet:        return "triggers_set";
    case PositionChange::Closed:             return "closed";
    case PositionChange::Liquidated:         return "liquidated";
    case PositionChange::Repriced:           return "repriced";
    case PositionChange::Hydrated:           return "hydrated";
  }
  return "unknown";
}

// -----------------------------------------------------------------------------
// PositionUpdateEvent
// -----------------------------------------------------------------------------
//
// @brief  Carries an immutable snapshot of a Position after the
//         PositionLedger committed a change to it.
//
// @details
// Published on the engine's EventBus after the commit, with no ledger lock
// held. Subscribers:
//   - PositionIndex keeps its pair -> positions and owner -> cross group
//     maps current from these events.
//   - IpcServer forwards them as "position_update" telemetry.
//
// The position field is a full copy. It remains valid after publication
// regardless of what happens to the ledger's internal table.
//
// Thread model:
//   Published on whichever thread committed the mutation: the IPC thread
//   for user requests, a WorkerPool thread for monitor submissions.
//   Subscribers must therefore be thread-safe.
//
// Ownership:
//   Self-contained value type.
// -----------------------------------------------------------------------------
struct PositionUpdateEvent {
  domain::Position position;
  PositionChange change{PositionChange::Opened};
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

}  // namespace margin
