#pragma once

#include "margin/domain/history_records.hpp"
#include "margin/events/event_types.hpp"

#include <cstdint>

namespace margin {

// -----------------------------------------------------------------------------
// LiquidationEvent
// -----------------------------------------------------------------------------
// Published by PositionLedger once a liquidation has been durably recorded
// and committed. Carries the same LiquidationRecord that went to the
// history journal, so telemetry consumers see exactly what was audited.
// -----------------------------------------------------------------------------
struct LiquidationEvent {
  domain::LiquidationRecord record;
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

}  // namespace margin
