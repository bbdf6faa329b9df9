#pragma once

#include "margin/domain/position_types.hpp"
#include "margin/events/event_types.hpp"

#include <cstdint>
#include <string>

namespace margin {

// -----------------------------------------------------------------------------
// RiskAlertEvent — structured internal defect report
// -----------------------------------------------------------------------------
//
// @brief  Published by the LiquidationMonitor when it meets a position whose
//         snapshot the margin math refuses (zero size, non-positive
//         collateral, non-positive price).
//
// @details
// Such a snapshot means an upstream invariant was broken. The monitor
// quarantines the position (it is never evaluated again) and reports it
// through this event instead of throwing, so the sweep over the other,
// healthy positions continues.
//
// Thread model:
//   Published on the monitor loop thread. Forwarded to the IPC telemetry
//   queue as "risk_alert".
// -----------------------------------------------------------------------------
struct RiskAlertEvent {
  domain::PositionId position_id{0};
  domain::OwnerId owner;
  std::string pair;
  std::string reason;        // e.g. "zero_size", "non_positive_collateral"
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

// -----------------------------------------------------------------------------
// LiquidationWarningEvent
// -----------------------------------------------------------------------------
// Published when an open position moves up into the Warning or Critical risk
// zone, once per zone entry, for owners with liquidation warnings enabled.
// -----------------------------------------------------------------------------
struct LiquidationWarningEvent {
  domain::PositionId position_id{0};
  domain::OwnerId owner;
  std::string pair;
  double mark_price{0.0};
  double liquidation_price{0.0};
  double risk_percent{0.0};
  domain::RiskZone zone{domain::RiskZone::Warning};
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

}  // namespace margin
