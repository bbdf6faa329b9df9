#pragma once

#include <cstdint>
#include <string>

namespace margin {
namespace domain {

// -----------------------------------------------------------------------------
// Identifiers
// -----------------------------------------------------------------------------
// PositionId and ReservationId are plain integer aliases: cheap to copy,
// hashable, and self-documenting at call sites. 0 is never issued and means
// "unset". OwnerId is the account identity handed to us by the surrounding
// platform (wallet address or user id); the engine never interprets it.
// -----------------------------------------------------------------------------
using PositionId = std::uint64_t;
using ReservationId = std::uint64_t;
using OwnerId = std::string;

// -----------------------------------------------------------------------------
// Side
// -----------------------------------------------------------------------------
// Direction of the leveraged exposure. Long profits when the mark rises,
// short profits when it falls.
// -----------------------------------------------------------------------------
enum class Side {
  Long,
  Short,
};

// -----------------------------------------------------------------------------
// MarginMode
// -----------------------------------------------------------------------------
// Isolated: the position's collateral is its own pool; losses cannot draw on
//           any other position.
// Cross:    every cross position of one owner shares one pool, and margin
//           health is judged on the owner's aggregate.
// -----------------------------------------------------------------------------
enum class MarginMode {
  Isolated,
  Cross,
};

// -----------------------------------------------------------------------------
// PositionStatus — position lifecycle
// -----------------------------------------------------------------------------
//
//   Open ──(manual close / SL / TP)──> Closed
//     │
//     └──(liquidate)───────────────> Liquidated
//
// Terminal states: Closed, Liquidated. A terminal position is immutable
// history; every mutating ledger operation rejects it with PositionNotOpen.
// -----------------------------------------------------------------------------
enum class PositionStatus {
  Open,
  Closed,
  Liquidated,
};

// Why a position left the Open state through close().
enum class CloseReason {
  Manual,   // Owner-initiated close
  Trigger,  // Stop-loss or take-profit crossed by the mark price
};

// How a liquidation was initiated. Recorded verbatim in LiquidationRecord.
enum class LiquidationType {
  Auto,    // LiquidationMonitor detected the maintenance breach
  Forced,  // Operator command through the IPC server
  Manual,  // Owner surrendered the position at a given mark
};

// How close a position is to its liquidation price, bucketed from the
// risk percent (see MarginCalculator::riskZone).
enum class RiskZone {
  Safe,
  Moderate,
  Warning,
  Critical,
};

inline const char* toString(Side s) {
  switch (s) {
    case Side::Long:  return "long";
    case Side::Short: return "short";
  }
  return "unknown";
}

inline const char* toString(MarginMode m) {
  switch (m) {
    case MarginMode::Isolated: return "isolated";
    case MarginMode::Cross:    return "cross";
  }
  return "unknown";
}

inline const char* toString(PositionStatus s) {
  switch (s) {
    case PositionStatus::Open:       return "open";
    case PositionStatus::Closed:     return "closed";
    case PositionStatus::Liquidated: return "liquidated";
  }
  return "unknown";
}

inline const char* toString(CloseReason r) {
  switch (r) {
    case CloseReason::Manual:  return "manual";
    case CloseReason::Trigger: return "trigger";
  }
  return "unknown";
}

inline const char* toString(LiquidationType t) {
  switch (t) {
    case LiquidationType::Auto:   return "auto";
    case LiquidationType::Forced: return "forced";
    case LiquidationType::Manual: return "manual";
  }
  return "unknown";
}

inline const char* toString(RiskZone z) {
  switch (z) {
    case RiskZone::Safe:     return "safe";
    case RiskZone::Moderate: return "moderate";
    case RiskZone::Warning:  return "warning";
    case RiskZone::Critical: return "critical";
  }
  return "unknown";
}

// Direction multiplier used by every PnL formula: +1 long, -1 short.
inline double directionSign(Side s) { return s == Side::Long ? 1.0 : -1.0; }

}  // namespace domain
}  // namespace margin
