#pragma once

#include "margin/domain/position_types.hpp"

#include <cstdint>
#include <string>

namespace margin {
namespace domain {

using RecordId = std::uint64_t;

// -----------------------------------------------------------------------------
// LiquidationRecord — immutable audit entry for one liquidation
// -----------------------------------------------------------------------------
//
// @brief  Snapshot of the position at the moment it was liquidated, plus the
//         loss and what was left of its collateral.
//
// @details
// Created exactly once per liquidation by PositionLedger and appended through
// IHistoryRecorder before the liquidation is committed. Never mutated.
//
//   loss_amount          = -(unrealized PnL at the trigger mark)
//                          + outstanding fees
//   remaining_collateral = collateral - loss_amount
//
// remaining_collateral is negative on a gap move (the loss exceeded the
// posted collateral). The exact shortfall is kept here; the wallet release
// for such a position is 0.
// -----------------------------------------------------------------------------
struct LiquidationRecord {
  RecordId id{0};
  PositionId position_id{0};
  OwnerId owner;
  std::string pair;
  Side side{Side::Long};
  int leverage{1};
  double entry_price{0.0};
  double liquidation_price{0.0};    // Stored liquidation price at trigger time
  double mark_price{0.0};           // Mark that triggered the liquidation
  double size{0.0};
  double collateral{0.0};
  double loss_amount{0.0};
  double remaining_collateral{0.0};
  double released_amount{0.0};      // What actually went back to the wallet
  MarginMode mode{MarginMode::Isolated};
  LiquidationType type{LiquidationType::Auto};
  std::int64_t liquidated_at_ms{0};
};

// -----------------------------------------------------------------------------
// ClosureRecord — immutable audit entry for one full close
// -----------------------------------------------------------------------------
// Appended on every close() (manual or trigger) before the close commits.
// Partial closes do not produce a ClosureRecord; their effect is visible in
// the position's realized_pnl and version.
// -----------------------------------------------------------------------------
struct ClosureRecord {
  RecordId id{0};
  PositionId position_id{0};
  OwnerId owner;
  std::string pair;
  Side side{Side::Long};
  double entry_price{0.0};
  double close_price{0.0};
  double size{0.0};
  double realized_pnl{0.0};         // Lifetime realized PnL, net of fees
  double fees{0.0};                 // Lifetime fees
  double released_amount{0.0};
  CloseReason reason{CloseReason::Manual};
  std::int64_t closed_at_ms{0};
};

}  // namespace domain
}  // namespace margin
