#pragma once

#include "margin/domain/position_types.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace margin {
namespace domain {

// -----------------------------------------------------------------------------
// Position — one leveraged exposure to one trading pair
// -----------------------------------------------------------------------------
//
// @brief  Full state of a margin position: what was opened, what collateral
//         backs it, the derived liquidation price, accumulated PnL and fees,
//         and the optimistic-concurrency version.
//
// @details
// Plain data struct with value semantics. The authoritative copy lives inside
// PositionLedger; every read hands out a complete copy taken under the
// position's lock, so a reader never observes a half-applied mutation.
//
// Stored vs derived fields:
//   - liquidation_price is stored. PositionLedger recomputes it in the same
//     critical section as any change to collateral or size (and, for cross
//     positions, whenever a sibling in the owner's cross group changes).
//   - mark_price and unrealized_pnl are derived at read time from the Price
//     Feed Adapter's latest mark for the pair. They are 0 when no mark is
//     known. They are never an input to any mutation.
//
// Fees:
//   fees_accrued is the total charged over the position's life (open fee,
//   partial-close fees, close fee). fees_outstanding is the portion not yet
//   deducted from a release: the open fee, settled on the terminal
//   transition.
//
// Version:
//   0 on open, +1 on every successful mutation of this position. Callers
//   pass the version they last read as expected_version; a mismatch is a
//   VersionConflict. Refreshing a cross sibling's liquidation price is not a
//   mutation of the sibling and does not bump its version.
//
// Ownership:
//   PositionLedger owns the mutable state. Events and query results carry
//   immutable copies.
// -----------------------------------------------------------------------------
struct Position {
  PositionId id{0};
  OwnerId owner;
  std::string pair;                   // Canonical pair, e.g. "ETH/USDT"
  Side side{Side::Long};
  int leverage{1};
  double entry_price{0.0};
  double size{0.0};                   // Base-currency quantity
  double collateral{0.0};             // Posted margin, quote currency
  MarginMode mode{MarginMode::Isolated};
  double liquidation_price{0.0};
  double mark_price{0.0};             // Derived at read time
  double unrealized_pnl{0.0};         // Derived at read time
  double realized_pnl{0.0};           // Net of fees
  double fees_accrued{0.0};
  double fees_outstanding{0.0};
  std::optional<double> stop_loss;
  std::optional<double> take_profit;
  PositionStatus status{PositionStatus::Open};
  std::uint64_t version{0};
  ReservationId reservation_id{0};
  std::int64_t opened_at_ms{0};
  std::int64_t updated_at_ms{0};
  std::int64_t closed_at_ms{0};       // 0 while open

  bool isOpen() const { return status == PositionStatus::Open; }

  // Entry notional: size valued at the entry price. The maintenance margin
  // and the leverage checks are taken on this figure.
  double entryNotional() const { return size * entry_price; }
};

}  // namespace domain
}  // namespace margin
