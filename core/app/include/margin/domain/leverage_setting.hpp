#pragma once

#include "margin/domain/position_types.hpp"

namespace margin {
namespace domain {

// -----------------------------------------------------------------------------
// LeverageSetting — per-owner account guardrails
// -----------------------------------------------------------------------------
//
// @brief  Account-level limits read by the ExecutionCoordinator and
//         PositionLedger on every open and adjust request.
//
// @details
// Owned and mutated by the account-settings side of the platform (the
// `set_leverage` IPC command writes into LeverageSettingStore). The margin
// core only reads it.
//
//   max_leverage               Upper bound for a position's leverage, and for
//                              the effective leverage left after a collateral
//                              withdrawal. Requests above it are rejected,
//                              never clamped.
//   preferred_leverage         Default the UI offers; informational here.
//   default_mode               Mode applied when an open request omits one.
//   auto_deleverage_enabled    Stored and reported; the engine-wide cross
//                              liquidation policy governs deleveraging.
//   liquidation_warning_enabled  Gates LiquidationWarningEvent publication.
//
// Defaults are the product defaults for an account that never saved
// settings.
// -----------------------------------------------------------------------------
struct LeverageSetting {
  OwnerId owner;
  int max_leverage{20};
  int preferred_leverage{10};
  MarginMode default_mode{MarginMode::Isolated};
  bool auto_deleverage_enabled{true};
  bool liquidation_warning_enabled{true};
};

}  // namespace domain
}  // namespace margin
