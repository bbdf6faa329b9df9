#pragma once

namespace margin {
namespace domain {

// -----------------------------------------------------------------------------
// MarginParams — engine-wide margin and fee constants
// -----------------------------------------------------------------------------
//
// @brief  Immutable parameters shared by the MarginCalculator, PositionLedger
//         and LiquidationMonitor.
//
// @details
// Copied by value into components at construction and constant for the
// lifetime of the engine. Loaded from the JSON config (see EngineConfig);
// the defaults below apply when the config omits a key.
//
//   maintenance_margin_rate  Fraction of entry notional that must remain as
//                            equity. The same rate is the margin-ratio
//                            threshold at which the monitor liquidates.
//   trading_fee_rate         Fee per execution as a fraction of notional at
//                            the execution price (0.003 = 0.30%).
//   max_leverage_ceiling     Hard upper bound for any owner's max_leverage
//                            setting.
//   warning_risk_percent     Risk percent at which a position enters the
//   critical_risk_percent    Warning / Critical zones.
//
// Thread model:
//   Plain data, copied into each component. No shared mutable state.
// -----------------------------------------------------------------------------
struct MarginParams {
  double maintenance_margin_rate{0.01};
  double trading_fee_rate{0.003};
  int max_leverage_ceiling{125};
  double warning_risk_percent{70.0};
  double critical_risk_percent{85.0};
};

// Policy for liquidating an owner's cross group once its aggregate margin
// ratio breaches maintenance. Engine-wide, so every owner is treated alike.
enum class CrossLiquidationPolicy {
  AllAtOnce,        // Liquidate every cross position of the owner together
  LargestLossFirst, // Liquidate in loss order until the rest is healthy
};

inline const char* toString(CrossLiquidationPolicy p) {
  switch (p) {
    case CrossLiquidationPolicy::AllAtOnce:        return "all_at_once";
    case CrossLiquidationPolicy::LargestLossFirst: return "largest_loss_first";
  }
  return "unknown";
}

}  // namespace domain
}  // namespace margin
