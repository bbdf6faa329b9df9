#pragma once

#include "margin/domain/margin_params.hpp"
#include "margin/domain/position.hpp"

#include <string>
#include <unordered_map>
#include <vector>

namespace margin {

// Latest mark per canonical pair, as handed out by PriceFeedAdapter::marks().
using MarkMap = std::unordered_map<std::string, double>;

// -----------------------------------------------------------------------------
// CalcStatus / MarginResult
// -----------------------------------------------------------------------------
// A snapshot the math cannot evaluate yields a non-Ok status instead of a
// number. Callers treat that as an internal defect: the ledger refuses the
// mutation, the monitor quarantines the position.
// -----------------------------------------------------------------------------
enum class CalcStatus {
  Ok,
  ZeroSize,               // size <= 0
  NonPositiveCollateral,  // collateral <= 0 (aggregate, for cross)
  NonPositivePrice,       // entry or mark <= 0
};

inline const char* toString(CalcStatus s) {
  switch (s) {
    case CalcStatus::Ok:                    return "ok";
    case CalcStatus::ZeroSize:              return "zero_size";
    case CalcStatus::NonPositiveCollateral: return "non_positive_collateral";
    case CalcStatus::NonPositivePrice:      return "non_positive_price";
  }
  return "unknown";
}

struct MarginResult {
  CalcStatus status{CalcStatus::Ok};
  double value{0.0};

  bool ok() const { return status == CalcStatus::Ok; }
};

// -----------------------------------------------------------------------------
// MarginCalculator — pure margin math
// -----------------------------------------------------------------------------
//
// @brief  Liquidation price, margin ratio, unrealized PnL and risk metrics
//         from position snapshots and mark prices.
//
// @details
// Formulas (s = size, e = entry, m = mark, C = collateral, r = maintenance
// margin rate, dir = +1 long / -1 short):
//
//   unrealizedPnl       = (m - e) * s * dir
//   maintenanceMargin   = r * e * s
//   marginRatio         = (C + uPnL) / (s * m)
//   liquidationPrice    = e - (C - MM) / s            long
//                         e + (C - MM) / s            short
//
// Cross mode takes the owner's whole cross group (the position itself
// included):
//
//   crossMarginRatio    = sum(C_i + uPnL_i) / sum(s_i * m_i)
//   crossLiquidationPrice(p)
//                       = e_p -/+ (sum C_i - r * sum e_i * s_i) / s_p
//
// The liquidation decision is marginRatio <= r, with maintenance on the mark
// notional, while liquidationPrice holds maintenance at the entry notional.
// For a long the ratio reaches r only at (e*s - C) / (s * (1 - r)), a little
// below the published price (10x ETH long from 2000: liquidation price 1810,
// ratio hits 1% at 1808.08). In that band riskPercent already reports 100.
// Shorts see the mirror gap above the price.
//
// A sibling whose pair has no mark in the MarkMap is valued at its entry
// price. A long whose formula lands below zero reports 0 (it cannot be
// liquidated by price alone).
//
// No side effects; holds only the immutable MarginParams. Safe to call
// concurrently from any thread on copies of position data.
// -----------------------------------------------------------------------------
class MarginCalculator {
 public:
  explicit MarginCalculator(domain::MarginParams params = {});

  const domain::MarginParams& params() const { return params_; }
  double maintenanceRate() const { return params_.maintenance_margin_rate; }

  // Checks the snapshot itself, independent of any mark.
  static CalcStatus validate(const domain::Position& position);

  static double unrealizedPnl(const domain::Position& position, double mark);

  double maintenanceMargin(const domain::Position& position) const;

  MarginResult marginRatio(const domain::Position& position,
                           double mark) const;

  MarginResult crossMarginRatio(const std::vector<domain::Position>& group,
                                const MarkMap& marks) const;

  MarginResult liquidationPrice(const domain::Position& position) const;

  MarginResult crossLiquidationPrice(
      const domain::Position& position,
      const std::vector<domain::Position>& group) const;

  // -------------------------------------------------------------------------
  // riskPercent(position, mark)
  // -------------------------------------------------------------------------
  // @brief  How far the mark has travelled from entry towards the stored
  //         liquidation price, in percent.
  //
  // @details
  //   (|e - liq| - |m - liq|) / |e - liq| * 100, clamped to [0, 100].
  // A mark at or past the liquidation price is 100. A mark that moved in the
  // position's favour by more than the entry-to-liquidation distance is 0.
  // -------------------------------------------------------------------------
  static double riskPercent(const domain::Position& position, double mark);

  domain::RiskZone riskZone(double risk_percent) const;

 private:
  domain::MarginParams params_;
};

}  // namespace margin
