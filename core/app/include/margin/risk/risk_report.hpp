#pragma once

#include "margin/domain/position.hpp"
#include "margin/risk/margin_calculator.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace margin {

// One open position's distance to liquidation at the current mark.
struct PositionRisk {
  domain::PositionId position_id{0};
  std::string pair;
  domain::Side side{domain::Side::Long};
  domain::MarginMode mode{domain::MarginMode::Isolated};
  double mark_price{0.0};
  double liquidation_price{0.0};
  double unrealized_pnl{0.0};
  double risk_percent{0.0};
  domain::RiskZone zone{domain::RiskZone::Safe};
};

// -----------------------------------------------------------------------------
// RiskReport
// -----------------------------------------------------------------------------
// Per-owner summary served by the "risk" command: every open position's risk
// percent and zone, how many positions sit in each zone, and the owner's
// posted collateral and unrealized PnL.
// -----------------------------------------------------------------------------
struct RiskReport {
  domain::OwnerId owner;
  std::vector<PositionRisk> positions;

  std::size_t safe_count{0};
  std::size_t moderate_count{0};
  std::size_t warning_count{0};
  std::size_t critical_count{0};

  double total_collateral{0.0};
  double total_unrealized_pnl{0.0};
};

// Builds the report from `positions` (non-open ones are skipped). A pair
// without a mark in `marks` is valued at the entry price.
RiskReport buildRiskReport(const domain::OwnerId& owner,
                           const std::vector<domain::Position>& positions,
                           const MarkMap& marks,
                           const MarginCalculator& calculator);

}  // namespace margin
