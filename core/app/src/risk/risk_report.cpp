#include "margin/risk/risk_report.hpp"

namespace margin {

RiskReport buildRiskReport(const domain::OwnerId& owner,
                           const std::vector<domain::Position>& positions,
                           const MarkMap& marks,
                           const MarginCalculator& calculator) {
  RiskReport report;
  report.owner = owner;

  for (const auto& p : positions) {
    if (!p.isOpen() || p.owner != owner) {
      continue;
    }

    auto it = marks.find(p.pair);
    const double mark =
        (it != marks.end() && it->second > 0.0) ? it->second : p.entry_price;

    PositionRisk risk;
    risk.position_id = p.id;
    risk.pair = p.pair;
    risk.side = p.side;
    risk.mode = p.mode;
    risk.mark_price = mark;
    risk.liquidation_price = p.liquidation_price;
    risk.unrealized_pnl = MarginCalculator::unrealizedPnl(p, mark);
    risk.risk_percent = MarginCalculator::riskPercent(p, mark);
    risk.zone = calculator.riskZone(risk.risk_percent);

    switch (risk.zone) {
      case domain::RiskZone::Safe:     ++report.safe_count; break;
      case domain::RiskZone::Moderate: ++report.moderate_count; break;
      case domain::RiskZone::Warning:  ++report.warning_count; break;
      case domain::RiskZone::Critical: ++report.critical_count; break;
    }

    report.total_collateral += p.collateral;
    report.total_unrealized_pnl += risk.unrealized_pnl;
    report.positions.push_back(risk);
  }
  return report;
}

}  // namespace margin
