#include "margin/risk/margin_calculator.hpp"

#include <algorithm>
#include <cmath>

namespace margin {

namespace {

constexpr double kModerateRiskPercent = 50.0;

double markOrEntry(const domain::Position& p, const MarkMap& marks) {
  auto it = marks.find(p.pair);
  if (it != marks.end() && it->second > 0.0) {
    return it->second;
  }
  return p.entry_price;
}

// Solves for the price at which equity equals maintenance, given the
// collateral and maintenance margin that back this position.
double solveLiquidationPrice(const domain::Position& p, double collateral,
                             double maintenance) {
  const double cushion = (collateral - maintenance) / p.size;
  if (p.side == domain::Side::Long) {
    return std::max(0.0, p.entry_price - cushion);
  }
  return p.entry_price + cushion;
}

}  // namespace

MarginCalculator::MarginCalculator(domain::MarginParams params)
    : params_(params) {}

CalcStatus MarginCalculator::validate(const domain::Position& position) {
  if (!(position.size > 0.0)) {
    return CalcStatus::ZeroSize;
  }
  if (!(position.collateral > 0.0)) {
    return CalcStatus::NonPositiveCollateral;
  }
  if (!(position.entry_price > 0.0)) {
    return CalcStatus::NonPositivePrice;
  }
  return CalcStatus::Ok;
}

double MarginCalculator::unrealizedPnl(const domain::Position& position,
                                       double mark) {
  return (mark - position.entry_price) * position.size *
         domain::directionSign(position.side);
}

double MarginCalculator::maintenanceMargin(
    const domain::Position& position) const {
  return params_.maintenance_margin_rate * position.entryNotional();
}

MarginResult MarginCalculator::marginRatio(const domain::Position& position,
                                           double mark) const {
  const CalcStatus status = validate(position);
  if (status != CalcStatus::Ok) {
    return {status, 0.0};
  }
  if (!(mark > 0.0)) {
    return {CalcStatus::NonPositivePrice, 0.0};
  }

  const double equity = position.collateral + unrealizedPnl(position, mark);
  return {CalcStatus::Ok, equity / (position.size * mark)};
}

MarginResult MarginCalculator::crossMarginRatio(
    const std::vector<domain::Position>& group, const MarkMap& marks) const {
  if (group.empty()) {
    return {CalcStatus::ZeroSize, 0.0};
  }

  double equity = 0.0;
  double exposure = 0.0;
  for (const auto& p : group) {
    const CalcStatus status = validate(p);
    if (status != CalcStatus::Ok) {
      return {status, 0.0};
    }
    const double mark = markOrEntry(p, marks);
    equity += p.collateral + unrealizedPnl(p, mark);
    exposure += p.size * mark;
  }
  return {CalcStatus::Ok, equity / exposure};
}

MarginResult MarginCalculator::liquidationPrice(
    const domain::Position& position) const {
  const CalcStatus status = validate(position);
  if (status != CalcStatus::Ok) {
    return {status, 0.0};
  }
  return {CalcStatus::Ok,
          solveLiquidationPrice(position, position.collateral,
                                maintenanceMargin(position))};
}

MarginResult MarginCalculator::crossLiquidationPrice(
    const domain::Position& position,
    const std::vector<domain::Position>& group) const {
  const CalcStatus own = validate(position);
  if (own != CalcStatus::Ok) {
    return {own, 0.0};
  }

  double total_collateral = 0.0;
  double total_maintenance = 0.0;
  bool self_seen = false;
  for (const auto& p : group) {
    const CalcStatus status = validate(p);
    if (status != CalcStatus::Ok) {
      return {status, 0.0};
    }
    total_collateral += p.collateral;
    total_maintenance += maintenanceMargin(p);
    self_seen = self_seen || p.id == position.id;
  }
  if (!self_seen) {
    total_collateral += position.collateral;
    total_maintenance += maintenanceMargin(position);
  }

  return {CalcStatus::Ok,
          solveLiquidationPrice(position, total_collateral,
                                total_maintenance)};
}

double MarginCalculator::riskPercent(const domain::Position& position,
                                     double mark) {
  const double liq = position.liquidation_price;
  const bool is_long = position.side == domain::Side::Long;

  if ((is_long && mark <= liq) || (!is_long && mark >= liq)) {
    return 100.0;
  }

  const double total_range = std::abs(position.entry_price - liq);
  if (total_range <= 0.0) {
    return 100.0;
  }

  const double distance = std::abs(mark - liq);
  const double percent = (total_range - distance) / total_range * 100.0;
  return std::clamp(percent, 0.0, 100.0);
}

domain::RiskZone MarginCalculator::riskZone(double risk_percent) const {
  if (risk_percent >= params_.critical_risk_percent) {
    return domain::RiskZone::Critical;
  }
  if (risk_percent >= params_.warning_risk_percent) {
    return domain::RiskZone::Warning;
  }
  if (risk_percent >= kModerateRiskPercent) {
    return domain::RiskZone::Moderate;
  }
  return domain::RiskZone::Safe;
}

}  // namespace margin
