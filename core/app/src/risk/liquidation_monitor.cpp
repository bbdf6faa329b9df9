#include "margin/risk/liquidation_monitor.hpp"

#include "margin/events/risk_alert_event.hpp"
#include "margin/time/time_utils.hpp"

#include <algorithm>
#include <iostream>
#include <optional>
#include <utility>

namespace margin {

namespace {

// Runs `fn` when the scope ends, also when a submission throws.
template <typename Fn>
class ScopeExit {
 public:
  explicit ScopeExit(Fn fn) : fn_(std::move(fn)) {}
  ~ScopeExit() { fn_(); }

  ScopeExit(const ScopeExit&) = delete;
  ScopeExit& operator=(const ScopeExit&) = delete;

 private:
  Fn fn_;
};

double markFor(const domain::Position& p, const MarkMap& marks) {
  auto it = marks.find(p.pair);
  return (it != marks.end() && it->second > 0.0) ? it->second : p.entry_price;
}

}  // namespace

LiquidationMonitor::LiquidationMonitor(
    EventBus& bus, ExecutionCoordinator& coordinator,
    const PositionIndex& index, const PositionLedger& ledger,
    const PriceFeedAdapter& prices, const LeverageSettingStore& settings,
    WorkerPool& pool, const ITimeProvider& clock,
    domain::CrossLiquidationPolicy policy)
    : bus_(bus),
      coordinator_(coordinator),
      index_(index),
      ledger_(ledger),
      prices_(prices),
      settings_(settings),
      pool_(pool),
      clock_(clock),
      policy_(policy) {}

// -----------------------------------------------------------------------------
// onTick()
// -----------------------------------------------------------------------------
TickSummary LiquidationMonitor::onTick(const PriceTickEvent& tick) {
  TickSummary summary;
  summary.pair = tick.symbol;

  const MarginCalculator& calc = ledger_.calculator();
  const double rate = calc.maintenanceRate();
  const double mark = tick.price;

  MarkMap marks = prices_.marks();
  marks[tick.symbol] = tick.price;

  // Snapshot every open position on the pair, dropping defective ones.
  std::vector<domain::Position> on_pair;
  for (domain::PositionId id : index_.positionsForPair(tick.symbol)) {
    if (isQuarantined(id)) {
      continue;
    }
    auto p = ledger_.get(id);
    if (!p || !p->isOpen()) {
      continue;
    }
    const CalcStatus status = MarginCalculator::validate(*p);
    if (status != CalcStatus::Ok) {
      quarantine(*p, status);
      ++summary.quarantined;
      continue;
    }
    on_pair.push_back(std::move(*p));
  }

  std::unordered_set<domain::PositionId> liquidating;

  // 1. Isolated positions.
  for (const auto& p : on_pair) {
    if (p.mode != domain::MarginMode::Isolated || inFlight(p.id)) {
      continue;
    }
    ++summary.evaluated;

    const MarginResult ratio = calc.marginRatio(p, mark);
    if (!ratio.ok()) {
      quarantine(p, ratio.status);
      ++summary.quarantined;
      continue;
    }
    if (ratio.value <= rate) {
      liquidating.insert(p.id);
      if (markInFlight(p.id)) {
        submitLiquidation(p, mark);
        ++summary.liquidations_submitted;
      }
    }
  }

  // 2. Cross groups touching the pair.
  for (const auto& owner : index_.crossOwnersForPair(tick.symbol)) {
    std::vector<domain::Position> group;
    bool busy = false;
    for (domain::PositionId id : index_.crossPositionsForOwner(owner)) {
      if (isQuarantined(id)) {
        continue;
      }
      auto p = ledger_.get(id);
      if (!p || !p->isOpen() || p->mode != domain::MarginMode::Cross) {
        continue;
      }
      const CalcStatus status = MarginCalculator::validate(*p);
      if (status != CalcStatus::Ok) {
        quarantine(*p, status);
        ++summary.quarantined;
        continue;
      }
      busy = busy || inFlight(id);
      group.push_back(std::move(*p));
    }
    if (group.empty() || busy) {
      continue;
    }
    summary.evaluated += group.size();

    const MarginResult ratio = calc.crossMarginRatio(group, marks);
    if (!ratio.ok() || ratio.value > rate) {
      continue;
    }

    domain::GroupLiquidation liquidation;
    liquidation.owner = owner;
    liquidation.type = domain::LiquidationType::Auto;
    for (const auto& m : selectGroupMembers(group, marks)) {
      liquidation.members.push_back({m.id, m.version, markFor(m, marks)});
      liquidating.insert(m.id);
      markInFlight(m.id);
    }

    std::cout << "[LiquidationMonitor] cross group of owner " << owner
              << " at margin ratio " << ratio.value << " (maintenance "
              << rate << "), liquidating " << liquidation.members.size()
              << " of " << group.size() << " position(s), policy "
              << domain::toString(policy_) << "\n";
    submitGroup(liquidation);
    ++summary.groups_submitted;
  }

  // 3 and 4. Triggers and warnings for everything that survives.
  for (const auto& p : on_pair) {
    if (liquidating.count(p.id) > 0) {
      last_zone_.erase(p.id);
      continue;
    }
    if (inFlight(p.id)) {
      continue;
    }
    checkTriggers(p, mark, summary);
    checkWarning(p, mark, summary);
  }

  return summary;
}

// -----------------------------------------------------------------------------
// selectGroupMembers()
// -----------------------------------------------------------------------------
std::vector<domain::Position> LiquidationMonitor::selectGroupMembers(
    std::vector<domain::Position> group, const MarkMap& marks) const {
  std::stable_sort(group.begin(), group.end(),
                   [&marks](const domain::Position& a,
                            const domain::Position& b) {
                     const double loss_a =
                         -MarginCalculator::unrealizedPnl(a, markFor(a, marks));
                     const double loss_b =
                         -MarginCalculator::unrealizedPnl(b, markFor(b, marks));
                     if (loss_a != loss_b) {
                       return loss_a > loss_b;
                     }
                     return a.id < b.id;
                   });

  if (policy_ == domain::CrossLiquidationPolicy::AllAtOnce) {
    return group;
  }

  const MarginCalculator& calc = ledger_.calculator();
  for (std::size_t k = 1; k < group.size(); ++k) {
    const std::vector<domain::Position> rest(group.begin() + k, group.end());
    const MarginResult ratio = calc.crossMarginRatio(rest, marks);
    if (ratio.ok() && ratio.value > calc.maintenanceRate()) {
      group.resize(k);
      return group;
    }
  }
  return group;
}

// -----------------------------------------------------------------------------
// quarantine()
// -----------------------------------------------------------------------------
void LiquidationMonitor::quarantine(const domain::Position& position,
                                    CalcStatus status) {
  {
    std::lock_guard lock(state_mutex_);
    if (!quarantined_.insert(position.id).second) {
      return;
    }
  }
  last_zone_.erase(position.id);

  std::cerr << "[LiquidationMonitor] INTERNAL: position " << position.id
            << " (owner " << position.owner << ", " << position.pair
            << ") quarantined: " << toString(status) << "\n";

  RiskAlertEvent alert;
  alert.position_id = position.id;
  alert.owner = position.owner;
  alert.pair = position.pair;
  alert.reason = toString(status);
  alert.timestamp = ms_to_timestamp(clock_.now_ms());
  alert.sequence_id = ++sequence_;
  bus_.publish(alert);
}

// -----------------------------------------------------------------------------
// checkTriggers()
// -----------------------------------------------------------------------------
void LiquidationMonitor::checkTriggers(const domain::Position& p, double mark,
                                       TickSummary& summary) {
  const bool is_long = p.side == domain::Side::Long;
  const bool stop_hit =
      p.stop_loss && (is_long ? mark <= *p.stop_loss : mark >= *p.stop_loss);
  const bool take_hit =
      p.take_profit &&
      (is_long ? mark >= *p.take_profit : mark <= *p.take_profit);
  if (!stop_hit && !take_hit) {
    return;
  }

  if (!markInFlight(p.id)) {
    return;
  }
  std::cout << "[LiquidationMonitor] " << (stop_hit ? "stop-loss" : "take-profit")
            << " of position " << p.id << " crossed at " << mark << "\n";
  submitTriggerClose(p, mark);
  ++summary.triggers_submitted;
}

// -----------------------------------------------------------------------------
// checkWarning()
// -----------------------------------------------------------------------------
void LiquidationMonitor::checkWarning(const domain::Position& p, double mark,
                                      TickSummary& summary) {
  const MarginCalculator& calc = ledger_.calculator();
  const double percent = MarginCalculator::riskPercent(p, mark);
  const domain::RiskZone zone = calc.riskZone(percent);

  auto it = last_zone_.find(p.id);
  const domain::RiskZone previous =
      it == last_zone_.end() ? domain::RiskZone::Safe : it->second;
  last_zone_[p.id] = zone;

  if (zone <= previous || zone < domain::RiskZone::Warning) {
    return;
  }
  if (!settings_.get(p.owner).liquidation_warning_enabled) {
    return;
  }

  LiquidationWarningEvent warning;
  warning.position_id = p.id;
  warning.owner = p.owner;
  warning.pair = p.pair;
  warning.mark_price = mark;
  warning.liquidation_price = p.liquidation_price;
  warning.risk_percent = percent;
  warning.zone = zone;
  warning.timestamp = ms_to_timestamp(clock_.now_ms());
  warning.sequence_id = ++sequence_;
  bus_.publish(warning);
  ++summary.warnings_published;
}

// -----------------------------------------------------------------------------
// Submissions (run on WorkerPool threads)
// -----------------------------------------------------------------------------
void LiquidationMonitor::submitLiquidation(const domain::Position& p,
                                           double mark) {
  domain::LiquidateRequest request;
  request.position_id = p.id;
  request.expected_version = p.version;
  request.mark_price = mark;
  request.type = domain::LiquidationType::Auto;

  const bool posted = pool_.post([this, request] {
    ScopeExit release_flag([&] { clearInFlight(request.position_id); });
    auto result = coordinator_.liquidate(request);
    if (result.ok()) {
      ++liquidations_;
    } else {
      countOutcome(result.error(), "liquidation", request.position_id);
    }
  });
  if (!posted) {
    std::cerr << "[LiquidationMonitor] worker pool stopped, liquidation of "
              << p.id << " dropped\n";
    clearInFlight(p.id);
  }
}

void LiquidationMonitor::submitGroup(const domain::GroupLiquidation& group) {
  const bool posted = pool_.post([this, group] {
    ScopeExit release_flags([&] {
      for (const auto& m : group.members) {
        clearInFlight(m.position_id);
      }
    });
    auto result = coordinator_.liquidateGroup(group);
    if (result.ok()) {
      liquidations_ += result.value().size();
    } else {
      countOutcome(result.error(), "group liquidation",
                   group.members.front().position_id);
    }
  });
  if (!posted) {
    std::cerr << "[LiquidationMonitor] worker pool stopped, group "
              << "liquidation of owner " << group.owner << " dropped\n";
    for (const auto& m : group.members) {
      clearInFlight(m.position_id);
    }
  }
}

void LiquidationMonitor::submitTriggerClose(const domain::Position& p,
                                            double mark) {
  domain::CloseRequest request;
  request.position_id = p.id;
  request.expected_version = p.version;
  request.close_price = mark;
  request.reason = domain::CloseReason::Trigger;

  const bool posted = pool_.post([this, request] {
    ScopeExit release_flag([&] { clearInFlight(request.position_id); });
    auto result = coordinator_.submit(request);
    if (result.ok()) {
      ++trigger_closes_;
    } else {
      countOutcome(result.error(), "trigger close", request.position_id);
    }
  });
  if (!posted) {
    std::cerr << "[LiquidationMonitor] worker pool stopped, trigger close of "
              << p.id << " dropped\n";
    clearInFlight(p.id);
  }
}

void LiquidationMonitor::countOutcome(domain::ErrorCode code, const char* what,
                                      domain::PositionId id) {
  if (code == domain::ErrorCode::VersionConflict ||
      code == domain::ErrorCode::PositionNotOpen) {
    ++resolved_conflicts_;
    std::cout << "[LiquidationMonitor] " << what << " of position " << id
              << " superseded (" << domain::toString(code) << ")\n";
    return;
  }
  ++failures_;
  std::cerr << "[LiquidationMonitor] " << what << " of position " << id
            << " failed: " << domain::toString(code) << "\n";
}

// -----------------------------------------------------------------------------
// In-flight bookkeeping and queries
// -----------------------------------------------------------------------------
bool LiquidationMonitor::markInFlight(domain::PositionId id) {
  std::lock_guard lock(state_mutex_);
  return in_flight_.insert(id).second;
}

void LiquidationMonitor::clearInFlight(domain::PositionId id) {
  std::lock_guard lock(state_mutex_);
  in_flight_.erase(id);
}

bool LiquidationMonitor::inFlight(domain::PositionId id) const {
  std::lock_guard lock(state_mutex_);
  return in_flight_.count(id) > 0;
}

bool LiquidationMonitor::isQuarantined(domain::PositionId id) const {
  std::lock_guard lock(state_mutex_);
  return quarantined_.count(id) > 0;
}

void LiquidationMonitor::waitIdle() { pool_.waitIdle(); }

MonitorStats LiquidationMonitor::stats() const {
  MonitorStats s;
  s.liquidations = liquidations_.load();
  s.trigger_closes = trigger_closes_.load();
  s.resolved_conflicts = resolved_conflicts_.load();
  s.failures = failures_.load();
  {
    std::lock_guard lock(state_mutex_);
    s.quarantined = quarantined_.size();
  }
  return s;
}

}  // namespace margin
