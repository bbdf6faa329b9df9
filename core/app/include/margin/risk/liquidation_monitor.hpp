#pragma once

#include "margin/concurrent/worker_pool.hpp"
#include "margin/domain/margin_params.hpp"
#include "margin/domain/position.hpp"
#include "margin/domain/requests.hpp"
#include "margin/eventbus/event_bus.hpp"
#include "margin/events/event_types.hpp"
#include "margin/execution/execution_coordinator.hpp"
#include "margin/ledger/leverage_setting_store.hpp"
#include "margin/ledger/position_ledger.hpp"
#include "margin/pricing/price_feed_adapter.hpp"
#include "margin/risk/margin_calculator.hpp"
#include "margin/risk/position_index.hpp"
#include "margin/time/i_time_provider.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace margin {

// What one onTick() call found and handed to the worker pool.
struct TickSummary {
  std::string pair;
  std::size_t evaluated{0};                // Positions whose margin was checked
  std::size_t liquidations_submitted{0};   // Isolated liquidations
  std::size_t groups_submitted{0};         // Cross group liquidations
  std::size_t triggers_submitted{0};       // Stop-loss / take-profit closes
  std::size_t warnings_published{0};
  std::size_t quarantined{0};              // Newly quarantined this tick
};

// Outcomes of submissions, counted when the worker finishes them.
struct MonitorStats {
  std::uint64_t liquidations{0};       // Positions liquidated
  std::uint64_t trigger_closes{0};
  std::uint64_t resolved_conflicts{0}; // VersionConflict / PositionNotOpen
  std::uint64_t failures{0};           // Any other error
  std::uint64_t quarantined{0};
};

// -----------------------------------------------------------------------------
// LiquidationMonitor — per-tick margin surveillance
// -----------------------------------------------------------------------------
//
// @brief  On every accepted mark-price tick, finds the positions the tick
//         affects, and hands liquidations and stop-loss / take-profit closes
//         to the WorkerPool, which submits them through the
//         ExecutionCoordinator.
//
// @details
// For a tick on pair P:
//   1. Isolated positions on P: margin ratio at the tick price. At or below
//      the maintenance rate, an auto liquidation is submitted carrying the
//      version that was evaluated.
//   2. Owners holding a cross position on P: the whole cross group is
//      evaluated with the latest mark of every pair. At or below the
//      maintenance rate, a group liquidation is submitted, members ordered
//      largest loss first. The configured CrossLiquidationPolicy decides
//      whether the whole group goes or only the shortest prefix after which
//      the rest is healthy again.
//   3. Positions on P not being liquidated: stop-loss and take-profit are
//      checked against the tick price. Liquidation wins over a trigger.
//   4. Positions on P not being liquidated: the risk zone is recomputed and
//      a LiquidationWarningEvent is published on an upward move into
//      Warning or Critical, if the owner has warnings enabled.
//
// A snapshot the margin math refuses is quarantined: logged as an internal
// defect, published as a RiskAlertEvent, and never evaluated again.
//
// At most one submission per position is in flight. A submission that comes
// back VersionConflict or PositionNotOpen lost a race with a user request
// and is not retried: the next tick re-evaluates the fresh state.
//
// Thread model:
//   onTick() is called from one thread (the monitor loop). Submissions run
//   on WorkerPool threads. stats(), isQuarantined() and waitIdle() may be
//   called from any thread.
//
// Ownership:
//   Borrows every collaborator; all must outlive the monitor. The pool must
//   be drained (waitIdle or shutdown) before the monitor is destroyed.
// -----------------------------------------------------------------------------
class LiquidationMonitor {
 public:
  LiquidationMonitor(EventBus& bus, ExecutionCoordinator& coordinator,
                     const PositionIndex& index, const PositionLedger& ledger,
                     const PriceFeedAdapter& prices,
                     const LeverageSettingStore& settings, WorkerPool& pool,
                     const ITimeProvider& clock,
                     domain::CrossLiquidationPolicy policy =
                         domain::CrossLiquidationPolicy::AllAtOnce);

  LiquidationMonitor(const LiquidationMonitor&) = delete;
  LiquidationMonitor& operator=(const LiquidationMonitor&) = delete;

  // `tick` must already be accepted by the PriceFeedAdapter (canonical
  // symbol, fresh).
  TickSummary onTick(const PriceTickEvent& tick);

  // Blocks until every submission posted so far has finished.
  void waitIdle();

  bool isQuarantined(domain::PositionId id) const;

  MonitorStats stats() const;

  domain::CrossLiquidationPolicy policy() const { return policy_; }

 private:
  // Members to liquidate from an unhealthy group, largest loss first.
  std::vector<domain::Position> selectGroupMembers(
      std::vector<domain::Position> group, const MarkMap& marks) const;

  void quarantine(const domain::Position& position, CalcStatus status);

  void checkTriggers(const domain::Position& position, double mark,
                     TickSummary& summary);
  void checkWarning(const domain::Position& position, double mark,
                    TickSummary& summary);

  void submitLiquidation(const domain::Position& position, double mark);
  void submitGroup(const domain::GroupLiquidation& group);
  void submitTriggerClose(const domain::Position& position, double mark);

  // Returns false if the position already has a submission in flight.
  bool markInFlight(domain::PositionId id);
  void clearInFlight(domain::PositionId id);
  bool inFlight(domain::PositionId id) const;

  void countOutcome(domain::ErrorCode code, const char* what,
                    domain::PositionId id);

  EventBus& bus_;
  ExecutionCoordinator& coordinator_;
  const PositionIndex& index_;
  const PositionLedger& ledger_;
  const PriceFeedAdapter& prices_;
  const LeverageSettingStore& settings_;
  WorkerPool& pool_;
  const ITimeProvider& clock_;
  domain::CrossLiquidationPolicy policy_;

  std::atomic<std::uint64_t> sequence_{0};

  mutable std::mutex state_mutex_;  // Guards quarantined_ and in_flight_
  std::unordered_set<domain::PositionId> quarantined_;
  std::unordered_set<domain::PositionId> in_flight_;

  // Last zone seen per position; touched only by onTick().
  std::unordered_map<domain::PositionId, domain::RiskZone> last_zone_;

  std::atomic<std::uint64_t> liquidations_{0};
  std::atomic<std::uint64_t> trigger_closes_{0};
  std::atomic<std::uint64_t> resolved_conflicts_{0};
  std::atomic<std::uint64_t> failures_{0};
};

}  // namespace margin
