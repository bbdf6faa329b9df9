#include "margin/execution/execution_coordinator.hpp"

#include <iostream>
#include <type_traits>
#include <utility>
#include <variant>

namespace margin {

ExecutionCoordinator::ExecutionCoordinator(
    PositionLedger& ledger, const LeverageSettingStore& settings)
    : ledger_(ledger), settings_(settings) {}

// -----------------------------------------------------------------------------
// withPositionLocks()
// -----------------------------------------------------------------------------
// The mode is read from a snapshot before any lock. Mode never changes
// after open, so the snapshot is enough to pick the locks.
// -----------------------------------------------------------------------------
template <typename Fn>
auto ExecutionCoordinator::withPositionLocks(domain::PositionId id, Fn&& fn)
    -> decltype(fn()) {
  const auto snapshot = ledger_.get(id);
  if (!snapshot) {
    return domain::ErrorCode::PositionNotFound;
  }

  std::unique_lock<std::mutex> group_lock;
  if (snapshot->mode == domain::MarginMode::Cross) {
    MutexPtr group = groupMutex(snapshot->owner);
    group_lock = std::unique_lock<std::mutex>(*group);
  }

  MutexPtr position = positionMutex(id);
  auto result = [&] {
    std::lock_guard lock(*position);
    return fn();
  }();

  const auto after = ledger_.get(id);
  if (after && !after->isOpen()) {
    dropPositionMutex(id);
  }
  return result;
}

// -----------------------------------------------------------------------------
// submit()
// -----------------------------------------------------------------------------
domain::Result<SubmitOutcome> ExecutionCoordinator::submit(
    const domain::Request& request) {
  return std::visit(
      [this](const auto& r) -> domain::Result<SubmitOutcome> {
        using T = std::decay_t<decltype(r)>;

        if constexpr (std::is_same_v<T, domain::OpenRequest>) {
          return submitOpen(r);
        } else if constexpr (std::is_same_v<T, domain::LiquidateRequest>) {
          auto record = liquidate(r);
          if (!record.ok()) {
            return record.error();
          }
          auto position = ledger_.get(r.position_id);
          if (!position) {
            return domain::ErrorCode::PositionNotFound;
          }
          return SubmitOutcome{*position, std::move(record).value()};
        } else {
          auto result = withPositionLocks(
              r.position_id, [&]() -> domain::Result<domain::Position> {
                if constexpr (std::is_same_v<
                                  T, domain::AdjustCollateralRequest>) {
                  return ledger_.adjustCollateral(
                      r.position_id, r.expected_version, r.delta);
                } else if constexpr (std::is_same_v<T,
                                                    domain::ReduceRequest>) {
                  return ledger_.reduce(r.position_id, r.expected_version,
                                        r.quantity, r.price);
                } else if constexpr (std::is_same_v<T,
                                                    domain::CloseRequest>) {
                  return ledger_.close(r.position_id, r.expected_version,
                                       r.close_price, r.reason);
                } else {
                  return ledger_.setTriggers(r.position_id,
                                             r.expected_version, r.stop_loss,
                                             r.take_profit);
                }
              });
          if (!result.ok()) {
            return result.error();
          }
          return SubmitOutcome{std::move(result).value(), std::nullopt};
        }
      },
      request);
}

domain::Result<SubmitOutcome> ExecutionCoordinator::submitOpen(
    const domain::OpenRequest& request) {
  const domain::MarginMode mode =
      request.mode.value_or(settings_.get(request.owner).default_mode);

  std::unique_lock<std::mutex> group_lock;
  if (mode == domain::MarginMode::Cross) {
    MutexPtr group = groupMutex(request.owner);
    group_lock = std::unique_lock<std::mutex>(*group);
  }

  auto result = ledger_.open(request);
  if (!result.ok()) {
    std::cout << "[ExecutionCoordinator] open rejected for owner "
              << request.owner << ": " << domain::toString(result.error())
              << "\n";
    return result.error();
  }
  return SubmitOutcome{std::move(result).value(), std::nullopt};
}

// -----------------------------------------------------------------------------
// liquidate()
// -----------------------------------------------------------------------------
domain::Result<domain::LiquidationRecord> ExecutionCoordinator::liquidate(
    const domain::LiquidateRequest& request) {
  return withPositionLocks(
      request.position_id,
      [&]() -> domain::Result<domain::LiquidationRecord> {
        return ledger_.liquidate(request.position_id,
                                 request.expected_version, request.mark_price,
                                 request.type);
      });
}

// -----------------------------------------------------------------------------
// liquidateGroup()
// -----------------------------------------------------------------------------
domain::Result<std::vector<domain::LiquidationRecord>>
ExecutionCoordinator::liquidateGroup(const domain::GroupLiquidation& group) {
  MutexPtr group_mutex = groupMutex(group.owner);
  domain::Result<std::vector<domain::LiquidationRecord>> result =
      domain::ErrorCode::InvalidRequest;
  {
    std::lock_guard lock(*group_mutex);
    result = ledger_.liquidateGroup(group);
  }

  if (result.ok()) {
    for (const auto& record : result.value()) {
      dropPositionMutex(record.position_id);
    }
  }
  return result;
}

// -----------------------------------------------------------------------------
// Mutex tables
// -----------------------------------------------------------------------------
ExecutionCoordinator::MutexPtr ExecutionCoordinator::positionMutex(
    domain::PositionId id) {
  std::lock_guard lock(table_mutex_);
  auto& slot = position_mutexes_[id];
  if (!slot) {
    slot = std::make_shared<std::mutex>();
  }
  return slot;
}

ExecutionCoordinator::MutexPtr ExecutionCoordinator::groupMutex(
    const domain::OwnerId& owner) {
  std::lock_guard lock(table_mutex_);
  auto& slot = group_mutexes_[owner];
  if (!slot) {
    slot = std::make_shared<std::mutex>();
  }
  return slot;
}

void ExecutionCoordinator::dropPositionMutex(domain::PositionId id) {
  std::lock_guard lock(table_mutex_);
  position_mutexes_.erase(id);
}

}  // namespace margin
