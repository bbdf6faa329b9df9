#pragma once

#include "margin/domain/error_code.hpp"
#include "margin/domain/history_records.hpp"
#include "margin/domain/position.hpp"
#include "margin/domain/requests.hpp"
#include "margin/ledger/leverage_setting_store.hpp"
#include "margin/ledger/position_ledger.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

namespace margin {

// -----------------------------------------------------------------------------
// SubmitOutcome
// -----------------------------------------------------------------------------
// The position after a successful request. `liquidation` is set only for
// LiquidateRequest.
// -----------------------------------------------------------------------------
struct SubmitOutcome {
  domain::Position position;
  std::optional<domain::LiquidationRecord> liquidation;
};

// -----------------------------------------------------------------------------
// ExecutionCoordinator — single entry point for every position mutation
// -----------------------------------------------------------------------------
//
// @brief  Routes requests from the IPC server and the LiquidationMonitor to
//         the PositionLedger, serialized per position and per cross group.
//
// @details
// Lock order:
//   1. the owner's cross-group mutex, only when the position is (or will
//      be) in cross mode
//   2. the position's mutex
// Group liquidations take only (1): every member belongs to the group and
// the ledger locks each member's slot itself.
//
// Two requests for different isolated positions never wait on each other.
// Requests for one position run one after the other; whichever commits
// first wins and the other sees VersionConflict (or PositionNotOpen).
//
// Position mutexes of terminal positions are dropped after the request that
// closed them.
//
// Thread model:
//   All methods are safe to call concurrently from any thread: the IPC
//   thread and the WorkerPool threads call in at the same time.
//
// Ownership:
//   Borrows the ledger and the leverage setting store.
// -----------------------------------------------------------------------------
class ExecutionCoordinator {
 public:
  ExecutionCoordinator(PositionLedger& ledger,
                       const LeverageSettingStore& settings);

  ExecutionCoordinator(const ExecutionCoordinator&) = delete;
  ExecutionCoordinator& operator=(const ExecutionCoordinator&) = delete;

  // Dispatches any request to the matching ledger operation.
  domain::Result<SubmitOutcome> submit(const domain::Request& request);

  domain::Result<domain::LiquidationRecord> liquidate(
      const domain::LiquidateRequest& request);

  domain::Result<std::vector<domain::LiquidationRecord>> liquidateGroup(
      const domain::GroupLiquidation& group);

 private:
  using MutexPtr = std::shared_ptr<std::mutex>;

  // Runs `fn` under the locks the position needs. Returns fn's result.
  template <typename Fn>
  auto withPositionLocks(domain::PositionId id, Fn&& fn)
      -> decltype(fn());

  domain::Result<SubmitOutcome> submitOpen(const domain::OpenRequest& request);

  MutexPtr positionMutex(domain::PositionId id);
  MutexPtr groupMutex(const domain::OwnerId& owner);
  void dropPositionMutex(domain::PositionId id);

  PositionLedger& ledger_;
  const LeverageSettingStore& settings_;

  std::mutex table_mutex_;  // Guards the two maps below
  std::unordered_map<domain::PositionId, MutexPtr> position_mutexes_;
  std::unordered_map<domain::OwnerId, MutexPtr> group_mutexes_;
};

}  // namespace margin
