#pragma once

#include "margin/concurrent/id_generator.hpp"
#include "margin/domain/error_code.hpp"
#include "margin/domain/history_records.hpp"
#include "margin/domain/margin_params.hpp"
#include "margin/domain/position.hpp"
#include "margin/domain/requests.hpp"
#include "margin/eventbus/event_bus.hpp"
#include "margin/events/position_update_event.hpp"
#include "margin/history/i_history_recorder.hpp"
#include "margin/ledger/i_collateral_wallet.hpp"
#include "margin/ledger/leverage_setting_store.hpp"
#include "margin/pricing/price_feed_adapter.hpp"
#include "margin/risk/margin_calculator.hpp"
#include "margin/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace margin {

// -----------------------------------------------------------------------------
// PositionLedger — authoritative store of margin positions
// -----------------------------------------------------------------------------
//
// @brief  Owns every position's state and every mutation of it. Enforces
//         the position invariants, moves collateral through the wallet, and
//         records terminal transitions in the history journal.
//
// @details
// Storage is a table keyed by position id. Each entry (Slot) carries its own
// std::mutex and the Position. The table itself is guarded by a
// std::shared_mutex that is held only to find or insert a slot, never while
// a position is being mutated, so a mutation of one position never stalls
// another.
//
// Optimistic concurrency:
//   Every mutating call carries expected_version. Under the slot's mutex the
//   ledger compares it with the stored version; a mismatch is
//   VersionConflict and nothing changes. Of two requests racing with the
//   same expected_version exactly one wins. The version check comes before
//   the status check, so a stale liquidation retry reports VersionConflict.
//
// Commit order inside the slot's critical section:
//   1. validate inputs and compute the candidate state
//   2. recompute the liquidation price (ComputationInvalid if the math
//      refuses the candidate)
//   3. terminal transitions only: append the history record, durably
//      (HistoryUnavailable if that fails, nothing else happens)
//   4. exactly one wallet reserve or release
//   5. write the candidate back with version + 1
// A reader copying the Position under the same mutex therefore sees either
// the state before or the state after, never a mix.
//
// Events (PositionUpdateEvent, LiquidationEvent) are published after the
// slot mutex is released.
//
// Fees: trading_fee_rate x notional at the execution price on open, on each
// partial close, and on close. The open fee is outstanding until the
// terminal transition settles it; a partial-close fee is settled at once.
//
// Cross margin:
//   A cross position's liquidation price depends on its owner's whole open
//   cross group. After a cross mutation commits, the ledger recomputes the
//   other group members' liquidation prices one slot at a time (no two slot
//   mutexes are ever held together) and publishes them as Repriced. That
//   refresh is not a mutation of the sibling and does not bump its version.
//   A cross close whose loss exceeds the position's own collateral charges
//   the excess to the open siblings, pro rata to their collateral, right
//   after the close commits. Each debited sibling gets version + 1 and a
//   CollateralAdjusted update. If the siblings cannot cover the excess the
//   close is refused with InsufficientCollateral.
//   Callers must serialize cross mutations per owner; the
//   ExecutionCoordinator does.
//
// Execution prices:
//   reduce, close and liquidate take an optional price. Empty means the
//   pair's latest mark from the PriceFeedAdapter (PairUnavailable if there
//   is none); only the LiquidationMonitor passes the tick it evaluated.
//
// Position ids continue above the history recorder's maxPositionId(), so
// after a journal replay a new position never reuses an audited id.
//
// Thread model:
//   All public methods are safe to call concurrently from any thread.
//
// Ownership:
//   Borrows the bus, wallet, setting store, history recorder, price adapter
//   and clock. All must outlive the ledger.
// -----------------------------------------------------------------------------
class PositionLedger {
 public:
  PositionLedger(EventBus& bus, ICollateralWallet& wallet,
                 const LeverageSettingStore& settings,
                 IHistoryRecorder& history, const PriceFeedAdapter& prices,
                 const ITimeProvider& clock, domain::MarginParams params = {},
                 std::vector<std::string> tradable_pairs = {});

  PositionLedger(const PositionLedger&) = delete;
  PositionLedger& operator=(const PositionLedger&) = delete;
  PositionLedger(PositionLedger&&) = delete;
  PositionLedger& operator=(PositionLedger&&) = delete;

  // -------------------------------------------------------------------------
  // open(request)
  // -------------------------------------------------------------------------
  // @brief  Opens a position at the pair's latest mark.
  //
  // @details
  // Rejections, all before any state change:
  //   InvalidRequest          empty owner/pair, size or collateral <= 0,
  //                           stop-loss / take-profit on the wrong side of
  //                           the entry
  //   InvalidLeverage         leverage outside [1, owner's max_leverage]
  //   PairUnavailable         pair not tradable, or no mark yet
  //   InsufficientCollateral  collateral x leverage < notional, or the
  //                           wallet reservation failed
  //
  // The new position has version 0 and owes the open fee.
  // -------------------------------------------------------------------------
  domain::Result<domain::Position> open(const domain::OpenRequest& request);

  // -------------------------------------------------------------------------
  // adjustCollateral(id, expected_version, delta)
  // -------------------------------------------------------------------------
  // @brief  Adds (delta > 0, reserved from the wallet) or withdraws
  //         (delta < 0, released to the wallet) collateral.
  //
  // @details
  // A withdrawal must leave collateral > 0 (InsufficientCollateral) and
  // entry notional / collateral <= max_leverage (InvalidLeverage).
  // -------------------------------------------------------------------------
  domain::Result<domain::Position> adjustCollateral(
      domain::PositionId id, std::uint64_t expected_version, double delta);

  // -------------------------------------------------------------------------
  // reduce(id, expected_version, quantity, price)
  // -------------------------------------------------------------------------
  // @brief  Partial close of `quantity` (0 < quantity < size) at `price`,
  //         or at the latest mark when `price` is empty.
  //
  // @details
  // Releases the proportional collateral plus the slice's PnL minus the
  // slice fee. A negative figure is a deficit taken from the collateral
  // that stays; if nothing would stay, InsufficientCollateral.
  // -------------------------------------------------------------------------
  domain::Result<domain::Position> reduce(domain::PositionId id,
                                          std::uint64_t expected_version,
                                          double quantity,
                                          std::optional<double> price);

  // -------------------------------------------------------------------------
  // close(id, expected_version, close_price, reason)
  // -------------------------------------------------------------------------
  // @brief  Full close: finalizes realized PnL net of all fees, appends a
  //         ClosureRecord, releases max(0, collateral + PnL - fees owed).
  //
  // @details
  // Fills at the latest mark when close_price is empty. A retry carrying
  // the same, now stale, expected_version fails with VersionConflict; funds
  // are released once. A cross close may debit the siblings (see above).
  // -------------------------------------------------------------------------
  domain::Result<domain::Position> close(domain::PositionId id,
                                         std::uint64_t expected_version,
                                         std::optional<double> close_price,
                                         domain::CloseReason reason);

  // Replaces stop-loss and take-profit. Moves no funds.
  domain::Result<domain::Position> setTriggers(
      domain::PositionId id, std::uint64_t expected_version,
      std::optional<double> stop_loss, std::optional<double> take_profit);

  // -------------------------------------------------------------------------
  // liquidate(id, expected_version, mark_price, type)
  // -------------------------------------------------------------------------
  // @brief  Forces the position to Liquidated at mark_price.
  //
  // @details
  //   loss      = -(uPnL at mark) + fees owed
  //   remaining = collateral - loss      (negative on a gap move)
  //   released  = max(0, remaining)
  // The LiquidationRecord is durably appended before the commit. A negative
  // remaining is logged as a shortfall, never thrown. Races with
  // adjust/close on the same expected_version: exactly one wins.
  // -------------------------------------------------------------------------
  domain::Result<domain::LiquidationRecord> liquidate(
      domain::PositionId id, std::uint64_t expected_version,
      std::optional<double> mark_price, domain::LiquidationType type);

  // -------------------------------------------------------------------------
  // liquidateGroup(group)
  // -------------------------------------------------------------------------
  // @brief  Liquidates several cross positions of one owner as one pool.
  //
  // @details
  // Shortfalls of members whose loss exceeded their own collateral are
  // netted against the positive remainders of the others: with P the sum
  // of positive remainders and S the sum of shortfalls, P - S (floored at
  // 0) is released, split over the positive members pro rata. Each record
  // still carries the member's own exact remaining collateral.
  //
  // Members whose version no longer matches, or that are no longer open,
  // are skipped. Returns the committed records in member order, or the
  // first error if none committed.
  // -------------------------------------------------------------------------
  domain::Result<std::vector<domain::LiquidationRecord>> liquidateGroup(
      const domain::GroupLiquidation& group);

  // Snapshot with mark_price / unrealized_pnl filled from the latest mark.
  std::optional<domain::Position> get(domain::PositionId id) const;

  std::vector<domain::Position> positionsByOwner(
      const domain::OwnerId& owner) const;

  std::vector<domain::Position> openPositions() const;

  // The owner's open cross positions, ordered by id.
  std::vector<domain::Position> crossGroup(const domain::OwnerId& owner) const;

  // -------------------------------------------------------------------------
  // hydratePosition(position)
  // -------------------------------------------------------------------------
  // @brief  Injects a previously persisted position during warm-up.
  //
  // @details
  // Inserts (or replaces) the position as given, without touching the
  // wallet, and moves the id generator past its id. Call before ticks
  // flow. Publishes a Hydrated update so the PositionIndex picks it up.
  // -------------------------------------------------------------------------
  void hydratePosition(const domain::Position& position);

  bool isTradable(const std::string& pair) const;

  const MarginCalculator& calculator() const { return calculator_; }

 private:
  struct Slot {
    std::mutex mutex;
    domain::Position position;
  };

  // Validates inputs and applies the operation to `candidate`, side effects
  // (history, wallet) last. Returns an error to abort with nothing applied.
  using Apply = std::function<std::optional<domain::ErrorCode>(
      domain::Position& candidate,
      const std::vector<domain::Position>& siblings)>;

  // Runs after the commit and its update event, before siblings are
  // repriced.
  using AfterCommit = std::function<void(const domain::Position& committed)>;

  domain::Result<domain::Position> mutate(domain::PositionId id,
                                          std::uint64_t expected_version,
                                          PositionChange change,
                                          const Apply& apply,
                                          const AfterCommit& after_commit = {});

  // Explicit price if given (must be finite and > 0), else the latest mark.
  domain::Result<double> fillPrice(const std::string& pair,
                                   std::optional<double> explicit_price) const;

  // Charges `deficit` to the owner's open cross positions pro rata.
  void debitCrossPool(const domain::OwnerId& owner, double deficit);

  std::shared_ptr<Slot> findSlot(domain::PositionId id) const;
  std::vector<std::shared_ptr<Slot>> ownerSlots(
      const domain::OwnerId& owner) const;

  static domain::Position copyOf(Slot& slot);

  // Open cross positions of the owner except `exclude`, ordered by id.
  std::vector<domain::Position> openCrossSiblings(
      const domain::OwnerId& owner, domain::PositionId exclude) const;

  // Sets candidate.liquidation_price, or returns ComputationInvalid.
  std::optional<domain::ErrorCode> reprice(
      domain::Position& candidate,
      const std::vector<domain::Position>& siblings) const;

  void refreshCrossSiblings(const domain::OwnerId& owner,
                            domain::PositionId exclude);

  domain::LiquidationRecord buildLiquidationRecord(
      const domain::Position& position, double mark_price,
      domain::LiquidationType type, std::int64_t now_ms);

  domain::Position withMarks(domain::Position position) const;

  void publishUpdate(const domain::Position& position, PositionChange change);
  void publishLiquidation(const domain::LiquidationRecord& record);

  EventBus& bus_;
  ICollateralWallet& wallet_;
  const LeverageSettingStore& settings_;
  IHistoryRecorder& history_;
  const PriceFeedAdapter& prices_;
  const ITimeProvider& clock_;

  MarginCalculator calculator_;
  std::unordered_set<std::string> tradable_pairs_;  // Empty = every pair

  IdGenerator position_ids_;
  std::atomic<std::uint64_t> sequence_{0};

  mutable std::shared_mutex table_mutex_;  // Guards slots_ and by_owner_
  std::unordered_map<domain::PositionId, std::shared_ptr<Slot>> slots_;
  std::unordered_map<domain::OwnerId, std::vector<domain::PositionId>>
      by_owner_;
};

}  // namespace margin
