// =============================================================================
// position_ledger_test.cpp
// =============================================================================
// Unit tests for margin::PositionLedger.
//
// Validates:
//   - open(): entry at the latest mark, liquidation price, reservation,
//     every rejection path
//   - adjustCollateral(), reduce(), setTriggers(), close() arithmetic and
//     their version / status guards
//   - liquidate(): record contents, wallet release, gap moves, exactly-once
//   - Cross groups: pooled liquidation prices, sibling refresh without a
//     version bump, group liquidation with shortfall netting, excess close
//     losses charged to the siblings
//   - Fills without an explicit price use the latest mark
//   - Audit failure aborts the transition
//   - Concurrent writers on one version: exactly one wins; retrying
//     writers commit one version per success
//   - Position ids continue above a replayed journal
//
// Reference numbers (maintenance 1%, fees 0 unless stated):
//   long ETH/USDT 10x, size 1, entry 2000, collateral 210 -> liq 1810
//   short BTC/USDT 5x, size 1, entry 100, collateral 20   -> liq 119
// =============================================================================

#include "margin/eventbus/event_bus.hpp"
#include "margin/events/liquidation_event.hpp"
#include "margin/events/position_update_event.hpp"
#include "margin/history/journal_history_recorder.hpp"
#include "margin/ledger/in_memory_wallet.hpp"
#include "margin/ledger/leverage_setting_store.hpp"
#include "margin/ledger/position_ledger.hpp"
#include "margin/pricing/price_feed_adapter.hpp"
#include "margin/time/simulation_time_provider.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <cstdio>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using margin::PositionChange;
using margin::domain::CloseReason;
using margin::domain::ErrorCode;
using margin::domain::LiquidationType;
using margin::domain::MarginMode;
using margin::domain::OpenRequest;
using margin::domain::Position;
using margin::domain::PositionStatus;
using margin::domain::Side;

namespace {

// Audit sink whose appends always fail.
class FailingHistory final : public margin::IHistoryRecorder {
 public:
  margin::domain::RecordId nextRecordId() override { return ++next_; }
  margin::domain::PositionId maxPositionId() const override { return 0; }
  bool append(const margin::domain::LiquidationRecord&) override {
    return false;
  }
  bool append(const margin::domain::ClosureRecord&) override { return false; }
  std::vector<margin::domain::LiquidationRecord> liquidationsByOwner(
      const margin::domain::OwnerId&) const override {
    return {};
  }
  std::vector<margin::domain::LiquidationRecord> liquidationsByPosition(
      margin::domain::PositionId) const override {
    return {};
  }
  std::vector<margin::domain::ClosureRecord> closuresByOwner(
      const margin::domain::OwnerId&) const override {
    return {};
  }

 private:
  margin::domain::RecordId next_{0};
};

margin::domain::MarginParams zeroFees() {
  margin::domain::MarginParams p;
  p.trading_fee_rate = 0.0;
  return p;
}

}  // namespace

class PositionLedgerTest : public ::testing::Test {
 protected:
  margin::EventBus bus;
  margin::InMemoryWallet wallet;
  margin::LeverageSettingStore settings;
  margin::JournalHistoryRecorder history;
  margin::PriceFeedAdapter prices;
  margin::SimulationTimeProvider clock{1000};
  std::unique_ptr<margin::PositionLedger> ledger;

  std::vector<margin::PositionUpdateEvent> updates;
  std::vector<margin::LiquidationEvent> liquidations;
  std::int64_t next_ts_{1};

  void SetUp() override {
    build(zeroFees());
    wallet.deposit("alice", 1000.0);
    wallet.deposit("bob", 1000.0);
    bus.subscribe<margin::PositionUpdateEvent>(
        [this](const margin::PositionUpdateEvent& e) { updates.push_back(e); });
    bus.subscribe<margin::LiquidationEvent>(
        [this](const margin::LiquidationEvent& e) {
          liquidations.push_back(e);
        });
    tick("ETH/USDT", 2000.0);
    tick("BTC/USDT", 100.0);
  }

  void build(margin::domain::MarginParams params,
             std::vector<std::string> pairs = {},
             margin::IHistoryRecorder* recorder = nullptr) {
    ledger = std::make_unique<margin::PositionLedger>(
        bus, wallet, settings, recorder ? *recorder : history, prices, clock,
        params, std::move(pairs));
  }

  void tick(const std::string& pair, double price) {
    margin::PriceTickEvent t;
    t.symbol = pair;
    t.price = price;
    t.timestamp_ms = next_ts_++;
    ASSERT_TRUE(prices.ingest(t).has_value());
  }

  static OpenRequest ethLong(MarginMode mode = MarginMode::Isolated,
                             const std::string& owner = "alice") {
    OpenRequest r;
    r.owner = owner;
    r.pair = "ETH/USDT";
    r.side = Side::Long;
    r.leverage = 10;
    r.size = 1.0;
    r.collateral = 210.0;
    r.mode = mode;
    return r;
  }

  static OpenRequest btcShort(MarginMode mode = MarginMode::Isolated,
                              const std::string& owner = "alice") {
    OpenRequest r;
    r.owner = owner;
    r.pair = "BTC/USDT";
    r.side = Side::Short;
    r.leverage = 5;
    r.size = 1.0;
    r.collateral = 20.0;
    r.mode = mode;
    return r;
  }

  Position openOk(const OpenRequest& r) {
    auto result = ledger->open(r);
    EXPECT_TRUE(result.ok()) << margin::domain::toString(result.error());
    return result.ok() ? result.value() : Position{};
  }
};

// =============================================================================
// open()
// =============================================================================
TEST_F(PositionLedgerTest, OpenIsolatedLong) {
  Position p = openOk(ethLong());

  EXPECT_EQ(p.id, 1u);
  EXPECT_EQ(p.pair, "ETH/USDT");
  EXPECT_DOUBLE_EQ(p.entry_price, 2000.0);
  EXPECT_DOUBLE_EQ(p.liquidation_price, 1810.0);
  EXPECT_EQ(p.version, 0u);
  EXPECT_EQ(p.status, PositionStatus::Open);
  EXPECT_EQ(p.opened_at_ms, 1000);
  EXPECT_NE(p.reservation_id, 0u);

  EXPECT_DOUBLE_EQ(wallet.balance("alice"), 790.0);
  EXPECT_DOUBLE_EQ(wallet.totalReserved("alice"), 210.0);

  ASSERT_EQ(updates.size(), 1u);
  EXPECT_EQ(updates[0].change, PositionChange::Opened);
  EXPECT_EQ(updates[0].position.id, p.id);
}

TEST_F(PositionLedgerTest, OpenIsolatedShort) {
  Position p = openOk(btcShort());
  EXPECT_DOUBLE_EQ(p.liquidation_price, 119.0);
}

TEST_F(PositionLedgerTest, OpenNormalizesPair) {
  OpenRequest r = ethLong();
  r.pair = "eth-usdt";
  Position p = openOk(r);
  EXPECT_EQ(p.pair, "ETH/USDT");
}

TEST_F(PositionLedgerTest, OpenChargesFeeAsOutstanding) {
  build(margin::domain::MarginParams{});
  Position p = openOk(ethLong());
  EXPECT_DOUBLE_EQ(p.fees_accrued, 6.0);
  EXPECT_DOUBLE_EQ(p.fees_outstanding, 6.0);
  EXPECT_DOUBLE_EQ(p.collateral, 210.0);
}

TEST_F(PositionLedgerTest, OpenRejectsLeverageOutsideSetting) {
  OpenRequest r = ethLong();
  r.leverage = 0;
  EXPECT_EQ(ledger->open(r).error(), ErrorCode::InvalidLeverage);

  r.leverage = 21;  // default max_leverage is 20
  r.collateral = 2000.0;
  EXPECT_EQ(ledger->open(r).error(), ErrorCode::InvalidLeverage);

  margin::domain::LeverageSetting s;
  s.owner = "alice";
  s.max_leverage = 50;
  s.preferred_leverage = 10;
  ASSERT_TRUE(settings.put(s).ok());
  EXPECT_TRUE(ledger->open(r).ok());
}

TEST_F(PositionLedgerTest, OpenRejectsUnderCollateralizedRequest) {
  OpenRequest r = ethLong();
  r.collateral = 199.0;  // 199 x 10 < 2000
  EXPECT_EQ(ledger->open(r).error(), ErrorCode::InsufficientCollateral);

  r.collateral = 200.0;  // exactly at the limit
  EXPECT_TRUE(ledger->open(r).ok());
}

TEST_F(PositionLedgerTest, OpenRejectsWhenWalletCannotReserve) {
  OpenRequest r = ethLong(MarginMode::Isolated, "carol");
  EXPECT_EQ(ledger->open(r).error(), ErrorCode::InsufficientCollateral);
  EXPECT_TRUE(ledger->positionsByOwner("carol").empty());
}

TEST_F(PositionLedgerTest, OpenRejectsPairWithoutMark) {
  OpenRequest r = ethLong();
  r.pair = "SOL/USDT";
  EXPECT_EQ(ledger->open(r).error(), ErrorCode::PairUnavailable);
}

TEST_F(PositionLedgerTest, OpenRejectsPairOutsideTradableSet) {
  build(zeroFees(), {"eth-usdt"});
  EXPECT_TRUE(ledger->open(ethLong()).ok());
  EXPECT_EQ(ledger->open(btcShort()).error(), ErrorCode::PairUnavailable);
}

TEST_F(PositionLedgerTest, OpenRejectsMalformedRequests) {
  OpenRequest r = ethLong();
  r.size = 0.0;
  EXPECT_EQ(ledger->open(r).error(), ErrorCode::InvalidRequest);

  r = ethLong();
  r.owner.clear();
  EXPECT_EQ(ledger->open(r).error(), ErrorCode::InvalidRequest);

  r = ethLong();
  r.stop_loss = 2100.0;  // above entry for a long
  EXPECT_EQ(ledger->open(r).error(), ErrorCode::InvalidRequest);

  r = ethLong();
  r.take_profit = 1900.0;  // below entry for a long
  EXPECT_EQ(ledger->open(r).error(), ErrorCode::InvalidRequest);

  EXPECT_DOUBLE_EQ(wallet.balance("alice"), 1000.0);
  EXPECT_TRUE(updates.empty());
}

TEST_F(PositionLedgerTest, OpenUsesOwnerDefaultMode) {
  margin::domain::LeverageSetting s = settings.get("alice");
  s.default_mode = MarginMode::Cross;
  ASSERT_TRUE(settings.put(s).ok());

  OpenRequest r = ethLong();
  r.mode.reset();
  EXPECT_EQ(openOk(r).mode, MarginMode::Cross);
}

// =============================================================================
// adjustCollateral()
// =============================================================================
TEST_F(PositionLedgerTest, AddCollateralLowersLiquidationPrice) {
  Position p = openOk(ethLong());

  auto adjusted = ledger->adjustCollateral(p.id, 0, 90.0);
  ASSERT_TRUE(adjusted.ok());
  EXPECT_DOUBLE_EQ(adjusted.value().collateral, 300.0);
  EXPECT_DOUBLE_EQ(adjusted.value().liquidation_price, 1720.0);
  EXPECT_EQ(adjusted.value().version, 1u);
  EXPECT_DOUBLE_EQ(wallet.balance("alice"), 700.0);
  EXPECT_EQ(updates.back().change, PositionChange::CollateralAdjusted);
}

TEST_F(PositionLedgerTest, WithdrawCollateralWithinMaxLeverage) {
  Position p = openOk(ethLong());

  auto adjusted = ledger->adjustCollateral(p.id, 0, -100.0);
  ASSERT_TRUE(adjusted.ok());
  EXPECT_DOUBLE_EQ(adjusted.value().collateral, 110.0);
  EXPECT_DOUBLE_EQ(adjusted.value().liquidation_price, 1910.0);
  EXPECT_DOUBLE_EQ(wallet.balance("alice"), 890.0);
}

TEST_F(PositionLedgerTest, WithdrawBeyondMaxLeverageIsRejected) {
  Position p = openOk(ethLong());

  EXPECT_EQ(ledger->adjustCollateral(p.id, 0, -150.0).error(),
            ErrorCode::InvalidLeverage);
  EXPECT_EQ(ledger->adjustCollateral(p.id, 0, -210.0).error(),
            ErrorCode::InsufficientCollateral);

  auto unchanged = ledger->get(p.id);
  ASSERT_TRUE(unchanged.has_value());
  EXPECT_DOUBLE_EQ(unchanged->collateral, 210.0);
  EXPECT_EQ(unchanged->version, 0u);
}

TEST_F(PositionLedgerTest, AdjustGuards) {
  Position p = openOk(ethLong());

  EXPECT_EQ(ledger->adjustCollateral(p.id, 0, 0.0).error(),
            ErrorCode::InvalidRequest);
  EXPECT_EQ(ledger->adjustCollateral(p.id, 7, 10.0).error(),
            ErrorCode::VersionConflict);
  EXPECT_EQ(ledger->adjustCollateral(999, 0, 10.0).error(),
            ErrorCode::PositionNotFound);
  EXPECT_EQ(ledger->adjustCollateral(p.id, 0, 5000.0).error(),
            ErrorCode::InsufficientCollateral);
}

TEST_F(PositionLedgerTest, AddCollateralGrowsTheExistingReservation) {
  Position p = openOk(ethLong());
  const std::size_t reservations = wallet.reservationCount();

  auto adjusted = ledger->adjustCollateral(p.id, 0, 90.0);
  ASSERT_TRUE(adjusted.ok());
  EXPECT_EQ(adjusted.value().reservation_id, p.reservation_id);
  EXPECT_EQ(wallet.reservationCount(), reservations);
  EXPECT_DOUBLE_EQ(wallet.totalReserved("alice"), 300.0);

  // Everything the position held comes back on a flat close.
  ASSERT_TRUE(ledger->close(p.id, 1, 2000.0, CloseReason::Manual).ok());
  EXPECT_DOUBLE_EQ(wallet.balance("alice"), 1000.0);
  EXPECT_DOUBLE_EQ(wallet.totalReleased("alice"), 300.0);
}

// =============================================================================
// reduce()
// =============================================================================
TEST_F(PositionLedgerTest, ReduceReleasesProportionalSlice) {
  OpenRequest r = ethLong();
  r.size = 2.0;
  r.collateral = 420.0;
  Position p = openOk(r);
  ASSERT_DOUBLE_EQ(p.liquidation_price, 1810.0);

  auto reduced = ledger->reduce(p.id, 0, 1.0, 2100.0);
  ASSERT_TRUE(reduced.ok());
  EXPECT_DOUBLE_EQ(reduced.value().size, 1.0);
  EXPECT_DOUBLE_EQ(reduced.value().collateral, 210.0);
  EXPECT_DOUBLE_EQ(reduced.value().realized_pnl, 100.0);
  EXPECT_DOUBLE_EQ(reduced.value().liquidation_price, 1810.0);
  EXPECT_EQ(reduced.value().version, 1u);

  // 1000 - 420 + (210 slice + 100 pnl)
  EXPECT_DOUBLE_EQ(wallet.balance("alice"), 890.0);
}

TEST_F(PositionLedgerTest, ReduceOfWholeSizeIsRejected) {
  Position p = openOk(ethLong());
  EXPECT_EQ(ledger->reduce(p.id, 0, 1.0, 2000.0).error(),
            ErrorCode::InvalidRequest);
  EXPECT_EQ(ledger->reduce(p.id, 0, 0.0, 2000.0).error(),
            ErrorCode::InvalidRequest);
}

TEST_F(PositionLedgerTest, ReduceWithoutPriceFillsAtLatestMark) {
  OpenRequest r = ethLong();
  r.size = 2.0;
  r.collateral = 420.0;
  Position p = openOk(r);
  tick("ETH/USDT", 1900.0);

  auto reduced = ledger->reduce(p.id, 0, 1.0, std::nullopt);
  ASSERT_TRUE(reduced.ok());
  EXPECT_DOUBLE_EQ(reduced.value().realized_pnl, -100.0);
  EXPECT_DOUBLE_EQ(wallet.balance("alice"), 1000.0 - 420.0 + 210.0 - 100.0);
}

// =============================================================================
// setTriggers()
// =============================================================================
TEST_F(PositionLedgerTest, SetTriggersReplacesBoth) {
  OpenRequest r = ethLong();
  r.stop_loss = 1850.0;
  Position p = openOk(r);

  auto set = ledger->setTriggers(p.id, 0, std::nullopt, 2300.0);
  ASSERT_TRUE(set.ok());
  EXPECT_FALSE(set.value().stop_loss.has_value());
  ASSERT_TRUE(set.value().take_profit.has_value());
  EXPECT_DOUBLE_EQ(*set.value().take_profit, 2300.0);

  EXPECT_EQ(ledger->setTriggers(p.id, 1, 2050.0, std::nullopt).error(),
            ErrorCode::InvalidRequest);
}

// =============================================================================
// close()
// =============================================================================
TEST_F(PositionLedgerTest, CloseRoundTripChargesBothFees) {
  build(margin::domain::MarginParams{});
  Position p = openOk(ethLong());

  auto closed = ledger->close(p.id, 0, 2000.0, CloseReason::Manual);
  ASSERT_TRUE(closed.ok());
  EXPECT_EQ(closed.value().status, PositionStatus::Closed);
  EXPECT_DOUBLE_EQ(closed.value().realized_pnl, -12.0);
  EXPECT_DOUBLE_EQ(closed.value().fees_accrued, 12.0);
  EXPECT_DOUBLE_EQ(closed.value().fees_outstanding, 0.0);
  EXPECT_EQ(closed.value().closed_at_ms, 1000);

  EXPECT_DOUBLE_EQ(wallet.balance("alice"), 1000.0 - 12.0);

  auto records = history.closuresByOwner("alice");
  ASSERT_EQ(records.size(), 1u);
  EXPECT_DOUBLE_EQ(records[0].released_amount, 198.0);
  EXPECT_DOUBLE_EQ(records[0].realized_pnl, -12.0);
  EXPECT_EQ(records[0].reason, CloseReason::Manual);
}

TEST_F(PositionLedgerTest, ClosedPositionRejectsFurtherMutation) {
  Position p = openOk(ethLong());
  ASSERT_TRUE(ledger->close(p.id, 0, 2050.0, CloseReason::Manual).ok());

  EXPECT_EQ(ledger->close(p.id, 0, 2050.0, CloseReason::Manual).error(),
            ErrorCode::VersionConflict);
  EXPECT_EQ(ledger->close(p.id, 1, 2050.0, CloseReason::Manual).error(),
            ErrorCode::PositionNotOpen);
  EXPECT_EQ(ledger->adjustCollateral(p.id, 1, 10.0).error(),
            ErrorCode::PositionNotOpen);
  EXPECT_EQ(ledger->liquidate(p.id, 1, 1500.0, LiquidationType::Forced)
                .error(),
            ErrorCode::PositionNotOpen);

  EXPECT_DOUBLE_EQ(wallet.balance("alice"), 1050.0);
  EXPECT_TRUE(ledger->openPositions().empty());
}

TEST_F(PositionLedgerTest, CloseWithoutPriceFillsAtLatestMark) {
  Position p = openOk(ethLong());
  tick("ETH/USDT", 2100.0);

  auto closed = ledger->close(p.id, 0, std::nullopt, CloseReason::Manual);
  ASSERT_TRUE(closed.ok());
  EXPECT_DOUBLE_EQ(closed.value().realized_pnl, 100.0);

  auto records = history.closuresByOwner("alice");
  ASSERT_EQ(records.size(), 1u);
  EXPECT_DOUBLE_EQ(records[0].close_price, 2100.0);
  EXPECT_DOUBLE_EQ(wallet.balance("alice"), 1100.0);
}

TEST_F(PositionLedgerTest, FillWithoutMarkIsPairUnavailable) {
  Position restored;
  restored.id = 40;
  restored.owner = "alice";
  restored.pair = "SOL/USDT";
  restored.side = Side::Long;
  restored.leverage = 10;
  restored.entry_price = 20.0;
  restored.size = 10.0;
  restored.collateral = 21.0;
  restored.liquidation_price = 18.1;
  ledger->hydratePosition(restored);

  EXPECT_EQ(ledger->close(40, 0, std::nullopt, CloseReason::Manual).error(),
            ErrorCode::PairUnavailable);
  EXPECT_EQ(
      ledger->liquidate(40, 0, std::nullopt, LiquidationType::Forced).error(),
      ErrorCode::PairUnavailable);
  EXPECT_EQ(ledger->get(40)->version, 0u);
}

// =============================================================================
// liquidate()
// =============================================================================
TEST_F(PositionLedgerTest, LiquidateIsolatedBelowLiquidationPrice) {
  Position p = openOk(ethLong());
  clock.advance_time(2000);

  auto record = ledger->liquidate(p.id, 0, 1792.0, LiquidationType::Auto);
  ASSERT_TRUE(record.ok());
  EXPECT_EQ(record.value().position_id, p.id);
  EXPECT_DOUBLE_EQ(record.value().liquidation_price, 1810.0);
  EXPECT_DOUBLE_EQ(record.value().mark_price, 1792.0);
  EXPECT_DOUBLE_EQ(record.value().loss_amount, 208.0);
  EXPECT_DOUBLE_EQ(record.value().remaining_collateral, 2.0);
  EXPECT_DOUBLE_EQ(record.value().released_amount, 2.0);
  EXPECT_EQ(record.value().type, LiquidationType::Auto);
  EXPECT_EQ(record.value().liquidated_at_ms, 2000);

  auto after = ledger->get(p.id);
  ASSERT_TRUE(after.has_value());
  EXPECT_EQ(after->status, PositionStatus::Liquidated);
  EXPECT_EQ(after->version, 1u);
  EXPECT_DOUBLE_EQ(after->realized_pnl, -208.0);

  EXPECT_DOUBLE_EQ(wallet.balance("alice"), 792.0);
  EXPECT_EQ(wallet.releaseCount(p.reservation_id), 1u);

  ASSERT_EQ(liquidations.size(), 1u);
  EXPECT_EQ(liquidations[0].record.id, record.value().id);
  EXPECT_EQ(updates.back().change, PositionChange::Liquidated);
}

TEST_F(PositionLedgerTest, GapLiquidationKeepsShortfallAndReleasesNothing) {
  Position p = openOk(ethLong());

  auto record = ledger->liquidate(p.id, 0, 1500.0, LiquidationType::Auto);
  ASSERT_TRUE(record.ok());
  EXPECT_DOUBLE_EQ(record.value().loss_amount, 500.0);
  EXPECT_DOUBLE_EQ(record.value().remaining_collateral, -290.0);
  EXPECT_DOUBLE_EQ(record.value().released_amount, 0.0);
  EXPECT_DOUBLE_EQ(wallet.balance("alice"), 790.0);
}

TEST_F(PositionLedgerTest, LiquidationHappensExactlyOnce) {
  Position p = openOk(ethLong());

  ASSERT_TRUE(ledger->liquidate(p.id, 0, 1792.0, LiquidationType::Auto).ok());
  EXPECT_EQ(
      ledger->liquidate(p.id, 0, 1792.0, LiquidationType::Auto).error(),
      ErrorCode::VersionConflict);
  EXPECT_EQ(
      ledger->liquidate(p.id, 1, 1792.0, LiquidationType::Forced).error(),
      ErrorCode::PositionNotOpen);

  EXPECT_EQ(history.liquidationsByPosition(p.id).size(), 1u);
  EXPECT_EQ(liquidations.size(), 1u);
  EXPECT_EQ(wallet.releaseCount(p.reservation_id), 1u);
}

TEST_F(PositionLedgerTest, LiquidationLossIncludesOutstandingOpenFee) {
  build(margin::domain::MarginParams{});
  Position p = openOk(ethLong());

  auto record = ledger->liquidate(p.id, 0, 1792.0, LiquidationType::Manual);
  ASSERT_TRUE(record.ok());
  EXPECT_DOUBLE_EQ(record.value().loss_amount, 214.0);
  EXPECT_DOUBLE_EQ(record.value().remaining_collateral, -4.0);
  EXPECT_DOUBLE_EQ(record.value().released_amount, 0.0);
}

// -----------------------------------------------------------------------------
// A failed audit append leaves the position and the wallet untouched.
// -----------------------------------------------------------------------------
TEST_F(PositionLedgerTest, HistoryFailureAbortsTransition) {
  FailingHistory failing;
  build(zeroFees(), {}, &failing);
  Position p = openOk(ethLong());

  EXPECT_EQ(
      ledger->liquidate(p.id, 0, 1792.0, LiquidationType::Auto).error(),
      ErrorCode::HistoryUnavailable);
  EXPECT_EQ(ledger->close(p.id, 0, 2000.0, CloseReason::Manual).error(),
            ErrorCode::HistoryUnavailable);

  auto after = ledger->get(p.id);
  ASSERT_TRUE(after.has_value());
  EXPECT_TRUE(after->isOpen());
  EXPECT_EQ(after->version, 0u);
  EXPECT_DOUBLE_EQ(wallet.balance("alice"), 790.0);
  EXPECT_TRUE(liquidations.empty());
}

// =============================================================================
// Cross margin
// =============================================================================
TEST_F(PositionLedgerTest, CrossSiblingsShareCollateral) {
  Position a = openOk(ethLong(MarginMode::Cross));
  EXPECT_DOUBLE_EQ(a.liquidation_price, 1810.0);

  updates.clear();
  Position b = openOk(btcShort(MarginMode::Cross));
  EXPECT_DOUBLE_EQ(b.liquidation_price, 100.0 + 209.0);

  // A was repriced against the pooled collateral without a version bump.
  auto a_now = ledger->get(a.id);
  ASSERT_TRUE(a_now.has_value());
  EXPECT_DOUBLE_EQ(a_now->liquidation_price, 2000.0 - 209.0);
  EXPECT_EQ(a_now->version, 0u);

  ASSERT_EQ(updates.size(), 2u);
  EXPECT_EQ(updates[0].change, PositionChange::Opened);
  EXPECT_EQ(updates[1].change, PositionChange::Repriced);
  EXPECT_EQ(updates[1].position.id, a.id);
}

TEST_F(PositionLedgerTest, IsolatedPositionIgnoresCrossSiblings) {
  openOk(btcShort(MarginMode::Cross));
  Position iso = openOk(ethLong(MarginMode::Isolated));
  EXPECT_DOUBLE_EQ(iso.liquidation_price, 1810.0);
  EXPECT_EQ(ledger->crossGroup("alice").size(), 1u);
}

// -----------------------------------------------------------------------------
// Recomputing from a crossGroup() snapshot lands on exactly the stored value.
// -----------------------------------------------------------------------------
TEST_F(PositionLedgerTest, StoredCrossLiquidationPricesDoNotDrift) {
  openOk(ethLong(MarginMode::Cross));
  Position b = openOk(btcShort(MarginMode::Cross));
  OpenRequest third = ethLong(MarginMode::Cross);
  third.size = 0.3;
  third.collateral = 77.7;
  openOk(third);

  ASSERT_TRUE(ledger->adjustCollateral(b.id, 0, 13.37).ok());

  const auto group = ledger->crossGroup("alice");
  ASSERT_EQ(group.size(), 3u);
  for (const auto& p : group) {
    auto recomputed = ledger->calculator().crossLiquidationPrice(p, group);
    ASSERT_TRUE(recomputed.ok());
    EXPECT_DOUBLE_EQ(recomputed.value, p.liquidation_price)
        << "position " << p.id;
  }
}

TEST_F(PositionLedgerTest, ClosingCrossMemberRepricesTheRest) {
  Position a = openOk(ethLong(MarginMode::Cross));
  Position b = openOk(btcShort(MarginMode::Cross));

  ASSERT_TRUE(ledger->close(b.id, 0, 100.0, CloseReason::Manual).ok());

  auto a_now = ledger->get(a.id);
  ASSERT_TRUE(a_now.has_value());
  EXPECT_DOUBLE_EQ(a_now->liquidation_price, 1810.0);
  EXPECT_EQ(a_now->version, 0u);
}

// -----------------------------------------------------------------------------
// A cross close losing more than its own collateral charges the excess to the
// siblings, pro rata, instead of dropping it.
// -----------------------------------------------------------------------------
TEST_F(PositionLedgerTest, CrossCloseChargesExcessLossToSiblings) {
  wallet.deposit("dave", 100000.0);
  Position a = openOk(ethLong(MarginMode::Cross, "dave"));
  OpenRequest rb = btcShort(MarginMode::Cross, "dave");
  rb.collateral = 5000.0;
  Position b = openOk(rb);
  updates.clear();

  // Loss 300 against 210 of own collateral: 90 is owed by B.
  auto closed = ledger->close(a.id, 0, 1700.0, CloseReason::Manual);
  ASSERT_TRUE(closed.ok());
  EXPECT_DOUBLE_EQ(history.closuresByOwner("dave")[0].released_amount, 0.0);

  auto b_now = ledger->get(b.id);
  ASSERT_TRUE(b_now.has_value());
  EXPECT_DOUBLE_EQ(b_now->collateral, 4910.0);
  EXPECT_EQ(b_now->version, 1u);

  bool debit_published = false;
  for (const auto& u : updates) {
    debit_published = debit_published ||
                      (u.position.id == b.id &&
                       u.change == PositionChange::CollateralAdjusted);
  }
  EXPECT_TRUE(debit_published);

  ASSERT_TRUE(ledger->close(b.id, 1, 100.0, CloseReason::Manual).ok());
  EXPECT_DOUBLE_EQ(wallet.balance("dave"), 99700.0);
}

TEST_F(PositionLedgerTest, CrossCloseRefusedWhenSiblingsCannotCoverLoss) {
  Position a = openOk(ethLong(MarginMode::Cross));
  Position b = openOk(btcShort(MarginMode::Cross));

  // Excess 290 against a pool of 20.
  EXPECT_EQ(ledger->close(a.id, 0, 1500.0, CloseReason::Manual).error(),
            ErrorCode::InsufficientCollateral);

  EXPECT_TRUE(ledger->get(a.id)->isOpen());
  EXPECT_EQ(ledger->get(a.id)->version, 0u);
  EXPECT_DOUBLE_EQ(ledger->get(b.id)->collateral, 20.0);
  EXPECT_TRUE(history.closuresByOwner("alice").empty());
}

TEST_F(PositionLedgerTest, GroupLiquidationNetsShortfall) {
  Position a = openOk(ethLong(MarginMode::Cross));
  Position b = openOk(btcShort(MarginMode::Cross));

  margin::domain::GroupLiquidation group;
  group.owner = "alice";
  group.members = {{a.id, 0, 1814.0}, {b.id, 0, 125.0}};

  auto result = ledger->liquidateGroup(group);
  ASSERT_TRUE(result.ok());
  ASSERT_EQ(result.value().size(), 2u);

  const auto& ra = result.value()[0];
  const auto& rb = result.value()[1];
  EXPECT_DOUBLE_EQ(ra.remaining_collateral, 24.0);
  EXPECT_DOUBLE_EQ(rb.remaining_collateral, -5.0);
  EXPECT_DOUBLE_EQ(ra.released_amount, 19.0);
  EXPECT_DOUBLE_EQ(rb.released_amount, 0.0);

  EXPECT_DOUBLE_EQ(wallet.balance("alice"), 1000.0 - 230.0 + 19.0);
  EXPECT_TRUE(ledger->crossGroup("alice").empty());
  EXPECT_EQ(liquidations.size(), 2u);
}

TEST_F(PositionLedgerTest, GroupLiquidationSkipsStaleMembers) {
  Position a = openOk(ethLong(MarginMode::Cross));
  Position b = openOk(btcShort(MarginMode::Cross));
  ASSERT_TRUE(ledger->adjustCollateral(b.id, 0, 5.0).ok());

  margin::domain::GroupLiquidation group;
  group.owner = "alice";
  group.members = {{a.id, 0, 1814.0}, {b.id, 0, 125.0}};

  auto result = ledger->liquidateGroup(group);
  ASSERT_TRUE(result.ok());
  ASSERT_EQ(result.value().size(), 1u);
  EXPECT_EQ(result.value()[0].position_id, a.id);
  EXPECT_TRUE(ledger->get(b.id)->isOpen());
}

TEST_F(PositionLedgerTest, GroupLiquidationRejectsForeignOrIsolatedMembers) {
  Position iso = openOk(ethLong(MarginMode::Isolated));
  Position bobs = openOk(btcShort(MarginMode::Cross, "bob"));

  margin::domain::GroupLiquidation group;
  group.owner = "alice";
  group.members = {{iso.id, 0, 1814.0}, {bobs.id, 0, 125.0}};
  EXPECT_EQ(ledger->liquidateGroup(group).error(), ErrorCode::InvalidRequest);

  group.members.clear();
  EXPECT_EQ(ledger->liquidateGroup(group).error(), ErrorCode::InvalidRequest);
}

// =============================================================================
// Queries and hydration
// =============================================================================
TEST_F(PositionLedgerTest, ReadsCarryMarkDerivedFields) {
  Position p = openOk(ethLong());
  tick("ETH/USDT", 2100.0);

  auto now = ledger->get(p.id);
  ASSERT_TRUE(now.has_value());
  EXPECT_DOUBLE_EQ(now->mark_price, 2100.0);
  EXPECT_DOUBLE_EQ(now->unrealized_pnl, 100.0);
  EXPECT_DOUBLE_EQ(now->entry_price, 2000.0);
}

TEST_F(PositionLedgerTest, HydrateRestoresAndReseedsIds) {
  Position restored;
  restored.id = 50;
  restored.owner = "alice";
  restored.pair = "eth_usdt";
  restored.side = Side::Long;
  restored.leverage = 10;
  restored.entry_price = 1900.0;
  restored.size = 1.0;
  restored.collateral = 200.0;
  restored.liquidation_price = 1719.0;
  restored.version = 4;
  ledger->hydratePosition(restored);

  auto got = ledger->get(50);
  ASSERT_TRUE(got.has_value());
  EXPECT_EQ(got->pair, "ETH/USDT");
  EXPECT_EQ(got->version, 4u);
  EXPECT_EQ(updates.back().change, PositionChange::Hydrated);

  EXPECT_EQ(openOk(ethLong()).id, 51u);
  EXPECT_EQ(ledger->openPositions().size(), 2u);
}

// -----------------------------------------------------------------------------
// After a restart over the same journal, new positions never reuse an id the
// history already names.
// -----------------------------------------------------------------------------
TEST_F(PositionLedgerTest, PositionIdsContinueAboveReplayedJournal) {
  const std::string path =
      ::testing::TempDir() + "margin_ledger_restart.jsonl";
  std::remove(path.c_str());

  margin::domain::PositionId first_id = 0;
  {
    margin::JournalHistoryRecorder journal(path);
    build(zeroFees(), {}, &journal);
    Position p = openOk(ethLong());
    first_id = p.id;
    ASSERT_TRUE(
        ledger->liquidate(p.id, 0, 1792.0, LiquidationType::Auto).ok());
    ledger.reset();
  }

  margin::JournalHistoryRecorder replayed(path);
  EXPECT_EQ(replayed.maxPositionId(), first_id);
  build(zeroFees(), {}, &replayed);

  Position fresh = openOk(ethLong());
  EXPECT_GT(fresh.id, first_id);
  EXPECT_TRUE(replayed.liquidationsByPosition(fresh.id).empty());
  EXPECT_EQ(replayed.liquidationsByPosition(first_id).size(), 1u);

  ledger.reset();
  std::remove(path.c_str());
}

// =============================================================================
// Concurrency
// =============================================================================
// -----------------------------------------------------------------------------
// Eight writers race on version 0: one commits, seven see VersionConflict.
// -----------------------------------------------------------------------------
TEST_F(PositionLedgerTest, ConcurrentWritersOnOneVersionExactlyOneWins) {
  Position p = openOk(ethLong());

  constexpr int kWriters = 8;
  std::atomic<int> ok{0};
  std::atomic<int> conflicts{0};
  std::atomic<bool> go{false};

  std::vector<std::thread> writers;
  for (int i = 0; i < kWriters; ++i) {
    writers.emplace_back([&] {
      while (!go.load()) {
        std::this_thread::yield();
      }
      auto r = ledger->adjustCollateral(p.id, 0, 10.0);
      if (r.ok()) {
        ++ok;
      } else if (r.error() == ErrorCode::VersionConflict) {
        ++conflicts;
      }
    });
  }
  go = true;
  for (auto& t : writers) t.join();

  EXPECT_EQ(ok.load(), 1);
  EXPECT_EQ(conflicts.load(), kWriters - 1);

  auto after = ledger->get(p.id);
  ASSERT_TRUE(after.has_value());
  EXPECT_EQ(after->version, 1u);
  EXPECT_DOUBLE_EQ(after->collateral, 220.0);
  EXPECT_DOUBLE_EQ(wallet.balance("alice"), 780.0);
}

// -----------------------------------------------------------------------------
// Writers that re-read the version and retry after a conflict: every success
// commits exactly one version and one top-up.
// -----------------------------------------------------------------------------
TEST_F(PositionLedgerTest, RetryingWritersCommitOneVersionPerSuccess) {
  Position p = openOk(ethLong());

  constexpr int kWriters = 4;
  constexpr int kRoundsPerWriter = 25;
  std::atomic<int> ok{0};
  std::atomic<int> unexpected{0};
  std::atomic<bool> go{false};

  std::vector<std::thread> writers;
  for (int i = 0; i < kWriters; ++i) {
    writers.emplace_back([&] {
      while (!go.load()) {
        std::this_thread::yield();
      }
      for (int round = 0; round < kRoundsPerWriter;) {
        auto current = ledger->get(p.id);
        if (!current) {
          ++unexpected;
          return;
        }
        auto r = ledger->adjustCollateral(p.id, current->version, 1.0);
        if (r.ok()) {
          ++ok;
          ++round;
        } else if (r.error() != ErrorCode::VersionConflict) {
          ++unexpected;
          return;
        }
      }
    });
  }
  go = true;
  for (auto& t : writers) t.join();

  EXPECT_EQ(unexpected.load(), 0);
  EXPECT_EQ(ok.load(), kWriters * kRoundsPerWriter);

  auto after = ledger->get(p.id);
  ASSERT_TRUE(after.has_value());
  EXPECT_EQ(after->version, static_cast<std::uint64_t>(ok.load()));
  EXPECT_DOUBLE_EQ(after->collateral, 210.0 + ok.load());
  EXPECT_DOUBLE_EQ(wallet.balance("alice"), 790.0 - ok.load());
  EXPECT_DOUBLE_EQ(wallet.totalReserved("alice"), 210.0 + ok.load());
}
