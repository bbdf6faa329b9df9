// =============================================================================
// margin_engine_test.cpp
// =============================================================================
// Unit tests for margin::MarginEngine.
//
// Validates:
//   - Lifecycle: start() / stop() / destructor, both idempotent
//   - pushPriceTick() drives the monitor loop end-to-end to a liquidation
//   - Ticks before start() only set marks
//   - Warm-up hydration before start()
//   - executeCommand() JSON round trips for requests, queries and settings
//   - Closes over the command socket fill at the mark, never a client price
//
// Design: Each test creates its own MarginEngine with every endpoint empty,
// so no ZeroMQ sockets are opened.
// =============================================================================

#include "margin/engine/margin_engine.hpp"
#include "margin/events/liquidation_event.hpp"
#include "margin/ledger/in_memory_wallet.hpp"
#include "margin/time/simulation_time_provider.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <future>
#include <string>

using margin::domain::MarginMode;
using margin::domain::PositionStatus;
using margin::domain::Side;
using nlohmann::json;

namespace {

margin::EngineConfig testConfig() {
  margin::EngineConfig config;
  config.margin.trading_fee_rate = 0.0;
  config.worker_threads = 2;
  config.price_feed_endpoint.clear();
  config.command_endpoint.clear();
  config.telemetry_endpoint.clear();
  return config;
}

}  // namespace

class MarginEngineTestFixture : public ::testing::Test {
 protected:
  margin::SimulationTimeProvider sim_clock{1700000000000};
  margin::InMemoryWallet wallet;
  std::int64_t next_ts_{1};

  void SetUp() override { wallet.deposit("alice", 10000.0); }

  void tick(margin::MarginEngine& engine, const std::string& symbol,
            double price) {
    engine.pushPriceTick(margin::PriceTickEvent{symbol, price, next_ts_++, 0});
  }

  // 1 ETH long at 2000, 10x, 210 collateral: isolated liquidation at 1810.
  margin::domain::Position openEthLong(margin::MarginEngine& engine) {
    margin::domain::OpenRequest r;
    r.owner = "alice";
    r.pair = "ETH/USDT";
    r.side = Side::Long;
    r.leverage = 10;
    r.size = 1.0;
    r.collateral = 210.0;
    r.mode = MarginMode::Isolated;
    auto outcome = engine.submit(r);
    EXPECT_TRUE(outcome.ok());
    return outcome.ok() ? outcome.value().position
                        : margin::domain::Position{};
  }
};

// -----------------------------------------------------------------------------
// 1. Lifecycle
// -----------------------------------------------------------------------------
TEST_F(MarginEngineTestFixture, IdempotentStartAndStop) {
  margin::MarginEngine engine(testConfig(), sim_clock, wallet);
  EXPECT_FALSE(engine.isRunning());
  EXPECT_EQ(engine.monitorEventBus(), nullptr);

  engine.start();
  engine.start();
  EXPECT_TRUE(engine.isRunning());
  EXPECT_NE(engine.monitorEventBus(), nullptr);

  engine.stop();
  engine.stop();
  EXPECT_FALSE(engine.isRunning());
}

TEST_F(MarginEngineTestFixture, DestructorStopsThreads) {
  {
    margin::MarginEngine engine(testConfig(), sim_clock, wallet);
    engine.start();
    tick(engine, "ETH/USDT", 2000.0);
  }
  SUCCEED();
}

// -----------------------------------------------------------------------------
// 2. End to end: a tick through the monitor loop liquidates a position and
//    the LiquidationEvent reaches an external subscriber.
// -----------------------------------------------------------------------------
TEST_F(MarginEngineTestFixture, TickDrivesLiquidationEndToEnd) {
  margin::MarginEngine engine(testConfig(), sim_clock, wallet);

  std::promise<margin::LiquidationEvent> promise;
  auto future = promise.get_future();
  std::atomic<bool> fired{false};
  engine.eventBus().subscribe<margin::LiquidationEvent>(
      [&](const margin::LiquidationEvent& e) {
        if (!fired.exchange(true)) {
          promise.set_value(e);
        }
      });

  engine.start();
  tick(engine, "eth-usdt", 2000.0);
  engine.waitIdle();

  auto p = openEthLong(engine);
  EXPECT_DOUBLE_EQ(p.liquidation_price, 1810.0);

  tick(engine, "ETH/USDT", 1792.0);
  engine.waitIdle();

  ASSERT_EQ(future.wait_for(std::chrono::seconds(2)),
            std::future_status::ready)
      << "Timed out: tick did not produce a LiquidationEvent";

  auto event = future.get();
  EXPECT_EQ(event.record.position_id, p.id);
  EXPECT_EQ(event.record.type, margin::domain::LiquidationType::Auto);
  EXPECT_DOUBLE_EQ(event.record.mark_price, 1792.0);
  EXPECT_DOUBLE_EQ(event.record.loss_amount, 208.0);

  EXPECT_EQ(engine.position(p.id)->status, PositionStatus::Liquidated);
  EXPECT_EQ(engine.liquidationsByOwner("alice").size(), 1u);
  EXPECT_EQ(engine.liquidationsByPosition(p.id).size(), 1u);
  EXPECT_EQ(engine.monitorStats().liquidations, 1u);
  EXPECT_TRUE(engine.openPositions().empty());

  engine.stop();
  EXPECT_DOUBLE_EQ(wallet.balance("alice"), 10000.0 - 208.0);
}

TEST_F(MarginEngineTestFixture, TicksBeforeStartOnlySetMarks) {
  margin::MarginEngine engine(testConfig(), sim_clock, wallet);

  tick(engine, "ETH/USDT", 2000.0);
  auto p = openEthLong(engine);

  tick(engine, "ETH/USDT", 1792.0);
  EXPECT_EQ(engine.position(p.id)->status, PositionStatus::Open);
  EXPECT_DOUBLE_EQ(engine.position(p.id)->mark_price, 1792.0);

  engine.start();
  engine.waitIdle();
  EXPECT_EQ(engine.position(p.id)->status, PositionStatus::Open);

  tick(engine, "ETH/USDT", 1791.0);
  engine.waitIdle();
  EXPECT_EQ(engine.position(p.id)->status, PositionStatus::Liquidated);
  engine.stop();
}

TEST_F(MarginEngineTestFixture, HydratedPositionIsMonitoredAfterStart) {
  margin::MarginEngine engine(testConfig(), sim_clock, wallet);

  margin::domain::Position restored;
  restored.id = 50;
  restored.owner = "alice";
  restored.pair = "ETH/USDT";
  restored.side = Side::Long;
  restored.leverage = 10;
  restored.entry_price = 2000.0;
  restored.size = 1.0;
  restored.collateral = 210.0;
  restored.liquidation_price = 1810.0;
  restored.mode = MarginMode::Isolated;
  engine.hydratePosition(restored);

  ASSERT_EQ(engine.positionsByOwner("alice").size(), 1u);

  engine.start();
  tick(engine, "ETH/USDT", 1792.0);
  engine.waitIdle();

  EXPECT_EQ(engine.liquidationsByPosition(50).size(), 1u);
  EXPECT_EQ(engine.position(50)->status, PositionStatus::Liquidated);
  engine.stop();
}

// -----------------------------------------------------------------------------
// 3. executeCommand()
// -----------------------------------------------------------------------------
TEST_F(MarginEngineTestFixture, PingReturnsPong) {
  margin::MarginEngine engine(testConfig(), sim_clock, wallet);
  auto response = json::parse(engine.executeCommand(R"({"cmd":"ping"})"));
  EXPECT_EQ(response.at("status").get<std::string>(), "ok");
  EXPECT_EQ(response.at("response").get<std::string>(), "pong");
}

TEST_F(MarginEngineTestFixture, CommandsOpenQueryAndConflict) {
  margin::MarginEngine engine(testConfig(), sim_clock, wallet);
  tick(engine, "ETH/USDT", 2000.0);

  auto opened = json::parse(engine.executeCommand(
      R"({"cmd":"open","owner":"alice","pair":"eth_usdt","side":"long",)"
      R"("leverage":10,"size":1,"collateral":210})"));
  ASSERT_EQ(opened.at("status").get<std::string>(), "ok") << opened.dump();
  const auto id = opened.at("position").at("id").get<std::uint64_t>();
  EXPECT_EQ(opened.at("position").at("pair").get<std::string>(), "ETH/USDT");
  EXPECT_EQ(opened.at("position").at("version").get<std::uint64_t>(), 0u);
  EXPECT_DOUBLE_EQ(
      opened.at("position").at("liquidation_price").get<double>(), 1810.0);

  auto listed = json::parse(
      engine.executeCommand(R"({"cmd":"positions","owner":"alice"})"));
  ASSERT_EQ(listed.at("positions").size(), 1u);
  EXPECT_EQ(listed.at("positions")[0].at("id").get<std::uint64_t>(), id);

  json adjust = {{"cmd", "adjust"},
                 {"position_id", id},
                 {"expected_version", 5},
                 {"delta", 10}};
  auto conflict = json::parse(engine.executeCommand(adjust.dump()));
  EXPECT_EQ(conflict.at("status").get<std::string>(), "error");
  EXPECT_EQ(conflict.at("error").get<std::string>(), "VersionConflict");
  EXPECT_TRUE(conflict.at("retryable").get<bool>());

  adjust["expected_version"] = 0;
  auto adjusted = json::parse(engine.executeCommand(adjust.dump()));
  ASSERT_EQ(adjusted.at("status").get<std::string>(), "ok");
  EXPECT_EQ(adjusted.at("position").at("version").get<std::uint64_t>(), 1u);

  auto missing = json::parse(
      engine.executeCommand(R"({"cmd":"positions","position_id":999})"));
  EXPECT_EQ(missing.at("error").get<std::string>(), "PositionNotFound");
}

// -----------------------------------------------------------------------------
// A close over the command socket fills at the oracle mark; a caller-chosen
// price is refused and leaves the position and the wallet alone.
// -----------------------------------------------------------------------------
TEST_F(MarginEngineTestFixture, CloseCommandFillsAtMarkOnly) {
  margin::MarginEngine engine(testConfig(), sim_clock, wallet);
  tick(engine, "ETH/USDT", 2000.0);
  const auto p = openEthLong(engine);

  json close = {{"cmd", "close"},
                {"position_id", p.id},
                {"expected_version", 0},
                {"price", 1000000}};
  auto refused = json::parse(engine.executeCommand(close.dump()));
  EXPECT_EQ(refused.at("error").get<std::string>(), "InvalidRequest");
  EXPECT_TRUE(engine.position(p.id)->isOpen());
  EXPECT_DOUBLE_EQ(wallet.balance("alice"), 9790.0);

  tick(engine, "ETH/USDT", 2100.0);
  close.erase("price");
  auto closed = json::parse(engine.executeCommand(close.dump()));
  ASSERT_EQ(closed.at("status").get<std::string>(), "ok") << closed.dump();
  EXPECT_EQ(engine.position(p.id)->status, PositionStatus::Closed);
  EXPECT_DOUBLE_EQ(wallet.balance("alice"), 10100.0);
}

TEST_F(MarginEngineTestFixture, RiskReportCommand) {
  margin::MarginEngine engine(testConfig(), sim_clock, wallet);
  tick(engine, "ETH/USDT", 2000.0);
  openEthLong(engine);

  auto response =
      json::parse(engine.executeCommand(R"({"cmd":"risk","owner":"alice"})"));
  ASSERT_EQ(response.at("status").get<std::string>(), "ok");
  const auto& report = response.at("report");
  EXPECT_EQ(report.at("owner").get<std::string>(), "alice");
  ASSERT_EQ(report.at("positions").size(), 1u);
  EXPECT_EQ(report.at("positions")[0].at("zone").get<std::string>(), "safe");
  EXPECT_EQ(report.at("zones").at("safe").get<std::size_t>(), 1u);
  EXPECT_DOUBLE_EQ(report.at("total_collateral").get<double>(), 210.0);
}

TEST_F(MarginEngineTestFixture, SetLeverageCommandMergesAndValidates) {
  margin::MarginEngine engine(testConfig(), sim_clock, wallet);

  auto stored = json::parse(engine.executeCommand(
      R"({"cmd":"set_leverage","owner":"alice","max_leverage":50,)"
      R"("default_mode":"cross"})"));
  ASSERT_EQ(stored.at("status").get<std::string>(), "ok") << stored.dump();
  EXPECT_EQ(stored.at("setting").at("max_leverage").get<int>(), 50);
  EXPECT_EQ(stored.at("setting").at("preferred_leverage").get<int>(), 10);
  EXPECT_EQ(stored.at("setting").at("default_mode").get<std::string>(),
            "cross");
  EXPECT_EQ(engine.leverageSetting("alice").default_mode, MarginMode::Cross);

  auto rejected = json::parse(engine.executeCommand(
      R"({"cmd":"set_leverage","owner":"alice","max_leverage":500})"));
  EXPECT_EQ(rejected.at("error").get<std::string>(), "InvalidLeverage");
  EXPECT_EQ(engine.leverageSetting("alice").max_leverage, 50);
}

TEST_F(MarginEngineTestFixture, MalformedCommandIsRejected) {
  margin::MarginEngine engine(testConfig(), sim_clock, wallet);
  auto response = json::parse(engine.executeCommand("{\"cmd\":"));
  EXPECT_EQ(response.at("status").get<std::string>(), "error");
  EXPECT_EQ(response.at("error").get<std::string>(), "InvalidRequest");
  EXPECT_FALSE(response.at("retryable").get<bool>());
}
