#pragma once

#include "margin/concurrent/event_loop_thread.hpp"
#include "margin/concurrent/worker_pool.hpp"
#include "margin/config/engine_config.hpp"
#include "margin/domain/error_code.hpp"
#include "margin/domain/history_records.hpp"
#include "margin/domain/leverage_setting.hpp"
#include "margin/domain/position.hpp"
#include "margin/domain/requests.hpp"
#include "margin/eventbus/event_bus.hpp"
#include "margin/events/event_types.hpp"
#include "margin/execution/execution_coordinator.hpp"
#include "margin/history/journal_history_recorder.hpp"
#include "margin/ledger/i_collateral_wallet.hpp"
#include "margin/ledger/leverage_setting_store.hpp"
#include "margin/ledger/position_ledger.hpp"
#include "margin/network/ipc_server.hpp"
#include "margin/network/price_feed_thread.hpp"
#include "margin/pricing/price_feed_adapter.hpp"
#include "margin/risk/liquidation_monitor.hpp"
#include "margin/risk/position_index.hpp"
#include "margin/risk/risk_report.hpp"
#include "margin/time/i_time_provider.hpp"

#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace margin {

// -----------------------------------------------------------------------------
// MarginEngine
// -----------------------------------------------------------------------------
//
// @brief  Central orchestrator: owns the ledger and its collaborators, the
//         monitor loop, the worker pool and the network threads.
//
// @details
// Thread layout after start():
//
//   price_feed thread   → PriceFeedGateway ZMQ recv loop, pushes ticks
//   monitor loop thread → PriceFeedAdapter::ingest + LiquidationMonitor
//   worker pool threads → monitor submissions (liquidations, trigger closes)
//   ipc thread          → command REP socket + telemetry PUB socket
//   caller's thread     → submit(), queries, stop()
//
// Cross-thread bridges (wired in start()):
//   1. price_feed  →  monitor loop:  PriceTickEvent (via pushPriceTick)
//   2. monitor     →  worker pool:   liquidation / close tasks
//   3. engine bus  →  ipc thread:    PositionUpdateEvent, LiquidationEvent,
//                                    RiskAlertEvent, LiquidationWarningEvent
//
// The state components (wallet borrowing, settings, history, ledger,
// coordinator, index) are built in the constructor, so requests, queries
// and hydratePosition() work before start(). Ticks pushed before start()
// only update marks; nothing is monitored until the loop runs.
//
// Thread model:
//   Constructed, started, stopped and destroyed on one thread (main).
//   submit(), the queries and pushPriceTick() are safe from any thread.
//
// Ownership:
//   MarginEngine
//    ├── bus_                  (EventBus, value)
//    ├── prices_               (PriceFeedAdapter, value)
//    ├── settings_             (LeverageSettingStore, value)
//    ├── history_              (JournalHistoryRecorder, value)
//    ├── ledger_               (PositionLedger, value)
//    ├── coordinator_          (ExecutionCoordinator, value)
//    ├── index_                (PositionIndex, value)
//    ├── monitor_              (unique_ptr<LiquidationMonitor>, from start())
//    ├── pool_                 (unique_ptr<WorkerPool>)
//    ├── monitor_loop_         (unique_ptr<EventLoopThread>)
//    ├── ipc_server_           (unique_ptr<IpcServer>)
//    ├── price_feed_thread_    (unique_ptr<PriceFeedThread>)
//    ├── clock_                (const ITimeProvider&, borrowed)
//    └── wallet_               (ICollateralWallet&, borrowed)
// -----------------------------------------------------------------------------
class MarginEngine {
 public:
  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  //
  // @brief  Builds the state components from the config.
  //
  // @details
  // Replays the history journal when config.journal_path is set; throws
  // std::runtime_error if the journal cannot be opened. No threads are
  // spawned and no sockets are opened.
  // -------------------------------------------------------------------------
  MarginEngine(EngineConfig config, const ITimeProvider& clock,
               ICollateralWallet& wallet);

  ~MarginEngine();

  MarginEngine(const MarginEngine&) = delete;
  MarginEngine& operator=(const MarginEngine&) = delete;
  MarginEngine(MarginEngine&&) = delete;
  MarginEngine& operator=(MarginEngine&&) = delete;

  // -------------------------------------------------------------------------
  // start()
  // -------------------------------------------------------------------------
  //
  // @brief  Starts the worker pool, the monitor loop, the IPC server and
  //         the price feed, in that order. No-op if running.
  //
  // @details
  // The price feed starts last so every subscriber is live before the
  // first tick. Endpoints left empty in the config are skipped.
  // -------------------------------------------------------------------------
  void start();

  // -------------------------------------------------------------------------
  // stop()
  // -------------------------------------------------------------------------
  //
  // @brief  Stops inflow first, drains queued ticks and submissions, then
  //         tears the threads down. Idempotent.
  // -------------------------------------------------------------------------
  void stop();

  bool isRunning() const { return running_; }

  // Queues a raw oracle tick for the monitor loop. Before start() the tick
  // only updates the mark. Thread-safe.
  void pushPriceTick(PriceTickEvent tick);

  // Blocks until every tick pushed so far is evaluated and every submission
  // it caused has finished.
  void waitIdle();

  domain::Result<SubmitOutcome> submit(const domain::Request& request);

  domain::Result<std::vector<domain::LiquidationRecord>> liquidateGroup(
      const domain::GroupLiquidation& group);

  // Warm-up restore; call before start().
  void hydratePosition(const domain::Position& position);

  std::optional<domain::Position> position(domain::PositionId id) const;
  std::vector<domain::Position> positionsByOwner(
      const domain::OwnerId& owner) const;
  std::vector<domain::Position> openPositions() const;

  std::vector<domain::LiquidationRecord> liquidationsByOwner(
      const domain::OwnerId& owner) const;
  std::vector<domain::LiquidationRecord> liquidationsByPosition(
      domain::PositionId id) const;
  std::vector<domain::ClosureRecord> closuresByOwner(
      const domain::OwnerId& owner) const;

  RiskReport riskReport(const domain::OwnerId& owner) const;

  domain::LeverageSetting leverageSetting(const domain::OwnerId& owner) const;
  domain::Result<domain::LeverageSetting> setLeverageSetting(
      domain::LeverageSetting setting);

  MonitorStats monitorStats() const;

  // -------------------------------------------------------------------------
  // executeCommand(cmd)
  // -------------------------------------------------------------------------
  //
  // @brief  Handles one JSON command from the IPC REP socket and returns the
  //         JSON response. See CommandCodec for the wire format.
  //
  // Thread model: Called on the IPC thread, or directly by tests.
  // -------------------------------------------------------------------------
  std::string executeCommand(const std::string& cmd);

  // Bus carrying position updates, liquidations and alerts.
  EventBus& eventBus() { return bus_; }

  // Bus of the monitor loop (price ticks), valid between start() and stop().
  EventBus* monitorEventBus();

  const EngineConfig& config() const { return config_; }

 private:
  void finishTick();

  EngineConfig config_;
  const ITimeProvider& clock_;
  ICollateralWallet& wallet_;

  EventBus bus_;
  PriceFeedAdapter prices_;
  LeverageSettingStore settings_;
  JournalHistoryRecorder history_;
  PositionLedger ledger_;
  ExecutionCoordinator coordinator_;
  PositionIndex index_;

  // Pool tasks call into the monitor: the pool is declared after it so it
  // is joined first.
  std::unique_ptr<LiquidationMonitor> monitor_;
  std::unique_ptr<WorkerPool> pool_;
  std::unique_ptr<EventLoopThread> monitor_loop_;
  std::unique_ptr<IpcServer> ipc_server_;
  std::unique_ptr<PriceFeedThread> price_feed_thread_;

  std::vector<EventBus::SubscriptionId> telemetry_subscriptions_;

  std::mutex ticks_mutex_;
  std::condition_variable ticks_cv_;
  std::size_t pending_ticks_{0};

  bool running_{false};
};

}  // namespace margin
