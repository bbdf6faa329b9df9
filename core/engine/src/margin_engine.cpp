#include "margin/engine/margin_engine.hpp"

#include "margin/events/liquidation_event.hpp"
#include "margin/events/position_update_event.hpp"
#include "margin/events/risk_alert_event.hpp"
#include "margin/history/record_codec.hpp"
#include "margin/network/command_codec.hpp"

#include <nlohmann/json.hpp>

#include <iostream>
#include <type_traits>
#include <utility>
#include <variant>

namespace margin {

// -----------------------------------------------------------------------------
// Constructor: build the state components
// -----------------------------------------------------------------------------
MarginEngine::MarginEngine(EngineConfig config, const ITimeProvider& clock,
                           ICollateralWallet& wallet)
    : config_(std::move(config)),
      clock_(clock),
      wallet_(wallet),
      settings_(config_.default_leverage, config_.margin.max_leverage_ceiling),
      history_(config_.journal_path),
      ledger_(bus_, wallet_, settings_, history_, prices_, clock_,
              config_.margin, config_.tradable_pairs),
      coordinator_(ledger_, settings_),
      index_(bus_) {}

MarginEngine::~MarginEngine() { stop(); }

// -----------------------------------------------------------------------------
// start()
// -----------------------------------------------------------------------------
void MarginEngine::start() {
  if (running_) {
    return;
  }

  // ---  1) Worker pool and monitor -----------------------------------------
  pool_ = std::make_unique<WorkerPool>(config_.worker_threads);
  monitor_ = std::make_unique<LiquidationMonitor>(
      bus_, coordinator_, index_, ledger_, prices_, settings_, *pool_, clock_,
      config_.cross_policy);

  // ---  2) Monitor loop: ingest, then evaluate, one tick at a time ----------
  monitor_loop_ = std::make_unique<EventLoopThread>();
  monitor_loop_->eventBus().subscribe<PriceTickEvent>(
      [this](const PriceTickEvent& tick) {
        if (auto accepted = prices_.ingest(tick)) {
          monitor_->onTick(*accepted);
        }
        finishTick();
      });
  monitor_loop_->start();

  // ---  3) IPC server and telemetry bridges ----------------------------------
  if (!config_.command_endpoint.empty() &&
      !config_.telemetry_endpoint.empty()) {
    ipc_server_ = std::make_unique<IpcServer>(
        [this](const std::string& cmd) { return executeCommand(cmd); },
        config_.command_endpoint, config_.telemetry_endpoint);
    ipc_server_->start();

    telemetry_subscriptions_.push_back(bus_.subscribe<PositionUpdateEvent>(
        [this](const PositionUpdateEvent& e) { ipc_server_->pushTelemetry(e); }));
    telemetry_subscriptions_.push_back(bus_.subscribe<LiquidationEvent>(
        [this](const LiquidationEvent& e) { ipc_server_->pushTelemetry(e); }));
    telemetry_subscriptions_.push_back(bus_.subscribe<RiskAlertEvent>(
        [this](const RiskAlertEvent& e) { ipc_server_->pushTelemetry(e); }));
    telemetry_subscriptions_.push_back(
        bus_.subscribe<LiquidationWarningEvent>(
            [this](const LiquidationWarningEvent& e) {
              ipc_server_->pushTelemetry(e);
            }));
  }

  // ---  4) Price feed LAST (ticks begin flowing) ----------------------------
  if (!config_.price_feed_endpoint.empty()) {
    price_feed_thread_ = std::make_unique<PriceFeedThread>(
        [this](PriceTickEvent tick) { pushPriceTick(std::move(tick)); },
        config_.price_feed_endpoint);
    price_feed_thread_->start();
  }

  running_ = true;

  std::cout << "[MarginEngine] started. Threads: monitor, "
            << pool_->threadCount() << " worker(s)"
            << (ipc_server_ ? ", ipc" : "")
            << (price_feed_thread_ ? ", price_feed" : "") << ". Policy: "
            << domain::toString(config_.cross_policy) << ".\n";
}

// -----------------------------------------------------------------------------
// stop()
// -----------------------------------------------------------------------------
void MarginEngine::stop() {
  if (!running_) {
    return;
  }

  // ---  1) Stop tick inflow FIRST -------------------------------------------
  price_feed_thread_.reset();

  // ---  2) Drain queued ticks, then the submissions they caused -------------
  monitor_loop_->stop();
  pool_->shutdown();

  // ---  3) Stop IPC (no more commands), then drop the bridges ---------------
  if (ipc_server_) {
    ipc_server_->stop();
  }
  for (auto id : telemetry_subscriptions_) {
    bus_.unsubscribe(id);
  }
  telemetry_subscriptions_.clear();
  ipc_server_.reset();

  // ---  4) Destroy the loop and the pool before the monitor they call -------
  monitor_loop_.reset();
  pool_.reset();
  monitor_.reset();

  {
    std::lock_guard lock(ticks_mutex_);
    pending_ticks_ = 0;
  }
  ticks_cv_.notify_all();

  running_ = false;

  std::cout << "[MarginEngine] stopped. All threads joined.\n";
}

// -----------------------------------------------------------------------------
// pushPriceTick() / waitIdle()
// -----------------------------------------------------------------------------
void MarginEngine::pushPriceTick(PriceTickEvent tick) {
  if (!monitor_loop_) {
    prices_.ingest(tick);
    return;
  }

  {
    std::lock_guard lock(ticks_mutex_);
    ++pending_ticks_;
  }
  if (!monitor_loop_->push(std::move(tick))) {
    finishTick();
  }
}

void MarginEngine::finishTick() {
  {
    std::lock_guard lock(ticks_mutex_);
    if (pending_ticks_ > 0) {
      --pending_ticks_;
    }
  }
  ticks_cv_.notify_all();
}

void MarginEngine::waitIdle() {
  {
    std::unique_lock lock(ticks_mutex_);
    ticks_cv_.wait(lock, [this] { return pending_ticks_ == 0; });
  }
  if (monitor_) {
    monitor_->waitIdle();
  }
}

// -----------------------------------------------------------------------------
// Requests and queries
// -----------------------------------------------------------------------------
domain::Result<SubmitOutcome> MarginEngine::submit(
    const domain::Request& request) {
  return coordinator_.submit(request);
}

domain::Result<std::vector<domain::LiquidationRecord>>
MarginEngine::liquidateGroup(const domain::GroupLiquidation& group) {
  return coordinator_.liquidateGroup(group);
}

void MarginEngine::hydratePosition(const domain::Position& position) {
  ledger_.hydratePosition(position);
}

std::optional<domain::Position> MarginEngine::position(
    domain::PositionId id) const {
  return ledger_.get(id);
}

std::vector<domain::Position> MarginEngine::positionsByOwner(
    const domain::OwnerId& owner) const {
  return ledger_.positionsByOwner(owner);
}

std::vector<domain::Position> MarginEngine::openPositions() const {
  return ledger_.openPositions();
}

std::vector<domain::LiquidationRecord> MarginEngine::liquidationsByOwner(
    const domain::OwnerId& owner) const {
  return history_.liquidationsByOwner(owner);
}

std::vector<domain::LiquidationRecord> MarginEngine::liquidationsByPosition(
    domain::PositionId id) const {
  return history_.liquidationsByPosition(id);
}

std::vector<domain::ClosureRecord> MarginEngine::closuresByOwner(
    const domain::OwnerId& owner) const {
  return history_.closuresByOwner(owner);
}

RiskReport MarginEngine::riskReport(const domain::OwnerId& owner) const {
  return buildRiskReport(owner, ledger_.positionsByOwner(owner),
                         prices_.marks(), ledger_.calculator());
}

domain::LeverageSetting MarginEngine::leverageSetting(
    const domain::OwnerId& owner) const {
  return settings_.get(owner);
}

domain::Result<domain::LeverageSetting> MarginEngine::setLeverageSetting(
    domain::LeverageSetting setting) {
  return settings_.put(std::move(setting));
}

MonitorStats MarginEngine::monitorStats() const {
  return monitor_ ? monitor_->stats() : MonitorStats{};
}

EventBus* MarginEngine::monitorEventBus() {
  return monitor_loop_ ? &monitor_loop_->eventBus() : nullptr;
}

// -----------------------------------------------------------------------------
// executeCommand(): handle IPC command requests
// -----------------------------------------------------------------------------
std::string MarginEngine::executeCommand(const std::string& cmd) {
  auto decoded = decodeCommand(cmd);
  if (!decoded.ok()) {
    std::cerr << "[MarginEngine] rejected command: " << cmd << "\n";
    return encodeError(decoded.error());
  }

  return std::visit(
      [this](const auto& command) -> std::string {
        using T = std::decay_t<decltype(command)>;
        nlohmann::json response;
        response["status"] = "ok";

        if constexpr (std::is_same_v<T, domain::Request>) {
          auto outcome = coordinator_.submit(command);
          if (!outcome.ok()) {
            return encodeError(outcome.error());
          }
          response["position"] = positionToJson(outcome.value().position);
          if (outcome.value().liquidation) {
            response["liquidation"] = toJson(*outcome.value().liquidation);
          }
        } else if constexpr (std::is_same_v<T, QueryCommand>) {
          switch (command.kind) {
            case QueryCommand::Kind::Ping:
              response["response"] = "pong";
              break;

            case QueryCommand::Kind::Positions: {
              nlohmann::json list = nlohmann::json::array();
              if (command.position_id) {
                auto p = ledger_.get(*command.position_id);
                if (!p) {
                  return encodeError(domain::ErrorCode::PositionNotFound);
                }
                list.push_back(positionToJson(*p));
              } else {
                for (const auto& p : ledger_.positionsByOwner(command.owner)) {
                  list.push_back(positionToJson(p));
                }
              }
              response["positions"] = std::move(list);
              break;
            }

            case QueryCommand::Kind::Liquidations: {
              nlohmann::json list = nlohmann::json::array();
              const auto records =
                  command.position_id
                      ? history_.liquidationsByPosition(*command.position_id)
                      : history_.liquidationsByOwner(command.owner);
              for (const auto& r : records) {
                list.push_back(toJson(r));
              }
              response["liquidations"] = std::move(list);
              break;
            }

            case QueryCommand::Kind::Closures: {
              nlohmann::json list = nlohmann::json::array();
              for (const auto& r : history_.closuresByOwner(command.owner)) {
                list.push_back(toJson(r));
              }
              response["closures"] = std::move(list);
              break;
            }

            case QueryCommand::Kind::Risk:
              response["report"] = riskReportToJson(riskReport(command.owner));
              break;
          }
        } else {
          domain::LeverageSetting setting = settings_.get(command.owner);
          if (command.max_leverage) {
            setting.max_leverage = *command.max_leverage;
          }
          if (command.preferred_leverage) {
            setting.preferred_leverage = *command.preferred_leverage;
          }
          if (command.default_mode) {
            setting.default_mode = *command.default_mode;
          }
          if (command.auto_deleverage_enabled) {
            setting.auto_deleverage_enabled = *command.auto_deleverage_enabled;
          }
          if (command.liquidation_warning_enabled) {
            setting.liquidation_warning_enabled =
                *command.liquidation_warning_enabled;
          }

          auto stored = settings_.put(setting);
          if (!stored.ok()) {
            return encodeError(stored.error());
          }
          response["setting"] = settingToJson(stored.value());
        }

        return response.dump();
      },
      decoded.value());
}

}  // namespace margin
