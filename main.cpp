// -----------------------------------------------------------------------------
// margin_engine — single executable entry point.
//
//   1) Load the EngineConfig (argv[1], optional; defaults otherwise).
//   2) Seed the in-memory wallet with the configured initial balances.
//   3) Create the MarginEngine on the live clock and start it. The engine
//      owns every thread: price feed, monitor loop, worker pool, IPC.
//   4) Park the main thread until Ctrl-C, then stop the engine.
//
// Thread layout:
//   main thread         → waits for SIGINT, then engine.stop()
//   price_feed thread   → oracle ticks over ZeroMQ SUB
//   monitor loop        → tick ingestion and margin surveillance
//   worker pool         → liquidations and trigger closes
//   ipc thread          → JSON commands (REP) and telemetry (PUB)
// -----------------------------------------------------------------------------

#include "margin/config/engine_config.hpp"
#include "margin/engine/margin_engine.hpp"
#include "margin/ledger/in_memory_wallet.hpp"
#include "margin/time/live_time_provider.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <exception>
#include <iostream>
#include <thread>

// -----------------------------------------------------------------------------
// Shutdown flag set by the SIGINT handler. The only global in the program.
// -----------------------------------------------------------------------------
static std::atomic<bool> g_shutdown_requested{false};

static void sigint_handler(int /*signum*/) {
  g_shutdown_requested.store(true);
}

int main(int argc, char** argv) {
  // -------------------------------------------------------------------------
  // 1) Configuration. A bad file is fatal: nothing has started yet.
  // -------------------------------------------------------------------------
  margin::EngineConfig config;
  try {
    if (argc > 1) {
      config = margin::loadEngineConfig(argv[1]);
      std::cout << "[main] loaded config from " << argv[1] << "\n";
    } else {
      std::cout << "[main] no config file given, using defaults\n";
    }
  } catch (const std::exception& e) {
    std::cerr << "[main] " << e.what() << "\n";
    return 1;
  }

  // -------------------------------------------------------------------------
  // 2) Wallet
  // -------------------------------------------------------------------------
  margin::InMemoryWallet wallet;
  for (const auto& [owner, amount] : config.initial_balances) {
    wallet.deposit(owner, amount);
  }

  // -------------------------------------------------------------------------
  // 3) Engine
  // -------------------------------------------------------------------------
  margin::LiveTimeProvider clock;
  try {
    margin::MarginEngine engine(config, clock, wallet);

    engine.eventBus().subscribe<margin::LiquidationEvent>(
        [](const margin::LiquidationEvent& e) {
          std::cout << "[Liquidation] position=" << e.record.position_id
                    << " owner=" << e.record.owner << " pair="
                    << e.record.pair << " mark=" << e.record.mark_price
                    << " loss=" << e.record.loss_amount << "\n";
        });

    engine.start();

    std::signal(SIGINT, sigint_handler);
    std::cout << "[main] Press Ctrl-C to shut down.\n";

    // -----------------------------------------------------------------------
    // 4) Wait for Ctrl-C
    // -----------------------------------------------------------------------
    while (!g_shutdown_requested.load()) {
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    std::cout << "\n[main] SIGINT received. Stopping engine...\n";
    engine.stop();
  } catch (const std::exception& e) {
    std::cerr << "[main] fatal: " << e.what() << "\n";
    return 1;
  }

  return 0;
}
