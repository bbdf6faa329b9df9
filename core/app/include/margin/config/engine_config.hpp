#pragma once

#include "margin/domain/leverage_setting.hpp"
#include "margin/domain/margin_params.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace margin {

// -----------------------------------------------------------------------------
// EngineConfig
// -----------------------------------------------------------------------------
//
// @brief  Everything the MarginEngine needs to start, loaded once from a
//         JSON file and immutable afterwards.
//
// @details
// Example (every key optional, defaults shown):
//
//   {
//     "margin": {
//       "maintenance_margin_rate": 0.01,
//       "trading_fee_rate": 0.003,
//       "max_leverage_ceiling": 125,
//       "warning_risk_percent": 70,
//       "critical_risk_percent": 85
//     },
//     "default_leverage": {
//       "max_leverage": 20, "preferred_leverage": 10,
//       "default_mode": "isolated",
//       "auto_deleverage_enabled": true,
//       "liquidation_warning_enabled": true
//     },
//     "tradable_pairs": [],                  // empty: any pair with a mark
//     "worker_threads": 4,
//     "cross_liquidation_policy": "all_at_once",
//     "journal_path": "",                    // empty: history kept in memory
//     "endpoints": {
//       "price_feed": "tcp://127.0.0.1:5555",
//       "command": "tcp://127.0.0.1:5556",
//       "telemetry": "tcp://127.0.0.1:5557"
//     },
//     "initial_balances": {"alice": 10000}   // seeded into the in-memory wallet
//   }
//
// An empty endpoint disables that socket (tests run without ZeroMQ I/O).
// -----------------------------------------------------------------------------
struct EngineConfig {
  domain::MarginParams margin;
  domain::LeverageSetting default_leverage;
  std::vector<std::string> tradable_pairs;
  std::size_t worker_threads{4};
  domain::CrossLiquidationPolicy cross_policy{
      domain::CrossLiquidationPolicy::AllAtOnce};
  std::string journal_path;

  std::string price_feed_endpoint{"tcp://127.0.0.1:5555"};
  std::string command_endpoint{"tcp://127.0.0.1:5556"};
  std::string telemetry_endpoint{"tcp://127.0.0.1:5557"};

  std::map<std::string, double> initial_balances;
};

// -------------------------------------------------------------------------
// parseEngineConfig(json)
// -------------------------------------------------------------------------
// Missing keys keep their defaults. A key with the wrong type or an
// out-of-range value throws std::runtime_error naming the key.
// -------------------------------------------------------------------------
EngineConfig parseEngineConfig(const nlohmann::json& j);

// Reads and parses the file. Throws std::runtime_error if it cannot be
// opened or is not valid JSON.
EngineConfig loadEngineConfig(const std::string& path);

}  // namespace margin
