#include "margin/config/engine_config.hpp"

#include "margin/domain/enum_parse.hpp"

#include <fstream>
#include <stdexcept>

namespace margin {

namespace {

using nlohmann::json;

[[noreturn]] void fail(const std::string& key, const std::string& why) {
  throw std::runtime_error("config key '" + key + "': " + why);
}

double readNumber(const json& parent, const char* key, const std::string& path,
                  double current) {
  auto it = parent.find(key);
  if (it == parent.end()) {
    return current;
  }
  if (!it->is_number()) {
    fail(path, "expected a number");
  }
  return it->get<double>();
}

int readInt(const json& parent, const char* key, const std::string& path,
            int current) {
  auto it = parent.find(key);
  if (it == parent.end()) {
    return current;
  }
  if (!it->is_number_integer()) {
    fail(path, "expected an integer");
  }
  return it->get<int>();
}

bool readBool(const json& parent, const char* key, const std::string& path,
              bool current) {
  auto it = parent.find(key);
  if (it == parent.end()) {
    return current;
  }
  if (!it->is_boolean()) {
    fail(path, "expected a boolean");
  }
  return it->get<bool>();
}

std::string readString(const json& parent, const char* key,
                       const std::string& path, const std::string& current) {
  auto it = parent.find(key);
  if (it == parent.end()) {
    return current;
  }
  if (!it->is_string()) {
    fail(path, "expected a string");
  }
  return it->get<std::string>();
}

const json* section(const json& root, const char* key) {
  auto it = root.find(key);
  if (it == root.end()) {
    return nullptr;
  }
  if (!it->is_object()) {
    fail(key, "expected an object");
  }
  return &*it;
}

void parseMargin(const json& m, domain::MarginParams& p) {
  p.maintenance_margin_rate =
      readNumber(m, "maintenance_margin_rate",
                 "margin.maintenance_margin_rate", p.maintenance_margin_rate);
  if (!(p.maintenance_margin_rate > 0.0 && p.maintenance_margin_rate < 1.0)) {
    fail("margin.maintenance_margin_rate", "must be in (0, 1)");
  }

  p.trading_fee_rate = readNumber(m, "trading_fee_rate",
                                  "margin.trading_fee_rate", p.trading_fee_rate);
  if (!(p.trading_fee_rate >= 0.0 && p.trading_fee_rate < 1.0)) {
    fail("margin.trading_fee_rate", "must be in [0, 1)");
  }

  p.max_leverage_ceiling =
      readInt(m, "max_leverage_ceiling", "margin.max_leverage_ceiling",
              p.max_leverage_ceiling);
  if (p.max_leverage_ceiling < 1) {
    fail("margin.max_leverage_ceiling", "must be >= 1");
  }

  p.warning_risk_percent =
      readNumber(m, "warning_risk_percent", "margin.warning_risk_percent",
                 p.warning_risk_percent);
  p.critical_risk_percent =
      readNumber(m, "critical_risk_percent", "margin.critical_risk_percent",
                 p.critical_risk_percent);
  if (!(p.warning_risk_percent > 0.0 &&
        p.warning_risk_percent < p.critical_risk_percent &&
        p.critical_risk_percent <= 100.0)) {
    fail("margin.warning_risk_percent",
         "must satisfy 0 < warning < critical <= 100");
  }
}

void parseLeverage(const json& l, int ceiling, domain::LeverageSetting& s) {
  s.max_leverage = readInt(l, "max_leverage", "default_leverage.max_leverage",
                           s.max_leverage);
  if (s.max_leverage < 1 || s.max_leverage > ceiling) {
    fail("default_leverage.max_leverage",
         "must be in [1, " + std::to_string(ceiling) + "]");
  }

  s.preferred_leverage =
      readInt(l, "preferred_leverage", "default_leverage.preferred_leverage",
              s.preferred_leverage);
  if (s.preferred_leverage < 1 || s.preferred_leverage > s.max_leverage) {
    fail("default_leverage.preferred_leverage", "must be in [1, max_leverage]");
  }

  const std::string mode =
      readString(l, "default_mode", "default_leverage.default_mode",
                 domain::toString(s.default_mode));
  auto parsed = domain::parseMarginMode(mode);
  if (!parsed) {
    fail("default_leverage.default_mode", "expected 'isolated' or 'cross'");
  }
  s.default_mode = *parsed;

  s.auto_deleverage_enabled =
      readBool(l, "auto_deleverage_enabled",
               "default_leverage.auto_deleverage_enabled",
               s.auto_deleverage_enabled);
  s.liquidation_warning_enabled =
      readBool(l, "liquidation_warning_enabled",
               "default_leverage.liquidation_warning_enabled",
               s.liquidation_warning_enabled);
}

}  // namespace

// -----------------------------------------------------------------------------
// parseEngineConfig()
// -----------------------------------------------------------------------------
EngineConfig parseEngineConfig(const json& j) {
  if (!j.is_object()) {
    fail("<root>", "expected an object");
  }

  EngineConfig config;

  if (const json* m = section(j, "margin")) {
    parseMargin(*m, config.margin);
  }
  if (const json* l = section(j, "default_leverage")) {
    parseLeverage(*l, config.margin.max_leverage_ceiling,
                  config.default_leverage);
  } else if (config.default_leverage.max_leverage >
             config.margin.max_leverage_ceiling) {
    fail("default_leverage.max_leverage", "exceeds margin.max_leverage_ceiling");
  }

  if (auto it = j.find("tradable_pairs"); it != j.end()) {
    if (!it->is_array()) {
      fail("tradable_pairs", "expected an array of strings");
    }
    for (const auto& pair : *it) {
      if (!pair.is_string() || pair.get<std::string>().empty()) {
        fail("tradable_pairs", "expected an array of non-empty strings");
      }
      config.tradable_pairs.push_back(pair.get<std::string>());
    }
  }

  const int workers = readInt(j, "worker_threads", "worker_threads",
                              static_cast<int>(config.worker_threads));
  if (workers < 1) {
    fail("worker_threads", "must be >= 1");
  }
  config.worker_threads = static_cast<std::size_t>(workers);

  const std::string policy =
      readString(j, "cross_liquidation_policy", "cross_liquidation_policy",
                 domain::toString(config.cross_policy));
  auto parsed_policy = domain::parseCrossLiquidationPolicy(policy);
  if (!parsed_policy) {
    fail("cross_liquidation_policy",
         "expected 'all_at_once' or 'largest_loss_first'");
  }
  config.cross_policy = *parsed_policy;

  config.journal_path =
      readString(j, "journal_path", "journal_path", config.journal_path);

  if (const json* e = section(j, "endpoints")) {
    config.price_feed_endpoint = readString(
        *e, "price_feed", "endpoints.price_feed", config.price_feed_endpoint);
    config.command_endpoint = readString(*e, "command", "endpoints.command",
                                         config.command_endpoint);
    config.telemetry_endpoint = readString(
        *e, "telemetry", "endpoints.telemetry", config.telemetry_endpoint);
  }

  if (const json* b = section(j, "initial_balances")) {
    for (const auto& [owner, amount] : b->items()) {
      if (!amount.is_number() || amount.get<double>() < 0.0) {
        fail("initial_balances." + owner, "expected a non-negative number");
      }
      config.initial_balances[owner] = amount.get<double>();
    }
  }

  return config;
}

// -----------------------------------------------------------------------------
// loadEngineConfig()
// -----------------------------------------------------------------------------
EngineConfig loadEngineConfig(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw std::runtime_error("cannot open config file '" + path + "'");
  }

  const json j = json::parse(in, nullptr, /*allow_exceptions=*/false);
  if (j.is_discarded()) {
    throw std::runtime_error("config file '" + path + "' is not valid JSON");
  }
  return parseEngineConfig(j);
}

}  // namespace margin
