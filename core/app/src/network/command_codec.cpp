#include "margin/network/command_codec.hpp"

#include "margin/domain/enum_parse.hpp"
#include "margin/history/record_codec.hpp"
#include "margin/time/time_utils.hpp"

#include <stdexcept>

namespace margin {

namespace {

using nlohmann::json;

// A field is present but unusable. Raised alongside json::exception by the
// readers below; decodeCommand() maps both to InvalidRequest.
struct FieldError : std::runtime_error {
  using std::runtime_error::runtime_error;
};

std::string requireString(const json& j, const char* key) {
  return j.at(key).get<std::string>();
}

double requireNumber(const json& j, const char* key) {
  const json& v = j.at(key);
  if (!v.is_number()) {
    throw FieldError(std::string(key) + " must be a number");
  }
  return v.get<double>();
}

std::uint64_t requireId(const json& j, const char* key) {
  const json& v = j.at(key);
  if (!v.is_number_unsigned()) {
    throw FieldError(std::string(key) + " must be a non-negative integer");
  }
  return v.get<std::uint64_t>();
}

int requireInt(const json& j, const char* key) {
  const json& v = j.at(key);
  if (!v.is_number_integer()) {
    throw FieldError(std::string(key) + " must be an integer");
  }
  return v.get<int>();
}

// Absent and null both mean "not given".
std::optional<double> optionalNumber(const json& j, const char* key) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    return std::nullopt;
  }
  return requireNumber(j, key);
}

std::optional<std::uint64_t> optionalId(const json& j, const char* key) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    return std::nullopt;
  }
  return requireId(j, key);
}

std::optional<bool> optionalBool(const json& j, const char* key) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    return std::nullopt;
  }
  if (!it->is_boolean()) {
    throw FieldError(std::string(key) + " must be a boolean");
  }
  return it->get<bool>();
}

// Fills run at the oracle's latest mark; a client cannot name its own price.
void rejectClientPrice(const json& j, const char* key) {
  if (j.contains(key)) {
    throw FieldError(std::string(key) + " is set by the engine");
  }
}

std::optional<domain::Request> decodeRequest(const std::string& cmd,
                                             const json& j) {
  if (cmd == "open") {
    domain::OpenRequest r;
    r.owner = requireString(j, "owner");
    r.pair = requireString(j, "pair");
    auto side = domain::parseSide(requireString(j, "side"));
    if (!side) {
      return std::nullopt;
    }
    r.side = *side;
    r.leverage = requireInt(j, "leverage");
    r.size = requireNumber(j, "size");
    r.collateral = requireNumber(j, "collateral");
    if (j.contains("mode") && !j.at("mode").is_null()) {
      auto mode = domain::parseMarginMode(requireString(j, "mode"));
      if (!mode) {
        return std::nullopt;
      }
      r.mode = *mode;
    }
    r.stop_loss = optionalNumber(j, "stop_loss");
    r.take_profit = optionalNumber(j, "take_profit");
    return domain::Request{r};
  }

  if (cmd == "adjust") {
    domain::AdjustCollateralRequest r;
    r.position_id = requireId(j, "position_id");
    r.expected_version = requireId(j, "expected_version");
    r.delta = requireNumber(j, "delta");
    return domain::Request{r};
  }

  if (cmd == "reduce") {
    domain::ReduceRequest r;
    r.position_id = requireId(j, "position_id");
    r.expected_version = requireId(j, "expected_version");
    r.quantity = requireNumber(j, "quantity");
    rejectClientPrice(j, "price");
    return domain::Request{r};
  }

  if (cmd == "close") {
    domain::CloseRequest r;
    r.position_id = requireId(j, "position_id");
    r.expected_version = requireId(j, "expected_version");
    rejectClientPrice(j, "price");
    r.reason = domain::CloseReason::Manual;
    return domain::Request{r};
  }

  if (cmd == "set_triggers") {
    domain::SetTriggersRequest r;
    r.position_id = requireId(j, "position_id");
    r.expected_version = requireId(j, "expected_version");
    r.stop_loss = optionalNumber(j, "stop_loss");
    r.take_profit = optionalNumber(j, "take_profit");
    return domain::Request{r};
  }

  if (cmd == "liquidate") {
    domain::LiquidateRequest r;
    r.position_id = requireId(j, "position_id");
    r.expected_version = requireId(j, "expected_version");
    rejectClientPrice(j, "mark_price");
    auto type = domain::parseLiquidationType(requireString(j, "type"));
    if (!type || *type == domain::LiquidationType::Auto) {
      return std::nullopt;
    }
    r.type = *type;
    return domain::Request{r};
  }

  return std::nullopt;
}

}  // namespace

// -----------------------------------------------------------------------------
// decodeCommand()
// -----------------------------------------------------------------------------
domain::Result<Command> decodeCommand(const std::string& text) {
  const json j = json::parse(text, nullptr, /*allow_exceptions=*/false);
  if (j.is_discarded() || !j.is_object()) {
    return domain::ErrorCode::InvalidRequest;
  }

  try {
    const std::string cmd = requireString(j, "cmd");

    if (cmd == "ping") {
      return Command{QueryCommand{QueryCommand::Kind::Ping, {}, std::nullopt}};
    }

    if (cmd == "positions" || cmd == "liquidations" || cmd == "closures" ||
        cmd == "risk") {
      QueryCommand q;
      if (cmd == "positions") {
        q.kind = QueryCommand::Kind::Positions;
      } else if (cmd == "liquidations") {
        q.kind = QueryCommand::Kind::Liquidations;
      } else if (cmd == "closures") {
        q.kind = QueryCommand::Kind::Closures;
      } else {
        q.kind = QueryCommand::Kind::Risk;
      }

      if (j.contains("owner")) {
        q.owner = requireString(j, "owner");
      }
      q.position_id = optionalId(j, "position_id");

      const bool by_position_allowed = q.kind == QueryCommand::Kind::Positions ||
                                       q.kind == QueryCommand::Kind::Liquidations;
      if (q.position_id && !by_position_allowed) {
        return domain::ErrorCode::InvalidRequest;
      }
      if (q.owner.empty() && !q.position_id) {
        return domain::ErrorCode::InvalidRequest;
      }
      return Command{q};
    }

    if (cmd == "set_leverage") {
      SetLeverageCommand s;
      s.owner = requireString(j, "owner");
      if (j.contains("max_leverage")) {
        s.max_leverage = requireInt(j, "max_leverage");
      }
      if (j.contains("preferred_leverage")) {
        s.preferred_leverage = requireInt(j, "preferred_leverage");
      }
      if (j.contains("default_mode")) {
        auto mode = domain::parseMarginMode(requireString(j, "default_mode"));
        if (!mode) {
          return domain::ErrorCode::InvalidRequest;
        }
        s.default_mode = *mode;
      }
      s.auto_deleverage_enabled = optionalBool(j, "auto_deleverage_enabled");
      s.liquidation_warning_enabled =
          optionalBool(j, "liquidation_warning_enabled");
      return Command{s};
    }

    auto request = decodeRequest(cmd, j);
    if (!request) {
      return domain::ErrorCode::InvalidRequest;
    }
    return Command{std::move(*request)};
  } catch (const json::exception&) {
    return domain::ErrorCode::InvalidRequest;
  } catch (const FieldError&) {
    return domain::ErrorCode::InvalidRequest;
  }
}

// -----------------------------------------------------------------------------
// Encoders
// -----------------------------------------------------------------------------
std::string encodeError(domain::ErrorCode code) {
  json j;
  j["status"] = "error";
  j["error"] = domain::toString(code);
  j["retryable"] = domain::isRetryable(code);
  return j.dump();
}

json positionToJson(const domain::Position& p) {
  json j;
  j["id"] = p.id;
  j["owner"] = p.owner;
  j["pair"] = p.pair;
  j["side"] = domain::toString(p.side);
  j["leverage"] = p.leverage;
  j["entry_price"] = p.entry_price;
  j["size"] = p.size;
  j["collateral"] = p.collateral;
  j["mode"] = domain::toString(p.mode);
  j["liquidation_price"] = p.liquidation_price;
  j["mark_price"] = p.mark_price;
  j["unrealized_pnl"] = p.unrealized_pnl;
  j["realized_pnl"] = p.realized_pnl;
  j["fees_accrued"] = p.fees_accrued;
  j["stop_loss"] = p.stop_loss ? json(*p.stop_loss) : json(nullptr);
  j["take_profit"] = p.take_profit ? json(*p.take_profit) : json(nullptr);
  j["status"] = domain::toString(p.status);
  j["version"] = p.version;
  j["opened_at_ms"] = p.opened_at_ms;
  j["updated_at_ms"] = p.updated_at_ms;
  j["closed_at_ms"] = p.closed_at_ms;
  return j;
}

json settingToJson(const domain::LeverageSetting& s) {
  json j;
  j["owner"] = s.owner;
  j["max_leverage"] = s.max_leverage;
  j["preferred_leverage"] = s.preferred_leverage;
  j["default_mode"] = domain::toString(s.default_mode);
  j["auto_deleverage_enabled"] = s.auto_deleverage_enabled;
  j["liquidation_warning_enabled"] = s.liquidation_warning_enabled;
  return j;
}

json riskReportToJson(const RiskReport& report) {
  json positions = json::array();
  for (const auto& r : report.positions) {
    json p;
    p["position_id"] = r.position_id;
    p["pair"] = r.pair;
    p["side"] = domain::toString(r.side);
    p["mode"] = domain::toString(r.mode);
    p["mark_price"] = r.mark_price;
    p["liquidation_price"] = r.liquidation_price;
    p["unrealized_pnl"] = r.unrealized_pnl;
    p["risk_percent"] = r.risk_percent;
    p["zone"] = domain::toString(r.zone);
    positions.push_back(std::move(p));
  }

  json j;
  j["owner"] = report.owner;
  j["positions"] = std::move(positions);
  j["zones"] = {{"safe", report.safe_count},
                {"moderate", report.moderate_count},
                {"warning", report.warning_count},
                {"critical", report.critical_count}};
  j["total_collateral"] = report.total_collateral;
  j["total_unrealized_pnl"] = report.total_unrealized_pnl;
  return j;
}

// -----------------------------------------------------------------------------
// formatTelemetry()
// -----------------------------------------------------------------------------
std::optional<std::string> formatTelemetry(const Event& event) {
  if (auto* e = std::get_if<PositionUpdateEvent>(&event)) {
    json j;
    j["type"] = "position_update";
    j["change"] = toString(e->change);
    j["sequence_id"] = e->sequence_id;
    j["timestamp_ms"] = timestamp_to_ms(e->timestamp);
    j["position"] = positionToJson(e->position);
    return j.dump();
  }
  if (auto* e = std::get_if<LiquidationEvent>(&event)) {
    json j;
    j["type"] = "liquidation";
    j["sequence_id"] = e->sequence_id;
    j["record"] = toJson(e->record);
    return j.dump();
  }
  if (auto* e = std::get_if<RiskAlertEvent>(&event)) {
    json j;
    j["type"] = "risk_alert";
    j["position_id"] = e->position_id;
    j["owner"] = e->owner;
    j["pair"] = e->pair;
    j["reason"] = e->reason;
    j["sequence_id"] = e->sequence_id;
    j["timestamp_ms"] = timestamp_to_ms(e->timestamp);
    return j.dump();
  }
  if (auto* e = std::get_if<LiquidationWarningEvent>(&event)) {
    json j;
    j["type"] = "liquidation_warning";
    j["position_id"] = e->position_id;
    j["owner"] = e->owner;
    j["pair"] = e->pair;
    j["mark_price"] = e->mark_price;
    j["liquidation_price"] = e->liquidation_price;
    j["risk_percent"] = e->risk_percent;
    j["zone"] = domain::toString(e->zone);
    j["sequence_id"] = e->sequence_id;
    j["timestamp_ms"] = timestamp_to_ms(e->timestamp);
    return j.dump();
  }
  return std::nullopt;
}

}  // namespace margin
