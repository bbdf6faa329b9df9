#pragma once

#include "margin/domain/error_code.hpp"
#include "margin/domain/leverage_setting.hpp"
#include "margin/domain/position.hpp"
#include "margin/domain/requests.hpp"
#include "margin/events/event.hpp"
#include "margin/risk/risk_report.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <variant>

namespace margin {

// Read-only commands.
struct QueryCommand {
  enum class Kind {
    Ping,
    Positions,     // by owner, or one position by position_id
    Liquidations,  // by owner, or by position_id
    Closures,      // by owner
    Risk,          // by owner
  };

  Kind kind{Kind::Ping};
  domain::OwnerId owner;
  std::optional<domain::PositionId> position_id;
};

// Account-settings update. Absent fields keep the owner's current value.
struct SetLeverageCommand {
  domain::OwnerId owner;
  std::optional<int> max_leverage;
  std::optional<int> preferred_leverage;
  std::optional<domain::MarginMode> default_mode;
  std::optional<bool> auto_deleverage_enabled;
  std::optional<bool> liquidation_warning_enabled;
};

using Command = std::variant<domain::Request, QueryCommand, SetLeverageCommand>;

// -----------------------------------------------------------------------------
// CommandCodec — JSON wire format of the command and telemetry sockets
// -----------------------------------------------------------------------------
//
// @brief  Decodes command strings received on the REP socket into typed
//         commands, and encodes positions, reports, errors and telemetry
//         events as JSON.
//
// @details
// A command is one JSON object with a "cmd" field:
//
//   {"cmd":"open","owner":"u1","pair":"ETH/USDT","side":"long",
//    "leverage":10,"size":1,"collateral":210,
//    "mode":"cross","stop_loss":1850,"take_profit":2400}
//   {"cmd":"adjust","position_id":7,"expected_version":0,"delta":50}
//   {"cmd":"reduce","position_id":7,"expected_version":1,"quantity":0.5}
//   {"cmd":"close","position_id":7,"expected_version":2}
//   {"cmd":"set_triggers","position_id":7,"expected_version":3,
//    "stop_loss":1900}
//   {"cmd":"liquidate","position_id":7,"expected_version":3,
//    "type":"forced"}
//   {"cmd":"positions","owner":"u1"}      or {"cmd":"positions","position_id":7}
//   {"cmd":"liquidations","owner":"u1"}   or by "position_id"
//   {"cmd":"closures","owner":"u1"}
//   {"cmd":"risk","owner":"u1"}
//   {"cmd":"set_leverage","owner":"u1","max_leverage":50,
//    "default_mode":"cross","liquidation_warning_enabled":false}
//   {"cmd":"ping"}
//
// Anything else (not JSON, unknown cmd, missing or mistyped field, unknown
// enum string, negative id, a client-supplied "price" or "mark_price")
// decodes to InvalidRequest. reduce, close and liquidate fill at the pair's
// latest mark. The "auto" liquidation type is reserved for the monitor and
// rejected here.
//
// Error responses:
//   {"status":"error","error":"VersionConflict","retryable":true}
//
// Thread model:
//   Free functions without state.
// -----------------------------------------------------------------------------

domain::Result<Command> decodeCommand(const std::string& text);

std::string encodeError(domain::ErrorCode code);

nlohmann::json positionToJson(const domain::Position& position);
nlohmann::json settingToJson(const domain::LeverageSetting& setting);
nlohmann::json riskReportToJson(const RiskReport& report);

// JSON line for the PUB socket, or nullopt for event kinds that are not
// telemetry (price ticks).
std::optional<std::string> formatTelemetry(const Event& event);

}  // namespace margin
