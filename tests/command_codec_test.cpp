// =============================================================================
// command_codec_test.cpp
// =============================================================================
// Unit tests for the JSON wire format of the IPC command and telemetry
// sockets (margin/network/command_codec.hpp).
// =============================================================================

#include "margin/network/command_codec.hpp"

#include <gtest/gtest.h>

#include <string>
#include <variant>

using margin::Command;
using margin::QueryCommand;
using margin::SetLeverageCommand;
using margin::domain::ErrorCode;
using nlohmann::json;

namespace {

// Decodes text that must be a state-changing request of type T.
template <typename T>
T decodeAs(const std::string& text) {
  auto result = margin::decodeCommand(text);
  EXPECT_TRUE(result.ok()) << text;
  if (!result.ok()) {
    return T{};
  }
  const auto* request = std::get_if<margin::domain::Request>(&result.value());
  EXPECT_NE(request, nullptr) << text;
  if (request == nullptr) {
    return T{};
  }
  const auto* typed = std::get_if<T>(request);
  EXPECT_NE(typed, nullptr) << text;
  return typed != nullptr ? *typed : T{};
}

QueryCommand decodeQuery(const std::string& text) {
  auto result = margin::decodeCommand(text);
  EXPECT_TRUE(result.ok()) << text;
  if (!result.ok()) {
    return QueryCommand{};
  }
  const auto* q = std::get_if<QueryCommand>(&result.value());
  EXPECT_NE(q, nullptr) << text;
  return q != nullptr ? *q : QueryCommand{};
}

ErrorCode decodeError(const std::string& text) {
  auto result = margin::decodeCommand(text);
  EXPECT_FALSE(result.ok()) << text;
  return result.ok() ? ErrorCode::ComputationInvalid : result.error();
}

}  // namespace

// -----------------------------------------------------------------------------
// Requests
// -----------------------------------------------------------------------------
TEST(CommandCodecTest, DecodesOpenWithOptionalFields) {
  auto r = decodeAs<margin::domain::OpenRequest>(
      R"({"cmd":"open","owner":"u1","pair":"eth-usdt","side":"short",)"
      R"("leverage":10,"size":1.5,"collateral":300,"mode":"cross",)"
      R"("stop_loss":2100,"take_profit":1800})");

  EXPECT_EQ(r.owner, "u1");
  EXPECT_EQ(r.pair, "eth-usdt");
  EXPECT_EQ(r.side, margin::domain::Side::Short);
  EXPECT_EQ(r.leverage, 10);
  EXPECT_DOUBLE_EQ(r.size, 1.5);
  EXPECT_DOUBLE_EQ(r.collateral, 300.0);
  ASSERT_TRUE(r.mode.has_value());
  EXPECT_EQ(*r.mode, margin::domain::MarginMode::Cross);
  ASSERT_TRUE(r.stop_loss.has_value());
  EXPECT_DOUBLE_EQ(*r.stop_loss, 2100.0);
  ASSERT_TRUE(r.take_profit.has_value());
  EXPECT_DOUBLE_EQ(*r.take_profit, 1800.0);
}

TEST(CommandCodecTest, OpenWithoutModeLeavesItToTheOwnerDefault) {
  auto r = decodeAs<margin::domain::OpenRequest>(
      R"({"cmd":"open","owner":"u1","pair":"ETH/USDT","side":"long",)"
      R"("leverage":5,"size":1,"collateral":400,"stop_loss":null})");
  EXPECT_FALSE(r.mode.has_value());
  EXPECT_FALSE(r.stop_loss.has_value());
  EXPECT_FALSE(r.take_profit.has_value());
}

TEST(CommandCodecTest, DecodesPositionRequests) {
  auto adjust = decodeAs<margin::domain::AdjustCollateralRequest>(
      R"({"cmd":"adjust","position_id":7,"expected_version":0,"delta":-50})");
  EXPECT_EQ(adjust.position_id, 7u);
  EXPECT_EQ(adjust.expected_version, 0u);
  EXPECT_DOUBLE_EQ(adjust.delta, -50.0);

  auto reduce = decodeAs<margin::domain::ReduceRequest>(
      R"({"cmd":"reduce","position_id":7,"expected_version":1,)"
      R"("quantity":0.5})");
  EXPECT_DOUBLE_EQ(reduce.quantity, 0.5);
  EXPECT_FALSE(reduce.price.has_value());

  auto close = decodeAs<margin::domain::CloseRequest>(
      R"({"cmd":"close","position_id":7,"expected_version":2})");
  EXPECT_EQ(close.expected_version, 2u);
  EXPECT_FALSE(close.close_price.has_value());
  EXPECT_EQ(close.reason, margin::domain::CloseReason::Manual);

  auto triggers = decodeAs<margin::domain::SetTriggersRequest>(
      R"({"cmd":"set_triggers","position_id":7,"expected_version":3,)"
      R"("stop_loss":1900})");
  ASSERT_TRUE(triggers.stop_loss.has_value());
  EXPECT_DOUBLE_EQ(*triggers.stop_loss, 1900.0);
  EXPECT_FALSE(triggers.take_profit.has_value());
}

TEST(CommandCodecTest, LiquidateAcceptsForcedAndManualOnly) {
  auto forced = decodeAs<margin::domain::LiquidateRequest>(
      R"({"cmd":"liquidate","position_id":7,"expected_version":3,)"
      R"("type":"forced"})");
  EXPECT_EQ(forced.type, margin::domain::LiquidationType::Forced);
  EXPECT_FALSE(forced.mark_price.has_value());

  auto manual = decodeAs<margin::domain::LiquidateRequest>(
      R"({"cmd":"liquidate","position_id":7,"expected_version":3,)"
      R"("type":"manual"})");
  EXPECT_EQ(manual.type, margin::domain::LiquidationType::Manual);

  EXPECT_EQ(decodeError(R"({"cmd":"liquidate","position_id":7,)"
                        R"("expected_version":3,"type":"auto"})"),
            ErrorCode::InvalidRequest);
}

TEST(CommandCodecTest, RejectsClientChosenFillPrices) {
  EXPECT_EQ(decodeError(R"({"cmd":"close","position_id":7,)"
                        R"("expected_version":2,"price":1})"),
            ErrorCode::InvalidRequest);
  EXPECT_EQ(decodeError(R"({"cmd":"reduce","position_id":7,)"
                        R"("expected_version":1,"quantity":0.5,"price":1e9})"),
            ErrorCode::InvalidRequest);
  EXPECT_EQ(decodeError(R"({"cmd":"liquidate","position_id":7,)"
                        R"("expected_version":3,"mark_price":1,)"
                        R"("type":"forced"})"),
            ErrorCode::InvalidRequest);
}

// -----------------------------------------------------------------------------
// Queries and settings
// -----------------------------------------------------------------------------
TEST(CommandCodecTest, DecodesQueries) {
  EXPECT_EQ(decodeQuery(R"({"cmd":"ping"})").kind, QueryCommand::Kind::Ping);

  auto by_owner = decodeQuery(R"({"cmd":"positions","owner":"u1"})");
  EXPECT_EQ(by_owner.kind, QueryCommand::Kind::Positions);
  EXPECT_EQ(by_owner.owner, "u1");
  EXPECT_FALSE(by_owner.position_id.has_value());

  auto by_id = decodeQuery(R"({"cmd":"liquidations","position_id":9})");
  EXPECT_EQ(by_id.kind, QueryCommand::Kind::Liquidations);
  ASSERT_TRUE(by_id.position_id.has_value());
  EXPECT_EQ(*by_id.position_id, 9u);

  EXPECT_EQ(decodeQuery(R"({"cmd":"closures","owner":"u1"})").kind,
            QueryCommand::Kind::Closures);
  EXPECT_EQ(decodeQuery(R"({"cmd":"risk","owner":"u1"})").kind,
            QueryCommand::Kind::Risk);
}

TEST(CommandCodecTest, QueriesNeedOwnerOrSupportedPositionId) {
  EXPECT_EQ(decodeError(R"({"cmd":"positions"})"), ErrorCode::InvalidRequest);
  EXPECT_EQ(decodeError(R"({"cmd":"risk","position_id":3})"),
            ErrorCode::InvalidRequest);
  EXPECT_EQ(decodeError(R"({"cmd":"closures","position_id":3})"),
            ErrorCode::InvalidRequest);
}

TEST(CommandCodecTest, DecodesPartialLeverageUpdate) {
  auto result = margin::decodeCommand(
      R"({"cmd":"set_leverage","owner":"u1","max_leverage":50,)"
      R"("default_mode":"cross","liquidation_warning_enabled":false})");
  ASSERT_TRUE(result.ok());
  const auto* s = std::get_if<SetLeverageCommand>(&result.value());
  ASSERT_NE(s, nullptr);
  EXPECT_EQ(s->owner, "u1");
  ASSERT_TRUE(s->max_leverage.has_value());
  EXPECT_EQ(*s->max_leverage, 50);
  EXPECT_FALSE(s->preferred_leverage.has_value());
  ASSERT_TRUE(s->default_mode.has_value());
  EXPECT_EQ(*s->default_mode, margin::domain::MarginMode::Cross);
  EXPECT_FALSE(s->auto_deleverage_enabled.has_value());
  ASSERT_TRUE(s->liquidation_warning_enabled.has_value());
  EXPECT_FALSE(*s->liquidation_warning_enabled);
}

// -----------------------------------------------------------------------------
// Malformed input never reaches the engine.
// -----------------------------------------------------------------------------
TEST(CommandCodecTest, RejectsMalformedInput) {
  const char* cases[] = {
      "not json",
      "[1,2,3]",
      R"({"owner":"u1"})",
      R"({"cmd":"teleport"})",
      R"({"cmd":42})",
      R"({"cmd":"positions","owner":5})",
      R"({"cmd":"adjust","position_id":-1,"expected_version":0,"delta":1})",
      R"({"cmd":"adjust","position_id":1,"expected_version":0,"delta":"1"})",
      R"({"cmd":"adjust","position_id":1,"delta":1})",
      R"({"cmd":"open","owner":"u1","pair":"ETH/USDT","side":"sideways",)"
      R"("leverage":10,"size":1,"collateral":200})",
      R"({"cmd":"open","owner":"u1","pair":"ETH/USDT","side":"long",)"
      R"("leverage":2.5,"size":1,"collateral":200})",
      R"({"cmd":"open","owner":"u1","pair":"ETH/USDT","side":"long",)"
      R"("leverage":10,"size":1,"collateral":200,"mode":"portfolio"})",
      R"({"cmd":"set_leverage","owner":"u1","auto_deleverage_enabled":1})",
  };
  for (const char* text : cases) {
    EXPECT_EQ(decodeError(text), ErrorCode::InvalidRequest) << text;
  }
}

// -----------------------------------------------------------------------------
// Encoders
// -----------------------------------------------------------------------------
TEST(CommandCodecTest, ErrorEncodingMarksOnlyConflictsRetryable) {
  auto conflict = json::parse(margin::encodeError(ErrorCode::VersionConflict));
  EXPECT_EQ(conflict.at("status").get<std::string>(), "error");
  EXPECT_EQ(conflict.at("error").get<std::string>(), "VersionConflict");
  EXPECT_TRUE(conflict.at("retryable").get<bool>());

  auto leverage = json::parse(margin::encodeError(ErrorCode::InvalidLeverage));
  EXPECT_EQ(leverage.at("error").get<std::string>(), "InvalidLeverage");
  EXPECT_FALSE(leverage.at("retryable").get<bool>());
}

TEST(CommandCodecTest, PositionJsonUsesWireNames) {
  margin::domain::Position p;
  p.id = 7;
  p.owner = "u1";
  p.pair = "ETH/USDT";
  p.side = margin::domain::Side::Short;
  p.mode = margin::domain::MarginMode::Cross;
  p.leverage = 10;
  p.take_profit = 1800.0;
  p.version = 4;

  auto j = margin::positionToJson(p);
  EXPECT_EQ(j.at("id").get<std::uint64_t>(), 7u);
  EXPECT_EQ(j.at("side").get<std::string>(), "short");
  EXPECT_EQ(j.at("mode").get<std::string>(), "cross");
  EXPECT_EQ(j.at("status").get<std::string>(), "open");
  EXPECT_TRUE(j.at("stop_loss").is_null());
  EXPECT_DOUBLE_EQ(j.at("take_profit").get<double>(), 1800.0);
  EXPECT_EQ(j.at("version").get<std::uint64_t>(), 4u);
  EXPECT_TRUE(j.contains("liquidation_price"));
  EXPECT_TRUE(j.contains("fees_accrued"));
}

TEST(CommandCodecTest, TelemetryForEveryPublishedEventKind) {
  margin::PositionUpdateEvent update;
  update.position.id = 3;
  update.change = margin::PositionChange::Repriced;
  auto update_line = margin::formatTelemetry(margin::Event{update});
  ASSERT_TRUE(update_line.has_value());
  auto u = json::parse(*update_line);
  EXPECT_EQ(u.at("type").get<std::string>(), "position_update");
  EXPECT_EQ(u.at("change").get<std::string>(), "repriced");
  EXPECT_EQ(u.at("position").at("id").get<std::uint64_t>(), 3u);

  margin::LiquidationEvent liquidation;
  liquidation.record.position_id = 3;
  liquidation.record.type = margin::domain::LiquidationType::Forced;
  auto liq_line = margin::formatTelemetry(margin::Event{liquidation});
  ASSERT_TRUE(liq_line.has_value());
  auto l = json::parse(*liq_line);
  EXPECT_EQ(l.at("type").get<std::string>(), "liquidation");
  EXPECT_EQ(l.at("record").at("kind").get<std::string>(), "liquidation");
  EXPECT_EQ(l.at("record").at("type").get<std::string>(), "forced");

  margin::RiskAlertEvent alert;
  alert.position_id = 3;
  alert.reason = "zero_size";
  auto alert_line = margin::formatTelemetry(margin::Event{alert});
  ASSERT_TRUE(alert_line.has_value());
  auto a = json::parse(*alert_line);
  EXPECT_EQ(a.at("type").get<std::string>(), "risk_alert");
  EXPECT_EQ(a.at("reason").get<std::string>(), "zero_size");

  margin::LiquidationWarningEvent warning;
  warning.zone = margin::domain::RiskZone::Critical;
  warning.risk_percent = 89.5;
  auto warning_line = margin::formatTelemetry(margin::Event{warning});
  ASSERT_TRUE(warning_line.has_value());
  auto w = json::parse(*warning_line);
  EXPECT_EQ(w.at("type").get<std::string>(), "liquidation_warning");
  EXPECT_EQ(w.at("zone").get<std::string>(), "critical");
  EXPECT_DOUBLE_EQ(w.at("risk_percent").get<double>(), 89.5);
}

TEST(CommandCodecTest, PriceTicksAreNotTelemetry) {
  margin::PriceTickEvent tick{"ETH/USDT", 2000.0, 1, 0};
  EXPECT_FALSE(margin::formatTelemetry(margin::Event{tick}).has_value());
}
