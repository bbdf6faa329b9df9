#include "margin/history/record_codec.hpp"

#include "margin/domain/enum_parse.hpp"

namespace margin {

nlohmann::json toJson(const domain::LiquidationRecord& r) {
  nlohmann::json j;
  j["kind"] = "liquidation";
  j["id"] = r.id;
  j["position_id"] = r.position_id;
  j["owner"] = r.owner;
  j["pair"] = r.pair;
  j["side"] = domain::toString(r.side);
  j["leverage"] = r.leverage;
  j["entry_price"] = r.entry_price;
  j["liquidation_price"] = r.liquidation_price;
  j["mark_price"] = r.mark_price;
  j["size"] = r.size;
  j["collateral"] = r.collateral;
  j["loss_amount"] = r.loss_amount;
  j["remaining_collateral"] = r.remaining_collateral;
  j["released_amount"] = r.released_amount;
  j["mode"] = domain::toString(r.mode);
  j["type"] = domain::toString(r.type);
  j["timestamp_ms"] = r.liquidated_at_ms;
  return j;
}

nlohmann::json toJson(const domain::ClosureRecord& r) {
  nlohmann::json j;
  j["kind"] = "closure";
  j["id"] = r.id;
  j["position_id"] = r.position_id;
  j["owner"] = r.owner;
  j["pair"] = r.pair;
  j["side"] = domain::toString(r.side);
  j["entry_price"] = r.entry_price;
  j["close_price"] = r.close_price;
  j["size"] = r.size;
  j["realized_pnl"] = r.realized_pnl;
  j["fees"] = r.fees;
  j["released_amount"] = r.released_amount;
  j["reason"] = domain::toString(r.reason);
  j["timestamp_ms"] = r.closed_at_ms;
  return j;
}

std::optional<domain::LiquidationRecord> liquidationFromJson(
    const nlohmann::json& j) {
  try {
    if (j.at("kind").get<std::string>() != "liquidation") {
      return std::nullopt;
    }

    auto side = domain::parseSide(j.at("side").get<std::string>());
    auto mode = domain::parseMarginMode(j.at("mode").get<std::string>());
    auto type = domain::parseLiquidationType(j.at("type").get<std::string>());
    if (!side || !mode || !type) {
      return std::nullopt;
    }

    domain::LiquidationRecord r;
    r.id = j.at("id").get<domain::RecordId>();
    r.position_id = j.at("position_id").get<domain::PositionId>();
    r.owner = j.at("owner").get<std::string>();
    r.pair = j.at("pair").get<std::string>();
    r.side = *side;
    r.leverage = j.at("leverage").get<int>();
    r.entry_price = j.at("entry_price").get<double>();
    r.liquidation_price = j.at("liquidation_price").get<double>();
    r.mark_price = j.at("mark_price").get<double>();
    r.size = j.at("size").get<double>();
    r.collateral = j.at("collateral").get<double>();
    r.loss_amount = j.at("loss_amount").get<double>();
    r.remaining_collateral = j.at("remaining_collateral").get<double>();
    r.released_amount = j.at("released_amount").get<double>();
    r.mode = *mode;
    r.type = *type;
    r.liquidated_at_ms = j.at("timestamp_ms").get<std::int64_t>();
    return r;
  } catch (const nlohmann::json::exception&) {
    return std::nullopt;
  }
}

std::optional<domain::ClosureRecord> closureFromJson(const nlohmann::json& j) {
  try {
    if (j.at("kind").get<std::string>() != "closure") {
      return std::nullopt;
    }

    auto side = domain::parseSide(j.at("side").get<std::string>());
    auto reason = domain::parseCloseReason(j.at("reason").get<std::string>());
    if (!side || !reason) {
      return std::nullopt;
    }

    domain::ClosureRecord r;
    r.id = j.at("id").get<domain::RecordId>();
    r.position_id = j.at("position_id").get<domain::PositionId>();
    r.owner = j.at("owner").get<std::string>();
    r.pair = j.at("pair").get<std::string>();
    r.side = *side;
    r.entry_price = j.at("entry_price").get<double>();
    r.close_price = j.at("close_price").get<double>();
    r.size = j.at("size").get<double>();
    r.realized_pnl = j.at("realized_pnl").get<double>();
    r.fees = j.at("fees").get<double>();
    r.released_amount = j.at("released_amount").get<double>();
    r.reason = *reason;
    r.closed_at_ms = j.at("timestamp_ms").get<std::int64_t>();
    return r;
  } catch (const nlohmann::json::exception&) {
    return std::nullopt;
  }
}

}  // namespace margin
