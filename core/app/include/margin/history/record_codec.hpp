#pragma once

#include "margin/domain/history_records.hpp"

#include <nlohmann/json.hpp>

#include <optional>

namespace margin {

// -----------------------------------------------------------------------------
// JSON encoding of history records
// -----------------------------------------------------------------------------
// One flat object per record with a "kind" discriminator ("liquidation" or
// "closure"). Used for journal lines and for IPC query responses, so an
// operator reading the journal sees the same shape the dashboard receives.
//
// The decoders return std::nullopt on a missing key, a wrong type or an
// unknown enum string; they never throw.
// -----------------------------------------------------------------------------

nlohmann::json toJson(const domain::LiquidationRecord& record);
nlohmann::json toJson(const domain::ClosureRecord& record);

std::optional<domain::LiquidationRecord> liquidationFromJson(
    const nlohmann::json& j);
std::optional<domain::ClosureRecord> closureFromJson(const nlohmann::json& j);

}  // namespace margin
