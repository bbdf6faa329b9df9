#pragma once

#include "margin/domain/margin_params.hpp"
#include "margin/domain/position_types.hpp"

#include <optional>
#include <string>

namespace margin {
namespace domain {

// -----------------------------------------------------------------------------
// String -> enum parsing for the JSON boundary
// -----------------------------------------------------------------------------
// Inverse of the toString() overloads. Exact lowercase match only; anything
// else is std::nullopt and the caller rejects the payload.
// -----------------------------------------------------------------------------

inline std::optional<Side> parseSide(const std::string& s) {
  if (s == "long") return Side::Long;
  if (s == "short") return Side::Short;
  return std::nullopt;
}

inline std::optional<MarginMode> parseMarginMode(const std::string& s) {
  if (s == "isolated") return MarginMode::Isolated;
  if (s == "cross") return MarginMode::Cross;
  return std::nullopt;
}

inline std::optional<PositionStatus> parsePositionStatus(const std::string& s) {
  if (s == "open") return PositionStatus::Open;
  if (s == "closed") return PositionStatus::Closed;
  if (s == "liquidated") return PositionStatus::Liquidated;
  return std::nullopt;
}

inline std::optional<CloseReason> parseCloseReason(const std::string& s) {
  if (s == "manual") return CloseReason::Manual;
  if (s == "trigger") return CloseReason::Trigger;
  return std::nullopt;
}

inline std::optional<LiquidationType> parseLiquidationType(
    const std::string& s) {
  if (s == "auto") return LiquidationType::Auto;
  if (s == "forced") return LiquidationType::Forced;
  if (s == "manual") return LiquidationType::Manual;
  return std::nullopt;
}

inline std::optional<CrossLiquidationPolicy> parseCrossLiquidationPolicy(
    const std::string& s) {
  if (s == "all_at_once") return CrossLiquidationPolicy::AllAtOnce;
  if (s == "largest_loss_first") return CrossLiquidationPolicy::LargestLossFirst;
  return std::nullopt;
}

}  // namespace domain
}  // namespace margin
