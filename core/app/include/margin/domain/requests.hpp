#pragma once

#include "margin/domain/position_types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace margin {
namespace domain {

// -----------------------------------------------------------------------------
// Request types
// -----------------------------------------------------------------------------
//
// @brief  One struct per state-changing operation, each carrying only the
//         fields its operation needs.
//
// @details
// The IPC boundary (CommandCodec) decodes JSON into exactly one of these and
// rejects anything malformed with InvalidRequest before the engine sees it.
// The ExecutionCoordinator dispatches on the variant with std::visit.
//
// Every request against an existing position carries expected_version: the
// version the caller last read. A stale version loses with VersionConflict.
// -----------------------------------------------------------------------------

struct OpenRequest {
  OwnerId owner;
  std::string pair;
  Side side{Side::Long};
  int leverage{1};
  double size{0.0};
  double collateral{0.0};
  std::optional<MarginMode> mode;      // Owner's default mode when absent
  std::optional<double> stop_loss;
  std::optional<double> take_profit;
};

struct AdjustCollateralRequest {
  PositionId position_id{0};
  std::uint64_t expected_version{0};
  double delta{0.0};                   // > 0 adds margin, < 0 withdraws
};

// Execution prices below are empty for user and operator requests: the
// ledger then fills at the pair's latest mark. Only the LiquidationMonitor
// sets them, to the tick it evaluated.

// Partial close of `quantity` (< size).
struct ReduceRequest {
  PositionId position_id{0};
  std::uint64_t expected_version{0};
  double quantity{0.0};
  std::optional<double> price;
};

struct CloseRequest {
  PositionId position_id{0};
  std::uint64_t expected_version{0};
  std::optional<double> close_price;
  CloseReason reason{CloseReason::Manual};
};

// Replaces both triggers. An empty optional clears that trigger.
struct SetTriggersRequest {
  PositionId position_id{0};
  std::uint64_t expected_version{0};
  std::optional<double> stop_loss;
  std::optional<double> take_profit;
};

struct LiquidateRequest {
  PositionId position_id{0};
  std::uint64_t expected_version{0};
  std::optional<double> mark_price;
  LiquidationType type{LiquidationType::Auto};
};

using Request = std::variant<OpenRequest, AdjustCollateralRequest,
                             ReduceRequest, CloseRequest, SetTriggersRequest,
                             LiquidateRequest>;

// -----------------------------------------------------------------------------
// GroupLiquidation
// -----------------------------------------------------------------------------
// Issued only by the LiquidationMonitor for an owner's cross group. Members
// are listed in liquidation order (largest loss first), each with the
// version the monitor evaluated and the mark it used.
// -----------------------------------------------------------------------------
struct GroupLiquidation {
  struct Member {
    PositionId position_id{0};
    std::uint64_t expected_version{0};
    double mark_price{0.0};
  };

  OwnerId owner;
  std::vector<Member> members;
  LiquidationType type{LiquidationType::Auto};
};

}  // namespace domain
}  // namespace margin
