#pragma once

#include "margin/domain/history_records.hpp"

#include <vector>

namespace margin {

// -----------------------------------------------------------------------------
// IHistoryRecorder — append-only audit trail
// -----------------------------------------------------------------------------
//
// @brief  Durable store of LiquidationRecords and ClosureRecords.
//
// @details
// append() returns true only once the record is durable. PositionLedger
// calls it BEFORE committing the terminal transition and aborts the
// transition (HistoryUnavailable) on false, so a crash can never leave a
// position marked liquidated without its record.
//
// nextRecordId() hands out record ids. Implementations that restore
// history must continue past the highest restored id.
//
// maxPositionId() is the highest position_id any stored record refers to
// (0 when empty). PositionLedger starts minting position ids above it, so a
// new position never inherits a restored position's audit trail.
//
// Query results are copies, in append order.
//
// Thread-safety contract:
//   All methods MUST be safe to call concurrently from any thread.
// -----------------------------------------------------------------------------
class IHistoryRecorder {
 public:
  virtual ~IHistoryRecorder() = default;

  virtual domain::RecordId nextRecordId() = 0;

  virtual domain::PositionId maxPositionId() const = 0;

  virtual bool append(const domain::LiquidationRecord& record) = 0;
  virtual bool append(const domain::ClosureRecord& record) = 0;

  virtual std::vector<domain::LiquidationRecord> liquidationsByOwner(
      const domain::OwnerId& owner) const = 0;
  virtual std::vector<domain::LiquidationRecord> liquidationsByPosition(
      domain::PositionId position_id) const = 0;
  virtual std::vector<domain::ClosureRecord> closuresByOwner(
      const domain::OwnerId& owner) const = 0;
};

}  // namespace margin
