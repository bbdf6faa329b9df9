#pragma once

#include "margin/concurrent/id_generator.hpp"
#include "margin/history/i_history_recorder.hpp"

#include <mutex>
#include <string>
#include <vector>

namespace margin {

// -----------------------------------------------------------------------------
// JournalHistoryRecorder — JSON-lines journal with in-memory query index
// -----------------------------------------------------------------------------
//
// @brief  Appends every record as one JSON line to a journal file and keeps
//         an in-memory copy for queries.
//
// @details
// Durability: the journal is opened with O_APPEND and every append is a
// full write(2) of the line followed by fsync(2). append() returns true only
// after fsync succeeded; on any failure it logs to stderr, returns false,
// and the record is NOT added to the in-memory index.
//
// Replay: on construction an existing journal is read line by line and
// every well-formed record is loaded, so audit queries survive restarts.
// Malformed lines (a torn final write, say) are skipped with a warning.
// The record id generator is reseeded past the highest id seen, and the
// highest position id seen is reported by maxPositionId().
//
// An empty path gives a memory-only recorder (no file, append always
// succeeds). The tests use it for ledger scenarios.
//
// Thread model:
//   One std::mutex serializes appends and queries, so journal order equals
//   in-memory order.
//
// Ownership:
//   Owns the file descriptor; closed in the destructor.
// -----------------------------------------------------------------------------
class JournalHistoryRecorder final : public IHistoryRecorder {
 public:
  // Throws std::runtime_error if a non-empty path cannot be opened.
  explicit JournalHistoryRecorder(std::string journal_path = "");
  ~JournalHistoryRecorder() override;

  JournalHistoryRecorder(const JournalHistoryRecorder&) = delete;
  JournalHistoryRecorder& operator=(const JournalHistoryRecorder&) = delete;

  domain::RecordId nextRecordId() override;
  domain::PositionId maxPositionId() const override;

  bool append(const domain::LiquidationRecord& record) override;
  bool append(const domain::ClosureRecord& record) override;

  std::vector<domain::LiquidationRecord> liquidationsByOwner(
      const domain::OwnerId& owner) const override;
  std::vector<domain::LiquidationRecord> liquidationsByPosition(
      domain::PositionId position_id) const override;
  std::vector<domain::ClosureRecord> closuresByOwner(
      const domain::OwnerId& owner) const override;

  std::size_t replayedCount() const { return replayed_; }

 private:
  void replay();
  bool writeLine(const std::string& line);

  std::string path_;
  int fd_{-1};
  std::size_t replayed_{0};

  IdGenerator record_ids_;

  mutable std::mutex mutex_;
  std::vector<domain::LiquidationRecord> liquidations_;
  std::vector<domain::ClosureRecord> closures_;
  domain::PositionId max_position_id_{0};
};

}  // namespace margin
