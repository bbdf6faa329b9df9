#include "margin/history/journal_history_recorder.hpp"

#include "margin/history/record_codec.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <iostream>
#include <iterator>
#include <stdexcept>
#include <utility>

namespace margin {

JournalHistoryRecorder::JournalHistoryRecorder(std::string journal_path)
    : path_(std::move(journal_path)) {
  if (path_.empty()) {
    return;
  }

  replay();

  fd_ = ::open(path_.c_str(), O_CREAT | O_APPEND | O_WRONLY, 0644);
  if (fd_ < 0) {
    throw std::runtime_error("cannot open history journal " + path_ + ": " +
                             std::strerror(errno));
  }

  std::cout << "[JournalHistoryRecorder] journal " << path_ << " open, "
            << replayed_ << " record(s) replayed.\n";
}

JournalHistoryRecorder::~JournalHistoryRecorder() {
  if (fd_ >= 0) {
    ::fsync(fd_);
    ::close(fd_);
  }
}

domain::RecordId JournalHistoryRecorder::nextRecordId() {
  return record_ids_.next_id();
}

domain::PositionId JournalHistoryRecorder::maxPositionId() const {
  std::lock_guard lock(mutex_);
  return max_position_id_;
}

// -----------------------------------------------------------------------------
// replay(): load an existing journal, called once before the fd is opened
// -----------------------------------------------------------------------------
void JournalHistoryRecorder::replay() {
  std::ifstream in(path_);
  if (!in.is_open()) {
    return;  // First run: no journal yet.
  }

  std::string line;
  std::size_t line_no = 0;
  while (std::getline(in, line)) {
    ++line_no;
    if (line.empty()) {
      continue;
    }

    nlohmann::json j = nlohmann::json::parse(line, nullptr, false);
    if (j.is_discarded()) {
      std::cerr << "[JournalHistoryRecorder] skipping malformed line "
                << line_no << " in " << path_ << "\n";
      continue;
    }

    if (auto liq = liquidationFromJson(j)) {
      record_ids_.reseed(liq->id);
      max_position_id_ = std::max(max_position_id_, liq->position_id);
      liquidations_.push_back(std::move(*liq));
      ++replayed_;
    } else if (auto closure = closureFromJson(j)) {
      record_ids_.reseed(closure->id);
      max_position_id_ = std::max(max_position_id_, closure->position_id);
      closures_.push_back(std::move(*closure));
      ++replayed_;
    } else {
      std::cerr << "[JournalHistoryRecorder] skipping unknown record at line "
                << line_no << " in " << path_ << "\n";
    }
  }
}

// -----------------------------------------------------------------------------
// writeLine(): full write + fsync. Caller holds mutex_.
// -----------------------------------------------------------------------------
bool JournalHistoryRecorder::writeLine(const std::string& line) {
  if (fd_ < 0) {
    return path_.empty();
  }

  const char* data = line.data();
  std::size_t remaining = line.size();
  while (remaining > 0) {
    ssize_t n = ::write(fd_, data, remaining);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      std::cerr << "[JournalHistoryRecorder] write failed: "
                << std::strerror(errno) << "\n";
      return false;
    }
    data += n;
    remaining -= static_cast<std::size_t>(n);
  }

  if (::fsync(fd_) != 0) {
    std::cerr << "[JournalHistoryRecorder] fsync failed: "
              << std::strerror(errno) << "\n";
    return false;
  }
  return true;
}

bool JournalHistoryRecorder::append(const domain::LiquidationRecord& record) {
  const std::string line = toJson(record).dump() + "\n";

  std::lock_guard lock(mutex_);
  if (!writeLine(line)) {
    return false;
  }
  liquidations_.push_back(record);
  max_position_id_ = std::max(max_position_id_, record.position_id);
  return true;
}

bool JournalHistoryRecorder::append(const domain::ClosureRecord& record) {
  const std::string line = toJson(record).dump() + "\n";

  std::lock_guard lock(mutex_);
  if (!writeLine(line)) {
    return false;
  }
  closures_.push_back(record);
  max_position_id_ = std::max(max_position_id_, record.position_id);
  return true;
}

std::vector<domain::LiquidationRecord>
JournalHistoryRecorder::liquidationsByOwner(
    const domain::OwnerId& owner) const {
  std::lock_guard lock(mutex_);
  std::vector<domain::LiquidationRecord> out;
  std::copy_if(liquidations_.begin(), liquidations_.end(),
               std::back_inserter(out),
               [&](const auto& r) { return r.owner == owner; });
  return out;
}

std::vector<domain::LiquidationRecord>
JournalHistoryRecorder::liquidationsByPosition(
    domain::PositionId position_id) const {
  std::lock_guard lock(mutex_);
  std::vector<domain::LiquidationRecord> out;
  std::copy_if(liquidations_.begin(), liquidations_.end(),
               std::back_inserter(out),
               [&](const auto& r) { return r.position_id == position_id; });
  return out;
}

std::vector<domain::ClosureRecord> JournalHistoryRecorder::closuresByOwner(
    const domain::OwnerId& owner) const {
  std::lock_guard lock(mutex_);
  std::vector<domain::ClosureRecord> out;
  std::copy_if(closures_.begin(), closures_.end(), std::back_inserter(out),
               [&](const auto& r) { return r.owner == owner; });
  return out;
}

}  // namespace margin
