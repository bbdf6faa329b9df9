#pragma once

#include <utility>
#include <variant>

namespace margin {
namespace domain {

// -----------------------------------------------------------------------------
// ErrorCode — every expected failure a caller can see
// -----------------------------------------------------------------------------
//
// @brief  Closed taxonomy of rejection reasons returned by the ledger, the
//         coordinator and the IPC surface.
//
// @details
// Three families:
//   Validation   InvalidLeverage, InsufficientCollateral, PairUnavailable,
//                InvalidRequest. Rejected before any state change; the caller
//                corrects its input.
//   Concurrency  VersionConflict. The caller re-reads and decides whether a
//                retry is still meaningful.
//   Lookup       PositionNotFound, PositionNotOpen.
//   Internal     ComputationInvalid (a snapshot the margin math refuses),
//                HistoryUnavailable (the audit append failed, nothing was
//                committed).
//
// None of these are thrown. They travel inside Result<T>.
// -----------------------------------------------------------------------------
enum class ErrorCode {
  InvalidLeverage,
  InsufficientCollateral,
  PairUnavailable,
  VersionConflict,
  PositionNotFound,
  PositionNotOpen,
  InvalidRequest,
  ComputationInvalid,
  HistoryUnavailable,
};

inline const char* toString(ErrorCode code) {
  switch (code) {
    case ErrorCode::InvalidLeverage:        return "InvalidLeverage";
    case ErrorCode::InsufficientCollateral: return "InsufficientCollateral";
    case ErrorCode::PairUnavailable:        return "PairUnavailable";
    case ErrorCode::VersionConflict:        return "VersionConflict";
    case ErrorCode::PositionNotFound:       return "PositionNotFound";
    case ErrorCode::PositionNotOpen:        return "PositionNotOpen";
    case ErrorCode::InvalidRequest:         return "InvalidRequest";
    case ErrorCode::ComputationInvalid:     return "ComputationInvalid";
    case ErrorCode::HistoryUnavailable:     return "HistoryUnavailable";
  }
  return "Unknown";
}

// Only a version conflict can succeed on a plain retry after a re-read.
inline bool isRetryable(ErrorCode code) {
  return code == ErrorCode::VersionConflict;
}

// -----------------------------------------------------------------------------
// Result<T> — value or ErrorCode
// -----------------------------------------------------------------------------
//
// @brief  Return type of every fallible engine operation.
//
// @details
// Thin wrapper over std::variant<T, ErrorCode>. Callers test ok() and then
// read value() or error(). Accessing the wrong alternative throws
// std::bad_variant_access, which is a programming error, not a business
// outcome.
//
// T must not be ErrorCode itself.
// -----------------------------------------------------------------------------
template <typename T>
class Result {
 public:
  Result(T value) : storage_(std::move(value)) {}
  Result(ErrorCode error) : storage_(error) {}

  bool ok() const { return std::holds_alternative<T>(storage_); }
  explicit operator bool() const { return ok(); }

  const T& value() const& { return std::get<T>(storage_); }
  T& value() & { return std::get<T>(storage_); }
  T&& value() && { return std::get<T>(std::move(storage_)); }

  ErrorCode error() const { return std::get<ErrorCode>(storage_); }

 private:
  std::variant<T, ErrorCode> storage_;
};

}  // namespace domain
}  // namespace margin
