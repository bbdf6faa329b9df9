#pragma once

#include <cstdint>

namespace margin {

// -----------------------------------------------------------------------------
// ITimeProvider — abstract time source interface
// -----------------------------------------------------------------------------
//
// @brief  Abstracts "current time" away from std::chrono::system_clock.
//
// @details
// Every timestamp the engine writes (opened_at_ms, updated_at_ms,
// closed_at_ms, record timestamps) comes from an injected provider:
//   - LiveTimeProvider       → delegates to std::chrono::system_clock.
//   - SimulationTimeProvider → returns a value set explicitly, so tests and
//                              replays produce identical records run after run.
//
// Epoch milliseconds as int64_t: the oracle's ticks, the JSON journal and
// the IPC payloads all carry integer milliseconds.
//
// Thread-safety contract:
//   Implementations MUST be safe for concurrent reads from multiple threads.
//
// Ownership:
//   Components hold a const reference; they do NOT own the provider. The
//   provider must outlive every component that references it.
// -----------------------------------------------------------------------------
class ITimeProvider {
 public:
  virtual ~ITimeProvider() = default;

  // -------------------------------------------------------------------------
  // now_ms()
  // -------------------------------------------------------------------------
  // @return Milliseconds since 1970-01-01 00:00:00 UTC.
  //
  // Thread-safety: Safe to call concurrently from any thread.
  // -------------------------------------------------------------------------
  virtual std::int64_t now_ms() const = 0;
};

}  // namespace margin
