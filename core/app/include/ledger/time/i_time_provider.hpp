#pragma once

#include <cstdint>

namespace ledger {

// -----------------------------------------------------------------------------
// ITimeProvider: injectable wall clock
// -----------------------------------------------------------------------------
// Every timestamp the ledger writes (requested_at, decided_at, audit
// timestamp, event timestamp) comes from here. Production wires
// LiveTimeProvider; tests wire SimulationTimeProvider so audit ordering and
// cursor paging are deterministic.
// -----------------------------------------------------------------------------
class ITimeProvider {
 public:
  virtual ~ITimeProvider() = default;

  // Milliseconds since the Unix epoch. Safe to call from any thread.
  virtual std::int64_t now_ms() const = 0;
};

}  // namespace ledger
