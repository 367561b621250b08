#pragma once

#include "ledger/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>

namespace ledger {

// -----------------------------------------------------------------------------
// SimulationTimeProvider: manually driven clock
// -----------------------------------------------------------------------------
//
// @brief  now_ms() returns whatever advance_time() or tick() last stored.
//
// @details
// Starts at 0 unless a start time is given. Used by tests to give audit entries distinct, predictable
// timestamps. The clock does not enforce monotonicity; tests may set any
// value, including moving backwards to produce timestamp ties.
//
// Thread-safety: now_ms() and advance_time() are safe from any thread.
// -----------------------------------------------------------------------------
class SimulationTimeProvider final : public ITimeProvider {
 public:
  SimulationTimeProvider() = default;
  explicit SimulationTimeProvider(std::int64_t start_ms)
      : current_time_ms_(start_ms) {}

  std::int64_t now_ms() const override;

  void advance_time(std::int64_t new_time_ms);

  // Moves the clock forward by delta_ms.
  void tick(std::int64_t delta_ms);

 private:
  std::atomic<std::int64_t> current_time_ms_{0};
};

}  // namespace ledger
