#pragma once

#include "ledger/time/i_time_provider.hpp"

namespace ledger {

// Reads std::chrono::system_clock.
class LiveTimeProvider final : public ITimeProvider {
 public:
  std::int64_t now_ms() const override;
};

}  // namespace ledger
