#pragma once

#include "ledger/domain/allocation.hpp"

#include <cstdint>

namespace ledger {

// -----------------------------------------------------------------------------
// AllocationUpdateEvent
// -----------------------------------------------------------------------------
// Published after an allocation is created, resized or released. For a
// release, allocation holds the row as it was before deletion and
// released is true.
// -----------------------------------------------------------------------------
struct AllocationUpdateEvent {
  domain::Allocation allocation;
  domain::Quantity previous_quantity{0};  // 0 for a new allocation
  bool released{false};
  std::int64_t timestamp_ms{0};
  std::uint64_t sequence_id{0};
};

}  // namespace ledger
