#pragma once

#include "ledger/domain/adjustment.hpp"
#include "ledger/domain/adjustment_status.hpp"

#include <cstdint>
#include <optional>

namespace ledger {

// -----------------------------------------------------------------------------
// AdjustmentUpdateEvent
// -----------------------------------------------------------------------------
//
// @brief  Published whenever an adjustment is created or changes status.
//
// @details
// adjustment is the row as committed. previous_status is empty for a newly
// requested adjustment and holds the state before the transition otherwise,
// so subscribers can react to specific edges (for example Pending -> Rejected)
// without keeping their own copy of the ledger.
//
// Thread model:
//   Staged inside a UnitOfWork and published on the notification loop
//   thread after commit. Plain data; safe to copy across threads.
// -----------------------------------------------------------------------------
struct AdjustmentUpdateEvent {
  domain::Adjustment adjustment;
  std::optional<domain::AdjustmentStatus> previous_status;
  std::int64_t timestamp_ms{0};
  std::uint64_t sequence_id{0};
};

}  // namespace ledger
