#pragma once

#include "ledger/domain/adjustment.hpp"
#include "ledger/domain/allocation.hpp"
#include "ledger/domain/ids.hpp"

#include <optional>
#include <vector>

namespace ledger {
namespace quantity {

// -----------------------------------------------------------------------------
// Quantity arithmetic: pure functions over batch rows
// -----------------------------------------------------------------------------
//
// @brief  The only place availability is computed. Everything else
//         (validator, engine queries, integrity scan) calls these.
//
// @details
// available = recorded + SUM(delta of Approved/Completed adjustments)
//
// Pending and Rejected adjustments never contribute. The functions are total:
// no error conditions, no clamping. A negative result is a legitimate answer
// that the validator turns into NegativeAvailability.
//
// Thread model: Stateless. Safe from any thread.
// -----------------------------------------------------------------------------

// Sum of recorded quantity and the given deltas.
domain::Quantity available(domain::Quantity recorded,
                           const std::vector<domain::Quantity>& deltas);

// -------------------------------------------------------------------------
// approvedDelta(adjustments, excluding)
// -------------------------------------------------------------------------
// @brief  Sum of quantity_delta over adjustments whose status counts toward
//         availability.
//
// @param  excluding  Adjustment left out of the sum. Used by approval
//                    validation to compute other_delta.
// -------------------------------------------------------------------------
domain::Quantity approvedDelta(
    const std::vector<domain::Adjustment>& adjustments,
    std::optional<domain::AdjustmentId> excluding = std::nullopt);

// Sum of allocation quantities, optionally leaving one allocation out (the
// row being updated).
domain::Quantity allocatedTotal(
    const std::vector<domain::Allocation>& allocations,
    std::optional<domain::AllocationId> excluding = std::nullopt);

}  // namespace quantity
}  // namespace ledger
