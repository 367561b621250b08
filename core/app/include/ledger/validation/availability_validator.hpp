#pragma once

#include "ledger/domain/adjustment.hpp"
#include "ledger/domain/allocation.hpp"
#include "ledger/domain/result.hpp"
#include "ledger/domain/stock_batch.hpp"

#include <optional>
#include <vector>

namespace ledger {

// -----------------------------------------------------------------------------
// BatchSnapshot: everything a decision about one batch may read
// -----------------------------------------------------------------------------
// Built by TransactionCoordinator while the batch lock is held, so the three
// row sets are mutually consistent for the duration of the decision.
// -----------------------------------------------------------------------------
struct BatchSnapshot {
  domain::StockBatch batch;
  std::vector<domain::Adjustment> adjustments;
  std::vector<domain::Allocation> allocations;
};

// Numbers behind "how much of this batch is free".
struct AvailabilityBreakdown {
  domain::Quantity recorded{0};
  domain::Quantity approved_delta{0};
  domain::Quantity available{0};
  domain::Quantity allocated{0};
  domain::Quantity remaining{0};
};

// Numbers captured when an adjustment approval is accepted. They become the
// metadata of the approval's audit entry.
struct ApprovalDecision {
  domain::Quantity recorded{0};
  domain::Quantity allocated{0};
  domain::Quantity other_delta{0};
  domain::Quantity quantity_delta{0};
  domain::Quantity new_available{0};
};

// -----------------------------------------------------------------------------
// AvailabilityValidator
// -----------------------------------------------------------------------------
//
// @brief  Pure decision functions over a BatchSnapshot.
//
// @details
// The validator never reads a store and never writes anything. It receives
// a snapshot, returns either the decision numbers or a typed LedgerError, and
// leaves persistence to the caller's UnitOfWork. That keeps every rule
// testable with plain structs and no locking.
//
// Check order:
//   Allocation: NegativeAvailability is tested before InsufficientStock.
//     A negative availability always also fails the remaining check, so the
//     data-integrity signal would otherwise never surface.
//   Approval:   WouldGoNegative is tested before BelowAllocatedFloor for the
//     same reason (new_available < 0 implies new_available < allocated).
//
// Thread model: Stateless. Safe from any thread.
// -----------------------------------------------------------------------------
class AvailabilityValidator {
 public:
  AvailabilityValidator() = delete;

  static AvailabilityBreakdown computeAvailability(
      const BatchSnapshot& snapshot,
      std::optional<domain::AllocationId> excluding_allocation = std::nullopt);

  // -------------------------------------------------------------------------
  // validateAllocation(snapshot, requested, excluding_allocation)
  // -------------------------------------------------------------------------
  // @brief  Decides whether `requested` units may be committed to a
  //         storefront.
  //
  // @param  excluding_allocation  Set when updating an existing allocation;
  //                               its current quantity is left out of
  //                               already_allocated.
  //
  // @return The breakdown the decision was made on, or:
  //         - NegativeAvailability if available < 0 (whatever is requested)
  //         - InsufficientStock    if requested > remaining
  // -------------------------------------------------------------------------
  static Result<AvailabilityBreakdown> validateAllocation(
      const BatchSnapshot& snapshot, domain::Quantity requested,
      std::optional<domain::AllocationId> excluding_allocation = std::nullopt);

  // -------------------------------------------------------------------------
  // validateAdjustmentApproval(snapshot, adjustment, target)
  // -------------------------------------------------------------------------
  // @brief  Decides whether a Pending adjustment may become `target`
  //         (Approved or Completed).
  //
  // @details
  // other_delta is the approved delta of every other adjustment on the
  // batch. Positive deltas only raise availability and always pass. For a
  // negative delta:
  //
  //   new_available = recorded + other_delta + quantity_delta
  //   new_available < 0          -> WouldGoNegative
  //   new_available < allocated  -> BelowAllocatedFloor
  //
  // @return ApprovalDecision on success; InvalidTransition if the adjustment
  //         is not Pending; InvalidArgument if target is not Approved or
  //         Completed.
  // -------------------------------------------------------------------------
  static Result<ApprovalDecision> validateAdjustmentApproval(
      const BatchSnapshot& snapshot, const domain::Adjustment& adjustment,
      domain::AdjustmentStatus target);

  // Request-time sanity check: a single loss larger than the entire receipt
  // can never be approved and is refused up front with WouldGoNegative.
  static Result<domain::Quantity> validateAdjustmentRequest(
      const domain::StockBatch& batch, domain::Quantity quantity_delta);
};

}  // namespace ledger
