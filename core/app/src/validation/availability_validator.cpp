#include "ledger/validation/availability_validator.hpp"

#include "ledger/quantity/quantity_arithmetic.hpp"
#include "ledger/store/adjustment_ledger.hpp"

#include <string>

namespace ledger {

// -----------------------------------------------------------------------------
// computeAvailability
// -----------------------------------------------------------------------------
AvailabilityBreakdown AvailabilityValidator::computeAvailability(
    const BatchSnapshot& snapshot,
    std::optional<domain::AllocationId> excluding_allocation) {
  AvailabilityBreakdown b;
  b.recorded = snapshot.batch.recorded_quantity;
  b.approved_delta = quantity::approvedDelta(snapshot.adjustments);
  b.available = quantity::available(b.recorded, {b.approved_delta});
  b.allocated =
      quantity::allocatedTotal(snapshot.allocations, excluding_allocation);
  b.remaining = b.available - b.allocated;
  return b;
}

// -----------------------------------------------------------------------------
// validateAllocation
// -----------------------------------------------------------------------------
Result<AvailabilityBreakdown> AvailabilityValidator::validateAllocation(
    const BatchSnapshot& snapshot, domain::Quantity requested,
    std::optional<domain::AllocationId> excluding_allocation) {
  AvailabilityBreakdown b = computeAvailability(snapshot, excluding_allocation);

  if (b.available < 0) {
    return LedgerError::negativeAvailability(b.recorded, b.approved_delta,
                                             b.available);
  }

  if (requested > b.remaining) {
    return LedgerError::insufficientStock(b.recorded, b.approved_delta,
                                          b.available, b.allocated,
                                          b.remaining, requested);
  }

  return b;
}

// -----------------------------------------------------------------------------
// validateAdjustmentApproval
// -----------------------------------------------------------------------------
Result<ApprovalDecision> AvailabilityValidator::validateAdjustmentApproval(
    const BatchSnapshot& snapshot, const domain::Adjustment& adjustment,
    domain::AdjustmentStatus target) {
  using S = domain::AdjustmentStatus;

  if (target != S::Approved && target != S::Completed) {
    return LedgerError::invalidArgument(
        std::string("Approval target must be APPROVED or COMPLETED, got ") +
        domain::adjustmentStatusToString(target));
  }

  if (adjustment.status != S::Pending ||
      !AdjustmentLedger::transitionAllowed(adjustment.status, target)) {
    return LedgerError::invalidTransition(
        "adjustment " + std::to_string(adjustment.id) + " is " +
        domain::adjustmentStatusToString(adjustment.status) +
        ", cannot move to " + domain::adjustmentStatusToString(target));
  }

  ApprovalDecision d;
  d.recorded = snapshot.batch.recorded_quantity;
  d.allocated = quantity::allocatedTotal(snapshot.allocations);
  d.other_delta = quantity::approvedDelta(snapshot.adjustments, adjustment.id);
  d.quantity_delta = adjustment.quantity_delta;
  d.new_available = quantity::available(d.recorded,
                                        {d.other_delta, d.quantity_delta});

  // Gains never endanger the floor.
  if (d.quantity_delta >= 0) {
    return d;
  }

  if (d.new_available < 0) {
    return LedgerError::wouldGoNegative(d.recorded, d.other_delta,
                                        d.quantity_delta, d.new_available);
  }

  if (d.new_available < d.allocated) {
    return LedgerError::belowAllocatedFloor(d.recorded, d.allocated,
                                            d.other_delta, d.quantity_delta,
                                            d.new_available);
  }

  return d;
}

// -----------------------------------------------------------------------------
// validateAdjustmentRequest
// -----------------------------------------------------------------------------
Result<domain::Quantity> AvailabilityValidator::validateAdjustmentRequest(
    const domain::StockBatch& batch, domain::Quantity quantity_delta) {
  domain::Quantity projected = batch.recorded_quantity + quantity_delta;
  if (projected < 0) {
    return LedgerError::wouldGoNegative(batch.recorded_quantity, 0,
                                        quantity_delta, projected);
  }
  return projected;
}

}  // namespace ledger
