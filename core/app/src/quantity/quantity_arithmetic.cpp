#include "ledger/quantity/quantity_arithmetic.hpp"

#include <numeric>

namespace ledger {
namespace quantity {

domain::Quantity available(domain::Quantity recorded,
                           const std::vector<domain::Quantity>& deltas) {
  return std::accumulate(deltas.begin(), deltas.end(), recorded);
}

domain::Quantity approvedDelta(
    const std::vector<domain::Adjustment>& adjustments,
    std::optional<domain::AdjustmentId> excluding) {
  domain::Quantity total = 0;
  for (const auto& adj : adjustments) {
    if (excluding && adj.id == *excluding) {
      continue;
    }
    if (domain::countsTowardAvailability(adj.status)) {
      total += adj.quantity_delta;
    }
  }
  return total;
}

domain::Quantity allocatedTotal(
    const std::vector<domain::Allocation>& allocations,
    std::optional<domain::AllocationId> excluding) {
  domain::Quantity total = 0;
  for (const auto& alloc : allocations) {
    if (excluding && alloc.id == *excluding) {
      continue;
    }
    total += alloc.quantity;
  }
  return total;
}

}  // namespace quantity
}  // namespace ledger
