#pragma once

#include "ledger/domain/allocation.hpp"

#include <cstddef>
#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

namespace ledger {

// -----------------------------------------------------------------------------
// AllocationStore: storefront commitments per batch
// -----------------------------------------------------------------------------
// Passive keyed table with a batch index. The availability floor is enforced
// upstream by AvailabilityValidator inside the batch's unit of work.
//
// Thread model: Safe from any thread (shared_mutex). Results are copies.
// -----------------------------------------------------------------------------
class AllocationStore {
 public:
  AllocationStore() = default;

  AllocationStore(const AllocationStore&) = delete;
  AllocationStore& operator=(const AllocationStore&) = delete;
  AllocationStore(AllocationStore&&) = delete;
  AllocationStore& operator=(AllocationStore&&) = delete;

  void upsert(const domain::Allocation& allocation);

  // Returns false if no allocation had that id.
  bool erase(domain::AllocationId id);

  std::optional<domain::Allocation> find(domain::AllocationId id) const;

  // Allocations of one batch in ascending id order.
  std::vector<domain::Allocation> forBatch(domain::BatchId batch_id) const;

  std::size_t size() const;

 private:
  mutable std::shared_mutex mutex_;
  std::unordered_map<domain::AllocationId, domain::Allocation> rows_;
  std::unordered_map<domain::BatchId, std::vector<domain::AllocationId>>
      by_batch_;
};

}  // namespace ledger
