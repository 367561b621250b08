#include "ledger/store/allocation_store.hpp"

#include <algorithm>
#include <mutex>

namespace ledger {

void AllocationStore::upsert(const domain::Allocation& allocation) {
  std::unique_lock lock(mutex_);
  auto [it, inserted] = rows_.insert_or_assign(allocation.id, allocation);
  if (inserted) {
    by_batch_[allocation.stock_batch_id].push_back(allocation.id);
  }
}

bool AllocationStore::erase(domain::AllocationId id) {
  std::unique_lock lock(mutex_);
  auto it = rows_.find(id);
  if (it == rows_.end()) {
    return false;
  }

  auto idx = by_batch_.find(it->second.stock_batch_id);
  if (idx != by_batch_.end()) {
    auto& ids = idx->second;
    ids.erase(std::remove(ids.begin(), ids.end(), id), ids.end());
    if (ids.empty()) {
      by_batch_.erase(idx);
    }
  }

  rows_.erase(it);
  return true;
}

std::optional<domain::Allocation> AllocationStore::find(
    domain::AllocationId id) const {
  std::shared_lock lock(mutex_);
  auto it = rows_.find(id);
  if (it == rows_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<domain::Allocation> AllocationStore::forBatch(
    domain::BatchId batch_id) const {
  std::vector<domain::Allocation> result;
  {
    std::shared_lock lock(mutex_);
    auto idx = by_batch_.find(batch_id);
    if (idx == by_batch_.end()) {
      return result;
    }
    result.reserve(idx->second.size());
    for (domain::AllocationId id : idx->second) {
      result.push_back(rows_.at(id));
    }
  }
  std::sort(result.begin(), result.end(),
            [](const domain::Allocation& a, const domain::Allocation& b) {
              return a.id < b.id;
            });
  return result;
}

std::size_t AllocationStore::size() const {
  std::shared_lock lock(mutex_);
  return rows_.size();
}

}  // namespace ledger
