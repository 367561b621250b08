#include "ledger/store/batch_store.hpp"

#include <algorithm>
#include <mutex>

namespace ledger {

bool BatchStore::insert(const domain::StockBatch& batch) {
  std::unique_lock lock(mutex_);
  return batches_.emplace(batch.id, batch).second;
}

std::optional<domain::StockBatch> BatchStore::find(domain::BatchId id) const {
  std::shared_lock lock(mutex_);
  auto it = batches_.find(id);
  if (it == batches_.end()) {
    return std::nullopt;
  }
  return it->second;
}

bool BatchStore::contains(domain::BatchId id) const {
  std::shared_lock lock(mutex_);
  return batches_.count(id) != 0;
}

std::vector<domain::BatchId> BatchStore::ids() const {
  std::vector<domain::BatchId> result;
  {
    std::shared_lock lock(mutex_);
    result.reserve(batches_.size());
    for (const auto& [id, batch] : batches_) {
      result.push_back(id);
    }
  }
  std::sort(result.begin(), result.end());
  return result;
}

std::size_t BatchStore::size() const {
  std::shared_lock lock(mutex_);
  return batches_.size();
}

}  // namespace ledger
