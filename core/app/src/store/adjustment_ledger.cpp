#include "ledger/store/adjustment_ledger.hpp"

#include <algorithm>
#include <mutex>

namespace ledger {

namespace {

void sortById(std::vector<domain::Adjustment>& rows) {
  std::sort(rows.begin(), rows.end(),
            [](const domain::Adjustment& a, const domain::Adjustment& b) {
              return a.id < b.id;
            });
}

}  // namespace

// -----------------------------------------------------------------------------
// upsert: replace in place, index on first sight
// -----------------------------------------------------------------------------
void AdjustmentLedger::upsert(const domain::Adjustment& adjustment) {
  std::unique_lock lock(mutex_);
  auto [it, inserted] = rows_.insert_or_assign(adjustment.id, adjustment);
  if (inserted) {
    by_batch_[adjustment.stock_batch_id].push_back(adjustment.id);
  }
}

std::optional<domain::Adjustment> AdjustmentLedger::find(
    domain::AdjustmentId id) const {
  std::shared_lock lock(mutex_);
  auto it = rows_.find(id);
  if (it == rows_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<domain::Adjustment> AdjustmentLedger::forBatch(
    domain::BatchId batch_id) const {
  std::vector<domain::Adjustment> result;
  {
    std::shared_lock lock(mutex_);
    auto idx = by_batch_.find(batch_id);
    if (idx == by_batch_.end()) {
      return result;
    }
    result.reserve(idx->second.size());
    for (domain::AdjustmentId id : idx->second) {
      result.push_back(rows_.at(id));
    }
  }
  sortById(result);
  return result;
}

std::vector<domain::Adjustment> AdjustmentLedger::pending(
    std::optional<domain::BatchId> batch_id) const {
  if (batch_id) {
    auto rows = forBatch(*batch_id);
    rows.erase(std::remove_if(rows.begin(), rows.end(),
                              [](const domain::Adjustment& a) {
                                return a.status !=
                                       domain::AdjustmentStatus::Pending;
                              }),
               rows.end());
    return rows;
  }

  std::vector<domain::Adjustment> result;
  {
    std::shared_lock lock(mutex_);
    for (const auto& [id, adj] : rows_) {
      if (adj.status == domain::AdjustmentStatus::Pending) {
        result.push_back(adj);
      }
    }
  }
  sortById(result);
  return result;
}

std::size_t AdjustmentLedger::size() const {
  std::shared_lock lock(mutex_);
  return rows_.size();
}

// -----------------------------------------------------------------------------
// transitionAllowed: exhaustive status machine
// -----------------------------------------------------------------------------
bool AdjustmentLedger::transitionAllowed(domain::AdjustmentStatus current,
                                         domain::AdjustmentStatus next) {
  using S = domain::AdjustmentStatus;

  switch (current) {
    case S::Pending:
      return next == S::Approved ||
             next == S::Completed ||
             next == S::Rejected;

    case S::Approved:
      return next == S::Completed;

    case S::Completed:
    case S::Rejected:
      return false;
  }

  return false;
}

}  // namespace ledger
