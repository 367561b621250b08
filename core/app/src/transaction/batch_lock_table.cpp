#include "ledger/transaction/batch_lock_table.hpp"

#include <utility>

namespace ledger {

std::timed_mutex& BatchLockTable::mutexFor(domain::BatchId batch_id) {
  std::lock_guard lock(table_mutex_);
  auto& slot = locks_[batch_id];
  if (!slot) {
    slot = std::make_unique<std::timed_mutex>();
  }
  return *slot;
}

std::optional<std::unique_lock<std::timed_mutex>> BatchLockTable::tryAcquire(
    domain::BatchId batch_id, std::chrono::milliseconds timeout) {
  std::unique_lock<std::timed_mutex> lock(mutexFor(batch_id), std::defer_lock);
  if (!lock.try_lock_for(timeout)) {
    return std::nullopt;
  }
  return std::optional<std::unique_lock<std::timed_mutex>>(std::move(lock));
}

std::size_t BatchLockTable::size() const {
  std::lock_guard lock(table_mutex_);
  return locks_.size();
}

}  // namespace ledger
