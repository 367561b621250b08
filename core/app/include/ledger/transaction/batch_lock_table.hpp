#pragma once

#include "ledger/domain/ids.hpp"

#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>

namespace ledger {

// -----------------------------------------------------------------------------
// BatchLockTable: one exclusive lock per batch
// -----------------------------------------------------------------------------
//
// @brief  Hands out a std::timed_mutex per BatchId, created on first use.
//
// @details
// Locks are never removed, so a reference obtained from mutexFor() stays
// valid for the table's lifetime. The table's own mutex is held only while
// looking up or creating an entry, never while a batch lock is waited on, so
// operations on different batches do not block each other.
//
// Thread model: Safe from any thread.
// -----------------------------------------------------------------------------
class BatchLockTable {
 public:
  BatchLockTable() = default;

  BatchLockTable(const BatchLockTable&) = delete;
  BatchLockTable& operator=(const BatchLockTable&) = delete;

  std::timed_mutex& mutexFor(domain::BatchId batch_id);

  // Returns an owning lock, or std::nullopt if the wait timed out.
  std::optional<std::unique_lock<std::timed_mutex>> tryAcquire(
      domain::BatchId batch_id, std::chrono::milliseconds timeout);

  std::size_t size() const;

 private:
  mutable std::mutex table_mutex_;
  std::unordered_map<domain::BatchId, std::unique_ptr<std::timed_mutex>>
      locks_;
};

}  // namespace ledger
