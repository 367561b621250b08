#pragma once

#include "ledger/domain/stock_batch.hpp"

#include <cstddef>
#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

namespace ledger {

// -----------------------------------------------------------------------------
// BatchStore: keyed table of stock batches
// -----------------------------------------------------------------------------
//
// @brief  Holds one StockBatch per warehouse receipt.
//
// @details
// The store has insert and read operations only. There is no update path, so
// recorded_quantity cannot change after the receipt is written. Everything
// that looks like a change in quantity is an Adjustment against the batch.
//
// Thread model:
//   Safe from any thread. Readers take a shared_lock, insert() takes a
//   unique_lock. find() returns a copy so callers never hold a reference
//   into the map.
//
// Ownership:
//   Owned by LedgerEngine as a value member.
// -----------------------------------------------------------------------------
class BatchStore {
 public:
  BatchStore() = default;

  BatchStore(const BatchStore&) = delete;
  BatchStore& operator=(const BatchStore&) = delete;
  BatchStore(BatchStore&&) = delete;
  BatchStore& operator=(BatchStore&&) = delete;

  // Returns false (and leaves the store untouched) if the id already exists.
  bool insert(const domain::StockBatch& batch);

  std::optional<domain::StockBatch> find(domain::BatchId id) const;

  bool contains(domain::BatchId id) const;

  // All batch ids in ascending order.
  std::vector<domain::BatchId> ids() const;

  std::size_t size() const;

 private:
  mutable std::shared_mutex mutex_;
  std::unordered_map<domain::BatchId, domain::StockBatch> batches_;
};

}  // namespace ledger
