#pragma once

#include "ledger/domain/adjustment.hpp"
#include "ledger/domain/allocation.hpp"
#include "ledger/domain/stock_batch.hpp"

#include <string>
#include <utility>
#include <vector>

namespace ledger {

// -----------------------------------------------------------------------------
// ILedgerSource: pre-existing ledger rows loaded at start-up
// -----------------------------------------------------------------------------
//
// @brief  Supplies batches, adjustments and allocations that already exist
//         (a previous session, a database export, a migration) so the engine
//         starts from the real state instead of an empty ledger.
//
// @details
// LedgerEngine::start() calls the three methods once each, in the order
// batches, adjustments, allocations, on the calling thread and before the
// notification loop or the IPC server run. The rows are inserted as-is:
// they are history, not new decisions, so they are neither validated nor
// audited, and no events are published for them. An inconsistent source
// (for example losses larger than the receipt) is accepted and later shows
// up as NegativeAvailability and in checkIntegrity().
//
// Ownership:
//   LedgerEngine receives a non-owning pointer and uses it only inside
//   start(). The caller owns the source.
// -----------------------------------------------------------------------------
class ILedgerSource {
 public:
  virtual ~ILedgerSource() = default;

  virtual std::vector<domain::StockBatch> loadBatches() = 0;
  virtual std::vector<domain::Adjustment> loadAdjustments() = 0;
  virtual std::vector<domain::Allocation> loadAllocations() = 0;
};

// Hands back rows given at construction. Used by tests and tools.
class StaticLedgerSource : public ILedgerSource {
 public:
  StaticLedgerSource(std::vector<domain::StockBatch> batches,
                     std::vector<domain::Adjustment> adjustments,
                     std::vector<domain::Allocation> allocations)
      : batches_(std::move(batches)),
        adjustments_(std::move(adjustments)),
        allocations_(std::move(allocations)) {}

  std::vector<domain::StockBatch> loadBatches() override { return batches_; }
  std::vector<domain::Adjustment> loadAdjustments() override {
    return adjustments_;
  }
  std::vector<domain::Allocation> loadAllocations() override {
    return allocations_;
  }

 private:
  std::vector<domain::StockBatch> batches_;
  std::vector<domain::Adjustment> adjustments_;
  std::vector<domain::Allocation> allocations_;
};

// -----------------------------------------------------------------------------
// JsonFileLedgerSource: snapshot document on disk
// -----------------------------------------------------------------------------
// Reads {"batches": [...], "adjustments": [...], "allocations": [...]} using
// the JSON codec. Missing arrays are treated as empty. The file is parsed
// once, in the constructor, which throws std::runtime_error if it cannot be
// read or any row is malformed.
// -----------------------------------------------------------------------------
class JsonFileLedgerSource : public ILedgerSource {
 public:
  explicit JsonFileLedgerSource(const std::string& path);

  std::vector<domain::StockBatch> loadBatches() override { return batches_; }
  std::vector<domain::Adjustment> loadAdjustments() override {
    return adjustments_;
  }
  std::vector<domain::Allocation> loadAllocations() override {
    return allocations_;
  }

 private:
  std::vector<domain::StockBatch> batches_;
  std::vector<domain::Adjustment> adjustments_;
  std::vector<domain::Allocation> allocations_;
};

}  // namespace ledger
