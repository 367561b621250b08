#pragma once

#include "ledger/domain/adjustment.hpp"

#include <cstddef>
#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

namespace ledger {

// -----------------------------------------------------------------------------
// AdjustmentLedger: proposed and decided quantity deltas
// -----------------------------------------------------------------------------
//
// @brief  Keyed table of Adjustment rows with a secondary index by batch.
//
// @details
// The ledger is a passive table. It does not validate quantities; that is
// AvailabilityValidator's job, and writes only arrive here through a
// committed UnitOfWork while the owning batch's lock is held.
//
// The status machine lives here as transitionAllowed(), an exhaustive switch
// over the current status:
//
//   Pending  ──► Approved ──► Completed
//      │  └──────────────────►   ▲
//      │                         │ (direct completion)
//      └──► Rejected
//
// Completed and Rejected are terminal; no transition leaves them.
//
// Thread model:
//   Safe from any thread (shared_mutex). Results are copies.
//
// Ownership:
//   Owned by LedgerEngine as a value member.
// -----------------------------------------------------------------------------
class AdjustmentLedger {
 public:
  AdjustmentLedger() = default;

  AdjustmentLedger(const AdjustmentLedger&) = delete;
  AdjustmentLedger& operator=(const AdjustmentLedger&) = delete;
  AdjustmentLedger(AdjustmentLedger&&) = delete;
  AdjustmentLedger& operator=(AdjustmentLedger&&) = delete;

  // Inserts or replaces the row with adjustment.id.
  void upsert(const domain::Adjustment& adjustment);

  std::optional<domain::Adjustment> find(domain::AdjustmentId id) const;

  // All adjustments of a batch in ascending id order.
  std::vector<domain::Adjustment> forBatch(domain::BatchId batch_id) const;

  // Pending adjustments in ascending id order, optionally for one batch only.
  std::vector<domain::Adjustment> pending(
      std::optional<domain::BatchId> batch_id = std::nullopt) const;

  std::size_t size() const;

  // -------------------------------------------------------------------------
  // transitionAllowed(current, next)
  // -------------------------------------------------------------------------
  // @brief  True if the status machine permits current -> next.
  //
  // @details
  // Self-transitions are not allowed, so rejecting an already rejected
  // adjustment fails instead of silently succeeding.
  // -------------------------------------------------------------------------
  static bool transitionAllowed(domain::AdjustmentStatus current,
                                domain::AdjustmentStatus next);

 private:
  mutable std::shared_mutex mutex_;
  std::unordered_map<domain::AdjustmentId, domain::Adjustment> rows_;
  std::unordered_map<domain::BatchId, std::vector<domain::AdjustmentId>>
      by_batch_;
};

}  // namespace ledger
