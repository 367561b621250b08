#pragma once

#include "ledger/domain/adjustment.hpp"
#include "ledger/domain/allocation.hpp"
#include "ledger/domain/audit_log_entry.hpp"
#include "ledger/events/event.hpp"
#include "ledger/validation/availability_validator.hpp"

#include <utility>
#include <vector>

namespace ledger {

// -----------------------------------------------------------------------------
// UnitOfWork: staged writes for one batch
// -----------------------------------------------------------------------------
//
// @brief  Collects everything one operation wants to change so the
//         coordinator can apply it atomically, or throw it all away.
//
// @details
// A UnitOfWork is created by TransactionCoordinator::run() after the batch
// lock is acquired and the snapshot is read. The operation body inspects
// snapshot(), decides, and stages:
//
//   - adjustment rows to insert or replace
//   - allocation rows to insert or replace
//   - allocation ids to delete
//   - audit entries (through AuditRecorder::record)
//   - change events for the notification loop
//
// Nothing staged is visible to anyone until commit. The snapshot is not
// updated by staging; every operation makes exactly one decision against the
// state it found.
//
// Thread model:
//   Confined to the thread running the operation. Not shared.
// -----------------------------------------------------------------------------
class UnitOfWork {
 public:
  explicit UnitOfWork(BatchSnapshot snapshot) : snapshot_(std::move(snapshot)) {}

  UnitOfWork(const UnitOfWork&) = delete;
  UnitOfWork& operator=(const UnitOfWork&) = delete;

  const BatchSnapshot& snapshot() const { return snapshot_; }
  domain::BatchId batchId() const { return snapshot_.batch.id; }

  void stageAdjustment(const domain::Adjustment& adjustment) {
    adjustments_.push_back(adjustment);
  }

  void stageAllocation(const domain::Allocation& allocation) {
    allocations_.push_back(allocation);
  }

  void stageAllocationRelease(domain::AllocationId id) {
    released_allocations_.push_back(id);
  }

  void stageAudit(const domain::AuditLogEntry& entry) {
    audit_entries_.push_back(entry);
  }

  void stageEvent(Event event) { events_.push_back(std::move(event)); }

  const std::vector<domain::Adjustment>& stagedAdjustments() const {
    return adjustments_;
  }
  const std::vector<domain::Allocation>& stagedAllocations() const {
    return allocations_;
  }
  const std::vector<domain::AllocationId>& stagedReleases() const {
    return released_allocations_;
  }
  const std::vector<domain::AuditLogEntry>& stagedAudit() const {
    return audit_entries_;
  }
  std::vector<Event>& stagedEvents() { return events_; }

  bool empty() const {
    return adjustments_.empty() && allocations_.empty() &&
           released_allocations_.empty() && audit_entries_.empty();
  }

 private:
  BatchSnapshot snapshot_;
  std::vector<domain::Adjustment> adjustments_;
  std::vector<domain::Allocation> allocations_;
  std::vector<domain::AllocationId> released_allocations_;
  std::vector<domain::AuditLogEntry> audit_entries_;
  std::vector<Event> events_;
};

}  // namespace ledger
