#include "ledger/transaction/transaction_coordinator.hpp"

#include <iostream>
#include <variant>

namespace ledger {

TransactionCoordinator::TransactionCoordinator(
    BatchStore& batches, AdjustmentLedger& adjustments,
    AllocationStore& allocations, IAuditStore& audit,
    std::chrono::milliseconds lock_timeout, EventSink sink)
    : batches_(batches),
      adjustments_(adjustments),
      allocations_(allocations),
      audit_(audit),
      lock_timeout_(lock_timeout),
      sink_(std::move(sink)) {}

// -----------------------------------------------------------------------------
// loadSnapshot: caller holds the batch lock
// -----------------------------------------------------------------------------
std::optional<BatchSnapshot> TransactionCoordinator::loadSnapshot(
    domain::BatchId batch_id) const {
  auto batch = batches_.find(batch_id);
  if (!batch) {
    return std::nullopt;
  }

  BatchSnapshot snapshot;
  snapshot.batch = std::move(*batch);
  snapshot.adjustments = adjustments_.forBatch(batch_id);
  snapshot.allocations = allocations_.forBatch(batch_id);
  return snapshot;
}

// -----------------------------------------------------------------------------
// commit: audit first, then rows, then notifications
// -----------------------------------------------------------------------------
std::optional<LedgerError> TransactionCoordinator::commit(UnitOfWork& uow) {
  if (auto failure = appendAudit(uow.stagedAudit())) {
    return failure;
  }

  // In-memory row writes cannot fail once the audit trail has accepted the
  // change.
  for (const auto& adj : uow.stagedAdjustments()) {
    adjustments_.upsert(adj);
  }
  for (const auto& alloc : uow.stagedAllocations()) {
    allocations_.upsert(alloc);
  }
  for (domain::AllocationId id : uow.stagedReleases()) {
    allocations_.erase(id);
  }

  publish(std::move(uow.stagedEvents()), uow.stagedAudit());
  return std::nullopt;
}

std::optional<LedgerError> TransactionCoordinator::appendAudit(
    const std::vector<domain::AuditLogEntry>& entries) {
  if (entries.empty()) {
    return std::nullopt;
  }
  try {
    audit_.append(entries);
  } catch (const StorageError& e) {
    return LedgerError::storageUnavailable(e.what());
  }
  return std::nullopt;
}

// -----------------------------------------------------------------------------
// publish: stamp one sequence number on every event of the commit
// -----------------------------------------------------------------------------
void TransactionCoordinator::publish(
    std::vector<Event> events,
    const std::vector<domain::AuditLogEntry>& audit) {
  const std::uint64_t seq = commit_seq_.fetch_add(1) + 1;

  if (!sink_) {
    return;
  }

  for (const auto& entry : audit) {
    events.emplace_back(AuditRecordedEvent{entry, 0});
  }
  for (auto& event : events) {
    std::visit([seq](auto& e) { e.sequence_id = seq; }, event);
  }

  sink_(std::move(events));
}

// -----------------------------------------------------------------------------
// insertBatch
// -----------------------------------------------------------------------------
Result<domain::StockBatch> TransactionCoordinator::insertBatch(
    const domain::StockBatch& batch,
    const std::vector<domain::AuditLogEntry>& audit,
    std::vector<Event> events) {
  const std::string operation = "create_batch";

  auto lock = locks_.tryAcquire(batch.id, lock_timeout_);
  if (!lock) {
    LedgerError error = LedgerError::contention(batch.id);
    logFailure(batch.id, operation, error);
    return error;
  }

  if (batches_.contains(batch.id)) {
    LedgerError error = LedgerError::invalidArgument(
        "Stock batch " + std::to_string(batch.id) + " already exists");
    logFailure(batch.id, operation, error);
    return error;
  }

  if (auto failure = appendAudit(audit)) {
    logFailure(batch.id, operation, *failure);
    return *failure;
  }

  batches_.insert(batch);
  publish(std::move(events), audit);
  return batch;
}

// -----------------------------------------------------------------------------
// logFailure
// -----------------------------------------------------------------------------
void TransactionCoordinator::logFailure(domain::BatchId batch_id,
                                        const std::string& operation,
                                        const LedgerError& error) const {
  const char* level = error.isInfrastructure() ? "CRITICAL" : "WARNING";
  std::cerr << "[TransactionCoordinator] " << level << ": " << operation
            << " rejected for batch_id=" << batch_id << " kind="
            << errorKindToString(error.kind) << ": " << error.message << "\n";
}

}  // namespace ledger
