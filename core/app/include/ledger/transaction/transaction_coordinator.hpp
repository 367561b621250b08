#pragma once

#include "ledger/audit/i_audit_store.hpp"
#include "ledger/domain/result.hpp"
#include "ledger/domain/stock_batch.hpp"
#include "ledger/events/event.hpp"
#include "ledger/store/adjustment_ledger.hpp"
#include "ledger/store/allocation_store.hpp"
#include "ledger/store/batch_store.hpp"
#include "ledger/transaction/batch_lock_table.hpp"
#include "ledger/transaction/unit_of_work.hpp"
#include "ledger/validation/availability_validator.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace ledger {

// -----------------------------------------------------------------------------
// TransactionCoordinator: atomic read-decide-write per batch
// -----------------------------------------------------------------------------
//
// @brief  Runs an operation body inside an exclusive per-batch unit of work
//         and commits its staged writes all-or-nothing.
//
// @details
// run(batch_id, operation, work):
//
//   1. Unknown batch -> NotFound, before any lock exists for it. Otherwise
//      acquire the batch's timed mutex. If the wait exceeds lock_timeout,
//      return Contention. Nothing has been read or written.
//   2. Read a BatchSnapshot (batch row, its adjustments, its allocations).
//   3. Call work(uow). The body decides against uow.snapshot() and stages
//      writes. If it returns an error, every staged write is dropped.
//   4. Commit:
//        a. IAuditStore::append(staged audit entries). A StorageError here
//           aborts the commit with StorageUnavailable; no row has changed.
//        b. Apply staged adjustment and allocation writes to the stores.
//        c. Hand the commit's events (plus one AuditRecordedEvent per entry)
//           to the event sink, stamped with one commit sequence number.
//   5. Release the lock.
//
// Because every writer of a batch goes through step 1, no two operations on
// the same batch can both decide on the same `available`. Batches never
// share a lock, so unrelated batches proceed in parallel.
//
// Availability is never cached here. Each run() recomputes from the rows it
// reads under the lock.
//
// Logging:
//   Business-rule rejections and contention are logged as WARNING on
//   std::cerr; storage failures as CRITICAL.
//
// Thread model:
//   run(), read() and insertBatch() are safe from any thread. The event sink
//   is invoked on the calling thread while the batch lock is held, so it must
//   be cheap and must not call back into the coordinator. LedgerEngine's sink
//   only enqueues into the notification loop.
//
// Ownership:
//   Owned by LedgerEngine. Holds references to the three stores and the
//   audit store, all owned by the engine and outliving the coordinator.
// -----------------------------------------------------------------------------
class TransactionCoordinator {
 public:
  using EventSink = std::function<void(std::vector<Event>)>;

  TransactionCoordinator(BatchStore& batches, AdjustmentLedger& adjustments,
                         AllocationStore& allocations, IAuditStore& audit,
                         std::chrono::milliseconds lock_timeout,
                         EventSink sink = {});

  TransactionCoordinator(const TransactionCoordinator&) = delete;
  TransactionCoordinator& operator=(const TransactionCoordinator&) = delete;
  TransactionCoordinator(TransactionCoordinator&&) = delete;
  TransactionCoordinator& operator=(TransactionCoordinator&&) = delete;

  // Replaces the sink. Not synchronised with running operations; call during
  // start-up or shut-down only.
  void setEventSink(EventSink sink) { sink_ = std::move(sink); }

  // -------------------------------------------------------------------------
  // run<T>(batch_id, operation, work)
  // -------------------------------------------------------------------------
  // @param  operation  Name used in log lines ("approve_adjustment").
  // @param  work       Decision body. Must not block on other batch locks.
  //
  // @return Whatever `work` returned if the commit succeeded; otherwise
  //         Contention, NotFound, the body's error or StorageUnavailable.
  // -------------------------------------------------------------------------
  template <typename T>
  Result<T> run(domain::BatchId batch_id, const std::string& operation,
                const std::function<Result<T>(UnitOfWork&)>& work);

  // Read-only variant: same lock, same snapshot, nothing committed.
  template <typename T>
  Result<T> read(domain::BatchId batch_id,
                 const std::function<Result<T>(const BatchSnapshot&)>& query);

  // -------------------------------------------------------------------------
  // insertBatch(batch, audit, events)
  // -------------------------------------------------------------------------
  // @brief  Commits a brand-new batch together with its receipt audit entry.
  //
  // @details
  // The audit entry is appended first; only on success does the batch row
  // become visible. A batch id that already exists is InvalidArgument.
  // -------------------------------------------------------------------------
  Result<domain::StockBatch> insertBatch(
      const domain::StockBatch& batch,
      const std::vector<domain::AuditLogEntry>& audit,
      std::vector<Event> events);

  std::chrono::milliseconds lockTimeout() const { return lock_timeout_; }

  // Number of successful commits so far.
  std::uint64_t commitCount() const { return commit_seq_.load(); }

  // Lock table entries. Grows only with batches that exist.
  std::size_t lockCount() const { return locks_.size(); }

 private:
  std::optional<BatchSnapshot> loadSnapshot(domain::BatchId batch_id) const;

  // Performs step 4. Returns the error if the commit was aborted.
  std::optional<LedgerError> commit(UnitOfWork& uow);

  // Appends audit entries; converts StorageError to StorageUnavailable.
  std::optional<LedgerError> appendAudit(
      const std::vector<domain::AuditLogEntry>& entries);

  void publish(std::vector<Event> events,
               const std::vector<domain::AuditLogEntry>& audit);

  void logFailure(domain::BatchId batch_id, const std::string& operation,
                  const LedgerError& error) const;

  BatchStore& batches_;
  AdjustmentLedger& adjustments_;
  AllocationStore& allocations_;
  IAuditStore& audit_;

  const std::chrono::milliseconds lock_timeout_;
  EventSink sink_;

  BatchLockTable locks_;
  std::atomic<std::uint64_t> commit_seq_{0};
};

// -----------------------------------------------------------------------------
// Template implementation
// -----------------------------------------------------------------------------
template <typename T>
Result<T> TransactionCoordinator::run(
    domain::BatchId batch_id, const std::string& operation,
    const std::function<Result<T>(UnitOfWork&)>& work) {
  // Batches are never deleted, so this check cannot go stale.
  if (!batches_.contains(batch_id)) {
    LedgerError error = LedgerError::notFound("Stock batch", batch_id);
    logFailure(batch_id, operation, error);
    return error;
  }

  auto lock = locks_.tryAcquire(batch_id, lock_timeout_);
  if (!lock) {
    LedgerError error = LedgerError::contention(batch_id);
    logFailure(batch_id, operation, error);
    return error;
  }

  auto snapshot = loadSnapshot(batch_id);
  if (!snapshot) {
    LedgerError error = LedgerError::notFound("Stock batch", batch_id);
    logFailure(batch_id, operation, error);
    return error;
  }

  UnitOfWork uow(std::move(*snapshot));
  Result<T> result = work(uow);
  if (!result.ok()) {
    logFailure(batch_id, operation, result.error());
    return result;
  }

  if (auto failure = commit(uow)) {
    logFailure(batch_id, operation, *failure);
    return *failure;
  }

  return result;
}

template <typename T>
Result<T> TransactionCoordinator::read(
    domain::BatchId batch_id,
    const std::function<Result<T>(const BatchSnapshot&)>& query) {
  if (!batches_.contains(batch_id)) {
    return LedgerError::notFound("Stock batch", batch_id);
  }

  auto lock = locks_.tryAcquire(batch_id, lock_timeout_);
  if (!lock) {
    return LedgerError::contention(batch_id);
  }

  auto snapshot = loadSnapshot(batch_id);
  if (!snapshot) {
    return LedgerError::notFound("Stock batch", batch_id);
  }

  return query(*snapshot);
}

}  // namespace ledger
