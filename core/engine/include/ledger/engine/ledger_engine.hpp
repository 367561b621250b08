#pragma once

#include "ledger/audit/audit_recorder.hpp"
#include "ledger/audit/i_audit_store.hpp"
#include "ledger/concurrent/event_loop_thread.hpp"
#include "ledger/concurrent/id_generator.hpp"
#include "ledger/config/ledger_config.hpp"
#include "ledger/domain/adjustment.hpp"
#include "ledger/domain/allocation.hpp"
#include "ledger/domain/result.hpp"
#include "ledger/domain/stock_batch.hpp"
#include "ledger/engine/command_dispatcher.hpp"
#include "ledger/engine/ledger_source.hpp"
#include "ledger/network/ipc_server.hpp"
#include "ledger/store/adjustment_ledger.hpp"
#include "ledger/store/allocation_store.hpp"
#include "ledger/store/batch_store.hpp"
#include "ledger/time/i_time_provider.hpp"
#include "ledger/transaction/transaction_coordinator.hpp"
#include "ledger/validation/availability_validator.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace ledger {

// -----------------------------------------------------------------------------
// Request and report types
// -----------------------------------------------------------------------------
struct CreateBatchRequest {
  std::string product_id;
  std::string warehouse_id;
  std::optional<std::string> supplier_id;
  domain::Quantity recorded_quantity{0};
  domain::CostFields cost;
  std::optional<std::string> reference;
  std::string received_by;
};

struct AdjustmentRequest {
  domain::BatchId batch_id{0};
  domain::Quantity quantity_delta{0};  // Sign is normalised by type
  domain::AdjustmentType adjustment_type{domain::AdjustmentType::Other};
  std::string reason;
  std::string requested_by;
  std::optional<std::string> reference_number;
};

struct BulkApprovalResult {
  std::vector<domain::AdjustmentId> approved;
  std::vector<std::pair<domain::AdjustmentId, LedgerError>> failed;
};

enum class IntegrityIssue {
  NegativeAvailability,  // available < 0
  OverAllocated,         // SUM(allocations) > available
};

const char* integrityIssueToString(IntegrityIssue issue);

struct IntegrityViolation {
  domain::BatchId batch_id{0};
  IntegrityIssue issue{IntegrityIssue::NegativeAvailability};
  AvailabilityBreakdown breakdown;
};

struct IntegrityReport {
  std::size_t batches_checked{0};
  std::vector<IntegrityViolation> violations;
  std::vector<domain::BatchId> skipped;  // Lock not acquired in time

  bool clean() const { return violations.empty() && skipped.empty(); }
};

// -----------------------------------------------------------------------------
// LedgerEngine: top-level orchestrator of the stock ledger
// -----------------------------------------------------------------------------
//
// @brief  Owns every ledger component and exposes the ledger operations.
//
// @details
// Components (all owned here):
//
//   BatchStore / AdjustmentLedger / AllocationStore   row tables
//   IAuditStore + AuditRecorder                       compliance trail
//   TransactionCoordinator                            per-batch atomicity
//   EventLoopThread  ("notification loop")            change events
//   IpcServer        (optional)                       ZeroMQ REP + PUB
//   CommandDispatcher                                 JSON command surface
//
// Every mutating operation follows the same path: cheap argument checks on
// the caller's thread, then TransactionCoordinator::run() on the owning
// batch, where the AvailabilityValidator decides against a locked snapshot
// and the row change, its audit entry and its events are staged and
// committed together. Operations return Result<T>; nothing throws across
// this API for business or storage failures.
//
// Lifecycle:
//   construct -> start(source?) -> operations ... -> stop()
//
//   start() hydrates from an optional ILedgerSource, starts the notification
//   loop and, when both endpoints are configured, the IPC server.
//   Operations may also be called before start(); their events are queued
//   and delivered once the loop runs.
//
// Thread model:
//   All operations are safe to call concurrently from any number of
//   threads. start() and stop() must be called from the owning thread.
//
// Ownership:
//   The ITimeProvider is borrowed and must outlive the engine. The audit
//   store is owned.
// -----------------------------------------------------------------------------
class LedgerEngine {
 public:
  // A null audit_store selects InMemoryAuditStore.
  LedgerEngine(LedgerConfig config, const ITimeProvider& clock,
               std::unique_ptr<IAuditStore> audit_store = nullptr);

  ~LedgerEngine();

  LedgerEngine(const LedgerEngine&) = delete;
  LedgerEngine& operator=(const LedgerEngine&) = delete;
  LedgerEngine(LedgerEngine&&) = delete;
  LedgerEngine& operator=(LedgerEngine&&) = delete;

  // -------------------------------------------------------------------------
  // start(source)
  // -------------------------------------------------------------------------
  // @brief  Hydrates, then brings the notification loop and IPC online.
  //
  // @details
  // Hydration inserts the source's rows without validation or audit and
  // advances the id generators past the largest hydrated ids. Rows that
  // reference an unknown batch, or reuse an id, are skipped with a
  // warning. Idempotent: a second start() is a no-op.
  // -------------------------------------------------------------------------
  void start(ILedgerSource* source = nullptr);

  // Stops IPC first, then flushes and joins the notification loop.
  void stop();

  bool running() const { return running_; }

  // --- Batches ---------------------------------------------------------------

  // Records a receipt. recorded_quantity is fixed from here on.
  Result<domain::StockBatch> createBatch(const CreateBatchRequest& request);

  // --- Adjustments -----------------------------------------------------------

  // -------------------------------------------------------------------------
  // requestAdjustment(request)
  // -------------------------------------------------------------------------
  // @brief  Creates a Pending adjustment.
  //
  // @details
  // The delta's sign is forced by the adjustment type (losses negative,
  // gains positive; CORRECTION / RECOUNT / OTHER keep the given sign).
  //
  // @return InvalidArgument for a zero delta, |delta| above kMaxQuantity, a
  //         total cost that does not fit MinorUnits or an empty requester,
  //         NotFound for an unknown batch, WouldGoNegative when the loss
  //         alone exceeds the batch's recorded quantity.
  // -------------------------------------------------------------------------
  Result<domain::Adjustment> requestAdjustment(const AdjustmentRequest& request);

  // -------------------------------------------------------------------------
  // approveAdjustment(id, approver, target)
  // -------------------------------------------------------------------------
  // @brief  Validates and moves a Pending adjustment to Approved (default)
  //         or directly to Completed, writing one ADJUSTMENT_APPROVED audit
  //         entry with the decision's numbers in its metadata.
  //
  // @return InvalidTransition if not Pending; WouldGoNegative or
  //         BelowAllocatedFloor for a loss that does not fit.
  // -------------------------------------------------------------------------
  Result<domain::Adjustment> approveAdjustment(
      domain::AdjustmentId id, const std::string& approver_id,
      domain::AdjustmentStatus target = domain::AdjustmentStatus::Approved);

  // Pending -> Rejected. No quantity validation. A second rejection fails
  // with InvalidTransition and changes nothing.
  Result<domain::Adjustment> rejectAdjustment(domain::AdjustmentId id,
                                              const std::string& approver_id);

  // Approved -> Completed. No re-validation; the delta already counts.
  Result<domain::Adjustment> completeAdjustment(domain::AdjustmentId id,
                                                const std::string& actor_id);

  // Approves each id in its own unit of work; one failure does not stop
  // the rest.
  BulkApprovalResult approveAdjustments(
      const std::vector<domain::AdjustmentId>& ids,
      const std::string& approver_id);

  std::vector<domain::Adjustment> listPendingAdjustments(
      std::optional<domain::BatchId> batch_id = std::nullopt) const;

  // --- Allocations -----------------------------------------------------------

  // quantity must be in [0, kMaxQuantity]. A zero allocation reserves the
  // storefront's row without committing stock.
  Result<domain::Allocation> requestAllocation(
      domain::BatchId batch_id, const std::string& storefront_id,
      domain::Quantity quantity, const std::string& actor_id = "system");

  // Same bounds as requestAllocation. Validated with this allocation's own current
  // quantity left out of already_allocated.
  Result<domain::Allocation> updateAllocation(
      domain::AllocationId id, domain::Quantity quantity,
      const std::string& actor_id = "system");

  // Deletes the allocation. Always permitted; returns the removed row.
  Result<domain::Allocation> releaseAllocation(
      domain::AllocationId id, const std::string& actor_id = "system");

  // --- Queries ---------------------------------------------------------------

  Result<domain::Quantity> getAvailableQuantity(domain::BatchId batch_id);

  Result<AvailabilityBreakdown> getAvailability(domain::BatchId batch_id);

  // Newest first. limit defaults to config.default_page_size and is capped
  // at config.max_page_size. Pass the previous page's `next` to continue.
  Result<AuditPage> getAuditTrail(
      domain::BatchId batch_id, std::optional<AuditCursor> after = std::nullopt,
      std::optional<std::size_t> limit = std::nullopt) const;

  std::vector<domain::AuditLogEntry> getAuditTrailForSubject(
      const std::string& subject_table, std::uint64_t subject_id) const;

  // Scans every batch under its own lock.
  IntegrityReport checkIntegrity();

  std::optional<domain::StockBatch> getBatch(domain::BatchId id) const;
  std::optional<domain::Adjustment> getAdjustment(domain::AdjustmentId id) const;
  std::optional<domain::Allocation> getAllocation(domain::AllocationId id) const;
  std::vector<domain::Adjustment> listAdjustments(domain::BatchId batch_id) const;
  std::vector<domain::Allocation> listAllocations(domain::BatchId batch_id) const;

  std::size_t batchCount() const { return batches_.size(); }
  std::size_t adjustmentCount() const { return adjustments_.size(); }
  std::size_t allocationCount() const { return allocations_.size(); }
  std::size_t auditEntryCount() const { return audit_store_->size(); }
  std::uint64_t commitCount() const { return coordinator_.commitCount(); }

  // --- Integration -----------------------------------------------------------

  // JSON command in, JSON reply out. Used by the IPC REP socket.
  std::string executeCommand(const std::string& command);

  // Bus of the notification loop. Subscribers run on the loop thread.
  EventBus& notificationBus() { return notification_loop_.eventBus(); }

  const LedgerConfig& config() const { return config_; }

 private:
  void hydrate(ILedgerSource& source);

  // Logs an argument-level rejection that never reached the coordinator.
  static LedgerError rejectEarly(const char* operation, LedgerError error);

  LedgerConfig config_;
  const ITimeProvider& clock_;
  std::unique_ptr<IAuditStore> audit_store_;

  IdGenerator batch_ids_;
  IdGenerator adjustment_ids_;
  IdGenerator allocation_ids_;
  IdGenerator audit_ids_;

  BatchStore batches_;
  AdjustmentLedger adjustments_;
  AllocationStore allocations_;

  AuditRecorder recorder_;
  TransactionCoordinator coordinator_;

  EventLoopThread notification_loop_;
  std::unique_ptr<IpcServer> ipc_server_;
  std::optional<EventBus::SubscriptionId> telemetry_bridge_;

  CommandDispatcher dispatcher_;

  bool running_{false};
};

}  // namespace ledger
