#include "ledger/engine/ledger_engine.hpp"

#include "ledger/audit/in_memory_audit_store.hpp"
#include "ledger/domain/adjustment_type.hpp"
#include "ledger/domain/audit_log_entry.hpp"

#include <nlohmann/json.hpp>

#include <iostream>
#include <limits>
#include <string>
#include <utility>

namespace ledger {

namespace {

template <typename Row>
std::optional<Row> findRow(const std::vector<Row>& rows, std::uint64_t id) {
  for (const auto& row : rows) {
    if (row.id == id) {
      return row;
    }
  }
  return std::nullopt;
}

constexpr domain::MinorUnits kMaxMinorUnits =
    std::numeric_limits<domain::MinorUnits>::max();

domain::MinorUnits absolute(domain::Quantity q) { return q < 0 ? -q : q; }

}  // namespace

const char* integrityIssueToString(IntegrityIssue issue) {
  switch (issue) {
    case IntegrityIssue::NegativeAvailability: return "NEGATIVE_AVAILABILITY";
    case IntegrityIssue::OverAllocated:        return "OVER_ALLOCATED";
  }
  return "UNKNOWN";
}

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
LedgerEngine::LedgerEngine(LedgerConfig config, const ITimeProvider& clock,
                           std::unique_ptr<IAuditStore> audit_store)
    : config_(std::move(config)),
      clock_(clock),
      audit_store_(audit_store ? std::move(audit_store)
                               : std::make_unique<InMemoryAuditStore>()),
      recorder_(*audit_store_, audit_ids_, clock_),
      coordinator_(batches_, adjustments_, allocations_, *audit_store_,
                   config_.lock_timeout,
                   [this](std::vector<Event> events) {
                     notification_loop_.push_all(std::move(events));
                   }),
      dispatcher_(*this) {
  // A reopened journal already holds ids; never reissue them.
  audit_ids_.advance_past(audit_store_->maxId());
}

// -----------------------------------------------------------------------------
// Destructor: RAII stop
// -----------------------------------------------------------------------------
LedgerEngine::~LedgerEngine() { stop(); }

// -----------------------------------------------------------------------------
// start()
// -----------------------------------------------------------------------------
void LedgerEngine::start(ILedgerSource* source) {
  if (running_) {
    return;
  }

  // ---  1) Hydration gate (optional) ----------------------------------------
  if (source != nullptr) {
    hydrate(*source);
  }

  // ---  2) Notification loop -------------------------------------------------
  notification_loop_.start();

  // ---  3) IpcServer (commands + telemetry) ----------------------------------
  if (config_.ipcEnabled()) {
    ipc_server_ = std::make_unique<IpcServer>(
        [this](const std::string& cmd) { return executeCommand(cmd); },
        config_.command_endpoint, config_.telemetry_endpoint);
    ipc_server_->start();

    // Telemetry bridge: every committed change goes out on PUB.
    telemetry_bridge_ = notification_loop_.eventBus().subscribe(
        [this](const Event& e) { ipc_server_->pushTelemetry(e); });
  }

  running_ = true;

  std::cout << "[LedgerEngine] started. Threads: notification"
            << (ipc_server_ ? ", ipc" : "") << ".\n";
}

// -----------------------------------------------------------------------------
// stop()
// -----------------------------------------------------------------------------
void LedgerEngine::stop() {
  if (!running_) {
    return;
  }

  // ---  1) Detach the bridge, then stop IPC (its thread calls
  //          executeCommand(), so it goes before anything else) --------------
  if (telemetry_bridge_) {
    notification_loop_.eventBus().unsubscribe(*telemetry_bridge_);
    telemetry_bridge_.reset();
  }
  ipc_server_.reset();

  // ---  2) Flush pending notifications and join ----------------------------
  notification_loop_.stop();

  running_ = false;

  std::cout << "[LedgerEngine] stopped. All threads joined.\n";
}

// -----------------------------------------------------------------------------
// hydrate(source)
// -----------------------------------------------------------------------------
void LedgerEngine::hydrate(ILedgerSource& source) {
  std::size_t batch_count = 0;
  std::size_t adjustment_count = 0;
  std::size_t allocation_count = 0;
  std::size_t skipped = 0;

  for (const auto& batch : source.loadBatches()) {
    if (!batches_.insert(batch)) {
      std::cerr << "[LedgerEngine] WARNING: hydration skipped duplicate "
                   "batch_id="
                << batch.id << "\n";
      ++skipped;
      continue;
    }
    batch_ids_.advance_past(batch.id);
    ++batch_count;
  }

  for (const auto& adjustment : source.loadAdjustments()) {
    if (!batches_.contains(adjustment.stock_batch_id) ||
        adjustments_.find(adjustment.id)) {
      std::cerr << "[LedgerEngine] WARNING: hydration skipped adjustment_id="
                << adjustment.id << " (unknown batch or duplicate id)\n";
      ++skipped;
      continue;
    }
    adjustments_.upsert(adjustment);
    adjustment_ids_.advance_past(adjustment.id);
    ++adjustment_count;
  }

  for (const auto& allocation : source.loadAllocations()) {
    if (!batches_.contains(allocation.stock_batch_id) ||
        allocations_.find(allocation.id)) {
      std::cerr << "[LedgerEngine] WARNING: hydration skipped allocation_id="
                << allocation.id << " (unknown batch or duplicate id)\n";
      ++skipped;
      continue;
    }
    allocations_.upsert(allocation);
    allocation_ids_.advance_past(allocation.id);
    ++allocation_count;
  }

  std::cout << "[LedgerEngine] Hydration complete: " << batch_count
            << " batch(es), " << adjustment_count << " adjustment(s), "
            << allocation_count << " allocation(s) loaded, " << skipped
            << " skipped.\n";
}

LedgerError LedgerEngine::rejectEarly(const char* operation,
                                      LedgerError error) {
  std::cerr << "[LedgerEngine] WARNING: " << operation
            << " rejected kind=" << errorKindToString(error.kind) << ": "
            << error.message << "\n";
  return error;
}

// -----------------------------------------------------------------------------
// createBatch()
// -----------------------------------------------------------------------------
Result<domain::StockBatch> LedgerEngine::createBatch(
    const CreateBatchRequest& request) {
  if (request.product_id.empty() || request.warehouse_id.empty()) {
    return rejectEarly("create_batch", LedgerError::invalidArgument(
                                           "product_id and warehouse_id are "
                                           "required"));
  }
  if (request.recorded_quantity < 0 ||
      request.recorded_quantity > domain::kMaxQuantity) {
    return rejectEarly("create_batch",
                       LedgerError::invalidArgument(
                           "recorded_quantity must be in [0, " +
                           std::to_string(domain::kMaxQuantity) + "], got " +
                           std::to_string(request.recorded_quantity)));
  }
  if (request.cost.unit_cost < 0 || request.cost.landed_unit_cost < 0) {
    return rejectEarly("create_batch", LedgerError::invalidArgument(
                                           "cost fields must be >= 0"));
  }

  domain::StockBatch batch;
  batch.id = batch_ids_.next_id();
  batch.product_id = request.product_id;
  batch.warehouse_id = request.warehouse_id;
  batch.supplier_id = request.supplier_id;
  batch.recorded_quantity = request.recorded_quantity;
  batch.cost = request.cost;
  batch.reference = request.reference;
  batch.received_by = request.received_by.empty() ? "system"
                                                  : request.received_by;
  batch.received_at_ms = clock_.now_ms();

  nlohmann::json metadata = {
      {"product_id", batch.product_id},
      {"warehouse_id", batch.warehouse_id},
      {"recorded_quantity", batch.recorded_quantity},
      {"unit_cost", batch.cost.unit_cost},
  };
  if (batch.supplier_id) {
    metadata["supplier_id"] = *batch.supplier_id;
  }

  domain::AuditLogEntry entry = recorder_.build(
      batch.id, domain::kBatchTable, batch.id, domain::kActionBatchReceived,
      "", std::to_string(batch.recorded_quantity), batch.received_by,
      std::move(metadata));

  std::vector<Event> events;
  events.emplace_back(BatchReceivedEvent{batch, batch.received_at_ms, 0});

  return coordinator_.insertBatch(batch, {entry}, std::move(events));
}

// -----------------------------------------------------------------------------
// requestAdjustment()
// -----------------------------------------------------------------------------
Result<domain::Adjustment> LedgerEngine::requestAdjustment(
    const AdjustmentRequest& request) {
  if (request.quantity_delta == 0) {
    return rejectEarly("request_adjustment", LedgerError::invalidArgument(
                                                 "quantity_delta must not be "
                                                 "zero"));
  }
  if (request.quantity_delta < -domain::kMaxQuantity ||
      request.quantity_delta > domain::kMaxQuantity) {
    return rejectEarly("request_adjustment",
                       LedgerError::invalidArgument(
                           "|quantity_delta| must not exceed " +
                           std::to_string(domain::kMaxQuantity) + ", got " +
                           std::to_string(request.quantity_delta)));
  }
  if (request.requested_by.empty()) {
    return rejectEarly("request_adjustment", LedgerError::invalidArgument(
                                                 "requested_by is required"));
  }

  const domain::Quantity delta =
      domain::normalizeDelta(request.adjustment_type, request.quantity_delta);

  return coordinator_.run<domain::Adjustment>(
      request.batch_id, "request_adjustment",
      [&](UnitOfWork& uow) -> Result<domain::Adjustment> {
        const domain::StockBatch& batch = uow.snapshot().batch;

        auto check = AvailabilityValidator::validateAdjustmentRequest(batch,
                                                                      delta);
        if (!check) {
          return check.error();
        }

        const domain::MinorUnits units = absolute(delta);
        if (batch.cost.unit_cost > kMaxMinorUnits / units) {
          return LedgerError::invalidArgument(
              "total cost of " + std::to_string(units) + " units at " +
              std::to_string(batch.cost.unit_cost) + " overflows");
        }

        domain::Adjustment adjustment;
        adjustment.id = adjustment_ids_.next_id();
        adjustment.stock_batch_id = batch.id;
        adjustment.quantity_delta = delta;
        adjustment.adjustment_type = request.adjustment_type;
        adjustment.status = domain::AdjustmentStatus::Pending;
        adjustment.reason = request.reason;
        adjustment.reference_number = request.reference_number;
        adjustment.requested_by = request.requested_by;
        adjustment.quantity_before = batch.recorded_quantity;
        adjustment.unit_cost = batch.cost.unit_cost;
        adjustment.total_cost = batch.cost.unit_cost * units;
        adjustment.requested_at_ms = clock_.now_ms();

        uow.stageAdjustment(adjustment);
        uow.stageEvent(AdjustmentUpdateEvent{
            adjustment, std::nullopt, adjustment.requested_at_ms, 0});
        return adjustment;
      });
}

// -----------------------------------------------------------------------------
// approveAdjustment()
// -----------------------------------------------------------------------------
Result<domain::Adjustment> LedgerEngine::approveAdjustment(
    domain::AdjustmentId id, const std::string& approver_id,
    domain::AdjustmentStatus target) {
  if (approver_id.empty()) {
    return rejectEarly("approve_adjustment", LedgerError::invalidArgument(
                                                 "approver_id is required"));
  }

  // Locate the owning batch; the decision itself re-reads under its lock.
  auto located = adjustments_.find(id);
  if (!located) {
    return rejectEarly("approve_adjustment",
                       LedgerError::notFound("Adjustment", id));
  }

  return coordinator_.run<domain::Adjustment>(
      located->stock_batch_id, "approve_adjustment",
      [&](UnitOfWork& uow) -> Result<domain::Adjustment> {
        const BatchSnapshot& snapshot = uow.snapshot();
        auto current = findRow(snapshot.adjustments, id);
        if (!current) {
          return LedgerError::notFound("Adjustment", id);
        }

        auto decision = AvailabilityValidator::validateAdjustmentApproval(
            snapshot, *current, target);
        if (!decision) {
          return decision.error();
        }
        const ApprovalDecision& d = decision.value();

        const std::int64_t now = clock_.now_ms();
        domain::Adjustment updated = *current;
        updated.status = target;
        updated.approved_by = approver_id;
        updated.decided_at_ms = now;
        if (target == domain::AdjustmentStatus::Completed) {
          updated.completed_at_ms = now;
        }

        const char* old_status = domain::adjustmentStatusToString(current->status);
        const char* new_status = domain::adjustmentStatusToString(target);

        uow.stageAdjustment(updated);
        recorder_.record(uow, snapshot.batch.id, domain::kAdjustmentTable,
                         updated.id, domain::kActionAdjustmentApproved,
                         old_status, new_status, approver_id,
                         {{"old_status", old_status},
                          {"new_status", new_status},
                          {"adjustment_type", domain::adjustmentTypeToString(
                                                  updated.adjustment_type)},
                          {"recorded_quantity", d.recorded},
                          {"allocated", d.allocated},
                          {"other_delta", d.other_delta},
                          {"quantity_delta", d.quantity_delta},
                          {"new_available", d.new_available}});
        uow.stageEvent(AdjustmentUpdateEvent{updated, current->status, now, 0});
        return updated;
      });
}

// -----------------------------------------------------------------------------
// rejectAdjustment()
// -----------------------------------------------------------------------------
Result<domain::Adjustment> LedgerEngine::rejectAdjustment(
    domain::AdjustmentId id, const std::string& approver_id) {
  if (approver_id.empty()) {
    return rejectEarly("reject_adjustment", LedgerError::invalidArgument(
                                                "approver_id is required"));
  }

  auto located = adjustments_.find(id);
  if (!located) {
    return rejectEarly("reject_adjustment",
                       LedgerError::notFound("Adjustment", id));
  }

  return coordinator_.run<domain::Adjustment>(
      located->stock_batch_id, "reject_adjustment",
      [&](UnitOfWork& uow) -> Result<domain::Adjustment> {
        auto current = findRow(uow.snapshot().adjustments, id);
        if (!current) {
          return LedgerError::notFound("Adjustment", id);
        }

        using S = domain::AdjustmentStatus;
        if (current->status != S::Pending ||
            !AdjustmentLedger::transitionAllowed(current->status,
                                                 S::Rejected)) {
          return LedgerError::invalidTransition(
              "adjustment " + std::to_string(id) + " is " +
              domain::adjustmentStatusToString(current->status) +
              ", cannot move to REJECTED");
        }

        const std::int64_t now = clock_.now_ms();
        domain::Adjustment updated = *current;
        updated.status = S::Rejected;
        updated.approved_by = approver_id;
        updated.decided_at_ms = now;

        uow.stageAdjustment(updated);
        recorder_.record(uow, uow.batchId(), domain::kAdjustmentTable,
                         updated.id, domain::kActionAdjustmentRejected,
                         "PENDING", "REJECTED", approver_id,
                         {{"old_status", "PENDING"},
                          {"new_status", "REJECTED"},
                          {"quantity_delta", updated.quantity_delta},
                          {"reason", updated.reason}});
        uow.stageEvent(AdjustmentUpdateEvent{updated, S::Pending, now, 0});
        return updated;
      });
}

// -----------------------------------------------------------------------------
// completeAdjustment()
// -----------------------------------------------------------------------------
Result<domain::Adjustment> LedgerEngine::completeAdjustment(
    domain::AdjustmentId id, const std::string& actor_id) {
  if (actor_id.empty()) {
    return rejectEarly("complete_adjustment", LedgerError::invalidArgument(
                                                  "actor_id is required"));
  }

  auto located = adjustments_.find(id);
  if (!located) {
    return rejectEarly("complete_adjustment",
                       LedgerError::notFound("Adjustment", id));
  }

  return coordinator_.run<domain::Adjustment>(
      located->stock_batch_id, "complete_adjustment",
      [&](UnitOfWork& uow) -> Result<domain::Adjustment> {
        auto current = findRow(uow.snapshot().adjustments, id);
        if (!current) {
          return LedgerError::notFound("Adjustment", id);
        }

        using S = domain::AdjustmentStatus;
        if (current->status != S::Approved) {
          return LedgerError::invalidTransition(
              "adjustment " + std::to_string(id) + " is " +
              domain::adjustmentStatusToString(current->status) +
              ", only APPROVED can be completed");
        }

        const std::int64_t now = clock_.now_ms();
        domain::Adjustment updated = *current;
        updated.status = S::Completed;
        updated.completed_at_ms = now;

        AvailabilityBreakdown b =
            AvailabilityValidator::computeAvailability(uow.snapshot());

        uow.stageAdjustment(updated);
        recorder_.record(uow, uow.batchId(), domain::kAdjustmentTable,
                         updated.id, domain::kActionAdjustmentCompleted,
                         "APPROVED", "COMPLETED", actor_id,
                         {{"old_status", "APPROVED"},
                          {"new_status", "COMPLETED"},
                          {"quantity_delta", updated.quantity_delta},
                          {"available", b.available}});
        uow.stageEvent(AdjustmentUpdateEvent{updated, S::Approved, now, 0});
        return updated;
      });
}

// -----------------------------------------------------------------------------
// approveAdjustments()
// -----------------------------------------------------------------------------
BulkApprovalResult LedgerEngine::approveAdjustments(
    const std::vector<domain::AdjustmentId>& ids,
    const std::string& approver_id) {
  BulkApprovalResult result;
  for (domain::AdjustmentId id : ids) {
    auto outcome = approveAdjustment(id, approver_id);
    if (outcome) {
      result.approved.push_back(id);
    } else {
      result.failed.emplace_back(id, outcome.error());
    }
  }
  return result;
}

std::vector<domain::Adjustment> LedgerEngine::listPendingAdjustments(
    std::optional<domain::BatchId> batch_id) const {
  return adjustments_.pending(batch_id);
}

// -----------------------------------------------------------------------------
// requestAllocation()
// -----------------------------------------------------------------------------
Result<domain::Allocation> LedgerEngine::requestAllocation(
    domain::BatchId batch_id, const std::string& storefront_id,
    domain::Quantity quantity, const std::string& actor_id) {
  if (storefront_id.empty()) {
    return rejectEarly("request_allocation", LedgerError::invalidArgument(
                                                 "storefront_id is required"));
  }
  if (quantity < 0 || quantity > domain::kMaxQuantity) {
    return rejectEarly("request_allocation",
                       LedgerError::invalidArgument(
                           "allocation quantity must be in [0, " +
                           std::to_string(domain::kMaxQuantity) + "], got " +
                           std::to_string(quantity)));
  }

  return coordinator_.run<domain::Allocation>(
      batch_id, "request_allocation",
      [&](UnitOfWork& uow) -> Result<domain::Allocation> {
        auto decision =
            AvailabilityValidator::validateAllocation(uow.snapshot(), quantity);
        if (!decision) {
          return decision.error();
        }
        const AvailabilityBreakdown& b = decision.value();

        domain::Allocation allocation;
        allocation.id = allocation_ids_.next_id();
        allocation.stock_batch_id = uow.batchId();
        allocation.storefront_id = storefront_id;
        allocation.quantity = quantity;
        allocation.allocated_by = actor_id;
        allocation.updated_at_ms = clock_.now_ms();

        uow.stageAllocation(allocation);
        recorder_.record(uow, uow.batchId(), domain::kAllocationTable,
                         allocation.id, domain::kActionAllocationCreated, "0",
                         std::to_string(quantity), actor_id,
                         {{"storefront_id", storefront_id},
                          {"requested_quantity", quantity},
                          {"recorded_quantity", b.recorded},
                          {"approved_delta", b.approved_delta},
                          {"available", b.available},
                          {"already_allocated", b.allocated},
                          {"remaining_after", b.remaining - quantity}});
        uow.stageEvent(AllocationUpdateEvent{allocation, 0, false,
                                             allocation.updated_at_ms, 0});
        return allocation;
      });
}

// -----------------------------------------------------------------------------
// updateAllocation()
// -----------------------------------------------------------------------------
Result<domain::Allocation> LedgerEngine::updateAllocation(
    domain::AllocationId id, domain::Quantity quantity,
    const std::string& actor_id) {
  if (quantity < 0 || quantity > domain::kMaxQuantity) {
    return rejectEarly("update_allocation",
                       LedgerError::invalidArgument(
                           "allocation quantity must be in [0, " +
                           std::to_string(domain::kMaxQuantity) + "], got " +
                           std::to_string(quantity)));
  }

  auto located = allocations_.find(id);
  if (!located) {
    return rejectEarly("update_allocation",
                       LedgerError::notFound("Allocation", id));
  }

  return coordinator_.run<domain::Allocation>(
      located->stock_batch_id, "update_allocation",
      [&](UnitOfWork& uow) -> Result<domain::Allocation> {
        auto current = findRow(uow.snapshot().allocations, id);
        if (!current) {
          return LedgerError::notFound("Allocation", id);
        }

        auto decision = AvailabilityValidator::validateAllocation(
            uow.snapshot(), quantity, id);
        if (!decision) {
          return decision.error();
        }
        const AvailabilityBreakdown& b = decision.value();

        domain::Allocation updated = *current;
        updated.quantity = quantity;
        updated.allocated_by = actor_id;
        updated.updated_at_ms = clock_.now_ms();

        uow.stageAllocation(updated);
        recorder_.record(uow, uow.batchId(), domain::kAllocationTable,
                         updated.id, domain::kActionAllocationUpdated,
                         std::to_string(current->quantity),
                         std::to_string(quantity), actor_id,
                         {{"storefront_id", updated.storefront_id},
                          {"requested_quantity", quantity},
                          {"available", b.available},
                          {"already_allocated", b.allocated},
                          {"remaining_after", b.remaining - quantity}});
        uow.stageEvent(AllocationUpdateEvent{updated, current->quantity, false,
                                             updated.updated_at_ms, 0});
        return updated;
      });
}

// -----------------------------------------------------------------------------
// releaseAllocation()
// -----------------------------------------------------------------------------
Result<domain::Allocation> LedgerEngine::releaseAllocation(
    domain::AllocationId id, const std::string& actor_id) {
  auto located = allocations_.find(id);
  if (!located) {
    return rejectEarly("release_allocation",
                       LedgerError::notFound("Allocation", id));
  }

  return coordinator_.run<domain::Allocation>(
      located->stock_batch_id, "release_allocation",
      [&](UnitOfWork& uow) -> Result<domain::Allocation> {
        auto current = findRow(uow.snapshot().allocations, id);
        if (!current) {
          return LedgerError::notFound("Allocation", id);
        }

        const std::int64_t now = clock_.now_ms();
        uow.stageAllocationRelease(id);
        recorder_.record(uow, uow.batchId(), domain::kAllocationTable, id,
                         domain::kActionAllocationReleased,
                         std::to_string(current->quantity), "0", actor_id,
                         {{"storefront_id", current->storefront_id}});
        uow.stageEvent(
            AllocationUpdateEvent{*current, current->quantity, true, now, 0});
        return *current;
      });
}

// -----------------------------------------------------------------------------
// Queries
// -----------------------------------------------------------------------------
Result<domain::Quantity> LedgerEngine::getAvailableQuantity(
    domain::BatchId batch_id) {
  return coordinator_.read<domain::Quantity>(
      batch_id, [](const BatchSnapshot& s) -> Result<domain::Quantity> {
        return AvailabilityValidator::computeAvailability(s).available;
      });
}

Result<AvailabilityBreakdown> LedgerEngine::getAvailability(
    domain::BatchId batch_id) {
  return coordinator_.read<AvailabilityBreakdown>(
      batch_id, [](const BatchSnapshot& s) -> Result<AvailabilityBreakdown> {
        return AvailabilityValidator::computeAvailability(s);
      });
}

Result<AuditPage> LedgerEngine::getAuditTrail(
    domain::BatchId batch_id, std::optional<AuditCursor> after,
    std::optional<std::size_t> limit) const {
  if (!batches_.contains(batch_id)) {
    return LedgerError::notFound("Stock batch", batch_id);
  }
  std::size_t page = limit.value_or(config_.default_page_size);
  if (page > config_.max_page_size) {
    page = config_.max_page_size;
  }
  return recorder_.trail(batch_id, after, page);
}

std::vector<domain::AuditLogEntry> LedgerEngine::getAuditTrailForSubject(
    const std::string& subject_table, std::uint64_t subject_id) const {
  return recorder_.forSubject(subject_table, subject_id);
}

// -----------------------------------------------------------------------------
// checkIntegrity()
// -----------------------------------------------------------------------------
IntegrityReport LedgerEngine::checkIntegrity() {
  IntegrityReport report;

  for (domain::BatchId batch_id : batches_.ids()) {
    auto breakdown = getAvailability(batch_id);
    if (!breakdown) {
      std::cerr << "[LedgerEngine] WARNING: integrity check skipped batch_id="
                << batch_id << " kind="
                << errorKindToString(breakdown.error().kind) << "\n";
      report.skipped.push_back(batch_id);
      continue;
    }

    ++report.batches_checked;
    const AvailabilityBreakdown& b = breakdown.value();
    if (b.available < 0) {
      report.violations.push_back(
          {batch_id, IntegrityIssue::NegativeAvailability, b});
    } else if (b.allocated > b.available) {
      report.violations.push_back({batch_id, IntegrityIssue::OverAllocated, b});
    }
  }

  if (!report.violations.empty()) {
    std::cerr << "[LedgerEngine] CRITICAL: integrity check found "
              << report.violations.size() << " violation(s) in "
              << report.batches_checked << " batch(es).\n";
  }
  return report;
}

std::optional<domain::StockBatch> LedgerEngine::getBatch(
    domain::BatchId id) const {
  return batches_.find(id);
}

std::optional<domain::Adjustment> LedgerEngine::getAdjustment(
    domain::AdjustmentId id) const {
  return adjustments_.find(id);
}

std::optional<domain::Allocation> LedgerEngine::getAllocation(
    domain::AllocationId id) const {
  return allocations_.find(id);
}

std::vector<domain::Adjustment> LedgerEngine::listAdjustments(
    domain::BatchId batch_id) const {
  return adjustments_.forBatch(batch_id);
}

std::vector<domain::Allocation> LedgerEngine::listAllocations(
    domain::BatchId batch_id) const {
  return allocations_.forBatch(batch_id);
}

// -----------------------------------------------------------------------------
// executeCommand(): handle IPC command requests
// -----------------------------------------------------------------------------
std::string LedgerEngine::executeCommand(const std::string& command) {
  return dispatcher_.dispatch(command);
}

}  // namespace ledger
