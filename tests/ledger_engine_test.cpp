// =============================================================================
// ledger_engine_test.cpp
// =============================================================================
// End-to-end tests for ledger::LedgerEngine, exercising the public operations
// the way a caller (or the IPC command channel) would.
//
// Validates:
//   - The four reference scenarios: over-allocation refused, loss below the
//     allocated floor refused, gains always approved, concurrent allocations
//     serialised so exactly one of two competing requests wins
//   - Adjustment lifecycle: normalised sign, request sanity check, reject is
//     not repeatable, complete requires APPROVED, bulk approval
//   - Every state change lands in the audit trail with its old and new
//     values; the trail pages newest first and respects the page clamp
//   - Hydrated data that already violates the invariants is reported by
//     checkIntegrity() and blocks new allocations
//   - Change events reach notificationBus() subscribers
//   - A loss approval racing an allocation, and two losses racing each
//     other, never leave available below allocated
//   - Quantities and costs too large for int64 arithmetic are refused
//
// The fixture runs without IPC (empty endpoints) and with a
// SimulationTimeProvider so audit timestamps are predictable.
// =============================================================================

#include "ledger/engine/ledger_engine.hpp"
#include "ledger/time/simulation_time_provider.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <cstdint>
#include <future>
#include <limits>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using ledger::ErrorKind;
using ledger::domain::AdjustmentStatus;
using ledger::domain::AdjustmentType;

// =============================================================================
// Test fixture
// =============================================================================
class LedgerEngineTest : public ::testing::Test {
 protected:
  void SetUp() override {
    clock_ = std::make_unique<ledger::SimulationTimeProvider>(1000);
    engine_ = std::make_unique<ledger::LedgerEngine>(makeConfig(), *clock_);
  }

  void TearDown() override { engine_->stop(); }

  static ledger::LedgerConfig makeConfig() {
    ledger::LedgerConfig cfg;
    cfg.command_endpoint.clear();
    cfg.telemetry_endpoint.clear();
    cfg.lock_timeout = std::chrono::milliseconds(1000);
    cfg.default_page_size = 2;
    cfg.max_page_size = 3;
    return cfg;
  }

  ledger::domain::BatchId createBatch(ledger::domain::Quantity qty) {
    ledger::CreateBatchRequest request;
    request.product_id = "SKU-1";
    request.warehouse_id = "WH-1";
    request.recorded_quantity = qty;
    request.cost.unit_cost = 250;
    request.received_by = "receiver";
    auto batch = engine_->createBatch(request);
    EXPECT_TRUE(batch.ok());
    clock_->tick(10);
    return batch.value().id;
  }

  ledger::domain::Adjustment propose(ledger::domain::BatchId batch,
                                     ledger::domain::Quantity delta,
                                     AdjustmentType type) {
    ledger::AdjustmentRequest request;
    request.batch_id = batch;
    request.quantity_delta = delta;
    request.adjustment_type = type;
    request.reason = "test";
    request.requested_by = "clerk";
    auto adjustment = engine_->requestAdjustment(request);
    EXPECT_TRUE(adjustment.ok());
    clock_->tick(10);
    return adjustment.value();
  }

  std::unique_ptr<ledger::SimulationTimeProvider> clock_;
  std::unique_ptr<ledger::LedgerEngine> engine_;
};

// -----------------------------------------------------------------------------
// 1. Scenario A: allocate 60 of 100, then 50 more is InsufficientStock.
// -----------------------------------------------------------------------------
TEST_F(LedgerEngineTest, ScenarioAOverAllocationRefused) {
  auto batch = createBatch(100);

  auto first = engine_->requestAllocation(batch, "STORE-X", 60);
  ASSERT_TRUE(first.ok());
  EXPECT_EQ(engine_->getAvailability(batch).value().remaining, 40);

  auto second = engine_->requestAllocation(batch, "STORE-X", 50);
  ASSERT_FALSE(second.ok());
  EXPECT_EQ(second.error().kind, ErrorKind::InsufficientStock);
  EXPECT_EQ(second.error().diagnostics.remaining, 40);
  EXPECT_EQ(second.error().diagnostics.requested_quantity, 50);
  EXPECT_EQ(engine_->listAllocations(batch).size(), 1u);
}

// -----------------------------------------------------------------------------
// 2. Scenario B: 90 allocated, a -20 damage cannot be approved.
// -----------------------------------------------------------------------------
TEST_F(LedgerEngineTest, ScenarioBLossBelowFloorRefused) {
  auto batch = createBatch(100);
  ASSERT_TRUE(engine_->requestAllocation(batch, "STORE-X", 90).ok());
  auto damage = propose(batch, -20, AdjustmentType::Damage);

  auto result = engine_->approveAdjustment(damage.id, "manager");
  ASSERT_FALSE(result.ok());
  EXPECT_EQ(result.error().kind, ErrorKind::BelowAllocatedFloor);
  EXPECT_EQ(result.error().diagnostics.new_available, 80);
  EXPECT_EQ(result.error().diagnostics.allocated, 90);

  EXPECT_EQ(engine_->getAdjustment(damage.id)->status,
            AdjustmentStatus::Pending);
  EXPECT_EQ(engine_->getAvailableQuantity(batch).value(), 100);
}

// -----------------------------------------------------------------------------
// 3. Scenario C: a +5 found-stock adjustment is approved; available 105.
// -----------------------------------------------------------------------------
TEST_F(LedgerEngineTest, ScenarioCGainApproved) {
  auto batch = createBatch(100);
  ASSERT_TRUE(engine_->requestAllocation(batch, "STORE-X", 100).ok());
  auto found = propose(batch, 5, AdjustmentType::Found);

  auto result = engine_->approveAdjustment(found.id, "manager");
  ASSERT_TRUE(result.ok());
  EXPECT_EQ(result.value().status, AdjustmentStatus::Approved);
  ASSERT_TRUE(result.value().approved_by.has_value());
  EXPECT_EQ(*result.value().approved_by, "manager");
  EXPECT_EQ(engine_->getAvailableQuantity(batch).value(), 105);
}

// -----------------------------------------------------------------------------
// 4. Scenario D: two concurrent requests for 60 of 100. Exactly one wins.
// Why: Both callers read available=100 if the decision is not serialised
//      per batch; the batch lock makes the second one see the first.
// -----------------------------------------------------------------------------
TEST_F(LedgerEngineTest, ScenarioDConcurrentAllocationsSerialised) {
  auto batch = createBatch(100);

  std::promise<void> go;
  std::shared_future<void> start_signal = go.get_future().share();
  std::atomic<int> succeeded{0};
  std::atomic<int> insufficient{0};

  auto worker = [&](const std::string& storefront) {
    start_signal.wait();
    auto result = engine_->requestAllocation(batch, storefront, 60);
    if (result.ok()) {
      ++succeeded;
    } else if (result.error().kind == ErrorKind::InsufficientStock) {
      ++insufficient;
    }
  };

  std::thread a(worker, "STORE-A");
  std::thread b(worker, "STORE-B");
  go.set_value();
  a.join();
  b.join();

  EXPECT_EQ(succeeded.load(), 1);
  EXPECT_EQ(insufficient.load(), 1);
  EXPECT_EQ(engine_->getAvailability(batch).value().allocated, 60);
}

// -----------------------------------------------------------------------------
// 5. Loss types are stored negative whatever sign the caller sent, and the
//    adjustment snapshots cost and quantity_before.
// -----------------------------------------------------------------------------
TEST_F(LedgerEngineTest, RequestNormalisesSignAndSnapshotsCost) {
  auto batch = createBatch(40);
  auto theft = propose(batch, 4, AdjustmentType::Theft);

  EXPECT_EQ(theft.quantity_delta, -4);
  EXPECT_EQ(theft.status, AdjustmentStatus::Pending);
  EXPECT_EQ(theft.quantity_before, 40);
  EXPECT_EQ(theft.unit_cost, 250);
  EXPECT_EQ(theft.total_cost, 1000);
  EXPECT_EQ(engine_->listPendingAdjustments(batch).size(), 1u);

  // A pending loss does not reduce availability.
  EXPECT_EQ(engine_->getAvailableQuantity(batch).value(), 40);
}

// -----------------------------------------------------------------------------
// 6. Request-time rejections: zero delta, loss larger than the receipt,
//    unknown batch.
// -----------------------------------------------------------------------------
TEST_F(LedgerEngineTest, RequestRejections) {
  auto batch = createBatch(20);

  ledger::AdjustmentRequest request;
  request.batch_id = batch;
  request.adjustment_type = AdjustmentType::Damage;
  request.requested_by = "clerk";

  request.quantity_delta = 0;
  EXPECT_EQ(engine_->requestAdjustment(request).error().kind,
            ErrorKind::InvalidArgument);

  request.quantity_delta = -25;
  EXPECT_EQ(engine_->requestAdjustment(request).error().kind,
            ErrorKind::WouldGoNegative);

  request.batch_id = 999;
  request.quantity_delta = -1;
  EXPECT_EQ(engine_->requestAdjustment(request).error().kind,
            ErrorKind::NotFound);

  EXPECT_EQ(engine_->adjustmentCount(), 0u);
}

// -----------------------------------------------------------------------------
// 7. Reject is terminal: a second reject and a later approve both fail and
//    add nothing to the trail.
// -----------------------------------------------------------------------------
TEST_F(LedgerEngineTest, RejectIsNotRepeatable) {
  auto batch = createBatch(50);
  auto loss = propose(batch, -5, AdjustmentType::Expired);

  ASSERT_TRUE(engine_->rejectAdjustment(loss.id, "manager").ok());
  const std::size_t entries = engine_->auditEntryCount();

  auto again = engine_->rejectAdjustment(loss.id, "manager");
  ASSERT_FALSE(again.ok());
  EXPECT_EQ(again.error().kind, ErrorKind::InvalidTransition);

  auto approve = engine_->approveAdjustment(loss.id, "manager");
  ASSERT_FALSE(approve.ok());
  EXPECT_EQ(approve.error().kind, ErrorKind::InvalidTransition);

  EXPECT_EQ(engine_->auditEntryCount(), entries);
  EXPECT_EQ(engine_->getAdjustment(loss.id)->status,
            AdjustmentStatus::Rejected);
}

// -----------------------------------------------------------------------------
// 8. complete only from APPROVED; direct PENDING -> COMPLETED goes through
//    approval and is validated.
// -----------------------------------------------------------------------------
TEST_F(LedgerEngineTest, CompletionRules) {
  auto batch = createBatch(50);
  auto pending = propose(batch, -5, AdjustmentType::WriteOff);

  auto early = engine_->completeAdjustment(pending.id, "auditor");
  ASSERT_FALSE(early.ok());
  EXPECT_EQ(early.error().kind, ErrorKind::InvalidTransition);

  ASSERT_TRUE(engine_->approveAdjustment(pending.id, "manager").ok());
  auto done = engine_->completeAdjustment(pending.id, "auditor");
  ASSERT_TRUE(done.ok());
  EXPECT_EQ(done.value().status, AdjustmentStatus::Completed);
  EXPECT_TRUE(done.value().completed_at_ms.has_value());

  auto direct = propose(batch, 3, AdjustmentType::Found);
  auto completed = engine_->approveAdjustment(direct.id, "manager",
                                              AdjustmentStatus::Completed);
  ASSERT_TRUE(completed.ok());
  EXPECT_EQ(completed.value().status, AdjustmentStatus::Completed);

  EXPECT_EQ(engine_->getAvailableQuantity(batch).value(), 48);
}

// -----------------------------------------------------------------------------
// 9. Bulk approval reports each id's outcome independently.
// -----------------------------------------------------------------------------
TEST_F(LedgerEngineTest, BulkApproval) {
  auto batch = createBatch(100);
  ASSERT_TRUE(engine_->requestAllocation(batch, "STORE-X", 85).ok());
  auto small = propose(batch, -10, AdjustmentType::Damage);
  auto large = propose(batch, -10, AdjustmentType::Damage);

  auto result = engine_->approveAdjustments({small.id, large.id, 777}, "boss");

  ASSERT_EQ(result.approved.size(), 1u);
  EXPECT_EQ(result.approved[0], small.id);
  ASSERT_EQ(result.failed.size(), 2u);
  EXPECT_EQ(result.failed[0].first, large.id);
  EXPECT_EQ(result.failed[0].second.kind, ErrorKind::BelowAllocatedFloor);
  EXPECT_EQ(result.failed[1].second.kind, ErrorKind::NotFound);
}

// -----------------------------------------------------------------------------
// 10. The trail holds one entry per state change, with old and new values.
// Why: The trail is the compliance record; an approval that does not show
//      PENDING -> APPROVED with who approved it is not auditable.
// -----------------------------------------------------------------------------
TEST_F(LedgerEngineTest, AuditTrailRecordsEveryChange) {
  auto batch = createBatch(30);
  auto loss = propose(batch, -5, AdjustmentType::Damage);
  ASSERT_TRUE(engine_->approveAdjustment(loss.id, "manager").ok());
  clock_->tick(10);
  auto alloc = engine_->requestAllocation(batch, "STORE-X", 10, "planner");
  ASSERT_TRUE(alloc.ok());
  clock_->tick(10);
  ASSERT_TRUE(engine_->updateAllocation(alloc.value().id, 15, "planner").ok());
  clock_->tick(10);
  ASSERT_TRUE(engine_->releaseAllocation(alloc.value().id, "planner").ok());

  auto history = engine_->getAuditTrailForSubject(
      ledger::domain::kAllocationTable, alloc.value().id);
  ASSERT_EQ(history.size(), 3u);
  EXPECT_EQ(history[0].action, ledger::domain::kActionAllocationCreated);
  EXPECT_EQ(history[0].new_value, "10");
  EXPECT_EQ(history[1].action, ledger::domain::kActionAllocationUpdated);
  EXPECT_EQ(history[1].old_value, "10");
  EXPECT_EQ(history[1].new_value, "15");
  EXPECT_EQ(history[2].action, ledger::domain::kActionAllocationReleased);
  EXPECT_EQ(history[2].new_value, "0");

  auto approval = engine_->getAuditTrailForSubject(
      ledger::domain::kAdjustmentTable, loss.id);
  ASSERT_EQ(approval.size(), 1u);
  EXPECT_EQ(approval[0].old_value, "PENDING");
  EXPECT_EQ(approval[0].new_value, "APPROVED");
  EXPECT_EQ(approval[0].actor_id, "manager");
  EXPECT_EQ(approval[0].metadata.at("new_available"), 25);

  auto receipt =
      engine_->getAuditTrailForSubject(ledger::domain::kBatchTable, batch);
  ASSERT_EQ(receipt.size(), 1u);
  EXPECT_EQ(receipt[0].new_value, "30");
  EXPECT_EQ(receipt[0].actor_id, "receiver");

  EXPECT_EQ(engine_->getBatch(batch)->recorded_quantity, 30);
}

// -----------------------------------------------------------------------------
// 11. Trail pages are newest first; default and maximum page sizes apply.
// -----------------------------------------------------------------------------
TEST_F(LedgerEngineTest, AuditTrailPaging) {
  auto batch = createBatch(100);
  for (int i = 0; i < 5; ++i) {
    ASSERT_TRUE(engine_->requestAllocation(batch, "STORE-X", 1).ok());
    clock_->tick(10);
  }

  auto first = engine_->getAuditTrail(batch);
  ASSERT_TRUE(first.ok());
  ASSERT_EQ(first.value().entries.size(), 2u);
  EXPECT_EQ(first.value().entries[0].action,
            ledger::domain::kActionAllocationCreated);
  ASSERT_TRUE(first.value().next.has_value());

  auto clamped = engine_->getAuditTrail(batch, first.value().next, 100);
  ASSERT_TRUE(clamped.ok());
  EXPECT_EQ(clamped.value().entries.size(), 3u);

  auto last = engine_->getAuditTrail(batch, clamped.value().next, 3);
  ASSERT_TRUE(last.ok());
  ASSERT_EQ(last.value().entries.size(), 1u);
  EXPECT_EQ(last.value().entries[0].action,
            ledger::domain::kActionBatchReceived);
  EXPECT_FALSE(last.value().next.has_value());

  EXPECT_EQ(engine_->getAuditTrail(4242).error().kind, ErrorKind::NotFound);
}

// -----------------------------------------------------------------------------
// 12. Invalid allocation arguments are refused before any lock is taken.
//     A zero allocation is valid on create, as it is on update.
// -----------------------------------------------------------------------------
TEST_F(LedgerEngineTest, AllocationArgumentChecks) {
  auto batch = createBatch(10);

  EXPECT_EQ(engine_->requestAllocation(batch, "", 1).error().kind,
            ErrorKind::InvalidArgument);
  EXPECT_EQ(engine_->requestAllocation(batch, "STORE-X", -1).error().kind,
            ErrorKind::InvalidArgument);

  auto empty = engine_->requestAllocation(batch, "STORE-Z", 0);
  ASSERT_TRUE(empty.ok());
  EXPECT_EQ(empty.value().quantity, 0);
  ASSERT_TRUE(engine_->updateAllocation(empty.value().id, 0).ok());
  EXPECT_EQ(engine_->getAvailability(batch).value().remaining, 10);

  EXPECT_EQ(engine_->updateAllocation(55, 1).error().kind, ErrorKind::NotFound);
  EXPECT_EQ(engine_->releaseAllocation(55).error().kind, ErrorKind::NotFound);

  ledger::CreateBatchRequest bad;
  bad.product_id = "SKU";
  bad.warehouse_id = "WH";
  bad.recorded_quantity = -1;
  EXPECT_EQ(engine_->createBatch(bad).error().kind, ErrorKind::InvalidArgument);
  EXPECT_EQ(engine_->batchCount(), 1u);
}

// -----------------------------------------------------------------------------
// 13. Hydrated rows that already break the invariants are reported, and a
//     negative batch refuses every allocation. New ids continue after the
//     hydrated ones.
// -----------------------------------------------------------------------------
TEST_F(LedgerEngineTest, HydrationAndIntegrityCheck) {
  ledger::domain::StockBatch negative;
  negative.id = 10;
  negative.product_id = "SKU-N";
  negative.warehouse_id = "WH-1";
  negative.recorded_quantity = 10;

  ledger::domain::StockBatch over = negative;
  over.id = 11;
  over.recorded_quantity = 50;

  ledger::domain::Adjustment big_loss;
  big_loss.id = 20;
  big_loss.stock_batch_id = 10;
  big_loss.quantity_delta = -15;
  big_loss.adjustment_type = AdjustmentType::Damage;
  big_loss.status = AdjustmentStatus::Completed;
  big_loss.requested_by = "legacy";

  ledger::domain::Allocation too_much;
  too_much.id = 30;
  too_much.stock_batch_id = 11;
  too_much.storefront_id = "STORE-OLD";
  too_much.quantity = 60;

  ledger::domain::Allocation orphan = too_much;
  orphan.id = 31;
  orphan.stock_batch_id = 99;

  ledger::StaticLedgerSource source({negative, over}, {big_loss},
                                    {too_much, orphan});
  engine_->start(&source);

  EXPECT_EQ(engine_->batchCount(), 2u);
  EXPECT_EQ(engine_->allocationCount(), 1u);

  auto report = engine_->checkIntegrity();
  EXPECT_FALSE(report.clean());
  EXPECT_EQ(report.batches_checked, 2u);
  ASSERT_EQ(report.violations.size(), 2u);
  EXPECT_EQ(report.violations[0].batch_id, 10u);
  EXPECT_EQ(report.violations[0].issue,
            ledger::IntegrityIssue::NegativeAvailability);
  EXPECT_EQ(report.violations[0].breakdown.available, -5);
  EXPECT_EQ(report.violations[1].issue, ledger::IntegrityIssue::OverAllocated);

  auto blocked = engine_->requestAllocation(10, "STORE-X", 1);
  ASSERT_FALSE(blocked.ok());
  EXPECT_EQ(blocked.error().kind, ErrorKind::NegativeAvailability);

  EXPECT_GT(createBatch(5), 11u);
  EXPECT_GT(propose(11, 1, AdjustmentType::Found).id, 20u);
}

// -----------------------------------------------------------------------------
// 14. Subscribers on notificationBus() receive committed changes on the
//     notification thread; stop() delivers whatever is still queued.
// -----------------------------------------------------------------------------
TEST_F(LedgerEngineTest, NotificationsDelivered) {
  std::atomic<int> batches{0};
  std::atomic<int> allocations{0};
  std::atomic<int> audits{0};

  engine_->notificationBus().subscribe<ledger::BatchReceivedEvent>(
      [&](const ledger::BatchReceivedEvent&) { ++batches; });
  engine_->notificationBus().subscribe<ledger::AllocationUpdateEvent>(
      [&](const ledger::AllocationUpdateEvent&) { ++allocations; });
  engine_->notificationBus().subscribe<ledger::AuditRecordedEvent>(
      [&](const ledger::AuditRecordedEvent&) { ++audits; });

  engine_->start();
  auto batch = createBatch(10);
  ASSERT_TRUE(engine_->requestAllocation(batch, "STORE-X", 4).ok());
  EXPECT_FALSE(engine_->requestAllocation(batch, "STORE-X", 40).ok());
  engine_->stop();

  EXPECT_EQ(batches.load(), 1);
  EXPECT_EQ(allocations.load(), 1);
  EXPECT_EQ(audits.load(), 2);
  EXPECT_FALSE(engine_->running());
}

// -----------------------------------------------------------------------------
// 15. A hydrated batch whose losses exceed its receipt and which still has
//     an allocation reports NegativeAvailability, not InsufficientStock, for
//     both new and shrinking allocations. A gain brings it back.
// Why: With available < 0 every request also exceeds remaining; the caller
//      needs the data-integrity signal, which is checked first.
// -----------------------------------------------------------------------------
TEST_F(LedgerEngineTest, NegativeHydratedBatchReportsIntegrityFirst) {
  ledger::domain::StockBatch batch;
  batch.id = 40;
  batch.product_id = "SKU-N";
  batch.warehouse_id = "WH-1";
  batch.recorded_quantity = 10;

  ledger::domain::Adjustment loss;
  loss.id = 50;
  loss.stock_batch_id = 40;
  loss.quantity_delta = -15;
  loss.adjustment_type = AdjustmentType::Theft;
  loss.status = AdjustmentStatus::Approved;
  loss.requested_by = "legacy";

  ledger::domain::Allocation held;
  held.id = 60;
  held.stock_batch_id = 40;
  held.storefront_id = "STORE-OLD";
  held.quantity = 3;

  ledger::StaticLedgerSource source({batch}, {loss}, {held});
  engine_->start(&source);

  auto fresh = engine_->requestAllocation(40, "STORE-X", 1);
  ASSERT_FALSE(fresh.ok());
  EXPECT_EQ(fresh.error().kind, ErrorKind::NegativeAvailability);
  EXPECT_EQ(fresh.error().diagnostics.recorded_quantity, 10);
  EXPECT_EQ(fresh.error().diagnostics.approved_delta, -15);
  EXPECT_EQ(fresh.error().diagnostics.available, -5);
  EXPECT_FALSE(fresh.error().diagnostics.requested_quantity.has_value());

  auto shrink = engine_->updateAllocation(60, 1);
  ASSERT_FALSE(shrink.ok());
  EXPECT_EQ(shrink.error().kind, ErrorKind::NegativeAvailability);
  EXPECT_EQ(engine_->getAllocation(60)->quantity, 3);

  auto found = propose(40, 10, AdjustmentType::Found);
  ASSERT_TRUE(engine_->approveAdjustment(found.id, "manager").ok());
  EXPECT_EQ(engine_->getAvailableQuantity(40).value(), 5);
  EXPECT_TRUE(engine_->requestAllocation(40, "STORE-X", 2).ok());
}

// -----------------------------------------------------------------------------
// 16. A loss approval racing an allocation on the same batch: each fits
//     alone, not both. Exactly one commits and the floor holds.
// Why: The approval reads `allocated` and the allocation reads `available`;
//      without the batch lock both could decide on stale numbers.
// -----------------------------------------------------------------------------
TEST_F(LedgerEngineTest, LossApprovalRacesAllocation) {
  for (int round = 0; round < 20; ++round) {
    auto batch = createBatch(100);
    auto loss = propose(batch, -30, AdjustmentType::Damage);

    std::promise<void> go;
    std::shared_future<void> start_signal = go.get_future().share();
    bool approved = false;
    bool allocated = false;
    ErrorKind approval_error = ErrorKind::InvalidArgument;
    ErrorKind allocation_error = ErrorKind::InvalidArgument;

    std::thread approver([&] {
      start_signal.wait();
      auto result = engine_->approveAdjustment(loss.id, "manager");
      approved = result.ok();
      if (!approved) approval_error = result.error().kind;
    });
    std::thread planner([&] {
      start_signal.wait();
      auto result = engine_->requestAllocation(batch, "STORE-X", 80);
      allocated = result.ok();
      if (!allocated) allocation_error = result.error().kind;
    });
    go.set_value();
    approver.join();
    planner.join();

    ASSERT_NE(approved, allocated) << "round " << round;
    if (approved) {
      EXPECT_EQ(allocation_error, ErrorKind::InsufficientStock);
    } else {
      EXPECT_EQ(approval_error, ErrorKind::BelowAllocatedFloor);
    }

    auto b = engine_->getAvailability(batch).value();
    EXPECT_GE(b.available, b.allocated) << "round " << round;
  }
}

// -----------------------------------------------------------------------------
// 17. Two losses that each keep the floor, but not together, approved
//     concurrently: exactly one is approved, the other stays Pending.
// -----------------------------------------------------------------------------
TEST_F(LedgerEngineTest, ConcurrentLossApprovalsKeepFloor) {
  for (int round = 0; round < 20; ++round) {
    auto batch = createBatch(100);
    ASSERT_TRUE(engine_->requestAllocation(batch, "STORE-X", 50).ok());
    auto first = propose(batch, -30, AdjustmentType::Damage);
    auto second = propose(batch, -30, AdjustmentType::Spoilage);

    std::promise<void> go;
    std::shared_future<void> start_signal = go.get_future().share();
    std::atomic<int> succeeded{0};
    std::atomic<int> below_floor{0};

    auto worker = [&](ledger::domain::AdjustmentId id) {
      start_signal.wait();
      auto result = engine_->approveAdjustment(id, "manager");
      if (result.ok()) {
        ++succeeded;
      } else if (result.error().kind == ErrorKind::BelowAllocatedFloor) {
        ++below_floor;
      }
    };

    std::thread a(worker, first.id);
    std::thread b(worker, second.id);
    go.set_value();
    a.join();
    b.join();

    EXPECT_EQ(succeeded.load(), 1) << "round " << round;
    EXPECT_EQ(below_floor.load(), 1) << "round " << round;

    auto breakdown = engine_->getAvailability(batch).value();
    EXPECT_EQ(breakdown.available, 70);
    EXPECT_GE(breakdown.available, breakdown.allocated);
    EXPECT_EQ(engine_->listPendingAdjustments(batch).size(), 1u);
  }
}

// -----------------------------------------------------------------------------
// 18. Quantities outside [-kMaxQuantity, kMaxQuantity] and costs that do not
//     fit are InvalidArgument; nothing is written for them.
// -----------------------------------------------------------------------------
TEST_F(LedgerEngineTest, ExtremeQuantitiesRefused) {
  using ledger::domain::kMaxQuantity;
  auto batch = createBatch(20);

  ledger::AdjustmentRequest request;
  request.batch_id = batch;
  request.adjustment_type = AdjustmentType::Found;
  request.requested_by = "clerk";

  request.quantity_delta = std::numeric_limits<std::int64_t>::min();
  EXPECT_EQ(engine_->requestAdjustment(request).error().kind,
            ErrorKind::InvalidArgument);
  request.quantity_delta = std::numeric_limits<std::int64_t>::max();
  EXPECT_EQ(engine_->requestAdjustment(request).error().kind,
            ErrorKind::InvalidArgument);
  request.quantity_delta = kMaxQuantity + 1;
  EXPECT_EQ(engine_->requestAdjustment(request).error().kind,
            ErrorKind::InvalidArgument);
  EXPECT_EQ(engine_->adjustmentCount(), 0u);

  // The bound itself is accepted, and its sign is still normalised.
  request.quantity_delta = -kMaxQuantity;
  auto gain = engine_->requestAdjustment(request);
  ASSERT_TRUE(gain.ok());
  EXPECT_EQ(gain.value().quantity_delta, kMaxQuantity);
  EXPECT_EQ(gain.value().total_cost, 250 * kMaxQuantity);

  ledger::CreateBatchRequest huge;
  huge.product_id = "SKU-H";
  huge.warehouse_id = "WH-1";
  huge.recorded_quantity = kMaxQuantity + 1;
  EXPECT_EQ(engine_->createBatch(huge).error().kind,
            ErrorKind::InvalidArgument);

  EXPECT_EQ(
      engine_->requestAllocation(batch, "STORE-X", kMaxQuantity + 1)
          .error()
          .kind,
      ErrorKind::InvalidArgument);

  ledger::CreateBatchRequest pricey;
  pricey.product_id = "SKU-P";
  pricey.warehouse_id = "WH-1";
  pricey.recorded_quantity = 10;
  pricey.cost.unit_cost = std::numeric_limits<std::int64_t>::max() / 2;
  auto expensive = engine_->createBatch(pricey);
  ASSERT_TRUE(expensive.ok());

  request.batch_id = expensive.value().id;
  request.quantity_delta = 3;
  EXPECT_EQ(engine_->requestAdjustment(request).error().kind,
            ErrorKind::InvalidArgument);
  EXPECT_EQ(engine_->listPendingAdjustments(expensive.value().id).size(), 0u);
}
