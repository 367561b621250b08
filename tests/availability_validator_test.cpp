// =============================================================================
// availability_validator_test.cpp
// =============================================================================
// Unit tests for ledger::AvailabilityValidator.
//
// Validates:
//   - Allocation decisions: success, InsufficientStock with its numbers,
//     NegativeAvailability regardless of the requested quantity
//   - Update-style validation that excludes the allocation's own quantity
//   - Approval decisions: gains always pass, BelowAllocatedFloor,
//     WouldGoNegative, and the order in which they are checked
//   - Status and target preconditions of approval
//   - The request-time sanity check
//
// Snapshots are plain structs; nothing here touches a store or a lock.
// =============================================================================

#include "ledger/validation/availability_validator.hpp"

#include <gtest/gtest.h>

namespace {

using ledger::AvailabilityValidator;
using ledger::BatchSnapshot;
using ledger::ErrorKind;
using ledger::domain::Adjustment;
using ledger::domain::AdjustmentStatus;
using ledger::domain::Allocation;

// =============================================================================
// Snapshot builder
// =============================================================================
class SnapshotBuilder {
 public:
  explicit SnapshotBuilder(ledger::domain::Quantity recorded) {
    snapshot_.batch.id = 1;
    snapshot_.batch.product_id = "SKU-1";
    snapshot_.batch.warehouse_id = "WH-1";
    snapshot_.batch.recorded_quantity = recorded;
  }

  SnapshotBuilder& adjustment(ledger::domain::Quantity delta,
                              AdjustmentStatus status) {
    Adjustment a;
    a.id = ++next_adjustment_id_;
    a.stock_batch_id = 1;
    a.quantity_delta = delta;
    a.status = status;
    snapshot_.adjustments.push_back(a);
    return *this;
  }

  SnapshotBuilder& allocation(ledger::domain::Quantity qty) {
    Allocation a;
    a.id = ++next_allocation_id_;
    a.stock_batch_id = 1;
    a.storefront_id = "STORE";
    a.quantity = qty;
    snapshot_.allocations.push_back(a);
    return *this;
  }

  BatchSnapshot build() const { return snapshot_; }

 private:
  BatchSnapshot snapshot_;
  ledger::domain::AdjustmentId next_adjustment_id_{0};
  ledger::domain::AllocationId next_allocation_id_{0};
};

}  // namespace

// -----------------------------------------------------------------------------
// 1. Scenario A: recorded 100, allocate 60 (ok), then 50 more fails.
// -----------------------------------------------------------------------------
TEST(AvailabilityValidatorTest, AllocationScenarioA) {
  BatchSnapshot empty = SnapshotBuilder(100).build();
  auto first = AvailabilityValidator::validateAllocation(empty, 60);
  ASSERT_TRUE(first.ok());
  EXPECT_EQ(first.value().remaining, 100);

  BatchSnapshot after = SnapshotBuilder(100).allocation(60).build();
  auto second = AvailabilityValidator::validateAllocation(after, 50);
  ASSERT_FALSE(second.ok());

  const auto& err = second.error();
  EXPECT_EQ(err.kind, ErrorKind::InsufficientStock);
  EXPECT_FALSE(err.retryable());
  EXPECT_EQ(err.diagnostics.recorded_quantity, 100);
  EXPECT_EQ(err.diagnostics.available, 100);
  EXPECT_EQ(err.diagnostics.allocated, 60);
  EXPECT_EQ(err.diagnostics.remaining, 40);
  EXPECT_EQ(err.diagnostics.requested_quantity, 50);
}

// -----------------------------------------------------------------------------
// 2. An allocation of exactly what remains is accepted.
// -----------------------------------------------------------------------------
TEST(AvailabilityValidatorTest, AllocationOfExactRemainderSucceeds) {
  BatchSnapshot s = SnapshotBuilder(100)
                        .adjustment(-10, AdjustmentStatus::Approved)
                        .allocation(50)
                        .build();

  auto result = AvailabilityValidator::validateAllocation(s, 40);
  ASSERT_TRUE(result.ok());
  EXPECT_EQ(result.value().available, 90);
  EXPECT_EQ(result.value().allocated, 50);
  EXPECT_EQ(result.value().remaining, 40);
}

// -----------------------------------------------------------------------------
// 3. Negative availability fails every allocation, even of 1 unit, and is
//    reported as NegativeAvailability rather than InsufficientStock.
// Why: available < 0 always also fails the remaining check; the integrity
//      signal has to win.
// -----------------------------------------------------------------------------
TEST(AvailabilityValidatorTest, NegativeAvailabilityWinsOverInsufficientStock) {
  BatchSnapshot s = SnapshotBuilder(10)
                        .adjustment(-15, AdjustmentStatus::Completed)
                        .build();

  auto result = AvailabilityValidator::validateAllocation(s, 1);
  ASSERT_FALSE(result.ok());
  EXPECT_EQ(result.error().kind, ErrorKind::NegativeAvailability);
  EXPECT_EQ(result.error().diagnostics.available, -5);
  EXPECT_EQ(result.error().diagnostics.approved_delta, -15);
}

// -----------------------------------------------------------------------------
// 4. Updating an allocation leaves its own current quantity out.
// Why: Raising a 60-unit allocation to 90 on a 100-unit batch must be
//      judged against the other 0 units allocated, not against 60.
// -----------------------------------------------------------------------------
TEST(AvailabilityValidatorTest, UpdateExcludesOwnAllocation) {
  BatchSnapshot s = SnapshotBuilder(100).allocation(60).build();

  EXPECT_FALSE(AvailabilityValidator::validateAllocation(s, 90).ok());

  auto result = AvailabilityValidator::validateAllocation(s, 90, 1);
  ASSERT_TRUE(result.ok());
  EXPECT_EQ(result.value().allocated, 0);
}

// -----------------------------------------------------------------------------
// 5. Scenario B: recorded 100 with 90 allocated; approving -20 fails with
//    BelowAllocatedFloor (80 < 90).
// -----------------------------------------------------------------------------
TEST(AvailabilityValidatorTest, ApprovalScenarioB) {
  BatchSnapshot s = SnapshotBuilder(100)
                        .allocation(90)
                        .adjustment(-20, AdjustmentStatus::Pending)
                        .build();

  auto result = AvailabilityValidator::validateAdjustmentApproval(
      s, s.adjustments.front(), AdjustmentStatus::Approved);
  ASSERT_FALSE(result.ok());

  const auto& d = result.error().diagnostics;
  EXPECT_EQ(result.error().kind, ErrorKind::BelowAllocatedFloor);
  EXPECT_EQ(d.recorded_quantity, 100);
  EXPECT_EQ(d.allocated, 90);
  EXPECT_EQ(d.other_delta, 0);
  EXPECT_EQ(d.quantity_delta, -20);
  EXPECT_EQ(d.new_available, 80);
}

// -----------------------------------------------------------------------------
// 6. Scenario C: a pending gain always passes, even on an over-allocated
//    batch.
// -----------------------------------------------------------------------------
TEST(AvailabilityValidatorTest, ApprovalScenarioCGainAlwaysPasses) {
  BatchSnapshot s = SnapshotBuilder(100)
                        .adjustment(+5, AdjustmentStatus::Pending)
                        .build();

  auto result = AvailabilityValidator::validateAdjustmentApproval(
      s, s.adjustments.front(), AdjustmentStatus::Approved);
  ASSERT_TRUE(result.ok());
  EXPECT_EQ(result.value().new_available, 105);

  BatchSnapshot broken = SnapshotBuilder(10)
                             .adjustment(-20, AdjustmentStatus::Approved)
                             .adjustment(+1, AdjustmentStatus::Pending)
                             .build();
  EXPECT_TRUE(AvailabilityValidator::validateAdjustmentApproval(
                  broken, broken.adjustments.back(),
                  AdjustmentStatus::Completed)
                  .ok());
}

// -----------------------------------------------------------------------------
// 7. A loss that would drive availability below zero is WouldGoNegative,
//    not BelowAllocatedFloor, even when allocations exist.
// -----------------------------------------------------------------------------
TEST(AvailabilityValidatorTest, WouldGoNegativeCheckedBeforeFloor) {
  BatchSnapshot s = SnapshotBuilder(50)
                        .adjustment(-20, AdjustmentStatus::Approved)
                        .allocation(10)
                        .adjustment(-40, AdjustmentStatus::Pending)
                        .build();

  auto result = AvailabilityValidator::validateAdjustmentApproval(
      s, s.adjustments.back(), AdjustmentStatus::Approved);
  ASSERT_FALSE(result.ok());
  EXPECT_EQ(result.error().kind, ErrorKind::WouldGoNegative);
  EXPECT_EQ(result.error().diagnostics.other_delta, -20);
  EXPECT_EQ(result.error().diagnostics.new_available, -10);
}

// -----------------------------------------------------------------------------
// 8. A loss that lands exactly on the allocated floor is accepted.
// -----------------------------------------------------------------------------
TEST(AvailabilityValidatorTest, LossDownToFloorSucceeds) {
  BatchSnapshot s = SnapshotBuilder(100)
                        .allocation(70)
                        .adjustment(-30, AdjustmentStatus::Pending)
                        .build();

  auto result = AvailabilityValidator::validateAdjustmentApproval(
      s, s.adjustments.front(), AdjustmentStatus::Completed);
  ASSERT_TRUE(result.ok());
  EXPECT_EQ(result.value().new_available, 70);
  EXPECT_EQ(result.value().allocated, 70);
}

// -----------------------------------------------------------------------------
// 9. Only Pending adjustments can be approved, and only to Approved or
//    Completed.
// -----------------------------------------------------------------------------
TEST(AvailabilityValidatorTest, ApprovalPreconditions) {
  BatchSnapshot s = SnapshotBuilder(100)
                        .adjustment(-1, AdjustmentStatus::Rejected)
                        .adjustment(-1, AdjustmentStatus::Pending)
                        .build();

  auto rejected = AvailabilityValidator::validateAdjustmentApproval(
      s, s.adjustments[0], AdjustmentStatus::Approved);
  ASSERT_FALSE(rejected.ok());
  EXPECT_EQ(rejected.error().kind, ErrorKind::InvalidTransition);

  auto bad_target = AvailabilityValidator::validateAdjustmentApproval(
      s, s.adjustments[1], AdjustmentStatus::Rejected);
  ASSERT_FALSE(bad_target.ok());
  EXPECT_EQ(bad_target.error().kind, ErrorKind::InvalidArgument);
}

// -----------------------------------------------------------------------------
// 10. Request-time check refuses a loss bigger than the whole receipt.
// -----------------------------------------------------------------------------
TEST(AvailabilityValidatorTest, RequestLargerThanReceiptRefused) {
  ledger::domain::StockBatch batch;
  batch.id = 1;
  batch.recorded_quantity = 20;

  EXPECT_TRUE(AvailabilityValidator::validateAdjustmentRequest(batch, -20).ok());

  auto result = AvailabilityValidator::validateAdjustmentRequest(batch, -21);
  ASSERT_FALSE(result.ok());
  EXPECT_EQ(result.error().kind, ErrorKind::WouldGoNegative);
  EXPECT_EQ(result.error().diagnostics.new_available, -1);
}
