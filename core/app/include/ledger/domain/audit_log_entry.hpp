#pragma once

#include "ledger/domain/ids.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>

namespace ledger {
namespace domain {

// Subject tables an audit entry can point at.
inline constexpr const char* kBatchTable = "stock_batches";
inline constexpr const char* kAdjustmentTable = "stock_adjustments";
inline constexpr const char* kAllocationTable = "storefront_allocations";

// Actions written by the ledger.
inline constexpr const char* kActionBatchReceived = "BATCH_RECEIVED";
inline constexpr const char* kActionAdjustmentApproved = "ADJUSTMENT_APPROVED";
inline constexpr const char* kActionAdjustmentCompleted = "ADJUSTMENT_COMPLETED";
inline constexpr const char* kActionAdjustmentRejected = "ADJUSTMENT_REJECTED";
inline constexpr const char* kActionAllocationCreated = "ALLOCATION_CREATED";
inline constexpr const char* kActionAllocationUpdated = "ALLOCATION_UPDATED";
inline constexpr const char* kActionAllocationReleased = "ALLOCATION_RELEASED";

// -----------------------------------------------------------------------------
// AuditLogEntry: one immutable line of the compliance trail
// -----------------------------------------------------------------------------
//
// @brief  Records a single committed state change: what row, which action,
//         the value before and after, who did it and when.
//
// @details
// Entries are append-only. Once an IAuditStore accepts an entry nothing in
// the ledger updates or deletes it.
//
// batch_id duplicates the batch reference that is also present in metadata,
// so the per-batch trail can be served from an index without parsing JSON.
//
// metadata is a JSON object holding the numeric context of the decision, for
// example {recorded_quantity, allocated, other_delta, quantity_delta,
// new_available} for an approval. It is captured at decision time and never
// recomputed.
// -----------------------------------------------------------------------------
struct AuditLogEntry {
  AuditEntryId id{0};
  BatchId batch_id{0};
  std::string subject_table;
  std::uint64_t subject_id{0};
  std::string action;
  std::string old_value;
  std::string new_value;
  std::string actor_id;
  std::int64_t timestamp_ms{0};
  nlohmann::json metadata = nlohmann::json::object();
};

}  // namespace domain
}  // namespace ledger
