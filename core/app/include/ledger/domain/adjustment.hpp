#pragma once

#include "ledger/domain/adjustment_status.hpp"
#include "ledger/domain/adjustment_type.hpp"
#include "ledger/domain/ids.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace ledger {
namespace domain {

// -----------------------------------------------------------------------------
// Adjustment: a signed quantity correction against one batch
// -----------------------------------------------------------------------------
//
// @brief  Row of the AdjustmentLedger: who asked for which delta, why, and
//         where it sits in the approval workflow.
//
// @details
// quantity_delta is negative for losses (theft, damage, expiry) and positive
// for gains (found stock, customer returns). Its sign has already been
// normalised against adjustment_type by the time the row is stored.
//
// quantity_before snapshots the batch's recorded_quantity at request time.
// Since recorded_quantity is immutable this always equals the current value;
// it is kept on the row so exported adjustments are self-describing.
//
// total_cost = unit_cost * |quantity_delta|, priced at the batch's landed
// unit cost when the adjustment was requested.
//
// Ownership:
//   AdjustmentLedger owns the authoritative rows. Updates happen only by
//   replacing the whole row inside a committed UnitOfWork.
// -----------------------------------------------------------------------------
struct Adjustment {
  AdjustmentId id{0};
  BatchId stock_batch_id{0};
  Quantity quantity_delta{0};
  AdjustmentType adjustment_type{AdjustmentType::Other};
  AdjustmentStatus status{AdjustmentStatus::Pending};
  std::string reason;
  std::optional<std::string> reference_number;  // e.g. police report, RMA
  std::string requested_by;
  std::optional<std::string> approved_by;  // Set on Approved/Completed/Rejected
  Quantity quantity_before{0};
  MinorUnits unit_cost{0};
  MinorUnits total_cost{0};
  std::int64_t requested_at_ms{0};
  std::optional<std::int64_t> decided_at_ms;
  std::optional<std::int64_t> completed_at_ms;

  bool isDecrease() const { return quantity_delta < 0; }
  bool isIncrease() const { return quantity_delta > 0; }
};

}  // namespace domain
}  // namespace ledger
