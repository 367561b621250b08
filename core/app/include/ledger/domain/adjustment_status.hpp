#pragma once

#include <optional>
#include <string_view>

namespace ledger {
namespace domain {

// -----------------------------------------------------------------------------
// AdjustmentStatus: approval workflow state of an Adjustment
// -----------------------------------------------------------------------------
//
// @brief  Closed set of states an adjustment can occupy.
//
// @details
// Legal transitions (enforced by AdjustmentLedger::transitionAllowed):
//
//   Pending ──────> Approved ───> Completed
//      │                              ▲
//      ├──────────────────────────────┘
//      └──> Rejected
//
// Terminal states: Completed, Rejected. A terminal adjustment is never
// modified again.
//
// Only Approved and Completed contribute their delta to available quantity.
// Pending and Rejected count as zero.
// -----------------------------------------------------------------------------
enum class AdjustmentStatus {
  Pending,    // Requested, awaiting an approver
  Approved,   // Accepted; delta counts toward availability
  Completed,  // Accepted and physically actioned; terminal
  Rejected,   // Declined by an approver; terminal
};

// Whether an adjustment in this status feeds the availability sum.
inline bool countsTowardAvailability(AdjustmentStatus status) {
  switch (status) {
    case AdjustmentStatus::Approved:
    case AdjustmentStatus::Completed:
      return true;
    case AdjustmentStatus::Pending:
    case AdjustmentStatus::Rejected:
      return false;
  }
  return false;
}

inline bool isTerminal(AdjustmentStatus status) {
  switch (status) {
    case AdjustmentStatus::Completed:
    case AdjustmentStatus::Rejected:
      return true;
    case AdjustmentStatus::Pending:
    case AdjustmentStatus::Approved:
      return false;
  }
  return false;
}

inline const char* adjustmentStatusToString(AdjustmentStatus status) {
  switch (status) {
    case AdjustmentStatus::Pending:   return "PENDING";
    case AdjustmentStatus::Approved:  return "APPROVED";
    case AdjustmentStatus::Completed: return "COMPLETED";
    case AdjustmentStatus::Rejected:  return "REJECTED";
  }
  return "UNKNOWN";
}

inline std::optional<AdjustmentStatus> parseAdjustmentStatus(
    std::string_view text) {
  if (text == "PENDING") return AdjustmentStatus::Pending;
  if (text == "APPROVED") return AdjustmentStatus::Approved;
  if (text == "COMPLETED") return AdjustmentStatus::Completed;
  if (text == "REJECTED") return AdjustmentStatus::Rejected;
  return std::nullopt;
}

}  // namespace domain
}  // namespace ledger
