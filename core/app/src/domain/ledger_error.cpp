#include "ledger/domain/ledger_error.hpp"

#include <sstream>

namespace ledger {

const char* errorKindToString(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::InsufficientStock:    return "InsufficientStock";
    case ErrorKind::NegativeAvailability: return "NegativeAvailability";
    case ErrorKind::BelowAllocatedFloor:  return "BelowAllocatedFloor";
    case ErrorKind::WouldGoNegative:      return "WouldGoNegative";
    case ErrorKind::InvalidTransition:    return "InvalidTransition";
    case ErrorKind::Contention:           return "Contention";
    case ErrorKind::NotFound:             return "NotFound";
    case ErrorKind::InvalidArgument:      return "InvalidArgument";
    case ErrorKind::StorageUnavailable:   return "StorageUnavailable";
  }
  return "Unknown";
}

// -----------------------------------------------------------------------------
// Business-rule factories
// -----------------------------------------------------------------------------
LedgerError LedgerError::insufficientStock(domain::Quantity recorded,
                                           domain::Quantity approved_delta,
                                           domain::Quantity available,
                                           domain::Quantity already_allocated,
                                           domain::Quantity remaining,
                                           domain::Quantity requested) {
  std::ostringstream msg;
  msg << "Insufficient stock: recorded=" << recorded
      << " approved_delta=" << approved_delta << " available=" << available
      << " already_allocated=" << already_allocated
      << " remaining=" << remaining << " requested=" << requested;

  LedgerError e;
  e.kind = ErrorKind::InsufficientStock;
  e.message = msg.str();
  e.diagnostics.recorded_quantity = recorded;
  e.diagnostics.approved_delta = approved_delta;
  e.diagnostics.available = available;
  e.diagnostics.allocated = already_allocated;
  e.diagnostics.remaining = remaining;
  e.diagnostics.requested_quantity = requested;
  return e;
}

LedgerError LedgerError::negativeAvailability(domain::Quantity recorded,
                                              domain::Quantity approved_delta,
                                              domain::Quantity available) {
  std::ostringstream msg;
  msg << "Available quantity is negative: recorded=" << recorded
      << " approved_delta=" << approved_delta << " available=" << available
      << ". Review approved adjustments for this batch.";

  LedgerError e;
  e.kind = ErrorKind::NegativeAvailability;
  e.message = msg.str();
  e.diagnostics.recorded_quantity = recorded;
  e.diagnostics.approved_delta = approved_delta;
  e.diagnostics.available = available;
  return e;
}

LedgerError LedgerError::belowAllocatedFloor(domain::Quantity recorded,
                                             domain::Quantity allocated,
                                             domain::Quantity other_delta,
                                             domain::Quantity quantity_delta,
                                             domain::Quantity new_available) {
  std::ostringstream msg;
  msg << "Adjustment would reduce stock below allocated quantity: recorded="
      << recorded << " allocated=" << allocated
      << " other_delta=" << other_delta << " quantity_delta=" << quantity_delta
      << " new_available=" << new_available;

  LedgerError e;
  e.kind = ErrorKind::BelowAllocatedFloor;
  e.message = msg.str();
  e.diagnostics.recorded_quantity = recorded;
  e.diagnostics.allocated = allocated;
  e.diagnostics.other_delta = other_delta;
  e.diagnostics.quantity_delta = quantity_delta;
  e.diagnostics.new_available = new_available;
  return e;
}

LedgerError LedgerError::wouldGoNegative(domain::Quantity recorded,
                                         domain::Quantity other_delta,
                                         domain::Quantity quantity_delta,
                                         domain::Quantity new_available) {
  std::ostringstream msg;
  msg << "Adjustment would make available quantity negative: recorded="
      << recorded << " other_delta=" << other_delta
      << " quantity_delta=" << quantity_delta
      << " new_available=" << new_available;

  LedgerError e;
  e.kind = ErrorKind::WouldGoNegative;
  e.message = msg.str();
  e.diagnostics.recorded_quantity = recorded;
  e.diagnostics.other_delta = other_delta;
  e.diagnostics.quantity_delta = quantity_delta;
  e.diagnostics.new_available = new_available;
  return e;
}

// -----------------------------------------------------------------------------
// Non-quantity factories
// -----------------------------------------------------------------------------
LedgerError LedgerError::invalidTransition(const std::string& detail) {
  LedgerError e;
  e.kind = ErrorKind::InvalidTransition;
  e.message = "Invalid status transition: " + detail;
  return e;
}

LedgerError LedgerError::contention(domain::BatchId batch_id) {
  LedgerError e;
  e.kind = ErrorKind::Contention;
  e.message = "Timed out waiting for lock on batch " +
              std::to_string(batch_id) + "; retry the operation";
  return e;
}

LedgerError LedgerError::notFound(const std::string& what, std::uint64_t id) {
  LedgerError e;
  e.kind = ErrorKind::NotFound;
  e.message = what + " " + std::to_string(id) + " not found";
  return e;
}

LedgerError LedgerError::invalidArgument(const std::string& detail) {
  LedgerError e;
  e.kind = ErrorKind::InvalidArgument;
  e.message = detail;
  return e;
}

LedgerError LedgerError::storageUnavailable(const std::string& detail) {
  LedgerError e;
  e.kind = ErrorKind::StorageUnavailable;
  e.message = "Audit storage unavailable: " + detail;
  return e;
}

}  // namespace ledger
