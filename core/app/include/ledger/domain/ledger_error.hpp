#pragma once

#include "ledger/domain/ids.hpp"

#include <optional>
#include <stdexcept>
#include <string>

namespace ledger {

// -----------------------------------------------------------------------------
// ErrorKind: why a ledger operation did not commit
// -----------------------------------------------------------------------------
// Business-rule kinds describe a decision the validator made against a
// consistent snapshot. Contention means no decision was made at all and the
// caller may simply re-issue the operation. StorageUnavailable is the only
// infrastructure kind; it is never produced by a business rule.
// -----------------------------------------------------------------------------
enum class ErrorKind {
  InsufficientStock,     // Allocation exceeds what remains of the batch
  NegativeAvailability,  // Recorded losses already exceed the receipt
  BelowAllocatedFloor,   // Approving the loss would strand storefront stock
  WouldGoNegative,       // Approving the loss would drive availability < 0
  InvalidTransition,     // Status machine forbids the requested change
  Contention,            // Batch lock not acquired in time; retryable
  NotFound,              // Unknown batch / adjustment / allocation id
  InvalidArgument,       // Malformed request (zero delta, negative qty, ...)
  StorageUnavailable,    // Audit store failed; nothing was committed
};

const char* errorKindToString(ErrorKind kind);

// -----------------------------------------------------------------------------
// QuantityDiagnostics: the numbers behind a rejection
// -----------------------------------------------------------------------------
// Only the fields relevant to the failed check are set. Callers can build an
// actionable message ("only 40 of the requested 50 remain") without querying
// the ledger again.
// -----------------------------------------------------------------------------
struct QuantityDiagnostics {
  std::optional<domain::Quantity> recorded_quantity;
  std::optional<domain::Quantity> approved_delta;
  std::optional<domain::Quantity> available;
  std::optional<domain::Quantity> allocated;
  std::optional<domain::Quantity> remaining;
  std::optional<domain::Quantity> requested_quantity;
  std::optional<domain::Quantity> other_delta;
  std::optional<domain::Quantity> quantity_delta;
  std::optional<domain::Quantity> new_available;
};

// -----------------------------------------------------------------------------
// LedgerError
// -----------------------------------------------------------------------------
//
// @brief  Typed failure returned by every mutating ledger operation.
//
// @details
// Constructed through the named factories below so the message and the
// diagnostics always agree. LedgerError is a plain value; it travels inside
// Result<T> and is serialised verbatim onto the IPC command socket.
// -----------------------------------------------------------------------------
struct LedgerError {
  ErrorKind kind{ErrorKind::InvalidArgument};
  std::string message;
  QuantityDiagnostics diagnostics;

  // Only lock contention may be retried unchanged.
  bool retryable() const { return kind == ErrorKind::Contention; }

  bool isInfrastructure() const {
    return kind == ErrorKind::StorageUnavailable;
  }

  static LedgerError insufficientStock(domain::Quantity recorded,
                                       domain::Quantity approved_delta,
                                       domain::Quantity available,
                                       domain::Quantity already_allocated,
                                       domain::Quantity remaining,
                                       domain::Quantity requested);

  static LedgerError negativeAvailability(domain::Quantity recorded,
                                          domain::Quantity approved_delta,
                                          domain::Quantity available);

  static LedgerError belowAllocatedFloor(domain::Quantity recorded,
                                         domain::Quantity allocated,
                                         domain::Quantity other_delta,
                                         domain::Quantity quantity_delta,
                                         domain::Quantity new_available);

  static LedgerError wouldGoNegative(domain::Quantity recorded,
                                     domain::Quantity other_delta,
                                     domain::Quantity quantity_delta,
                                     domain::Quantity new_available);

  static LedgerError invalidTransition(const std::string& detail);
  static LedgerError contention(domain::BatchId batch_id);
  static LedgerError notFound(const std::string& what, std::uint64_t id);
  static LedgerError invalidArgument(const std::string& detail);
  static LedgerError storageUnavailable(const std::string& detail);
};

// -----------------------------------------------------------------------------
// StorageError: thrown by audit store implementations
// -----------------------------------------------------------------------------
// Stores signal infrastructure failure by throwing. TransactionCoordinator
// catches it at the commit boundary, discards the staged writes, and turns it
// into ErrorKind::StorageUnavailable. It never escapes a public operation.
// -----------------------------------------------------------------------------
class StorageError : public std::runtime_error {
 public:
  explicit StorageError(const std::string& message)
      : std::runtime_error(message) {}
};

}  // namespace ledger
