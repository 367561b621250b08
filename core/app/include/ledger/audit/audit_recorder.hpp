#pragma once

#include "ledger/audit/i_audit_store.hpp"
#include "ledger/concurrent/id_generator.hpp"
#include "ledger/domain/audit_log_entry.hpp"
#include "ledger/time/i_time_provider.hpp"
#include "ledger/transaction/unit_of_work.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace ledger {

// -----------------------------------------------------------------------------
// AuditRecorder
// -----------------------------------------------------------------------------
//
// @brief  Builds audit entries and serves the trail.
//
// @details
// record() does not write to storage. It stamps the entry with a fresh id and
// the current time and stages it in the caller's UnitOfWork. The entry reaches
// the IAuditStore only when TransactionCoordinator commits that unit of work,
// in the same step as the row change it describes. If the decision is
// rejected, or the store fails, the entry is discarded with the rest of the
// unit.
//
// The recorder offers no update or delete.
//
// Thread model:
//   Safe from any thread. Relies on the thread safety of IdGenerator,
//   ITimeProvider and IAuditStore.
//
// Ownership:
//   Owned by LedgerEngine. Holds references to the store, the id generator
//   and the clock, all of which outlive it.
// -----------------------------------------------------------------------------
class AuditRecorder {
 public:
  AuditRecorder(IAuditStore& store, IdGenerator& ids,
                const ITimeProvider& clock);

  AuditRecorder(const AuditRecorder&) = delete;
  AuditRecorder& operator=(const AuditRecorder&) = delete;

  // Stages one entry in `uow` and returns a copy of it.
  domain::AuditLogEntry record(UnitOfWork& uow, domain::BatchId batch_id,
                               const std::string& subject_table,
                               std::uint64_t subject_id,
                               const std::string& action,
                               const std::string& old_value,
                               const std::string& new_value,
                               const std::string& actor_id,
                               nlohmann::json metadata =
                                   nlohmann::json::object());

  // Builds an entry without staging it (batch creation commits its entry
  // outside a unit of work).
  domain::AuditLogEntry build(domain::BatchId batch_id,
                              const std::string& subject_table,
                              std::uint64_t subject_id,
                              const std::string& action,
                              const std::string& old_value,
                              const std::string& new_value,
                              const std::string& actor_id,
                              nlohmann::json metadata =
                                  nlohmann::json::object());

  // Newest-first page of a batch's trail. A limit of 0 is treated as 1.
  AuditPage trail(domain::BatchId batch_id, std::optional<AuditCursor> after,
                  std::size_t limit) const;

  // Every entry of a batch, newest first, following cursors to the end.
  std::vector<domain::AuditLogEntry> fullTrail(domain::BatchId batch_id,
                                               std::size_t page_size) const;

  std::vector<domain::AuditLogEntry> forSubject(
      const std::string& subject_table, std::uint64_t subject_id) const;

 private:
  IAuditStore& store_;
  IdGenerator& ids_;
  const ITimeProvider& clock_;
};

}  // namespace ledger
