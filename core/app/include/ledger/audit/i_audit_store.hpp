#pragma once

#include "ledger/domain/audit_log_entry.hpp"
#include "ledger/domain/ids.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace ledger {

// -----------------------------------------------------------------------------
// AuditCursor / AuditPage
// -----------------------------------------------------------------------------
// The per-batch trail is served newest first, ordered by (timestamp_ms, id)
// descending. A cursor names the last entry of the previous page; the next
// page starts strictly after it in that order. Because ids are unique the
// cursor is unambiguous even when several entries share a timestamp.
// -----------------------------------------------------------------------------
struct AuditCursor {
  std::int64_t timestamp_ms{0};
  domain::AuditEntryId id{0};
};

struct AuditPage {
  std::vector<domain::AuditLogEntry> entries;
  std::optional<AuditCursor> next;  // Empty when this is the last page
};

// -----------------------------------------------------------------------------
// IAuditStore: append-only persistence for the compliance trail
// -----------------------------------------------------------------------------
//
// @brief  Storage contract used by TransactionCoordinator at commit time and
//         by AuditRecorder to serve the trail.
//
// @details
// append() is all-or-nothing: either every entry of the batch becomes
// visible, or none does and StorageError is thrown. The coordinator calls it
// before applying any row write, so a failed append leaves the ledger
// unchanged.
//
// The interface has no update or delete.
//
// Thread model:
//   Implementations must be safe for concurrent append() and reads from
//   any thread. Appends for different batches may run in parallel.
// -----------------------------------------------------------------------------
class IAuditStore {
 public:
  virtual ~IAuditStore() = default;

  // Throws StorageError on failure; nothing is stored in that case.
  virtual void append(const std::vector<domain::AuditLogEntry>& entries) = 0;

  virtual AuditPage pageByBatch(domain::BatchId batch_id,
                                std::optional<AuditCursor> after,
                                std::size_t limit) const = 0;

  // Entries for one subject row, oldest first.
  virtual std::vector<domain::AuditLogEntry> bySubject(
      const std::string& subject_table, std::uint64_t subject_id) const = 0;

  // Largest id stored so far (0 when empty). Used to seed the id generator.
  virtual domain::AuditEntryId maxId() const = 0;

  virtual std::size_t size() const = 0;
};

}  // namespace ledger
