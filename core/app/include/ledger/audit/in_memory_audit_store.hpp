#pragma once

#include "ledger/audit/i_audit_store.hpp"

#include <map>
#include <shared_mutex>
#include <unordered_map>
#include <unordered_set>
#include <utility>

namespace ledger {

// -----------------------------------------------------------------------------
// InMemoryAuditStore
// -----------------------------------------------------------------------------
//
// @brief  Process-local IAuditStore. Default store, and the index layer
//         JournalAuditStore builds on.
//
// @details
// Entries live in one vector in arrival order. Two secondary indexes point
// into it: by batch (for paging) and by (subject_table, subject_id).
//
// append() rejects the whole batch with StorageError if any entry reuses an
// id that is already stored or appears twice in the batch. The check runs
// before anything is inserted.
//
// Thread model: shared_mutex; appends are exclusive, reads shared.
// -----------------------------------------------------------------------------
class InMemoryAuditStore : public IAuditStore {
 public:
  InMemoryAuditStore() = default;

  InMemoryAuditStore(const InMemoryAuditStore&) = delete;
  InMemoryAuditStore& operator=(const InMemoryAuditStore&) = delete;
  InMemoryAuditStore(InMemoryAuditStore&&) = delete;
  InMemoryAuditStore& operator=(InMemoryAuditStore&&) = delete;

  void append(const std::vector<domain::AuditLogEntry>& entries) override;

  AuditPage pageByBatch(domain::BatchId batch_id,
                        std::optional<AuditCursor> after,
                        std::size_t limit) const override;

  std::vector<domain::AuditLogEntry> bySubject(
      const std::string& subject_table,
      std::uint64_t subject_id) const override;

  domain::AuditEntryId maxId() const override;

  std::size_t size() const override;

 protected:
  // Duplicate-id check; throws StorageError. Caller holds no lock.
  void checkAppendable(const std::vector<domain::AuditLogEntry>& entries) const;

  // Inserts without the duplicate check. Used when reloading a journal.
  void insertUnchecked(const std::vector<domain::AuditLogEntry>& entries);

 private:
  void insertLocked(const domain::AuditLogEntry& entry);

  mutable std::shared_mutex mutex_;
  std::vector<domain::AuditLogEntry> entries_;
  std::unordered_set<domain::AuditEntryId> ids_;
  std::unordered_map<domain::BatchId, std::vector<std::size_t>> by_batch_;
  std::map<std::pair<std::string, std::uint64_t>, std::vector<std::size_t>>
      by_subject_;
  domain::AuditEntryId max_id_{0};
};

}  // namespace ledger
