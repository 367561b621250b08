#include "ledger/audit/in_memory_audit_store.hpp"

#include "ledger/domain/ledger_error.hpp"

#include <algorithm>
#include <mutex>
#include <string>

namespace ledger {

namespace {

// True if a sorts before b in newest-first order.
bool newerThan(const domain::AuditLogEntry& a, const domain::AuditLogEntry& b) {
  if (a.timestamp_ms != b.timestamp_ms) {
    return a.timestamp_ms > b.timestamp_ms;
  }
  return a.id > b.id;
}

// True if the entry lies strictly after the cursor in newest-first order.
bool olderThanCursor(const domain::AuditLogEntry& e, const AuditCursor& c) {
  if (e.timestamp_ms != c.timestamp_ms) {
    return e.timestamp_ms < c.timestamp_ms;
  }
  return e.id < c.id;
}

// Throws if an entry reuses a stored id or repeats an id within the batch.
void rejectDuplicateIds(const std::unordered_set<domain::AuditEntryId>& stored,
                        const std::vector<domain::AuditLogEntry>& entries) {
  std::unordered_set<domain::AuditEntryId> seen;
  for (const auto& e : entries) {
    if (stored.count(e.id) != 0 || !seen.insert(e.id).second) {
      throw StorageError("duplicate audit entry id " + std::to_string(e.id));
    }
  }
}

}  // namespace

// -----------------------------------------------------------------------------
// append: validate the whole batch, then insert it under one lock
// -----------------------------------------------------------------------------
void InMemoryAuditStore::append(
    const std::vector<domain::AuditLogEntry>& entries) {
  std::unique_lock lock(mutex_);

  rejectDuplicateIds(ids_, entries);

  for (const auto& e : entries) {
    insertLocked(e);
  }
}

void InMemoryAuditStore::checkAppendable(
    const std::vector<domain::AuditLogEntry>& entries) const {
  std::shared_lock lock(mutex_);
  rejectDuplicateIds(ids_, entries);
}

void InMemoryAuditStore::insertUnchecked(
    const std::vector<domain::AuditLogEntry>& entries) {
  std::unique_lock lock(mutex_);
  for (const auto& e : entries) {
    insertLocked(e);
  }
}

void InMemoryAuditStore::insertLocked(const domain::AuditLogEntry& entry) {
  std::size_t index = entries_.size();
  entries_.push_back(entry);
  ids_.insert(entry.id);
  by_batch_[entry.batch_id].push_back(index);
  by_subject_[{entry.subject_table, entry.subject_id}].push_back(index);
  max_id_ = std::max(max_id_, entry.id);
}

// -----------------------------------------------------------------------------
// pageByBatch: newest first, restartable by (timestamp, id) cursor
// -----------------------------------------------------------------------------
AuditPage InMemoryAuditStore::pageByBatch(domain::BatchId batch_id,
                                          std::optional<AuditCursor> after,
                                          std::size_t limit) const {
  std::vector<domain::AuditLogEntry> candidates;
  {
    std::shared_lock lock(mutex_);
    auto it = by_batch_.find(batch_id);
    if (it != by_batch_.end()) {
      for (std::size_t index : it->second) {
        const auto& e = entries_[index];
        if (!after || olderThanCursor(e, *after)) {
          candidates.push_back(e);
        }
      }
    }
  }

  std::sort(candidates.begin(), candidates.end(), newerThan);

  AuditPage page;
  if (limit == 0) {
    limit = 1;
  }
  if (candidates.size() > limit) {
    candidates.resize(limit);
    const auto& last = candidates.back();
    page.next = AuditCursor{last.timestamp_ms, last.id};
  }
  page.entries = std::move(candidates);
  return page;
}

std::vector<domain::AuditLogEntry> InMemoryAuditStore::bySubject(
    const std::string& subject_table, std::uint64_t subject_id) const {
  std::vector<domain::AuditLogEntry> result;
  std::shared_lock lock(mutex_);
  auto it = by_subject_.find({subject_table, subject_id});
  if (it == by_subject_.end()) {
    return result;
  }
  result.reserve(it->second.size());
  for (std::size_t index : it->second) {
    result.push_back(entries_[index]);
  }
  return result;
}

domain::AuditEntryId InMemoryAuditStore::maxId() const {
  std::shared_lock lock(mutex_);
  return max_id_;
}

std::size_t InMemoryAuditStore::size() const {
  std::shared_lock lock(mutex_);
  return entries_.size();
}

}  // namespace ledger
