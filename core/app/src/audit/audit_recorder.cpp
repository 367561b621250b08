#include "ledger/audit/audit_recorder.hpp"

#include <utility>

namespace ledger {

AuditRecorder::AuditRecorder(IAuditStore& store, IdGenerator& ids,
                             const ITimeProvider& clock)
    : store_(store), ids_(ids), clock_(clock) {}

domain::AuditLogEntry AuditRecorder::build(domain::BatchId batch_id,
                                           const std::string& subject_table,
                                           std::uint64_t subject_id,
                                           const std::string& action,
                                           const std::string& old_value,
                                           const std::string& new_value,
                                           const std::string& actor_id,
                                           nlohmann::json metadata) {
  domain::AuditLogEntry entry;
  entry.id = ids_.next_id();
  entry.batch_id = batch_id;
  entry.subject_table = subject_table;
  entry.subject_id = subject_id;
  entry.action = action;
  entry.old_value = old_value;
  entry.new_value = new_value;
  entry.actor_id = actor_id;
  entry.timestamp_ms = clock_.now_ms();
  entry.metadata = std::move(metadata);
  // batch_id is also kept in metadata so an exported entry is self-describing.
  entry.metadata["batch_id"] = batch_id;
  return entry;
}

domain::AuditLogEntry AuditRecorder::record(UnitOfWork& uow,
                                            domain::BatchId batch_id,
                                            const std::string& subject_table,
                                            std::uint64_t subject_id,
                                            const std::string& action,
                                            const std::string& old_value,
                                            const std::string& new_value,
                                            const std::string& actor_id,
                                            nlohmann::json metadata) {
  domain::AuditLogEntry entry =
      build(batch_id, subject_table, subject_id, action, old_value, new_value,
            actor_id, std::move(metadata));
  uow.stageAudit(entry);
  return entry;
}

AuditPage AuditRecorder::trail(domain::BatchId batch_id,
                               std::optional<AuditCursor> after,
                               std::size_t limit) const {
  return store_.pageByBatch(batch_id, after, limit == 0 ? 1 : limit);
}

std::vector<domain::AuditLogEntry> AuditRecorder::fullTrail(
    domain::BatchId batch_id, std::size_t page_size) const {
  std::vector<domain::AuditLogEntry> all;
  std::optional<AuditCursor> cursor;
  do {
    AuditPage page = trail(batch_id, cursor, page_size);
    all.insert(all.end(), page.entries.begin(), page.entries.end());
    cursor = page.next;
  } while (cursor);
  return all;
}

std::vector<domain::AuditLogEntry> AuditRecorder::forSubject(
    const std::string& subject_table, std::uint64_t subject_id) const {
  return store_.bySubject(subject_table, subject_id);
}

}  // namespace ledger
