#pragma once

#include "ledger/audit/in_memory_audit_store.hpp"

#include <fstream>
#include <mutex>
#include <string>

namespace ledger {

// -----------------------------------------------------------------------------
// JournalAuditStore: audit trail persisted as JSON lines
// -----------------------------------------------------------------------------
//
// @brief  Appends each entry as one JSON object per line to a file opened in
//         append mode, and keeps the in-memory indexes for reads.
//
// @details
// Construction reloads every well-formed line already in the file, so the
// trail survives restarts. A trailing line that fails to parse (torn write
// from a crash) is logged and truncated from the file, so later appends
// start on a fresh line; any other malformed line aborts construction with
// StorageError.
//
// append() serialises the whole batch into one buffer, writes it with a
// single write call and flushes. Only when the stream reports success are
// the entries added to the in-memory indexes. A failed write throws
// StorageError and the entries are not visible.
//
// Thread model:
//   file_mutex_ serialises writers so lines never interleave. Reads go to
//   the in-memory indexes and do not touch the file.
// -----------------------------------------------------------------------------
class JournalAuditStore final : public InMemoryAuditStore {
 public:
  // Throws StorageError if the file cannot be opened or is corrupt.
  explicit JournalAuditStore(std::string path);

  void append(const std::vector<domain::AuditLogEntry>& entries) override;

  const std::string& path() const { return path_; }

 private:
  // Loads the file into the indexes. True if the last line needs a '\n'.
  bool reload();

  std::string path_;
  std::mutex file_mutex_;
  std::ofstream out_;
};

}  // namespace ledger
