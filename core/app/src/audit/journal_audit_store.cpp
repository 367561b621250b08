#include "ledger/audit/journal_audit_store.hpp"

#include "ledger/codec/json_codec.hpp"
#include "ledger/domain/ledger_error.hpp"

#include <filesystem>
#include <iostream>
#include <iterator>
#include <system_error>
#include <utility>

namespace ledger {

// -----------------------------------------------------------------------------
// Constructor: reload the existing journal, then open for append
// -----------------------------------------------------------------------------
JournalAuditStore::JournalAuditStore(std::string path)
    : path_(std::move(path)) {
  const bool unterminated = reload();

  out_.open(path_, std::ios::out | std::ios::app);
  if (!out_.is_open()) {
    throw StorageError("cannot open audit journal for append: " + path_);
  }

  if (unterminated) {
    out_.put('\n');
    out_.flush();
    if (!out_.good()) {
      throw StorageError("cannot terminate last line of audit journal: " +
                         path_);
    }
  }

  std::cout << "[JournalAuditStore] opened " << path_ << " ("
            << size() << " entries)\n";
}

// -----------------------------------------------------------------------------
// reload: parse every line; tolerate only a torn final line
// -----------------------------------------------------------------------------
//
// A torn final line is cut off the file so the next append starts on a line
// of its own. Returns true when the last good line lacks its newline.
bool JournalAuditStore::reload() {
  std::ifstream in(path_, std::ios::binary);
  if (!in.is_open()) {
    // No journal yet; the append stream creates it.
    return false;
  }

  const std::string content((std::istreambuf_iterator<char>(in)),
                            std::istreambuf_iterator<char>());
  in.close();

  std::vector<domain::AuditLogEntry> entries;
  std::size_t good_end = 0;
  bool unterminated = false;
  std::size_t line_no = 0;

  for (std::size_t pos = 0; pos < content.size();) {
    const std::size_t eol = content.find('\n', pos);
    const bool terminated = eol != std::string::npos;
    const std::size_t next = terminated ? eol + 1 : content.size();
    const std::string line =
        content.substr(pos, (terminated ? eol : content.size()) - pos);
    ++line_no;
    pos = next;

    if (line.empty()) {
      good_end = next;
      continue;
    }

    try {
      entries.push_back(
          nlohmann::json::parse(line).get<domain::AuditLogEntry>());
    } catch (const nlohmann::json::exception& e) {
      if (content.find_first_not_of('\n', next) != std::string::npos) {
        throw StorageError("corrupt audit journal " + path_ + " at line " +
                           std::to_string(line_no) + ": " + e.what());
      }
      std::cerr << "[JournalAuditStore] WARNING: truncating torn final line "
                << line_no << " of " << path_ << ": " << e.what() << "\n";
      break;
    }
    good_end = next;
    unterminated = !terminated;
  }

  if (good_end < content.size()) {
    std::error_code ec;
    std::filesystem::resize_file(path_, good_end, ec);
    if (ec) {
      throw StorageError("cannot truncate torn tail of audit journal " +
                         path_ + ": " + ec.message());
    }
  }

  checkAppendable(entries);
  insertUnchecked(entries);
  return unterminated;
}

// -----------------------------------------------------------------------------
// append: one buffered write per commit, index only after a good flush
// -----------------------------------------------------------------------------
void JournalAuditStore::append(
    const std::vector<domain::AuditLogEntry>& entries) {
  if (entries.empty()) {
    return;
  }

  std::lock_guard lock(file_mutex_);

  checkAppendable(entries);

  std::string buffer;
  try {
    for (const auto& e : entries) {
      buffer += nlohmann::json(e).dump();
      buffer += '\n';
    }
  } catch (const nlohmann::json::exception& e) {
    throw StorageError("cannot encode audit entry for " + path_ + ": " +
                       e.what());
  }

  out_.write(buffer.data(), static_cast<std::streamsize>(buffer.size()));
  out_.flush();
  if (!out_.good()) {
    out_.clear();
    throw StorageError("write to audit journal failed: " + path_);
  }

  insertUnchecked(entries);
}

}  // namespace ledger
