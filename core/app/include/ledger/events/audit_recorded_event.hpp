#pragma once

#include "ledger/domain/audit_log_entry.hpp"

#include <cstdint>

namespace ledger {

// Published once per audit entry after the store has accepted it.
struct AuditRecordedEvent {
  domain::AuditLogEntry entry;
  std::uint64_t sequence_id{0};
};

}  // namespace ledger
