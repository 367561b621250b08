#pragma once

#include <chrono>
#include <cstddef>
#include <string>

namespace ledger {

// -----------------------------------------------------------------------------
// LedgerConfig: runtime settings for the engine and the stock_ledger binary
// -----------------------------------------------------------------------------
//
// @brief  Plain value struct. Every field has a working default, so a
//         default-constructed LedgerConfig runs the engine in-process with
//         the IPC server on its usual ports.
//
// @details
// An empty command_endpoint or telemetry_endpoint disables the IPC server.
// Tests rely on this to run without sockets.
//
// audit_journal_path empty -> InMemoryAuditStore; otherwise
// JournalAuditStore appending to that file.
//
// snapshot_path, when set, names a JSON document of pre-existing batches,
// adjustments and allocations that the binary hydrates at start-up.
// -----------------------------------------------------------------------------
struct LedgerConfig {
  std::chrono::milliseconds lock_timeout{250};

  std::string command_endpoint{"tcp://127.0.0.1:5556"};
  std::string telemetry_endpoint{"tcp://127.0.0.1:5557"};

  std::string audit_journal_path;
  std::string snapshot_path;

  std::size_t default_page_size{50};
  std::size_t max_page_size{500};

  bool ipcEnabled() const {
    return !command_endpoint.empty() && !telemetry_endpoint.empty();
  }
};

// -------------------------------------------------------------------------
// loadConfig(path)
// -------------------------------------------------------------------------
// @brief  Reads a JSON object from `path` on top of the defaults.
//
// @details
// Recognised keys: lock_timeout_ms, command_endpoint, telemetry_endpoint,
// audit_journal_path, snapshot_path, default_page_size, max_page_size.
// Unknown keys are ignored; missing keys keep their defaults.
//
// @throws std::runtime_error if the file cannot be read, is not a JSON
//         object, has a value of the wrong type, or sets an invalid value
//         (non-positive timeout, zero page size, default > max).
// -------------------------------------------------------------------------
LedgerConfig loadConfig(const std::string& path);

// Same rules as loadConfig, applied to an in-memory JSON text.
LedgerConfig parseConfig(const std::string& json_text);

}  // namespace ledger
