#pragma once

#include <nlohmann/json.hpp>

#include <functional>
#include <string>
#include <unordered_map>

namespace ledger {

class LedgerEngine;

// -----------------------------------------------------------------------------
// CommandDispatcher: JSON command surface of the ledger
// -----------------------------------------------------------------------------
//
// @brief  Turns one JSON request into one LedgerEngine call and its result
//         back into one JSON reply.
//
// @details
// Request:  {"command": "<name>", ...arguments}
// Reply:    {"status": "ok", ...payload}
//           {"status": "error", "error": {"kind", "message", "retryable",
//                                         "diagnostics"}}
//
// Commands:
//   ping, status,
//   create_batch, get_batch,
//   request_adjustment, approve_adjustment, approve_adjustments,
//   reject_adjustment, complete_adjustment, get_adjustment,
//   list_adjustments, list_pending_adjustments,
//   request_allocation, update_allocation, release_allocation,
//   get_allocation, list_allocations,
//   get_available_quantity, get_availability,
//   get_audit_trail, get_subject_audit_trail,
//   check_integrity
//
// A request that is not JSON, lacks "command", names an unknown command or
// carries a missing / mistyped argument gets an InvalidArgument error reply.
// dispatch() never throws.
//
// Thread model:
//   Stateless apart from the immutable handler table. Safe from any thread
//   as far as LedgerEngine is.
// -----------------------------------------------------------------------------
class CommandDispatcher {
 public:
  explicit CommandDispatcher(LedgerEngine& engine);

  CommandDispatcher(const CommandDispatcher&) = delete;
  CommandDispatcher& operator=(const CommandDispatcher&) = delete;

  std::string dispatch(const std::string& request_text) const;

 private:
  using Handler = std::function<nlohmann::json(const nlohmann::json&)>;

  void registerHandlers();

  LedgerEngine& engine_;
  std::unordered_map<std::string, Handler> handlers_;
};

}  // namespace ledger
