#pragma once

#include "ledger/audit/i_audit_store.hpp"
#include "ledger/domain/adjustment.hpp"
#include "ledger/domain/allocation.hpp"
#include "ledger/domain/audit_log_entry.hpp"
#include "ledger/domain/ledger_error.hpp"
#include "ledger/domain/stock_batch.hpp"
#include "ledger/validation/availability_validator.hpp"

#include <nlohmann/json.hpp>

namespace ledger {

// -----------------------------------------------------------------------------
// JSON codec for ledger types
// -----------------------------------------------------------------------------
// nlohmann::json ADL hooks. The same representation is used on the IPC
// command socket, in telemetry, in the audit journal and in hydration
// snapshots, so a row read back from any of them is the row that was written.
//
// Enums are encoded as their upper-case names ("PENDING", "WRITE_OFF").
// Optional fields are omitted when empty and accepted as missing or null.
//
// from_json throws nlohmann::json::exception for missing keys or wrong types
// and std::invalid_argument for an unknown enum name.
// -----------------------------------------------------------------------------

namespace domain {

void to_json(nlohmann::json& j, const CostFields& c);
void from_json(const nlohmann::json& j, CostFields& c);

void to_json(nlohmann::json& j, const StockBatch& b);
void from_json(const nlohmann::json& j, StockBatch& b);

void to_json(nlohmann::json& j, const Adjustment& a);
void from_json(const nlohmann::json& j, Adjustment& a);

void to_json(nlohmann::json& j, const Allocation& a);
void from_json(const nlohmann::json& j, Allocation& a);

void to_json(nlohmann::json& j, const AuditLogEntry& e);
void from_json(const nlohmann::json& j, AuditLogEntry& e);

AdjustmentType adjustmentTypeFromJson(const nlohmann::json& j);
AdjustmentStatus adjustmentStatusFromJson(const nlohmann::json& j);

}  // namespace domain

void to_json(nlohmann::json& j, const QuantityDiagnostics& d);
void to_json(nlohmann::json& j, const LedgerError& e);
void to_json(nlohmann::json& j, const AvailabilityBreakdown& b);
void to_json(nlohmann::json& j, const AuditCursor& c);
void from_json(const nlohmann::json& j, AuditCursor& c);
void to_json(nlohmann::json& j, const AuditPage& p);

}  // namespace ledger
