#include "ledger/codec/json_codec.hpp"

#include "ledger/time/time_utils.hpp"

#include <optional>
#include <stdexcept>
#include <string>

namespace ledger {

namespace {

template <typename T>
void putOptional(nlohmann::json& j, const char* key,
                 const std::optional<T>& value) {
  if (value) {
    j[key] = *value;
  }
}

template <typename T>
std::optional<T> getOptional(const nlohmann::json& j, const char* key) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    return std::nullopt;
  }
  return it->template get<T>();
}

template <typename T>
T getOr(const nlohmann::json& j, const char* key, T fallback) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    return fallback;
  }
  return it->template get<T>();
}

}  // namespace

namespace domain {

// -----------------------------------------------------------------------------
// Enums
// -----------------------------------------------------------------------------
AdjustmentType adjustmentTypeFromJson(const nlohmann::json& j) {
  const auto text = j.get<std::string>();
  auto parsed = parseAdjustmentType(text);
  if (!parsed) {
    throw std::invalid_argument("unknown adjustment_type: " + text);
  }
  return *parsed;
}

AdjustmentStatus adjustmentStatusFromJson(const nlohmann::json& j) {
  const auto text = j.get<std::string>();
  auto parsed = parseAdjustmentStatus(text);
  if (!parsed) {
    throw std::invalid_argument("unknown adjustment status: " + text);
  }
  return *parsed;
}

// -----------------------------------------------------------------------------
// CostFields / StockBatch
// -----------------------------------------------------------------------------
void to_json(nlohmann::json& j, const CostFields& c) {
  j = nlohmann::json{{"unit_cost", c.unit_cost},
                     {"landed_unit_cost", c.landed_unit_cost}};
}

void from_json(const nlohmann::json& j, CostFields& c) {
  c.unit_cost = getOr<MinorUnits>(j, "unit_cost", 0);
  c.landed_unit_cost = getOr<MinorUnits>(j, "landed_unit_cost", c.unit_cost);
}

void to_json(nlohmann::json& j, const StockBatch& b) {
  j = nlohmann::json{{"id", b.id},
                     {"product_id", b.product_id},
                     {"warehouse_id", b.warehouse_id},
                     {"recorded_quantity", b.recorded_quantity},
                     {"cost", b.cost},
                     {"received_by", b.received_by},
                     {"received_at_ms", b.received_at_ms}};
  putOptional(j, "supplier_id", b.supplier_id);
  putOptional(j, "reference", b.reference);
}

void from_json(const nlohmann::json& j, StockBatch& b) {
  b.id = j.at("id").get<BatchId>();
  b.product_id = j.at("product_id").get<std::string>();
  b.warehouse_id = j.at("warehouse_id").get<std::string>();
  b.supplier_id = getOptional<std::string>(j, "supplier_id");
  b.recorded_quantity = j.at("recorded_quantity").get<Quantity>();
  if (auto it = j.find("cost"); it != j.end()) {
    b.cost = it->get<CostFields>();
  }
  b.reference = getOptional<std::string>(j, "reference");
  b.received_by = getOr<std::string>(j, "received_by", "");
  b.received_at_ms = getOr<std::int64_t>(j, "received_at_ms", 0);
}

// -----------------------------------------------------------------------------
// Adjustment
// -----------------------------------------------------------------------------
void to_json(nlohmann::json& j, const Adjustment& a) {
  j = nlohmann::json{{"id", a.id},
                     {"stock_batch_id", a.stock_batch_id},
                     {"quantity_delta", a.quantity_delta},
                     {"adjustment_type", adjustmentTypeToString(a.adjustment_type)},
                     {"status", adjustmentStatusToString(a.status)},
                     {"reason", a.reason},
                     {"requested_by", a.requested_by},
                     {"quantity_before", a.quantity_before},
                     {"unit_cost", a.unit_cost},
                     {"total_cost", a.total_cost},
                     {"requested_at_ms", a.requested_at_ms}};
  putOptional(j, "reference_number", a.reference_number);
  putOptional(j, "approved_by", a.approved_by);
  putOptional(j, "decided_at_ms", a.decided_at_ms);
  putOptional(j, "completed_at_ms", a.completed_at_ms);
}

void from_json(const nlohmann::json& j, Adjustment& a) {
  a.id = j.at("id").get<AdjustmentId>();
  a.stock_batch_id = j.at("stock_batch_id").get<BatchId>();
  a.quantity_delta = j.at("quantity_delta").get<Quantity>();
  a.adjustment_type = adjustmentTypeFromJson(j.at("adjustment_type"));
  a.status = adjustmentStatusFromJson(j.at("status"));
  a.reason = getOr<std::string>(j, "reason", "");
  a.reference_number = getOptional<std::string>(j, "reference_number");
  a.requested_by = getOr<std::string>(j, "requested_by", "");
  a.approved_by = getOptional<std::string>(j, "approved_by");
  a.quantity_before = getOr<Quantity>(j, "quantity_before", 0);
  a.unit_cost = getOr<MinorUnits>(j, "unit_cost", 0);
  a.total_cost = getOr<MinorUnits>(j, "total_cost", 0);
  a.requested_at_ms = getOr<std::int64_t>(j, "requested_at_ms", 0);
  a.decided_at_ms = getOptional<std::int64_t>(j, "decided_at_ms");
  a.completed_at_ms = getOptional<std::int64_t>(j, "completed_at_ms");
}

// -----------------------------------------------------------------------------
// Allocation
// -----------------------------------------------------------------------------
void to_json(nlohmann::json& j, const Allocation& a) {
  j = nlohmann::json{{"id", a.id},
                     {"stock_batch_id", a.stock_batch_id},
                     {"storefront_id", a.storefront_id},
                     {"quantity", a.quantity},
                     {"allocated_by", a.allocated_by},
                     {"updated_at_ms", a.updated_at_ms}};
}

void from_json(const nlohmann::json& j, Allocation& a) {
  a.id = j.at("id").get<AllocationId>();
  a.stock_batch_id = j.at("stock_batch_id").get<BatchId>();
  a.storefront_id = j.at("storefront_id").get<std::string>();
  a.quantity = j.at("quantity").get<Quantity>();
  a.allocated_by = getOr<std::string>(j, "allocated_by", "");
  a.updated_at_ms = getOr<std::int64_t>(j, "updated_at_ms", 0);
}

// -----------------------------------------------------------------------------
// AuditLogEntry
// -----------------------------------------------------------------------------
void to_json(nlohmann::json& j, const AuditLogEntry& e) {
  j = nlohmann::json{{"id", e.id},
                     {"batch_id", e.batch_id},
                     {"subject_table", e.subject_table},
                     {"subject_id", e.subject_id},
                     {"action", e.action},
                     {"old_value", e.old_value},
                     {"new_value", e.new_value},
                     {"actor_id", e.actor_id},
                     {"timestamp_ms", e.timestamp_ms},
                     {"timestamp", ms_to_iso8601(e.timestamp_ms)},
                     {"metadata", e.metadata}};
}

void from_json(const nlohmann::json& j, AuditLogEntry& e) {
  e.id = j.at("id").get<AuditEntryId>();
  e.batch_id = j.at("batch_id").get<BatchId>();
  e.subject_table = j.at("subject_table").get<std::string>();
  e.subject_id = j.at("subject_id").get<std::uint64_t>();
  e.action = j.at("action").get<std::string>();
  e.old_value = j.at("old_value").get<std::string>();
  e.new_value = j.at("new_value").get<std::string>();
  e.actor_id = j.at("actor_id").get<std::string>();
  e.timestamp_ms = j.at("timestamp_ms").get<std::int64_t>();
  e.metadata = j.value("metadata", nlohmann::json::object());
}

}  // namespace domain

// -----------------------------------------------------------------------------
// Errors
// -----------------------------------------------------------------------------
void to_json(nlohmann::json& j, const QuantityDiagnostics& d) {
  j = nlohmann::json::object();
  putOptional(j, "recorded_quantity", d.recorded_quantity);
  putOptional(j, "approved_delta", d.approved_delta);
  putOptional(j, "available", d.available);
  putOptional(j, "allocated", d.allocated);
  putOptional(j, "remaining", d.remaining);
  putOptional(j, "requested_quantity", d.requested_quantity);
  putOptional(j, "other_delta", d.other_delta);
  putOptional(j, "quantity_delta", d.quantity_delta);
  putOptional(j, "new_available", d.new_available);
}

void to_json(nlohmann::json& j, const LedgerError& e) {
  j = nlohmann::json{{"kind", errorKindToString(e.kind)},
                     {"message", e.message},
                     {"retryable", e.retryable()},
                     {"diagnostics", e.diagnostics}};
}

// -----------------------------------------------------------------------------
// Query results
// -----------------------------------------------------------------------------
void to_json(nlohmann::json& j, const AvailabilityBreakdown& b) {
  j = nlohmann::json{{"recorded_quantity", b.recorded},
                     {"approved_delta", b.approved_delta},
                     {"available", b.available},
                     {"allocated", b.allocated},
                     {"remaining", b.remaining}};
}

void to_json(nlohmann::json& j, const AuditCursor& c) {
  j = nlohmann::json{{"timestamp_ms", c.timestamp_ms}, {"id", c.id}};
}

void from_json(const nlohmann::json& j, AuditCursor& c) {
  c.timestamp_ms = j.at("timestamp_ms").get<std::int64_t>();
  c.id = j.at("id").get<domain::AuditEntryId>();
}

void to_json(nlohmann::json& j, const AuditPage& p) {
  j = nlohmann::json{{"entries", p.entries}};
  if (p.next) {
    j["next_cursor"] = *p.next;
  } else {
    j["next_cursor"] = nullptr;
  }
}

}  // namespace ledger
