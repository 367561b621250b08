#include "ledger/engine/command_dispatcher.hpp"

#include "ledger/codec/json_codec.hpp"
#include "ledger/engine/ledger_engine.hpp"

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace ledger {

namespace {

using nlohmann::json;

json okReply() { return json{{"status", "ok"}}; }

json errorReply(const LedgerError& error) {
  return json{{"status", "error"}, {"error", error}};
}

// Parse errors quote the offending bytes, which need not be valid UTF-8.
std::string serialize(const json& response) {
  return response.dump(-1, ' ', false, json::error_handler_t::replace);
}

template <typename T>
json reply(const Result<T>& result, const char* key) {
  if (!result) {
    return errorReply(result.error());
  }
  json j = okReply();
  j[key] = result.value();
  return j;
}

template <typename T>
json replyOptional(const std::optional<T>& row, const char* key,
                   const char* what, std::uint64_t id) {
  if (!row) {
    return errorReply(LedgerError::notFound(what, id));
  }
  json j = okReply();
  j[key] = *row;
  return j;
}

std::optional<std::string> optionalString(const json& args, const char* key) {
  auto it = args.find(key);
  if (it == args.end() || it->is_null()) {
    return std::nullopt;
  }
  return it->get<std::string>();
}

std::string stringOr(const json& args, const char* key,
                     const std::string& fallback) {
  return optionalString(args, key).value_or(fallback);
}

}  // namespace

CommandDispatcher::CommandDispatcher(LedgerEngine& engine) : engine_(engine) {
  registerHandlers();
}

// -----------------------------------------------------------------------------
// dispatch()
// -----------------------------------------------------------------------------
std::string CommandDispatcher::dispatch(const std::string& request_text) const {
  json response;

  try {
    json request = json::parse(request_text);
    if (!request.is_object() || !request.contains("command") ||
        !request["command"].is_string()) {
      return serialize(errorReply(LedgerError::invalidArgument(
          "request must be a JSON object with a string \"command\"")));
    }

    const auto name = request["command"].get<std::string>();
    auto it = handlers_.find(name);
    if (it == handlers_.end()) {
      return serialize(
          errorReply(LedgerError::invalidArgument("Unknown command: " + name)));
    }

    response = it->second(request);
  } catch (const json::exception& e) {
    response = errorReply(LedgerError::invalidArgument(
        std::string("malformed request: ") + e.what()));
  } catch (const std::invalid_argument& e) {
    response = errorReply(LedgerError::invalidArgument(e.what()));
  }

  return serialize(response);
}

// -----------------------------------------------------------------------------
// registerHandlers()
// -----------------------------------------------------------------------------
void CommandDispatcher::registerHandlers() {
  // --- Health ----------------------------------------------------------------
  handlers_["ping"] = [](const json&) {
    json j = okReply();
    j["response"] = "PONG";
    return j;
  };

  handlers_["status"] = [this](const json&) {
    json j = okReply();
    j["running"] = engine_.running();
    j["batches"] = engine_.batchCount();
    j["adjustments"] = engine_.adjustmentCount();
    j["pending_adjustments"] = engine_.listPendingAdjustments().size();
    j["allocations"] = engine_.allocationCount();
    j["audit_entries"] = engine_.auditEntryCount();
    j["commits"] = engine_.commitCount();
    return j;
  };

  // --- Batches ---------------------------------------------------------------
  handlers_["create_batch"] = [this](const json& args) {
    CreateBatchRequest req;
    req.product_id = args.at("product_id").get<std::string>();
    req.warehouse_id = args.at("warehouse_id").get<std::string>();
    req.supplier_id = optionalString(args, "supplier_id");
    req.recorded_quantity = args.at("recorded_quantity").get<domain::Quantity>();
    if (args.contains("cost")) {
      req.cost = args.at("cost").get<domain::CostFields>();
    }
    req.reference = optionalString(args, "reference");
    req.received_by = stringOr(args, "received_by", "system");
    return reply(engine_.createBatch(req), "batch");
  };

  handlers_["get_batch"] = [this](const json& args) {
    const auto id = args.at("batch_id").get<domain::BatchId>();
    return replyOptional(engine_.getBatch(id), "batch", "Stock batch", id);
  };

  // --- Adjustments -----------------------------------------------------------
  handlers_["request_adjustment"] = [this](const json& args) {
    AdjustmentRequest req;
    req.batch_id = args.at("batch_id").get<domain::BatchId>();
    req.quantity_delta = args.at("quantity_delta").get<domain::Quantity>();
    req.adjustment_type =
        domain::adjustmentTypeFromJson(args.at("adjustment_type"));
    req.reason = stringOr(args, "reason", "");
    req.requested_by = args.at("requested_by").get<std::string>();
    req.reference_number = optionalString(args, "reference_number");
    return reply(engine_.requestAdjustment(req), "adjustment");
  };

  handlers_["approve_adjustment"] = [this](const json& args) {
    auto target = domain::AdjustmentStatus::Approved;
    if (args.contains("target_status")) {
      target = domain::adjustmentStatusFromJson(args.at("target_status"));
    }
    return reply(engine_.approveAdjustment(
                     args.at("adjustment_id").get<domain::AdjustmentId>(),
                     args.at("approver_id").get<std::string>(), target),
                 "adjustment");
  };

  handlers_["approve_adjustments"] = [this](const json& args) {
    auto result = engine_.approveAdjustments(
        args.at("adjustment_ids").get<std::vector<domain::AdjustmentId>>(),
        args.at("approver_id").get<std::string>());

    json failed = json::array();
    for (const auto& [id, error] : result.failed) {
      failed.push_back({{"adjustment_id", id}, {"error", error}});
    }
    json j = okReply();
    j["approved"] = result.approved;
    j["failed"] = std::move(failed);
    return j;
  };

  handlers_["reject_adjustment"] = [this](const json& args) {
    return reply(engine_.rejectAdjustment(
                     args.at("adjustment_id").get<domain::AdjustmentId>(),
                     args.at("approver_id").get<std::string>()),
                 "adjustment");
  };

  handlers_["complete_adjustment"] = [this](const json& args) {
    return reply(engine_.completeAdjustment(
                     args.at("adjustment_id").get<domain::AdjustmentId>(),
                     args.at("actor_id").get<std::string>()),
                 "adjustment");
  };

  handlers_["get_adjustment"] = [this](const json& args) {
    const auto id = args.at("adjustment_id").get<domain::AdjustmentId>();
    return replyOptional(engine_.getAdjustment(id), "adjustment", "Adjustment",
                         id);
  };

  handlers_["list_adjustments"] = [this](const json& args) {
    json j = okReply();
    j["adjustments"] =
        engine_.listAdjustments(args.at("batch_id").get<domain::BatchId>());
    return j;
  };

  handlers_["list_pending_adjustments"] = [this](const json& args) {
    std::optional<domain::BatchId> batch_id;
    if (args.contains("batch_id") && !args.at("batch_id").is_null()) {
      batch_id = args.at("batch_id").get<domain::BatchId>();
    }
    json j = okReply();
    j["adjustments"] = engine_.listPendingAdjustments(batch_id);
    return j;
  };

  // --- Allocations -----------------------------------------------------------
  handlers_["request_allocation"] = [this](const json& args) {
    return reply(engine_.requestAllocation(
                     args.at("batch_id").get<domain::BatchId>(),
                     args.at("storefront_id").get<std::string>(),
                     args.at("quantity").get<domain::Quantity>(),
                     stringOr(args, "actor_id", "system")),
                 "allocation");
  };

  handlers_["update_allocation"] = [this](const json& args) {
    return reply(engine_.updateAllocation(
                     args.at("allocation_id").get<domain::AllocationId>(),
                     args.at("quantity").get<domain::Quantity>(),
                     stringOr(args, "actor_id", "system")),
                 "allocation");
  };

  handlers_["release_allocation"] = [this](const json& args) {
    return reply(engine_.releaseAllocation(
                     args.at("allocation_id").get<domain::AllocationId>(),
                     stringOr(args, "actor_id", "system")),
                 "allocation");
  };

  handlers_["get_allocation"] = [this](const json& args) {
    const auto id = args.at("allocation_id").get<domain::AllocationId>();
    return replyOptional(engine_.getAllocation(id), "allocation", "Allocation",
                         id);
  };

  handlers_["list_allocations"] = [this](const json& args) {
    json j = okReply();
    j["allocations"] =
        engine_.listAllocations(args.at("batch_id").get<domain::BatchId>());
    return j;
  };

  // --- Queries ---------------------------------------------------------------
  handlers_["get_available_quantity"] = [this](const json& args) {
    return reply(engine_.getAvailableQuantity(
                     args.at("batch_id").get<domain::BatchId>()),
                 "available");
  };

  handlers_["get_availability"] = [this](const json& args) {
    return reply(
        engine_.getAvailability(args.at("batch_id").get<domain::BatchId>()),
        "availability");
  };

  handlers_["get_audit_trail"] = [this](const json& args) {
    std::optional<AuditCursor> cursor;
    if (args.contains("cursor") && !args.at("cursor").is_null()) {
      cursor = args.at("cursor").get<AuditCursor>();
    }
    std::optional<std::size_t> limit;
    if (args.contains("limit") && !args.at("limit").is_null()) {
      limit = args.at("limit").get<std::size_t>();
    }
    return reply(engine_.getAuditTrail(
                     args.at("batch_id").get<domain::BatchId>(), cursor, limit),
                 "page");
  };

  handlers_["get_subject_audit_trail"] = [this](const json& args) {
    json j = okReply();
    j["entries"] = engine_.getAuditTrailForSubject(
        args.at("subject_table").get<std::string>(),
        args.at("subject_id").get<std::uint64_t>());
    return j;
  };

  handlers_["check_integrity"] = [this](const json&) {
    IntegrityReport report = engine_.checkIntegrity();

    json violations = json::array();
    for (const auto& v : report.violations) {
      violations.push_back({{"batch_id", v.batch_id},
                            {"issue", integrityIssueToString(v.issue)},
                            {"availability", v.breakdown}});
    }
    json j = okReply();
    j["clean"] = report.clean();
    j["batches_checked"] = report.batches_checked;
    j["violations"] = std::move(violations);
    j["skipped"] = report.skipped;
    return j;
  };
}

}  // namespace ledger
