// =============================================================================
// command_dispatcher_test.cpp
// =============================================================================
// Tests for the JSON command channel, driven through
// LedgerEngine::executeCommand() exactly as the IPC REP socket drives it.
//
// Validates:
//   - Health commands (ping, status)
//   - A batch -> allocation -> adjustment flow with row payloads in replies
//   - Error replies carry kind, retryable and the quantity diagnostics
//   - Malformed JSON, unknown commands, missing arguments and bytes that
//     are not UTF-8 are answered with InvalidArgument instead of escaping
//     the dispatcher
// =============================================================================

#include "ledger/engine/ledger_engine.hpp"
#include "ledger/time/simulation_time_provider.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <cstdint>
#include <memory>
#include <string>

using nlohmann::json;

// =============================================================================
// Test fixture
// =============================================================================
class CommandDispatcherTest : public ::testing::Test {
 protected:
  void SetUp() override {
    ledger::LedgerConfig cfg;
    cfg.command_endpoint.clear();
    cfg.telemetry_endpoint.clear();
    engine_ = std::make_unique<ledger::LedgerEngine>(cfg, clock_);
  }

  json send(const json& request) {
    return json::parse(engine_->executeCommand(request.dump()));
  }

  json sendRaw(const std::string& text) {
    return json::parse(engine_->executeCommand(text));
  }

  ledger::SimulationTimeProvider clock_{5000};
  std::unique_ptr<ledger::LedgerEngine> engine_;
};

// -----------------------------------------------------------------------------
// 1. ping / status.
// -----------------------------------------------------------------------------
TEST_F(CommandDispatcherTest, HealthCommands) {
  json pong = send({{"command", "ping"}});
  EXPECT_EQ(pong.at("status"), "ok");
  EXPECT_EQ(pong.at("response"), "PONG");

  json status = send({{"command", "status"}});
  EXPECT_EQ(status.at("status"), "ok");
  EXPECT_EQ(status.at("batches"), 0);
  EXPECT_EQ(status.at("audit_entries"), 0);
}

// -----------------------------------------------------------------------------
// 2. Full flow through the command channel.
// -----------------------------------------------------------------------------
TEST_F(CommandDispatcherTest, BatchAllocationAdjustmentFlow) {
  json created = send({{"command", "create_batch"},
                       {"product_id", "SKU-77"},
                       {"warehouse_id", "WH-3"},
                       {"recorded_quantity", 100},
                       {"cost", {{"unit_cost", 120}, {"landed_unit_cost", 150}}},
                       {"received_by", "receiver"}});
  ASSERT_EQ(created.at("status"), "ok");
  const auto batch_id = created.at("batch").at("id").get<std::uint64_t>();
  EXPECT_EQ(created.at("batch").at("recorded_quantity"), 100);

  json alloc = send({{"command", "request_allocation"},
                     {"batch_id", batch_id},
                     {"storefront_id", "STORE-1"},
                     {"quantity", 70}});
  ASSERT_EQ(alloc.at("status"), "ok");
  EXPECT_EQ(alloc.at("allocation").at("quantity"), 70);

  json adj = send({{"command", "request_adjustment"},
                   {"batch_id", batch_id},
                   {"quantity_delta", 10},
                   {"adjustment_type", "THEFT"},
                   {"reason", "shelf count"},
                   {"requested_by", "clerk"}});
  ASSERT_EQ(adj.at("status"), "ok");
  EXPECT_EQ(adj.at("adjustment").at("quantity_delta"), -10);
  EXPECT_EQ(adj.at("adjustment").at("status"), "PENDING");
  const auto adj_id = adj.at("adjustment").at("id").get<std::uint64_t>();

  json pending = send({{"command", "list_pending_adjustments"}});
  EXPECT_EQ(pending.at("adjustments").size(), 1u);

  json approved = send({{"command", "approve_adjustment"},
                        {"adjustment_id", adj_id},
                        {"approver_id", "manager"}});
  ASSERT_EQ(approved.at("status"), "ok");
  EXPECT_EQ(approved.at("adjustment").at("status"), "APPROVED");

  json availability =
      send({{"command", "get_availability"}, {"batch_id", batch_id}});
  ASSERT_EQ(availability.at("status"), "ok");
  EXPECT_EQ(availability.at("availability").at("available"), 90);
  EXPECT_EQ(availability.at("availability").at("remaining"), 20);

  json trail = send({{"command", "get_audit_trail"},
                     {"batch_id", batch_id},
                     {"limit", 10}});
  ASSERT_EQ(trail.at("status"), "ok");
  EXPECT_EQ(trail.at("page").at("entries").size(), 3u);
  EXPECT_TRUE(trail.at("page").at("next_cursor").is_null());

  json integrity = send({{"command", "check_integrity"}});
  EXPECT_TRUE(integrity.at("clean").get<bool>());
}

// -----------------------------------------------------------------------------
// 3. A business-rule rejection carries its numbers to the caller.
// -----------------------------------------------------------------------------
TEST_F(CommandDispatcherTest, ErrorReplyShape) {
  json created = send({{"command", "create_batch"},
                       {"product_id", "SKU-1"},
                       {"warehouse_id", "WH-1"},
                       {"recorded_quantity", 10}});
  const auto batch_id = created.at("batch").at("id").get<std::uint64_t>();

  json refused = send({{"command", "request_allocation"},
                       {"batch_id", batch_id},
                       {"storefront_id", "STORE-1"},
                       {"quantity", 11}});

  ASSERT_EQ(refused.at("status"), "error");
  const json& error = refused.at("error");
  EXPECT_EQ(error.at("kind"), "InsufficientStock");
  EXPECT_FALSE(error.at("retryable").get<bool>());
  EXPECT_EQ(error.at("diagnostics").at("remaining"), 10);
  EXPECT_EQ(error.at("diagnostics").at("requested_quantity"), 11);

  json missing = send({{"command", "get_batch"}, {"batch_id", 999}});
  ASSERT_EQ(missing.at("status"), "error");
  EXPECT_EQ(missing.at("error").at("kind"), "NotFound");
}

// -----------------------------------------------------------------------------
// 4. Bad requests never escape as exceptions.
// -----------------------------------------------------------------------------
TEST_F(CommandDispatcherTest, MalformedRequests) {
  json not_json = sendRaw("{this is not json");
  EXPECT_EQ(not_json.at("status"), "error");
  EXPECT_EQ(not_json.at("error").at("kind"), "InvalidArgument");

  json no_command = send({{"batch_id", 1}});
  EXPECT_EQ(no_command.at("error").at("kind"), "InvalidArgument");

  json unknown = send({{"command", "launch_rocket"}});
  EXPECT_EQ(unknown.at("error").at("kind"), "InvalidArgument");

  json missing_arg = send({{"command", "request_allocation"}, {"batch_id", 1}});
  EXPECT_EQ(missing_arg.at("error").at("kind"), "InvalidArgument");

  json bad_type = send({{"command", "request_adjustment"},
                        {"batch_id", 1},
                        {"quantity_delta", -1},
                        {"adjustment_type", "MISPLACED"},
                        {"requested_by", "clerk"}});
  EXPECT_EQ(bad_type.at("error").at("kind"), "InvalidArgument");
}

// -----------------------------------------------------------------------------
// 5. A request carrying bytes that are not UTF-8 still gets a JSON reply.
// Why: The parse error text quotes the raw bytes; serialising that reply
//      must not throw on the IPC thread.
// -----------------------------------------------------------------------------
TEST_F(CommandDispatcherTest, InvalidUtf8RequestAnswered) {
  std::string reply_text;
  ASSERT_NO_THROW(reply_text =
                      engine_->executeCommand("{\"command\":\"ping\x80\"}"));

  json reply = json::parse(reply_text);
  EXPECT_EQ(reply.at("status"), "error");
  EXPECT_EQ(reply.at("error").at("kind"), "InvalidArgument");

  // The channel keeps working afterwards.
  EXPECT_EQ(send({{"command", "ping"}}).at("response"), "PONG");
}
