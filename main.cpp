// -----------------------------------------------------------------------------
// stock_ledger: single executable entry point.
//
//   1) Load LedgerConfig from the optional first argument (JSON file).
//   2) Pick the audit store: JournalAuditStore when audit_journal_path is
//      set, otherwise the in-memory store.
//   3) Create the LedgerEngine on the wall clock and start it, hydrating
//      from snapshot_path when one is configured.
//   4) Serve JSON commands on the REP endpoint and publish telemetry on the
//      PUB endpoint until SIGINT / SIGTERM.
//   5) Shut down cleanly.
//
// Thread layout:
//   main thread          -> waits for the shutdown flag
//   notification thread  -> EventBus callbacks (telemetry bridge, logger)
//   ipc thread           -> REP command handling + PUB telemetry
//
// Exit codes: 0 on clean shutdown, 1 on a configuration or start-up error.
// -----------------------------------------------------------------------------

#include "ledger/audit/journal_audit_store.hpp"
#include "ledger/config/ledger_config.hpp"
#include "ledger/engine/ledger_engine.hpp"
#include "ledger/engine/ledger_source.hpp"
#include "ledger/events/event.hpp"
#include "ledger/time/live_time_provider.hpp"
#include "ledger/time/time_utils.hpp"

#include <zmq.hpp>

#include <atomic>
#include <chrono>
#include <csignal>
#include <exception>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <thread>

// -----------------------------------------------------------------------------
// The only global: a lock-free flag the signal handler may touch.
// -----------------------------------------------------------------------------
static std::atomic<bool> g_shutdown_requested{false};

static void shutdown_handler(int /*signum*/) {
  g_shutdown_requested.store(true);
}

int main(int argc, char** argv) {
  // -------------------------------------------------------------------------
  // 1) Configuration
  // -------------------------------------------------------------------------
  ledger::LedgerConfig config;
  try {
    if (argc > 1) {
      config = ledger::loadConfig(argv[1]);
      std::cout << "[main] Loaded configuration from " << argv[1] << "\n";
    }
  } catch (const std::runtime_error& e) {
    std::cerr << "[main] Configuration error: " << e.what() << "\n";
    return 1;
  }

  // -------------------------------------------------------------------------
  // 2) Audit store and hydration source
  // -------------------------------------------------------------------------
  std::unique_ptr<ledger::IAuditStore> audit_store;
  std::unique_ptr<ledger::ILedgerSource> source;
  try {
    if (!config.audit_journal_path.empty()) {
      audit_store =
          std::make_unique<ledger::JournalAuditStore>(config.audit_journal_path);
    }
    if (!config.snapshot_path.empty()) {
      source =
          std::make_unique<ledger::JsonFileLedgerSource>(config.snapshot_path);
    }
  } catch (const std::runtime_error& e) {
    // StorageError derives from std::runtime_error.
    std::cerr << "[main] Start-up error: " << e.what() << "\n";
    return 1;
  }

  // -------------------------------------------------------------------------
  // 3) Engine
  // -------------------------------------------------------------------------
  ledger::LiveTimeProvider clock;
  ledger::LedgerEngine engine(config, clock, std::move(audit_store));

  // Console trace of committed changes. Runs on the notification thread.
  engine.notificationBus().subscribe<ledger::AdjustmentUpdateEvent>(
      [](const ledger::AdjustmentUpdateEvent& e) {
        std::cout << "[Ledger] " << ledger::ms_to_iso8601(e.timestamp_ms)
                  << " adjustment_id=" << e.adjustment.id
                  << " batch_id=" << e.adjustment.stock_batch_id << " status="
                  << ledger::domain::adjustmentStatusToString(
                         e.adjustment.status)
                  << " delta=" << e.adjustment.quantity_delta << "\n";
      });
  engine.notificationBus().subscribe<ledger::AllocationUpdateEvent>(
      [](const ledger::AllocationUpdateEvent& e) {
        std::cout << "[Ledger] " << ledger::ms_to_iso8601(e.timestamp_ms)
                  << " allocation_id=" << e.allocation.id
                  << " batch_id=" << e.allocation.stock_batch_id
                  << " storefront=" << e.allocation.storefront_id << " qty="
                  << (e.released ? 0 : e.allocation.quantity)
                  << (e.released ? " (released)" : "") << "\n";
      });

  try {
    engine.start(source.get());
  } catch (const zmq::error_t& e) {
    std::cerr << "[main] Could not bind IPC endpoints: " << e.what() << "\n";
    return 1;
  }

  // -------------------------------------------------------------------------
  // 4) Serve until interrupted
  // -------------------------------------------------------------------------
  std::signal(SIGINT, shutdown_handler);
  std::signal(SIGTERM, shutdown_handler);

  if (config.ipcEnabled()) {
    std::cout << "[main] Commands on " << config.command_endpoint
              << ", telemetry on " << config.telemetry_endpoint << "\n";
  }
  std::cout << "[main] Press Ctrl-C to shut down.\n";

  while (!g_shutdown_requested.load()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  // -------------------------------------------------------------------------
  // 5) Clean shutdown
  // -------------------------------------------------------------------------
  std::cout << "\n[main] Shutdown requested. Stopping engine...\n";
  engine.stop();

  return 0;
}
