#pragma once

#include "ledger/concurrent/thread_safe_queue.hpp"
#include "ledger/events/event.hpp"

#include <zmq.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <thread>

namespace ledger {

// -----------------------------------------------------------------------------
// IpcServer: ZeroMQ command and telemetry gateway
// -----------------------------------------------------------------------------
//
// @brief  One worker thread serving two sockets:
//
//   REP (command_endpoint):   receives a JSON command, passes it to the
//                             command handler (LedgerEngine::executeCommand)
//                             and sends back the JSON reply.
//   PUB (telemetry_endpoint): broadcasts one JSON message per committed
//                             change event.
//
// @details
// Telemetry arrives through pushTelemetry() from the notification loop
// thread and is buffered in a ThreadSafeQueue, so formatting and socket I/O
// never run on a ledger caller's thread or under a batch lock.
//
// The REP socket has a receive timeout so the loop alternates between
// draining telemetry and polling for a command, and notices stop() within
// one timeout period.
//
// Thread model:
//   start() and stop() from the owning thread. pushTelemetry() from any
//   thread. The command handler runs on the IPC thread; LedgerEngine's
//   operations are safe to call from there.
//
// Ownership:
//   Owned by LedgerEngine via std::unique_ptr. Owns the ZMQ context, both
//   sockets, the telemetry queue and the worker thread.
// -----------------------------------------------------------------------------
class IpcServer {
 public:
  using CommandHandler = std::function<std::string(const std::string&)>;

  IpcServer(CommandHandler command_handler, std::string command_endpoint,
            std::string telemetry_endpoint);

  ~IpcServer();

  IpcServer(const IpcServer&) = delete;
  IpcServer& operator=(const IpcServer&) = delete;
  IpcServer(IpcServer&&) = delete;
  IpcServer& operator=(IpcServer&&) = delete;

  // Binds both sockets and spawns the worker. Idempotent. Throws
  // zmq::error_t if an endpoint cannot be bound.
  void start();

  // Joins the worker after a final telemetry flush. Idempotent.
  void stop();

  void pushTelemetry(Event event);

  // -------------------------------------------------------------------------
  // formatTelemetry(event)
  // -------------------------------------------------------------------------
  // @brief  JSON text published for one event. Every message has a "type"
  //         field: batch_received, adjustment_update, allocation_update or
  //         audit_recorded.
  // -------------------------------------------------------------------------
  static std::string formatTelemetry(const Event& event);

 private:
  static constexpr int kPollTimeoutMs = 50;

  void run();
  void processTelemetry();
  void processCommands();

  CommandHandler command_handler_;
  std::string command_endpoint_;
  std::string telemetry_endpoint_;

  std::unique_ptr<zmq::context_t> context_;
  std::unique_ptr<zmq::socket_t> cmd_socket_;
  std::unique_ptr<zmq::socket_t> pub_socket_;

  ThreadSafeQueue<Event> telemetry_queue_;
  std::thread thread_;
  std::atomic<bool> running_{false};
};

}  // namespace ledger
