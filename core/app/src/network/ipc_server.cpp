#include "ledger/network/ipc_server.hpp"

#include "ledger/codec/json_codec.hpp"
#include "ledger/domain/adjustment_status.hpp"

#include <nlohmann/json.hpp>

#include <cerrno>
#include <iostream>
#include <utility>

namespace ledger {

IpcServer::IpcServer(CommandHandler command_handler,
                     std::string command_endpoint,
                     std::string telemetry_endpoint)
    : command_handler_(std::move(command_handler)),
      command_endpoint_(std::move(command_endpoint)),
      telemetry_endpoint_(std::move(telemetry_endpoint)) {}

IpcServer::~IpcServer() { stop(); }

// -----------------------------------------------------------------------------
// start(): bind sockets, spawn worker
// -----------------------------------------------------------------------------
void IpcServer::start() {
  if (running_.load()) {
    return;
  }

  context_ = std::make_unique<zmq::context_t>(1);
  cmd_socket_ =
      std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::rep);
  pub_socket_ =
      std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::pub);

  cmd_socket_->set(zmq::sockopt::rcvtimeo, kPollTimeoutMs);
  cmd_socket_->set(zmq::sockopt::linger, 0);
  pub_socket_->set(zmq::sockopt::linger, 0);
  cmd_socket_->bind(command_endpoint_);
  pub_socket_->bind(telemetry_endpoint_);

  running_.store(true);
  thread_ = std::thread([this] { run(); });

  std::cout << "[IpcServer] started. CMD=" << command_endpoint_
            << " PUB=" << telemetry_endpoint_ << "\n";
}

// -----------------------------------------------------------------------------
// stop(): signal, join, close sockets
// -----------------------------------------------------------------------------
void IpcServer::stop() {
  if (!running_.exchange(false)) {
    return;
  }

  if (thread_.joinable()) {
    thread_.join();
  }

  cmd_socket_.reset();
  pub_socket_.reset();
  context_.reset();

  std::cout << "[IpcServer] stopped.\n";
}

void IpcServer::pushTelemetry(Event event) {
  telemetry_queue_.push(std::move(event));
}

// -----------------------------------------------------------------------------
// run(): alternate telemetry drain and command poll
// -----------------------------------------------------------------------------
void IpcServer::run() {
  while (running_.load()) {
    processTelemetry();
    processCommands();
  }
  processTelemetry();
}

void IpcServer::processTelemetry() {
  for (const Event& event : telemetry_queue_.drain()) {
    std::string text = formatTelemetry(event);
    zmq::message_t msg(text.data(), text.size());
    pub_socket_->send(msg, zmq::send_flags::dontwait);
  }
}

void IpcServer::processCommands() {
  zmq::message_t request;
  zmq::recv_result_t result;

  try {
    result = cmd_socket_->recv(request, zmq::recv_flags::none);
  } catch (const zmq::error_t& e) {
    if (e.num() == EINTR) {
      return;
    }
    throw;
  }

  if (!result.has_value()) {
    return;
  }

  std::string command(static_cast<const char*>(request.data()),
                      request.size());
  std::string response = command_handler_(command);

  zmq::message_t reply(response.data(), response.size());
  cmd_socket_->send(reply, zmq::send_flags::none);
}

// -----------------------------------------------------------------------------
// formatTelemetry(): one JSON document per event alternative
// -----------------------------------------------------------------------------
std::string IpcServer::formatTelemetry(const Event& event) {
  nlohmann::json j;

  if (const auto* e = std::get_if<BatchReceivedEvent>(&event)) {
    j["type"] = "batch_received";
    j["batch"] = e->batch;
    j["timestamp_ms"] = e->timestamp_ms;
    j["sequence_id"] = e->sequence_id;
  } else if (const auto* e = std::get_if<AdjustmentUpdateEvent>(&event)) {
    j["type"] = "adjustment_update";
    j["adjustment"] = e->adjustment;
    if (e->previous_status) {
      j["previous_status"] =
          domain::adjustmentStatusToString(*e->previous_status);
    } else {
      j["previous_status"] = nullptr;
    }
    j["timestamp_ms"] = e->timestamp_ms;
    j["sequence_id"] = e->sequence_id;
  } else if (const auto* e = std::get_if<AllocationUpdateEvent>(&event)) {
    j["type"] = "allocation_update";
    j["allocation"] = e->allocation;
    j["previous_quantity"] = e->previous_quantity;
    j["released"] = e->released;
    j["timestamp_ms"] = e->timestamp_ms;
    j["sequence_id"] = e->sequence_id;
  } else if (const auto* e = std::get_if<AuditRecordedEvent>(&event)) {
    j["type"] = "audit_recorded";
    j["entry"] = e->entry;
    j["sequence_id"] = e->sequence_id;
  }

  // Row strings come from callers; invalid UTF-8 becomes U+FFFD.
  return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

}  // namespace ledger
