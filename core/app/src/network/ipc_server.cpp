#include "oms/network/ipc_server.hpp"
#include "oms/codec/json_codec.hpp"
#include "oms/domain/enum_codec.hpp"

#include <nlohmann/json.hpp>

#include <iostream>
#include <type_traits>
#include <utility>

namespace oms {

IpcServer::IpcServer(CommandHandler command_handler,
                     std::string cmd_endpoint,
                     std::string pub_endpoint)
    : command_handler_(std::move(command_handler)),
      cmd_endpoint_(std::move(cmd_endpoint)),
      pub_endpoint_(std::move(pub_endpoint)) {}

IpcServer::~IpcServer() { stop(); }

// -----------------------------------------------------------------------------
// start(): create sockets and spawn worker thread
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
  cmd_socket_->bind(cmd_endpoint_);
  pub_socket_->bind(pub_endpoint_);

  running_.store(true);
  thread_ = std::thread([this] { run(); });

  std::cout << "[IpcServer] started. CMD=" << cmd_endpoint_
            << " PUB=" << pub_endpoint_ << "\n";
}

// -----------------------------------------------------------------------------
// stop(): signal and join
// -----------------------------------------------------------------------------
void IpcServer::stop() {
  if (!running_.exchange(false)) {
    if (thread_.joinable()) {
      thread_.join();
    }
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

void IpcServer::run() {
  while (running_.load()) {
    processTelemetry();
    processCommands();
  }

  // Publish whatever is left before the sockets close.
  processTelemetry();
}

void IpcServer::processTelemetry() {
  for (const Event& event : telemetry_queue_.drain()) {
    auto json_str = formatTelemetry(event);
    if (json_str.has_value()) {
      zmq::message_t msg(json_str->data(), json_str->size());
      pub_socket_->send(msg, zmq::send_flags::dontwait);
    }
  }
}

// -----------------------------------------------------------------------------
// processCommands(): poll REP socket and dispatch
// -----------------------------------------------------------------------------
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

  std::string cmd(static_cast<const char*>(request.data()), request.size());
  std::string response = dispatch(cmd);

  zmq::message_t reply(response.data(), response.size());
  cmd_socket_->send(reply, zmq::send_flags::none);
}

std::string IpcServer::dispatch(const std::string& request) {
  try {
    return command_handler_(request);
  } catch (const std::exception& e) {
    std::cerr << "[IpcServer] WARNING: command handler failed: " << e.what()
              << "\n";
    nlohmann::json j{{"error", "InternalError"}, {"message", e.what()}};
    return j.dump();
  }
}

// -----------------------------------------------------------------------------
// formatTelemetry(): one JSON object per event
// -----------------------------------------------------------------------------
std::optional<std::string> IpcServer::formatTelemetry(const Event& event) {
  return std::visit(
      [](const auto& e) -> std::optional<std::string> {
        using T = std::decay_t<decltype(e)>;
        nlohmann::json j;
        if constexpr (std::is_same_v<T, OrderUpdateEvent>) {
          j = toOrderRecord(e.order);
          j["type"] = "order_update";
          j["previous_status"] = domain::toString(e.previous_status);
        } else if constexpr (std::is_same_v<T, FillRecordedEvent>) {
          j = toFillRecord(e.fill);
          j["type"] = "fill";
        } else if constexpr (std::is_same_v<T, PositionUpdateEvent>) {
          j = toPositionRecord(e.position);
          j["type"] = "position_update";
          j["removed"] = e.removed;
        } else if constexpr (std::is_same_v<T, SessionStatusEvent>) {
          j["type"] = "session_status";
          j["connected"] = e.connected;
          j["detail"] = e.detail;
        } else {
          return std::nullopt;
        }
        j["ts_ms"] = e.timestamp_ms;
        return j.dump();
      },
      event);
}

}  // namespace oms
