#include "optexec/network/ipc_server.hpp"
#include "optexec/time/time_utils.hpp"

#include <nlohmann/json.hpp>

#include <cerrno>
#include <iostream>
#include <utility>

namespace optexec {

IpcServer::IpcServer(CommandHandler command_handler, std::string cmd_endpoint,
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
  // Publish what is left before the sockets close.
  processTelemetry();
}

void IpcServer::processTelemetry() {
  while (auto maybe_event = telemetry_queue_.try_pop()) {
    auto json_str = formatTelemetry(*maybe_event);
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
  std::string response;
  try {
    response = command_handler_(cmd);
  } catch (const std::exception& e) {
    // REP must answer every request or the socket wedges.
    std::cerr << "[IpcServer] ERROR: command '" << cmd
              << "' failed: " << e.what() << "\n";
    response = nlohmann::json{{"ok", false}, {"error", e.what()}}.dump();
  }

  zmq::message_t reply(response.data(), response.size());
  cmd_socket_->send(reply, zmq::send_flags::none);
}

// -----------------------------------------------------------------------------
// formatTelemetry(): dispatch Event variant to per-type formatters
// -----------------------------------------------------------------------------
std::optional<std::string> IpcServer::formatTelemetry(const Event& event) {
  if (auto* e = std::get_if<OrderFilledEvent>(&event)) {
    return formatOrderFilled(*e);
  }
  if (auto* e = std::get_if<PositionClosedEvent>(&event)) {
    return formatPositionClosed(*e);
  }
  if (auto* e = std::get_if<RiskViolationEvent>(&event)) {
    return formatRiskViolation(*e);
  }
  return std::nullopt;
}

std::string IpcServer::formatOrderFilled(const OrderFilledEvent& e) {
  nlohmann::json j;
  j["type"] = "order_filled";
  j["order_id"] = e.order_id;
  j["symbol"] = e.contract.symbol;
  j["side"] = domain::sideToString(e.side);
  j["fill_price"] = e.fill_price;
  j["total_quantity"] = e.total_quantity;
  j["filled_quantity"] = e.filled_quantity;
  j["is_partial"] = e.is_partial;
  j["fills"] = e.fills.size();
  j["timestamp_ms"] = timestamp_to_ms(e.timestamp);
  return j.dump();
}

std::string IpcServer::formatPositionClosed(const PositionClosedEvent& e) {
  nlohmann::json j;
  j["type"] = "position_closed";
  j["entry_order_id"] = e.entry_order_id;
  j["exit_order_id"] = e.exit_order_id;
  j["symbol"] = e.symbol;
  j["quantity"] = e.quantity;
  j["entry_price"] = e.entry_price;
  j["exit_price"] = e.exit_price;
  j["pnl"] = e.pnl;
  j["reason"] = domain::exitReasonToString(e.reason);
  j["timestamp_ms"] = timestamp_to_ms(e.timestamp);
  return j.dump();
}

std::string IpcServer::formatRiskViolation(const RiskViolationEvent& e) {
  nlohmann::json j;
  j["type"] = "risk_violation";
  j["reason"] = e.reason;
  j["current_value"] = e.current_value;
  j["limit_value"] = e.limit_value;
  j["timestamp_ms"] = timestamp_to_ms(e.timestamp);
  return j.dump();
}

}  // namespace optexec
