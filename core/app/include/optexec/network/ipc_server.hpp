#pragma once

#include "optexec/concurrent/thread_safe_queue.hpp"
#include "optexec/events/event.hpp"

#include <zmq.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <thread>

namespace optexec {

// -----------------------------------------------------------------------------
// IpcServer — ZeroMQ operator surface (REP commands + PUB telemetry)
// -----------------------------------------------------------------------------
//
// @brief  One worker thread serves operator commands on a REP socket and
//         broadcasts JSON telemetry on a PUB socket.
//
// @details
//   PUB: OrderFilledEvent, PositionClosedEvent and RiskViolationEvent are
//        queued by pushTelemetry() from the execution loop and published
//        as JSON by the worker, so serialization and socket I/O stay off
//        that loop.
//   REP: each request string goes to command_handler_ (bound to
//        TradingEngine::executeCommand()); its JSON reply is sent back.
//        The socket has a receive timeout so the worker alternates
//        between commands and telemetry.
//
// Thread model:
//   start()/stop() from the owning thread. pushTelemetry() from any thread.
//   command_handler_ runs on the IPC worker thread.
//
// Ownership:
//   Owned by TradingEngine via std::unique_ptr. Owns the context, both
//   sockets, the telemetry queue and the worker thread.
// -----------------------------------------------------------------------------
class IpcServer {
 public:
  using CommandHandler = std::function<std::string(const std::string&)>;

  // No sockets are opened until start().
  explicit IpcServer(CommandHandler command_handler,
                     std::string cmd_endpoint = "tcp://127.0.0.1:5556",
                     std::string pub_endpoint = "tcp://127.0.0.1:5557");

  ~IpcServer();

  IpcServer(const IpcServer&) = delete;
  IpcServer& operator=(const IpcServer&) = delete;
  IpcServer(IpcServer&&) = delete;
  IpcServer& operator=(IpcServer&&) = delete;

  // -------------------------------------------------------------------------
  // start()
  // -------------------------------------------------------------------------
  // @brief  Binds both sockets and spawns the worker. No-op when running.
  // @throws zmq::error_t when an endpoint cannot be bound.
  // -------------------------------------------------------------------------
  void start();

  // Signals the worker, joins it and closes the sockets. Idempotent.
  void stop();

  void pushTelemetry(Event event);

  // -------------------------------------------------------------------------
  // formatTelemetry(event)
  // -------------------------------------------------------------------------
  // @return JSON text for the three telemetry types, std::nullopt for any
  //         other event.
  // -------------------------------------------------------------------------
  static std::optional<std::string> formatTelemetry(const Event& event);

 private:
  static constexpr int kPollTimeoutMs = 50;

  void run();

  void processTelemetry();

  void processCommands();

  static std::string formatOrderFilled(const OrderFilledEvent& e);
  static std::string formatPositionClosed(const PositionClosedEvent& e);
  static std::string formatRiskViolation(const RiskViolationEvent& e);

  CommandHandler command_handler_;
  std::string cmd_endpoint_;
  std::string pub_endpoint_;

  std::unique_ptr<zmq::context_t> context_;
  std::unique_ptr<zmq::socket_t> cmd_socket_;
  std::unique_ptr<zmq::socket_t> pub_socket_;

  ThreadSafeQueue<Event> telemetry_queue_;
  std::thread thread_;
  std::atomic<bool> running_{false};
};

}  // namespace optexec
