#pragma once

#include "optexec/events/event.hpp"
#include "optexec/time/simulation_time_provider.hpp"

#include <zmq.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <string>

namespace optexec {

// -----------------------------------------------------------------------------
// MarketDataGateway — ZeroMQ SUB bridge for LTP ticks
// -----------------------------------------------------------------------------
//
// @brief  Receives JSON ticks on a SUB socket, advances the simulation clock
//         when one is attached, and hands a MarketDataEvent to the engine.
//
// @details
// Expected JSON per message:
//   {
//     "timestamp_ms": 1700000000000,   // int64 epoch milliseconds
//     "symbol":       "NIFTY24OCT24900CE",
//     "token":        "40002",         // instrument token, matched on
//     "price":        101.5,           // last traded price
//     "volume":       75.0             // optional, defaults to 0
//   }
// "token" falls back to "symbol" when absent.
//
// Per message, in order:
//   1. advance_time(timestamp_ms) when a SimulationTimeProvider is attached,
//      so every component reading now_ms() for this tick sees tick time.
//   2. event_sink_(MarketDataEvent).
// Malformed messages (nlohmann::json::exception) are logged and skipped.
//
// Thread model:
//   run() blocks the calling thread (MarketDataThread). stop() may be called
//   from any thread; the loop notices it within kRecvTimeoutMs.
//
// Ownership:
//   Owns the zmq::context_t and zmq::socket_t. The time provider, when
//   given, is owned by TradingEngine and must outlive the gateway.
// -----------------------------------------------------------------------------
class MarketDataGateway {
 public:
  using EventSink = std::function<void(Event)>;

  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  // @param  sim_clock   Clock to advance per tick, or nullptr when the engine
  //                     runs on wall-clock time.
  // @param  event_sink  Callback invoked for each decoded tick.
  // @param  endpoint    ZMQ endpoint to connect to.
  //
  // Side-effects: opens a SUB socket subscribed to everything and connects.
  // -------------------------------------------------------------------------
  MarketDataGateway(SimulationTimeProvider* sim_clock, EventSink event_sink,
                    const std::string& endpoint = "tcp://127.0.0.1:5555");

  ~MarketDataGateway() = default;

  MarketDataGateway(const MarketDataGateway&) = delete;
  MarketDataGateway& operator=(const MarketDataGateway&) = delete;
  MarketDataGateway(MarketDataGateway&&) = delete;
  MarketDataGateway& operator=(MarketDataGateway&&) = delete;

  // Blocking recv loop. Call from exactly one thread.
  void run();

  // Requests the recv loop to exit.
  void stop();

  // -------------------------------------------------------------------------
  // decodeTick(payload, sequence_id)
  // -------------------------------------------------------------------------
  // @brief  Parses one tick message.
  // @throws nlohmann::json::exception on malformed JSON or missing keys.
  // -------------------------------------------------------------------------
  static MarketDataEvent decodeTick(const std::string& payload,
                                    std::uint64_t sequence_id);

  std::uint64_t ticksReceived() const { return sequence_.load(); }

 private:
  static constexpr int kRecvTimeoutMs = 100;

  SimulationTimeProvider* sim_clock_;
  EventSink event_sink_;

  zmq::context_t context_{1};
  zmq::socket_t socket_{context_, zmq::socket_type::sub};

  std::atomic<bool> running_{false};
  std::atomic<std::uint64_t> sequence_{0};
};

}  // namespace optexec
