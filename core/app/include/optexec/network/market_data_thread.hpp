#pragma once

#include "optexec/events/event.hpp"
#include "optexec/gateway/market_data_gateway.hpp"
#include "optexec/time/simulation_time_provider.hpp"

#include <functional>
#include <memory>
#include <string>
#include <thread>

namespace optexec {

// -----------------------------------------------------------------------------
// MarketDataThread — dedicated I/O thread for market data ingestion
// -----------------------------------------------------------------------------
//
// @brief  Runs the MarketDataGateway's blocking recv loop on its own
//         std::thread, so network I/O never runs on the market or execution
//         loops.
//
// @details
// The gateway is created in start(), not in the constructor, so the engine
// can build this object early and open the socket only once every
// subscriber is wired. The event sink pushes each tick into the market
// loop's queue.
//
// Thread model:
//   start() and stop() are called from the owning thread (TradingEngine).
//   stop() sets the gateway's flag and joins; idempotent.
//
// Ownership:
//   Owned by TradingEngine via std::unique_ptr. Owns the gateway. The
//   simulation clock pointer may be null (wall-clock mode).
// -----------------------------------------------------------------------------
class MarketDataThread {
 public:
  using EventSink = std::function<void(Event)>;

  MarketDataThread(SimulationTimeProvider* sim_clock, EventSink event_sink,
                   std::string endpoint = "tcp://127.0.0.1:5555");

  ~MarketDataThread();

  MarketDataThread(const MarketDataThread&) = delete;
  MarketDataThread& operator=(const MarketDataThread&) = delete;
  MarketDataThread(MarketDataThread&&) = delete;
  MarketDataThread& operator=(MarketDataThread&&) = delete;

  // Creates the gateway and spawns the recv thread. No-op when running.
  void start();

  // Signals the gateway and joins the thread.
  void stop();

  bool isRunning() const { return thread_.joinable(); }

 private:
  SimulationTimeProvider* sim_clock_;
  EventSink event_sink_;
  std::string endpoint_;

  std::unique_ptr<MarketDataGateway> gateway_;
  std::thread thread_;
};

}  // namespace optexec
