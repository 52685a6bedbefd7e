#pragma once

#include "optexec/broker/paper_broker.hpp"
#include "optexec/concurrent/event_loop_thread.hpp"
#include "optexec/concurrent/order_id_generator.hpp"
#include "optexec/concurrent/task_scheduler.hpp"
#include "optexec/config/engine_config.hpp"
#include "optexec/execution/execution_controller.hpp"
#include "optexec/execution/exit_controller.hpp"
#include "optexec/execution/option_chain_selector.hpp"
#include "optexec/market/candle_aggregator.hpp"
#include "optexec/market/market_clock.hpp"
#include "optexec/network/ipc_server.hpp"
#include "optexec/network/market_data_thread.hpp"
#include "optexec/risk/risk_governor.hpp"
#include "optexec/store/jsonl_trade_journal.hpp"
#include "optexec/store/position_ledger.hpp"
#include "optexec/strategy/ema_crossover_strategy.hpp"
#include "optexec/time/i_time_provider.hpp"
#include "optexec/time/simulation_time_provider.hpp"

#include <atomic>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace optexec {

// -----------------------------------------------------------------------------
// TradingEngine
// -----------------------------------------------------------------------------
//
// @brief  Owns every thread, loop and component and wires the option
//         order lifecycle: tick -> candle -> signal -> entry -> fills ->
//         exit tracking -> exit.
//
// @details
// Thread layout:
//
//   market loop        PaperBroker::onTick, ExitController::onTick,
//                      CandleAggregator, ExitController::onCandleClose,
//                      EmaCrossoverStrategy
//   execution loop     ExecutionController::onSignal, fill routing
//   market data thread MarketDataGateway ZMQ recv loop
//   ipc thread         IpcServer (commands + telemetry)
//   schedulers         square-off check (engine), entry watchdog
//                      (ExecutionController), limit expiry (PaperBroker)
//
// Cross-thread bridges (wired in start()):
//   1. market data thread -> market loop:   MarketDataEvent (pushEvent)
//   2. market loop -> execution loop:       SignalEvent, only while the
//                                           session is open
//   3. broker callback -> execution loop:   OrderFilledEvent
//   4. governor / exit controller -> execution loop:
//                                           RiskViolationEvent,
//                                           PositionClosedEvent
//   5. execution loop -> ipc thread:        telemetry
//
// Fill routing on the execution loop:
//   exit-order fills go to ExitController::onExitOrderFilled; entry fills
//   go to ExecutionController::onOrderFilled, and the resulting snapshot
//   is registered with ExitController, or handed to
//   ExitController::exitLateFill when its position was already exited.
//
// Thread model:
//   Constructed, started, stopped and destroyed on one thread (main).
//   pushEvent()/pushMarketData() and executeCommand() are safe from any
//   thread while running.
//
// Ownership:
//   The time provider (and simulation clock, when given) are owned by the
//   caller and must outlive the engine. Components are unique_ptr members
//   so stop() controls destruction order; loops are value members
//   destroyed last.
// -----------------------------------------------------------------------------
class TradingEngine {
 public:
  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  //
  // @param  cfg        Engine configuration. Empty network endpoints disable
  //                    the market data thread / IPC server (tests push
  //                    events via pushMarketData()). An empty journal path
  //                    disables the journal.
  // @param  time       Clock every component reads.
  // @param  sim_clock  Clock the gateway advances per tick; nullptr in
  //                    wall-clock mode. Usually the same object as time.
  //
  // Side-effects: none; start() brings the engine up.
  // -------------------------------------------------------------------------
  TradingEngine(config::EngineConfig cfg, ITimeProvider& time,
                SimulationTimeProvider* sim_clock = nullptr);

  ~TradingEngine();

  TradingEngine(const TradingEngine&) = delete;
  TradingEngine& operator=(const TradingEngine&) = delete;
  TradingEngine(TradingEngine&&) = delete;
  TradingEngine& operator=(TradingEngine&&) = delete;

  // -------------------------------------------------------------------------
  // start()
  // -------------------------------------------------------------------------
  //
  // @details
  // Startup sequence:
  //   1. Create the broker, ledger, journal, governor, selector, clock and
  //      the two controllers.
  //   2. Start the market and execution loops.
  //   3. Wire bridges and create the candle aggregator and strategy, in the
  //      order the market loop must see each tick.
  //   4. Start the square-off scheduler.
  //   5. Start the IPC server.
  //   6. Start the market data thread LAST.
  //
  // Idempotent.
  // @throws zmq::error_t when an IPC endpoint cannot be bound.
  // -------------------------------------------------------------------------
  void start();

  // -------------------------------------------------------------------------
  // stop()
  // -------------------------------------------------------------------------
  //
  // @details
  // Shutdown sequence:
  //   1. Stop market data and IPC (no new ticks or commands).
  //   2. Stop the square-off scheduler and drain the market loop.
  //   3. Stop the execution controller (no new entries, watchdogs
  //      cancelled, LTP waits woken), then exit every tracked position with
  //      reason SYSTEM_SHUTDOWN.
  //   4. Drain and stop the execution loop; entries filled during the drain
  //      are exited the same way.
  //   5. Remove bridges and destroy components in reverse creation order.
  //
  // Idempotent. start() may be called again afterwards.
  // -------------------------------------------------------------------------
  void stop();

  bool isRunning() const { return running_.load(); }

  void pushMarketData(MarketDataEvent event);

  // Event sink bound to the market data thread.
  void pushEvent(Event event);

  // -------------------------------------------------------------------------
  // executeCommand(cmd)
  // -------------------------------------------------------------------------
  //
  // @return JSON response text.
  //
  // @details
  //   "PING"      {"status":"ok","response":"PONG"}
  //   "STATUS"    halted flag, capital, realized PnL, broker balance,
  //               ledger positions and tracked exits
  //   "HALT"      engages the governor's kill switch
  //   "SQUAREOFF" exits every tracked position, reason MANUAL
  //   "SUMMARY"   session summary (journal, or the ledger's closed
  //               positions when the journal is disabled)
  //   other       {"status":"error","response":"Unknown command: ..."}
  //
  // Thread model: called on the IPC thread.
  // -------------------------------------------------------------------------
  std::string executeCommand(const std::string& cmd);

  EventBus& marketEventBus();
  EventBus& executionEventBus();

  // Component access for tests and tools; null before start().
  broker::PaperBroker* paperBroker() { return broker_.get(); }
  store::PositionLedger* ledger() { return ledger_.get(); }
  risk::RiskGovernor* riskGovernor() { return risk_.get(); }
  execution::ExecutionController* executionController() {
    return execution_.get();
  }
  execution::ExitController* exitController() { return exit_.get(); }

 private:
  void onSignal(const SignalEvent& signal);

  void onOrderFilled(const OrderFilledEvent& event);

  template <typename EventType, typename Handler>
  void bridge(EventBus& bus, Handler handler);

  const config::EngineConfig cfg_;
  ITimeProvider& time_;
  SimulationTimeProvider* sim_clock_;

  OrderIdGenerator order_id_gen_;

  EventLoopThread market_loop_{"market"};
  EventLoopThread exec_loop_{"execution"};
  std::unique_ptr<TaskScheduler> squareoff_scheduler_;

  std::unique_ptr<MarketDataThread> market_data_thread_;
  std::unique_ptr<IpcServer> ipc_server_;

  std::unique_ptr<broker::PaperBroker> broker_;
  std::unique_ptr<store::PositionLedger> ledger_;
  std::unique_ptr<store::JsonlTradeJournal> journal_;
  std::unique_ptr<risk::RiskGovernor> risk_;
  std::unique_ptr<execution::OptionChainSelector> selector_;
  std::unique_ptr<market::MarketClock> clock_;
  std::unique_ptr<execution::ExecutionController> execution_;
  std::unique_ptr<execution::ExitController> exit_;
  std::unique_ptr<market::CandleAggregator> candles_;
  std::unique_ptr<strategy::EmaCrossoverStrategy> strategy_;

  std::vector<std::pair<EventBus*, EventBus::SubscriptionId>> bridges_;

  std::atomic<bool> running_{false};
};

}  // namespace optexec
