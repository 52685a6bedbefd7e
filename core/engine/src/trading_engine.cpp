#include "optexec/engine/trading_engine.hpp"
#include "optexec/errors.hpp"
#include "optexec/time/time_utils.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <iostream>
#include <utility>

namespace optexec {

namespace {

constexpr TaskScheduler::Key kSquareoffTask = 1;
constexpr std::chrono::milliseconds kSquareoffInterval{1000};

}  // namespace

TradingEngine::TradingEngine(config::EngineConfig cfg, ITimeProvider& time,
                             SimulationTimeProvider* sim_clock)
    : cfg_(std::move(cfg)), time_(time), sim_clock_(sim_clock) {}

TradingEngine::~TradingEngine() { stop(); }

template <typename EventType, typename Handler>
void TradingEngine::bridge(EventBus& bus, Handler handler) {
  const EventBus::SubscriptionId id = bus.subscribe<EventType>(
      std::function<void(const EventType&)>(std::move(handler)));
  bridges_.emplace_back(&bus, id);
}

// -----------------------------------------------------------------------------
// start()
// -----------------------------------------------------------------------------
void TradingEngine::start() {
  if (running_) {
    return;
  }

  // ---  1) Components ------------------------------------------------------
  broker_ = std::make_unique<broker::PaperBroker>(cfg_.paper, order_id_gen_,
                                                  time_);
  ledger_ = std::make_unique<store::PositionLedger>();

  if (!cfg_.journal.path.empty()) {
    try {
      journal_ = std::make_unique<store::JsonlTradeJournal>(cfg_.journal.path);
    } catch (const PersistenceFailure& e) {
      std::cerr << "[TradingEngine] ERROR: " << e.what()
                << "; running without a trade journal.\n";
    }
  }

  risk_ = std::make_unique<risk::RiskGovernor>(
      *broker_, cfg_.risk, time_,
      [this](const RiskViolationEvent& e) { exec_loop_.push(e); });

  std::vector<domain::Contract> chain = cfg_.option_chain;
  selector_ = std::make_unique<execution::OptionChainSelector>(std::move(chain));
  clock_ = std::make_unique<market::MarketClock>(time_, cfg_.market,
                                                 cfg_.exit.squareoff_minute);

  execution_ = std::make_unique<execution::ExecutionController>(
      *broker_, *selector_, *risk_, *ledger_, order_id_gen_, time_,
      cfg_.execution, journal_.get());
  exit_ = std::make_unique<execution::ExitController>(
      *broker_, *execution_, *risk_, *ledger_, order_id_gen_, *clock_, time_,
      cfg_.exit, journal_.get(), [this](const Event& e) { exec_loop_.push(e); });

  // ---  2) Loops -----------------------------------------------------------
  market_loop_.start();
  exec_loop_.start();

  // ---  3) Bridges, in per-tick order --------------------------------------
  broker_->setOrderFilledCallback(
      [this](const OrderFilledEvent& e) { exec_loop_.push(e); });

  bridge<MarketDataEvent>(market_loop_.eventBus(),
                          [this](const MarketDataEvent& e) {
                            broker_->onTick(e);
                            exit_->onTick(e);
                          });

  candles_ = std::make_unique<market::CandleAggregator>(
      market_loop_.eventBus(), cfg_.underlying.token,
      cfg_.market.candle_timeframe_sec);

  // Exits adjust on the close before the strategy can open anything new.
  bridge<CandleEvent>(market_loop_.eventBus(), [this](const CandleEvent& e) {
    exit_->onCandleClose(e);
  });

  strategy_ = std::make_unique<strategy::EmaCrossoverStrategy>(
      market_loop_.eventBus(), cfg_.strategy);

  bridge<SignalEvent>(market_loop_.eventBus(),
                      [this](const SignalEvent& e) { onSignal(e); });

  bridge<SignalEvent>(exec_loop_.eventBus(), [this](const SignalEvent& e) {
    execution_->onSignal(e.signal, e.spot_price);
  });
  bridge<OrderFilledEvent>(exec_loop_.eventBus(),
                           [this](const OrderFilledEvent& e) {
                             onOrderFilled(e);
                           });

  // ---  4) Square-off ------------------------------------------------------
  squareoff_scheduler_ = std::make_unique<TaskScheduler>("squareoff");
  squareoff_scheduler_->start();
  squareoff_scheduler_->scheduleEvery(kSquareoffTask, kSquareoffInterval,
                                      [this] {
                                        exit_->checkSquareoff();
                                        return true;
                                      });

  // Core is up; from here a throw leaves stop() able to tear down.
  running_ = true;

  // ---  5) IPC -------------------------------------------------------------
  if (!cfg_.network.ipc_cmd_endpoint.empty() &&
      !cfg_.network.ipc_pub_endpoint.empty()) {
    ipc_server_ = std::make_unique<IpcServer>(
        [this](const std::string& cmd) { return executeCommand(cmd); },
        cfg_.network.ipc_cmd_endpoint, cfg_.network.ipc_pub_endpoint);
    ipc_server_->start();

    bridge<OrderFilledEvent>(exec_loop_.eventBus(),
                             [this](const OrderFilledEvent& e) {
                               ipc_server_->pushTelemetry(e);
                             });
    bridge<PositionClosedEvent>(exec_loop_.eventBus(),
                                [this](const PositionClosedEvent& e) {
                                  ipc_server_->pushTelemetry(e);
                                });
    bridge<RiskViolationEvent>(exec_loop_.eventBus(),
                               [this](const RiskViolationEvent& e) {
                                 ipc_server_->pushTelemetry(e);
                               });
  }

  // ---  6) Market data LAST ------------------------------------------------
  if (!cfg_.network.market_data_endpoint.empty()) {
    market_data_thread_ = std::make_unique<MarketDataThread>(
        sim_clock_, [this](Event event) { pushEvent(std::move(event)); },
        cfg_.network.market_data_endpoint);
    market_data_thread_->start();
  }

  std::cout << "[TradingEngine] started. underlying="
            << cfg_.underlying.symbol << " options=" << cfg_.option_chain.size()
            << " sizing=" << config::sizingModeToString(cfg_.risk.sizing_mode)
            << (market_data_thread_ ? " market_data=on" : "")
            << (ipc_server_ ? " ipc=on" : "")
            << (journal_ ? " journal=" + journal_->path() : std::string())
            << "\n";
}

// -----------------------------------------------------------------------------
// stop()
// -----------------------------------------------------------------------------
void TradingEngine::stop() {
  if (!running_) {
    return;
  }

  // ---  1) No new ticks or commands ----------------------------------------
  market_data_thread_.reset();
  ipc_server_.reset();

  // ---  2) Quiesce the market side -----------------------------------------
  squareoff_scheduler_.reset();
  market_loop_.stop();

  // ---  3) No new entries, then flatten ----------------------------------
  execution_->stop();
  std::size_t closed = exit_->closeAllPositions(domain::ExitReason::Shutdown);

  // ---  4) Drain fills; entries that landed meanwhile are flattened too ----
  exec_loop_.stop();
  closed += exit_->closeAllPositions(domain::ExitReason::Shutdown);

  // ---  5) Tear down -------------------------------------------------------
  for (const auto& [bus, id] : bridges_) {
    bus->unsubscribe(id);
  }
  bridges_.clear();
  broker_->setOrderFilledCallback({});

  strategy_.reset();
  candles_.reset();
  exit_.reset();
  execution_.reset();
  clock_.reset();
  selector_.reset();
  risk_.reset();
  journal_.reset();
  ledger_.reset();
  broker_.reset();

  running_ = false;

  std::cout << "[TradingEngine] stopped. " << closed
            << " position(s) closed on shutdown. All threads joined.\n";
}

void TradingEngine::pushMarketData(MarketDataEvent event) {
  market_loop_.push(std::move(event));
}

void TradingEngine::pushEvent(Event event) {
  market_loop_.push(std::move(event));
}

// -----------------------------------------------------------------------------
// onSignal: session gate between the market and execution loops
// -----------------------------------------------------------------------------
void TradingEngine::onSignal(const SignalEvent& signal) {
  if (!clock_->isMarketOpen()) {
    std::cout << "[TradingEngine] " << domain::signalToString(signal.signal)
              << " ignored: market closed.\n";
    return;
  }
  exec_loop_.push(signal);
}

// -----------------------------------------------------------------------------
// onOrderFilled: route a fill to the controller that placed the order
// -----------------------------------------------------------------------------
void TradingEngine::onOrderFilled(const OrderFilledEvent& event) {
  if (exit_->ownsOrder(event.order_id)) {
    exit_->onExitOrderFilled(event);
    return;
  }

  const std::optional<domain::OpenPosition> snapshot =
      execution_->onOrderFilled(event);
  if (!snapshot) {
    return;
  }
  if (snapshot->after_exit) {
    exit_->exitLateFill(*snapshot);
    return;
  }

  try {
    exit_->registerPosition(*snapshot);
  } catch (const InvalidState& e) {
    std::cerr << "[TradingEngine] ERROR: order " << snapshot->order_id
              << " not tracked for exit: " << e.what() << "\n";
  }
}

// -----------------------------------------------------------------------------
// executeCommand(): operator commands from the IPC server
// -----------------------------------------------------------------------------
std::string TradingEngine::executeCommand(const std::string& cmd) {
  nlohmann::json response;

  if (!running_) {
    response["status"] = "error";
    response["response"] = "Engine not running";
    return response.dump();
  }

  if (cmd == "PING") {
    response["status"] = "ok";
    response["response"] = "PONG";
  } else if (cmd == "STATUS") {
    response["status"] = "ok";
    response["halted"] = !risk_->canTakeNewTrade();
    response["capital"] = risk_->availableCapital();
    response["realized_pnl"] = risk_->realizedPnl();
    response["balance"] = broker_->getAccountBalance();
    response["market_open"] = clock_->isMarketOpen();

    nlohmann::json positions_json = nlohmann::json::array();
    for (const auto& pos : ledger_->getSnapshots()) {
      nlohmann::json p;
      p["symbol"] = pos.symbol;
      p["status"] =
          pos.status == domain::AggregateStatus::Open ? "OPEN" : "CLOSED";
      p["open_quantity"] = pos.open_quantity;
      p["average_entry_price"] = pos.average_entry_price;
      p["last_price"] = pos.last_price;
      p["realized_pnl"] = pos.realized_pnl;
      p["unrealized_pnl"] = pos.unrealized_pnl;
      positions_json.push_back(std::move(p));
    }
    response["positions"] = std::move(positions_json);

    nlohmann::json exits_json = nlohmann::json::array();
    for (const auto& s : exit_->trackedPositions()) {
      nlohmann::json x;
      x["order_id"] = s.order_id;
      x["symbol"] = s.contract.symbol;
      x["quantity"] = s.quantity;
      x["entry_price"] = s.entry_price;
      x["stop_loss"] = s.stop_loss_price;
      if (cfg_.exit.take_profit_enabled) {
        x["take_profit"] = s.take_profit_price;
      }
      x["breakeven"] = s.breakeven_engaged;
      exits_json.push_back(std::move(x));
    }
    response["exits"] = std::move(exits_json);
  } else if (cmd == "HALT") {
    risk_->haltTrading("Manual halt");
    response["status"] = "ok";
    response["response"] = "Trading halted";
  } else if (cmd == "SQUAREOFF") {
    const std::size_t closed =
        exit_->closeAllPositions(domain::ExitReason::Manual);
    response["status"] = "ok";
    response["closed"] = closed;
  } else if (cmd == "SUMMARY") {
    store::SessionSummary summary;
    if (journal_) {
      summary = journal_->summary();
    } else {
      std::vector<double> pnls;
      for (const auto& pos : ledger_->closedPositions()) {
        pnls.push_back(pos.realized_pnl);
      }
      summary = store::JsonlTradeJournal::summarize(pnls);
    }
    response["status"] = "ok";
    response["total_trades"] = summary.total_trades;
    response["wins"] = summary.wins;
    response["losses"] = summary.losses;
    response["win_rate"] = summary.win_rate;
    response["gross_profit"] = summary.gross_profit;
    response["gross_loss"] = summary.gross_loss;
    response["profit_factor"] = summary.profit_factor;
    response["net_pnl"] = summary.net_pnl;
    response["max_drawdown"] = summary.max_drawdown;
  } else {
    response["status"] = "error";
    response["response"] = "Unknown command: " + cmd;
  }

  return response.dump();
}

EventBus& TradingEngine::marketEventBus() { return market_loop_.eventBus(); }

EventBus& TradingEngine::executionEventBus() { return exec_loop_.eventBus(); }

}  // namespace optexec
