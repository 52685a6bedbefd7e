// =============================================================================
// trading_engine_test.cpp
// =============================================================================
// Unit tests for optexec::TradingEngine (orchestrator).
//
// Validates:
//   - start()/stop() are idempotent and the destructor stops the threads
//   - Components exist only while the engine runs
//   - pushMarketData() reaches the paper broker's quote cache
//   - Operator commands: PING, STATUS, HALT, SQUAREOFF, SUMMARY, unknown
//   - stop() flattens open positions with reason SYSTEM_SHUTDOWN
//
// Network endpoints and the journal are disabled, so everything runs
// in-process. A SimulationTimeProvider pinned inside the session keeps the
// square-off scheduler idle.
// =============================================================================

#include "engine_test_config.hpp"

#include "optexec/engine/trading_engine.hpp"
#include "optexec/time/simulation_time_provider.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace {

using namespace std::chrono_literals;
using optexec::testing::callContract;
using optexec::testing::optionTick;

// Thread-safe sink for events published on an engine bus.
template <typename EventType>
class Recorder {
 public:
  void record(const EventType& e) {
    {
      std::lock_guard lock(mutex_);
      events_.push_back(e);
    }
    cv_.notify_all();
  }

  bool waitForCount(std::size_t n,
                    std::chrono::milliseconds timeout = 2000ms) {
    std::unique_lock lock(mutex_);
    return cv_.wait_for(lock, timeout, [&] { return events_.size() >= n; });
  }

  std::vector<EventType> events() const {
    std::lock_guard lock(mutex_);
    return events_;
  }

  std::function<void(const EventType&)> callback() {
    return [this](const EventType& e) { record(e); };
  }

 private:
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::vector<EventType> events_;
};

}  // namespace

class TradingEngineTest : public ::testing::Test {
 protected:
  nlohmann::json command(const std::string& cmd) {
    return nlohmann::json::parse(engine.executeCommand(cmd));
  }

  // Quote for the call, then a BUY_CE signal; returns once the entry fill
  // has been processed (and the position registered for exit).
  void openCallPosition(double ltp) {
    engine.pushMarketData(optionTick(callContract(), ltp));
    engine.pushEvent(optexec::testing::buyCallSignal());
    ASSERT_TRUE(fills.waitForCount(1));
  }

  // Recorders are declared before the engine so they outlive it.
  Recorder<optexec::OrderFilledEvent> fills;
  Recorder<optexec::PositionClosedEvent> closed;
  Recorder<optexec::RiskViolationEvent> violations;

  optexec::SimulationTimeProvider clock{optexec::testing::kSessionTime};
  optexec::TradingEngine engine{optexec::testing::engineTestConfig(), clock,
                                &clock};

  void SetUp() override {
    engine.start();
    engine.executionEventBus().subscribe<optexec::OrderFilledEvent>(
        fills.callback());
    engine.executionEventBus().subscribe<optexec::PositionClosedEvent>(
        closed.callback());
    engine.executionEventBus().subscribe<optexec::RiskViolationEvent>(
        violations.callback());
  }

  void TearDown() override { engine.stop(); }
};

// =============================================================================
// 1. Lifecycle
// =============================================================================

TEST_F(TradingEngineTest, StartAndStopAreIdempotent) {
  EXPECT_TRUE(engine.isRunning());
  engine.start();
  EXPECT_TRUE(engine.isRunning());

  ASSERT_NE(engine.paperBroker(), nullptr);
  ASSERT_NE(engine.ledger(), nullptr);
  ASSERT_NE(engine.riskGovernor(), nullptr);
  ASSERT_NE(engine.executionController(), nullptr);
  ASSERT_NE(engine.exitController(), nullptr);

  engine.stop();
  EXPECT_FALSE(engine.isRunning());
  EXPECT_EQ(engine.paperBroker(), nullptr);
  EXPECT_EQ(engine.exitController(), nullptr);

  engine.stop();
  EXPECT_FALSE(engine.isRunning());

  // Restart brings up fresh components.
  engine.start();
  EXPECT_TRUE(engine.isRunning());
  EXPECT_NE(engine.paperBroker(), nullptr);
}

// The destructor must stop and join both loops and the scheduler. If it
// did not, the test binary would hang or terminate on a joinable thread.
TEST(TradingEngineLifecycleTest, DestructorStopsRunningEngine) {
  optexec::SimulationTimeProvider clock{optexec::testing::kSessionTime};
  {
    optexec::TradingEngine engine(optexec::testing::engineTestConfig(), clock,
                                  &clock);
    engine.start();
    engine.pushMarketData(optionTick(callContract(), 100.0));
  }
  SUCCEED();
}

TEST(TradingEngineLifecycleTest, CommandsFailWhileStopped) {
  optexec::SimulationTimeProvider clock{optexec::testing::kSessionTime};
  optexec::TradingEngine engine(optexec::testing::engineTestConfig(), clock);

  auto response = nlohmann::json::parse(engine.executeCommand("PING"));
  EXPECT_EQ(response["status"], "error");
  EXPECT_EQ(response["response"], "Engine not running");
  EXPECT_EQ(engine.paperBroker(), nullptr);
}

// =============================================================================
// 2. Market data path
// =============================================================================

TEST_F(TradingEngineTest, PushMarketDataUpdatesBrokerQuote) {
  Recorder<optexec::MarketDataEvent> ticks;
  // Subscribed after start(), so it runs after the broker's bridge.
  engine.marketEventBus().subscribe<optexec::MarketDataEvent>(
      ticks.callback());

  engine.pushMarketData(optionTick(callContract(), 101.25));
  ASSERT_TRUE(ticks.waitForCount(1));

  EXPECT_DOUBLE_EQ(engine.paperBroker()->getLtp(callContract()), 101.25);
  EXPECT_DOUBLE_EQ(
      engine.paperBroker()->getLtp(optexec::testing::putContract()), 0.0);
}

// =============================================================================
// 3. Commands
// =============================================================================

TEST_F(TradingEngineTest, PingReturnsPong) {
  auto response = command("PING");
  EXPECT_EQ(response["status"], "ok");
  EXPECT_EQ(response["response"], "PONG");
}

TEST_F(TradingEngineTest, UnknownCommandIsRejected) {
  auto response = command("LAUNCH");
  EXPECT_EQ(response["status"], "error");
  EXPECT_EQ(response["response"], "Unknown command: LAUNCH");
}

TEST_F(TradingEngineTest, StatusReportsAccountAndPositions) {
  auto idle = command("STATUS");
  EXPECT_EQ(idle["status"], "ok");
  EXPECT_FALSE(idle["halted"].get<bool>());
  EXPECT_TRUE(idle["market_open"].get<bool>());
  EXPECT_DOUBLE_EQ(idle["balance"].get<double>(), 1'000'000.0);
  EXPECT_TRUE(idle["positions"].empty());
  EXPECT_TRUE(idle["exits"].empty());

  openCallPosition(100.0);

  auto busy = command("STATUS");
  ASSERT_EQ(busy["positions"].size(), 1u);
  EXPECT_EQ(busy["positions"][0]["symbol"], "NIFTY24JAN21500CE");
  EXPECT_EQ(busy["positions"][0]["status"], "OPEN");
  EXPECT_EQ(busy["positions"][0]["open_quantity"].get<std::int64_t>(), 50);

  ASSERT_EQ(busy["exits"].size(), 1u);
  EXPECT_DOUBLE_EQ(busy["exits"][0]["stop_loss"].get<double>(), 80.0);
  EXPECT_DOUBLE_EQ(busy["exits"][0]["take_profit"].get<double>(), 140.0);
  EXPECT_DOUBLE_EQ(busy["balance"].get<double>(), 1'000'000.0 - 5000.0);
}

TEST_F(TradingEngineTest, HaltEngagesKillSwitch) {
  auto response = command("HALT");
  EXPECT_EQ(response["status"], "ok");

  ASSERT_TRUE(violations.waitForCount(1));
  EXPECT_EQ(violations.events()[0].reason, "Manual halt");
  EXPECT_TRUE(command("STATUS")["halted"].get<bool>());

  // A second HALT is accepted but emits nothing new.
  command("HALT");
  std::this_thread::sleep_for(100ms);
  EXPECT_EQ(violations.events().size(), 1u);
}

// Why: the governor gate sits in the execution controller; a halted engine
// must not place entry orders even with a quote and a valid signal.
TEST_F(TradingEngineTest, SignalWhileHaltedPlacesNothing) {
  command("HALT");

  engine.pushMarketData(optionTick(callContract(), 100.0));
  engine.pushEvent(optexec::testing::buyCallSignal());
  std::this_thread::sleep_for(200ms);

  EXPECT_TRUE(fills.events().empty());
  EXPECT_TRUE(engine.ledger()->getSnapshots().empty());
  EXPECT_TRUE(engine.exitController()->trackedPositions().empty());
}

TEST_F(TradingEngineTest, SquareoffClosesEveryPosition) {
  openCallPosition(100.0);

  auto response = command("SQUAREOFF");
  EXPECT_EQ(response["status"], "ok");
  EXPECT_EQ(response["closed"].get<std::size_t>(), 1u);

  ASSERT_TRUE(closed.waitForCount(1));
  const auto event = closed.events()[0];
  EXPECT_EQ(event.reason, optexec::domain::ExitReason::Manual);
  EXPECT_EQ(event.quantity, 50);
  EXPECT_DOUBLE_EQ(event.exit_price, 100.0);
  EXPECT_DOUBLE_EQ(event.pnl, 0.0);

  EXPECT_EQ(command("SQUAREOFF")["closed"].get<std::size_t>(), 0u);
}

TEST_F(TradingEngineTest, SummaryFallsBackToLedgerWithoutJournal) {
  auto empty = command("SUMMARY");
  EXPECT_EQ(empty["status"], "ok");
  EXPECT_EQ(empty["total_trades"].get<int>(), 0);

  openCallPosition(100.0);
  engine.pushMarketData(optionTick(callContract(), 79.0));
  ASSERT_TRUE(closed.waitForCount(1));

  auto summary = command("SUMMARY");
  EXPECT_EQ(summary["total_trades"].get<int>(), 1);
  EXPECT_EQ(summary["losses"].get<int>(), 1);
  EXPECT_DOUBLE_EQ(summary["net_pnl"].get<double>(), -1050.0);
}

// =============================================================================
// 4. Shutdown
// =============================================================================

TEST_F(TradingEngineTest, StopFlattensOpenPositions) {
  openCallPosition(100.0);
  engine.pushMarketData(optionTick(callContract(), 104.0));

  engine.stop();

  // The exit fill and its PositionClosedEvent are drained before stop()
  // returns.
  auto events = closed.events();
  ASSERT_EQ(events.size(), 1u);
  EXPECT_EQ(events[0].reason, optexec::domain::ExitReason::Shutdown);
  EXPECT_DOUBLE_EQ(events[0].exit_price, 104.0);
  EXPECT_DOUBLE_EQ(events[0].pnl, 200.0);
}
