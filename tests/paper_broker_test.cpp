// =============================================================================
// paper_broker_test.cpp
// =============================================================================
// Unit tests for optexec::broker::PaperBroker.
//
// Validates:
//   - Market buys fill at LTP, or wait for the first tick without one
//   - Slicing with fixed randomness: partial fill when cash runs out
//   - Market sells credit cash and reduce holdings
//   - Limit and stop matching on ticks
//   - Cancel and limit expiry
//   - Invalid requests are rejected with BrokerRejected
//
// Randomness is pinned by config (seed, equal min/max slices and fraction,
// zero jitter) so every expectation is exact.
// =============================================================================

#include "fake_broker.hpp"

#include "optexec/broker/paper_broker.hpp"
#include "optexec/errors.hpp"
#include "optexec/time/simulation_time_provider.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <thread>
#include <vector>

using optexec::domain::OrderKind;
using optexec::domain::OrderStatus;
using optexec::domain::Side;

class PaperBrokerTest : public ::testing::Test {
 protected:
  PaperBrokerTest() {
    cfg.starting_capital = 100'000.0;
    cfg.seed = 42;
    cfg.min_fill_slices = 1;
    cfg.max_fill_slices = 1;
    cfg.price_jitter_percent = 0.0;
    cfg.slice_fraction_min = 0.5;
    cfg.slice_fraction_max = 0.5;
    cfg.limit_expiry_ms = 60'000;
  }

  void build() {
    broker = std::make_unique<optexec::broker::PaperBroker>(cfg, ids, time);
    broker->setOrderFilledCallback(
        [this](const optexec::OrderFilledEvent& e) { events.push_back(e); });
  }

  void tick(double price) {
    optexec::MarketDataEvent e;
    e.symbol = ce.symbol;
    e.token = ce.token;
    e.price = price;
    broker->onTick(e);
  }

  optexec::domain::OrderRequest request(Side side, std::int64_t qty,
                                        OrderKind kind = OrderKind::Market,
                                        double limit = 0.0,
                                        double trigger = 0.0) {
    optexec::domain::OrderRequest r;
    r.contract = ce;
    r.side = side;
    r.quantity = qty;
    r.kind = kind;
    r.limit_price = limit;
    r.trigger_price = trigger;
    return r;
  }

  optexec::config::PaperBrokerConfig cfg;
  optexec::OrderIdGenerator ids;
  optexec::SimulationTimeProvider time{1'700'000'000'000};
  optexec::domain::Contract ce =
      optexec::testing::makeOption("NIFTY25000CE", "40001");
  std::unique_ptr<optexec::broker::PaperBroker> broker;
  std::vector<optexec::OrderFilledEvent> events;
};

// -----------------------------------------------------------------------------
// 1. With a known price a market buy fills at once and debits cash.
// -----------------------------------------------------------------------------
TEST_F(PaperBrokerTest, MarketBuyFillsAtLtp) {
  build();
  tick(100.0);
  auto id = broker->placeOrder(request(Side::Buy, 25));

  EXPECT_EQ(broker->getOrderStatus(id), OrderStatus::Filled);
  ASSERT_EQ(events.size(), 1u);
  EXPECT_DOUBLE_EQ(events[0].fill_price, 100.0);
  EXPECT_FALSE(events[0].is_partial);
  EXPECT_DOUBLE_EQ(broker->getAccountBalance(), 97'500.0);
  EXPECT_EQ(broker->heldQuantity(ce.token), 25);
}

// -----------------------------------------------------------------------------
// 2. Without a price the order parks and fills on the first tick.
// -----------------------------------------------------------------------------
TEST_F(PaperBrokerTest, MarketBuyWaitsForFirstTick) {
  build();
  auto id = broker->placeOrder(request(Side::Buy, 25));
  EXPECT_EQ(broker->getOrderStatus(id), OrderStatus::Pending);
  EXPECT_EQ(broker->openOrderCount(), 1u);
  EXPECT_TRUE(events.empty());

  tick(80.0);
  EXPECT_EQ(broker->getOrderStatus(id), OrderStatus::Filled);
  EXPECT_EQ(broker->openOrderCount(), 0u);
  ASSERT_EQ(events.size(), 1u);
  EXPECT_DOUBLE_EQ(events[0].fill_price, 80.0);
}

// -----------------------------------------------------------------------------
// 3. Three slices at half the remainder, cash for only the first:
//    slice 1 = 50 @ 100 (5000 <= 6000), slice 2 = 25 @ 100 (2500 > 1000).
// -----------------------------------------------------------------------------
TEST_F(PaperBrokerTest, CashShortfallLeavesPartialFill) {
  cfg.starting_capital = 6000.0;
  cfg.min_fill_slices = 3;
  cfg.max_fill_slices = 3;
  cfg.multi_fill_min_quantity = 50;
  build();
  tick(100.0);

  auto id = broker->placeOrder(request(Side::Buy, 100));

  EXPECT_EQ(broker->getOrderStatus(id), OrderStatus::Partial);
  ASSERT_EQ(events.size(), 1u);
  EXPECT_EQ(events[0].filled_quantity, 50);
  EXPECT_EQ(events[0].total_quantity, 100);
  EXPECT_TRUE(events[0].is_partial);
  EXPECT_DOUBLE_EQ(broker->getAccountBalance(), 1000.0);
  ASSERT_EQ(broker->getFills(id).size(), 1u);
}

// -----------------------------------------------------------------------------
// 4. Enough cash: every slice is reported with cumulative state, and the
//    fills sum to the order quantity.
// -----------------------------------------------------------------------------
TEST_F(PaperBrokerTest, MultiSliceFillReportsCumulativeState) {
  cfg.min_fill_slices = 3;
  cfg.max_fill_slices = 3;
  cfg.multi_fill_min_quantity = 50;
  build();
  tick(100.0);

  auto id = broker->placeOrder(request(Side::Buy, 100));

  // 50, then 25, then the remaining 25.
  ASSERT_EQ(events.size(), 3u);
  EXPECT_EQ(events[0].filled_quantity, 50);
  EXPECT_EQ(events[1].filled_quantity, 75);
  EXPECT_EQ(events[2].filled_quantity, 100);
  EXPECT_FALSE(events[2].is_partial);
  ASSERT_EQ(events[2].fills.size(), 3u);
  EXPECT_EQ(events[2].fills[2].sequence, 3u);
  EXPECT_EQ(broker->getOrderStatus(id), OrderStatus::Filled);
}

// -----------------------------------------------------------------------------
// 5. Not even one slice affordable: REJECTED, no event.
// -----------------------------------------------------------------------------
TEST_F(PaperBrokerTest, NoCashRejects) {
  cfg.starting_capital = 100.0;
  build();
  tick(100.0);

  auto id = broker->placeOrder(request(Side::Buy, 25));
  EXPECT_EQ(broker->getOrderStatus(id), OrderStatus::Rejected);
  EXPECT_TRUE(events.empty());
}

// -----------------------------------------------------------------------------
// 6. A market sell credits cash and reduces holdings.
// -----------------------------------------------------------------------------
TEST_F(PaperBrokerTest, MarketSellCreditsCash) {
  build();
  tick(100.0);
  broker->placeOrder(request(Side::Buy, 25));
  tick(120.0);
  auto sell = broker->placeOrder(request(Side::Sell, 25));

  EXPECT_EQ(broker->getOrderStatus(sell), OrderStatus::Filled);
  EXPECT_EQ(broker->heldQuantity(ce.token), 0);
  EXPECT_DOUBLE_EQ(broker->getAccountBalance(), 100'500.0);
}

// -----------------------------------------------------------------------------
// 7. A buy limit rests until LTP falls to it; a sell limit until LTP rises.
// -----------------------------------------------------------------------------
TEST_F(PaperBrokerTest, LimitOrdersFillWhenCrossed) {
  build();
  tick(100.0);
  auto buy = broker->placeOrder(request(Side::Buy, 25, OrderKind::Limit, 95.0));
  EXPECT_EQ(broker->getOrderStatus(buy), OrderStatus::Pending);

  tick(96.0);
  EXPECT_EQ(broker->getOrderStatus(buy), OrderStatus::Pending);
  tick(94.0);
  EXPECT_EQ(broker->getOrderStatus(buy), OrderStatus::Filled);
  EXPECT_DOUBLE_EQ(events.back().fill_price, 94.0);

  auto sell =
      broker->placeOrder(request(Side::Sell, 25, OrderKind::Limit, 110.0));
  tick(109.0);
  EXPECT_EQ(broker->getOrderStatus(sell), OrderStatus::Pending);
  tick(111.0);
  EXPECT_EQ(broker->getOrderStatus(sell), OrderStatus::Filled);
}

// -----------------------------------------------------------------------------
// 8. A sell stop triggers at or below its trigger and fills at that tick.
// -----------------------------------------------------------------------------
TEST_F(PaperBrokerTest, SellStopTriggersOnTick) {
  build();
  tick(100.0);
  broker->placeOrder(request(Side::Buy, 25));
  auto stop =
      broker->placeOrder(request(Side::Sell, 25, OrderKind::Stop, 0.0, 90.0));

  tick(91.0);
  EXPECT_EQ(broker->getOrderStatus(stop), OrderStatus::Pending);
  tick(89.5);
  EXPECT_EQ(broker->getOrderStatus(stop), OrderStatus::Filled);
  EXPECT_DOUBLE_EQ(events.back().fill_price, 89.5);
  EXPECT_EQ(broker->heldQuantity(ce.token), 0);
}

// -----------------------------------------------------------------------------
// 9. Cancel works on open orders only.
// -----------------------------------------------------------------------------
TEST_F(PaperBrokerTest, CancelOnlyOpenOrders) {
  build();
  tick(100.0);
  auto stop =
      broker->placeOrder(request(Side::Sell, 25, OrderKind::Stop, 0.0, 90.0));
  auto filled = broker->placeOrder(request(Side::Buy, 25));

  EXPECT_TRUE(broker->cancelOrder(stop));
  EXPECT_EQ(broker->getOrderStatus(stop), OrderStatus::Cancelled);
  EXPECT_FALSE(broker->cancelOrder(stop));
  EXPECT_FALSE(broker->cancelOrder(filled));
  EXPECT_FALSE(broker->cancelOrder(987654));

  tick(80.0);
  EXPECT_EQ(broker->getOrderStatus(stop), OrderStatus::Cancelled);
}

// -----------------------------------------------------------------------------
// 10. An unfilled limit is cancelled after limit_expiry_ms.
// -----------------------------------------------------------------------------
TEST_F(PaperBrokerTest, UnfilledLimitExpires) {
  cfg.limit_expiry_ms = 20;
  build();
  tick(100.0);
  auto id = broker->placeOrder(request(Side::Buy, 25, OrderKind::Limit, 50.0));

  for (int i = 0; i < 200 && broker->getOrderStatus(id) != OrderStatus::Cancelled;
       ++i) {
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  EXPECT_EQ(broker->getOrderStatus(id), OrderStatus::Cancelled);
  EXPECT_EQ(broker->openOrderCount(), 0u);
}

// -----------------------------------------------------------------------------
// 11. Malformed requests are refused outright.
// -----------------------------------------------------------------------------
TEST_F(PaperBrokerTest, InvalidRequestsThrow) {
  build();
  EXPECT_THROW(broker->placeOrder(request(Side::Buy, 0)),
               optexec::BrokerRejected);
  EXPECT_THROW(broker->placeOrder(request(Side::Buy, 25, OrderKind::Limit)),
               optexec::BrokerRejected);
  EXPECT_THROW(broker->placeOrder(request(Side::Sell, 25, OrderKind::Stop)),
               optexec::BrokerRejected);

  auto r = request(Side::Buy, 25);
  r.id = 500;
  broker->placeOrder(r);
  EXPECT_THROW(broker->placeOrder(r), optexec::BrokerRejected);
}

// -----------------------------------------------------------------------------
// 12. A throwing callback does not break the broker.
// -----------------------------------------------------------------------------
TEST_F(PaperBrokerTest, ThrowingCallbackContained) {
  build();
  broker->setOrderFilledCallback([](const optexec::OrderFilledEvent&) {
    throw std::runtime_error("consumer failed");
  });
  tick(100.0);
  optexec::domain::OrderId id = 0;
  EXPECT_NO_THROW(id = broker->placeOrder(request(Side::Buy, 25)));
  EXPECT_EQ(broker->getOrderStatus(id), OrderStatus::Filled);
}
