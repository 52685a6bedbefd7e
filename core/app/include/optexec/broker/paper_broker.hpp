#pragma once

#include "optexec/broker/i_broker.hpp"
#include "optexec/concurrent/order_id_generator.hpp"
#include "optexec/concurrent/task_scheduler.hpp"
#include "optexec/config/engine_config.hpp"
#include "optexec/domain/fill.hpp"
#include "optexec/events/event_types.hpp"
#include "optexec/time/i_time_provider.hpp"

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <unordered_map>
#include <vector>

namespace optexec {
namespace broker {

// -----------------------------------------------------------------------------
// PaperBroker — simulated matching engine
// -----------------------------------------------------------------------------
//
// @brief  IBroker implementation that fills orders against the last traded
//         price it has seen, with randomized slicing for larger market buys.
//
// @details
// Matching rules:
//
//   MARKET BUY   Price known: fills immediately in a random number of
//                slices (min_fill_slices..max_fill_slices) when quantity
//                >= multi_fill_min_quantity, otherwise in one. Each slice
//                takes slice_fraction_min..max of the remainder (the last
//                slice takes all of it) at LTP ± price_jitter_percent.
//                Slicing stops as soon as a slice costs more than the cash
//                balance. Nothing filled -> REJECTED; some -> PARTIAL.
//                Price unknown: parked until the first tick for the token.
//   MARKET SELL  One fill for the whole quantity at LTP; reduces the held
//                quantity for the token and credits price × quantity.
//   LIMIT        BUY fills at LTP when LTP <= limit, SELL when LTP >= limit,
//                checked at placement (if a price is known) and on every
//                tick. Unfilled limits expire after limit_expiry_ms and are
//                CANCELLED.
//   STOP         Checked on ticks only. SELL triggers at LTP <= trigger, BUY
//                at LTP >= trigger; fills market-style at LTP.
//
// onTick() updates the LTP cache first, then evaluates parked market
// orders, limits and stops, in that order, each at most once per tick.
//
// Fill reporting: one callback per slice. Every event carries the order's
// cumulative state and the full fill list so far.
//
// Thread model:
//   One mutex guards all tables. Fill events produced under the lock are
//   collected and the callback is invoked after it is released; a callback
//   that throws std::exception is logged and does not affect the broker.
//   Limit expiry runs on the broker's own TaskScheduler thread.
//
// Ownership: owns its TaskScheduler; references the id generator and time
// provider owned by TradingEngine.
// -----------------------------------------------------------------------------
class PaperBroker final : public IBroker {
 public:
  PaperBroker(const config::PaperBrokerConfig& cfg, OrderIdGenerator& ids,
              const ITimeProvider& time);

  ~PaperBroker() override;

  PaperBroker(const PaperBroker&) = delete;
  PaperBroker& operator=(const PaperBroker&) = delete;
  PaperBroker(PaperBroker&&) = delete;
  PaperBroker& operator=(PaperBroker&&) = delete;

  // -------------------------------------------------------------------------
  // IBroker
  // -------------------------------------------------------------------------
  // @throws BrokerRejected for a non-positive quantity, a duplicate id, or a
  //         LIMIT/STOP without a positive price.
  domain::OrderId placeOrder(const domain::OrderRequest& request) override;

  bool cancelOrder(domain::OrderId id) override;

  std::optional<domain::OrderStatus> getOrderStatus(
      domain::OrderId id) const override;

  double getLtp(const domain::Contract& contract) const override;

  double getAccountBalance() const override;

  void setOrderFilledCallback(OrderFilledCallback callback) override;

  // -------------------------------------------------------------------------
  // Market data hook, called from the market loop for every tick.
  // -------------------------------------------------------------------------
  void onTick(const MarketDataEvent& tick);

  // Snapshot of an order as the broker sees it.
  std::optional<domain::Order> getOrder(domain::OrderId id) const;

  std::vector<domain::Fill> getFills(domain::OrderId id) const;

  // Net quantity bought and not yet sold, per token.
  std::int64_t heldQuantity(const std::string& token) const;

  // Orders still waiting on price, limit or trigger.
  std::size_t openOrderCount() const;

 private:
  using EventList = std::vector<OrderFilledEvent>;

  // All private helpers below expect mutex_ to be held.
  void executeMarketBuy(domain::Order& order, double ltp, EventList& out);
  void executeMarketSell(domain::Order& order, double ltp, EventList& out);
  bool tryFillLimit(domain::Order& order, double ltp, EventList& out);
  void triggerStop(domain::Order& order, double ltp, EventList& out);
  void recordFill(domain::Order& order, std::int64_t quantity, double price,
                  EventList& out);
  OrderFilledEvent buildEvent(const domain::Order& order) const;
  double jitteredPrice(double ltp);
  double sliceFraction();

  void expireLimit(domain::OrderId id);
  void dispatch(const EventList& events);

  const config::PaperBrokerConfig cfg_;
  OrderIdGenerator& ids_;
  const ITimeProvider& time_;

  mutable std::mutex mutex_;
  double balance_{0.0};
  std::mt19937 rng_;
  OrderFilledCallback callback_;

  std::unordered_map<domain::OrderId, domain::Order> orders_;
  std::unordered_map<domain::OrderId, std::vector<domain::Fill>> fills_;
  std::unordered_map<std::string, double> ltp_cache_;      // token -> LTP
  std::unordered_map<std::string, std::int64_t> holdings_;  // token -> qty

  // Open orders by kind. std::map keeps evaluation in placement order.
  std::map<domain::OrderId, std::string> awaiting_price_;  // id -> token
  std::map<domain::OrderId, std::string> open_limits_;
  std::map<domain::OrderId, std::string> open_stops_;

  TaskScheduler expiry_;
};

}  // namespace broker
}  // namespace optexec
