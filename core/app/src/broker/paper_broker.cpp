#include "optexec/broker/paper_broker.hpp"
#include "optexec/errors.hpp"
#include "optexec/time/time_utils.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <iostream>

namespace optexec {
namespace broker {

namespace {

std::mt19937 makeRng(const std::optional<std::uint32_t>& seed) {
  if (seed) {
    return std::mt19937(*seed);
  }
  std::random_device rd;
  return std::mt19937(rd());
}

bool limitCrossed(const domain::Order& order, double ltp) {
  if (order.side == domain::Side::Buy) {
    return ltp <= order.limit_price;
  }
  return ltp >= order.limit_price;
}

bool stopTriggered(const domain::Order& order, double ltp) {
  if (order.side == domain::Side::Sell) {
    return ltp <= order.trigger_price;
  }
  return ltp >= order.trigger_price;
}

}  // namespace

PaperBroker::PaperBroker(const config::PaperBrokerConfig& cfg,
                         OrderIdGenerator& ids, const ITimeProvider& time)
    : cfg_(cfg),
      ids_(ids),
      time_(time),
      balance_(cfg.starting_capital),
      rng_(makeRng(cfg.seed)),
      expiry_("paper-expiry") {
  expiry_.start();
}

PaperBroker::~PaperBroker() { expiry_.stop(); }

// -----------------------------------------------------------------------------
// placeOrder: validate, record, match what can be matched now
// -----------------------------------------------------------------------------
domain::OrderId PaperBroker::placeOrder(const domain::OrderRequest& request) {
  if (request.quantity <= 0) {
    throw BrokerRejected("quantity must be positive, got " +
                         std::to_string(request.quantity));
  }
  if (request.kind == domain::OrderKind::Limit && request.limit_price <= 0.0) {
    throw BrokerRejected("LIMIT order without a positive limit price");
  }
  if (request.kind == domain::OrderKind::Stop && request.trigger_price <= 0.0) {
    throw BrokerRejected("STOP order without a positive trigger price");
  }

  const domain::OrderId id =
      request.id != domain::kNoOrderId ? request.id : ids_.next_id();

  EventList events;
  bool schedule_expiry = false;
  {
    std::lock_guard lock(mutex_);
    if (orders_.count(id) > 0) {
      throw BrokerRejected("duplicate order id " + std::to_string(id));
    }

    domain::Order order;
    order.id = id;
    order.contract = request.contract;
    order.side = request.side;
    order.quantity = request.quantity;
    order.kind = request.kind;
    order.limit_price = request.limit_price;
    order.trigger_price = request.trigger_price;
    order.status = domain::OrderStatus::Pending;
    order.placed_at_ms = time_.now_ms();

    domain::Order& placed = orders_.emplace(id, std::move(order)).first->second;
    fills_[id];

    const auto ltp_it = ltp_cache_.find(placed.contract.token);
    const double ltp = ltp_it != ltp_cache_.end() ? ltp_it->second : 0.0;

    switch (placed.kind) {
      case domain::OrderKind::Market:
        if (ltp <= 0.0) {
          awaiting_price_.emplace(id, placed.contract.token);
          std::cout << "[PaperBroker] MARKET order " << id << " for "
                    << placed.contract.symbol << " waiting for first tick.\n";
        } else if (placed.side == domain::Side::Buy) {
          executeMarketBuy(placed, ltp, events);
        } else {
          executeMarketSell(placed, ltp, events);
        }
        break;

      case domain::OrderKind::Limit:
        if (ltp > 0.0 && tryFillLimit(placed, ltp, events)) {
          break;
        }
        if (!domain::isTerminal(placed.status)) {
          open_limits_.emplace(id, placed.contract.token);
          schedule_expiry = true;
        }
        break;

      case domain::OrderKind::Stop:
        open_stops_.emplace(id, placed.contract.token);
        break;
    }
  }

  if (schedule_expiry) {
    expiry_.scheduleAfter(id, std::chrono::milliseconds(cfg_.limit_expiry_ms),
                          [this, id] { expireLimit(id); });
  }

  dispatch(events);
  return id;
}

// -----------------------------------------------------------------------------
// cancelOrder: only open orders can be cancelled
// -----------------------------------------------------------------------------
bool PaperBroker::cancelOrder(domain::OrderId id) {
  bool was_limit = false;
  {
    std::lock_guard lock(mutex_);
    auto it = orders_.find(id);
    if (it == orders_.end() || domain::isTerminal(it->second.status)) {
      return false;
    }

    if (open_limits_.erase(id) > 0) {
      was_limit = true;
    } else if (awaiting_price_.erase(id) == 0 && open_stops_.erase(id) == 0) {
      return false;
    }
    it->second.status = domain::OrderStatus::Cancelled;
  }

  if (was_limit) {
    expiry_.cancel(id);
  }
  std::cout << "[PaperBroker] Order " << id << " cancelled.\n";
  return true;
}

std::optional<domain::OrderStatus> PaperBroker::getOrderStatus(
    domain::OrderId id) const {
  std::lock_guard lock(mutex_);
  auto it = orders_.find(id);
  if (it == orders_.end()) {
    return std::nullopt;
  }
  return it->second.status;
}

double PaperBroker::getLtp(const domain::Contract& contract) const {
  std::lock_guard lock(mutex_);
  auto it = ltp_cache_.find(contract.token);
  return it != ltp_cache_.end() ? it->second : 0.0;
}

double PaperBroker::getAccountBalance() const {
  std::lock_guard lock(mutex_);
  return balance_;
}

void PaperBroker::setOrderFilledCallback(OrderFilledCallback callback) {
  std::lock_guard lock(mutex_);
  callback_ = std::move(callback);
}

// -----------------------------------------------------------------------------
// onTick: cache, then parked markets, limits, stops
// -----------------------------------------------------------------------------
void PaperBroker::onTick(const MarketDataEvent& tick) {
  if (tick.price <= 0.0) {
    return;
  }

  EventList events;
  std::vector<domain::OrderId> filled_limits;
  {
    std::lock_guard lock(mutex_);
    ltp_cache_[tick.token] = tick.price;

    for (auto it = awaiting_price_.begin(); it != awaiting_price_.end();) {
      if (it->second != tick.token) {
        ++it;
        continue;
      }
      domain::Order& order = orders_.at(it->first);
      it = awaiting_price_.erase(it);
      if (order.side == domain::Side::Buy) {
        executeMarketBuy(order, tick.price, events);
      } else {
        executeMarketSell(order, tick.price, events);
      }
    }

    for (auto it = open_limits_.begin(); it != open_limits_.end();) {
      if (it->second != tick.token) {
        ++it;
        continue;
      }
      domain::Order& order = orders_.at(it->first);
      if (tryFillLimit(order, tick.price, events)) {
        filled_limits.push_back(it->first);
        it = open_limits_.erase(it);
      } else {
        ++it;
      }
    }

    for (auto it = open_stops_.begin(); it != open_stops_.end();) {
      if (it->second != tick.token) {
        ++it;
        continue;
      }
      domain::Order& order = orders_.at(it->first);
      if (stopTriggered(order, tick.price)) {
        triggerStop(order, tick.price, events);
        it = open_stops_.erase(it);
      } else {
        ++it;
      }
    }
  }

  for (domain::OrderId id : filled_limits) {
    expiry_.cancel(id);
  }
  dispatch(events);
}

// -----------------------------------------------------------------------------
// Queries
// -----------------------------------------------------------------------------
std::optional<domain::Order> PaperBroker::getOrder(domain::OrderId id) const {
  std::lock_guard lock(mutex_);
  auto it = orders_.find(id);
  if (it == orders_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<domain::Fill> PaperBroker::getFills(domain::OrderId id) const {
  std::lock_guard lock(mutex_);
  auto it = fills_.find(id);
  if (it == fills_.end()) {
    return {};
  }
  return it->second;
}

std::int64_t PaperBroker::heldQuantity(const std::string& token) const {
  std::lock_guard lock(mutex_);
  auto it = holdings_.find(token);
  return it != holdings_.end() ? it->second : 0;
}

std::size_t PaperBroker::openOrderCount() const {
  std::lock_guard lock(mutex_);
  return awaiting_price_.size() + open_limits_.size() + open_stops_.size();
}

// -----------------------------------------------------------------------------
// executeMarketBuy: randomized slices until done or out of cash
// -----------------------------------------------------------------------------
void PaperBroker::executeMarketBuy(domain::Order& order, double ltp,
                                   EventList& out) {
  int slices = 1;
  if (order.quantity >= cfg_.multi_fill_min_quantity &&
      cfg_.max_fill_slices > 1) {
    std::uniform_int_distribution<int> dist(cfg_.min_fill_slices,
                                            cfg_.max_fill_slices);
    slices = dist(rng_);
  }

  for (int i = 0; i < slices; ++i) {
    const std::int64_t remaining = order.quantity - order.filled_quantity;
    if (remaining <= 0) {
      break;
    }

    const double price = jitteredPrice(ltp);
    std::int64_t qty = remaining;
    if (i < slices - 1) {
      qty = static_cast<std::int64_t>(
          std::floor(static_cast<double>(remaining) * sliceFraction()));
      if (qty <= 0) {
        continue;
      }
    }

    const double cost = price * static_cast<double>(qty);
    if (cost > balance_) {
      std::cerr << "[PaperBroker] WARNING: insufficient cash for slice of "
                << qty << " @ " << price << " on order " << order.id
                << " (balance=" << balance_ << ").\n";
      break;
    }

    balance_ -= cost;
    recordFill(order, qty, price, out);
  }

  if (order.filled_quantity == 0) {
    order.status = domain::OrderStatus::Rejected;
    std::cerr << "[PaperBroker] Order " << order.id
              << " REJECTED: nothing could be filled.\n";
    return;
  }

  holdings_[order.contract.token] += order.filled_quantity;
}

// -----------------------------------------------------------------------------
// executeMarketSell: single fill at LTP
// -----------------------------------------------------------------------------
void PaperBroker::executeMarketSell(domain::Order& order, double ltp,
                                    EventList& out) {
  std::int64_t& held = holdings_[order.contract.token];
  if (held < order.quantity) {
    std::cerr << "[PaperBroker] WARNING: selling " << order.quantity << " of "
              << order.contract.symbol << " with only " << held << " held.\n";
  }
  held = std::max<std::int64_t>(0, held - order.quantity);
  balance_ += ltp * static_cast<double>(order.quantity);
  recordFill(order, order.quantity, ltp, out);
}

// -----------------------------------------------------------------------------
// tryFillLimit: whole quantity at LTP when the limit is crossed
// -----------------------------------------------------------------------------
bool PaperBroker::tryFillLimit(domain::Order& order, double ltp,
                               EventList& out) {
  if (!limitCrossed(order, ltp)) {
    return false;
  }

  if (order.side == domain::Side::Buy) {
    const double cost = ltp * static_cast<double>(order.quantity);
    if (cost > balance_) {
      order.status = domain::OrderStatus::Rejected;
      std::cerr << "[PaperBroker] LIMIT order " << order.id
                << " REJECTED: insufficient cash (cost=" << cost
                << ", balance=" << balance_ << ").\n";
      return true;
    }
    balance_ -= cost;
    holdings_[order.contract.token] += order.quantity;
    recordFill(order, order.quantity, ltp, out);
    return true;
  }

  executeMarketSell(order, ltp, out);
  return true;
}

// -----------------------------------------------------------------------------
// triggerStop: executes market-style at the triggering price
// -----------------------------------------------------------------------------
void PaperBroker::triggerStop(domain::Order& order, double ltp,
                              EventList& out) {
  std::cout << "[PaperBroker] STOP order " << order.id << " triggered at "
            << ltp << " (trigger=" << order.trigger_price << ").\n";

  if (order.side == domain::Side::Sell) {
    executeMarketSell(order, ltp, out);
    return;
  }

  const double cost = ltp * static_cast<double>(order.quantity);
  if (cost > balance_) {
    order.status = domain::OrderStatus::Rejected;
    std::cerr << "[PaperBroker] STOP order " << order.id
              << " REJECTED: insufficient cash.\n";
    return;
  }
  balance_ -= cost;
  holdings_[order.contract.token] += order.quantity;
  recordFill(order, order.quantity, ltp, out);
}

// -----------------------------------------------------------------------------
// recordFill: append, update cumulative state, queue one event
// -----------------------------------------------------------------------------
void PaperBroker::recordFill(domain::Order& order, std::int64_t quantity,
                             double price, EventList& out) {
  std::vector<domain::Fill>& fills = fills_[order.id];

  domain::Fill fill;
  fill.order_id = order.id;
  fill.quantity = quantity;
  fill.price = price;
  fill.sequence = static_cast<std::uint32_t>(fills.size() + 1);
  fill.time_ms = time_.now_ms();
  fills.push_back(fill);

  const double prev_notional =
      order.average_fill_price * static_cast<double>(order.filled_quantity);
  order.filled_quantity += quantity;
  order.average_fill_price =
      (prev_notional + price * static_cast<double>(quantity)) /
      static_cast<double>(order.filled_quantity);
  order.status = order.filled_quantity >= order.quantity
                     ? domain::OrderStatus::Filled
                     : domain::OrderStatus::Partial;

  out.push_back(buildEvent(order));
}

OrderFilledEvent PaperBroker::buildEvent(const domain::Order& order) const {
  OrderFilledEvent event;
  event.order_id = order.id;
  event.contract = order.contract;
  event.side = order.side;
  event.fill_price = order.average_fill_price;
  event.total_quantity = order.quantity;
  event.filled_quantity = order.filled_quantity;
  event.is_partial = order.filled_quantity < order.quantity;
  event.timestamp = ms_to_timestamp(time_.now_ms());

  auto it = fills_.find(order.id);
  if (it != fills_.end()) {
    event.fills = it->second;
  }
  return event;
}

double PaperBroker::jitteredPrice(double ltp) {
  if (cfg_.price_jitter_percent <= 0.0) {
    return ltp;
  }
  std::uniform_real_distribution<double> dist(-cfg_.price_jitter_percent,
                                              cfg_.price_jitter_percent);
  return ltp * (1.0 + dist(rng_) / 100.0);
}

double PaperBroker::sliceFraction() {
  if (cfg_.slice_fraction_min >= cfg_.slice_fraction_max) {
    return cfg_.slice_fraction_min;
  }
  std::uniform_real_distribution<double> dist(cfg_.slice_fraction_min,
                                              cfg_.slice_fraction_max);
  return dist(rng_);
}

// -----------------------------------------------------------------------------
// expireLimit: scheduler thread; the order may have filled in the meantime
// -----------------------------------------------------------------------------
void PaperBroker::expireLimit(domain::OrderId id) {
  {
    std::lock_guard lock(mutex_);
    if (open_limits_.erase(id) == 0) {
      return;
    }
    auto it = orders_.find(id);
    if (it == orders_.end() || domain::isTerminal(it->second.status)) {
      return;
    }
    it->second.status = domain::OrderStatus::Cancelled;
  }
  std::cout << "[PaperBroker] LIMIT order " << id
            << " expired unfilled after " << cfg_.limit_expiry_ms
            << " ms; cancelled.\n";
}

// -----------------------------------------------------------------------------
// dispatch: callback outside the lock, exceptions contained
// -----------------------------------------------------------------------------
void PaperBroker::dispatch(const EventList& events) {
  if (events.empty()) {
    return;
  }

  OrderFilledCallback callback;
  {
    std::lock_guard lock(mutex_);
    callback = callback_;
  }
  if (!callback) {
    return;
  }

  for (const OrderFilledEvent& event : events) {
    try {
      callback(event);
    } catch (const std::exception& e) {
      std::cerr << "[PaperBroker] ERROR: fill callback for order "
                << event.order_id << " threw: " << e.what() << "\n";
    }
  }
}

}  // namespace broker
}  // namespace optexec
