#include "optexec/execution/exit_controller.hpp"
#include "optexec/errors.hpp"
#include "optexec/time/time_utils.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>
#include <string>
#include <utility>

namespace optexec {
namespace execution {

namespace {

const char* legName(bool stop) { return stop ? "stop" : "target"; }

}  // namespace

ExitController::ExitController(broker::IBroker& broker,
                               ExecutionController& execution,
                               risk::RiskGovernor& risk,
                               store::IPositionStore& store,
                               OrderIdGenerator& ids,
                               const market::MarketClock& clock,
                               const ITimeProvider& time,
                               const config::ExitConfig& cfg,
                               store::ITradeJournal* journal, EventSink sink)
    : broker_(broker),
      execution_(execution),
      risk_(risk),
      store_(store),
      ids_(ids),
      clock_(clock),
      time_(time),
      cfg_(cfg),
      journal_(journal),
      sink_(std::move(sink)) {}

// -----------------------------------------------------------------------------
// registerPosition: compute stop/target, then place broker legs
// -----------------------------------------------------------------------------
void ExitController::registerPosition(const domain::OpenPosition& position) {
  const double entry = position.average_entry_price;
  if (!(entry > 0.0)) {
    throw InvalidState("cannot register order " +
                       std::to_string(position.order_id) +
                       ": entry price must be > 0, got " +
                       std::to_string(entry));
  }
  if (position.quantity_filled <= 0) {
    throw InvalidState("cannot register order " +
                       std::to_string(position.order_id) +
                       ": nothing filled");
  }

  const double initial_stop = entry * (1.0 - cfg_.stop_loss_percent / 100.0);
  const double target = cfg_.take_profit_enabled
                            ? entry * (1.0 + cfg_.take_profit_percent / 100.0)
                            : std::numeric_limits<double>::infinity();

  bool refreshed = false;
  bool exited = false;
  domain::ExitState snapshot;
  {
    std::lock_guard lock(mutex_);
    auto it = states_.find(position.order_id);
    if (exited_.count(position.order_id) > 0) {
      exited = true;
    } else if (it != states_.end()) {
      domain::ExitState& s = it->second;
      s.quantity = position.quantity_filled;
      s.entry_price = entry;
      s.entry_price_original = entry;
      if (!s.breakeven_engaged && initial_stop > s.stop_loss_price) {
        s.stop_loss_price = initial_stop;
      }
      s.take_profit_price = target;
      refreshed = true;
      snapshot = s;
    } else {
      domain::ExitState s;
      s.order_id = position.order_id;
      s.contract = position.contract;
      s.signal = position.signal;
      s.quantity = position.quantity_filled;
      s.entry_price = entry;
      s.entry_price_original = entry;
      s.stop_loss_price = initial_stop;
      s.take_profit_price = target;
      s.highest_price = entry;
      s.lowest_price = entry;
      snapshot = s;
      states_.emplace(position.order_id, std::move(s));
    }
  }

  if (exited) {
    std::cerr << "[ExitController] WARNING: order " << position.order_id
              << " was already exited; registration ignored.\n";
    return;
  }

  std::cout << "[ExitController] " << (refreshed ? "Refreshed" : "Registered")
            << " order " << snapshot.order_id << " " << snapshot.contract.symbol
            << " qty=" << snapshot.quantity << " entry=" << entry
            << " SL=" << snapshot.stop_loss_price
            << " TP=" << snapshot.take_profit_price << "\n";

  if (cfg_.use_broker_exit_orders) {
    placeBrokerLegs(position.order_id);
  }
}

// -----------------------------------------------------------------------------
// placeBrokerLegs: (re)place STOP and LIMIT legs for the current quantity
// -----------------------------------------------------------------------------
void ExitController::placeBrokerLegs(domain::OrderId order_id) {
  domain::ExitState snapshot;
  domain::OrderId old_stop = domain::kNoOrderId;
  domain::OrderId old_target = domain::kNoOrderId;
  {
    std::lock_guard lock(mutex_);
    auto it = states_.find(order_id);
    if (it == states_.end()) {
      return;
    }
    snapshot = it->second;
    old_stop = std::exchange(it->second.broker_stop_order_id,
                             domain::kNoOrderId);
    old_target = std::exchange(it->second.broker_target_order_id,
                               domain::kNoOrderId);
  }

  cancelLeg(old_stop, "stop");
  cancelLeg(old_target, "target");

  const domain::OrderId stop_id = placeLeg(snapshot, LegKind::Stop);
  const domain::OrderId target_id = cfg_.take_profit_enabled
                                        ? placeLeg(snapshot, LegKind::Target)
                                        : domain::kNoOrderId;

  bool orphaned = false;
  {
    std::lock_guard lock(mutex_);
    auto it = states_.find(order_id);
    if (it == states_.end()) {
      orphaned = true;
    } else {
      it->second.broker_stop_order_id = stop_id;
      it->second.broker_target_order_id = target_id;
      if (stop_id != domain::kNoOrderId) {
        it->second.last_broker_stop_price = snapshot.stop_loss_price;
      }
    }
  }

  if (orphaned) {
    // Exited while the legs were being placed.
    cancelLeg(stop_id, "stop");
    cancelLeg(target_id, "target");
    return;
  }

  if (stop_id == domain::kNoOrderId) {
    std::cerr << "[ExitController] WARNING: order " << order_id
              << " stop leg falls back to software monitoring.\n";
  }
  if (cfg_.take_profit_enabled && target_id == domain::kNoOrderId) {
    std::cerr << "[ExitController] WARNING: order " << order_id
              << " target leg falls back to software monitoring.\n";
  }
}

// -----------------------------------------------------------------------------
// placeLeg: id registered before the request leaves
// -----------------------------------------------------------------------------
domain::OrderId ExitController::placeLeg(const domain::ExitState& state,
                                         LegKind kind) {
  const domain::OrderId id = ids_.next_id();
  {
    std::lock_guard lock(mutex_);
    exit_orders_[id] = ExitLeg{state.order_id, kind, state.quantity};
  }

  domain::OrderRequest request;
  request.id = id;
  request.contract = state.contract;
  request.side = domain::Side::Sell;
  request.quantity = state.quantity;
  switch (kind) {
    case LegKind::Stop:
      request.kind = domain::OrderKind::Stop;
      request.trigger_price = state.stop_loss_price;
      break;
    case LegKind::Target:
      request.kind = domain::OrderKind::Limit;
      request.limit_price = state.take_profit_price;
      break;
    case LegKind::Market:
      request.kind = domain::OrderKind::Market;
      break;
  }

  try {
    broker_.placeOrder(request);
  } catch (const std::exception& e) {
    std::cerr << "[ExitController] ERROR: "
              << domain::orderKindToString(request.kind)
              << " SELL for order " << state.order_id
              << " refused: " << e.what() << "\n";
    forgetLeg(id);
    return domain::kNoOrderId;
  }

  if (broker_.getOrderStatus(id) == domain::OrderStatus::Rejected) {
    std::cerr << "[ExitController] ERROR: "
              << domain::orderKindToString(request.kind)
              << " SELL for order " << state.order_id << " REJECTED.\n";
    forgetLeg(id);
    return domain::kNoOrderId;
  }

  if (kind != LegKind::Market) {
    std::cout << "[ExitController] Broker " << legName(kind == LegKind::Stop)
              << " " << id << " placed for order " << state.order_id << " @ "
              << (kind == LegKind::Stop ? request.trigger_price
                                        : request.limit_price)
              << "\n";
  }
  return id;
}

// -----------------------------------------------------------------------------
// onTick: watermarks, mark-to-market, software legs
// -----------------------------------------------------------------------------
void ExitController::onTick(const MarketDataEvent& tick) {
  if (tick.price <= 0.0) {
    return;
  }

  std::vector<domain::ExitState> matching;
  {
    std::lock_guard lock(mutex_);
    for (auto& [id, s] : states_) {
      if (s.contract.token != tick.token) {
        continue;
      }
      s.highest_price = std::max(s.highest_price, tick.price);
      s.lowest_price = std::min(s.lowest_price, tick.price);
      matching.push_back(s);
    }
  }
  if (matching.empty()) {
    return;
  }

  store_.markToMarket(matching.front().contract, tick.price);

  if (cfg_.use_broker_exit_orders) {
    refreshLegHealth(matching);
  }

  std::vector<Breach> breaches;
  {
    std::lock_guard lock(mutex_);
    for (const domain::ExitState& seen : matching) {
      auto it = states_.find(seen.order_id);
      if (it == states_.end()) {
        continue;
      }
      const domain::ExitState& s = it->second;
      if (s.broker_stop_order_id == domain::kNoOrderId &&
          tick.price <= s.stop_loss_price) {
        breaches.push_back({s.order_id, tick.price,
                            domain::ExitReason::StopLoss});
      } else if (cfg_.take_profit_enabled &&
                 s.broker_target_order_id == domain::kNoOrderId &&
                 tick.price >= s.take_profit_price) {
        breaches.push_back({s.order_id, tick.price,
                            domain::ExitReason::Target});
      }
    }
  }

  for (const Breach& breach : breaches) {
    exitPositionInternal(breach.order_id, breach.price, breach.reason,
                         domain::kNoOrderId, 0);
  }
}

// -----------------------------------------------------------------------------
// refreshLegHealth: legs the broker dropped become software legs
// -----------------------------------------------------------------------------
void ExitController::refreshLegHealth(
    const std::vector<domain::ExitState>& states) {
  for (const domain::ExitState& s : states) {
    for (const bool is_stop : {true, false}) {
      const domain::OrderId leg =
          is_stop ? s.broker_stop_order_id : s.broker_target_order_id;
      if (leg == domain::kNoOrderId) {
        continue;
      }
      const std::optional<domain::OrderStatus> status =
          broker_.getOrderStatus(leg);
      if (status != domain::OrderStatus::Cancelled &&
          status != domain::OrderStatus::Rejected) {
        continue;
      }

      std::lock_guard lock(mutex_);
      exit_orders_.erase(leg);
      auto it = states_.find(s.order_id);
      if (it == states_.end()) {
        continue;
      }
      domain::OrderId& current = is_stop ? it->second.broker_stop_order_id
                                         : it->second.broker_target_order_id;
      if (current == leg) {
        current = domain::kNoOrderId;
        std::cerr << "[ExitController] WARNING: broker " << legName(is_stop)
                  << " " << leg << " for order " << s.order_id << " is "
                  << domain::orderStatusToString(*status)
                  << "; watching in software.\n";
      }
    }
  }
}

// -----------------------------------------------------------------------------
// onCandleClose: breakeven latch, then raise-only trailing
// -----------------------------------------------------------------------------
void ExitController::onCandleClose(const CandleEvent& /*candle*/) {
  std::vector<std::pair<domain::OrderId, domain::Contract>> tracked;
  {
    std::lock_guard lock(mutex_);
    tracked.reserve(states_.size());
    for (const auto& [id, s] : states_) {
      tracked.emplace_back(id, s.contract);
    }
  }

  std::vector<domain::OrderId> replace;
  for (const auto& [id, contract] : tracked) {
    const double ltp = broker_.getLtp(contract);
    if (ltp <= 0.0) {
      continue;
    }

    std::lock_guard lock(mutex_);
    auto it = states_.find(id);
    if (it == states_.end()) {
      continue;
    }
    domain::ExitState& s = it->second;
    s.highest_price = std::max(s.highest_price, ltp);
    s.lowest_price = std::min(s.lowest_price, ltp);

    bool moved = false;

    if (cfg_.breakeven_enabled && !s.breakeven_engaged &&
        s.entry_price_original > 0.0) {
      const double profit_pct =
          (ltp - s.entry_price_original) / s.entry_price_original * 100.0;
      if (profit_pct >= cfg_.breakeven_trigger_percent) {
        s.breakeven_engaged = true;
        if (s.entry_price_original > s.stop_loss_price) {
          s.stop_loss_price = s.entry_price_original;
          moved = true;
        }
        std::cout << "[ExitController] Breakeven engaged for order " << id
                  << ": stop " << s.stop_loss_price << "\n";
      }
    }

    if (cfg_.trailing_stop_enabled && !s.breakeven_engaged) {
      const double candidate = ltp * (1.0 - cfg_.stop_loss_percent / 100.0);
      if (candidate > s.stop_loss_price) {
        s.stop_loss_price = candidate;
        moved = true;
      }
    }

    if (moved && s.broker_stop_order_id != domain::kNoOrderId &&
        s.last_broker_stop_price > 0.0) {
      const double change_pct =
          std::abs(s.stop_loss_price - s.last_broker_stop_price) /
          s.last_broker_stop_price * 100.0;
      if (change_pct >= cfg_.stop_update_threshold_percent) {
        replace.push_back(id);
      }
    }
  }

  for (domain::OrderId id : replace) {
    replaceBrokerStop(id);
  }
}

// -----------------------------------------------------------------------------
// replaceBrokerStop: cancel, and re-place only if the cancel succeeded
// -----------------------------------------------------------------------------
void ExitController::replaceBrokerStop(domain::OrderId order_id) {
  domain::ExitState snapshot;
  {
    std::lock_guard lock(mutex_);
    auto it = states_.find(order_id);
    if (it == states_.end() ||
        it->second.broker_stop_order_id == domain::kNoOrderId) {
      return;
    }
    snapshot = it->second;
  }

  const domain::OrderId old_stop = snapshot.broker_stop_order_id;
  bool cancelled = false;
  try {
    cancelled = broker_.cancelOrder(old_stop);
  } catch (const std::exception& e) {
    std::cerr << "[ExitController] WARNING: cancel of stop " << old_stop
              << " failed: " << e.what() << "\n";
    return;
  }
  if (!cancelled) {
    std::cout << "[ExitController] Stop " << old_stop
              << " no longer cancellable; keeping it.\n";
    return;
  }
  forgetLeg(old_stop);

  const domain::OrderId new_stop = placeLeg(snapshot, LegKind::Stop);

  bool orphaned = false;
  {
    std::lock_guard lock(mutex_);
    auto it = states_.find(order_id);
    if (it == states_.end()) {
      orphaned = true;
    } else {
      it->second.broker_stop_order_id = new_stop;
      if (new_stop != domain::kNoOrderId) {
        it->second.last_broker_stop_price = snapshot.stop_loss_price;
      }
    }
  }

  if (orphaned) {
    cancelLeg(new_stop, "stop");
    return;
  }
  if (new_stop == domain::kNoOrderId) {
    std::cerr << "[ExitController] WARNING: stop for order " << order_id
              << " could not be re-placed; watching in software.\n";
    return;
  }
  std::cout << "[ExitController] Stop for order " << order_id << " moved "
            << old_stop << " -> " << new_stop << " @ "
            << snapshot.stop_loss_price << "\n";
}

// -----------------------------------------------------------------------------
// checkSquareoff
// -----------------------------------------------------------------------------
void ExitController::checkSquareoff() {
  if (!clock_.isSquareoffTime()) {
    return;
  }

  std::vector<std::pair<domain::OrderId, domain::Contract>> tracked;
  {
    std::lock_guard lock(mutex_);
    for (const auto& [id, s] : states_) {
      tracked.emplace_back(id, s.contract);
    }
  }

  for (const auto& [id, contract] : tracked) {
    const double ltp = broker_.getLtp(contract);
    if (ltp <= 0.0) {
      std::cerr << "[ExitController] WARNING: square-off of order " << id
                << " waiting for a price on " << contract.symbol << "\n";
      continue;
    }
    exitPositionInternal(id, ltp, domain::ExitReason::Squareoff,
                         domain::kNoOrderId, 0);
  }
}

bool ExitController::exitPosition(domain::OrderId order_id, double exit_price,
                                  domain::ExitReason reason) {
  return exitPositionInternal(order_id, exit_price, reason, domain::kNoOrderId,
                              0);
}

// -----------------------------------------------------------------------------
// onExitOrderFilled: a broker leg executed
// -----------------------------------------------------------------------------
void ExitController::onExitOrderFilled(const OrderFilledEvent& event) {
  ExitLeg leg;
  {
    std::lock_guard lock(mutex_);
    auto it = exit_orders_.find(event.order_id);
    if (it == exit_orders_.end()) {
      std::cerr << "[ExitController] WARNING: fill for unknown exit order "
                << event.order_id << "\n";
      return;
    }
    leg = it->second;
  }

  // Software exit confirmations need nothing more: the close was booked
  // when the MARKET SELL was placed.
  if (leg.kind != LegKind::Market) {
    const domain::ExitReason reason = leg.kind == LegKind::Stop
                                          ? domain::ExitReason::StopLoss
                                          : domain::ExitReason::Target;
    exitPositionInternal(leg.entry_order_id, event.fill_price, reason,
                         event.order_id, leg.quantity);
  }

  if (!event.is_partial) {
    forgetLeg(event.order_id);
  }
}

// -----------------------------------------------------------------------------
// closeAllPositions
// -----------------------------------------------------------------------------
std::size_t ExitController::closeAllPositions(domain::ExitReason reason) {
  std::vector<domain::ExitState> tracked = trackedPositions();
  std::size_t closed = 0;

  for (const domain::ExitState& s : tracked) {
    double price = broker_.getLtp(s.contract);
    if (price <= 0.0) {
      price = s.entry_price;
      std::cerr << "[ExitController] WARNING: no LTP for " << s.contract.symbol
                << "; closing order " << s.order_id << " at entry " << price
                << "\n";
    }
    if (exitPositionInternal(s.order_id, price, reason, domain::kNoOrderId,
                             0)) {
      ++closed;
    }
  }

  if (!tracked.empty()) {
    std::cout << "[ExitController] Closed " << closed << " position(s), reason "
              << domain::exitReasonToString(reason) << "\n";
  }
  return closed;
}

// -----------------------------------------------------------------------------
// exitPositionInternal: the single place a position is closed
// -----------------------------------------------------------------------------
bool ExitController::exitPositionInternal(domain::OrderId order_id,
                                          double exit_price,
                                          domain::ExitReason reason,
                                          domain::OrderId exit_order_id,
                                          std::int64_t sold_by_leg) {
  domain::ExitState state;
  {
    std::lock_guard lock(mutex_);
    auto it = states_.find(order_id);
    if (it == states_.end()) {
      std::cerr << "[ExitController] WARNING: order " << order_id
                << " already closed or not registered; "
                << domain::exitReasonToString(reason) << " exit skipped.\n";
      return false;
    }
    state = std::move(it->second);
    states_.erase(it);
    exited_.emplace(order_id, reason);
  }

  // The execution view can be ahead of the last registration.
  if (std::optional<domain::OpenPosition> live =
          execution_.onOrderExit(order_id)) {
    if (live->quantity_filled > state.quantity) {
      std::cerr << "[ExitController] WARNING: order " << order_id
                << " exiting " << live->quantity_filled << ", "
                << state.quantity << " registered.\n";
    }
    if (live->quantity_filled > 0) {
      state.quantity = live->quantity_filled;
    }
    if (live->average_entry_price > 0.0) {
      state.entry_price = live->average_entry_price;
    }
  }

  domain::OrderId market_id = domain::kNoOrderId;
  const std::int64_t unsold = state.quantity - sold_by_leg;
  if (unsold > 0) {
    domain::ExitState order = state;
    order.quantity = unsold;
    market_id = placeLeg(order, LegKind::Market);
    if (market_id == domain::kNoOrderId) {
      std::cerr << "[ExitController] CRITICAL: market exit of " << unsold
                << " for order " << order_id
                << " was not accepted; booking the close at " << exit_price
                << " anyway.\n";
    }
  }

  if (state.broker_stop_order_id != exit_order_id) {
    cancelLeg(state.broker_stop_order_id, "stop");
  }
  if (state.broker_target_order_id != exit_order_id) {
    cancelLeg(state.broker_target_order_id, "target");
  }

  domain::OrderId booked_exit_id = exit_order_id;
  if (booked_exit_id == domain::kNoOrderId) {
    booked_exit_id = market_id != domain::kNoOrderId ? market_id : order_id;
  }

  const double entry = resolveEntryPrice(state, exit_price);
  bookClose(order_id, state.contract, state.quantity, entry, exit_price,
            reason, booked_exit_id);
  return true;
}

// -----------------------------------------------------------------------------
// exitLateFill: sell entry fills that arrived after the exit
// -----------------------------------------------------------------------------
bool ExitController::exitLateFill(const domain::OpenPosition& late) {
  if (late.quantity_filled <= 0) {
    return false;
  }

  domain::ExitReason reason = domain::ExitReason::Manual;
  {
    std::lock_guard lock(mutex_);
    auto it = exited_.find(late.order_id);
    if (it != exited_.end()) {
      reason = it->second;
    }
  }

  double price = broker_.getLtp(late.contract);
  if (price <= 0.0) {
    price = late.average_entry_price;
    std::cerr << "[ExitController] WARNING: no LTP for "
              << late.contract.symbol << "; booking late fill of order "
              << late.order_id << " at its entry " << price << "\n";
  }

  domain::ExitState order;
  order.order_id = late.order_id;
  order.contract = late.contract;
  order.signal = late.signal;
  order.quantity = late.quantity_filled;
  order.entry_price = late.average_entry_price;

  const domain::OrderId market_id = placeLeg(order, LegKind::Market);
  if (market_id == domain::kNoOrderId) {
    std::cerr << "[ExitController] CRITICAL: market exit of late fill for "
              << "order " << late.order_id << " was not accepted; booking "
              << "the close at " << price << " anyway.\n";
  }

  std::cerr << "[ExitController] WARNING: order " << late.order_id
            << " filled " << late.quantity_filled
            << " after its exit; selling it now.\n";

  bookClose(late.order_id, late.contract, late.quantity_filled,
            resolveEntryPrice(order, price), price, reason,
            market_id != domain::kNoOrderId ? market_id : late.order_id);
  return true;
}

// -----------------------------------------------------------------------------
// bookClose: ledger, governor, journal, event
// -----------------------------------------------------------------------------
void ExitController::bookClose(domain::OrderId order_id,
                               const domain::Contract& contract,
                               std::int64_t quantity, double entry,
                               double exit_price, domain::ExitReason reason,
                               domain::OrderId exit_order_id) {
  const double pnl = (exit_price - entry) * static_cast<double>(quantity);

  store_.applyExitFill(contract, exit_order_id, quantity, exit_price, reason);
  risk_.onPositionClosed(order_id, exit_price, quantity, entry);

  if (journal_ != nullptr) {
    store::TradeRecord trade;
    trade.kind = store::TradeRecord::Kind::Exit;
    trade.order_id = exit_order_id;
    trade.symbol = contract.symbol;
    trade.quantity = quantity;
    trade.price = exit_price;
    trade.fill_number = 1;
    trade.entry_price = entry;
    trade.pnl = pnl;
    trade.reason = reason;
    trade.time_ms = time_.now_ms();
    try {
      journal_->recordTrade(trade);
    } catch (const PersistenceFailure& e) {
      std::cerr << "[ExitController] ERROR: journal write failed for order "
                << order_id << ": " << e.what() << "\n";
    }
  }

  std::cout << "[ExitController] EXIT " << domain::exitReasonToString(reason)
            << " order " << order_id << " " << contract.symbol
            << " qty=" << quantity << " entry=" << entry
            << " exit=" << exit_price << " pnl=" << pnl << "\n";

  if (sink_) {
    PositionClosedEvent closed;
    closed.entry_order_id = order_id;
    closed.exit_order_id = exit_order_id;
    closed.symbol = contract.symbol;
    closed.quantity = quantity;
    closed.entry_price = entry;
    closed.exit_price = exit_price;
    closed.pnl = pnl;
    closed.reason = reason;
    closed.timestamp = ms_to_timestamp(time_.now_ms());
    sink_(closed);
  }
}

// -----------------------------------------------------------------------------
// resolveEntryPrice: state, original, execution view, ledger, exit price
// -----------------------------------------------------------------------------
double ExitController::resolveEntryPrice(const domain::ExitState& state,
                                         double exit_price) const {
  if (state.entry_price > 0.0) {
    return state.entry_price;
  }
  if (state.entry_price_original > 0.0) {
    return state.entry_price_original;
  }
  if (std::optional<double> entry = execution_.entryPrice(state.order_id)) {
    return *entry;
  }
  if (std::optional<domain::AggregatePosition> agg =
          store_.position(state.contract.symbol)) {
    if (agg->average_entry_price > 0.0) {
      return agg->average_entry_price;
    }
  }
  std::cerr << "[ExitController] CRITICAL: no entry price for order "
            << state.order_id << "; using exit price " << exit_price
            << " (zero PnL).\n";
  return exit_price;
}

// The leg may already have executed; then it stays known until its fill
// report arrives.
bool ExitController::cancelLeg(domain::OrderId leg_id, const char* what) {
  if (leg_id == domain::kNoOrderId) {
    return false;
  }
  bool cancelled = false;
  try {
    cancelled = broker_.cancelOrder(leg_id);
  } catch (const std::exception& e) {
    std::cerr << "[ExitController] WARNING: cancel of " << what << " "
              << leg_id << " failed: " << e.what() << "\n";
  }
  if (cancelled) {
    forgetLeg(leg_id);
  }
  return cancelled;
}

void ExitController::forgetLeg(domain::OrderId leg_id) {
  std::lock_guard lock(mutex_);
  exit_orders_.erase(leg_id);
}

// -----------------------------------------------------------------------------
// Readers
// -----------------------------------------------------------------------------
bool ExitController::ownsOrder(domain::OrderId order_id) const {
  std::lock_guard lock(mutex_);
  return exit_orders_.count(order_id) > 0;
}

std::size_t ExitController::exitOrderCount() const {
  std::lock_guard lock(mutex_);
  return exit_orders_.size();
}

bool ExitController::isTracked(domain::OrderId order_id) const {
  std::lock_guard lock(mutex_);
  return states_.count(order_id) > 0;
}

std::optional<domain::ExitState> ExitController::exitState(
    domain::OrderId order_id) const {
  std::lock_guard lock(mutex_);
  auto it = states_.find(order_id);
  if (it == states_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<domain::ExitState> ExitController::trackedPositions() const {
  std::lock_guard lock(mutex_);
  std::vector<domain::ExitState> result;
  result.reserve(states_.size());
  for (const auto& [id, s] : states_) {
    result.push_back(s);
  }
  return result;
}

}  // namespace execution
}  // namespace optexec
