#include "optexec/execution/execution_controller.hpp"
#include "optexec/errors.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <iostream>
#include <string>

namespace optexec {
namespace execution {

ExecutionController::ExecutionController(
    broker::IBroker& broker, IOptionSelector& selector,
    risk::RiskGovernor& risk, store::IPositionStore& store,
    OrderIdGenerator& ids, const ITimeProvider& time,
    const config::ExecutionConfig& cfg, store::ITradeJournal* journal)
    : broker_(broker),
      selector_(selector),
      risk_(risk),
      store_(store),
      ids_(ids),
      time_(time),
      cfg_(cfg),
      journal_(journal),
      watchdog_("entry-watchdog") {
  watchdog_.start();
}

ExecutionController::~ExecutionController() { stop(); }

void ExecutionController::stop() {
  {
    std::lock_guard lock(wait_mutex_);
    stopping_.store(true);
  }
  wait_cv_.notify_all();
  watchdog_.stop();
}

// -----------------------------------------------------------------------------
// onSignal (text form)
// -----------------------------------------------------------------------------
std::optional<domain::OrderId> ExecutionController::onSignal(
    std::string_view signal, double spot_price) {
  std::optional<domain::SignalType> parsed = domain::parseSignal(signal);
  if (!parsed) {
    std::cerr << "[ExecutionController] WARNING: unknown signal '" << signal
              << "'. Dropped.\n";
    return std::nullopt;
  }
  return onSignal(*parsed, spot_price);
}

// -----------------------------------------------------------------------------
// onSignal: gate, select, price, size, book, place
// -----------------------------------------------------------------------------
std::optional<domain::OrderId> ExecutionController::onSignal(
    domain::SignalType signal, double spot_price) {
  const char* signal_name = domain::signalToString(signal);

  if (stopping_.load()) {
    return std::nullopt;
  }
  if (!risk_.canTakeNewTrade()) {
    std::cerr << "[ExecutionController] WARNING: trading disabled, dropping "
              << signal_name << "\n";
    return std::nullopt;
  }
  if (!risk_.allowMultiplePositions()) {
    std::lock_guard lock(mutex_);
    if (!open_positions_.empty()) {
      std::cout << "[ExecutionController] Position already open, dropping "
                << signal_name << "\n";
      return std::nullopt;
    }
  }

  // --- 1. Contract selection ------------------------------------------------
  std::optional<domain::Contract> selected;
  try {
    selected = selector_.select(signal, spot_price);
  } catch (const std::exception& e) {
    std::cerr << "[ExecutionController] WARNING: option selection failed for "
              << signal_name << ": " << e.what() << ". Dropped.\n";
    return std::nullopt;
  }
  if (!selected) {
    std::cerr << "[ExecutionController] WARNING: no option contract for "
              << signal_name << " at spot " << spot_price << "\n";
    return std::nullopt;
  }
  const domain::Contract contract = *selected;

  try {
    selector_.subscribe(contract);
  } catch (const std::exception& e) {
    std::cerr << "[ExecutionController] WARNING: subscribe to "
              << contract.symbol << " failed: " << e.what() << "\n";
  }

  // --- 2. Entry price -------------------------------------------------------
  double ltp = 0.0;
  try {
    ltp = awaitLtp(contract);
  } catch (const PriceUnavailable& e) {
    std::cerr << "[ExecutionController] WARNING: " << e.what()
              << ". Skipping trade.\n";
    return std::nullopt;
  }

  // --- 3. Size --------------------------------------------------------------
  const std::int64_t quantity = risk_.sizeOrder(ltp, contract.lot_size);
  if (quantity <= 0) {
    std::cerr << "[ExecutionController] WARNING: sized quantity " << quantity
              << " for " << contract.symbol << " @ " << ltp
              << " (capital=" << risk_.availableCapital() << "). Dropped.\n";
    return std::nullopt;
  }

  // --- 4. Bookkeeping before placement --------------------------------------
  const domain::OrderId id = ids_.next_id();
  const bool is_limit = cfg_.entry_order_kind == domain::OrderKind::Limit;
  const double limit_price =
      is_limit ? ltp * (1.0 + cfg_.price_tolerance_percent / 100.0) : 0.0;

  domain::OpenPosition position;
  position.order_id = id;
  position.contract = contract;
  position.signal = signal;
  position.entry_kind = cfg_.entry_order_kind;
  position.limit_price = limit_price;
  position.quantity_requested = quantity;
  position.status = domain::OrderStatus::Pending;
  position.created_at_ms = time_.now_ms();

  {
    std::lock_guard lock(mutex_);
    open_positions_[id] = position;
    if (is_limit) {
      pending_orders_[id] = PendingOrder{contract, limit_price,
                                         position.created_at_ms};
    }
  }
  journalOrder(position, is_limit ? limit_price : ltp, "PENDING");

  domain::OrderRequest request;
  request.id = id;
  request.contract = contract;
  request.side = domain::Side::Buy;
  request.quantity = quantity;
  request.kind = cfg_.entry_order_kind;
  request.limit_price = limit_price;

  std::cout << "[ExecutionController] Placing " << signal_name << " "
            << domain::orderKindToString(request.kind) << " BUY "
            << contract.symbol << " qty=" << quantity << " ltp=" << ltp
            << (is_limit ? " limit=" + std::to_string(limit_price) : "")
            << " id=" << id << "\n";

  // --- 5. Place ---------------------------------------------------------------
  try {
    broker_.placeOrder(request);
  } catch (const BrokerRejected& e) {
    std::cerr << "[ExecutionController] ERROR: order " << id
              << " rejected by broker: " << e.what() << "\n";
    {
      std::lock_guard lock(mutex_);
      retireUnfilledLocked(id, domain::OrderStatus::Rejected);
    }
    journalOrder(position, ltp, "REJECTED");
    return std::nullopt;
  }

  const std::optional<domain::OrderStatus> status = broker_.getOrderStatus(id);
  if (status == domain::OrderStatus::Rejected) {
    std::cerr << "[ExecutionController] ERROR: order " << id
              << " REJECTED after placement.\n";
    {
      std::lock_guard lock(mutex_);
      retireUnfilledLocked(id, domain::OrderStatus::Rejected);
    }
    journalOrder(position, ltp, "REJECTED");
    return std::nullopt;
  }

  if (is_limit && status != domain::OrderStatus::Filled) {
    watchdog_.scheduleEvery(id,
                            std::chrono::milliseconds(cfg_.watchdog_interval_ms),
                            [this, id] { return checkPendingOrder(id); });
  }

  return id;
}

// -----------------------------------------------------------------------------
// awaitLtp: bounded retries with a fixed, interruptible backoff
// -----------------------------------------------------------------------------
double ExecutionController::awaitLtp(const domain::Contract& contract) {
  for (int attempt = 1; attempt <= cfg_.ltp_max_retries; ++attempt) {
    const double ltp = broker_.getLtp(contract);
    if (ltp > 0.0) {
      if (attempt > 1) {
        std::cout << "[ExecutionController] LTP for " << contract.symbol
                  << " after " << attempt << " attempts: " << ltp << "\n";
      }
      return ltp;
    }
    if (attempt == cfg_.ltp_max_retries) {
      break;
    }

    std::unique_lock lock(wait_mutex_);
    if (wait_cv_.wait_for(lock,
                          std::chrono::milliseconds(cfg_.ltp_retry_interval_ms),
                          [this] { return stopping_.load(); })) {
      throw PriceUnavailable("stopped while waiting for LTP of " +
                             contract.symbol);
    }
  }
  throw PriceUnavailable("no LTP for " + contract.symbol + " (token " +
                         contract.token + ") after " +
                         std::to_string(cfg_.ltp_max_retries) + " attempts");
}

// -----------------------------------------------------------------------------
// onOrderFilled: apply only what has not been applied
// -----------------------------------------------------------------------------
std::optional<domain::OpenPosition> ExecutionController::onOrderFilled(
    const OrderFilledEvent& event) {
  const domain::OrderId id = event.order_id;
  std::vector<domain::Fill> applied;
  domain::OpenPosition snapshot;
  bool completed = false;

  bool after_exit = false;

  {
    std::lock_guard lock(mutex_);

    domain::OpenPosition* found = nullptr;
    auto it = open_positions_.find(id);
    if (it != open_positions_.end()) {
      found = &it->second;
    } else if (auto exited = exited_.find(id); exited != exited_.end()) {
      found = &exited->second;
      after_exit = true;
    } else {
      auto retired = retired_.find(id);
      if (retired == retired_.end()) {
        std::cerr << "[ExecutionController] WARNING: fill for unknown order "
                  << id << ". Ignored.\n";
        return std::nullopt;
      }
      std::cerr << "[ExecutionController] WARNING: late fill for retired "
                << "order " << id << "; position restored.\n";
      it = open_positions_.emplace(id, std::move(retired->second)).first;
      retired_.erase(retired);
      it->second.status = it->second.quantity_filled > 0
                              ? domain::OrderStatus::Partial
                              : domain::OrderStatus::Pending;
      found = &it->second;
    }
    domain::OpenPosition& pos = *found;

    // --- Work out the new fills ---------------------------------------------
    if (!event.fills.empty()) {
      for (const domain::Fill& fill : event.fills) {
        if (fill.sequence > pos.applied_sequence && fill.quantity > 0) {
          applied.push_back(fill);
        }
      }
      std::sort(applied.begin(), applied.end(),
                [](const domain::Fill& a, const domain::Fill& b) {
                  return a.sequence < b.sequence;
                });
    } else {
      const std::int64_t delta =
          event.filled_quantity - pos.accounted_quantity;
      if (delta > 0) {
        double price =
            (event.fill_price * static_cast<double>(event.filled_quantity) -
             pos.average_entry_price *
                 static_cast<double>(pos.accounted_quantity)) /
            static_cast<double>(delta);
        if (price <= 0.0) {
          price = event.fill_price;
        }
        domain::Fill fill;
        fill.order_id = id;
        fill.quantity = delta;
        fill.price = price;
        fill.time_ms = time_.now_ms();
        applied.push_back(fill);
      }
    }

    if (applied.empty()) {
      return std::nullopt;
    }

    // --- Apply: ledger first, then the position average ---------------------
    std::int64_t applied_quantity = 0;
    double applied_notional = 0.0;
    for (const domain::Fill& fill : applied) {
      applied_quantity += fill.quantity;
      applied_notional += fill.price * static_cast<double>(fill.quantity);
      store_.applyEntryFill(pos.contract, id, fill.quantity, fill.price);

      const double prev =
          pos.average_entry_price * static_cast<double>(pos.quantity_filled);
      pos.quantity_filled += fill.quantity;
      pos.average_entry_price =
          (prev + fill.price * static_cast<double>(fill.quantity)) /
          static_cast<double>(pos.quantity_filled);
      pos.applied_sequence = std::max(pos.applied_sequence, fill.sequence);
    }
    pos.accounted_quantity = pos.quantity_filled;

    if (after_exit) {
      // The exit already sold what was filled before it; hand back only
      // the late fills so the caller can flatten them.
      snapshot = pos;
      snapshot.quantity_filled = applied_quantity;
      snapshot.accounted_quantity = applied_quantity;
      snapshot.average_entry_price =
          applied_notional / static_cast<double>(applied_quantity);
      snapshot.after_exit = true;
    } else {
      const domain::OrderStatus next =
          pos.quantity_filled >= pos.quantity_requested
              ? domain::OrderStatus::Filled
              : domain::OrderStatus::Partial;
      if (!transitionStatus(pos.status, next)) {
        std::cerr << "[ExecutionController] WARNING: order " << id
                  << " cannot move from "
                  << domain::orderStatusToString(pos.status) << " to "
                  << domain::orderStatusToString(next) << "\n";
      }

      completed = pos.status == domain::OrderStatus::Filled;
      if (completed) {
        pending_orders_.erase(id);
      }
      snapshot = pos;
      // Under the mutex, so an exit (which goes through onOrderExit first)
      // always closes after this registration.
      risk_.onPositionOpened(id, snapshot);
    }
  }

  if (completed) {
    watchdog_.cancel(id);
  }

  if (after_exit) {
    std::cerr << "[ExecutionController] WARNING: order " << id << " filled "
              << snapshot.quantity_filled << " @ "
              << snapshot.average_entry_price
              << " after its position was exited.\n";
  } else {
    std::cout << "[ExecutionController] Order " << id << " "
              << domain::orderStatusToString(snapshot.status) << " "
              << snapshot.quantity_filled << "/"
              << snapshot.quantity_requested
              << " avg=" << snapshot.average_entry_price << "\n";
  }

  if (journal_ != nullptr) {
    try {
      for (const domain::Fill& fill : applied) {
        store::TradeRecord trade;
        trade.kind = store::TradeRecord::Kind::Entry;
        trade.order_id = id;
        trade.symbol = snapshot.contract.symbol;
        trade.quantity = fill.quantity;
        trade.price = fill.price;
        trade.fill_number = fill.sequence;
        trade.time_ms = fill.time_ms;
        journal_->recordTrade(trade);
      }
    } catch (const PersistenceFailure& e) {
      std::cerr << "[ExecutionController] ERROR: journal write failed: "
                << e.what() << "\n";
    }
  }

  if (after_exit) {
    return snapshot;
  }

  journalOrder(snapshot, snapshot.average_entry_price,
               domain::orderStatusToString(snapshot.status));
  return snapshot;
}

// -----------------------------------------------------------------------------
// onOrderExit: move the position to the exited table
// -----------------------------------------------------------------------------
std::optional<domain::OpenPosition> ExecutionController::onOrderExit(
    domain::OrderId order_id) {
  std::optional<domain::OpenPosition> exited;
  {
    std::lock_guard lock(mutex_);
    auto it = open_positions_.find(order_id);
    if (it != open_positions_.end()) {
      exited = it->second;
      open_positions_.erase(it);
    } else if (auto retired = retired_.find(order_id);
               retired != retired_.end()) {
      exited = retired->second;
      retired_.erase(retired);
    }
    pending_orders_.erase(order_id);
    if (exited) {
      exited_[order_id] = *exited;
    }
  }
  watchdog_.cancel(order_id);

  // Whatever is still working at the broker would only reopen the position.
  if (exited && !domain::isTerminal(exited->status)) {
    if (broker_.cancelOrder(order_id)) {
      std::cout << "[ExecutionController] Cancelled the unfilled rest of "
                << "order " << order_id << " after exit.\n";
    }
  }
  return exited;
}

// -----------------------------------------------------------------------------
// checkPendingOrder: one watchdog pass
// -----------------------------------------------------------------------------
bool ExecutionController::checkPendingOrder(domain::OrderId order_id) {
  PendingOrder pending;
  {
    std::lock_guard lock(mutex_);
    auto it = pending_orders_.find(order_id);
    if (it == pending_orders_.end()) {
      return false;
    }
    pending = it->second;
  }

  const std::optional<domain::OrderStatus> status =
      broker_.getOrderStatus(order_id);
  if (status && domain::isTerminal(*status)) {
    std::lock_guard lock(mutex_);
    pending_orders_.erase(order_id);
    if (*status != domain::OrderStatus::Filled) {
      std::cout << "[ExecutionController] Order " << order_id << " is "
                << domain::orderStatusToString(*status)
                << " at the broker.\n";
      retireUnfilledLocked(order_id, *status);
    }
    return false;
  }

  const std::int64_t elapsed = time_.now_ms() - pending.placed_at_ms;
  if (elapsed >= cfg_.order_timeout_ms) {
    std::cerr << "[ExecutionController] WARNING: cancelling order "
              << order_id << ": pending " << elapsed << " ms (timeout "
              << cfg_.order_timeout_ms << " ms).\n";
    cancelEntry(order_id, "timeout");
    return false;
  }

  const double ltp = broker_.getLtp(pending.contract);
  if (ltp > 0.0 && pending.limit_price > 0.0) {
    const double drift =
        std::abs((ltp - pending.limit_price) / pending.limit_price) * 100.0;
    if (drift > cfg_.price_tolerance_percent) {
      std::cerr << "[ExecutionController] WARNING: cancelling order "
                << order_id << ": price moved " << drift
                << "% from limit (tolerance "
                << cfg_.price_tolerance_percent << "%).\n";
      cancelEntry(order_id, "price drift");
      return false;
    }
  }
  return true;
}

// -----------------------------------------------------------------------------
// cancelEntry: broker first, then our tables
// -----------------------------------------------------------------------------
void ExecutionController::cancelEntry(domain::OrderId order_id,
                                      const char* why) {
  const bool cancelled = broker_.cancelOrder(order_id);
  const std::optional<domain::OrderStatus> status =
      broker_.getOrderStatus(order_id);

  std::optional<domain::OpenPosition> position;
  {
    std::lock_guard lock(mutex_);
    pending_orders_.erase(order_id);
    if (!cancelled && status == domain::OrderStatus::Filled) {
      // Lost the race to a fill; its event is on the way.
      return;
    }
    auto it = open_positions_.find(order_id);
    if (it != open_positions_.end()) {
      position = it->second;
    }
    retireUnfilledLocked(order_id, domain::OrderStatus::Cancelled);
  }
  watchdog_.cancel(order_id);

  if (position) {
    std::cout << "[ExecutionController] Order " << order_id
              << " cancelled (" << why << "), filled "
              << position->quantity_filled << "/"
              << position->quantity_requested << "\n";
    journalOrder(*position, position->limit_price, "CANCELLED");
  }
}

// Caller holds mutex_.
void ExecutionController::retireUnfilledLocked(
    domain::OrderId order_id, domain::OrderStatus final_status) {
  auto it = open_positions_.find(order_id);
  if (it == open_positions_.end()) {
    return;
  }
  if (it->second.quantity_filled > 0) {
    // Partial fill stays open with what it has; exits size from the fill.
    return;
  }
  it->second.status = final_status;
  retired_[order_id] = std::move(it->second);
  open_positions_.erase(it);
}

void ExecutionController::journalOrder(const domain::OpenPosition& position,
                                       double price, const char* status) {
  if (journal_ == nullptr) {
    return;
  }
  store::OrderRecord record;
  record.order_id = position.order_id;
  record.symbol = position.contract.symbol;
  record.signal = position.signal;
  record.kind = position.entry_kind;
  record.quantity = position.quantity_requested;
  record.price = price;
  record.status = status;
  record.time_ms = time_.now_ms();
  try {
    journal_->recordOrder(record);
  } catch (const PersistenceFailure& e) {
    std::cerr << "[ExecutionController] ERROR: journal write failed for order "
              << position.order_id << ": " << e.what() << "\n";
  }
}

// -----------------------------------------------------------------------------
// Readers
// -----------------------------------------------------------------------------
std::optional<double> ExecutionController::entryPrice(
    domain::OrderId order_id) const {
  std::lock_guard lock(mutex_);
  auto it = open_positions_.find(order_id);
  if (it == open_positions_.end() || it->second.average_entry_price <= 0.0) {
    return std::nullopt;
  }
  return it->second.average_entry_price;
}

std::optional<domain::OpenPosition> ExecutionController::openPosition(
    domain::OrderId order_id) const {
  std::lock_guard lock(mutex_);
  auto it = open_positions_.find(order_id);
  if (it == open_positions_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<domain::OpenPosition> ExecutionController::openPositions() const {
  std::lock_guard lock(mutex_);
  std::vector<domain::OpenPosition> result;
  result.reserve(open_positions_.size());
  for (const auto& [id, pos] : open_positions_) {
    result.push_back(pos);
  }
  return result;
}

std::size_t ExecutionController::pendingOrderCount() const {
  std::lock_guard lock(mutex_);
  return pending_orders_.size();
}

// -----------------------------------------------------------------------------
// transitionStatus: PENDING -> {PARTIAL -> PARTIAL|FILLED} | FILLED |
//                   CANCELLED | REJECTED
// -----------------------------------------------------------------------------
bool ExecutionController::transitionStatus(domain::OrderStatus& current,
                                           domain::OrderStatus next) {
  using domain::OrderStatus;

  bool allowed = false;
  switch (current) {
    case OrderStatus::Pending:
      allowed = next != OrderStatus::Pending;
      break;
    case OrderStatus::Partial:
      allowed = next == OrderStatus::Partial || next == OrderStatus::Filled;
      break;
    case OrderStatus::Filled:
    case OrderStatus::Cancelled:
    case OrderStatus::Rejected:
      allowed = false;
      break;
  }

  if (allowed) {
    current = next;
  }
  return allowed;
}

}  // namespace execution
}  // namespace optexec
