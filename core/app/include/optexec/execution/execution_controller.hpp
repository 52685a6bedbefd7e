#pragma once

#include "optexec/broker/i_broker.hpp"
#include "optexec/concurrent/order_id_generator.hpp"
#include "optexec/concurrent/task_scheduler.hpp"
#include "optexec/config/engine_config.hpp"
#include "optexec/domain/fill.hpp"
#include "optexec/domain/position.hpp"
#include "optexec/events/order_filled_event.hpp"
#include "optexec/execution/i_option_selector.hpp"
#include "optexec/risk/risk_governor.hpp"
#include "optexec/store/i_position_store.hpp"
#include "optexec/store/i_trade_journal.hpp"
#include "optexec/time/i_time_provider.hpp"

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace optexec {
namespace execution {

// -----------------------------------------------------------------------------
// ExecutionController — signal to entry order, fills to open positions
// -----------------------------------------------------------------------------
//
// @brief  Owns the order submission state machine for entry orders and the
//         OpenPosition table they produce.
//
// @details
// Per-order state machine:
//
//   PENDING ──► PARTIAL ──► PARTIAL ... ──► FILLED
//      │
//      ├──► CANCELLED   (watchdog timeout / price drift / broker expiry)
//      └──► REJECTED    (broker refused)
//
// onSignal() pipeline, each step may drop the signal with a log line:
//   1. trading enabled (RiskGovernor kill switch)
//   2. single-position rule when allow_multiple_positions is false
//   3. IOptionSelector::select(), then subscribe()
//   4. poll the option LTP: ltp_max_retries attempts, ltp_retry_interval_ms
//      apart (PriceUnavailable when it never arrives)
//   5. RiskGovernor::sizeOrder()
//   6. pre-generate the order id, write the OpenPosition (and, for LIMIT,
//      the pending-order entry) and the journal record, then place
//
// Step 6 writes bookkeeping before the request leaves so that a fill
// callback arriving before placeOrder() returns always finds its position.
//
// Fill reconciliation (onOrderFilled):
//   Broker events are cumulative. Only fills with a sequence number above
//   the position's applied_sequence are forwarded to the IPositionStore.
//   Without a per-fill breakdown the delta is filled_quantity minus the
//   quantity already accounted for, priced so that the running average
//   matches the broker's. A replayed event therefore changes nothing.
//
// LIMIT watchdog:
//   Every watchdog_interval_ms, checkPendingOrder() cancels the order when
//   it has been pending for order_timeout_ms, or when the LTP has drifted
//   more than price_tolerance_percent from the limit. A cancel that races a
//   fill keeps whatever was filled. A fill arriving after the position was
//   retired brings it back.
//
// After the exit:
//   onOrderExit() moves the position to an exited table. A fill that still
//   arrives for it is applied to the ledger like any other and returned
//   with after_exit set, so the caller sells it straight away.
//
// Thread model:
//   onSignal() runs on the execution loop and may block while polling the
//   LTP; stop() interrupts that wait. onOrderFilled() runs on the
//   execution loop. Watchdog checks run on the controller's own
//   TaskScheduler. One mutex guards the tables; it is never held across a
//   broker, selector or journal call. Ledger writes and governor
//   registrations happen under the mutex (lock order: controller, then
//   ledger or governor).
//
// Ownership: every collaborator is a reference owned by TradingEngine; the
// journal is optional (nullptr disables it).
// -----------------------------------------------------------------------------
class ExecutionController {
 public:
  ExecutionController(broker::IBroker& broker, IOptionSelector& selector,
                      risk::RiskGovernor& risk, store::IPositionStore& store,
                      OrderIdGenerator& ids, const ITimeProvider& time,
                      const config::ExecutionConfig& cfg,
                      store::ITradeJournal* journal = nullptr);

  ~ExecutionController();

  ExecutionController(const ExecutionController&) = delete;
  ExecutionController& operator=(const ExecutionController&) = delete;
  ExecutionController(ExecutionController&&) = delete;
  ExecutionController& operator=(ExecutionController&&) = delete;

  // Interrupts any LTP wait and stops the watchdog scheduler. Idempotent.
  void stop();

  // -------------------------------------------------------------------------
  // onSignal(signal, spot_price)
  // -------------------------------------------------------------------------
  // @return the entry order id when an order was placed, std::nullopt when
  //         the signal was dropped or the broker rejected the order.
  // -------------------------------------------------------------------------
  std::optional<domain::OrderId> onSignal(domain::SignalType signal,
                                          double spot_price);

  // Text form ("BUY_CE" / "BUY_PE"); anything else is logged and dropped.
  std::optional<domain::OrderId> onSignal(std::string_view signal,
                                          double spot_price);

  // -------------------------------------------------------------------------
  // onOrderFilled(event)
  // -------------------------------------------------------------------------
  // @return a snapshot of the updated OpenPosition when the event carried
  //         fills not applied before; std::nullopt for replays and for
  //         orders this controller does not know. For an order already
  //         exited the snapshot has after_exit set and covers only the
  //         new fills, which are in the ledger and still need selling.
  // -------------------------------------------------------------------------
  std::optional<domain::OpenPosition> onOrderFilled(
      const OrderFilledEvent& event);

  // -------------------------------------------------------------------------
  // onOrderExit(order_id)
  // -------------------------------------------------------------------------
  // The position was exited. Moves it to the exited table, stops watching
  // it, and cancels whatever of the entry order is still working.
  //
  // @return the position as it stood at the exit (quantity_filled is what
  //         the exit must sell), std::nullopt when the order is unknown or
  //         was already exited.
  // -------------------------------------------------------------------------
  std::optional<domain::OpenPosition> onOrderExit(domain::OrderId order_id);

  // One watchdog pass for a pending LIMIT entry.
  // @return true while the order still needs watching.
  bool checkPendingOrder(domain::OrderId order_id);

  std::optional<double> entryPrice(domain::OrderId order_id) const;

  std::optional<domain::OpenPosition> openPosition(
      domain::OrderId order_id) const;

  std::vector<domain::OpenPosition> openPositions() const;

  std::size_t pendingOrderCount() const;

  // Applies next to current when the state machine allows it.
  // @return false (current unchanged) for an illegal transition.
  static bool transitionStatus(domain::OrderStatus& current,
                               domain::OrderStatus next);

 private:
  struct PendingOrder {
    domain::Contract contract;
    double limit_price{0.0};
    std::int64_t placed_at_ms{0};
  };

  // Throws PriceUnavailable after the last retry.
  double awaitLtp(const domain::Contract& contract);

  void cancelEntry(domain::OrderId order_id, const char* why);

  // Caller holds mutex_. Drops the position, or keeps it when something
  // already filled.
  void retireUnfilledLocked(domain::OrderId order_id,
                            domain::OrderStatus final_status);

  void journalOrder(const domain::OpenPosition& position, double price,
                    const char* status);

  broker::IBroker& broker_;
  IOptionSelector& selector_;
  risk::RiskGovernor& risk_;
  store::IPositionStore& store_;
  OrderIdGenerator& ids_;
  const ITimeProvider& time_;
  const config::ExecutionConfig cfg_;
  store::ITradeJournal* journal_;

  mutable std::mutex mutex_;
  std::unordered_map<domain::OrderId, domain::OpenPosition> open_positions_;
  std::unordered_map<domain::OrderId, PendingOrder> pending_orders_;
  std::unordered_map<domain::OrderId, domain::OpenPosition> retired_;
  // Exited positions, kept so late fills on their entry order are
  // recognised and booked.
  std::unordered_map<domain::OrderId, domain::OpenPosition> exited_;

  std::atomic<bool> stopping_{false};
  std::mutex wait_mutex_;
  std::condition_variable wait_cv_;

  TaskScheduler watchdog_;
};

}  // namespace execution
}  // namespace optexec
