#pragma once

#include "optexec/domain/exit_reason.hpp"
#include "optexec/domain/order.hpp"
#include "optexec/domain/signal.hpp"

#include <cstdint>
#include <string>

namespace optexec {
namespace store {

struct OrderRecord {
  domain::OrderId order_id{domain::kNoOrderId};
  std::string symbol;
  domain::SignalType signal{domain::SignalType::BuyCall};
  domain::OrderKind kind{domain::OrderKind::Market};
  std::int64_t quantity{0};
  double price{0.0};        // LTP at submission, or the limit price
  std::string status;
  std::int64_t time_ms{0};
};

// ENTRY records carry fill_number; EXIT records carry pnl and reason.
struct TradeRecord {
  enum class Kind { Entry, Exit };

  Kind kind{Kind::Entry};
  domain::OrderId order_id{domain::kNoOrderId};
  std::string symbol;
  std::int64_t quantity{0};
  double price{0.0};
  std::uint32_t fill_number{0};
  double entry_price{0.0};
  double pnl{0.0};
  domain::ExitReason reason{domain::ExitReason::StopLoss};
  std::int64_t time_ms{0};
};

struct SessionSummary {
  std::int64_t total_trades{0};
  std::int64_t wins{0};
  std::int64_t losses{0};
  double win_rate{0.0};          // Percent
  double gross_profit{0.0};
  double gross_loss{0.0};        // Positive magnitude
  double profit_factor{0.0};     // 0 when there is no loss to divide by
  double net_pnl{0.0};
  double max_drawdown{0.0};      // Positive magnitude, peak to trough
};

// -----------------------------------------------------------------------------
// ITradeJournal — append-only order / trade records
// -----------------------------------------------------------------------------
// Implementations throw PersistenceFailure when a record cannot be written.
// Callers log and continue; the journal never blocks trading.
// -----------------------------------------------------------------------------
class ITradeJournal {
 public:
  virtual ~ITradeJournal() = default;

  virtual void recordOrder(const OrderRecord& record) = 0;

  virtual void recordTrade(const TradeRecord& record) = 0;

  // Summary over EXIT records written this session.
  virtual SessionSummary summary() const = 0;
};

}  // namespace store
}  // namespace optexec
