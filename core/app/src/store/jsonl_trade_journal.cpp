#include "optexec/store/jsonl_trade_journal.hpp"
#include "optexec/errors.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <utility>

namespace optexec {
namespace store {

JsonlTradeJournal::JsonlTradeJournal(std::string path)
    : path_(std::move(path)) {
  out_.open(path_, std::ios::out | std::ios::app);
  if (!out_) {
    throw PersistenceFailure("cannot open trade journal '" + path_ +
                             "' for append");
  }
}

// -----------------------------------------------------------------------------
// recordOrder
// -----------------------------------------------------------------------------
void JsonlTradeJournal::recordOrder(const OrderRecord& record) {
  nlohmann::json line = {
      {"type", "ORDER"},
      {"order_id", record.order_id},
      {"symbol", record.symbol},
      {"signal", domain::signalToString(record.signal)},
      {"order_type", domain::orderKindToString(record.kind)},
      {"quantity", record.quantity},
      {"price", record.price},
      {"status", record.status},
      {"time_ms", record.time_ms},
  };

  std::lock_guard lock(mutex_);
  writeLine(line.dump());
}

// -----------------------------------------------------------------------------
// recordTrade: ENTRY carries the fill number, EXIT the PnL and reason
// -----------------------------------------------------------------------------
void JsonlTradeJournal::recordTrade(const TradeRecord& record) {
  nlohmann::json line = {
      {"type", "TRADE"},
      {"order_id", record.order_id},
      {"symbol", record.symbol},
      {"quantity", record.quantity},
      {"price", record.price},
      {"time_ms", record.time_ms},
  };

  const bool is_exit = record.kind == TradeRecord::Kind::Exit;
  if (is_exit) {
    line["trade_type"] = "EXIT";
    line["entry_price"] = record.entry_price;
    line["pnl"] = record.pnl;
    line["reason"] = domain::exitReasonToString(record.reason);
  } else {
    line["trade_type"] = "ENTRY";
    line["fill_number"] = record.fill_number;
  }

  std::lock_guard lock(mutex_);
  writeLine(line.dump());
  if (is_exit) {
    exit_pnls_.push_back(record.pnl);
  }
}

SessionSummary JsonlTradeJournal::summary() const {
  std::lock_guard lock(mutex_);
  return summarize(exit_pnls_);
}

// -----------------------------------------------------------------------------
// summarize: wins/losses, profit factor, drawdown from a zero-based curve
// -----------------------------------------------------------------------------
SessionSummary JsonlTradeJournal::summarize(const std::vector<double>& pnls) {
  SessionSummary s;
  double equity = 0.0;
  double peak = 0.0;

  for (double pnl : pnls) {
    ++s.total_trades;
    if (pnl > 0.0) {
      ++s.wins;
      s.gross_profit += pnl;
    } else if (pnl < 0.0) {
      ++s.losses;
      s.gross_loss += -pnl;
    }
    equity += pnl;
    peak = std::max(peak, equity);
    s.max_drawdown = std::max(s.max_drawdown, peak - equity);
  }

  s.net_pnl = equity;
  if (s.total_trades > 0) {
    s.win_rate = 100.0 * static_cast<double>(s.wins) /
                 static_cast<double>(s.total_trades);
  }
  if (s.gross_loss > 0.0) {
    s.profit_factor = s.gross_profit / s.gross_loss;
  }
  return s;
}

// Caller holds mutex_.
void JsonlTradeJournal::writeLine(const std::string& line) {
  out_ << line << '\n';
  out_.flush();
  if (!out_) {
    out_.clear();
    throw PersistenceFailure("write to trade journal '" + path_ + "' failed");
  }
}

}  // namespace store
}  // namespace optexec
