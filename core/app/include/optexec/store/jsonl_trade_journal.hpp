#pragma once

#include "optexec/store/i_trade_journal.hpp"

#include <fstream>
#include <mutex>
#include <string>
#include <vector>

namespace optexec {
namespace store {

// -----------------------------------------------------------------------------
// JsonlTradeJournal — ITradeJournal backed by a JSON-lines file
// -----------------------------------------------------------------------------
//
// @brief  Appends one JSON object per order or trade record and keeps the
//         session's exit PnLs in memory for summary().
//
// @details
// Line shapes:
//   {"type":"ORDER","order_id":..,"symbol":..,"signal":"BUY_CE",
//    "order_type":"MARKET","quantity":..,"price":..,"status":..,"time_ms":..}
//   {"type":"TRADE","trade_type":"ENTRY","order_id":..,"symbol":..,
//    "quantity":..,"price":..,"fill_number":..,"time_ms":..}
//   {"type":"TRADE","trade_type":"EXIT","order_id":..,"symbol":..,
//    "quantity":..,"price":..,"entry_price":..,"pnl":..,"reason":"SL",
//    "time_ms":..}
//
// Each line is flushed on write so a crash loses at most the record being
// written. The file is opened in append mode; earlier sessions are kept.
//
// Thread model: all members are safe from any thread (one mutex).
// -----------------------------------------------------------------------------
class JsonlTradeJournal final : public ITradeJournal {
 public:
  // @throws PersistenceFailure if the file cannot be opened for append.
  explicit JsonlTradeJournal(std::string path);

  JsonlTradeJournal(const JsonlTradeJournal&) = delete;
  JsonlTradeJournal& operator=(const JsonlTradeJournal&) = delete;
  JsonlTradeJournal(JsonlTradeJournal&&) = delete;
  JsonlTradeJournal& operator=(JsonlTradeJournal&&) = delete;

  void recordOrder(const OrderRecord& record) override;

  void recordTrade(const TradeRecord& record) override;

  SessionSummary summary() const override;

  const std::string& path() const { return path_; }

  // Pure function over a sequence of closed-trade PnLs, in close order.
  static SessionSummary summarize(const std::vector<double>& pnls);

 private:
  void writeLine(const std::string& line);

  std::string path_;
  mutable std::mutex mutex_;
  std::ofstream out_;
  std::vector<double> exit_pnls_;
};

}  // namespace store
}  // namespace optexec
