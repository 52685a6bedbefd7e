#pragma once

// =============================================================================
// engine_test_config.hpp
// =============================================================================
// Deterministic optexec::config::EngineConfig for tests that run the whole
// TradingEngine in-process.
//
//   - No sockets: every network endpoint is empty, events are pushed
//     through pushMarketData() / pushEvent().
//   - No journal file.
//   - Paper broker fills in one slice at exactly the LTP.
//   - One call and one put at strike 21500, lot 50; underlying NIFTY.
// =============================================================================

#include "optexec/config/engine_config.hpp"
#include "optexec/events/event_types.hpp"
#include "optexec/time/time_utils.hpp"

#include <cstdint>
#include <string>

namespace optexec {
namespace testing {

// Monday 2024-01-01 10:00 IST, inside the session.
constexpr std::int64_t kSessionTime = 1'704'083'400'000;

inline domain::Contract callContract() {
  return {"NIFTY24JAN21500CE", "CE21500", 50, 21500.0,
          domain::OptionType::Call};
}

inline domain::Contract putContract() {
  return {"NIFTY24JAN21500PE", "PE21500", 50, 21500.0,
          domain::OptionType::Put};
}

inline config::EngineConfig engineTestConfig() {
  config::EngineConfig cfg;

  cfg.risk.sizing_mode = config::SizingMode::FixedLot;
  cfg.risk.sizing_value = 1.0;
  cfg.risk.max_daily_loss = 5000.0;

  cfg.execution.ltp_max_retries = 3;
  cfg.execution.ltp_retry_interval_ms = 5;

  cfg.exit.stop_loss_percent = 20.0;
  cfg.exit.take_profit_percent = 40.0;

  cfg.paper.seed = 1;
  cfg.paper.min_fill_slices = 1;
  cfg.paper.max_fill_slices = 1;
  cfg.paper.price_jitter_percent = 0.0;
  cfg.paper.limit_expiry_ms = 600'000;

  cfg.underlying = {"NIFTY", "NIFTY", 1, 0.0, domain::OptionType::None};
  cfg.option_chain = {callContract(), putContract()};

  cfg.network.market_data_endpoint.clear();
  cfg.network.ipc_cmd_endpoint.clear();
  cfg.network.ipc_pub_endpoint.clear();
  cfg.journal.path.clear();
  return cfg;
}

inline MarketDataEvent optionTick(const domain::Contract& contract,
                                  double price) {
  MarketDataEvent md;
  md.symbol = contract.symbol;
  md.token = contract.token;
  md.price = price;
  md.timestamp = ms_to_timestamp(kSessionTime);
  return md;
}

inline SignalEvent buyCallSignal() {
  SignalEvent signal;
  signal.strategy_id = "test";
  signal.signal = domain::SignalType::BuyCall;
  signal.spot_price = 21510.0;
  signal.timestamp = ms_to_timestamp(kSessionTime);
  return signal;
}

}  // namespace testing
}  // namespace optexec
