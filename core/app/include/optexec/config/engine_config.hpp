#pragma once

#include "optexec/domain/contract.hpp"
#include "optexec/domain/order.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace optexec {
namespace config {

// -----------------------------------------------------------------------------
// SizingMode
// -----------------------------------------------------------------------------
// FixedLot — quantity = value × lot size.
// Percent  — spend value % of available capital, rounded down to whole lots.
// -----------------------------------------------------------------------------
enum class SizingMode {
  FixedLot,
  Percent,
};

// Throws InvalidConfiguration for anything but "fixed_lot" / "percent".
SizingMode parseSizingMode(const std::string& text);

const char* sizingModeToString(SizingMode mode);

// Throws InvalidConfiguration unless text is "HH:MM" within a day.
int parseClockTime(const std::string& text);

// -----------------------------------------------------------------------------
// Section structs
// -----------------------------------------------------------------------------
// Defaults match the values the engine has traded with; every field can be
// overridden from the JSON file. Percentages are plain percent (2.0 == 2%).
// -----------------------------------------------------------------------------
struct RiskConfig {
  double max_daily_loss{5000.0};
  SizingMode sizing_mode{SizingMode::FixedLot};
  double sizing_value{1.0};
  bool allow_multiple_positions{true};
};

struct ExecutionConfig {
  domain::OrderKind entry_order_kind{domain::OrderKind::Market};
  double price_tolerance_percent{2.0};
  std::int64_t order_timeout_ms{30000};
  int ltp_max_retries{15};
  std::int64_t ltp_retry_interval_ms{1000};
  std::int64_t watchdog_interval_ms{1000};
};

struct ExitConfig {
  double stop_loss_percent{20.0};
  double take_profit_percent{40.0};
  bool take_profit_enabled{true};
  bool trailing_stop_enabled{false};
  bool breakeven_enabled{false};
  double breakeven_trigger_percent{40.0};  // Defaults to take_profit_percent
  bool use_broker_exit_orders{true};
  double stop_update_threshold_percent{1.0};
  int squareoff_minute{15 * 60 + 15};      // Local minute of day
};

struct MarketConfig {
  int open_minute{9 * 60 + 15};
  int close_minute{15 * 60 + 15};
  int utc_offset_minutes{330};
  bool trade_weekends{false};
  std::int64_t candle_timeframe_sec{60};
};

struct StrategyConfig {
  std::string id{"ema_crossover"};
  int fast_period{9};
  int slow_period{26};
};

struct PaperBrokerConfig {
  double starting_capital{1'000'000.0};
  std::optional<std::uint32_t> seed;        // Unset: seeded from random_device
  int min_fill_slices{1};
  int max_fill_slices{3};
  std::int64_t multi_fill_min_quantity{50};  // Smaller orders fill in one slice
  double slice_fraction_min{0.3};
  double slice_fraction_max{0.7};
  double price_jitter_percent{1.0};
  std::int64_t limit_expiry_ms{30000};
};

struct NetworkConfig {
  std::string market_data_endpoint{"tcp://127.0.0.1:5555"};
  std::string ipc_cmd_endpoint{"tcp://127.0.0.1:5556"};
  std::string ipc_pub_endpoint{"tcp://127.0.0.1:5557"};
};

struct JournalConfig {
  std::string path;  // Empty disables the journal
};

// -----------------------------------------------------------------------------
// EngineConfig
// -----------------------------------------------------------------------------
//
// @brief  Everything TradingEngine needs, loaded once at startup.
//
// @details
// Loaded by loadEngineConfig() before any component is built. Validation is
// strict because configuration errors are the only errors allowed to stop
// the process; once the engine is running nothing re-reads the file.
//
// JSON layout (all sections optional except the ones marked *):
//
//   {
//     "risk":      { "max_daily_loss", "mode"*, "value"*,
//                    "allow_multiple_positions" },
//     "execution": { "order_type", "price_tolerance_percent",
//                    "order_timeout_seconds", "ltp_max_retries",
//                    "ltp_retry_interval_ms", "watchdog_interval_ms" },
//     "exit":      { "sl_percent"*, "tp_percent"*, "tp_exit_enabled",
//                    "trailing_sl", "breakeven_enabled",
//                    "breakeven_trigger_percent", "use_broker_sl_orders",
//                    "sl_update_threshold_percent", "squareoff_time" },
//     "market":    { "open", "close", "utc_offset_minutes",
//                    "trade_weekends", "candle_timeframe_sec" },
//     "strategy":  { "id", "fast_period", "slow_period" },
//     "paper":     { "starting_capital", "seed", "min_fill_slices",
//                    "max_fill_slices", "multi_fill_min_quantity",
//                    "slice_fraction_min", "slice_fraction_max",
//                    "price_jitter_percent", "limit_expiry_seconds" },
//     "underlying"*: { "symbol", "token" },
//     "options":   [ { "symbol", "token", "lot_size", "strike",
//                      "type": "CE" | "PE" } ],
//     "network":   { "market_data_endpoint", "ipc_cmd_endpoint",
//                    "ipc_pub_endpoint" },
//     "journal":   { "path" },
//     "clock":     "simulation" | "live"
//   }
// -----------------------------------------------------------------------------
struct EngineConfig {
  RiskConfig risk;
  ExecutionConfig execution;
  ExitConfig exit;
  MarketConfig market;
  StrategyConfig strategy;
  PaperBrokerConfig paper;
  domain::Contract underlying;
  std::vector<domain::Contract> option_chain;
  NetworkConfig network;
  JournalConfig journal;
  bool simulated_clock{true};
};

// Throws InvalidConfiguration on missing required keys, wrong types or
// out-of-range values.
EngineConfig parseEngineConfig(const nlohmann::json& root);

// Reads and parses a JSON file. Throws InvalidConfiguration when the file
// cannot be opened or is not valid JSON.
EngineConfig loadEngineConfig(const std::string& path);

}  // namespace config
}  // namespace optexec
