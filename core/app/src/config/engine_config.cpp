#include "optexec/config/engine_config.hpp"
#include "optexec/errors.hpp"

#include <cmath>
#include <fstream>
#include <iostream>
#include <sstream>

namespace optexec {
namespace config {

namespace {

using nlohmann::json;

// Reads obj[key] into out when present; leaves the default otherwise.
template <typename T>
void readOptional(const json& obj, const char* key, T& out) {
  auto it = obj.find(key);
  if (it != obj.end() && !it->is_null()) {
    out = it->template get<T>();
  }
}

const json& requireKey(const json& obj, const char* section, const char* key) {
  auto it = obj.find(key);
  if (it == obj.end() || it->is_null()) {
    throw InvalidConfiguration(std::string("missing required key '") +
                               section + "." + key + "'");
  }
  return *it;
}

const json* section(const json& root, const char* name) {
  auto it = root.find(name);
  if (it == root.end() || it->is_null()) {
    return nullptr;
  }
  if (!it->is_object()) {
    throw InvalidConfiguration(std::string("section '") + name +
                               "' must be an object");
  }
  return &*it;
}

void requirePositive(double value, const char* what) {
  if (!(value > 0.0) || !std::isfinite(value)) {
    throw InvalidConfiguration(std::string(what) + " must be > 0");
  }
}

void requireNonNegative(double value, const char* what) {
  if (value < 0.0 || !std::isfinite(value)) {
    throw InvalidConfiguration(std::string(what) + " must be >= 0");
  }
}

domain::OrderKind parseEntryOrderKind(const std::string& text) {
  if (text == "MARKET") {
    return domain::OrderKind::Market;
  }
  if (text == "LIMIT") {
    return domain::OrderKind::Limit;
  }
  throw InvalidConfiguration("unknown execution.order_type '" + text +
                             "' (expected MARKET or LIMIT)");
}

domain::OptionType parseOptionType(const std::string& text) {
  if (text == "CE") {
    return domain::OptionType::Call;
  }
  if (text == "PE") {
    return domain::OptionType::Put;
  }
  throw InvalidConfiguration("unknown option type '" + text +
                             "' (expected CE or PE)");
}

// ---- risk -------------------------------------------------------------------
void parseRisk(const json& root, RiskConfig& out) {
  const json* risk = section(root, "risk");
  if (risk == nullptr) {
    throw InvalidConfiguration("missing required section 'risk'");
  }
  readOptional(*risk, "max_daily_loss", out.max_daily_loss);
  out.sizing_mode =
      parseSizingMode(requireKey(*risk, "risk", "mode").get<std::string>());
  out.sizing_value = requireKey(*risk, "risk", "value").get<double>();
  readOptional(*risk, "allow_multiple_positions",
               out.allow_multiple_positions);

  requirePositive(out.max_daily_loss, "risk.max_daily_loss");
  requirePositive(out.sizing_value, "risk.value");
}

// ---- execution --------------------------------------------------------------
void parseExecution(const json& root, ExecutionConfig& out) {
  const json* exec = section(root, "execution");
  if (exec == nullptr) {
    return;
  }
  std::string order_type = "MARKET";
  readOptional(*exec, "order_type", order_type);
  out.entry_order_kind = parseEntryOrderKind(order_type);

  readOptional(*exec, "price_tolerance_percent", out.price_tolerance_percent);

  double timeout_sec = static_cast<double>(out.order_timeout_ms) / 1000.0;
  readOptional(*exec, "order_timeout_seconds", timeout_sec);
  out.order_timeout_ms = static_cast<std::int64_t>(timeout_sec * 1000.0);

  readOptional(*exec, "ltp_max_retries", out.ltp_max_retries);
  readOptional(*exec, "ltp_retry_interval_ms", out.ltp_retry_interval_ms);
  readOptional(*exec, "watchdog_interval_ms", out.watchdog_interval_ms);

  requireNonNegative(out.price_tolerance_percent,
                     "execution.price_tolerance_percent");
  requirePositive(static_cast<double>(out.order_timeout_ms),
                  "execution.order_timeout_seconds");
  if (out.ltp_max_retries < 1) {
    throw InvalidConfiguration("execution.ltp_max_retries must be >= 1");
  }
  requireNonNegative(static_cast<double>(out.ltp_retry_interval_ms),
                     "execution.ltp_retry_interval_ms");
  requirePositive(static_cast<double>(out.watchdog_interval_ms),
                  "execution.watchdog_interval_ms");
}

// ---- exit -------------------------------------------------------------------
void parseExit(const json& root, ExitConfig& out) {
  const json* exit = section(root, "exit");
  if (exit == nullptr) {
    throw InvalidConfiguration("missing required section 'exit'");
  }
  out.stop_loss_percent = requireKey(*exit, "exit", "sl_percent").get<double>();
  out.take_profit_percent =
      requireKey(*exit, "exit", "tp_percent").get<double>();
  readOptional(*exit, "tp_exit_enabled", out.take_profit_enabled);
  readOptional(*exit, "trailing_sl", out.trailing_stop_enabled);
  readOptional(*exit, "breakeven_enabled", out.breakeven_enabled);

  out.breakeven_trigger_percent = out.take_profit_percent;
  readOptional(*exit, "breakeven_trigger_percent",
               out.breakeven_trigger_percent);

  readOptional(*exit, "use_broker_sl_orders", out.use_broker_exit_orders);
  readOptional(*exit, "sl_update_threshold_percent",
               out.stop_update_threshold_percent);

  auto squareoff = exit->find("squareoff_time");
  if (squareoff != exit->end() && !squareoff->is_null()) {
    out.squareoff_minute = parseClockTime(squareoff->get<std::string>());
  }

  requirePositive(out.stop_loss_percent, "exit.sl_percent");
  if (out.stop_loss_percent >= 100.0) {
    throw InvalidConfiguration("exit.sl_percent must be < 100");
  }
  requirePositive(out.take_profit_percent, "exit.tp_percent");
  requireNonNegative(out.breakeven_trigger_percent,
                     "exit.breakeven_trigger_percent");
  requireNonNegative(out.stop_update_threshold_percent,
                     "exit.sl_update_threshold_percent");
}

// ---- market / strategy ------------------------------------------------------
void parseMarket(const json& root, MarketConfig& out) {
  const json* market = section(root, "market");
  if (market == nullptr) {
    return;
  }
  auto open = market->find("open");
  if (open != market->end() && !open->is_null()) {
    out.open_minute = parseClockTime(open->get<std::string>());
  }
  auto close = market->find("close");
  if (close != market->end() && !close->is_null()) {
    out.close_minute = parseClockTime(close->get<std::string>());
  }
  readOptional(*market, "utc_offset_minutes", out.utc_offset_minutes);
  readOptional(*market, "trade_weekends", out.trade_weekends);
  readOptional(*market, "candle_timeframe_sec", out.candle_timeframe_sec);

  if (out.close_minute <= out.open_minute) {
    throw InvalidConfiguration("market.close must be after market.open");
  }
  requirePositive(static_cast<double>(out.candle_timeframe_sec),
                  "market.candle_timeframe_sec");
}

void parseStrategy(const json& root, StrategyConfig& out) {
  const json* strategy = section(root, "strategy");
  if (strategy == nullptr) {
    return;
  }
  readOptional(*strategy, "id", out.id);
  readOptional(*strategy, "fast_period", out.fast_period);
  readOptional(*strategy, "slow_period", out.slow_period);
  if (out.fast_period < 1 || out.slow_period <= out.fast_period) {
    throw InvalidConfiguration(
        "strategy periods must satisfy 1 <= fast_period < slow_period");
  }
}

// ---- paper broker -----------------------------------------------------------
void parsePaper(const json& root, PaperBrokerConfig& out) {
  const json* paper = section(root, "paper");
  if (paper == nullptr) {
    return;
  }
  readOptional(*paper, "starting_capital", out.starting_capital);
  auto seed = paper->find("seed");
  if (seed != paper->end() && !seed->is_null()) {
    out.seed = seed->get<std::uint32_t>();
  }
  readOptional(*paper, "min_fill_slices", out.min_fill_slices);
  readOptional(*paper, "max_fill_slices", out.max_fill_slices);
  readOptional(*paper, "multi_fill_min_quantity", out.multi_fill_min_quantity);
  readOptional(*paper, "slice_fraction_min", out.slice_fraction_min);
  readOptional(*paper, "slice_fraction_max", out.slice_fraction_max);
  readOptional(*paper, "price_jitter_percent", out.price_jitter_percent);

  double expiry_sec = static_cast<double>(out.limit_expiry_ms) / 1000.0;
  readOptional(*paper, "limit_expiry_seconds", expiry_sec);
  out.limit_expiry_ms = static_cast<std::int64_t>(expiry_sec * 1000.0);

  requireNonNegative(out.starting_capital, "paper.starting_capital");
  if (out.min_fill_slices < 1 || out.max_fill_slices < out.min_fill_slices) {
    throw InvalidConfiguration(
        "paper fill slices must satisfy 1 <= min_fill_slices <= "
        "max_fill_slices");
  }
  if (out.slice_fraction_min <= 0.0 || out.slice_fraction_max >= 1.0 ||
      out.slice_fraction_max < out.slice_fraction_min) {
    throw InvalidConfiguration(
        "paper slice fractions must satisfy 0 < min <= max < 1");
  }
  requireNonNegative(out.price_jitter_percent, "paper.price_jitter_percent");
  requirePositive(static_cast<double>(out.limit_expiry_ms),
                  "paper.limit_expiry_seconds");
}

// ---- instruments ------------------------------------------------------------
void parseInstruments(const json& root, EngineConfig& out) {
  const json* underlying = section(root, "underlying");
  if (underlying == nullptr) {
    throw InvalidConfiguration("missing required section 'underlying'");
  }
  out.underlying.symbol =
      requireKey(*underlying, "underlying", "symbol").get<std::string>();
  out.underlying.token =
      requireKey(*underlying, "underlying", "token").get<std::string>();
  out.underlying.option_type = domain::OptionType::None;

  auto options = root.find("options");
  if (options == root.end() || options->is_null()) {
    return;
  }
  if (!options->is_array()) {
    throw InvalidConfiguration("'options' must be an array");
  }
  for (const auto& item : *options) {
    domain::Contract c;
    c.symbol = requireKey(item, "options[]", "symbol").get<std::string>();
    c.token = requireKey(item, "options[]", "token").get<std::string>();
    c.lot_size = requireKey(item, "options[]", "lot_size").get<std::int64_t>();
    c.strike = requireKey(item, "options[]", "strike").get<double>();
    c.option_type =
        parseOptionType(requireKey(item, "options[]", "type").get<std::string>());
    if (c.lot_size <= 0) {
      throw InvalidConfiguration("options[].lot_size must be > 0 for " +
                                 c.symbol);
    }
    out.option_chain.push_back(std::move(c));
  }
}

void parseNetwork(const json& root, NetworkConfig& out) {
  const json* network = section(root, "network");
  if (network == nullptr) {
    return;
  }
  readOptional(*network, "market_data_endpoint", out.market_data_endpoint);
  readOptional(*network, "ipc_cmd_endpoint", out.ipc_cmd_endpoint);
  readOptional(*network, "ipc_pub_endpoint", out.ipc_pub_endpoint);
}

}  // namespace

// -----------------------------------------------------------------------------
// parseSizingMode / sizingModeToString
// -----------------------------------------------------------------------------
SizingMode parseSizingMode(const std::string& text) {
  if (text == "fixed_lot") {
    return SizingMode::FixedLot;
  }
  if (text == "percent") {
    return SizingMode::Percent;
  }
  throw InvalidConfiguration("unknown position sizing mode '" + text + "'");
}

const char* sizingModeToString(SizingMode mode) {
  switch (mode) {
    case SizingMode::FixedLot: return "fixed_lot";
    case SizingMode::Percent:  return "percent";
  }
  return "unknown";
}

// -----------------------------------------------------------------------------
// parseClockTime: "HH:MM" -> minute of day
// -----------------------------------------------------------------------------
int parseClockTime(const std::string& text) {
  int hours = -1;
  int minutes = -1;
  char colon = '\0';
  std::istringstream in(text);
  in >> hours >> colon >> minutes;
  if (in.fail() || colon != ':' || !in.eof() || hours < 0 || hours > 23 ||
      minutes < 0 || minutes > 59) {
    throw InvalidConfiguration("invalid clock time '" + text +
                               "' (expected HH:MM)");
  }
  return hours * 60 + minutes;
}

// -----------------------------------------------------------------------------
// parseEngineConfig: json -> EngineConfig, all type errors re-labelled
// -----------------------------------------------------------------------------
EngineConfig parseEngineConfig(const nlohmann::json& root) {
  if (!root.is_object()) {
    throw InvalidConfiguration("configuration root must be a JSON object");
  }

  EngineConfig cfg;
  try {
    parseRisk(root, cfg.risk);
    parseExecution(root, cfg.execution);
    parseExit(root, cfg.exit);
    parseMarket(root, cfg.market);
    parseStrategy(root, cfg.strategy);
    parsePaper(root, cfg.paper);
    parseInstruments(root, cfg);
    parseNetwork(root, cfg.network);

    if (const json* journal = section(root, "journal")) {
      readOptional(*journal, "path", cfg.journal.path);
    }

    std::string clock = "simulation";
    readOptional(root, "clock", clock);
    if (clock != "simulation" && clock != "live") {
      throw InvalidConfiguration("unknown clock '" + clock +
                                 "' (expected simulation or live)");
    }
    cfg.simulated_clock = (clock == "simulation");
  } catch (const nlohmann::json::exception& e) {
    throw InvalidConfiguration(std::string("malformed configuration: ") +
                               e.what());
  }

  return cfg;
}

// -----------------------------------------------------------------------------
// loadEngineConfig: read file, parse JSON, delegate
// -----------------------------------------------------------------------------
EngineConfig loadEngineConfig(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw InvalidConfiguration("cannot open configuration file '" + path + "'");
  }

  nlohmann::json root;
  try {
    root = nlohmann::json::parse(in);
  } catch (const nlohmann::json::parse_error& e) {
    throw InvalidConfiguration("configuration file '" + path +
                               "' is not valid JSON: " + e.what());
  }

  EngineConfig cfg = parseEngineConfig(root);
  std::cout << "[EngineConfig] loaded " << path << ": sizing="
            << sizingModeToString(cfg.risk.sizing_mode) << "/"
            << cfg.risk.sizing_value
            << " entry=" << domain::orderKindToString(
                                cfg.execution.entry_order_kind)
            << " options=" << cfg.option_chain.size() << "\n";
  return cfg;
}

}  // namespace config
}  // namespace optexec
