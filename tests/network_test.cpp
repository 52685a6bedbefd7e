// =============================================================================
// network_test.cpp
// =============================================================================
// Unit tests for the wire-format helpers of the network layer:
//   - optexec::MarketDataGateway::decodeTick (JSON tick -> MarketDataEvent)
//   - optexec::IpcServer::formatTelemetry    (Event -> JSON telemetry)
//
// Validates:
//   - Required and optional tick fields, and the errors malformed ticks raise
//   - Each telemetry event type carries its "type" tag and payload fields
//   - Events that are not telemetry are not formatted
//
// No sockets are opened; the helpers are static and pure.
// =============================================================================

#include "optexec/gateway/market_data_gateway.hpp"
#include "optexec/network/ipc_server.hpp"
#include "optexec/time/time_utils.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace {

constexpr std::int64_t kTickTime = 1'704'083'400'000;

}  // namespace

// =============================================================================
// 1. decodeTick
// =============================================================================

TEST(DecodeTickTest, DecodesAllFields) {
  const std::string payload =
      R"({"symbol":"NIFTY24JAN21500CE","token":"43650","price":101.5,)"
      R"("volume":1200,"timestamp_ms":1704083400000})";

  optexec::MarketDataEvent md =
      optexec::MarketDataGateway::decodeTick(payload, 7);

  EXPECT_EQ(md.symbol, "NIFTY24JAN21500CE");
  EXPECT_EQ(md.token, "43650");
  EXPECT_DOUBLE_EQ(md.price, 101.5);
  EXPECT_DOUBLE_EQ(md.volume, 1200.0);
  EXPECT_EQ(optexec::timestamp_to_ms(md.timestamp), kTickTime);
  EXPECT_EQ(md.sequence_id, 7u);
}

// Feeds that only publish the symbol key ticks by symbol.
TEST(DecodeTickTest, TokenDefaultsToSymbolAndVolumeToZero) {
  const std::string payload =
      R"({"symbol":"NIFTY","price":21500.0,"timestamp_ms":1704083400000})";

  optexec::MarketDataEvent md =
      optexec::MarketDataGateway::decodeTick(payload, 1);

  EXPECT_EQ(md.token, "NIFTY");
  EXPECT_DOUBLE_EQ(md.volume, 0.0);
}

TEST(DecodeTickTest, MissingRequiredFieldThrows) {
  EXPECT_THROW(optexec::MarketDataGateway::decodeTick(
                   R"({"symbol":"NIFTY","timestamp_ms":1})", 1),
               nlohmann::json::exception);
  EXPECT_THROW(optexec::MarketDataGateway::decodeTick(
                   R"({"symbol":"NIFTY","price":1.0})", 1),
               nlohmann::json::exception);
}

TEST(DecodeTickTest, MalformedJsonThrows) {
  EXPECT_THROW(optexec::MarketDataGateway::decodeTick("{not json", 1),
               nlohmann::json::exception);
  EXPECT_THROW(optexec::MarketDataGateway::decodeTick(
                   R"({"symbol":"NIFTY","price":"high","timestamp_ms":1})", 1),
               nlohmann::json::exception);
}

// =============================================================================
// 2. formatTelemetry
// =============================================================================

TEST(FormatTelemetryTest, OrderFilled) {
  optexec::OrderFilledEvent e;
  e.order_id = 12;
  e.contract.symbol = "NIFTY24JAN21500CE";
  e.side = optexec::domain::Side::Buy;
  e.fill_price = 104.0;
  e.total_quantity = 50;
  e.filled_quantity = 50;
  e.fills.push_back({12, 30, 100.0, 1, kTickTime});
  e.fills.push_back({12, 20, 110.0, 2, kTickTime});
  e.timestamp = optexec::ms_to_timestamp(kTickTime);

  std::optional<std::string> text = optexec::IpcServer::formatTelemetry(e);
  ASSERT_TRUE(text.has_value());

  const auto j = nlohmann::json::parse(*text);
  EXPECT_EQ(j.at("type"), "order_filled");
  EXPECT_EQ(j.at("order_id").get<std::uint64_t>(), 12u);
  EXPECT_EQ(j.at("symbol"), "NIFTY24JAN21500CE");
  EXPECT_EQ(j.at("side"), "BUY");
  EXPECT_DOUBLE_EQ(j.at("fill_price").get<double>(), 104.0);
  EXPECT_EQ(j.at("filled_quantity").get<std::int64_t>(), 50);
  EXPECT_FALSE(j.at("is_partial").get<bool>());
  EXPECT_EQ(j.at("fills").get<std::size_t>(), 2u);
  EXPECT_EQ(j.at("timestamp_ms").get<std::int64_t>(), kTickTime);
}

TEST(FormatTelemetryTest, PositionClosed) {
  optexec::PositionClosedEvent e;
  e.entry_order_id = 3;
  e.exit_order_id = 9;
  e.symbol = "NIFTY24JAN21500PE";
  e.quantity = 50;
  e.entry_price = 100.0;
  e.exit_price = 79.0;
  e.pnl = -1050.0;
  e.reason = optexec::domain::ExitReason::StopLoss;

  std::optional<std::string> text = optexec::IpcServer::formatTelemetry(e);
  ASSERT_TRUE(text.has_value());

  const auto j = nlohmann::json::parse(*text);
  EXPECT_EQ(j.at("type"), "position_closed");
  EXPECT_EQ(j.at("entry_order_id").get<std::uint64_t>(), 3u);
  EXPECT_EQ(j.at("exit_order_id").get<std::uint64_t>(), 9u);
  EXPECT_DOUBLE_EQ(j.at("pnl").get<double>(), -1050.0);
  EXPECT_EQ(j.at("reason"), "SL");
}

TEST(FormatTelemetryTest, RiskViolation) {
  optexec::RiskViolationEvent e;
  e.reason = "Max Daily Loss Reached";
  e.current_value = -5000.0;
  e.limit_value = 5000.0;

  std::optional<std::string> text = optexec::IpcServer::formatTelemetry(e);
  ASSERT_TRUE(text.has_value());

  const auto j = nlohmann::json::parse(*text);
  EXPECT_EQ(j.at("type"), "risk_violation");
  EXPECT_EQ(j.at("reason"), "Max Daily Loss Reached");
  EXPECT_DOUBLE_EQ(j.at("current_value").get<double>(), -5000.0);
  EXPECT_DOUBLE_EQ(j.at("limit_value").get<double>(), 5000.0);
}

TEST(FormatTelemetryTest, MarketDataIsNotTelemetry) {
  optexec::MarketDataEvent md;
  md.symbol = "NIFTY";
  md.price = 21500.0;

  EXPECT_FALSE(optexec::IpcServer::formatTelemetry(md).has_value());
}
