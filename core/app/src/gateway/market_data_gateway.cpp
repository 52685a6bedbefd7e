#include "optexec/gateway/market_data_gateway.hpp"
#include "optexec/events/event_types.hpp"
#include "optexec/time/time_utils.hpp"

#include <nlohmann/json.hpp>

#include <iostream>
#include <string>
#include <utility>

namespace optexec {

// -----------------------------------------------------------------------------
// Constructor: SUB socket with receive timeout
// -----------------------------------------------------------------------------
MarketDataGateway::MarketDataGateway(SimulationTimeProvider* sim_clock,
                                     EventSink event_sink,
                                     const std::string& endpoint)
    : sim_clock_(sim_clock), event_sink_(std::move(event_sink)) {
  socket_.set(zmq::sockopt::subscribe, "");
  // recv() must return periodically or stop() is never observed.
  socket_.set(zmq::sockopt::rcvtimeo, kRecvTimeoutMs);
  socket_.connect(endpoint);
}

// -----------------------------------------------------------------------------
// decodeTick
// -----------------------------------------------------------------------------
MarketDataEvent MarketDataGateway::decodeTick(const std::string& payload,
                                              std::uint64_t sequence_id) {
  const auto json = nlohmann::json::parse(payload);

  MarketDataEvent md;
  md.symbol = json.at("symbol").get<std::string>();
  md.token = json.value("token", md.symbol);
  md.price = json.at("price").get<double>();
  md.volume = json.value("volume", 0.0);
  md.timestamp = ms_to_timestamp(json.at("timestamp_ms").get<std::int64_t>());
  md.sequence_id = sequence_id;
  return md;
}

// -----------------------------------------------------------------------------
// run(): blocking recv loop
// -----------------------------------------------------------------------------
void MarketDataGateway::run() {
  running_.store(true);

  while (running_.load()) {
    zmq::message_t msg;
    auto result = socket_.recv(msg, zmq::recv_flags::none);
    if (!result.has_value()) {
      continue;  // Timeout; re-check running_.
    }

    std::string payload = msg.to_string();

    try {
      MarketDataEvent md = decodeTick(payload, sequence_.load() + 1);

      // Clock first: everything that handles this tick reads tick time.
      if (sim_clock_ != nullptr) {
        sim_clock_->advance_time(timestamp_to_ms(md.timestamp));
      }
      sequence_.store(md.sequence_id);

      event_sink_(std::move(md));
    } catch (const nlohmann::json::exception& e) {
      std::cerr << "[MarketDataGateway] JSON parse error: " << e.what()
                << " payload: " << payload << "\n";
    }
  }
}

void MarketDataGateway::stop() { running_.store(false); }

}  // namespace optexec
