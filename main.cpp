// -----------------------------------------------------------------------------
// optexec_engine — single executable entry point.
//
//   optexec_engine [config.json]
//
//   1) Load the engine configuration (default config/engine_config.json).
//      An invalid configuration is fatal: exit code 2.
//   2) Pick the clock: a SimulationTimeProvider advanced by the market data
//      gateway per tick ("clock": "simulation"), or the wall clock.
//   3) Start the TradingEngine. Ticks arrive on the market data thread,
//      operator commands on the IPC thread.
//   4) Wait for SIGINT, then stop the engine: every open position is exited
//      with reason SYSTEM_SHUTDOWN before the threads are joined.
// -----------------------------------------------------------------------------

#include "optexec/config/engine_config.hpp"
#include "optexec/engine/trading_engine.hpp"
#include "optexec/errors.hpp"
#include "optexec/time/live_time_provider.hpp"
#include "optexec/time/simulation_time_provider.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

namespace {

// Set by the SIGINT handler, polled by main(). The only global.
std::atomic<bool> g_stop_requested{false};

void sigint_handler(int /*signum*/) { g_stop_requested.store(true); }

}  // namespace

int main(int argc, char** argv) {
  const std::string config_path =
      argc > 1 ? argv[1] : "config/engine_config.json";

  optexec::config::EngineConfig cfg;
  try {
    cfg = optexec::config::loadEngineConfig(config_path);
  } catch (const optexec::InvalidConfiguration& e) {
    std::cerr << "[main] CRITICAL: invalid configuration: " << e.what()
              << "\n";
    return 2;
  }

  optexec::SimulationTimeProvider sim_clock;
  optexec::LiveTimeProvider live_clock;
  optexec::ITimeProvider& time = cfg.simulated_clock
                                     ? static_cast<optexec::ITimeProvider&>(
                                           sim_clock)
                                     : live_clock;

  optexec::TradingEngine engine(cfg, time,
                                cfg.simulated_clock ? &sim_clock : nullptr);

  std::signal(SIGINT, sigint_handler);

  try {
    engine.start();
  } catch (const std::exception& e) {
    std::cerr << "[main] CRITICAL: engine failed to start: " << e.what()
              << "\n";
    engine.stop();
    return 1;
  }

  std::cout << "[main] Listening for ticks on "
            << cfg.network.market_data_endpoint << "\n"
            << "[main] Press Ctrl-C to shut down.\n";

  while (!g_stop_requested.load()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  std::cout << "\n[main] SIGINT received. Shutting down...\n";
  engine.stop();
  return 0;
}
