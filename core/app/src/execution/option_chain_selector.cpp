#include "optexec/execution/option_chain_selector.hpp"

#include <cmath>
#include <iostream>
#include <utility>

namespace optexec {
namespace execution {

OptionChainSelector::OptionChainSelector(std::vector<domain::Contract> chain)
    : chain_(std::move(chain)) {}

std::optional<domain::Contract> OptionChainSelector::select(
    domain::SignalType signal, double spot_price) {
  const domain::OptionType wanted = signal == domain::SignalType::BuyCall
                                        ? domain::OptionType::Call
                                        : domain::OptionType::Put;

  const domain::Contract* best = nullptr;
  double best_distance = 0.0;
  for (const domain::Contract& c : chain_) {
    if (c.option_type != wanted) {
      continue;
    }
    const double distance = std::abs(c.strike - spot_price);
    if (best == nullptr || distance < best_distance ||
        (distance == best_distance && c.strike < best->strike)) {
      best = &c;
      best_distance = distance;
    }
  }

  if (best == nullptr) {
    std::cerr << "[OptionChainSelector] WARNING: no "
              << domain::optionTypeToString(wanted)
              << " contracts in the chain.\n";
    return std::nullopt;
  }

  std::cout << "[OptionChainSelector] " << domain::signalToString(signal)
            << " spot=" << spot_price << " -> " << best->symbol
            << " (strike " << best->strike << ")\n";
  return *best;
}

void OptionChainSelector::subscribe(const domain::Contract& contract) {
  std::lock_guard lock(mutex_);
  subscribed_.insert(contract.token);
}

bool OptionChainSelector::isSubscribed(const std::string& token) const {
  std::lock_guard lock(mutex_);
  return subscribed_.count(token) > 0;
}

}  // namespace execution
}  // namespace optexec
