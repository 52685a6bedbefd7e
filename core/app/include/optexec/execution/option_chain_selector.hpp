#pragma once

#include "optexec/domain/contract.hpp"
#include "optexec/execution/i_option_selector.hpp"

#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace optexec {
namespace execution {

// -----------------------------------------------------------------------------
// OptionChainSelector — nearest-strike pick from a configured option chain
// -----------------------------------------------------------------------------
// BUY_CE picks among the CE contracts, BUY_PE among the PE contracts, the
// one whose strike is closest to the spot price. On a tie the lower strike
// wins. subscribe() records the token; the market data feed in this build
// streams every configured contract, so nothing is sent upstream.
//
// Thread model: the chain is immutable after construction; the subscription
// set is guarded by a mutex.
// -----------------------------------------------------------------------------
class OptionChainSelector final : public IOptionSelector {
 public:
  explicit OptionChainSelector(std::vector<domain::Contract> chain);

  std::optional<domain::Contract> select(domain::SignalType signal,
                                         double spot_price) override;

  void subscribe(const domain::Contract& contract) override;

  bool isSubscribed(const std::string& token) const;

  std::size_t chainSize() const { return chain_.size(); }

 private:
  const std::vector<domain::Contract> chain_;

  mutable std::mutex mutex_;
  std::set<std::string> subscribed_;
};

}  // namespace execution
}  // namespace optexec
