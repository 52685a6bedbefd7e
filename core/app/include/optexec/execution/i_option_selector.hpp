#pragma once

#include "optexec/domain/contract.hpp"
#include "optexec/domain/signal.hpp"

#include <optional>

namespace optexec {
namespace execution {

// -----------------------------------------------------------------------------
// IOptionSelector — signal + spot -> tradable option contract
// -----------------------------------------------------------------------------
// select() returns std::nullopt when no contract fits. Either call may throw
// (network, instrument master); ExecutionController logs that and drops the
// signal.
// -----------------------------------------------------------------------------
class IOptionSelector {
 public:
  virtual ~IOptionSelector() = default;

  virtual std::optional<domain::Contract> select(domain::SignalType signal,
                                                 double spot_price) = 0;

  // Ask the market data source to start streaming the contract.
  virtual void subscribe(const domain::Contract& contract) = 0;
};

}  // namespace execution
}  // namespace optexec
