#pragma once

#include <cstdint>
#include <string>

namespace optexec {
namespace domain {

// -----------------------------------------------------------------------------
// OptionType
// -----------------------------------------------------------------------------
// None is used for the underlying (index or future); CE/PE for option legs.
// -----------------------------------------------------------------------------
enum class OptionType {
  None,
  Call,  // CE
  Put,   // PE
};

// -----------------------------------------------------------------------------
// Contract
// -----------------------------------------------------------------------------
// Responsibility: External identity of a tradable instrument.
//
// @details
// Contracts come from the instrument master (configuration in this build) and
// are never mutated after load. Components copy them by value into orders,
// positions and events; two contracts refer to the same instrument when
// their tokens match. The symbol is the key used by the position ledger.
//
// Thread-safety: value type, safe to copy between threads.
// -----------------------------------------------------------------------------
struct Contract {
  std::string symbol;            // Exchange trading symbol, e.g. "NIFTY24OCT22000CE"
  std::string token;             // Exchange token used by the market data feed
  std::int64_t lot_size{1};      // Minimum tradable multiple
  double strike{0.0};            // Strike price, 0 for the underlying
  OptionType option_type{OptionType::None};
};

inline bool sameInstrument(const Contract& a, const Contract& b) {
  return a.token == b.token;
}

inline const char* optionTypeToString(OptionType type) {
  switch (type) {
    case OptionType::None: return "NONE";
    case OptionType::Call: return "CE";
    case OptionType::Put:  return "PE";
  }
  return "NONE";
}

}  // namespace domain
}  // namespace optexec
