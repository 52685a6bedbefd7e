#pragma once

#include <optional>
#include <string_view>

namespace optexec {
namespace domain {

// -----------------------------------------------------------------------------
// SignalType
// -----------------------------------------------------------------------------
// BuyCall (BUY_CE) on a bullish crossover, BuyPut (BUY_PE) on a bearish one.
// Both open a long option position; there is no short side.
// -----------------------------------------------------------------------------
enum class SignalType {
  BuyCall,
  BuyPut,
};

inline const char* signalToString(SignalType signal) {
  switch (signal) {
    case SignalType::BuyCall: return "BUY_CE";
    case SignalType::BuyPut:  return "BUY_PE";
  }
  return "UNKNOWN";
}

// Returns std::nullopt for anything other than "BUY_CE" / "BUY_PE".
inline std::optional<SignalType> parseSignal(std::string_view text) {
  if (text == "BUY_CE") {
    return SignalType::BuyCall;
  }
  if (text == "BUY_PE") {
    return SignalType::BuyPut;
  }
  return std::nullopt;
}

}  // namespace domain
}  // namespace optexec
