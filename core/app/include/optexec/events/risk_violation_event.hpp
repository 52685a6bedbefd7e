#pragma once

#include "optexec/events/event_types.hpp"

#include <string>

namespace optexec {

// -----------------------------------------------------------------------------
// RiskViolationEvent
// -----------------------------------------------------------------------------
// Emitted once when the kill switch engages, either because the cumulative
// realized PnL magnitude reached the daily loss limit or because an operator
// issued HALT. current_value / limit_value are the PnL and the limit.
// -----------------------------------------------------------------------------
struct RiskViolationEvent {
  std::string reason;
  double current_value{0.0};
  double limit_value{0.0};
  Timestamp timestamp{};
};

}  // namespace optexec
