#pragma once

#include "optexec/domain/exit_reason.hpp"
#include "optexec/domain/order.hpp"
#include "optexec/events/event_types.hpp"

#include <cstdint>
#include <string>

namespace optexec {

// -----------------------------------------------------------------------------
// PositionClosedEvent
// -----------------------------------------------------------------------------
// Published by the exit controller after an exit has been finalized in the
// ledger and the risk governor. Telemetry only; no component changes state
// in response to it.
// -----------------------------------------------------------------------------
struct PositionClosedEvent {
  domain::OrderId entry_order_id{domain::kNoOrderId};
  domain::OrderId exit_order_id{domain::kNoOrderId};
  std::string symbol;
  std::int64_t quantity{0};
  double entry_price{0.0};
  double exit_price{0.0};
  double pnl{0.0};
  domain::ExitReason reason{domain::ExitReason::StopLoss};
  Timestamp timestamp{};
};

}  // namespace optexec
