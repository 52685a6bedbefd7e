#pragma once

namespace optexec {
namespace domain {

// -----------------------------------------------------------------------------
// OrderStatus
// -----------------------------------------------------------------------------
// Responsibility: Lifecycle state of a broker order.
//
// @details
// Allowed transitions (enforced by ExecutionController::transitionStatus):
//
//   Pending ──► Partial ──► Partial | Filled | Cancelled
//      │
//      ├──► Filled
//      ├──► Cancelled
//      └──► Rejected
//
// Filled, Cancelled and Rejected are terminal. A Partial order that is later
// cancelled keeps the quantity already filled.
// -----------------------------------------------------------------------------
enum class OrderStatus {
  Pending,    // Accepted by the broker, nothing filled yet
  Partial,    // Some quantity filled
  Filled,     // Fully filled — terminal state
  Cancelled,  // Cancelled or expired — terminal state
  Rejected,   // Rejected by the broker — terminal state
};

inline bool isTerminal(OrderStatus status) {
  return status == OrderStatus::Filled ||
         status == OrderStatus::Cancelled ||
         status == OrderStatus::Rejected;
}

inline const char* orderStatusToString(OrderStatus status) {
  switch (status) {
    case OrderStatus::Pending:   return "PENDING";
    case OrderStatus::Partial:   return "PARTIAL";
    case OrderStatus::Filled:    return "FILLED";
    case OrderStatus::Cancelled: return "CANCELLED";
    case OrderStatus::Rejected:  return "REJECTED";
  }
  return "UNKNOWN";
}

}  // namespace domain
}  // namespace optexec
