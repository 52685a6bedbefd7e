#pragma once

#include "optexec/domain/order.hpp"

#include <atomic>
#include <cstdint>

namespace optexec {

// -----------------------------------------------------------------------------
// OrderIdGenerator
// -----------------------------------------------------------------------------
//
// @brief  Session-wide source of order ids.
//
// @details
// One instance is owned by TradingEngine and shared by reference with the
// ExecutionController (which pre-generates entry ids before submission) and
// the PaperBroker (which assigns ids to exit orders that arrive without one).
// Sharing a single counter is what keeps the two id spaces disjoint.
//
// Ids start at 1; domain::kNoOrderId (0) is never issued.
//
// Thread-safety: next_id() is a relaxed fetch_add, safe from any thread.
// Uniqueness is all that is required, not ordering against other memory.
// -----------------------------------------------------------------------------
class OrderIdGenerator {
 public:
  OrderIdGenerator() = default;

  OrderIdGenerator(const OrderIdGenerator&) = delete;
  OrderIdGenerator& operator=(const OrderIdGenerator&) = delete;
  OrderIdGenerator(OrderIdGenerator&&) = delete;
  OrderIdGenerator& operator=(OrderIdGenerator&&) = delete;

  domain::OrderId next_id() {
    return next_id_.fetch_add(1, std::memory_order_relaxed);
  }

 private:
  std::atomic<domain::OrderId> next_id_{1};
};

}  // namespace optexec
