#pragma once

#include "optexec/events/event.hpp"

#include <cstddef>
#include <functional>
#include <mutex>
#include <utility>
#include <vector>

namespace optexec {

// -----------------------------------------------------------------------------
// EventBus
// -----------------------------------------------------------------------------
// Responsibility: In-process publish/subscribe channel for Event values.
//
// @details
// Each EventLoopThread owns one bus; components attach to the bus of the
// loop they run on. Cross-loop traffic never goes through a bus directly:
// a bridge subscriber pushes the event into the other loop's queue.
//
// Delivery is synchronous on the publishing thread, in subscription order.
// A subscriber that throws std::exception is logged and skipped so that
// one failing consumer cannot starve the others of a tick or a fill.
//
// Thread model: subscribe, unsubscribe and publish are safe from any
// thread. The subscriber list is copied under the lock and callbacks run
// without it, so callbacks may publish or unsubscribe.
// -----------------------------------------------------------------------------
class EventBus {
 public:
  using GenericCallback = std::function<void(const Event&)>;
  using SubscriptionId = std::size_t;

  EventBus() = default;

  EventBus(const EventBus&) = delete;
  EventBus& operator=(const EventBus&) = delete;

  // -------------------------------------------------------------------------
  // subscribe(callback)
  // -------------------------------------------------------------------------
  // @brief  Registers a callback for every event published on this bus.
  // @return Id for unsubscribe().
  // -------------------------------------------------------------------------
  SubscriptionId subscribe(GenericCallback callback);

  // -------------------------------------------------------------------------
  // subscribe<EventType>(callback)
  // -------------------------------------------------------------------------
  // @brief  Registers a callback that only sees events holding EventType.
  // @return Id for unsubscribe().
  // -------------------------------------------------------------------------
  template <typename EventType>
  SubscriptionId subscribe(std::function<void(const EventType&)> callback);

  // Removes a subscription. Unknown ids are ignored. A publish() already in
  // flight may still deliver its current event to the removed callback.
  void unsubscribe(SubscriptionId id);

  // Delivers event to every subscriber registered when the call started.
  void publish(const Event& event);

  std::size_t subscriberCount() const;

 private:
  using SubscriberEntry = std::pair<SubscriptionId, GenericCallback>;

  mutable std::mutex mutex_;
  SubscriptionId next_id_{0};
  std::vector<SubscriberEntry> subscribers_;
};

template <typename EventType>
EventBus::SubscriptionId EventBus::subscribe(
    std::function<void(const EventType&)> callback) {
  GenericCallback wrapped = [cb = std::move(callback)](const Event& event) {
    if (const auto* typed = std::get_if<EventType>(&event)) {
      cb(*typed);
    }
  };
  return subscribe(std::move(wrapped));
}

}  // namespace optexec
