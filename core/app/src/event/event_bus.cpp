#include "optexec/eventbus/event_bus.hpp"

#include <algorithm>
#include <exception>
#include <iostream>

namespace optexec {

// -----------------------------------------------------------------------------
// subscribe: append under the lock, hand back a fresh id
// -----------------------------------------------------------------------------
EventBus::SubscriptionId EventBus::subscribe(GenericCallback callback) {
  std::lock_guard lock(mutex_);
  SubscriptionId id = next_id_++;
  subscribers_.emplace_back(id, std::move(callback));
  return id;
}

// -----------------------------------------------------------------------------
// unsubscribe: erase the matching entry, if any
// -----------------------------------------------------------------------------
void EventBus::unsubscribe(SubscriptionId id) {
  std::lock_guard lock(mutex_);
  subscribers_.erase(
      std::remove_if(subscribers_.begin(), subscribers_.end(),
                     [id](const SubscriberEntry& e) { return e.first == id; }),
      subscribers_.end());
}

// -----------------------------------------------------------------------------
// publish: snapshot the subscriber list, then dispatch without the lock
// -----------------------------------------------------------------------------
void EventBus::publish(const Event& event) {
  std::vector<SubscriberEntry> snapshot;
  {
    std::lock_guard lock(mutex_);
    snapshot = subscribers_;
  }

  for (const auto& [id, callback] : snapshot) {
    try {
      callback(event);
    } catch (const std::exception& e) {
      std::cerr << "[EventBus] ERROR: subscriber " << id
                << " threw on event index " << event.index() << ": "
                << e.what() << "\n";
    }
  }
}

std::size_t EventBus::subscriberCount() const {
  std::lock_guard lock(mutex_);
  return subscribers_.size();
}

}  // namespace optexec
