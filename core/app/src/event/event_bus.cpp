#include "predict/eventbus/event_bus.hpp"

#include <algorithm>

namespace predict {

// -----------------------------------------------------------------------------
// subscribe(GenericCallback)
// -----------------------------------------------------------------------------
EventBus::SubscriptionId EventBus::subscribe(GenericCallback callback) {
  std::lock_guard lock(mutex_);

  // Ids are never reused, so a stale id handed to unsubscribe() later
  // cannot remove somebody else's callback.
  SubscriptionId id = next_id_++;
  subscribers_.emplace_back(id, std::move(callback));
  return id;
}

// -----------------------------------------------------------------------------
// unsubscribe(id): unknown ids are ignored
// -----------------------------------------------------------------------------
void EventBus::unsubscribe(SubscriptionId id) {
  std::lock_guard lock(mutex_);

  // erase/remove_if keeps the remaining subscribers in registration order,
  // which is the delivery order publish() guarantees.
  subscribers_.erase(
      std::remove_if(subscribers_.begin(), subscribers_.end(),
                     [id](const SubscriberEntry& e) { return e.first == id; }),
      subscribers_.end());
}

// -----------------------------------------------------------------------------
// publish(): snapshot the list under the lock, deliver outside it
// -----------------------------------------------------------------------------
void EventBus::publish(const Event& event) {
  std::vector<SubscriberEntry> copy;
  {
    // Only the copy happens under the lock. A callback that subscribes,
    // unsubscribes or publishes re-enters the bus without deadlocking; a
    // subscriber added during this call first hears the next event.
    std::lock_guard lock(mutex_);
    copy = subscribers_;
  }

  // Synchronous fan-out on the caller's thread. An exception from a
  // callback propagates to the publisher; the tick boundary in AgentLoop
  // is where it is caught and reported.
  for (const auto& entry : copy) {
    entry.second(event);
  }
}

std::size_t EventBus::subscriberCount() const {
  std::lock_guard lock(mutex_);
  return subscribers_.size();
}

}  // namespace predict
