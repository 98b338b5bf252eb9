#pragma once

#include "predict/events/event.hpp"

#include <cstddef>
#include <functional>
#include <mutex>
#include <utility>
#include <vector>

namespace predict {

// -----------------------------------------------------------------------------
// EventBus — synchronous in-process publish/subscribe
// -----------------------------------------------------------------------------
//
// @brief  Fan-out of engine events (signal decisions, bets, position
//         updates, resolutions, risk violations, tick summaries) to
//         observers: the console logger in main, the IPC telemetry bridge,
//         tests.
//
// @details
// Observers only. No component takes decisions from the bus; the decision
// path is the direct call chain inside TradingPipeline, which keeps a tick
// deterministic regardless of who is listening.
//
// Callbacks run on the publishing thread before publish() returns. The
// subscriber list is copied under the lock and invoked without it, so a
// callback may subscribe, unsubscribe or publish without deadlocking.
// -----------------------------------------------------------------------------
class EventBus {
 public:
  using GenericCallback = std::function<void(const Event&)>;
  using SubscriptionId = std::size_t;

  EventBus() = default;

  EventBus(const EventBus&) = delete;
  EventBus& operator=(const EventBus&) = delete;

  // Receives every published event.
  SubscriptionId subscribe(GenericCallback callback);

  // Receives only events holding EventType.
  template <typename EventType>
  SubscriptionId subscribe(std::function<void(const EventType&)> callback);

  // A publish() already in flight on another thread may still deliver one
  // more event to the removed callback.
  void unsubscribe(SubscriptionId id);

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
    if (const auto* ptr = std::get_if<EventType>(&event)) {
      cb(*ptr);
    }
  };
  return subscribe(std::move(wrapped));
}

}  // namespace predict
