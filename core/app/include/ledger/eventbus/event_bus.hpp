#pragma once

#include "ledger/events/event.hpp"

#include <cstddef>
#include <functional>
#include <mutex>
#include <utility>
#include <vector>

namespace ledger {

// -----------------------------------------------------------------------------
// EventBus
// -----------------------------------------------------------------------------
//
// @brief  In-process publish/subscribe channel for ledger change events.
//
// @details
// Subscribers register either a generic callback (every Event) or a typed
// callback through subscribe<T>(), which only fires for that alternative of
// the Event variant. publish() invokes the callbacks synchronously on the
// calling thread.
//
// The subscriber list is copied under the mutex and callbacks run without
// it, so a callback may itself subscribe, unsubscribe or publish.
//
// Thread model:
//   subscribe(), unsubscribe() and publish() are safe from any thread.
// -----------------------------------------------------------------------------
class EventBus {
 public:
  using GenericCallback = std::function<void(const Event&)>;
  using SubscriptionId = std::size_t;

  EventBus() = default;

  EventBus(const EventBus&) = delete;
  EventBus& operator=(const EventBus&) = delete;

  SubscriptionId subscribe(GenericCallback callback);

  template <typename EventType>
  SubscriptionId subscribe(std::function<void(const EventType&)> callback);

  // A callback already running for the current event may still complete.
  void unsubscribe(SubscriptionId id);

  void publish(const Event& event);

  std::size_t subscriberCount() const;

 private:
  using SubscriberEntry = std::pair<SubscriptionId, GenericCallback>;

  mutable std::mutex mutex_;      // Guards subscribers_ and next_id_
  SubscriptionId next_id_{0};
  std::vector<SubscriberEntry> subscribers_;
};

// Typed subscribe: wraps the callback in a variant type check.
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

}  // namespace ledger
