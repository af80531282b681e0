#pragma once

#include "quorum/events/event.hpp"

#include <functional>
#include <mutex>
#include <utility>
#include <vector>

namespace quorum {

// -----------------------------------------------------------------------------
// EventBus
// -----------------------------------------------------------------------------
// Responsibility: Publish-subscribe channel for the audit side channel.
// Persistence, notification and IPC telemetry subscribe; the orchestrator,
// aggregator cycle and execution coordinator publish (via EventLoopThread).
//
// Thread model: subscribe, unsubscribe and publish are safe from any thread.
// Callbacks run synchronously on the publishing thread. The subscriber list
// is copied under the lock and invoked without it, so a callback may publish
// or unsubscribe without deadlocking.
// -----------------------------------------------------------------------------
class EventBus {
 public:
  using GenericCallback = std::function<void(const Event&)>;
  using SubscriptionId = std::size_t;

  EventBus() = default;

  EventBus(const EventBus&) = delete;
  EventBus& operator=(const EventBus&) = delete;

  // Registers a callback invoked for every published event.
  SubscriptionId subscribe(GenericCallback callback);

  // Registers a callback invoked only for events holding EventType.
  template <typename EventType>
  SubscriptionId subscribe(std::function<void(const EventType&)> callback);

  // Removes a subscription. A publish() already in progress may still
  // deliver the current event to it.
  void unsubscribe(SubscriptionId id);

  // Delivers `event` to every subscriber on the calling thread.
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

}  // namespace quorum
