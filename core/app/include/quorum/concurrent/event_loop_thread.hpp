#pragma once

#include "quorum/concurrent/thread_safe_queue.hpp"
#include "quorum/eventbus/event_bus.hpp"
#include "quorum/events/event.hpp"

#include <atomic>
#include <string>
#include <thread>

namespace quorum {

// -----------------------------------------------------------------------------
// EventLoopThread
// -----------------------------------------------------------------------------
//
// @brief  Owns one worker thread that drains a ThreadSafeQueue<Event> and
//         publishes each event on its own EventBus.
//
// @details
// The orchestrator runs the audit side channel on one of these: proposals,
// decisions, rejections, approvals, order updates, execution results and
// portfolio updates are push()ed from whichever thread produced them, and
// every subscriber (JsonLinesJournal, NotificationDispatcher, IpcServer
// telemetry) runs serialized on the loop thread. Producers never wait on a
// slow subscriber.
//
// stop() publishes whatever is still queued before joining, so an orderly
// shutdown never drops an audit record.
//
// Thread model:
//   push() and eventBus() are safe from any thread. Subscriber callbacks run
//   only on the loop thread. start()/stop() are idempotent.
//
// Ownership:
//   Owns the queue, the bus and the thread. Components that subscribe must
//   unsubscribe before the loop is destroyed.
// -----------------------------------------------------------------------------
class EventLoopThread {
 public:
  explicit EventLoopThread(std::string name = "EventLoop");
  ~EventLoopThread();

  EventLoopThread(const EventLoopThread&) = delete;
  EventLoopThread& operator=(const EventLoopThread&) = delete;
  EventLoopThread(EventLoopThread&&) = delete;
  EventLoopThread& operator=(EventLoopThread&&) = delete;

  void start();
  void stop();

  void push(Event event) { queue_.push(std::move(event)); }

  EventBus& eventBus() { return bus_; }
  const EventBus& eventBus() const { return bus_; }

  bool isRunning() const { return running_.load(); }
  std::size_t pending() const { return queue_.size(); }

 private:
  void run();
  void dispatch(const Event& event);

  std::string name_;
  ThreadSafeQueue<Event> queue_;
  EventBus bus_;
  std::atomic<bool> running_{false};
  std::thread thread_;
};

}  // namespace quorum
