#include "quorum/concurrent/event_loop_thread.hpp"

#include <chrono>
#include <exception>
#include <iostream>

namespace quorum {

namespace {

// Upper bound on how long the worker sleeps with an empty queue before it
// re-checks running_. stop() also wakes it directly.
constexpr auto kIdleWaitTimeout = std::chrono::milliseconds(10);

}  // namespace

EventLoopThread::EventLoopThread(std::string name) : name_(std::move(name)) {}

EventLoopThread::~EventLoopThread() { stop(); }

void EventLoopThread::start() {
  if (thread_.joinable()) {
    return;
  }
  running_.store(true);
  thread_ = std::thread([this] { run(); });
}

// -----------------------------------------------------------------------------
// stop()
// -----------------------------------------------------------------------------
// Clears running_, wakes the worker and joins it. The worker flushes the
// queue on its way out (see run()).
// -----------------------------------------------------------------------------
void EventLoopThread::stop() {
  if (!thread_.joinable()) {
    return;
  }
  running_.store(false);
  queue_.wake();
  thread_.join();
}

void EventLoopThread::run() {
  while (running_.load()) {
    std::optional<Event> event = queue_.pop_for(kIdleWaitTimeout);
    if (event) {
      dispatch(*event);
    }
  }

  // Flush: events pushed before stop() still reach their subscribers.
  for (const Event& event : queue_.drain()) {
    dispatch(event);
  }
}

// A throwing subscriber must not take the loop (and every other subscriber)
// down with it.
void EventLoopThread::dispatch(const Event& event) {
  try {
    bus_.publish(event);
  } catch (const std::exception& ex) {
    std::cerr << "[" << name_ << "] subscriber threw: " << ex.what()
              << std::endl;
  }
}

}  // namespace quorum
