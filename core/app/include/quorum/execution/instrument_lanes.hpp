#pragma once

#include "quorum/concurrent/thread_safe_queue.hpp"

#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace quorum {

// -----------------------------------------------------------------------------
// InstrumentLanes — one serial worker per instrument
// -----------------------------------------------------------------------------
//
// @brief  Runs tasks for the same instrument strictly one after another and
//         tasks for different instruments concurrently.
//
// @details
// The ExecutionCoordinator posts each order's state machine to the lane of
// its instrument. Because a lane runs one task at a time, the fills of one
// order are applied to the portfolio before the next order on that
// instrument reaches the venue.
//
// Lanes are created on first use and live until stop(). stop() lets every
// lane finish the task it is running and the tasks already queued, then
// joins; callers cancel their orders first so queued tasks finish quickly.
// post() after stop() is refused (returns false).
//
// Thread model:
//   post() from any thread. Tasks run on the lane threads. A std::exception
//   escaping a task is logged; the lane keeps running.
// -----------------------------------------------------------------------------
class InstrumentLanes {
 public:
  using Task = std::function<void()>;

  InstrumentLanes() = default;
  ~InstrumentLanes();

  InstrumentLanes(const InstrumentLanes&) = delete;
  InstrumentLanes& operator=(const InstrumentLanes&) = delete;

  bool post(const std::string& instrument, Task task);

  void stop();

  std::size_t laneCount() const;

 private:
  struct Lane {
    ThreadSafeQueue<Task> queue;
    std::thread thread;
  };

  void runLane(const std::string& instrument, Lane& lane);

  mutable std::mutex mutex_;
  std::map<std::string, std::unique_ptr<Lane>> lanes_;
  std::atomic<bool> stopping_{false};
};

}  // namespace quorum
