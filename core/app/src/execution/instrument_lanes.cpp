#include "quorum/execution/instrument_lanes.hpp"

#include <chrono>
#include <exception>
#include <iostream>

namespace quorum {

namespace {

constexpr auto kLaneIdleWait = std::chrono::milliseconds(20);

void runTask(const std::string& instrument, const InstrumentLanes::Task& task) {
  try {
    task();
  } catch (const std::exception& ex) {
    std::cerr << "[InstrumentLanes] task for " << instrument
              << " threw: " << ex.what() << "\n";
  }
}

}  // namespace

InstrumentLanes::~InstrumentLanes() { stop(); }

bool InstrumentLanes::post(const std::string& instrument, Task task) {
  std::lock_guard lock(mutex_);
  if (stopping_.load()) {
    return false;
  }

  auto it = lanes_.find(instrument);
  if (it == lanes_.end()) {
    auto lane = std::make_unique<Lane>();
    Lane* raw = lane.get();
    it = lanes_.emplace(instrument, std::move(lane)).first;
    const std::string& name = it->first;
    raw->thread = std::thread([this, &name, raw] { runLane(name, *raw); });
  }
  it->second->queue.push(std::move(task));
  return true;
}

void InstrumentLanes::runLane(const std::string& instrument, Lane& lane) {
  while (!stopping_.load()) {
    auto task = lane.queue.pop_for(kLaneIdleWait);
    if (task) {
      runTask(instrument, *task);
    }
  }
  for (const Task& task : lane.queue.drain()) {
    runTask(instrument, task);
  }
}

void InstrumentLanes::stop() {
  std::map<std::string, std::unique_ptr<Lane>> lanes;
  {
    std::lock_guard lock(mutex_);
    if (stopping_.exchange(true)) {
      return;
    }
    lanes.swap(lanes_);
  }
  for (auto& [instrument, lane] : lanes) {
    lane->queue.wake();
  }
  for (auto& [instrument, lane] : lanes) {
    if (lane->thread.joinable()) {
      lane->thread.join();
    }
  }
}

std::size_t InstrumentLanes::laneCount() const {
  std::lock_guard lock(mutex_);
  return lanes_.size();
}

}  // namespace quorum
