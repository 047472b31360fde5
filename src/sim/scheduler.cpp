// Copyright (c) 2025 The ISDS Developers
// Distributed under the MIT software license

#include "sim/scheduler.hpp"
#include "util/logging.hpp"
#include <algorithm>

namespace isds {
namespace sim {

Scheduler::Scheduler() = default;

void Scheduler::Schedule(SimSeconds due_time, Event event) {
  if (due_time < now_) {
    LOG_SIM_TRACE("Clamping past due time {:.3f} to now {:.3f}", due_time, now_);
    due_time = now_;
  }
  queue_.push(TimedEvent{due_time, next_sequence_++, std::move(event)});
}

namespace {

// Clears the flag again even if the dispatcher throws
class DispatchGuard {
public:
  explicit DispatchGuard(bool &flag) : flag_(flag) { flag_ = true; }
  ~DispatchGuard() { flag_ = false; }
  DispatchGuard(const DispatchGuard &) = delete;
  DispatchGuard &operator=(const DispatchGuard &) = delete;

private:
  bool &flag_;
};

} // namespace

size_t Scheduler::CatchUp(SimSeconds target_time, const Dispatcher &dispatch) {
  if (dispatching_) {
    LOG_SIM_WARN("Refusing nested catch-up to {:.3f} at {:.3f}", target_time, now_);
    return 0;
  }

  DispatchGuard guard(dispatching_);
  size_t dispatched = 0;

  while (!queue_.empty() && queue_.top().due_time <= target_time) {
    // Copy before popping: the dispatcher may push onto the queue
    TimedEvent next = queue_.top();
    queue_.pop();

    now_ = std::max(now_, next.due_time);
    dispatch(next.event);
    dispatched++;
  }

  now_ = std::max(now_, target_time);
  return dispatched;
}

std::optional<SimSeconds> Scheduler::NextDueTime() const {
  if (queue_.empty()) {
    return std::nullopt;
  }
  return queue_.top().due_time;
}

void Scheduler::Reset() {
  queue_ = decltype(queue_){};
  now_ = 0.0;
  next_sequence_ = 0;
}

} // namespace sim
} // namespace isds
