// Copyright (c) 2025 The ISDS Developers
// Distributed under the MIT software license

#pragma once

#include "sim/events.hpp"
#include "sim/types.hpp"
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <queue>
#include <vector>

namespace isds {
namespace sim {

/**
 * Scheduler - virtual clock plus min-heap of pending events
 *
 * Events are served earliest due time first; equal due times are served in
 * scheduling order. The clock only moves forward: a due time in the past is
 * clamped to now. There is no cancellation.
 */
class Scheduler {
public:
  using Dispatcher = std::function<void(const Event &)>;

  Scheduler();

  void Schedule(SimSeconds due_time, Event event);
  void ScheduleNow(Event event) { Schedule(now_, std::move(event)); }

  // Dispatch every event due at or before target_time, advancing the clock
  // to each event's due time. The dispatcher may schedule more events; those
  // due within the window are served in the same call. Afterwards the clock
  // reads max(now, target_time). Returns the number of events dispatched.
  // A call made from inside the dispatcher is refused and returns 0.
  size_t CatchUp(SimSeconds target_time, const Dispatcher &dispatch);

  SimSeconds Now() const { return now_; }
  bool Dispatching() const { return dispatching_; }
  size_t PendingCount() const { return queue_.size(); }
  std::optional<SimSeconds> NextDueTime() const;

  // Drop all pending events and rewind the clock to zero
  void Reset();

private:
  struct TimedEvent {
    SimSeconds due_time;
    uint64_t sequence;
    Event event;
  };

  // Min-heap with sequence tiebreaker
  struct LaterFirst {
    bool operator()(const TimedEvent &a, const TimedEvent &b) const {
      if (a.due_time != b.due_time) {
        return a.due_time > b.due_time;
      }
      return a.sequence > b.sequence;
    }
  };

  SimSeconds now_ = 0.0;
  uint64_t next_sequence_ = 0;
  bool dispatching_ = false;
  std::priority_queue<TimedEvent, std::vector<TimedEvent>, LaterFirst> queue_;
};

} // namespace sim
} // namespace isds
