// Copyright (c) 2025 The ISDS Developers
// Distributed under the MIT software license

#pragma once

#include "sim/types.hpp"
#include <algorithm>
#include <cmath>
#include <string>

namespace isds {
namespace sim {

// Components describing the physical layer beneath the protocols

struct UnderlayPosition {
  float x{0.f};
  float y{0.f};

  static float Distance(const UnderlayPosition &a, const UnderlayPosition &b) {
    return std::hypot(a.x - b.x, a.y - b.y);
  }

  friend bool operator==(const UnderlayPosition &a, const UnderlayPosition &b) {
    return a.x == b.x && a.y == b.y;
  }
};

struct UnderlayNodeName {
  std::string name;
};

// Straight trajectory of an in-flight message
struct UnderlayLine {
  UnderlayPosition start;
  UnderlayPosition end;
};

// [start, end) virtual-time interval of an in-flight message
struct TimeSpan {
  SimSeconds start{0.0};
  SimSeconds end{0.0};

  // Fraction of the span elapsed at `now`; may leave [0, 1]
  double Progress(SimSeconds now) const {
    if (end <= start) {
      return now >= end ? 1.0 : 0.0;
    }
    return (now - start) / (end - start);
  }

  double ProgressClamped(SimSeconds now) const {
    return std::clamp(Progress(now), 0.0, 1.0);
  }
};

// Transport envelope of a message entity
struct UnderlayMessage {
  Entity source{kNullEntity};
  Entity dest{kNullEntity};
};

// Where a message travelling along `line` during `span` is at `now`
inline UnderlayPosition Interpolate(const UnderlayLine &line, const TimeSpan &span,
                                    SimSeconds now) {
  const float progress = static_cast<float>(span.ProgressClamped(now));
  return UnderlayPosition{
      std::fma(line.end.x - line.start.x, progress, line.start.x),
      std::fma(line.end.y - line.start.y, progress, line.start.y)};
}

} // namespace sim
} // namespace isds
