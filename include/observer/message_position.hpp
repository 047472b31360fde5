// Copyright (c) 2025 The ISDS Developers
// Distributed under the MIT software license

#pragma once

#include "sim/types.hpp"
#include "sim/underlay.hpp"
#include <optional>
#include <vector>

namespace isds {
namespace sim {
class World;
}

namespace observer {

// An in-flight message as drawn on the underlay
struct MessagePosition {
  sim::Entity message;
  sim::Entity source;
  sim::Entity dest;
  sim::UnderlayPosition position;
  double progress; // clamped to [0, 1]
};

// Where a message is at `now`; nullopt if the entity is not an in-flight
// message
std::optional<MessagePosition> LocateMessage(const sim::World &world, sim::Entity message,
                                             sim::SimSeconds now);

// All in-flight messages, in entity order
std::vector<MessagePosition> LocateMessages(const sim::World &world, sim::SimSeconds now);

} // namespace observer
} // namespace isds
