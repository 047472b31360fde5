// Copyright (c) 2025 The ISDS Developers
// Distributed under the MIT software license

#pragma once

#include "sim/types.hpp"
#include <memory>
#include <string>
#include <variant>

namespace isds {
namespace sim {

class Command;

// Change notification delivered to the node whose peer set changed
struct PeerSetUpdate {
  enum class Kind {
    PEER_ADDED,
    PEER_REMOVED
  };

  Kind kind{Kind::PEER_ADDED};
  Entity peer{kNullEntity};

  static PeerSetUpdate Added(Entity peer) { return {Kind::PEER_ADDED, peer}; }
  static PeerSetUpdate Removed(Entity peer) {
    return {Kind::PEER_REMOVED, peer};
  }

  bool IsAdded() const { return kind == Kind::PEER_ADDED; }
  bool IsRemoved() const { return kind == Kind::PEER_REMOVED; }
};

// A message entity reached its destination
struct MessageArrived {
  Entity message{kNullEntity};
};

// Something happened to a single node
struct NodeEvent {
  enum class Kind {
    POKE,
    PEER_SET_CHANGED
  };

  Entity node{kNullEntity};
  Kind kind{Kind::POKE};
  PeerSetUpdate update{}; // only meaningful for PEER_SET_CHANGED

  static NodeEvent Poke(Entity node) { return {node, Kind::POKE, {}}; }
  static NodeEvent PeerSetChanged(Entity node, PeerSetUpdate update) {
    return {node, Kind::PEER_SET_CHANGED, update};
  }
};

// Deferred operator command
struct CommandEvent {
  std::shared_ptr<const Command> command;
};

using Event = std::variant<MessageArrived, NodeEvent, CommandEvent>;

std::string DescribeEvent(const Event &event);

} // namespace sim
} // namespace isds
