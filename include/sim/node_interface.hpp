// Copyright (c) 2025 The ISDS Developers
// Distributed under the MIT software license

#pragma once

#include "sim/simulation.hpp"
#include "sim/types.hpp"
#include "topology/peer_set.hpp"
#include <random>
#include <string>
#include <utility>

namespace isds {
namespace sim {

// The acting node's view of the simulation, handed to protocol handlers
class NodeInterface {
public:
  NodeInterface(Simulation &sim, Entity node) : sim_(sim), node_(node) {}

  Entity id() const { return node_; }

  // Own component, default-constructed on first access
  template <typename T> T &Get() { return sim_.world().GetOrInsert<T>(node_); }

  const topology::PeerSet &Peers() { return Get<topology::PeerSet>(); }

  SimSeconds Now() const { return sim_.Now(); }
  std::mt19937_64 &Rng() { return sim_.rng(); }

  template <typename Payload> bool SendMessage(Entity dest, Payload payload) {
    return sim_.SendMessage(node_, dest, std::move(payload)) != kNullEntity;
  }

  std::string Name() const { return sim_.Name(node_); }

  // Message-log line prefixed with the node name
  void Log(const std::string &message) { sim_.Log(Name() + ": " + message); }

  Simulation &simulation() { return sim_; }

private:
  Simulation &sim_;
  Entity node_;
};

} // namespace sim
} // namespace isds
