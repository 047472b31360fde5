// Copyright (c) 2025 The ISDS Developers
// Distributed under the MIT software license

#include "sim/commands.hpp"
#include "sim/simulation.hpp"
#include "topology/delaunay.hpp"
#include "topology/peers.hpp"
#include <algorithm>
#include <iterator>
#include <random>
#include <string>
#include <vector>

namespace isds {
namespace command {

using sim::Entity;
using sim::EntityId;

namespace {

std::string Id(Entity entity) { return std::to_string(EntityId(entity)); }

} // namespace

bool SpawnRandomNodes::Execute(sim::Simulation &sim, sim::CommandState &) const {
  for (size_t i = 0; i < count_; ++i) {
    sim.SpawnRandomNode();
  }
  return true;
}

std::string SpawnRandomNodes::Describe() const {
  return "spawn-random-nodes(" + std::to_string(count_) + ")";
}

bool SpawnRandomMessages::Execute(sim::Simulation &sim, sim::CommandState &state) const {
  if (count_ > 0 && sim.AllNodes().size() < 2) {
    return state.Invalid("too-few-nodes", "random messages need two nodes");
  }
  for (size_t i = 0; i < count_; ++i) {
    sim.SpawnMessageBetweenRandomNodes();
  }
  return true;
}

std::string SpawnRandomMessages::Describe() const {
  return "spawn-random-messages(" + std::to_string(count_) + ")";
}

bool PokeNode::Execute(sim::Simulation &sim, sim::CommandState &state) const {
  if (!sim.IsNode(node_)) {
    return state.Invalid("unknown-node", "cannot poke entity " + Id(node_));
  }
  sim.ScheduleNow(sim::NodeEvent::Poke(node_));
  return true;
}

std::string PokeNode::Describe() const { return "poke(" + Id(node_) + ")"; }

bool PokeMultipleRandomNodes::Execute(sim::Simulation &sim, sim::CommandState &) const {
  const std::vector<Entity> nodes = sim.AllNodes();
  std::vector<Entity> chosen;
  std::sample(nodes.begin(), nodes.end(), std::back_inserter(chosen),
              std::min(count_, nodes.size()), sim.rng());

  for (Entity node : chosen) {
    sim.ScheduleNow(sim::NodeEvent::Poke(node));
  }
  return true;
}

std::string PokeMultipleRandomNodes::Describe() const {
  return "poke-random(" + std::to_string(count_) + ")";
}

bool AddPeer::Execute(sim::Simulation &sim, sim::CommandState &state) const {
  if (!sim.IsNode(node_) || !sim.IsNode(peer_) || node_ == peer_) {
    return state.Invalid("bad-peer", "cannot link " + Id(node_) + " -> " + Id(peer_));
  }
  topology::AddPeer(sim, node_, peer_);
  return true;
}

std::string AddPeer::Describe() const {
  return "add-peer(" + Id(node_) + ", " + Id(peer_) + ")";
}

bool RemovePeer::Execute(sim::Simulation &sim, sim::CommandState &state) const {
  if (!sim.IsNode(node_)) {
    return state.Invalid("unknown-node", "cannot unlink from entity " + Id(node_));
  }
  topology::RemovePeer(sim, node_, peer_);
  return true;
}

std::string RemovePeer::Describe() const {
  return "remove-peer(" + Id(node_) + ", " + Id(peer_) + ")";
}

bool MakeDelaunayNetwork::Execute(sim::Simulation &sim, sim::CommandState &state) const {
  return topology::MakeDelaunayNetwork(sim, state);
}

std::string MakeDelaunayNetwork::Describe() const { return "make-delaunay-network"; }

bool AddRandomPeers::Execute(sim::Simulation &sim, sim::CommandState &state) const {
  if (!sim.IsNode(node_)) {
    return state.Invalid("unknown-node", "cannot add peers to entity " + Id(node_));
  }
  topology::AddRandomNodesAsPeers(sim, node_, min_peers_, max_peers_);
  return true;
}

std::string AddRandomPeers::Describe() const {
  return "add-random-peers(" + Id(node_) + ", " + std::to_string(min_peers_) + ", " +
         std::to_string(max_peers_) + ")";
}

bool CatchUp::Execute(sim::Simulation &sim, sim::CommandState &state) const {
  if (!(elapsed_ >= 0.0)) {
    return state.Invalid("negative-elapsed", "cannot catch up by a negative time");
  }
  if (sim.Dispatching()) {
    return state.Invalid("nested-catch-up", "cannot advance the clock from inside a dispatch");
  }
  sim.CatchUp(elapsed_);
  return true;
}

std::string CatchUp::Describe() const {
  return "catch-up(" + std::to_string(elapsed_) + ")";
}

} // namespace command
} // namespace isds
