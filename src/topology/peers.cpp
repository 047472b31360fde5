// Copyright (c) 2025 The ISDS Developers
// Distributed under the MIT software license

#include "topology/peers.hpp"
#include "sim/simulation.hpp"
#include "util/logging.hpp"
#include <algorithm>
#include <iterator>
#include <random>
#include <vector>

namespace isds {
namespace topology {

using sim::Entity;
using sim::EntityId;

PeerSet &PeersOf(sim::Simulation &sim, Entity node) {
  return sim.world().GetOrInsert<PeerSet>(node);
}

bool AddPeer(sim::Simulation &sim, Entity node, Entity peer) {
  if (node == peer) {
    LOG_TOPO_WARN("Refusing to peer {} with itself", sim.Name(node));
    return false;
  }
  if (!sim.IsNode(node) || !sim.IsNode(peer)) {
    LOG_TOPO_WARN("Cannot add peer {} -> {}: not a node", EntityId(node),
                  EntityId(peer));
    return false;
  }

  bool changed = PeersOf(sim, node).Insert(peer, sim.Now());
  if (changed) {
    LOG_TOPO_DEBUG("{} added peer {}", sim.Name(node), sim.Name(peer));
  }
  // Announced even for an existing link
  sim.ScheduleNow(sim::NodeEvent::PeerSetChanged(node, sim::PeerSetUpdate::Added(peer)));
  return changed;
}

bool RemovePeer(sim::Simulation &sim, Entity node, Entity peer) {
  auto *peers = sim.world().Get<PeerSet>(node);
  if (!peers || !peers->Remove(peer, sim.Now())) {
    return false;
  }

  LOG_TOPO_DEBUG("{} removed peer {}", sim.Name(node), sim.Name(peer));
  sim.ScheduleNow(sim::NodeEvent::PeerSetChanged(node, sim::PeerSetUpdate::Removed(peer)));
  return true;
}

size_t AddRandomNodesAsPeers(sim::Simulation &sim, Entity node, size_t min_peers,
                             size_t max_peers) {
  if (!sim.IsNode(node)) {
    LOG_TOPO_WARN("Cannot add random peers to {}: not a node", EntityId(node));
    return 0;
  }

  const PeerSet &current = PeersOf(sim, node);
  std::vector<Entity> candidates;
  for (Entity other : sim.AllOtherNodes(node)) {
    if (!current.Contains(other)) {
      candidates.push_back(other);
    }
  }

  max_peers = std::min(max_peers, candidates.size());
  min_peers = std::min(min_peers, max_peers);

  size_t count = min_peers;
  if (min_peers < max_peers) {
    std::uniform_int_distribution<size_t> dist(min_peers, max_peers - 1);
    count = dist(sim.rng());
  }

  std::vector<Entity> chosen;
  chosen.reserve(count);
  std::sample(candidates.begin(), candidates.end(), std::back_inserter(chosen),
              count, sim.rng());

  size_t added = 0;
  for (Entity peer : chosen) {
    if (AddPeer(sim, node, peer)) {
      added++;
    }
  }

  LOG_TOPO_DEBUG("{} got {} random peers ({} candidates)", sim.Name(node), added,
                 candidates.size());
  return added;
}

} // namespace topology
} // namespace isds
