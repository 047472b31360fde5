// Copyright (c) 2025 The ISDS Developers
// Distributed under the MIT software license

#pragma once

#include "sim/types.hpp"
#include "topology/peer_set.hpp"
#include <cstddef>

namespace isds {
namespace sim {
class Simulation;
}

namespace topology {

// The node's peer set, created empty on first access
PeerSet &PeersOf(sim::Simulation &sim, sim::Entity node);

// One-directional link node -> peer. A PeerAdded event for `node` is
// scheduled at the current instant even if the link already existed.
// Returns true only if the set changed.
// Self links and links to non-nodes are refused.
bool AddPeer(sim::Simulation &sim, sim::Entity node, sim::Entity peer);

// Inverse of AddPeer. `peer` need not exist any more.
bool RemovePeer(sim::Simulation &sim, sim::Entity node, sim::Entity peer);

// Peer `node` with a random number of random not-yet-peered nodes, drawn
// uniformly from [min_peers, max_peers) after clamping both bounds to the
// candidate count (exactly min_peers if that range is empty).
// Returns the number of peers added.
size_t AddRandomNodesAsPeers(sim::Simulation &sim, sim::Entity node,
                             size_t min_peers, size_t max_peers);

} // namespace topology
} // namespace isds
