// Copyright (c) 2025 The ISDS Developers
// Distributed under the MIT software license

#include "observer/edge_map.hpp"
#include "sim/world.hpp"
#include "topology/peer_set.hpp"
#include "util/logging.hpp"

namespace isds {
namespace observer {

const char *EdgeTypeName(EdgeType type) {
  switch (type) {
  case EdgeType::UNDIRECTED:
    return "undirected";
  case EdgeType::LEFT_RIGHT:
    return "left-right";
  case EdgeType::RIGHT_LEFT:
    return "right-left";
  case EdgeType::PHANTOM:
    return "phantom";
  }
  return "unknown";
}

bool EdgeMap::RebuildIfNeeded(const sim::World &world, sim::SimSeconds now) {
  if (!NeedsRebuild(world)) {
    return false;
  }
  Rebuild(world, now);
  return true;
}

bool EdgeMap::NeedsRebuild(const sim::World &world) const {
  if (!built_at_) {
    return true;
  }
  size_t sets = 0;
  for (const auto &[node, peers] : world.Query<topology::PeerSet>()) {
    auto it = built_changes_.find(node);
    if (it == built_changes_.end() || it->second != peers->changes()) {
      return true;
    }
    sets++;
  }
  // A peer set went away
  return sets != built_changes_.size();
}

void EdgeMap::Rebuild(const sim::World &world, sim::SimSeconds now) {
  for (auto &[endpoints, edge] : edges_) {
    edge.type = EdgeType::PHANTOM;
  }

  built_changes_.clear();
  for (const auto &[node, peers] : world.Query<topology::PeerSet>()) {
    built_changes_[node] = peers->changes();
    for (sim::Entity peer : *peers) {
      const EdgeEndpoints endpoints(node, peer);
      const EdgeType one_way =
          endpoints.left == node ? EdgeType::LEFT_RIGHT : EdgeType::RIGHT_LEFT;

      auto it = edges_.find(endpoints);
      if (it != edges_.end()) {
        // Seen from the other side during this rebuild: both directions exist
        it->second.type =
            it->second.type == EdgeType::PHANTOM ? one_way : EdgeType::UNDIRECTED;
        continue;
      }

      const auto *from = world.Get<sim::UnderlayPosition>(node);
      const auto *to = world.Get<sim::UnderlayPosition>(peer);
      if (!from || !to) {
        LOG_TRACE("Skipping edge {} - {}: endpoint has no position",
                  sim::EntityId(node), sim::EntityId(peer));
        continue;
      }
      edges_.emplace(endpoints, Edge{one_way, sim::UnderlayLine{*from, *to}});
    }
  }

  built_at_ = now;
}

std::optional<EdgeType> EdgeMap::GetEdgeType(sim::Entity a, sim::Entity b) const {
  auto it = edges_.find(EdgeEndpoints(a, b));
  if (it == edges_.end()) {
    return std::nullopt;
  }
  return it->second.type;
}

size_t EdgeMap::CountLive() const {
  size_t live = 0;
  for (const auto &[endpoints, edge] : edges_) {
    if (edge.type != EdgeType::PHANTOM) {
      live++;
    }
  }
  return live;
}

} // namespace observer
} // namespace isds
