// Copyright (c) 2025 The ISDS Developers
// Distributed under the MIT software license

#pragma once

#include "sim/types.hpp"
#include "sim/underlay.hpp"
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>

namespace isds {
namespace sim {
class World;
}

namespace observer {

// Unordered node pair, stored with left <= right
struct EdgeEndpoints {
  sim::Entity left;
  sim::Entity right;

  EdgeEndpoints(sim::Entity a, sim::Entity b)
      : left(a <= b ? a : b), right(a <= b ? b : a) {}

  friend bool operator<(const EdgeEndpoints &a, const EdgeEndpoints &b) {
    if (a.left != b.left) {
      return a.left < b.left;
    }
    return a.right < b.right;
  }
  friend bool operator==(const EdgeEndpoints &a, const EdgeEndpoints &b) {
    return a.left == b.left && a.right == b.right;
  }
};

enum class EdgeType {
  UNDIRECTED, // both nodes list each other
  LEFT_RIGHT, // only left lists right
  RIGHT_LEFT, // only right lists left
  PHANTOM     // was a link once, gone now
};

const char *EdgeTypeName(EdgeType type);

/**
 * EdgeMap - undirected layout of all peer links, for drawing
 *
 * Edges that disappear stay behind as PHANTOM so a view can fade them out.
 * The map is rebuilt only when some peer set changed after the last build,
 * judged by the sets' change counters rather than their timestamps.
 */
class EdgeMap {
public:
  struct Edge {
    EdgeType type;
    sim::UnderlayLine line;
  };

  EdgeMap() = default;

  // Returns true if a rebuild happened
  bool RebuildIfNeeded(const sim::World &world, sim::SimSeconds now);
  bool NeedsRebuild(const sim::World &world) const;
  void Rebuild(const sim::World &world, sim::SimSeconds now);

  std::optional<EdgeType> GetEdgeType(sim::Entity a, sim::Entity b) const;
  const std::map<EdgeEndpoints, Edge> &edges() const { return edges_; }
  size_t CountLive() const;

  std::optional<sim::SimSeconds> built_at() const { return built_at_; }

private:
  std::map<EdgeEndpoints, Edge> edges_;
  std::optional<sim::SimSeconds> built_at_;
  // PeerSet::changes() of every peer set as of the last build
  std::map<sim::Entity, uint64_t> built_changes_;
};

} // namespace observer
} // namespace isds
