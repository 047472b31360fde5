// Copyright (c) 2025 The ISDS Developers
// Distributed under the MIT software license

#pragma once

#include "sim/operation_state.hpp"
#include "sim/underlay.hpp"
#include <cstddef>
#include <utility>
#include <vector>

namespace isds {
namespace sim {
class Simulation;
}

namespace topology {

// Undirected edge between two point indices, first < second
using PointEdge = std::pair<size_t, size_t>;

/**
 * Edges of the Delaunay triangulation of `points`, sorted and unique
 *
 * Computed as the dual of the Voronoi diagram: two sites are neighbours when
 * their Voronoi cells share an edge. Coordinates are snapped to a 1/1000 grid.
 *
 * Fails (state set, edges untouched) with fewer than 3 distinct positions or
 * when all positions are collinear. Points sharing a position with an earlier
 * point get no edges. Four or more cocircular points yield the bounding
 * polygon without a diagonal.
 */
bool ComputeDelaunayEdges(const std::vector<sim::UnderlayPosition> &points,
                          std::vector<PointEdge> &edges, sim::CommandState &state);

// Rewire every node so its peer set equals its triangulation neighbours.
// Links that no longer belong are removed, missing ones added, each change
// notified. On failure no peer set is touched.
bool MakeDelaunayNetwork(sim::Simulation &sim, sim::CommandState &state);

} // namespace topology
} // namespace isds
