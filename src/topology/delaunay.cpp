// Copyright (c) 2025 The ISDS Developers
// Distributed under the MIT software license

#include "topology/delaunay.hpp"
#include "sim/simulation.hpp"
#include "topology/peers.hpp"
#include "util/logging.hpp"
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <boost/polygon/point_data.hpp>
#include <boost/polygon/voronoi.hpp>

namespace isds {
namespace topology {

namespace {

using GridPoint = boost::polygon::point_data<int32_t>;

constexpr double kGridScale = 1000.0;
constexpr double kGridLimit = 1 << 30;

bool IsCollinear(const std::vector<GridPoint> &sites) {
  const GridPoint &a = sites[0];
  const GridPoint &b = sites[1];
  for (size_t i = 2; i < sites.size(); ++i) {
    const GridPoint &c = sites[i];
    const int64_t cross =
        static_cast<int64_t>(b.x() - a.x()) * (c.y() - a.y()) -
        static_cast<int64_t>(b.y() - a.y()) * (c.x() - a.x());
    if (cross != 0) {
      return false;
    }
  }
  return true;
}

} // namespace

bool ComputeDelaunayEdges(const std::vector<sim::UnderlayPosition> &points,
                          std::vector<PointEdge> &edges, sim::CommandState &state) {
  // Distinct grid sites; site_owner maps a site back to the first point on it
  std::vector<GridPoint> sites;
  std::vector<size_t> site_owner;
  std::map<std::pair<int32_t, int32_t>, size_t> seen;

  for (size_t i = 0; i < points.size(); ++i) {
    const double sx = std::round(points[i].x * kGridScale);
    const double sy = std::round(points[i].y * kGridScale);
    if (!std::isfinite(sx) || !std::isfinite(sy) || std::fabs(sx) > kGridLimit ||
        std::fabs(sy) > kGridLimit) {
      return state.Invalid("position-out-of-range",
                           "point " + std::to_string(i) + " cannot be triangulated");
    }
    const auto key = std::make_pair(static_cast<int32_t>(sx), static_cast<int32_t>(sy));
    if (!seen.emplace(key, sites.size()).second) {
      LOG_TOPO_WARN("Point {} duplicates an earlier position and gets no neighbours", i);
      continue;
    }
    sites.emplace_back(key.first, key.second);
    site_owner.push_back(i);
  }

  if (sites.size() < 3) {
    return state.Invalid("too-few-points",
                         std::to_string(sites.size()) + " distinct positions, need 3");
  }
  if (IsCollinear(sites)) {
    return state.Invalid("collinear-points", "all positions lie on one line");
  }

  boost::polygon::voronoi_diagram<double> diagram;
  boost::polygon::construct_voronoi(sites.begin(), sites.end(), &diagram);

  std::set<PointEdge> unique;
  for (const auto &edge : diagram.edges()) {
    // Half-edges come in twin pairs; the set folds them together
    if (!edge.is_primary()) {
      continue;
    }
    const size_t a = site_owner[edge.cell()->source_index()];
    const size_t b = site_owner[edge.twin()->cell()->source_index()];
    if (a == b) {
      continue;
    }
    unique.emplace(std::min(a, b), std::max(a, b));
  }

  edges.assign(unique.begin(), unique.end());
  return true;
}

bool MakeDelaunayNetwork(sim::Simulation &sim, sim::CommandState &state) {
  const std::vector<sim::Entity> nodes = sim.AllNodes();

  std::vector<sim::UnderlayPosition> positions;
  positions.reserve(nodes.size());
  for (sim::Entity node : nodes) {
    positions.push_back(*sim.world().Get<sim::UnderlayPosition>(node));
  }

  std::vector<PointEdge> edges;
  if (!ComputeDelaunayEdges(positions, edges, state)) {
    LOG_TOPO_WARN("Delaunay network not built: {} ({})", state.GetReason(),
                  state.GetDebugMessage());
    return false;
  }

  std::map<sim::Entity, std::set<sim::Entity>> wanted;
  for (sim::Entity node : nodes) {
    wanted[node];
  }
  for (const auto &[a, b] : edges) {
    wanted[nodes[a]].insert(nodes[b]);
    wanted[nodes[b]].insert(nodes[a]);
  }

  size_t removed = 0;
  size_t added = 0;
  for (sim::Entity node : nodes) {
    const std::set<sim::Entity> &neighbours = wanted[node];

    for (sim::Entity peer : PeersOf(sim, node).ToVector()) {
      if (neighbours.count(peer) == 0 && RemovePeer(sim, node, peer)) {
        removed++;
      }
    }
    // Kept links are announced again too
    for (sim::Entity peer : neighbours) {
      if (AddPeer(sim, node, peer)) {
        added++;
      }
    }
  }

  LOG_TOPO_INFO("Delaunay network over {} nodes: {} edges, {} links added, {} removed",
                nodes.size(), edges.size(), added, removed);
  return true;
}

} // namespace topology
} // namespace isds
