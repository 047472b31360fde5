// Copyright (c) 2025 The ISDS Developers
// Distributed under the MIT software license

#pragma once

#include "sim/config.hpp"
#include "sim/simulation.hpp"
#include "sim/types.hpp"
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace isds {
namespace app {

enum class TopologyKind {
  DELAUNAY, // triangulation over node positions
  RANDOM,   // random peers per node, made symmetric
  NONE      // no links
};

std::optional<TopologyKind> ParseTopology(const std::string &name);
const char *TopologyName(TopologyKind kind);

// Scenario configuration
struct ScenarioConfig {
  sim::SimulationConfig sim_config;

  size_t nodes = 16;
  TopologyKind topology = TopologyKind::DELAUNAY;

  // Random topology bounds, [min_peers, max_peers)
  size_t min_peers = 2;
  size_t max_peers = 4;

  // Each round pokes `pokes_per_round` random nodes, then advances the clock
  size_t rounds = 20;
  size_t pokes_per_round = 1;
  sim::SimSeconds round_interval = 100.0;

  // Payload-less underlay messages spawned per round
  size_t random_messages = 0;

  bool dump_snapshot = false;
};

// Outcome of a finished scenario
struct ScenarioReport {
  size_t nodes = 0;
  size_t links = 0; // directed
  uint64_t min_tip_height = 0;
  uint64_t max_tip_height = 0;
  size_t distinct_tips = 0;
  size_t total_fork_tips = 0;
  bool converged = false;
  sim::SimSeconds end_time = 0.0;
};

// Scenario - builds a network of Nakamoto nodes, drives poke rounds and
// reports whether all nodes agree on one tip
class Scenario {
public:
  explicit Scenario(const ScenarioConfig &config = ScenarioConfig{});
  ~Scenario();

  // Spawn nodes, install the protocol and wire the topology
  bool initialize();

  // Run all rounds plus one settling interval
  bool run();

  ScenarioReport report() const;

  sim::Simulation &simulation() { return *sim_; }
  const sim::Simulation &simulation() const { return *sim_; }

private:
  ScenarioConfig config_;
  std::unique_ptr<sim::Simulation> sim_;
  bool initialized_ = false;
  bool init_failed_ = false;

  bool init_topology();
  bool init_random_topology();
};

} // namespace app
} // namespace isds
