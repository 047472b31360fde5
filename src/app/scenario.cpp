// Copyright (c) 2025 The ISDS Developers
// Distributed under the MIT software license

#include "app/scenario.hpp"
#include "protocol/nakamoto_consensus.hpp"
#include "protocol/nakamoto_state.hpp"
#include "protocol/protocol.hpp"
#include "sim/commands.hpp"
#include "topology/peers.hpp"
#include "util/logging.hpp"
#include <algorithm>
#include <limits>
#include <set>
#include <vector>

namespace isds {
namespace app {

std::optional<TopologyKind> ParseTopology(const std::string &name) {
  if (name == "delaunay") {
    return TopologyKind::DELAUNAY;
  }
  if (name == "random") {
    return TopologyKind::RANDOM;
  }
  if (name == "none") {
    return TopologyKind::NONE;
  }
  return std::nullopt;
}

const char *TopologyName(TopologyKind kind) {
  switch (kind) {
  case TopologyKind::DELAUNAY:
    return "delaunay";
  case TopologyKind::RANDOM:
    return "random";
  case TopologyKind::NONE:
    return "none";
  }
  return "unknown";
}

Scenario::Scenario(const ScenarioConfig &config)
    : config_(config), sim_(std::make_unique<sim::Simulation>(config.sim_config)) {}

Scenario::~Scenario() = default;

bool Scenario::initialize() {
  if (initialized_) {
    LOG_APP_WARN("Scenario already initialized");
    return true;
  }
  if (init_failed_) {
    LOG_APP_ERROR("Scenario setup failed earlier; create a new scenario");
    return false;
  }
  init_failed_ = true;

  LOG_APP_INFO("Initializing scenario: {} nodes, {} topology, seed {}", config_.nodes,
               TopologyName(config_.topology), config_.sim_config.seed);

  sim_->EmplaceEventHandler<
      protocol::InvokeProtocolForAllNodes<protocol::NakamotoConsensus>>();

  sim::CommandState state;
  if (!sim_->Execute(command::SpawnRandomNodes(config_.nodes), state)) {
    LOG_APP_ERROR("Failed to spawn nodes: {}", state.GetReason());
    return false;
  }

  if (!init_topology()) {
    return false;
  }

  // Deliver the peer-set notifications of the initial wiring
  sim_->CatchUp(1.0);
  init_failed_ = false;
  initialized_ = true;
  return true;
}

bool Scenario::init_topology() {
  switch (config_.topology) {
  case TopologyKind::NONE:
    return true;
  case TopologyKind::RANDOM:
    return init_random_topology();
  case TopologyKind::DELAUNAY:
    break;
  }

  sim::CommandState state;
  if (!sim_->Execute(command::MakeDelaunayNetwork(), state)) {
    LOG_APP_ERROR("Failed to build Delaunay network: {} ({})", state.GetReason(),
                  state.GetDebugMessage());
    return false;
  }
  return true;
}

bool Scenario::init_random_topology() {
  if (config_.min_peers > config_.max_peers) {
    LOG_APP_ERROR("Invalid peer bounds: min {} > max {}", config_.min_peers,
                  config_.max_peers);
    return false;
  }

  const std::vector<sim::Entity> nodes = sim_->AllNodes();
  for (sim::Entity node : nodes) {
    topology::AddRandomNodesAsPeers(*sim_, node, config_.min_peers, config_.max_peers);
  }

  // Mirror every link so gossip flows both ways
  for (sim::Entity node : nodes) {
    for (sim::Entity peer : topology::PeersOf(*sim_, node).ToVector()) {
      if (!topology::PeersOf(*sim_, peer).Contains(node)) {
        topology::AddPeer(*sim_, peer, node);
      }
    }
  }
  return true;
}

bool Scenario::run() {
  if (!initialized_ && !initialize()) {
    return false;
  }

  for (size_t round = 0; round < config_.rounds; ++round) {
    sim_->DoNow(command::PokeMultipleRandomNodes(config_.pokes_per_round));
    if (config_.random_messages > 0) {
      sim_->DoNow(command::SpawnRandomMessages(config_.random_messages));
    }
    const size_t events = sim_->CatchUp(config_.round_interval);
    LOG_APP_INFO("Round {}/{} done at t={:.1f} ({} events)", round + 1, config_.rounds,
                 sim_->Now(), events);
  }

  sim_->CatchUp(config_.round_interval);

  const ScenarioReport result = report();
  LOG_APP_INFO("Scenario finished: heights {}..{}, {} distinct tips, converged={}",
               result.min_tip_height, result.max_tip_height, result.distinct_tips,
               result.converged);
  return true;
}

ScenarioReport Scenario::report() const {
  ScenarioReport result;
  result.end_time = sim_->Now();

  const sim::World &world = sim_->world();
  std::set<protocol::BlockHash> tips;
  uint64_t min_height = std::numeric_limits<uint64_t>::max();

  for (sim::Entity node : sim_->AllNodes()) {
    result.nodes++;
    if (const auto *peers = world.Get<topology::PeerSet>(node)) {
      result.links += peers->size();
    }

    const auto *chain = world.Get<protocol::NakamotoNodeState>(node);
    const uint64_t height = chain ? chain->TipHeight() : 0;
    tips.insert(chain ? chain->Tip() : protocol::BlockHash{});
    if (chain) {
      result.total_fork_tips += chain->ForkTips().size();
    }
    min_height = std::min(min_height, height);
    result.max_tip_height = std::max(result.max_tip_height, height);
  }

  result.min_tip_height = result.nodes == 0 ? 0 : min_height;
  result.distinct_tips = tips.size();
  result.converged = tips.size() <= 1;
  return result;
}

} // namespace app
} // namespace isds
