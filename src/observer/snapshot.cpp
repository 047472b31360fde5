// Copyright (c) 2025 The ISDS Developers
// Distributed under the MIT software license

#include "observer/snapshot.hpp"
#include "observer/message_position.hpp"
#include "protocol/nakamoto_state.hpp"
#include "sim/simulation.hpp"
#include "topology/peer_set.hpp"

namespace isds {
namespace observer {

nlohmann::json Snapshot(const sim::Simulation &sim) {
  const sim::World &world = sim.world();
  const sim::Simulation::Stats &stats = sim.GetStats();

  nlohmann::json out;
  out["time"] = sim.Now();
  out["stats"] = {{"messages_sent", stats.messages_sent},
                  {"messages_delivered", stats.messages_delivered},
                  {"messages_dropped", stats.messages_dropped},
                  {"events_dispatched", stats.events_dispatched},
                  {"commands_failed", stats.commands_failed},
                  {"handler_errors", stats.handler_errors}};

  nlohmann::json nodes = nlohmann::json::array();
  for (sim::Entity node : sim.AllNodes()) {
    const auto *position = world.Get<sim::UnderlayPosition>(node);

    nlohmann::json entry;
    entry["id"] = sim::EntityId(node);
    entry["name"] = sim.Name(node);
    entry["x"] = position->x;
    entry["y"] = position->y;

    nlohmann::json peers = nlohmann::json::array();
    if (const auto *peer_set = world.Get<topology::PeerSet>(node)) {
      for (sim::Entity peer : *peer_set) {
        peers.push_back(sim::EntityId(peer));
      }
      entry["peers_updated_at"] = peer_set->last_update();
    }
    entry["peers"] = std::move(peers);

    if (const auto *chain = world.Get<protocol::NakamotoNodeState>(node)) {
      entry["tip"] = chain->Tip().GetHex();
      entry["tip_height"] = chain->TipHeight();
      entry["block_count"] = chain->BlockCount();
      nlohmann::json forks = nlohmann::json::array();
      for (const auto &fork_tip : chain->ForkTips()) {
        forks.push_back(fork_tip.GetHex());
      }
      entry["fork_tips"] = std::move(forks);
    }

    nodes.push_back(std::move(entry));
  }
  out["nodes"] = std::move(nodes);
  out["in_flight"] = world.Count<sim::UnderlayMessage>();

  nlohmann::json messages = nlohmann::json::array();
  for (const MessagePosition &located : LocateMessages(world, sim.Now())) {
    messages.push_back({{"id", sim::EntityId(located.message)},
                        {"source", sim::EntityId(located.source)},
                        {"dest", sim::EntityId(located.dest)},
                        {"x", located.position.x},
                        {"y", located.position.y},
                        {"progress", located.progress}});
  }
  out["messages"] = std::move(messages);

  nlohmann::json log = nlohmann::json::array();
  for (const auto &line : sim.MessageLog()) {
    log.push_back({{"time", line.time}, {"text", line.text}});
  }
  out["log"] = std::move(log);

  return out;
}

} // namespace observer
} // namespace isds
