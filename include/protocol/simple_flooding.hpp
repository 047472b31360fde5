// Copyright (c) 2025 The ISDS Developers
// Distributed under the MIT software license

#pragma once

#include "sim/events.hpp"
#include "sim/node_interface.hpp"
#include "sim/operation_state.hpp"
#include "sim/types.hpp"
#include "sim/underlay.hpp"
#include <cstddef>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace isds {
namespace protocol {

// Payload of a flooded item
template <typename T> struct FloodingMessage {
  T item;
};

// Per-node flooding bookkeeping: which items each peer is known to have
// (sent to it or received from it), and which items this node has seen
template <typename T> class FloodingState {
public:
  bool PeerKnows(sim::Entity peer, const T &item) const {
    auto it = known_by_peer_.find(peer);
    return it != known_by_peer_.end() && it->second.count(item) > 0;
  }

  void MarkKnown(sim::Entity peer, const T &item) { known_by_peer_[peer].insert(item); }

  void ForgetPeer(sim::Entity peer) { known_by_peer_.erase(peer); }

  // Returns true if the item was new to this node
  bool MarkSeen(const T &item) { return seen_.insert(item).second; }
  bool HasSeen(const T &item) const { return seen_.count(item) > 0; }

  size_t TrackedPeerCount() const { return known_by_peer_.size(); }

private:
  std::map<sim::Entity, std::set<T>> known_by_peer_;
  std::set<T> seen_;
};

/**
 * SimpleFlooding - gossip every item to every peer that does not have it yet
 *
 * Each item crosses a directed peer link at most once, except for explicit
 * FloodPeerWith replays. Usable on its own or as transport for other
 * protocols through the static helpers.
 */
template <typename T> class SimpleFlooding {
public:
  using MessagePayload = FloodingMessage<T>;

  // Mark seen and send to every peer not known to have the item
  static void Flood(sim::NodeInterface &node, const T &item) {
    const std::vector<sim::Entity> peers = node.Peers().ToVector();
    auto &state = node.Get<FloodingState<T>>();
    state.MarkSeen(item);

    for (sim::Entity peer : peers) {
      if (state.PeerKnows(peer, item)) {
        continue;
      }
      if (node.SendMessage(peer, MessagePayload{item})) {
        state.MarkKnown(peer, item);
      }
    }
  }

  // Send items to peer in order, regardless of bookkeeping
  static void FloodPeerWith(sim::NodeInterface &node, sim::Entity peer,
                            const std::vector<T> &items) {
    auto &state = node.Get<FloodingState<T>>();
    for (const T &item : items) {
      if (node.SendMessage(peer, MessagePayload{item})) {
        state.MarkKnown(peer, item);
      }
    }
  }

  static void ForgetPeer(sim::NodeInterface &node, sim::Entity peer) {
    node.Get<FloodingState<T>>().ForgetPeer(peer);
  }

  bool HandleMessage(sim::NodeInterface &node, const sim::UnderlayMessage &envelope,
                     const MessagePayload &payload, sim::HandlerState &) const {
    if (node.Peers().Contains(envelope.source)) {
      node.Get<FloodingState<T>>().MarkKnown(envelope.source, payload.item);
    }
    Flood(node, payload.item);
    return true;
  }

  bool HandlePoke(sim::NodeInterface &, sim::HandlerState &) const { return true; }

  bool HandlePeerSetUpdate(sim::NodeInterface &node, const sim::PeerSetUpdate &update,
                           sim::HandlerState &) const {
    if (update.IsRemoved()) {
      ForgetPeer(node, update.peer);
    }
    return true;
  }

  std::string Name() const { return "simple-flooding"; }
};

} // namespace protocol
} // namespace isds
