// Copyright (c) 2025 The ISDS Developers
// Distributed under the MIT software license

#pragma once

#include "protocol/block.hpp"
#include "protocol/nakamoto_state.hpp"
#include "protocol/simple_flooding.hpp"
#include "sim/events.hpp"
#include "sim/node_interface.hpp"
#include "sim/operation_state.hpp"
#include "sim/underlay.hpp"
#include <string>

namespace isds {
namespace protocol {

/**
 * NakamotoConsensus - longest-chain consensus over flooded blocks
 *
 * Poke:         find a block on top of the own tip and flood it
 * Message:      register the block, then keep flooding it
 * Peer added:   replay every known block, lowest first, to the new peer
 * Peer removed: drop flooding bookkeeping for it
 *
 * Per-node state lives in the NakamotoNodeState component.
 */
class NakamotoConsensus {
public:
  using MessagePayload = FloodingMessage<Block>;

  NakamotoConsensus() = default;

  bool HandleMessage(sim::NodeInterface &node, const sim::UnderlayMessage &envelope,
                     const MessagePayload &payload, sim::HandlerState &state) const;

  bool HandlePoke(sim::NodeInterface &node, sim::HandlerState &state) const;

  bool HandlePeerSetUpdate(sim::NodeInterface &node, const sim::PeerSetUpdate &update,
                           sim::HandlerState &state) const;

  std::string Name() const { return "nakamoto-consensus"; }

private:
  SimpleFlooding<Block> flooding_;
};

} // namespace protocol
} // namespace isds
