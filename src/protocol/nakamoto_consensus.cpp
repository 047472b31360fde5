// Copyright (c) 2025 The ISDS Developers
// Distributed under the MIT software license

#include "protocol/nakamoto_consensus.hpp"
#include "util/logging.hpp"

namespace isds {
namespace protocol {

bool NakamotoConsensus::HandleMessage(sim::NodeInterface &node,
                                      const sim::UnderlayMessage &envelope,
                                      const MessagePayload &payload,
                                      sim::HandlerState &state) const {
  auto &chain = node.Get<NakamotoNodeState>();
  const BlockRegistration result = chain.RegisterBlock(payload.item);

  switch (result) {
  case BlockRegistration::TIP_EXTENDED:
    LOG_CONSENSUS_DEBUG("{}: new tip {} at height {}", node.Name(),
                        ShortHash(chain.Tip()), chain.TipHeight());
    break;
  case BlockRegistration::REORG:
    LOG_CONSENSUS_INFO("{}: reorganized to {} at height {}", node.Name(),
                       ShortHash(chain.Tip()), chain.TipHeight());
    node.Log("switched to a longer chain");
    break;
  case BlockRegistration::FORK:
    LOG_CONSENSUS_DEBUG("{}: fork block {}", node.Name(), payload.item.ToString());
    break;
  case BlockRegistration::ORPHAN:
    LOG_CONSENSUS_DEBUG("{}: dropped orphan {}", node.Name(), payload.item.ToString());
    break;
  case BlockRegistration::DUPLICATE:
    LOG_CONSENSUS_TRACE("{}: duplicate {}", node.Name(), payload.item.ToString());
    break;
  }

  return flooding_.HandleMessage(node, envelope, payload, state);
}

bool NakamotoConsensus::HandlePoke(sim::NodeInterface &node, sim::HandlerState &state) const {
  auto &chain = node.Get<NakamotoNodeState>();
  const Block block = Block::Create(chain.Tip(), node.Rng());

  const BlockRegistration result = chain.RegisterBlock(block);
  if (result != BlockRegistration::TIP_EXTENDED) {
    return state.Error("bad-new-block", std::string("own block registered as ") +
                                            BlockRegistrationName(result));
  }

  node.Log("found a new block");
  LOG_CONSENSUS_DEBUG("{}: found block {} at height {}", node.Name(), block.ToString(),
                      chain.TipHeight());
  SimpleFlooding<Block>::Flood(node, block);
  return true;
}

bool NakamotoConsensus::HandlePeerSetUpdate(sim::NodeInterface &node,
                                            const sim::PeerSetUpdate &update,
                                            sim::HandlerState &) const {
  if (update.IsAdded()) {
    const auto blocks = node.Get<NakamotoNodeState>().AllBlocksSorted();
    SimpleFlooding<Block>::FloodPeerWith(node, update.peer, blocks);
  } else {
    SimpleFlooding<Block>::ForgetPeer(node, update.peer);
  }
  return true;
}

} // namespace protocol
} // namespace isds
