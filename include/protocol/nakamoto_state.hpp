// Copyright (c) 2025 The ISDS Developers
// Distributed under the MIT software license

#pragma once

#include "protocol/block.hpp"
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <vector>

namespace isds {
namespace protocol {

// Outcome of registering a block with a node's block tree
enum class BlockRegistration {
  DUPLICATE,    // already known, or the genesis sentinel
  ORPHAN,       // predecessor unknown; block dropped
  TIP_EXTENDED, // built on the current tip
  FORK,         // stored as a fork tip, tip unchanged
  REORG         // fork outgrew the tip; old tip became a fork tip
};

const char *BlockRegistrationName(BlockRegistration result);

/**
 * NakamotoNodeState - one node's view of the block tree
 *
 * Longest chain wins; on equal height the first seen tip stays. The tip is
 * never a fork tip. Blocks are never removed, so a reorg only moves the tip.
 */
class NakamotoNodeState {
public:
  NakamotoNodeState() = default;

  BlockRegistration RegisterBlock(const Block &block);

  const BlockHash &Tip() const { return tip_; }
  const std::set<BlockHash> &ForkTips() const { return fork_tips_; }

  // Genesis has height 0; unknown blocks have none
  std::optional<uint64_t> Height(const BlockHash &hash) const;
  uint64_t TipHeight() const;

  std::optional<BlockHash> HashPrev(const BlockHash &hash) const;
  std::optional<Block> GetBlock(const BlockHash &hash) const;
  bool Contains(const BlockHash &hash) const { return blocks_.count(hash) > 0; }
  size_t BlockCount() const { return blocks_.size(); }

  // All stored blocks (forks included), lowest height first
  std::vector<Block> AllBlocksSorted() const;

private:
  struct StoredBlock {
    uint64_t height;
    Block block;
  };

  std::map<BlockHash, StoredBlock> blocks_;
  BlockHash tip_;
  std::set<BlockHash> fork_tips_;
};

} // namespace protocol
} // namespace isds
