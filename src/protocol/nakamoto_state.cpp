// Copyright (c) 2025 The ISDS Developers
// Distributed under the MIT software license

#include "protocol/nakamoto_state.hpp"
#include <algorithm>

namespace isds {
namespace protocol {

const char *BlockRegistrationName(BlockRegistration result) {
  switch (result) {
  case BlockRegistration::DUPLICATE:
    return "duplicate";
  case BlockRegistration::ORPHAN:
    return "orphan";
  case BlockRegistration::TIP_EXTENDED:
    return "tip-extended";
  case BlockRegistration::FORK:
    return "fork";
  case BlockRegistration::REORG:
    return "reorg";
  }
  return "unknown";
}

BlockRegistration NakamotoNodeState::RegisterBlock(const Block &block) {
  if (block.IsGenesis() || Contains(block.hash)) {
    return BlockRegistration::DUPLICATE;
  }

  const std::optional<uint64_t> parent_height = Height(block.hash_prev);
  if (!parent_height) {
    return BlockRegistration::ORPHAN;
  }
  const uint64_t height = *parent_height + 1;
  blocks_.emplace(block.hash, StoredBlock{height, block});

  if (block.hash_prev == tip_) {
    tip_ = block.hash;
    return BlockRegistration::TIP_EXTENDED;
  }

  // A fork tip that gets a child stops being a leaf
  fork_tips_.erase(block.hash_prev);

  if (height > TipHeight()) {
    fork_tips_.insert(tip_);
    tip_ = block.hash;
    return BlockRegistration::REORG;
  }

  fork_tips_.insert(block.hash);
  return BlockRegistration::FORK;
}

std::optional<uint64_t> NakamotoNodeState::Height(const BlockHash &hash) const {
  if (hash.IsNull()) {
    return 0;
  }
  auto it = blocks_.find(hash);
  if (it == blocks_.end()) {
    return std::nullopt;
  }
  return it->second.height;
}

uint64_t NakamotoNodeState::TipHeight() const { return Height(tip_).value_or(0); }

std::optional<BlockHash> NakamotoNodeState::HashPrev(const BlockHash &hash) const {
  auto it = blocks_.find(hash);
  if (it == blocks_.end()) {
    return std::nullopt;
  }
  return it->second.block.hash_prev;
}

std::optional<Block> NakamotoNodeState::GetBlock(const BlockHash &hash) const {
  auto it = blocks_.find(hash);
  if (it == blocks_.end()) {
    return std::nullopt;
  }
  return it->second.block;
}

std::vector<Block> NakamotoNodeState::AllBlocksSorted() const {
  std::vector<const StoredBlock *> stored;
  stored.reserve(blocks_.size());
  for (const auto &[hash, entry] : blocks_) {
    stored.push_back(&entry);
  }
  std::stable_sort(stored.begin(), stored.end(),
                   [](const StoredBlock *a, const StoredBlock *b) {
                     return a->height < b->height;
                   });

  std::vector<Block> out;
  out.reserve(stored.size());
  for (const StoredBlock *entry : stored) {
    out.push_back(entry->block);
  }
  return out;
}

} // namespace protocol
} // namespace isds
