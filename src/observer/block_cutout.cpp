// Copyright (c) 2025 The ISDS Developers
// Distributed under the MIT software license

#include "observer/block_cutout.hpp"
#include "protocol/nakamoto_state.hpp"
#include <cstdint>

namespace isds {
namespace observer {

namespace {

// Appends up to `count` blocks, walking back from `hash` until genesis
void WalkBack(const protocol::NakamotoNodeState &state, protocol::BlockHash hash,
              size_t count, std::vector<std::optional<protocol::BlockHash>> &column) {
  for (size_t i = 0; i < count && !hash.IsNull(); ++i) {
    column.emplace_back(hash);
    const auto prev = state.HashPrev(hash);
    if (!prev) {
      break;
    }
    hash = *prev;
  }
}

} // namespace

BlockColumns BlocksCutout(const protocol::NakamotoNodeState &state, size_t max_depth) {
  BlockColumns columns(1);
  WalkBack(state, state.Tip(), max_depth, columns[0]);

  const uint64_t tip_height = state.TipHeight();
  for (const protocol::BlockHash &fork_tip : state.ForkTips()) {
    const uint64_t fork_height = state.Height(fork_tip).value_or(0);
    const uint64_t height_diff = tip_height > fork_height ? tip_height - fork_height : 0;
    if (height_diff >= max_depth) {
      continue;
    }

    auto &column = columns.emplace_back(static_cast<size_t>(height_diff));
    WalkBack(state, fork_tip, max_depth - height_diff, column);
  }

  return columns;
}

} // namespace observer
} // namespace isds
