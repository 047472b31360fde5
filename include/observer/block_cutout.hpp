// Copyright (c) 2025 The ISDS Developers
// Distributed under the MIT software license

#pragma once

#include "protocol/block.hpp"
#include <cstddef>
#include <optional>
#include <vector>

namespace isds {
namespace protocol {
class NakamotoNodeState;
}

namespace observer {

// One column per chain; row i of every column is height tip_height - i.
// Empty cells pad fork columns up to the fork tip's height.
using BlockColumns = std::vector<std::vector<std::optional<protocol::BlockHash>>>;

/**
 * The most recent part of a node's block tree
 *
 * Column 0 is the main chain walked back from the tip, at most max_depth
 * blocks and never past genesis. Every fork tip less than max_depth below
 * the tip height adds one column, walked back the same way.
 */
BlockColumns BlocksCutout(const protocol::NakamotoNodeState &state, size_t max_depth);

} // namespace observer
} // namespace isds
