// Copyright (c) 2025 The ISDS Developers
// Distributed under the MIT software license

#include "protocol/block.hpp"

namespace isds {
namespace protocol {

Block Block::Create(const BlockHash &hash_prev, std::mt19937_64 &rng) {
  Block block;
  block.hash_prev = hash_prev;
  for (size_t word = 0; word < BlockHash::WORDS; ++word) {
    block.hash.SetUint64(word, rng());
  }
  return block;
}

std::string Block::ToString() const {
  return ShortHash(hash) + "<-" + ShortHash(hash_prev);
}

std::string ShortHash(const BlockHash &hash) { return hash.GetHex().substr(0, 8); }

} // namespace protocol
} // namespace isds
