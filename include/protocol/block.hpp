// Copyright (c) 2025 The ISDS Developers
// Distributed under the MIT software license

#pragma once

#include "util/uint.hpp"
#include <random>
#include <string>

namespace isds {
namespace protocol {

// Opaque random block identity; the all-zero value names genesis
using BlockHash = uint256;

/**
 * Block - identity plus predecessor identity
 *
 * No content, no proof of work: the hash is drawn at random when the block
 * is found. Genesis is never materialized, only referenced as hash_prev.
 */
struct Block {
  BlockHash hash;
  BlockHash hash_prev;

  static Block Create(const BlockHash &hash_prev, std::mt19937_64 &rng);

  bool IsGenesis() const { return hash.IsNull(); }

  // Short form for logs
  std::string ToString() const;

  friend bool operator==(const Block &a, const Block &b) {
    return a.hash == b.hash && a.hash_prev == b.hash_prev;
  }
  friend bool operator!=(const Block &a, const Block &b) { return !(a == b); }
  friend bool operator<(const Block &a, const Block &b) {
    if (a.hash != b.hash) {
      return a.hash < b.hash;
    }
    return a.hash_prev < b.hash_prev;
  }
};

// First 8 hex digits, for logs
std::string ShortHash(const BlockHash &hash);

} // namespace protocol
} // namespace isds
