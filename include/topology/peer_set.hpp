// Copyright (c) 2025 The ISDS Developers
// Distributed under the MIT software license

#pragma once

#include "sim/types.hpp"
#include <cstddef>
#include <cstdint>
#include <set>
#include <vector>

namespace isds {
namespace topology {

// PeerSet - a node's ordered set of peers plus the virtual time of the last
// change and a count of all changes. Symmetry with the peers' own sets is up
// to the caller.
class PeerSet {
public:
  using const_iterator = std::set<sim::Entity>::const_iterator;

  PeerSet() = default;

  // Both return true only if the set changed; the stamp moves only then
  bool Insert(sim::Entity peer, sim::SimSeconds now) {
    if (!peers_.insert(peer).second) {
      return false;
    }
    last_update_ = now;
    changes_++;
    return true;
  }

  bool Remove(sim::Entity peer, sim::SimSeconds now) {
    if (peers_.erase(peer) == 0) {
      return false;
    }
    last_update_ = now;
    changes_++;
    return true;
  }

  bool Contains(sim::Entity peer) const { return peers_.count(peer) > 0; }
  size_t size() const { return peers_.size(); }
  bool empty() const { return peers_.empty(); }

  const_iterator begin() const { return peers_.begin(); }
  const_iterator end() const { return peers_.end(); }

  std::vector<sim::Entity> ToVector() const {
    return std::vector<sim::Entity>(peers_.begin(), peers_.end());
  }

  sim::SimSeconds last_update() const { return last_update_; }
  uint64_t changes() const { return changes_; }

private:
  std::set<sim::Entity> peers_;
  sim::SimSeconds last_update_ = 0.0;
  uint64_t changes_ = 0;
};

} // namespace topology
} // namespace isds
