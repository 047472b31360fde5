// Copyright (c) 2025 The ISDS Developers
// Distributed under the MIT software license

#pragma once

#include <cstdint>
#include <entt/entity/entity.hpp>

namespace isds {
namespace sim {

// Handle of a simulated node or in-flight message. Totally ordered; the
// order follows allocation order, which keeps replays deterministic.
using Entity = entt::entity;

inline constexpr Entity kNullEntity{entt::null};

// Virtual seconds since simulation start
using SimSeconds = double;

// Numeric form of an entity, for logs and snapshots
inline uint64_t EntityId(Entity entity) {
  return static_cast<uint64_t>(entt::to_integral(entity));
}

} // namespace sim
} // namespace isds
