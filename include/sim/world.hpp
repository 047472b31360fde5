// Copyright (c) 2025 The ISDS Developers
// Distributed under the MIT software license

#pragma once

#include "sim/types.hpp"
#include <algorithm>
#include <cstddef>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>
#include <entt/entity/registry.hpp>

namespace isds {
namespace sim {

/**
 * World - entity/component store of the simulation
 *
 * Thin wrapper over entt::registry. Queries are evaluated eagerly and
 * returned sorted by entity so iteration order never depends on pool layout.
 *
 * Component pointers stay valid until the next structural change (insert or
 * remove) of the same component type.
 */
class World {
public:
  World() = default;

  World(const World &) = delete;
  World &operator=(const World &) = delete;

  template <typename... Components> Entity Spawn(Components &&...components) {
    const Entity entity = registry_.create();
    (registry_.emplace<std::decay_t<Components>>(
         entity, std::forward<Components>(components)),
     ...);
    return entity;
  }

  // Returns false if the entity was already gone
  bool Despawn(Entity entity) {
    if (!Contains(entity)) {
      return false;
    }
    registry_.destroy(entity);
    return true;
  }

  bool Contains(Entity entity) const {
    return entity != kNullEntity && registry_.valid(entity);
  }

  template <typename T> T *Get(Entity entity) {
    return Contains(entity) ? registry_.try_get<T>(entity) : nullptr;
  }

  template <typename T> const T *Get(Entity entity) const {
    return Contains(entity) ? registry_.try_get<T>(entity) : nullptr;
  }

  template <typename T> bool Has(Entity entity) const {
    return Contains(entity) && registry_.all_of<T>(entity);
  }

  // Adds or replaces
  template <typename T> T &Insert(Entity entity, T component) {
    return registry_.emplace_or_replace<T>(entity, std::move(component));
  }

  template <typename T> T &GetOrInsert(Entity entity) {
    return registry_.get_or_emplace<T>(entity);
  }

  template <typename T> bool Remove(Entity entity) {
    return Contains(entity) && registry_.remove<T>(entity) > 0;
  }

  // Entities owning all of Ts, ascending
  template <typename... Ts> std::vector<Entity> Entities() const {
    std::vector<Entity> out;
    for (const Entity entity : registry_.view<const Ts...>()) {
      out.push_back(entity);
    }
    std::sort(out.begin(), out.end());
    return out;
  }

  template <typename... Ts> std::vector<std::tuple<Entity, Ts *...>> Query() {
    std::vector<std::tuple<Entity, Ts *...>> out;
    for (const Entity entity : Entities<Ts...>()) {
      out.emplace_back(entity, registry_.try_get<Ts>(entity)...);
    }
    return out;
  }

  template <typename... Ts>
  std::vector<std::tuple<Entity, const Ts *...>> Query() const {
    std::vector<std::tuple<Entity, const Ts *...>> out;
    for (const Entity entity : Entities<Ts...>()) {
      out.emplace_back(entity, registry_.try_get<Ts>(entity)...);
    }
    return out;
  }

  template <typename T> size_t Count() const {
    return registry_.view<const T>().size();
  }

private:
  entt::registry registry_;
};

} // namespace sim
} // namespace isds
