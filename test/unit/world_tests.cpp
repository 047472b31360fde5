// Copyright (c) 2025 The ISDS Developers
// Distributed under the MIT software license
// Unit tests for sim/world - entity/component store

#include <catch2/catch_test_macros.hpp>
#include "sim/underlay.hpp"
#include "sim/world.hpp"
#include <string>

using namespace isds::sim;

namespace {

struct Counter {
    int value = 0;
};

struct Tag {
    std::string label;
};

} // namespace

TEST_CASE("World - spawn and despawn", "[sim][world][unit]") {
    World world;

    Entity a = world.Spawn(Counter{1}, Tag{"a"});
    Entity b = world.Spawn(Counter{2});

    REQUIRE(world.Contains(a));
    REQUIRE(world.Contains(b));
    REQUIRE_FALSE(world.Contains(kNullEntity));

    SECTION("Components are readable after spawn") {
        REQUIRE(world.Get<Counter>(a)->value == 1);
        REQUIRE(world.Get<Tag>(a)->label == "a");
        REQUIRE(world.Get<Tag>(b) == nullptr);
    }

    SECTION("Despawn removes the entity once") {
        REQUIRE(world.Despawn(a));
        REQUIRE_FALSE(world.Contains(a));
        REQUIRE_FALSE(world.Despawn(a));
        REQUIRE(world.Get<Counter>(a) == nullptr);
        REQUIRE_FALSE(world.Has<Counter>(a));
    }
}

TEST_CASE("World - component access", "[sim][world][unit]") {
    World world;
    Entity e = world.Spawn(Counter{5});

    SECTION("Insert adds or replaces") {
        world.Insert(e, Tag{"first"});
        REQUIRE(world.Get<Tag>(e)->label == "first");
        world.Insert(e, Tag{"second"});
        REQUIRE(world.Get<Tag>(e)->label == "second");
    }

    SECTION("GetOrInsert default-constructs only when absent") {
        Tag& tag = world.GetOrInsert<Tag>(e);
        REQUIRE(tag.label.empty());
        tag.label = "kept";
        REQUIRE(world.GetOrInsert<Tag>(e).label == "kept");
        REQUIRE(world.GetOrInsert<Counter>(e).value == 5);
    }

    SECTION("Remove reports whether something was removed") {
        REQUIRE(world.Remove<Counter>(e));
        REQUIRE_FALSE(world.Has<Counter>(e));
        REQUIRE_FALSE(world.Remove<Counter>(e));
        REQUIRE(world.Contains(e));
    }

    SECTION("Mutation through Get is visible") {
        world.Get<Counter>(e)->value = 9;
        const World& view = world;
        REQUIRE(view.Get<Counter>(e)->value == 9);
    }
}

TEST_CASE("World - queries are sorted and filtered", "[sim][world][unit]") {
    World world;
    std::vector<Entity> with_both;
    for (int i = 0; i < 10; ++i) {
        Entity e = world.Spawn(Counter{i});
        if (i % 2 == 0) {
            world.Insert(e, Tag{std::to_string(i)});
            with_both.push_back(e);
        }
    }

    // Remove and re-add a component to shuffle pool order
    world.Remove<Tag>(with_both.front());
    world.Insert(with_both.front(), Tag{"0"});

    auto rows = world.Query<Counter, Tag>();
    REQUIRE(rows.size() == with_both.size());
    for (size_t i = 0; i < rows.size(); ++i) {
        auto [entity, counter, tag] = rows[i];
        REQUIRE(entity == with_both[i]);
        REQUIRE(std::to_string(counter->value) == tag->label);
    }

    REQUIRE(world.Count<Counter>() == 10);
    REQUIRE(world.Count<Tag>() == 5);
    REQUIRE(world.Entities<Counter>().size() == 10);

    SECTION("Query results are writable") {
        for (auto& [entity, counter] : world.Query<Counter>()) {
            counter->value += 100;
        }
        REQUIRE(world.Get<Counter>(with_both[1])->value == 102);
    }
}
