// Copyright (c) 2025 The ISDS Developers
// Distributed under the MIT software license
// Unit tests for topology/peers - peer set management and notifications

#include <catch2/catch_test_macros.hpp>
#include "simulation/test_helpers.hpp"
#include "topology/peer_set.hpp"
#include "topology/peers.hpp"
#include <set>

using namespace isds;
using namespace isds::sim;
using namespace isds::topology;

TEST_CASE("PeerSet - insert and remove", "[topology][peers][unit]") {
    PeerSet peers;
    const Entity a = static_cast<Entity>(1);
    const Entity b = static_cast<Entity>(2);

    REQUIRE(peers.Insert(a, 1.0));
    REQUIRE(peers.last_update() == 1.0);

    SECTION("Duplicate insert is not a change") {
        REQUIRE_FALSE(peers.Insert(a, 2.0));
        REQUIRE(peers.last_update() == 1.0);
        REQUIRE(peers.size() == 1);
    }

    SECTION("Removing a stranger is not a change") {
        REQUIRE_FALSE(peers.Remove(b, 3.0));
        REQUIRE(peers.last_update() == 1.0);
    }

    SECTION("Remove bumps the stamp") {
        REQUIRE(peers.Remove(a, 4.0));
        REQUIRE(peers.empty());
        REQUIRE(peers.last_update() == 4.0);
    }
}

TEST_CASE("AddPeer / RemovePeer - notifications", "[topology][peers][unit]") {
    Simulation sim(test::TestConfig());
    auto& recorder = sim.EmplaceEventHandler<test::RecordingHandler>();

    Entity a = sim.SpawnNode("a", {10.f, 10.f});
    Entity b = sim.SpawnNode("b", {20.f, 10.f});

    SECTION("Adding notifies the owner only") {
        REQUIRE(AddPeer(sim, a, b));
        REQUIRE(PeersOf(sim, a).Contains(b));
        REQUIRE_FALSE(PeersOf(sim, b).Contains(a));

        sim.CatchUp(0.0);
        auto changes = recorder.PeerSetChanges();
        REQUIRE(changes.size() == 1);
        REQUIRE(changes[0].node == a);
        REQUIRE(changes[0].update.IsAdded());
        REQUIRE(changes[0].update.peer == b);
    }

    SECTION("Re-adding notifies again, redundant removal is silent") {
        REQUIRE(AddPeer(sim, a, b));
        sim.CatchUp(2.0);
        REQUIRE_FALSE(AddPeer(sim, a, b));
        REQUIRE(PeersOf(sim, a).size() == 1);
        REQUIRE(PeersOf(sim, a).last_update() == 0.0);

        REQUIRE_FALSE(RemovePeer(sim, b, a));
        sim.CatchUp(0.0);
        auto changes = recorder.PeerSetChanges();
        REQUIRE(changes.size() == 2);
        REQUIRE(changes[1].node == a);
        REQUIRE(changes[1].update.IsAdded());
        REQUIRE(changes[1].update.peer == b);
    }

    SECTION("Removing notifies with PeerRemoved") {
        AddPeer(sim, a, b);
        REQUIRE(RemovePeer(sim, a, b));
        sim.CatchUp(0.0);
        auto changes = recorder.PeerSetChanges();
        REQUIRE(changes.size() == 2);
        REQUIRE(changes[1].update.IsRemoved());
        REQUIRE(PeersOf(sim, a).empty());
    }

    SECTION("Self links and non-nodes are refused") {
        REQUIRE_FALSE(AddPeer(sim, a, a));
        REQUIRE_FALSE(AddPeer(sim, a, static_cast<Entity>(999)));
        REQUIRE(PeersOf(sim, a).empty());
    }

    SECTION("Peer-set stamp uses virtual time") {
        sim.CatchUp(12.5);
        AddPeer(sim, a, b);
        REQUIRE(PeersOf(sim, a).last_update() == 12.5);
    }
}

TEST_CASE("AddRandomNodesAsPeers - bounds", "[topology][peers][unit]") {
    Simulation sim(test::TestConfig(7));
    Entity node = sim.SpawnRandomNode();
    for (int i = 0; i < 4; ++i) {
        sim.SpawnRandomNode();
    }

    SECTION("Empty range yields exactly min") {
        REQUIRE(AddRandomNodesAsPeers(sim, node, 2, 3) == 2);
        REQUIRE(PeersOf(sim, node).size() == 2);
    }

    SECTION("Count is drawn from [min, max)") {
        size_t added = AddRandomNodesAsPeers(sim, node, 1, 4);
        REQUIRE(added >= 1);
        REQUIRE(added < 4);
    }

    SECTION("Bounds are clamped to the candidates") {
        REQUIRE(AddRandomNodesAsPeers(sim, node, 10, 20) == 4);
        REQUIRE_FALSE(PeersOf(sim, node).Contains(node));
        // Nobody left to add
        REQUIRE(AddRandomNodesAsPeers(sim, node, 1, 3) == 0);
    }

    SECTION("Existing peers are not candidates") {
        auto others = sim.AllOtherNodes(node);
        AddPeer(sim, node, others[0]);
        AddPeer(sim, node, others[1]);
        REQUIRE(AddRandomNodesAsPeers(sim, node, 2, 2) == 2);
        REQUIRE(PeersOf(sim, node).size() == 4);
    }

    SECTION("Zero requested adds nothing") {
        REQUIRE(AddRandomNodesAsPeers(sim, node, 0, 0) == 0);
        REQUIRE(PeersOf(sim, node).empty());
    }
}
