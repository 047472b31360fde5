// Copyright (c) 2025 The ISDS Developers
// Distributed under the MIT software license
// Unit tests for sim/commands and the simulation driver

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "sim/commands.hpp"
#include "simulation/test_helpers.hpp"
#include <set>
#include <stdexcept>
#include <string>

using namespace isds;
using namespace isds::sim;

TEST_CASE("SpawnRandomNodes - names and positions", "[sim][commands][unit]") {
    SimulationConfig config = test::TestConfig(3);
    Simulation sim(config);

    CommandState state;
    REQUIRE(sim.Execute(command::SpawnRandomNodes(6), state));
    REQUIRE(sim.AllNodes().size() == 6);

    for (Entity node : sim.AllNodes()) {
        const std::string name = sim.Name(node);
        REQUIRE(name.size() == 8);
        REQUIRE(name.rfind("node", 0) == 0);

        const auto* pos = sim.world().Get<UnderlayPosition>(node);
        REQUIRE(pos->x >= config.buffer_zone);
        REQUIRE(pos->x <= config.underlay_width - config.buffer_zone);
        REQUIRE(pos->y >= config.buffer_zone);
        REQUIRE(pos->y <= config.underlay_height - config.buffer_zone);
    }
}

TEST_CASE("Simulation - same seed replays identically", "[sim][commands][unit]") {
    Simulation first(test::TestConfig(42));
    Simulation second(test::TestConfig(42));
    CommandState state;
    first.Execute(command::SpawnRandomNodes(5), state);
    second.Execute(command::SpawnRandomNodes(5), state);

    auto nodes1 = first.AllNodes();
    auto nodes2 = second.AllNodes();
    REQUIRE(nodes1 == nodes2);
    for (size_t i = 0; i < nodes1.size(); ++i) {
        REQUIRE(first.Name(nodes1[i]) == second.Name(nodes2[i]));
        REQUIRE(*first.world().Get<UnderlayPosition>(nodes1[i]) ==
                *second.world().Get<UnderlayPosition>(nodes2[i]));
    }
}

TEST_CASE("PokeNode and PokeMultipleRandomNodes", "[sim][commands][unit]") {
    Simulation sim(test::TestConfig());
    auto& recorder = sim.EmplaceEventHandler<test::RecordingHandler>();
    Entity a = sim.SpawnNode("a", {10.f, 10.f});
    sim.SpawnNode("b", {50.f, 10.f});
    sim.SpawnNode("c", {90.f, 10.f});

    SECTION("Poke of a known node") {
        sim.DoNow(command::PokeNode(a));
        sim.CatchUp(0.0);
        REQUIRE(recorder.CountPokes() == 1);
    }

    SECTION("Poke of an unknown node is invalid") {
        CommandState state;
        REQUIRE_FALSE(sim.Execute(command::PokeNode(static_cast<Entity>(77)), state));
        REQUIRE(state.IsInvalid());
        REQUIRE(state.GetReason() == "unknown-node");
    }

    SECTION("Failed queued commands are counted") {
        sim.DoNow(command::PokeNode(static_cast<Entity>(77)));
        sim.CatchUp(0.0);
        REQUIRE(sim.GetStats().commands_failed == 1);
        REQUIRE(recorder.CountPokes() == 0);
    }

    SECTION("Random pokes hit distinct nodes, capped at node count") {
        sim.DoNow(command::PokeMultipleRandomNodes(10));
        sim.CatchUp(0.0);
        REQUIRE(recorder.CountPokes() == 3);

        std::set<Entity> poked;
        for (const auto& event : recorder.events) {
            poked.insert(std::get<NodeEvent>(event).node);
        }
        REQUIRE(poked.size() == 3);
    }

    SECTION("Poke of a node despawned before dispatch is dropped") {
        sim.ScheduleNow(NodeEvent::Poke(a));
        sim.world().Despawn(a);
        sim.CatchUp(0.0);
        REQUIRE(recorder.CountPokes() == 0);
    }
}

TEST_CASE("Simulation - message flight", "[sim][commands][unit]") {
    SimulationConfig config = test::TestConfig();
    config.flight_per_second = 100.0;
    Simulation sim(config);
    auto& recorder = sim.EmplaceEventHandler<test::RecordingHandler>();

    Entity a = sim.SpawnNode("a", {0.f, 0.f});
    Entity b = sim.SpawnNode("b", {300.f, 400.f});

    SECTION("Arrival after distance / speed") {
        Entity message = sim.SpawnMessage(a, b);
        REQUIRE(message != kNullEntity);

        const auto* span = sim.world().Get<TimeSpan>(message);
        REQUIRE(span->end == Catch::Approx(5.0));

        sim.CatchUp(4.9);
        REQUIRE(recorder.events.empty());
        REQUIRE(sim.world().Contains(message));

        sim.CatchUp(0.2);
        REQUIRE(recorder.events.size() == 1);
        REQUIRE_FALSE(sim.world().Contains(message));
        REQUIRE(sim.GetStats().messages_delivered == 1);
        REQUIRE(sim.CountMessagesSent(a, b) == 1);
        REQUIRE(sim.CountMessagesSent(b, a) == 0);
    }

    SECTION("Destination despawned in flight") {
        Entity message = sim.SpawnMessage(a, b);
        sim.world().Despawn(b);
        sim.CatchUp(10.0);
        REQUIRE(recorder.events.empty());
        REQUIRE_FALSE(sim.world().Contains(message));
        REQUIRE(sim.GetStats().messages_dropped == 1);
    }

    SECTION("Message despawned in flight is a no-op") {
        Entity message = sim.SpawnMessage(a, b);
        sim.world().Despawn(message);
        REQUIRE(sim.CatchUp(10.0) == 1);
        REQUIRE(recorder.events.empty());
    }

    SECTION("Endpoints must be nodes") {
        REQUIRE(sim.SpawnMessage(a, static_cast<Entity>(55)) == kNullEntity);
        REQUIRE(sim.GetStats().messages_sent == 0);
    }

    SECTION("Interpolated position follows the line") {
        Entity message = sim.SpawnMessage(a, b);
        const auto line = *sim.world().Get<UnderlayLine>(message);
        const auto span = *sim.world().Get<TimeSpan>(message);

        auto halfway = Interpolate(line, span, 2.5);
        REQUIRE(halfway.x == Catch::Approx(150.0));
        REQUIRE(halfway.y == Catch::Approx(200.0));

        auto before = Interpolate(line, span, -1.0);
        REQUIRE(before == line.start);
        auto after = Interpolate(line, span, 99.0);
        REQUIRE(after.x == Catch::Approx(300.0));
    }
}

TEST_CASE("SpawnRandomMessages - underlay traffic", "[sim][commands][unit]") {
    Simulation sim(test::TestConfig(5));
    CommandState state;

    SECTION("Needs two nodes") {
        sim.SpawnRandomNode();
        REQUIRE_FALSE(sim.Execute(command::SpawnRandomMessages(3), state));
        REQUIRE(state.GetReason() == "too-few-nodes");
    }

    SECTION("Messages travel and vanish") {
        sim.Execute(command::SpawnRandomNodes(4), state);
        REQUIRE(sim.Execute(command::SpawnRandomMessages(3), state));
        REQUIRE(sim.GetStats().messages_sent == 3);
        REQUIRE(sim.world().Count<UnderlayMessage>() == 3);

        sim.CatchUp(100.0);
        REQUIRE(sim.GetStats().messages_delivered == 3);
        REQUIRE(sim.world().Count<UnderlayMessage>() == 0);
    }
}

TEST_CASE("Topology commands", "[sim][commands][unit]") {
    Simulation sim(test::TestConfig());
    Entity a = sim.SpawnNode("a", {10.f, 10.f});
    Entity b = sim.SpawnNode("b", {50.f, 10.f});
    CommandState state;

    SECTION("AddPeer and RemovePeer") {
        REQUIRE(sim.Execute(command::AddPeer(a, b), state));
        REQUIRE(topology::PeersOf(sim, a).Contains(b));
        REQUIRE(sim.Execute(command::RemovePeer(a, b), state));
        REQUIRE_FALSE(topology::PeersOf(sim, a).Contains(b));
    }

    SECTION("AddPeer rejects self links") {
        REQUIRE_FALSE(sim.Execute(command::AddPeer(a, a), state));
        REQUIRE(state.GetReason() == "bad-peer");
    }

    SECTION("MakeDelaunayNetwork reports degenerate input") {
        REQUIRE_FALSE(sim.Execute(command::MakeDelaunayNetwork(), state));
        REQUIRE(state.GetReason() == "too-few-points");
    }

    SECTION("AddRandomPeers") {
        REQUIRE(sim.Execute(command::AddRandomPeers(a, 1, 1), state));
        REQUIRE(topology::PeersOf(sim, a).Contains(b));
    }

    SECTION("CatchUp advances the clock") {
        REQUIRE(sim.Execute(command::CatchUp(3.0), state));
        REQUIRE(sim.Now() == 3.0);
        REQUIRE_FALSE(sim.Execute(command::CatchUp(-1.0), state));
    }
}

TEST_CASE("CatchUp command - refused while dispatching", "[sim][commands][unit]") {
    Simulation sim(test::TestConfig());
    auto& recorder = sim.EmplaceEventHandler<test::RecordingHandler>();
    Entity a = sim.SpawnNode("a", {10.f, 10.f});

    sim.DoNow(command::CatchUp(50.0));
    sim.DoNow(command::PokeNode(a));
    sim.Schedule(20.0, NodeEvent::Poke(a));

    // Both commands plus the poke the second one schedules
    REQUIRE(sim.CatchUp(1.0) == 3);
    REQUIRE(sim.Now() == 1.0);
    REQUIRE(sim.GetStats().commands_failed == 1);
    REQUIRE(recorder.CountPokes() == 1);
    REQUIRE(sim.PendingEvents() == 1);
    REQUIRE_FALSE(sim.Dispatching());

    // Outside a dispatch the command still works
    CommandState state;
    REQUIRE(sim.Execute(command::CatchUp(30.0), state));
    REQUIRE(sim.Now() == 31.0);
    REQUIRE(recorder.CountPokes() == 2);
}

TEST_CASE("Simulation - message log keeps the newest lines", "[sim][commands][unit]") {
    SimulationConfig config = test::TestConfig();
    config.message_log_size = 3;
    Simulation sim(config);

    for (int i = 0; i < 5; ++i) {
        sim.Log("line " + std::to_string(i));
    }
    REQUIRE(sim.MessageLog().size() == 3);
    REQUIRE(sim.MessageLog().front().text == "line 4");
    REQUIRE(sim.MessageLog().back().text == "line 2");
}

namespace {

class ExplodingCommand : public Command {
public:
    bool Execute(Simulation&, CommandState&) const override {
        throw std::runtime_error("boom");
    }
    std::string Describe() const override { return "Exploding"; }
};

} // namespace

TEST_CASE("Simulation - failing commands", "[sim][commands][unit]") {
    Simulation sim(test::TestConfig());

    SECTION("Exceptions become errors") {
        CommandState state;
        REQUIRE_FALSE(sim.Execute(ExplodingCommand(), state));
        REQUIRE(state.IsError());
        REQUIRE(state.GetReason() == "command-exception");
        REQUIRE(state.GetDebugMessage() == "boom");
    }

    SECTION("Rejected input is invalid, not an error") {
        CommandState state;
        REQUIRE_FALSE(sim.Execute(command::PokeNode(static_cast<Entity>(9)), state));
        REQUIRE(state.IsInvalid());
        REQUIRE_FALSE(state.IsError());
    }

    SECTION("Queued failures are counted and do not stop the run") {
        Entity a = sim.SpawnNode("a", {10.f, 10.f});
        sim.DoNow(ExplodingCommand());
        sim.DoNow(command::PokeNode(a));
        sim.CatchUp(1.0);
        REQUIRE(sim.GetStats().commands_failed == 1);
        REQUIRE(sim.MessageLog().front().text == "a: got poked");
    }
}
