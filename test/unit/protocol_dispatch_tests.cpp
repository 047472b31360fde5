// Copyright (c) 2025 The ISDS Developers
// Distributed under the MIT software license
// Unit tests for protocol/protocol - routing of node stimuli to protocols

#include <catch2/catch_test_macros.hpp>
#include "protocol/protocol.hpp"
#include "simulation/test_helpers.hpp"
#include <stdexcept>

using namespace isds;
using namespace isds::sim;

namespace {

struct Ping {
    int value = 0;
};

struct Pong {
    int value = 0;
};

// Per-node stimulus counters written by CountingProtocol
struct Counters {
    int messages = 0;
    int last_value = 0;
    int pokes = 0;
    int peers_added = 0;
    int peers_removed = 0;
};

class CountingProtocol {
public:
    using MessagePayload = Ping;

    bool HandleMessage(NodeInterface& node, const UnderlayMessage&, const Ping& ping,
                       HandlerState&) const {
        auto& counters = node.Get<Counters>();
        counters.messages++;
        counters.last_value = ping.value;
        return true;
    }
    bool HandlePoke(NodeInterface& node, HandlerState&) const {
        node.Get<Counters>().pokes++;
        return true;
    }
    bool HandlePeerSetUpdate(NodeInterface& node, const PeerSetUpdate& update,
                             HandlerState&) const {
        if (update.IsAdded()) {
            node.Get<Counters>().peers_added++;
        } else {
            node.Get<Counters>().peers_removed++;
        }
        return true;
    }
    std::string Name() const { return "counting"; }
};

// Fails every stimulus, by status or by exception
class FailingProtocol {
public:
    using MessagePayload = Pong;

    bool HandleMessage(NodeInterface&, const UnderlayMessage&, const Pong&,
                       HandlerState& state) const {
        return state.Error("always-fails");
    }
    bool HandlePoke(NodeInterface&, HandlerState&) const {
        throw std::runtime_error("poke exploded");
    }
    bool HandlePeerSetUpdate(NodeInterface&, const PeerSetUpdate&, HandlerState& state) const {
        return state.Invalid("rejected");
    }
    std::string Name() const { return "failing"; }
};

class ThrowingHandler : public EventHandler {
public:
    void HandleEvent(Simulation&, const Event&) override {
        throw std::runtime_error("handler exploded");
    }
    std::string Name() const override { return "throwing"; }
};

static_assert(protocol::Protocol<CountingProtocol>);
static_assert(protocol::Protocol<FailingProtocol>);
static_assert(protocol::Protocol<protocol::NakamotoConsensus>);

} // namespace

TEST_CASE("InvokeProtocolForAllNodes - routing", "[protocol][unit]") {
    Simulation sim(test::TestConfig());
    sim.EmplaceEventHandler<protocol::InvokeProtocolForAllNodes<CountingProtocol>>();

    Entity a = sim.SpawnNode("a", {10.f, 10.f});
    Entity b = sim.SpawnNode("b", {60.f, 10.f});

    SECTION("Pokes reach the poked node") {
        sim.ScheduleNow(NodeEvent::Poke(a));
        sim.CatchUp(0.0);
        REQUIRE(sim.world().Get<Counters>(a)->pokes == 1);
        REQUIRE(sim.world().Get<Counters>(b) == nullptr);
    }

    SECTION("Matching payloads reach the destination") {
        sim.SendMessage(a, b, Ping{42});
        sim.CatchUp(10.0);
        REQUIRE(sim.world().Get<Counters>(b)->messages == 1);
        REQUIRE(sim.world().Get<Counters>(b)->last_value == 42);
    }

    SECTION("Other payloads are ignored") {
        sim.SendMessage(a, b, Pong{1});
        sim.SpawnMessage(a, b);
        sim.CatchUp(10.0);
        REQUIRE(sim.world().Get<Counters>(b) == nullptr);
        REQUIRE(sim.GetStats().messages_delivered == 2);
    }

    SECTION("Peer-set changes reach the owner") {
        topology::AddPeer(sim, a, b);
        topology::RemovePeer(sim, a, b);
        sim.CatchUp(0.0);
        REQUIRE(sim.world().Get<Counters>(a)->peers_added == 1);
        REQUIRE(sim.world().Get<Counters>(a)->peers_removed == 1);
    }
}

TEST_CASE("InvokeProtocolForAllNodes - failures are isolated", "[protocol][unit]") {
    Simulation sim(test::TestConfig());
    sim.EmplaceEventHandler<protocol::InvokeProtocolForAllNodes<FailingProtocol>>();
    sim.EmplaceEventHandler<ThrowingHandler>();
    sim.EmplaceEventHandler<protocol::InvokeProtocolForAllNodes<CountingProtocol>>();
    REQUIRE(sim.EventHandlerCount() == 3);

    Entity a = sim.SpawnNode("a", {10.f, 10.f});
    Entity b = sim.SpawnNode("b", {60.f, 10.f});

    sim.ScheduleNow(NodeEvent::Poke(a));
    sim.SendMessage(b, a, Pong{1});
    sim.SendMessage(b, a, Ping{2});
    topology::AddPeer(sim, a, b);
    sim.CatchUp(10.0);

    const auto* counters = sim.world().Get<Counters>(a);
    REQUIRE(counters != nullptr);
    REQUIRE(counters->pokes == 1);
    REQUIRE(counters->messages == 1);
    REQUIRE(counters->peers_added == 1);

    // The raw handler throws on every event; the simulation keeps going
    REQUIRE(sim.GetStats().handler_errors == sim.GetStats().events_dispatched);
    REQUIRE(sim.PendingEvents() == 0);
}
