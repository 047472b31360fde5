// Copyright (c) 2025 The ISDS Developers
// Distributed under the MIT software license

#pragma once

#include "sim/event_handler.hpp"
#include "sim/events.hpp"
#include "sim/node_interface.hpp"
#include "sim/operation_state.hpp"
#include "sim/simulation.hpp"
#include "sim/underlay.hpp"
#include "util/logging.hpp"
#include <concepts>
#include <exception>
#include <string>
#include <utility>
#include <variant>

namespace isds {
namespace protocol {

/**
 * Protocol - per-node behaviour reacting to the three node-level stimuli
 *
 * Handlers return false (with the reason in state) when they could not
 * process the stimulus. Protocol objects hold only protocol-wide
 * configuration; per-node state lives in the node's components.
 */
template <typename P>
concept Protocol = requires(const P &protocol, sim::NodeInterface &node,
                            const sim::UnderlayMessage &envelope,
                            const typename P::MessagePayload &payload,
                            const sim::PeerSetUpdate &update,
                            sim::HandlerState &state) {
  typename P::MessagePayload;
  { protocol.HandleMessage(node, envelope, payload, state) } -> std::same_as<bool>;
  { protocol.HandlePoke(node, state) } -> std::same_as<bool>;
  { protocol.HandlePeerSetUpdate(node, update, state) } -> std::same_as<bool>;
  { protocol.Name() } -> std::convertible_to<std::string>;
};

// Runs protocol P on every node: routes arrivals of P::MessagePayload
// messages, pokes and peer-set changes to it. Failures are logged and do not
// stop other handlers.
template <Protocol P> class InvokeProtocolForAllNodes : public sim::EventHandler {
public:
  InvokeProtocolForAllNodes() = default;
  explicit InvokeProtocolForAllNodes(P protocol) : protocol_(std::move(protocol)) {}

  void HandleEvent(sim::Simulation &sim, const sim::Event &event) override {
    if (const auto *arrived = std::get_if<sim::MessageArrived>(&event)) {
      const auto *payload =
          sim.world().Get<typename P::MessagePayload>(arrived->message);
      const auto *envelope = sim.world().Get<sim::UnderlayMessage>(arrived->message);
      if (!payload || !envelope) {
        return;
      }
      // Handlers spawn messages, which may move these components
      const sim::UnderlayMessage envelope_copy = *envelope;
      const typename P::MessagePayload payload_copy = *payload;
      Invoke(sim, envelope_copy.dest, "message",
             [&](sim::NodeInterface &node, sim::HandlerState &state) {
               return protocol_.HandleMessage(node, envelope_copy, payload_copy, state);
             });
      return;
    }

    if (const auto *node_event = std::get_if<sim::NodeEvent>(&event)) {
      if (node_event->kind == sim::NodeEvent::Kind::POKE) {
        Invoke(sim, node_event->node, "poke",
               [&](sim::NodeInterface &node, sim::HandlerState &state) {
                 return protocol_.HandlePoke(node, state);
               });
      } else {
        const sim::PeerSetUpdate update = node_event->update;
        Invoke(sim, node_event->node, "peer-set update",
               [&](sim::NodeInterface &node, sim::HandlerState &state) {
                 return protocol_.HandlePeerSetUpdate(node, update, state);
               });
      }
    }
  }

  std::string Name() const override { return protocol_.Name(); }

private:
  template <typename Fn>
  void Invoke(sim::Simulation &sim, sim::Entity node_id, const char *stimulus, Fn &&fn) {
    sim::NodeInterface node = sim.Node(node_id);
    sim::HandlerState state;
    bool ok = false;
    try {
      ok = fn(node, state);
    } catch (const std::exception &e) {
      state.Error("handler-exception", e.what());
    }

    if (!ok) {
      LOG_PROTO_WARN("{}: {} handling failed on {}: {} ({})", protocol_.Name(),
                     stimulus, sim.Name(node_id), state.GetReason(),
                     state.GetDebugMessage());
    }
  }

  P protocol_;
};

} // namespace protocol
} // namespace isds
