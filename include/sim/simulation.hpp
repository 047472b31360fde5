// Copyright (c) 2025 The ISDS Developers
// Distributed under the MIT software license

#pragma once

#include "sim/command.hpp"
#include "sim/config.hpp"
#include "sim/event_handler.hpp"
#include "sim/events.hpp"
#include "sim/scheduler.hpp"
#include "sim/types.hpp"
#include "sim/underlay.hpp"
#include "sim/world.hpp"
#include <concepts>
#include <cstddef>
#include <deque>
#include <map>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <utility>
#include <vector>

namespace isds {
namespace sim {

class NodeInterface;

/**
 * Simulation - owns the world, the scheduler, the RNG and the installed
 * event handlers, and routes every dispatched event to them
 *
 * Single threaded. Every run is reproducible for a fixed seed and command
 * sequence. Events aimed at despawned entities are dropped silently.
 */
class Simulation {
public:
  struct Stats {
    size_t messages_sent = 0;
    size_t messages_delivered = 0;
    size_t messages_dropped = 0; // destination gone before arrival
    size_t events_dispatched = 0;
    size_t commands_failed = 0;
    size_t handler_errors = 0;
  };

  struct LogLine {
    SimSeconds time;
    std::string text;
  };

  explicit Simulation(const SimulationConfig &config = SimulationConfig{});
  ~Simulation();

  Simulation(const Simulation &) = delete;
  Simulation &operator=(const Simulation &) = delete;

  World &world() { return world_; }
  const World &world() const { return world_; }
  const SimulationConfig &config() const { return config_; }
  std::mt19937_64 &rng() { return rng_; }
  SimSeconds Now() const { return scheduler_.Now(); }
  size_t PendingEvents() const { return scheduler_.PendingCount(); }

  // === Event handlers ===

  void AddEventHandler(std::unique_ptr<EventHandler> handler);

  template <std::derived_from<EventHandler> Handler, typename... Args>
  Handler &EmplaceEventHandler(Args &&...args) {
    auto handler = std::make_unique<Handler>(std::forward<Args>(args)...);
    Handler &ref = *handler;
    AddEventHandler(std::move(handler));
    return ref;
  }

  size_t EventHandlerCount() const { return handlers_.size(); }

  // === Scheduling ===

  void Schedule(SimSeconds due_time, Event event);
  void ScheduleNow(Event event);

  // Queue a command for the current instant
  void DoNow(std::shared_ptr<const Command> command);

  template <std::derived_from<Command> C> void DoNow(C command) {
    DoNow(std::make_shared<const C>(std::move(command)));
  }

  // Run a command synchronously
  bool Execute(const Command &command, CommandState &state);

  // Process events up to an absolute virtual time
  size_t WorkUntil(SimSeconds target_time);

  // Process events for `elapsed` more virtual seconds
  size_t CatchUp(SimSeconds elapsed);

  // True while WorkUntil / CatchUp is dispatching; both refuse to nest
  bool Dispatching() const { return scheduler_.Dispatching(); }

  // === Nodes and messages ===

  Entity SpawnNode(std::string name, UnderlayPosition position);
  Entity SpawnRandomNode();

  // Spawns an in-flight message and schedules its arrival. Returns
  // kNullEntity if either endpoint is not a node.
  Entity SpawnMessage(Entity source, Entity dest);

  template <typename Payload>
  Entity SendMessage(Entity source, Entity dest, Payload payload) {
    const Entity message = SpawnMessage(source, dest);
    if (message != kNullEntity) {
      world_.Insert<Payload>(message, std::move(payload));
    }
    return message;
  }

  // Payload-less underlay traffic between two distinct random nodes
  Entity SpawnMessageBetweenRandomNodes();

  bool IsNode(Entity entity) const;
  std::vector<Entity> AllNodes() const;
  std::vector<Entity> AllOtherNodes(Entity node) const;
  std::optional<Entity> PickRandomNode();
  std::string Name(Entity node) const;

  NodeInterface Node(Entity node);

  // === Observation ===

  const Stats &GetStats() const { return stats_; }
  size_t CountMessagesSent(Entity from, Entity to) const;

  // Append a line to the message log (newest first)
  void Log(const std::string &line);
  const std::deque<LogLine> &MessageLog() const { return message_log_; }

private:
  void Dispatch(const Event &event);
  void DispatchMessage(const MessageArrived &arrived, const Event &event);
  void RunCommand(const Command &command);
  void NotifyHandlers(const Event &event);

  SimulationConfig config_;
  std::mt19937_64 rng_;
  World world_;
  Scheduler scheduler_;
  std::vector<std::unique_ptr<EventHandler>> handlers_;

  Stats stats_;
  std::map<std::pair<Entity, Entity>, size_t> link_sends_;
  std::deque<LogLine> message_log_;
};

} // namespace sim
} // namespace isds
