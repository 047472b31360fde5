// Copyright (c) 2025 The ISDS Developers
// Distributed under the MIT software license

#include "sim/simulation.hpp"
#include "sim/node_interface.hpp"
#include "util/logging.hpp"
#include <algorithm>
#include <cstdio>
#include <exception>

namespace isds {
namespace sim {

Simulation::Simulation(const SimulationConfig &config)
    : config_(config), rng_(config.seed) {
  LOG_SIM_DEBUG("Simulation created (seed={}, underlay={}x{}, flight={}/s)",
                config_.seed, config_.underlay_width, config_.underlay_height,
                config_.flight_per_second);
}

Simulation::~Simulation() = default;

void Simulation::AddEventHandler(std::unique_ptr<EventHandler> handler) {
  if (!handler) {
    LOG_SIM_WARN("Ignoring null event handler");
    return;
  }
  LOG_SIM_DEBUG("Installed event handler '{}'", handler->Name());
  handlers_.push_back(std::move(handler));
}

void Simulation::Schedule(SimSeconds due_time, Event event) {
  scheduler_.Schedule(due_time, std::move(event));
}

void Simulation::ScheduleNow(Event event) {
  scheduler_.ScheduleNow(std::move(event));
}

void Simulation::DoNow(std::shared_ptr<const Command> command) {
  if (!command) {
    LOG_SIM_WARN("Ignoring null command");
    return;
  }
  ScheduleNow(CommandEvent{std::move(command)});
}

bool Simulation::Execute(const Command &command, CommandState &state) {
  LOG_SIM_DEBUG("Executing {}", command.Describe());
  try {
    return command.Execute(*this, state);
  } catch (const std::exception &e) {
    return state.Error("command-exception", e.what());
  }
}

size_t Simulation::WorkUntil(SimSeconds target_time) {
  return scheduler_.CatchUp(target_time,
                            [this](const Event &event) { Dispatch(event); });
}

size_t Simulation::CatchUp(SimSeconds elapsed) {
  return WorkUntil(Now() + elapsed);
}

// === Dispatch ===

void Simulation::Dispatch(const Event &event) {
  stats_.events_dispatched++;
  LOG_SIM_TRACE("[{:.3f}] dispatch {}", Now(), DescribeEvent(event));

  if (const auto *arrived = std::get_if<MessageArrived>(&event)) {
    DispatchMessage(*arrived, event);
    return;
  }

  if (const auto *node_event = std::get_if<NodeEvent>(&event)) {
    if (!IsNode(node_event->node)) {
      LOG_SIM_DEBUG("Dropping {}: node no longer exists", DescribeEvent(event));
      return;
    }
    if (node_event->kind == NodeEvent::Kind::POKE) {
      Log(Name(node_event->node) + ": got poked");
    }
    NotifyHandlers(event);
    return;
  }

  const auto &command = std::get<CommandEvent>(event).command;
  if (command) {
    RunCommand(*command);
  }
}

void Simulation::DispatchMessage(const MessageArrived &arrived, const Event &event) {
  const auto *envelope = world_.Get<UnderlayMessage>(arrived.message);
  if (!envelope) {
    LOG_SIM_DEBUG("Dropping {}: message no longer exists", DescribeEvent(event));
    return;
  }
  const UnderlayMessage message = *envelope;

  if (!IsNode(message.dest)) {
    stats_.messages_dropped++;
    LOG_SIM_DEBUG("Dropping message {}: destination {} is gone",
                  EntityId(arrived.message), EntityId(message.dest));
    world_.Despawn(arrived.message);
    return;
  }

  stats_.messages_delivered++;
  Log(Name(message.dest) + ": got message from " + Name(message.source));
  NotifyHandlers(event);
  world_.Despawn(arrived.message);
}

void Simulation::RunCommand(const Command &command) {
  CommandState state;
  if (!Execute(command, state)) {
    stats_.commands_failed++;
    LOG_SIM_ERROR("Command {} failed: {} ({})", command.Describe(),
                  state.GetReason(), state.GetDebugMessage());
  }
}

void Simulation::NotifyHandlers(const Event &event) {
  // Index loop: a handler may install further handlers
  for (size_t i = 0; i < handlers_.size(); ++i) {
    EventHandler &handler = *handlers_[i];
    try {
      handler.HandleEvent(*this, event);
    } catch (const std::exception &e) {
      stats_.handler_errors++;
      LOG_SIM_ERROR("Event handler '{}' threw on {}: {}", handler.Name(),
                    DescribeEvent(event), e.what());
    }
  }
}

// === Nodes and messages ===

Entity Simulation::SpawnNode(std::string name, UnderlayPosition position) {
  const Entity node = world_.Spawn(UnderlayNodeName{name}, position);
  LOG_SIM_DEBUG("Spawned {} (entity {}) at ({:.1f}, {:.1f})", name,
                EntityId(node), position.x, position.y);
  return node;
}

Entity Simulation::SpawnRandomNode() {
  std::uniform_int_distribution<int> number(0, 9999);
  char name[16];
  std::snprintf(name, sizeof(name), "node%04d", number(rng_));

  const float buffer = config_.buffer_zone;
  const float max_x = std::max(buffer, config_.underlay_width - buffer);
  const float max_y = std::max(buffer, config_.underlay_height - buffer);
  std::uniform_real_distribution<float> x(buffer, max_x);
  std::uniform_real_distribution<float> y(buffer, max_y);
  const float px = x(rng_);
  const float py = y(rng_);

  return SpawnNode(name, UnderlayPosition{px, py});
}

Entity Simulation::SpawnMessage(Entity source, Entity dest) {
  const auto *from = world_.Get<UnderlayPosition>(source);
  const auto *to = world_.Get<UnderlayPosition>(dest);
  if (!from || !to || !IsNode(source) || !IsNode(dest)) {
    LOG_SIM_WARN("Cannot send message {} -> {}: endpoint is not a node",
                 EntityId(source), EntityId(dest));
    return kNullEntity;
  }
  const UnderlayLine line{*from, *to};

  const SimSeconds start = Now();
  double flight_time = 0.0;
  if (config_.flight_per_second > 0.0) {
    flight_time = UnderlayPosition::Distance(line.start, line.end) /
                  config_.flight_per_second;
  }
  const TimeSpan span{start, start + flight_time};

  const Entity message = world_.Spawn(UnderlayMessage{source, dest}, span, line);
  stats_.messages_sent++;
  link_sends_[{source, dest}]++;
  Log(Name(source) + ": sending message to " + Name(dest));

  Schedule(span.end, MessageArrived{message});
  return message;
}

Entity Simulation::SpawnMessageBetweenRandomNodes() {
  const auto source = PickRandomNode();
  if (!source) {
    return kNullEntity;
  }
  const auto others = AllOtherNodes(*source);
  if (others.empty()) {
    return kNullEntity;
  }
  std::uniform_int_distribution<size_t> pick(0, others.size() - 1);
  return SpawnMessage(*source, others[pick(rng_)]);
}

bool Simulation::IsNode(Entity entity) const {
  return world_.Has<UnderlayNodeName>(entity) &&
         world_.Has<UnderlayPosition>(entity);
}

std::vector<Entity> Simulation::AllNodes() const {
  return world_.Entities<UnderlayNodeName, UnderlayPosition>();
}

std::vector<Entity> Simulation::AllOtherNodes(Entity node) const {
  std::vector<Entity> nodes = AllNodes();
  nodes.erase(std::remove(nodes.begin(), nodes.end(), node), nodes.end());
  return nodes;
}

std::optional<Entity> Simulation::PickRandomNode() {
  const auto nodes = AllNodes();
  if (nodes.empty()) {
    return std::nullopt;
  }
  std::uniform_int_distribution<size_t> pick(0, nodes.size() - 1);
  return nodes[pick(rng_)];
}

std::string Simulation::Name(Entity node) const {
  if (const auto *name = world_.Get<UnderlayNodeName>(node)) {
    return name->name;
  }
  return "entity" + std::to_string(EntityId(node));
}

NodeInterface Simulation::Node(Entity node) { return NodeInterface(*this, node); }

// === Observation ===

size_t Simulation::CountMessagesSent(Entity from, Entity to) const {
  auto it = link_sends_.find({from, to});
  return it == link_sends_.end() ? 0 : it->second;
}

void Simulation::Log(const std::string &line) {
  LOG_SIM_DEBUG("[{:.3f}] {}", Now(), line);
  if (config_.message_log_size == 0) {
    return;
  }
  message_log_.push_front(LogLine{Now(), line});
  while (message_log_.size() > config_.message_log_size) {
    message_log_.pop_back();
  }
}

} // namespace sim
} // namespace isds
