// Copyright (c) 2025 The ISDS Developers
// Distributed under the MIT software license

#include "sim/events.hpp"
#include "sim/command.hpp"
#include <string>

namespace isds {
namespace sim {

std::string DescribeEvent(const Event &event) {
  if (const auto *arrived = std::get_if<MessageArrived>(&event)) {
    return "message-arrived(" + std::to_string(EntityId(arrived->message)) + ")";
  }
  if (const auto *node_event = std::get_if<NodeEvent>(&event)) {
    const std::string node = std::to_string(EntityId(node_event->node));
    if (node_event->kind == NodeEvent::Kind::POKE) {
      return "poke(" + node + ")";
    }
    return std::string(node_event->update.IsAdded() ? "peer-added(" : "peer-removed(") +
           node + ", " + std::to_string(EntityId(node_event->update.peer)) + ")";
  }
  const auto &command = std::get<CommandEvent>(event).command;
  return "command(" + (command ? command->Describe() : std::string("null")) + ")";
}

} // namespace sim
} // namespace isds
