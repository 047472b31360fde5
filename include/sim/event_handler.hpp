// Copyright (c) 2025 The ISDS Developers
// Distributed under the MIT software license

#pragma once

#include "sim/events.hpp"
#include <string>

namespace isds {
namespace sim {

class Simulation;

// Receives every message arrival and node event the simulation dispatches.
// Exceptions thrown from HandleEvent are caught and logged by the simulation.
class EventHandler {
public:
  virtual ~EventHandler() = default;

  virtual void HandleEvent(Simulation &sim, const Event &event) = 0;

  virtual std::string Name() const = 0;
};

} // namespace sim
} // namespace isds
