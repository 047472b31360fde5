// Copyright (c) 2025 The ISDS Developers
// Distributed under the MIT software license

#pragma once

#include "sim/operation_state.hpp"
#include <string>

namespace isds {
namespace sim {

class Simulation;

// Operator-issued mutation of the simulation, run now or at a scheduled time
class Command {
public:
  virtual ~Command() = default;

  // Returns false and fills state when the command could not apply.
  // A failed command leaves the simulation unchanged.
  virtual bool Execute(Simulation &sim, CommandState &state) const = 0;

  virtual std::string Describe() const = 0;
};

} // namespace sim
} // namespace isds
