// Copyright (c) 2025 The ISDS Developers
// Distributed under the MIT software license

#pragma once

#include <cstddef>
#include <cstdint>

namespace isds {
namespace sim {

struct SimulationConfig {
  // Underlay plane; random nodes keep buffer_zone away from the border
  float underlay_width = 800.f;
  float underlay_height = 600.f;
  float buffer_zone = 10.f;

  // Underlay distance a message covers per virtual second
  double flight_per_second = 200.0;

  uint64_t seed = 0;

  // Lines kept in the human-readable message log
  size_t message_log_size = 12;
};

} // namespace sim
} // namespace isds
