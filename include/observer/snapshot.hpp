// Copyright (c) 2025 The ISDS Developers
// Distributed under the MIT software license

#pragma once

#include <nlohmann/json.hpp>

namespace isds {
namespace sim {
class Simulation;
}

namespace observer {

/**
 * Read-only dump of the simulation state
 *
 * {
 *   "time": <virtual seconds>,
 *   "stats": {...},
 *   "nodes": [{"id", "name", "x", "y", "peers", "peers_updated_at",
 *              "tip", "tip_height", "fork_tips", "block_count"}, ...],
 *   "in_flight": <message count>,
 *   "messages": [{"id", "source", "dest", "x", "y", "progress"}, ...],
 *   "log": [{"time", "text"}, ...]
 * }
 *
 * Consensus fields are present only for nodes carrying consensus state.
 */
nlohmann::json Snapshot(const sim::Simulation &sim);

} // namespace observer
} // namespace isds
