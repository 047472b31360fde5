// Copyright (c) 2025 The ISDS Developers
// Distributed under the MIT software license

#pragma once

#include "sim/command.hpp"
#include "sim/types.hpp"
#include <cstddef>
#include <string>

namespace isds {
namespace command {

// Operator commands. Each can run synchronously through
// Simulation::Execute or be queued with Simulation::DoNow.

class SpawnRandomNodes : public sim::Command {
public:
  explicit SpawnRandomNodes(size_t count) : count_(count) {}
  bool Execute(sim::Simulation &sim, sim::CommandState &state) const override;
  std::string Describe() const override;

private:
  size_t count_;
};

// Payload-less messages between random node pairs
class SpawnRandomMessages : public sim::Command {
public:
  explicit SpawnRandomMessages(size_t count) : count_(count) {}
  bool Execute(sim::Simulation &sim, sim::CommandState &state) const override;
  std::string Describe() const override;

private:
  size_t count_;
};

class PokeNode : public sim::Command {
public:
  explicit PokeNode(sim::Entity node) : node_(node) {}
  bool Execute(sim::Simulation &sim, sim::CommandState &state) const override;
  std::string Describe() const override;

private:
  sim::Entity node_;
};

// Pokes min(count, node count) distinct random nodes
class PokeMultipleRandomNodes : public sim::Command {
public:
  explicit PokeMultipleRandomNodes(size_t count) : count_(count) {}
  bool Execute(sim::Simulation &sim, sim::CommandState &state) const override;
  std::string Describe() const override;

private:
  size_t count_;
};

class AddPeer : public sim::Command {
public:
  AddPeer(sim::Entity node, sim::Entity peer) : node_(node), peer_(peer) {}
  bool Execute(sim::Simulation &sim, sim::CommandState &state) const override;
  std::string Describe() const override;

private:
  sim::Entity node_;
  sim::Entity peer_;
};

class RemovePeer : public sim::Command {
public:
  RemovePeer(sim::Entity node, sim::Entity peer) : node_(node), peer_(peer) {}
  bool Execute(sim::Simulation &sim, sim::CommandState &state) const override;
  std::string Describe() const override;

private:
  sim::Entity node_;
  sim::Entity peer_;
};

class MakeDelaunayNetwork : public sim::Command {
public:
  MakeDelaunayNetwork() = default;
  bool Execute(sim::Simulation &sim, sim::CommandState &state) const override;
  std::string Describe() const override;
};

class AddRandomPeers : public sim::Command {
public:
  AddRandomPeers(sim::Entity node, size_t min_peers, size_t max_peers)
      : node_(node), min_peers_(min_peers), max_peers_(max_peers) {}
  bool Execute(sim::Simulation &sim, sim::CommandState &state) const override;
  std::string Describe() const override;

private:
  sim::Entity node_;
  size_t min_peers_;
  size_t max_peers_;
};

// Advance the clock from inside a command script. Only valid through
// Simulation::Execute: queued via DoNow it runs mid-dispatch and fails.
class CatchUp : public sim::Command {
public:
  explicit CatchUp(sim::SimSeconds elapsed) : elapsed_(elapsed) {}
  bool Execute(sim::Simulation &sim, sim::CommandState &state) const override;
  std::string Describe() const override;

private:
  sim::SimSeconds elapsed_;
};

} // namespace command
} // namespace isds
