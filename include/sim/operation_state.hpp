// Copyright (c) 2025 The ISDS Developers
// Distributed under the MIT software license

#pragma once

#include <string>

namespace isds {
namespace sim {

/**
 * Outcome of a command or protocol handler - tracks why it failed
 *
 * INVALID: the caller asked for something that cannot apply (unknown node,
 *          degenerate topology input)
 * ERROR:   the operation itself went wrong (handler exception, internal
 *          inconsistency)
 *
 * Setters return false so failures can be reported in one line:
 *   return state.Invalid("unknown-node", "poke target was despawned");
 */
class OperationState {
public:
  enum class Result {
    VALID,
    INVALID,
    ERROR
  };

  OperationState() : result_(Result::VALID) {}

  bool IsValid() const { return result_ == Result::VALID; }
  bool IsInvalid() const { return result_ == Result::INVALID; }
  bool IsError() const { return result_ == Result::ERROR; }

  bool Invalid(const std::string &reason,
               const std::string &debug_message = "") {
    result_ = Result::INVALID;
    reason_ = reason;
    debug_message_ = debug_message;
    return false;
  }

  bool Error(const std::string &reason,
             const std::string &debug_message = "") {
    result_ = Result::ERROR;
    reason_ = reason;
    debug_message_ = debug_message;
    return false;
  }

  const std::string &GetReason() const { return reason_; }
  const std::string &GetDebugMessage() const { return debug_message_; }

private:
  Result result_;
  std::string reason_;
  std::string debug_message_;
};

// Protocol handlers and commands report through the same status type
using HandlerState = OperationState;
using CommandState = OperationState;

} // namespace sim
} // namespace isds
