#pragma once

#include <stdexcept>
#include <string>

namespace chaosmine {

enum class ErrorCode {
  // Preconditions: the call is valid in general but not in the current state.
  CooldownActive,
  PhaseTooEarly,
  EventsLocked,
  FirstMineDelay,
  ZoneNotAffected,
  ShardOutOfRange,
  ShardAlreadyProcessed,
  AgentInactive,
  AgentNotSilent,
  InsufficientBalance,
  BlockRegression,

  // Unknown ids.
  AgentNotFound,
  EventNotFound,
  VestingEntryNotFound,
  ZoneNotFound,

  InvalidConfig,
};

const char* error_code_name(ErrorCode code);

// Precondition failures are "try later / no-op" for callers; retrying the same
// call in the same state fails the same way.
bool is_precondition_failure(ErrorCode code);
bool is_not_found(ErrorCode code);

// Every failed Engine entry point throws EngineError before mutating any state.
class EngineError : public std::runtime_error {
 public:
  EngineError(ErrorCode code, const std::string& message);

  ErrorCode code() const { return code_; }

 private:
  ErrorCode code_;
};

} // namespace chaosmine
