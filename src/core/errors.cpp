#include "chaosmine/core/errors.h"

namespace chaosmine {

const char* error_code_name(ErrorCode code) {
  switch (code) {
    case ErrorCode::CooldownActive: return "cooldown_active";
    case ErrorCode::PhaseTooEarly: return "phase_too_early";
    case ErrorCode::EventsLocked: return "events_locked";
    case ErrorCode::FirstMineDelay: return "first_mine_delay";
    case ErrorCode::ZoneNotAffected: return "zone_not_affected";
    case ErrorCode::ShardOutOfRange: return "shard_out_of_range";
    case ErrorCode::ShardAlreadyProcessed: return "shard_already_processed";
    case ErrorCode::AgentInactive: return "agent_inactive";
    case ErrorCode::AgentNotSilent: return "agent_not_silent";
    case ErrorCode::InsufficientBalance: return "insufficient_balance";
    case ErrorCode::BlockRegression: return "block_regression";
    case ErrorCode::AgentNotFound: return "agent_not_found";
    case ErrorCode::EventNotFound: return "event_not_found";
    case ErrorCode::VestingEntryNotFound: return "vesting_entry_not_found";
    case ErrorCode::ZoneNotFound: return "zone_not_found";
    case ErrorCode::InvalidConfig: return "invalid_config";
  }
  return "unknown";
}

bool is_precondition_failure(ErrorCode code) {
  switch (code) {
    case ErrorCode::CooldownActive:
    case ErrorCode::PhaseTooEarly:
    case ErrorCode::EventsLocked:
    case ErrorCode::FirstMineDelay:
    case ErrorCode::ZoneNotAffected:
    case ErrorCode::ShardOutOfRange:
    case ErrorCode::ShardAlreadyProcessed:
    case ErrorCode::AgentInactive:
    case ErrorCode::AgentNotSilent:
    case ErrorCode::InsufficientBalance:
    case ErrorCode::BlockRegression:
      return true;
    default:
      return false;
  }
}

bool is_not_found(ErrorCode code) {
  return code == ErrorCode::AgentNotFound || code == ErrorCode::EventNotFound ||
         code == ErrorCode::VestingEntryNotFound || code == ErrorCode::ZoneNotFound;
}

EngineError::EngineError(ErrorCode code, const std::string& message)
    : std::runtime_error(std::string(error_code_name(code)) + ": " + message), code_(code) {}

} // namespace chaosmine
