#pragma once

#include <cstdint>
#include <unordered_map>

#include "chaosmine/core/accumulator.h"
#include "chaosmine/core/entities.h"
#include "chaosmine/core/token_ledger.h"

namespace chaosmine {

struct EngineState {
  BlockNumber current_block{0};

  AccumulatorState accumulator;
  TokenLedger ledger;

  Id next_agent_id{1};
  Id next_vesting_id{1};
  Id next_event_id{1};

  std::unordered_map<Id, Agent> agents;
  std::unordered_map<Id, VestingEntry> vesting;

  // Never erased.
  std::unordered_map<Id, EventRecord> events;

  std::uint64_t active_agent_count{0};
  BlockNumber last_event_block{0};
};

} // namespace chaosmine
