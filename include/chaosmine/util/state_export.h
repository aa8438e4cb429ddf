#pragma once

#include <string>

#include "chaosmine/core/config.h"
#include "chaosmine/core/engine_state.h"

namespace chaosmine {

// Export agents as a JSON array sorted by id.
//
// 128-bit fields (reward_debt) are exported as decimal strings; every other
// amount is an exact JSON integer. Output ends with a trailing newline.
std::string agents_to_json(const EngineState& state);

// Export event records, including the processed shard list and the derived
// "processed" flag. If `cfg` is provided, zone names are resolved.
//
// Output is a JSON array and ends with a trailing newline.
std::string events_to_json(const EngineState& state, const EngineConfig* cfg = nullptr);

// Accumulator, ledger totals, burns by source and balances.
std::string supply_to_json(const EngineState& state);

// Everything above in one object, plus vesting entries and id counters.
std::string engine_state_to_json(const EngineState& state, const EngineConfig* cfg = nullptr);

} // namespace chaosmine
