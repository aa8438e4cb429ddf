#pragma once

#include <cstdint>
#include <string>

#include "chaosmine/core/config.h"
#include "chaosmine/core/engine_state.h"

namespace chaosmine {

// Compute a stable 64-bit digest of an engine state.
//
// Properties:
//  - Deterministic across runs/platforms (no dependence on unordered_map iteration order).
//  - Sensitive to every ledger, accumulator, agent, vesting and event field.
std::uint64_t digest_engine_state64(const EngineState& state);

// Digest of the tuning, for identifying configs in bug reports and regression tests.
std::uint64_t digest_engine_config64(const EngineConfig& cfg);

// Format a 64-bit digest as a fixed-width lowercase hex string.
std::string digest64_to_hex(std::uint64_t v);

} // namespace chaosmine
