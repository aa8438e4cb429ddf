#pragma once

#include <cstdint>
#include <vector>

#include "chaosmine/core/config.h"

namespace chaosmine {

struct EmissionInputs {
  std::uint64_t active_agents{0};
  std::int64_t era_modifier_bps{10'000};
  BlockNumber blocks_since_genesis{0};
  // total_minted - total_burned.
  Amount current_supply{0};
};

// max(1.0, K * (1 - active / N0)^2) as a 1e18 fixed-point value.
// Returns exactly K at 0 agents and exactly 1.0 from N0 agents upwards.
util::u128 genesis_multiplier_wad(const EmissionConfig& cfg, std::uint64_t active_agents);

// initial_max_per_block >> (blocks_since_genesis / halving_interval_blocks).
Amount max_emission_for_epoch(const EmissionConfig& cfg, BlockNumber blocks_since_genesis);

// Per-block emission: min(target * max(genesis, era), epoch ceiling, remaining supply).
//
// This alone does not keep the supply under the cap across several blocks; the
// accrual step floors its mint again.
Amount compute_emission_per_block(const EmissionConfig& cfg, const EmissionInputs& in);

// Gross emission over the blocks [from_offset, to_offset), offsets counted from genesis.
// The range is cut at every halving and era boundary and each piece is priced at
// its own epoch ceiling and era modifier, so splitting a range never changes the sum.
// active_agents and current_supply are held fixed across the range.
Amount compute_window_emission(const EmissionConfig& cfg, const std::vector<EraConfig>& eras,
                               std::uint64_t active_agents, Amount current_supply, BlockNumber from_offset,
                               BlockNumber to_offset);

} // namespace chaosmine
