#pragma once

#include <cstdint>

#include "chaosmine/core/types.h"

namespace chaosmine {

// Global reward accumulator. One instance per engine.
struct AccumulatorState {
  // Net reward per unit of effective hashrate since genesis, scaled by 1e18.
  // Never decreases.
  u128 acc_reward_per_hash{0};

  Hashrate total_effective_hashrate{0};
  BlockNumber last_update_block{0};

  // Net emission credited to the accumulator, and the burn-on-earn taken from it.
  Amount total_net_emission{0};
  Amount total_emission_burned{0};
};

// Result of advancing the accumulator to a block, computed without side effects.
struct AccrualStep {
  BlockNumber elapsed{0};
  Amount gross{0};
  Amount burn{0};
  Amount net{0};
  u128 acc_delta{0};

  // Net was floored to the remaining supply.
  bool clamped{false};

  // Blocks elapsed but nobody held hashrate, so nothing is minted for them.
  bool skipped{false};
};

// Accrual for the window (last_update_block, current_block].
//
// gross = window_emission (see compute_window_emission), burn = gross * burn_bps / 10000,
// net = gross - burn floored to remaining_supply (burn rescaled to keep the ratio),
// acc_delta = net * 1e18 / total_effective_hashrate. All divisions truncate.
AccrualStep compute_accrual(const AccumulatorState& acc, BlockNumber current_block, Amount window_emission,
                            std::int64_t burn_bps, Amount remaining_supply);

// Applies a step from compute_accrual and moves last_update_block forward.
void apply_accrual(AccumulatorState& acc, const AccrualStep& step, BlockNumber current_block);

// (acc - debt) * hashrate / 1e18, truncated.
Amount pending_reward(u128 acc_reward_per_hash, u128 reward_debt, Hashrate hashrate);

} // namespace chaosmine
