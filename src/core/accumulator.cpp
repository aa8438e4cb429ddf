#include "chaosmine/core/accumulator.h"

#include "chaosmine/util/fixed_point.h"

namespace chaosmine {

using util::kBpsDenominator;
using util::kWad;
using util::mul_div;

AccrualStep compute_accrual(const AccumulatorState& acc, BlockNumber current_block, Amount window_emission,
                            std::int64_t burn_bps, Amount remaining_supply) {
  AccrualStep step;
  if (current_block <= acc.last_update_block) return step;
  step.elapsed = current_block - acc.last_update_block;

  if (acc.total_effective_hashrate == 0) {
    step.skipped = true;
    return step;
  }

  const std::int64_t bps = util::clamp_bps(burn_bps, 0, kBpsDenominator - 1);
  step.gross = window_emission;
  step.burn = util::apply_bps(step.gross, bps);
  step.net = step.gross - step.burn;

  if (step.net > remaining_supply) {
    step.clamped = true;
    step.net = remaining_supply;
    step.burn = util::clamp_to_u64(
        mul_div(step.net, static_cast<u128>(bps), static_cast<u128>(kBpsDenominator - bps)));
    step.gross = step.net + step.burn;
  }

  step.acc_delta = mul_div(step.net, kWad, acc.total_effective_hashrate);
  return step;
}

void apply_accrual(AccumulatorState& acc, const AccrualStep& step, BlockNumber current_block) {
  if (current_block <= acc.last_update_block) return;
  acc.acc_reward_per_hash += step.acc_delta;
  acc.total_net_emission += step.net;
  acc.total_emission_burned += step.burn;
  acc.last_update_block = current_block;
}

Amount pending_reward(u128 acc_reward_per_hash, u128 reward_debt, Hashrate hashrate) {
  if (acc_reward_per_hash <= reward_debt || hashrate == 0) return 0;
  return util::clamp_to_u64(mul_div(acc_reward_per_hash - reward_debt, hashrate, kWad));
}

} // namespace chaosmine
