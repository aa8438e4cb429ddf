#include "chaosmine/core/vesting.h"

#include "chaosmine/util/fixed_point.h"

namespace chaosmine {

Amount vested_amount(const VestingEntry& e, BlockNumber current_block) {
  if (e.duration_blocks == 0) return e.amount;
  if (current_block <= e.start_block) return 0;
  const BlockNumber elapsed = current_block - e.start_block;
  if (elapsed >= e.duration_blocks) return e.amount;
  return util::clamp_to_u64(util::mul_div(e.amount, elapsed, e.duration_blocks));
}

Amount available_to_withdraw(const VestingEntry& e, BlockNumber current_block) {
  const Amount vested = vested_amount(e, current_block);
  return vested > e.claimed_so_far ? vested - e.claimed_so_far : 0;
}

} // namespace chaosmine
