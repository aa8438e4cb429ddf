#pragma once

#include "chaosmine/core/entities.h"

namespace chaosmine {

// amount * min(1, (current - start) / duration). A zero duration vests at once.
Amount vested_amount(const VestingEntry& e, BlockNumber current_block);

// Vested but not yet withdrawn.
Amount available_to_withdraw(const VestingEntry& e, BlockNumber current_block);

inline Amount remaining_amount(const VestingEntry& e) {
  return e.amount > e.claimed_so_far ? e.amount - e.claimed_so_far : 0;
}

} // namespace chaosmine
