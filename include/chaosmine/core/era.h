#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "chaosmine/core/entities.h"

namespace chaosmine {

// Index of the era containing `blocks_since_genesis`. Eras are laid out back to
// back; the last era never ends. Requires a non-empty table.
std::size_t era_index_at(const std::vector<EraConfig>& eras, BlockNumber blocks_since_genesis);

// First block (relative to genesis) of era `index`.
BlockNumber era_start_offset(const std::vector<EraConfig>& eras, std::size_t index);

// Highest phase i with active_agents >= thresholds[i].
int phase_for_population(const std::vector<std::uint64_t>& thresholds, std::uint64_t active_agents);

} // namespace chaosmine
