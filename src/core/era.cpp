#include "chaosmine/core/era.h"

namespace chaosmine {

std::size_t era_index_at(const std::vector<EraConfig>& eras, BlockNumber blocks_since_genesis) {
  if (eras.empty()) return 0;
  BlockNumber end = 0;
  for (std::size_t i = 0; i + 1 < eras.size(); ++i) {
    end += eras[i].duration_blocks;
    if (blocks_since_genesis < end) return i;
  }
  return eras.size() - 1;
}

BlockNumber era_start_offset(const std::vector<EraConfig>& eras, std::size_t index) {
  BlockNumber start = 0;
  for (std::size_t i = 0; i < index && i < eras.size(); ++i) start += eras[i].duration_blocks;
  return start;
}

int phase_for_population(const std::vector<std::uint64_t>& thresholds, std::uint64_t active_agents) {
  int phase = 0;
  for (std::size_t i = 0; i < thresholds.size(); ++i) {
    if (active_agents >= thresholds[i]) phase = static_cast<int>(i);
    else break;
  }
  return phase;
}

} // namespace chaosmine
