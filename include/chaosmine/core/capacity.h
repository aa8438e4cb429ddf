#pragma once

#include <cstdint>
#include <optional>
#include <vector>

#include "chaosmine/core/config.h"
#include "chaosmine/core/entities.h"

namespace chaosmine {

// Everything the capacity calculator needs besides the equipment list.
struct CapacityContext {
  const ZoneConfig* zone{nullptr};
  ZoneId zone_id{0};
  std::size_t era_index{0};
  std::optional<PoolState> pool;
  BlockNumber current_block{0};

  // Network total effective hashrate without this agent's own contribution.
  Hashrate network_hashrate_excluding_agent{0};

  int pioneer_phase{0};
};

// Intermediate values, kept for logging and tests.
struct CapacityBreakdown {
  Hashrate equipment_sum{0};
  std::int64_t pool_bonus_bps{0};
  Hashrate after_pool{0};
  std::int64_t dominance_tax_bps{0};
  Hashrate after_tax{0};
  Hashrate pioneer_bonus{0};
  Hashrate total{0};
};

// Context dependent quirk multiplier, clamped to [5000, 20000]. Unknown or zero
// quirk ids are neutral (10000).
std::int64_t quirk_multiplier_bps(const CapacityConfig& cfg, std::uint32_t quirk_id, ZoneId zone,
                                  std::size_t era_index, bool pooled);

// 10000 + zone mining modifier, clamped to [7500, 15000].
std::int64_t zone_synergy_bps(const ZoneConfig& zone);

// base * durability * quirk * synergy, clamped to [0, unit_cap_multiplier * base].
Hashrate unit_contribution(const CapacityConfig& cfg, const EquipmentUnit& unit, std::int64_t quirk_bps,
                           std::int64_t synergy_bps);

// Pool bonus (negative beyond the overshare threshold).
std::int64_t pool_bonus_bps(const CapacityConfig& cfg, const PoolState& pool, Hashrate network_excluding_agent,
                            Hashrate agent_hashrate, BlockNumber current_block);

// Dominance tax for an agent holding `agent_hashrate` against the rest of the network.
std::int64_t dominance_tax_bps(const CapacityConfig& cfg, Hashrate agent_hashrate, Hashrate network_excluding_agent);

CapacityBreakdown compute_effective_hashrate(const CapacityConfig& cfg, const std::vector<EquipmentUnit>& units,
                                             const CapacityContext& ctx);

} // namespace chaosmine
