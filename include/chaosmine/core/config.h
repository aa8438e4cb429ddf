#pragma once

#include <cstdint>
#include <vector>

#include "chaosmine/core/entities.h"

namespace chaosmine {

// Token amounts are expressed in base units; one whole token is kTokenUnit units.
constexpr Amount kTokenUnit = 1'000'000;

std::vector<EraConfig> default_era_table();
std::vector<ZoneConfig> default_zone_table();
std::vector<QuirkDef> default_quirk_table();

struct EmissionConfig {
  // Emission target per active agent per day, before modifiers.
  Amount target_daily_per_agent{1'000 * kTokenUnit};

  std::uint64_t blocks_per_day{43'200};

  // Genesis density multiplier K (200000 = 20x) and the population N0 at which it
  // has decayed to 1.0x.
  std::int64_t genesis_multiplier_bps{200'000};
  std::uint64_t genesis_population{1'000};

  // Per-block ceiling for epoch 0; halves every halving_interval_blocks.
  Amount initial_max_per_block{100 * kTokenUnit};
  BlockNumber halving_interval_blocks{31'536'000};

  // Hard ceiling on total_minted - total_burned.
  Amount supply_cap{1'000'000'000 * kTokenUnit};

  // Share of every accrual burned immediately (source: Mining).
  std::int64_t burn_on_earn_bps{2'000};
};

struct CapacityConfig {
  std::vector<QuirkDef> quirks{default_quirk_table()};

  // A single unit never contributes more than this multiple of its base capacity.
  std::int64_t unit_cap_multiplier{10};

  // --- Pool bonus ---
  std::int64_t pool_base_bonus_bps{1'000};
  std::int64_t pool_homogeneous_bonus_bps{500};
  std::int64_t pool_loyalty_bonus_bps{300};
  BlockNumber pool_loyalty_tenure_blocks{302'400};

  // The bonus decays linearly to zero as the pool's network share rises from
  // start to end. Beyond end, a penalty grows linearly up to
  // pool_overshare_penalty_max_bps, reached at pool_overshare_full_penalty_share_bps.
  std::int64_t pool_decay_start_share_bps{1'500};
  std::int64_t pool_decay_end_share_bps{3'000};
  std::int64_t pool_overshare_penalty_max_bps{2'000};
  std::int64_t pool_overshare_full_penalty_share_bps{5'000};

  // --- Dominance tax ---
  // Linear from 0 at start share to max at full share; capped beyond.
  std::int64_t dominance_tax_start_share_bps{100};
  std::int64_t dominance_tax_full_share_bps{500};
  std::int64_t dominance_tax_max_bps{5'000};

  // Additive hashrate granted permanently at registration, indexed by genesis phase.
  std::vector<Hashrate> pioneer_bonus_by_phase{50, 30, 15, 5, 0};
};

struct EventConfig {
  std::uint32_t shard_size{128};

  // Genesis phase required before events can be triggered.
  int min_phase_for_events{1};

  // Events stay locked until this much has been minted in total (0 = no gate).
  Amount events_unlock_minted{0};

  Amount trigger_bounty{10 * kTokenUnit};
  Amount process_bounty_per_agent{kTokenUnit / 10};

  // Base durability damage per severity tier (index 0 = tier 1).
  std::vector<std::int64_t> tier_base_damage_bps{500, 1'000, 2'000, 3'500, 5'000};

  // Shelter + shield never reduce damage by more than this.
  std::int64_t max_combined_reduction_bps{9'000};
};

struct EngineConfig {
  // Block at which era and halving clocks start.
  BlockNumber genesis_block{0};

  EmissionConfig emission;
  CapacityConfig capacity;
  EventConfig events;

  std::vector<EraConfig> eras{default_era_table()};
  std::vector<ZoneConfig> zones{default_zone_table()};

  // Active-agent thresholds for genesis phases. Phase i is reached once
  // active_agent_count >= phase_thresholds[i]; the first entry must be 0.
  std::vector<std::uint64_t> phase_thresholds{0, 25, 100, 500, 2'000};

  // Blocks after registration before the first claim is accepted.
  BlockNumber first_mine_delay_blocks{10'000};

  // An agent silent for longer than this may be deactivated by anyone.
  BlockNumber silence_window_blocks{100'000};

  // Base cosmic resilience before the zone modifier.
  std::int64_t base_resilience_bps{1'000};

  // Claimed rewards vest linearly over this many blocks.
  BlockNumber vesting_duration_blocks{200'000};

  // Burned from the remaining amount of an entry claimed early.
  std::int64_t early_claim_penalty_bps{5'000};
};

} // namespace chaosmine
