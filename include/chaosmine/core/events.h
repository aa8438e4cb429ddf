#pragma once

#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

#include "chaosmine/core/entities.h"

namespace chaosmine {

// Event parameters derived from a seed. Identical inputs give identical events.
struct DerivedEvent {
  EventType type{EventType::SolarFlare};
  int severity_tier{1};
  std::int64_t base_damage_bps{0};
  ZoneId origin_zone{0};
  // Origin zone plus (severity_tier - 1) further distinct zones, bounded by zone_count.
  std::uint8_t affected_zones_mask{0};
};

// `block_seed` comes from the host's EntropySource for the trigger block.
DerivedEvent derive_event(std::uint64_t block_seed, Id event_id, int max_tier,
                          const std::vector<std::int64_t>& tier_base_damage_bps, std::size_t zone_count);

struct DamageInputs {
  std::int64_t base_damage_bps{0};
  std::int64_t zone_multiplier_bps{10'000};
  std::int64_t shelter_bps{0};
  std::int64_t shield_absorption_bps{0};
  std::int64_t resilience_bps{0};
  std::int64_t max_combined_reduction_bps{9'000};
};

// base * zone_mult * (1 - min(shelter + shield, max_reduction)) * (1 - resilience),
// truncated and clamped to [0, 10000].
std::int64_t compute_damage_bps(const DamageInputs& in);

// ceil(population / shard_size).
std::uint32_t required_shard_count(std::uint32_t population, std::uint32_t shard_size);

// Half-open index range [begin, end) of a shard within a zone of `population` agents.
std::pair<std::uint32_t, std::uint32_t> shard_range(std::uint32_t shard_index, std::uint32_t shard_size,
                                                    std::uint32_t population);

// True once every required (zone, shard) pair is in shard_processed.
bool is_event_processed(const EventRecord& ev);

std::size_t processed_shard_count(const EventRecord& ev);
std::size_t total_required_shards(const EventRecord& ev);

} // namespace chaosmine
