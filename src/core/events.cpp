#include "chaosmine/core/events.h"

#include <algorithm>

#include "chaosmine/util/fixed_point.h"
#include "chaosmine/util/hash_rng.h"

namespace chaosmine {

DerivedEvent derive_event(std::uint64_t block_seed, Id event_id, int max_tier,
                          const std::vector<std::int64_t>& tier_base_damage_bps, std::size_t zone_count) {
  util::HashRng rng(util::mix64(block_seed, event_id));

  DerivedEvent ev;
  ev.type = static_cast<EventType>(rng.index(kEventTypeCount));

  const int tiers = std::max(1, std::min<int>(max_tier, static_cast<int>(tier_base_damage_bps.size())));
  ev.severity_tier = 1 + static_cast<int>(rng.index(static_cast<std::size_t>(tiers)));
  if (!tier_base_damage_bps.empty()) {
    ev.base_damage_bps = tier_base_damage_bps[static_cast<std::size_t>(ev.severity_tier - 1)];
  }

  const std::size_t zones = std::min<std::size_t>(std::max<std::size_t>(zone_count, 1), kMaxZones);
  ev.origin_zone = static_cast<ZoneId>(rng.index(zones));
  ev.affected_zones_mask = static_cast<std::uint8_t>(1u << ev.origin_zone);

  const std::size_t wanted = std::min<std::size_t>(static_cast<std::size_t>(ev.severity_tier), zones);
  std::size_t have = 1;
  while (have < wanted) {
    const auto z = static_cast<ZoneId>(rng.index(zones));
    if (zone_in_mask(ev.affected_zones_mask, z)) continue;
    ev.affected_zones_mask = static_cast<std::uint8_t>(ev.affected_zones_mask | (1u << z));
    ++have;
  }
  return ev;
}

std::int64_t compute_damage_bps(const DamageInputs& in) {
  using util::kBpsDenominator;
  const std::int64_t base = std::max<std::int64_t>(in.base_damage_bps, 0);
  const std::int64_t mult = std::max<std::int64_t>(in.zone_multiplier_bps, 0);
  const std::int64_t max_reduction = util::clamp_bps(in.max_combined_reduction_bps, 0, kBpsDenominator);
  const std::int64_t reduction = std::min(
      std::max<std::int64_t>(in.shelter_bps, 0) + std::max<std::int64_t>(in.shield_absorption_bps, 0), max_reduction);
  const std::int64_t resilience = util::clamp_bps(in.resilience_bps, 0, kBpsDenominator);

  const util::u128 num = static_cast<util::u128>(base) * static_cast<util::u128>(mult) *
                         static_cast<util::u128>(kBpsDenominator - reduction) *
                         static_cast<util::u128>(kBpsDenominator - resilience);
  const util::u128 denom = static_cast<util::u128>(kBpsDenominator) * kBpsDenominator * kBpsDenominator;
  const util::u128 dmg = num / denom;
  return dmg > static_cast<util::u128>(kBpsDenominator) ? kBpsDenominator : static_cast<std::int64_t>(dmg);
}

std::uint32_t required_shard_count(std::uint32_t population, std::uint32_t shard_size) {
  if (shard_size == 0 || population == 0) return 0;
  return population / shard_size + (population % shard_size != 0 ? 1u : 0u);
}

std::pair<std::uint32_t, std::uint32_t> shard_range(std::uint32_t shard_index, std::uint32_t shard_size,
                                                    std::uint32_t population) {
  const std::uint64_t begin = static_cast<std::uint64_t>(shard_index) * shard_size;
  const std::uint64_t end = std::min<std::uint64_t>(begin + shard_size, population);
  if (begin >= end) return {population, population};
  return {static_cast<std::uint32_t>(begin), static_cast<std::uint32_t>(end)};
}

bool is_event_processed(const EventRecord& ev) {
  for (int z = 0; z < kMaxZones; ++z) {
    const auto zone = static_cast<ZoneId>(z);
    for (std::uint32_t s = 0; s < ev.required_shards[zone]; ++s) {
      if (ev.shard_processed.count(ShardKey{zone, s}) == 0) return false;
    }
  }
  return true;
}

std::size_t processed_shard_count(const EventRecord& ev) { return ev.shard_processed.size(); }

std::size_t total_required_shards(const EventRecord& ev) {
  std::size_t n = 0;
  for (std::uint32_t c : ev.required_shards) n += c;
  return n;
}

} // namespace chaosmine
