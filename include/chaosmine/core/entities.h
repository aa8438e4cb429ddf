#pragma once

#include <array>
#include <cstdint>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "chaosmine/core/types.h"

namespace chaosmine {

enum class EventType : std::uint8_t {
  SolarFlare = 0,
  GravitationalWave = 1,
  CosmicRayBurst = 2,
  VoidRift = 3,
};

constexpr int kEventTypeCount = 4;

// Where burned tokens came from. The engine itself burns for Mining (burn-on-earn)
// and EarlyClaim; collaborators report purchase burns through Engine::burn_from_balance.
enum class BurnSource : std::uint8_t {
  Mining = 0,
  RigPurchase = 1,
  FacilityUpgrade = 2,
  RigRepair = 3,
  ShieldPurchase = 4,
  EarlyClaim = 5,
};

constexpr int kBurnSourceCount = 6;

// --- Static tables ---

// Era table row. Eras are laid out back to back from genesis; the last era
// extends indefinitely.
struct EraConfig {
  std::string name;
  BlockNumber duration_blocks{0};

  // Reward modifier applied by the emission scheduler (10000 = 1.0x).
  std::int64_t reward_modifier_bps{10000};

  // Highest severity tier the event engine may roll (>= 1).
  int max_event_tier{1};

  BlockNumber event_cooldown_blocks{0};
};

struct ZoneConfig {
  std::string name;

  // Mining synergy (added to 1.0x, then clamped to [0.75x, 1.5x]).
  std::int64_t mining_modifier_bps{0};

  // Added to the base cosmic resilience of agents registered in / moving to this zone.
  std::int64_t resilience_modifier_bps{0};

  // Per event-type damage multiplier (10000 = 1.0x), indexed by EventType.
  std::array<std::int64_t, kEventTypeCount> damage_multiplier_bps{{10000, 10000, 10000, 10000}};
};

// Context dependent quirk multiplier. The first matching context wins in the
// order zone, era, pool; otherwise default_bps. Results are clamped to [0.5x, 2.0x].
struct QuirkDef {
  std::uint32_t id{0};
  std::string name;
  std::int64_t default_bps{10000};

  std::uint8_t zone_mask{0};
  std::int64_t in_zone_bps{10000};

  // Era index from which era_bps applies. -1 disables the era context.
  int min_era{-1};
  std::int64_t era_bps{10000};

  // Applies while the agent belongs to a pool. 0 disables the pool context.
  std::int64_t pooled_bps{0};
};

// --- Collaborator-provided views ---

struct EquipmentUnit {
  Hashrate base_capacity{0};
  std::uint32_t quirk_id{0};
  // Remaining durability, 10000 = pristine.
  std::int64_t durability_bps{10000};
};

struct PoolState {
  Id pool_id{kInvalidId};
  Hashrate pool_hashrate{0};
  // All members share one equipment specialization.
  bool homogeneous{false};
  BlockNumber joined_block{0};
};

// --- Engine-owned records ---

struct ShieldState {
  std::int64_t last_absorption_bps{0};
  std::uint32_t events_absorbed{0};
};

struct Agent {
  Id id{kInvalidId};

  // Cached result of the capacity calculator (0 while inactive).
  Hashrate effective_hashrate{0};

  // Accumulator snapshot at the last settlement.
  u128 reward_debt{0};

  // Rewards settled at a hashrate change and not yet claimed.
  Amount buffered_rewards{0};

  std::vector<Id> vesting_entries;
  Amount total_claimed{0};

  ZoneId zone{0};
  std::int64_t resilience_bps{0};
  ShieldState shield;

  int pioneer_phase{0};
  BlockNumber registration_block{0};
  BlockNumber last_touch_block{0};
  bool active{true};
};

struct VestingEntry {
  Id id{kInvalidId};
  Id agent_id{kInvalidId};
  Amount amount{0};
  BlockNumber start_block{0};
  BlockNumber duration_blocks{0};
  Amount claimed_so_far{0};
};

// (zone, shard index) pair, ordered for use in std::set.
using ShardKey = std::pair<ZoneId, std::uint32_t>;

struct EventRecord {
  Id id{kInvalidId};
  EventType type{EventType::SolarFlare};
  int severity_tier{1};
  std::int64_t base_damage_bps{0};
  ZoneId origin_zone{0};
  std::uint8_t affected_zones_mask{0};
  BlockNumber trigger_block{0};
  Id triggered_by{kInvalidId};

  // Shard count per zone, fixed from the zone population at trigger time.
  // Zones outside affected_zones_mask stay at 0.
  std::array<std::uint32_t, kMaxZones> required_shards{};

  // Zone population snapshot used to bound shard ranges.
  std::array<std::uint32_t, kMaxZones> zone_population{};

  std::set<ShardKey> shard_processed;
};

inline bool zone_in_mask(std::uint8_t mask, ZoneId zone) {
  return zone < kMaxZones && (mask & static_cast<std::uint8_t>(1u << zone)) != 0;
}

} // namespace chaosmine
