#include "chaosmine/util/digest.h"

#include <cstdint>
#include <sstream>
#include <string>
#include <type_traits>

#include "chaosmine/util/sorted_keys.h"

namespace chaosmine {
namespace {

// FNV-1a 64-bit.
class Digest64 {
 public:
  Digest64() = default;

  void add_u8(std::uint8_t b) {
    h_ ^= static_cast<std::uint64_t>(b);
    h_ *= kPrime;
  }

  void add_u64(std::uint64_t v) {
    // Feed little-endian bytes to avoid host endianness differences.
    for (int i = 0; i < 8; ++i) {
      add_u8(static_cast<std::uint8_t>((v >> (i * 8)) & 0xFFu));
    }
  }

  void add_u128(util::u128 v) {
    add_u64(static_cast<std::uint64_t>(v));
    add_u64(static_cast<std::uint64_t>(v >> 64));
  }

  void add_i64(std::int64_t v) { add_u64(static_cast<std::uint64_t>(v)); }

  void add_size(std::size_t n) { add_u64(static_cast<std::uint64_t>(n)); }

  void add_bool(bool b) { add_u8(static_cast<std::uint8_t>(b ? 1 : 0)); }

  template <typename E, typename = std::enable_if_t<std::is_enum_v<E>>>
  void add_enum(E e) {
    using U = std::underlying_type_t<E>;
    add_u64(static_cast<std::uint64_t>(static_cast<U>(e)));
  }

  void add_string(const std::string& s) {
    add_size(s.size());
    for (unsigned char c : s) add_u8(static_cast<std::uint8_t>(c));
  }

  std::uint64_t value() const { return h_; }

 private:
  static constexpr std::uint64_t kOffset = 1469598103934665603ull;
  static constexpr std::uint64_t kPrime = 1099511628211ull;

  std::uint64_t h_{kOffset};
};

void hash_agent(Digest64& d, const Agent& a) {
  d.add_u64(a.id);
  d.add_u64(a.effective_hashrate);
  d.add_u128(a.reward_debt);
  d.add_u64(a.buffered_rewards);
  // Queue-like: entries are opened in order.
  d.add_size(a.vesting_entries.size());
  for (Id e : a.vesting_entries) d.add_u64(e);
  d.add_u64(a.total_claimed);
  d.add_u8(a.zone);
  d.add_i64(a.resilience_bps);
  d.add_i64(a.shield.last_absorption_bps);
  d.add_u64(a.shield.events_absorbed);
  d.add_i64(a.pioneer_phase);
  d.add_u64(a.registration_block);
  d.add_u64(a.last_touch_block);
  d.add_bool(a.active);
}

void hash_event(Digest64& d, const EventRecord& ev) {
  d.add_u64(ev.id);
  d.add_enum(ev.type);
  d.add_i64(ev.severity_tier);
  d.add_i64(ev.base_damage_bps);
  d.add_u8(ev.origin_zone);
  d.add_u8(ev.affected_zones_mask);
  d.add_u64(ev.trigger_block);
  d.add_u64(ev.triggered_by);
  for (int z = 0; z < kMaxZones; ++z) {
    d.add_u64(ev.required_shards[z]);
    d.add_u64(ev.zone_population[z]);
  }
  // std::set iterates in key order.
  d.add_size(ev.shard_processed.size());
  for (const auto& [zone, shard] : ev.shard_processed) {
    d.add_u8(zone);
    d.add_u64(shard);
  }
}

} // namespace

std::uint64_t digest_engine_state64(const EngineState& s) {
  Digest64 d;
  d.add_string("chaosmine.engine_state.v1");
  d.add_u64(s.current_block);

  const auto& acc = s.accumulator;
  d.add_u128(acc.acc_reward_per_hash);
  d.add_u64(acc.total_effective_hashrate);
  d.add_u64(acc.last_update_block);
  d.add_u64(acc.total_net_emission);
  d.add_u64(acc.total_emission_burned);

  d.add_u64(s.ledger.supply_cap());
  d.add_u64(s.ledger.total_minted());
  d.add_u64(s.ledger.total_burned());
  for (int i = 0; i < kBurnSourceCount; ++i) d.add_u64(s.ledger.burned_by(static_cast<BurnSource>(i)));
  const auto& balances = s.ledger.balances();
  d.add_size(balances.size());
  for (Id holder : util::sorted_keys(balances)) {
    d.add_u64(holder);
    d.add_u64(balances.at(holder));
  }

  d.add_u64(s.next_agent_id);
  d.add_u64(s.next_vesting_id);
  d.add_u64(s.next_event_id);
  d.add_u64(s.active_agent_count);
  d.add_u64(s.last_event_block);

  d.add_size(s.agents.size());
  for (Id id : util::sorted_keys(s.agents)) hash_agent(d, s.agents.at(id));

  d.add_size(s.vesting.size());
  for (Id id : util::sorted_keys(s.vesting)) {
    const auto& e = s.vesting.at(id);
    d.add_u64(e.id);
    d.add_u64(e.agent_id);
    d.add_u64(e.amount);
    d.add_u64(e.start_block);
    d.add_u64(e.duration_blocks);
    d.add_u64(e.claimed_so_far);
  }

  d.add_size(s.events.size());
  for (Id id : util::sorted_keys(s.events)) hash_event(d, s.events.at(id));

  return d.value();
}

std::uint64_t digest_engine_config64(const EngineConfig& cfg) {
  Digest64 d;
  d.add_string("chaosmine.engine_config.v1");
  d.add_u64(cfg.genesis_block);

  const auto& em = cfg.emission;
  d.add_u64(em.target_daily_per_agent);
  d.add_u64(em.blocks_per_day);
  d.add_i64(em.genesis_multiplier_bps);
  d.add_u64(em.genesis_population);
  d.add_u64(em.initial_max_per_block);
  d.add_u64(em.halving_interval_blocks);
  d.add_u64(em.supply_cap);
  d.add_i64(em.burn_on_earn_bps);

  const auto& c = cfg.capacity;
  d.add_size(c.quirks.size());
  for (const auto& q : c.quirks) {
    d.add_u64(q.id);
    d.add_string(q.name);
    d.add_i64(q.default_bps);
    d.add_u8(q.zone_mask);
    d.add_i64(q.in_zone_bps);
    d.add_i64(q.min_era);
    d.add_i64(q.era_bps);
    d.add_i64(q.pooled_bps);
  }
  d.add_i64(c.unit_cap_multiplier);
  d.add_i64(c.pool_base_bonus_bps);
  d.add_i64(c.pool_homogeneous_bonus_bps);
  d.add_i64(c.pool_loyalty_bonus_bps);
  d.add_u64(c.pool_loyalty_tenure_blocks);
  d.add_i64(c.pool_decay_start_share_bps);
  d.add_i64(c.pool_decay_end_share_bps);
  d.add_i64(c.pool_overshare_penalty_max_bps);
  d.add_i64(c.pool_overshare_full_penalty_share_bps);
  d.add_i64(c.dominance_tax_start_share_bps);
  d.add_i64(c.dominance_tax_full_share_bps);
  d.add_i64(c.dominance_tax_max_bps);
  d.add_size(c.pioneer_bonus_by_phase.size());
  for (Hashrate h : c.pioneer_bonus_by_phase) d.add_u64(h);

  const auto& ev = cfg.events;
  d.add_u64(ev.shard_size);
  d.add_i64(ev.min_phase_for_events);
  d.add_u64(ev.events_unlock_minted);
  d.add_u64(ev.trigger_bounty);
  d.add_u64(ev.process_bounty_per_agent);
  d.add_size(ev.tier_base_damage_bps.size());
  for (std::int64_t t : ev.tier_base_damage_bps) d.add_i64(t);
  d.add_i64(ev.max_combined_reduction_bps);

  d.add_size(cfg.eras.size());
  for (const auto& e : cfg.eras) {
    d.add_string(e.name);
    d.add_u64(e.duration_blocks);
    d.add_i64(e.reward_modifier_bps);
    d.add_i64(e.max_event_tier);
    d.add_u64(e.event_cooldown_blocks);
  }
  d.add_size(cfg.zones.size());
  for (const auto& z : cfg.zones) {
    d.add_string(z.name);
    d.add_i64(z.mining_modifier_bps);
    d.add_i64(z.resilience_modifier_bps);
    for (std::int64_t m : z.damage_multiplier_bps) d.add_i64(m);
  }
  d.add_size(cfg.phase_thresholds.size());
  for (std::uint64_t t : cfg.phase_thresholds) d.add_u64(t);

  d.add_u64(cfg.first_mine_delay_blocks);
  d.add_u64(cfg.silence_window_blocks);
  d.add_i64(cfg.base_resilience_bps);
  d.add_u64(cfg.vesting_duration_blocks);
  d.add_i64(cfg.early_claim_penalty_bps);
  return d.value();
}

std::string digest64_to_hex(std::uint64_t v) {
  std::ostringstream out;
  out << std::hex;
  out.width(16);
  out.fill('0');
  out << v;
  return out.str();
}

} // namespace chaosmine
