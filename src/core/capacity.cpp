#include "chaosmine/core/capacity.h"

#include <algorithm>

#include "chaosmine/util/fixed_point.h"

namespace chaosmine {
namespace {

using util::clamp_bps;
using util::kBpsDenominator;
using util::mul_div;
using util::u128;

constexpr std::int64_t kQuirkMinBps = 5'000;
constexpr std::int64_t kQuirkMaxBps = 20'000;
constexpr std::int64_t kSynergyMinBps = 7'500;
constexpr std::int64_t kSynergyMaxBps = 15'000;

const QuirkDef* find_quirk(const CapacityConfig& cfg, std::uint32_t id) {
  if (id == 0) return nullptr;
  for (const auto& q : cfg.quirks) {
    if (q.id == id) return &q;
  }
  return nullptr;
}

// Share of `part` in `part + rest`, in bps. Zero total means zero share.
std::int64_t share_bps(Hashrate part, Hashrate rest) {
  const u128 total = static_cast<u128>(part) + rest;
  if (total == 0) return 0;
  const u128 s = mul_div(part, static_cast<u128>(kBpsDenominator), total);
  return static_cast<std::int64_t>(std::min<u128>(s, kBpsDenominator));
}

Hashrate scale_bps(Hashrate v, std::int64_t bps) {
  if (bps <= 0) return 0;
  return util::clamp_to_u64(mul_div(v, static_cast<u128>(bps), static_cast<u128>(kBpsDenominator)));
}

} // namespace

std::int64_t quirk_multiplier_bps(const CapacityConfig& cfg, std::uint32_t quirk_id, ZoneId zone,
                                  std::size_t era_index, bool pooled) {
  const QuirkDef* q = find_quirk(cfg, quirk_id);
  if (!q) return kBpsDenominator;

  std::int64_t bps = q->default_bps;
  if (zone_in_mask(q->zone_mask, zone)) {
    bps = q->in_zone_bps;
  } else if (q->min_era >= 0 && era_index >= static_cast<std::size_t>(q->min_era)) {
    bps = q->era_bps;
  } else if (pooled && q->pooled_bps > 0) {
    bps = q->pooled_bps;
  }
  return clamp_bps(bps, kQuirkMinBps, kQuirkMaxBps);
}

std::int64_t zone_synergy_bps(const ZoneConfig& zone) {
  return clamp_bps(kBpsDenominator + zone.mining_modifier_bps, kSynergyMinBps, kSynergyMaxBps);
}

Hashrate unit_contribution(const CapacityConfig& cfg, const EquipmentUnit& unit, std::int64_t quirk_bps,
                           std::int64_t synergy_bps) {
  if (unit.base_capacity == 0 || unit.durability_bps <= 0) return 0;
  const std::int64_t durability = std::min<std::int64_t>(unit.durability_bps, kBpsDenominator);

  // base * d * q * s / 1e12; each factor is bounded so the product fits in 128 bits.
  const u128 factor = static_cast<u128>(durability) * static_cast<u128>(std::max<std::int64_t>(quirk_bps, 0)) *
                      static_cast<u128>(std::max<std::int64_t>(synergy_bps, 0));
  const u128 denom = static_cast<u128>(kBpsDenominator) * kBpsDenominator * kBpsDenominator;
  const u128 raw = mul_div(unit.base_capacity, factor, denom);

  const u128 cap = util::saturating_mul(unit.base_capacity,
                                        static_cast<u128>(std::max<std::int64_t>(cfg.unit_cap_multiplier, 0)));
  return util::clamp_to_u64(std::min(raw, cap));
}

std::int64_t pool_bonus_bps(const CapacityConfig& cfg, const PoolState& pool, Hashrate network_excluding_agent,
                            Hashrate agent_hashrate, BlockNumber current_block) {
  std::int64_t bonus = cfg.pool_base_bonus_bps;
  if (pool.homogeneous) bonus += cfg.pool_homogeneous_bonus_bps;
  if (current_block >= pool.joined_block && current_block - pool.joined_block >= cfg.pool_loyalty_tenure_blocks) {
    bonus += cfg.pool_loyalty_bonus_bps;
  }

  const u128 network = static_cast<u128>(network_excluding_agent) + agent_hashrate;
  if (network == 0) return bonus;
  const std::int64_t share = static_cast<std::int64_t>(
      std::min<u128>(mul_div(pool.pool_hashrate, static_cast<u128>(kBpsDenominator), network), kBpsDenominator));

  const std::int64_t start = cfg.pool_decay_start_share_bps;
  const std::int64_t end = cfg.pool_decay_end_share_bps;
  if (share <= start) return bonus;
  if (share < end) return bonus * (end - share) / (end - start);

  const std::int64_t full = cfg.pool_overshare_full_penalty_share_bps;
  const std::int64_t over = std::min(share, full) - end;
  return -(cfg.pool_overshare_penalty_max_bps * over / (full - end));
}

std::int64_t dominance_tax_bps(const CapacityConfig& cfg, Hashrate agent_hashrate, Hashrate network_excluding_agent) {
  const std::int64_t share = share_bps(agent_hashrate, network_excluding_agent);
  const std::int64_t start = cfg.dominance_tax_start_share_bps;
  const std::int64_t full = cfg.dominance_tax_full_share_bps;
  if (share <= start) return 0;
  if (share >= full) return cfg.dominance_tax_max_bps;
  return (share - start) * cfg.dominance_tax_max_bps / (full - start);
}

CapacityBreakdown compute_effective_hashrate(const CapacityConfig& cfg, const std::vector<EquipmentUnit>& units,
                                             const CapacityContext& ctx) {
  CapacityBreakdown out;
  if (units.empty()) return out;

  const std::int64_t synergy = ctx.zone ? zone_synergy_bps(*ctx.zone) : kBpsDenominator;
  const bool pooled = ctx.pool.has_value();

  u128 sum = 0;
  for (const auto& u : units) {
    const std::int64_t q = quirk_multiplier_bps(cfg, u.quirk_id, ctx.zone_id, ctx.era_index, pooled);
    sum += unit_contribution(cfg, u, q, synergy);
  }
  out.equipment_sum = util::clamp_to_u64(sum);

  out.after_pool = out.equipment_sum;
  if (pooled) {
    out.pool_bonus_bps =
        pool_bonus_bps(cfg, *ctx.pool, ctx.network_hashrate_excluding_agent, out.equipment_sum, ctx.current_block);
    out.after_pool = scale_bps(out.equipment_sum, kBpsDenominator + out.pool_bonus_bps);
  }

  out.dominance_tax_bps = dominance_tax_bps(cfg, out.after_pool, ctx.network_hashrate_excluding_agent);
  out.after_tax = scale_bps(out.after_pool, kBpsDenominator - out.dominance_tax_bps);

  if (ctx.pioneer_phase >= 0 && static_cast<std::size_t>(ctx.pioneer_phase) < cfg.pioneer_bonus_by_phase.size()) {
    out.pioneer_bonus = cfg.pioneer_bonus_by_phase[static_cast<std::size_t>(ctx.pioneer_phase)];
  }
  out.total = util::clamp_to_u64(static_cast<u128>(out.after_tax) + out.pioneer_bonus);
  return out;
}

} // namespace chaosmine
