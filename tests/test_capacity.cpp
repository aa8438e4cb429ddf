#include <iostream>
#include <vector>

#include "chaosmine/core/capacity.h"
#include "chaosmine/core/config.h"

#define CM_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

int test_capacity() {
  using namespace chaosmine;

  const EngineConfig ecfg;
  const CapacityConfig& cfg = ecfg.capacity;

  // --- Quirk contexts: zone, then era, then pool, else default ---
  CM_ASSERT(quirk_multiplier_bps(cfg, 0, 0, 0, false) == 10000);
  CM_ASSERT(quirk_multiplier_bps(cfg, 99, 0, 0, false) == 10000);
  CM_ASSERT(quirk_multiplier_bps(cfg, 1, 0, 0, false) == 15000);
  CM_ASSERT(quirk_multiplier_bps(cfg, 1, 2, 0, false) == 10000);
  CM_ASSERT(quirk_multiplier_bps(cfg, 2, 4, 0, false) == 13000);
  CM_ASSERT(quirk_multiplier_bps(cfg, 2, 0, 0, false) == 9000);
  CM_ASSERT(quirk_multiplier_bps(cfg, 3, 0, 2, false) == 8000);
  CM_ASSERT(quirk_multiplier_bps(cfg, 3, 0, 3, false) == 20000);
  CM_ASSERT(quirk_multiplier_bps(cfg, 4, 0, 0, true) == 12500);
  CM_ASSERT(quirk_multiplier_bps(cfg, 4, 0, 0, false) == 10000);
  {
    CapacityConfig wild = cfg;
    QuirkDef weak;
    weak.id = 10;
    weak.default_bps = 1000;
    QuirkDef strong;
    strong.id = 11;
    strong.default_bps = 30000;
    wild.quirks = {weak, strong};
    CM_ASSERT(quirk_multiplier_bps(wild, 10, 0, 0, false) == 5000);
    CM_ASSERT(quirk_multiplier_bps(wild, 11, 0, 0, false) == 20000);
  }

  // --- Zone synergy clamp ---
  CM_ASSERT(zone_synergy_bps(ecfg.zones[7]) == 12500);
  {
    ZoneConfig z;
    z.mining_modifier_bps = 10000;
    CM_ASSERT(zone_synergy_bps(z) == 15000);
    z.mining_modifier_bps = -5000;
    CM_ASSERT(zone_synergy_bps(z) == 7500);
  }

  // --- Per-unit contribution and the 10x cap ---
  CM_ASSERT(unit_contribution(cfg, EquipmentUnit{1000, 0, 5000}, 10000, 10000) == 500);
  CM_ASSERT(unit_contribution(cfg, EquipmentUnit{1000, 0, 0}, 20000, 15000) == 0);
  CM_ASSERT(unit_contribution(cfg, EquipmentUnit{1000, 0, 10000}, 20000, 15000) == 3000);
  {
    CapacityConfig tight = cfg;
    tight.unit_cap_multiplier = 1;
    CM_ASSERT(unit_contribution(tight, EquipmentUnit{1000, 0, 10000}, 20000, 15000) == 1000);
  }

  // --- Dominance tax: 0 at 1% share, 50% at 5%, linear between, capped beyond ---
  CM_ASSERT(dominance_tax_bps(cfg, 100, 9900) == 0);
  CM_ASSERT(dominance_tax_bps(cfg, 300, 9700) == 2500);
  CM_ASSERT(dominance_tax_bps(cfg, 500, 9500) == 5000);
  CM_ASSERT(dominance_tax_bps(cfg, 2000, 8000) == 5000);
  CM_ASSERT(dominance_tax_bps(cfg, 0, 0) == 0);
  CM_ASSERT(dominance_tax_bps(cfg, 1000, 0) == 5000);
  {
    std::int64_t prev = 0;
    for (Hashrate h = 100; h <= 600; h += 10) {
      const std::int64_t t = dominance_tax_bps(cfg, h, 10000 - h);
      CM_ASSERT(t >= prev);
      prev = t;
    }
  }

  // --- Pool bonus with share decay and overshare penalty ---
  {
    PoolState pool;
    pool.pool_hashrate = 1000;
    pool.homogeneous = true;
    pool.joined_block = 0;
    CM_ASSERT(pool_bonus_bps(cfg, pool, 99000, 1000, 0) == 1500);
    CM_ASSERT(pool_bonus_bps(cfg, pool, 99000, 1000, cfg.pool_loyalty_tenure_blocks) == 1800);

    pool.homogeneous = false;
    pool.pool_hashrate = 22500;
    CM_ASSERT(pool_bonus_bps(cfg, pool, 99000, 1000, 0) == 500);
    pool.pool_hashrate = 30000;
    CM_ASSERT(pool_bonus_bps(cfg, pool, 99000, 1000, 0) == 0);
    pool.pool_hashrate = 40000;
    CM_ASSERT(pool_bonus_bps(cfg, pool, 99000, 1000, 0) == -1000);
    pool.pool_hashrate = 60000;
    CM_ASSERT(pool_bonus_bps(cfg, pool, 99000, 1000, 0) == -2000);

    // Empty network: no decay.
    pool.pool_hashrate = 0;
    CM_ASSERT(pool_bonus_bps(cfg, pool, 0, 0, 0) == 1000);
  }

  // --- Full pipeline ---
  {
    CapacityContext ctx;
    ctx.zone = &ecfg.zones[2];
    ctx.zone_id = 2;
    ctx.network_hashrate_excluding_agent = 1'000'000;
    ctx.pioneer_phase = 1;

    // Zero units: nothing at all, not even the pioneer bonus.
    CM_ASSERT(compute_effective_hashrate(cfg, {}, ctx).total == 0);

    const std::vector<EquipmentUnit> units = {EquipmentUnit{600, 0, 10000}, EquipmentUnit{400, 0, 10000}};
    const CapacityBreakdown b = compute_effective_hashrate(cfg, units, ctx);
    CM_ASSERT(b.equipment_sum == 1000);
    CM_ASSERT(b.dominance_tax_bps == 0);
    CM_ASSERT(b.pioneer_bonus == 30);
    CM_ASSERT(b.total == 1030);

    PoolState pool;
    pool.pool_hashrate = 5000;
    ctx.pool = pool;
    const CapacityBreakdown pooled = compute_effective_hashrate(cfg, units, ctx);
    CM_ASSERT(pooled.pool_bonus_bps == 1000);
    CM_ASSERT(pooled.after_pool == 1100);
    CM_ASSERT(pooled.total == 1130);

    // A dominant pool is penalized but never pushed below zero.
    pool.pool_hashrate = 900'000;
    ctx.pool = pool;
    const CapacityBreakdown hogged = compute_effective_hashrate(cfg, units, ctx);
    CM_ASSERT(hogged.pool_bonus_bps == -2000);
    CM_ASSERT(hogged.after_pool == 800);

    // Sole agent on the network pays the full tax.
    ctx.pool.reset();
    ctx.network_hashrate_excluding_agent = 0;
    ctx.pioneer_phase = 4;
    const CapacityBreakdown alone = compute_effective_hashrate(cfg, units, ctx);
    CM_ASSERT(alone.dominance_tax_bps == 5000);
    CM_ASSERT(alone.total == 500);
  }

  return 0;
}
