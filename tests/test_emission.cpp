#include <iostream>
#include <vector>

#include "chaosmine/core/config.h"
#include "chaosmine/core/emission.h"

#define CM_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

int test_emission() {
  using namespace chaosmine;
  using util::kWad;
  using util::u128;

  EmissionConfig cfg;
  cfg.genesis_multiplier_bps = 200'000;
  cfg.genesis_population = 1'000;

  // --- Genesis multiplier: K at zero, 1.0 at N0, strictly decreasing until it reaches 1.0 ---
  CM_ASSERT(genesis_multiplier_wad(cfg, 0) == 20 * kWad);
  CM_ASSERT(genesis_multiplier_wad(cfg, 1'000) == kWad);
  CM_ASSERT(genesis_multiplier_wad(cfg, 50'000) == kWad);
  CM_ASSERT(genesis_multiplier_wad(cfg, 500) == 5 * kWad);
  {
    u128 prev = genesis_multiplier_wad(cfg, 0);
    for (std::uint64_t a = 1; a <= 777; ++a) {
      const u128 m = genesis_multiplier_wad(cfg, a);
      CM_ASSERT(m < prev);
      CM_ASSERT(m >= kWad);
      prev = m;
    }
    CM_ASSERT(prev == kWad);
    for (std::uint64_t a = 777; a <= 1'000; ++a) CM_ASSERT(genesis_multiplier_wad(cfg, a) == kWad);
  }

  // --- Per-block emission with round numbers: 100 units per agent per block ---
  cfg.blocks_per_day = 1'000;
  cfg.target_daily_per_agent = 100'000;
  cfg.initial_max_per_block = 1'000'000'000;
  cfg.halving_interval_blocks = 10'000;

  EmissionInputs in;
  in.active_agents = 0;
  in.era_modifier_bps = 15'000;
  CM_ASSERT(compute_emission_per_block(cfg, in) == 0);

  // Era modifier wins once the population is dense.
  in.active_agents = 1'000;
  CM_ASSERT(compute_emission_per_block(cfg, in) == 150'000);
  in.era_modifier_bps = 8'000;
  CM_ASSERT(compute_emission_per_block(cfg, in) == 100'000);

  // Genesis multiplier wins while the population is thin.
  in.active_agents = 500;
  in.era_modifier_bps = 15'000;
  CM_ASSERT(compute_emission_per_block(cfg, in) == 250'000);

  // Halving ceiling.
  in.active_agents = 1'000;
  cfg.initial_max_per_block = 120'000;
  in.blocks_since_genesis = 9'999;
  CM_ASSERT(compute_emission_per_block(cfg, in) == 120'000);
  in.blocks_since_genesis = 10'000;
  CM_ASSERT(compute_emission_per_block(cfg, in) == 60'000);
  in.blocks_since_genesis = 25'000;
  CM_ASSERT(compute_emission_per_block(cfg, in) == 30'000);
  CM_ASSERT(max_emission_for_epoch(cfg, 10'000ULL * 64) == 0);
  CM_ASSERT(max_emission_for_epoch(cfg, 10'000ULL * 1'000) == 0);

  // Remaining supply ceiling.
  in.blocks_since_genesis = 0;
  in.current_supply = cfg.supply_cap - 10;
  CM_ASSERT(compute_emission_per_block(cfg, in) == 10);
  in.current_supply = cfg.supply_cap;
  CM_ASSERT(compute_emission_per_block(cfg, in) == 0);

  // --- Window emission, priced piecewise across era and halving boundaries ---
  {
    EraConfig boom;
    boom.name = "boom";
    boom.duration_blocks = 5'000;
    boom.reward_modifier_bps = 15'000;
    EraConfig bust;
    bust.name = "bust";
    bust.reward_modifier_bps = 8'000;
    const std::vector<EraConfig> eras = {boom, bust};

    // 5000 blocks at 120000 (epoch ceiling), 5000 at 100000, 2000 at 60000 after the halving.
    const Amount total = compute_window_emission(cfg, eras, 1'000, 0, 0, 12'000);
    CM_ASSERT(total == 1'220'000'000);
    CM_ASSERT(compute_window_emission(cfg, eras, 1'000, 0, 0, 4'999) +
                  compute_window_emission(cfg, eras, 1'000, 0, 4'999, 10'001) +
                  compute_window_emission(cfg, eras, 1'000, 0, 10'001, 12'000) ==
              total);
    CM_ASSERT(compute_window_emission(cfg, eras, 1'000, 0, 9'999, 10'001) == 100'000 + 60'000);

    CM_ASSERT(compute_window_emission(cfg, eras, 1'000, 0, 7, 7) == 0);
    CM_ASSERT(compute_window_emission(cfg, eras, 1'000, 0, 10, 5) == 0);
    CM_ASSERT(compute_window_emission(cfg, eras, 0, 0, 0, 12'000) == 0);
    // The ceiling is gone after 64 halvings.
    CM_ASSERT(compute_window_emission(cfg, eras, 1'000, 0, 10'000ULL * 64, 10'000ULL * 70) == 0);
    // 120000 >> 16 == 1 per block in epoch 16, nothing from epoch 17 on.
    CM_ASSERT(compute_window_emission(cfg, eras, 1'000, 0, 10'000ULL * 16, 10'000ULL * 70) == 10'000);
  }

  return 0;
}
