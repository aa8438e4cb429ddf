#include "chaosmine/core/emission.h"

#include <algorithm>

#include "chaosmine/core/era.h"
#include "chaosmine/util/fixed_point.h"

namespace chaosmine {

using util::kWad;
using util::mul_div;
using util::u128;

namespace {

// 1 bps == 1e14 wad.
constexpr u128 kWadPerBps = kWad / static_cast<u128>(util::kBpsDenominator);

} // namespace

u128 genesis_multiplier_wad(const EmissionConfig& cfg, std::uint64_t active_agents) {
  const std::uint64_t n0 = cfg.genesis_population;
  if (n0 == 0 || active_agents >= n0) return kWad;

  const u128 k_wad = static_cast<u128>(std::max<std::int64_t>(cfg.genesis_multiplier_bps, 0)) * kWadPerBps;
  const u128 d = n0 - active_agents;
  const u128 m = mul_div(k_wad, d * d, static_cast<u128>(n0) * n0);
  return std::max(m, kWad);
}

Amount max_emission_for_epoch(const EmissionConfig& cfg, BlockNumber blocks_since_genesis) {
  if (cfg.halving_interval_blocks == 0) return cfg.initial_max_per_block;
  const std::uint64_t epoch = blocks_since_genesis / cfg.halving_interval_blocks;
  if (epoch >= 64) return 0;
  return cfg.initial_max_per_block >> epoch;
}

Amount compute_emission_per_block(const EmissionConfig& cfg, const EmissionInputs& in) {
  if (cfg.blocks_per_day == 0 || in.active_agents == 0) return 0;

  const u128 target = mul_div(cfg.target_daily_per_agent, in.active_agents, cfg.blocks_per_day);

  const u128 genesis = genesis_multiplier_wad(cfg, in.active_agents);
  const u128 era = static_cast<u128>(std::max<std::int64_t>(in.era_modifier_bps, 0)) * kWadPerBps;
  const u128 modifier = std::max(genesis, era);

  const u128 emission = mul_div(target, modifier, kWad);
  const u128 epoch_cap = max_emission_for_epoch(cfg, in.blocks_since_genesis);
  const u128 remaining = in.current_supply >= cfg.supply_cap ? 0 : cfg.supply_cap - in.current_supply;

  return util::clamp_to_u64(std::min({emission, epoch_cap, remaining}));
}

Amount compute_window_emission(const EmissionConfig& cfg, const std::vector<EraConfig>& eras,
                               std::uint64_t active_agents, Amount current_supply, BlockNumber from_offset,
                               BlockNumber to_offset) {
  if (to_offset <= from_offset || active_agents == 0 || eras.empty()) return 0;

  const BlockNumber halving = cfg.halving_interval_blocks;
  u128 total = 0;
  BlockNumber t = from_offset;
  while (t < to_offset) {
    BlockNumber end = to_offset;
    if (halving != 0) {
      const std::uint64_t epoch = t / halving;
      // The ceiling is zero from epoch 64 on.
      if (epoch >= 64) break;
      const u128 next_halving = (static_cast<u128>(epoch) + 1) * halving;
      if (next_halving < end) end = static_cast<BlockNumber>(next_halving);
    }
    const std::size_t era = era_index_at(eras, t);
    if (era + 1 < eras.size()) end = std::min(end, era_start_offset(eras, era + 1));

    EmissionInputs in;
    in.active_agents = active_agents;
    in.era_modifier_bps = eras[era].reward_modifier_bps;
    in.blocks_since_genesis = t;
    in.current_supply = current_supply;
    const u128 piece = static_cast<u128>(compute_emission_per_block(cfg, in)) * (end - t);
    total = util::clamp_to_u64(total + piece);
    t = end;
  }
  return static_cast<Amount>(total);
}

} // namespace chaosmine
