#include <iostream>
#include <vector>

#include "chaosmine/core/engine.h"
#include "chaosmine/core/token_ledger.h"
#include "fake_world.h"

#define CM_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

namespace {

chaosmine::Amount sum_balances(const chaosmine::EngineState& s) {
  chaosmine::Amount total = 0;
  for (const auto& [holder, bal] : s.ledger.balances()) total += bal;
  return total;
}

} // namespace

int test_supply() {
  using namespace chaosmine;

  // --- Ledger primitives ---
  {
    TokenLedger ledger(1'000);
    CM_ASSERT(ledger.mint(1, 600) == 600);
    CM_ASSERT(ledger.mint(2, 600) == 400);
    CM_ASSERT(ledger.mint(2, 1) == 0);
    CM_ASSERT(ledger.remaining_supply() == 0);

    ledger.burn(1, 100, BurnSource::RigPurchase);
    CM_ASSERT(ledger.remaining_supply() == 100);
    CM_ASSERT(ledger.burned_by(BurnSource::RigPurchase) == 100);
    ledger.transfer(1, 3, 500);
    CM_ASSERT(ledger.balance_of(1) == 0);
    CM_ASSERT(ledger.balances().count(1) == 0);
    CM_ASSERT(ledger.balance_of(3) == 500);

    try {
      ledger.burn(1, 1, BurnSource::RigRepair);
      CM_ASSERT(false);
    } catch (const EngineError& e) {
      CM_ASSERT(e.code() == ErrorCode::InsufficientBalance);
    }

    ledger.mint_with_burn(4, 125, 25, BurnSource::Mining);
    const SupplyMetrics m = ledger.metrics();
    CM_ASSERT(m.total_minted == 1'125);
    CM_ASSERT(m.total_burned == 125);
    CM_ASSERT(m.circulating == 1'000);
    CM_ASSERT(m.remaining_supply == 0);
    CM_ASSERT(m.burn_ratio_bps == 1'111);
    CM_ASSERT(m.burned_by_source[static_cast<std::size_t>(BurnSource::Mining)] == 25);
  }

  // --- Emission stops at the cap and restarts when burns make room ---
  {
    testing::FakeWorld world;
    SeededEntropySource entropy(1);
    EngineConfig cfg = testing::scenario_config();
    cfg.emission.supply_cap = 500'000;
    cfg.vesting_duration_blocks = 0;
    Engine engine(cfg, world, world, entropy);

    const Id a = engine.register_agent(2);
    world.add(a, 2, 2'000);
    engine.on_equipment_changed(a);

    // 500 blocks would pay 800000 net; only 500000 fits.
    engine.set_block(500);
    CM_ASSERT(engine.pending_rewards(a) == 500'000);
    engine.touch();
    SupplyMetrics m = engine.supply_metrics();
    CM_ASSERT(m.circulating == 500'000);
    CM_ASSERT(m.remaining_supply == 0);
    CM_ASSERT(m.total_burned == 125'000);
    CM_ASSERT(m.total_minted == 625'000);
    CM_ASSERT(engine.emission_per_block() == 0);

    engine.set_block(1'000);
    engine.touch();
    CM_ASSERT(engine.supply_metrics().total_minted == 625'000);

    CM_ASSERT(engine.claim(a) == 500'000);
    const Id entry = engine.agent(a).vesting_entries.at(0);
    CM_ASSERT(engine.withdraw_vested(entry) == 500'000);
    CM_ASSERT(engine.balance_of(a) == 500'000);

    engine.burn_from_balance(a, 10'000, BurnSource::FacilityUpgrade);
    CM_ASSERT(engine.supply_metrics().remaining_supply == 10'000);
    CM_ASSERT(engine.emission_per_block() == 2'000);

    engine.set_block(1'010);
    engine.touch();
    m = engine.supply_metrics();
    CM_ASSERT(m.circulating == 500'000);
    CM_ASSERT(m.circulating <= m.supply_cap);
    CM_ASSERT(m.burned_by_source[static_cast<std::size_t>(BurnSource::FacilityUpgrade)] == 10'000);
  }

  // --- Conservation across many operations ---
  {
    testing::FakeWorld world;
    SeededEntropySource entropy(9);
    EngineConfig cfg = testing::scenario_config();
    cfg.vesting_duration_blocks = 1'000;
    Engine engine(cfg, world, world, entropy);

    std::vector<Id> ids;
    for (int i = 0; i < 6; ++i) {
      const Id id = engine.register_agent(static_cast<ZoneId>(i % 8));
      world.add(id, static_cast<ZoneId>(i % 8), 1'000 + 700 * static_cast<Hashrate>(i));
      engine.on_equipment_changed(id);
      ids.push_back(id);
    }

    for (int step = 1; step <= 40; ++step) {
      engine.advance_blocks(37);
      const Id who = ids[static_cast<std::size_t>(step) % ids.size()];
      switch (step % 4) {
        case 0:
          engine.claim(who);
          break;
        case 1:
          world.equipment[who][0].base_capacity += 250;
          engine.on_equipment_changed(who);
          break;
        case 2:
          for (Id e : engine.agent(who).vesting_entries) engine.withdraw_vested(e);
          break;
        default:
          engine.touch();
          break;
      }

      engine.touch();
      const EngineState s = engine.snapshot();
      const SupplyMetrics sm = s.ledger.metrics();
      CM_ASSERT(sm.circulating <= sm.supply_cap);
      CM_ASSERT(sum_balances(s) == sm.circulating);
      CM_ASSERT(s.accumulator.total_net_emission == sm.total_minted - sm.total_burned);

      // Everything owed to agents is backed by the net emission, up to per-agent rounding.
      Amount owed = 0;
      for (Id id : ids) owed += engine.agent(id).total_claimed + engine.pending_rewards(id);
      CM_ASSERT(owed <= s.accumulator.total_net_emission);
      CM_ASSERT(s.accumulator.total_net_emission - owed <= 40 * ids.size());
    }
  }

  return 0;
}
