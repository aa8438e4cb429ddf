#include <iostream>

#include "chaosmine/core/accumulator.h"
#include "chaosmine/core/engine.h"
#include "chaosmine/util/digest.h"
#include "fake_world.h"

#define CM_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

int test_accumulator() {
  using namespace chaosmine;
  using util::kWad;

  // --- Pure accrual step ---
  {
    AccumulatorState acc;
    acc.total_effective_hashrate = 1'000;

    const AccrualStep step = compute_accrual(acc, 500, 1'000'000, 2'000, 1'000'000'000);
    CM_ASSERT(step.elapsed == 500);
    CM_ASSERT(step.gross == 1'000'000);
    CM_ASSERT(step.burn == 200'000);
    CM_ASSERT(step.net == 800'000);
    CM_ASSERT(step.acc_delta == 800 * kWad);
    CM_ASSERT(!step.clamped && !step.skipped);

    apply_accrual(acc, step, 500);
    CM_ASSERT(acc.last_update_block == 500);
    CM_ASSERT(acc.total_net_emission == 800'000);
    CM_ASSERT(acc.total_emission_burned == 200'000);
    CM_ASSERT(pending_reward(acc.acc_reward_per_hash, 0, 1'000) == 800'000);
    CM_ASSERT(pending_reward(acc.acc_reward_per_hash, acc.acc_reward_per_hash, 1'000) == 0);

    // Same block: nothing to do.
    const AccrualStep again = compute_accrual(acc, 500, 1'000'000, 2'000, 1'000'000'000);
    CM_ASSERT(again.elapsed == 0 && again.net == 0 && again.acc_delta == 0);

    // Floored to the remaining supply, burn rescaled to keep the 20% ratio.
    const AccrualStep floored = compute_accrual(acc, 600, 200'000, 2'000, 100);
    CM_ASSERT(floored.clamped);
    CM_ASSERT(floored.net == 100);
    CM_ASSERT(floored.burn == 25);
    CM_ASSERT(floored.gross == 125);
  }

  // Nobody holds hashrate: the window is skipped, nothing is minted.
  {
    AccumulatorState acc;
    const AccrualStep step = compute_accrual(acc, 100, 200'000, 2'000, 1'000'000'000);
    CM_ASSERT(step.skipped);
    CM_ASSERT(step.elapsed == 100);
    CM_ASSERT(step.gross == 0 && step.acc_delta == 0);
    apply_accrual(acc, step, 100);
    CM_ASSERT(acc.last_update_block == 100);
    CM_ASSERT(acc.acc_reward_per_hash == 0);
  }

  // --- Scenario: sole agent, 1000 hashrate, 100 per block at 20x, 500 blocks ---
  {
    testing::FakeWorld world;
    SeededEntropySource entropy(7);
    Engine engine(testing::scenario_config(), world, world, entropy);

    const Id a = engine.register_agent(2);
    // 2000 base, neutral zone, and a sole agent pays the full 50% dominance tax.
    world.add(a, 2, 2'000);
    CM_ASSERT(engine.on_equipment_changed(a) == 1'000);
    CM_ASSERT(engine.emission_per_block() == 2'000);

    engine.set_block(500);
    CM_ASSERT(engine.pending_rewards(a) == 800'000);
    // pending_rewards only previews.
    CM_ASSERT(engine.accumulator().acc_reward_per_hash == 0);

    engine.touch();
    CM_ASSERT(engine.accumulator().acc_reward_per_hash == 800 * kWad);

    // Idempotent touch.
    const auto before = digest_engine_state64(engine.snapshot());
    engine.touch();
    engine.touch();
    CM_ASSERT(digest_engine_state64(engine.snapshot()) == before);

    CM_ASSERT(engine.claim(a) == 800'000);
    CM_ASSERT(engine.pending_rewards(a) == 0);
    CM_ASSERT(engine.agent(a).total_claimed == 800'000);
    CM_ASSERT(engine.supply_metrics().burned_by_source[static_cast<std::size_t>(BurnSource::Mining)] == 200'000);
  }

  // --- A hashrate change settles at the current accumulator ---
  {
    testing::FakeWorld world;
    SeededEntropySource entropy(7);
    Engine engine(testing::scenario_config(), world, world, entropy);

    const Id a = engine.register_agent(2);
    const Id b = engine.register_agent(2);
    world.add(a, 2, 1'000);
    world.add(b, 2, 1'000);
    engine.on_equipment_changed(a);
    engine.on_equipment_changed(b);

    engine.set_block(100);
    const Amount before = engine.pending_rewards(b);
    CM_ASSERT(before > 0);

    // Increase: nothing retroactive.
    world.equipment[b] = {EquipmentUnit{5'000, 0, 10'000}};
    const Hashrate raised = engine.on_equipment_changed(b);
    CM_ASSERT(raised > engine.effective_hashrate(a));
    CM_ASSERT(engine.pending_rewards(b) == before);

    // Decrease to nothing: nothing earned is lost.
    world.equipment[b].clear();
    CM_ASSERT(engine.on_equipment_changed(b) == 0);
    CM_ASSERT(engine.pending_rewards(b) == before);
    CM_ASSERT(engine.agent(b).buffered_rewards == before);

    // With zero hashrate b earns nothing further.
    engine.set_block(300);
    CM_ASSERT(engine.pending_rewards(b) == before);
    CM_ASSERT(engine.claim(b) == before);
  }

  // --- Accrual across a halving boundary does not depend on touch timing ---
  {
    EngineConfig cfg = testing::scenario_config();
    cfg.emission.initial_max_per_block = 2'000;
    cfg.emission.halving_interval_blocks = 1'000;

    testing::FakeWorld w1;
    testing::FakeWorld w2;
    SeededEntropySource e1(7);
    SeededEntropySource e2(7);
    Engine split(cfg, w1, w1, e1);
    Engine whole(cfg, w2, w2, e2);
    const Id a = split.register_agent(2);
    CM_ASSERT(whole.register_agent(2) == a);
    w1.add(a, 2, 2'000);
    w2.add(a, 2, 2'000);
    split.on_equipment_changed(a);
    whole.on_equipment_changed(a);

    split.set_block(999);
    split.touch();
    split.set_block(1'001);
    whole.set_block(1'001);
    // 1000 blocks at 2000 and one at 1000, 80% net after burn-on-earn.
    CM_ASSERT(whole.pending_rewards(a) == 1'600'800);
    CM_ASSERT(split.pending_rewards(a) == 1'600'800);
    split.touch();
    whole.touch();
    CM_ASSERT(split.accumulator().acc_reward_per_hash == whole.accumulator().acc_reward_per_hash);
    CM_ASSERT(digest_engine_state64(split.snapshot()) == digest_engine_state64(whole.snapshot()));
    CM_ASSERT(whole.emission_per_block() == 1'000);
  }

  // --- Accrual across an era change ---
  {
    EngineConfig cfg = testing::scenario_config();
    EraConfig early = cfg.eras[0];
    early.name = "early";
    early.duration_blocks = 100;
    early.reward_modifier_bps = 300'000;
    EraConfig late = cfg.eras[0];
    late.name = "late";
    late.reward_modifier_bps = 200'000;
    cfg.eras = {early, late};

    testing::FakeWorld w1;
    testing::FakeWorld w2;
    SeededEntropySource e1(7);
    SeededEntropySource e2(7);
    Engine stepped(cfg, w1, w1, e1);
    Engine once(cfg, w2, w2, e2);
    const Id a = stepped.register_agent(2);
    once.register_agent(2);
    w1.add(a, 2, 2'000);
    w2.add(a, 2, 2'000);
    stepped.on_equipment_changed(a);
    once.on_equipment_changed(a);
    CM_ASSERT(once.emission_per_block() == 3'000);

    for (BlockNumber b : {37, 100, 121, 150}) {
      stepped.set_block(b);
      stepped.touch();
    }
    once.set_block(150);
    once.touch();
    CM_ASSERT(once.current_era() == 1);
    CM_ASSERT(once.emission_per_block() == 2'000);
    // 100 blocks at 3000 and 50 at 2000.
    CM_ASSERT(once.accumulator().total_net_emission == 320'000);
    CM_ASSERT(stepped.accumulator().acc_reward_per_hash == once.accumulator().acc_reward_per_hash);
    CM_ASSERT(stepped.pending_rewards(a) == 320'000);
    CM_ASSERT(once.pending_rewards(a) == 320'000);
  }

  return 0;
}
