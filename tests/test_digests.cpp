#include <iostream>
#include <string>
#include <vector>

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

namespace {

// A short scripted history touching every part of the state.
chaosmine::EngineState run_history(std::uint64_t seed, chaosmine::Hashrate extra_capacity) {
  using namespace chaosmine;
  testing::FakeWorld world;
  SeededEntropySource entropy(seed);
  EngineConfig cfg = testing::scenario_config();
  cfg.vesting_duration_blocks = 400;
  Engine engine(cfg, world, world, entropy);

  std::vector<Id> ids;
  for (int i = 0; i < 5; ++i) {
    const ZoneId zone = static_cast<ZoneId>(i);
    const Id id = engine.register_agent(zone);
    world.add(id, zone, 1'500 + static_cast<Hashrate>(i) * 100 + (i == 4 ? extra_capacity : 0));
    engine.on_equipment_changed(id);
    ids.push_back(id);
  }

  engine.set_block(200);
  for (Id id : ids) engine.claim(id);
  const Id ev = engine.trigger_event(ids[0]);
  const EventRecord rec = engine.event(ev);
  for (int z = 0; z < kMaxZones; ++z) {
    for (std::uint32_t s = 0; s < rec.required_shards[z]; ++s) {
      engine.process_shard(ids[1], ev, static_cast<ZoneId>(z), s);
    }
  }
  engine.set_block(400);
  engine.withdraw_vested(engine.agent(ids[2]).vesting_entries.at(0));
  engine.touch();
  return engine.snapshot();
}

} // namespace

int test_digests() {
  using namespace chaosmine;

  // --- Engine state digest is a function of the history ---
  const std::uint64_t d1 = digest_engine_state64(run_history(17, 0));
  const std::uint64_t d2 = digest_engine_state64(run_history(17, 0));
  CM_ASSERT(d1 == d2);

  // A different rig changes the digest, and so do other event seeds.
  CM_ASSERT(digest_engine_state64(run_history(17, 1'000)) != d1);
  bool seed_matters = false;
  for (std::uint64_t seed = 18; seed < 22; ++seed) {
    if (digest_engine_state64(run_history(seed, 0)) != d1) seed_matters = true;
  }
  CM_ASSERT(seed_matters);

  // Single-field sensitivity.
  {
    EngineState s = run_history(17, 0);
    s.accumulator.acc_reward_per_hash += 1;
    CM_ASSERT(digest_engine_state64(s) != d1);
  }
  {
    EngineState s = run_history(17, 0);
    s.agents.begin()->second.buffered_rewards += 1;
    CM_ASSERT(digest_engine_state64(s) != d1);
  }
  {
    EngineState s = run_history(17, 0);
    s.ledger.mint(123, 1);
    CM_ASSERT(digest_engine_state64(s) != d1);
  }

  // --- Config digest ---
  const EngineConfig defaults;
  const std::uint64_t c1 = digest_engine_config64(defaults);
  CM_ASSERT(c1 == digest_engine_config64(EngineConfig{}));
  {
    EngineConfig changed;
    changed.zones[3].damage_multiplier_bps[1] += 1;
    CM_ASSERT(digest_engine_config64(changed) != c1);
  }
  {
    EngineConfig changed;
    changed.eras[0].name = "daybreak";
    CM_ASSERT(digest_engine_config64(changed) != c1);
  }

  // --- Hex format ---
  CM_ASSERT(digest64_to_hex(0) == "0000000000000000");
  CM_ASSERT(digest64_to_hex(0xDEADBEEFull) == "00000000deadbeef");
  CM_ASSERT(digest64_to_hex(c1).size() == 16);

  return 0;
}
