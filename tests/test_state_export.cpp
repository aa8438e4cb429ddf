#include <iostream>
#include <string>

#include "chaosmine/core/engine.h"
#include "chaosmine/util/fixed_point.h"
#include "chaosmine/util/json.h"
#include "chaosmine/util/state_export.h"
#include "fake_world.h"

#define CM_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

int test_state_export() {
  using namespace chaosmine;

  testing::FakeWorld world;
  SeededEntropySource entropy(8);
  EngineConfig cfg = testing::scenario_config();
  ZoneConfig only;
  only.name = "Dark Forest";
  cfg.zones = {only};
  Engine engine(cfg, world, world, entropy);

  const Id a = engine.register_agent(0);
  const Id b = engine.register_agent(0);
  world.add(a, 0, 2'000);
  world.add(b, 0, 2'000);
  engine.on_equipment_changed(a);
  engine.on_equipment_changed(b);

  engine.set_block(500);
  CM_ASSERT(engine.claim(a) > 0);
  const Id ev = engine.trigger_event(b);
  engine.process_shard(b, ev, 0, 0);

  const EngineState s = engine.snapshot();

  // --- Full state ---
  const std::string text = engine_state_to_json(s, &cfg);
  CM_ASSERT(!text.empty() && text.back() == '\n');
  const json::Value root = json::parse(text);
  CM_ASSERT(root.is_object());

  CM_ASSERT(root.at("current_block").uint_value() == 500);
  CM_ASSERT(root.at("active_agent_count").uint_value() == 2);
  CM_ASSERT(root.at("last_event_block").uint_value() == 500);
  CM_ASSERT(root.at("next_agent_id").uint_value() == 3);
  CM_ASSERT(root.at("next_vesting_id").uint_value() == 2);
  CM_ASSERT(root.at("next_event_id").uint_value() == 2);

  // 128-bit accumulator survives as a decimal string.
  const json::Value& acc = root.at("accumulator");
  CM_ASSERT(acc.at("acc_reward_per_hash").is_string());
  CM_ASSERT(util::u128_from_string(acc.at("acc_reward_per_hash").string_value()) ==
            s.accumulator.acc_reward_per_hash);
  CM_ASSERT(acc.at("total_effective_hashrate").uint_value() == s.accumulator.total_effective_hashrate);

  const json::Value& ledger = root.at("ledger");
  const SupplyMetrics m = s.ledger.metrics();
  CM_ASSERT(ledger.at("total_minted").uint_value() == m.total_minted);
  CM_ASSERT(ledger.at("circulating").uint_value() == m.circulating);
  CM_ASSERT(ledger.at("burned_by_source").at("mining").uint_value() == m.burned_by_source[0]);
  bool saw_pool = false;
  for (const auto& row : ledger.at("balances").array()) {
    if (row.at("holder").is_string()) {
      CM_ASSERT(row.at("holder").string_value() == "reward_pool");
      CM_ASSERT(row.at("balance").uint_value() == s.ledger.balance_of(TokenLedger::kRewardPool));
      saw_pool = true;
    }
  }
  CM_ASSERT(saw_pool);

  // Agents sorted by id.
  const json::Array& agents = root.at("agents").array();
  CM_ASSERT(agents.size() == 2);
  CM_ASSERT(agents[0].at("id").uint_value() == a);
  CM_ASSERT(agents[1].at("id").uint_value() == b);
  CM_ASSERT(agents[0].at("vesting_entries").array().size() == 1);
  CM_ASSERT(agents[0].at("total_claimed").uint_value() == s.agents.at(a).total_claimed);
  CM_ASSERT(agents[0].at("reward_debt").is_string());
  CM_ASSERT(agents[1].at("active").bool_value() == true);

  const json::Array& vesting = root.at("vesting").array();
  CM_ASSERT(vesting.size() == 1);
  CM_ASSERT(vesting[0].at("agent_id").uint_value() == a);
  CM_ASSERT(vesting[0].at("start_block").uint_value() == 500);

  // Events with resolved zone names and shard progress.
  const json::Array& events = root.at("events").array();
  CM_ASSERT(events.size() == 1);
  const json::Value& e0 = events[0];
  CM_ASSERT(e0.at("id").uint_value() == ev);
  CM_ASSERT(e0.at("affected_zones").array().size() == 1);
  CM_ASSERT(e0.at("affected_zones").at(0).string_value() == "Dark Forest");
  CM_ASSERT(e0.at("required_shards").at(0).at("population").uint_value() == 2);
  CM_ASSERT(e0.at("shard_processed").array().size() == 1);
  CM_ASSERT(e0.at("processed").bool_value() == true);

  // --- Without a config, zones are listed by index ---
  const json::Value bare = json::parse(events_to_json(s));
  CM_ASSERT(bare.at(0).at("affected_zones").at(0).int_value(-1) == 0);

  // --- Partial exports agree with the full one ---
  const json::Value agents_only = json::parse(agents_to_json(s));
  CM_ASSERT(agents_only.array().size() == 2);
  const json::Value supply = json::parse(supply_to_json(s));
  CM_ASSERT(supply.at("ledger").at("total_burned").uint_value() == m.total_burned);

  // Export is deterministic.
  CM_ASSERT(engine_state_to_json(engine.snapshot(), &cfg) == text);

  return 0;
}
