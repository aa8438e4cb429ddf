#include "chaosmine/util/state_export.h"

#include <cstdint>
#include <string>

#include "chaosmine/core/enum_strings.h"
#include "chaosmine/core/events.h"
#include "chaosmine/util/json.h"
#include "chaosmine/util/sorted_keys.h"

namespace chaosmine {
namespace {

json::Value num(std::uint64_t v) { return json::integer(static_cast<std::int64_t>(v)); }

json::Value wide(util::u128 v) { return util::u128_to_string(v); }

json::Array zone_list(std::uint8_t mask, const EngineConfig* cfg) {
  json::Array out;
  for (int z = 0; z < kMaxZones; ++z) {
    const auto zone = static_cast<ZoneId>(z);
    if (!zone_in_mask(mask, zone)) continue;
    if (cfg && static_cast<std::size_t>(z) < cfg->zones.size()) {
      out.push_back(cfg->zones[z].name);
    } else {
      out.push_back(json::integer(z));
    }
  }
  return out;
}

json::Array agents_array(const EngineState& s) {
  json::Array out;
  out.reserve(s.agents.size());
  for (Id id : util::sorted_keys(s.agents)) {
    const Agent& a = s.agents.at(id);
    json::Object obj;
    obj["id"] = num(a.id);
    obj["effective_hashrate"] = num(a.effective_hashrate);
    obj["reward_debt"] = wide(a.reward_debt);
    obj["buffered_rewards"] = num(a.buffered_rewards);
    json::Array entries;
    for (Id e : a.vesting_entries) entries.push_back(num(e));
    obj["vesting_entries"] = std::move(entries);
    obj["total_claimed"] = num(a.total_claimed);
    obj["zone"] = json::integer(a.zone);
    obj["resilience_bps"] = json::integer(a.resilience_bps);
    json::Object shield;
    shield["last_absorption_bps"] = json::integer(a.shield.last_absorption_bps);
    shield["events_absorbed"] = num(a.shield.events_absorbed);
    obj["shield"] = std::move(shield);
    obj["pioneer_phase"] = json::integer(a.pioneer_phase);
    obj["registration_block"] = num(a.registration_block);
    obj["last_touch_block"] = num(a.last_touch_block);
    obj["active"] = a.active;
    out.push_back(std::move(obj));
  }
  return out;
}

json::Array events_array(const EngineState& s, const EngineConfig* cfg) {
  json::Array out;
  out.reserve(s.events.size());
  for (Id id : util::sorted_keys(s.events)) {
    const EventRecord& ev = s.events.at(id);
    json::Object obj;
    obj["id"] = num(ev.id);
    obj["type"] = event_type_to_string(ev.type);
    obj["severity_tier"] = json::integer(ev.severity_tier);
    obj["base_damage_bps"] = json::integer(ev.base_damage_bps);
    obj["origin_zone"] = json::integer(ev.origin_zone);
    obj["affected_zones_mask"] = json::integer(ev.affected_zones_mask);
    obj["affected_zones"] = zone_list(ev.affected_zones_mask, cfg);
    obj["trigger_block"] = num(ev.trigger_block);
    obj["triggered_by"] = num(ev.triggered_by);

    json::Array required;
    for (int z = 0; z < kMaxZones; ++z) {
      if (ev.required_shards[z] == 0 && ev.zone_population[z] == 0) continue;
      json::Object zo;
      zo["zone"] = json::integer(z);
      zo["population"] = num(ev.zone_population[z]);
      zo["shards"] = num(ev.required_shards[z]);
      required.push_back(std::move(zo));
    }
    obj["required_shards"] = std::move(required);

    json::Array done;
    for (const auto& [zone, shard] : ev.shard_processed) {
      json::Array pair;
      pair.push_back(json::integer(zone));
      pair.push_back(num(shard));
      done.push_back(std::move(pair));
    }
    obj["shard_processed"] = std::move(done);
    obj["processed"] = is_event_processed(ev);
    out.push_back(std::move(obj));
  }
  return out;
}

json::Object supply_object(const EngineState& s) {
  const auto& acc = s.accumulator;
  json::Object a;
  a["acc_reward_per_hash"] = wide(acc.acc_reward_per_hash);
  a["total_effective_hashrate"] = num(acc.total_effective_hashrate);
  a["last_update_block"] = num(acc.last_update_block);
  a["total_net_emission"] = num(acc.total_net_emission);
  a["total_emission_burned"] = num(acc.total_emission_burned);

  const SupplyMetrics m = s.ledger.metrics();
  json::Object ledger;
  ledger["supply_cap"] = num(m.supply_cap);
  ledger["total_minted"] = num(m.total_minted);
  ledger["total_burned"] = num(m.total_burned);
  ledger["circulating"] = num(m.circulating);
  ledger["remaining_supply"] = num(m.remaining_supply);
  ledger["burn_ratio_bps"] = json::integer(m.burn_ratio_bps);
  json::Object by_source;
  for (int i = 0; i < kBurnSourceCount; ++i) {
    by_source[burn_source_to_string(static_cast<BurnSource>(i))] = num(m.burned_by_source[i]);
  }
  ledger["burned_by_source"] = std::move(by_source);

  json::Array balances;
  const auto& b = s.ledger.balances();
  for (Id holder : util::sorted_keys(b)) {
    json::Object row;
    if (holder == TokenLedger::kRewardPool) {
      row["holder"] = std::string("reward_pool");
    } else {
      row["holder"] = num(holder);
    }
    row["balance"] = num(b.at(holder));
    balances.push_back(std::move(row));
  }
  ledger["balances"] = std::move(balances);

  json::Object out;
  out["accumulator"] = std::move(a);
  out["ledger"] = std::move(ledger);
  return out;
}

} // namespace

std::string agents_to_json(const EngineState& state) {
  return json::stringify(json::array(agents_array(state)), 2) + "\n";
}

std::string events_to_json(const EngineState& state, const EngineConfig* cfg) {
  return json::stringify(json::array(events_array(state, cfg)), 2) + "\n";
}

std::string supply_to_json(const EngineState& state) {
  return json::stringify(json::object(supply_object(state)), 2) + "\n";
}

std::string engine_state_to_json(const EngineState& state, const EngineConfig* cfg) {
  json::Object root = supply_object(state);
  root["current_block"] = num(state.current_block);
  root["active_agent_count"] = num(state.active_agent_count);
  root["last_event_block"] = num(state.last_event_block);
  root["next_agent_id"] = num(state.next_agent_id);
  root["next_vesting_id"] = num(state.next_vesting_id);
  root["next_event_id"] = num(state.next_event_id);
  root["agents"] = agents_array(state);
  root["events"] = events_array(state, cfg);

  json::Array vesting;
  for (Id id : util::sorted_keys(state.vesting)) {
    const VestingEntry& e = state.vesting.at(id);
    json::Object obj;
    obj["id"] = num(e.id);
    obj["agent_id"] = num(e.agent_id);
    obj["amount"] = num(e.amount);
    obj["start_block"] = num(e.start_block);
    obj["duration_blocks"] = num(e.duration_blocks);
    obj["claimed_so_far"] = num(e.claimed_so_far);
    vesting.push_back(std::move(obj));
  }
  root["vesting"] = std::move(vesting);
  return json::stringify(json::object(std::move(root)), 2) + "\n";
}

} // namespace chaosmine
