#include "chaosmine/core/config_io.h"

#include <functional>
#include <limits>
#include <sstream>
#include <unordered_map>
#include <unordered_set>
#include <utility>

#include "chaosmine/core/enum_strings.h"
#include "chaosmine/core/errors.h"
#include "chaosmine/util/file_io.h"
#include "chaosmine/util/log.h"

namespace chaosmine {
namespace {

using json::Array;
using json::Object;
using json::Value;

template <typename... Parts>
std::string join(Parts&&... parts) {
  std::ostringstream ss;
  (ss << ... << std::forward<Parts>(parts));
  return ss.str();
}

[[noreturn]] void bad(const std::string& where, const std::string& msg) {
  throw EngineError(ErrorCode::InvalidConfig, where + ": " + msg);
}

std::uint64_t get_u64(const Value& v, const std::string& where) {
  if (!v.is_integer()) bad(where, "expected a non-negative integer");
  if (v.int_value() < 0) bad(where, "must be non-negative");
  return static_cast<std::uint64_t>(v.int_value());
}

std::int64_t get_i64(const Value& v, const std::string& where) {
  if (!v.is_integer()) bad(where, "expected an integer");
  return v.int_value();
}

int get_int(const Value& v, const std::string& where) {
  const std::int64_t i = get_i64(v, where);
  if (i < std::numeric_limits<int>::min() || i > std::numeric_limits<int>::max()) bad(where, "out of range");
  return static_cast<int>(i);
}

const Object& get_object(const Value& v, const std::string& where) {
  if (!v.is_object()) bad(where, "expected an object");
  return v.object();
}

const Array& get_array(const Value& v, const std::string& where) {
  if (!v.is_array()) bad(where, "expected an array");
  return v.array();
}

// Applies every known key through `handlers`; unknown keys are logged, not fatal,
// so newer config files still load on older builds.
template <typename Handlers>
void apply_keys(const Object& o, const std::string& where, const Handlers& handlers) {
  for (const auto& [key, value] : o) {
    const auto it = handlers.find(key);
    if (it == handlers.end()) {
      log::warn(join("config: ignoring unknown key '", where, ".", key, "'"));
      continue;
    }
    it->second(value, where + "." + key);
  }
}

using Handler = std::function<void(const Value&, const std::string&)>;
using HandlerMap = std::unordered_map<std::string, Handler>;

Handler u64_field(std::uint64_t& out) {
  return [&out](const Value& v, const std::string& w) { out = get_u64(v, w); };
}

Handler i64_field(std::int64_t& out) {
  return [&out](const Value& v, const std::string& w) { out = get_i64(v, w); };
}

Handler int_field(int& out) {
  return [&out](const Value& v, const std::string& w) { out = get_int(v, w); };
}

Handler u32_field(std::uint32_t& out) {
  return [&out](const Value& v, const std::string& w) {
    const std::uint64_t u = get_u64(v, w);
    if (u > std::numeric_limits<std::uint32_t>::max()) bad(w, "out of range");
    out = static_cast<std::uint32_t>(u);
  };
}

QuirkDef quirk_from_json(const Value& v, const std::string& where) {
  QuirkDef q;
  std::uint32_t mask = 0;
  HandlerMap h{
      {"id", u32_field(q.id)},
      {"name", [&q](const Value& x, const std::string& w) {
         if (!x.is_string()) bad(w, "expected a string");
         q.name = x.string_value();
       }},
      {"default_bps", i64_field(q.default_bps)},
      {"zone_mask", u32_field(mask)},
      {"in_zone_bps", i64_field(q.in_zone_bps)},
      {"min_era", int_field(q.min_era)},
      {"era_bps", i64_field(q.era_bps)},
      {"pooled_bps", i64_field(q.pooled_bps)},
  };
  apply_keys(get_object(v, where), where, h);
  if (mask > 0xFF) bad(where + ".zone_mask", "must fit in 8 bits");
  q.zone_mask = static_cast<std::uint8_t>(mask);
  return q;
}

EraConfig era_from_json(const Value& v, const std::string& where) {
  EraConfig e;
  HandlerMap h{
      {"name", [&e](const Value& x, const std::string& w) {
         if (!x.is_string()) bad(w, "expected a string");
         e.name = x.string_value();
       }},
      {"duration_blocks", u64_field(e.duration_blocks)},
      {"reward_modifier_bps", i64_field(e.reward_modifier_bps)},
      {"max_event_tier", int_field(e.max_event_tier)},
      {"event_cooldown_blocks", u64_field(e.event_cooldown_blocks)},
  };
  apply_keys(get_object(v, where), where, h);
  return e;
}

ZoneConfig zone_from_json(const Value& v, const std::string& where) {
  ZoneConfig z;
  HandlerMap h{
      {"name", [&z](const Value& x, const std::string& w) {
         if (!x.is_string()) bad(w, "expected a string");
         z.name = x.string_value();
       }},
      {"mining_modifier_bps", i64_field(z.mining_modifier_bps)},
      {"resilience_modifier_bps", i64_field(z.resilience_modifier_bps)},
      {"damage_multiplier_bps", [&z](const Value& x, const std::string& w) {
         for (const auto& [type_name, mult] : get_object(x, w)) {
           const auto type = event_type_from_string(type_name);
           if (!type) bad(w, "unknown event type '" + type_name + "'");
           z.damage_multiplier_bps[static_cast<std::size_t>(*type)] = get_i64(mult, w + "." + type_name);
         }
       }},
  };
  apply_keys(get_object(v, where), where, h);
  return z;
}

template <typename T, typename Fn>
std::vector<T> array_of(const Value& v, const std::string& where, Fn fn) {
  std::vector<T> out;
  const auto& a = get_array(v, where);
  out.reserve(a.size());
  for (std::size_t i = 0; i < a.size(); ++i) out.push_back(fn(a[i], join(where, "[", i, "]")));
  return out;
}

Value quirk_to_json(const QuirkDef& q) {
  Object o;
  o["id"] = json::integer(q.id);
  o["name"] = q.name;
  o["default_bps"] = json::integer(q.default_bps);
  o["zone_mask"] = json::integer(q.zone_mask);
  o["in_zone_bps"] = json::integer(q.in_zone_bps);
  o["min_era"] = json::integer(q.min_era);
  o["era_bps"] = json::integer(q.era_bps);
  o["pooled_bps"] = json::integer(q.pooled_bps);
  return o;
}

Value era_to_json(const EraConfig& e) {
  Object o;
  o["name"] = e.name;
  o["duration_blocks"] = json::integer(static_cast<std::int64_t>(e.duration_blocks));
  o["reward_modifier_bps"] = json::integer(e.reward_modifier_bps);
  o["max_event_tier"] = json::integer(e.max_event_tier);
  o["event_cooldown_blocks"] = json::integer(static_cast<std::int64_t>(e.event_cooldown_blocks));
  return o;
}

Value zone_to_json(const ZoneConfig& z) {
  Object mult;
  for (int t = 0; t < kEventTypeCount; ++t) {
    mult[event_type_to_string(static_cast<EventType>(t))] = json::integer(z.damage_multiplier_bps[t]);
  }
  Object o;
  o["name"] = z.name;
  o["mining_modifier_bps"] = json::integer(z.mining_modifier_bps);
  o["resilience_modifier_bps"] = json::integer(z.resilience_modifier_bps);
  o["damage_multiplier_bps"] = std::move(mult);
  return o;
}

bool in_bps_range(std::int64_t v) { return v >= 0 && v <= 10'000; }

} // namespace

std::vector<std::string> validate_engine_config(const EngineConfig& cfg) {
  std::vector<std::string> errors;
  auto push = [&errors](auto&&... parts) { errors.push_back(join(parts...)); };

  const auto& em = cfg.emission;
  if (em.blocks_per_day == 0) push("emission.blocks_per_day must be > 0");
  if (em.genesis_population == 0) push("emission.genesis_population must be > 0");
  if (em.genesis_multiplier_bps < 10'000) push("emission.genesis_multiplier_bps must be >= 10000");
  if (em.halving_interval_blocks == 0) push("emission.halving_interval_blocks must be > 0");
  if (em.supply_cap == 0 || em.supply_cap > static_cast<Amount>(std::numeric_limits<std::int64_t>::max())) {
    push("emission.supply_cap must be in (0, 2^63)");
  }
  if (em.burn_on_earn_bps < 0 || em.burn_on_earn_bps >= 10'000) push("emission.burn_on_earn_bps must be in [0, 10000)");

  const auto& cap = cfg.capacity;
  if (cap.unit_cap_multiplier < 1) push("capacity.unit_cap_multiplier must be >= 1");
  if (cap.pool_base_bonus_bps < 0 || cap.pool_homogeneous_bonus_bps < 0 || cap.pool_loyalty_bonus_bps < 0) {
    push("capacity pool bonuses must be non-negative");
  }
  if (cap.pool_decay_start_share_bps < 0 || cap.pool_decay_start_share_bps >= cap.pool_decay_end_share_bps) {
    push("capacity.pool_decay_start_share_bps must be in [0, pool_decay_end_share_bps)");
  }
  if (cap.pool_overshare_full_penalty_share_bps <= cap.pool_decay_end_share_bps) {
    push("capacity.pool_overshare_full_penalty_share_bps must exceed pool_decay_end_share_bps");
  }
  if (!in_bps_range(cap.pool_overshare_penalty_max_bps)) push("capacity.pool_overshare_penalty_max_bps out of range");
  if (cap.dominance_tax_start_share_bps < 0 || cap.dominance_tax_start_share_bps >= cap.dominance_tax_full_share_bps) {
    push("capacity.dominance_tax_start_share_bps must be in [0, dominance_tax_full_share_bps)");
  }
  if (!in_bps_range(cap.dominance_tax_max_bps)) push("capacity.dominance_tax_max_bps out of range");
  std::unordered_set<std::uint32_t> quirk_ids;
  for (const auto& q : cap.quirks) {
    if (q.id == 0) push("capacity.quirks: id 0 is reserved for 'no quirk'");
    if (!quirk_ids.insert(q.id).second) push("capacity.quirks: duplicate id ", q.id);
    if (q.default_bps <= 0 || q.in_zone_bps <= 0 || q.era_bps <= 0 || q.pooled_bps < 0) {
      push("capacity.quirks[", q.id, "]: multipliers must be positive");
    }
  }

  const auto& ev = cfg.events;
  if (ev.shard_size == 0) push("events.shard_size must be > 0");
  if (ev.min_phase_for_events < 0) push("events.min_phase_for_events must be >= 0");
  if (ev.tier_base_damage_bps.empty()) push("events.tier_base_damage_bps must not be empty");
  for (std::int64_t d : ev.tier_base_damage_bps) {
    if (!in_bps_range(d)) push("events.tier_base_damage_bps entries must be in [0, 10000]");
  }
  if (!in_bps_range(ev.max_combined_reduction_bps)) push("events.max_combined_reduction_bps out of range");

  if (cfg.eras.empty()) push("eras must not be empty");
  for (std::size_t i = 0; i < cfg.eras.size(); ++i) {
    const auto& e = cfg.eras[i];
    if (i + 1 < cfg.eras.size() && e.duration_blocks == 0) push("eras[", i, "]: duration_blocks must be > 0");
    if (e.reward_modifier_bps < 0) push("eras[", i, "]: reward_modifier_bps must be >= 0");
    if (e.max_event_tier < 1 || static_cast<std::size_t>(e.max_event_tier) > ev.tier_base_damage_bps.size()) {
      push("eras[", i, "]: max_event_tier must be in [1, ", ev.tier_base_damage_bps.size(), "]");
    }
  }

  if (cfg.zones.empty() || cfg.zones.size() > static_cast<std::size_t>(kMaxZones)) {
    push("zones must have between 1 and ", kMaxZones, " entries");
  }
  for (std::size_t i = 0; i < cfg.zones.size(); ++i) {
    for (std::int64_t m : cfg.zones[i].damage_multiplier_bps) {
      if (m < 0) push("zones[", i, "]: damage multipliers must be non-negative");
    }
  }

  if (cfg.phase_thresholds.empty() || cfg.phase_thresholds.front() != 0) {
    push("phase_thresholds must start with 0");
  }
  for (std::size_t i = 1; i < cfg.phase_thresholds.size(); ++i) {
    if (cfg.phase_thresholds[i] <= cfg.phase_thresholds[i - 1]) push("phase_thresholds must be strictly increasing");
  }

  if (!in_bps_range(cfg.base_resilience_bps)) push("base_resilience_bps out of range");
  if (!in_bps_range(cfg.early_claim_penalty_bps)) push("early_claim_penalty_bps out of range");

  return errors;
}

EngineConfig engine_config_from_json(const Value& doc, const EngineConfig& base) {
  EngineConfig cfg = base;
  auto& em = cfg.emission;
  auto& cap = cfg.capacity;
  auto& ev = cfg.events;

  const HandlerMap emission_keys{
      {"target_daily_per_agent", u64_field(em.target_daily_per_agent)},
      {"blocks_per_day", u64_field(em.blocks_per_day)},
      {"genesis_multiplier_bps", i64_field(em.genesis_multiplier_bps)},
      {"genesis_population", u64_field(em.genesis_population)},
      {"initial_max_per_block", u64_field(em.initial_max_per_block)},
      {"halving_interval_blocks", u64_field(em.halving_interval_blocks)},
      {"supply_cap", u64_field(em.supply_cap)},
      {"burn_on_earn_bps", i64_field(em.burn_on_earn_bps)},
  };

  const HandlerMap capacity_keys{
      {"quirks", [&cap](const Value& v, const std::string& w) { cap.quirks = array_of<QuirkDef>(v, w, quirk_from_json); }},
      {"unit_cap_multiplier", i64_field(cap.unit_cap_multiplier)},
      {"pool_base_bonus_bps", i64_field(cap.pool_base_bonus_bps)},
      {"pool_homogeneous_bonus_bps", i64_field(cap.pool_homogeneous_bonus_bps)},
      {"pool_loyalty_bonus_bps", i64_field(cap.pool_loyalty_bonus_bps)},
      {"pool_loyalty_tenure_blocks", u64_field(cap.pool_loyalty_tenure_blocks)},
      {"pool_decay_start_share_bps", i64_field(cap.pool_decay_start_share_bps)},
      {"pool_decay_end_share_bps", i64_field(cap.pool_decay_end_share_bps)},
      {"pool_overshare_penalty_max_bps", i64_field(cap.pool_overshare_penalty_max_bps)},
      {"pool_overshare_full_penalty_share_bps", i64_field(cap.pool_overshare_full_penalty_share_bps)},
      {"dominance_tax_start_share_bps", i64_field(cap.dominance_tax_start_share_bps)},
      {"dominance_tax_full_share_bps", i64_field(cap.dominance_tax_full_share_bps)},
      {"dominance_tax_max_bps", i64_field(cap.dominance_tax_max_bps)},
      {"pioneer_bonus_by_phase", [&cap](const Value& v, const std::string& w) {
         cap.pioneer_bonus_by_phase = array_of<Hashrate>(v, w, get_u64);
       }},
  };

  const HandlerMap event_keys{
      {"shard_size", u32_field(ev.shard_size)},
      {"min_phase_for_events", int_field(ev.min_phase_for_events)},
      {"events_unlock_minted", u64_field(ev.events_unlock_minted)},
      {"trigger_bounty", u64_field(ev.trigger_bounty)},
      {"process_bounty_per_agent", u64_field(ev.process_bounty_per_agent)},
      {"tier_base_damage_bps", [&ev](const Value& v, const std::string& w) {
         ev.tier_base_damage_bps = array_of<std::int64_t>(v, w, get_i64);
       }},
      {"max_combined_reduction_bps", i64_field(ev.max_combined_reduction_bps)},
  };

  const HandlerMap root_keys{
      {"genesis_block", u64_field(cfg.genesis_block)},
      {"emission", [&](const Value& v, const std::string& w) { apply_keys(get_object(v, w), w, emission_keys); }},
      {"capacity", [&](const Value& v, const std::string& w) { apply_keys(get_object(v, w), w, capacity_keys); }},
      {"events", [&](const Value& v, const std::string& w) { apply_keys(get_object(v, w), w, event_keys); }},
      {"eras", [&cfg](const Value& v, const std::string& w) { cfg.eras = array_of<EraConfig>(v, w, era_from_json); }},
      {"zones", [&cfg](const Value& v, const std::string& w) { cfg.zones = array_of<ZoneConfig>(v, w, zone_from_json); }},
      {"phase_thresholds", [&cfg](const Value& v, const std::string& w) {
         cfg.phase_thresholds = array_of<std::uint64_t>(v, w, get_u64);
       }},
      {"first_mine_delay_blocks", u64_field(cfg.first_mine_delay_blocks)},
      {"silence_window_blocks", u64_field(cfg.silence_window_blocks)},
      {"base_resilience_bps", i64_field(cfg.base_resilience_bps)},
      {"vesting_duration_blocks", u64_field(cfg.vesting_duration_blocks)},
      {"early_claim_penalty_bps", i64_field(cfg.early_claim_penalty_bps)},
  };

  apply_keys(get_object(doc, "config"), "config", root_keys);

  const auto errors = validate_engine_config(cfg);
  if (!errors.empty()) {
    std::string msg = errors.front();
    if (errors.size() > 1) msg += join(" (+", errors.size() - 1, " more)");
    throw EngineError(ErrorCode::InvalidConfig, msg);
  }
  return cfg;
}

EngineConfig engine_config_from_json_text(const std::string& text, const EngineConfig& base) {
  Value doc;
  try {
    doc = json::parse(text);
  } catch (const std::runtime_error& e) {
    throw EngineError(ErrorCode::InvalidConfig, e.what());
  }
  return engine_config_from_json(doc, base);
}

EngineConfig load_engine_config_file(const std::string& path) {
  const std::string text = read_text_file(path);
  log::debug("config: loading " + path);
  return engine_config_from_json_text(text);
}

Value engine_config_to_json(const EngineConfig& cfg) {
  const auto i64 = [](std::uint64_t v) { return json::integer(static_cast<std::int64_t>(v)); };

  Object em;
  em["target_daily_per_agent"] = i64(cfg.emission.target_daily_per_agent);
  em["blocks_per_day"] = i64(cfg.emission.blocks_per_day);
  em["genesis_multiplier_bps"] = json::integer(cfg.emission.genesis_multiplier_bps);
  em["genesis_population"] = i64(cfg.emission.genesis_population);
  em["initial_max_per_block"] = i64(cfg.emission.initial_max_per_block);
  em["halving_interval_blocks"] = i64(cfg.emission.halving_interval_blocks);
  em["supply_cap"] = i64(cfg.emission.supply_cap);
  em["burn_on_earn_bps"] = json::integer(cfg.emission.burn_on_earn_bps);

  const auto& c = cfg.capacity;
  Object cap;
  Array quirks;
  for (const auto& q : c.quirks) quirks.push_back(quirk_to_json(q));
  cap["quirks"] = std::move(quirks);
  cap["unit_cap_multiplier"] = json::integer(c.unit_cap_multiplier);
  cap["pool_base_bonus_bps"] = json::integer(c.pool_base_bonus_bps);
  cap["pool_homogeneous_bonus_bps"] = json::integer(c.pool_homogeneous_bonus_bps);
  cap["pool_loyalty_bonus_bps"] = json::integer(c.pool_loyalty_bonus_bps);
  cap["pool_loyalty_tenure_blocks"] = i64(c.pool_loyalty_tenure_blocks);
  cap["pool_decay_start_share_bps"] = json::integer(c.pool_decay_start_share_bps);
  cap["pool_decay_end_share_bps"] = json::integer(c.pool_decay_end_share_bps);
  cap["pool_overshare_penalty_max_bps"] = json::integer(c.pool_overshare_penalty_max_bps);
  cap["pool_overshare_full_penalty_share_bps"] = json::integer(c.pool_overshare_full_penalty_share_bps);
  cap["dominance_tax_start_share_bps"] = json::integer(c.dominance_tax_start_share_bps);
  cap["dominance_tax_full_share_bps"] = json::integer(c.dominance_tax_full_share_bps);
  cap["dominance_tax_max_bps"] = json::integer(c.dominance_tax_max_bps);
  Array pioneer;
  for (Hashrate h : c.pioneer_bonus_by_phase) pioneer.push_back(i64(h));
  cap["pioneer_bonus_by_phase"] = std::move(pioneer);

  Object ev;
  ev["shard_size"] = json::integer(cfg.events.shard_size);
  ev["min_phase_for_events"] = json::integer(cfg.events.min_phase_for_events);
  ev["events_unlock_minted"] = i64(cfg.events.events_unlock_minted);
  ev["trigger_bounty"] = i64(cfg.events.trigger_bounty);
  ev["process_bounty_per_agent"] = i64(cfg.events.process_bounty_per_agent);
  Array tiers;
  for (std::int64_t d : cfg.events.tier_base_damage_bps) tiers.push_back(json::integer(d));
  ev["tier_base_damage_bps"] = std::move(tiers);
  ev["max_combined_reduction_bps"] = json::integer(cfg.events.max_combined_reduction_bps);

  Array eras;
  for (const auto& e : cfg.eras) eras.push_back(era_to_json(e));
  Array zones;
  for (const auto& z : cfg.zones) zones.push_back(zone_to_json(z));
  Array phases;
  for (std::uint64_t t : cfg.phase_thresholds) phases.push_back(i64(t));

  Object root;
  root["genesis_block"] = i64(cfg.genesis_block);
  root["emission"] = std::move(em);
  root["capacity"] = std::move(cap);
  root["events"] = std::move(ev);
  root["eras"] = std::move(eras);
  root["zones"] = std::move(zones);
  root["phase_thresholds"] = std::move(phases);
  root["first_mine_delay_blocks"] = i64(cfg.first_mine_delay_blocks);
  root["silence_window_blocks"] = i64(cfg.silence_window_blocks);
  root["base_resilience_bps"] = json::integer(cfg.base_resilience_bps);
  root["vesting_duration_blocks"] = i64(cfg.vesting_duration_blocks);
  root["early_claim_penalty_bps"] = json::integer(cfg.early_claim_penalty_bps);
  return root;
}

void save_engine_config_file(const std::string& path, const EngineConfig& cfg) {
  write_text_file(path, json::stringify(engine_config_to_json(cfg), 2) + "\n");
  log::debug("config: saved " + path);
}

} // namespace chaosmine
