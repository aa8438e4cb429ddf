#include "chaosmine/core/engine.h"

#include <algorithm>
#include <exception>
#include <limits>
#include <string>
#include <utility>

#include "chaosmine/core/config_io.h"
#include "chaosmine/core/emission.h"
#include "chaosmine/core/enum_strings.h"
#include "chaosmine/core/era.h"
#include "chaosmine/core/events.h"
#include "chaosmine/core/vesting.h"
#include "chaosmine/util/fixed_point.h"
#include "chaosmine/util/log.h"

namespace chaosmine {
namespace {

std::string zone_str(ZoneId z) { return std::to_string(static_cast<int>(z)); }

[[noreturn]] void not_found(ErrorCode code, const char* what, Id id) {
  throw EngineError(code, std::string(what) + " " + std::to_string(id));
}

} // namespace

Engine::Engine(EngineConfig cfg, EquipmentSource& equipment, ZoneRoster& roster, const EntropySource& entropy)
    : cfg_(std::move(cfg)), equipment_(equipment), roster_(roster), entropy_(entropy) {
  const auto issues = validate_engine_config(cfg_);
  if (!issues.empty()) {
    std::string msg;
    for (const auto& i : issues) {
      if (!msg.empty()) msg += "; ";
      msg += i;
    }
    throw EngineError(ErrorCode::InvalidConfig, msg);
  }

  state_.ledger = TokenLedger(cfg_.emission.supply_cap);
  state_.current_block = cfg_.genesis_block;
  state_.accumulator.last_update_block = cfg_.genesis_block;
  state_.last_event_block = cfg_.genesis_block;
}

// --- Block clock ---

void Engine::set_block(BlockNumber block) {
  std::lock_guard<std::mutex> lock(mu_);
  if (block < state_.current_block) {
    throw EngineError(ErrorCode::BlockRegression,
                      "block " + std::to_string(block) + " is behind " + std::to_string(state_.current_block));
  }
  state_.current_block = block;
}

void Engine::advance_blocks(BlockNumber n) {
  std::lock_guard<std::mutex> lock(mu_);
  if (n > std::numeric_limits<BlockNumber>::max() - state_.current_block) {
    throw EngineError(ErrorCode::BlockRegression, "advancing " + std::to_string(n) + " blocks from " +
                                                      std::to_string(state_.current_block) + " overflows");
  }
  state_.current_block += n;
}

BlockNumber Engine::current_block() const {
  std::lock_guard<std::mutex> lock(mu_);
  return state_.current_block;
}

// --- Internal lookups ---

BlockNumber Engine::blocks_since_genesis_locked() const {
  return state_.current_block > cfg_.genesis_block ? state_.current_block - cfg_.genesis_block : 0;
}

std::size_t Engine::current_era_locked() const { return era_index_at(cfg_.eras, blocks_since_genesis_locked()); }

int Engine::current_phase_locked() const {
  return phase_for_population(cfg_.phase_thresholds, state_.active_agent_count);
}

Amount Engine::emission_per_block_locked() const {
  EmissionInputs in;
  in.active_agents = state_.active_agent_count;
  in.era_modifier_bps = cfg_.eras[current_era_locked()].reward_modifier_bps;
  in.blocks_since_genesis = blocks_since_genesis_locked();
  in.current_supply = state_.ledger.circulating();
  return compute_emission_per_block(cfg_.emission, in);
}

Amount Engine::window_emission_locked() const {
  const BlockNumber g = cfg_.genesis_block;
  const BlockNumber from = state_.accumulator.last_update_block;
  const BlockNumber to = state_.current_block;
  return compute_window_emission(cfg_.emission, cfg_.eras, state_.active_agent_count, state_.ledger.circulating(),
                                 from > g ? from - g : 0, to > g ? to - g : 0);
}

Agent& Engine::agent_locked(Id agent) {
  auto it = state_.agents.find(agent);
  if (it == state_.agents.end()) not_found(ErrorCode::AgentNotFound, "agent", agent);
  return it->second;
}

const Agent& Engine::agent_locked(Id agent) const {
  auto it = state_.agents.find(agent);
  if (it == state_.agents.end()) not_found(ErrorCode::AgentNotFound, "agent", agent);
  return it->second;
}

VestingEntry& Engine::entry_locked(Id entry) {
  auto it = state_.vesting.find(entry);
  if (it == state_.vesting.end()) not_found(ErrorCode::VestingEntryNotFound, "vesting entry", entry);
  return it->second;
}

const VestingEntry& Engine::entry_locked(Id entry) const {
  auto it = state_.vesting.find(entry);
  if (it == state_.vesting.end()) not_found(ErrorCode::VestingEntryNotFound, "vesting entry", entry);
  return it->second;
}

EventRecord& Engine::event_locked(Id event) {
  auto it = state_.events.find(event);
  if (it == state_.events.end()) not_found(ErrorCode::EventNotFound, "event", event);
  return it->second;
}

const EventRecord& Engine::event_locked(Id event) const {
  auto it = state_.events.find(event);
  if (it == state_.events.end()) not_found(ErrorCode::EventNotFound, "event", event);
  return it->second;
}

// --- Accumulator ---

void Engine::touch_locked() {
  auto& acc = state_.accumulator;
  const AccrualStep step = compute_accrual(acc, state_.current_block, window_emission_locked(),
                                           cfg_.emission.burn_on_earn_bps, state_.ledger.remaining_supply());
  if (step.elapsed == 0) return;

  if (step.gross > 0) {
    state_.ledger.mint_with_burn(TokenLedger::kRewardPool, step.gross, step.burn, BurnSource::Mining);
  }
  if (step.clamped) {
    log::warn("touch: accrual over " + std::to_string(step.elapsed) + " blocks floored to " +
              std::to_string(step.net) + " at the supply cap");
  }
  apply_accrual(acc, step, state_.current_block);
}

void Engine::settle_locked(Agent& a) {
  touch_locked();
  const u128 acc = state_.accumulator.acc_reward_per_hash;
  a.buffered_rewards += pending_reward(acc, a.reward_debt, a.effective_hashrate);
  a.reward_debt = acc;
}

void Engine::set_hashrate_locked(Agent& a, Hashrate h) {
  settle_locked(a);
  auto& total = state_.accumulator.total_effective_hashrate;
  total = (total >= a.effective_hashrate ? total - a.effective_hashrate : 0) + h;
  a.effective_hashrate = h;
}

Hashrate Engine::compute_hashrate_locked(const Agent& a) const {
  CapacityContext ctx;
  ctx.zone = &cfg_.zones[a.zone];
  ctx.zone_id = a.zone;
  ctx.era_index = current_era_locked();
  ctx.pool = equipment_.agent_pool(a.id);
  ctx.current_block = state_.current_block;
  const Hashrate total = state_.accumulator.total_effective_hashrate;
  ctx.network_hashrate_excluding_agent = total >= a.effective_hashrate ? total - a.effective_hashrate : 0;
  ctx.pioneer_phase = a.pioneer_phase;
  return compute_effective_hashrate(cfg_.capacity, equipment_.agent_equipment(a.id), ctx).total;
}

Hashrate Engine::refresh_hashrate_locked(Agent& a) {
  const Hashrate h = a.active ? compute_hashrate_locked(a) : 0;
  set_hashrate_locked(a, h);
  return h;
}

void Engine::touch() {
  std::lock_guard<std::mutex> lock(mu_);
  touch_locked();
}

// --- Agent lifecycle ---

Id Engine::register_agent(ZoneId zone) {
  std::lock_guard<std::mutex> lock(mu_);
  if (zone >= cfg_.zones.size()) throw EngineError(ErrorCode::ZoneNotFound, "zone " + zone_str(zone));

  Agent a;
  a.id = state_.next_agent_id;
  a.zone = zone;
  a.resilience_bps = util::clamp_bps(cfg_.base_resilience_bps + cfg_.zones[zone].resilience_modifier_bps, 0,
                                     util::kBpsDenominator);
  a.pioneer_phase = current_phase_locked();
  a.registration_block = state_.current_block;
  a.last_touch_block = state_.current_block;
  a.active = true;
  const Hashrate h = compute_hashrate_locked(a);

  // The new agent changes the population, so the elapsed window is closed at the old rate.
  touch_locked();
  ++state_.next_agent_id;
  a.reward_debt = state_.accumulator.acc_reward_per_hash;
  Agent& stored = state_.agents.emplace(a.id, std::move(a)).first->second;
  ++state_.active_agent_count;
  set_hashrate_locked(stored, h);

  log::debug("agent " + std::to_string(stored.id) + " registered in zone " + zone_str(zone) + " (phase " +
             std::to_string(stored.pioneer_phase) + ", hashrate " + std::to_string(h) + ")");
  return stored.id;
}

void Engine::heartbeat(Id agent) {
  std::lock_guard<std::mutex> lock(mu_);
  Agent& a = agent_locked(agent);
  if (a.active) {
    touch_locked();
    a.last_touch_block = state_.current_block;
    return;
  }

  const Hashrate h = compute_hashrate_locked(a);
  touch_locked();
  a.active = true;
  a.last_touch_block = state_.current_block;
  ++state_.active_agent_count;
  set_hashrate_locked(a, h);
  log::info("agent " + std::to_string(agent) + " reactivated");
}

void Engine::deactivate_if_silent(Id agent) {
  std::lock_guard<std::mutex> lock(mu_);
  Agent& a = agent_locked(agent);
  if (!a.active) throw EngineError(ErrorCode::AgentInactive, "agent " + std::to_string(agent) + " is inactive");
  const BlockNumber silent = state_.current_block - a.last_touch_block;
  if (silent <= cfg_.silence_window_blocks) {
    throw EngineError(ErrorCode::AgentNotSilent, "agent " + std::to_string(agent) + " last seen " +
                                                     std::to_string(silent) + " blocks ago");
  }

  set_hashrate_locked(a, 0);
  a.active = false;
  --state_.active_agent_count;
  log::info("agent " + std::to_string(agent) + " deactivated after " + std::to_string(silent) + " silent blocks");
}

Hashrate Engine::on_equipment_changed(Id agent) {
  std::lock_guard<std::mutex> lock(mu_);
  Agent& a = agent_locked(agent);
  return refresh_hashrate_locked(a);
}

Hashrate Engine::on_zone_changed(Id agent, ZoneId zone) {
  std::lock_guard<std::mutex> lock(mu_);
  if (zone >= cfg_.zones.size()) throw EngineError(ErrorCode::ZoneNotFound, "zone " + zone_str(zone));
  Agent& a = agent_locked(agent);

  Agent moved = a;
  moved.zone = zone;
  const Hashrate h = a.active ? compute_hashrate_locked(moved) : 0;

  set_hashrate_locked(a, h);
  a.zone = zone;
  a.resilience_bps = util::clamp_bps(cfg_.base_resilience_bps + cfg_.zones[zone].resilience_modifier_bps, 0,
                                     util::kBpsDenominator);
  return h;
}

// --- Rewards ---

Amount Engine::claim(Id agent) {
  std::lock_guard<std::mutex> lock(mu_);
  Agent& a = agent_locked(agent);
  const BlockNumber age = state_.current_block - a.registration_block;
  if (age < cfg_.first_mine_delay_blocks) {
    throw EngineError(ErrorCode::FirstMineDelay, "agent " + std::to_string(agent) + " registered " +
                                                     std::to_string(age) + " blocks ago");
  }

  settle_locked(a);
  a.last_touch_block = state_.current_block;
  const Amount amount = a.buffered_rewards;
  if (amount == 0) return 0;

  VestingEntry e;
  e.id = state_.next_vesting_id++;
  e.agent_id = agent;
  e.amount = amount;
  e.start_block = state_.current_block;
  e.duration_blocks = cfg_.vesting_duration_blocks;
  a.vesting_entries.push_back(e.id);
  state_.vesting.emplace(e.id, e);

  a.buffered_rewards = 0;
  a.total_claimed += amount;
  return amount;
}

void Engine::erase_entry_locked(Id entry) {
  auto it = state_.vesting.find(entry);
  if (it == state_.vesting.end()) return;
  auto ait = state_.agents.find(it->second.agent_id);
  if (ait != state_.agents.end()) {
    auto& ids = ait->second.vesting_entries;
    ids.erase(std::remove(ids.begin(), ids.end(), entry), ids.end());
  }
  state_.vesting.erase(it);
}

Amount Engine::withdraw_vested(Id entry) {
  std::lock_guard<std::mutex> lock(mu_);
  VestingEntry& e = entry_locked(entry);
  const Amount available = chaosmine::available_to_withdraw(e, state_.current_block);
  if (available == 0) return 0;

  state_.ledger.transfer(TokenLedger::kRewardPool, e.agent_id, available);
  e.claimed_so_far += available;
  if (remaining_amount(e) == 0) erase_entry_locked(entry);
  return available;
}

Amount Engine::claim_early(Id entry) {
  std::lock_guard<std::mutex> lock(mu_);
  const VestingEntry& e = entry_locked(entry);
  const Amount remaining = remaining_amount(e);
  const Amount penalty = util::apply_bps(remaining, cfg_.early_claim_penalty_bps);
  const Amount payout = remaining - penalty;

  const Amount pool = state_.ledger.balance_of(TokenLedger::kRewardPool);
  if (pool < remaining) {
    throw EngineError(ErrorCode::InsufficientBalance,
                      "reward pool holds " + std::to_string(pool) + ", entry needs " + std::to_string(remaining));
  }

  const Id owner = e.agent_id;
  state_.ledger.transfer(TokenLedger::kRewardPool, owner, payout);
  state_.ledger.burn(TokenLedger::kRewardPool, penalty, BurnSource::EarlyClaim);
  erase_entry_locked(entry);

  log::debug("vesting entry " + std::to_string(entry) + " claimed early: paid " + std::to_string(payout) +
             ", burned " + std::to_string(penalty));
  return payout;
}

void Engine::burn_from_balance(Id agent, Amount amount, BurnSource source) {
  std::lock_guard<std::mutex> lock(mu_);
  agent_locked(agent);
  state_.ledger.burn(agent, amount, source);
}

Amount Engine::pay_bounty_locked(Id to, Amount amount) {
  const Amount minted = state_.ledger.mint(to, amount);
  if (minted < amount) {
    log::warn("bounty for agent " + std::to_string(to) + " floored to " + std::to_string(minted) +
              " at the supply cap");
  }
  return minted;
}

// --- Events ---

Id Engine::trigger_event(Id caller) {
  std::lock_guard<std::mutex> lock(mu_);
  agent_locked(caller);

  const int phase = current_phase_locked();
  if (phase < cfg_.events.min_phase_for_events) {
    throw EngineError(ErrorCode::PhaseTooEarly, "phase " + std::to_string(phase) + " < " +
                                                    std::to_string(cfg_.events.min_phase_for_events));
  }
  if (state_.ledger.total_minted() < cfg_.events.events_unlock_minted) {
    throw EngineError(ErrorCode::EventsLocked, "minted " + std::to_string(state_.ledger.total_minted()) + " of " +
                                                   std::to_string(cfg_.events.events_unlock_minted));
  }
  const EraConfig& era = cfg_.eras[current_era_locked()];
  const BlockNumber since = state_.current_block - state_.last_event_block;
  if (since < era.event_cooldown_blocks) {
    throw EngineError(ErrorCode::CooldownActive, std::to_string(era.event_cooldown_blocks - since) +
                                                     " blocks of cooldown left in era " + era.name);
  }

  EventRecord rec;
  rec.id = state_.next_event_id;
  const DerivedEvent d = derive_event(entropy_.block_seed(state_.current_block), rec.id, era.max_event_tier,
                                      cfg_.events.tier_base_damage_bps, cfg_.zones.size());
  rec.type = d.type;
  rec.severity_tier = d.severity_tier;
  rec.base_damage_bps = d.base_damage_bps;
  rec.origin_zone = d.origin_zone;
  rec.affected_zones_mask = d.affected_zones_mask;
  rec.trigger_block = state_.current_block;
  rec.triggered_by = caller;
  for (std::size_t z = 0; z < cfg_.zones.size(); ++z) {
    const auto zone = static_cast<ZoneId>(z);
    if (!zone_in_mask(rec.affected_zones_mask, zone)) continue;
    rec.zone_population[z] = roster_.zone_agent_count(zone);
    rec.required_shards[z] = required_shard_count(rec.zone_population[z], cfg_.events.shard_size);
  }

  touch_locked();
  const Id id = rec.id;
  const std::size_t shards = total_required_shards(rec);
  ++state_.next_event_id;
  state_.last_event_block = state_.current_block;
  state_.events.emplace(id, std::move(rec));
  pay_bounty_locked(caller, cfg_.events.trigger_bounty);

  log::info("event " + std::to_string(id) + " (" + event_type_to_string(d.type) + ", tier " +
            std::to_string(d.severity_tier) + ", origin zone " + zone_str(d.origin_zone) + ", " +
            std::to_string(shards) + " shards) triggered by agent " + std::to_string(caller));
  return id;
}

void Engine::damage_agent_locked(const EventRecord& ev, ZoneId zone, Id agent_id) {
  Agent& a = agent_locked(agent_id);

  const std::int64_t shield = equipment_.shield_absorption_bps(agent_id);
  DamageInputs in;
  in.base_damage_bps = ev.base_damage_bps;
  in.zone_multiplier_bps = cfg_.zones[zone].damage_multiplier_bps[static_cast<std::size_t>(ev.type)];
  in.shelter_bps = equipment_.shelter_bps(agent_id);
  in.shield_absorption_bps = shield;
  in.resilience_bps = a.resilience_bps;
  in.max_combined_reduction_bps = cfg_.events.max_combined_reduction_bps;
  const std::int64_t dmg = compute_damage_bps(in);

  if (dmg > 0) equipment_.apply_durability_damage(agent_id, dmg);
  a.shield.last_absorption_bps = shield;
  if (shield > 0) ++a.shield.events_absorbed;

  // The damage has landed; from here on the agent counts as processed.
  try {
    refresh_hashrate_locked(a);
  } catch (const std::exception& e) {
    // Without a readable rig the agent earns nothing until on_equipment_changed resyncs it.
    set_hashrate_locked(a, 0);
    log::warn("event " + std::to_string(ev.id) + ": agent " + std::to_string(agent_id) +
              " damaged but its rig could not be read, hashrate set to 0: " + e.what());
  }
}

std::uint32_t Engine::process_shard(Id caller, Id event, ZoneId zone, std::uint32_t shard) {
  std::lock_guard<std::mutex> lock(mu_);
  agent_locked(caller);
  EventRecord& ev = event_locked(event);
  if (!zone_in_mask(ev.affected_zones_mask, zone)) {
    throw EngineError(ErrorCode::ZoneNotAffected, "zone " + zone_str(zone) + " not hit by event " +
                                                      std::to_string(event));
  }
  if (shard >= ev.required_shards[zone]) {
    throw EngineError(ErrorCode::ShardOutOfRange, "shard " + std::to_string(shard) + " of zone " + zone_str(zone) +
                                                      " (event " + std::to_string(event) + " has " +
                                                      std::to_string(ev.required_shards[zone]) + ")");
  }
  const ShardKey key{zone, shard};
  if (ev.shard_processed.count(key) != 0) {
    throw EngineError(ErrorCode::ShardAlreadyProcessed, "shard " + std::to_string(shard) + " of zone " +
                                                            zone_str(zone) + " in event " + std::to_string(event));
  }

  const auto range = shard_range(shard, cfg_.events.shard_size, ev.zone_population[zone]);
  // Agents that left the zone since the trigger shrink the live roster.
  const std::uint32_t end = std::min(range.second, roster_.zone_agent_count(zone));

  touch_locked();

  std::uint32_t done = 0;
  std::uint32_t failed = 0;
  for (std::uint32_t i = range.first; i < end; ++i) {
    Id id = kInvalidId;
    try {
      id = roster_.zone_agent_at(zone, i);
      damage_agent_locked(ev, zone, id);
      ++done;
    } catch (const std::exception& e) {
      ++failed;
      log::warn("event " + std::to_string(event) + ": damaging agent " + std::to_string(id) + " at zone " +
                zone_str(zone) + " index " + std::to_string(i) + " failed: " + e.what());
    }
  }

  ev.shard_processed.insert(key);
  const u128 bounty = static_cast<u128>(cfg_.events.process_bounty_per_agent) * done;
  pay_bounty_locked(caller, util::clamp_to_u64(bounty));

  if (failed > 0) {
    log::warn("event " + std::to_string(event) + " shard " + zone_str(zone) + "/" + std::to_string(shard) + ": " +
              std::to_string(failed) + " agents skipped");
  }
  if (chaosmine::is_event_processed(ev)) {
    log::info("event " + std::to_string(event) + " fully processed");
  }
  return done;
}

// --- Queries ---

Amount Engine::pending_rewards(Id agent) const {
  std::lock_guard<std::mutex> lock(mu_);
  const Agent& a = agent_locked(agent);
  const auto& acc = state_.accumulator;
  const AccrualStep step = compute_accrual(acc, state_.current_block, window_emission_locked(),
                                           cfg_.emission.burn_on_earn_bps, state_.ledger.remaining_supply());
  return a.buffered_rewards + pending_reward(acc.acc_reward_per_hash + step.acc_delta, a.reward_debt,
                                             a.effective_hashrate);
}

Hashrate Engine::effective_hashrate(Id agent) const {
  std::lock_guard<std::mutex> lock(mu_);
  return agent_locked(agent).effective_hashrate;
}

Agent Engine::agent(Id agent) const {
  std::lock_guard<std::mutex> lock(mu_);
  return agent_locked(agent);
}

VestingEntry Engine::vesting_entry(Id entry) const {
  std::lock_guard<std::mutex> lock(mu_);
  return entry_locked(entry);
}

Amount Engine::available_to_withdraw(Id entry) const {
  std::lock_guard<std::mutex> lock(mu_);
  return chaosmine::available_to_withdraw(entry_locked(entry), state_.current_block);
}

Amount Engine::balance_of(Id holder) const {
  std::lock_guard<std::mutex> lock(mu_);
  return state_.ledger.balance_of(holder);
}

EventRecord Engine::event(Id event) const {
  std::lock_guard<std::mutex> lock(mu_);
  return event_locked(event);
}

bool Engine::is_event_processed(Id event) const {
  std::lock_guard<std::mutex> lock(mu_);
  return chaosmine::is_event_processed(event_locked(event));
}

std::vector<EventRecord> Engine::recent_events(std::size_t count) const {
  std::lock_guard<std::mutex> lock(mu_);
  std::vector<EventRecord> out;
  for (Id id = state_.next_event_id - 1; id > 0 && out.size() < count; --id) {
    auto it = state_.events.find(id);
    if (it != state_.events.end()) out.push_back(it->second);
  }
  return out;
}

std::size_t Engine::current_era() const {
  std::lock_guard<std::mutex> lock(mu_);
  return current_era_locked();
}

const EraConfig& Engine::current_era_config() const {
  std::lock_guard<std::mutex> lock(mu_);
  return cfg_.eras[current_era_locked()];
}

int Engine::current_phase() const {
  std::lock_guard<std::mutex> lock(mu_);
  return current_phase_locked();
}

Amount Engine::emission_per_block() const {
  std::lock_guard<std::mutex> lock(mu_);
  return emission_per_block_locked();
}

SupplyMetrics Engine::supply_metrics() const {
  std::lock_guard<std::mutex> lock(mu_);
  return state_.ledger.metrics();
}

AccumulatorState Engine::accumulator() const {
  std::lock_guard<std::mutex> lock(mu_);
  return state_.accumulator;
}

EngineState Engine::snapshot() const {
  std::lock_guard<std::mutex> lock(mu_);
  return state_;
}

} // namespace chaosmine
