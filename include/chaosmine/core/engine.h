#pragma once

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <vector>

#include "chaosmine/core/accumulator.h"
#include "chaosmine/core/capacity.h"
#include "chaosmine/core/collaborators.h"
#include "chaosmine/core/config.h"
#include "chaosmine/core/engine_state.h"
#include "chaosmine/core/errors.h"
#include "chaosmine/core/token_ledger.h"

namespace chaosmine {

// The economic engine.
//
// Every public member runs under one mutex, so calls from any number of threads
// are applied in a single global order. Each write entry point validates its
// preconditions before mutating anything and throws EngineError on failure.
//
// Time only moves through set_block/advance_blocks. Entry points that depend
// on emission bring the accumulator up to date first ("touch before use").
//
// The collaborators are not owned and must outlive the engine.
class Engine {
 public:
  Engine(EngineConfig cfg, EquipmentSource& equipment, ZoneRoster& roster, const EntropySource& entropy);

  Engine(const Engine&) = delete;
  Engine& operator=(const Engine&) = delete;

  const EngineConfig& cfg() const { return cfg_; }

  // --- Block clock ---
  // Throws BlockRegression if `block` is behind the current block.
  void set_block(BlockNumber block);
  void advance_blocks(BlockNumber n);
  BlockNumber current_block() const;

  // --- Agent lifecycle ---
  Id register_agent(ZoneId zone);

  // Liveness refresh. Reactivates a deactivated agent.
  void heartbeat(Id agent);

  // Permissionless. Requires the agent to have been silent for longer than
  // silence_window_blocks.
  void deactivate_if_silent(Id agent);

  // Recompute the agent's effective hashrate after its equipment or pool changed.
  // Returns the new value.
  Hashrate on_equipment_changed(Id agent);
  Hashrate on_zone_changed(Id agent, ZoneId zone);

  // --- Rewards ---
  // Permissionless and idempotent.
  void touch();

  // Moves everything the agent has earned into a new vesting entry.
  // Returns the vested amount (0 if nothing was pending; no entry is created).
  Amount claim(Id agent);

  Amount withdraw_vested(Id entry);

  // Pays out the unwithdrawn remainder of an entry minus early_claim_penalty_bps,
  // which is burned. The entry is consumed.
  Amount claim_early(Id entry);

  // Burns tokens spent on purchases made through collaborators.
  void burn_from_balance(Id agent, Amount amount, BurnSource source);

  // --- Events ---
  Id trigger_event(Id caller);

  // Damages one shard of one affected zone. Returns the number of agents damaged.
  std::uint32_t process_shard(Id caller, Id event, ZoneId zone, std::uint32_t shard);

  // --- Queries ---
  Amount pending_rewards(Id agent) const;
  Hashrate effective_hashrate(Id agent) const;
  Agent agent(Id agent) const;
  VestingEntry vesting_entry(Id entry) const;
  Amount available_to_withdraw(Id entry) const;
  Amount balance_of(Id holder) const;

  EventRecord event(Id event) const;
  bool is_event_processed(Id event) const;
  // Most recent first.
  std::vector<EventRecord> recent_events(std::size_t count) const;

  std::size_t current_era() const;
  const EraConfig& current_era_config() const;
  int current_phase() const;
  Amount emission_per_block() const;
  SupplyMetrics supply_metrics() const;
  AccumulatorState accumulator() const;

  // Copy of the full state, taken under the lock.
  EngineState snapshot() const;

 private:
  BlockNumber blocks_since_genesis_locked() const;
  std::size_t current_era_locked() const;
  int current_phase_locked() const;
  Amount emission_per_block_locked() const;
  // Gross emission for the blocks since the last accumulator update.
  Amount window_emission_locked() const;

  Agent& agent_locked(Id agent);
  const Agent& agent_locked(Id agent) const;
  VestingEntry& entry_locked(Id entry);
  const VestingEntry& entry_locked(Id entry) const;
  EventRecord& event_locked(Id event);
  const EventRecord& event_locked(Id event) const;

  void touch_locked();

  // Touches, moves the agent's pending reward into buffered_rewards and resyncs
  // its debt to the current accumulator.
  void settle_locked(Agent& a);

  // settle_locked, then replaces the agent's hashrate in the network total.
  void set_hashrate_locked(Agent& a, Hashrate h);

  Hashrate compute_hashrate_locked(const Agent& a) const;
  Hashrate refresh_hashrate_locked(Agent& a);

  void erase_entry_locked(Id entry);

  void damage_agent_locked(const EventRecord& ev, ZoneId zone, Id agent_id);
  Amount pay_bounty_locked(Id to, Amount amount);

  mutable std::mutex mu_;

  EngineConfig cfg_;
  EquipmentSource& equipment_;
  ZoneRoster& roster_;
  const EntropySource& entropy_;

  EngineState state_;
};

} // namespace chaosmine
