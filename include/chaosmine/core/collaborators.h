#pragma once

#include <cstdint>
#include <optional>
#include <vector>

#include "chaosmine/core/entities.h"

namespace chaosmine {

// Read/write view of the equipment system. The engine computes damage
// percentages; the implementation owns durability and applies them.
class EquipmentSource {
 public:
  virtual ~EquipmentSource() = default;

  virtual std::vector<EquipmentUnit> agent_equipment(Id agent) const = 0;
  virtual std::optional<PoolState> agent_pool(Id agent) const = 0;
  virtual std::int64_t shelter_bps(Id agent) const = 0;
  virtual std::int64_t shield_absorption_bps(Id agent) const = 0;

  virtual void apply_durability_damage(Id agent, std::int64_t damage_bps) = 0;
};

// Zone membership index used to walk shards.
class ZoneRoster {
 public:
  virtual ~ZoneRoster() = default;

  virtual std::uint32_t zone_agent_count(ZoneId zone) const = 0;
  virtual Id zone_agent_at(ZoneId zone, std::uint32_t index) const = 0;
};

// Per-block entropy for event derivation.
class EntropySource {
 public:
  virtual ~EntropySource() = default;

  virtual std::uint64_t block_seed(BlockNumber block) const = 0;
};

// Entropy from a fixed seed mixed with the block number.
class SeededEntropySource : public EntropySource {
 public:
  explicit SeededEntropySource(std::uint64_t seed) : seed_(seed) {}

  std::uint64_t block_seed(BlockNumber block) const override;

 private:
  std::uint64_t seed_{0};
};

} // namespace chaosmine
