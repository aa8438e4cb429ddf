#pragma once

#include <array>
#include <cstdint>
#include <unordered_map>

#include "chaosmine/core/entities.h"

namespace chaosmine {

struct SupplyMetrics {
  Amount total_minted{0};
  Amount total_burned{0};
  Amount circulating{0};
  Amount supply_cap{0};
  Amount remaining_supply{0};

  // total_burned / total_minted in basis points (0 before the first mint).
  std::int64_t burn_ratio_bps{0};

  std::array<Amount, kBurnSourceCount> burned_by_source{};
};

// Token accounting: totals, per-holder balances and the supply ceiling.
//
// Invariant: total_minted - total_burned <= supply_cap after every call.
// Minting never throws for supply reasons; it mints as much as still fits.
class TokenLedger {
 public:
  // Account holding minted rewards until they are withdrawn from vesting.
  static constexpr Id kRewardPool = ~Id{0};

  explicit TokenLedger(Amount supply_cap = 0) : supply_cap_(supply_cap) {}

  Amount supply_cap() const { return supply_cap_; }
  Amount total_minted() const { return total_minted_; }
  Amount total_burned() const { return total_burned_; }
  Amount circulating() const { return total_minted_ - total_burned_; }
  Amount remaining_supply() const;

  // Mints min(amount, remaining_supply()) into `to`. Returns the amount minted.
  Amount mint(Id to, Amount amount);

  // Mints `gross` into `to` and immediately burns `burn` of it.
  //
  // Requires burn <= gross and gross - burn <= remaining_supply(); callers floor
  // the amounts first (see compute_accrual).
  void mint_with_burn(Id to, Amount gross, Amount burn, BurnSource source);

  // Throws EngineError(InsufficientBalance) if `from` holds less than `amount`.
  void burn(Id from, Amount amount, BurnSource source);
  void transfer(Id from, Id to, Amount amount);

  Amount balance_of(Id holder) const;
  Amount burned_by(BurnSource source) const { return burned_by_source_[static_cast<std::size_t>(source)]; }
  const std::unordered_map<Id, Amount>& balances() const { return balances_; }

  SupplyMetrics metrics() const;

 private:
  void debit(Id from, Amount amount);

  Amount supply_cap_{0};
  Amount total_minted_{0};
  Amount total_burned_{0};
  std::array<Amount, kBurnSourceCount> burned_by_source_{};
  std::unordered_map<Id, Amount> balances_;
};

} // namespace chaosmine
