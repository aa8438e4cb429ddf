#include "chaosmine/core/token_ledger.h"

#include <algorithm>
#include <stdexcept>
#include <string>

#include "chaosmine/core/errors.h"

namespace chaosmine {

Amount TokenLedger::remaining_supply() const {
  const Amount circ = circulating();
  return circ >= supply_cap_ ? 0 : supply_cap_ - circ;
}

Amount TokenLedger::mint(Id to, Amount amount) {
  const Amount minted = std::min(amount, remaining_supply());
  if (minted == 0) return 0;
  total_minted_ += minted;
  balances_[to] += minted;
  return minted;
}

void TokenLedger::mint_with_burn(Id to, Amount gross, Amount burn, BurnSource source) {
  if (burn > gross || gross - burn > remaining_supply()) {
    throw std::logic_error("mint_with_burn: amounts exceed remaining supply");
  }
  if (gross == 0) return;
  total_minted_ += gross;
  total_burned_ += burn;
  burned_by_source_[static_cast<std::size_t>(source)] += burn;
  balances_[to] += gross - burn;
}

void TokenLedger::debit(Id from, Amount amount) {
  auto it = balances_.find(from);
  const Amount have = (it == balances_.end()) ? 0 : it->second;
  if (have < amount) {
    throw EngineError(ErrorCode::InsufficientBalance,
                      "holder " + std::to_string(from) + " has " + std::to_string(have) + ", needs " +
                          std::to_string(amount));
  }
  if (amount == 0) return;
  it->second -= amount;
  if (it->second == 0) balances_.erase(it);
}

void TokenLedger::burn(Id from, Amount amount, BurnSource source) {
  debit(from, amount);
  total_burned_ += amount;
  burned_by_source_[static_cast<std::size_t>(source)] += amount;
}

void TokenLedger::transfer(Id from, Id to, Amount amount) {
  debit(from, amount);
  if (amount > 0) balances_[to] += amount;
}

Amount TokenLedger::balance_of(Id holder) const {
  auto it = balances_.find(holder);
  return it == balances_.end() ? 0 : it->second;
}

SupplyMetrics TokenLedger::metrics() const {
  SupplyMetrics m;
  m.total_minted = total_minted_;
  m.total_burned = total_burned_;
  m.circulating = circulating();
  m.supply_cap = supply_cap_;
  m.remaining_supply = remaining_supply();
  if (total_minted_ > 0) {
    m.burn_ratio_bps = static_cast<std::int64_t>(
        util::mul_div(total_burned_, static_cast<util::u128>(util::kBpsDenominator), total_minted_));
  }
  m.burned_by_source = burned_by_source_;
  return m;
}

} // namespace chaosmine
