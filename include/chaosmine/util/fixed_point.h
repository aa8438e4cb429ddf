#pragma once

#include <cstdint>
#include <limits>
#include <string>

namespace chaosmine::util {

// 128-bit unsigned intermediate for ledger arithmetic (GCC/Clang extension).
using u128 = unsigned __int128;

// 1e18: scale of accumulator values and "wad" multipliers.
inline constexpr u128 kWad = static_cast<u128>(1'000'000'000'000'000'000ULL);

inline constexpr std::int64_t kBpsDenominator = 10'000;

inline constexpr u128 kU128Max = ~static_cast<u128>(0);

inline u128 saturating_mul(u128 a, u128 b) {
  if (a == 0 || b == 0) return 0;
  if (a > kU128Max / b) return kU128Max;
  return a * b;
}

// floor(a * b / d), d > 0.
//
// When a * b does not fit in 128 bits the product is decomposed as
// (a / d) * b + (a % d) * b / d, which still truncates and saturates instead of
// wrapping around.
inline u128 mul_div(u128 a, u128 b, u128 d) {
  if (d == 0) return 0;
  if (a == 0 || b == 0) return 0;
  if (a <= kU128Max / b) return (a * b) / d;
  const u128 q = a / d;
  const u128 r = a % d;
  const u128 hi = saturating_mul(q, b);
  const u128 lo = (r <= kU128Max / b) ? (r * b) / d : saturating_mul(r, b / d);
  if (hi > kU128Max - lo) return kU128Max;
  return hi + lo;
}

// floor(amount * bps / 10000) for a non-negative bps value.
inline std::uint64_t apply_bps(std::uint64_t amount, std::int64_t bps) {
  if (bps <= 0) return 0;
  const u128 v = mul_div(amount, static_cast<u128>(bps), static_cast<u128>(kBpsDenominator));
  return v > std::numeric_limits<std::uint64_t>::max() ? std::numeric_limits<std::uint64_t>::max()
                                                         : static_cast<std::uint64_t>(v);
}

inline std::uint64_t clamp_to_u64(u128 v) {
  return v > std::numeric_limits<std::uint64_t>::max() ? std::numeric_limits<std::uint64_t>::max()
                                                         : static_cast<std::uint64_t>(v);
}

inline std::int64_t clamp_bps(std::int64_t v, std::int64_t lo, std::int64_t hi) {
  return v < lo ? lo : (v > hi ? hi : v);
}

// Decimal text for a 128-bit value (used by state export and log messages).
std::string u128_to_string(u128 v);

// Parses decimal text produced by u128_to_string. Throws std::runtime_error on bad input.
u128 u128_from_string(const std::string& s);

} // namespace chaosmine::util
