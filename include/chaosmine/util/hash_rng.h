#pragma once

#include <cstddef>
#include <cstdint>

namespace chaosmine::util {

// splitmix64: fast deterministic mixing / RNG step (Sebastiano Vigna).
//
// IMPORTANT: This is *not* a cryptographically secure RNG. Event derivation only
// needs "same seed -> same event"; unpredictability comes from the host's seed.
inline std::uint64_t splitmix64(std::uint64_t x) {
  x += 0x9e3779b97f4a7c15ULL;
  x = (x ^ (x >> 30)) * 0xbf58476d1ce4e5b9ULL;
  x = (x ^ (x >> 27)) * 0x94d049bb133111ebULL;
  return x ^ (x >> 31);
}

// Order-sensitive combination of two words into one seed.
inline std::uint64_t mix64(std::uint64_t a, std::uint64_t b) {
  return splitmix64(a ^ splitmix64(b + 0x632be59bd9b4e019ULL));
}

inline std::uint64_t next_splitmix64(std::uint64_t& state) {
  state = splitmix64(state);
  return state;
}

// Unbiased bounded random integer in [0, bound_exclusive).
//
// Uses rejection sampling to avoid modulo bias.
inline std::uint64_t bounded_u64(std::uint64_t& state, std::uint64_t bound_exclusive) {
  if (bound_exclusive <= 1) return 0;
  const std::uint64_t threshold = (std::uint64_t(0) - bound_exclusive) % bound_exclusive;
  for (;;) {
    const std::uint64_t r = next_splitmix64(state);
    if (r >= threshold) return r % bound_exclusive;
  }
}

struct HashRng {
  std::uint64_t s{0};

  explicit HashRng(std::uint64_t seed) : s(seed) {}

  // Index in [0, n).
  std::size_t index(std::size_t n) {
    if (n <= 1) return 0;
    return static_cast<std::size_t>(bounded_u64(s, static_cast<std::uint64_t>(n)));
  }
};

} // namespace chaosmine::util
