#pragma once

#include <cstdint>

#include "chaosmine/util/fixed_point.h"

namespace chaosmine {

using Id = std::uint64_t;
constexpr Id kInvalidId = 0;

using BlockNumber = std::uint64_t;

// Token amounts in base units. Supply caps are validated to fit in int64 so that
// amounts can be exported as exact JSON integers.
using Amount = std::uint64_t;

using Hashrate = std::uint64_t;

using ZoneId = std::uint8_t;

// Zones are addressed by a uint8 bitmask.
constexpr int kMaxZones = 8;

using util::u128;

} // namespace chaosmine
