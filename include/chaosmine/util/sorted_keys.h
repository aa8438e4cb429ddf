#pragma once

#include <algorithm>
#include <vector>

namespace chaosmine::util {

// Engine containers are std::unordered_map keyed by id. Anything that feeds a
// digest, an export or a sum that must be reproducible walks keys in sorted
// order instead of hash order.
template <typename Map>
inline std::vector<typename Map::key_type> sorted_keys(const Map& m) {
  std::vector<typename Map::key_type> keys;
  keys.reserve(m.size());
  for (const auto& kv : m) keys.push_back(kv.first);
  std::sort(keys.begin(), keys.end());
  return keys;
}

} // namespace chaosmine::util
