#include "chaosmine/util/fixed_point.h"

#include <algorithm>
#include <stdexcept>

namespace chaosmine::util {

std::string u128_to_string(u128 v) {
  if (v == 0) return "0";
  std::string out;
  while (v > 0) {
    out.push_back(static_cast<char>('0' + static_cast<int>(v % 10)));
    v /= 10;
  }
  std::reverse(out.begin(), out.end());
  return out;
}

u128 u128_from_string(const std::string& s) {
  if (s.empty()) throw std::runtime_error("empty u128 string");
  u128 v = 0;
  for (char c : s) {
    if (c < '0' || c > '9') throw std::runtime_error("invalid u128 digit in: " + s);
    const u128 digit = static_cast<u128>(c - '0');
    if (v > (kU128Max - digit) / 10) throw std::runtime_error("u128 overflow: " + s);
    v = v * 10 + digit;
  }
  return v;
}

} // namespace chaosmine::util
