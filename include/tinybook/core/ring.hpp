#pragma once

#include "tinybook/core/types.hpp"

#include <stdexcept>
#include <string>
#include <vector>

namespace tinybook::core {

// Arithmetic in Z_{2^64}: uint64 overflow already wraps correctly.
inline u64 add_mod(u64 a, u64 b) { return a + b; }
inline u64 sub_mod(u64 a, u64 b) { return a - b; }
inline u64 mul_mod(u64 a, u64 b) {
  return static_cast<u64>(static_cast<u128>(a) * static_cast<u128>(b));
}

inline void add_into(std::vector<u64>& acc, const std::vector<u64>& x) {
  if (acc.size() != x.size()) {
    throw std::runtime_error("add_into: size mismatch " + std::to_string(acc.size()) +
                             " vs " + std::to_string(x.size()));
  }
  for (size_t i = 0; i < x.size(); ++i) acc[i] = add_mod(acc[i], x[i]);
}

}  // namespace tinybook::core
