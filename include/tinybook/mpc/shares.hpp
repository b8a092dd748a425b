#pragma once

#include "tinybook/core/ring.hpp"

#include <random>
#include <stdexcept>
#include <vector>

namespace tinybook::mpc {

using core::u64;

// Additive sharing over Z_2^64 among n parties: x = sum_j x_j.
template<class URBG>
inline std::vector<std::vector<u64>> split_add(const std::vector<u64>& x, size_t parties, URBG& g) {
  if (parties == 0) throw std::invalid_argument("split_add: zero parties");
  std::uniform_int_distribution<u64> dist;
  std::vector<std::vector<u64>> out(parties, std::vector<u64>(x.size(), 0));
  for (size_t i = 0; i < x.size(); ++i) {
    u64 acc = 0;
    for (size_t j = 1; j < parties; ++j) {
      out[j][i] = dist(g);
      acc = core::add_mod(acc, out[j][i]);
    }
    out[0][i] = core::sub_mod(x[i], acc);
  }
  return out;
}

inline std::vector<u64> reconstruct(const std::vector<std::vector<u64>>& shares) {
  if (shares.empty()) throw std::runtime_error("reconstruct: no shares");
  std::vector<u64> out(shares[0].size(), 0);
  for (const auto& s : shares) core::add_into(out, s);
  return out;
}

}  // namespace tinybook::mpc
