#include <cassert>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <random>
#include <stdexcept>
#include <vector>

#include "tinybook/core/ring.hpp"
#include "tinybook/mpc/correlation.hpp"
#include "tinybook/mpc/shares.hpp"

using namespace tinybook;
using core::u64;

static void test_split_reconstruct() {
  std::mt19937_64 rng(7);
  std::vector<u64> x = {0, 1, 2, ~u64(0), 12345};
  for (size_t parties = 1; parties <= 5; ++parties) {
    auto sh = mpc::split_add(x, parties, rng);
    assert(sh.size() == parties);
    assert(mpc::reconstruct(sh) == x);
  }
}

// Product shares must reconstruct x*y over the whole ring, not just for bits.
static void test_multiply_shares() {
  std::mt19937_64 rng(99);
  const uint64_t N = 32;
  const uint64_t K = 4;
  for (uint32_t parties = 1; parties <= 4; ++parties) {
    mpc::Dealer dealer(1000 + parties);
    auto mats = dealer.allocate(parties, N, K);
    assert(mats.size() == parties);
    for (uint64_t k = 0; k < K; ++k) {
      std::vector<u64> x(N), y(N), x_hat(N), y_hat(N);
      for (auto& v : x) v = rng();
      for (auto& v : y) v = rng();
      x_hat = x;
      y_hat = y;
      for (const auto& m : mats) {
        core::add_into(x_hat, m.derive_mask(k, mpc::Factor::Left));
        core::add_into(y_hat, m.derive_mask(k, mpc::Factor::Right));
      }
      std::vector<std::vector<u64>> z;
      for (const auto& m : mats) z.push_back(m.local_multiply_share(k, x_hat, y_hat));
      auto prod = mpc::reconstruct(z);
      for (uint64_t i = 0; i < N; ++i) {
        if (prod[i] != core::mul_mod(x[i], y[i])) {
          std::cerr << "product mismatch parties=" << parties << " k=" << k << " i=" << i << "\n";
          std::exit(1);
        }
      }
    }
  }
}

static void test_deterministic_dealer() {
  mpc::Dealer d0(42), d1(42), d2(43);
  auto a = d0.allocate(3, 8, 2);
  auto b = d1.allocate(3, 8, 2);
  auto c = d2.allocate(3, 8, 2);
  assert(a[1].derive_mask(1, mpc::Factor::Left) == b[1].derive_mask(1, mpc::Factor::Left));
  assert(a[1].derive_mask(1, mpc::Factor::Left) != c[1].derive_mask(1, mpc::Factor::Left));
  // Streams do not overlap across instances or factors.
  assert(a[0].derive_mask(0, mpc::Factor::Left) != a[0].derive_mask(1, mpc::Factor::Left));
  assert(a[0].derive_mask(0, mpc::Factor::Left) != a[0].derive_mask(0, mpc::Factor::Right));
  // Only party 0 carries the correction vector.
  assert(a[0].stored_bytes() == 16 + 2 * 8 * 8);
  assert(a[1].stored_bytes() == 16);
}

static void test_prg_prefix_stable() {
  mpc::SecureRand sr;
  mpc::AesCtrPrg prg(sr.rand_seed());
  auto long_run = prg.words(5, 9);
  auto short_run = prg.words(5, 3);
  for (size_t i = 0; i < short_run.size(); ++i) assert(long_run[i] == short_run[i]);
}

static void test_bad_arguments() {
  mpc::Dealer d(1);
  bool threw = false;
  try {
    d.allocate(0, 8, 1);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
  auto mats = d.allocate(2, 8, 1);
  threw = false;
  try {
    mats[0].derive_mask(1, mpc::Factor::Left);
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

int main() {
  test_split_reconstruct();
  test_multiply_shares();
  test_deterministic_dealer();
  test_prg_prefix_stable();
  test_bad_arguments();
  std::cout << "correlation engine ok\n";
  return 0;
}
