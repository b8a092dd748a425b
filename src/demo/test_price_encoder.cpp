#include <cassert>
#include <cstdint>
#include <iostream>
#include <vector>

#include "protocol_harness.hpp"

using namespace tinybook;
using book::Role;

int main() {
  const uint64_t N = 16;

  auto ask = book::encode_price(Role::Ask, 4, N);
  auto bid = book::encode_price(Role::Bid, 9, N);
  assert(ask.size() == N && bid.size() == N);
  for (uint64_t i = 0; i < N; ++i) {
    assert(ask[i] == (i >= 4 ? 1u : 0u));
    assert(bid[i] == (i <= 9 ? 1u : 0u));
  }

  // Slot products form exactly [ask, bid], or nothing when bid < ask.
  for (uint64_t a = 0; a < N; ++a) {
    for (uint64_t b = 0; b < N; ++b) {
      auto va = book::encode_price(Role::Ask, a, N);
      auto vb = book::encode_price(Role::Bid, b, N);
      std::vector<uint64_t> prod(N);
      for (uint64_t i = 0; i < N; ++i) prod[i] = va[i] * vb[i];
      auto r = book::range_from_indicator(prod);
      if (a <= b) {
        assert(r && r->min() == a && r->max() == b);
      } else {
        assert(!r);
      }
    }
  }

  // Edges of the domain.
  assert(book::encode_price(Role::Ask, 0, N) == std::vector<uint64_t>(N, 1));
  assert(book::encode_price(Role::Bid, N - 1, N) == std::vector<uint64_t>(N, 1));
  auto one = book::encode_price(Role::Bid, 0, 1);
  assert(one.size() == 1 && one[0] == 1);

  assert(book::encode_price(Role::Ask, 7, N) == book::encode_price(Role::Ask, 7, N));

  harness::expect_error(core::ErrorCode::PriceOutOfRange,
                        [&] { book::encode_price(Role::Ask, N, N); }, "ask == domain");
  harness::expect_error(core::ErrorCode::PriceOutOfRange,
                        [&] { book::encode_price(Role::Bid, 1000, N); }, "bid past domain");

  std::cout << "price encoder ok\n";
  return 0;
}
