#include <cassert>
#include <cstdint>
#include <iostream>
#include <random>
#include <vector>

#include "protocol_harness.hpp"
#include "tinybook/mpc/shares.hpp"

using namespace tinybook;
using core::ErrorCode;

// Shares of an arbitrary plaintext vector, tagged as one protocol run.
static std::vector<book::OutcomeShare> share_vector(const std::vector<uint64_t>& plain, uint32_t parties) {
  static std::mt19937_64 rng(2024);
  auto parts = mpc::split_add(plain, parties, rng);
  std::vector<book::OutcomeShare> out;
  for (uint32_t j = 0; j < parties; ++j) {
    book::OutcomeShare s;
    s.batch = 77;
    s.instance = 3;
    s.node = j;
    s.node_count = parties;
    s.values = parts[j];
    out.push_back(s);
  }
  return out;
}

int main() {
  auto ok = book::reveal(share_vector({0, 0, 1, 1, 1, 0}, 3));
  assert(ok && ok->min() == 2 && ok->max() == 4);
  assert(!book::reveal(share_vector({0, 0, 0, 0}, 3)));
  auto full = book::reveal(share_vector({1, 1, 1}, 2));
  assert(full && full->min() == 0 && full->max() == 2);

  harness::expect_error(ErrorCode::MalformedShares,
                        [&] { book::reveal(share_vector({0, 1, 0, 1}, 3)); }, "non-contiguous");
  harness::expect_error(ErrorCode::MalformedShares,
                        [&] { book::reveal(share_vector({0, 2, 0}, 3)); }, "non-binary");
  harness::expect_error(ErrorCode::MalformedShares,
                        [&] { book::reveal(share_vector({5, 0, 0}, 3)); }, "non-binary first slot");

  harness::expect_error(ErrorCode::IncompleteShares, [&] { book::reveal({}); }, "empty");
  auto missing = share_vector({0, 1, 1}, 3);
  missing.pop_back();
  harness::expect_error(ErrorCode::IncompleteShares, [&] { book::reveal(missing); }, "missing node");

  // A node count taken off the wire is checked against the shares present.
  auto inflated = share_vector({0, 1, 1}, 3);
  for (auto& s : inflated) s.node_count = 0xFFFFFFFFu;
  harness::expect_error(ErrorCode::IncompleteShares, [&] { book::reveal(inflated); }, "inflated node count");
  auto surplus = share_vector({0, 1, 1}, 3);
  for (auto& s : surplus) s.node_count = 2;
  harness::expect_error(ErrorCode::MalformedShares, [&] { book::reveal(surplus); }, "surplus shares");

  auto dup = share_vector({0, 1, 1}, 3);
  dup[1] = dup[0];
  harness::expect_error(ErrorCode::MalformedShares, [&] { book::reveal(dup); }, "duplicate node");

  auto mixed = share_vector({0, 1, 1}, 3);
  mixed[2].instance = 4;
  harness::expect_error(ErrorCode::MalformedShares, [&] { book::reveal(mixed); }, "mixed instances");

  auto ragged = share_vector({0, 1, 1}, 3);
  ragged[1].values.push_back(0);
  harness::expect_error(ErrorCode::DomainMismatch, [&] { book::reveal(ragged); }, "ragged shares");

  // Without every node the sum is noise; reveal refuses rather than guessing.
  std::vector<book::Node> nodes(3);
  auto batch = book::preprocess(nodes, 16, 1);
  auto ask = book::order(harness::collect_masks(nodes, book::request::ask(*batch)), 4);
  auto bid = book::order(harness::collect_masks(nodes, book::request::bid(*batch)), 9);
  auto shares = harness::collect_shares(nodes, ask, bid);
  std::vector<book::OutcomeShare> two(shares.begin(), shares.begin() + 2);
  harness::expect_error(ErrorCode::IncompleteShares, [&] { book::reveal(two); }, "two of three");
  auto tampered = shares;
  tampered[0].values[0] += 1;
  harness::expect_error(ErrorCode::MalformedShares, [&] { book::reveal(tampered); }, "tampered share");

  std::cout << "reveal malformed ok\n";
  return 0;
}
