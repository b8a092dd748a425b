#include <algorithm>
#include <cassert>
#include <cstdint>
#include <iostream>
#include <random>
#include <vector>

#include "protocol_harness.hpp"

using namespace tinybook;

static void test_usage_scenarios() {
  std::vector<book::Node> nodes(3);
  auto batch = book::preprocess(nodes, 16, 4);

  auto r = harness::match(nodes, *batch, 4, 9);
  assert(r.has_value());
  assert(r->min() == 4 && r->max() == 9);
  assert(*r == (book::PriceRange{4, 9}));
  assert(r->size() == 6 && r->contains(7) && !r->contains(10));

  assert(!harness::match(nodes, *batch, 9, 4).has_value());
  assert(!harness::match(nodes, *batch, 11, 7).has_value());

  auto eq = harness::match(nodes, *batch, 5, 5);
  assert(eq && eq->min() == 5 && eq->max() == 5);
}

// Every (ask, bid) over a small domain, for several committee sizes.
static void test_exhaustive_small_domain() {
  const uint64_t N = 8;
  for (size_t k = 1; k <= 4; ++k) {
    std::vector<book::Node> nodes(k);
    auto batch = book::preprocess(nodes, N, N * N);
    for (uint64_t a = 0; a < N; ++a) {
      for (uint64_t b = 0; b < N; ++b) {
        auto r = harness::match(nodes, *batch, a, b);
        const bool ok = (a <= b) ? (r && r->min() == a && r->max() == b) : !r;
        if (!ok) {
          std::cerr << "match mismatch nodes=" << k << " ask=" << a << " bid=" << b << "\n";
          std::exit(1);
        }
      }
    }
    assert(batch->remaining(book::Role::Ask) == 0);
  }
}

// Node identity, not position, orders mask sets and shares.
static void test_shuffled_delivery() {
  std::vector<book::Node> nodes(5);
  auto batch = book::preprocess(nodes, 32, 2);
  std::mt19937_64 rng(3);

  auto ask_tok = book::request::ask(*batch);
  auto bid_tok = book::request::bid(*batch);
  auto ask_sets = harness::collect_masks(nodes, ask_tok);
  auto bid_sets = harness::collect_masks(nodes, bid_tok);
  std::shuffle(ask_sets.begin(), ask_sets.end(), rng);
  std::shuffle(bid_sets.begin(), bid_sets.end(), rng);
  auto ask = book::order(ask_sets, 0);
  auto bid = book::order(bid_sets, 31);

  auto shares = harness::collect_shares(nodes, ask, bid);
  std::shuffle(shares.begin(), shares.end(), rng);
  auto r = book::reveal(shares);
  assert(r && r->min() == 0 && r->max() == 31);
}

static void test_node_issue_request() {
  std::vector<book::Node> nodes(3);
  auto batch = book::preprocess(nodes, 16, 2);
  assert(nodes[0].current_batch() == batch);
  assert(nodes[2].index().value() == 2);

  // Any node can hand out tokens; allocation is shared by the whole batch.
  auto a0 = nodes[0].issue_request(book::Role::Ask);
  auto b0 = nodes[1].issue_request(book::Role::Bid);
  auto a1 = nodes[2].issue_request(book::Role::Ask);
  assert(a0.instance == 0 && b0.instance == 0 && a1.instance == 1);

  auto ask = book::order(harness::collect_masks(nodes, a0), 3);
  auto bid = book::order(harness::collect_masks(nodes, b0), 12);
  auto r = book::reveal(harness::collect_shares(nodes, ask, bid));
  assert(r && r->min() == 3 && r->max() == 12);
}

int main() {
  test_usage_scenarios();
  test_exhaustive_small_domain();
  test_shuffled_delivery();
  test_node_issue_request();
  std::cout << "match/reveal ok\n";
  return 0;
}
