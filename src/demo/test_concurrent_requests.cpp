#include <algorithm>
#include <atomic>
#include <cassert>
#include <cstdint>
#include <iostream>
#include <mutex>
#include <thread>
#include <vector>

#include "protocol_harness.hpp"

using namespace tinybook;

// Concurrent clients never receive overlapping instances, and the batch size
// is a hard limit.
static void test_parallel_allocation() {
  constexpr uint64_t kBatch = 1000;
  constexpr int kThreads = 8;
  std::vector<book::Node> nodes(2);
  auto batch = book::preprocess(nodes, 4, kBatch);

  std::mutex mu;
  std::vector<uint64_t> seen;
  std::atomic<int> exhausted{0};
  std::vector<std::thread> ts;
  for (int t = 0; t < kThreads; ++t) {
    ts.emplace_back([&] {
      std::vector<uint64_t> mine;
      for (;;) {
        try {
          mine.push_back(book::request::ask(*batch).instance);
        } catch (const core::ProtocolError& e) {
          if (e.code() == core::ErrorCode::ExhaustedBatch) exhausted.fetch_add(1);
          break;
        }
      }
      std::lock_guard<std::mutex> lk(mu);
      seen.insert(seen.end(), mine.begin(), mine.end());
    });
  }
  for (auto& t : ts) t.join();

  assert(exhausted.load() == kThreads);
  assert(seen.size() == kBatch);
  std::sort(seen.begin(), seen.end());
  for (uint64_t i = 0; i < kBatch; ++i) assert(seen[i] == i);
  assert(batch->issued(book::Role::Ask) == kBatch);
  assert(batch->remaining(book::Role::Ask) == 0);
  assert(batch->issued(book::Role::Bid) == 0);
}

// Independent instances run end to end on separate threads against the same nodes.
static void test_parallel_instances() {
  constexpr int kThreads = 6;
  constexpr uint64_t kPerThread = 20;
  const uint64_t N = 24;
  std::vector<book::Node> nodes(3);
  auto batch = book::preprocess(nodes, N, kThreads * kPerThread);

  // Pair tokens up front so each thread owns whole instances.
  std::vector<std::pair<book::RequestToken, book::RequestToken>> pairs;
  for (uint64_t i = 0; i < kThreads * kPerThread; ++i) {
    auto a = book::request::ask(*batch);
    auto b = book::request::bid(*batch);
    pairs.emplace_back(a, b);
  }

  std::atomic<int> failures{0};
  std::vector<std::thread> ts;
  for (int t = 0; t < kThreads; ++t) {
    ts.emplace_back([&, t] {
      for (uint64_t k = 0; k < kPerThread; ++k) {
        const auto& p = pairs[static_cast<size_t>(t) * kPerThread + k];
        const uint64_t ask_price = (t * 7 + k * 3) % N;
        const uint64_t bid_price = (t * 5 + k * 11) % N;
        try {
          auto ask = book::order(harness::collect_masks(nodes, p.first), ask_price);
          auto bid = book::order(harness::collect_masks(nodes, p.second), bid_price);
          auto r = book::reveal(harness::collect_shares(nodes, ask, bid));
          const bool ok = ask_price <= bid_price ? (r && r->min() == ask_price && r->max() == bid_price)
                                                 : !r;
          if (!ok) failures.fetch_add(1);
        } catch (const std::exception& e) {
          std::cerr << "thread " << t << ": " << e.what() << "\n";
          failures.fetch_add(1);
        }
      }
    });
  }
  for (auto& t : ts) t.join();
  assert(failures.load() == 0);
  for (uint64_t i = 0; i < kThreads * kPerThread; ++i) {
    assert(nodes[2].state(batch->id(), i) == book::InstanceState::Consumed);
  }
}

int main() {
  test_parallel_allocation();
  test_parallel_instances();
  std::cout << "concurrent requests ok\n";
  return 0;
}
