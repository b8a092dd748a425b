#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "tinybook/runtime/accounting.hpp"
#include "tinybook/tinybook.hpp"

using namespace tinybook;
using core::Bytes;

namespace {

struct Args {
  int nodes = 3;
  uint64_t prices = 16;
  uint64_t ask = 4;
  uint64_t bid = 9;
  uint64_t batch = 0;  // 0: TINYBOOK_BATCH_SIZE / built-in default
};

Args parse(int argc, char** argv) {
  Args a;
  for (int i = 1; i < argc; ++i) {
    std::string s(argv[i]);
    auto next = [&](int& idx) -> std::string {
      if (idx + 1 >= argc) throw std::runtime_error("flag requires value: " + s);
      return std::string(argv[++idx]);
    };
    auto take = [&](const std::string& pfx) -> std::string { return s.substr(pfx.size()); };
    if (s == "--nodes") a.nodes = std::stoi(next(i));
    else if (s == "--prices") a.prices = std::stoull(next(i));
    else if (s == "--ask") a.ask = std::stoull(next(i));
    else if (s == "--bid") a.bid = std::stoull(next(i));
    else if (s == "--batch") a.batch = std::stoull(next(i));
    else if (s.rfind("--nodes=", 0) == 0) a.nodes = std::stoi(take("--nodes="));
    else if (s.rfind("--prices=", 0) == 0) a.prices = std::stoull(take("--prices="));
    else if (s.rfind("--ask=", 0) == 0) a.ask = std::stoull(take("--ask="));
    else if (s.rfind("--bid=", 0) == 0) a.bid = std::stoull(take("--bid="));
    else if (s.rfind("--batch=", 0) == 0) a.batch = std::stoull(take("--batch="));
    else if (s == "--help" || s == "-h") {
      std::cerr << "Usage: tinybook_demo [--nodes K] [--prices N] [--ask P] [--bid P] [--batch B]\n";
      std::exit(0);
    } else {
      throw std::runtime_error("unknown flag: " + s);
    }
  }
  if (a.nodes <= 0) throw std::runtime_error("--nodes must be > 0");
  if (a.prices == 0) throw std::runtime_error("--prices must be > 0");
  return a;
}

// Runs fn(node_index) on one thread per node and rethrows the first failure.
template<typename Fn>
void run_parties(size_t n, Fn fn) {
  std::vector<std::string> errs(n);
  std::vector<std::thread> ts;
  ts.reserve(n);
  for (size_t j = 0; j < n; ++j) {
    ts.emplace_back([&, j] {
      try {
        fn(j);
      } catch (const std::exception& e) {
        errs[j] = e.what();
      }
    });
  }
  for (auto& t : ts) t.join();
  for (size_t j = 0; j < n; ++j) {
    if (!errs[j].empty()) throw std::runtime_error("node " + std::to_string(j) + ": " + errs[j]);
  }
}

}  // namespace

int main(int argc, char** argv) {
  try {
    Args args = parse(argc, argv);
    const size_t n = static_cast<size_t>(args.nodes);

    std::vector<book::Node> nodes(n);
    auto batch = args.batch ? book::preprocess(nodes, args.prices, args.batch)
                            : book::preprocess(nodes, args.prices);

    // Clients: one request per side, delivered to every node as bytes.
    const Bytes req_ask = book::wire::encode(book::request::ask(*batch));
    const Bytes req_bid = book::wire::encode(book::request::bid(*batch));

    std::vector<Bytes> masks_ask(n), masks_bid(n);
    run_parties(n, [&](size_t j) {
      masks_ask[j] = book::wire::encode(nodes[j].masks(book::wire::decode_request_token(req_ask)));
      masks_bid[j] = book::wire::encode(nodes[j].masks(book::wire::decode_request_token(req_bid)));
    });

    std::vector<book::MaskSet> sets_ask, sets_bid;
    for (size_t j = 0; j < n; ++j) {
      sets_ask.push_back(book::wire::decode_mask_set(masks_ask[j]));
      sets_bid.push_back(book::wire::decode_mask_set(masks_bid[j]));
    }
    const Bytes order_ask = book::wire::encode(book::order(sets_ask, args.ask));
    const Bytes order_bid = book::wire::encode(book::order(sets_bid, args.bid));

    // Nodes: compute shares from the broadcast orders.
    std::vector<Bytes> share_bytes(n);
    run_parties(n, [&](size_t j) {
      share_bytes[j] = book::wire::encode(nodes[j].outcome(book::wire::decode_masked_order(order_ask),
                                                           book::wire::decode_masked_order(order_bid)));
    });

    // Operator.
    std::vector<book::OutcomeShare> shares;
    for (const auto& b : share_bytes) shares.push_back(book::wire::decode_outcome_share(b));
    auto result = book::reveal(shares);
    if (result) {
      std::cout << "match: [" << result->min() << ", " << result->max() << "]\n";
    } else {
      std::cout << "no match\n";
    }
    if (runtime::counting_enabled()) {
      const runtime::Traffic t = runtime::traffic();
      for (auto c : {runtime::Channel::Dealer, runtime::Channel::Masks, runtime::Channel::Orders,
                     runtime::Channel::Shares}) {
        std::cout << runtime::channel_name(c) << ": " << t[c].messages << " msgs, " << t[c].bytes
                  << " bytes\n";
      }
    }
    return 0;
  } catch (const std::exception& e) {
    std::cerr << "tinybook_demo error: " << e.what() << "\n";
    return 1;
  }
}
