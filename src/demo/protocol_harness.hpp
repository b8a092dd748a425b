#pragma once

#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "tinybook/tinybook.hpp"

namespace harness {

using namespace tinybook;

// Runs fn and exits the test unless it throws ProtocolError with `code`.
template<typename Fn>
inline void expect_error(core::ErrorCode code, Fn fn, const char* what) {
  try {
    fn();
  } catch (const core::ProtocolError& e) {
    if (e.code() == code) return;
    std::cerr << what << ": expected " << core::error_code_name(code) << ", got " << e.what() << "\n";
    std::exit(1);
  }
  std::cerr << what << ": expected " << core::error_code_name(code) << ", nothing thrown\n";
  std::exit(1);
}

inline std::vector<book::MaskSet> collect_masks(std::vector<book::Node>& nodes, const book::RequestToken& t) {
  std::vector<book::MaskSet> out;
  for (auto& n : nodes) out.push_back(n.masks(t));
  return out;
}

inline std::vector<book::OutcomeShare> collect_shares(std::vector<book::Node>& nodes,
                                                      const book::MaskedOrder& ask,
                                                      const book::MaskedOrder& bid) {
  std::vector<book::OutcomeShare> out;
  for (auto& n : nodes) out.push_back(n.outcome(ask, bid));
  return out;
}

// Full workflow for one ask/bid pair on a fresh instance of `batch`.
inline std::optional<book::PriceRange> match(std::vector<book::Node>& nodes,
                                             book::Batch& batch,
                                             uint64_t ask_price,
                                             uint64_t bid_price) {
  auto ask_tok = book::request::ask(batch);
  auto bid_tok = book::request::bid(batch);
  auto ask = book::order(collect_masks(nodes, ask_tok), ask_price);
  auto bid = book::order(collect_masks(nodes, bid_tok), bid_price);
  return book::reveal(collect_shares(nodes, ask, bid));
}

}  // namespace harness
