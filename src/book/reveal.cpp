#include "tinybook/book/reveal.hpp"

#include <iostream>
#include <string>

#include "tinybook/core/config.hpp"
#include "tinybook/core/errors.hpp"
#include "tinybook/mpc/shares.hpp"

namespace tinybook::book {

using core::ErrorCode;
using core::ProtocolError;

namespace {

[[noreturn]] void malformed(const std::string& what) {
  std::cerr << "[reveal] malformed outcome: " << what << "\n";
  throw ProtocolError(ErrorCode::MalformedShares, what);
}

}  // namespace

std::optional<PriceRange> range_from_indicator(const std::vector<u64>& r) {
  const size_t none = r.size();
  size_t lo = none, hi = 0;
  for (size_t i = 0; i < r.size(); ++i) {
    if (r[i] == 0) continue;
    if (r[i] != 1) malformed("slot " + std::to_string(i) + " reconstructs to " + std::to_string(r[i]));
    if (lo == none) {
      lo = i;
    } else if (hi + 1 != i) {
      malformed("non-contiguous match at slots " + std::to_string(hi) + " and " + std::to_string(i));
    }
    hi = i;
  }
  if (lo == none) return std::nullopt;
  return PriceRange{static_cast<u64>(lo), static_cast<u64>(hi)};
}

std::optional<PriceRange> reveal(const std::vector<OutcomeShare>& shares) {
  if (shares.empty()) throw ProtocolError(ErrorCode::IncompleteShares, "no shares");
  const OutcomeShare& first = shares.front();
  const size_t domain = first.values.size();
  if (first.node_count == 0 || shares.size() > first.node_count) {
    malformed(std::to_string(shares.size()) + " shares for " + std::to_string(first.node_count) +
              " nodes");
  }
  if (shares.size() < first.node_count) {
    throw ProtocolError(ErrorCode::IncompleteShares,
                        "have " + std::to_string(shares.size()) + " of " +
                            std::to_string(first.node_count) + " shares");
  }

  std::vector<bool> seen(first.node_count, false);
  std::vector<std::vector<u64>> vals;
  vals.reserve(shares.size());
  for (const OutcomeShare& s : shares) {
    if (s.batch != first.batch || s.instance != first.instance || s.node_count != first.node_count) {
      malformed("shares from different protocol runs");
    }
    if (s.values.size() != domain) {
      throw ProtocolError(ErrorCode::DomainMismatch,
                          "share lengths " + std::to_string(s.values.size()) + " vs " +
                              std::to_string(domain));
    }
    if (s.node >= first.node_count || seen[s.node]) {
      malformed("node " + std::to_string(s.node) + " out of range or repeated");
    }
    seen[s.node] = true;
    vals.push_back(s.values);
  }

  const std::vector<u64> r = mpc::reconstruct(vals);
  auto out = range_from_indicator(r);
  if (core::trace_enabled()) {
    std::cerr << "[reveal] batch=" << first.batch << " instance=" << first.instance << " -> ";
    if (out) {
      std::cerr << "[" << out->lo << ", " << out->hi << "]\n";
    } else {
      std::cerr << "no match\n";
    }
  }
  return out;
}

}  // namespace tinybook::book
