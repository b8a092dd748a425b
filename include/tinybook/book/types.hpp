#pragma once

#include "tinybook/core/types.hpp"

#include <cstdint>
#include <vector>

namespace tinybook::book {

using core::BatchId;
using core::InstanceIndex;
using core::NodeIndex;
using core::PriceDomain;
using core::u64;

enum class Role : uint8_t { Ask = 0, Bid = 1 };

inline const char* role_name(Role r) { return r == Role::Ask ? "ask" : "bid"; }

// Single-use handle for one half (ask or bid) of instance `instance` in batch
// `batch`. The k-th ask and k-th bid of a batch are matched.
struct RequestToken {
  BatchId batch = 0;
  Role role = Role::Ask;
  InstanceIndex instance = 0;
  PriceDomain domain = 0;
};

// One node's masks for one token, keyed by that node's index in the batch.
struct MaskSet {
  BatchId batch = 0;
  InstanceIndex instance = 0;
  Role role = Role::Ask;
  NodeIndex node = 0;
  NodeIndex node_count = 0;
  std::vector<u64> values;  // one per price slot
};

// Encoded price plus the sum of every node's masks; safe to broadcast.
struct MaskedOrder {
  BatchId batch = 0;
  InstanceIndex instance = 0;
  Role role = Role::Ask;
  std::vector<u64> masked;
};

// One node's additive share of the per-slot match indicator.
struct OutcomeShare {
  BatchId batch = 0;
  InstanceIndex instance = 0;
  NodeIndex node = 0;
  NodeIndex node_count = 0;
  std::vector<u64> values;
};

// Inclusive range [lo, hi]: lo is the ask price, hi the bid price.
struct PriceRange {
  u64 lo = 0;
  u64 hi = 0;

  u64 min() const { return lo; }
  u64 max() const { return hi; }
  u64 size() const { return hi - lo + 1; }
  bool contains(u64 p) const { return lo <= p && p <= hi; }

  friend bool operator==(const PriceRange& a, const PriceRange& b) {
    return a.lo == b.lo && a.hi == b.hi;
  }
  friend bool operator!=(const PriceRange& a, const PriceRange& b) { return !(a == b); }
};

}  // namespace tinybook::book
