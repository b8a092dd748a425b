#pragma once

#include "tinybook/core/types.hpp"
#include "tinybook/mpc/prg.hpp"

#include <cstdint>
#include <optional>
#include <random>
#include <vector>

namespace tinybook::mpc {

using core::InstanceIndex;
using core::NodeIndex;
using core::PriceDomain;

// Which factor of the per-slot product a mask belongs to.
enum class Factor : uint8_t { Left = 0, Right = 1 };

// One party's view of a batch of multiplication correlations. Instance k
// holds, per slot i, additive shares of r_x[i], r_y[i] and r_x[i]*r_y[i].
// Shares are AES-CTR keystream words under the party key; party 0 also keeps
// a correction vector so the product shares sum to the true product.
class PartyMaterial {
 public:
  PartyMaterial(NodeIndex party,
                NodeIndex parties,
                PriceDomain domain,
                InstanceIndex instances,
                const Seed& seed,
                std::vector<u64> product_correction);

  NodeIndex party() const { return party_; }
  NodeIndex parties() const { return parties_; }
  PriceDomain domain() const { return domain_; }
  InstanceIndex instances() const { return instances_; }

  // This party's share of r_x (Left) or r_y (Right) for one instance.
  std::vector<u64> derive_mask(InstanceIndex instance, Factor f) const;

  // Share of x*y per slot given the public masked values x^ = x + r_x and
  // y^ = y + r_y. Purely local.
  std::vector<u64> local_multiply_share(InstanceIndex instance,
                                        const std::vector<u64>& x_hat,
                                        const std::vector<u64>& y_hat) const;

  uint64_t stored_bytes() const;

 private:
  enum class Component : u64 { LeftMask = 0, RightMask = 1, Product = 2 };

  static u64 stream_id(InstanceIndex instance, Component c) {
    return instance * 3 + static_cast<u64>(c);
  }
  std::vector<u64> derive(InstanceIndex instance, Component c) const;
  void check_instance(InstanceIndex instance) const;

  NodeIndex party_;
  NodeIndex parties_;
  PriceDomain domain_;
  InstanceIndex instances_;
  AesCtrPrg prg_;
  std::vector<u64> product_correction_;  // party 0 only, instances * domain

  friend class Dealer;
};

// Simulated trusted dealer standing in for the preprocessing phase.
class Dealer {
 public:
  // Keys from OpenSSL RAND_bytes.
  Dealer();
  // Deterministic keys from mt19937_64(seed).
  explicit Dealer(uint64_t seed);
  // Deterministic keys for one stream of a seed; distinct streams yield
  // unrelated keys. Preprocessing uses the batch id as the stream.
  Dealer(uint64_t seed, uint64_t stream);

  std::vector<PartyMaterial> allocate(NodeIndex parties, PriceDomain domain, InstanceIndex instances);

 private:
  Seed next_seed();

  std::optional<std::mt19937_64> det_;
  SecureRand rand_;
};

}  // namespace tinybook::mpc
