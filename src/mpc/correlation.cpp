#include "tinybook/mpc/correlation.hpp"

#include <limits>
#include <stdexcept>
#include <string>
#include <utility>
#ifdef _OPENMP
#include <omp.h>
#endif

#include "tinybook/core/ring.hpp"

namespace tinybook::mpc {

using core::add_mod;
using core::mul_mod;
using core::sub_mod;

PartyMaterial::PartyMaterial(NodeIndex party,
                             NodeIndex parties,
                             PriceDomain domain,
                             InstanceIndex instances,
                             const Seed& seed,
                             std::vector<u64> product_correction)
    : party_(party),
      parties_(parties),
      domain_(domain),
      instances_(instances),
      prg_(seed),
      product_correction_(std::move(product_correction)) {
  if (party_ >= parties_) throw std::invalid_argument("PartyMaterial: party index out of range");
  if (party_ == 0 && product_correction_.size() != instances_ * domain_) {
    throw std::invalid_argument("PartyMaterial: correction size mismatch");
  }
}

void PartyMaterial::check_instance(InstanceIndex instance) const {
  if (instance >= instances_) {
    throw std::runtime_error("PartyMaterial: instance " + std::to_string(instance) +
                             " out of " + std::to_string(instances_));
  }
}

std::vector<u64> PartyMaterial::derive(InstanceIndex instance, Component c) const {
  check_instance(instance);
  return prg_.words(stream_id(instance, c), static_cast<size_t>(domain_));
}

std::vector<u64> PartyMaterial::derive_mask(InstanceIndex instance, Factor f) const {
  return derive(instance, f == Factor::Left ? Component::LeftMask : Component::RightMask);
}

std::vector<u64> PartyMaterial::local_multiply_share(InstanceIndex instance,
                                                     const std::vector<u64>& x_hat,
                                                     const std::vector<u64>& y_hat) const {
  const size_t n = static_cast<size_t>(domain_);
  if (x_hat.size() != n || y_hat.size() != n) {
    throw std::runtime_error("PartyMaterial: masked input size mismatch");
  }
  const auto rx = derive(instance, Component::LeftMask);
  const auto ry = derive(instance, Component::RightMask);
  auto z = derive(instance, Component::Product);
  const bool lead = (party_ == 0);
  const u64* corr = lead ? product_correction_.data() + instance * n : nullptr;

#ifdef _OPENMP
#pragma omp parallel for if (n >= (1ull << 16)) schedule(static)
#endif
  for (long long ii = 0; ii < static_cast<long long>(n); ++ii) {
    const size_t i = static_cast<size_t>(ii);
    u64 acc = z[i];
    acc = sub_mod(acc, mul_mod(x_hat[i], ry[i]));
    acc = sub_mod(acc, mul_mod(y_hat[i], rx[i]));
    if (lead) {
      acc = add_mod(acc, corr[i]);
      acc = add_mod(acc, mul_mod(x_hat[i], y_hat[i]));
    }
    z[i] = acc;
  }
  return z;
}

uint64_t PartyMaterial::stored_bytes() const {
  return sizeof(Seed) + product_correction_.size() * sizeof(u64);
}

Dealer::Dealer() = default;

Dealer::Dealer(uint64_t seed) : det_(std::in_place, seed) {}

Dealer::Dealer(uint64_t seed, uint64_t stream) {
  std::seed_seq seq{static_cast<uint32_t>(seed), static_cast<uint32_t>(seed >> 32),
                    static_cast<uint32_t>(stream), static_cast<uint32_t>(stream >> 32)};
  det_.emplace(seq);
}

Seed Dealer::next_seed() {
  if (!det_) return rand_.rand_seed();
  Seed s{};
  for (auto& b : s) b = static_cast<uint8_t>((*det_)() & 0xFFu);
  return s;
}

std::vector<PartyMaterial> Dealer::allocate(NodeIndex parties, PriceDomain domain, InstanceIndex instances) {
  if (parties == 0) throw std::invalid_argument("Dealer: zero parties");
  if (domain == 0) throw std::invalid_argument("Dealer: zero price domain");
  if (instances == 0) throw std::invalid_argument("Dealer: zero batch size");
  if (instances > std::numeric_limits<u64>::max() / 3 ||
      domain > std::numeric_limits<size_t>::max() / instances) {
    throw std::invalid_argument("Dealer: batch too large");
  }

  std::vector<Seed> seeds(parties);
  for (auto& s : seeds) s = next_seed();

  std::vector<PartyMaterial> out;
  out.reserve(parties);
  for (NodeIndex j = 0; j < parties; ++j) {
    std::vector<u64> corr;
    if (j == 0) corr.assign(static_cast<size_t>(instances * domain), 0);
    out.emplace_back(j, parties, domain, instances, seeds[j], std::move(corr));
  }

  // corr = r_x * r_y - sum_j c_j, slot by slot.
  const size_t n = static_cast<size_t>(domain);
  for (InstanceIndex k = 0; k < instances; ++k) {
    std::vector<u64> rx(n, 0), ry(n, 0), c_sum(n, 0);
    for (const auto& pm : out) {
      core::add_into(rx, pm.derive(k, PartyMaterial::Component::LeftMask));
      core::add_into(ry, pm.derive(k, PartyMaterial::Component::RightMask));
      core::add_into(c_sum, pm.derive(k, PartyMaterial::Component::Product));
    }
    u64* corr = out[0].product_correction_.data() + k * n;
    for (size_t i = 0; i < n; ++i) {
      corr[i] = sub_mod(mul_mod(rx[i], ry[i]), c_sum[i]);
    }
  }
  return out;
}

}  // namespace tinybook::mpc
