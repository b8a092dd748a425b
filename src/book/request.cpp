#include "tinybook/book/request.hpp"

#include <iostream>
#include <string>

#include "tinybook/core/config.hpp"
#include "tinybook/core/errors.hpp"

namespace tinybook::book {

using core::ErrorCode;
using core::ProtocolError;

Batch::Batch(BatchId id, PriceDomain domain, InstanceIndex size, NodeIndex node_count)
    : id_(id), domain_(domain), size_(size), node_count_(node_count) {
  for (auto& n : next_) n.store(0, std::memory_order_relaxed);
}

RequestToken Batch::issue(Role role) {
  auto& ctr = next_[static_cast<size_t>(role)];
  InstanceIndex cur = ctr.load(std::memory_order_relaxed);
  do {
    if (cur >= size_) {
      throw ProtocolError(ErrorCode::ExhaustedBatch,
                          "batch " + std::to_string(id_) + " has no " + role_name(role) +
                              " instance left (size " + std::to_string(size_) + ")");
    }
  } while (!ctr.compare_exchange_weak(cur, cur + 1, std::memory_order_acq_rel,
                                      std::memory_order_relaxed));
  if (core::trace_enabled()) {
    std::cerr << "[request] batch=" << id_ << " " << role_name(role) << " instance=" << cur << "\n";
  }
  RequestToken t;
  t.batch = id_;
  t.role = role;
  t.instance = cur;
  t.domain = domain_;
  return t;
}

InstanceIndex Batch::issued(Role role) const {
  return next_[static_cast<size_t>(role)].load(std::memory_order_acquire);
}

bool Batch::was_issued(const RequestToken& token) const {
  return token.batch == id_ && token.instance < issued(token.role);
}

namespace request {

RequestToken ask(Batch& batch) { return batch.issue(Role::Ask); }
RequestToken bid(Batch& batch) { return batch.issue(Role::Bid); }

}  // namespace request

}  // namespace tinybook::book
