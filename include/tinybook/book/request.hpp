#pragma once

#include "tinybook/book/types.hpp"

#include <array>
#include <atomic>
#include <memory>

namespace tinybook::book {

// Arena of correlated-randomness instances produced by one preprocess call and
// shared by every node of that call. Token allocation is the only shared
// mutable state; it is a lock-free counter per role.
class Batch {
 public:
  Batch(BatchId id, PriceDomain domain, InstanceIndex size, NodeIndex node_count);

  Batch(const Batch&) = delete;
  Batch& operator=(const Batch&) = delete;

  BatchId id() const { return id_; }
  PriceDomain domain() const { return domain_; }
  InstanceIndex size() const { return size_; }
  NodeIndex node_count() const { return node_count_; }

  // Next unused instance for `role`. Throws ProtocolError(ExhaustedBatch).
  RequestToken issue(Role role);

  InstanceIndex issued(Role role) const;
  InstanceIndex remaining(Role role) const { return size_ - issued(role); }
  bool was_issued(const RequestToken& token) const;

 private:
  BatchId id_;
  PriceDomain domain_;
  InstanceIndex size_;
  NodeIndex node_count_;
  std::array<std::atomic<InstanceIndex>, 2> next_;
};

namespace request {

RequestToken ask(Batch& batch);
RequestToken bid(Batch& batch);

}  // namespace request

}  // namespace tinybook::book
