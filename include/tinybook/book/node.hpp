#pragma once

#include "tinybook/book/request.hpp"
#include "tinybook/book/types.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <vector>

namespace tinybook::book {

// Per-node lifecycle of one correlated-randomness instance. Allocation of the
// token itself happens in the shared Batch arena.
enum class InstanceState : uint8_t {
  Unallocated = 0,
  AskMasked = 1,
  BidMasked = 2,
  BothMasked = 3,
  Consumed = 4,  // outcome computed
  Failed = 5,    // mask replay detected; instance retired
};

const char* instance_state_name(InstanceState s);

// One party of the workflow. Holds this party's preprocessed material for
// every batch it took part in; nothing here is shared with other nodes.
class Node {
 public:
  Node();
  ~Node();
  Node(Node&&) noexcept;
  Node& operator=(Node&&) noexcept;

  // Allocates from the most recent batch this node was preprocessed for.
  RequestToken issue_request(Role role);

  // Mask share for `token`; each (token, node) pair may be served once.
  MaskSet masks(const RequestToken& token);

  // This node's share of the match indicator for a matched ask/bid pair.
  // The instance is consumed; a second call fails.
  OutcomeShare outcome(const MaskedOrder& ask, const MaskedOrder& bid);

  InstanceState state(BatchId batch, InstanceIndex instance) const;
  std::optional<NodeIndex> index() const;
  std::shared_ptr<Batch> current_batch() const;

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;

  friend std::shared_ptr<Batch> preprocess(std::vector<Node>& nodes,
                                           PriceDomain domain,
                                           InstanceIndex batch_size);
};

// Runs (simulated) preprocessing among `nodes` for prices in [0, domain).
// Node i becomes party i of the new batch. Earlier batches stay usable.
std::shared_ptr<Batch> preprocess(std::vector<Node>& nodes, PriceDomain domain, InstanceIndex batch_size);
std::shared_ptr<Batch> preprocess(std::vector<Node>& nodes, PriceDomain domain);

}  // namespace tinybook::book
