#include "tinybook/book/node.hpp"

#include <atomic>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>

#include "tinybook/book/wire.hpp"
#include "tinybook/core/config.hpp"
#include "tinybook/core/errors.hpp"
#include "tinybook/mpc/correlation.hpp"
#include "tinybook/runtime/accounting.hpp"

namespace tinybook::book {

using core::ErrorCode;
using core::ProtocolError;

namespace {

std::atomic<BatchId> g_next_batch{1};

bool has_role(InstanceState s, Role r) {
  if (s == InstanceState::BothMasked) return true;
  return r == Role::Ask ? s == InstanceState::AskMasked : s == InstanceState::BidMasked;
}

InstanceState with_role(InstanceState s, Role r) {
  if (s == InstanceState::Unallocated) {
    return r == Role::Ask ? InstanceState::AskMasked : InstanceState::BidMasked;
  }
  return InstanceState::BothMasked;
}

mpc::Factor factor_of(Role r) { return r == Role::Ask ? mpc::Factor::Left : mpc::Factor::Right; }

std::string where(BatchId batch, InstanceIndex instance) {
  return "batch " + std::to_string(batch) + " instance " + std::to_string(instance);
}

}  // namespace

const char* instance_state_name(InstanceState s) {
  switch (s) {
    case InstanceState::Unallocated: return "Unallocated";
    case InstanceState::AskMasked: return "AskMasked";
    case InstanceState::BidMasked: return "BidMasked";
    case InstanceState::BothMasked: return "BothMasked";
    case InstanceState::Consumed: return "Consumed";
    case InstanceState::Failed: return "Failed";
  }
  return "Unknown";
}

struct Node::Impl {
  struct BatchState {
    std::shared_ptr<Batch> batch;
    mpc::PartyMaterial material;
    std::vector<InstanceState> states;
  };

  mutable std::mutex mu;
  // References stay valid across rehash; entries are never erased.
  std::unordered_map<BatchId, BatchState> batches;
  std::shared_ptr<Batch> latest;

  BatchState* find(BatchId id) {
    auto it = batches.find(id);
    return it == batches.end() ? nullptr : &it->second;
  }
  const BatchState* find(BatchId id) const {
    auto it = batches.find(id);
    return it == batches.end() ? nullptr : &it->second;
  }
};

Node::Node() : impl_(std::make_unique<Impl>()) {}
Node::~Node() = default;
Node::Node(Node&&) noexcept = default;
Node& Node::operator=(Node&&) noexcept = default;

RequestToken Node::issue_request(Role role) {
  std::shared_ptr<Batch> batch = current_batch();
  if (!batch) {
    throw ProtocolError(ErrorCode::ExhaustedBatch, "node has not been preprocessed");
  }
  return batch->issue(role);
}

MaskSet Node::masks(const RequestToken& token) {
  const mpc::PartyMaterial* material = nullptr;
  NodeIndex node_count = 0;
  {
    std::lock_guard<std::mutex> lk(impl_->mu);
    Impl::BatchState* bs = impl_->find(token.batch);
    if (!bs) {
      throw ProtocolError(ErrorCode::UnknownToken, "unknown batch " + std::to_string(token.batch));
    }
    if (token.domain != bs->batch->domain()) {
      throw ProtocolError(ErrorCode::UnknownToken,
                          "token domain " + std::to_string(token.domain) + " vs batch domain " +
                              std::to_string(bs->batch->domain()));
    }
    if (!bs->batch->was_issued(token)) {
      throw ProtocolError(ErrorCode::UnknownToken,
                          std::string(role_name(token.role)) + " token never issued for " +
                              where(token.batch, token.instance));
    }
    InstanceState& st = bs->states[static_cast<size_t>(token.instance)];
    if (st == InstanceState::Failed || st == InstanceState::Consumed || has_role(st, token.role)) {
      // A replayed token means a client may try to reuse a one-time pad.
      if (st != InstanceState::Consumed) st = InstanceState::Failed;
      throw ProtocolError(ErrorCode::TokenAlreadyConsumed,
                          std::string(role_name(token.role)) + " masks already issued for " +
                              where(token.batch, token.instance));
    }
    st = with_role(st, token.role);
    material = &bs->material;
    node_count = bs->batch->node_count();
  }

  MaskSet out;
  out.batch = token.batch;
  out.instance = token.instance;
  out.role = token.role;
  out.node = material->party();
  out.node_count = node_count;
  out.values = material->derive_mask(token.instance, factor_of(token.role));
  runtime::record_message(runtime::Channel::Masks, wire::encoded_size(out));
  if (core::trace_enabled()) {
    std::cerr << "[node " << out.node << "] masks " << role_name(token.role) << " "
              << where(token.batch, token.instance) << "\n";
  }
  return out;
}

OutcomeShare Node::outcome(const MaskedOrder& ask, const MaskedOrder& bid) {
  if (ask.role != Role::Ask || bid.role != Role::Bid) {
    throw ProtocolError(ErrorCode::RoleMismatch,
                        std::string("expected (ask, bid), got (") + role_name(ask.role) + ", " +
                            role_name(bid.role) + ")");
  }
  if (ask.batch != bid.batch || ask.instance != bid.instance) {
    throw ProtocolError(ErrorCode::UnpairedTokens,
                        "ask from " + where(ask.batch, ask.instance) + ", bid from " +
                            where(bid.batch, bid.instance));
  }

  const mpc::PartyMaterial* material = nullptr;
  NodeIndex node_count = 0;
  {
    std::lock_guard<std::mutex> lk(impl_->mu);
    Impl::BatchState* bs = impl_->find(ask.batch);
    if (!bs) {
      throw ProtocolError(ErrorCode::UnknownToken, "unknown batch " + std::to_string(ask.batch));
    }
    if (ask.instance >= bs->batch->size()) {
      throw ProtocolError(ErrorCode::UnknownToken, "no " + where(ask.batch, ask.instance));
    }
    const PriceDomain domain = bs->batch->domain();
    if (ask.masked.size() != domain || bid.masked.size() != domain) {
      throw ProtocolError(ErrorCode::DomainMismatch,
                          "order lengths (" + std::to_string(ask.masked.size()) + ", " +
                              std::to_string(bid.masked.size()) + ") vs domain " +
                              std::to_string(domain));
    }
    InstanceState& st = bs->states[static_cast<size_t>(ask.instance)];
    switch (st) {
      case InstanceState::BothMasked:
        break;
      case InstanceState::Consumed:
        throw ProtocolError(ErrorCode::InstanceAlreadyUsed,
                            "outcome already computed for " + where(ask.batch, ask.instance));
      case InstanceState::Failed:
        throw ProtocolError(ErrorCode::InstanceRetired, where(ask.batch, ask.instance) + " was retired");
      default:
        throw ProtocolError(ErrorCode::UnknownToken,
                            where(ask.batch, ask.instance) + " is " + instance_state_name(st) +
                                " on this node");
    }
    st = InstanceState::Consumed;
    material = &bs->material;
    node_count = bs->batch->node_count();
  }

  OutcomeShare out;
  out.batch = ask.batch;
  out.instance = ask.instance;
  out.node = material->party();
  out.node_count = node_count;
  out.values = material->local_multiply_share(ask.instance, ask.masked, bid.masked);
  runtime::record_message(runtime::Channel::Shares, wire::encoded_size(out));
  if (core::trace_enabled()) {
    std::cerr << "[node " << out.node << "] outcome " << where(ask.batch, ask.instance) << "\n";
  }
  return out;
}

InstanceState Node::state(BatchId batch, InstanceIndex instance) const {
  std::lock_guard<std::mutex> lk(impl_->mu);
  const Impl::BatchState* bs = impl_->find(batch);
  if (!bs || instance >= bs->states.size()) return InstanceState::Unallocated;
  return bs->states[static_cast<size_t>(instance)];
}

std::optional<NodeIndex> Node::index() const {
  std::lock_guard<std::mutex> lk(impl_->mu);
  if (!impl_->latest) return std::nullopt;
  const Impl::BatchState* bs = impl_->find(impl_->latest->id());
  return bs->material.party();
}

std::shared_ptr<Batch> Node::current_batch() const {
  std::lock_guard<std::mutex> lk(impl_->mu);
  return impl_->latest;
}

std::shared_ptr<Batch> preprocess(std::vector<Node>& nodes, PriceDomain domain, InstanceIndex batch_size) {
  if (nodes.empty()) throw std::invalid_argument("preprocess: no nodes");
  if (domain == 0) throw std::invalid_argument("preprocess: price domain must be positive");
  if (batch_size == 0) throw std::invalid_argument("preprocess: batch size must be positive");

  const NodeIndex parties = static_cast<NodeIndex>(nodes.size());
  const BatchId id = g_next_batch.fetch_add(1, std::memory_order_relaxed);
  // A configured seed still gives every batch its own keys.
  const std::optional<uint64_t> seed = core::config().dealer_seed;
  mpc::Dealer dealer = seed ? mpc::Dealer(*seed, id) : mpc::Dealer();
  std::vector<mpc::PartyMaterial> material = dealer.allocate(parties, domain, batch_size);

  auto batch = std::make_shared<Batch>(id, domain, batch_size, parties);
  for (NodeIndex j = 0; j < parties; ++j) {
    Node& node = nodes[j];
    runtime::record_message(runtime::Channel::Dealer, material[j].stored_bytes());
    std::lock_guard<std::mutex> lk(node.impl_->mu);
    node.impl_->batches.emplace(
        batch->id(),
        Node::Impl::BatchState{batch, std::move(material[j]),
                               std::vector<InstanceState>(static_cast<size_t>(batch_size),
                                                          InstanceState::Unallocated)});
    node.impl_->latest = batch;
  }
  if (core::trace_enabled()) {
    std::cerr << "[preprocess] batch=" << batch->id() << " nodes=" << parties << " prices=" << domain
              << " instances=" << batch_size << "\n";
  }
  return batch;
}

std::shared_ptr<Batch> preprocess(std::vector<Node>& nodes, PriceDomain domain) {
  return preprocess(nodes, domain, static_cast<InstanceIndex>(core::config().default_batch_size));
}

}  // namespace tinybook::book
