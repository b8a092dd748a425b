#include "tinybook/book/order.hpp"

#include <string>

#include "tinybook/book/price_encoder.hpp"
#include "tinybook/book/wire.hpp"
#include "tinybook/core/errors.hpp"
#include "tinybook/core/ring.hpp"
#include "tinybook/runtime/accounting.hpp"

namespace tinybook::book {

using core::ErrorCode;
using core::ProtocolError;

namespace {

[[noreturn]] void inconsistent(const std::string& what) {
  throw ProtocolError(ErrorCode::InconsistentMaskSets, what);
}

}  // namespace

MaskedOrder order(const std::vector<MaskSet>& mask_sets, u64 price) {
  if (mask_sets.empty()) inconsistent("no mask sets");
  const MaskSet& first = mask_sets.front();
  const size_t domain = first.values.size();
  if (first.node_count == 0 || mask_sets.size() != first.node_count) {
    inconsistent("expected " + std::to_string(first.node_count) + " mask sets, got " +
                 std::to_string(mask_sets.size()));
  }

  std::vector<bool> seen(first.node_count, false);
  for (const MaskSet& m : mask_sets) {
    if (m.batch != first.batch || m.instance != first.instance || m.role != first.role) {
      inconsistent("mask sets drawn from different tokens");
    }
    if (m.node_count != first.node_count || m.values.size() != domain) {
      inconsistent("mask sets disagree on node count or price domain");
    }
    if (m.node >= first.node_count || seen[m.node]) {
      inconsistent("node " + std::to_string(m.node) + " missing or repeated in mask sets");
    }
    seen[m.node] = true;
  }

  MaskedOrder out;
  out.batch = first.batch;
  out.instance = first.instance;
  out.role = first.role;
  out.masked = encode_price(first.role, price, domain);
  for (const MaskSet& m : mask_sets) core::add_into(out.masked, m.values);
  runtime::record_message(runtime::Channel::Orders, wire::encoded_size(out));
  return out;
}

}  // namespace tinybook::book
