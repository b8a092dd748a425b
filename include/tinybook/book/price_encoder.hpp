#pragma once

#include "tinybook/book/types.hpp"

#include <vector>

namespace tinybook::book {

// Threshold indicator over [0, domain):
//   Ask: v[i] = 1 iff i >= price
//   Bid: v[i] = 1 iff i <= price
// so ask[i] * bid[i] = 1 exactly on [ask_price, bid_price].
// Throws ProtocolError(PriceOutOfRange) unless price < domain.
std::vector<u64> encode_price(Role role, u64 price, PriceDomain domain);

}  // namespace tinybook::book
