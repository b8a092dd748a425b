#pragma once

#include "tinybook/book/types.hpp"

#include <optional>
#include <vector>

namespace tinybook::book {

// Operator side: reconstruct the match indicator from one share per node.
// Returns std::nullopt for "no match", otherwise [ask_price, bid_price].
// Missing shares raise IncompleteShares; anything that is not a single run of
// ones raises MalformedShares (logged to stderr, never read as "no match").
std::optional<PriceRange> reveal(const std::vector<OutcomeShare>& shares);

// Result policy on an already reconstructed indicator vector.
std::optional<PriceRange> range_from_indicator(const std::vector<u64>& indicator);

}  // namespace tinybook::book
