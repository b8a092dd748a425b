#pragma once

#include "tinybook/book/types.hpp"

#include <vector>

namespace tinybook::book {

// Client side: encode `price` and add every node's mask. `mask_sets` must hold
// exactly one set per node index of the batch (any order) and all sets must
// come from the same token; otherwise ProtocolError(InconsistentMaskSets).
MaskedOrder order(const std::vector<MaskSet>& mask_sets, u64 price);

}  // namespace tinybook::book
