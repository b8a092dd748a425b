#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace tinybook::core {

using u8 = uint8_t;
using u64 = uint64_t;
using u128 = unsigned __int128;

// Simple byte container helper used in serialization-friendly structs.
using Bytes = std::vector<uint8_t>;

using NodeIndex = uint32_t;
using BatchId = uint64_t;
using InstanceIndex = uint64_t;

// Number of distinct prices; valid prices are [0, domain).
using PriceDomain = uint64_t;

}  // namespace tinybook::core
