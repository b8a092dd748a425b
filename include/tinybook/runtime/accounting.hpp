#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

namespace tinybook::runtime {

// Protocol channels. Each message is counted once, at the size its wire
// encoding would take (see book/wire.hpp). Dealer traffic is the material a
// node stores per batch.
enum class Channel : uint8_t { Dealer = 0, Masks = 1, Orders = 2, Shares = 3 };
inline constexpr size_t kChannelCount = 4;

struct ChannelTotals {
  uint64_t messages = 0;
  uint64_t bytes = 0;
};

struct Traffic {
  std::array<ChannelTotals, kChannelCount> channels{};

  const ChannelTotals& operator[](Channel c) const { return channels[static_cast<size_t>(c)]; }
  uint64_t total_bytes() const;
  uint64_t total_messages() const;
};

const char* channel_name(Channel c);

// Counting is on when either set_counting_enabled(true) or TINYBOOK_ACCOUNTING.
void set_counting_enabled(bool enabled);
bool counting_enabled();

void record_message(Channel c, uint64_t bytes);
Traffic traffic();
void reset_traffic();

}  // namespace tinybook::runtime
