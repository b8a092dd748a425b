#include "tinybook/runtime/accounting.hpp"

#include <atomic>

#include "tinybook/core/config.hpp"

namespace tinybook::runtime {

namespace {

struct Counter {
  std::atomic<uint64_t> messages{0};
  std::atomic<uint64_t> bytes{0};
};

std::atomic<bool> g_enabled{false};
std::array<Counter, kChannelCount> g_channels;

}  // namespace

uint64_t Traffic::total_bytes() const {
  uint64_t sum = 0;
  for (const auto& c : channels) sum += c.bytes;
  return sum;
}

uint64_t Traffic::total_messages() const {
  uint64_t sum = 0;
  for (const auto& c : channels) sum += c.messages;
  return sum;
}

const char* channel_name(Channel c) {
  switch (c) {
    case Channel::Dealer: return "dealer";
    case Channel::Masks: return "masks";
    case Channel::Orders: return "orders";
    case Channel::Shares: return "shares";
  }
  return "?";
}

void set_counting_enabled(bool enabled) {
  g_enabled.store(enabled, std::memory_order_relaxed);
}

bool counting_enabled() {
  return g_enabled.load(std::memory_order_relaxed) || core::config().accounting;
}

void record_message(Channel c, uint64_t bytes) {
  if (!counting_enabled()) return;
  Counter& ctr = g_channels[static_cast<size_t>(c)];
  ctr.messages.fetch_add(1, std::memory_order_relaxed);
  ctr.bytes.fetch_add(bytes, std::memory_order_relaxed);
}

Traffic traffic() {
  Traffic out;
  for (size_t i = 0; i < kChannelCount; ++i) {
    out.channels[i].messages = g_channels[i].messages.load(std::memory_order_relaxed);
    out.channels[i].bytes = g_channels[i].bytes.load(std::memory_order_relaxed);
  }
  return out;
}

void reset_traffic() {
  for (auto& c : g_channels) {
    c.messages.store(0, std::memory_order_relaxed);
    c.bytes.store(0, std::memory_order_relaxed);
  }
}

}  // namespace tinybook::runtime
