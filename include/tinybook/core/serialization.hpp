#pragma once

#include "tinybook/core/types.hpp"

#include <cstdint>
#include <stdexcept>
#include <vector>

namespace tinybook::core {

// Minimal helpers for little-endian encoding/decoding to byte vectors.
inline void append_u32(Bytes& out, uint32_t v) {
  for (int i = 0; i < 4; ++i) out.push_back(static_cast<uint8_t>((v >> (8 * i)) & 0xff));
}

inline void append_u64(Bytes& out, uint64_t v) {
  for (int i = 0; i < 8; ++i) out.push_back(static_cast<uint8_t>((v >> (8 * i)) & 0xff));
}

inline uint8_t read_u8(const Bytes& buf, size_t& offset) {
  if (offset + 1 > buf.size()) throw std::runtime_error("serialization: truncated u8");
  return buf[offset++];
}

inline uint32_t read_u32(const Bytes& buf, size_t& offset) {
  if (offset + 4 > buf.size()) throw std::runtime_error("serialization: truncated u32");
  uint32_t v = 0;
  for (int i = 0; i < 4; ++i) v |= static_cast<uint32_t>(buf[offset + i]) << (8 * i);
  offset += 4;
  return v;
}

inline uint64_t read_u64(const Bytes& buf, size_t& offset) {
  if (offset + 8 > buf.size()) throw std::runtime_error("serialization: truncated u64");
  uint64_t v = 0;
  for (int i = 0; i < 8; ++i) v |= static_cast<uint64_t>(buf[offset + i]) << (8 * i);
  offset += 8;
  return v;
}

// Length-prefixed u64 vector (u64 count, then count words).
inline void append_u64_vec(Bytes& out, const std::vector<uint64_t>& ws) {
  append_u64(out, ws.size());
  out.reserve(out.size() + 8 * ws.size());
  for (uint64_t w : ws) append_u64(out, w);
}

inline std::vector<uint64_t> read_u64_vec(const Bytes& buf, size_t& offset) {
  uint64_t n = read_u64(buf, offset);
  if (n > (buf.size() - offset) / 8) throw std::runtime_error("serialization: truncated u64 vector");
  std::vector<uint64_t> ws(static_cast<size_t>(n));
  for (auto& w : ws) w = read_u64(buf, offset);
  return ws;
}

}  // namespace tinybook::core
