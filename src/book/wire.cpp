#include "tinybook/book/wire.hpp"

#include <cstring>
#include <stdexcept>
#include <string>

#include "tinybook/core/serialization.hpp"

namespace tinybook::book::wire {

using core::append_u32;
using core::append_u64;
using core::append_u64_vec;
using core::Bytes;
using core::read_u32;
using core::read_u64;
using core::read_u64_vec;
using core::read_u8;

namespace {

constexpr char kTagToken[4] = {'T', 'B', 'R', 'Q'};
constexpr char kTagMaskSet[4] = {'T', 'B', 'M', 'S'};
constexpr char kTagOrder[4] = {'T', 'B', 'M', 'O'};
constexpr char kTagShare[4] = {'T', 'B', 'O', 'S'};

void put_tag(Bytes& out, const char (&tag)[4]) { out.insert(out.end(), tag, tag + 4); }

void expect_tag(const Bytes& buf, size_t& off, const char (&tag)[4], const char* what) {
  if (buf.size() < 4 || std::memcmp(buf.data(), tag, 4) != 0) {
    throw std::runtime_error(std::string("wire: bad tag for ") + what);
  }
  off = 4;
}

void expect_end(const Bytes& buf, size_t off, const char* what) {
  if (off != buf.size()) throw std::runtime_error(std::string("wire: trailing bytes after ") + what);
}

void put_role(Bytes& out, Role r) { out.push_back(static_cast<uint8_t>(r)); }

constexpr size_t kTagBytes = 4;
constexpr size_t kVecPrefixBytes = 8;

size_t vec_bytes(const std::vector<uint64_t>& v) { return kVecPrefixBytes + 8 * v.size(); }

Role get_role(const Bytes& buf, size_t& off) {
  uint8_t r = read_u8(buf, off);
  if (r > 1) throw std::runtime_error("wire: bad role " + std::to_string(r));
  return static_cast<Role>(r);
}

}  // namespace

Bytes encode(const RequestToken& t) {
  Bytes out;
  put_tag(out, kTagToken);
  append_u64(out, t.batch);
  put_role(out, t.role);
  append_u64(out, t.instance);
  append_u64(out, t.domain);
  return out;
}

Bytes encode(const MaskSet& m) {
  Bytes out;
  put_tag(out, kTagMaskSet);
  append_u64(out, m.batch);
  append_u64(out, m.instance);
  put_role(out, m.role);
  append_u32(out, m.node);
  append_u32(out, m.node_count);
  append_u64_vec(out, m.values);
  return out;
}

Bytes encode(const MaskedOrder& o) {
  Bytes out;
  put_tag(out, kTagOrder);
  append_u64(out, o.batch);
  append_u64(out, o.instance);
  put_role(out, o.role);
  append_u64_vec(out, o.masked);
  return out;
}

Bytes encode(const OutcomeShare& s) {
  Bytes out;
  put_tag(out, kTagShare);
  append_u64(out, s.batch);
  append_u64(out, s.instance);
  append_u32(out, s.node);
  append_u32(out, s.node_count);
  append_u64_vec(out, s.values);
  return out;
}

size_t encoded_size(const MaskSet& m) {
  return kTagBytes + 8 + 8 + 1 + 4 + 4 + vec_bytes(m.values);
}

size_t encoded_size(const MaskedOrder& o) {
  return kTagBytes + 8 + 8 + 1 + vec_bytes(o.masked);
}

size_t encoded_size(const OutcomeShare& s) {
  return kTagBytes + 8 + 8 + 4 + 4 + vec_bytes(s.values);
}

RequestToken decode_request_token(const Bytes& buf) {
  size_t off = 0;
  expect_tag(buf, off, kTagToken, "request token");
  RequestToken t;
  t.batch = read_u64(buf, off);
  t.role = get_role(buf, off);
  t.instance = read_u64(buf, off);
  t.domain = read_u64(buf, off);
  expect_end(buf, off, "request token");
  return t;
}

MaskSet decode_mask_set(const Bytes& buf) {
  size_t off = 0;
  expect_tag(buf, off, kTagMaskSet, "mask set");
  MaskSet m;
  m.batch = read_u64(buf, off);
  m.instance = read_u64(buf, off);
  m.role = get_role(buf, off);
  m.node = read_u32(buf, off);
  m.node_count = read_u32(buf, off);
  m.values = read_u64_vec(buf, off);
  expect_end(buf, off, "mask set");
  return m;
}

MaskedOrder decode_masked_order(const Bytes& buf) {
  size_t off = 0;
  expect_tag(buf, off, kTagOrder, "masked order");
  MaskedOrder o;
  o.batch = read_u64(buf, off);
  o.instance = read_u64(buf, off);
  o.role = get_role(buf, off);
  o.masked = read_u64_vec(buf, off);
  expect_end(buf, off, "masked order");
  return o;
}

OutcomeShare decode_outcome_share(const Bytes& buf) {
  size_t off = 0;
  expect_tag(buf, off, kTagShare, "outcome share");
  OutcomeShare s;
  s.batch = read_u64(buf, off);
  s.instance = read_u64(buf, off);
  s.node = read_u32(buf, off);
  s.node_count = read_u32(buf, off);
  s.values = read_u64_vec(buf, off);
  expect_end(buf, off, "outcome share");
  return s;
}

}  // namespace tinybook::book::wire
