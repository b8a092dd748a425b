#pragma once

#include "tinybook/core/types.hpp"

#include <array>
#include <cstddef>
#include <vector>

#include <openssl/aes.h>

namespace tinybook::mpc {

using core::u64;
using Seed = std::array<uint8_t, 16>;

// AES-128-CTR keystream. Block layout: bytes [0,8) block counter, bytes
// [8,16) stream id, both little-endian. Distinct streams never overlap.
class AesCtrPrg {
 public:
  explicit AesCtrPrg(const Seed& seed);

  void fill_words(u64 stream, u64* out, size_t words) const;
  std::vector<u64> words(u64 stream, size_t n) const;

 private:
  AES_KEY key_;
};

// OS-backed randomness (OpenSSL RAND_bytes). Throws if the DRBG fails.
struct SecureRand {
  Seed rand_seed();
};

}  // namespace tinybook::mpc
