#include "tinybook/mpc/prg.hpp"

#include <cstring>
#include <stdexcept>

#include <openssl/rand.h>

namespace tinybook::mpc {

AesCtrPrg::AesCtrPrg(const Seed& seed) {
  if (AES_set_encrypt_key(seed.data(), 128, &key_) != 0) {
    throw std::runtime_error("AesCtrPrg: AES_set_encrypt_key failed");
  }
}

void AesCtrPrg::fill_words(u64 stream, u64* out, size_t words) const {
  std::array<uint8_t, 16> in{};
  std::array<uint8_t, 16> block{};
  std::memcpy(in.data() + 8, &stream, sizeof(u64));
  u64 counter = 0;
  size_t produced = 0;
  while (produced < words) {
    std::memcpy(in.data(), &counter, sizeof(u64));
    AES_encrypt(in.data(), block.data(), &key_);
    uint64_t w0 = 0, w1 = 0;
    std::memcpy(&w0, block.data(), sizeof(uint64_t));
    std::memcpy(&w1, block.data() + 8, sizeof(uint64_t));
    out[produced++] = w0;
    if (produced < words) out[produced++] = w1;
    counter++;
  }
}

std::vector<u64> AesCtrPrg::words(u64 stream, size_t n) const {
  std::vector<u64> out(n);
  fill_words(stream, out.data(), n);
  return out;
}

Seed SecureRand::rand_seed() {
  Seed s{};
  if (RAND_bytes(s.data(), static_cast<int>(s.size())) != 1) {
    throw std::runtime_error("SecureRand: RAND_bytes failed");
  }
  return s;
}

}  // namespace tinybook::mpc
