#include "common/crypto/random.h"

#include <sodium.h>

#include <stdexcept>

namespace {
void ensure_sodium_ready() {
  static const bool ready = [] { return sodium_init() >= 0; }();
  if (!ready) {
    throw std::runtime_error("libsodium initialization failed");
  }
}
}  // namespace

namespace blobxfer::crypto {

void fill_random(std::span<std::uint8_t> out) {
  ensure_sodium_ready();
  if (!out.empty()) {
    randombytes_buf(out.data(), out.size());
  }
}

std::uint32_t random_uint32() {
  ensure_sodium_ready();
  return randombytes_random();
}

std::uint64_t random_uint64() {
  ensure_sodium_ready();
  std::uint64_t value = 0;
  randombytes_buf(&value, sizeof(value));
  return value;
}

}  // namespace blobxfer::crypto
