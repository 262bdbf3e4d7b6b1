#include "common/crypto/digest.h"

#include <sodium.h>

#include <stdexcept>

namespace blobxfer::crypto {

Digest blob_digest(std::span<const std::uint8_t> data) {
  if (sodium_init() < 0) {
    throw std::runtime_error("libsodium initialization failed");
  }
  Digest out{};
  crypto_generichash(out.data(), out.size(), data.data(), data.size(), nullptr, 0);
  return out;
}

std::string to_hex(std::span<const std::uint8_t> data) {
  std::string out(data.size() * 2 + 1, '\0');
  sodium_bin2hex(out.data(), out.size(), data.data(), data.size());
  out.pop_back();
  return out;
}

}  // namespace blobxfer::crypto
