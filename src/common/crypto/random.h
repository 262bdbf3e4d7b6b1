#pragma once

#include <cstdint>
#include <span>

namespace blobxfer::crypto {

// Fill `out` from the libsodium CSPRNG.
// Throws std::runtime_error if libsodium cannot be initialized.
void fill_random(std::span<std::uint8_t> out);

std::uint32_t random_uint32();

std::uint64_t random_uint64();

}  // namespace blobxfer::crypto
