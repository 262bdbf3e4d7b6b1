#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>

namespace blobxfer::crypto {

inline constexpr std::size_t kDigestSize = 32;

using Digest = std::array<std::uint8_t, kDigestSize>;

// BLAKE2b-256 of `data`. Used to compare a sent blob with its reassembly.
Digest blob_digest(std::span<const std::uint8_t> data);

// Lowercase hex encoding.
std::string to_hex(std::span<const std::uint8_t> data);

}  // namespace blobxfer::crypto
