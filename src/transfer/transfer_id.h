#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

namespace blobxfer::transfer {

// 128-bit identifier shared by both ends of one transfer.
struct TransferId {
  std::array<std::uint32_t, 4> words{};

  static constexpr std::size_t kWireSize = 16;

  [[nodiscard]] bool is_zero() const {
    return words[0] == 0 && words[1] == 0 && words[2] == 0 && words[3] == 0;
  }

  friend bool operator==(const TransferId& a, const TransferId& b) { return a.words == b.words; }
  friend bool operator!=(const TransferId& a, const TransferId& b) { return !(a == b); }
};

// Draw a fresh id from the libsodium CSPRNG. Never returns the all-zero id.
TransferId generate_transfer_id();

// "XXXXXXXX-XXXXXXXX-XXXXXXXX-XXXXXXXX", for logs.
std::string to_string(const TransferId& id);

struct TransferIdHash {
  std::size_t operator()(const TransferId& id) const noexcept {
    std::uint64_t h = (static_cast<std::uint64_t>(id.words[0]) << 32) | id.words[1];
    const std::uint64_t l = (static_cast<std::uint64_t>(id.words[2]) << 32) | id.words[3];
    h ^= l + 0x9E3779B97F4A7C15ULL + (h << 6) + (h >> 2);
    return static_cast<std::size_t>(h);
  }
};

// Opaque handle the owner holds for one transfer. Zero is never issued.
struct TransferHandle {
  std::uint64_t value{0};

  [[nodiscard]] bool valid() const { return value != 0; }

  friend bool operator==(TransferHandle a, TransferHandle b) { return a.value == b.value; }
  friend bool operator!=(TransferHandle a, TransferHandle b) { return a.value != b.value; }
  friend bool operator<(TransferHandle a, TransferHandle b) { return a.value < b.value; }
};

struct TransferHandleHash {
  std::size_t operator()(TransferHandle handle) const noexcept {
    return std::hash<std::uint64_t>{}(handle.value);
  }
};

// Opaque reference to a remote peer connection.
using PeerId = std::uint64_t;

}  // namespace blobxfer::transfer
