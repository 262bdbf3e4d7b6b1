#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

#include "transfer/transfer_message.h"

namespace blobxfer::transfer {

// Serializes and parses TransferMessage structures for wire transmission.
// Wire format (all integers big-endian):
//   [kind: 1 byte]
//   For kChunk:
//     [transfer_id: 16 bytes, four 32-bit words]
//     [total_bytes: 4 bytes]
//     [offset: 4 bytes]
//     [length: 4 bytes]
//     [payload: 256 bytes, fixed; bytes past `length` are zero]
//   For kCancelOutgoing and kCancelIncoming:
//     [transfer_id: 16 bytes]
class MessageCodec {
 public:
  static std::vector<std::uint8_t> encode(const TransferMessage& message);

  // Encode into a pre-allocated buffer. Returns the number of bytes written,
  // or 0 if the buffer is too small.
  static std::size_t encode_to(const TransferMessage& message, std::span<std::uint8_t> output);

  // Parse bytes into a TransferMessage. Returns nullopt on malformed input.
  static std::optional<TransferMessage> decode(std::span<const std::uint8_t> data);

  static std::size_t encoded_size(MessageKind kind);

  static constexpr std::size_t kChunkSize = 1 + TransferId::kWireSize + 4 + 4 + 4 +
                                            kChunkPayloadCapacity;  // 285 bytes
  static constexpr std::size_t kCancelSize = 1 + TransferId::kWireSize;  // 17 bytes
};

}  // namespace blobxfer::transfer
