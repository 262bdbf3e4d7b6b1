#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

#include "transfer/transfer_id.h"

namespace blobxfer::transfer {

// Payload capacity of one chunk frame. Protocol constant: both peers must agree.
inline constexpr std::size_t kChunkPayloadCapacity = 256;

// One bounded byte range of a blob. Only the first `length` payload bytes are meaningful.
struct ChunkFrame {
  TransferId transfer_id;
  std::uint32_t total_bytes{0};
  std::uint32_t offset{0};
  std::uint32_t length{0};
  std::array<std::uint8_t, kChunkPayloadCapacity> bytes{};
};

// Sent by the receiver when it abandons an incoming transfer.
// From the recipient's point of view the transfer is outgoing.
struct CancelOutgoingFrame {
  TransferId transfer_id;
};

// Sent by the sender when it abandons an outgoing transfer.
// From the recipient's point of view the transfer is incoming.
struct CancelIncomingFrame {
  TransferId transfer_id;
};

enum class MessageKind : std::uint8_t { kChunk = 1, kCancelOutgoing = 2, kCancelIncoming = 3 };

struct TransferMessage {
  MessageKind kind{};
  ChunkFrame chunk;
  CancelOutgoingFrame cancel_outgoing;
  CancelIncomingFrame cancel_incoming;
};

TransferMessage make_chunk_message(const ChunkFrame& chunk);

TransferMessage make_cancel_outgoing_message(const TransferId& id);

TransferMessage make_cancel_incoming_message(const TransferId& id);

// Id carried by any message kind.
const TransferId& message_transfer_id(const TransferMessage& message);

const char* to_string(MessageKind kind);

}  // namespace blobxfer::transfer
