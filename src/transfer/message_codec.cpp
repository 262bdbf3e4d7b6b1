#include "transfer/message_codec.h"

#include <algorithm>
#include <cstring>

namespace {

std::size_t write_u32(std::span<std::uint8_t> out, std::size_t pos, std::uint32_t value) {
  out[pos] = static_cast<std::uint8_t>((value >> 24) & 0xFF);
  out[pos + 1] = static_cast<std::uint8_t>((value >> 16) & 0xFF);
  out[pos + 2] = static_cast<std::uint8_t>((value >> 8) & 0xFF);
  out[pos + 3] = static_cast<std::uint8_t>(value & 0xFF);
  return pos + 4;
}

std::uint32_t read_u32(std::span<const std::uint8_t> data, std::size_t offset) {
  return (static_cast<std::uint32_t>(data[offset]) << 24) |
         (static_cast<std::uint32_t>(data[offset + 1]) << 16) |
         (static_cast<std::uint32_t>(data[offset + 2]) << 8) |
         static_cast<std::uint32_t>(data[offset + 3]);
}

std::size_t write_id(std::span<std::uint8_t> out, std::size_t pos,
                     const blobxfer::transfer::TransferId& id) {
  for (const auto word : id.words) {
    pos = write_u32(out, pos, word);
  }
  return pos;
}

blobxfer::transfer::TransferId read_id(std::span<const std::uint8_t> data, std::size_t offset) {
  blobxfer::transfer::TransferId id;
  for (std::size_t i = 0; i < id.words.size(); ++i) {
    id.words[i] = read_u32(data, offset + 4 * i);
  }
  return id;
}

}  // namespace

namespace blobxfer::transfer {

std::size_t MessageCodec::encoded_size(MessageKind kind) {
  switch (kind) {
    case MessageKind::kChunk:
      return kChunkSize;
    case MessageKind::kCancelOutgoing:
    case MessageKind::kCancelIncoming:
      return kCancelSize;
  }
  return 0;
}

std::vector<std::uint8_t> MessageCodec::encode(const TransferMessage& message) {
  std::vector<std::uint8_t> out(encoded_size(message.kind));
  const std::size_t written = encode_to(message, out);
  out.resize(written);
  return out;
}

std::size_t MessageCodec::encode_to(const TransferMessage& message,
                                    std::span<std::uint8_t> output) {
  const std::size_t size = encoded_size(message.kind);
  if (size == 0 || output.size() < size) {
    return 0;
  }

  output[0] = static_cast<std::uint8_t>(message.kind);
  std::size_t pos = 1;

  switch (message.kind) {
    case MessageKind::kChunk: {
      const auto& chunk = message.chunk;
      pos = write_id(output, pos, chunk.transfer_id);
      pos = write_u32(output, pos, chunk.total_bytes);
      pos = write_u32(output, pos, chunk.offset);
      pos = write_u32(output, pos, chunk.length);
      const std::size_t length = std::min<std::size_t>(chunk.length, chunk.bytes.size());
      std::memcpy(output.data() + pos, chunk.bytes.data(), length);
      std::memset(output.data() + pos + length, 0, chunk.bytes.size() - length);
      pos += chunk.bytes.size();
      break;
    }
    case MessageKind::kCancelOutgoing:
      pos = write_id(output, pos, message.cancel_outgoing.transfer_id);
      break;
    case MessageKind::kCancelIncoming:
      pos = write_id(output, pos, message.cancel_incoming.transfer_id);
      break;
  }

  return pos;
}

std::optional<TransferMessage> MessageCodec::decode(std::span<const std::uint8_t> data) {
  if (data.empty()) {
    return std::nullopt;
  }

  TransferMessage message{};
  const auto kind = static_cast<MessageKind>(data[0]);
  message.kind = kind;

  switch (kind) {
    case MessageKind::kChunk: {
      if (data.size() != kChunkSize) {
        return std::nullopt;
      }
      auto& chunk = message.chunk;
      chunk.transfer_id = read_id(data, 1);
      chunk.total_bytes = read_u32(data, 17);
      chunk.offset = read_u32(data, 21);
      chunk.length = read_u32(data, 25);
      if (chunk.length > chunk.bytes.size()) {
        return std::nullopt;
      }
      std::memcpy(chunk.bytes.data(), data.data() + 29, chunk.bytes.size());
      break;
    }
    case MessageKind::kCancelOutgoing: {
      if (data.size() != kCancelSize) {
        return std::nullopt;
      }
      message.cancel_outgoing.transfer_id = read_id(data, 1);
      break;
    }
    case MessageKind::kCancelIncoming: {
      if (data.size() != kCancelSize) {
        return std::nullopt;
      }
      message.cancel_incoming.transfer_id = read_id(data, 1);
      break;
    }
    default:
      return std::nullopt;
  }

  return message;
}

TransferMessage make_chunk_message(const ChunkFrame& chunk) {
  TransferMessage message{};
  message.kind = MessageKind::kChunk;
  message.chunk = chunk;
  return message;
}

TransferMessage make_cancel_outgoing_message(const TransferId& id) {
  TransferMessage message{};
  message.kind = MessageKind::kCancelOutgoing;
  message.cancel_outgoing.transfer_id = id;
  return message;
}

TransferMessage make_cancel_incoming_message(const TransferId& id) {
  TransferMessage message{};
  message.kind = MessageKind::kCancelIncoming;
  message.cancel_incoming.transfer_id = id;
  return message;
}

const TransferId& message_transfer_id(const TransferMessage& message) {
  switch (message.kind) {
    case MessageKind::kCancelOutgoing:
      return message.cancel_outgoing.transfer_id;
    case MessageKind::kCancelIncoming:
      return message.cancel_incoming.transfer_id;
    case MessageKind::kChunk:
      break;
  }
  return message.chunk.transfer_id;
}

const char* to_string(MessageKind kind) {
  switch (kind) {
    case MessageKind::kChunk:
      return "chunk";
    case MessageKind::kCancelOutgoing:
      return "cancel-outgoing";
    case MessageKind::kCancelIncoming:
      return "cancel-incoming";
  }
  return "unknown";
}

}  // namespace blobxfer::transfer
