#include "transfer/chunk_codec.h"

#include <algorithm>
#include <cstring>

namespace blobxfer::transfer {

std::size_t copy_to_chunk(std::span<const std::uint8_t> source, ChunkFrame& frame,
                          std::size_t offset, std::size_t max_length) {
  const std::size_t available = offset < source.size() ? source.size() - offset : 0;
  const std::size_t length = std::min({available, max_length, frame.bytes.size()});

  if (length > 0) {
    std::memcpy(frame.bytes.data(), source.data() + offset, length);
  }

  frame.offset = static_cast<std::uint32_t>(offset);
  frame.length = static_cast<std::uint32_t>(length);
  return length;
}

bool copy_from_chunk(const ChunkFrame& frame, std::span<std::uint8_t> destination) {
  const std::size_t offset = frame.offset;
  const std::size_t length = frame.length;

  if (length > frame.bytes.size()) {
    return false;
  }
  if (offset > destination.size() || length > destination.size() - offset) {
    return false;
  }

  if (length > 0) {
    std::memcpy(destination.data() + offset, frame.bytes.data(), length);
  }
  return true;
}

bool chunk_range_valid(const ChunkFrame& frame) {
  if (frame.total_bytes == 0 || frame.length > kChunkPayloadCapacity) {
    return false;
  }
  const std::uint64_t end = static_cast<std::uint64_t>(frame.offset) + frame.length;
  return end <= frame.total_bytes;
}

}  // namespace blobxfer::transfer
