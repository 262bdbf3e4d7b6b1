#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

#include "transfer/transfer_message.h"

namespace blobxfer::transfer {

// Copy up to `max_length` bytes of `source` starting at `offset` into `frame`.
// The copy is further bounded by the frame capacity and the bytes left in
// `source`. Sets frame.offset and frame.length; returns the copied length
// (0 when `offset` is at or past the end of `source`).
std::size_t copy_to_chunk(std::span<const std::uint8_t> source, ChunkFrame& frame,
                          std::size_t offset, std::size_t max_length);

// Copy the frame payload into `destination` at frame.offset.
// Returns false without copying when the frame length exceeds the payload
// capacity or the range does not fit in `destination`.
bool copy_from_chunk(const ChunkFrame& frame, std::span<std::uint8_t> destination);

// True when the frame's own fields are self-consistent: a non-zero total,
// a length within capacity and a range that fits inside total_bytes.
[[nodiscard]] bool chunk_range_valid(const ChunkFrame& frame);

}  // namespace blobxfer::transfer
