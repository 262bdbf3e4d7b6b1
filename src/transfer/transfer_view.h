#pragma once

#include <algorithm>
#include <cstddef>

#include "transfer/tick.h"
#include "transfer/transfer_id.h"

namespace blobxfer::transfer {

// Owner-visible progress of an outgoing transfer.
struct OutgoingTransferView {
  Seconds elapsed_time{0.0};
  std::size_t total_bytes{0};
  std::size_t bytes_sent{0};
  PeerId target{0};

  [[nodiscard]] bool is_complete() const { return bytes_sent >= total_bytes; }
  [[nodiscard]] bool in_progress() const { return bytes_sent < total_bytes; }
  [[nodiscard]] float progress() const {
    if (total_bytes == 0) {
      return 0.0F;
    }
    return std::clamp(static_cast<float>(bytes_sent) / static_cast<float>(total_bytes), 0.0F, 1.0F);
  }
};

// Owner-visible progress of an incoming transfer.
struct IncomingTransferView {
  Seconds elapsed_time{0.0};
  std::size_t total_bytes{0};
  std::size_t bytes_received{0};
  PeerId source{0};

  [[nodiscard]] bool is_complete() const { return bytes_received >= total_bytes; }
  [[nodiscard]] bool in_progress() const { return bytes_received < total_bytes; }
  [[nodiscard]] float progress() const {
    if (total_bytes == 0) {
      return 0.0F;
    }
    return std::clamp(static_cast<float>(bytes_received) / static_cast<float>(total_bytes), 0.0F,
                      1.0F);
  }
};

}  // namespace blobxfer::transfer
