#pragma once

#include <cstddef>
#include <cstdint>
#include <unordered_map>
#include <vector>

#include "transfer/tick.h"
#include "transfer/transfer_id.h"

namespace blobxfer::transfer {

// Receive-side state of one transfer. Owns the reassembly buffer.
struct IncomingTransfer {
  TransferId transfer_id;
  TransferHandle handle;
  PeerId source{0};

  // Pre-sized to total_bytes and zero-filled on creation. Emptied if the
  // owner takes the blob out before the record is removed.
  std::vector<std::uint8_t> blob;
  std::uint32_t total_bytes{0};

  Seconds start_time{0.0};

  // Saturates at total_bytes. Duplicate chunks still count, so this is a
  // progress value rather than an exact coverage measure.
  std::size_t bytes_received{0};

  std::uint32_t age_since_complete{0};

  [[nodiscard]] bool is_complete() const { return bytes_received >= total_bytes; }
  [[nodiscard]] bool in_progress() const { return bytes_received < total_bytes; }
};

// Incoming transfers indexed by id and by owner handle.
class IncomingTransferTable {
 public:
  IncomingTransferTable() = default;

  IncomingTransferTable(const IncomingTransferTable&) = delete;
  IncomingTransferTable& operator=(const IncomingTransferTable&) = delete;

  // Insert a new record. Returns nullptr if the id or handle is already present.
  IncomingTransfer* add(IncomingTransfer transfer);

  IncomingTransfer* find(const TransferId& id);
  IncomingTransfer* find(TransferHandle handle);
  const IncomingTransfer* find(const TransferId& id) const;
  const IncomingTransfer* find(TransferHandle handle) const;

  // Remove and dispose a record. Returns false if the id is unknown.
  bool remove(const TransferId& id);

  // Dispose every record. Returns the number disposed.
  std::size_t clear();

  [[nodiscard]] std::size_t size() const { return transfers_.size(); }
  [[nodiscard]] bool empty() const { return transfers_.empty(); }
  [[nodiscard]] std::uint64_t disposed() const { return disposed_; }

  // Bytes currently held by reassembly buffers.
  [[nodiscard]] std::size_t memory_usage() const;

 private:
  std::unordered_map<TransferId, IncomingTransfer, TransferIdHash> transfers_;
  std::unordered_map<TransferHandle, TransferId, TransferHandleHash> handle_index_;
  std::uint64_t disposed_{0};
};

}  // namespace blobxfer::transfer
