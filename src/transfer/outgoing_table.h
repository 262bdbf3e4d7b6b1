#pragma once

#include <cstddef>
#include <cstdint>
#include <unordered_map>
#include <vector>

#include "transfer/tick.h"
#include "transfer/transfer_id.h"

namespace blobxfer::transfer {

// Send-side state of one transfer. Owns the blob from admission until removal.
struct OutgoingTransfer {
  TransferId transfer_id;
  TransferHandle handle;
  PeerId target{0};

  // Never modified after admission.
  std::vector<std::uint8_t> blob;

  Seconds start_time{0.0};
  std::size_t bytes_sent{0};

  // Ticks since bytes_sent reached total_bytes().
  std::uint32_t age_since_complete{0};

  [[nodiscard]] std::size_t total_bytes() const { return blob.size(); }
  [[nodiscard]] bool is_complete() const { return bytes_sent >= blob.size(); }
  [[nodiscard]] bool in_progress() const { return bytes_sent < blob.size(); }
};

// Outgoing transfers indexed by id and by owner handle.
// Removing a record disposes its blob; every record is disposed exactly once.
class OutgoingTransferTable {
 public:
  OutgoingTransferTable() = default;

  OutgoingTransferTable(const OutgoingTransferTable&) = delete;
  OutgoingTransferTable& operator=(const OutgoingTransferTable&) = delete;

  // Insert a new record. Returns nullptr if the id or handle is already present.
  OutgoingTransfer* add(OutgoingTransfer transfer);

  OutgoingTransfer* find(const TransferId& id);
  OutgoingTransfer* find(TransferHandle handle);
  const OutgoingTransfer* find(const TransferId& id) const;
  const OutgoingTransfer* find(TransferHandle handle) const;

  // Remove and dispose a record. Returns false if the id is unknown.
  bool remove(const TransferId& id);

  // Dispose every record. Returns the number disposed.
  std::size_t clear();

  [[nodiscard]] std::size_t size() const { return transfers_.size(); }
  [[nodiscard]] bool empty() const { return transfers_.empty(); }

  // Total blobs released by remove() and clear().
  [[nodiscard]] std::uint64_t disposed() const { return disposed_; }

 private:
  std::unordered_map<TransferId, OutgoingTransfer, TransferIdHash> transfers_;
  std::unordered_map<TransferHandle, TransferId, TransferHandleHash> handle_index_;
  std::uint64_t disposed_{0};
};

}  // namespace blobxfer::transfer
