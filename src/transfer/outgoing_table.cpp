#include "transfer/outgoing_table.h"

#include <utility>

namespace blobxfer::transfer {

OutgoingTransfer* OutgoingTransferTable::add(OutgoingTransfer transfer) {
  if (transfers_.count(transfer.transfer_id) != 0 || handle_index_.count(transfer.handle) != 0) {
    return nullptr;
  }

  const TransferId id = transfer.transfer_id;
  handle_index_.emplace(transfer.handle, id);
  auto [it, inserted] = transfers_.emplace(id, std::move(transfer));
  return &it->second;
}

OutgoingTransfer* OutgoingTransferTable::find(const TransferId& id) {
  auto it = transfers_.find(id);
  if (it != transfers_.end()) {
    return &it->second;
  }
  return nullptr;
}

OutgoingTransfer* OutgoingTransferTable::find(TransferHandle handle) {
  auto it = handle_index_.find(handle);
  if (it != handle_index_.end()) {
    return find(it->second);
  }
  return nullptr;
}

const OutgoingTransfer* OutgoingTransferTable::find(const TransferId& id) const {
  auto it = transfers_.find(id);
  return it != transfers_.end() ? &it->second : nullptr;
}

const OutgoingTransfer* OutgoingTransferTable::find(TransferHandle handle) const {
  auto it = handle_index_.find(handle);
  return it != handle_index_.end() ? find(it->second) : nullptr;
}

bool OutgoingTransferTable::remove(const TransferId& id) {
  auto it = transfers_.find(id);
  if (it == transfers_.end()) {
    return false;
  }

  handle_index_.erase(it->second.handle);
  transfers_.erase(it);
  ++disposed_;
  return true;
}

std::size_t OutgoingTransferTable::clear() {
  const std::size_t count = transfers_.size();
  transfers_.clear();
  handle_index_.clear();
  disposed_ += count;
  return count;
}

}  // namespace blobxfer::transfer
