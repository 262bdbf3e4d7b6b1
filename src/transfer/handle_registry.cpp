#include "transfer/handle_registry.h"

namespace blobxfer::transfer {

TransferHandle HandleRegistry::create() {
  TransferHandle handle{next_handle_++};
  records_.emplace(handle, HandleRecord{});
  return handle;
}

HandleRecord* HandleRegistry::find(TransferHandle handle) {
  auto it = records_.find(handle);
  return it != records_.end() ? &it->second : nullptr;
}

const HandleRecord* HandleRegistry::find(TransferHandle handle) const {
  auto it = records_.find(handle);
  return it != records_.end() ? &it->second : nullptr;
}

bool HandleRegistry::alive(TransferHandle handle) const {
  const auto* record = find(handle);
  return record != nullptr && record->alive;
}

bool HandleRegistry::destroy(TransferHandle handle) {
  auto it = records_.find(handle);
  if (it == records_.end() || !it->second.alive) {
    return false;
  }

  auto& record = it->second;
  record.alive = false;
  record.request.reset();
  record.outgoing.reset();
  record.incoming.reset();
  erase_if_released(it);
  return true;
}

void HandleRegistry::remove_outgoing_cleanup(TransferHandle handle) {
  auto it = records_.find(handle);
  if (it == records_.end()) {
    return;
  }
  it->second.outgoing_cleanup = false;
  erase_if_released(it);
}

void HandleRegistry::remove_incoming_cleanup(TransferHandle handle) {
  auto it = records_.find(handle);
  if (it == records_.end()) {
    return;
  }
  it->second.incoming_cleanup.reset();
  erase_if_released(it);
}

std::size_t HandleRegistry::outgoing_view_count() const {
  std::size_t count = 0;
  for (const auto& [handle, record] : records_) {
    if (record.outgoing) {
      ++count;
    }
  }
  return count;
}

void HandleRegistry::erase_if_released(std::map<TransferHandle, HandleRecord>::iterator it) {
  if (!it->second.alive && !it->second.has_cleanup()) {
    records_.erase(it);
  }
}

}  // namespace blobxfer::transfer
