#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <vector>

#include "transfer/transfer_id.h"
#include "transfer/transfer_view.h"

namespace blobxfer::transfer {

// A blob waiting for admission on the next tick.
struct OutgoingRequest {
  std::vector<std::uint8_t> blob;
  PeerId target{0};
};

// Everything attached to one owner handle.
//
// Views are what the owner sees. Cleanup markers outlive the views: when the
// handle is destroyed while a marker is attached, the record stays behind so
// the engine can notice the destruction and dispose its internal state.
struct HandleRecord {
  bool alive{true};
  std::optional<OutgoingRequest> request;
  std::optional<OutgoingTransferView> outgoing;
  bool outgoing_cleanup{false};
  std::optional<IncomingTransferView> incoming;
  std::optional<TransferId> incoming_cleanup;

  [[nodiscard]] bool has_cleanup() const { return outgoing_cleanup || incoming_cleanup.has_value(); }
};

// Arena of transfer handles. Handles are issued in increasing order and never reused.
class HandleRegistry {
 public:
  HandleRegistry() = default;

  TransferHandle create();

  HandleRecord* find(TransferHandle handle);
  const HandleRecord* find(TransferHandle handle) const;

  // True while the owner-facing handle exists (not yet destroyed).
  [[nodiscard]] bool alive(TransferHandle handle) const;

  // Destroy the owner-facing handle: drops the request and both views.
  // The record is kept while a cleanup marker is attached.
  // Returns false if the handle was already destroyed or never existed.
  bool destroy(TransferHandle handle);

  void remove_outgoing_cleanup(TransferHandle handle);
  void remove_incoming_cleanup(TransferHandle handle);

  // Handles in ascending order matching a predicate on the record.
  template <typename Pred>
  std::vector<TransferHandle> select(Pred&& pred) const {
    std::vector<TransferHandle> out;
    for (const auto& [handle, record] : records_) {
      if (pred(record)) {
        out.push_back(handle);
      }
    }
    return out;
  }

  [[nodiscard]] std::size_t size() const { return records_.size(); }

  // Number of live handles with an outgoing view.
  [[nodiscard]] std::size_t outgoing_view_count() const;

 private:
  void erase_if_released(std::map<TransferHandle, HandleRecord>::iterator it);

  std::map<TransferHandle, HandleRecord> records_;
  std::uint64_t next_handle_{1};
};

}  // namespace blobxfer::transfer
