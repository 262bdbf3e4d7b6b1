#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <unordered_set>

#include "transfer/transfer_id.h"

namespace blobxfer::transfer {

// Ids of incoming transfers the local side abandoned. Chunks for these ids
// are discarded instead of starting a new reassembly.
//
// Bounded: once `capacity` ids are held, inserting evicts the oldest one.
class CanceledTransferSet {
 public:
  explicit CanceledTransferSet(std::size_t capacity = 1024);

  // Returns false if the id was already present.
  bool add(const TransferId& id);

  [[nodiscard]] bool contains(const TransferId& id) const { return ids_.count(id) != 0; }

  [[nodiscard]] std::size_t size() const { return ids_.size(); }
  [[nodiscard]] std::size_t capacity() const { return capacity_; }
  [[nodiscard]] std::uint64_t evictions() const { return evictions_; }

 private:
  std::size_t capacity_;
  std::unordered_set<TransferId, TransferIdHash> ids_;
  std::deque<TransferId> insertion_order_;
  std::uint64_t evictions_{0};
};

}  // namespace blobxfer::transfer
