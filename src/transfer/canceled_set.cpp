#include "transfer/canceled_set.h"

#include <algorithm>

namespace blobxfer::transfer {

CanceledTransferSet::CanceledTransferSet(std::size_t capacity)
    : capacity_(std::max<std::size_t>(capacity, 1)) {}

bool CanceledTransferSet::add(const TransferId& id) {
  if (!ids_.insert(id).second) {
    return false;
  }
  insertion_order_.push_back(id);

  while (insertion_order_.size() > capacity_) {
    ids_.erase(insertion_order_.front());
    insertion_order_.pop_front();
    ++evictions_;
  }
  return true;
}

}  // namespace blobxfer::transfer
