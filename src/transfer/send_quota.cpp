#include "transfer/send_quota.h"

#include <algorithm>
#include <cmath>

#include "common/logging/logger.h"

namespace blobxfer::transfer {

SendQuotaScheduler::SendQuotaScheduler(std::size_t max_bytes_per_second,
                                       std::size_t min_transfer_quota)
    : max_bytes_per_second_(max_bytes_per_second), min_transfer_quota_(min_transfer_quota) {}

void SendQuotaScheduler::begin_tick(Seconds delta, std::size_t active_transfers) {
  if (active_transfers == 0) {
    // Only accumulate while there is something to send.
    if (global_quota_ != 0) {
      ++stats_.idle_resets;
    }
    global_quota_ = 0;
    per_transfer_quota_ = 0;
    return;
  }

  const double seconds = std::max(delta.count(), 0.0);
  const auto granted = static_cast<std::size_t>(
      std::ceil(seconds * static_cast<double>(max_bytes_per_second_)));

  global_quota_ += granted;
  per_transfer_quota_ = global_quota_ / std::max<std::size_t>(active_transfers, 1);

  ++stats_.ticks_accrued;
  stats_.bytes_granted += granted;
}

bool SendQuotaScheduler::should_defer() {
  if (per_transfer_quota_ > min_transfer_quota_) {
    return false;
  }
  ++stats_.deferred_shares;
  return true;
}

void SendQuotaScheduler::debit(std::size_t bytes) {
  if (bytes > global_quota_) {
    LOG_ERROR("Send quota overdrawn: debit {} exceeds remaining {}", bytes, global_quota_);
    bytes = global_quota_;
  }
  global_quota_ -= bytes;
  stats_.bytes_debited += bytes;
}

}  // namespace blobxfer::transfer
