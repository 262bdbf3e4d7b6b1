#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>

namespace blobxfer::transfer {

struct SendQuotaStats {
  std::uint64_t ticks_accrued{0};
  std::uint64_t idle_resets{0};
  std::uint64_t bytes_granted{0};
  std::uint64_t bytes_debited{0};
  std::uint64_t deferred_shares{0};
};

/**
 * Divides a global per-second byte budget across the active outgoing transfers.
 *
 * Each tick the global quota grows by ceil(delta * max_bytes_per_second) while
 * at least one outgoing transfer exists, and resets to zero when none does.
 * Every transfer gets the same share, global_quota / active_count, recomputed
 * each tick. Share a transfer leaves unspent stays in the global quota and
 * carries over to later ticks.
 *
 * Thread Safety:
 *   Not thread-safe. Owned and driven by TransferEngine.
 */
class SendQuotaScheduler {
 public:
  using Seconds = std::chrono::duration<double>;

  SendQuotaScheduler(std::size_t max_bytes_per_second, std::size_t min_transfer_quota);

  // Accrue this tick's budget and compute the per-transfer share.
  void begin_tick(Seconds delta, std::size_t active_transfers);

  // Share each transfer may spend this tick.
  [[nodiscard]] std::size_t per_transfer_quota() const { return per_transfer_quota_; }

  // True when the share is too small to be worth emitting frames for.
  // Records the deferral in the stats.
  bool should_defer();

  // Charge `bytes` against the global quota.
  void debit(std::size_t bytes);

  [[nodiscard]] std::size_t global_quota() const { return global_quota_; }
  [[nodiscard]] std::size_t max_bytes_per_second() const { return max_bytes_per_second_; }
  [[nodiscard]] const SendQuotaStats& stats() const { return stats_; }

 private:
  std::size_t max_bytes_per_second_;
  std::size_t min_transfer_quota_;
  std::size_t global_quota_{0};
  std::size_t per_transfer_quota_{0};
  SendQuotaStats stats_;
};

}  // namespace blobxfer::transfer
