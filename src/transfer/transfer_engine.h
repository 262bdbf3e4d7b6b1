#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <vector>

#include "common/utils/thread_checker.h"
#include "transfer/canceled_set.h"
#include "transfer/command_buffer.h"
#include "transfer/handle_registry.h"
#include "transfer/incoming_table.h"
#include "transfer/outgoing_table.h"
#include "transfer/send_quota.h"
#include "transfer/tick.h"
#include "transfer/transfer_config.h"
#include "transfer/transfer_message.h"
#include "transfer/transfer_view.h"

namespace blobxfer::transfer {

// Counters for observability. Monotonic over the engine's lifetime, except
// incoming_buffered_bytes, which is sampled at the end of each tick.
struct TransferEngineStats {
  std::uint64_t ticks{0};

  // Admission.
  std::uint64_t transfers_admitted{0};
  std::uint64_t transfers_rejected{0};

  // Outgoing lifecycle.
  std::uint64_t outgoing_completed{0};
  std::uint64_t outgoing_disposed{0};
  std::uint64_t outgoing_aged_out{0};
  std::uint64_t outgoing_canceled_local{0};
  std::uint64_t outgoing_canceled_remote{0};
  std::uint64_t outgoing_peer_lost{0};

  // Incoming lifecycle.
  std::uint64_t incoming_created{0};
  std::uint64_t incoming_completed{0};
  std::uint64_t incoming_disposed{0};
  std::uint64_t incoming_aged_out{0};
  std::uint64_t incoming_canceled_local{0};
  std::uint64_t incoming_canceled_remote{0};
  std::uint64_t incoming_peer_lost{0};

  // Chunks.
  std::uint64_t chunks_sent{0};
  std::uint64_t chunks_received{0};
  std::uint64_t chunks_deferred{0};
  std::uint64_t chunks_dropped_canceled{0};
  std::uint64_t chunks_rejected{0};
  std::uint64_t bytes_sent{0};
  std::uint64_t bytes_received{0};

  // Control.
  std::uint64_t cancel_notices_sent{0};
  std::uint64_t cancel_notices_ignored{0};
  std::uint64_t malformed_messages{0};
  std::uint64_t internal_inconsistencies{0};
  std::uint64_t messages_sent{0};

  // Bytes held by reassembly buffers.
  std::uint64_t incoming_buffered_bytes{0};
};

/**
 * Moves blobs between peers as rate-limited chunk frames.
 *
 * The engine owns every outgoing and incoming transfer. The owner starts
 * outgoing transfers with begin_outgoing_transfer(), observes both directions
 * through handles, and releases a handle to acknowledge completion or to
 * cancel. Inbound messages are queued with on_message() or on_datagram() and
 * applied on the next update().
 *
 * update() runs one tick in a fixed order: admission, quota accrual, outgoing
 * lifecycle and chunk emission, outgoing cleanup, inbound cancel-outgoing,
 * inbound chunks, incoming lifecycle, incoming cleanup, inbound
 * cancel-incoming. Structural changes and outgoing messages made during the
 * tick are committed together at its end.
 *
 * Thread Safety:
 *   Not thread-safe. Construct, drive and query from one thread.
 */
class TransferEngine {
 public:
  using SendFn = std::function<void(PeerId, const TransferMessage&)>;
  using PeerAliveFn = std::function<bool(PeerId)>;

  // `send_fn` is called at the end of each tick for every message produced.
  // `peer_alive_fn` reports whether a peer reference still resolves; when it
  // is empty every peer is treated as alive.
  TransferEngine(TransferConfig config, SendFn send_fn, PeerAliveFn peer_alive_fn = {});
  ~TransferEngine();

  TransferEngine(const TransferEngine&) = delete;
  TransferEngine& operator=(const TransferEngine&) = delete;

  // ========== Owner API ==========

  // Request a new outgoing transfer. The engine takes the buffer. Admission
  // happens on the next update(); an empty blob is rejected there and its
  // handle destroyed.
  TransferHandle begin_outgoing_transfer(std::vector<std::uint8_t> blob, PeerId target);

  // Release a handle: acknowledges a completed transfer or cancels one in
  // progress. Returns false if the handle does not exist (already released,
  // force-destroyed, or never issued).
  bool release(TransferHandle handle);

  [[nodiscard]] bool exists(TransferHandle handle) const;

  [[nodiscard]] std::optional<OutgoingTransferView> outgoing(TransferHandle handle) const;
  [[nodiscard]] std::optional<IncomingTransferView> incoming(TransferHandle handle) const;

  // Read-only view of the reassembly buffer. Valid until the next update()
  // or release().
  [[nodiscard]] std::optional<std::span<const std::uint8_t>> incoming_blob(
      TransferHandle handle) const;

  // Move a completed blob out and release its handle.
  std::optional<std::vector<std::uint8_t>> take_incoming_blob(TransferHandle handle);

  // Handles with a visible view, in ascending order.
  [[nodiscard]] std::vector<TransferHandle> outgoing_transfers() const;
  [[nodiscard]] std::vector<TransferHandle> incoming_transfers() const;

  // ========== Transport API ==========

  // Queue a message received from `source`.
  void on_message(PeerId source, const TransferMessage& message);

  // Decode and queue a wire message. Returns false if the bytes are malformed.
  bool on_datagram(PeerId source, std::span<const std::uint8_t> data);

  // ========== Tick ==========

  void update(const TickTime& tick);

  // ========== State Queries ==========

  [[nodiscard]] const TransferEngineStats& stats() const { return stats_; }
  [[nodiscard]] const TransferConfig& config() const { return config_; }
  [[nodiscard]] const SendQuotaScheduler& quota() const { return quota_; }
  [[nodiscard]] const CanceledTransferSet& canceled_transfers() const { return canceled_; }

  [[nodiscard]] std::size_t outgoing_count() const { return outgoing_.size(); }
  [[nodiscard]] std::size_t incoming_count() const { return incoming_.size(); }
  [[nodiscard]] std::size_t pending_inbound() const { return inbox_.size(); }

 private:
  struct InboundMessage {
    PeerId source{0};
    TransferMessage message;
    bool consumed{false};
  };

  void admit_requests(const TickTime& tick);
  void update_outgoing(const TickTime& tick);
  void emit_chunks(OutgoingTransfer& transfer, OutgoingTransferView& view, const TickTime& tick);
  void cleanup_outgoing();
  void process_cancel_outgoing();
  void receive_chunks(const TickTime& tick);
  void start_incoming(PeerId source, const ChunkFrame& chunk, const TickTime& tick);
  void update_incoming();
  void cleanup_incoming();
  void process_cancel_incoming();
  void compact_inbox();

  [[nodiscard]] bool peer_alive(PeerId peer) const;
  void log_incoming_complete(const IncomingTransfer& transfer, const TickTime& tick) const;

  TransferConfig config_;
  SendFn send_fn_;
  PeerAliveFn peer_alive_fn_;

  HandleRegistry registry_;
  CommandBuffer commands_;
  OutgoingTransferTable outgoing_;
  IncomingTransferTable incoming_;
  CanceledTransferSet canceled_;
  SendQuotaScheduler quota_;
  std::vector<InboundMessage> inbox_;

  TransferEngineStats stats_;

  BLOBXFER_THREAD_CHECKER(thread_checker_);
};

}  // namespace blobxfer::transfer
