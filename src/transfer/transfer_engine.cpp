#include "transfer/transfer_engine.h"

#include <algorithm>
#include <limits>
#include <utility>

#include "common/logging/logger.h"
#include "transfer/chunk_codec.h"
#include "transfer/message_codec.h"

namespace blobxfer::transfer {

TransferEngine::TransferEngine(TransferConfig config, SendFn send_fn, PeerAliveFn peer_alive_fn)
    : config_(config),
      send_fn_(std::move(send_fn)),
      peer_alive_fn_(std::move(peer_alive_fn)),
      canceled_(config_.canceled_set_capacity),
      quota_(config_.max_bytes_per_second, config_.min_transfer_quota) {
  LOG_DEBUG("TransferEngine initialized: chunk={}B, rate={}B/s, max_age={} ticks",
            config_.max_chunk_size, config_.max_bytes_per_second,
            config_.max_age_since_completion);
}

TransferEngine::~TransferEngine() {
  const std::size_t outgoing = outgoing_.clear();
  const std::size_t incoming = incoming_.clear();
  if (outgoing != 0 || incoming != 0) {
    LOG_DEBUG("TransferEngine shutdown disposed {} outgoing and {} incoming transfers", outgoing,
              incoming);
  }
}

// ========== Owner API ==========

TransferHandle TransferEngine::begin_outgoing_transfer(std::vector<std::uint8_t> blob,
                                                        PeerId target) {
  BLOBXFER_DCHECK_THREAD(thread_checker_);
  const TransferHandle handle = registry_.create();
  auto* record = registry_.find(handle);
  record->request = OutgoingRequest{std::move(blob), target};
  return handle;
}

bool TransferEngine::release(TransferHandle handle) {
  BLOBXFER_DCHECK_THREAD(thread_checker_);
  if (!registry_.destroy(handle)) {
    return false;
  }
  LOG_DEBUG("Released transfer handle {}", handle.value);
  return true;
}

bool TransferEngine::exists(TransferHandle handle) const { return registry_.alive(handle); }

std::optional<OutgoingTransferView> TransferEngine::outgoing(TransferHandle handle) const {
  const auto* record = registry_.find(handle);
  if (record == nullptr || !record->alive || !record->outgoing) {
    return std::nullopt;
  }
  return record->outgoing;
}

std::optional<IncomingTransferView> TransferEngine::incoming(TransferHandle handle) const {
  const auto* record = registry_.find(handle);
  if (record == nullptr || !record->alive || !record->incoming) {
    return std::nullopt;
  }
  return record->incoming;
}

std::optional<std::span<const std::uint8_t>> TransferEngine::incoming_blob(
    TransferHandle handle) const {
  if (!incoming(handle)) {
    return std::nullopt;
  }
  const auto* transfer = incoming_.find(handle);
  if (transfer == nullptr) {
    return std::nullopt;
  }
  return std::span<const std::uint8_t>(transfer->blob);
}

std::optional<std::vector<std::uint8_t>> TransferEngine::take_incoming_blob(
    TransferHandle handle) {
  BLOBXFER_DCHECK_THREAD(thread_checker_);
  if (!incoming(handle)) {
    return std::nullopt;
  }
  auto* transfer = incoming_.find(handle);
  if (transfer == nullptr || !transfer->is_complete()) {
    return std::nullopt;
  }

  std::vector<std::uint8_t> blob = std::move(transfer->blob);
  transfer->blob.clear();
  registry_.destroy(handle);
  return blob;
}

std::vector<TransferHandle> TransferEngine::outgoing_transfers() const {
  return registry_.select(
      [](const HandleRecord& record) { return record.alive && record.outgoing.has_value(); });
}

std::vector<TransferHandle> TransferEngine::incoming_transfers() const {
  return registry_.select(
      [](const HandleRecord& record) { return record.alive && record.incoming.has_value(); });
}

// ========== Transport API ==========

void TransferEngine::on_message(PeerId source, const TransferMessage& message) {
  BLOBXFER_DCHECK_THREAD(thread_checker_);
  if (config_.trace_chunks) {
    LOG_TRACE("<<< {} {} from peer {}", to_string(message.kind),
              to_string(message_transfer_id(message)), source);
  }
  inbox_.push_back(InboundMessage{source, message, false});
}

bool TransferEngine::on_datagram(PeerId source, std::span<const std::uint8_t> data) {
  auto message = MessageCodec::decode(data);
  if (!message) {
    ++stats_.malformed_messages;
    LOG_WARN("Dropping malformed transfer message ({} bytes) from peer {}", data.size(), source);
    return false;
  }
  on_message(source, *message);
  return true;
}

// ========== Tick ==========

void TransferEngine::update(const TickTime& tick) {
  BLOBXFER_DCHECK_THREAD(thread_checker_);
  ++stats_.ticks;

  admit_requests(tick);

  // Approximate: completed transfers still hold a view and count here.
  quota_.begin_tick(tick.delta, registry_.outgoing_view_count());

  update_outgoing(tick);
  cleanup_outgoing();
  process_cancel_outgoing();

  receive_chunks(tick);
  update_incoming();
  cleanup_incoming();
  process_cancel_incoming();

  compact_inbox();

  stats_.messages_sent += commands_.playback(registry_, send_fn_);
  stats_.outgoing_disposed = outgoing_.disposed();
  stats_.incoming_disposed = incoming_.disposed();
  stats_.incoming_buffered_bytes = incoming_.memory_usage();
}

void TransferEngine::admit_requests(const TickTime& tick) {
  const auto pending = registry_.select(
      [](const HandleRecord& record) { return record.alive && record.request.has_value(); });

  for (const auto handle : pending) {
    auto* record = registry_.find(handle);
    OutgoingRequest request = std::move(*record->request);
    record->request.reset();

    if (request.blob.empty() ||
        request.blob.size() > std::numeric_limits<std::uint32_t>::max()) {
      LOG_ERROR("Rejecting outgoing transfer {}: blob of {} bytes is not sendable", handle.value,
                request.blob.size());
      ++stats_.transfers_rejected;
      commands_.destroy_handle(handle);
      continue;
    }

    OutgoingTransfer transfer;
    transfer.transfer_id = generate_transfer_id();
    transfer.handle = handle;
    transfer.target = request.target;
    transfer.blob = std::move(request.blob);
    transfer.start_time = tick.now;

    OutgoingTransferView view;
    view.total_bytes = transfer.total_bytes();
    view.target = transfer.target;

    const TransferId id = transfer.transfer_id;
    const std::size_t total = transfer.total_bytes();
    if (outgoing_.add(std::move(transfer)) == nullptr) {
      LOG_ERROR("Transfer id {} collided with an existing outgoing transfer", to_string(id));
      ++stats_.transfers_rejected;
      commands_.destroy_handle(handle);
      continue;
    }

    commands_.attach_outgoing(handle, view);
    ++stats_.transfers_admitted;
    LOG_DEBUG("Admitted outgoing transfer {} ({} bytes) to peer {}", to_string(id), total,
              request.target);
  }
}

void TransferEngine::update_outgoing(const TickTime& tick) {
  const auto handles = registry_.select(
      [](const HandleRecord& record) { return record.alive && record.outgoing.has_value(); });

  for (const auto handle : handles) {
    auto& view = *registry_.find(handle)->outgoing;

    auto* transfer = outgoing_.find(handle);
    if (transfer == nullptr) {
      LOG_ERROR("No internal state for outgoing transfer handle {}", handle.value);
      ++stats_.internal_inconsistencies;
      commands_.destroy_handle(handle);
      continue;
    }

    if (!peer_alive(transfer->target)) {
      LOG_DEBUG("Target peer {} of outgoing transfer {} is gone", transfer->target,
                to_string(transfer->transfer_id));
      ++stats_.outgoing_peer_lost;
      commands_.destroy_handle(handle);
      continue;
    }

    if (transfer->in_progress()) {
      view.elapsed_time = tick.now - transfer->start_time;

      // Small shares would mean lots of tiny frames; wait for the quota to build up.
      if (!quota_.should_defer()) {
        emit_chunks(*transfer, view, tick);
      }
      continue;
    }

    // Complete. The owner should release it; if not, it goes after a few ticks.
    if (++transfer->age_since_complete >= config_.max_age_since_completion) {
      LOG_WARN("Outgoing transfer {} has not been released for {} ticks",
               to_string(transfer->transfer_id), transfer->age_since_complete);
      ++stats_.outgoing_aged_out;
      commands_.destroy_handle(handle);
    }
  }
}

void TransferEngine::emit_chunks(OutgoingTransfer& transfer, OutgoingTransferView& view,
                                 const TickTime& tick) {
  std::size_t share = quota_.per_transfer_quota();

  while (share > 0 && transfer.in_progress()) {
    const std::size_t max_length = std::min(share, config_.max_chunk_size);

    ChunkFrame chunk;
    chunk.transfer_id = transfer.transfer_id;
    chunk.total_bytes = static_cast<std::uint32_t>(transfer.total_bytes());
    const std::size_t length = copy_to_chunk(transfer.blob, chunk, transfer.bytes_sent, max_length);
    if (length == 0) {
      break;
    }

    commands_.send(transfer.target, make_chunk_message(chunk));

    if (config_.trace_chunks) {
      LOG_TRACE(">>> chunk {} offset={} length={}", to_string(transfer.transfer_id),
                chunk.offset, chunk.length);
    }

    transfer.bytes_sent += length;
    view.bytes_sent = transfer.bytes_sent;

    share -= length;
    quota_.debit(length);

    ++stats_.chunks_sent;
    stats_.bytes_sent += length;
  }

  if (transfer.is_complete()) {
    ++stats_.outgoing_completed;
    LOG_DEBUG("Outgoing transfer {} sent {} bytes in {:.2f}s", to_string(transfer.transfer_id),
              transfer.total_bytes(), (tick.now - transfer.start_time).count());
  }
}

void TransferEngine::cleanup_outgoing() {
  const auto handles = registry_.select(
      [](const HandleRecord& record) { return !record.alive && record.outgoing_cleanup; });

  for (const auto handle : handles) {
    auto* transfer = outgoing_.find(handle);
    if (transfer != nullptr) {
      // A lost peer was already counted when its handle was destroyed.
      if (transfer->in_progress() && peer_alive(transfer->target)) {
        ++stats_.outgoing_canceled_local;
        commands_.send(transfer->target, make_cancel_incoming_message(transfer->transfer_id));
        ++stats_.cancel_notices_sent;
        LOG_DEBUG("Canceled outgoing transfer {} at {}/{} bytes",
                  to_string(transfer->transfer_id), transfer->bytes_sent,
                  transfer->total_bytes());
      }
      outgoing_.remove(transfer->transfer_id);
    }

    commands_.remove_outgoing_cleanup(handle);
  }
}

void TransferEngine::process_cancel_outgoing() {
  for (auto& inbound : inbox_) {
    if (inbound.consumed || inbound.message.kind != MessageKind::kCancelOutgoing) {
      continue;
    }
    inbound.consumed = true;

    const TransferId& id = inbound.message.cancel_outgoing.transfer_id;
    auto* transfer = outgoing_.find(id);
    if (transfer == nullptr) {
      continue;
    }
    if (transfer->target != inbound.source) {
      LOG_WARN("Ignoring cancel for outgoing transfer {} from peer {} (target is {})",
               to_string(id), inbound.source, transfer->target);
      ++stats_.cancel_notices_ignored;
      continue;
    }

    LOG_DEBUG("Peer {} canceled outgoing transfer {}", inbound.source, to_string(id));
    const TransferHandle handle = transfer->handle;
    outgoing_.remove(id);
    ++stats_.outgoing_canceled_remote;

    // Detach the cleanup marker first so destroying the handle sends no notice.
    commands_.remove_outgoing_cleanup(handle);
    commands_.destroy_handle(handle);
  }
}

void TransferEngine::receive_chunks(const TickTime& tick) {
  for (auto& inbound : inbox_) {
    if (inbound.consumed || inbound.message.kind != MessageKind::kChunk) {
      continue;
    }
    const ChunkFrame& chunk = inbound.message.chunk;

    if (config_.trace_chunks) {
      LOG_TRACE("<<< chunk {} offset={} length={}", to_string(chunk.transfer_id), chunk.offset,
                chunk.length);
    }

    if (!chunk_range_valid(chunk) || chunk.total_bytes > config_.max_incoming_bytes) {
      LOG_WARN("Rejecting chunk for {} from peer {}: total={} offset={} length={}",
               to_string(chunk.transfer_id), inbound.source, chunk.total_bytes, chunk.offset,
               chunk.length);
      ++stats_.chunks_rejected;
      inbound.consumed = true;
      continue;
    }

    auto* transfer = incoming_.find(chunk.transfer_id);
    if (transfer == nullptr) {
      inbound.consumed = true;
      // Unknown id: either a new transfer or a straggler for one we abandoned.
      if (canceled_.contains(chunk.transfer_id)) {
        ++stats_.chunks_dropped_canceled;
        continue;
      }
      start_incoming(inbound.source, chunk, tick);
      continue;
    }

    if (transfer->source != inbound.source || transfer->total_bytes != chunk.total_bytes) {
      LOG_WARN("Rejecting chunk for {} from peer {}: does not match the transfer from peer {}",
               to_string(chunk.transfer_id), inbound.source, transfer->source);
      ++stats_.chunks_rejected;
      inbound.consumed = true;
      continue;
    }

    // The view is attached at the end of the tick that created the transfer.
    // Chunks arriving before then wait in the inbox for the next tick.
    auto* record = registry_.find(transfer->handle);
    if (record == nullptr || !record->incoming) {
      ++stats_.chunks_deferred;
      continue;
    }
    inbound.consumed = true;

    const bool was_complete = transfer->is_complete();
    if (!copy_from_chunk(chunk, transfer->blob)) {
      LOG_WARN("Chunk for {} does not fit the reassembly buffer", to_string(chunk.transfer_id));
      ++stats_.chunks_rejected;
      continue;
    }
    transfer->bytes_received =
        std::min<std::size_t>(transfer->bytes_received + chunk.length, transfer->total_bytes);

    auto& view = *record->incoming;
    view.bytes_received = transfer->bytes_received;
    view.elapsed_time = tick.now - transfer->start_time;

    ++stats_.chunks_received;
    stats_.bytes_received += chunk.length;

    if (!was_complete && transfer->is_complete()) {
      ++stats_.incoming_completed;
      log_incoming_complete(*transfer, tick);
    }
  }
}

void TransferEngine::start_incoming(PeerId source, const ChunkFrame& chunk, const TickTime& tick) {
  IncomingTransfer transfer;
  transfer.transfer_id = chunk.transfer_id;
  transfer.handle = registry_.create();
  transfer.source = source;
  transfer.total_bytes = chunk.total_bytes;
  transfer.blob.assign(chunk.total_bytes, 0);
  transfer.start_time = tick.now;

  if (!copy_from_chunk(chunk, transfer.blob)) {
    LOG_WARN("First chunk for {} does not fit its announced size", to_string(chunk.transfer_id));
    ++stats_.chunks_rejected;
    registry_.destroy(transfer.handle);
    return;
  }
  transfer.bytes_received = chunk.length;

  IncomingTransferView view;
  view.total_bytes = transfer.total_bytes;
  view.bytes_received = transfer.bytes_received;
  view.source = source;

  LOG_DEBUG("New incoming transfer {} ({} bytes) from peer {}", to_string(chunk.transfer_id),
            chunk.total_bytes, source);

  const TransferHandle handle = transfer.handle;
  auto* added = incoming_.add(std::move(transfer));
  commands_.attach_incoming(handle, view, chunk.transfer_id);

  ++stats_.incoming_created;
  ++stats_.chunks_received;
  stats_.bytes_received += chunk.length;

  if (added->is_complete()) {
    ++stats_.incoming_completed;
    log_incoming_complete(*added, tick);
  }
}

void TransferEngine::update_incoming() {
  const auto handles = registry_.select(
      [](const HandleRecord& record) { return record.alive && record.incoming.has_value(); });

  for (const auto handle : handles) {
    auto* transfer = incoming_.find(handle);
    if (transfer == nullptr) {
      LOG_ERROR("No internal state for incoming transfer handle {}", handle.value);
      ++stats_.internal_inconsistencies;
      commands_.destroy_handle(handle);
      continue;
    }

    if (!peer_alive(transfer->source)) {
      LOG_DEBUG("Source peer {} of incoming transfer {} is gone", transfer->source,
                to_string(transfer->transfer_id));
      ++stats_.incoming_peer_lost;
      commands_.destroy_handle(handle);
      continue;
    }

    // The owner is expected to consume completed incoming transfers promptly.
    if (transfer->is_complete() &&
        ++transfer->age_since_complete >= config_.max_age_since_completion) {
      LOG_ERROR("Incoming transfer {} has not been consumed for {} ticks",
                to_string(transfer->transfer_id), transfer->age_since_complete);
      ++stats_.incoming_aged_out;
      commands_.destroy_handle(handle);
    }
  }
}

void TransferEngine::cleanup_incoming() {
  const auto handles = registry_.select([](const HandleRecord& record) {
    return !record.alive && record.incoming_cleanup.has_value();
  });

  for (const auto handle : handles) {
    const TransferId cleanup_id = *registry_.find(handle)->incoming_cleanup;

    auto* transfer = incoming_.find(handle);
    if (transfer != nullptr) {
      if (transfer->in_progress()) {
        // Late chunks for this id must not start a new transfer.
        canceled_.add(transfer->transfer_id);
        if (peer_alive(transfer->source)) {
          ++stats_.incoming_canceled_local;
          commands_.send(transfer->source, make_cancel_outgoing_message(transfer->transfer_id));
          ++stats_.cancel_notices_sent;
        }
        LOG_DEBUG("Canceled incoming transfer {} at {}/{} bytes",
                  to_string(transfer->transfer_id), transfer->bytes_received,
                  transfer->total_bytes);
      }
      incoming_.remove(transfer->transfer_id);
    } else {
      // State already gone, completion unknown: treat as canceled.
      canceled_.add(cleanup_id);
    }

    commands_.remove_incoming_cleanup(handle);
  }
}

void TransferEngine::process_cancel_incoming() {
  for (auto& inbound : inbox_) {
    if (inbound.consumed || inbound.message.kind != MessageKind::kCancelIncoming) {
      continue;
    }
    inbound.consumed = true;

    const TransferId& id = inbound.message.cancel_incoming.transfer_id;
    auto* transfer = incoming_.find(id);
    if (transfer == nullptr) {
      // The notice can overtake chunks still in flight.
      canceled_.add(id);
      continue;
    }
    if (transfer->source != inbound.source) {
      LOG_WARN("Ignoring cancel for incoming transfer {} from peer {} (source is {})",
               to_string(id), inbound.source, transfer->source);
      ++stats_.cancel_notices_ignored;
      continue;
    }

    LOG_DEBUG("Peer {} canceled incoming transfer {}", inbound.source, to_string(id));
    if (transfer->in_progress()) {
      canceled_.add(id);
    }

    const TransferHandle handle = transfer->handle;
    incoming_.remove(id);
    ++stats_.incoming_canceled_remote;

    commands_.remove_incoming_cleanup(handle);
    commands_.destroy_handle(handle);
  }
}

void TransferEngine::compact_inbox() {
  inbox_.erase(std::remove_if(inbox_.begin(), inbox_.end(),
                              [](const InboundMessage& inbound) { return inbound.consumed; }),
               inbox_.end());
}

bool TransferEngine::peer_alive(PeerId peer) const {
  return !peer_alive_fn_ || peer_alive_fn_(peer);
}

void TransferEngine::log_incoming_complete(const IncomingTransfer& transfer,
                                           const TickTime& tick) const {
  const double elapsed = (tick.now - transfer.start_time).count();
  LOG_DEBUG("Incoming transfer {} completed in {:.1f}s ({:.1f} kB/s)",
            to_string(transfer.transfer_id), elapsed,
            static_cast<double>(transfer.total_bytes) / std::max(elapsed * 1024.0, 1e-9));
}

}  // namespace blobxfer::transfer
