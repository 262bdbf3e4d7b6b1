#include <gtest/gtest.h>

#include <algorithm>
#include <cstdint>
#include <memory>
#include <optional>
#include <set>
#include <vector>

#include "transfer/transfer_engine.h"
#include "transfer_test_helpers.h"

namespace blobxfer::transfer::tests {

class TransferEngineTest : public ::testing::Test {
 protected:
  static constexpr PeerId kSender = 1;
  static constexpr PeerId kReceiver = 2;

  struct Outbound {
    PeerId to{0};
    TransferMessage message;
  };

  void SetUp() override { start(); }

  // (Re)create both engines from config_.
  void start() {
    sender_out_.clear();
    receiver_out_.clear();
    dead_.clear();
    tick_ = 0;

    auto alive = [this](PeerId peer) { return dead_.count(peer) == 0; };
    sender_ = std::make_unique<TransferEngine>(
        config_,
        [this](PeerId to, const TransferMessage& message) {
          sender_out_.push_back({to, message});
        },
        alive);
    receiver_ = std::make_unique<TransferEngine>(
        config_,
        [this](PeerId to, const TransferMessage& message) {
          receiver_out_.push_back({to, message});
        },
        alive);
  }

  // Deliver the previous tick's traffic, then run one tick on both engines.
  // Afterwards sender_out_ and receiver_out_ hold what this tick produced.
  void tick() {
    deliver(sender_out_, kSender);
    deliver(receiver_out_, kReceiver);

    const TickTime time{kFrame * static_cast<double>(tick_), kFrame};
    sender_->update(time);
    receiver_->update(time);
    ++tick_;
  }

  std::vector<ChunkFrame> sent_chunks() const {
    std::vector<ChunkFrame> chunks;
    for (const auto& out : sender_out_) {
      if (out.message.kind == MessageKind::kChunk) {
        chunks.push_back(out.message.chunk);
      }
    }
    return chunks;
  }

  // Tick until the receiver holds a complete transfer and take its blob.
  std::optional<std::vector<std::uint8_t>> run_until_received(int max_ticks) {
    for (int i = 0; i < max_ticks; ++i) {
      tick();
      for (const auto handle : receiver_->incoming_transfers()) {
        auto view = receiver_->incoming(handle);
        if (view && view->is_complete()) {
          return receiver_->take_incoming_blob(handle);
        }
      }
    }
    return std::nullopt;
  }

  // Tick until the receiver has an incoming view. Returns its handle.
  TransferHandle run_until_incoming(int max_ticks = 10) {
    for (int i = 0; i < max_ticks; ++i) {
      tick();
      const auto handles = receiver_->incoming_transfers();
      if (!handles.empty()) {
        return handles.front();
      }
    }
    return {};
  }

  static constexpr Seconds kFrame{1.0 / 60.0};

  TransferConfig config_;
  std::unique_ptr<TransferEngine> sender_;
  std::unique_ptr<TransferEngine> receiver_;
  std::vector<Outbound> sender_out_;
  std::vector<Outbound> receiver_out_;
  std::set<PeerId> dead_;
  std::uint64_t tick_{0};

 private:
  void deliver(std::vector<Outbound>& outbox, PeerId from) {
    std::vector<Outbound> pending;
    pending.swap(outbox);
    for (const auto& out : pending) {
      if (dead_.count(out.to) != 0) {
        continue;
      }
      auto& engine = out.to == kSender ? *sender_ : *receiver_;
      engine.on_message(from, out.message);
    }
  }
};

// ========== Delivery ==========

TEST_F(TransferEngineTest, RoundTripPreservesBytes) {
  for (const std::size_t size : {1U, 255U, 256U, 257U, 65536U}) {
    SCOPED_TRACE(size);
    start();

    const auto blob = make_blob(size, static_cast<std::uint32_t>(size));
    const auto handle = sender_->begin_outgoing_transfer(blob, kReceiver);

    auto received = run_until_received(200);
    ASSERT_TRUE(received.has_value());
    EXPECT_EQ(*received, blob);

    auto view = sender_->outgoing(handle);
    ASSERT_TRUE(view.has_value());
    EXPECT_TRUE(view->is_complete());
    EXPECT_FLOAT_EQ(view->progress(), 1.0F);
    EXPECT_TRUE(sender_->release(handle));
  }
}

TEST_F(TransferEngineTest, AdmissionHappensOnNextTick) {
  const auto handle = sender_->begin_outgoing_transfer(make_blob(1000), kReceiver);
  EXPECT_TRUE(sender_->exists(handle));
  EXPECT_FALSE(sender_->outgoing(handle).has_value());

  tick();
  auto view = sender_->outgoing(handle);
  ASSERT_TRUE(view.has_value());
  EXPECT_EQ(view->total_bytes, 1000U);
  EXPECT_EQ(view->bytes_sent, 0U);
  EXPECT_EQ(view->target, kReceiver);
  EXPECT_TRUE(sender_out_.empty());

  tick();
  view = sender_->outgoing(handle);
  ASSERT_TRUE(view.has_value());
  EXPECT_EQ(view->bytes_sent, 547U);
  EXPECT_EQ(sent_chunks().size(), 3U);
  EXPECT_EQ(sender_->outgoing_transfers().size(), 1U);
}

TEST_F(TransferEngineTest, OutOfOrderChunksReassemble) {
  const auto blob = make_blob(1000, 9);
  const auto id = make_id(42);

  for (const std::size_t offset : {768U, 512U, 256U, 0U}) {
    receiver_->on_message(kSender, make_chunk(id, blob, offset));
  }
  tick();
  tick();

  const auto handles = receiver_->incoming_transfers();
  ASSERT_EQ(handles.size(), 1U);
  auto received = receiver_->take_incoming_blob(handles.front());
  ASSERT_TRUE(received.has_value());
  EXPECT_EQ(*received, blob);
  EXPECT_FALSE(receiver_->exists(handles.front()));
}

TEST_F(TransferEngineTest, ChunksWaitForViewAttachment) {
  const auto blob = make_blob(512);
  const auto id = make_id(5);
  receiver_->on_message(kSender, make_chunk(id, blob, 0));
  receiver_->on_message(kSender, make_chunk(id, blob, 256));

  tick();
  auto handles = receiver_->incoming_transfers();
  ASSERT_EQ(handles.size(), 1U);
  auto view = receiver_->incoming(handles.front());
  ASSERT_TRUE(view.has_value());
  EXPECT_EQ(view->total_bytes, 512U);
  EXPECT_EQ(view->bytes_received, 256U);
  EXPECT_EQ(view->source, kSender);
  EXPECT_EQ(receiver_->stats().chunks_deferred, 1U);
  EXPECT_EQ(receiver_->pending_inbound(), 1U);
  EXPECT_FALSE(receiver_->take_incoming_blob(handles.front()).has_value());

  tick();
  view = receiver_->incoming(handles.front());
  ASSERT_TRUE(view.has_value());
  EXPECT_TRUE(view->is_complete());
  EXPECT_EQ(receiver_->pending_inbound(), 0U);

  auto span = receiver_->incoming_blob(handles.front());
  ASSERT_TRUE(span.has_value());
  EXPECT_TRUE(std::equal(span->begin(), span->end(), blob.begin(), blob.end()));
}

TEST_F(TransferEngineTest, DuplicateChunkCountsTowardProgress) {
  const auto blob = make_blob(512, 3);
  const auto id = make_id(8);
  receiver_->on_message(kSender, make_chunk(id, blob, 0));
  tick();
  receiver_->on_message(kSender, make_chunk(id, blob, 0));
  tick();

  const auto handles = receiver_->incoming_transfers();
  ASSERT_EQ(handles.size(), 1U);
  auto view = receiver_->incoming(handles.front());
  ASSERT_TRUE(view.has_value());
  EXPECT_EQ(view->bytes_received, view->total_bytes);
  EXPECT_TRUE(view->is_complete());

  // Progress saturates; the second half was never delivered.
  auto span = receiver_->incoming_blob(handles.front());
  ASSERT_TRUE(span.has_value());
  ASSERT_EQ(span->size(), 512U);
  EXPECT_TRUE(std::equal(span->begin(), span->begin() + 256, blob.begin()));
  EXPECT_TRUE(std::all_of(span->begin() + 256, span->end(),
                          [](std::uint8_t byte) { return byte == 0; }));
}

TEST_F(TransferEngineTest, BufferedBytesTrackReassembly) {
  const auto blob = make_blob(1000);
  const auto id = make_id(6);
  receiver_->on_message(kSender, make_chunk(id, blob, 0));
  tick();
  EXPECT_EQ(receiver_->stats().incoming_buffered_bytes, 1000U);

  const auto handles = receiver_->incoming_transfers();
  ASSERT_EQ(handles.size(), 1U);
  ASSERT_TRUE(receiver_->release(handles.front()));
  tick();
  EXPECT_EQ(receiver_->stats().incoming_buffered_bytes, 0U);
}

// ========== Rate Limiting ==========

TEST_F(TransferEngineTest, SingleTransferFollowsRateBudget) {
  const auto handle = sender_->begin_outgoing_transfer(make_blob(65536), kReceiver);

  std::size_t expected_offset = 0;
  std::uint64_t complete_tick = 0;
  for (int i = 0; i < 200 && complete_tick == 0; ++i) {
    tick();

    const auto chunks = sent_chunks();
    std::size_t tick_bytes = 0;
    for (std::size_t c = 0; c < chunks.size(); ++c) {
      EXPECT_LE(chunks[c].length, kChunkPayloadCapacity);
      if (c + 1 < chunks.size()) {
        EXPECT_EQ(chunks[c].length, kChunkPayloadCapacity);
      }
      EXPECT_EQ(chunks[c].offset, expected_offset);
      expected_offset += chunks[c].length;
      tick_bytes += chunks[c].length;
    }
    EXPECT_LE(tick_bytes, 547U);

    auto view = sender_->outgoing(handle);
    ASSERT_TRUE(view.has_value());
    if (view->is_complete()) {
      complete_tick = tick_ - 1;
      EXPECT_NEAR(view->elapsed_time.count(), 2.0, 1e-9);
    }
  }

  // Admitted on tick 0, 547 bytes per tick from tick 1.
  EXPECT_EQ(complete_tick, 120U);
  EXPECT_EQ(expected_offset, 65536U);
  EXPECT_EQ(sender_->stats().bytes_sent, 65536U);
}

TEST_F(TransferEngineTest, ConcurrentTransfersShareBudgetEvenly) {
  const auto first = sender_->begin_outgoing_transfer(make_blob(65536, 1), kReceiver);
  const auto second = sender_->begin_outgoing_transfer(make_blob(65536, 2), kReceiver);

  std::uint64_t complete_tick = 0;
  for (int i = 0; i < 300 && complete_tick == 0; ++i) {
    tick();
    auto a = sender_->outgoing(first);
    auto b = sender_->outgoing(second);
    ASSERT_TRUE(a.has_value());
    ASSERT_TRUE(b.has_value());
    EXPECT_EQ(a->bytes_sent, b->bytes_sent);
    if (a->is_complete() && b->is_complete()) {
      complete_tick = tick_ - 1;
    }
  }

  EXPECT_EQ(complete_tick, 240U);
}

TEST_F(TransferEngineTest, UnevenTransfersStayWithinTickBudget) {
  const std::vector<std::size_t> sizes{100, 5000, 7000};
  for (std::size_t i = 0; i < sizes.size(); ++i) {
    sender_->begin_outgoing_transfer(make_blob(sizes[i], static_cast<std::uint32_t>(i)),
                                     kReceiver);
  }

  std::size_t total_sent = 0;
  for (int i = 0; i < 200; ++i) {
    const std::size_t carry = sender_->quota().global_quota();
    const std::uint64_t granted_before = sender_->quota().stats().bytes_granted;
    const std::size_t active = sender_->outgoing_transfers().size();

    tick();

    const std::uint64_t granted = sender_->quota().stats().bytes_granted - granted_before;
    std::size_t tick_bytes = 0;
    for (const auto& chunk : sent_chunks()) {
      tick_bytes += chunk.length;
    }
    EXPECT_LE(tick_bytes, carry + granted) << "tick " << tick_ - 1;
    if (active != 0) {
      // No transfer may exceed an even split of what was available.
      const std::size_t share = (carry + granted) / active;
      for (const auto& chunk : sent_chunks()) {
        EXPECT_LE(chunk.length, share);
      }
    }
    total_sent += tick_bytes;
  }

  EXPECT_EQ(total_sent, 12100U);
  EXPECT_EQ(sender_->stats().outgoing_completed, 3U);
  EXPECT_EQ(sender_->stats().bytes_sent, 12100U);
}

TEST_F(TransferEngineTest, QuotaResetsWhenNothingToSend) {
  const auto handle = sender_->begin_outgoing_transfer(make_blob(100), kReceiver);
  tick();
  tick();
  ASSERT_TRUE(sender_->outgoing(handle)->is_complete());
  EXPECT_GT(sender_->quota().global_quota(), 0U);

  ASSERT_TRUE(sender_->release(handle));
  tick();
  EXPECT_EQ(sender_->quota().global_quota(), 0U);
}

// ========== Cancellation ==========

TEST_F(TransferEngineTest, ReceiverCancelStopsSender) {
  const auto handle = sender_->begin_outgoing_transfer(make_blob(65536), kReceiver);
  const auto incoming = run_until_incoming();
  ASSERT_TRUE(incoming.valid());

  ASSERT_TRUE(receiver_->release(incoming));
  tick();
  ASSERT_EQ(receiver_out_.size(), 1U);
  EXPECT_EQ(receiver_out_[0].message.kind, MessageKind::kCancelOutgoing);
  EXPECT_EQ(receiver_->incoming_count(), 0U);
  EXPECT_EQ(receiver_->canceled_transfers().size(), 1U);
  EXPECT_EQ(receiver_->stats().incoming_canceled_local, 1U);

  tick();
  EXPECT_FALSE(sender_->exists(handle));
  EXPECT_EQ(sender_->outgoing_count(), 0U);
  EXPECT_EQ(sender_->stats().outgoing_canceled_remote, 1U);

  tick();
  EXPECT_TRUE(sent_chunks().empty());
  EXPECT_GT(receiver_->stats().chunks_dropped_canceled, 0U);
  EXPECT_EQ(receiver_->incoming_count(), 0U);

  tick();
  EXPECT_TRUE(sender_out_.empty());
  EXPECT_EQ(sender_->stats().cancel_notices_sent, 0U);
  EXPECT_TRUE(receiver_->incoming_transfers().empty());
}

TEST_F(TransferEngineTest, SenderCancelNotifiesReceiver) {
  const auto handle = sender_->begin_outgoing_transfer(make_blob(65536), kReceiver);
  const auto incoming = run_until_incoming();
  ASSERT_TRUE(incoming.valid());

  ASSERT_TRUE(sender_->release(handle));
  EXPECT_FALSE(sender_->outgoing(handle).has_value());

  tick();
  ASSERT_EQ(sender_out_.size(), 1U);
  ASSERT_EQ(sender_out_[0].message.kind, MessageKind::kCancelIncoming);
  const TransferId id = message_transfer_id(sender_out_[0].message);
  EXPECT_EQ(sender_->outgoing_count(), 0U);
  EXPECT_EQ(sender_->stats().outgoing_canceled_local, 1U);

  tick();
  EXPECT_FALSE(receiver_->exists(incoming));
  EXPECT_EQ(receiver_->incoming_count(), 0U);
  EXPECT_TRUE(receiver_->canceled_transfers().contains(id));
  EXPECT_EQ(receiver_->stats().incoming_canceled_remote, 1U);

  tick();
  EXPECT_TRUE(receiver_out_.empty());
  EXPECT_EQ(receiver_->stats().cancel_notices_sent, 0U);
}

TEST_F(TransferEngineTest, CanceledIdSuppressesLateChunks) {
  const auto id = make_id(77);
  receiver_->on_message(kSender, make_cancel_incoming_message(id));
  tick();
  EXPECT_TRUE(receiver_->canceled_transfers().contains(id));

  const auto blob = make_blob(300);
  receiver_->on_message(kSender, make_chunk(id, blob, 0));
  tick();
  EXPECT_EQ(receiver_->incoming_count(), 0U);
  EXPECT_TRUE(receiver_->incoming_transfers().empty());
  EXPECT_EQ(receiver_->stats().chunks_dropped_canceled, 1U);
}

TEST_F(TransferEngineTest, CancelFromWrongPeerIsIgnored) {
  const auto handle = sender_->begin_outgoing_transfer(make_blob(65536), kReceiver);
  tick();
  tick();
  const auto chunks = sent_chunks();
  ASSERT_FALSE(chunks.empty());

  sender_->on_message(9, make_cancel_outgoing_message(chunks.front().transfer_id));
  tick();
  EXPECT_TRUE(sender_->exists(handle));
  EXPECT_EQ(sender_->stats().cancel_notices_ignored, 1U);
  EXPECT_EQ(sender_->stats().outgoing_canceled_remote, 0U);
}

// ========== Release and Aging ==========

TEST_F(TransferEngineTest, ReleaseIsIdempotent) {
  const auto handle = sender_->begin_outgoing_transfer(make_blob(100), kReceiver);
  tick();
  tick();
  ASSERT_TRUE(sender_->outgoing(handle)->is_complete());

  EXPECT_TRUE(sender_->release(handle));
  EXPECT_FALSE(sender_->release(handle));
  EXPECT_FALSE(sender_->exists(handle));
  EXPECT_FALSE(sender_->release(TransferHandle{9999}));

  tick();
  EXPECT_EQ(sender_->outgoing_count(), 0U);
  EXPECT_EQ(sender_->stats().outgoing_disposed, 1U);
  EXPECT_EQ(sender_->stats().cancel_notices_sent, 0U);
}

TEST_F(TransferEngineTest, UnreleasedOutgoingAgesOut) {
  const auto handle = sender_->begin_outgoing_transfer(make_blob(100), kReceiver);
  tick();
  tick();
  ASSERT_TRUE(sender_->outgoing(handle)->is_complete());
  EXPECT_EQ(sender_->stats().outgoing_completed, 1U);

  for (int i = 0; i < 3; ++i) {
    tick();
    EXPECT_TRUE(sender_->exists(handle));
  }
  tick();
  EXPECT_FALSE(sender_->exists(handle));
  EXPECT_EQ(sender_->stats().outgoing_aged_out, 1U);

  tick();
  tick();
  EXPECT_EQ(sender_->outgoing_count(), 0U);
  EXPECT_EQ(sender_->stats().outgoing_disposed, 1U);
  EXPECT_EQ(sender_->stats().cancel_notices_sent, 0U);
}

TEST_F(TransferEngineTest, UnconsumedIncomingAgesOut) {
  sender_->begin_outgoing_transfer(make_blob(100), kReceiver);
  const auto incoming = run_until_incoming();
  ASSERT_TRUE(incoming.valid());
  ASSERT_TRUE(receiver_->incoming(incoming)->is_complete());

  for (int i = 0; i < 3; ++i) {
    tick();
    EXPECT_TRUE(receiver_->exists(incoming));
  }
  tick();
  EXPECT_FALSE(receiver_->exists(incoming));
  EXPECT_EQ(receiver_->stats().incoming_aged_out, 1U);

  tick();
  EXPECT_EQ(receiver_->incoming_count(), 0U);
  EXPECT_EQ(receiver_->canceled_transfers().size(), 0U);
  EXPECT_EQ(receiver_->stats().cancel_notices_sent, 0U);
}

// ========== Peer Loss ==========

TEST_F(TransferEngineTest, LostTargetDisposesOutgoingWithoutNotice) {
  const auto handle = sender_->begin_outgoing_transfer(make_blob(65536), kReceiver);
  ASSERT_TRUE(run_until_incoming().valid());

  dead_.insert(kReceiver);
  tick();
  EXPECT_FALSE(sender_->exists(handle));
  EXPECT_EQ(sender_->stats().outgoing_peer_lost, 1U);

  tick();
  EXPECT_EQ(sender_->outgoing_count(), 0U);
  EXPECT_EQ(sender_->stats().cancel_notices_sent, 0U);
  EXPECT_EQ(sender_->stats().outgoing_peer_lost, 1U);
  EXPECT_EQ(sender_->stats().outgoing_canceled_local, 0U);
  EXPECT_TRUE(sender_out_.empty());
}

TEST_F(TransferEngineTest, LostSourceDisposesIncomingWithoutNotice) {
  sender_->begin_outgoing_transfer(make_blob(65536), kReceiver);
  const auto incoming = run_until_incoming();
  ASSERT_TRUE(incoming.valid());

  dead_.insert(kSender);
  tick();
  EXPECT_FALSE(receiver_->exists(incoming));
  EXPECT_EQ(receiver_->stats().incoming_peer_lost, 1U);

  tick();
  EXPECT_EQ(receiver_->incoming_count(), 0U);
  EXPECT_EQ(receiver_->stats().cancel_notices_sent, 0U);
  EXPECT_EQ(receiver_->stats().incoming_peer_lost, 1U);
  EXPECT_EQ(receiver_->stats().incoming_canceled_local, 0U);
}

// ========== Rejection ==========

TEST_F(TransferEngineTest, EmptyBlobIsRejected) {
  const auto handle = sender_->begin_outgoing_transfer({}, kReceiver);
  EXPECT_TRUE(sender_->exists(handle));

  tick();
  EXPECT_FALSE(sender_->exists(handle));
  EXPECT_EQ(sender_->stats().transfers_rejected, 1U);
  EXPECT_EQ(sender_->outgoing_count(), 0U);

  tick();
  EXPECT_TRUE(sender_out_.empty());
}

TEST_F(TransferEngineTest, InvalidChunksAreRejected) {
  const auto id = make_id(3);

  ChunkFrame chunk;
  chunk.transfer_id = id;

  chunk.total_bytes = 0;
  chunk.length = 10;
  receiver_->on_message(kSender, make_chunk_message(chunk));

  chunk.total_bytes = 1000;
  chunk.length = 300;
  receiver_->on_message(kSender, make_chunk_message(chunk));

  chunk.offset = 900;
  chunk.length = 256;
  receiver_->on_message(kSender, make_chunk_message(chunk));

  chunk.offset = 0;
  chunk.length = 10;
  chunk.total_bytes = static_cast<std::uint32_t>(config_.max_incoming_bytes + 1);
  receiver_->on_message(kSender, make_chunk_message(chunk));

  tick();
  EXPECT_EQ(receiver_->stats().chunks_rejected, 4U);
  EXPECT_EQ(receiver_->incoming_count(), 0U);
  EXPECT_EQ(receiver_->pending_inbound(), 0U);
}

TEST_F(TransferEngineTest, ChunkFromOtherPeerIsRejected) {
  const auto blob = make_blob(512);
  const auto id = make_id(4);
  receiver_->on_message(kSender, make_chunk(id, blob, 0));
  tick();

  receiver_->on_message(9, make_chunk(id, blob, 256));
  tick();
  EXPECT_EQ(receiver_->stats().chunks_rejected, 1U);

  const auto handles = receiver_->incoming_transfers();
  ASSERT_EQ(handles.size(), 1U);
  EXPECT_EQ(receiver_->incoming(handles.front())->bytes_received, 256U);
}

TEST_F(TransferEngineTest, MalformedDatagramIsDropped) {
  const std::vector<std::uint8_t> garbage{0xFF, 0x01, 0x02};
  EXPECT_FALSE(receiver_->on_datagram(kSender, garbage));
  EXPECT_EQ(receiver_->stats().malformed_messages, 1U);
  EXPECT_EQ(receiver_->pending_inbound(), 0U);
}

}  // namespace blobxfer::transfer::tests
