#include <gtest/gtest.h>

#include <utility>
#include <vector>

#include "transfer/command_buffer.h"
#include "transfer_test_helpers.h"

namespace blobxfer::transfer::tests {

class CommandBufferTest : public ::testing::Test {
 protected:
  CommandBuffer::SendFn capture() {
    return [this](PeerId peer, const TransferMessage& message) {
      sent_.emplace_back(peer, message);
    };
  }

  HandleRegistry registry_;
  CommandBuffer commands_;
  std::vector<std::pair<PeerId, TransferMessage>> sent_;
};

TEST_F(CommandBufferTest, NothingVisibleBeforePlayback) {
  const auto handle = registry_.create();
  OutgoingTransferView view;
  view.total_bytes = 100;

  commands_.attach_outgoing(handle, view);
  commands_.send(2, make_cancel_incoming_message(make_id(1)));

  EXPECT_FALSE(registry_.find(handle)->outgoing.has_value());
  EXPECT_TRUE(sent_.empty());
  EXPECT_EQ(commands_.pending_commands(), 1U);
  EXPECT_EQ(commands_.pending_messages(), 1U);

  EXPECT_EQ(commands_.playback(registry_, capture()), 1U);
  ASSERT_TRUE(registry_.find(handle)->outgoing.has_value());
  EXPECT_EQ(registry_.find(handle)->outgoing->total_bytes, 100U);
  EXPECT_TRUE(registry_.find(handle)->outgoing_cleanup);
  ASSERT_EQ(sent_.size(), 1U);
  EXPECT_EQ(sent_[0].first, 2U);
  EXPECT_TRUE(commands_.empty());
}

TEST_F(CommandBufferTest, AttachToDestroyedHandleIsSkipped) {
  const auto handle = registry_.create();
  commands_.destroy_handle(handle);
  commands_.attach_incoming(handle, IncomingTransferView{}, make_id(3));

  commands_.playback(registry_, capture());
  EXPECT_EQ(registry_.find(handle), nullptr);
}

TEST_F(CommandBufferTest, AttachIncomingSetsCleanupId) {
  const auto handle = registry_.create();
  commands_.attach_incoming(handle, IncomingTransferView{}, make_id(3));
  commands_.playback(registry_, capture());

  const auto* record = registry_.find(handle);
  ASSERT_NE(record, nullptr);
  ASSERT_TRUE(record->incoming_cleanup.has_value());
  EXPECT_EQ(*record->incoming_cleanup, make_id(3));
}

TEST_F(CommandBufferTest, RemoveCleanupThenDestroyErasesRecord) {
  const auto handle = registry_.create();
  commands_.attach_outgoing(handle, OutgoingTransferView{});
  commands_.playback(registry_, capture());

  commands_.remove_outgoing_cleanup(handle);
  commands_.destroy_handle(handle);
  commands_.playback(registry_, capture());
  EXPECT_EQ(registry_.find(handle), nullptr);
}

TEST_F(CommandBufferTest, MessagesKeepRecordingOrder) {
  commands_.send(1, make_cancel_outgoing_message(make_id(1)));
  commands_.send(2, make_cancel_incoming_message(make_id(2)));
  commands_.send(3, make_cancel_outgoing_message(make_id(3)));

  EXPECT_EQ(commands_.playback(registry_, capture()), 3U);
  ASSERT_EQ(sent_.size(), 3U);
  EXPECT_EQ(sent_[0].first, 1U);
  EXPECT_EQ(message_transfer_id(sent_[1].second), make_id(2));
  EXPECT_EQ(sent_[2].second.kind, MessageKind::kCancelOutgoing);
}

}  // namespace blobxfer::transfer::tests
