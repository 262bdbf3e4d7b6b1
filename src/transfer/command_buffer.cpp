#include "transfer/command_buffer.h"

#include "common/logging/logger.h"

namespace blobxfer::transfer {

void CommandBuffer::attach_outgoing(TransferHandle handle, const OutgoingTransferView& view) {
  Command command{};
  command.kind = CommandKind::kAttachOutgoing;
  command.handle = handle;
  command.outgoing_view = view;
  commands_.push_back(command);
}

void CommandBuffer::attach_incoming(TransferHandle handle, const IncomingTransferView& view,
                                    const TransferId& id) {
  Command command{};
  command.kind = CommandKind::kAttachIncoming;
  command.handle = handle;
  command.incoming_view = view;
  command.transfer_id = id;
  commands_.push_back(command);
}

void CommandBuffer::destroy_handle(TransferHandle handle) {
  Command command{};
  command.kind = CommandKind::kDestroyHandle;
  command.handle = handle;
  commands_.push_back(command);
}

void CommandBuffer::remove_outgoing_cleanup(TransferHandle handle) {
  Command command{};
  command.kind = CommandKind::kRemoveOutgoingCleanup;
  command.handle = handle;
  commands_.push_back(command);
}

void CommandBuffer::remove_incoming_cleanup(TransferHandle handle) {
  Command command{};
  command.kind = CommandKind::kRemoveIncomingCleanup;
  command.handle = handle;
  commands_.push_back(command);
}

void CommandBuffer::send(PeerId peer, const TransferMessage& message) {
  messages_.emplace_back(peer, message);
}

std::size_t CommandBuffer::playback(HandleRegistry& registry, const SendFn& send_fn) {
  for (const auto& command : commands_) {
    switch (command.kind) {
      case CommandKind::kAttachOutgoing: {
        auto* record = registry.find(command.handle);
        if (record == nullptr || !record->alive) {
          LOG_DEBUG("Skipping outgoing attach for destroyed handle {}", command.handle.value);
          break;
        }
        record->outgoing = command.outgoing_view;
        record->outgoing_cleanup = true;
        break;
      }
      case CommandKind::kAttachIncoming: {
        auto* record = registry.find(command.handle);
        if (record == nullptr || !record->alive) {
          LOG_DEBUG("Skipping incoming attach for destroyed handle {}", command.handle.value);
          break;
        }
        record->incoming = command.incoming_view;
        record->incoming_cleanup = command.transfer_id;
        break;
      }
      case CommandKind::kDestroyHandle:
        registry.destroy(command.handle);
        break;
      case CommandKind::kRemoveOutgoingCleanup:
        registry.remove_outgoing_cleanup(command.handle);
        break;
      case CommandKind::kRemoveIncomingCleanup:
        registry.remove_incoming_cleanup(command.handle);
        break;
    }
  }
  commands_.clear();

  std::size_t sent = 0;
  for (const auto& [peer, message] : messages_) {
    if (send_fn) {
      send_fn(peer, message);
      ++sent;
    }
  }
  messages_.clear();
  return sent;
}

}  // namespace blobxfer::transfer
