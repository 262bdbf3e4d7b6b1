#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <utility>
#include <vector>

#include "transfer/handle_registry.h"
#include "transfer/transfer_message.h"

namespace blobxfer::transfer {

enum class CommandKind : std::uint8_t {
  kAttachOutgoing = 1,
  kAttachIncoming = 2,
  kDestroyHandle = 3,
  kRemoveOutgoingCleanup = 4,
  kRemoveIncomingCleanup = 5,
};

struct Command {
  CommandKind kind{};
  TransferHandle handle;
  OutgoingTransferView outgoing_view;
  IncomingTransferView incoming_view;
  TransferId transfer_id;
};

// Structural changes and outgoing messages recorded during a tick.
//
// Nothing recorded here is visible until playback(), which the engine runs
// once at the end of the tick: structural commands first, in recording
// order, then messages, in recording order.
class CommandBuffer {
 public:
  using SendFn = std::function<void(PeerId, const TransferMessage&)>;

  // Attach an outgoing view and its cleanup marker.
  void attach_outgoing(TransferHandle handle, const OutgoingTransferView& view);

  // Attach an incoming view and its cleanup marker.
  void attach_incoming(TransferHandle handle, const IncomingTransferView& view,
                       const TransferId& id);

  void destroy_handle(TransferHandle handle);
  void remove_outgoing_cleanup(TransferHandle handle);
  void remove_incoming_cleanup(TransferHandle handle);

  void send(PeerId peer, const TransferMessage& message);

  // Apply and clear everything recorded. Returns the number of messages sent.
  std::size_t playback(HandleRegistry& registry, const SendFn& send_fn);

  [[nodiscard]] std::size_t pending_commands() const { return commands_.size(); }
  [[nodiscard]] std::size_t pending_messages() const { return messages_.size(); }
  [[nodiscard]] bool empty() const { return commands_.empty() && messages_.empty(); }

 private:
  std::vector<Command> commands_;
  std::vector<std::pair<PeerId, TransferMessage>> messages_;
};

}  // namespace blobxfer::transfer
