#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <vector>

#include "transfer/transfer_engine.h"
#include "transfer/transfer_message.h"

namespace blobxfer::sim {

struct LoopbackLinkStats {
  std::uint64_t datagrams_sent{0};
  std::uint64_t bytes_sent{0};
  std::uint64_t datagrams_delivered{0};
  std::uint64_t datagrams_rejected{0};
  std::uint64_t datagrams_dropped{0};
};

// In-memory datagram link between simulated peers.
//
// send() encodes a message with the wire codec and queues it for the
// destination. deliver() hands everything queued for a peer to its engine;
// the simulator calls it at the start of each tick, so a message sent during
// tick N is seen by the peer on tick N + 1.
class LoopbackLink {
 public:
  void send(transfer::PeerId from, transfer::PeerId to, const transfer::TransferMessage& message);

  // Feed every datagram queued for `peer` to `engine`. Returns the number delivered.
  std::size_t deliver(transfer::PeerId peer, transfer::TransferEngine& engine);

  // A disconnected peer receives nothing; datagrams addressed to it are dropped.
  void disconnect(transfer::PeerId peer);
  [[nodiscard]] bool connected(transfer::PeerId peer) const;

  [[nodiscard]] std::size_t in_flight() const;
  [[nodiscard]] const LoopbackLinkStats& stats() const { return stats_; }

 private:
  struct Datagram {
    transfer::PeerId from{0};
    std::vector<std::uint8_t> bytes;
  };

  std::map<transfer::PeerId, std::vector<Datagram>> queues_;
  std::map<transfer::PeerId, bool> disconnected_;
  LoopbackLinkStats stats_;
};

}  // namespace blobxfer::sim
