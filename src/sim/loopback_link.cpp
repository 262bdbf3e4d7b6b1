#include "sim/loopback_link.h"

#include <utility>

#include "common/logging/logger.h"
#include "transfer/message_codec.h"

namespace blobxfer::sim {

void LoopbackLink::send(transfer::PeerId from, transfer::PeerId to,
                        const transfer::TransferMessage& message) {
  if (!connected(to)) {
    ++stats_.datagrams_dropped;
    return;
  }
  auto bytes = transfer::MessageCodec::encode(message);
  ++stats_.datagrams_sent;
  stats_.bytes_sent += bytes.size();
  queues_[to].push_back(Datagram{from, std::move(bytes)});
}

std::size_t LoopbackLink::deliver(transfer::PeerId peer, transfer::TransferEngine& engine) {
  auto it = queues_.find(peer);
  if (it == queues_.end()) {
    return 0;
  }

  std::vector<Datagram> pending;
  pending.swap(it->second);

  std::size_t delivered = 0;
  for (const auto& datagram : pending) {
    if (!engine.on_datagram(datagram.from, datagram.bytes)) {
      ++stats_.datagrams_rejected;
      continue;
    }
    ++delivered;
  }
  stats_.datagrams_delivered += delivered;
  return delivered;
}

void LoopbackLink::disconnect(transfer::PeerId peer) {
  disconnected_[peer] = true;
  auto it = queues_.find(peer);
  if (it != queues_.end()) {
    stats_.datagrams_dropped += it->second.size();
    queues_.erase(it);
  }
  LOG_INFO("Peer {} disconnected from the loopback link", peer);
}

bool LoopbackLink::connected(transfer::PeerId peer) const {
  auto it = disconnected_.find(peer);
  return it == disconnected_.end() || !it->second;
}

std::size_t LoopbackLink::in_flight() const {
  std::size_t total = 0;
  for (const auto& [peer, queue] : queues_) {
    total += queue.size();
  }
  return total;
}

}  // namespace blobxfer::sim
