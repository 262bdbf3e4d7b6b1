#include <cstdint>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <random>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/crypto/digest.h"
#include "common/crypto/random.h"
#include "common/logging/logger.h"
#include "sim/loopback_link.h"
#include "sim/sim_config.h"
#include "transfer/transfer_engine.h"

using namespace blobxfer;
using json = nlohmann::json;

namespace {
constexpr transfer::PeerId kSenderPeer = 1;
constexpr transfer::PeerId kReceiverPeer = 2;

enum class TransferStatus { kPending, kDelivered, kCanceled, kCorrupted, kIncomplete };

const char* status_to_string(TransferStatus status) {
  switch (status) {
    case TransferStatus::kPending: return "pending";
    case TransferStatus::kDelivered: return "delivered";
    case TransferStatus::kCanceled: return "canceled";
    case TransferStatus::kCorrupted: return "corrupted";
    case TransferStatus::kIncomplete: return "incomplete";
  }
  return "unknown";
}

struct SimTransfer {
  std::size_t index{0};
  transfer::TransferHandle sender_handle;
  crypto::Digest digest{};
  std::size_t size{0};
  bool send_complete{false};
  std::uint64_t send_complete_tick{0};
  std::uint64_t receive_complete_tick{0};
  TransferStatus status{TransferStatus::kPending};
};

std::vector<std::uint8_t> make_blob(std::mt19937_64& rng, std::size_t size) {
  std::vector<std::uint8_t> blob(size);
  std::uniform_int_distribution<int> dist(0, 255);
  for (auto& byte : blob) {
    byte = static_cast<std::uint8_t>(dist(rng));
  }
  return blob;
}

// Match a reassembled blob to the first unresolved transfer with the same digest.
SimTransfer* match_transfer(std::vector<SimTransfer>& transfers, const crypto::Digest& digest) {
  for (auto& t : transfers) {
    if (t.status == TransferStatus::kPending && t.digest == digest) {
      return &t;
    }
  }
  return nullptr;
}

json stats_to_json(const transfer::TransferEngineStats& stats) {
  return json{
    {"ticks", stats.ticks},
    {"transfers_admitted", stats.transfers_admitted},
    {"transfers_rejected", stats.transfers_rejected},
    {"outgoing_completed", stats.outgoing_completed},
    {"outgoing_disposed", stats.outgoing_disposed},
    {"outgoing_canceled_remote", stats.outgoing_canceled_remote},
    {"incoming_created", stats.incoming_created},
    {"incoming_completed", stats.incoming_completed},
    {"incoming_disposed", stats.incoming_disposed},
    {"incoming_canceled_local", stats.incoming_canceled_local},
    {"chunks_sent", stats.chunks_sent},
    {"chunks_received", stats.chunks_received},
    {"chunks_deferred", stats.chunks_deferred},
    {"chunks_dropped_canceled", stats.chunks_dropped_canceled},
    {"chunks_rejected", stats.chunks_rejected},
    {"bytes_sent", stats.bytes_sent},
    {"bytes_received", stats.bytes_received},
    {"cancel_notices_sent", stats.cancel_notices_sent},
    {"messages_sent", stats.messages_sent},
    {"incoming_buffered_bytes", stats.incoming_buffered_bytes}
  };
}

}  // namespace

int main(int argc, char* argv[]) {
  sim::SimConfig config;
  std::error_code ec;

  if (!sim::parse_args(argc, argv, config, ec)) {
    std::cerr << "Failed to parse arguments: " << ec.message() << '\n';
    std::cerr << "Usage: blobxfer-sim [--size <bytes>] [--transfers <n>] [options]" << '\n';
    return EXIT_FAILURE;
  }

  // JSON goes to stdout, so console logging is off in that mode.
  logging::configure_logging(config.verbose ? logging::LogLevel::debug : logging::LogLevel::info,
                             !config.json, config.log_file);
  if (config.transfer.trace_chunks) {
    logging::set_level(logging::LogLevel::trace);
  }

  std::string error;
  if (!sim::validate_config(config, error)) {
    LOG_ERROR("Invalid configuration: {}", error);
    std::cerr << "Invalid configuration: " << error << '\n';
    return EXIT_FAILURE;
  }

  std::uint64_t seed = config.seed;
  try {
    if (seed == 0) {
      seed = crypto::random_uint64();
    }
  } catch (const std::runtime_error& e) {
    LOG_CRITICAL("Failed to initialize random source: {}", e.what());
    std::cerr << "Failed to initialize random source: " << e.what() << '\n';
    return EXIT_FAILURE;
  }

  sim::LoopbackLink link;
  auto alive = [&link](transfer::PeerId peer) { return link.connected(peer); };

  transfer::TransferEngine sender(
      config.transfer,
      [&link](transfer::PeerId to, const transfer::TransferMessage& message) {
        link.send(kSenderPeer, to, message);
      },
      alive);
  transfer::TransferEngine receiver(
      config.transfer,
      [&link](transfer::PeerId to, const transfer::TransferMessage& message) {
        link.send(kReceiverPeer, to, message);
      },
      alive);

  LOG_INFO("Simulating {} transfer(s) of {} bytes at {} B/s, {} ticks/s, seed {}",
           config.transfers, config.blob_size, config.transfer.max_bytes_per_second,
           config.tick_rate, seed);

  std::mt19937_64 rng(seed);
  std::vector<SimTransfer> transfers(config.transfers);
  for (std::size_t i = 0; i < transfers.size(); ++i) {
    auto blob = make_blob(rng, config.blob_size);
    transfers[i].index = i;
    transfers[i].size = blob.size();
    transfers[i].digest = crypto::blob_digest(blob);
    transfers[i].sender_handle = sender.begin_outgoing_transfer(std::move(blob), kReceiverPeer);
  }

  const transfer::Seconds delta(1.0 / config.tick_rate);
  bool cancel_issued = false;
  std::uint64_t tick = 0;

  for (; tick < config.max_ticks; ++tick) {
    const transfer::TickTime time{delta * static_cast<double>(tick), delta};

    link.deliver(kSenderPeer, sender);
    link.deliver(kReceiverPeer, receiver);

    sender.update(time);
    receiver.update(time);

    // Sender side: acknowledge finished transfers, notice canceled ones.
    for (auto& t : transfers) {
      if (t.send_complete || t.status != TransferStatus::kPending) {
        continue;
      }
      auto view = sender.outgoing(t.sender_handle);
      if (view && view->is_complete()) {
        t.send_complete = true;
        t.send_complete_tick = tick;
        sender.release(t.sender_handle);
      } else if (!sender.exists(t.sender_handle)) {
        t.status = TransferStatus::kCanceled;
        LOG_INFO("Transfer {} was canceled by the receiver", t.index);
      }
    }

    // Receiver side: verify and consume complete blobs.
    for (const auto handle : receiver.incoming_transfers()) {
      auto view = receiver.incoming(handle);
      if (!view) {
        continue;
      }

      if (config.cancel_after != 0 && !cancel_issued && tick >= config.cancel_after &&
          view->in_progress()) {
        LOG_INFO("Receiver cancels incoming transfer at {}/{} bytes", view->bytes_received,
                 view->total_bytes);
        receiver.release(handle);
        cancel_issued = true;
        continue;
      }

      if (!view->is_complete()) {
        continue;
      }
      auto blob = receiver.take_incoming_blob(handle);
      if (!blob) {
        continue;
      }
      const auto digest = crypto::blob_digest(*blob);
      SimTransfer* t = match_transfer(transfers, digest);
      if (t == nullptr) {
        LOG_ERROR("Received {} bytes with unknown digest {}", blob->size(), crypto::to_hex(digest));
        for (auto& candidate : transfers) {
          if (candidate.status == TransferStatus::kPending && candidate.size == blob->size()) {
            candidate.status = TransferStatus::kCorrupted;
            break;
          }
        }
        continue;
      }
      t->status = TransferStatus::kDelivered;
      t->receive_complete_tick = tick;
    }

    bool done = true;
    for (const auto& t : transfers) {
      if (t.status == TransferStatus::kPending) {
        done = false;
        break;
      }
    }
    if (done && sender.outgoing_count() == 0 && receiver.incoming_count() == 0 &&
        link.in_flight() == 0) {
      ++tick;
      break;
    }
  }

  for (auto& t : transfers) {
    if (t.status == TransferStatus::kPending) {
      t.status = TransferStatus::kIncomplete;
      LOG_WARN("Transfer {} did not finish within {} ticks", t.index, config.max_ticks);
    }
  }

  bool failed = false;
  json report;
  report["seed"] = seed;
  report["ticks"] = tick;
  report["tick_rate"] = config.tick_rate;
  report["rate"] = config.transfer.max_bytes_per_second;
  report["transfers"] = json::array();

  for (const auto& t : transfers) {
    const bool expected_cancel = t.status == TransferStatus::kCanceled && config.cancel_after != 0;
    if (t.status != TransferStatus::kDelivered && !expected_cancel) {
      failed = true;
    }

    const double seconds = static_cast<double>(t.receive_complete_tick) / config.tick_rate;
    const double throughput = seconds > 0.0 ? static_cast<double>(t.size) / seconds : 0.0;

    json entry{
      {"index", t.index},
      {"size", t.size},
      {"status", status_to_string(t.status)},
      {"digest", crypto::to_hex(t.digest)},
      {"digest_match", t.status == TransferStatus::kDelivered},
      {"ticks", t.receive_complete_tick},
      {"seconds", seconds},
      {"throughput", throughput}
    };
    report["transfers"].push_back(entry);

    if (!config.json) {
      std::cout << "transfer " << t.index << ": " << status_to_string(t.status) << ", "
                << t.size << " bytes";
      if (t.status == TransferStatus::kDelivered) {
        std::cout << " in " << t.receive_complete_tick << " ticks (" << std::fixed
                  << std::setprecision(2) << seconds << "s, " << std::setprecision(1)
                  << throughput / 1024.0 << " kB/s)";
      }
      std::cout << '\n';
    }
  }

  report["sender"] = stats_to_json(sender.stats());
  report["receiver"] = stats_to_json(receiver.stats());
  report["link"] = json{
    {"datagrams_sent", link.stats().datagrams_sent},
    {"bytes_sent", link.stats().bytes_sent},
    {"datagrams_rejected", link.stats().datagrams_rejected}
  };
  report["ok"] = !failed;

  if (config.json) {
    std::cout << report.dump(2) << '\n';
  }

  if (failed) {
    LOG_ERROR("Simulation finished with failures after {} ticks", tick);
    return EXIT_FAILURE;
  }
  LOG_INFO("Simulation finished after {} ticks", tick);
  return EXIT_SUCCESS;
}
