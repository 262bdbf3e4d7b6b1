#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <system_error>

#include "transfer/transfer_message.h"

namespace blobxfer::transfer {

// Engine policy. max_chunk_size is a protocol constant and must match the
// peer; the rest is local policy.
struct TransferConfig {
  // Bytes per chunk frame. Must equal kChunkPayloadCapacity.
  std::size_t max_chunk_size{kChunkPayloadCapacity};

  // Ticks a completed transfer may linger before it is force-destroyed.
  std::uint32_t max_age_since_completion{4};

  // Global outgoing budget shared by all active outgoing transfers.
  std::size_t max_bytes_per_second{32 * 1024};

  // A per-transfer share must exceed this to emit anything in a tick.
  std::size_t min_transfer_quota{32};

  // Largest announced blob an incoming chunk may allocate.
  std::size_t max_incoming_bytes{static_cast<std::size_t>(64) * 1024 * 1024};

  // Number of canceled incoming ids remembered; oldest evicted first.
  std::size_t canceled_set_capacity{1024};

  // Log every chunk sent and received at trace level.
  bool trace_chunks{false};
};

// Validate configuration.
bool validate_config(const TransferConfig& config, std::string& error);

// Load the [transfer] section of an INI file into `config`.
// Keys not present in the file keep their current values.
bool load_config_file(const std::string& path, TransferConfig& config, std::error_code& ec);

// INI line helpers shared with the simulator's config loader.
bool parse_ini_value(const std::string& line, std::string& key, std::string& value);
std::string get_current_section(const std::string& line);
bool parse_bool(const std::string& value);

// Apply one [transfer] key. Unknown keys are ignored and return true.
bool apply_transfer_key(const std::string& key, const std::string& value, TransferConfig& config,
                        std::error_code& ec);

}  // namespace blobxfer::transfer
