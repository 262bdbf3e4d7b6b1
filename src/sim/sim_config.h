#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <system_error>

#include "transfer/transfer_config.h"

namespace blobxfer::sim {

// Loopback simulator configuration.
struct SimConfig {
  // General settings.
  std::string config_file;
  std::string log_file;
  bool verbose{false};
  bool json{false};

  // Scenario.
  std::size_t blob_size{64 * 1024};
  std::size_t transfers{1};
  double tick_rate{60.0};
  std::uint64_t max_ticks{100000};

  // Receiver releases the first incoming transfer after this many ticks.
  // Zero disables the cancel.
  std::uint64_t cancel_after{0};

  // Seed for blob contents. Zero draws one from the system CSPRNG.
  std::uint64_t seed{0};

  // Applied to both engines.
  transfer::TransferConfig transfer;
};

// Parse command-line arguments into configuration.
// Options given on the command line override values from --config.
bool parse_args(int argc, char* argv[], SimConfig& config, std::error_code& ec);

// Load the [sim] and [transfer] sections of an INI file.
bool load_config_file(const std::string& path, SimConfig& config, std::error_code& ec);

// Validate configuration, including the embedded transfer configuration.
bool validate_config(const SimConfig& config, std::string& error);

}  // namespace blobxfer::sim
