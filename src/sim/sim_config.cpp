#include "sim/sim_config.h"

#include <cerrno>
#include <fstream>

#include <CLI/CLI.hpp>

#include "common/config/safe_parse.h"
#include "common/logging/logger.h"

namespace blobxfer::sim {

namespace {

bool apply_sim_key(const std::string& key, const std::string& value, SimConfig& config,
                   std::error_code& ec) {
  if (key == "size") {
    return config::safe_parse_int(value, config.blob_size, key, ec);
  }
  if (key == "transfers") {
    return config::safe_parse_int(value, config.transfers, key, ec);
  }
  if (key == "tick_rate") {
    return config::safe_parse_double(value, config.tick_rate, key, ec);
  }
  if (key == "max_ticks") {
    return config::safe_parse_int(value, config.max_ticks, key, ec);
  }
  if (key == "cancel_after") {
    return config::safe_parse_int(value, config.cancel_after, key, ec);
  }
  if (key == "seed") {
    return config::safe_parse_int(value, config.seed, key, ec);
  }
  if (key == "log_file") {
    config.log_file = value;
  } else if (key == "verbose") {
    config.verbose = transfer::parse_bool(value);
  } else if (key == "json") {
    config.json = transfer::parse_bool(value);
  }
  return true;
}

}  // namespace

bool parse_args(int argc, char* argv[], SimConfig& config, std::error_code& ec) {
  CLI::App app{"blobxfer loopback simulator"};

  // Values parsed here are copied over the file's only when given explicitly.
  SimConfig cli = config;

  app.add_option("-c,--config", config.config_file, "Configuration file path");
  auto* verbose = app.add_flag("-v,--verbose", cli.verbose, "Enable debug logging");
  auto* json = app.add_flag("--json", cli.json, "Print the report as JSON");
  auto* log_file = app.add_option("--log-file", cli.log_file, "Log file path");

  // Scenario.
  auto* size = app.add_option("-s,--size", cli.blob_size, "Blob size in bytes");
  auto* transfers = app.add_option("-n,--transfers", cli.transfers, "Simultaneous transfers");
  auto* tick_rate = app.add_option("--tick-rate", cli.tick_rate, "Ticks per second");
  auto* max_ticks = app.add_option("--max-ticks", cli.max_ticks, "Give up after this many ticks");
  auto* cancel_after = app.add_option("--cancel-after", cli.cancel_after,
                                      "Receiver cancels the first transfer after N ticks");
  auto* seed = app.add_option("--seed", cli.seed, "Blob content seed (0 = random)");

  // Transfer policy.
  auto* rate = app.add_option("-r,--rate", cli.transfer.max_bytes_per_second,
                              "Outgoing budget in bytes per second");
  auto* trace = app.add_flag("--trace-chunks", cli.transfer.trace_chunks,
                             "Log every chunk at trace level");

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError& e) {
    LOG_ERROR("Argument error: {}", e.what());
    ec = std::make_error_code(std::errc::invalid_argument);
    return false;
  }

  // Load config file if specified.
  if (!config.config_file.empty()) {
    if (!load_config_file(config.config_file, config, ec)) {
      return false;
    }
  }

  if (verbose->count() > 0) config.verbose = cli.verbose;
  if (json->count() > 0) config.json = cli.json;
  if (log_file->count() > 0) config.log_file = cli.log_file;
  if (size->count() > 0) config.blob_size = cli.blob_size;
  if (transfers->count() > 0) config.transfers = cli.transfers;
  if (tick_rate->count() > 0) config.tick_rate = cli.tick_rate;
  if (max_ticks->count() > 0) config.max_ticks = cli.max_ticks;
  if (cancel_after->count() > 0) config.cancel_after = cli.cancel_after;
  if (seed->count() > 0) config.seed = cli.seed;
  if (rate->count() > 0) config.transfer.max_bytes_per_second = cli.transfer.max_bytes_per_second;
  if (trace->count() > 0) config.transfer.trace_chunks = cli.transfer.trace_chunks;

  return true;
}

bool load_config_file(const std::string& path, SimConfig& config, std::error_code& ec) {
  std::ifstream file(path);
  if (!file) {
    ec = std::error_code(errno, std::generic_category());
    LOG_ERROR("Failed to open config file: {}", path);
    return false;
  }

  std::string line;
  std::string section;

  while (std::getline(file, line)) {
    std::string new_section = transfer::get_current_section(line);
    if (!new_section.empty()) {
      section = new_section;
      continue;
    }

    std::string key;
    std::string value;
    if (!transfer::parse_ini_value(line, key, value)) {
      continue;
    }

    if (section == "sim" || section.empty()) {
      if (!apply_sim_key(key, value, config, ec)) {
        return false;
      }
    } else if (section == "transfer") {
      if (!transfer::apply_transfer_key(key, value, config.transfer, ec)) {
        return false;
      }
    }
  }

  return true;
}

bool validate_config(const SimConfig& config, std::string& error) {
  if (config.blob_size == 0) {
    error = "Blob size must be greater than 0";
    return false;
  }
  if (config.blob_size > config.transfer.max_incoming_bytes) {
    error = "Blob size " + std::to_string(config.blob_size) +
            " exceeds max_incoming_bytes (" + std::to_string(config.transfer.max_incoming_bytes) +
            ")";
    return false;
  }
  if (config.transfers == 0) {
    error = "Number of transfers must be greater than 0";
    return false;
  }
  if (!(config.tick_rate > 0.0)) {
    error = "Tick rate must be positive";
    return false;
  }
  if (config.max_ticks == 0) {
    error = "max_ticks must be greater than 0";
    return false;
  }
  return transfer::validate_config(config.transfer, error);
}

}  // namespace blobxfer::sim
