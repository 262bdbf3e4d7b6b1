#include "transfer/transfer_config.h"

#include <cerrno>
#include <fstream>
#include <limits>

#include "common/config/safe_parse.h"
#include "common/logging/logger.h"

namespace blobxfer::transfer {

using config::safe_parse_int;

namespace {

constexpr const char* kIniWhitespace = " \t\r";

std::string trim(const std::string& text) {
  const auto first = text.find_first_not_of(kIniWhitespace);
  if (first == std::string::npos) {
    return {};
  }
  const auto last = text.find_last_not_of(kIniWhitespace);
  return text.substr(first, last - first + 1);
}

}  // namespace

bool parse_ini_value(const std::string& line, std::string& key, std::string& value) {
  const std::string content = trim(line);
  if (content.empty() || content.front() == '#' || content.front() == ';' ||
      content.front() == '[') {
    return false;
  }

  const auto separator = content.find('=');
  if (separator == std::string::npos) {
    return false;
  }
  key = trim(content.substr(0, separator));
  value = trim(content.substr(separator + 1));
  return !key.empty();
}

std::string get_current_section(const std::string& line) {
  const std::string content = trim(line);
  if (content.size() < 2 || content.front() != '[' || content.back() != ']') {
    return {};
  }
  return trim(content.substr(1, content.size() - 2));
}

bool parse_bool(const std::string& value) {
  return value == "true" || value == "1" || value == "yes";
}

bool apply_transfer_key(const std::string& key, const std::string& value, TransferConfig& config,
                        std::error_code& ec) {
  if (key == "max_chunk_size") {
    return safe_parse_int(value, config.max_chunk_size, key, ec);
  }
  if (key == "max_age_since_completion") {
    return safe_parse_int(value, config.max_age_since_completion, key, ec);
  }
  if (key == "max_bytes_per_second") {
    return safe_parse_int(value, config.max_bytes_per_second, key, ec);
  }
  if (key == "min_transfer_quota") {
    return safe_parse_int(value, config.min_transfer_quota, key, ec);
  }
  if (key == "max_incoming_bytes") {
    return safe_parse_int(value, config.max_incoming_bytes, key, ec);
  }
  if (key == "canceled_set_capacity") {
    return safe_parse_int(value, config.canceled_set_capacity, key, ec);
  }
  if (key == "trace_chunks") {
    config.trace_chunks = parse_bool(value);
  }
  return true;
}

bool load_config_file(const std::string& path, TransferConfig& config, std::error_code& ec) {
  std::ifstream file(path);
  if (!file) {
    ec = std::error_code(errno, std::generic_category());
    LOG_ERROR("Failed to open config file: {}", path);
    return false;
  }

  std::string line;
  std::string section;

  while (std::getline(file, line)) {
    std::string new_section = get_current_section(line);
    if (!new_section.empty()) {
      section = new_section;
      continue;
    }

    std::string key;
    std::string value;
    if (!parse_ini_value(line, key, value)) {
      continue;
    }

    if (section == "transfer" || section.empty()) {
      if (!apply_transfer_key(key, value, config, ec)) {
        return false;
      }
    }
  }

  LOG_DEBUG("Loaded transfer configuration from {}", path);
  return true;
}

bool validate_config(const TransferConfig& config, std::string& error) {
  if (config.max_chunk_size != kChunkPayloadCapacity) {
    error = "max_chunk_size must be " + std::to_string(kChunkPayloadCapacity) +
            " (chunk payload capacity shared with the peer)";
    return false;
  }

  if (config.max_age_since_completion == 0) {
    error = "max_age_since_completion must be greater than 0";
    return false;
  }

  if (config.max_bytes_per_second == 0) {
    error = "max_bytes_per_second must be greater than 0";
    return false;
  }

  if (config.min_transfer_quota >= config.max_bytes_per_second) {
    error = "min_transfer_quota (" + std::to_string(config.min_transfer_quota) +
            ") must be smaller than max_bytes_per_second (" +
            std::to_string(config.max_bytes_per_second) + ")";
    return false;
  }

  if (config.max_incoming_bytes == 0 ||
      config.max_incoming_bytes > std::numeric_limits<std::uint32_t>::max()) {
    error = "max_incoming_bytes must be between 1 and " +
            std::to_string(std::numeric_limits<std::uint32_t>::max());
    return false;
  }

  if (config.canceled_set_capacity == 0) {
    error = "canceled_set_capacity must be greater than 0";
    return false;
  }

  return true;
}

}  // namespace blobxfer::transfer
