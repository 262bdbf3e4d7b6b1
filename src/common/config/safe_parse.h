#pragma once

#include <limits>
#include <stdexcept>
#include <string>
#include <system_error>
#include <type_traits>

#include "common/logging/logger.h"

namespace blobxfer::config {

// Parse an integer config value, rejecting negatives for unsigned targets,
// trailing characters and out-of-range values.
template <typename T>
inline bool safe_parse_int(const std::string& value, T& out, const std::string& field_name,
                           std::error_code& ec) {
  try {
    if constexpr (std::is_unsigned_v<T>) {
      if (!value.empty() && value[0] == '-') {
        LOG_ERROR("Configuration error: {} value '{}' cannot be negative", field_name, value);
        ec = std::make_error_code(std::errc::result_out_of_range);
        return false;
      }
      std::size_t consumed = 0;
      unsigned long long parsed = std::stoull(value, &consumed);
      if (consumed != value.size()) {
        throw std::invalid_argument(field_name);
      }
      if (parsed > std::numeric_limits<T>::max()) {
        LOG_ERROR("Configuration error: {} value '{}' is out of range", field_name, value);
        ec = std::make_error_code(std::errc::result_out_of_range);
        return false;
      }
      out = static_cast<T>(parsed);
    } else {
      std::size_t consumed = 0;
      long long parsed = std::stoll(value, &consumed);
      if (consumed != value.size()) {
        throw std::invalid_argument(field_name);
      }
      if (parsed < std::numeric_limits<T>::min() || parsed > std::numeric_limits<T>::max()) {
        LOG_ERROR("Configuration error: {} value '{}' is out of range", field_name, value);
        ec = std::make_error_code(std::errc::result_out_of_range);
        return false;
      }
      out = static_cast<T>(parsed);
    }
    return true;
  } catch (const std::invalid_argument&) {
    LOG_ERROR("Configuration error: {} value '{}' is not a valid number", field_name, value);
    ec = std::make_error_code(std::errc::invalid_argument);
    return false;
  } catch (const std::out_of_range&) {
    LOG_ERROR("Configuration error: {} value '{}' is out of range", field_name, value);
    ec = std::make_error_code(std::errc::result_out_of_range);
    return false;
  }
}

// Parse a positive floating-point config value.
inline bool safe_parse_double(const std::string& value, double& out, const std::string& field_name,
                              std::error_code& ec) {
  try {
    std::size_t consumed = 0;
    const double parsed = std::stod(value, &consumed);
    if (consumed != value.size() || !(parsed > 0.0)) {
      throw std::invalid_argument(field_name);
    }
    out = parsed;
    return true;
  } catch (const std::invalid_argument&) {
    LOG_ERROR("Configuration error: {} value '{}' is not a positive number", field_name, value);
    ec = std::make_error_code(std::errc::invalid_argument);
    return false;
  } catch (const std::out_of_range&) {
    LOG_ERROR("Configuration error: {} value '{}' is out of range", field_name, value);
    ec = std::make_error_code(std::errc::result_out_of_range);
    return false;
  }
}

}  // namespace blobxfer::config
