#ifndef TFTPWS_CONFIG_HPP
#define TFTPWS_CONFIG_HPP

#include "tftpws/tftp_common.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace tftpws {

// Per-transfer client settings. Passed by value into the transfer engine.
struct ClientConfig {
  uint16_t block_size = DEFAULT_BLOCK_SIZE;
  // Unset means the windowsize option is not requested at all.
  std::optional<uint16_t> window_size;
  std::chrono::milliseconds timeout{DEFAULT_TIMEOUT_MS};
  uint32_t max_retries = DEFAULT_MAX_RETRIES;
  std::string mode = "octet";
  bool verbose = false;

  // Throws ConfigError describing the first invalid field.
  void validate() const;

  // Window size the client asks for, 1 when the option is not requested.
  uint16_t requested_window_size() const {
    return window_size ? *window_size : DEFAULT_WINDOW_SIZE;
  }
};

// Parses a decimal option value into [min_value, max_value]. Returns nullopt
// for anything that is not a plain in-range decimal number.
std::optional<uint32_t> parse_decimal(const std::string &text,
                                      uint32_t min_value, uint32_t max_value);

} // namespace tftpws

#endif // TFTPWS_CONFIG_HPP
