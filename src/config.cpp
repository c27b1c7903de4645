#include "tftpws/config.hpp"
#include "tftpws/errors.hpp"

#include <cctype>

namespace tftpws {

void ClientConfig::validate() const {
    if (block_size < MIN_BLOCK_SIZE || block_size > MAX_BLOCK_SIZE) {
        throw ConfigError("Block size must be between " + std::to_string(MIN_BLOCK_SIZE) +
                          " and " + std::to_string(MAX_BLOCK_SIZE) + ", got " +
                          std::to_string(block_size));
    }
    if (window_size && *window_size == 0) {
        throw ConfigError("Window size must be at least 1");
    }
    if (timeout.count() <= 0) {
        throw ConfigError("Timeout must be positive");
    }
    if (max_retries == 0) {
        throw ConfigError("Retry limit must be at least 1");
    }

    std::string lower_mode = mode;
    for (char &c : lower_mode) c = static_cast<char>(tolower(static_cast<unsigned char>(c)));
    if (lower_mode != "octet" && lower_mode != "netascii") {
        throw ConfigError("Unsupported transfer mode '" + mode + "' (use octet or netascii)");
    }
}

std::optional<uint32_t> parse_decimal(const std::string &text, uint32_t min_value,
                                      uint32_t max_value) {
    if (text.empty() || text.size() > 10) {
        return std::nullopt;
    }
    uint64_t value = 0;
    for (char c : text) {
        if (!isdigit(static_cast<unsigned char>(c))) {
            return std::nullopt;
        }
        value = value * 10 + static_cast<uint64_t>(c - '0');
    }
    if (value < min_value || value > max_value) {
        return std::nullopt;
    }
    return static_cast<uint32_t>(value);
}

} // namespace tftpws
