#include "tftpws/negotiation.hpp"
#include "tftpws/errors.hpp"

#include <type_traits>

namespace tftpws {

namespace {

template <class>
inline constexpr bool always_false = false;

uint16_t parse_option(const OptionMap &options, const char *name, uint32_t min_value,
                      uint32_t max_value, uint16_t fallback) {
    auto it = options.find(name);
    if (it == options.end()) {
        return fallback;
    }
    std::optional<uint32_t> value = parse_decimal(it->second, min_value, max_value);
    if (!value) {
        throw ProtocolError(ProtocolError::Kind::MalformedPacket,
                            std::string("Protocol error: server sent invalid ") + name + " '" +
                                it->second + "'");
    }
    return static_cast<uint16_t>(*value);
}

} // namespace

SessionParameters negotiate(const OptionAckPacket &oack, const ClientConfig &config) {
    SessionParameters params;
    params.options_acknowledged = true;

    // RFC 2348: the server may lower the block size, never raise it
    params.block_size = parse_option(oack.options, OPTION_BLKSIZE, MIN_BLOCK_SIZE,
                                     config.block_size, DEFAULT_BLOCK_SIZE);

    if (oack.options.count(OPTION_WINDOWSIZE) != 0 && !config.window_size) {
        throw ProtocolError(ProtocolError::Kind::MalformedPacket,
                            "Protocol error: server acknowledged windowsize that was not requested");
    }
    // RFC 7440: likewise the window may only shrink
    params.window_size = parse_option(oack.options, OPTION_WINDOWSIZE, 1,
                                      config.requested_window_size(), DEFAULT_WINDOW_SIZE);
    return params;
}

SessionParameters negotiate(const Packet &first_reply, const ClientConfig &config) {
    return std::visit(
        [&config, &first_reply](const auto &packet) -> SessionParameters {
            using T = std::decay_t<decltype(packet)>;
            if constexpr (std::is_same_v<T, OptionAckPacket>) {
                return negotiate(packet, config);
            } else if constexpr (std::is_same_v<T, DataPacket>) {
                // Server without option support: lock-step RFC 1350 transfer
                return SessionParameters{};
            } else if constexpr (std::is_same_v<T, ErrorPacket>) {
                throw RemoteError(packet.code, packet.message);
            } else if constexpr (std::is_same_v<T, RequestPacket> ||
                                 std::is_same_v<T, AckPacket>) {
                throw ProtocolError(ProtocolError::Kind::UnexpectedOpcode,
                                    std::string("Protocol error: unexpected ") +
                                        opcode_name(opcode_of(first_reply)) +
                                        " in reply to read request");
            } else {
                static_assert(always_false<T>, "unhandled packet type");
            }
        },
        first_reply);
}

} // namespace tftpws
