#include "tftpws/packet.hpp"
#include "tftpws/errors.hpp"

#include <cctype>
#include <type_traits>

namespace tftpws {

namespace {

template <class>
inline constexpr bool always_false = false;

void append_u16(std::vector<char> &packet, uint16_t value) {
    uint16_t net_value = htons(value);
    packet.insert(packet.end(), (char *)&net_value, (char *)&net_value + sizeof(net_value));
}

void append_string(std::vector<char> &packet, const std::string &value) {
    packet.insert(packet.end(), value.begin(), value.end());
    packet.push_back('\0');
}

uint16_t read_u16(const char *buffer) {
    uint16_t value;
    memcpy(&value, buffer, sizeof(value));
    return ntohs(value);
}

void expect_opcode(const char *buffer, size_t size, uint16_t expected, size_t min_size) {
    if (size < 2) {
        throw ProtocolError(ProtocolError::Kind::MalformedPacket,
                            "Protocol error: packet too short (" + std::to_string(size) + " bytes)");
    }
    uint16_t opcode = get_opcode(buffer, size);
    if (opcode != expected) {
        throw ProtocolError::unexpected_opcode(expected, opcode);
    }
    if (size < min_size) {
        throw ProtocolError(ProtocolError::Kind::MalformedPacket,
                            std::string("Protocol error: truncated ") + opcode_name(expected) +
                                " packet (" + std::to_string(size) + " bytes)");
    }
}

std::string to_lower(std::string value) {
    for (char &c : value) c = static_cast<char>(tolower(static_cast<unsigned char>(c)));
    return value;
}

// Splits a run of NUL-terminated strings. A final unterminated run is kept,
// an empty tail after the last NUL is not.
std::vector<std::string> split_strings(const char *ptr, const char *end) {
    std::vector<std::string> parts;
    while (ptr < end) {
        const char *terminator = (const char *)memchr(ptr, '\0', end - ptr);
        if (terminator == nullptr) {
            parts.emplace_back(ptr, end - ptr);
            break;
        }
        parts.emplace_back(ptr, terminator - ptr);
        ptr = terminator + 1;
    }
    return parts;
}

} // namespace

// --- Packet Creation Functions ---

std::vector<char> encode_request(const std::string &filename, const std::string &mode,
                                 const RequestOptions &options) {
    std::vector<char> packet;
    append_u16(packet, TFTP_OPCODE_RRQ);
    append_string(packet, filename);
    append_string(packet, mode);

    if (options.block_size != DEFAULT_BLOCK_SIZE) {
        append_string(packet, OPTION_BLKSIZE);
        append_string(packet, std::to_string(options.block_size));
    }
    if (options.window_size) {
        append_string(packet, OPTION_WINDOWSIZE);
        append_string(packet, std::to_string(*options.window_size));
    }
    return packet;
}

std::vector<char> encode_ack(uint16_t block_num) {
    std::vector<char> packet;
    packet.reserve(ACK_PACKET_SIZE);
    append_u16(packet, TFTP_OPCODE_ACK);
    append_u16(packet, block_num);
    return packet;
}

std::vector<char> encode_data(uint16_t block_num, const char *data, size_t data_size) {
    if (data_size > MAX_BLOCK_SIZE) {
        throw std::length_error("Data size exceeds maximum allowed");
    }
    std::vector<char> packet(DATA_HEADER_SIZE + data_size);
    uint16_t opcode = htons(TFTP_OPCODE_DATA);
    uint16_t net_block_num = htons(block_num);
    memcpy(packet.data(), &opcode, sizeof(opcode));
    memcpy(packet.data() + sizeof(opcode), &net_block_num, sizeof(net_block_num));
    if (data_size > 0) {
        memcpy(packet.data() + DATA_HEADER_SIZE, data, data_size);
    }
    return packet;
}

std::vector<char> encode_error(uint16_t error_code, const std::string &message) {
    std::vector<char> packet;
    append_u16(packet, TFTP_OPCODE_ERROR);
    append_u16(packet, error_code);
    append_string(packet, message);
    return packet;
}

std::vector<char> encode_option_ack(const OptionList &options) {
    std::vector<char> packet;
    append_u16(packet, TFTP_OPCODE_OACK);
    for (const auto &option : options) {
        append_string(packet, option.first);
        append_string(packet, option.second);
    }
    return packet;
}

// --- Packet Parsing Functions ---

uint16_t get_opcode(const char *buffer, size_t size) {
    if (size < 2)
        return 0; // Invalid packet
    return read_u16(buffer);
}

RequestPacket decode_request(const char *buffer, size_t size) {
    expect_opcode(buffer, size, TFTP_OPCODE_RRQ, 6); // Opcode(2) + name(1) + 0 + mode(1) + 0

    std::vector<std::string> parts = split_strings(buffer + 2, buffer + size);
    if (parts.size() < 2 || parts[0].empty() || parts[1].empty()) {
        throw ProtocolError(ProtocolError::Kind::MalformedPacket,
                            "Protocol error: request is missing filename or mode");
    }

    RequestPacket request;
    request.filename = parts[0];
    request.mode = parts[1];
    for (size_t i = 2; i + 1 < parts.size(); i += 2) {
        if (!parts[i].empty()) {
            request.options.emplace_back(to_lower(parts[i]), parts[i + 1]);
        }
    }
    return request;
}

DataPacket decode_data(const char *buffer, size_t size) {
    expect_opcode(buffer, size, TFTP_OPCODE_DATA, DATA_HEADER_SIZE);
    DataPacket data;
    data.block = read_u16(buffer + 2);
    data.payload.assign(buffer + DATA_HEADER_SIZE, buffer + size);
    return data;
}

AckPacket decode_ack(const char *buffer, size_t size) {
    expect_opcode(buffer, size, TFTP_OPCODE_ACK, ACK_PACKET_SIZE);
    AckPacket ack;
    ack.block = read_u16(buffer + 2);
    return ack;
}

ErrorPacket decode_error(const char *buffer, size_t size) {
    expect_opcode(buffer, size, TFTP_OPCODE_ERROR, ERROR_HEADER_SIZE);
    ErrorPacket error;
    error.code = read_u16(buffer + 2);

    const char *msg_start = buffer + ERROR_HEADER_SIZE;
    const char *msg_end = buffer + size;
    while (msg_end > msg_start && *(msg_end - 1) == '\0') {
        --msg_end;
    }
    error.message.reserve(msg_end - msg_start);
    for (const char *p = msg_start; p < msg_end; ++p) {
        // Non-ASCII bytes cannot be represented, substitute them
        error.message.push_back(static_cast<unsigned char>(*p) < 0x80 ? *p : '?');
    }
    return error;
}

OptionAckPacket decode_option_ack(const char *buffer, size_t size) {
    expect_opcode(buffer, size, TFTP_OPCODE_OACK, 2);
    OptionAckPacket oack;
    std::vector<std::string> parts = split_strings(buffer + 2, buffer + size);
    for (size_t i = 0; i + 1 < parts.size(); i += 2) {
        if (parts[i].empty()) {
            continue;
        }
        oack.options[to_lower(parts[i])] = parts[i + 1];
    }
    return oack;
}

Packet decode_packet(const char *buffer, size_t size) {
    if (size < 2) {
        throw ProtocolError(ProtocolError::Kind::MalformedPacket,
                            "Protocol error: packet too short (" + std::to_string(size) + " bytes)");
    }
    uint16_t opcode = get_opcode(buffer, size);
    switch (opcode) {
    case TFTP_OPCODE_RRQ:
        return decode_request(buffer, size);
    case TFTP_OPCODE_DATA:
        return decode_data(buffer, size);
    case TFTP_OPCODE_ACK:
        return decode_ack(buffer, size);
    case TFTP_OPCODE_ERROR:
        return decode_error(buffer, size);
    case TFTP_OPCODE_OACK:
        return decode_option_ack(buffer, size);
    default:
        throw ProtocolError(ProtocolError::Kind::UnexpectedOpcode,
                            "Protocol error: unsupported opcode " + std::to_string(opcode));
    }
}

uint16_t opcode_of(const Packet &packet) {
    return std::visit(
        [](const auto &p) -> uint16_t {
            using T = std::decay_t<decltype(p)>;
            if constexpr (std::is_same_v<T, RequestPacket>) {
                return TFTP_OPCODE_RRQ;
            } else if constexpr (std::is_same_v<T, DataPacket>) {
                return TFTP_OPCODE_DATA;
            } else if constexpr (std::is_same_v<T, AckPacket>) {
                return TFTP_OPCODE_ACK;
            } else if constexpr (std::is_same_v<T, ErrorPacket>) {
                return TFTP_OPCODE_ERROR;
            } else if constexpr (std::is_same_v<T, OptionAckPacket>) {
                return TFTP_OPCODE_OACK;
            } else {
                static_assert(always_false<T>, "unhandled packet type");
            }
        },
        packet);
}

const char *opcode_name(uint16_t opcode) {
    switch (opcode) {
    case TFTP_OPCODE_RRQ: return "RRQ";
    case TFTP_OPCODE_WRQ: return "WRQ";
    case TFTP_OPCODE_DATA: return "DATA";
    case TFTP_OPCODE_ACK: return "ACK";
    case TFTP_OPCODE_ERROR: return "ERROR";
    case TFTP_OPCODE_OACK: return "OACK";
    default: return "UNKNOWN";
    }
}

} // namespace tftpws
