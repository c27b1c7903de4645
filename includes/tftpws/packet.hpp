/*
 * RRQ   -> | Opcode=1 | Filename | 0 | Mode | 0 | (Option | 0 | Value | 0)* |
 * DATA  -> | Opcode=3 | Block # (2 bytes) | Data (0..blksize bytes) |
 * ACK   -> | Opcode=4 | Block # (2 bytes) |
 * ERROR -> | Opcode=5 | ErrorCode (2 bytes) | ErrMsg | 0 |
 * OACK  -> | Opcode=6 | (Option | 0 | Value | 0)* |
 *
 * All integers are in network byte order.
 */

#ifndef TFTPWS_PACKET_HPP
#define TFTPWS_PACKET_HPP

#include "tftpws/tftp_common.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace tftpws {

using OptionList = std::vector<std::pair<std::string, std::string>>;
using OptionMap = std::map<std::string, std::string>;

struct RequestPacket {
  std::string filename;
  std::string mode;
  OptionList options; // in wire order
};

struct DataPacket {
  uint16_t block = 0;
  std::vector<char> payload;
};

struct AckPacket {
  uint16_t block = 0;
};

struct ErrorPacket {
  uint16_t code = 0;
  std::string message;
};

struct OptionAckPacket {
  OptionMap options; // keys lower-cased
};

using Packet = std::variant<RequestPacket, DataPacket, AckPacket, ErrorPacket,
                            OptionAckPacket>;

// Options a client may attach to a read request.
struct RequestOptions {
  uint16_t block_size = DEFAULT_BLOCK_SIZE; // sent only if != 512
  std::optional<uint16_t> window_size;      // sent only if set
};

// --- Packet Creation Functions ---

std::vector<char> encode_request(const std::string &filename,
                                 const std::string &mode,
                                 const RequestOptions &options);
std::vector<char> encode_ack(uint16_t block_num);
std::vector<char> encode_data(uint16_t block_num, const char *data,
                              size_t data_size);
std::vector<char> encode_error(uint16_t error_code, const std::string &message);
std::vector<char> encode_option_ack(const OptionList &options);

// --- Packet Parsing Functions ---
// Each decode_* throws ProtocolError(UnexpectedOpcode) when the buffer holds a
// different packet type and ProtocolError(MalformedPacket) when it is
// truncated.

uint16_t get_opcode(const char *buffer, size_t size);

RequestPacket decode_request(const char *buffer, size_t size);
DataPacket decode_data(const char *buffer, size_t size);
AckPacket decode_ack(const char *buffer, size_t size);
ErrorPacket decode_error(const char *buffer, size_t size);
OptionAckPacket decode_option_ack(const char *buffer, size_t size);

// Decodes any packet a read transfer can see. WRQ and unknown opcodes are
// rejected with ProtocolError(UnexpectedOpcode).
Packet decode_packet(const char *buffer, size_t size);

inline DataPacket decode_data(const std::vector<char> &buffer) {
  return decode_data(buffer.data(), buffer.size());
}
inline AckPacket decode_ack(const std::vector<char> &buffer) {
  return decode_ack(buffer.data(), buffer.size());
}
inline ErrorPacket decode_error(const std::vector<char> &buffer) {
  return decode_error(buffer.data(), buffer.size());
}
inline OptionAckPacket decode_option_ack(const std::vector<char> &buffer) {
  return decode_option_ack(buffer.data(), buffer.size());
}
inline RequestPacket decode_request(const std::vector<char> &buffer) {
  return decode_request(buffer.data(), buffer.size());
}
inline Packet decode_packet(const std::vector<char> &buffer) {
  return decode_packet(buffer.data(), buffer.size());
}

uint16_t opcode_of(const Packet &packet);
const char *opcode_name(uint16_t opcode);

} // namespace tftpws

#endif // TFTPWS_PACKET_HPP
