#ifndef TFTPWS_ERRORS_HPP
#define TFTPWS_ERRORS_HPP

#include <cstdint>
#include <stdexcept>
#include <string>

namespace tftpws {

// Base for every fatal transfer failure. Timeouts are not errors, the
// transfer engine recovers from them locally.
class TransferError : public std::runtime_error {
public:
  explicit TransferError(const std::string &what) : std::runtime_error(what) {}
};

class ProtocolError : public TransferError {
public:
  enum class Kind {
    UnexpectedOpcode, // wrong opcode for the current phase
    MalformedPacket,  // truncated packet or unusable field value
    SocketFailure     // send/recv failed for a reason other than timeout
  };

  ProtocolError(Kind kind, const std::string &what)
      : TransferError(what), kind_(kind) {}

  Kind kind() const { return kind_; }

  static ProtocolError unexpected_opcode(uint16_t expected, uint16_t actual) {
    return ProtocolError(Kind::UnexpectedOpcode,
                         "Protocol error: expected opcode " +
                             std::to_string(expected) + ", got " +
                             std::to_string(actual));
  }

private:
  Kind kind_;
};

// The server answered with an ERROR packet.
class RemoteError : public TransferError {
public:
  RemoteError(uint16_t code, const std::string &message)
      : TransferError("TFTP Error " + std::to_string(code) + ": " + message),
        code_(code), message_(message) {}

  uint16_t code() const { return code_; }
  const std::string &message() const { return message_; }

private:
  uint16_t code_;
  std::string message_;
};

class MaxRetriesExceeded : public TransferError {
public:
  explicit MaxRetriesExceeded(uint32_t retries)
      : TransferError("Timed out after " + std::to_string(retries) +
                      " consecutive retries"),
        retries_(retries) {}

  uint32_t retries() const { return retries_; }

private:
  uint32_t retries_;
};

class ConfigError : public std::invalid_argument {
public:
  explicit ConfigError(const std::string &what) : std::invalid_argument(what) {}
};

} // namespace tftpws

#endif // TFTPWS_ERRORS_HPP
