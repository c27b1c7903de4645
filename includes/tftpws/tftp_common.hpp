#ifndef TFTPWS_TFTP_COMMON_HPP
#define TFTPWS_TFTP_COMMON_HPP

#include <chrono>
#include <cstdint>
#include <cstring>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

#ifdef _WIN32
#include <winsock2.h>
#include <ws2tcpip.h>
#pragma comment(lib, "ws2_32.lib")
using socklen_t = int;
#else // Linux/macOS
#include <arpa/inet.h>
#include <errno.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>
using SOCKET = int;
const int INVALID_SOCKET = -1;
const int SOCKET_ERROR = -1;
#define closesocket close
#endif

namespace tftpws {

// TFTP Opcodes
const uint16_t TFTP_OPCODE_RRQ = 1;
const uint16_t TFTP_OPCODE_WRQ = 2;
const uint16_t TFTP_OPCODE_DATA = 3;
const uint16_t TFTP_OPCODE_ACK = 4;
const uint16_t TFTP_OPCODE_ERROR = 5;
const uint16_t TFTP_OPCODE_OACK = 6; // RFC 2347

// TFTP Error Codes
const uint16_t TFTP_ERROR_NOT_DEFINED = 0;
const uint16_t TFTP_ERROR_FILE_NOT_FOUND = 1;
const uint16_t TFTP_ERROR_ACCESS_VIOLATION = 2;
const uint16_t TFTP_ERROR_DISK_FULL = 3;
const uint16_t TFTP_ERROR_ILLEGAL_OPERATION = 4;
const uint16_t TFTP_ERROR_UNKNOWN_TRANSFER_ID = 5;
const uint16_t TFTP_ERROR_FILE_ALREADY_EXISTS = 6;
const uint16_t TFTP_ERROR_NO_SUCH_USER = 7;
const uint16_t TFTP_ERROR_OPTION_REFUSED = 8; // RFC 2347

// Option names (RFC 2348, RFC 7440)
const char OPTION_BLKSIZE[] = "blksize";
const char OPTION_WINDOWSIZE[] = "windowsize";

// Constants
const int TFTP_DEFAULT_PORT = 69;
const int DATA_HEADER_SIZE = 4;
const int ACK_PACKET_SIZE = 4;
const int ERROR_HEADER_SIZE = 4;
const uint16_t DEFAULT_BLOCK_SIZE = 512; // RFC 1350
const uint16_t MIN_BLOCK_SIZE = 8;       // RFC 2348
const uint16_t MAX_BLOCK_SIZE = 65464;   // RFC 2348
const uint16_t DEFAULT_WINDOW_SIZE = 1;  // RFC 7440, same as lock-step
const uint32_t DEFAULT_TIMEOUT_MS = 5000;
const uint32_t DEFAULT_MAX_RETRIES = 5;
const size_t MIN_RECV_BUFFER_BYTES = 512 * 1024;
const size_t MAX_DATAGRAM_SIZE = 65536;

// Helper structure for network initialization/cleanup
struct NetworkInitializer {
  NetworkInitializer() {
#ifdef _WIN32
    WSADATA wsaData;
    if (WSAStartup(MAKEWORD(2, 2), &wsaData) != 0) {
      throw std::runtime_error("WSAStartup failed");
    }
#endif
  }
  ~NetworkInitializer() {
#ifdef _WIN32
    WSACleanup();
#endif
  }
  NetworkInitializer(const NetworkInitializer &) = delete;
  NetworkInitializer &operator=(const NetworkInitializer &) = delete;
};

// Helper function to set socket receive timeout
inline bool set_socket_timeout(SOCKET sock, std::chrono::milliseconds timeout) {
#ifdef _WIN32
  DWORD timeout_ms = static_cast<DWORD>(timeout.count());
  if (setsockopt(sock, SOL_SOCKET, SO_RCVTIMEO, (const char *)&timeout_ms,
                 sizeof(timeout_ms)) == SOCKET_ERROR) {
    return false;
  }
#else
  struct timeval tv;
  tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
  tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
  if (setsockopt(sock, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) < 0) {
    return false;
  }
#endif
  return true;
}

// Helper function to grow the kernel receive buffer so a full window fits
inline bool set_socket_recv_buffer(SOCKET sock, size_t bytes) {
  const size_t max_bytes = static_cast<size_t>(std::numeric_limits<int>::max());
  int size = static_cast<int>(bytes < max_bytes ? bytes : max_bytes);
  return setsockopt(sock, SOL_SOCKET, SO_RCVBUF, (const char *)&size,
                    sizeof(size)) != SOCKET_ERROR;
}

// True when the last socket call failed because the receive timeout expired
inline bool last_error_is_timeout() {
#ifdef _WIN32
  return WSAGetLastError() == WSAETIMEDOUT;
#else
  return errno == EAGAIN || errno == EWOULDBLOCK;
#endif
}

inline std::string last_socket_error() {
#ifdef _WIN32
  return "WSError " + std::to_string(WSAGetLastError());
#else
  return std::string(strerror(errno));
#endif
}

} // namespace tftpws

#endif // TFTPWS_TFTP_COMMON_HPP
