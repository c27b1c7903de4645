#ifndef TFTPWS_TRANSPORT_HPP
#define TFTPWS_TRANSPORT_HPP

#include "tftpws/tftp_common.hpp"

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace tftpws {

// Datagram channel between the client and one server transfer.
class DatagramTransport {
public:
  virtual ~DatagramTransport() = default;

  // Sends to the server. Before the first reply this is the address the
  // request goes to, afterwards the server's transfer ID.
  virtual void send(const std::vector<char> &packet) = 0;

  // Waits up to `timeout` for the next datagram from the server. Returns
  // nullopt when the timeout expires. Throws ProtocolError(SocketFailure) for
  // any other socket error.
  virtual std::optional<std::vector<char>>
  receive(std::chrono::milliseconds timeout) = 0;
};

// UDP implementation. Owns its socket and closes it on destruction.
class UdpTransport : public DatagramTransport {
public:
  UdpTransport(const std::string &server_ip, int server_port,
               size_t recv_buffer_bytes = MIN_RECV_BUFFER_BYTES,
               bool verbose = false);
  ~UdpTransport() override;

  UdpTransport(const UdpTransport &) = delete;
  UdpTransport &operator=(const UdpTransport &) = delete;

  void send(const std::vector<char> &packet) override;
  std::optional<std::vector<char>>
  receive(std::chrono::milliseconds timeout) override;

  bool has_transfer_id() const { return tid_locked_; }
  std::string peer() const;

private:
  bool same_endpoint(const sockaddr_in &a, const sockaddr_in &b) const;
  void reject_stranger(const sockaddr_in &from);

  NetworkInitializer net_init_; // RAII for Winsock init/cleanup
  SOCKET sock_ = INVALID_SOCKET;
  sockaddr_in server_addr_{};
  bool tid_locked_ = false;
  std::chrono::milliseconds current_timeout_{0};
  std::vector<char> buffer_;
  bool verbose_;
};

// Receive buffer large enough for two full windows, never below 512 KiB and
// capped at INT_MAX.
size_t recv_buffer_for(uint16_t window_size, uint16_t block_size);

} // namespace tftpws

#endif // TFTPWS_TRANSPORT_HPP
