#include "tftpws/transport.hpp"
#include "tftpws/errors.hpp"
#include "tftpws/packet.hpp"

#include <algorithm>
#include <iostream>
#include <limits>

namespace tftpws {

size_t recv_buffer_for(uint16_t window_size, uint16_t block_size) {
    size_t window_bytes = static_cast<size_t>(window_size) * (block_size + DATA_HEADER_SIZE) * 2;
    // SO_RCVBUF takes an int
    const size_t max_bytes = static_cast<size_t>(std::numeric_limits<int>::max());
    return std::min(std::max(window_bytes, MIN_RECV_BUFFER_BYTES), max_bytes);
}

UdpTransport::UdpTransport(const std::string &server_ip, int server_port,
                           size_t recv_buffer_bytes, bool verbose)
    : buffer_(MAX_DATAGRAM_SIZE), verbose_(verbose) {
    server_addr_.sin_family = AF_INET;
    server_addr_.sin_port = htons(static_cast<uint16_t>(server_port));
    if (inet_pton(AF_INET, server_ip.c_str(), &server_addr_.sin_addr) <= 0) {
        throw ConfigError("Invalid server address: " + server_ip);
    }

    sock_ = socket(AF_INET, SOCK_DGRAM, IPPROTO_UDP);
    if (sock_ == INVALID_SOCKET) {
        throw ProtocolError(ProtocolError::Kind::SocketFailure,
                            "Failed to create socket: " + last_socket_error());
    }

    if (!set_socket_recv_buffer(sock_, recv_buffer_bytes)) {
        // The kernel may cap the size; a smaller buffer only costs drops.
        std::cerr << "Warning: could not set receive buffer to " << recv_buffer_bytes
                  << " bytes: " << last_socket_error() << std::endl;
    }
}

UdpTransport::~UdpTransport() {
    if (sock_ != INVALID_SOCKET) {
        closesocket(sock_);
    }
}

std::string UdpTransport::peer() const {
    char ip[INET_ADDRSTRLEN];
    inet_ntop(AF_INET, &server_addr_.sin_addr, ip, INET_ADDRSTRLEN);
    return std::string(ip) + ":" + std::to_string(ntohs(server_addr_.sin_port));
}

bool UdpTransport::same_endpoint(const sockaddr_in &a, const sockaddr_in &b) const {
    return a.sin_addr.s_addr == b.sin_addr.s_addr && a.sin_port == b.sin_port;
}

void UdpTransport::send(const std::vector<char> &packet) {
    int sent = sendto(sock_, packet.data(), static_cast<int>(packet.size()), 0,
                      (struct sockaddr *)&server_addr_, sizeof(server_addr_));
    if (sent == SOCKET_ERROR) {
        throw ProtocolError(ProtocolError::Kind::SocketFailure,
                            "sendto failed: " + last_socket_error());
    }
}

// RFC 1350: a packet from a foreign TID gets an error and is otherwise ignored
void UdpTransport::reject_stranger(const sockaddr_in &from) {
    std::cerr << "Warning: Received packet from unexpected source. Ignoring." << std::endl;
    std::vector<char> error_packet = encode_error(TFTP_ERROR_UNKNOWN_TRANSFER_ID, "Unknown transfer ID");
    if (sendto(sock_, error_packet.data(), static_cast<int>(error_packet.size()), 0,
               (const struct sockaddr *)&from, sizeof(from)) == SOCKET_ERROR) {
        std::cerr << "Warning: could not answer unexpected source: " << last_socket_error() << std::endl;
    }
}

std::optional<std::vector<char>> UdpTransport::receive(std::chrono::milliseconds timeout) {
    using clock = std::chrono::steady_clock;
    const clock::time_point deadline = clock::now() + timeout;

    while (true) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - clock::now());
        if (remaining.count() <= 0) {
            return std::nullopt;
        }
        if (remaining != current_timeout_) {
            if (!set_socket_timeout(sock_, remaining)) {
                throw ProtocolError(ProtocolError::Kind::SocketFailure,
                                    "Failed to set socket timeout: " + last_socket_error());
            }
            current_timeout_ = remaining;
        }

        sockaddr_in from{};
        socklen_t from_len = sizeof(from);
        int bytes_received = recvfrom(sock_, buffer_.data(), static_cast<int>(buffer_.size()), 0,
                                      (struct sockaddr *)&from, &from_len);
        if (bytes_received == SOCKET_ERROR) {
            if (last_error_is_timeout()) {
                return std::nullopt;
            }
            throw ProtocolError(ProtocolError::Kind::SocketFailure,
                                "recvfrom failed: " + last_socket_error());
        }

        // The first reply carries the server's transfer ID (IP + ephemeral port)
        if (!tid_locked_) {
            server_addr_ = from;
            tid_locked_ = true;
            if (verbose_) {
                std::cout << "Server TID: " << peer() << std::endl;
            }
        } else if (!same_endpoint(from, server_addr_)) {
            reject_stranger(from);
            continue;
        }

        return std::vector<char>(buffer_.begin(), buffer_.begin() + bytes_received);
    }
}

} // namespace tftpws
