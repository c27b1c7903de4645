#ifndef TFTPWS_WINDOW_TRANSFER_HPP
#define TFTPWS_WINDOW_TRANSFER_HPP

#include "tftpws/config.hpp"
#include "tftpws/metrics.hpp"
#include "tftpws/negotiation.hpp"
#include "tftpws/packet.hpp"
#include "tftpws/transport.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace tftpws {

enum class TransferPhase {
  AwaitingFirstReply,        // RRQ sent
  NegotiatingOptions,        // OACK received, ACK 0 sent
  ReceivingWindow,
  AwaitingRetransmitTimeout, // last cumulative ACK resent after a timeout
  Complete,
  Failed
};

const char *to_string(TransferPhase phase);

// Receive-side bookkeeping of one download.
struct TransferState {
  uint16_t expected_block = 1;
  std::vector<uint16_t> window; // blocks accepted since the last ACK
  std::vector<char> payload;
  std::chrono::steady_clock::time_point last_ack_time;
};

struct TransferResult {
  std::vector<char> payload;
  TransferMetrics metrics;
  SessionParameters session;
};

// RFC 7440 read transfer. The server may send up to window_size blocks before
// the client answers with one cumulative ACK for the highest in-order block.
//
// run() drives a whole download over the transport. start(), on_packet(),
// on_timeout() and finish() expose the same state machine one event at a
// time. Every fatal event moves the transfer to Failed and throws a
// TransferError subclass.
class WindowedTransfer {
public:
  using clock = std::chrono::steady_clock;

  WindowedTransfer(DatagramTransport &transport, ClientConfig config);

  TransferResult run(const std::string &filename);

  void start(const std::string &filename);
  void on_packet(const Packet &packet);
  void on_timeout();
  // Only valid once the transfer is Complete.
  TransferResult finish();

  TransferPhase phase() const { return phase_; }
  bool finished() const {
    return phase_ == TransferPhase::Complete || phase_ == TransferPhase::Failed;
  }
  const TransferState &state() const { return state_; }
  const SessionParameters &session() const { return session_; }

private:
  template <class Handler> void guarded(Handler &&handler);

  void on_first_reply(const Packet &packet);
  void on_option_ack(const OptionAckPacket &oack);
  void on_data(const DataPacket &data);
  void send_ack(uint16_t block_num);
  void resend_last_ack();
  uint16_t last_cumulative_ack() const;
  void count_timeout();
  void notify_server(uint16_t error_code, const std::string &message);

  DatagramTransport &transport_;
  ClientConfig config_;
  TransferPhase phase_ = TransferPhase::AwaitingFirstReply;
  bool started_ = false;
  SessionParameters session_;
  TransferState state_;
  MetricsCollector metrics_;
  std::vector<char> request_;
  uint32_t consecutive_timeouts_ = 0;
  bool reply_seen_ = false;
  bool first_data_pending_rtt_ = false;
  bool server_notified_ = false;
};

} // namespace tftpws

#endif // TFTPWS_WINDOW_TRANSFER_HPP
