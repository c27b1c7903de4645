#ifndef TFTPWS_METRICS_HPP
#define TFTPWS_METRICS_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace tftpws {

// Summary of one finished transfer.
struct TransferMetrics {
  uint16_t window_size = 0;
  size_t file_size = 0;      // bytes
  double transfer_time = 0;  // seconds
  uint64_t total_packets = 0;
  uint64_t total_acks = 0;
  uint64_t retransmissions = 0;
  double throughput_mbps = 0;
  double avg_rtt_ms = 0;
  uint64_t rtt_samples = 0;
  double packet_loss_rate = 0;
};

// retransmissions / max(total_packets, 1)
double compute_loss_rate(uint64_t retransmissions, uint64_t total_packets);

// (bytes * 8) / (seconds * 1e6); 0 when no time elapsed.
double compute_throughput_mbps(size_t bytes, double seconds);

// Mutable accumulator fed by the transfer engine while a transfer runs.
class MetricsCollector {
public:
  using clock = std::chrono::steady_clock;

  MetricsCollector();

  void record_data_packet() { ++total_packets_; }
  void record_ack_sent() { ++total_acks_; }
  void record_retransmission() { ++retransmissions_; }
  void record_rtt(clock::duration elapsed);

  uint64_t total_packets() const { return total_packets_; }
  uint64_t total_acks() const { return total_acks_; }
  uint64_t retransmissions() const { return retransmissions_; }
  const std::vector<double> &rtt_samples_ms() const { return rtt_samples_ms_; }

  // Produces the summary; the transfer time runs from construction to now.
  // May be called once, a second call throws std::logic_error.
  TransferMetrics finalize(size_t payload_bytes, uint16_t window_size);

  // Same, with an explicit elapsed time.
  TransferMetrics finalize(size_t payload_bytes, uint16_t window_size,
                           double elapsed_seconds);

private:
  clock::time_point start_;
  uint64_t total_packets_ = 0;
  uint64_t total_acks_ = 0;
  uint64_t retransmissions_ = 0;
  std::vector<double> rtt_samples_ms_;
  bool finalized_ = false;
};

} // namespace tftpws

#endif // TFTPWS_METRICS_HPP
