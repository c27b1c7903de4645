#include "tftpws/metrics.hpp"

#include <algorithm>
#include <numeric>
#include <stdexcept>

namespace tftpws {

double compute_loss_rate(uint64_t retransmissions, uint64_t total_packets) {
    return static_cast<double>(retransmissions) /
           static_cast<double>(std::max<uint64_t>(total_packets, 1));
}

double compute_throughput_mbps(size_t bytes, double seconds) {
    if (seconds <= 0) {
        return 0;
    }
    return (static_cast<double>(bytes) * 8) / (seconds * 1000000.0);
}

MetricsCollector::MetricsCollector() : start_(clock::now()) {}

void MetricsCollector::record_rtt(clock::duration elapsed) {
    rtt_samples_ms_.push_back(
        std::chrono::duration<double, std::milli>(elapsed).count());
}

TransferMetrics MetricsCollector::finalize(size_t payload_bytes, uint16_t window_size) {
    double elapsed = std::chrono::duration<double>(clock::now() - start_).count();
    return finalize(payload_bytes, window_size, elapsed);
}

TransferMetrics MetricsCollector::finalize(size_t payload_bytes, uint16_t window_size,
                                           double elapsed_seconds) {
    if (finalized_) {
        throw std::logic_error("Transfer metrics already finalized");
    }
    finalized_ = true;

    TransferMetrics metrics;
    metrics.window_size = window_size;
    metrics.file_size = payload_bytes;
    metrics.transfer_time = elapsed_seconds;
    metrics.total_packets = total_packets_;
    metrics.total_acks = total_acks_;
    metrics.retransmissions = retransmissions_;
    metrics.throughput_mbps = compute_throughput_mbps(payload_bytes, elapsed_seconds);
    metrics.rtt_samples = rtt_samples_ms_.size();
    if (!rtt_samples_ms_.empty()) {
        metrics.avg_rtt_ms = std::accumulate(rtt_samples_ms_.begin(), rtt_samples_ms_.end(), 0.0) /
                             static_cast<double>(rtt_samples_ms_.size());
    }
    metrics.packet_loss_rate = compute_loss_rate(retransmissions_, total_packets_);
    return metrics;
}

} // namespace tftpws
