#include "tftpws/report.hpp"

#include <iomanip>
#include <sstream>

namespace tftpws {

namespace {

const int TABLE_WIDTH = 100;

} // namespace

std::string format_metrics_table(const std::vector<TrialResult> &results) {
    std::ostringstream out;
    const std::string rule(TABLE_WIDTH, '=');

    out << '\n' << rule << '\n';
    out << std::left << std::setw(4) << "WS" << ' ' << std::setw(12) << "File Size" << ' '
        << std::setw(10) << "Time (s)" << ' ' << std::setw(12) << "Throughput" << ' '
        << std::setw(8) << "Packets" << ' ' << std::setw(8) << "ACKs" << ' ' << std::setw(8)
        << "Retrans" << ' ' << std::setw(8) << "Loss %" << '\n';
    out << rule << '\n';

    out << std::fixed;
    for (const TrialResult &result : results) {
        const TransferMetrics &m = result.metrics;
        out << std::setw(4) << result.window_size << ' ' << std::setw(12) << m.file_size << ' '
            << std::setprecision(3) << std::setw(10) << m.transfer_time << ' '
            << std::setprecision(2) << std::setw(12) << m.throughput_mbps << ' ' << std::setw(8)
            << m.total_packets << ' ' << std::setw(8) << m.total_acks << ' ' << std::setw(8)
            << m.retransmissions << ' ' << std::setw(8) << m.packet_loss_rate * 100 << '\n';
    }

    out << rule << '\n';
    return out.str();
}

std::optional<PerformanceSummary> summarize_performance(const std::vector<TrialResult> &results) {
    if (results.size() < 2) {
        return std::nullopt;
    }
    PerformanceSummary summary;
    summary.baseline = results.front();
    summary.best = results.front();
    for (const TrialResult &result : results) {
        if (result.metrics.throughput_mbps > summary.best.metrics.throughput_mbps) {
            summary.best = result;
        }
    }
    double base = summary.baseline.metrics.throughput_mbps;
    if (base > 0) {
        summary.improvement_percent = (summary.best.metrics.throughput_mbps - base) / base * 100;
    }
    return summary;
}

std::string format_summary(const PerformanceSummary &summary) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(2);
    out << "\nPerformance Summary:\n";
    out << "  Baseline (WS=" << summary.baseline.window_size
        << "): " << summary.baseline.metrics.throughput_mbps << " Mbps\n";
    out << "  Best (WS=" << summary.best.window_size << "): " << summary.best.metrics.throughput_mbps
        << " Mbps\n";
    out << std::setprecision(1) << "  Improvement: " << summary.improvement_percent << "%\n";
    return out.str();
}

std::string format_transfer_metrics(const TransferMetrics &m) {
    std::ostringstream out;
    out << std::fixed;
    out << "  Window size:     " << m.window_size << '\n';
    out << "  File size:       " << m.file_size << " bytes\n";
    out << "  Transfer time:   " << std::setprecision(3) << m.transfer_time << " s\n";
    out << "  Throughput:      " << std::setprecision(2) << m.throughput_mbps << " Mbps\n";
    out << "  DATA packets:    " << m.total_packets << '\n';
    out << "  ACKs sent:       " << m.total_acks << '\n';
    out << "  Retransmissions: " << m.retransmissions << '\n';
    out << "  Average RTT:     " << std::setprecision(2) << m.avg_rtt_ms << " ms (" << m.rtt_samples << " samples)\n";
    out << "  Loss rate:       " << std::setprecision(2) << m.packet_loss_rate * 100 << " %\n";
    return out.str();
}

} // namespace tftpws
