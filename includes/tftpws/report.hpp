#ifndef TFTPWS_REPORT_HPP
#define TFTPWS_REPORT_HPP

#include "tftpws/metrics.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace tftpws {

// One analyzer trial: the window size asked for and what the transfer measured.
struct TrialResult {
  uint16_t window_size = 0;
  TransferMetrics metrics;
};

struct PerformanceSummary {
  TrialResult baseline; // first trial run
  TrialResult best;     // highest throughput
  double improvement_percent = 0;
};

// Fixed-width table, one row per trial.
std::string format_metrics_table(const std::vector<TrialResult> &results);

// Needs at least two trials.
std::optional<PerformanceSummary>
summarize_performance(const std::vector<TrialResult> &results);

std::string format_summary(const PerformanceSummary &summary);

// Multi-line description of a single transfer.
std::string format_transfer_metrics(const TransferMetrics &metrics);

} // namespace tftpws

#endif // TFTPWS_REPORT_HPP
