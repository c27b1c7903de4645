// Runs batches of RFC 7440 downloads at different window sizes against a
// test server and tabulates the measured transfer quality.

#include "tftpws/config.hpp"
#include "tftpws/errors.hpp"
#include "tftpws/report.hpp"
#include "tftpws/transport.hpp"
#include "tftpws/window_transfer.hpp"

#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <optional>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

using namespace tftpws;

namespace {

const char DEFAULT_HOST[] = "127.0.0.1";
const int DEFAULT_ANALYZER_PORT = 6970;

struct TrialPlan {
    uint16_t window_size;
    std::string filename;
};

std::vector<TrialPlan> trials_for(const std::string &test_case) {
    std::vector<TrialPlan> trials;
    if (test_case == "quick") {
        for (uint16_t ws = 1; ws <= 8; ++ws) trials.push_back({ws, "medium.bin"});
    } else if (test_case == "full") {
        trials = {
            {1, "small.bin"},  {2, "small.bin"},  {3, "small.bin"},   {4, "small.bin"},
            {5, "small.bin"},  {6, "small.bin"},  {7, "small.bin"},   {8, "small.bin"},
            {1, "medium.bin"}, {2, "medium.bin"}, {4, "medium.bin"},  {8, "medium.bin"},
            {12, "medium.bin"}, {16, "medium.bin"}, {24, "medium.bin"}, {32, "medium.bin"},
            {1, "large.bin"},  {2, "large.bin"},  {4, "large.bin"},   {8, "large.bin"},
            {16, "large.bin"}, {32, "large.bin"}, {48, "large.bin"},  {64, "large.bin"},
            {1, "xlarge.bin"}, {8, "xlarge.bin"}, {32, "xlarge.bin"}, {64, "xlarge.bin"},
            {1, "single-block.bin"}, {16, "single-block.bin"},
            {16, "exact-window.bin"}, {32, "exact-window.bin"},
        };
    } else if (test_case == "performance") {
        for (uint16_t ws : {1, 2, 4, 8, 16, 32, 64}) trials.push_back({ws, "large.bin"});
    }
    return trials;
}

const char *describe(const std::string &test_case) {
    if (test_case == "quick") return "Quick Test: Medium file (10KB) with windowsize 1-8";
    if (test_case == "full") return "Full Test Suite: Tests 1-32";
    return "Performance Test: Large file with various windowsizes";
}

// Downloads one file, writes it where a real client would and removes it
// again. Failures are reported on stdout and yield no result.
std::optional<TrialResult> run_windowsize_test(const std::string &host, int port,
                                               const TrialPlan &trial, int test_num) {
    namespace fs = std::filesystem;
    const fs::path output_path =
        fs::temp_directory_path() /
        ("tftp-test-ws" + std::to_string(trial.window_size) + "-" + std::to_string(test_num) + ".bin");
    std::error_code ec;

    try {
        ClientConfig config;
        config.window_size = trial.window_size;

        UdpTransport transport(host, port, recv_buffer_for(trial.window_size, config.block_size));
        WindowedTransfer transfer(transport, config);
        TransferResult result = transfer.run(trial.filename);

        std::ofstream output_file(output_path, std::ios::binary | std::ios::trunc);
        output_file.write(result.payload.data(), static_cast<std::streamsize>(result.payload.size()));
        output_file.close();

        if (!output_file || !fs::exists(output_path)) {
            std::cout << "  ✗ Test " << test_num << ": File not downloaded" << std::endl;
            fs::remove(output_path, ec);
            return std::nullopt;
        }
        fs::remove(output_path, ec);

        return TrialResult{trial.window_size, result.metrics};
    } catch (const std::exception &e) {
        std::cout << "  ✗ Test " << test_num << ": " << e.what() << std::endl;
        fs::remove(output_path, ec);
        return std::nullopt;
    }
}

} // namespace

int main(int argc, char *argv[]) {
    if (argc < 2) {
        std::cout << "Usage: tftpws_analyzer <test_case> [-h host] [-p port]\n"
                  << "  test_case: quick, full, performance" << std::endl;
        return 1;
    }

    std::string test_case = argv[1];
    std::string host = DEFAULT_HOST;
    int port = DEFAULT_ANALYZER_PORT;

    for (int i = 2; i + 1 < argc; i += 2) {
        std::string flag = argv[i];
        if (flag == "-h") {
            host = argv[i + 1];
        } else if (flag == "-p") {
            std::optional<uint32_t> parsed = parse_decimal(argv[i + 1], 1, 65535);
            if (!parsed) {
                std::cerr << "Error: Invalid port '" << argv[i + 1] << "'" << std::endl;
                return 1;
            }
            port = static_cast<int>(*parsed);
        } else {
            std::cerr << "Error: Unknown option '" << flag << "'" << std::endl;
            return 1;
        }
    }

    std::cout << "\ntftpws Windowsize Analyzer (RFC 7440)" << std::endl;
    std::cout << "=" << std::string(60, '=') << std::endl;

    std::vector<TrialPlan> trials = trials_for(test_case);
    if (trials.empty()) {
        std::cout << "Unknown test case: " << test_case << std::endl;
        return 1;
    }

    std::cout << "\n" << describe(test_case) << std::endl;

    std::vector<TrialResult> results;
    for (size_t i = 0; i < trials.size(); ++i) {
        const TrialPlan &trial = trials[i];
        // quick/performance number trials by window size, full by position
        int test_num = test_case == "full" ? static_cast<int>(i + 1) : trial.window_size;

        if (test_case == "full") {
            std::cout << "  Test " << std::setw(2) << test_num << ": WS=" << std::setw(2)
                      << trial.window_size << " File=" << std::left << std::setw(20) << trial.filename
                      << std::right << "... " << std::flush;
        } else {
            std::cout << "  Testing windowsize " << trial.window_size << "... " << std::flush;
        }

        std::optional<TrialResult> result = run_windowsize_test(host, port, trial, test_num);
        if (result) {
            std::cout << "✓ " << std::fixed << std::setprecision(2) << result->metrics.throughput_mbps
                      << " Mbps" << std::endl;
            results.push_back(*result);
        }
    }

    if (!results.empty()) {
        std::cout << format_metrics_table(results);
        if (std::optional<PerformanceSummary> summary = summarize_performance(results)) {
            std::cout << format_summary(*summary);
        }
    }

    std::cout << "\nTests completed successfully!" << std::endl;
    return 0;
}
