#include "tftpws/config.hpp"
#include "tftpws/errors.hpp"
#include "tftpws/report.hpp"
#include "tftpws/transport.hpp"
#include "tftpws/window_transfer.hpp"

#include <cstdio>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace tftpws;

namespace {

void print_usage() {
    std::cerr << "Usage: tftpws_client <server_ip> get <remote_filename> <local_filename> [options]\n"
              << "Options:\n"
              << "  -p <port>        server port (default " << TFTP_DEFAULT_PORT << ")\n"
              << "  -b <blksize>     requested block size (default " << DEFAULT_BLOCK_SIZE << ")\n"
              << "  -w <windowsize>  requested window size (not sent by default)\n"
              << "  -t <timeout_ms>  receive timeout (default " << DEFAULT_TIMEOUT_MS << ")\n"
              << "  -r <retries>     consecutive timeouts before giving up (default "
              << DEFAULT_MAX_RETRIES << ")\n"
              << "  -m <mode>        octet or netascii (default octet)\n"
              << "  -v               verbose packet trace" << std::endl;
}

uint32_t parse_flag_value(const std::string &flag, const std::string &value, uint32_t min_value,
                          uint32_t max_value) {
    std::optional<uint32_t> parsed = parse_decimal(value, min_value, max_value);
    if (!parsed) {
        throw ConfigError("Invalid value '" + value + "' for " + flag + " (expected " +
                          std::to_string(min_value) + ".." + std::to_string(max_value) + ")");
    }
    return *parsed;
}

void receive_file(const std::string &server_ip, int server_port, const std::string &remote_filename,
                  const std::string &local_filename, const ClientConfig &config) {
    UdpTransport transport(server_ip, server_port,
                           recv_buffer_for(config.requested_window_size(), config.block_size),
                           config.verbose);
    WindowedTransfer transfer(transport, config);

    std::cout << "Sending RRQ for file: " << remote_filename << " to " << server_ip << ":"
              << server_port << std::endl;
    TransferResult result = transfer.run(remote_filename);

    std::ofstream output_file(local_filename, std::ios::binary | std::ios::trunc);
    if (!output_file) {
        throw std::runtime_error("Failed to open local file for writing: " + local_filename);
    }
    output_file.write(result.payload.data(), static_cast<std::streamsize>(result.payload.size()));
    output_file.close();
    if (!output_file) {
        remove(local_filename.c_str()); // Clean up partial file
        throw std::runtime_error("Failed to write local file: " + local_filename);
    }

    std::cout << "File '" << local_filename << "' received successfully." << std::endl;
    std::cout << format_transfer_metrics(result.metrics);
}

} // namespace

int main(int argc, char *argv[]) {
    if (argc < 5) {
        print_usage();
        return 1;
    }

    std::string server_ip = argv[1];
    std::string command = argv[2];
    std::string remote_filename = argv[3];
    std::string local_filename = argv[4];
    int server_port = TFTP_DEFAULT_PORT; // Use standard port
    ClientConfig config;

    try {
        for (int i = 5; i < argc; ++i) {
            std::string flag = argv[i];
            if (flag == "-v") {
                config.verbose = true;
                continue;
            }
            if (i + 1 >= argc) {
                throw ConfigError("Missing value for " + flag);
            }
            std::string value = argv[++i];
            if (flag == "-p") {
                server_port = static_cast<int>(parse_flag_value(flag, value, 1, 65535));
            } else if (flag == "-b") {
                config.block_size =
                    static_cast<uint16_t>(parse_flag_value(flag, value, MIN_BLOCK_SIZE, MAX_BLOCK_SIZE));
            } else if (flag == "-w") {
                config.window_size = static_cast<uint16_t>(parse_flag_value(flag, value, 1, 65535));
            } else if (flag == "-t") {
                config.timeout = std::chrono::milliseconds(parse_flag_value(flag, value, 1, 3600000));
            } else if (flag == "-r") {
                config.max_retries = parse_flag_value(flag, value, 1, 1000);
            } else if (flag == "-m") {
                config.mode = value;
            } else {
                throw ConfigError("Unknown option '" + flag + "'");
            }
        }
        config.validate();
    } catch (const ConfigError &e) {
        std::cerr << "Error: " << e.what() << std::endl;
        print_usage();
        return 1;
    }

    try {
        if (command == "get") {
            receive_file(server_ip, server_port, remote_filename, local_filename, config);
        } else {
            std::cerr << "Error: Invalid command '" << command << "'. Only 'get' is supported." << std::endl;
            return 1;
        }
    } catch (const RemoteError &e) {
        std::cerr << "Error: Received TFTP Error Code " << e.code() << ": " << e.message() << std::endl;
        return 1;
    } catch (const std::exception &e) {
        std::cerr << "Client failed: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
