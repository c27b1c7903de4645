#include "tftpws/window_transfer.hpp"
#include "tftpws/errors.hpp"

#include <iostream>
#include <stdexcept>
#include <type_traits>
#include <utility>

namespace tftpws {

namespace {

template <class>
inline constexpr bool always_false = false;

} // namespace

const char *to_string(TransferPhase phase) {
    switch (phase) {
    case TransferPhase::AwaitingFirstReply: return "AwaitingFirstReply";
    case TransferPhase::NegotiatingOptions: return "NegotiatingOptions";
    case TransferPhase::ReceivingWindow: return "ReceivingWindow";
    case TransferPhase::AwaitingRetransmitTimeout: return "AwaitingRetransmitTimeout";
    case TransferPhase::Complete: return "Complete";
    case TransferPhase::Failed: return "Failed";
    }
    return "Unknown";
}

WindowedTransfer::WindowedTransfer(DatagramTransport &transport, ClientConfig config)
    : transport_(transport), config_(std::move(config)) {
    config_.validate();
}

// Runs a transfer step and marks the transfer Failed if it throws. Local
// protocol violations are reported to the server before the error surfaces.
template <class Handler>
void WindowedTransfer::guarded(Handler &&handler) {
    if (finished()) {
        throw std::logic_error(std::string("Transfer already ") + to_string(phase_));
    }
    try {
        handler();
    } catch (const ProtocolError &e) {
        phase_ = TransferPhase::Failed;
        if (e.kind() != ProtocolError::Kind::SocketFailure) {
            notify_server(TFTP_ERROR_ILLEGAL_OPERATION, e.what());
        }
        throw;
    } catch (const TransferError &) {
        phase_ = TransferPhase::Failed;
        throw;
    }
}

TransferResult WindowedTransfer::run(const std::string &filename) {
    start(filename);
    while (!finished()) {
        std::optional<std::vector<char>> datagram;
        guarded([&] { datagram = transport_.receive(config_.timeout); });
        if (!datagram) {
            on_timeout();
            continue;
        }
        Packet packet;
        guarded([&] { packet = decode_packet(*datagram); });
        on_packet(packet);
    }
    return finish();
}

void WindowedTransfer::start(const std::string &filename) {
    if (started_) {
        throw std::logic_error("Transfer already started");
    }
    started_ = true;
    metrics_ = MetricsCollector();
    guarded([&] {
        RequestOptions options;
        options.block_size = config_.block_size;
        options.window_size = config_.window_size;
        request_ = encode_request(filename, config_.mode, options);

        if (config_.verbose) {
            std::cout << "Sending RRQ for file: " << filename << " (blksize " << config_.block_size
                      << ", windowsize " << config_.requested_window_size() << ")" << std::endl;
        }
        transport_.send(request_);
        // Without an OACK the first window is timed from the request
        state_.last_ack_time = clock::now();
    });
}

void WindowedTransfer::on_packet(const Packet &packet) {
    guarded([&] {
        reply_seen_ = true;
        switch (phase_) {
        case TransferPhase::AwaitingFirstReply:
            on_first_reply(packet);
            return;
        case TransferPhase::NegotiatingOptions:
        case TransferPhase::ReceivingWindow:
        case TransferPhase::AwaitingRetransmitTimeout:
            break;
        case TransferPhase::Complete:
        case TransferPhase::Failed:
            throw std::logic_error("packet after transfer end");
        }

        std::visit(
            [&](const auto &p) {
                using T = std::decay_t<decltype(p)>;
                if constexpr (std::is_same_v<T, DataPacket>) {
                    if (phase_ != TransferPhase::ReceivingWindow) {
                        phase_ = TransferPhase::ReceivingWindow;
                    }
                    on_data(p);
                } else if constexpr (std::is_same_v<T, ErrorPacket>) {
                    throw RemoteError(p.code, p.message);
                } else if constexpr (std::is_same_v<T, OptionAckPacket>) {
                    // Our ACK 0 was lost and the server repeated its OACK
                    metrics_.record_retransmission();
                    if (phase_ == TransferPhase::NegotiatingOptions) {
                        send_ack(0);
                    }
                } else if constexpr (std::is_same_v<T, RequestPacket> ||
                                     std::is_same_v<T, AckPacket>) {
                    throw ProtocolError(ProtocolError::Kind::UnexpectedOpcode,
                                        std::string("Protocol error: unexpected ") +
                                            opcode_name(opcode_of(packet)) + " during transfer");
                } else {
                    static_assert(always_false<T>, "unhandled packet type");
                }
            },
            packet);
    });
}

void WindowedTransfer::on_first_reply(const Packet &packet) {
    if (const auto *oack = std::get_if<OptionAckPacket>(&packet)) {
        on_option_ack(*oack);
        return;
    }
    // DATA: the server ignored our options. ERROR and anything else throw.
    session_ = negotiate(packet, config_);
    consecutive_timeouts_ = 0;
    phase_ = TransferPhase::ReceivingWindow;
    if (config_.verbose) {
        std::cout << "Server sent DATA without OACK, using blksize " << session_.block_size
                  << ", windowsize " << session_.window_size << std::endl;
    }
    on_data(std::get<DataPacket>(packet));
}

void WindowedTransfer::on_option_ack(const OptionAckPacket &oack) {
    phase_ = TransferPhase::NegotiatingOptions;
    try {
        session_ = negotiate(oack, config_);
    } catch (const ProtocolError &e) {
        notify_server(TFTP_ERROR_OPTION_REFUSED, e.what());
        throw;
    }
    consecutive_timeouts_ = 0;
    if (config_.verbose) {
        std::cout << "Received OACK: blksize " << session_.block_size << ", windowsize "
                  << session_.window_size << std::endl;
    }
    send_ack(0);
    first_data_pending_rtt_ = true;
}

void WindowedTransfer::on_data(const DataPacket &data) {
    metrics_.record_data_packet();

    const clock::time_point now = clock::now();
    if (first_data_pending_rtt_) {
        // OACK -> ACK 0 -> first DATA round trip
        metrics_.record_rtt(now - state_.last_ack_time);
        first_data_pending_rtt_ = false;
    }

    if (data.block != state_.expected_block) {
        // Duplicate from a resent window or a block that overtook its predecessor
        metrics_.record_retransmission();
        if (config_.verbose) {
            std::cout << "Received DATA block " << data.block << ", expected " << state_.expected_block
                      << ". Ignoring." << std::endl;
        }
        return;
    }

    if (data.payload.size() > session_.block_size) {
        throw ProtocolError(ProtocolError::Kind::MalformedPacket,
                            "Protocol error: DATA block " + std::to_string(data.block) + " carries " +
                                std::to_string(data.payload.size()) + " bytes, blksize is " +
                                std::to_string(session_.block_size));
    }

    state_.payload.insert(state_.payload.end(), data.payload.begin(), data.payload.end());
    state_.window.push_back(data.block);
    ++state_.expected_block; // wraps 65535 -> 0
    consecutive_timeouts_ = 0;

    const bool last_block = data.payload.size() < session_.block_size;
    const bool window_full = state_.window.size() >= session_.window_size;
    if (!last_block && !window_full) {
        return;
    }

    metrics_.record_rtt(now - state_.last_ack_time);
    send_ack(data.block);
    state_.window.clear();

    if (last_block) {
        phase_ = TransferPhase::Complete;
        if (config_.verbose) {
            std::cout << "Transfer complete. Received " << state_.payload.size() << " bytes." << std::endl;
        }
    }
}

void WindowedTransfer::on_timeout() {
    guarded([&] {
        count_timeout();
        metrics_.record_retransmission();

        if (phase_ == TransferPhase::AwaitingFirstReply) {
            if (config_.verbose) {
                std::cerr << "Warning: Timeout waiting for reply to RRQ, resending ("
                          << consecutive_timeouts_ << "/" << config_.max_retries << ")" << std::endl;
            }
            transport_.send(request_);
            state_.last_ack_time = clock::now();
            return;
        }

        if (phase_ == TransferPhase::ReceivingWindow) {
            phase_ = TransferPhase::AwaitingRetransmitTimeout;
        }
        if (config_.verbose) {
            std::cerr << "Warning: Timeout waiting for DATA block " << state_.expected_block
                      << ", resending ACK " << last_cumulative_ack() << " (" << consecutive_timeouts_
                      << "/" << config_.max_retries << ")" << std::endl;
        }
        resend_last_ack();
    });
}

TransferResult WindowedTransfer::finish() {
    if (phase_ != TransferPhase::Complete) {
        throw std::logic_error(std::string("Cannot finish transfer in phase ") + to_string(phase_));
    }
    TransferResult result;
    result.session = session_;
    result.metrics = metrics_.finalize(state_.payload.size(), session_.window_size);
    result.payload = std::move(state_.payload);
    state_.payload.clear();
    return result;
}

void WindowedTransfer::send_ack(uint16_t block_num) {
    transport_.send(encode_ack(block_num));
    metrics_.record_ack_sent();
    state_.last_ack_time = clock::now();
    if (config_.verbose) {
        std::cout << "Sent ACK for block " << block_num << std::endl;
    }
}

void WindowedTransfer::resend_last_ack() {
    send_ack(last_cumulative_ack());
}

// Highest in-order block received: the tail of a partial window, otherwise the
// block the previous ACK already named (0 right after an OACK).
uint16_t WindowedTransfer::last_cumulative_ack() const {
    if (!state_.window.empty()) {
        return state_.window.back();
    }
    return static_cast<uint16_t>(state_.expected_block - 1);
}

void WindowedTransfer::count_timeout() {
    if (consecutive_timeouts_ >= config_.max_retries) {
        throw MaxRetriesExceeded(consecutive_timeouts_);
    }
    ++consecutive_timeouts_;
}

void WindowedTransfer::notify_server(uint16_t error_code, const std::string &message) {
    if (!reply_seen_ || server_notified_) {
        return;
    }
    server_notified_ = true;
    try {
        transport_.send(encode_error(error_code, message));
    } catch (const ProtocolError &e) {
        std::cerr << "Warning: could not send ERROR to server: " << e.what() << std::endl;
    }
}

} // namespace tftpws
