#include "fake_transport.hpp"

#include "tftpws/errors.hpp"
#include "tftpws/window_transfer.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

using namespace tftpws;
using namespace tftpws::test;

namespace {

ClientConfig windowed(uint16_t window_size, uint16_t block_size = DEFAULT_BLOCK_SIZE) {
    ClientConfig config;
    config.block_size = block_size;
    config.window_size = window_size;
    config.timeout = std::chrono::milliseconds(10);
    config.max_retries = 3;
    return config;
}

class WindowedTransferTest : public ::testing::Test {
protected:
    // Starts a transfer and answers the request with an OACK for `window_size`.
    void negotiate_window(WindowedTransfer &transfer, uint16_t window_size,
                          uint16_t block_size = DEFAULT_BLOCK_SIZE) {
        transfer.start("file.bin");
        OptionMap options{{"windowsize", std::to_string(window_size)}};
        if (block_size != DEFAULT_BLOCK_SIZE) {
            options["blksize"] = std::to_string(block_size);
        }
        transfer.on_packet(oack(options));
        ASSERT_EQ(transfer.phase(), TransferPhase::NegotiatingOptions);
        ASSERT_EQ(transport.acks(), std::vector<uint16_t>{0});
        transport.sent.clear();
    }

    ScriptedTransport transport;
};

} // namespace

TEST_F(WindowedTransferTest, StartSendsReadRequest) {
    WindowedTransfer transfer(transport, windowed(16, 1024));
    transfer.start("large.bin");

    ASSERT_EQ(transport.sent.size(), 1u);
    RequestPacket request = decode_request(transport.sent[0]);
    EXPECT_EQ(request.filename, "large.bin");
    EXPECT_EQ(request.mode, "octet");
    EXPECT_EQ(request.options,
              (OptionList{{"blksize", "1024"}, {"windowsize", "16"}}));
    EXPECT_EQ(transfer.phase(), TransferPhase::AwaitingFirstReply);
}

TEST_F(WindowedTransferTest, AcksOnceWindowIsFull) {
    WindowedTransfer transfer(transport, windowed(4));
    negotiate_window(transfer, 4);

    for (uint16_t block = 1; block <= 3; ++block) {
        transfer.on_packet(data_packet(block, 512));
        EXPECT_TRUE(transport.acks().empty()) << "early ACK after block " << block;
        EXPECT_EQ(transfer.state().window.size(), block);
    }
    transfer.on_packet(data_packet(4, 512));
    EXPECT_EQ(transport.acks(), std::vector<uint16_t>{4});
    EXPECT_TRUE(transfer.state().window.empty());
    EXPECT_EQ(transfer.phase(), TransferPhase::ReceivingWindow);
}

TEST_F(WindowedTransferTest, ShortFifthBlockClosesWindowAndTransfer) {
    WindowedTransfer transfer(transport, windowed(4));
    negotiate_window(transfer, 4);

    for (uint16_t block = 1; block <= 4; ++block) transfer.on_packet(data_packet(block, 512));
    transfer.on_packet(data_packet(5, 100));

    EXPECT_EQ(transport.acks(), (std::vector<uint16_t>{4, 5}));
    EXPECT_EQ(transfer.phase(), TransferPhase::Complete);

    TransferResult result = transfer.finish();
    EXPECT_EQ(result.payload.size(), 4u * 512 + 100);
    EXPECT_EQ(result.session.window_size, 4);
    EXPECT_EQ(result.metrics.total_packets, 5u);
    EXPECT_EQ(result.metrics.total_acks, 3u); // ACK 0, 4, 5
    EXPECT_EQ(result.metrics.retransmissions, 0u);
}

TEST_F(WindowedTransferTest, FullFifthBlockDefersAckToEighth) {
    WindowedTransfer transfer(transport, windowed(4));
    negotiate_window(transfer, 4);

    for (uint16_t block = 1; block <= 7; ++block) transfer.on_packet(data_packet(block, 512));
    EXPECT_EQ(transport.acks(), std::vector<uint16_t>{4});

    transfer.on_packet(data_packet(8, 512));
    EXPECT_EQ(transport.acks(), (std::vector<uint16_t>{4, 8}));
    EXPECT_EQ(transfer.phase(), TransferPhase::ReceivingWindow);
}

TEST_F(WindowedTransferTest, ExactMultipleEndsOnEmptyBlock) {
    WindowedTransfer transfer(transport, windowed(4));
    negotiate_window(transfer, 4);

    // 8 full blocks == 2 windows of 512 * 4
    for (uint16_t block = 1; block <= 8; ++block) transfer.on_packet(data_packet(block, 512));
    EXPECT_EQ(transfer.phase(), TransferPhase::ReceivingWindow);

    transfer.on_packet(data_packet(9, 0));
    EXPECT_EQ(transfer.phase(), TransferPhase::Complete);
    EXPECT_EQ(transport.acks(), (std::vector<uint16_t>{4, 8, 9}));
    EXPECT_EQ(transfer.finish().payload.size(), 8u * 512);
}

TEST_F(WindowedTransferTest, DuplicateBlockCountsAsRetransmission) {
    WindowedTransfer transfer(transport, windowed(8));
    negotiate_window(transfer, 8);

    for (uint16_t block = 1; block <= 4; ++block) transfer.on_packet(data_packet(block, 512));
    ASSERT_EQ(transfer.state().expected_block, 5);

    transfer.on_packet(data_packet(3, 512));
    EXPECT_EQ(transfer.state().expected_block, 5);
    EXPECT_EQ(transfer.state().window, (std::vector<uint16_t>{1, 2, 3, 4}));
    EXPECT_EQ(transfer.state().payload.size(), 4u * 512);
    EXPECT_TRUE(transport.acks().empty());

    transfer.on_packet(data_packet(5, 10));
    TransferResult result = transfer.finish();
    EXPECT_EQ(result.metrics.retransmissions, 1u);
    EXPECT_EQ(result.metrics.total_packets, 6u);
}

TEST_F(WindowedTransferTest, OutOfOrderBlockIsNotBuffered) {
    WindowedTransfer transfer(transport, windowed(4));
    negotiate_window(transfer, 4);

    transfer.on_packet(data_packet(1, 512));
    transfer.on_packet(data_packet(3, 512)); // block 2 lost
    EXPECT_EQ(transfer.state().expected_block, 2);
    EXPECT_EQ(transfer.state().window, std::vector<uint16_t>{1});
}

TEST_F(WindowedTransferTest, WindowSizeOneAcksEveryBlock) {
    WindowedTransfer transfer(transport, windowed(1));
    negotiate_window(transfer, 1);

    for (uint16_t block = 1; block <= 5; ++block) {
        transfer.on_packet(data_packet(block, 512));
        EXPECT_EQ(transport.acks().back(), block);
    }
    transfer.on_packet(data_packet(6, 1));
    EXPECT_EQ(transport.acks(), (std::vector<uint16_t>{1, 2, 3, 4, 5, 6}));
    EXPECT_EQ(transfer.phase(), TransferPhase::Complete);
}

TEST_F(WindowedTransferTest, ServerWithoutOptionsFallsBackToLockStep) {
    WindowedTransfer transfer(transport, windowed(16, 1024));
    transfer.start("file.bin");
    transport.sent.clear();

    // 512 bytes is a full block at the default size
    transfer.on_packet(data_packet(1, 512));
    EXPECT_EQ(transfer.session().block_size, DEFAULT_BLOCK_SIZE);
    EXPECT_EQ(transfer.session().window_size, 1);
    EXPECT_FALSE(transfer.session().options_acknowledged);
    EXPECT_EQ(transport.acks(), std::vector<uint16_t>{1});
    EXPECT_EQ(transfer.phase(), TransferPhase::ReceivingWindow);

    transfer.on_packet(data_packet(2, 3));
    EXPECT_EQ(transfer.phase(), TransferPhase::Complete);
    EXPECT_EQ(transfer.finish().payload.size(), 515u);
}

TEST_F(WindowedTransferTest, NegotiatedBlockSizeDefinesLastBlock) {
    WindowedTransfer transfer(transport, windowed(2, 1024));
    negotiate_window(transfer, 2, 1024);

    transfer.on_packet(data_packet(1, 1024));
    transfer.on_packet(data_packet(2, 512));
    EXPECT_EQ(transfer.phase(), TransferPhase::Complete);
    EXPECT_EQ(transport.acks(), std::vector<uint16_t>{2});
}

TEST_F(WindowedTransferTest, TimeoutResendsTailOfPartialWindow) {
    WindowedTransfer transfer(transport, windowed(8));
    negotiate_window(transfer, 8);

    transfer.on_packet(data_packet(1, 512));
    transfer.on_packet(data_packet(2, 512));
    transfer.on_timeout();

    EXPECT_EQ(transport.acks(), std::vector<uint16_t>{2});
    EXPECT_EQ(transfer.phase(), TransferPhase::AwaitingRetransmitTimeout);
    // The window is still open, the server resumes after block 2
    EXPECT_EQ(transfer.state().window, (std::vector<uint16_t>{1, 2}));

    transfer.on_packet(data_packet(3, 512));
    EXPECT_EQ(transfer.phase(), TransferPhase::ReceivingWindow);
}

TEST_F(WindowedTransferTest, TimeoutAfterClosedWindowResendsPreviousAck) {
    WindowedTransfer transfer(transport, windowed(2));
    negotiate_window(transfer, 2);

    transfer.on_packet(data_packet(1, 512));
    transfer.on_packet(data_packet(2, 512));
    transfer.on_timeout();
    EXPECT_EQ(transport.acks(), (std::vector<uint16_t>{2, 2}));
}

TEST_F(WindowedTransferTest, TimeoutAfterOackResendsAckZero) {
    WindowedTransfer transfer(transport, windowed(4));
    negotiate_window(transfer, 4);

    transfer.on_timeout();
    EXPECT_EQ(transport.acks(), std::vector<uint16_t>{0});
    EXPECT_EQ(transfer.phase(), TransferPhase::NegotiatingOptions);
}

TEST_F(WindowedTransferTest, TimeoutBeforeReplyResendsRequest) {
    WindowedTransfer transfer(transport, windowed(4));
    transfer.start("file.bin");
    transfer.on_timeout();

    ASSERT_EQ(transport.sent.size(), 2u);
    EXPECT_EQ(transport.sent[0], transport.sent[1]);
    EXPECT_EQ(transport.count_sent(TFTP_OPCODE_RRQ), 2u);
}

TEST_F(WindowedTransferTest, GivesUpAfterMaxRetries) {
    WindowedTransfer transfer(transport, windowed(4)); // max_retries 3
    negotiate_window(transfer, 4);
    transfer.on_packet(data_packet(1, 512));

    for (int i = 0; i < 3; ++i) transfer.on_timeout();
    EXPECT_EQ(transport.acks(), (std::vector<uint16_t>{1, 1, 1}));

    try {
        transfer.on_timeout();
        FAIL() << "expected MaxRetriesExceeded";
    } catch (const MaxRetriesExceeded &e) {
        EXPECT_EQ(e.retries(), 3u);
    }
    EXPECT_EQ(transfer.phase(), TransferPhase::Failed);
    EXPECT_THROW(transfer.finish(), std::logic_error);
}

TEST_F(WindowedTransferTest, ProgressResetsRetryCounter) {
    WindowedTransfer transfer(transport, windowed(4));
    negotiate_window(transfer, 4);

    for (uint16_t block = 1; block <= 4; ++block) {
        transfer.on_timeout();
        transfer.on_timeout();
        transfer.on_timeout();
        transfer.on_packet(data_packet(block, 512));
    }
    EXPECT_EQ(transfer.phase(), TransferPhase::ReceivingWindow);
}

TEST_F(WindowedTransferTest, TimeoutsCountAsRetransmissions) {
    WindowedTransfer transfer(transport, windowed(2));
    negotiate_window(transfer, 2);

    transfer.on_packet(data_packet(1, 512));
    transfer.on_timeout();
    transfer.on_packet(data_packet(2, 512));
    transfer.on_packet(data_packet(3, 0));

    TransferResult result = transfer.finish();
    EXPECT_EQ(result.metrics.retransmissions, 1u);
    EXPECT_EQ(result.metrics.total_acks, 4u); // ACK 0, resent 1, 2, 3
    EXPECT_DOUBLE_EQ(result.metrics.packet_loss_rate, 1.0 / 3);
}

TEST_F(WindowedTransferTest, DuplicateOackResendsAckZero) {
    WindowedTransfer transfer(transport, windowed(4));
    negotiate_window(transfer, 4);

    transfer.on_packet(oack({{"windowsize", "4"}}));
    EXPECT_EQ(transport.acks(), std::vector<uint16_t>{0});
    EXPECT_EQ(transfer.phase(), TransferPhase::NegotiatingOptions);
}

TEST_F(WindowedTransferTest, ErrorPacketFailsWithRemoteError) {
    WindowedTransfer transfer(transport, windowed(4));
    negotiate_window(transfer, 4);
    transfer.on_packet(data_packet(1, 512));

    ErrorPacket error;
    error.code = TFTP_ERROR_DISK_FULL;
    error.message = "Disk full";
    try {
        transfer.on_packet(error);
        FAIL() << "expected RemoteError";
    } catch (const RemoteError &e) {
        EXPECT_EQ(e.code(), TFTP_ERROR_DISK_FULL);
        EXPECT_EQ(e.message(), "Disk full");
    }
    EXPECT_EQ(transfer.phase(), TransferPhase::Failed);
    // No ERROR is sent back for a server-side abort
    EXPECT_EQ(transport.count_sent(TFTP_OPCODE_ERROR), 0u);
}

TEST_F(WindowedTransferTest, ErrorAsFirstReplyFails) {
    WindowedTransfer transfer(transport, windowed(4));
    transfer.start("missing.bin");

    ErrorPacket error;
    error.code = TFTP_ERROR_FILE_NOT_FOUND;
    error.message = "File not found";
    EXPECT_THROW(transfer.on_packet(error), RemoteError);
    EXPECT_EQ(transfer.phase(), TransferPhase::Failed);
    EXPECT_THROW(transfer.on_packet(data_packet(1, 1)), std::logic_error);
}

TEST_F(WindowedTransferTest, UnexpectedOpcodeIsFatalAndReported) {
    WindowedTransfer transfer(transport, windowed(4));
    negotiate_window(transfer, 4);

    try {
        transfer.on_packet(AckPacket{});
        FAIL() << "expected ProtocolError";
    } catch (const ProtocolError &e) {
        EXPECT_EQ(e.kind(), ProtocolError::Kind::UnexpectedOpcode);
    }
    EXPECT_EQ(transfer.phase(), TransferPhase::Failed);
    ASSERT_EQ(transport.count_sent(TFTP_OPCODE_ERROR), 1u);
    EXPECT_EQ(decode_error(transport.sent.back()).code, TFTP_ERROR_ILLEGAL_OPERATION);
}

TEST_F(WindowedTransferTest, OversizedBlockIsMalformed) {
    WindowedTransfer transfer(transport, windowed(4));
    negotiate_window(transfer, 4);

    try {
        transfer.on_packet(data_packet(1, 513));
        FAIL() << "expected ProtocolError";
    } catch (const ProtocolError &e) {
        EXPECT_EQ(e.kind(), ProtocolError::Kind::MalformedPacket);
    }
    EXPECT_EQ(transfer.phase(), TransferPhase::Failed);
}

TEST_F(WindowedTransferTest, OversizedStaleDuplicateIsIgnored) {
    WindowedTransfer transfer(transport, windowed(8));
    negotiate_window(transfer, 8);

    for (uint16_t block = 1; block <= 4; ++block) transfer.on_packet(data_packet(block, 512));
    EXPECT_NO_THROW(transfer.on_packet(data_packet(2, 600)));
    EXPECT_EQ(transfer.phase(), TransferPhase::ReceivingWindow);
    EXPECT_EQ(transfer.state().payload.size(), 4u * 512);
    EXPECT_EQ(transport.count_sent(TFTP_OPCODE_ERROR), 0u);

    transfer.on_packet(data_packet(5, 7));
    TransferResult result = transfer.finish();
    EXPECT_EQ(result.metrics.retransmissions, 1u);
    EXPECT_EQ(result.payload.size(), 4u * 512 + 7);
}

TEST_F(WindowedTransferTest, RttSampledPerWindowAndAfterOack) {
    WindowedTransfer transfer(transport, windowed(2));
    negotiate_window(transfer, 2);

    // OACK -> first DATA, then one sample per closed window
    transfer.on_packet(data_packet(1, 512));
    transfer.on_packet(data_packet(2, 512));
    transfer.on_packet(data_packet(3, 100));

    TransferResult result = transfer.finish();
    EXPECT_EQ(result.metrics.total_acks, 3u); // ACK 0, 2, 3
    EXPECT_EQ(result.metrics.rtt_samples, 3u);
}

TEST_F(WindowedTransferTest, RttSampledPerAckWithoutOack) {
    WindowedTransfer transfer(transport, windowed(4));
    transfer.start("file.bin");

    transfer.on_packet(data_packet(1, 512));
    transfer.on_packet(data_packet(2, 512));
    transfer.on_timeout(); // a resent ACK is not a sample
    transfer.on_packet(data_packet(3, 20));

    TransferResult result = transfer.finish();
    EXPECT_EQ(transport.acks(), (std::vector<uint16_t>{1, 2, 2, 3}));
    EXPECT_EQ(result.metrics.rtt_samples, 3u);
}

TEST_F(WindowedTransferTest, RefusedOptionsAreReportedWithOptionError) {
    WindowedTransfer transfer(transport, windowed(4));
    transfer.start("file.bin");

    EXPECT_THROW(transfer.on_packet(oack({{"windowsize", "64"}})), ProtocolError);
    EXPECT_EQ(transfer.phase(), TransferPhase::Failed);
    ASSERT_EQ(transport.count_sent(TFTP_OPCODE_ERROR), 1u);
    EXPECT_EQ(decode_error(transport.sent.back()).code, TFTP_ERROR_OPTION_REFUSED);
}

TEST_F(WindowedTransferTest, BlockNumbersWrapAround) {
    WindowedTransfer transfer(transport, windowed(64, 8));
    negotiate_window(transfer, 64, 8);

    // 65540 full blocks walk the block number past 65535 back to 0
    uint16_t block = 1;
    for (uint32_t i = 0; i < 65540; ++i, ++block) {
        transfer.on_packet(data_packet(block, 8));
    }
    EXPECT_EQ(transfer.state().expected_block, 65541 % 65536);
    transfer.on_packet(data_packet(block, 0));

    EXPECT_EQ(transfer.phase(), TransferPhase::Complete);
    EXPECT_EQ(transfer.finish().payload.size(), 65540u * 8);
}

TEST_F(WindowedTransferTest, FinishBeforeCompleteIsAnError) {
    WindowedTransfer transfer(transport, windowed(4));
    transfer.start("file.bin");
    EXPECT_THROW(transfer.finish(), std::logic_error);
    EXPECT_THROW(transfer.start("file.bin"), std::logic_error);
}

TEST_F(WindowedTransferTest, RejectsInvalidConfiguration) {
    ClientConfig config = windowed(4);
    config.block_size = 4;
    EXPECT_THROW({ WindowedTransfer transfer(transport, config); }, ConfigError);
}

TEST_F(WindowedTransferTest, RunDrivesWholeTransfer) {
    transport.reply(encode_option_ack({{"windowsize", "2"}}));
    transport.time_out();
    transport.reply(data_datagram(1, 512));
    transport.reply(data_datagram(2, 512));
    transport.reply(data_datagram(2, 512)); // duplicate
    transport.reply(data_datagram(3, 512));
    transport.reply(data_datagram(4, 511));

    WindowedTransfer transfer(transport, windowed(2));
    TransferResult result = transfer.run("file.bin");

    EXPECT_EQ(transport.acks(), (std::vector<uint16_t>{0, 0, 2, 4}));
    EXPECT_EQ(result.payload.size(), 3u * 512 + 511);
    EXPECT_EQ(result.payload.front(), make_block_payload(1, 1)[0]);
    EXPECT_EQ(result.payload.back(), make_block_payload(4, 1)[0]);
    EXPECT_EQ(result.metrics.window_size, 2);
    EXPECT_EQ(result.metrics.total_packets, 5u);
    EXPECT_EQ(result.metrics.total_acks, 4u);
    EXPECT_EQ(result.metrics.retransmissions, 2u);
    EXPECT_DOUBLE_EQ(result.metrics.packet_loss_rate, 0.4);
    EXPECT_EQ(result.metrics.rtt_samples, 3u); // first DATA, windows 2 and 4
    EXPECT_GE(result.metrics.avg_rtt_ms, 0.0);
}

TEST_F(WindowedTransferTest, RunReportsMalformedDatagram) {
    transport.reply(std::vector<char>{0});
    WindowedTransfer transfer(transport, windowed(2));
    EXPECT_THROW(transfer.run("file.bin"), ProtocolError);
    EXPECT_EQ(transfer.phase(), TransferPhase::Failed);
}

TEST_F(WindowedTransferTest, RunFailsWhenServerNeverAnswers) {
    for (int i = 0; i < 4; ++i) transport.time_out();
    WindowedTransfer transfer(transport, windowed(2));
    EXPECT_THROW(transfer.run("file.bin"), MaxRetriesExceeded);
    EXPECT_EQ(transport.count_sent(TFTP_OPCODE_RRQ), 4u);
}
