#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <thread>

#include "errors.hpp"
#include "mock_transport.hpp"
#include "reliable_sender.hpp"

using namespace termlink;
using termlink::test::MockTransport;
using namespace std::chrono_literals;

class ReliableSenderTest : public testing::Test {
protected:
    void SetUp() override {
        cfg_.retransmit_interval = 0ms;
        cfg_.heartbeat_interval = 0ms;
    }

    void make(bool connect = true) {
        auto transport = std::make_unique<MockTransport>();
        transport_ = transport.get();
        sender_ = std::make_unique<ReliableSender>(io_, cfg_, std::move(transport));
        sender_->set_failure_handler([this](uint32_t seq, const std::vector<uint8_t>& payload,
                                            DeliveryFailureReason reason) {
            failures_.push_back(Failure{seq, payload, reason});
        });
        if (connect)
            ASSERT_FALSE(sender_->connect());
    }

    std::vector<ReliableFrame> data_frames() const {
        std::vector<ReliableFrame> out;
        for (auto& s : transport_->sent()) {
            auto f = decode_reliable_frame(s.bytes.data(), s.bytes.size());
            if (f && f->hdr.type == REL_TYPE_DATA)
                out.push_back(*f);
        }
        return out;
    }

    void inject(uint16_t type, uint32_t seq, uint32_t session_id = 1) {
        transport_->inject(encode_reliable_frame(type, session_id, cfg_.stream_id, seq, nullptr, 0));
    }

    struct Failure {
        uint32_t sequence;
        std::vector<uint8_t> payload;
        DeliveryFailureReason reason;
    };

    asio::io_context io_;
    ReliableConfig cfg_;
    MockTransport* transport_{nullptr};
    std::vector<Failure> failures_;
    std::unique_ptr<ReliableSender> sender_;
};

TEST_F(ReliableSenderTest, AssignsIncreasingSequenceNumbers) {
    make();
    std::vector<uint8_t> msg = {9, 8, 7};
    for (uint32_t expected = 0; expected < 3; expected++) {
        uint32_t seq = 99;
        ASSERT_FALSE(sender_->send(msg, &seq));
        EXPECT_EQ(expected, seq);
    }
    auto frames = data_frames();
    ASSERT_EQ(3u, frames.size());
    EXPECT_EQ(2u, frames[2].sequence_number);
    EXPECT_EQ(msg, frames[2].payload);
    EXPECT_EQ(1u, frames[2].hdr.session_id);
    EXPECT_EQ(1001u, frames[2].hdr.stream_id);
    EXPECT_EQ(3u, sender_->pending_count());
    EXPECT_EQ(3u, sender_->statistics().next_sequence);
}

TEST_F(ReliableSenderTest, AckClearsPendingMessage) {
    make();
    std::vector<uint32_t> acked;
    sender_->set_ack_handler([&](uint32_t seq) { acked.push_back(seq); });
    std::vector<uint8_t> msg(10, 1);
    for (int i = 0; i < 3; i++)
        ASSERT_FALSE(sender_->send(msg));

    inject(REL_TYPE_ACK, 1);
    EXPECT_FALSE(sender_->is_pending(1));
    EXPECT_TRUE(sender_->is_pending(0));
    EXPECT_EQ(2u, sender_->pending_count());
    ASSERT_EQ(1u, acked.size());
    EXPECT_EQ(1u, acked[0]);

    inject(REL_TYPE_ACK, 1);
    EXPECT_EQ(1u, acked.size());
    EXPECT_EQ(1u, sender_->statistics().acked);
}

TEST_F(ReliableSenderTest, IgnoresAckForAnotherSession) {
    make();
    std::vector<uint8_t> msg(10, 1);
    ASSERT_FALSE(sender_->send(msg));
    inject(REL_TYPE_ACK, 0, 77);
    EXPECT_TRUE(sender_->is_pending(0));
}

TEST_F(ReliableSenderTest, NoRetransmitBeforeTimeout) {
    make();
    std::vector<uint8_t> msg(10, 1);
    ASSERT_FALSE(sender_->send(msg));
    sender_->check_retransmissions(ReliableSender::Clock::now());
    EXPECT_EQ(1u, data_frames().size());
    EXPECT_EQ(0u, sender_->statistics().retransmits);
}

TEST_F(ReliableSenderTest, RetransmitsFiveTimesThenReportsFailure) {
    make();
    std::vector<uint8_t> msg = {1, 2, 3};
    uint32_t seq = 0;
    ASSERT_FALSE(sender_->send(msg, &seq));
    auto t0 = ReliableSender::Clock::now();

    for (int k = 1; k <= 5; k++) {
        sender_->check_retransmissions(t0 + k * 150ms);
        EXPECT_EQ((size_t)(1 + k), data_frames().size());
        EXPECT_TRUE(failures_.empty());
    }
    for (auto& f : data_frames()) {
        EXPECT_EQ(seq, f.sequence_number);
        EXPECT_EQ(msg, f.payload);
    }

    sender_->check_retransmissions(t0 + 6 * 150ms);
    EXPECT_EQ(6u, data_frames().size());
    ASSERT_EQ(1u, failures_.size());
    EXPECT_EQ(seq, failures_[0].sequence);
    EXPECT_EQ(msg, failures_[0].payload);
    EXPECT_EQ(DeliveryFailureReason::RetriesExhausted, failures_[0].reason);
    EXPECT_FALSE(sender_->is_pending(seq));

    sender_->check_retransmissions(t0 + 20 * 150ms);
    EXPECT_EQ(6u, data_frames().size());
    EXPECT_EQ(1u, failures_.size());

    auto stats = sender_->statistics();
    EXPECT_EQ(5u, stats.retransmits);
    EXPECT_EQ(1u, stats.failures);
    EXPECT_EQ(0u, stats.pending);
}

TEST_F(ReliableSenderTest, NakTriggersImmediateRetransmit) {
    make();
    std::vector<uint8_t> msg(4, 4);
    ASSERT_FALSE(sender_->send(msg));
    inject(REL_TYPE_NAK, 0);
    EXPECT_EQ(2u, data_frames().size());
    inject(REL_TYPE_NAK, 5);
    EXPECT_EQ(2u, data_frames().size());
}

TEST_F(ReliableSenderTest, FullWindowTimesOutWithoutConsumingASequence) {
    cfg_.window = 2;
    cfg_.admission_timeout = 20ms;
    make();
    std::vector<uint8_t> msg(4, 4);
    ASSERT_FALSE(sender_->send(msg));
    ASSERT_FALSE(sender_->send(msg));
    EXPECT_EQ(make_error_code(errc::window_full), sender_->send(msg));
    EXPECT_EQ(2u, data_frames().size());
    EXPECT_EQ(2u, sender_->statistics().next_sequence);
}

TEST_F(ReliableSenderTest, AckFreesWindowForWaitingSender) {
    cfg_.window = 1;
    cfg_.admission_timeout = 5000ms;
    make();
    std::vector<uint8_t> msg(4, 4);
    ASSERT_FALSE(sender_->send(msg));

    std::thread acker([this] {
        std::this_thread::sleep_for(20ms);
        inject(REL_TYPE_ACK, 0);
    });
    uint32_t seq = 0;
    auto ec = sender_->send(msg, &seq);
    acker.join();
    EXPECT_FALSE(ec);
    EXPECT_EQ(1u, seq);
    EXPECT_EQ(1u, sender_->pending_count());
}

TEST_F(ReliableSenderTest, CloseReportsPendingMessages) {
    make();
    std::vector<uint8_t> msg(4, 4);
    ASSERT_FALSE(sender_->send(msg));
    ASSERT_FALSE(sender_->send(msg));
    inject(REL_TYPE_ACK, 0);
    sender_->close();
    ASSERT_EQ(1u, failures_.size());
    EXPECT_EQ(1u, failures_[0].sequence);
    EXPECT_EQ(DeliveryFailureReason::Closed, failures_[0].reason);
    EXPECT_EQ(make_error_code(errc::closed), sender_->send(msg));
    EXPECT_FALSE(sender_->is_connected());
}

TEST_F(ReliableSenderTest, SendRequiresConnection) {
    make(false);
    std::vector<uint8_t> msg(4, 4);
    EXPECT_EQ(make_error_code(errc::not_connected), sender_->send(msg));
}

TEST_F(ReliableSenderTest, RejectsOversizedPayload) {
    make();
    std::vector<uint8_t> msg(kMaxUdpPayloadLength, 0);
    EXPECT_EQ(make_error_code(errc::payload_too_large), sender_->send(msg));
    EXPECT_EQ(0u, sender_->pending_count());
}

TEST_F(ReliableSenderTest, TransportFailureDoesNotConsumeSequence) {
    make();
    std::vector<uint8_t> msg(4, 4);
    transport_->fail_send = true;
    EXPECT_TRUE(sender_->send(msg));
    transport_->fail_send = false;
    uint32_t seq = 99;
    ASSERT_FALSE(sender_->send(msg, &seq));
    EXPECT_EQ(0u, seq);
}

TEST_F(ReliableSenderTest, HeartbeatHasNoPayload) {
    make();
    sender_->send_heartbeat();
    auto sent = transport_->sent();
    ASSERT_EQ(1u, sent.size());
    auto f = decode_reliable_frame(sent[0].bytes.data(), sent[0].bytes.size());
    ASSERT_TRUE(f.has_value());
    EXPECT_EQ(REL_TYPE_HEARTBEAT, f->hdr.type);
    EXPECT_TRUE(f->payload.empty());
    EXPECT_EQ(1u, sender_->statistics().heartbeats);
}
