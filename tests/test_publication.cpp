#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>

#include "mock_transport.hpp"
#include "publication.hpp"

using namespace termlink;
using termlink::test::MockTransport;

class PublicationTest : public testing::Test {
protected:
    static constexpr int32_t TERM_LENGTH = 65536;
    static constexpr int32_t INITIAL_TERM_ID = 100;

    void SetUp() override {
        cfg_.term_length = TERM_LENGTH;
        cfg_.initial_term_id = INITIAL_TERM_ID;
        cfg_.setup_interval = std::chrono::milliseconds(0);
    }

    std::unique_ptr<Publication> make(bool connect = true) {
        auto transport = std::make_unique<MockTransport>();
        transport_ = transport.get();
        auto pub = std::make_unique<Publication>(io_, cfg_, std::move(transport));
        if (connect)
            EXPECT_FALSE(pub->connect());
        return pub;
    }

    void inject_status(int32_t term_id, int32_t term_offset, uint32_t window,
                       uint32_t session_id = 1) {
        StatusHeader sm;
        sm.session_id = session_id;
        sm.stream_id = cfg_.stream_id;
        sm.consumption_term_id = (uint32_t)term_id;
        sm.consumption_term_offset = (uint32_t)term_offset;
        sm.receiver_window = window;
        transport_->inject(encode_status(sm));
    }

    asio::io_context io_;
    PublicationConfig cfg_;
    MockTransport* transport_{nullptr};
};

TEST_F(PublicationTest, ConnectAnnouncesStreamWithSetup) {
    auto pub = make();
    auto setups = transport_->sent_of_type(HDR_TYPE_SETUP);
    ASSERT_EQ(1u, setups.size());
    auto setup = decode_setup(setups[0].bytes.data(), setups[0].bytes.size());
    ASSERT_TRUE(setup.has_value());
    EXPECT_EQ(1u, setup->session_id);
    EXPECT_EQ(1001u, setup->stream_id);
    EXPECT_EQ((uint32_t)INITIAL_TERM_ID, setup->initial_term_id);
    EXPECT_EQ((uint32_t)INITIAL_TERM_ID, setup->active_term_id);
    EXPECT_EQ((uint32_t)TERM_LENGTH, setup->term_length);
    EXPECT_TRUE(pub->is_connected());
}

TEST_F(PublicationTest, GeneratesInitialTermIdOnceWhenNotConfigured) {
    cfg_.initial_term_id = 0;
    auto pub = make();
    EXPECT_NE(0, pub->initial_term_id());
    int32_t first = pub->initial_term_id();
    EXPECT_EQ(first, pub->initial_term_id());
}

TEST_F(PublicationTest, OfferBeforeConnectIsNotConnected) {
    auto pub = make(false);
    std::vector<uint8_t> msg(16, 1);
    EXPECT_EQ(Publication::NOT_CONNECTED, pub->offer(msg));
}

TEST_F(PublicationTest, FailedConnectLeavesNothingOpen) {
    auto transport = std::make_unique<MockTransport>();
    transport->fail_open = true;
    MockTransport* mock = transport.get();
    Publication pub(io_, cfg_, std::move(transport));
    EXPECT_TRUE(pub.connect());
    EXPECT_FALSE(mock->is_open());
    EXPECT_GE(mock->closed_count, 1);
    std::vector<uint8_t> msg(16, 1);
    EXPECT_EQ(Publication::NOT_CONNECTED, pub.offer(msg));
}

TEST_F(PublicationTest, PositionsStrictlyIncrease) {
    auto pub = make();
    std::vector<uint8_t> msg(100, 7);
    int64_t last = 0;
    for (int i = 0; i < 10; i++) {
        int64_t pos = pub->offer(msg);
        ASSERT_GT(pos, last);
        last = pos;
    }
    EXPECT_EQ(10 * 160, last);
    EXPECT_EQ(last, pub->position());
}

TEST_F(PublicationTest, TransmitsAlignedFrameFromTermBuffer) {
    auto pub = make();
    std::vector<uint8_t> msg = {1, 2, 3, 4, 5};
    EXPECT_EQ(64, pub->offer(msg));

    auto frames = transport_->sent_of_type(HDR_TYPE_DATA);
    ASSERT_EQ(1u, frames.size());
    ASSERT_EQ(64u, frames[0].bytes.size());
    auto df = decode_data_frame(frames[0].bytes.data(), frames[0].bytes.size());
    ASSERT_TRUE(df.has_value());
    EXPECT_EQ(37u, df->hdr.frame_length);
    EXPECT_EQ(0u, df->hdr.term_offset);
    EXPECT_EQ((uint32_t)INITIAL_TERM_ID, df->hdr.term_id);
    EXPECT_EQ(msg, df->payload);
    EXPECT_EQ(64, pub->log_buffers().tail(0));
}

TEST_F(PublicationTest, BackPressuredExactlyOncePerRotation) {
    auto pub = make();
    std::vector<uint8_t> msg(1024, 0x42);
    int back_pressured = 0;
    int64_t last = 0;
    for (int i = 0; i < 100; i++) {
        int64_t pos = pub->offer(msg);
        if (pos == Publication::BACK_PRESSURED) {
            back_pressured++;
            pos = pub->offer(msg);
        }
        ASSERT_GT(pos, last) << "message " << i;
        last = pos;
    }
    // 62 frames of 1056 bytes fit in a 64 KiB term.
    EXPECT_EQ(1, back_pressured);
    EXPECT_EQ(TERM_LENGTH + 38 * 1056, last);
    EXPECT_EQ(1, pub->log_buffers().active_term_count());
    EXPECT_EQ(100u, transport_->sent_of_type(HDR_TYPE_DATA).size());

    auto frames = transport_->sent_of_type(HDR_TYPE_DATA);
    auto first_in_next_term = read_data_header(frames[62].bytes.data());
    EXPECT_EQ((uint32_t)INITIAL_TERM_ID + 1, first_in_next_term.term_id);
    EXPECT_EQ(0u, first_in_next_term.term_offset);
}

TEST_F(PublicationTest, RejectsFramesLargerThanQuarterTerm) {
    auto pub = make();
    EXPECT_EQ((size_t)TERM_LENGTH / 4, pub->max_message_length());
    std::vector<uint8_t> too_big(TERM_LENGTH / 4 - kDataHeaderLength + 1, 0);
    EXPECT_EQ(Publication::MAX_POSITION_EXCEEDED, pub->offer(too_big));
    EXPECT_EQ(0, pub->log_buffers().tail(0));

    std::vector<uint8_t> largest(TERM_LENGTH / 4 - kDataHeaderLength, 0);
    EXPECT_EQ(TERM_LENGTH / 4, pub->offer(largest));
}

TEST_F(PublicationTest, SendFailureLeavesNoHole) {
    auto pub = make();
    std::vector<uint8_t> msg(64, 3);
    transport_->fail_send = true;
    EXPECT_EQ(Publication::NOT_CONNECTED, pub->offer(msg));
    EXPECT_EQ(0, pub->position());
    EXPECT_EQ(0u, pub->log_buffers().term(0).get_u32(0));

    transport_->fail_send = false;
    EXPECT_EQ(96, pub->offer(msg));
    auto frames = transport_->sent_of_type(HDR_TYPE_DATA);
    ASSERT_EQ(1u, frames.size());
    EXPECT_EQ(0u, read_data_header(frames[0].bytes.data()).term_offset);
}

TEST_F(PublicationTest, ClosedPublicationRejectsOffers) {
    auto pub = make();
    pub->close();
    EXPECT_TRUE(pub->is_closed());
    EXPECT_FALSE(pub->is_connected());
    std::vector<uint8_t> msg(8, 0);
    EXPECT_EQ(Publication::CLOSED, pub->offer(msg));
    EXPECT_FALSE(pub->try_claim(8).has_value());
    EXPECT_TRUE(pub->connect());
}

TEST_F(PublicationTest, ClaimCommitTransmitsFilledFrame) {
    auto pub = make();
    auto claim = pub->try_claim(64);
    ASSERT_TRUE(claim.has_value());
    EXPECT_EQ(64u, claim->length());
    claim->put_int32(0, 7);
    claim->put_int64(8, 1234567890123LL);
    EXPECT_THROW(claim->put_int64(60, 1), std::out_of_range);
    EXPECT_EQ(0u, transport_->sent_of_type(HDR_TYPE_DATA).size());

    EXPECT_EQ(96, claim->commit());
    auto frames = transport_->sent_of_type(HDR_TYPE_DATA);
    ASSERT_EQ(1u, frames.size());
    EXPECT_EQ(7u, get_u32(frames[0].bytes.data(), kDataHeaderLength));
    EXPECT_EQ(1234567890123ULL, get_u64(frames[0].bytes.data(), kDataHeaderLength + 8));
    EXPECT_EQ(96, pub->position());
}

TEST_F(PublicationTest, OutstandingClaimBackPressuresOffers) {
    auto pub = make();
    auto claim = pub->try_claim(32);
    ASSERT_TRUE(claim.has_value());
    std::vector<uint8_t> msg(16, 1);
    EXPECT_EQ(Publication::BACK_PRESSURED, pub->offer(msg));
    EXPECT_FALSE(pub->try_claim(32).has_value());
    EXPECT_EQ(0, pub->log_buffers().active_term_count());
    claim->commit();
    EXPECT_EQ(64 + 64, pub->offer(msg));
}

TEST_F(PublicationTest, AbortZeroesHeaderAndFreesSlot) {
    auto pub = make();
    auto claim = pub->try_claim(40);
    ASSERT_TRUE(claim.has_value());
    EXPECT_NE(0u, pub->log_buffers().term(0).get_u32(0));
    claim->abort();
    EXPECT_EQ(0u, pub->log_buffers().term(0).get_u32(0));
    EXPECT_EQ(0u, transport_->sent_of_type(HDR_TYPE_DATA).size());

    std::vector<uint8_t> msg(16, 1);
    EXPECT_EQ(64, pub->offer(msg));
}

TEST_F(PublicationTest, DroppedClaimAborts) {
    auto pub = make();
    {
        auto claim = pub->try_claim(40);
        ASSERT_TRUE(claim.has_value());
    }
    EXPECT_EQ(0u, pub->log_buffers().term(0).get_u32(0));
    std::vector<uint8_t> msg(16, 1);
    EXPECT_EQ(64, pub->offer(msg));
}

TEST_F(PublicationTest, ClaimOpenAcrossCloseRejectsWrites) {
    auto pub = make();
    auto claim = pub->try_claim(64);
    ASSERT_TRUE(claim.has_value());
    ASSERT_NE(nullptr, claim->buffer());
    pub->close();

    std::vector<uint8_t> bytes(64, 0x5a);
    EXPECT_THROW(claim->put_bytes(0, bytes.data(), bytes.size()), std::logic_error);
    EXPECT_THROW(claim->put_int32(0, 1), std::logic_error);
    EXPECT_EQ(nullptr, claim->buffer());
    EXPECT_EQ(Publication::CLOSED, claim->commit());
    EXPECT_EQ(0u, transport_->sent_of_type(HDR_TYPE_DATA).size());
}

TEST_F(PublicationTest, ClaimAbortedAfterCloseReleasesQuietly) {
    auto pub = make();
    {
        auto claim = pub->try_claim(64);
        ASSERT_TRUE(claim.has_value());
        pub->close();
    }
    EXPECT_TRUE(pub->is_closed());
    EXPECT_FALSE(pub->try_claim(8).has_value());
}

TEST_F(PublicationTest, StatusFrameUpdatesReceiverState) {
    auto pub = make();
    EXPECT_FALSE(pub->has_receiver());
    inject_status(INITIAL_TERM_ID, 0, 1u << 20, 99);
    EXPECT_FALSE(pub->has_receiver());

    inject_status(INITIAL_TERM_ID + 1, 1056, 1u << 20);
    EXPECT_TRUE(pub->has_receiver());
    EXPECT_EQ(1u << 20, pub->receiver_window());
    EXPECT_EQ(TERM_LENGTH + 1056, pub->last_consumption_position());
}

TEST_F(PublicationTest, WindowIsAdvisoryByDefault) {
    auto pub = make();
    inject_status(INITIAL_TERM_ID, 0, 1024);
    std::vector<uint8_t> msg(1024, 0);
    EXPECT_EQ(1056, pub->offer(msg));
    EXPECT_EQ(2112, pub->offer(msg));
}

TEST_F(PublicationTest, EnforcedWindowBackPressuresWithoutRotating) {
    cfg_.enforce_receiver_window = true;
    auto pub = make();
    inject_status(INITIAL_TERM_ID, 0, 2048);
    std::vector<uint8_t> msg(1024, 0);
    EXPECT_EQ(1056, pub->offer(msg));
    EXPECT_EQ(Publication::BACK_PRESSURED, pub->offer(msg));
    EXPECT_EQ(0, pub->log_buffers().active_term_count());

    inject_status(INITIAL_TERM_ID, 1056, 2048);
    EXPECT_EQ(2112, pub->offer(msg));
}

TEST_F(PublicationTest, MalformedInboundFrameIsIgnored) {
    auto pub = make();
    transport_->inject(std::vector<uint8_t>(5, 0xFF));
    std::vector<uint8_t> msg(16, 1);
    EXPECT_EQ(64, pub->offer(msg));
}
