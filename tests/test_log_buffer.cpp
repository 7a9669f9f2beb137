#include <gtest/gtest.h>

#include <stdexcept>

#include "log_buffer.hpp"

using namespace termlink;

TEST(PositionTest, ShiftIsLog2OfTermLength) {
    EXPECT_EQ(16, position_bits_to_shift(65536));
    EXPECT_EQ(24, position_bits_to_shift(16 * 1024 * 1024));
    EXPECT_THROW(position_bits_to_shift(65535), std::invalid_argument);
}

TEST(PositionTest, ComputesPositionFromTermIdAndOffset) {
    const int shift = 16;
    EXPECT_EQ(0, compute_position(100, 0, shift, 100));
    EXPECT_EQ(1056, compute_position(100, 1056, shift, 100));
    EXPECT_EQ(65536 + 32, compute_position(101, 32, shift, 100));
    EXPECT_EQ(2 * 65536, compute_position(102, 0, shift, 100));
}

TEST(PositionTest, TermIdWrapsAroundInt32) {
    const int shift = 16;
    int32_t initial = INT32_MAX;
    int32_t next = (int32_t)((uint32_t)initial + 1u);
    EXPECT_EQ(65536, compute_position(next, 0, shift, initial));
}

TEST(PositionTest, DecomposesPosition) {
    const int shift = 16;
    int64_t pos = compute_position(107, 4096, shift, 100);
    EXPECT_EQ(107, compute_term_id_from_position(pos, shift, 100));
    EXPECT_EQ(4096, compute_term_offset_from_position(pos, shift));
}

TEST(PositionTest, PartitionIndex) {
    EXPECT_EQ(0, index_by_term_count(0));
    EXPECT_EQ(1, index_by_term_count(1));
    EXPECT_EQ(2, index_by_term_count(2));
    EXPECT_EQ(0, index_by_term_count(3));
    EXPECT_EQ(2, index_by_term(10, 15));
}

TEST(TermBufferTest, BoundsCheckedAccess) {
    TermBuffer term(128);
    uint8_t bytes[4] = {1, 2, 3, 4};
    term.put_bytes(124, bytes, 4);
    EXPECT_EQ(0x04030201u, term.get_u32(124));
    EXPECT_THROW(term.put_bytes(125, bytes, 4), std::out_of_range);
    EXPECT_THROW(term.get_u32(126), std::out_of_range);
    EXPECT_THROW(term.slice(0, 129), std::out_of_range);
    EXPECT_THROW(term.get_data_header(100), std::out_of_range);
}

TEST(TermBufferTest, HeaderRoundTripInPlace) {
    TermBuffer term(4096);
    DataHeader h;
    h.frame_length = 40;
    h.term_offset = 64;
    h.session_id = 5;
    h.term_id = 9;
    term.put_data_header(64, h);
    DataHeader back = term.get_data_header(64);
    EXPECT_EQ(40u, back.frame_length);
    EXPECT_EQ(64u, back.term_offset);
    EXPECT_EQ(9u, back.term_id);

    term.set_memory(64, kDataHeaderLength, 0);
    EXPECT_EQ(0u, term.get_u32(64));
}

TEST(TermBufferSetTest, AllocatesThreeZeroedPartitions) {
    TermBufferSet log(65536, 4096);
    EXPECT_EQ(65536, log.term_length());
    EXPECT_EQ(16, log.position_bits_to_shift());
    EXPECT_EQ(0, log.active_partition_index());
    EXPECT_EQ(0, log.active_term_count());
    for (int i = 0; i < kPartitionCount; i++) {
        EXPECT_EQ(0, log.tail(i));
        EXPECT_EQ(65536u, log.term(i).capacity());
    }
    EXPECT_EQ(3 * 65536 + 4096, log.log_length());
}

TEST(TermBufferSetTest, RejectsInvalidGeometry) {
    EXPECT_THROW(TermBufferSet(1024, 4096), std::invalid_argument);
    EXPECT_THROW(TermBufferSet(65536 + 32, 4096), std::invalid_argument);
    EXPECT_THROW(TermBufferSet(65536, 1000), std::invalid_argument);
    EXPECT_THROW(TermBufferSet(65536, 2048), std::invalid_argument);
}

TEST(TermBufferSetTest, SpaceCheckAndRotation) {
    TermBufferSet log(65536, 4096);
    log.set_tail(0, 65536 - 64);
    EXPECT_TRUE(log.has_space(64));
    EXPECT_FALSE(log.has_space(96));

    log.set_tail(1, 1234);
    log.rotate();
    EXPECT_EQ(1, log.active_term_count());
    EXPECT_EQ(1, log.active_partition_index());
    EXPECT_EQ(0, log.tail(1));
    EXPECT_TRUE(log.has_space(96));

    log.rotate();
    log.rotate();
    EXPECT_EQ(3, log.active_term_count());
    EXPECT_EQ(0, log.active_partition_index());
    EXPECT_EQ(0, log.tail(0));
}

TEST(TermBufferSetTest, TailAccessOutsidePartitionsThrows) {
    TermBufferSet log(65536, 4096);
    EXPECT_THROW(log.tail(3), std::out_of_range);
    EXPECT_THROW(log.term(-1), std::out_of_range);
}
