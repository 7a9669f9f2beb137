#pragma once
#include <array>
#include <atomic>
#include <cstdint>
#include <cstddef>
#include <vector>
#include "protocol.hpp"

namespace termlink {

constexpr int kPartitionCount = 3;

// Position encoding. A position is (termCount << shift) + termOffset where
// termCount = termId - initialTermId and shift = log2(termLength).

inline bool is_power_of_two(int64_t v) { return v > 0 && (v & (v - 1)) == 0; }

int position_bits_to_shift(int32_t term_length);

int64_t compute_position(int32_t active_term_id, int32_t term_offset,
                         int position_bits_to_shift, int32_t initial_term_id);
int32_t compute_term_id_from_position(int64_t position, int position_bits_to_shift,
                                      int32_t initial_term_id);
int32_t compute_term_offset_from_position(int64_t position, int position_bits_to_shift);

inline int index_by_term_count(int64_t term_count) {
    return (int)(term_count % kPartitionCount);
}

inline int index_by_term(int32_t initial_term_id, int32_t term_id) {
    return index_by_term_count((int64_t)(uint32_t)(term_id - initial_term_id));
}

// Fixed-length owned byte arena. Every access is bounds checked and throws
// std::out_of_range when the slice does not fit.
class TermBuffer {
public:
    explicit TermBuffer(size_t length) : bytes_(length, 0) {}
    size_t capacity() const { return bytes_.size(); }

    void put_bytes(size_t offset, const uint8_t* src, size_t len);
    void get_bytes(size_t offset, uint8_t* dst, size_t len) const;
    void put_u32(size_t offset, uint32_t v);
    uint32_t get_u32(size_t offset) const;
    void put_data_header(size_t offset, const DataHeader& h);
    DataHeader get_data_header(size_t offset) const;
    void set_memory(size_t offset, size_t len, uint8_t value);

    // Read-only view of [offset, offset + len).
    const uint8_t* slice(size_t offset, size_t len) const;
    // Writable view of [offset, offset + len), used for zero-copy claims.
    uint8_t* mutable_slice(size_t offset, size_t len);

private:
    void check(size_t offset, size_t len) const;
    std::vector<uint8_t> bytes_;
};

// Three rotating term partitions plus the tail/active-term metadata block.
// Tail counters hold the term offset of the next free byte in each partition.
class TermBufferSet {
public:
    // Validates termLength (power of two, 64 KiB..1 GiB) and pageSize
    // (power of two, 4 KiB..1 GiB); throws std::invalid_argument.
    TermBufferSet(int32_t term_length, int32_t page_size);
    TermBufferSet(const TermBufferSet&) = delete;
    TermBufferSet& operator=(const TermBufferSet&) = delete;

    int32_t term_length() const { return term_length_; }
    int32_t page_size() const { return page_size_; }
    int position_bits_to_shift() const { return position_bits_to_shift_; }
    int64_t log_length() const;

    int active_partition_index() const;
    int64_t active_term_count() const;
    int64_t tail(int partition) const;
    void set_tail(int partition, int64_t value);

    // True when a frame of aligned_length fits at the active tail.
    bool has_space(int32_t aligned_length) const;
    // Advances activeTermCount and zeroes the next partition's tail.
    void rotate();

    TermBuffer& term(int partition);
    const TermBuffer& term(int partition) const;

private:
    struct MetaData {
        std::array<std::atomic<int64_t>, kPartitionCount> tail_counters;
        std::atomic<int64_t> active_term_count{0};
    };

    int32_t term_length_;
    int32_t page_size_;
    int position_bits_to_shift_;
    std::vector<TermBuffer> terms_;
    MetaData meta_;
};

} // namespace termlink
