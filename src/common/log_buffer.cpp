#include "log_buffer.hpp"
#include <cstring>
#include <stdexcept>
#include <string>

namespace termlink {

// Tail counters and active term count, padded to one cache line.
static constexpr int64_t kLogMetaDataLength = 64;

int position_bits_to_shift(int32_t term_length) {
  if (!is_power_of_two(term_length))
    throw std::invalid_argument("term length not a power of two: " +
                                std::to_string(term_length));
  int shift = 0;
  while ((int64_t{1} << shift) < term_length)
    shift++;
  return shift;
}

int64_t compute_position(int32_t active_term_id, int32_t term_offset,
                         int position_bits_to_shift, int32_t initial_term_id) {
  int32_t term_count =
      (int32_t)((uint32_t)active_term_id - (uint32_t)initial_term_id);
  return ((int64_t)term_count << position_bits_to_shift) + term_offset;
}

int32_t compute_term_id_from_position(int64_t position,
                                      int position_bits_to_shift,
                                      int32_t initial_term_id) {
  return (int32_t)((uint32_t)(position >> position_bits_to_shift) +
                   (uint32_t)initial_term_id);
}

int32_t compute_term_offset_from_position(int64_t position,
                                          int position_bits_to_shift) {
  int64_t mask = (int64_t{1} << position_bits_to_shift) - 1;
  return (int32_t)(position & mask);
}

void TermBuffer::check(size_t offset, size_t len) const {
  if (offset > bytes_.size() || len > bytes_.size() - offset)
    throw std::out_of_range("term buffer slice [" + std::to_string(offset) +
                            ", +" + std::to_string(len) + ") exceeds " +
                            std::to_string(bytes_.size()));
}

void TermBuffer::put_bytes(size_t offset, const uint8_t *src, size_t len) {
  check(offset, len);
  if (len)
    std::memcpy(bytes_.data() + offset, src, len);
}

void TermBuffer::get_bytes(size_t offset, uint8_t *dst, size_t len) const {
  check(offset, len);
  if (len)
    std::memcpy(dst, bytes_.data() + offset, len);
}

void TermBuffer::put_u32(size_t offset, uint32_t v) {
  check(offset, 4);
  termlink::put_u32(bytes_.data(), offset, v);
}

uint32_t TermBuffer::get_u32(size_t offset) const {
  check(offset, 4);
  return termlink::get_u32(bytes_.data(), offset);
}

void TermBuffer::put_data_header(size_t offset, const DataHeader &h) {
  check(offset, kDataHeaderLength);
  write_data_header(bytes_.data() + offset, h);
}

DataHeader TermBuffer::get_data_header(size_t offset) const {
  check(offset, kDataHeaderLength);
  return read_data_header(bytes_.data() + offset);
}

void TermBuffer::set_memory(size_t offset, size_t len, uint8_t value) {
  check(offset, len);
  if (len)
    std::memset(bytes_.data() + offset, value, len);
}

const uint8_t *TermBuffer::slice(size_t offset, size_t len) const {
  check(offset, len);
  return bytes_.data() + offset;
}

uint8_t *TermBuffer::mutable_slice(size_t offset, size_t len) {
  check(offset, len);
  return bytes_.data() + offset;
}

TermBufferSet::TermBufferSet(int32_t term_length, int32_t page_size)
    : term_length_(term_length), page_size_(page_size) {
  if (term_length < kTermMinLength || term_length > kTermMaxLength ||
      !is_power_of_two(term_length))
    throw std::invalid_argument("invalid term length: " +
                                std::to_string(term_length));
  if (page_size < kPageMinSize || page_size > kPageMaxSize ||
      !is_power_of_two(page_size))
    throw std::invalid_argument("invalid page size: " +
                                std::to_string(page_size));
  position_bits_to_shift_ = termlink::position_bits_to_shift(term_length);
  terms_.reserve(kPartitionCount);
  for (int i = 0; i < kPartitionCount; i++)
    terms_.emplace_back((size_t)term_length);
  for (auto &t : meta_.tail_counters)
    t.store(0, std::memory_order_relaxed);
  meta_.active_term_count.store(0, std::memory_order_release);
}

int64_t TermBufferSet::log_length() const {
  int64_t raw = (int64_t)term_length_ * kPartitionCount + kLogMetaDataLength;
  return (raw + page_size_ - 1) & ~((int64_t)page_size_ - 1);
}

int TermBufferSet::active_partition_index() const {
  return index_by_term_count(active_term_count());
}

int64_t TermBufferSet::active_term_count() const {
  return meta_.active_term_count.load(std::memory_order_acquire);
}

int64_t TermBufferSet::tail(int partition) const {
  return meta_.tail_counters.at((size_t)partition)
      .load(std::memory_order_acquire);
}

void TermBufferSet::set_tail(int partition, int64_t value) {
  meta_.tail_counters.at((size_t)partition)
      .store(value, std::memory_order_release);
}

bool TermBufferSet::has_space(int32_t aligned_length) const {
  int64_t offset = tail(active_partition_index());
  return offset + aligned_length <= term_length_;
}

void TermBufferSet::rotate() {
  int64_t next_count = active_term_count() + 1;
  set_tail(index_by_term_count(next_count), 0);
  meta_.active_term_count.store(next_count, std::memory_order_release);
}

TermBuffer &TermBufferSet::term(int partition) {
  return terms_.at((size_t)partition);
}

const TermBuffer &TermBufferSet::term(int partition) const {
  return terms_.at((size_t)partition);
}

} // namespace termlink
