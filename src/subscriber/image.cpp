#include "image.hpp"

namespace termlink {

TermRebuilder::TermRebuilder(TermBuffer &term, int32_t term_id,
                             int32_t term_length)
    : term_(term), term_id_(term_id), term_length_(term_length) {}

size_t TermRebuilder::insert(const DataHeader &hdr, const uint8_t *frame,
                             std::vector<DataHeader> &completed) {
  int32_t offset = (int32_t)hdr.term_offset;
  term_.put_bytes((size_t)offset, frame, hdr.frame_length);
  seen_offsets_.insert(offset);
  if (offset != completed_position_)
    return 0;

  // Walk forward over every frame already in place. A zero frame length marks
  // a gap that has not arrived yet.
  size_t n = 0;
  while ((size_t)completed_position_ + kDataHeaderLength <=
         (size_t)term_length_) {
    uint32_t frame_length = term_.get_u32((size_t)completed_position_);
    if (frame_length < kDataHeaderLength)
      break;
    size_t aligned = align_frame_length(frame_length);
    if ((size_t)completed_position_ + aligned > (size_t)term_length_)
      break;
    completed.push_back(term_.get_data_header((size_t)completed_position_));
    completed_position_ += (int32_t)aligned;
    n++;
  }
  return n;
}

Image::Image(uint32_t session_id, uint32_t stream_id, int32_t initial_term_id,
             int32_t term_length, const Endpoint &source)
    : session_id_(session_id), stream_id_(stream_id),
      initial_term_id_(initial_term_id), source_(source),
      log_(term_length, kPageMinSize) {
  consumed_.term_id = initial_term_id;
}

TermRebuilder &Image::rebuilder_for(int64_t term_count, int32_t term_id) {
  auto it = rebuilders_.find(term_count);
  if (it != rebuilders_.end())
    return *it->second;

  if (term_count > newest_term_count_)
    newest_term_count_ = term_count;
  // Terms three or more behind the newest have handed their partition on.
  while (!rebuilders_.empty() &&
         rebuilders_.begin()->first <= newest_term_count_ - kPartitionCount)
    rebuilders_.erase(rebuilders_.begin());

  int partition = index_by_term_count(term_count);
  TermBuffer &term = log_.term(partition);
  term.set_memory(0, (size_t)log_.term_length(), 0);
  log_.set_tail(partition, 0);

  auto rb = std::make_unique<TermRebuilder>(term, term_id, log_.term_length());
  TermRebuilder &ref = *rb;
  rebuilders_.emplace(term_count, std::move(rb));
  return ref;
}

Image::InsertResult
Image::insert_frame(const DataHeader &hdr, const uint8_t *frame, size_t len,
                    std::vector<ConsumptionPoint> &consumed) {
  const int32_t term_length = log_.term_length();
  if (hdr.frame_length < kDataHeaderLength || hdr.frame_length > len)
    return InsertResult::Malformed;
  if (hdr.term_offset % kFrameAlignment != 0)
    return InsertResult::Malformed;
  if ((uint64_t)hdr.term_offset + align_frame_length(hdr.frame_length) >
      (uint64_t)term_length)
    return InsertResult::Malformed;

  int32_t term_id = (int32_t)hdr.term_id;
  int64_t term_count =
      (int64_t)(int32_t)((uint32_t)term_id - (uint32_t)initial_term_id_);
  if (term_count < 0)
    return InsertResult::Stale;
  if (newest_term_count_ >= 0 &&
      term_count <= newest_term_count_ - kPartitionCount)
    return InsertResult::Stale;

  TermRebuilder &rb = rebuilder_for(term_count, term_id);
  if (rb.seen((int32_t)hdr.term_offset) ||
      (int32_t)hdr.term_offset < rb.completed_position())
    return InsertResult::Duplicate;

  std::vector<DataHeader> completed;
  rb.insert(hdr, frame, completed);
  log_.set_tail(index_by_term_count(term_count), rb.completed_position());

  const int shift = log_.position_bits_to_shift();
  for (const auto &h : completed) {
    int32_t end_offset =
        (int32_t)(h.term_offset + align_frame_length(h.frame_length));
    if (h.type != HDR_TYPE_DATA)
      continue;
    Fragment f;
    size_t payload_len = h.frame_length - kDataHeaderLength;
    const uint8_t *p =
        rb.term().slice(h.term_offset + kDataHeaderLength, payload_len);
    f.payload.assign(p, p + payload_len);
    f.session_id = h.session_id;
    f.stream_id = h.stream_id;
    f.term_id = (int32_t)h.term_id;
    f.term_offset = (int32_t)h.term_offset;
    f.position = compute_position(f.term_id, end_offset, shift, initial_term_id_);
    if (f.position > position_) {
      position_ = f.position;
      consumed_ = ConsumptionPoint{f.term_id, end_offset};
    }
    consumed.push_back(ConsumptionPoint{f.term_id, end_offset});
    ready_.push_back(std::move(f));
  }
  return InsertResult::Accepted;
}

size_t Image::poll(size_t limit, std::vector<Fragment> &out) {
  size_t n = 0;
  while (n < limit && !ready_.empty()) {
    out.push_back(std::move(ready_.front()));
    ready_.pop_front();
    n++;
  }
  return n;
}

ConsumptionPoint Image::consumption() const { return consumed_; }

} // namespace termlink
