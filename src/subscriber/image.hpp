#pragma once
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <unordered_set>
#include <vector>
#include "log_buffer.hpp"
#include "protocol.hpp"
#include "transport.hpp"

namespace termlink {

struct Fragment {
    std::vector<uint8_t> payload;
    uint32_t session_id{0};
    uint32_t stream_id{0};
    int32_t term_id{0};
    int32_t term_offset{0};
    int64_t position{0}; // stream position just past this fragment
};

// Receiver progress in one term, reported back to the sender as a Status frame.
struct ConsumptionPoint {
    int32_t term_id{0};
    int32_t term_offset{0};
};

// Rebuilds one term from frames that may arrive in any order. Frames are
// copied into the term at their own offset; fragments are emitted only for
// the contiguous run starting at completed_position.
class TermRebuilder {
public:
    TermRebuilder(TermBuffer& term, int32_t term_id, int32_t term_length);

    bool seen(int32_t term_offset) const { return seen_offsets_.count(term_offset) != 0; }

    // Caller has validated offset/length against the term. Returns the
    // number of frames scanned past completed_position.
    size_t insert(const DataHeader& hdr, const uint8_t* frame, std::vector<DataHeader>& completed);

    int32_t term_id() const { return term_id_; }
    int32_t completed_position() const { return completed_position_; }
    const TermBuffer& term() const { return term_; }

private:
    TermBuffer& term_;
    int32_t term_id_;
    int32_t term_length_;
    int32_t completed_position_{0};
    std::unordered_set<int32_t> seen_offsets_;
};

// Subscriber-side reconstruction context for one publishing session.
class Image {
public:
    enum class InsertResult { Accepted, Duplicate, Stale, Malformed };

    Image(uint32_t session_id, uint32_t stream_id, int32_t initial_term_id,
          int32_t term_length, const Endpoint& source);
    Image(const Image&) = delete;
    Image& operator=(const Image&) = delete;

    InsertResult insert_frame(const DataHeader& hdr, const uint8_t* frame, size_t len,
                              std::vector<ConsumptionPoint>& consumed);

    // Moves up to limit ready fragments, oldest first, into out.
    size_t poll(size_t limit, std::vector<Fragment>& out);
    size_t ready_count() const { return ready_.size(); }

    uint32_t session_id() const { return session_id_; }
    uint32_t stream_id() const { return stream_id_; }
    int32_t initial_term_id() const { return initial_term_id_; }
    int32_t term_length() const { return log_.term_length(); }
    const Endpoint& source() const { return source_; }
    void set_source(const Endpoint& ep) { source_ = ep; }
    // Position just past the newest rebuilt fragment.
    int64_t position() const { return position_; }
    ConsumptionPoint consumption() const;

private:
    TermRebuilder& rebuilder_for(int64_t term_count, int32_t term_id);

    uint32_t session_id_;
    uint32_t stream_id_;
    int32_t initial_term_id_;
    Endpoint source_;
    TermBufferSet log_;
    std::map<int64_t, std::unique_ptr<TermRebuilder>> rebuilders_; // by term count
    int64_t newest_term_count_{-1};
    std::deque<Fragment> ready_;
    int64_t position_{0};
    ConsumptionPoint consumed_{};
};

} // namespace termlink
