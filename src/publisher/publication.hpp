#pragma once
#include <asio.hpp>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "log_buffer.hpp"
#include "protocol.hpp"
#include "timer.hpp"
#include "transport.hpp"

namespace termlink {

struct PublicationConfig {
    std::string host{"127.0.0.1"};
    uint16_t port{40001};
    uint32_t stream_id{1001};
    uint32_t session_id{1};
    int32_t initial_term_id{0}; // 0: pick one at construction
    int32_t term_length{kTermDefaultLength};
    int32_t page_size{kPageMinSize};
    uint32_t mtu_length{kMtuDefaultLength};
    size_t max_datagram_length{65504};
    std::chrono::milliseconds setup_interval{100};
    bool enforce_receiver_window{false};
};

class Publication;

// Zero-copy reservation of one frame in the active term. The header is
// written when the claim is taken; commit() publishes it, abort() zeroes the
// header so the slot reads as empty. Destroying an open claim aborts it.
//
// A claim must not outlive the Publication it came from. If the publication
// is closed first, writes throw std::logic_error, buffer() returns nullptr and
// commit() returns CLOSED; the term stays allocated until the claim completes.
class BufferClaim {
public:
    BufferClaim(BufferClaim&& other) noexcept;
    BufferClaim& operator=(BufferClaim&& other) noexcept;
    BufferClaim(const BufferClaim&) = delete;
    BufferClaim& operator=(const BufferClaim&) = delete;
    ~BufferClaim();

    size_t length() const { return length_; }
    // nullptr once the claim completed or the publication closed.
    uint8_t* buffer();

    void put_bytes(size_t offset, const uint8_t* src, size_t len);
    void put_int32(size_t offset, int32_t v);
    void put_int64(size_t offset, int64_t v);

    int64_t commit();
    void abort();

private:
    friend class Publication;
    BufferClaim(Publication* pub, int partition, int32_t term_offset, int32_t term_id,
                size_t length, uint8_t* payload);
    void check(size_t offset, size_t len) const;

    Publication* pub_{nullptr};
    int partition_{0};
    int32_t term_offset_{0};
    int32_t term_id_{0};
    size_t length_{0};
    uint8_t* payload_{nullptr};
};

class Publication {
public:
    static constexpr int64_t NOT_CONNECTED = -1;
    static constexpr int64_t BACK_PRESSURED = -2;
    static constexpr int64_t ADMIN_ACTION = -3;
    static constexpr int64_t CLOSED = -4;
    static constexpr int64_t MAX_POSITION_EXCEEDED = -5;

    Publication(asio::io_context& io, const PublicationConfig& cfg);
    Publication(asio::io_context& io, const PublicationConfig& cfg,
                std::unique_ptr<DatagramTransport> transport);
    ~Publication();
    Publication(const Publication&) = delete;
    Publication& operator=(const Publication&) = delete;

    // Opens the transport and announces the stream with a Setup frame.
    std::error_code connect();
    void close();

    // New stream position, or one of the negative status codes above.
    int64_t offer(const uint8_t* data, size_t len);
    int64_t offer(const std::vector<uint8_t>& data) { return offer(data.data(), data.size()); }

    std::optional<BufferClaim> try_claim(size_t length);

    int64_t position() const;
    uint32_t receiver_window() const;
    int64_t last_consumption_position() const;
    bool has_receiver() const;
    bool is_connected() const;
    bool is_closed() const;

    uint32_t session_id() const { return cfg_.session_id; }
    uint32_t stream_id() const { return cfg_.stream_id; }
    int32_t initial_term_id() const { return initial_term_id_; }
    int32_t term_length() const { return cfg_.term_length; }
    size_t max_message_length() const { return max_message_length_; }
    int position_bits_to_shift() const { return position_bits_to_shift_; }

    // Valid until close() and, if a claim is open then, until it completes.
    const TermBufferSet& log_buffers() const { return *log_; }

private:
    friend class BufferClaim;

    // Shared admission checks for offer/try_claim; 0 when the frame may be
    // placed, otherwise the status to return. Caller holds mtx_.
    int64_t admit(size_t frame_length, int32_t aligned_length);
    int64_t transmit_and_advance(int partition, int32_t term_offset, int32_t term_id,
                                 int32_t frame_length);
    int64_t commit_claim(BufferClaim& claim);
    void abort_claim(BufferClaim& claim);
    void write_claim(BufferClaim& claim, size_t offset, const uint8_t* src, size_t len);
    bool claim_writable() const;
    // Caller holds mtx_.
    void finish_claim();

    void send_setup();
    void on_setup_timer();
    void on_datagram(const uint8_t* data, size_t len, const Endpoint& from);

    PublicationConfig cfg_;
    int32_t initial_term_id_;
    int position_bits_to_shift_;
    size_t max_message_length_;
    std::unique_ptr<TermBufferSet> log_;
    std::unique_ptr<DatagramTransport> transport_;
    PeriodicTimer setup_timer_;

    mutable std::mutex mtx_;
    int64_t position_{0};
    uint32_t receiver_window_{0};
    int64_t consumption_position_{0};
    bool has_receiver_{false};
    bool claim_outstanding_{false};
    bool closed_{false};
};

} // namespace termlink
