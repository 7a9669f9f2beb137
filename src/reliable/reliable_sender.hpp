#pragma once
#include <asio.hpp>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <system_error>
#include <vector>
#include "reliable_config.hpp"
#include "timer.hpp"
#include "transport.hpp"

namespace termlink {

enum class DeliveryFailureReason { RetriesExhausted, Closed };

const char* delivery_failure_reason_name(DeliveryFailureReason r);

struct SenderStatistics {
    size_t pending{0};
    uint32_t next_sequence{0};
    uint64_t sent{0};
    uint64_t acked{0};
    uint64_t retransmits{0};
    uint64_t failures{0};
    uint64_t heartbeats{0};
};

// Sequence-numbered delivery on top of UDP. Every message stays pending until
// its ACK arrives; unacknowledged messages are retransmitted up to
// max_retransmits times and then reported through the failure handler.
class ReliableSender {
public:
    using Clock = std::chrono::steady_clock;
    using FailureHandler = std::function<void(uint32_t sequence, const std::vector<uint8_t>& payload,
                                              DeliveryFailureReason reason)>;
    using AckHandler = std::function<void(uint32_t sequence)>;

    ReliableSender(asio::io_context& io, const ReliableConfig& cfg);
    ReliableSender(asio::io_context& io, const ReliableConfig& cfg,
                   std::unique_ptr<DatagramTransport> transport);
    ~ReliableSender();
    ReliableSender(const ReliableSender&) = delete;
    ReliableSender& operator=(const ReliableSender&) = delete;

    // Opens the transport and starts the retransmission and heartbeat timers.
    std::error_code connect();
    // Pending messages are reported with DeliveryFailureReason::Closed.
    void close();

    // Waits up to admission_timeout for a free window slot. On success the
    // assigned sequence number is stored in *sequence when given.
    std::error_code send(const uint8_t* data, size_t len, uint32_t* sequence = nullptr);
    std::error_code send(const std::vector<uint8_t>& payload, uint32_t* sequence = nullptr) {
        return send(payload.data(), payload.size(), sequence);
    }

    // Retransmits or drops every pending message older than retransmit_timeout.
    void check_retransmissions(Clock::time_point now);
    void send_heartbeat();

    void set_failure_handler(FailureHandler h);
    void set_ack_handler(AckHandler h);

    size_t pending_count() const;
    bool is_pending(uint32_t sequence) const;
    SenderStatistics statistics() const;
    bool is_connected() const;

private:
    enum class MessageState { Queued, Sent, Acked, Dropped };

    struct PendingMessage {
        std::vector<uint8_t> payload;
        Clock::time_point sent_at;
        int retry_count{0};
        MessageState state{MessageState::Queued};
    };

    struct Failure {
        uint32_t sequence;
        std::vector<uint8_t> payload;
        DeliveryFailureReason reason;
    };

    void on_datagram(const uint8_t* data, size_t len, const Endpoint& from);
    void on_ack(uint32_t sequence);
    void on_nak(uint32_t sequence);
    // Caller holds mtx_.
    std::error_code transmit(uint32_t sequence, const PendingMessage& msg);
    void report(std::vector<Failure>& failures);

    ReliableConfig cfg_;
    std::unique_ptr<DatagramTransport> transport_;
    PeriodicTimer retransmit_timer_;
    PeriodicTimer heartbeat_timer_;

    mutable std::mutex mtx_;
    std::condition_variable window_cv_;
    std::map<uint32_t, PendingMessage> pending_;
    uint32_t next_sequence_{0};
    SenderStatistics stats_;
    FailureHandler on_failure_;
    AckHandler on_ack_;
    bool closed_{false};
};

} // namespace termlink
