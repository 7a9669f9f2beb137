#pragma once
#include <asio.hpp>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <system_error>
#include <vector>
#include "reliable_config.hpp"
#include "transport.hpp"

namespace termlink {

struct ReceiverStatistics {
    uint32_t expected_sequence{0};
    uint64_t received{0};
    uint64_t delivered{0};
    size_t buffered{0};
    uint64_t duplicates{0};
    uint64_t acks_sent{0};
    uint64_t heartbeats{0};
    std::optional<std::chrono::steady_clock::time_point> last_heartbeat;
};

// In-order delivery of sequence-numbered frames. Every data frame is ACKed,
// duplicates included; frames ahead of the expected sequence wait in a
// reorder buffer until the gap closes.
class ReliableReceiver {
public:
    using MessageHandler = std::function<void(const std::vector<uint8_t>& payload, uint32_t sequence,
                                              uint32_t session_id, uint32_t stream_id)>;

    ReliableReceiver(asio::io_context& io, const ReliableConfig& cfg);
    ReliableReceiver(asio::io_context& io, const ReliableConfig& cfg,
                     std::unique_ptr<DatagramTransport> transport);
    ~ReliableReceiver();
    ReliableReceiver(const ReliableReceiver&) = delete;
    ReliableReceiver& operator=(const ReliableReceiver&) = delete;

    std::error_code start();
    void close();

    void set_message_handler(MessageHandler h);

    ReceiverStatistics statistics() const;
    uint32_t expected_sequence() const;
    Endpoint local_endpoint() const { return transport_->local_endpoint(); }

private:
    struct Buffered {
        std::vector<uint8_t> payload;
        uint32_t session_id;
        uint32_t stream_id;
    };
    struct Delivery {
        uint32_t sequence;
        Buffered msg;
    };

    void on_datagram(const uint8_t* data, size_t len, const Endpoint& from);
    // Caller holds mtx_.
    void send_ack(uint32_t sequence, uint32_t session_id, uint32_t stream_id, const Endpoint& to);

    ReliableConfig cfg_;
    std::unique_ptr<DatagramTransport> transport_;

    mutable std::mutex mtx_;
    uint32_t expected_sequence_{0};
    std::map<uint32_t, Buffered> out_of_order_;
    ReceiverStatistics stats_;
    MessageHandler on_message_;
    bool closed_{false};
};

} // namespace termlink
