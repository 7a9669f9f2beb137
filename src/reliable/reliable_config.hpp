#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace termlink {

// Shared by both ends: the sender connects to host:port, the receiver binds it.
struct ReliableConfig {
    std::string host{"127.0.0.1"};
    uint16_t port{40001};
    uint32_t session_id{1};
    uint32_t stream_id{1001};
    std::optional<uint32_t> session_filter; // receiver only
    size_t window{1000};
    std::chrono::milliseconds retransmit_interval{100};
    std::chrono::milliseconds retransmit_timeout{100};
    int max_retransmits{5};
    std::chrono::milliseconds heartbeat_interval{1000};
    std::chrono::milliseconds admission_timeout{1000};
    std::chrono::milliseconds admission_poll{1};
};

} // namespace termlink
