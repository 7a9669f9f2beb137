#pragma once
#include <asio.hpp>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <system_error>
#include <vector>

namespace termlink {

using Endpoint = asio::ip::udp::endpoint;

enum class TransportState { Opening, Ready, Failed, Closed };

const char* transport_state_name(TransportState s);

// Datagram collaborator consumed by every endpoint. Receive handlers are
// invoked one at a time, in arrival order.
class DatagramTransport {
public:
    using ReceiveHandler = std::function<void(const uint8_t* data, size_t len, const Endpoint& from)>;
    using StateHandler = std::function<void(TransportState state, const std::error_code& ec)>;

    virtual ~DatagramTransport() = default;
    virtual std::error_code open() = 0;
    virtual void close() = 0;
    virtual bool is_open() const = 0;
    // To the connected peer (connect mode) or the last peer heard from (bind mode).
    virtual std::error_code send(const uint8_t* data, size_t len) = 0;
    virtual std::error_code send_to(const Endpoint& to, const uint8_t* data, size_t len) = 0;
    virtual void set_receive_handler(ReceiveHandler h) = 0;
    virtual void set_state_handler(StateHandler h) = 0;
    virtual Endpoint local_endpoint() const = 0;
};

struct UdpTransportConfig {
    enum class Mode { Connect, Bind };
    Mode mode{Mode::Connect};
    std::string host{"127.0.0.1"};
    uint16_t port{40001};
    size_t max_datagram{65536};
    int socket_buffer_size{0}; // 0 keeps the OS default
};

class UdpTransport : public DatagramTransport {
public:
    UdpTransport(asio::io_context& io, const UdpTransportConfig& cfg);
    ~UdpTransport() override;

    std::error_code open() override;
    void close() override;
    bool is_open() const override;
    std::error_code send(const uint8_t* data, size_t len) override;
    std::error_code send_to(const Endpoint& to, const uint8_t* data, size_t len) override;
    void set_receive_handler(ReceiveHandler h) override;
    void set_state_handler(StateHandler h) override;
    Endpoint local_endpoint() const override;

private:
    void do_receive();
    void notify(TransportState s, const std::error_code& ec);

    asio::io_context& io_;
    UdpTransportConfig cfg_;
    asio::strand<asio::io_context::executor_type> strand_;
    asio::ip::udp::socket sock_;
    Endpoint last_from_;
    Endpoint recv_from_;
    bool have_peer_{false};
    std::vector<uint8_t> read_buf_;
    ReceiveHandler on_receive_;
    StateHandler on_state_;
    mutable std::mutex mtx_;
};

} // namespace termlink
