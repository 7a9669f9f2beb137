#include "transport.hpp"
#include "errors.hpp"
#include "logging.hpp"

namespace termlink {

const char *transport_state_name(TransportState s) {
  switch (s) {
  case TransportState::Opening:
    return "opening";
  case TransportState::Ready:
    return "ready";
  case TransportState::Failed:
    return "failed";
  default:
    return "closed";
  }
}

UdpTransport::UdpTransport(asio::io_context &io, const UdpTransportConfig &cfg)
    : io_(io), cfg_(cfg), strand_(asio::make_strand(io)), sock_(io),
      read_buf_(cfg.max_datagram) {}

UdpTransport::~UdpTransport() { close(); }

void UdpTransport::notify(TransportState s, const std::error_code &ec) {
  StateHandler h;
  {
    std::lock_guard<std::mutex> lk(mtx_);
    h = on_state_;
  }
  if (h)
    h(s, ec);
}

std::error_code UdpTransport::open() {
  notify(TransportState::Opening, {});
  std::error_code ec;
  asio::ip::udp::resolver res(io_);
  auto results = res.resolve(cfg_.host, std::to_string(cfg_.port), ec);
  if (!ec && results.empty())
    ec = asio::error::host_not_found;
  if (ec) {
    Logger::instance().log(LogLevel::ERROR, "resolve %s:%u failed: %s",
                           cfg_.host.c_str(), (unsigned)cfg_.port,
                           ec.message().c_str());
    notify(TransportState::Failed, ec);
    return ec;
  }
  Endpoint ep = *results.begin();

  {
    std::lock_guard<std::mutex> lk(mtx_);
    sock_.open(ep.protocol(), ec);
    if (!ec && cfg_.socket_buffer_size > 0) {
      sock_.set_option(
          asio::socket_base::receive_buffer_size(cfg_.socket_buffer_size), ec);
      if (!ec)
        sock_.set_option(
            asio::socket_base::send_buffer_size(cfg_.socket_buffer_size), ec);
    }
    if (!ec) {
      if (cfg_.mode == UdpTransportConfig::Mode::Bind) {
        sock_.set_option(asio::socket_base::reuse_address(true), ec);
        if (!ec)
          sock_.bind(ep, ec);
      } else {
        sock_.connect(ep, ec);
        if (!ec)
          have_peer_ = true;
      }
    }
    if (ec) {
      std::error_code ec2;
      sock_.close(ec2);
    }
  }

  if (ec) {
    Logger::instance().log(LogLevel::ERROR, "udp %s %s:%u failed: %s",
                           cfg_.mode == UdpTransportConfig::Mode::Bind
                               ? "bind"
                               : "connect",
                           cfg_.host.c_str(), (unsigned)cfg_.port,
                           ec.message().c_str());
    notify(TransportState::Failed, ec);
    return ec;
  }

  Logger::instance().log(LogLevel::INFO, "udp transport ready on %s:%u",
                         local_endpoint().address().to_string().c_str(),
                         (unsigned)local_endpoint().port());
  notify(TransportState::Ready, {});
  do_receive();
  return {};
}

void UdpTransport::close() {
  bool was_open = false;
  {
    std::lock_guard<std::mutex> lk(mtx_);
    was_open = sock_.is_open();
    if (was_open) {
      std::error_code ec;
      sock_.close(ec);
    }
    have_peer_ = false;
  }
  if (was_open) {
    Logger::instance().log(LogLevel::INFO, "udp transport closed");
    notify(TransportState::Closed, {});
  }
}

bool UdpTransport::is_open() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return sock_.is_open();
}

std::error_code UdpTransport::send(const uint8_t *data, size_t len) {
  std::lock_guard<std::mutex> lk(mtx_);
  if (!sock_.is_open())
    return make_error_code(errc::not_connected);
  std::error_code ec;
  if (cfg_.mode == UdpTransportConfig::Mode::Connect) {
    sock_.send(asio::buffer(data, len), 0, ec);
  } else {
    if (!have_peer_)
      return make_error_code(errc::not_connected);
    sock_.send_to(asio::buffer(data, len), last_from_, 0, ec);
  }
  return ec;
}

std::error_code UdpTransport::send_to(const Endpoint &to, const uint8_t *data,
                                      size_t len) {
  std::lock_guard<std::mutex> lk(mtx_);
  if (!sock_.is_open())
    return make_error_code(errc::not_connected);
  std::error_code ec;
  if (cfg_.mode == UdpTransportConfig::Mode::Connect)
    sock_.send(asio::buffer(data, len), 0, ec);
  else
    sock_.send_to(asio::buffer(data, len), to, 0, ec);
  return ec;
}

void UdpTransport::set_receive_handler(ReceiveHandler h) {
  std::lock_guard<std::mutex> lk(mtx_);
  on_receive_ = std::move(h);
}

void UdpTransport::set_state_handler(StateHandler h) {
  std::lock_guard<std::mutex> lk(mtx_);
  on_state_ = std::move(h);
}

Endpoint UdpTransport::local_endpoint() const {
  std::lock_guard<std::mutex> lk(mtx_);
  std::error_code ec;
  Endpoint ep = sock_.local_endpoint(ec);
  return ec ? Endpoint{} : ep;
}

void UdpTransport::do_receive() {
  std::lock_guard<std::mutex> lk(mtx_);
  if (!sock_.is_open())
    return;
  sock_.async_receive_from(
      asio::buffer(read_buf_), recv_from_,
      asio::bind_executor(strand_, [this](std::error_code ec, std::size_t n) {
        if (ec == asio::error::operation_aborted)
          return;
        if (ec) {
          // ICMP port unreachable surfaces here on a connected socket.
          Logger::instance().log(LogLevel::DEBUG, "udp receive error: %s",
                                 ec.message().c_str());
          do_receive();
          return;
        }
        Endpoint from;
        ReceiveHandler h;
        {
          std::lock_guard<std::mutex> lk2(mtx_);
          from = recv_from_;
          last_from_ = recv_from_;
          if (cfg_.mode == UdpTransportConfig::Mode::Bind)
            have_peer_ = true;
          h = on_receive_;
        }
        if (h)
          h(read_buf_.data(), n, from);
        do_receive();
      }));
}

} // namespace termlink
