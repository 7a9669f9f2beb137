#include "reliable_receiver.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include "protocol.hpp"

namespace termlink {

static std::unique_ptr<DatagramTransport>
make_udp_transport(asio::io_context &io, const ReliableConfig &cfg) {
  UdpTransportConfig tc;
  tc.mode = UdpTransportConfig::Mode::Bind;
  tc.host = cfg.host;
  tc.port = cfg.port;
  return std::unique_ptr<DatagramTransport>(new UdpTransport(io, tc));
}

ReliableReceiver::ReliableReceiver(asio::io_context &io,
                                   const ReliableConfig &cfg)
    : ReliableReceiver(io, cfg, make_udp_transport(io, cfg)) {}

ReliableReceiver::ReliableReceiver(asio::io_context &,
                                   const ReliableConfig &cfg,
                                   std::unique_ptr<DatagramTransport> transport)
    : cfg_(cfg), transport_(std::move(transport)) {
  transport_->set_receive_handler(
      [this](const uint8_t *data, size_t len, const Endpoint &from) {
        on_datagram(data, len, from);
      });
  transport_->set_state_handler(
      [this](TransportState s, const std::error_code &ec) {
        Logger::instance().log(
            s == TransportState::Failed ? LogLevel::WARN : LogLevel::DEBUG,
            "reliable receiver stream=%u transport %s%s%s", cfg_.stream_id,
            transport_state_name(s), ec ? ": " : "",
            ec ? ec.message().c_str() : "");
      });
}

ReliableReceiver::~ReliableReceiver() { close(); }

std::error_code ReliableReceiver::start() {
  {
    std::lock_guard<std::mutex> lk(mtx_);
    if (closed_)
      return make_error_code(errc::closed);
  }
  std::error_code ec = transport_->open();
  if (ec) {
    transport_->close();
    Logger::instance().log(LogLevel::ERROR,
                           "reliable receiver %s:%u listen failed: %s",
                           cfg_.host.c_str(), cfg_.port, ec.message().c_str());
    return ec;
  }
  auto ep = transport_->local_endpoint();
  Logger::instance().log(LogLevel::INFO,
                         "reliable receiver stream=%u listening on %s:%u",
                         cfg_.stream_id, ep.address().to_string().c_str(),
                         ep.port());
  return {};
}

void ReliableReceiver::close() {
  size_t dropped;
  {
    std::lock_guard<std::mutex> lk(mtx_);
    if (closed_)
      return;
    closed_ = true;
    dropped = out_of_order_.size();
    out_of_order_.clear();
  }
  transport_->close();
  Logger::instance().log(LogLevel::INFO,
                         "reliable receiver stream=%u closed, %zu buffered "
                         "message(s) discarded",
                         cfg_.stream_id, dropped);
}

void ReliableReceiver::set_message_handler(MessageHandler h) {
  std::lock_guard<std::mutex> lk(mtx_);
  on_message_ = std::move(h);
}

void ReliableReceiver::send_ack(uint32_t sequence, uint32_t session_id,
                                uint32_t stream_id, const Endpoint &to) {
  auto frame = encode_reliable_frame(REL_TYPE_ACK, session_id, stream_id,
                                     sequence, nullptr, 0);
  auto ec = transport_->send_to(to, frame.data(), frame.size());
  if (ec) {
    Logger::instance().log(LogLevel::WARN, "ACK seq=%u send failed: %s",
                           sequence, ec.message().c_str());
    return;
  }
  stats_.acks_sent++;
}

void ReliableReceiver::on_datagram(const uint8_t *data, size_t len,
                                   const Endpoint &from) {
  auto frame = decode_reliable_frame(data, len);
  if (!frame) {
    Logger::instance().log(LogLevel::WARN,
                           "reliable receiver dropped malformed frame "
                           "(%zu bytes)",
                           len);
    return;
  }
  const DataHeader &hdr = frame->hdr;
  if (hdr.stream_id != cfg_.stream_id)
    return;
  if (cfg_.session_filter && *cfg_.session_filter != hdr.session_id)
    return;

  std::vector<Delivery> ready;
  MessageHandler handler;
  {
    std::lock_guard<std::mutex> lk(mtx_);
    if (closed_)
      return;
    if (hdr.type == REL_TYPE_HEARTBEAT) {
      stats_.heartbeats++;
      stats_.last_heartbeat = std::chrono::steady_clock::now();
      return;
    }
    if (hdr.type != REL_TYPE_DATA) {
      Logger::instance().log(LogLevel::DEBUG,
                             "reliable receiver ignoring frame type %u",
                             (unsigned)hdr.type);
      return;
    }

    uint32_t seq = frame->sequence_number;
    send_ack(seq, hdr.session_id, hdr.stream_id, from);

    if (seq < expected_sequence_ || out_of_order_.count(seq)) {
      stats_.duplicates++;
      Logger::instance().log(LogLevel::DEBUG, "duplicate seq=%u", seq);
      return;
    }
    stats_.received++;
    Buffered msg{std::move(frame->payload), hdr.session_id, hdr.stream_id};
    if (seq != expected_sequence_) {
      out_of_order_.emplace(seq, std::move(msg));
      return;
    }
    ready.push_back(Delivery{seq, std::move(msg)});
    expected_sequence_++;
    for (auto it = out_of_order_.find(expected_sequence_);
         it != out_of_order_.end();
         it = out_of_order_.find(expected_sequence_)) {
      ready.push_back(Delivery{it->first, std::move(it->second)});
      out_of_order_.erase(it);
      expected_sequence_++;
    }
    stats_.delivered += ready.size();
    handler = on_message_;
  }
  if (handler)
    for (const auto &d : ready)
      handler(d.msg.payload, d.sequence, d.msg.session_id, d.msg.stream_id);
}

ReceiverStatistics ReliableReceiver::statistics() const {
  std::lock_guard<std::mutex> lk(mtx_);
  ReceiverStatistics s = stats_;
  s.expected_sequence = expected_sequence_;
  s.buffered = out_of_order_.size();
  return s;
}

uint32_t ReliableReceiver::expected_sequence() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return expected_sequence_;
}

} // namespace termlink
