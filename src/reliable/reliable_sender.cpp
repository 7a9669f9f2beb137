#include "reliable_sender.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include "protocol.hpp"

namespace termlink {

const char *delivery_failure_reason_name(DeliveryFailureReason r) {
  switch (r) {
  case DeliveryFailureReason::RetriesExhausted:
    return "retries exhausted";
  case DeliveryFailureReason::Closed:
    return "closed";
  }
  return "unknown";
}

static std::unique_ptr<DatagramTransport>
make_udp_transport(asio::io_context &io, const ReliableConfig &cfg) {
  UdpTransportConfig tc;
  tc.mode = UdpTransportConfig::Mode::Connect;
  tc.host = cfg.host;
  tc.port = cfg.port;
  return std::unique_ptr<DatagramTransport>(new UdpTransport(io, tc));
}

ReliableSender::ReliableSender(asio::io_context &io, const ReliableConfig &cfg)
    : ReliableSender(io, cfg, make_udp_transport(io, cfg)) {}

ReliableSender::ReliableSender(asio::io_context &io, const ReliableConfig &cfg,
                               std::unique_ptr<DatagramTransport> transport)
    : cfg_(cfg), transport_(std::move(transport)), retransmit_timer_(io),
      heartbeat_timer_(io) {
  transport_->set_receive_handler(
      [this](const uint8_t *data, size_t len, const Endpoint &from) {
        on_datagram(data, len, from);
      });
  transport_->set_state_handler(
      [this](TransportState s, const std::error_code &ec) {
        Logger::instance().log(
            s == TransportState::Failed ? LogLevel::WARN : LogLevel::DEBUG,
            "reliable sender session=%u transport %s%s%s", cfg_.session_id,
            transport_state_name(s), ec ? ": " : "",
            ec ? ec.message().c_str() : "");
      });
}

ReliableSender::~ReliableSender() { close(); }

std::error_code ReliableSender::connect() {
  {
    std::lock_guard<std::mutex> lk(mtx_);
    if (closed_)
      return make_error_code(errc::closed);
  }
  std::error_code ec = transport_->open();
  if (ec) {
    transport_->close();
    Logger::instance().log(LogLevel::ERROR,
                           "reliable sender %s:%u connect failed: %s",
                           cfg_.host.c_str(), cfg_.port, ec.message().c_str());
    return ec;
  }
  Logger::instance().log(LogLevel::INFO,
                         "reliable sender session=%u stream=%u -> %s:%u "
                         "window=%zu",
                         cfg_.session_id, cfg_.stream_id, cfg_.host.c_str(),
                         cfg_.port, cfg_.window);
  if (cfg_.retransmit_interval.count() > 0)
    retransmit_timer_.start(cfg_.retransmit_interval,
                            [this] { check_retransmissions(Clock::now()); });
  if (cfg_.heartbeat_interval.count() > 0)
    heartbeat_timer_.start(cfg_.heartbeat_interval,
                           [this] { send_heartbeat(); });
  return {};
}

void ReliableSender::close() {
  retransmit_timer_.cancel();
  heartbeat_timer_.cancel();
  std::vector<Failure> failures;
  {
    std::lock_guard<std::mutex> lk(mtx_);
    if (closed_)
      return;
    closed_ = true;
    for (auto &kv : pending_) {
      kv.second.state = MessageState::Dropped;
      failures.push_back(Failure{kv.first, std::move(kv.second.payload),
                                 DeliveryFailureReason::Closed});
    }
    stats_.failures += failures.size();
    pending_.clear();
  }
  window_cv_.notify_all();
  transport_->close();
  Logger::instance().log(LogLevel::INFO,
                         "reliable sender session=%u closed, %zu message(s) "
                         "undelivered",
                         cfg_.session_id, failures.size());
  report(failures);
}

std::error_code ReliableSender::transmit(uint32_t sequence,
                                         const PendingMessage &msg) {
  auto frame = encode_reliable_frame(REL_TYPE_DATA, cfg_.session_id,
                                     cfg_.stream_id, sequence,
                                     msg.payload.data(), msg.payload.size());
  return transport_->send(frame.data(), frame.size());
}

std::error_code ReliableSender::send(const uint8_t *data, size_t len,
                                     uint32_t *sequence) {
  std::unique_lock<std::mutex> lk(mtx_);
  if (closed_)
    return make_error_code(errc::closed);
  if (!transport_->is_open())
    return make_error_code(errc::not_connected);
  if (len > kMaxUdpPayloadLength - kReliableHeaderLength)
    return make_error_code(errc::payload_too_large);

  // Queued: wait for a window slot before a sequence number is assigned.
  auto deadline = Clock::now() + cfg_.admission_timeout;
  while (pending_.size() >= cfg_.window) {
    if (Clock::now() >= deadline) {
      Logger::instance().log(LogLevel::WARN,
                             "reliable sender window full (%zu pending)",
                             pending_.size());
      return make_error_code(errc::window_full);
    }
    window_cv_.wait_for(lk, cfg_.admission_poll);
    if (closed_)
      return make_error_code(errc::closed);
  }

  uint32_t seq = next_sequence_;
  PendingMessage msg;
  msg.payload.assign(data, data + len);
  msg.sent_at = Clock::now();
  auto ec = transmit(seq, msg);
  if (ec) {
    Logger::instance().log(LogLevel::WARN,
                           "reliable send seq=%u failed: %s", seq,
                           ec.message().c_str());
    return ec;
  }
  msg.state = MessageState::Sent;
  pending_.emplace(seq, std::move(msg));
  next_sequence_++;
  stats_.sent++;
  if (sequence)
    *sequence = seq;
  return {};
}

void ReliableSender::check_retransmissions(Clock::time_point now) {
  std::vector<Failure> failures;
  {
    std::lock_guard<std::mutex> lk(mtx_);
    if (closed_)
      return;
    for (auto it = pending_.begin(); it != pending_.end();) {
      PendingMessage &msg = it->second;
      if (now - msg.sent_at < cfg_.retransmit_timeout) {
        ++it;
        continue;
      }
      if (msg.retry_count >= cfg_.max_retransmits) {
        msg.state = MessageState::Dropped;
        failures.push_back(Failure{it->first, std::move(msg.payload),
                                   DeliveryFailureReason::RetriesExhausted});
        it = pending_.erase(it);
        continue;
      }
      auto ec = transmit(it->first, msg);
      if (ec)
        Logger::instance().log(LogLevel::WARN, "retransmit seq=%u failed: %s",
                               it->first, ec.message().c_str());
      msg.retry_count++;
      msg.sent_at = now;
      stats_.retransmits++;
      Logger::instance().log(LogLevel::DEBUG, "retransmit seq=%u attempt %d",
                             it->first, msg.retry_count);
      ++it;
    }
    stats_.failures += failures.size();
  }
  if (!failures.empty()) {
    window_cv_.notify_all();
    report(failures);
  }
}

void ReliableSender::send_heartbeat() {
  std::lock_guard<std::mutex> lk(mtx_);
  if (closed_ || !transport_->is_open())
    return;
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::system_clock::now().time_since_epoch())
                .count();
  auto frame = encode_reliable_frame(REL_TYPE_HEARTBEAT, cfg_.session_id,
                                     cfg_.stream_id, (uint32_t)ms, nullptr, 0);
  auto ec = transport_->send(frame.data(), frame.size());
  if (ec) {
    Logger::instance().log(LogLevel::WARN, "heartbeat send failed: %s",
                           ec.message().c_str());
    return;
  }
  stats_.heartbeats++;
}

void ReliableSender::report(std::vector<Failure> &failures) {
  FailureHandler handler;
  {
    std::lock_guard<std::mutex> lk(mtx_);
    handler = on_failure_;
  }
  for (auto &f : failures) {
    Logger::instance().log(LogLevel::WARN,
                           "reliable message seq=%u not delivered: %s",
                           f.sequence, delivery_failure_reason_name(f.reason));
    if (handler)
      handler(f.sequence, f.payload, f.reason);
  }
}

void ReliableSender::on_datagram(const uint8_t *data, size_t len,
                                 const Endpoint &) {
  auto frame = decode_reliable_frame(data, len);
  if (!frame) {
    Logger::instance().log(LogLevel::WARN,
                           "reliable sender dropped malformed frame "
                           "(%zu bytes)",
                           len);
    return;
  }
  if (frame->hdr.session_id != cfg_.session_id ||
      frame->hdr.stream_id != cfg_.stream_id)
    return;
  switch (frame->hdr.type) {
  case REL_TYPE_ACK:
    on_ack(frame->sequence_number);
    break;
  case REL_TYPE_NAK:
    on_nak(frame->sequence_number);
    break;
  default:
    Logger::instance().log(LogLevel::DEBUG,
                           "reliable sender ignoring frame type %u",
                           (unsigned)frame->hdr.type);
    break;
  }
}

void ReliableSender::on_ack(uint32_t sequence) {
  AckHandler handler;
  {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = pending_.find(sequence);
    if (it == pending_.end()) {
      Logger::instance().log(LogLevel::DEBUG, "ACK for unknown seq=%u",
                             sequence);
      return;
    }
    it->second.state = MessageState::Acked;
    pending_.erase(it);
    stats_.acked++;
    handler = on_ack_;
  }
  window_cv_.notify_all();
  if (handler)
    handler(sequence);
}

void ReliableSender::on_nak(uint32_t sequence) {
  std::lock_guard<std::mutex> lk(mtx_);
  auto it = pending_.find(sequence);
  if (it == pending_.end() || closed_)
    return;
  Logger::instance().log(LogLevel::DEBUG, "NAK for seq=%u, retransmitting",
                         sequence);
  auto ec = transmit(sequence, it->second);
  if (ec) {
    Logger::instance().log(LogLevel::WARN, "retransmit seq=%u failed: %s",
                           sequence, ec.message().c_str());
    return;
  }
  stats_.retransmits++;
}

void ReliableSender::set_failure_handler(FailureHandler h) {
  std::lock_guard<std::mutex> lk(mtx_);
  on_failure_ = std::move(h);
}

void ReliableSender::set_ack_handler(AckHandler h) {
  std::lock_guard<std::mutex> lk(mtx_);
  on_ack_ = std::move(h);
}

size_t ReliableSender::pending_count() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return pending_.size();
}

bool ReliableSender::is_pending(uint32_t sequence) const {
  std::lock_guard<std::mutex> lk(mtx_);
  return pending_.count(sequence) != 0;
}

SenderStatistics ReliableSender::statistics() const {
  std::lock_guard<std::mutex> lk(mtx_);
  SenderStatistics s = stats_;
  s.pending = pending_.size();
  s.next_sequence = next_sequence_;
  return s;
}

bool ReliableSender::is_connected() const {
  {
    std::lock_guard<std::mutex> lk(mtx_);
    if (closed_)
      return false;
  }
  return transport_->is_open();
}

} // namespace termlink
