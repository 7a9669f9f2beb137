#include "publication.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include <algorithm>
#include <cstring>
#include <limits>
#include <random>
#include <stdexcept>

namespace termlink {

static int32_t pick_initial_term_id(int32_t configured) {
  if (configured != 0)
    return configured;
  std::random_device rd;
  std::uniform_int_distribution<int32_t> dist(
      1, std::numeric_limits<int32_t>::max());
  return dist(rd);
}

static std::unique_ptr<DatagramTransport>
make_udp_transport(asio::io_context &io, const PublicationConfig &cfg) {
  UdpTransportConfig tc;
  tc.mode = UdpTransportConfig::Mode::Connect;
  tc.host = cfg.host;
  tc.port = cfg.port;
  return std::unique_ptr<DatagramTransport>(new UdpTransport(io, tc));
}

// BufferClaim

BufferClaim::BufferClaim(Publication *pub, int partition, int32_t term_offset,
                         int32_t term_id, size_t length, uint8_t *payload)
    : pub_(pub), partition_(partition), term_offset_(term_offset),
      term_id_(term_id), length_(length), payload_(payload) {}

BufferClaim::BufferClaim(BufferClaim &&other) noexcept
    : pub_(other.pub_), partition_(other.partition_),
      term_offset_(other.term_offset_), term_id_(other.term_id_),
      length_(other.length_), payload_(other.payload_) {
  other.pub_ = nullptr;
  other.payload_ = nullptr;
}

BufferClaim &BufferClaim::operator=(BufferClaim &&other) noexcept {
  if (this != &other) {
    if (pub_)
      abort();
    pub_ = other.pub_;
    partition_ = other.partition_;
    term_offset_ = other.term_offset_;
    term_id_ = other.term_id_;
    length_ = other.length_;
    payload_ = other.payload_;
    other.pub_ = nullptr;
    other.payload_ = nullptr;
  }
  return *this;
}

BufferClaim::~BufferClaim() {
  if (pub_)
    abort();
}

void BufferClaim::check(size_t offset, size_t len) const {
  if (!pub_)
    throw std::logic_error("buffer claim already completed");
  if (offset > length_ || len > length_ - offset)
    throw std::out_of_range("write outside claimed range");
}

uint8_t *BufferClaim::buffer() {
  if (!pub_ || !pub_->claim_writable())
    return nullptr;
  return payload_;
}

void BufferClaim::put_bytes(size_t offset, const uint8_t *src, size_t len) {
  check(offset, len);
  pub_->write_claim(*this, offset, src, len);
}

void BufferClaim::put_int32(size_t offset, int32_t v) {
  check(offset, 4);
  uint8_t b[4];
  termlink::put_u32(b, 0, (uint32_t)v);
  pub_->write_claim(*this, offset, b, sizeof(b));
}

void BufferClaim::put_int64(size_t offset, int64_t v) {
  check(offset, 8);
  uint8_t b[8];
  termlink::put_u64(b, 0, (uint64_t)v);
  pub_->write_claim(*this, offset, b, sizeof(b));
}

int64_t BufferClaim::commit() {
  if (!pub_)
    return Publication::CLOSED;
  int64_t result = pub_->commit_claim(*this);
  pub_ = nullptr;
  payload_ = nullptr;
  return result;
}

void BufferClaim::abort() {
  if (!pub_)
    return;
  pub_->abort_claim(*this);
  pub_ = nullptr;
  payload_ = nullptr;
}

// Publication

Publication::Publication(asio::io_context &io, const PublicationConfig &cfg)
    : Publication(io, cfg, make_udp_transport(io, cfg)) {}

Publication::Publication(asio::io_context &io, const PublicationConfig &cfg,
                         std::unique_ptr<DatagramTransport> transport)
    : cfg_(cfg), initial_term_id_(pick_initial_term_id(cfg.initial_term_id)),
      log_(new TermBufferSet(cfg.term_length, cfg.page_size)),
      transport_(std::move(transport)), setup_timer_(io) {
  position_bits_to_shift_ = log_->position_bits_to_shift();
  max_message_length_ =
      std::min((size_t)cfg_.term_length / 4, cfg_.max_datagram_length);
  transport_->set_receive_handler(
      [this](const uint8_t *data, size_t len, const Endpoint &from) {
        on_datagram(data, len, from);
      });
  transport_->set_state_handler(
      [this](TransportState s, const std::error_code &ec) {
        Logger::instance().log(
            s == TransportState::Failed ? LogLevel::WARN : LogLevel::DEBUG,
            "publication session=%u stream=%u transport %s%s%s",
            cfg_.session_id, cfg_.stream_id, transport_state_name(s),
            ec ? ": " : "", ec ? ec.message().c_str() : "");
      });
}

Publication::~Publication() { close(); }

std::error_code Publication::connect() {
  {
    std::lock_guard<std::mutex> lk(mtx_);
    if (closed_)
      return make_error_code(errc::closed);
  }
  std::error_code ec = transport_->open();
  if (ec) {
    transport_->close();
    Logger::instance().log(LogLevel::ERROR,
                           "publication session=%u connect failed: %s",
                           cfg_.session_id, ec.message().c_str());
    return ec;
  }
  Logger::instance().log(LogLevel::INFO,
                         "publication session=%u stream=%u initial_term=%d "
                         "term_length=%d connected",
                         cfg_.session_id, cfg_.stream_id, initial_term_id_,
                         cfg_.term_length);
  send_setup();
  if (cfg_.setup_interval.count() > 0)
    setup_timer_.start(cfg_.setup_interval, [this] { on_setup_timer(); });
  return {};
}

void Publication::close() {
  setup_timer_.cancel();
  {
    std::lock_guard<std::mutex> lk(mtx_);
    if (closed_)
      return;
    closed_ = true;
  }
  transport_->close();
  Logger::instance().log(LogLevel::INFO,
                         "publication session=%u closed at position %lld",
                         cfg_.session_id, (long long)position());
  std::lock_guard<std::mutex> lk(mtx_);
  if (claim_outstanding_)
    Logger::instance().log(LogLevel::DEBUG,
                           "publication session=%u: term kept until the open "
                           "claim completes",
                           cfg_.session_id);
  else
    log_.reset();
}

void Publication::send_setup() {
  std::vector<uint8_t> frame;
  {
    std::lock_guard<std::mutex> lk(mtx_);
    if (closed_)
      return;
    SetupHeader h;
    h.session_id = cfg_.session_id;
    h.stream_id = cfg_.stream_id;
    h.initial_term_id = (uint32_t)initial_term_id_;
    h.active_term_id =
        (uint32_t)initial_term_id_ + (uint32_t)log_->active_term_count();
    h.term_offset = (uint32_t)log_->tail(log_->active_partition_index());
    h.term_length = (uint32_t)cfg_.term_length;
    h.mtu_length = cfg_.mtu_length;
    frame = encode_setup(h);
  }
  auto ec = transport_->send(frame.data(), frame.size());
  if (ec)
    Logger::instance().log(LogLevel::WARN, "setup send failed: %s",
                           ec.message().c_str());
  else
    Logger::instance().log(LogLevel::DEBUG,
                           "setup sent: stream=%u session=%u initial_term=%d",
                           cfg_.stream_id, cfg_.session_id, initial_term_id_);
}

void Publication::on_setup_timer() {
  bool done;
  {
    std::lock_guard<std::mutex> lk(mtx_);
    done = has_receiver_ || closed_;
  }
  if (done) {
    setup_timer_.cancel();
    return;
  }
  send_setup();
}

void Publication::on_datagram(const uint8_t *data, size_t len,
                              const Endpoint &) {
  auto frame = decode_frame(data, len);
  if (!frame) {
    Logger::instance().log(LogLevel::WARN,
                           "publication dropped malformed frame (%zu bytes)",
                           len);
    return;
  }
  if (auto *sm = std::get_if<StatusHeader>(&*frame)) {
    if (sm->session_id != cfg_.session_id || sm->stream_id != cfg_.stream_id)
      return;
    std::lock_guard<std::mutex> lk(mtx_);
    receiver_window_ = sm->receiver_window;
    consumption_position_ = compute_position(
        (int32_t)sm->consumption_term_id, (int32_t)sm->consumption_term_offset,
        position_bits_to_shift_, initial_term_id_);
    if (!has_receiver_)
      Logger::instance().log(LogLevel::INFO,
                             "publication session=%u: receiver window=%u",
                             cfg_.session_id, sm->receiver_window);
    has_receiver_ = true;
    return;
  }
  if (auto *nak = std::get_if<NakHeader>(&*frame)) {
    Logger::instance().log(LogLevel::DEBUG,
                           "NAK ignored: term=%u offset=%u length=%u",
                           nak->term_id, nak->term_offset, nak->length);
    return;
  }
  Logger::instance().log(LogLevel::DEBUG,
                         "publication ignoring inbound %s frame",
                         frame_type_name(*peek_frame_type(data, len)));
}

int64_t Publication::admit(size_t frame_length, int32_t aligned_length) {
  if (closed_)
    return CLOSED;
  if (!transport_->is_open())
    return NOT_CONNECTED;
  if (frame_length > max_message_length_)
    return MAX_POSITION_EXCEEDED;
  if (claim_outstanding_)
    return BACK_PRESSURED;
  if (cfg_.enforce_receiver_window && has_receiver_ &&
      position_ + aligned_length - consumption_position_ >
          (int64_t)receiver_window_)
    return BACK_PRESSURED;
  if (!log_->has_space(aligned_length)) {
    int64_t from = log_->active_term_count();
    log_->rotate();
    Logger::instance().log(LogLevel::DEBUG,
                           "publication session=%u rotated term %lld -> %lld",
                           cfg_.session_id, (long long)from,
                           (long long)log_->active_term_count());
    return BACK_PRESSURED;
  }
  return 0;
}

int64_t Publication::transmit_and_advance(int partition, int32_t term_offset,
                                          int32_t term_id,
                                          int32_t frame_length) {
  int32_t aligned = (int32_t)align_frame_length((size_t)frame_length);
  TermBuffer &term = log_->term(partition);
  term.set_memory((size_t)(term_offset + frame_length),
                  (size_t)(aligned - frame_length), 0);
  auto ec = transport_->send(term.slice((size_t)term_offset, (size_t)aligned),
                             (size_t)aligned);
  if (ec) {
    Logger::instance().log(LogLevel::WARN,
                           "publication session=%u send failed: %s",
                           cfg_.session_id, ec.message().c_str());
    term.set_memory((size_t)term_offset, kDataHeaderLength, 0);
    return NOT_CONNECTED;
  }
  int32_t new_tail = term_offset + aligned;
  log_->set_tail(partition, new_tail);
  position_ = compute_position(term_id, new_tail, position_bits_to_shift_,
                               initial_term_id_);
  return position_;
}

int64_t Publication::offer(const uint8_t *data, size_t len) {
  std::lock_guard<std::mutex> lk(mtx_);
  size_t frame_length = kDataHeaderLength + len;
  int32_t aligned = (int32_t)align_frame_length(frame_length);
  int64_t status = admit(frame_length, aligned);
  if (status != 0)
    return status;

  int partition = log_->active_partition_index();
  int32_t term_offset = (int32_t)log_->tail(partition);
  int32_t term_id =
      (int32_t)((uint32_t)initial_term_id_ + (uint32_t)log_->active_term_count());

  DataHeader h;
  h.frame_length = (uint32_t)frame_length;
  h.term_offset = (uint32_t)term_offset;
  h.session_id = cfg_.session_id;
  h.stream_id = cfg_.stream_id;
  h.term_id = (uint32_t)term_id;
  TermBuffer &term = log_->term(partition);
  term.put_data_header((size_t)term_offset, h);
  term.put_bytes((size_t)term_offset + kDataHeaderLength, data, len);
  return transmit_and_advance(partition, term_offset, term_id,
                              (int32_t)frame_length);
}

std::optional<BufferClaim> Publication::try_claim(size_t length) {
  std::lock_guard<std::mutex> lk(mtx_);
  size_t frame_length = kDataHeaderLength + length;
  int32_t aligned = (int32_t)align_frame_length(frame_length);
  if (admit(frame_length, aligned) != 0)
    return std::nullopt;

  int partition = log_->active_partition_index();
  int32_t term_offset = (int32_t)log_->tail(partition);
  int32_t term_id =
      (int32_t)((uint32_t)initial_term_id_ + (uint32_t)log_->active_term_count());

  DataHeader h;
  h.frame_length = (uint32_t)frame_length;
  h.term_offset = (uint32_t)term_offset;
  h.session_id = cfg_.session_id;
  h.stream_id = cfg_.stream_id;
  h.term_id = (uint32_t)term_id;
  TermBuffer &term = log_->term(partition);
  term.put_data_header((size_t)term_offset, h);
  uint8_t *payload =
      term.mutable_slice((size_t)term_offset + kDataHeaderLength, length);
  claim_outstanding_ = true;
  return BufferClaim(this, partition, term_offset, term_id, length, payload);
}

void Publication::finish_claim() {
  claim_outstanding_ = false;
  if (closed_)
    log_.reset();
}

int64_t Publication::commit_claim(BufferClaim &claim) {
  std::lock_guard<std::mutex> lk(mtx_);
  bool closed = closed_;
  finish_claim();
  if (closed)
    return CLOSED;
  return transmit_and_advance(claim.partition_, claim.term_offset_,
                              claim.term_id_,
                              (int32_t)(kDataHeaderLength + claim.length_));
}

void Publication::abort_claim(BufferClaim &claim) {
  std::lock_guard<std::mutex> lk(mtx_);
  if (!closed_)
    log_->term(claim.partition_)
        .set_memory((size_t)claim.term_offset_, kDataHeaderLength, 0);
  finish_claim();
}

void Publication::write_claim(BufferClaim &claim, size_t offset,
                              const uint8_t *src, size_t len) {
  std::lock_guard<std::mutex> lk(mtx_);
  if (closed_)
    throw std::logic_error("publication closed while claim open");
  if (len)
    std::memcpy(claim.payload_ + offset, src, len);
}

bool Publication::claim_writable() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return !closed_;
}

int64_t Publication::position() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return position_;
}

uint32_t Publication::receiver_window() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return receiver_window_;
}

int64_t Publication::last_consumption_position() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return consumption_position_;
}

bool Publication::has_receiver() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return has_receiver_;
}

bool Publication::is_connected() const {
  {
    std::lock_guard<std::mutex> lk(mtx_);
    if (closed_)
      return false;
  }
  return transport_->is_open();
}

bool Publication::is_closed() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return closed_;
}

} // namespace termlink
