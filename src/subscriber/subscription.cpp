#include "subscription.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include <iterator>
#include <new>
#include <stdexcept>

namespace termlink {

static std::unique_ptr<DatagramTransport>
make_udp_transport(asio::io_context &io, const SubscriptionConfig &cfg) {
  UdpTransportConfig tc;
  tc.mode = UdpTransportConfig::Mode::Bind;
  tc.host = cfg.listen_host;
  tc.port = cfg.listen_port;
  return std::unique_ptr<DatagramTransport>(new UdpTransport(io, tc));
}

Subscription::Subscription(asio::io_context &io, const SubscriptionConfig &cfg)
    : Subscription(io, cfg, make_udp_transport(io, cfg)) {}

Subscription::Subscription(asio::io_context &, const SubscriptionConfig &cfg,
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
            "subscription stream=%u transport %s%s%s", cfg_.stream_id,
            transport_state_name(s), ec ? ": " : "",
            ec ? ec.message().c_str() : "");
      });
}

Subscription::~Subscription() { close(); }

std::error_code Subscription::start() {
  {
    std::lock_guard<std::mutex> lk(mtx_);
    if (closed_)
      return make_error_code(errc::closed);
  }
  std::error_code ec = transport_->open();
  if (ec) {
    transport_->close();
    Logger::instance().log(LogLevel::ERROR,
                           "subscription %s:%u listen failed: %s",
                           cfg_.listen_host.c_str(), cfg_.listen_port,
                           ec.message().c_str());
    return ec;
  }
  auto ep = transport_->local_endpoint();
  Logger::instance().log(LogLevel::INFO,
                         "subscription stream=%u listening on %s:%u",
                         cfg_.stream_id, ep.address().to_string().c_str(),
                         ep.port());
  return {};
}

void Subscription::close() {
  std::vector<ImageInfo> gone;
  ImageHandler on_unavailable;
  {
    std::lock_guard<std::mutex> lk(mtx_);
    if (closed_)
      return;
    closed_ = true;
    for (auto &kv : images_)
      gone.push_back(info_of(*kv.second));
    images_.clear();
    on_unavailable = on_unavailable_;
  }
  transport_->close();
  Logger::instance().log(LogLevel::INFO,
                         "subscription stream=%u closed, %zu image(s) released",
                         cfg_.stream_id, gone.size());
  if (on_unavailable)
    for (const auto &img : gone)
      on_unavailable(img);
}

void Subscription::set_fragment_handler(FragmentHandler h) {
  std::lock_guard<std::mutex> lk(mtx_);
  on_fragment_ = std::move(h);
}

void Subscription::set_available_image_handler(ImageHandler h) {
  std::lock_guard<std::mutex> lk(mtx_);
  on_available_ = std::move(h);
}

void Subscription::set_unavailable_image_handler(ImageHandler h) {
  std::lock_guard<std::mutex> lk(mtx_);
  on_unavailable_ = std::move(h);
}

ImageInfo Subscription::info_of(const Image &image) {
  ImageInfo info;
  info.session_id = image.session_id();
  info.stream_id = image.stream_id();
  info.initial_term_id = image.initial_term_id();
  info.term_length = image.term_length();
  info.source = image.source();
  info.position = image.position();
  return info;
}

bool Subscription::accepts(uint32_t session_id, uint32_t stream_id) const {
  if (stream_id != cfg_.stream_id)
    return false;
  return !cfg_.session_id || *cfg_.session_id == session_id;
}

void Subscription::send_status(const Image &image,
                               const ConsumptionPoint &point,
                               const Endpoint &to) {
  StatusHeader sm;
  sm.session_id = image.session_id();
  sm.stream_id = image.stream_id();
  sm.consumption_term_id = (uint32_t)point.term_id;
  sm.consumption_term_offset = (uint32_t)point.term_offset;
  sm.receiver_window = cfg_.receiver_window;
  auto frame = encode_status(sm);
  auto ec = transport_->send_to(to, frame.data(), frame.size());
  if (ec)
    Logger::instance().log(LogLevel::WARN, "status send failed: %s",
                           ec.message().c_str());
}

void Subscription::on_datagram(const uint8_t *data, size_t len,
                               const Endpoint &from) {
  auto frame = decode_frame(data, len);
  if (!frame) {
    Logger::instance().log(LogLevel::WARN,
                           "subscription dropped malformed frame (%zu bytes)",
                           len);
    return;
  }
  if (auto *setup = std::get_if<SetupHeader>(&*frame)) {
    on_setup(*setup, from);
    return;
  }
  if (auto *df = std::get_if<DataFrame>(&*frame)) {
    on_data(df->hdr, data, len, from);
    return;
  }
  Logger::instance().log(LogLevel::DEBUG,
                         "subscription ignoring inbound %s frame",
                         frame_type_name(*peek_frame_type(data, len)));
}

void Subscription::on_setup(const SetupHeader &setup, const Endpoint &from) {
  if (!accepts(setup.session_id, setup.stream_id))
    return;
  ImageInfo created;
  ImageHandler on_available;
  {
    std::lock_guard<std::mutex> lk(mtx_);
    if (closed_)
      return;
    auto it = images_.find(setup.session_id);
    if (it != images_.end()) {
      // Publisher repeats Setup until it hears from us.
      it->second->set_source(from);
      send_status(*it->second, it->second->consumption(), from);
      return;
    }
    if (setup.term_length > (uint32_t)cfg_.max_term_length) {
      Logger::instance().log(LogLevel::WARN,
                             "setup for session=%u rejected: term length %u "
                             "above limit %d",
                             setup.session_id, setup.term_length,
                             cfg_.max_term_length);
      return;
    }
    std::unique_ptr<Image> image;
    try {
      image.reset(new Image(setup.session_id, setup.stream_id,
                            (int32_t)setup.initial_term_id,
                            (int32_t)setup.term_length, from));
    } catch (const std::invalid_argument &e) {
      Logger::instance().log(LogLevel::WARN,
                             "setup for session=%u rejected: %s",
                             setup.session_id, e.what());
      return;
    } catch (const std::bad_alloc &) {
      Logger::instance().log(LogLevel::WARN,
                             "setup for session=%u dropped: cannot allocate "
                             "3 x %u byte terms",
                             setup.session_id, setup.term_length);
      return;
    }
    send_status(*image, image->consumption(), from);
    created = info_of(*image);
    images_.emplace(setup.session_id, std::move(image));
    on_available = on_available_;
  }
  Logger::instance().log(LogLevel::INFO,
                         "image available: session=%u stream=%u "
                         "initial_term=%d term_length=%d from %s:%u",
                         created.session_id, created.stream_id,
                         created.initial_term_id, created.term_length,
                         created.source.address().to_string().c_str(),
                         created.source.port());
  if (on_available)
    on_available(created);
}

void Subscription::on_data(const DataHeader &hdr, const uint8_t *data,
                           size_t len, const Endpoint &from) {
  if (!accepts(hdr.session_id, hdr.stream_id))
    return;
  std::lock_guard<std::mutex> lk(mtx_);
  if (closed_)
    return;
  auto it = images_.find(hdr.session_id);
  if (it == images_.end()) {
    Logger::instance().log(LogLevel::WARN,
                           "data for session=%u before setup, dropped",
                           hdr.session_id);
    return;
  }
  Image &image = *it->second;
  std::vector<ConsumptionPoint> consumed;
  switch (image.insert_frame(hdr, data, len, consumed)) {
  case Image::InsertResult::Accepted:
    for (const auto &point : consumed)
      send_status(image, point, from);
    break;
  case Image::InsertResult::Duplicate:
    Logger::instance().log(LogLevel::DEBUG,
                           "duplicate frame term=%u offset=%u dropped",
                           hdr.term_id, hdr.term_offset);
    break;
  case Image::InsertResult::Stale:
    Logger::instance().log(LogLevel::DEBUG,
                           "stale frame term=%u offset=%u dropped", hdr.term_id,
                           hdr.term_offset);
    break;
  case Image::InsertResult::Malformed:
    Logger::instance().log(LogLevel::WARN,
                           "frame term=%u offset=%u length=%u outside term, "
                           "dropped",
                           hdr.term_id, hdr.term_offset, hdr.frame_length);
    break;
  }
}

int Subscription::poll(int limit) {
  if (limit <= 0)
    return 0;
  std::vector<Fragment> batch;
  FragmentHandler handler;
  {
    std::lock_guard<std::mutex> lk(mtx_);
    size_t remaining = (size_t)limit;
    auto start = images_.lower_bound(poll_cursor_);
    if (start == images_.end())
      start = images_.begin();
    auto it = start;
    for (size_t n = 0; n < images_.size() && remaining > 0; n++) {
      remaining -= it->second->poll(remaining, batch);
      if (++it == images_.end())
        it = images_.begin();
    }
    if (start != images_.end()) {
      auto after = std::next(start);
      poll_cursor_ = after == images_.end() ? 0 : after->first;
    }
    handler = on_fragment_;
  }
  if (handler)
    for (const auto &f : batch)
      handler(f.payload, f.session_id, f.stream_id, f.position);
  return (int)batch.size();
}

size_t Subscription::image_count() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return images_.size();
}

std::vector<ImageInfo> Subscription::images() const {
  std::lock_guard<std::mutex> lk(mtx_);
  std::vector<ImageInfo> out;
  for (const auto &kv : images_)
    out.push_back(info_of(*kv.second));
  return out;
}

bool Subscription::is_closed() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return closed_;
}

} // namespace termlink
