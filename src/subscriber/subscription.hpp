#pragma once
#include <asio.hpp>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "image.hpp"
#include "protocol.hpp"
#include "transport.hpp"

namespace termlink {

struct SubscriptionConfig {
    std::string listen_host{"0.0.0.0"};
    uint16_t listen_port{40001};
    uint32_t stream_id{1001};
    std::optional<uint32_t> session_id; // unset: accept every session
    uint32_t receiver_window{kReceiverWindowDefault};
    // Setups announcing a longer term are refused; each image holds three terms.
    int32_t max_term_length{kTermMaxLength};
};

// Snapshot of one image, handed to availability callbacks.
struct ImageInfo {
    uint32_t session_id{0};
    uint32_t stream_id{0};
    int32_t initial_term_id{0};
    int32_t term_length{0};
    Endpoint source;
    int64_t position{0};
};

class Subscription {
public:
    using FragmentHandler = std::function<void(const std::vector<uint8_t>& payload, uint32_t session_id,
                                               uint32_t stream_id, int64_t position)>;
    using ImageHandler = std::function<void(const ImageInfo& image)>;

    Subscription(asio::io_context& io, const SubscriptionConfig& cfg);
    Subscription(asio::io_context& io, const SubscriptionConfig& cfg,
                 std::unique_ptr<DatagramTransport> transport);
    ~Subscription();
    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;

    std::error_code start();
    // Stops listening; every known image is reported unavailable once.
    void close();

    // Delivers up to limit rebuilt fragments to the fragment handler. Each
    // call starts one image further along than the previous one.
    int poll(int limit = 10);

    void set_fragment_handler(FragmentHandler h);
    void set_available_image_handler(ImageHandler h);
    void set_unavailable_image_handler(ImageHandler h);

    size_t image_count() const;
    std::vector<ImageInfo> images() const;
    bool is_closed() const;
    Endpoint local_endpoint() const { return transport_->local_endpoint(); }
    uint32_t stream_id() const { return cfg_.stream_id; }

private:
    void on_datagram(const uint8_t* data, size_t len, const Endpoint& from);
    void on_setup(const SetupHeader& setup, const Endpoint& from);
    void on_data(const DataHeader& hdr, const uint8_t* data, size_t len, const Endpoint& from);
    bool accepts(uint32_t session_id, uint32_t stream_id) const;
    // Caller holds mtx_.
    void send_status(const Image& image, const ConsumptionPoint& point, const Endpoint& to);
    static ImageInfo info_of(const Image& image);

    SubscriptionConfig cfg_;
    std::unique_ptr<DatagramTransport> transport_;

    mutable std::mutex mtx_;
    std::map<uint32_t, std::unique_ptr<Image>> images_; // by session id
    FragmentHandler on_fragment_;
    ImageHandler on_available_;
    ImageHandler on_unavailable_;
    uint32_t poll_cursor_{0}; // session id the next poll starts from
    bool closed_{false};
};

} // namespace termlink
