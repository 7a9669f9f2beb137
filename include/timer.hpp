#pragma once
#include <asio.hpp>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>

namespace termlink {

// Repeating steady_timer. The callback runs on the io_context; cancel()
// waits for a callback already in progress on another thread and may be
// called from inside the callback itself.
class PeriodicTimer {
public:
    using Callback = std::function<void()>;

    explicit PeriodicTimer(asio::io_context& io);
    ~PeriodicTimer();
    PeriodicTimer(const PeriodicTimer&) = delete;
    PeriodicTimer& operator=(const PeriodicTimer&) = delete;

    void start(std::chrono::milliseconds interval, Callback fn);
    void cancel();
    bool active() const;

private:
    struct State {
        explicit State(asio::io_context& io) : timer(io) {}
        std::recursive_mutex mtx;
        asio::steady_timer timer;
        std::chrono::milliseconds interval{0};
        Callback fn;
        bool active{false};
        uint64_t generation{0};
    };
    static void arm(const std::shared_ptr<State>& st, uint64_t gen);

    std::shared_ptr<State> st_;
};

} // namespace termlink
