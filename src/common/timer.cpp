#include "timer.hpp"

namespace termlink {

PeriodicTimer::PeriodicTimer(asio::io_context &io)
    : st_(std::make_shared<State>(io)) {}

PeriodicTimer::~PeriodicTimer() { cancel(); }

void PeriodicTimer::start(std::chrono::milliseconds interval, Callback fn) {
  std::lock_guard<std::recursive_mutex> lk(st_->mtx);
  st_->timer.cancel();
  st_->interval = interval;
  st_->fn = std::move(fn);
  st_->active = true;
  arm(st_, ++st_->generation);
}

void PeriodicTimer::cancel() {
  std::lock_guard<std::recursive_mutex> lk(st_->mtx);
  if (!st_->active)
    return;
  st_->active = false;
  st_->generation++;
  st_->timer.cancel();
}

bool PeriodicTimer::active() const {
  std::lock_guard<std::recursive_mutex> lk(st_->mtx);
  return st_->active;
}

void PeriodicTimer::arm(const std::shared_ptr<State> &st, uint64_t gen) {
  st->timer.expires_after(st->interval);
  st->timer.async_wait([st, gen](std::error_code ec) {
    if (ec)
      return;
    std::lock_guard<std::recursive_mutex> lk(st->mtx);
    if (!st->active || st->generation != gen)
      return;
    st->fn();
    if (st->active && st->generation == gen)
      arm(st, gen);
  });
}

} // namespace termlink
