#include "logging.hpp"
#include "subscription.hpp"
#include "util.hpp"
#include <algorithm>
#include <asio.hpp>
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <csignal>
#include <iostream>
#include <thread>

using namespace termlink;

int main(int argc, char **argv) {
  std::string listen = "0.0.0.0:40001";
  uint32_t stream_id = 1001;
  long session_filter = -1;
  long count = 0;
  int threads = 2;
  std::string log_level = "info";

  for (int i = 1; i < argc; i++) {
    std::string a = argv[i];
    auto next = [&](int &i) -> std::string {
      if (i + 1 < argc)
        return std::string(argv[++i]);
      std::cerr << "missing value for " << a << "\n";
      std::exit(1);
    };
    if (a == "--listen")
      listen = next(i);
    else if (a == "--stream")
      stream_id = (uint32_t)std::stoul(next(i));
    else if (a == "--session")
      session_filter = std::stol(next(i));
    else if (a == "--count")
      count = std::stol(next(i));
    else if (a == "--threads")
      threads = std::stoi(next(i));
    else if (a == "--log-level")
      log_level = next(i);
  }

  auto lvl = parse_log_level(log_level);
  if (!lvl) {
    std::cerr << "bad log level " << log_level << std::endl;
    return 1;
  }
  Logger::instance().set_level(*lvl);

  SubscriptionConfig cfg;
  if (!parse_host_port(listen, cfg.listen_host, cfg.listen_port)) {
    std::cerr << "bad listen address" << std::endl;
    return 1;
  }
  cfg.stream_id = stream_id;
  if (session_filter >= 0)
    cfg.session_id = (uint32_t)session_filter;

  asio::io_context io;
  std::atomic<bool> stop{false};
  asio::signal_set signals(io, SIGINT, SIGTERM);
  signals.async_wait([&](const std::error_code &ec, int) {
    if (!ec)
      stop = true;
  });

  Subscription sub(io, cfg);
  long received = 0;
  long bytes = 0;
  sub.set_fragment_handler([&](const std::vector<uint8_t> &payload,
                               uint32_t session, uint32_t stream,
                               int64_t position) {
    received++;
    bytes += (long)payload.size();
    Logger::instance().log(LogLevel::DEBUG,
                           "fragment session=%u stream=%u len=%zu pos=%lld",
                           session, stream, payload.size(),
                           (long long)position);
  });
  sub.set_available_image_handler([](const ImageInfo &img) {
    std::cout << "image available: session " << img.session_id << " from "
              << img.source << std::endl;
  });
  sub.set_unavailable_image_handler([](const ImageInfo &img) {
    std::cout << "image unavailable: session " << img.session_id
              << " at position " << img.position << std::endl;
  });
  if (sub.start())
    return 1;

  std::vector<std::thread> th;
  for (int i = 0; i < std::max(1, threads); i++)
    th.emplace_back([&]() { io.run(); });

  while (!stop && (count <= 0 || received < count)) {
    if (sub.poll(64) == 0)
      std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
  std::cout << "received " << received << " fragment(s), " << bytes
            << " bytes" << std::endl;

  sub.close();
  signals.cancel();
  io.stop();
  for (auto &t : th)
    t.join();
  return 0;
}
