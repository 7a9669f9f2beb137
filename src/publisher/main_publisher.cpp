#include "logging.hpp"
#include "publication.hpp"
#include "util.hpp"
#include <algorithm>
#include <asio.hpp>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <thread>

using namespace termlink;

int main(int argc, char **argv) {
  std::string channel = "127.0.0.1:40001";
  uint32_t stream_id = 1001;
  uint32_t session_id = 1;
  std::string term_length = "16m";
  int count = 100;
  size_t size = 1024;
  int interval_ms = 0;
  int wait_receiver_ms = 1000;
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
    if (a == "--channel")
      channel = next(i);
    else if (a == "--stream")
      stream_id = (uint32_t)std::stoul(next(i));
    else if (a == "--session")
      session_id = (uint32_t)std::stoul(next(i));
    else if (a == "--term-length")
      term_length = next(i);
    else if (a == "--count")
      count = std::stoi(next(i));
    else if (a == "--size")
      size = (size_t)std::stoul(next(i));
    else if (a == "--interval-ms")
      interval_ms = std::stoi(next(i));
    else if (a == "--wait-receiver-ms")
      wait_receiver_ms = std::stoi(next(i));
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

  PublicationConfig cfg;
  if (!parse_host_port(channel, cfg.host, cfg.port)) {
    std::cerr << "bad channel" << std::endl;
    return 1;
  }
  auto tl = parse_size(term_length);
  if (!tl) {
    std::cerr << "bad term length" << std::endl;
    return 1;
  }
  cfg.stream_id = stream_id;
  cfg.session_id = session_id;
  cfg.term_length = (int32_t)*tl;

  asio::io_context io;
  auto work = asio::make_work_guard(io);
  std::vector<std::thread> th;
  for (int i = 0; i < std::max(1, threads); i++)
    th.emplace_back([&]() { io.run(); });
  auto shutdown = [&]() {
    work.reset();
    io.stop();
    for (auto &t : th)
      t.join();
  };

  int rc = 0;
  try {
    Publication pub(io, cfg);
    if (pub.connect()) {
      shutdown();
      return 1;
    }
    auto deadline = std::chrono::steady_clock::now() +
                    std::chrono::milliseconds(wait_receiver_ms);
    while (!pub.has_receiver() && std::chrono::steady_clock::now() < deadline)
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
    if (!pub.has_receiver())
      Logger::instance().log(LogLevel::WARN,
                             "no receiver yet, publishing anyway");

    std::vector<uint8_t> payload(size);
    int sent = 0;
    long back_pressured = 0;
    int64_t result = 0;
    for (int n = 0; n < count && rc == 0; n++) {
      for (size_t k = 0; k < payload.size(); k++)
        payload[k] = (uint8_t)(n + k);
      for (;;) {
        result = pub.offer(payload);
        if (result >= 0) {
          sent++;
          break;
        }
        if (result == Publication::BACK_PRESSURED) {
          back_pressured++;
          std::this_thread::yield();
          continue;
        }
        Logger::instance().log(LogLevel::ERROR, "offer failed: %lld",
                               (long long)result);
        rc = 1;
        break;
      }
      if (interval_ms > 0)
        std::this_thread::sleep_for(std::chrono::milliseconds(interval_ms));
    }
    Logger::instance().log(LogLevel::INFO,
                           "published %d message(s) of %zu bytes, position "
                           "%lld, back pressured %ld time(s)",
                           sent, size, (long long)pub.position(),
                           back_pressured);
    pub.close();
  } catch (const std::invalid_argument &e) {
    std::cerr << "bad configuration: " << e.what() << std::endl;
    rc = 1;
  }
  shutdown();
  return rc;
}
