#include "errors.hpp"
#include "logging.hpp"
#include "reliable_receiver.hpp"
#include "reliable_sender.hpp"
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

static int run_sender(asio::io_context &io, const ReliableConfig &cfg,
                      int count, size_t size, int linger_ms) {
  ReliableSender sender(io, cfg);
  std::atomic<long> failed{0};
  sender.set_failure_handler([&](uint32_t seq, const std::vector<uint8_t> &,
                                 DeliveryFailureReason reason) {
    failed++;
    std::cerr << "seq " << seq << " failed: "
              << delivery_failure_reason_name(reason) << std::endl;
  });
  if (sender.connect())
    return 1;

  std::vector<uint8_t> payload(size);
  int sent = 0;
  for (int n = 0; n < count; n++) {
    for (size_t k = 0; k < payload.size(); k++)
      payload[k] = (uint8_t)(n ^ k);
    auto ec = sender.send(payload);
    if (ec == errc::window_full) {
      n--;
      continue;
    }
    if (ec) {
      std::cerr << "send failed: " << ec.message() << std::endl;
      break;
    }
    sent++;
  }

  // Give outstanding messages a chance to be acknowledged.
  auto deadline =
      std::chrono::steady_clock::now() + std::chrono::milliseconds(linger_ms);
  while (sender.pending_count() > 0 &&
         std::chrono::steady_clock::now() < deadline)
    std::this_thread::sleep_for(std::chrono::milliseconds(10));

  auto st = sender.statistics();
  std::cout << "sent " << sent << ", acked " << st.acked << ", retransmits "
            << st.retransmits << ", pending " << st.pending << std::endl;
  sender.close();
  return failed == 0 ? 0 : 2;
}

static int run_receiver(asio::io_context &io, const ReliableConfig &cfg,
                        long count) {
  std::atomic<bool> stop{false};
  asio::signal_set signals(io, SIGINT, SIGTERM);
  signals.async_wait([&](const std::error_code &ec, int) {
    if (!ec)
      stop = true;
  });

  ReliableReceiver receiver(io, cfg);
  std::atomic<long> delivered{0};
  receiver.set_message_handler([&](const std::vector<uint8_t> &payload,
                                   uint32_t seq, uint32_t session, uint32_t) {
    delivered++;
    Logger::instance().log(LogLevel::DEBUG, "seq=%u session=%u len=%zu", seq,
                           session, payload.size());
  });
  if (receiver.start())
    return 1;

  while (!stop && (count <= 0 || delivered < count))
    std::this_thread::sleep_for(std::chrono::milliseconds(10));

  auto st = receiver.statistics();
  std::cout << "delivered " << st.delivered << ", duplicates "
            << st.duplicates << ", buffered " << st.buffered
            << ", heartbeats " << st.heartbeats << std::endl;
  receiver.close();
  signals.cancel();
  return 0;
}

int main(int argc, char **argv) {
  if (argc < 2) {
    std::cerr << "usage: termlink_reliable sender|receiver [options]"
              << std::endl;
    return 1;
  }
  std::string mode = argv[1];
  std::string channel = "127.0.0.1:40001";
  ReliableConfig cfg;
  long count = 100;
  size_t size = 256;
  int linger_ms = 2000;
  int threads = 2;
  std::string log_level = "info";

  for (int i = 2; i < argc; i++) {
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
      cfg.stream_id = (uint32_t)std::stoul(next(i));
    else if (a == "--session")
      cfg.session_id = (uint32_t)std::stoul(next(i));
    else if (a == "--window")
      cfg.window = (size_t)std::stoul(next(i));
    else if (a == "--count")
      count = std::stol(next(i));
    else if (a == "--size")
      size = (size_t)std::stoul(next(i));
    else if (a == "--linger-ms")
      linger_ms = std::stoi(next(i));
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
  if (!parse_host_port(channel, cfg.host, cfg.port)) {
    std::cerr << "bad channel" << std::endl;
    return 1;
  }
  if (mode != "sender" && mode != "receiver") {
    std::cerr << "unknown mode " << mode << std::endl;
    return 1;
  }

  asio::io_context io;
  auto work = asio::make_work_guard(io);
  std::vector<std::thread> th;
  for (int i = 0; i < std::max(1, threads); i++)
    th.emplace_back([&]() { io.run(); });

  int rc = mode == "sender" ? run_sender(io, cfg, (int)count, size, linger_ms)
                            : run_receiver(io, cfg, count);

  work.reset();
  io.stop();
  for (auto &t : th)
    t.join();
  return rc;
}
