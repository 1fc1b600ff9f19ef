// Copyright (c) 2025 The Wirepack Authors
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "wirepack/rate_limiter.hpp"
#include "wirepack/security_guard.hpp"
#include "wireping/pinger.hpp"

namespace {
/**
 * @brief Thread-safe logger for debug messages.
 */
class Logger {
 public:
  explicit Logger(bool enabled) : enabled_(enabled) {}

  void Log(const std::string& msg) {
    if (!enabled_) return;
    std::lock_guard<std::mutex> lock(mutex_);
    std::fprintf(stderr, "%s\n", msg.c_str());
  }

 private:
  bool enabled_;
  std::mutex mutex_;
};

void PrintUsage() {
  std::fprintf(stderr,
               "Usage: wireping_example [-c COUNT] [-i INTERVAL_MS] "
               "[-W TIMEOUT_MS] [-s SIZE] [--strict] [--debug] HOST\n"
               "       Requires privileges for raw ICMP sockets.\n");
}
}  // namespace

int main(int argc, char** argv) {
  int count = wireping::Options::kDefaultCount;
  int interval_ms = 1000;
  int timeout_ms = 1000;
  size_t size = wireping::Options::kDefaultPayloadSize;
  bool debug = false;
  bool strict = false;
  std::string host;

  for (int i = 1; i < argc; ++i) {
    std::string a(argv[i]);
    auto need = [&](int n) { return i + n < argc; };
    if (a == "-c" && need(1)) {
      count = std::atoi(argv[++i]);
    } else if (a == "-i" && need(1)) {
      interval_ms = std::atoi(argv[++i]);
    } else if (a == "-W" && need(1)) {
      timeout_ms = std::atoi(argv[++i]);
    } else if (a == "-s" && need(1)) {
      size = static_cast<size_t>(std::atoi(argv[++i]));
    } else if (a == "--strict") {
      strict = true;
    } else if (a == "--debug") {
      debug = true;
    } else if (a == "-h" || a == "--help") {
      PrintUsage();
      return 0;
    } else if (host.empty() && a[0] != '-') {
      host = a;
    } else {
      std::fprintf(stderr, "Unknown option: %s\n", a.c_str());
      PrintUsage();
      return 2;
    }
  }
  if (host.empty()) {
    PrintUsage();
    return 2;
  }

  Logger logger(debug);
  auto log_callback = [&logger](const std::string& msg) { logger.Log(msg); };

  if (strict) wirepack::SecurityGuard::Instance().EnableStrictMode();

  auto opts = wireping::Options::Builder()
                  .Count(count)
                  .Interval(std::chrono::milliseconds(interval_ms))
                  .Timeout(std::chrono::milliseconds(timeout_ms))
                  .PayloadSize(size)
                  .LogSink(log_callback)
                  .Build();

  wireping::Pinger pinger;
  wirepack::Error err;
  if (!pinger.Open(opts, &err)) {
    std::cerr << "failed to open ICMP socket: " << err << std::endl;
    return 1;
  }
  pinger.SetRateLimiter(
      std::shared_ptr<wirepack::RateLimiter>(wirepack::RateLimiter::Default()));

  std::printf("PING %s: %zu data bytes\n", host.c_str(), opts.PayloadSize());
  std::vector<wireping::Reply> replies;
  wireping::Summary summary;
  if (!pinger.Run(host, &replies, &summary, &err)) {
    std::cerr << "ping failed: " << err << std::endl;
    return 1;
  }
  for (const auto& r : replies) std::cout << r << std::endl;
  std::cout << "--- " << host << " ping statistics ---\n"
            << summary << std::endl;
  return summary.received > 0 ? 0 : 1;
}
