// Copyright (c) 2025 The Wirepack Authors
/**
 * @file pinger.hpp
 * @brief ICMP echo client built on wirepack::PacketChannel.
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

#include "wirepack/error.hpp"
#include "wirepack/packet_channel.hpp"
#include "wirepack/rate_limiter.hpp"
#include "wirepack/time_source.hpp"

namespace wireping {

/**
 * Immutable configuration options for Pinger.
 */
class Options {
 public:
  using LogCallback = std::function<void(const std::string&)>;

  class Builder {
   public:
    Builder();
    /** Echo requests per Run(); clamped to [1, kMaxCount]. */
    Builder& Count(int v);
    Builder& Interval(std::chrono::milliseconds v);
    /** Per-request reply timeout; clamped to at least 1 ms. */
    Builder& Timeout(std::chrono::milliseconds v);
    /** Echo data bytes; clamped to [0, kMaxPayloadSize]. */
    Builder& PayloadSize(size_t v);
    Builder& Identifier(uint16_t v);
    Builder& LogSink(LogCallback cb);
    Options Build() const;

   private:
    int count_;
    std::chrono::milliseconds interval_;
    std::chrono::milliseconds timeout_;
    size_t payload_size_;
    uint16_t identifier_;
    LogCallback log_sink_cb_;
  };

  Options();

  int Count() const;
  std::chrono::milliseconds Interval() const;
  std::chrono::milliseconds Timeout() const;
  size_t PayloadSize() const;
  uint16_t Identifier() const;
  const LogCallback& LogSink() const;

  static constexpr int kDefaultCount = 4;
  static constexpr int kMaxCount = 1000;
  static constexpr std::chrono::milliseconds kDefaultInterval =
      std::chrono::milliseconds(1000);
  static constexpr std::chrono::milliseconds kDefaultTimeout =
      std::chrono::milliseconds(1000);
  static constexpr size_t kDefaultPayloadSize = 32;
  static constexpr size_t kMaxPayloadSize = 1472;
  static constexpr uint16_t kDefaultIdentifier = 0x5750;  // "WP"

 private:
  Options(int count, std::chrono::milliseconds interval,
          std::chrono::milliseconds timeout, size_t payload_size,
          uint16_t identifier, LogCallback log_cb);

  int count_;
  std::chrono::milliseconds interval_;
  std::chrono::milliseconds timeout_;
  size_t payload_size_;
  uint16_t identifier_;
  LogCallback log_callback_;
};

std::ostream& operator<<(std::ostream& os, const Options& o);

/** Outcome of one echo request. */
struct Reply {
  uint16_t sequence = 0;
  bool received = false;
  std::string from;     ///< Replying address
  uint8_t ttl = 0;      ///< TTL of the reply datagram
  size_t bytes = 0;     ///< ICMP message size
  double rtt_ms = 0.0;  ///< Round-trip time
};

struct Summary {
  int transmitted = 0;
  int received = 0;
  double min_ms = 0.0;
  double avg_ms = 0.0;
  double max_ms = 0.0;

  double LossPercent() const;
};

std::ostream& operator<<(std::ostream& os, const Reply& r);
std::ostream& operator<<(std::ostream& os, const Summary& s);

/**
 * ICMP echo client.
 *
 * Sends echo requests over a raw ICMP PacketChannel and matches replies by
 * identifier and sequence. Replies with a bad checksum or for other
 * requests are skipped until the timeout expires.
 */
class Pinger {
 public:
  /** Uses a platform raw socket and the default monotonic clock. */
  Pinger();

  /**
   * @brief Uses the given channel (not yet opened) and clock.
   * @param time_source Clock for round-trip times; not owned.
   */
  explicit Pinger(std::unique_ptr<wirepack::PacketChannel> channel,
                  wirepack::TimeSource* time_source = nullptr);
  ~Pinger();

  Pinger(const Pinger&) = delete;
  Pinger& operator=(const Pinger&) = delete;

  /**
   * @brief Opens the raw ICMP channel.
   * @return false with kIo when the socket cannot be created (needs
   *         privileges).
   */
  bool Open(const Options& options = Options(),
            wirepack::Error* err = nullptr);

  void SetRateLimiter(std::shared_ptr<wirepack::RateLimiter> limiter);

  /**
   * @brief Sends one echo request and waits for its reply.
   * @param host Dotted-quad IPv4 address.
   * @return false with kTimeout when no matching reply arrives in time.
   */
  bool PingOnce(const std::string& host, uint16_t sequence, Reply* out,
                wirepack::Error* err = nullptr);

  /**
   * @brief Sends Options::Count() requests, one per interval.
   *
   * Timeouts are recorded as lost replies; any other error stops the run.
   */
  bool Run(const std::string& host, std::vector<Reply>* replies,
           Summary* summary, wirepack::Error* err = nullptr);

  wirepack::ChannelStats GetStats() const;

 private:
  class Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace wireping
