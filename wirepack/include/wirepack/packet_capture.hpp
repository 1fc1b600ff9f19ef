// Copyright (c) 2025 The Wirepack Authors
/**
 * @file packet_capture.hpp
 * @brief Protocol-filtered IPv4 capture over a raw PacketChannel.
 */
#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

#include "wirepack/codec.hpp"
#include "wirepack/error.hpp"
#include "wirepack/export.hpp"
#include "wirepack/packet_channel.hpp"
#include "wirepack/platform/socket_interface.hpp"
#include "wirepack/protocols/ipv4.hpp"
#include "wirepack/time_source.hpp"

namespace wirepack {

/** One datagram accepted by PacketCapture. */
struct WIREPACK_API CapturedPacket {
  double timestamp = 0.0;       ///< TimeSource seconds at receipt
  platform::Endpoint source;    ///< Sender reported by the socket
  std::vector<uint8_t> raw;     ///< Datagram as received, IPv4 header first
  Ipv4Packet ip;                ///< Decoded header; options lead ip.payload

  size_t Length() const { return raw.size(); }

  /** Bytes after the IPv4 header and its options. */
  std::vector<uint8_t> TransportBytes() const;

  /** Decodes the transport bytes as T (IcmpPacket, TcpSegment, ...). */
  template <typename T>
  bool ParseTransport(T* out, Error* err = nullptr) const {
    return Decode(TransportBytes(), out, err);
  }

  /** "[12.345678] 10.0.0.2 -> 10.0.0.1 ICMP (28 bytes)" */
  std::string Summary() const;
};

struct CaptureStats {
  uint64_t captured = 0;   ///< Datagrams delivered
  uint64_t dropped = 0;    ///< Rejected by the protocol or pattern filters
  uint64_t malformed = 0;  ///< Not decodable as IPv4
};

/**
 * @brief Receives IPv4 datagrams of one protocol from a raw socket.
 *
 * Each received datagram is decoded as Ipv4Packet, then checked against
 * the configured protocol number and every byte pattern added with
 * AddFilter(); all patterns must occur in the raw datagram. Datagrams that
 * fail a filter count as dropped, undecodable ones as malformed; both are
 * skipped. Socket, admission and rate-limit failures end the capture.
 *
 * Not thread-safe; GetStats() may be called from any thread.
 */
class WIREPACK_API PacketCapture {
 public:
  using PacketHandler = std::function<void(const CapturedPacket&)>;
  /** Return false to stop CaptureStream(). */
  using StreamCallback = std::function<bool(const CapturedPacket&)>;

  /** Immutable configuration options for PacketCapture. */
  class WIREPACK_API Options {
   public:
    using LogCallback = std::function<void(const std::string&)>;

    class WIREPACK_API Builder {
     public:
      Builder();
      /** IP protocol number to capture; 0 is rejected by Start(). */
      Builder& Protocol(uint8_t v);
      /** Receive buffer size; clamped to [1, kMaxDatagramSize]. */
      Builder& MaxDatagramSize(size_t v);
      Builder& LogSink(LogCallback cb);
      Options Build() const;

     private:
      uint8_t protocol_;
      size_t max_datagram_size_;
      LogCallback log_sink_cb_;
    };

    Options();

    uint8_t Protocol() const;
    size_t MaxDatagramSize() const;
    const LogCallback& LogSink() const;

    static Options Icmp();
    static Options Tcp();
    static Options Udp();

    static constexpr uint8_t kDefaultProtocol = kProtocolIcmp;
    static constexpr size_t kMaxDatagramSize =
        PacketChannel::Options::kMaxDatagramSize;

   private:
    Options(uint8_t protocol, size_t max_datagram_size, LogCallback log_cb);

    uint8_t protocol_;
    size_t max_datagram_size_;
    LogCallback log_callback_;
  };

  /** Uses a platform raw socket and the default monotonic clock. */
  PacketCapture();

  /**
   * @brief Uses the given channel (not yet opened) and clock.
   * @param time_source Clock for timestamps and deadlines; not owned.
   */
  explicit PacketCapture(std::unique_ptr<PacketChannel> channel,
                         TimeSource* time_source = nullptr);
  ~PacketCapture();

  PacketCapture(const PacketCapture&) = delete;
  PacketCapture& operator=(const PacketCapture&) = delete;

  /**
   * @brief Opens the raw channel for the configured protocol and resets
   *        the statistics.
   * @return false with kInvalidArgument when already capturing or the
   *         protocol is 0, kIo when the socket cannot be created.
   */
  bool Start(const Options& options = Options(), Error* err = nullptr);

  /** Closes the channel. Safe to call multiple times. */
  void Stop();
  bool IsCapturing() const;

  /** Handlers run in order for every packet Capture() accepts. */
  PacketCapture& OnPacket(PacketHandler handler);
  PacketCapture& AddFilter(std::vector<uint8_t> pattern);
  PacketCapture& AddFilter(const std::string& pattern);
  PacketCapture& ClearFilters();

  void SetRateLimiter(std::shared_ptr<RateLimiter> limiter);

  /**
   * @brief Collects up to `count` packets or until `timeout_s` elapses.
   * @param count Packets to collect; 0 means until the timeout.
   * @param timeout_s Seconds to wait in total; 0 means until `count`.
   * @return false with kInvalidArgument when both are 0 or capture is not
   *         started, or the channel error that ended the capture.
   */
  bool Capture(size_t count, double timeout_s,
               std::vector<CapturedPacket>* out, Error* err = nullptr);

  /**
   * @brief Passes accepted packets to `callback` until it returns false or
   *        `timeout_s` elapses (0 = no deadline).
   * @param delivered Receives the number of packets passed to callback.
   */
  bool CaptureStream(const StreamCallback& callback, double timeout_s,
                     size_t* delivered, Error* err = nullptr);

  CaptureStats GetStats() const;
  ChannelStats GetChannelStats() const;

 private:
  class Impl;
  std::unique_ptr<Impl> impl_;
};

WIREPACK_API std::ostream& operator<<(std::ostream& os,
                                      const PacketCapture::Options& o);
WIREPACK_API std::ostream& operator<<(std::ostream& os,
                                      const CaptureStats& s);

}  // namespace wirepack
