// Copyright (c) 2025 The Wirepack Authors
/**
 * @file packet_channel.hpp
 * @brief Rate-limited datagram channel speaking wire structures.
 */
#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

#include "wirepack/codec.hpp"
#include "wirepack/error.hpp"
#include "wirepack/export.hpp"
#include "wirepack/platform/socket_interface.hpp"
#include "wirepack/rate_limiter.hpp"

namespace wirepack {

struct ChannelStats {
  uint64_t packets_sent = 0;      ///< Datagrams sent successfully
  uint64_t packets_received = 0;  ///< Datagrams received
  uint64_t send_errors = 0;       ///< sendto() failures or partial sends
  uint64_t recv_errors = 0;       ///< Receive failures, truncation, timeouts
  uint64_t rate_limited = 0;      ///< Operations refused by the limiter
  uint64_t decode_errors = 0;     ///< Received datagrams that failed decode
  std::string last_error;         ///< Latest error message
};

/**
 * @brief Datagram socket plus codec plus admission control.
 *
 * Every send and receive is admitted first: with SecurityGuard strict mode
 * on, a channel without a rate limiter refuses I/O (kSecurityConfig);
 * otherwise an attached limiter must grant a token (kRateLimitExceeded).
 *
 * Not thread-safe for concurrent I/O on the same channel; the attached
 * RateLimiter may be shared between channels.
 */
class WIREPACK_API PacketChannel {
 public:
  /** Immutable configuration options for PacketChannel. */
  class WIREPACK_API Options {
   public:
    using LogCallback = std::function<void(const std::string&)>;

    class WIREPACK_API Builder {
     public:
      Builder();
      /** Receive buffer size; clamped to [1, kMaxDatagramSize]. */
      Builder& MaxDatagramSize(size_t v);
      /** Local address to bind; when set, Open binds even to port 0. */
      Builder& BindAddress(const std::string& address);
      Builder& LogSink(LogCallback cb);
      Options Build() const;

     private:
      size_t max_datagram_size_;
      std::string bind_address_;
      LogCallback log_sink_cb_;
    };

    Options();

    size_t MaxDatagramSize() const;
    const std::string& BindAddress() const;
    const LogCallback& LogSink() const;

    static constexpr size_t kDefaultMaxDatagramSize = 65535;
    static constexpr size_t kMaxDatagramSize = 65535;

   private:
    Options(size_t max_datagram_size, std::string bind_address,
            LogCallback log_cb);

    size_t max_datagram_size_;
    std::string bind_address_;
    LogCallback log_callback_;
  };

  /** Uses the platform socket. */
  PacketChannel();
  /** Uses the given socket (tests inject fakes here). */
  explicit PacketChannel(std::unique_ptr<platform::ISocket> socket);
  ~PacketChannel();

  PacketChannel(const PacketChannel&) = delete;
  PacketChannel& operator=(const PacketChannel&) = delete;

  /**
   * @brief Creates the socket and optionally binds it.
   * @param type Datagram (UDP) or raw IPv4.
   * @param protocol IP protocol number for raw sockets, 0 for UDP.
   * @param bind_port Port to bind; 0 skips binding unless the options name
   *        a bind address, in which case the kernel picks the port.
   * @return false with kIo when the socket cannot be created or bound.
   */
  bool Open(platform::SocketType type, int protocol, uint16_t bind_port = 0,
            const Options& options = Options(), Error* err = nullptr);

  /** Closes the socket. Safe to call multiple times. */
  void Close();
  bool IsOpen() const;
  platform::SocketType Type() const;
  /** Bound local port; 0 when unbound. */
  uint16_t LocalPort() const;

  void SetRateLimiter(std::shared_ptr<RateLimiter> limiter);
  std::shared_ptr<RateLimiter> GetRateLimiter() const;

  bool SendBytes(const platform::Endpoint& to,
                 const std::vector<uint8_t>& data, Error* err = nullptr);

  /**
   * @brief Receives one datagram.
   * @return false with kTimeout when nothing arrives within timeout_us.
   */
  bool ReceiveBytes(platform::Endpoint* from, std::vector<uint8_t>* data,
                    int64_t timeout_us, Error* err = nullptr);

  /** Encodes packet and sends it. */
  template <typename T>
  bool SendPacket(const platform::Endpoint& to, const T& packet,
                  Error* err = nullptr) {
    std::vector<uint8_t> bytes;
    if (!Encode(packet, &bytes, err)) return false;
    return SendBytes(to, bytes, err);
  }

  /**
   * @brief Receives one datagram and decodes it as T.
   * @param raw Receives the undecoded bytes when non-null.
   */
  template <typename T>
  bool ReceivePacket(platform::Endpoint* from, T* packet, int64_t timeout_us,
                     Error* err = nullptr,
                     std::vector<uint8_t>* raw = nullptr) {
    std::vector<uint8_t> bytes;
    if (!ReceiveBytes(from, &bytes, timeout_us, err)) return false;
    Error decode_err;
    if (!Decode(bytes, packet, &decode_err)) {
      NoteDecodeFailure(decode_err);
      return Fail(err, std::move(decode_err));
    }
    if (raw) *raw = std::move(bytes);
    return true;
  }

  ChannelStats GetStats() const;

 private:
  void NoteDecodeFailure(const Error& e);

  class Impl;
  std::unique_ptr<Impl> impl_;
};

WIREPACK_API std::ostream& operator<<(std::ostream& os,
                                      const PacketChannel::Options& o);

}  // namespace wirepack
