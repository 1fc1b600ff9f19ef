// Copyright (c) 2025 The Wirepack Authors
/**
 * @file packet_channel.cc
 * @brief Socket I/O with strict-mode and rate-limit admission.
 */
#include "wirepack/packet_channel.hpp"

#include <algorithm>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "internal/stats_tracker.hpp"
#include "wirepack/security_guard.hpp"

namespace wirepack {

// ---------------- Options ----------------

PacketChannel::Options::Builder::Builder() {
  max_datagram_size_ = Options::kDefaultMaxDatagramSize;
}

PacketChannel::Options::Builder& PacketChannel::Options::Builder::
    MaxDatagramSize(size_t v) {
  max_datagram_size_ =
      std::min(std::max<size_t>(v, 1), Options::kMaxDatagramSize);
  return *this;
}

PacketChannel::Options::Builder& PacketChannel::Options::Builder::
    BindAddress(const std::string& address) {
  bind_address_ = address;
  return *this;
}

PacketChannel::Options::Builder& PacketChannel::Options::Builder::LogSink(
    LogCallback cb) {
  log_sink_cb_ = std::move(cb);
  return *this;
}

PacketChannel::Options PacketChannel::Options::Builder::Build() const {
  return Options(max_datagram_size_, bind_address_, log_sink_cb_);
}

PacketChannel::Options::Options()
    : max_datagram_size_(kDefaultMaxDatagramSize) {}

PacketChannel::Options::Options(size_t max_datagram_size,
                                std::string bind_address, LogCallback log_cb)
    : max_datagram_size_(max_datagram_size),
      bind_address_(std::move(bind_address)),
      log_callback_(std::move(log_cb)) {}

size_t PacketChannel::Options::MaxDatagramSize() const {
  return max_datagram_size_;
}

const std::string& PacketChannel::Options::BindAddress() const {
  return bind_address_;
}

const PacketChannel::Options::LogCallback& PacketChannel::Options::LogSink()
    const {
  return log_callback_;
}

std::ostream& operator<<(std::ostream& os, const PacketChannel::Options& o) {
  os << "PacketChannel::Options{max_datagram_size=" << o.MaxDatagramSize()
     << ", bind_address="
     << (o.BindAddress().empty() ? "any" : o.BindAddress())
     << ", log_sink=" << (o.LogSink() ? "set" : "none") << "}";
  return os;
}

// ---------------- Impl ----------------

class PacketChannel::Impl {
 public:
  explicit Impl(std::unique_ptr<platform::ISocket> socket)
      : socket_(std::move(socket)) {}
  ~Impl() { Close(); }

  bool Open(platform::SocketType type, int protocol, uint16_t bind_port,
            const Options& options, Error* err) {
    options_ = options;
    type_ = type;
    if (!socket_) socket_ = platform::CreatePlatformSocket();
    if (!socket_->Initialize(type, protocol)) {
      return RecordFailure(
          Error::Io("Socket initialization", socket_->GetLastError()), err);
    }
    const bool bind = bind_port != 0 || !options.BindAddress().empty();
    if (bind && !socket_->Bind(options.BindAddress(), bind_port)) {
      Error e = Error::Io("Socket bind", socket_->GetLastError());
      socket_->Close();
      return RecordFailure(std::move(e), err);
    }
    Log([&](std::ostringstream& oss) {
      oss << "[wirepack] opened " << platform::ToString(type)
          << " socket protocol=" << protocol << " port=" << LocalPort()
          << " " << options_;
    });
    return true;
  }

  void Close() {
    if (socket_) socket_->Close();
  }

  bool IsOpen() const { return socket_ && socket_->IsValid(); }
  platform::SocketType Type() const { return type_; }
  uint16_t LocalPort() const { return IsOpen() ? socket_->LocalPort() : 0; }

  void SetRateLimiter(std::shared_ptr<RateLimiter> limiter) {
    std::lock_guard<std::mutex> lk(limiter_mtx_);
    limiter_ = std::move(limiter);
  }

  std::shared_ptr<RateLimiter> GetRateLimiter() const {
    std::lock_guard<std::mutex> lk(limiter_mtx_);
    return limiter_;
  }

  bool SendBytes(const platform::Endpoint& to,
                 const std::vector<uint8_t>& data, Error* err) {
    if (!Admit("send", err)) return false;
    if (!IsOpen()) {
      stats_.IncSendErrors();
      return RecordFailure(Error::Io("send", "socket not open"), err);
    }
    if (!socket_->Send(to, data)) {
      stats_.IncSendErrors();
      return RecordFailure(Error::Io("send", socket_->GetLastError()), err);
    }
    stats_.IncPacketsSent();
    return true;
  }

  bool ReceiveBytes(platform::Endpoint* from, std::vector<uint8_t>* data,
                    int64_t timeout_us, Error* err) {
    if (!Admit("receive", err)) return false;
    if (!IsOpen()) {
      stats_.IncRecvErrors();
      return RecordFailure(Error::Io("receive", "socket not open"), err);
    }
    if (!socket_->WaitReadable(timeout_us)) {
      stats_.IncRecvErrors();
      return RecordFailure(Error::Timeout("receive"), err);
    }
    platform::Endpoint sender;
    std::vector<uint8_t> buf;
    if (!socket_->Receive(&sender, &buf, options_.MaxDatagramSize())) {
      stats_.IncRecvErrors();
      return RecordFailure(Error::Io("receive", socket_->GetLastError()), err);
    }
    stats_.IncPacketsReceived();
    *from = sender;
    *data = std::move(buf);
    return true;
  }

  void NoteDecodeFailure(const Error& e) {
    stats_.IncDecodeErrors();
    std::ostringstream oss;
    oss << "Decode rejected: " << e;
    stats_.SetLastError(oss.str());
    if (options_.LogSink()) options_.LogSink()(oss.str());
  }

  ChannelStats GetStats() const { return stats_.Snapshot(); }

 private:
  /** Strict-mode and rate-limit admission for one operation. */
  bool Admit(const std::string& operation, Error* err) {
    std::shared_ptr<RateLimiter> limiter = GetRateLimiter();
    if (!limiter) {
      if (SecurityGuard::Instance().IsStrictMode()) {
        return RecordFailure(
            Error::SecurityConfig("Strict mode requires a rate limiter for " +
                                  operation),
            err);
      }
      return true;
    }
    Error e;
    if (!limiter->CheckLimit(operation, &e)) {
      stats_.IncRateLimited();
      return RecordFailure(std::move(e), err);
    }
    return true;
  }

  bool RecordFailure(Error e, Error* err) {
    std::ostringstream oss;
    oss << e;
    const std::string text = oss.str();
    if (options_.LogSink()) options_.LogSink()(text);
    stats_.SetLastError(text);
    return Fail(err, std::move(e));
  }

  template <typename F>
  void Log(F&& fill) {
    if (!options_.LogSink()) return;
    std::ostringstream oss;
    fill(oss);
    options_.LogSink()(oss.str());
  }

  std::unique_ptr<platform::ISocket> socket_;
  platform::SocketType type_{platform::SocketType::kDatagram};
  Options options_;
  mutable std::mutex limiter_mtx_;
  std::shared_ptr<RateLimiter> limiter_;
  internal::StatsTracker stats_;
};

// ---------------- PacketChannel ----------------

PacketChannel::PacketChannel() : impl_(std::make_unique<Impl>(nullptr)) {}

PacketChannel::PacketChannel(std::unique_ptr<platform::ISocket> socket)
    : impl_(std::make_unique<Impl>(std::move(socket))) {}

PacketChannel::~PacketChannel() = default;

bool PacketChannel::Open(platform::SocketType type, int protocol,
                         uint16_t bind_port, const Options& options,
                         Error* err) {
  return impl_->Open(type, protocol, bind_port, options, err);
}

void PacketChannel::Close() { impl_->Close(); }
bool PacketChannel::IsOpen() const { return impl_->IsOpen(); }
platform::SocketType PacketChannel::Type() const { return impl_->Type(); }
uint16_t PacketChannel::LocalPort() const { return impl_->LocalPort(); }

void PacketChannel::SetRateLimiter(std::shared_ptr<RateLimiter> limiter) {
  impl_->SetRateLimiter(std::move(limiter));
}

std::shared_ptr<RateLimiter> PacketChannel::GetRateLimiter() const {
  return impl_->GetRateLimiter();
}

bool PacketChannel::SendBytes(const platform::Endpoint& to,
                              const std::vector<uint8_t>& data, Error* err) {
  return impl_->SendBytes(to, data, err);
}

bool PacketChannel::ReceiveBytes(platform::Endpoint* from,
                                 std::vector<uint8_t>* data,
                                 int64_t timeout_us, Error* err) {
  return impl_->ReceiveBytes(from, data, timeout_us, err);
}

void PacketChannel::NoteDecodeFailure(const Error& e) {
  impl_->NoteDecodeFailure(e);
}

ChannelStats PacketChannel::GetStats() const { return impl_->GetStats(); }

}  // namespace wirepack
