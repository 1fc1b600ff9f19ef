// Copyright (c) 2025 The Wirepack Authors
/**
 * @file packet_capture.cc
 * @brief Receive loop, IPv4 decoding and filtering for PacketCapture.
 */
#include "wirepack/packet_capture.hpp"

#include <algorithm>
#include <atomic>
#include <cstdio>
#include <memory>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "wirepack/platform/default_time_source.hpp"

namespace wirepack {

// ---------------- CapturedPacket ----------------

std::vector<uint8_t> CapturedPacket::TransportBytes() const {
  const size_t header = static_cast<size_t>(ip.ihl) * 4;
  const size_t skip =
      header > Ipv4Packet::kHeaderSize ? header - Ipv4Packet::kHeaderSize : 0;
  if (skip >= ip.payload.size()) return {};
  return std::vector<uint8_t>(ip.payload.begin() + skip, ip.payload.end());
}

std::string CapturedPacket::Summary() const {
  char stamp[32];
  std::snprintf(stamp, sizeof(stamp), "%.6f", timestamp);
  std::ostringstream oss;
  oss << '[' << stamp << "] " << FormatIpv4Address(ip.source) << " -> "
      << FormatIpv4Address(ip.destination) << ' ' << ProtocolName(ip.protocol)
      << " (" << raw.size() << " bytes)";
  return oss.str();
}

// ---------------- Options ----------------

PacketCapture::Options::Builder::Builder() {
  protocol_ = Options::kDefaultProtocol;
  max_datagram_size_ = Options::kMaxDatagramSize;
}

PacketCapture::Options::Builder& PacketCapture::Options::Builder::Protocol(
    uint8_t v) {
  protocol_ = v;
  return *this;
}

PacketCapture::Options::Builder& PacketCapture::Options::Builder::
    MaxDatagramSize(size_t v) {
  max_datagram_size_ =
      std::min(std::max<size_t>(v, 1), Options::kMaxDatagramSize);
  return *this;
}

PacketCapture::Options::Builder& PacketCapture::Options::Builder::LogSink(
    LogCallback cb) {
  log_sink_cb_ = std::move(cb);
  return *this;
}

PacketCapture::Options PacketCapture::Options::Builder::Build() const {
  return Options(protocol_, max_datagram_size_, log_sink_cb_);
}

PacketCapture::Options::Options()
    : protocol_(kDefaultProtocol), max_datagram_size_(kMaxDatagramSize) {}

PacketCapture::Options::Options(uint8_t protocol, size_t max_datagram_size,
                                LogCallback log_cb)
    : protocol_(protocol),
      max_datagram_size_(max_datagram_size),
      log_callback_(std::move(log_cb)) {}

uint8_t PacketCapture::Options::Protocol() const { return protocol_; }

size_t PacketCapture::Options::MaxDatagramSize() const {
  return max_datagram_size_;
}

const PacketCapture::Options::LogCallback& PacketCapture::Options::LogSink()
    const {
  return log_callback_;
}

PacketCapture::Options PacketCapture::Options::Icmp() {
  return Builder().Protocol(kProtocolIcmp).Build();
}

PacketCapture::Options PacketCapture::Options::Tcp() {
  return Builder().Protocol(kProtocolTcp).Build();
}

PacketCapture::Options PacketCapture::Options::Udp() {
  return Builder().Protocol(kProtocolUdp).Build();
}

std::ostream& operator<<(std::ostream& os, const PacketCapture::Options& o) {
  os << "PacketCapture::Options{protocol=" << ProtocolName(o.Protocol())
     << ", max_datagram_size=" << o.MaxDatagramSize()
     << ", log_sink=" << (o.LogSink() ? "set" : "none") << "}";
  return os;
}

std::ostream& operator<<(std::ostream& os, const CaptureStats& s) {
  os << "captured=" << s.captured << " dropped=" << s.dropped
     << " malformed=" << s.malformed;
  return os;
}

// ---------------- Impl ----------------

class PacketCapture::Impl {
 public:
  Impl(std::unique_ptr<PacketChannel> channel, TimeSource* ts)
      : channel_(std::move(channel)),
        time_source_(ts ? ts : &platform::GetDefaultTimeSource()) {
    if (!channel_) channel_ = std::make_unique<PacketChannel>();
  }

  ~Impl() { Stop(); }

  bool Start(const Options& options, Error* err) {
    if (capturing_) {
      return Fail(err,
                  Error::InvalidArgument("Packet capture is already running"));
    }
    if (options.Protocol() == 0) {
      return Fail(err, Error::InvalidArgument(
                           "Packet capture needs an IP protocol number"));
    }
    options_ = options;
    auto channel_opts = PacketChannel::Options::Builder()
                            .MaxDatagramSize(options.MaxDatagramSize())
                            .LogSink(options.LogSink())
                            .Build();
    if (!channel_->Open(platform::SocketType::kRaw, options.Protocol(), 0,
                        channel_opts, err)) {
      return false;
    }
    captured_.store(0, std::memory_order_relaxed);
    dropped_.store(0, std::memory_order_relaxed);
    malformed_.store(0, std::memory_order_relaxed);
    capturing_ = true;
    std::ostringstream oss;
    oss << "[wirepack] capture started " << options_;
    Log(oss.str());
    return true;
  }

  void Stop() {
    if (!capturing_) return;
    channel_->Close();
    capturing_ = false;
    std::ostringstream oss;
    oss << "[wirepack] capture stopped " << GetStats();
    Log(oss.str());
  }

  bool IsCapturing() const { return capturing_; }

  void OnPacket(PacketHandler handler) {
    handlers_.push_back(std::move(handler));
  }

  void AddFilter(std::vector<uint8_t> pattern) {
    filters_.push_back(std::move(pattern));
  }

  void ClearFilters() { filters_.clear(); }

  void SetRateLimiter(std::shared_ptr<RateLimiter> limiter) {
    channel_->SetRateLimiter(std::move(limiter));
  }

  bool Capture(size_t count, double timeout_s,
               std::vector<CapturedPacket>* out, Error* err) {
    if (!CheckStarted(err)) return false;
    if (count == 0 && timeout_s <= 0) {
      return Fail(err, Error::InvalidArgument(
                           "Capture needs a packet count or a timeout"));
    }
    const bool bounded = timeout_s > 0;
    const double deadline = time_source_->NowSeconds() + timeout_s;
    std::vector<CapturedPacket> packets;
    while (count == 0 || packets.size() < count) {
      CapturedPacket packet;
      bool expired = false;
      if (!NextPacket(bounded, deadline, &packet, &expired, err)) {
        return false;
      }
      if (expired) break;
      for (const PacketHandler& h : handlers_) h(packet);
      packets.push_back(std::move(packet));
    }
    *out = std::move(packets);
    return true;
  }

  bool CaptureStream(const StreamCallback& callback, double timeout_s,
                     size_t* delivered, Error* err) {
    if (!CheckStarted(err)) return false;
    if (!callback) {
      return Fail(err,
                  Error::InvalidArgument("CaptureStream needs a callback"));
    }
    const bool bounded = timeout_s > 0;
    const double deadline = time_source_->NowSeconds() + timeout_s;
    size_t n = 0;
    while (true) {
      CapturedPacket packet;
      bool expired = false;
      if (!NextPacket(bounded, deadline, &packet, &expired, err)) {
        return false;
      }
      if (expired) break;
      ++n;
      if (!callback(packet)) break;
    }
    *delivered = n;
    return true;
  }

  CaptureStats GetStats() const {
    CaptureStats s;
    s.captured = captured_.load(std::memory_order_relaxed);
    s.dropped = dropped_.load(std::memory_order_relaxed);
    s.malformed = malformed_.load(std::memory_order_relaxed);
    return s;
  }

  ChannelStats GetChannelStats() const { return channel_->GetStats(); }

 private:
  /** Idle wait per receive when no deadline is set. */
  static constexpr int64_t kIdleWaitUs = 1000000;

  bool CheckStarted(Error* err) const {
    if (capturing_) return true;
    return Fail(err, Error::InvalidArgument("Packet capture is not started"));
  }

  /**
   * Receives until a datagram passes the filters. Sets *expired instead
   * when the deadline passes first.
   */
  bool NextPacket(bool bounded, double deadline, CapturedPacket* packet,
                  bool* expired, Error* err) {
    while (true) {
      int64_t wait_us = kIdleWaitUs;
      if (bounded) {
        const double remaining = deadline - time_source_->NowSeconds();
        if (remaining <= 0) {
          *expired = true;
          return true;
        }
        wait_us = std::max<int64_t>(1, static_cast<int64_t>(remaining * 1e6));
      }

      platform::Endpoint from;
      std::vector<uint8_t> bytes;
      Error recv_err;
      if (!channel_->ReceiveBytes(&from, &bytes, wait_us, &recv_err)) {
        if (recv_err.code != ErrorCode::kTimeout) {
          return Fail(err, std::move(recv_err));
        }
        // The wait covered the remaining time.
        if (bounded) {
          *expired = true;
          return true;
        }
        continue;
      }

      CapturedPacket p;
      p.timestamp = time_source_->NowSeconds();
      p.source = from;
      Error decode_err;
      if (!Decode(bytes, &p.ip, &decode_err)) {
        malformed_.fetch_add(1, std::memory_order_relaxed);
        std::ostringstream oss;
        oss << "[wirepack] capture skipped malformed datagram from "
            << from.address << ": " << decode_err;
        Log(oss.str());
        continue;
      }
      if (p.ip.protocol != options_.Protocol() || !MatchesFilters(bytes)) {
        dropped_.fetch_add(1, std::memory_order_relaxed);
        continue;
      }
      p.raw = std::move(bytes);
      captured_.fetch_add(1, std::memory_order_relaxed);
      *packet = std::move(p);
      return true;
    }
  }

  bool MatchesFilters(const std::vector<uint8_t>& data) const {
    for (const std::vector<uint8_t>& pattern : filters_) {
      if (pattern.empty()) continue;
      if (std::search(data.begin(), data.end(), pattern.begin(),
                      pattern.end()) == data.end()) {
        return false;
      }
    }
    return true;
  }

  void Log(const std::string& msg) {
    if (options_.LogSink()) options_.LogSink()(msg);
  }

  std::unique_ptr<PacketChannel> channel_;
  TimeSource* time_source_;
  Options options_;
  bool capturing_ = false;
  std::vector<PacketHandler> handlers_;
  std::vector<std::vector<uint8_t>> filters_;
  std::atomic<uint64_t> captured_{0};
  std::atomic<uint64_t> dropped_{0};
  std::atomic<uint64_t> malformed_{0};
};

// ---------------- PacketCapture ----------------

PacketCapture::PacketCapture()
    : impl_(std::make_unique<Impl>(nullptr, nullptr)) {}

PacketCapture::PacketCapture(std::unique_ptr<PacketChannel> channel,
                             TimeSource* time_source)
    : impl_(std::make_unique<Impl>(std::move(channel), time_source)) {}

PacketCapture::~PacketCapture() = default;

bool PacketCapture::Start(const Options& options, Error* err) {
  return impl_->Start(options, err);
}

void PacketCapture::Stop() { impl_->Stop(); }
bool PacketCapture::IsCapturing() const { return impl_->IsCapturing(); }

PacketCapture& PacketCapture::OnPacket(PacketHandler handler) {
  impl_->OnPacket(std::move(handler));
  return *this;
}

PacketCapture& PacketCapture::AddFilter(std::vector<uint8_t> pattern) {
  impl_->AddFilter(std::move(pattern));
  return *this;
}

PacketCapture& PacketCapture::AddFilter(const std::string& pattern) {
  impl_->AddFilter(std::vector<uint8_t>(pattern.begin(), pattern.end()));
  return *this;
}

PacketCapture& PacketCapture::ClearFilters() {
  impl_->ClearFilters();
  return *this;
}

void PacketCapture::SetRateLimiter(std::shared_ptr<RateLimiter> limiter) {
  impl_->SetRateLimiter(std::move(limiter));
}

bool PacketCapture::Capture(size_t count, double timeout_s,
                            std::vector<CapturedPacket>* out, Error* err) {
  return impl_->Capture(count, timeout_s, out, err);
}

bool PacketCapture::CaptureStream(const StreamCallback& callback,
                                  double timeout_s, size_t* delivered,
                                  Error* err) {
  return impl_->CaptureStream(callback, timeout_s, delivered, err);
}

CaptureStats PacketCapture::GetStats() const { return impl_->GetStats(); }

ChannelStats PacketCapture::GetChannelStats() const {
  return impl_->GetChannelStats();
}

}  // namespace wirepack
