// Copyright (c) 2025 The Wirepack Authors
/**
 * @file pinger.cc
 * @brief ICMP echo request/reply exchange over a raw PacketChannel.
 */
#include "wireping/pinger.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <iomanip>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "wirepack/checksum.hpp"
#include "wirepack/codec.hpp"
#include "wirepack/platform/default_time_source.hpp"
#include "wirepack/protocols/icmp.hpp"
#include "wirepack/protocols/ipv4.hpp"

namespace wireping {

// ---------------- Options ----------------

Options::Builder::Builder() {
  count_ = Options::kDefaultCount;
  interval_ = Options::kDefaultInterval;
  timeout_ = Options::kDefaultTimeout;
  payload_size_ = Options::kDefaultPayloadSize;
  identifier_ = Options::kDefaultIdentifier;
}

Options::Builder& Options::Builder::Count(int v) {
  count_ = std::min(std::max(v, 1), Options::kMaxCount);
  return *this;
}

Options::Builder& Options::Builder::Interval(std::chrono::milliseconds v) {
  interval_ = std::max(v, std::chrono::milliseconds(0));
  return *this;
}

Options::Builder& Options::Builder::Timeout(std::chrono::milliseconds v) {
  timeout_ = std::max(v, std::chrono::milliseconds(1));
  return *this;
}

Options::Builder& Options::Builder::PayloadSize(size_t v) {
  payload_size_ = std::min(v, Options::kMaxPayloadSize);
  return *this;
}

Options::Builder& Options::Builder::Identifier(uint16_t v) {
  identifier_ = v;
  return *this;
}

Options::Builder& Options::Builder::LogSink(LogCallback cb) {
  log_sink_cb_ = std::move(cb);
  return *this;
}

Options Options::Builder::Build() const {
  return Options(count_, interval_, timeout_, payload_size_, identifier_,
                 log_sink_cb_);
}

Options::Options() {
  count_ = kDefaultCount;
  interval_ = kDefaultInterval;
  timeout_ = kDefaultTimeout;
  payload_size_ = kDefaultPayloadSize;
  identifier_ = kDefaultIdentifier;
}

Options::Options(int count, std::chrono::milliseconds interval,
                 std::chrono::milliseconds timeout, size_t payload_size,
                 uint16_t identifier, LogCallback log_cb) {
  count_ = count;
  interval_ = interval;
  timeout_ = timeout;
  payload_size_ = payload_size;
  identifier_ = identifier;
  log_callback_ = std::move(log_cb);
}

int Options::Count() const { return count_; }

std::chrono::milliseconds Options::Interval() const { return interval_; }

std::chrono::milliseconds Options::Timeout() const { return timeout_; }

size_t Options::PayloadSize() const { return payload_size_; }

uint16_t Options::Identifier() const { return identifier_; }

const Options::LogCallback& Options::LogSink() const { return log_callback_; }

std::ostream& operator<<(std::ostream& os, const Options& o) {
  os << "Options{count=" << o.Count() << ", interval=" << o.Interval().count()
     << "ms, timeout=" << o.Timeout().count()
     << "ms, payload=" << o.PayloadSize() << ", id=" << o.Identifier() << "}";
  return os;
}

double Summary::LossPercent() const {
  if (transmitted == 0) return 0.0;
  return 100.0 * static_cast<double>(transmitted - received) /
         static_cast<double>(transmitted);
}

std::ostream& operator<<(std::ostream& os, const Reply& r) {
  if (!r.received) {
    os << "seq=" << r.sequence << " timeout";
    return os;
  }
  os << r.bytes << " bytes from " << r.from << ": icmp_seq=" << r.sequence
     << " ttl=" << static_cast<int>(r.ttl) << " time=" << std::fixed
     << std::setprecision(3) << r.rtt_ms << " ms";
  return os;
}

std::ostream& operator<<(std::ostream& os, const Summary& s) {
  os << s.transmitted << " packets transmitted, " << s.received
     << " received, " << std::fixed << std::setprecision(1) << s.LossPercent()
     << "% packet loss";
  if (s.received > 0) {
    os << ", rtt min/avg/max = " << std::setprecision(3) << s.min_ms << '/'
       << s.avg_ms << '/' << s.max_ms << " ms";
  }
  return os;
}

// ---------------- Impl ----------------

class Pinger::Impl {
 public:
  Impl(std::unique_ptr<wirepack::PacketChannel> channel,
       wirepack::TimeSource* ts)
      : channel_(std::move(channel)),
        time_source_(ts ? ts : &wirepack::platform::GetDefaultTimeSource()) {
    if (!channel_) channel_ = std::make_unique<wirepack::PacketChannel>();
  }

  bool Open(const Options& options, wirepack::Error* err) {
    options_ = options;
    auto channel_opts =
        wirepack::PacketChannel::Options::Builder()
            .LogSink(options.LogSink())
            .Build();
    Log("[wireping] open " + ToText(options));
    return channel_->Open(wirepack::platform::SocketType::kRaw,
                          wirepack::kProtocolIcmp, 0, channel_opts, err);
  }

  void SetRateLimiter(std::shared_ptr<wirepack::RateLimiter> limiter) {
    channel_->SetRateLimiter(std::move(limiter));
  }

  bool PingOnce(const std::string& host, uint16_t sequence, Reply* out,
                wirepack::Error* err) {
    uint32_t addr = 0;
    if (!wirepack::ParseIpv4Address(host, &addr)) {
      return wirepack::Fail(err, wirepack::Error::InvalidArgument(
                                     "Invalid IPv4 address: " + host));
    }

    const wirepack::IcmpPacket request = wirepack::IcmpPacket::EchoRequest(
        options_.Identifier(), sequence, MakePayload(sequence));
    const wirepack::platform::Endpoint to(host, 0);
    const double sent_at = time_source_->NowSeconds();
    if (!channel_->SendPacket(to, request, err)) return false;

    const double deadline =
        sent_at + static_cast<double>(options_.Timeout().count()) / 1000.0;
    while (true) {
      const double remaining = deadline - time_source_->NowSeconds();
      if (remaining <= 0) {
        return wirepack::Fail(err, wirepack::Error::Timeout("echo reply"));
      }
      wirepack::platform::Endpoint from;
      wirepack::Ipv4Packet ip;
      wirepack::Error recv_err;
      if (!channel_->ReceivePacket(&from, &ip,
                                   static_cast<int64_t>(remaining * 1e6),
                                   &recv_err)) {
        // Malformed datagrams on a raw socket are not fatal.
        if (recv_err.code == wirepack::ErrorCode::kInsufficientData ||
            recv_err.code == wirepack::ErrorCode::kValidation) {
          continue;
        }
        return wirepack::Fail(err, std::move(recv_err));
      }
      Reply reply;
      if (!MatchReply(ip, sequence, &reply)) continue;
      reply.rtt_ms = (time_source_->NowSeconds() - sent_at) * 1000.0;
      *out = reply;
      std::ostringstream oss;
      oss << "[wireping] " << reply;
      Log(oss.str());
      return true;
    }
  }

  bool Run(const std::string& host, std::vector<Reply>* replies,
           Summary* summary, wirepack::Error* err) {
    std::vector<Reply> results;
    Summary s;
    double total_ms = 0.0;
    for (int i = 0; i < options_.Count(); ++i) {
      if (i != 0 && options_.Interval().count() > 0) {
        std::this_thread::sleep_for(options_.Interval());
      }
      const uint16_t seq = static_cast<uint16_t>(i + 1);
      Reply reply;
      reply.sequence = seq;
      wirepack::Error e;
      ++s.transmitted;
      if (!PingOnce(host, seq, &reply, &e)) {
        if (e.code != wirepack::ErrorCode::kTimeout) {
          return wirepack::Fail(err, std::move(e));
        }
        Log("[wireping] seq=" + std::to_string(seq) + " timed out");
        results.push_back(reply);
        continue;
      }
      ++s.received;
      total_ms += reply.rtt_ms;
      s.min_ms =
          s.received == 1 ? reply.rtt_ms : std::min(s.min_ms, reply.rtt_ms);
      s.max_ms = std::max(s.max_ms, reply.rtt_ms);
      results.push_back(reply);
    }
    if (s.received > 0) s.avg_ms = total_ms / s.received;
    *replies = std::move(results);
    *summary = s;
    return true;
  }

  wirepack::ChannelStats GetStats() const { return channel_->GetStats(); }

 private:
  std::vector<uint8_t> MakePayload(uint16_t sequence) const {
    std::vector<uint8_t> data(options_.PayloadSize());
    for (size_t i = 0; i < data.size(); ++i) {
      data[i] = static_cast<uint8_t>((sequence + i) & 0xff);
    }
    return data;
  }

  /** True when ip carries the echo reply for sequence. */
  bool MatchReply(const wirepack::Ipv4Packet& ip, uint16_t sequence,
                  Reply* reply) {
    if (ip.protocol != wirepack::kProtocolIcmp) return false;
    // Skip IPv4 header options, which the codec leaves in the payload.
    const size_t options_len = static_cast<size_t>(ip.ihl - 5) * 4;
    if (ip.payload.size() < options_len) return false;
    const uint8_t* icmp_bytes = ip.payload.data() + options_len;
    const size_t icmp_size = ip.payload.size() - options_len;

    wirepack::IcmpPacket icmp;
    wirepack::Error e;
    if (!wirepack::Decode(icmp_bytes, icmp_size, &icmp, &e)) {
      std::ostringstream oss;
      oss << "[wireping] ignoring ICMP datagram: " << e;
      Log(oss.str());
      return false;
    }
    if (!icmp.IsEchoReply() || icmp.identifier != options_.Identifier() ||
        icmp.sequence_number != sequence) {
      return false;
    }
    if (wirepack::InternetChecksum(icmp_bytes, icmp_size) != 0) {
      Log("[wireping] ignoring echo reply with bad checksum");
      return false;
    }
    reply->sequence = sequence;
    reply->received = true;
    reply->from = wirepack::FormatIpv4Address(ip.source);
    reply->ttl = ip.ttl;
    reply->bytes = icmp_size;
    return true;
  }

  static std::string ToText(const Options& o) {
    std::ostringstream oss;
    oss << o;
    return oss.str();
  }

  void Log(const std::string& msg) {
    if (options_.LogSink()) options_.LogSink()(msg);
  }

  std::unique_ptr<wirepack::PacketChannel> channel_;
  wirepack::TimeSource* time_source_;
  Options options_;
};

// ---------------- Pinger ----------------

Pinger::Pinger() : impl_(std::make_unique<Impl>(nullptr, nullptr)) {}

Pinger::Pinger(std::unique_ptr<wirepack::PacketChannel> channel,
               wirepack::TimeSource* time_source)
    : impl_(std::make_unique<Impl>(std::move(channel), time_source)) {}

Pinger::~Pinger() = default;

bool Pinger::Open(const Options& options, wirepack::Error* err) {
  return impl_->Open(options, err);
}

void Pinger::SetRateLimiter(std::shared_ptr<wirepack::RateLimiter> limiter) {
  impl_->SetRateLimiter(std::move(limiter));
}

bool Pinger::PingOnce(const std::string& host, uint16_t sequence, Reply* out,
                      wirepack::Error* err) {
  return impl_->PingOnce(host, sequence, out, err);
}

bool Pinger::Run(const std::string& host, std::vector<Reply>* replies,
                 Summary* summary, wirepack::Error* err) {
  return impl_->Run(host, replies, summary, err);
}

wirepack::ChannelStats Pinger::GetStats() const { return impl_->GetStats(); }

}  // namespace wireping
