// Copyright (c) 2025 The Wirepack Authors
/**
 * @file stats_tracker.hpp
 * @brief Lock-free counters behind PacketChannel::GetStats().
 */
#ifndef WIREPACK_INTERNAL_STATS_TRACKER_HPP_
#define WIREPACK_INTERNAL_STATS_TRACKER_HPP_

#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>

#include "wirepack/packet_channel.hpp"

namespace wirepack {
namespace internal {

class StatsTracker {
 public:
  void Reset() {
    packets_sent_.store(0, std::memory_order_relaxed);
    packets_received_.store(0, std::memory_order_relaxed);
    send_errors_.store(0, std::memory_order_relaxed);
    recv_errors_.store(0, std::memory_order_relaxed);
    rate_limited_.store(0, std::memory_order_relaxed);
    decode_errors_.store(0, std::memory_order_relaxed);
    std::lock_guard<std::mutex> lk(last_error_mtx_);
    last_error_.clear();
  }

  void IncPacketsSent() {
    packets_sent_.fetch_add(1, std::memory_order_relaxed);
  }
  void IncPacketsReceived() {
    packets_received_.fetch_add(1, std::memory_order_relaxed);
  }
  void IncSendErrors() { send_errors_.fetch_add(1, std::memory_order_relaxed); }
  void IncRecvErrors() { recv_errors_.fetch_add(1, std::memory_order_relaxed); }
  void IncRateLimited() {
    rate_limited_.fetch_add(1, std::memory_order_relaxed);
  }
  void IncDecodeErrors() {
    decode_errors_.fetch_add(1, std::memory_order_relaxed);
  }
  void SetLastError(const std::string& text) {
    std::lock_guard<std::mutex> lk(last_error_mtx_);
    last_error_ = text;
  }

  ChannelStats Snapshot() const {
    ChannelStats stats;
    stats.packets_sent = packets_sent_.load(std::memory_order_relaxed);
    stats.packets_received = packets_received_.load(std::memory_order_relaxed);
    stats.send_errors = send_errors_.load(std::memory_order_relaxed);
    stats.recv_errors = recv_errors_.load(std::memory_order_relaxed);
    stats.rate_limited = rate_limited_.load(std::memory_order_relaxed);
    stats.decode_errors = decode_errors_.load(std::memory_order_relaxed);
    std::lock_guard<std::mutex> lk(last_error_mtx_);
    stats.last_error = last_error_;
    return stats;
  }

 private:
  std::atomic<uint64_t> packets_sent_{0};
  std::atomic<uint64_t> packets_received_{0};
  std::atomic<uint64_t> send_errors_{0};
  std::atomic<uint64_t> recv_errors_{0};
  std::atomic<uint64_t> rate_limited_{0};
  std::atomic<uint64_t> decode_errors_{0};
  mutable std::mutex last_error_mtx_;
  std::string last_error_;
};

}  // namespace internal
}  // namespace wirepack

#endif  // WIREPACK_INTERNAL_STATS_TRACKER_HPP_
