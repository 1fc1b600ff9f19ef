// Copyright (c) 2025 The Wirepack Authors
/**
 * @file rate_limiter.hpp
 * @brief Token-bucket limiter for network operations.
 */
#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

#include "wirepack/error.hpp"
#include "wirepack/export.hpp"
#include "wirepack/time_source.hpp"

namespace wirepack {

/**
 * @brief Token bucket of `max_requests` tokens refilled over a window.
 *
 * Tokens refill at max_requests / window_seconds per second, in whole
 * tokens, capped at max_requests. A disabled limiter admits everything.
 *
 * Thread-safe: all methods take an internal lock.
 */
class WIREPACK_API RateLimiter {
 public:
  /**
   * @brief Creates a full bucket.
   * @param max_requests Bucket capacity; must be positive.
   * @param window_seconds Refill window; must be positive.
   * @param err Receives kSecurityConfig on a non-positive argument.
   * @param time_source Clock (default: platform monotonic clock). Not owned.
   */
  static std::unique_ptr<RateLimiter> Create(int64_t max_requests,
                                             int64_t window_seconds,
                                             Error* err = nullptr,
                                             TimeSource* time_source = nullptr);

  /** 1000 requests per 60 seconds. */
  static std::unique_ptr<RateLimiter> Default(TimeSource* ts = nullptr);
  /** 100 requests per 60 seconds. */
  static std::unique_ptr<RateLimiter> Strict(TimeSource* ts = nullptr);
  /** 10000 requests per 60 seconds. */
  static std::unique_ptr<RateLimiter> Permissive(TimeSource* ts = nullptr);

  RateLimiter(const RateLimiter&) = delete;
  RateLimiter& operator=(const RateLimiter&) = delete;

  /**
   * @brief Consumes one token.
   * @param operation Name reported in the error.
   * @return false with kRateLimitExceeded when the bucket is empty.
   */
  bool CheckLimit(const std::string& operation = "operation",
                  Error* err = nullptr);

  /** Consumes one token when available. */
  bool TryOperation();

  int64_t RemainingTokens();

  /** Seconds until the next token is available; 0 when one is ready. */
  double TimeUntilNextToken();

  void Enable();
  void Disable();
  bool IsEnabled() const;

  /** Refills the bucket to capacity. */
  void Reset();

  int64_t MaxRequests() const { return max_requests_; }
  int64_t WindowSeconds() const { return window_seconds_; }

 private:
  RateLimiter(int64_t max_requests, int64_t window_seconds, TimeSource* ts);

  void RefillLocked();
  bool TakeLocked();

  const int64_t max_requests_;
  const int64_t window_seconds_;
  TimeSource* time_source_;

  mutable std::mutex mtx_;
  int64_t tokens_;
  double last_refill_;
  bool enabled_{true};
};

}  // namespace wirepack
