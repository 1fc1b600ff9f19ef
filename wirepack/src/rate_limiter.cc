// Copyright (c) 2025 The Wirepack Authors
/**
 * @file rate_limiter.cc
 * @brief Token bucket refill and admission.
 */
#include "wirepack/rate_limiter.hpp"

#include <algorithm>
#include <cmath>
#include <memory>
#include <mutex>
#include <string>

#include "wirepack/platform/default_time_source.hpp"
#include "wirepack/security_guard.hpp"

namespace wirepack {

std::unique_ptr<RateLimiter> RateLimiter::Create(int64_t max_requests,
                                                 int64_t window_seconds,
                                                 Error* err,
                                                 TimeSource* time_source) {
  if (max_requests <= 0) {
    Fail(err, Error::SecurityConfig("Max requests must be positive"));
    return nullptr;
  }
  if (window_seconds <= 0) {
    Fail(err, Error::SecurityConfig("Window seconds must be positive"));
    return nullptr;
  }
  TimeSource* ts =
      time_source ? time_source : &platform::GetDefaultTimeSource();
  return std::unique_ptr<RateLimiter>(
      new RateLimiter(max_requests, window_seconds, ts));
}

std::unique_ptr<RateLimiter> RateLimiter::Default(TimeSource* ts) {
  return Create(SecurityGuard::kDefaultRateLimitRequests,
                SecurityGuard::kDefaultRateLimitWindowSeconds, nullptr, ts);
}

std::unique_ptr<RateLimiter> RateLimiter::Strict(TimeSource* ts) {
  return Create(100, 60, nullptr, ts);
}

std::unique_ptr<RateLimiter> RateLimiter::Permissive(TimeSource* ts) {
  return Create(10000, 60, nullptr, ts);
}

RateLimiter::RateLimiter(int64_t max_requests, int64_t window_seconds,
                         TimeSource* ts)
    : max_requests_(max_requests),
      window_seconds_(window_seconds),
      time_source_(ts),
      tokens_(max_requests),
      last_refill_(ts->NowSeconds()) {}

bool RateLimiter::CheckLimit(const std::string& operation, Error* err) {
  std::lock_guard<std::mutex> lk(mtx_);
  if (!enabled_) return true;
  if (TakeLocked()) return true;
  return Fail(err, Error::RateLimitExceeded(operation, max_requests_,
                                            window_seconds_));
}

bool RateLimiter::TryOperation() {
  std::lock_guard<std::mutex> lk(mtx_);
  if (!enabled_) return true;
  return TakeLocked();
}

int64_t RateLimiter::RemainingTokens() {
  std::lock_guard<std::mutex> lk(mtx_);
  RefillLocked();
  return std::max<int64_t>(0, tokens_);
}

double RateLimiter::TimeUntilNextToken() {
  std::lock_guard<std::mutex> lk(mtx_);
  RefillLocked();
  if (tokens_ >= 1) return 0.0;
  const double per_token = static_cast<double>(window_seconds_) /
                           static_cast<double>(max_requests_);
  const double elapsed = time_source_->NowSeconds() - last_refill_;
  return std::max(0.0, per_token - elapsed);
}

void RateLimiter::Enable() {
  std::lock_guard<std::mutex> lk(mtx_);
  enabled_ = true;
}

void RateLimiter::Disable() {
  std::lock_guard<std::mutex> lk(mtx_);
  enabled_ = false;
}

bool RateLimiter::IsEnabled() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return enabled_;
}

void RateLimiter::Reset() {
  std::lock_guard<std::mutex> lk(mtx_);
  tokens_ = max_requests_;
  last_refill_ = time_source_->NowSeconds();
}

void RateLimiter::RefillLocked() {
  const double now = time_source_->NowSeconds();
  const double elapsed = now - last_refill_;
  const double per_second = static_cast<double>(max_requests_) /
                            static_cast<double>(window_seconds_);
  const int64_t add = static_cast<int64_t>(std::floor(elapsed * per_second));
  // last_refill_ only advances when whole tokens were added, so fractional
  // progress accumulates across calls.
  if (add > 0) {
    tokens_ = std::min(max_requests_, tokens_ + add);
    last_refill_ = now;
  }
}

bool RateLimiter::TakeLocked() {
  RefillLocked();
  if (tokens_ < 1) return false;
  --tokens_;
  return true;
}

}  // namespace wirepack
