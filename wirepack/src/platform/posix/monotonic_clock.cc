// Copyright (c) 2025 The Wirepack Authors
/**
 * @file monotonic_clock.cc
 * @brief POSIX-specific implementation using clock_gettime().
 */
#include "wirepack/monotonic_clock.hpp"

#include <time.h>

#include <cstdint>
#include <memory>

namespace wirepack {

struct MonotonicClock::Impl {
  int64_t mono_t0_nsec_{0};  // Monotonic anchor (nanoseconds)

  // Get current CLOCK_MONOTONIC in nanoseconds
  static int64_t MonotonicNow() {
    timespec ts{};
    clock_gettime(CLOCK_MONOTONIC, &ts);
    return static_cast<int64_t>(ts.tv_sec) * 1'000'000'000LL +
           static_cast<int64_t>(ts.tv_nsec);
  }
};

MonotonicClock::MonotonicClock() : impl_(std::make_unique<Impl>()) {
  impl_->mono_t0_nsec_ = Impl::MonotonicNow();
}

MonotonicClock::~MonotonicClock() = default;

double MonotonicClock::NowSeconds() {
  const int64_t elapsed = Impl::MonotonicNow() - impl_->mono_t0_nsec_;
  return static_cast<double>(elapsed) / 1e9;
}

}  // namespace wirepack
