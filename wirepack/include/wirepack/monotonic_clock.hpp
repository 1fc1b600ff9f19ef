// Copyright (c) 2025 The Wirepack Authors
/**
 * @file monotonic_clock.hpp
 * @brief POSIX monotonic clock-based TimeSource implementation.
 *
 * Uses clock_gettime(CLOCK_MONOTONIC), which is not affected by system time
 * adjustments.
 */
#pragma once

#include <memory>

#include "wirepack/export.hpp"
#include "wirepack/time_source.hpp"

namespace wirepack {

/**
 * @brief TimeSource backed by POSIX clock_gettime(CLOCK_MONOTONIC).
 *
 * Seconds are measured from construction. Thread-safe.
 */
class WIREPACK_API MonotonicClock : public TimeSource {
 public:
  MonotonicClock();
  ~MonotonicClock() override;

  // Non-copyable, non-movable
  MonotonicClock(const MonotonicClock&) = delete;
  MonotonicClock& operator=(const MonotonicClock&) = delete;
  MonotonicClock(MonotonicClock&&) = delete;
  MonotonicClock& operator=(MonotonicClock&&) = delete;

  double NowSeconds() override;

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace wirepack
