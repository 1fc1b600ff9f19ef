// Copyright (c) 2025 The Wirepack Authors
/**
 * @file time_source.hpp
 * @brief Minimal monotonic time source interface.
 */
#pragma once

namespace wirepack {

/**
 * Interface for time sources used by rate limiting and timeouts.
 * Implementations return monotonically non-decreasing seconds from an
 * arbitrary origin.
 */
class TimeSource {
 public:
  virtual ~TimeSource() = default;

  /** Returns the current time in seconds. */
  virtual double NowSeconds() = 0;
};

}  // namespace wirepack
