// Copyright (c) 2025 The Wirepack Authors
/**
 * @file default_time_source.cc (POSIX)
 * @brief POSIX implementation - creates MonotonicClock instance.
 */
#include "wirepack/platform/default_time_source.hpp"

#include <memory>

#include "wirepack/monotonic_clock.hpp"

namespace wirepack {
namespace platform {

std::unique_ptr<TimeSource> CreateDefaultTimeSource() {
  return std::make_unique<MonotonicClock>();
}

TimeSource& GetDefaultTimeSource() {
  static std::unique_ptr<TimeSource> instance = CreateDefaultTimeSource();
  return *instance;
}

}  // namespace platform
}  // namespace wirepack
