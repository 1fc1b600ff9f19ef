// Copyright (c) 2025 The Wirepack Authors
/**
 * @file default_time_source.hpp
 * @brief Platform-specific default TimeSource.
 */
#pragma once

#include <memory>

#include "wirepack/export.hpp"
#include "wirepack/time_source.hpp"

namespace wirepack {
namespace platform {

/**
 * @brief Creates a platform-specific default TimeSource.
 * @return Unique pointer to MonotonicClock (POSIX).
 */
WIREPACK_API std::unique_ptr<TimeSource> CreateDefaultTimeSource();

/** Process-wide shared default TimeSource (created on first use). */
WIREPACK_API TimeSource& GetDefaultTimeSource();

}  // namespace platform
}  // namespace wirepack
