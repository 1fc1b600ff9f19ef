// Copyright (c) 2025 The Wirepack Authors
/**
 * @file security_guard.hpp
 * @brief Process-wide limits applied by every encode and decode.
 */
#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <ostream>

#include "wirepack/error.hpp"
#include "wirepack/export.hpp"

namespace wirepack {

/** Snapshot of the guard configuration, read once per codec call. */
struct SecurityLimits {
  size_t max_buffer_size = 0;
  size_t max_nesting_depth = 0;
  bool strict_mode = false;
};

WIREPACK_API std::ostream& operator<<(std::ostream& os,
                                      const SecurityLimits& limits);

/**
 * @brief Process-wide security configuration.
 *
 * All members are atomics, so limits may be changed while other threads
 * encode and decode; each codec call works on the snapshot it read at its
 * start.
 */
class WIREPACK_API SecurityGuard {
 public:
  static constexpr size_t kDefaultMaxBufferSize = 10 * 1024 * 1024;
  static constexpr size_t kDefaultMaxNestingDepth = 100;
  static constexpr uint32_t kDefaultRateLimitRequests = 1000;
  static constexpr uint32_t kDefaultRateLimitWindowSeconds = 60;

  static SecurityGuard& Instance();

  SecurityGuard(const SecurityGuard&) = delete;
  SecurityGuard& operator=(const SecurityGuard&) = delete;

  /**
   * @brief Sets the maximum encoded or decoded buffer size in bytes.
   * @return false with kSecurityConfig when size <= 0; limit unchanged.
   */
  bool SetMaxBufferSize(int64_t size, Error* err = nullptr);
  size_t MaxBufferSize() const;

  /**
   * @brief Sets the maximum structure nesting depth.
   * @return false with kSecurityConfig when depth <= 0; limit unchanged.
   */
  bool SetMaxNestingDepth(int64_t depth, Error* err = nullptr);
  size_t MaxNestingDepth() const;

  /** Strict mode makes PacketChannel refuse I/O without a rate limiter. */
  void EnableStrictMode();
  void DisableStrictMode();
  bool IsStrictMode() const;

  /** Restores the default limits and disables strict mode. */
  void Reset();

  SecurityLimits Limits() const;

 private:
  SecurityGuard() = default;

  std::atomic<size_t> max_buffer_size_{kDefaultMaxBufferSize};
  std::atomic<size_t> max_nesting_depth_{kDefaultMaxNestingDepth};
  std::atomic<bool> strict_mode_{false};
};

}  // namespace wirepack
