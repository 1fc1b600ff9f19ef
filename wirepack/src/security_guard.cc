// Copyright (c) 2025 The Wirepack Authors
#include "wirepack/security_guard.hpp"

#include <ostream>

namespace wirepack {

std::ostream& operator<<(std::ostream& os, const SecurityLimits& limits) {
  os << "SecurityLimits{max_buffer_size=" << limits.max_buffer_size
     << ", max_nesting_depth=" << limits.max_nesting_depth
     << ", strict_mode=" << (limits.strict_mode ? "on" : "off") << "}";
  return os;
}

SecurityGuard& SecurityGuard::Instance() {
  static SecurityGuard instance;
  return instance;
}

bool SecurityGuard::SetMaxBufferSize(int64_t size, Error* err) {
  if (size <= 0) {
    return Fail(err, Error::SecurityConfig("Max buffer size must be positive"));
  }
  max_buffer_size_.store(static_cast<size_t>(size), std::memory_order_relaxed);
  return true;
}

size_t SecurityGuard::MaxBufferSize() const {
  return max_buffer_size_.load(std::memory_order_relaxed);
}

bool SecurityGuard::SetMaxNestingDepth(int64_t depth, Error* err) {
  if (depth <= 0) {
    return Fail(err,
                Error::SecurityConfig("Max nesting depth must be positive"));
  }
  max_nesting_depth_.store(static_cast<size_t>(depth),
                           std::memory_order_relaxed);
  return true;
}

size_t SecurityGuard::MaxNestingDepth() const {
  return max_nesting_depth_.load(std::memory_order_relaxed);
}

void SecurityGuard::EnableStrictMode() {
  strict_mode_.store(true, std::memory_order_relaxed);
}

void SecurityGuard::DisableStrictMode() {
  strict_mode_.store(false, std::memory_order_relaxed);
}

bool SecurityGuard::IsStrictMode() const {
  return strict_mode_.load(std::memory_order_relaxed);
}

void SecurityGuard::Reset() {
  max_buffer_size_.store(kDefaultMaxBufferSize, std::memory_order_relaxed);
  max_nesting_depth_.store(kDefaultMaxNestingDepth, std::memory_order_relaxed);
  strict_mode_.store(false, std::memory_order_relaxed);
}

SecurityLimits SecurityGuard::Limits() const {
  SecurityLimits limits;
  limits.max_buffer_size = MaxBufferSize();
  limits.max_nesting_depth = MaxNestingDepth();
  limits.strict_mode = IsStrictMode();
  return limits;
}

}  // namespace wirepack
