// Copyright (c) 2025 The Wirepack Authors
/**
 * @file error.cc
 * @brief Error factories and formatting.
 */
#include "wirepack/error.hpp"

#include <sstream>
#include <string>

namespace wirepack {

const char* ToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::kOk:
      return "Ok";
    case ErrorCode::kSchemaCycle:
      return "SchemaCycle";
    case ErrorCode::kSchemaLayout:
      return "SchemaLayout";
    case ErrorCode::kBufferOverflow:
      return "BufferOverflow";
    case ErrorCode::kNestingDepthExceeded:
      return "NestingDepthExceeded";
    case ErrorCode::kInsufficientData:
      return "InsufficientData";
    case ErrorCode::kValidation:
      return "Validation";
    case ErrorCode::kMissingField:
      return "MissingField";
    case ErrorCode::kRateLimitExceeded:
      return "RateLimitExceeded";
    case ErrorCode::kSecurityConfig:
      return "SecurityConfig";
    case ErrorCode::kIo:
      return "Io";
    case ErrorCode::kTimeout:
      return "Timeout";
    case ErrorCode::kInvalidArgument:
      return "InvalidArgument";
  }
  return "Unknown";
}

Error Error::SchemaCycle(const std::string& path) {
  Error e;
  e.code = ErrorCode::kSchemaCycle;
  e.message = "Cyclic structure reference: " + path;
  return e;
}

Error Error::SchemaLayout(const std::string& field, const std::string& why) {
  Error e;
  e.code = ErrorCode::kSchemaLayout;
  e.field = field;
  e.message = "Invalid layout at field '" + field + "': " + why;
  return e;
}

Error Error::BufferOverflow(size_t requested_size, size_t max_size) {
  Error e;
  e.code = ErrorCode::kBufferOverflow;
  e.requested_size = requested_size;
  e.max_size = max_size;
  std::ostringstream oss;
  oss << "Buffer overflow protection: requested size (" << requested_size
      << " bytes) exceeds maximum allowed size (" << max_size << " bytes)";
  e.message = oss.str();
  return e;
}

Error Error::NestingDepthExceeded(size_t depth, size_t max_depth) {
  Error e;
  e.code = ErrorCode::kNestingDepthExceeded;
  e.depth = depth;
  e.max_depth = max_depth;
  std::ostringstream oss;
  oss << "Nesting depth " << depth << " exceeds maximum " << max_depth;
  e.message = oss.str();
  return e;
}

Error Error::InsufficientData(size_t expected, size_t available,
                              const std::string& field) {
  Error e;
  e.code = ErrorCode::kInsufficientData;
  e.expected = expected;
  e.available = available;
  e.field = field;
  std::ostringstream oss;
  oss << "Insufficient data for field '" << field << "': expected " << expected
      << " bytes, " << available << " available";
  e.message = oss.str();
  return e;
}

Error Error::Validation(const std::string& field, int64_t value,
                        const std::string& constraint) {
  Error e;
  e.code = ErrorCode::kValidation;
  e.field = field;
  e.value = value;
  e.constraint = constraint;
  std::ostringstream oss;
  oss << "Validation failed for field '" << field << "': value " << value
      << " violates " << constraint;
  e.message = oss.str();
  return e;
}

Error Error::MissingField(const std::string& field) {
  Error e;
  e.code = ErrorCode::kMissingField;
  e.field = field;
  e.message = "Field '" + field + "' has no value";
  return e;
}

Error Error::RateLimitExceeded(const std::string& operation, int64_t limit,
                               int64_t window_seconds) {
  Error e;
  e.code = ErrorCode::kRateLimitExceeded;
  e.operation = operation;
  e.limit = limit;
  e.window_seconds = window_seconds;
  std::ostringstream oss;
  oss << "Rate limit exceeded for " << operation << ": maximum " << limit
      << " requests per " << window_seconds << " seconds";
  e.message = oss.str();
  return e;
}

Error Error::SecurityConfig(const std::string& why) {
  Error e;
  e.code = ErrorCode::kSecurityConfig;
  e.message = why;
  return e;
}

Error Error::Io(const std::string& operation, const std::string& detail) {
  Error e;
  e.code = ErrorCode::kIo;
  e.operation = operation;
  e.message = operation + " failed: " + detail;
  return e;
}

Error Error::Timeout(const std::string& operation) {
  Error e;
  e.code = ErrorCode::kTimeout;
  e.operation = operation;
  e.message = operation + " timed out";
  return e;
}

Error Error::InvalidArgument(const std::string& why) {
  Error e;
  e.code = ErrorCode::kInvalidArgument;
  e.message = why;
  return e;
}

std::ostream& operator<<(std::ostream& os, const Error& e) {
  os << ToString(e.code);
  if (!e.message.empty()) os << ": " << e.message;
  return os;
}

}  // namespace wirepack
