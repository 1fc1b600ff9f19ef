// Copyright (c) 2025 The Wirepack Authors
/**
 * @file error.hpp
 * @brief Typed failure reports shared by the codec, security and I/O layers.
 *
 * Every fallible operation in wirepack returns bool and fills an optional
 * Error. The code identifies the failure class; the remaining members carry
 * the payload relevant to that class (unused members stay zero/empty).
 *
 * | Code                 | Payload                                   |
 * |----------------------|-------------------------------------------|
 * | kSchemaCycle         | message (cycle path)                      |
 * | kSchemaLayout        | field, message                            |
 * | kBufferOverflow      | requested_size, max_size                  |
 * | kNestingDepthExceeded| depth, max_depth                          |
 * | kInsufficientData    | expected, available, field                |
 * | kValidation          | field, value, constraint                  |
 * | kMissingField        | field                                     |
 * | kRateLimitExceeded   | operation, limit, window_seconds          |
 * | kSecurityConfig      | message                                   |
 * | kIo / kTimeout       | operation, message                        |
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>
#include <utility>

#include "wirepack/export.hpp"

namespace wirepack {

enum class ErrorCode {
  kOk = 0,
  kSchemaCycle,
  kSchemaLayout,
  kBufferOverflow,
  kNestingDepthExceeded,
  kInsufficientData,
  kValidation,
  kMissingField,
  kRateLimitExceeded,
  kSecurityConfig,
  kIo,
  kTimeout,
  kInvalidArgument,
};

/** Returns a stable identifier such as "InsufficientData". */
WIREPACK_API const char* ToString(ErrorCode code);

struct WIREPACK_API Error {
  ErrorCode code = ErrorCode::kOk;
  std::string message;

  std::string field;       ///< Field name (layout/data/validation errors)
  std::string operation;   ///< Operation name (rate limit, I/O)
  std::string constraint;  ///< Violated constraint, e.g. "range[5,15]"
  int64_t value = 0;       ///< Offending value (validation)

  size_t requested_size = 0;
  size_t max_size = 0;
  size_t depth = 0;
  size_t max_depth = 0;
  size_t expected = 0;
  size_t available = 0;
  int64_t limit = 0;
  int64_t window_seconds = 0;

  bool ok() const { return code == ErrorCode::kOk; }

  /** @name Factories for each failure class */
  ///@{
  static Error SchemaCycle(const std::string& path);
  static Error SchemaLayout(const std::string& field, const std::string& why);
  static Error BufferOverflow(size_t requested_size, size_t max_size);
  static Error NestingDepthExceeded(size_t depth, size_t max_depth);
  static Error InsufficientData(size_t expected, size_t available,
                                const std::string& field);
  static Error Validation(const std::string& field, int64_t value,
                          const std::string& constraint);
  static Error MissingField(const std::string& field);
  static Error RateLimitExceeded(const std::string& operation, int64_t limit,
                                 int64_t window_seconds);
  static Error SecurityConfig(const std::string& why);
  static Error Io(const std::string& operation, const std::string& detail);
  static Error Timeout(const std::string& operation);
  static Error InvalidArgument(const std::string& why);
  ///@}

  /** Stream formatter for logging: "<Code>: <message>". */
  friend std::ostream& operator<<(std::ostream& os, const Error& e);
};

/** Stores e into err when err is non-null. Always returns false. */
inline bool Fail(Error* err, Error e) {
  if (err != nullptr) *err = std::move(e);
  return false;
}

}  // namespace wirepack
