// Copyright (c) 2025 The Wirepack Authors
/**
 * @file http.hpp
 * @brief HTTP/1.x request and response framing (RFC 7230).
 *
 * HTTP is a text protocol and does not go through the schema codec.
 * Parse() still honours the SecurityGuard buffer limit.
 */
#pragma once

#include <ostream>
#include <string>
#include <utility>
#include <vector>

#include "wirepack/error.hpp"
#include "wirepack/export.hpp"

namespace wirepack {

struct WIREPACK_API HttpMessage {
  using Header = std::pair<std::string, std::string>;

  bool is_request = true;
  std::string method = "GET";
  std::string uri = "/";
  std::string version = "HTTP/1.1";
  int status_code = 200;
  std::string reason = "OK";
  std::vector<Header> headers;  ///< In wire order
  std::string body;

  static HttpMessage CreateRequest(const std::string& method,
                                   const std::string& uri,
                                   std::vector<Header> headers = {},
                                   std::string body = std::string(),
                                   const std::string& version = "HTTP/1.1");

  /** An empty reason is replaced with ReasonPhrase(status_code). */
  static HttpMessage CreateResponse(int status_code,
                                    const std::string& reason = std::string(),
                                    std::vector<Header> headers = {},
                                    std::string body = std::string(),
                                    const std::string& version = "HTTP/1.1");

  /**
   * @brief Parses a raw request or response.
   * @return false with kBufferOverflow when raw exceeds the SecurityGuard
   *         limit, or kInvalidArgument on a malformed start line.
   */
  static bool Parse(const std::string& raw, HttpMessage* out,
                    Error* err = nullptr);

  /** Serializes with CRLF line endings. */
  std::string ToRaw() const;

  /** Case-insensitive lookup; returns nullptr when absent. */
  const std::string* FindHeader(const std::string& name) const;
  void SetHeader(const std::string& name, const std::string& value);
};

/** Standard reason phrase, "Unknown" for unlisted codes. */
WIREPACK_API std::string ReasonPhrase(int status_code);

WIREPACK_API bool operator==(const HttpMessage& a, const HttpMessage& b);
inline bool operator!=(const HttpMessage& a, const HttpMessage& b) {
  return !(a == b);
}
WIREPACK_API std::ostream& operator<<(std::ostream& os, const HttpMessage& m);

}  // namespace wirepack
