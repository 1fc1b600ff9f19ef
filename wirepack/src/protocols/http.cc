// Copyright (c) 2025 The Wirepack Authors
#include "wirepack/protocols/http.hpp"

#include <cctype>
#include <cstdlib>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

#include "wirepack/security_guard.hpp"

namespace wirepack {

namespace {

std::string Trim(const std::string& s) {
  size_t b = 0;
  size_t e = s.size();
  while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
  while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
  return s.substr(b, e - b);
}

bool EqualsIgnoreCase(const std::string& a, const std::string& b) {
  if (a.size() != b.size()) return false;
  for (size_t i = 0; i < a.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(a[i])) !=
        std::tolower(static_cast<unsigned char>(b[i]))) {
      return false;
    }
  }
  return true;
}

/** Splits s at the first n-1 spaces. */
std::vector<std::string> SplitStartLine(const std::string& s, size_t n) {
  std::vector<std::string> parts;
  size_t pos = 0;
  while (parts.size() + 1 < n) {
    const size_t sp = s.find(' ', pos);
    if (sp == std::string::npos) break;
    parts.push_back(s.substr(pos, sp - pos));
    pos = sp + 1;
  }
  parts.push_back(s.substr(pos));
  return parts;
}

}  // namespace

std::string ReasonPhrase(int status_code) {
  switch (status_code) {
    case 100:
      return "Continue";
    case 200:
      return "OK";
    case 201:
      return "Created";
    case 202:
      return "Accepted";
    case 204:
      return "No Content";
    case 301:
      return "Moved Permanently";
    case 302:
      return "Found";
    case 304:
      return "Not Modified";
    case 400:
      return "Bad Request";
    case 401:
      return "Unauthorized";
    case 403:
      return "Forbidden";
    case 404:
      return "Not Found";
    case 405:
      return "Method Not Allowed";
    case 429:
      return "Too Many Requests";
    case 500:
      return "Internal Server Error";
    case 502:
      return "Bad Gateway";
    case 503:
      return "Service Unavailable";
    default:
      return "Unknown";
  }
}

HttpMessage HttpMessage::CreateRequest(const std::string& method,
                                       const std::string& uri,
                                       std::vector<Header> headers,
                                       std::string body,
                                       const std::string& version) {
  HttpMessage m;
  m.is_request = true;
  m.method = method;
  m.uri = uri;
  m.version = version;
  m.headers = std::move(headers);
  m.body = std::move(body);
  return m;
}

HttpMessage HttpMessage::CreateResponse(int status_code,
                                        const std::string& reason,
                                        std::vector<Header> headers,
                                        std::string body,
                                        const std::string& version) {
  HttpMessage m;
  m.is_request = false;
  m.status_code = status_code;
  m.reason = reason.empty() ? ReasonPhrase(status_code) : reason;
  m.version = version;
  m.headers = std::move(headers);
  m.body = std::move(body);
  return m;
}

bool HttpMessage::Parse(const std::string& raw, HttpMessage* out, Error* err) {
  const size_t max = SecurityGuard::Instance().MaxBufferSize();
  if (raw.size() > max) {
    return Fail(err, Error::BufferOverflow(raw.size(), max));
  }
  if (raw.empty()) {
    return Fail(err, Error::InvalidArgument("Empty HTTP message"));
  }

  size_t line_end = raw.find("\r\n");
  const std::string start_line =
      raw.substr(0, line_end == std::string::npos ? raw.size() : line_end);

  HttpMessage m;
  const std::vector<std::string> parts = SplitStartLine(start_line, 3);
  if (parts.size() < 2 || parts[0].empty()) {
    return Fail(err, Error::InvalidArgument("Malformed HTTP start line: '" +
                                            start_line + "'"));
  }
  if (parts[0].compare(0, 5, "HTTP/") == 0) {
    m.is_request = false;
    m.version = parts[0];
    char* end = nullptr;
    const long code = std::strtol(parts[1].c_str(), &end, 10);
    if (end == parts[1].c_str() || *end != '\0' || code < 100 || code > 999) {
      return Fail(err, Error::InvalidArgument("Invalid HTTP status code '" +
                                              parts[1] + "'"));
    }
    m.status_code = static_cast<int>(code);
    m.reason = parts.size() > 2 ? parts[2] : std::string();
  } else {
    m.is_request = true;
    m.method = parts[0];
    m.uri = parts[1];
    m.version = parts.size() > 2 ? parts[2] : std::string("HTTP/1.1");
  }

  size_t pos = line_end == std::string::npos ? raw.size() : line_end + 2;
  while (pos < raw.size()) {
    line_end = raw.find("\r\n", pos);
    const size_t stop = line_end == std::string::npos ? raw.size() : line_end;
    const std::string line = raw.substr(pos, stop - pos);
    pos = line_end == std::string::npos ? raw.size() : line_end + 2;
    if (line.empty()) {
      m.body = raw.substr(pos);
      break;
    }
    const size_t colon = line.find(':');
    // Lines without a colon are not headers; skip them.
    if (colon == std::string::npos) continue;
    m.headers.emplace_back(Trim(line.substr(0, colon)),
                           Trim(line.substr(colon + 1)));
  }

  *out = std::move(m);
  return true;
}

std::string HttpMessage::ToRaw() const {
  std::string raw;
  if (is_request) {
    raw = method + " " + uri + " " + version;
  } else {
    raw = version + " " + std::to_string(status_code) + " " + reason;
  }
  raw += "\r\n";
  for (const Header& h : headers) {
    raw += h.first + ": " + h.second + "\r\n";
  }
  raw += "\r\n";
  raw += body;
  return raw;
}

const std::string* HttpMessage::FindHeader(const std::string& name) const {
  for (const Header& h : headers) {
    if (EqualsIgnoreCase(h.first, name)) return &h.second;
  }
  return nullptr;
}

void HttpMessage::SetHeader(const std::string& name, const std::string& value) {
  for (Header& h : headers) {
    if (EqualsIgnoreCase(h.first, name)) {
      h.second = value;
      return;
    }
  }
  headers.emplace_back(name, value);
}

bool operator==(const HttpMessage& a, const HttpMessage& b) {
  if (a.is_request != b.is_request || a.version != b.version ||
      a.headers != b.headers || a.body != b.body) {
    return false;
  }
  if (a.is_request) return a.method == b.method && a.uri == b.uri;
  return a.status_code == b.status_code && a.reason == b.reason;
}

std::ostream& operator<<(std::ostream& os, const HttpMessage& m) {
  if (m.is_request) {
    os << "HTTP{" << m.method << ' ' << m.uri << ' ' << m.version;
  } else {
    os << "HTTP{" << m.version << ' ' << m.status_code << ' ' << m.reason;
  }
  os << " headers=" << m.headers.size() << " body=" << m.body.size() << "B}";
  return os;
}

}  // namespace wirepack
