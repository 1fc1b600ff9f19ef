// Copyright (c) 2025 The Wirepack Authors
/**
 * @file http_test.cc
 * @test HTTP message text codec
 * @brief Parsing and serializing requests and responses.
 */
#include "wirepack/protocols/http.hpp"

#include <gtest/gtest.h>

#include <string>

#include "test_util.hpp"
#include "wirepack/security_guard.hpp"

namespace wirepack {

class HttpTest : public testing::SecurityGuardTest {};

TEST_F(HttpTest, ParsesRequestWithHeadersAndBody) {
  const std::string raw =
      "POST /api/v1/items HTTP/1.1\r\n"
      "Host: example.com\r\n"
      "Content-Type:  application/json \r\n"
      "garbage line\r\n"
      "\r\n"
      "{\"a\":1}";
  HttpMessage m;
  Error err;
  ASSERT_TRUE(HttpMessage::Parse(raw, &m, &err)) << err;
  EXPECT_TRUE(m.is_request);
  EXPECT_EQ(m.method, "POST");
  EXPECT_EQ(m.uri, "/api/v1/items");
  EXPECT_EQ(m.version, "HTTP/1.1");
  ASSERT_EQ(m.headers.size(), 2u);
  ASSERT_NE(m.FindHeader("content-type"), nullptr);
  EXPECT_EQ(*m.FindHeader("content-type"), "application/json");
  EXPECT_EQ(m.FindHeader("Accept"), nullptr);
  EXPECT_EQ(m.body, "{\"a\":1}");
}

TEST_F(HttpTest, ParsesResponseAndKeepsMultiWordReason) {
  HttpMessage m;
  Error err;
  ASSERT_TRUE(HttpMessage::Parse(
      "HTTP/1.0 404 Not Found\r\nContent-Length: 0\r\n\r\n", &m, &err))
      << err;
  EXPECT_FALSE(m.is_request);
  EXPECT_EQ(m.version, "HTTP/1.0");
  EXPECT_EQ(m.status_code, 404);
  EXPECT_EQ(m.reason, "Not Found");
  EXPECT_TRUE(m.body.empty());
}

/**
 * @test HttpTest.SerializedMessageParsesBack
 * @brief Verify that ToRaw output is accepted by Parse unchanged.
 */
TEST_F(HttpTest, SerializedMessageParsesBack) {
  HttpMessage req = HttpMessage::CreateRequest(
      "GET", "/index.html", {{"Host", "example.com"}});
  req.SetHeader("host", "example.org");
  req.SetHeader("Accept", "*/*");
  ASSERT_EQ(req.headers.size(), 2u);
  EXPECT_EQ(req.headers[0].second, "example.org");
  EXPECT_EQ(req.ToRaw(),
            "GET /index.html HTTP/1.1\r\nHost: example.org\r\n"
            "Accept: */*\r\n\r\n");

  HttpMessage back;
  ASSERT_TRUE(HttpMessage::Parse(req.ToRaw(), &back));
  EXPECT_EQ(back, req);

  HttpMessage resp = HttpMessage::CreateResponse(503, "", {}, "busy");
  EXPECT_EQ(resp.reason, "Service Unavailable");
  ASSERT_TRUE(HttpMessage::Parse(resp.ToRaw(), &back));
  EXPECT_EQ(back, resp);
}

TEST_F(HttpTest, RejectsMalformedAndOversizedInput) {
  HttpMessage m;
  Error err;
  EXPECT_FALSE(HttpMessage::Parse("", &m, &err));
  EXPECT_EQ(err.code, ErrorCode::kInvalidArgument);
  EXPECT_FALSE(HttpMessage::Parse("NONSENSE\r\n\r\n", &m, &err));
  EXPECT_EQ(err.code, ErrorCode::kInvalidArgument);
  EXPECT_FALSE(HttpMessage::Parse("HTTP/1.1 abc OK\r\n\r\n", &m, &err));
  EXPECT_EQ(err.code, ErrorCode::kInvalidArgument);
  EXPECT_FALSE(HttpMessage::Parse("HTTP/1.1 42 Odd\r\n\r\n", &m, &err));
  EXPECT_EQ(err.code, ErrorCode::kInvalidArgument);

  ASSERT_TRUE(SecurityGuard::Instance().SetMaxBufferSize(8));
  EXPECT_FALSE(HttpMessage::Parse("GET / HTTP/1.1\r\n\r\n", &m, &err));
  EXPECT_EQ(err.code, ErrorCode::kBufferOverflow);
  EXPECT_EQ(err.max_size, 8u);
}

}  // namespace wirepack
