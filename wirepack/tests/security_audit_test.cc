// Copyright (c) 2025 The Wirepack Authors
/**
 * @file security_audit_test.cc
 * @test Security audit findings
 * @brief Schema, configuration and channel audits plus the report.
 */
#include "wirepack/security_audit.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include "test_util.hpp"
#include "wirepack/protocols/arp.hpp"
#include "wirepack/protocols/icmp.hpp"

namespace wirepack {

namespace {

struct AuditInner {
  uint8_t v = 0;

  static void Describe(SchemaBuilder<AuditInner>* b) {
    b->Name("AuditInner").Int("v", &AuditInner::v);
  }
};

struct Bounded {
  AuditInner inner;
  std::vector<uint8_t> tail;

  static void Describe(SchemaBuilder<Bounded>* b) {
    b->Name("Bounded")
        .Nested("inner", &Bounded::inner)
        .Bytes("tail", &Bounded::tail)
        .Validate(Constraint::LengthRange(0, 64));
  }
};

size_t Count(const std::vector<Finding>& findings, Severity s) {
  size_t n = 0;
  for (const Finding& f : findings) {
    if (f.severity == s) ++n;
  }
  return n;
}

}  // namespace

class SecurityAuditTest : public testing::SecurityGuardTest {};

TEST_F(SecurityAuditTest, SchemaFindings) {
  auto icmp = SchemaRegistry::Instance().Get<IcmpPacket>();
  ASSERT_NE(icmp, nullptr);
  std::vector<Finding> findings = AuditSchema(*icmp);
  ASSERT_EQ(findings.size(), 1u);
  EXPECT_EQ(findings[0].severity, Severity::kWarning);
  EXPECT_NE(findings[0].message.find("'data'"), std::string::npos);

  auto arp = SchemaRegistry::Instance().Get<ArpPacket>();
  ASSERT_NE(arp, nullptr);
  EXPECT_TRUE(AuditSchema(*arp).empty());

  auto bounded = SchemaRegistry::Instance().Get<Bounded>();
  ASSERT_NE(bounded, nullptr);
  findings = AuditSchema(*bounded);
  ASSERT_EQ(findings.size(), 1u);
  EXPECT_EQ(findings[0].severity, Severity::kInfo);
  EXPECT_NE(findings[0].message.find("AuditInner"), std::string::npos);
}

/**
 * @test SecurityAuditTest.ConfigurationFindings
 * @brief Verify the findings for default, hardened and loose limits.
 *
 * @expected
 * - Defaults: one info finding (strict mode off).
 * - Strict mode on: a single success finding.
 * - Oversized limits: two warnings.
 */
TEST_F(SecurityAuditTest, ConfigurationFindings) {
  std::vector<Finding> findings = AuditConfiguration();
  ASSERT_EQ(findings.size(), 1u);
  EXPECT_EQ(findings[0].severity, Severity::kInfo);

  SecurityGuard::Instance().EnableStrictMode();
  findings = AuditConfiguration();
  ASSERT_EQ(findings.size(), 1u);
  EXPECT_EQ(findings[0].severity, Severity::kSuccess);

  ASSERT_TRUE(SecurityGuard::Instance().SetMaxBufferSize(200LL << 20));
  ASSERT_TRUE(SecurityGuard::Instance().SetMaxNestingDepth(5000));
  findings = AuditConfiguration();
  EXPECT_EQ(Count(findings, Severity::kWarning), 2u);
  EXPECT_EQ(Count(findings, Severity::kSuccess), 0u);
}

TEST_F(SecurityAuditTest, ChannelFindings) {
  auto state = std::make_shared<testing::FakeSocket::State>();
  PacketChannel channel(
      std::unique_ptr<platform::ISocket>(new testing::FakeSocket(state)));
  ASSERT_TRUE(channel.Open(platform::SocketType::kRaw, 1));

  std::vector<Finding> findings = AuditChannel(channel);
  EXPECT_EQ(Count(findings, Severity::kWarning), 1u);
  EXPECT_EQ(Count(findings, Severity::kCritical), 1u);

  testing::FakeTimeSource clock;
  std::shared_ptr<RateLimiter> limiter =
      RateLimiter::Create(10, 1, nullptr, &clock);
  limiter->Disable();
  channel.SetRateLimiter(limiter);
  findings = AuditChannel(channel);
  EXPECT_EQ(Count(findings, Severity::kWarning), 0u);
  EXPECT_EQ(Count(findings, Severity::kInfo), 1u);

  std::ostringstream oss;
  oss << findings[0];
  EXPECT_EQ(oss.str().compare(0, 7, "[info] "), 0) << oss.str();
}

TEST_F(SecurityAuditTest, ReportListsConfiguration) {
  const std::string report = GenerateReport();
  EXPECT_EQ(report.compare(0, 23, "# Security Audit Report"), 0);
  EXPECT_NE(report.find("max_buffer_size=10485760"), std::string::npos);
  EXPECT_NE(report.find("Strict mode is disabled"), std::string::npos);
  EXPECT_NE(report.find("## Recommendations"), std::string::npos);
}

}  // namespace wirepack
