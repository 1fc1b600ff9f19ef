// Copyright (c) 2025 The Wirepack Authors
/**
 * @file security_guard_test.cc
 * @test Process-wide security limits
 * @brief Defaults, validation of new limits and strict mode.
 */
#include "wirepack/security_guard.hpp"

#include <gtest/gtest.h>

#include <sstream>
#include <thread>
#include <vector>

#include "test_util.hpp"

namespace wirepack {

class SecurityGuardLimitsTest : public testing::SecurityGuardTest {};

TEST_F(SecurityGuardLimitsTest, Defaults) {
  SecurityGuard& g = SecurityGuard::Instance();
  EXPECT_EQ(g.MaxBufferSize(), 10u * 1024u * 1024u);
  EXPECT_EQ(g.MaxNestingDepth(), 100u);
  EXPECT_FALSE(g.IsStrictMode());
  EXPECT_EQ(&g, &SecurityGuard::Instance());
}

/**
 * @test SecurityGuardLimitsTest.RejectsNonPositiveLimits
 * @brief Verify that invalid limits fail and leave the previous value.
 *
 * @expected
 * - 0 and negative values fail with kSecurityConfig.
 * - Valid values are applied and visible through Limits().
 */
TEST_F(SecurityGuardLimitsTest, RejectsNonPositiveLimits) {
  SecurityGuard& g = SecurityGuard::Instance();
  Error err;
  EXPECT_FALSE(g.SetMaxBufferSize(0, &err));
  EXPECT_EQ(err.code, ErrorCode::kSecurityConfig);
  EXPECT_EQ(err.message, "Max buffer size must be positive");
  EXPECT_FALSE(g.SetMaxNestingDepth(-3, &err));
  EXPECT_EQ(err.code, ErrorCode::kSecurityConfig);
  EXPECT_EQ(g.MaxBufferSize(), SecurityGuard::kDefaultMaxBufferSize);
  EXPECT_EQ(g.MaxNestingDepth(), SecurityGuard::kDefaultMaxNestingDepth);

  ASSERT_TRUE(g.SetMaxBufferSize(4096, &err));
  ASSERT_TRUE(g.SetMaxNestingDepth(8, &err));
  g.EnableStrictMode();
  const SecurityLimits limits = g.Limits();
  EXPECT_EQ(limits.max_buffer_size, 4096u);
  EXPECT_EQ(limits.max_nesting_depth, 8u);
  EXPECT_TRUE(limits.strict_mode);

  std::ostringstream oss;
  oss << limits;
  EXPECT_EQ(oss.str(),
            "SecurityLimits{max_buffer_size=4096, max_nesting_depth=8, "
            "strict_mode=on}");

  g.DisableStrictMode();
  EXPECT_FALSE(g.IsStrictMode());
  g.Reset();
  EXPECT_EQ(g.MaxBufferSize(), SecurityGuard::kDefaultMaxBufferSize);
}

TEST_F(SecurityGuardLimitsTest, ConcurrentUpdatesStayValid) {
  SecurityGuard& g = SecurityGuard::Instance();
  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([&g, t] {
      for (int i = 1; i <= 200; ++i) {
        ASSERT_TRUE(g.SetMaxBufferSize(i * (t + 1)));
        ASSERT_GT(g.Limits().max_buffer_size, 0u);
      }
    });
  }
  for (std::thread& th : threads) th.join();
  EXPECT_GT(g.MaxBufferSize(), 0u);
}

}  // namespace wirepack
