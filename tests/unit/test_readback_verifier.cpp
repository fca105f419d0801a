#include "scpi-driver/protocol/ReadbackVerifier.hpp"

#include <gtest/gtest.h>
#include <limits>

using namespace scpidrv;

TEST(ReadbackVerifier, NumericWithinOnePercent) {
  ReadbackVerifier verifier;
  EXPECT_TRUE(verifier.numeric_matches(100.0, 100.0));
  EXPECT_TRUE(verifier.numeric_matches(100.0, 100.9));
  EXPECT_TRUE(verifier.numeric_matches(100.0, 99.1));
  EXPECT_FALSE(verifier.numeric_matches(100.0, 101.5));
  EXPECT_FALSE(verifier.numeric_matches(-10.0, -10.2));
}

TEST(ReadbackVerifier, NumericZeroSetpoint) {
  ReadbackVerifier verifier;
  EXPECT_TRUE(verifier.numeric_matches(0.0, 0.0));
  EXPECT_FALSE(verifier.numeric_matches(0.0, 1e-6));
}

TEST(ReadbackVerifier, NaNNeverMatches) {
  ReadbackVerifier verifier;
  double nan = std::numeric_limits<double>::quiet_NaN();
  EXPECT_FALSE(verifier.numeric_matches(1.0, nan));
  EXPECT_FALSE(verifier.range_matches(1.0, nan));
}

TEST(ReadbackVerifier, RangeBand) {
  ReadbackVerifier verifier;
  // Device picks the next range step at or above the request
  EXPECT_TRUE(verifier.range_matches(0.15, 1.0));
  EXPECT_TRUE(verifier.range_matches(1.0, 1.0));
  EXPECT_TRUE(verifier.range_matches(1.04, 1.0));
  EXPECT_FALSE(verifier.range_matches(1.1, 1.0));
  EXPECT_FALSE(verifier.range_matches(0.1, 1.0));
}

TEST(ReadbackVerifier, CustomLimits) {
  VerifierLimits limits;
  limits.relative_tolerance = 0.1;
  ReadbackVerifier verifier(limits);
  EXPECT_TRUE(verifier.numeric_matches(100.0, 109.0));
  EXPECT_DOUBLE_EQ(verifier.limits().relative_tolerance, 0.1);
}

TEST(ReadbackVerifier, FlagsAndTokens) {
  EXPECT_TRUE(ReadbackVerifier::flag_matches(true, true));
  EXPECT_FALSE(ReadbackVerifier::flag_matches(true, false));
  EXPECT_TRUE(ReadbackVerifier::token_matches("current", " CURRENT "));
  EXPECT_FALSE(ReadbackVerifier::token_matches("current", "power"));
}
