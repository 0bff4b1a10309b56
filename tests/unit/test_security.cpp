/**
 * @file test_security.cpp
 * @brief Unit tests for the security module
 */

#include <clipsync/security.h>
#include <gtest/gtest.h>

using namespace clipsync;

class SecurityTest : public ::testing::Test {
protected:
  void SetUp() override { ASSERT_TRUE(security_init().is_ok()); }
};

TEST_F(SecurityTest, InitIsIdempotent) {
  EXPECT_TRUE(security_init().is_ok());
  EXPECT_TRUE(is_security_initialized());
}

// ============================================================================
// Random Number Generation
// ============================================================================

TEST_F(SecurityTest, RandomBytesLength) {
  EXPECT_EQ(random_bytes(0).size(), 0u);
  EXPECT_EQ(random_bytes(32).size(), 32u);
}

TEST_F(SecurityTest, RandomBytesDiffer) {
  EXPECT_NE(random_bytes(32), random_bytes(32));
}

// ============================================================================
// Base64
// ============================================================================

TEST_F(SecurityTest, Base64KnownVector) {
  std::string text = "clipsync";
  EXPECT_EQ(base64_encode(Bytes(text.begin(), text.end())), "Y2xpcHN5bmM=");
}

TEST_F(SecurityTest, Base64Roundtrip) {
  Bytes data = random_bytes(100);

  auto decoded = base64_decode(base64_encode(data));
  ASSERT_TRUE(decoded.is_ok());
  EXPECT_EQ(decoded.value(), data);
}

TEST_F(SecurityTest, Base64RejectsInvalid) {
  EXPECT_TRUE(base64_decode("").is_error());
  EXPECT_TRUE(base64_decode("@@@@").is_error());
}
