#include <chrono>
#include <cstring>
#include <string>
#include <thread>

#include <gtest/gtest.h>

#include "relay/identity.hpp"
#include "relay/resume_tokens.hpp"

namespace {

using relay::ResumeTokenStore;

constexpr std::chrono::milliseconds kLongTtl{60000};

}  // namespace

TEST(ResumeTokenStoreTest, IssuedTokenValidatesOnlyForItsOwner) {
  ResumeTokenStore store(kLongTtl);
  auto token = store.IssueToken("aa01");
  ASSERT_TRUE(token.has_value());
  EXPECT_EQ(token->size(), 32u);
  EXPECT_TRUE(relay::IdentityGenerator::IsWellFormed(*token));

  EXPECT_TRUE(store.Validate("aa01", *token));
  EXPECT_FALSE(store.Validate("bb02", *token));
}

TEST(ResumeTokenStoreTest, PlayerIdAloneIsNotEnough) {
  ResumeTokenStore store(kLongTtl);
  ASSERT_TRUE(store.IssueToken("aa01").has_value());

  EXPECT_FALSE(store.Validate("aa01", ""));
  EXPECT_FALSE(store.Validate("aa01", "aa01"));
  EXPECT_FALSE(store.Validate("cc03", ""));
}

TEST(ResumeTokenStoreTest, ReissueInvalidatesPreviousToken) {
  ResumeTokenStore store(kLongTtl);
  auto first = store.IssueToken("aa01");
  auto second = store.IssueToken("aa01");
  ASSERT_TRUE(first && second);
  EXPECT_NE(*first, *second);

  EXPECT_FALSE(store.Validate("aa01", *first));
  EXPECT_TRUE(store.Validate("aa01", *second));
  EXPECT_EQ(store.Size(), 1u);
}

TEST(ResumeTokenStoreTest, ExpiredTokenIsRejected) {
  ResumeTokenStore store(std::chrono::milliseconds(20));
  auto token = store.IssueToken("aa01");
  ASSERT_TRUE(token.has_value());
  std::this_thread::sleep_for(std::chrono::milliseconds(60));

  EXPECT_FALSE(store.Validate("aa01", *token));
  EXPECT_EQ(store.Size(), 0u);
}

TEST(ResumeTokenStoreTest, EntropyFailureIssuesNothingAndRevokes) {
  bool fail = false;
  ResumeTokenStore store(kLongTtl, nullptr, [&fail](unsigned char* buffer, std::size_t len) {
    if (fail) {
      return false;
    }
    std::memset(buffer, 0x5a, len);
    return true;
  });
  auto token = store.IssueToken("aa01");
  ASSERT_TRUE(token.has_value());

  fail = true;
  EXPECT_FALSE(store.IssueToken("aa01").has_value());
  EXPECT_FALSE(store.Validate("aa01", *token));
}
