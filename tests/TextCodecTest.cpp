#include "fs/TextCodec.hpp"

#include <gtest/gtest.h>

using namespace w2n;

TEST(TextCodecTest, AcceptsUtf8) {
  EXPECT_TRUE(isUtf8(""));
  EXPECT_TRUE(isUtf8("plain ascii"));
  EXPECT_TRUE(isUtf8("caf\xC3\xA9"));
  EXPECT_TRUE(isUtf8("\xE2\x82\xAC"));
}

TEST(TextCodecTest, RejectsInvalidUtf8) {
  EXPECT_FALSE(isUtf8("caf\xE9"));
  EXPECT_FALSE(isUtf8("\xFF"));
  EXPECT_FALSE(isUtf8("\xC0\xAF"));     // overlong '/'
  EXPECT_FALSE(isUtf8("\xED\xA0\x80")); // surrogate
}

TEST(TextCodecTest, Latin1IsReencoded) {
  EXPECT_EQ(latin1ToUtf8("caf\xE9"), "caf\xC3\xA9");
  EXPECT_EQ(latin1ToUtf8("\xFF"), "\xC3\xBF");
  EXPECT_EQ(latin1ToUtf8("abc"), "abc");
}

TEST(TextCodecTest, DecodePrefersUtf8) {
  auto text = decodeText("caf\xC3\xA9");
  ASSERT_TRUE(text.has_value());
  EXPECT_EQ(*text, "caf\xC3\xA9");
}

TEST(TextCodecTest, DecodeFallsBackToLatin1) {
  auto text = decodeText("caf\xE9 C:\\Temp");
  ASSERT_TRUE(text.has_value());
  EXPECT_EQ(*text, "caf\xC3\xA9 C:\\Temp");
}
