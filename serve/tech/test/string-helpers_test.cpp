#include "serve/string-helpers.hpp"

#include <gtest/gtest.h>

namespace serve {

TEST(StringHelpersTest, TrimOws) {
  EXPECT_EQ(TrimOws("  \tvalue \t"), "value");
  EXPECT_EQ(TrimOws(""), "");
  EXPECT_EQ(TrimOws(" \t "), "");
  EXPECT_EQ(TrimOws("a b"), "a b");
}

TEST(StringHelpersTest, CaseInsensitiveEqual) {
  EXPECT_TRUE(CaseInsensitiveEqual("Content-Type", "content-type"));
  EXPECT_FALSE(CaseInsensitiveEqual("Content-Type", "content-typ"));
  EXPECT_TRUE(StartsWithCaseInsensitive("Bytes=0-1", "bytes="));
}

TEST(StringHelpersTest, HeaderListContains) {
  EXPECT_TRUE(HeaderListContains("keep-alive, Upgrade", "upgrade"));
  EXPECT_TRUE(HeaderListContains("close", "close"));
  EXPECT_FALSE(HeaderListContains("keep-alive", "close"));
  EXPECT_FALSE(HeaderListContains("", "close"));
}

}  // namespace serve
