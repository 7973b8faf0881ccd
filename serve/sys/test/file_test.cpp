#include "serve/file.hpp"

#include <gtest/gtest.h>

#include <array>
#include <span>
#include <string>

#include "serve/temp-file.hpp"

namespace serve {

TEST(FileTest, MissingFileIsEmpty) {
  File file(std::string("/this/path/does/not/exist"));
  EXPECT_FALSE(file);
  EXPECT_EQ(file.size(), File::kError);
}

TEST(FileTest, SizeAndContent) {
  test::ScopedTempDir dir;
  const auto path = dir.writeFile("hello.txt", "Hello, file!");

  File file(path.string());
  ASSERT_TRUE(file);
  EXPECT_EQ(file.size(), 12U);
  EXPECT_EQ(file.loadAllContent(), "Hello, file!");
  EXPECT_NE(file.lastModified().time_since_epoch().count(), 0);
}

TEST(FileTest, ReadAtOffset) {
  test::ScopedTempDir dir;
  const auto path = dir.writeFile("digits.txt", "0123456789");

  File file(path.string());
  ASSERT_TRUE(file);
  std::array<char, 4> buf{};
  ASSERT_EQ(file.readAt(buf, 3), 4U);
  EXPECT_EQ(std::string(buf.data(), buf.size()), "3456");
  EXPECT_EQ(file.readAt(buf, 8), 2U);
  EXPECT_EQ(file.readAt(buf, 10), 0U);
}

TEST(FileTest, EmptyFile) {
  test::ScopedTempDir dir;
  const auto path = dir.writeFile("empty", "");

  File file(path.string());
  ASSERT_TRUE(file);
  EXPECT_EQ(file.size(), 0U);
  EXPECT_EQ(file.loadAllContent(), "");
}

}  // namespace serve
