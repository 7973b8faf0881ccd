#include "serve/serving-policy.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <memory>
#include <utility>
#include <variant>

#include "serve/effective-config.hpp"
#include "serve/temp-file.hpp"

namespace serve {

class ServingPolicyTest : public ::testing::Test {
 protected:
  ServingPolicyTest() {
    tmp.writeFile("hello.txt", "hello");
    tmp.writeFile("docs/index.html", "<h1>docs</h1>");
    tmp.writeFile("docs/guide.md", "# guide");
    tmp.createDir("empty");
    notFoundPath = tmp.writeFile("404.html", "<h1>not found</h1>");
  }

  [[nodiscard]] ServingPolicy makePolicy(bool withNotFound = false, bool ok = false) const {
    auto config = std::make_shared<EffectiveConfig>();
    config->path = tmp.dirPath();
    if (withNotFound) {
      config->notFound = notFoundPath;
    }
    config->okOverride = ok;
    return ServingPolicy(std::move(config));
  }

  [[nodiscard]] std::filesystem::path under(const std::filesystem::path& rel) const {
    return std::filesystem::weakly_canonical(tmp.dirPath()) / rel;
  }

  test::ScopedTempDir tmp;
  std::filesystem::path notFoundPath;
};

TEST_F(ServingPolicyTest, ServesExistingFile) {
  const auto policy = makePolicy();
  EXPECT_EQ(policy.decide("/hello.txt"), Disposition(disposition::Serve{under("hello.txt")}));
  EXPECT_EQ(policy.decide("/docs/guide.md"), Disposition(disposition::Serve{under("docs/guide.md")}));
}

TEST_F(ServingPolicyTest, DecodesPercentEncoding) {
  tmp.writeFile("with space.txt", "x");
  const auto policy = makePolicy();
  EXPECT_EQ(policy.decide("/with%20space.txt"), Disposition(disposition::Serve{under("with space.txt")}));
}

TEST_F(ServingPolicyTest, IgnoresDotAndEmptySegments) {
  const auto policy = makePolicy();
  EXPECT_EQ(policy.decide("/./docs//guide.md"), Disposition(disposition::Serve{under("docs/guide.md")}));
}

TEST_F(ServingPolicyTest, DirectoryIndex) {
  const auto policy = makePolicy();
  EXPECT_EQ(policy.decide("/docs/"), Disposition(disposition::Serve{under("docs/index.html")}));
  EXPECT_EQ(policy.decide("/docs"), Disposition(disposition::RedirectToDirectory{"/docs/"}));
}

TEST_F(ServingPolicyTest, RootWithoutIndexFallsBack) {
  const auto policy = makePolicy();
  EXPECT_EQ(policy.decide("/"), Disposition(disposition::NotFoundEmpty{}));
  EXPECT_EQ(policy.decide("/empty/"), Disposition(disposition::NotFoundEmpty{}));
}

TEST_F(ServingPolicyTest, FileWithTrailingSlashFallsBack) {
  const auto policy = makePolicy();
  EXPECT_EQ(policy.decide("/hello.txt/"), Disposition(disposition::NotFoundEmpty{}));
}

TEST_F(ServingPolicyTest, MissingFileFallbacks) {
  EXPECT_EQ(makePolicy().decide("/nope"), Disposition(disposition::NotFoundEmpty{}));
  EXPECT_EQ(makePolicy(true).decide("/nope"), Disposition(disposition::NotFoundWithBody{notFoundPath}));
  EXPECT_EQ(makePolicy(true, true).decide("/app/route"), Disposition(disposition::OkOverride{notFoundPath}));
}

TEST_F(ServingPolicyTest, ExistingFileWinsOverOkOverride) {
  EXPECT_EQ(makePolicy(true, true).decide("/hello.txt"), Disposition(disposition::Serve{under("hello.txt")}));
}

TEST_F(ServingPolicyTest, TraversalIsOutOfRoot) {
  const auto policy = makePolicy(true, true);
  for (const char* path : {"/../etc/passwd", "/docs/../../secret", "/%2e%2e/secret", "/docs/%2E%2E", "/..",
                           "/a%00b", "/a%5c..%5cb", "/a\\b"}) {
    try {
      [[maybe_unused]] auto decision = policy.decide(path);
      ADD_FAILURE() << "expected ServingError for " << path;
    } catch (const ServingError& ex) {
      EXPECT_EQ(ex.kind(), ServingError::Kind::OutOfRoot) << path;
    }
  }
}

TEST_F(ServingPolicyTest, MalformedPercentEncoding) {
  const auto policy = makePolicy();
  for (const char* path : {"/bad%", "/bad%2", "/bad%zz"}) {
    try {
      [[maybe_unused]] auto decision = policy.decide(path);
      ADD_FAILURE() << "expected ServingError for " << path;
    } catch (const ServingError& ex) {
      EXPECT_EQ(ex.kind(), ServingError::Kind::MalformedPath) << path;
    }
  }
}

TEST_F(ServingPolicyTest, DotDotInsideSegmentNameIsAllowed) {
  tmp.writeFile("a..b", "x");
  EXPECT_EQ(makePolicy().decide("/a..b"), Disposition(disposition::Serve{under("a..b")}));
}

TEST_F(ServingPolicyTest, SymlinkLeavingRootIsFollowed) {
  test::ScopedTempDir outside;
  const auto target = outside.writeFile("shared.txt", "shared");
  std::filesystem::create_symlink(target, tmp.dirPath() / "shared.txt");
  EXPECT_EQ(makePolicy().decide("/shared.txt"), Disposition(disposition::Serve{under("shared.txt")}));
}

}  // namespace serve
