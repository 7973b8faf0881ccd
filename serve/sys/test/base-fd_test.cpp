#include "serve/base-fd.hpp"

#include <fcntl.h>
#include <gtest/gtest.h>
#include <unistd.h>

#include <cerrno>
#include <utility>

namespace serve {

namespace {

bool IsOpen(int fd) { return ::fcntl(fd, F_GETFD) != -1 || errno != EBADF; }

}  // namespace

TEST(BaseFdTest, DefaultIsClosed) {
  BaseFd fd;
  EXPECT_FALSE(fd);
  EXPECT_EQ(fd.fd(), BaseFd::kClosedFd);
}

TEST(BaseFdTest, ClosesOnDestruction) {
  int raw = ::open("/dev/null", O_RDONLY | O_CLOEXEC);
  ASSERT_GE(raw, 0);
  {
    BaseFd fd(raw);
    EXPECT_TRUE(fd);
  }
  EXPECT_FALSE(IsOpen(raw));
}

TEST(BaseFdTest, MoveTransfersOwnership) {
  BaseFd first(::open("/dev/null", O_RDONLY | O_CLOEXEC));
  const int raw = first.fd();
  BaseFd second(std::move(first));
  EXPECT_FALSE(first);  // NOLINT(bugprone-use-after-move)
  EXPECT_EQ(second.fd(), raw);

  BaseFd third;
  third = std::move(second);
  EXPECT_EQ(third.fd(), raw);
  EXPECT_TRUE(IsOpen(raw));
}

TEST(BaseFdTest, ReleaseDoesNotClose) {
  BaseFd fd(::open("/dev/null", O_RDONLY | O_CLOEXEC));
  const int raw = fd.release();
  EXPECT_FALSE(fd);
  EXPECT_TRUE(IsOpen(raw));
  ::close(raw);
}

TEST(BaseFdTest, CloseIsIdempotent) {
  BaseFd fd(::open("/dev/null", O_RDONLY | O_CLOEXEC));
  fd.close();
  fd.close();
  EXPECT_FALSE(fd);
}

}  // namespace serve
