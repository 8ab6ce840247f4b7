#include "deadsimple/base-fd.hpp"

#include <fcntl.h>
#include <gtest/gtest.h>
#include <unistd.h>

#include <utility>

using namespace deadsimple;

namespace {

bool IsOpen(int fd) { return ::fcntl(fd, F_GETFD) != -1; }

}  // namespace

TEST(BaseFdTest, DefaultIsClosed) {
  BaseFd fd;
  EXPECT_FALSE(fd);
  EXPECT_EQ(fd.fd(), BaseFd::kClosedFd);
}

TEST(BaseFdTest, DestructorCloses) {
  int raw = ::dup(STDOUT_FILENO);
  ASSERT_NE(raw, -1);
  {
    BaseFd fd(raw);
    EXPECT_TRUE(fd);
  }
  EXPECT_FALSE(IsOpen(raw));
}

TEST(BaseFdTest, CloseIsIdempotent) {
  BaseFd fd(::dup(STDOUT_FILENO));
  EXPECT_TRUE(fd.close());
  EXPECT_FALSE(fd);
  EXPECT_TRUE(fd.close());
  EXPECT_FALSE(fd);
}

TEST(BaseFdTest, FailedCloseStillReleasesDescriptor) {
  int raw = ::dup(STDOUT_FILENO);
  ASSERT_NE(raw, -1);
  BaseFd fd(raw);
  ASSERT_EQ(::close(raw), 0);

  EXPECT_FALSE(fd.close());
  EXPECT_FALSE(fd);
  EXPECT_EQ(fd.fd(), BaseFd::kClosedFd);
  EXPECT_TRUE(fd.close());
}

TEST(BaseFdTest, MoveTransfersOwnership) {
  int raw = ::dup(STDOUT_FILENO);
  BaseFd first(raw);
  BaseFd second(std::move(first));
  EXPECT_FALSE(first);  // NOLINT(bugprone-use-after-move)
  EXPECT_EQ(second.fd(), raw);

  BaseFd third;
  third = std::move(second);
  EXPECT_EQ(third.fd(), raw);
  EXPECT_TRUE(IsOpen(raw));
}

TEST(BaseFdTest, ReleaseDoesNotClose) {
  int raw = ::dup(STDOUT_FILENO);
  {
    BaseFd fd(raw);
    EXPECT_EQ(fd.release(), raw);
  }
  EXPECT_TRUE(IsOpen(raw));
  ::close(raw);
}
