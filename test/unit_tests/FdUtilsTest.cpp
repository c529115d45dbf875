#include "FdUtils.hpp"

#include "TestHeaders.hpp"

using namespace specter;

TEST_CASE("FdUtils writeAll writes every byte", "[FdUtils]") {
  int fds[2];
  FATAL_FAIL(::pipe(fds));

  string payload(4000, 'q');
  FdUtils::writeAll(fds[1], payload.data(), payload.size());
  ::close(fds[1]);

  string received;
  char buf[1024];
  ssize_t rc;
  while ((rc = ::read(fds[0], buf, sizeof(buf))) > 0) {
    received.append(buf, rc);
  }
  ::close(fds[0]);
  REQUIRE(received == payload);
}

TEST_CASE("FdUtils writeAll reports failures", "[FdUtils]") {
  SECTION("Invalid descriptor") {
    REQUIRE_THROWS_AS(FdUtils::writeAll(-1, "x", 1), IoError);
  }

  SECTION("Closed reader") {
    int fds[2];
    FATAL_FAIL(::pipe(fds));
    ::close(fds[0]);
    try {
      FdUtils::writeAll(fds[1], "x", 1);
      FAIL("writeAll should have thrown");
    } catch (const IoError& ioe) {
      REQUIRE(ioe.getErrno() == EPIPE);
    }
    ::close(fds[1]);
  }
}

TEST_CASE("FdUtils descriptor flags", "[FdUtils]") {
  int fds[2];
  FATAL_FAIL(::pipe(fds));
  FdUtils::setNonBlocking(fds[0]);
  FdUtils::setCloseOnExec(fds[0]);
  REQUIRE((fcntl(fds[0], F_GETFL) & O_NONBLOCK) != 0);
  REQUIRE((fcntl(fds[0], F_GETFD) & FD_CLOEXEC) != 0);

  char b;
  REQUIRE(::read(fds[0], &b, 1) == -1);
  REQUIRE(GetErrno() == EAGAIN);
  ::close(fds[0]);
  ::close(fds[1]);
}
