#include "FdUtils.hpp"

#include "SpecterErrors.hpp"

namespace specter {
void FdUtils::writeAll(int fd, const char* buf, size_t count) {
  if (fd < 0) {
    throw IoError("Invalid file descriptor for writeAll", EBADF);
  }
  if (count == 0) {
    return;
  }

  size_t bytesWritten = 0;
  do {
    ssize_t rc = ::write(fd, buf + bytesWritten, count - bytesWritten);
    if (rc < 0) {
      auto localErrno = GetErrno();
      if (localErrno == EINTR) {
        continue;
      }
      if (localErrno == EAGAIN || localErrno == EWOULDBLOCK) {
        // This is fine, just keep retrying
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
        continue;
      }
      LOG(ERROR) << "Cannot write to fd " << fd << ": " << strerror(localErrno);
      throw IoError("Cannot write to fd " + to_string(fd), localErrno);
    }
    if (rc == 0) {
      throw IoError("Cannot write to fd " + to_string(fd), EPIPE);
    }
    bytesWritten += rc;
  } while (bytesWritten != count);
}

void FdUtils::setNonBlocking(int fd) {
  int opts = fcntl(fd, F_GETFL);
  FATAL_FAIL(opts);
  FATAL_FAIL(fcntl(fd, F_SETFL, opts | O_NONBLOCK));
}

void FdUtils::setCloseOnExec(int fd) {
  int opts = fcntl(fd, F_GETFD);
  FATAL_FAIL(opts);
  FATAL_FAIL(fcntl(fd, F_SETFD, opts | FD_CLOEXEC));
}
}  // namespace specter
