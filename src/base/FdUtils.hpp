#ifndef __SPECTER_FD_UTILS__
#define __SPECTER_FD_UTILS__

#include "Headers.hpp"

namespace specter {
/**
 * @brief Blocking write loops and descriptor flag helpers for pty and pipe
 * file descriptors.
 */
class FdUtils {
 public:
  /**
   * @brief Writes the entire buffer to the descriptor, retrying on EAGAIN
   * and EINTR.
   * @throws IoError if the descriptor rejects the write.
   */
  static void writeAll(int fd, const char* buf, size_t count);

  static void setNonBlocking(int fd);

  static void setCloseOnExec(int fd);
};
}  // namespace specter
#endif  // __SPECTER_FD_UTILS__
