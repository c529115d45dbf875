#ifndef __SPECTER_TEST_HEADERS__
#define __SPECTER_TEST_HEADERS__

#include "Headers.hpp"
#include "SpecterErrors.hpp"

#include <catch2/catch_session.hpp>
#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

namespace specter {
/** @brief Fresh path under the temp directory that does not exist yet. */
inline string MakeTempPath(const string& prefix) {
  string pattern = GetTempDirectory() + prefix + "_XXXXXXXX";
  int fd = ::mkstemp(&pattern[0]);
  FATAL_FAIL(fd);
  ::close(fd);
  ::unlink(pattern.c_str());
  return pattern;
}

/** @brief Polls `condition` every few milliseconds until it holds. */
template <typename Predicate>
bool WaitFor(Predicate condition, std::chrono::milliseconds timeout) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while (!condition()) {
    if (std::chrono::steady_clock::now() >= deadline) {
      return false;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  return true;
}
}  // namespace specter

#endif  // __SPECTER_TEST_HEADERS__
