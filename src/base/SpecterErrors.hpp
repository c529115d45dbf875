#ifndef __SPECTER_ERRORS__
#define __SPECTER_ERRORS__

#include "Headers.hpp"

namespace specter {
/**
 * @brief Invalid window size, idle timeout, buffer size, mode or prompt
 * pattern. Raised before any child process is spawned.
 */
class ConfigurationError : public std::runtime_error {
 public:
  explicit ConfigurationError(const string& what) : std::runtime_error(what) {}
};

/**
 * @brief The OS could not create the pty or launch the child.
 */
class SpawnError : public std::runtime_error {
 public:
  explicit SpawnError(const string& what) : std::runtime_error(what) {}
};

/**
 * @brief A read, write or resize against the pty failed.
 */
class IoError : public std::runtime_error {
 public:
  IoError(const string& what, int _err)
      : std::runtime_error(what + ": " + strerror(_err)), err(_err) {}

  int getErrno() const { return err; }

 protected:
  int err;
};

/**
 * @brief A frame could not be encoded to or decoded from its wire form.
 */
class SerializationError : public std::runtime_error {
 public:
  explicit SerializationError(const string& what) : std::runtime_error(what) {}
};

/**
 * @brief The recording destination could not be created or written.
 */
class RecordingError : public std::runtime_error {
 public:
  explicit RecordingError(const string& what) : std::runtime_error(what) {}
};
}  // namespace specter

#endif  // __SPECTER_ERRORS__
