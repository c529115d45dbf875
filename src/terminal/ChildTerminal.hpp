#ifndef __SPECTER_CHILD_TERMINAL_HPP__
#define __SPECTER_CHILD_TERMINAL_HPP__

#include "Headers.hpp"

namespace specter {
/**
 * @brief A change in the child's run state observed by `pollStatus()`.
 */
struct ChildStatus {
  enum Kind {
    /** `value` is the exit code. */
    EXITED,
    /** `value` is the terminating signal number. */
    SIGNALED,
    /** `value` is the stop signal number. */
    STOPPED,
    /** `value` is SIGCONT. */
    CONTINUED,
  };

  Kind kind;
  int value;

  /** @brief True when the child will never produce another status. */
  bool isTerminal() const { return kind == EXITED || kind == SIGNALED; }
};

/**
 * @brief A child process attached to a terminal, seen only through the
 * operations a session needs.
 *
 * `read` is called from the session's reader thread while the other calls
 * come from the supervisor or from the orchestrator, so implementations must
 * tolerate that split.
 */
class ChildTerminal {
 public:
  virtual ~ChildTerminal() {}

  /**
   * @brief Opens the terminal at the given size and launches the command.
   * @throws SpawnError if the terminal or the process cannot be created.
   */
  virtual void spawn(const string& command, const vector<string>& args,
                     uint16_t cols, uint16_t rows) = 0;
  /**
   * @brief Blocks until output is available.
   * @return bytes read, 0 once the output stream has closed, -1 on error
   * with errno set.
   */
  virtual ssize_t read(char* buf, size_t count) = 0;
  /**
   * @brief Writes all of `data` to the terminal input.
   * @throws IoError if the write fails.
   */
  virtual void write(const string& data) = 0;
  /**
   * @brief Applies a new window geometry.
   * @throws IoError if the OS rejects the change.
   */
  virtual void setWindowSize(uint16_t cols, uint16_t rows) = 0;
  virtual winsize getWindowSize() = 0;
  /** @brief Non-blocking check for a run state change of the child. */
  virtual optional<ChildStatus> pollStatus() = 0;
  /** @brief Unconditionally kills the child. */
  virtual void kill() = 0;
  virtual pid_t getPid() = 0;
};
}  // namespace specter

#endif
