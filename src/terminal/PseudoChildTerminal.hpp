#ifndef __SPECTER_PSEUDO_CHILD_TERMINAL_HPP__
#define __SPECTER_PSEUDO_CHILD_TERMINAL_HPP__

#include "ChildTerminal.hpp"

namespace specter {
/**
 * @brief Runs the child on a real pseudo-terminal created with forkpty().
 */
class PseudoChildTerminal : public ChildTerminal {
 public:
  PseudoChildTerminal();
  virtual ~PseudoChildTerminal();

  virtual void spawn(const string& command, const vector<string>& args,
                     uint16_t cols, uint16_t rows);
  virtual ssize_t read(char* buf, size_t count);
  virtual void write(const string& data);
  virtual void setWindowSize(uint16_t cols, uint16_t rows);
  virtual winsize getWindowSize();
  virtual optional<ChildStatus> pollStatus();
  virtual void kill();
  virtual pid_t getPid() { return pid; }

  int getFd() { return masterFd; }

 protected:
  /** @brief Runs in the forked child; never returns. */
  void execChild(char* const* argv, int errorFd);

  pid_t pid;
  int masterFd;
  /** @brief Set once waitpid() has collected the child's final status. */
  bool reaped;
  /** @brief Guards `reaped` so kill() never targets a recycled pid. */
  std::mutex statusMutex;
};
}  // namespace specter

#endif
