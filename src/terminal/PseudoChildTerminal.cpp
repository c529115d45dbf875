#include "PseudoChildTerminal.hpp"

#include "FdUtils.hpp"
#include "SpecterErrors.hpp"

namespace specter {
PseudoChildTerminal::PseudoChildTerminal()
    : pid(-1), masterFd(-1), reaped(false) {}

PseudoChildTerminal::~PseudoChildTerminal() {
  {
    lock_guard<std::mutex> guard(statusMutex);
    if (pid > 0 && !reaped) {
      ::kill(pid, SIGKILL);
      int status;
      ::waitpid(pid, &status, 0);
      reaped = true;
    }
  }
  if (masterFd >= 0) {
    ::close(masterFd);
  }
}

void PseudoChildTerminal::spawn(const string& command,
                                const vector<string>& args, uint16_t cols,
                                uint16_t rows) {
  if (pid > 0) {
    throw SpawnError("Child already spawned with pid " + to_string(pid));
  }

  // Everything the child needs is prepared before forking.
  vector<string> argvStorage;
  argvStorage.push_back(command);
  argvStorage.insert(argvStorage.end(), args.begin(), args.end());
  vector<char*> argv;
  for (auto& it : argvStorage) {
    argv.push_back(&it[0]);
  }
  argv.push_back(NULL);

  // The child reports a failed exec through this pipe; a successful exec
  // closes it without writing anything.
  int errorPipe[2];
  if (::pipe(errorPipe) == -1) {
    throw SpawnError(string("Cannot create exec status pipe: ") +
                     strerror(GetErrno()));
  }
  FdUtils::setCloseOnExec(errorPipe[0]);
  FdUtils::setCloseOnExec(errorPipe[1]);

  winsize win;
  memset(&win, 0, sizeof(win));
  win.ws_col = cols;
  win.ws_row = rows;

  pid_t forkedPid = forkpty(&masterFd, NULL, NULL, &win);
  switch (forkedPid) {
    case -1: {
      int forkErrno = GetErrno();
      ::close(errorPipe[0]);
      ::close(errorPipe[1]);
      masterFd = -1;
      throw SpawnError(string("Cannot open pty: ") + strerror(forkErrno));
    }
    case 0: {
      ::close(errorPipe[0]);
      execChild(argv.data(), errorPipe[1]);
      break;
    }
    default: {
      // parent
      break;
    }
  }

  ::close(errorPipe[1]);
  int execErrno = 0;
  ssize_t rc;
  do {
    rc = ::read(errorPipe[0], &execErrno, sizeof(execErrno));
  } while (rc < 0 && GetErrno() == EINTR);
  ::close(errorPipe[0]);

  if (rc == sizeof(execErrno)) {
    int status;
    ::waitpid(forkedPid, &status, 0);
    ::close(masterFd);
    masterFd = -1;
    throw SpawnError("Cannot launch '" + command + "': " + strerror(execErrno));
  }

  pid = forkedPid;
  FdUtils::setCloseOnExec(masterFd);
  VLOG(1) << "pty opened " << masterFd << " for pid " << pid;
}

void PseudoChildTerminal::execChild(char* const* argv, int errorFd) {
  // Deliver output exactly as the program wrote it: no \n -> \r\n mapping.
  termios tios;
  if (tcgetattr(STDIN_FILENO, &tios) == 0) {
    tios.c_oflag &= ~ONLCR;
    tcsetattr(STDIN_FILENO, TCSANOW, &tios);
  }

  // bash remembers the SIGCHLD disposition it was started with, so reset
  // what the parent may have changed before exec'ing.
  signal(SIGCHLD, SIG_DFL);
  signal(SIGPIPE, SIG_DFL);
  signal(SIGINT, SIG_DFL);
  signal(SIGTERM, SIG_DFL);
  sigset_t emptyMask;
  sigemptyset(&emptyMask);
  sigprocmask(SIG_SETMASK, &emptyMask, NULL);

  execvp(argv[0], argv);

  int execErrno = GetErrno();
  ssize_t ignored = ::write(errorFd, &execErrno, sizeof(execErrno));
  (void)ignored;
  _exit(127);
}

ssize_t PseudoChildTerminal::read(char* buf, size_t count) {
  while (true) {
    ssize_t rc = ::read(masterFd, buf, count);
    if (rc >= 0) {
      return rc;
    }
    if (GetErrno() == EINTR) {
      continue;
    }
    if (GetErrno() == EIO) {
      // Linux reports EIO once every slave descriptor is closed.
      return 0;
    }
    return rc;
  }
}

void PseudoChildTerminal::write(const string& data) {
  FdUtils::writeAll(masterFd, data.data(), data.length());
}

void PseudoChildTerminal::setWindowSize(uint16_t cols, uint16_t rows) {
  winsize win;
  memset(&win, 0, sizeof(win));
  win.ws_col = cols;
  win.ws_row = rows;
  if (ioctl(masterFd, TIOCSWINSZ, &win) == -1) {
    throw IoError("Cannot resize pty", GetErrno());
  }
}

winsize PseudoChildTerminal::getWindowSize() {
  winsize win;
  memset(&win, 0, sizeof(win));
  if (ioctl(masterFd, TIOCGWINSZ, &win) == -1) {
    throw IoError("Cannot read pty size", GetErrno());
  }
  return win;
}

optional<ChildStatus> PseudoChildTerminal::pollStatus() {
  lock_guard<std::mutex> guard(statusMutex);
  if (pid <= 0 || reaped) {
    return {};
  }
  int status;
  pid_t rc = ::waitpid(pid, &status, WNOHANG | WUNTRACED | WCONTINUED);
  if (rc == 0) {
    return {};
  }
  if (rc < 0) {
    if (GetErrno() == EINTR) {
      return {};
    }
    throw IoError("Cannot wait for pid " + to_string(pid), GetErrno());
  }
  if (WIFEXITED(status)) {
    reaped = true;
    return ChildStatus{ChildStatus::EXITED, WEXITSTATUS(status)};
  }
  if (WIFSIGNALED(status)) {
    reaped = true;
    return ChildStatus{ChildStatus::SIGNALED, WTERMSIG(status)};
  }
  if (WIFSTOPPED(status)) {
    return ChildStatus{ChildStatus::STOPPED, WSTOPSIG(status)};
  }
  if (WIFCONTINUED(status)) {
    return ChildStatus{ChildStatus::CONTINUED, SIGCONT};
  }
  LOG(ERROR) << "Unexpected wait status " << status << " for pid " << pid;
  return {};
}

void PseudoChildTerminal::kill() {
  lock_guard<std::mutex> guard(statusMutex);
  if (pid <= 0 || reaped) {
    return;
  }
  if (::kill(pid, SIGKILL) == -1 && GetErrno() != ESRCH) {
    STERROR << "Cannot kill pid " << pid << ": " << strerror(GetErrno());
  }
}
}  // namespace specter
