#include "SessionOrchestrator.hpp"

#include "FdUtils.hpp"

namespace specter {
namespace {
// Write end of the self-pipe of the orchestrator owning the signal handlers.
volatile sig_atomic_t signalPipeFd = -1;

void terminationSignalHandler(int) {
  int savedErrno = errno;
  int fd = signalPipeFd;
  if (fd >= 0) {
    char c = 1;
    // A full pipe already carries a pending wakeup.
    ssize_t ignored = ::write(fd, &c, 1);
    (void)ignored;
  }
  errno = savedErrno;
}

const int INPUT_CHUNK_SIZE = 4096;
}  // namespace

SessionOrchestrator::SessionOrchestrator(
    shared_ptr<PtySession> _session, shared_ptr<OutputProcessor> _processor,
    shared_ptr<FrameSink> _sink, shared_ptr<RecordingManager> _recording,
    int _inputFd, bool _jsonInput)
    : session(_session),
      processor(_processor),
      sink(_sink),
      recording(_recording),
      channel(_session->getFrameChannel()),
      inputFd(_inputFd),
      jsonInput(_jsonInput),
      signalHandlersInstalled(false),
      sinkFailed(false),
      shutdownDone(false) {
  FATAL_FAIL(::pipe(shutdownPipe));
  FdUtils::setNonBlocking(shutdownPipe[0]);
  FdUtils::setNonBlocking(shutdownPipe[1]);
  FdUtils::setCloseOnExec(shutdownPipe[0]);
  FdUtils::setCloseOnExec(shutdownPipe[1]);
}

SessionOrchestrator::~SessionOrchestrator() {
  try {
    shutdown();
  } catch (const std::exception& ex) {
    LOG(ERROR) << "Error during shutdown: " << ex.what();
  }
  if (signalHandlersInstalled) {
    ::signal(SIGINT, SIG_DFL);
    ::signal(SIGTERM, SIG_DFL);
    signalPipeFd = -1;
  }
  ::close(shutdownPipe[0]);
  ::close(shutdownPipe[1]);
}

void SessionOrchestrator::installSignalHandlers() {
  signalPipeFd = shutdownPipe[1];
  struct sigaction action;
  memset(&action, 0, sizeof(action));
  action.sa_handler = terminationSignalHandler;
  sigemptyset(&action.sa_mask);
  FATAL_FAIL(::sigaction(SIGINT, &action, NULL));
  FATAL_FAIL(::sigaction(SIGTERM, &action, NULL));
  signalHandlersInstalled = true;
}

void SessionOrchestrator::requestShutdown() {
  char c = 1;
  ssize_t rc = ::write(shutdownPipe[1], &c, 1);
  if (rc < 0 && GetErrno() != EAGAIN && GetErrno() != EWOULDBLOCK) {
    LOG(ERROR) << "Cannot signal shutdown: " << strerror(GetErrno());
  }
}

void SessionOrchestrator::run() {
  el::Helpers::setThreadName("orchestrator");
  shared_ptr<PtySession> supervised = session;
  sessionThread = std::thread([supervised]() {
    el::Helpers::setThreadName("pty-session");
    supervised->run();
  });

  int wakeFd = channel->getWakeFd();
  while (true) {
    fd_set rfd;
    timeval tv;

    FD_ZERO(&rfd);
    FD_SET(wakeFd, &rfd);
    int maxfd = wakeFd;
    FD_SET(shutdownPipe[0], &rfd);
    maxfd = max(maxfd, shutdownPipe[0]);
    if (inputFd >= 0) {
      FD_SET(inputFd, &rfd);
      maxfd = max(maxfd, inputFd);
    }
    tv.tv_sec = 0;
    tv.tv_usec = LIVENESS_POLL_INTERVAL_MS * 1000;
    int rc = select(maxfd + 1, &rfd, NULL, NULL, &tv);
    if (rc < 0) {
      if (GetErrno() == EINTR) {
        continue;
      }
      STERROR << "select() failed: " << strerror(GetErrno());
      break;
    }

    if (FD_ISSET(shutdownPipe[0], &rfd)) {
      LOG(INFO) << "Termination requested, shutting down";
      break;
    }

    if (FD_ISSET(wakeFd, &rfd)) {
      channel->drainWakeFd();
    }
    if (!drainFrames()) {
      break;
    }
    if (channel->isDrained()) {
      LOG(INFO) << "Session finished";
      break;
    }

    if (inputFd >= 0 && FD_ISSET(inputFd, &rfd)) {
      handleInput();
    }
  }

  shutdown();
}

bool SessionOrchestrator::drainFrames() {
  Frame frame(FrameType::STDOUT, 0);
  while (channel->pop(&frame)) {
    if (!dispatch(frame)) {
      return false;
    }
  }
  return true;
}

bool SessionOrchestrator::dispatch(const Frame& frame) {
  vector<Frame> processed = processor->processFrame(frame);
  for (const Frame& out : processed) {
    if (!emitFrame(out)) {
      return false;
    }
  }
  return true;
}

bool SessionOrchestrator::emitFrame(const Frame& frame) {
  if (sinkFailed) {
    return false;
  }
  if (recording) {
    try {
      recording->recordFrame(frame);
    } catch (const RecordingError& re) {
      LOG(ERROR) << "Recording stopped: " << re.what();
    }
  }
  try {
    sink->emit(frame);
  } catch (const IoError& ioe) {
    LOG(ERROR) << "Output sink closed: " << ioe.what();
    sinkFailed = true;
    return false;
  }
  return true;
}

void SessionOrchestrator::handleInput() {
  char buf[INPUT_CHUNK_SIZE];
  ssize_t rc = ::read(inputFd, buf, sizeof(buf));
  if (rc < 0) {
    if (GetErrno() == EINTR || GetErrno() == EAGAIN) {
      return;
    }
    LOG(ERROR) << "Error reading control input: " << strerror(GetErrno());
    inputFd = -1;
    return;
  }
  if (rc == 0) {
    LOG(INFO) << "Control input closed";
    if (jsonInput && !inputBuffer.empty()) {
      string line;
      line.swap(inputBuffer);
      handleControlLine(line);
    }
    inputFd = -1;
    return;
  }

  if (!jsonInput) {
    try {
      session->writeInput(string(buf, rc));
    } catch (const IoError& ioe) {
      LOG(ERROR) << "Cannot forward input: " << ioe.what();
    }
    return;
  }

  inputBuffer.append(buf, rc);
  size_t newline;
  while ((newline = inputBuffer.find('\n')) != string::npos) {
    string line = inputBuffer.substr(0, newline);
    inputBuffer.erase(0, newline + 1);
    handleControlLine(line);
  }
}

void SessionOrchestrator::handleControlLine(const string& line) {
  if (!line.empty() && line.back() == '\r') {
    handleControlLine(line.substr(0, line.size() - 1));
    return;
  }
  if (line.find_first_not_of(" \t") == string::npos) {
    return;
  }
  try {
    handleControlFrame(Frame::fromJson(line));
  } catch (const SerializationError& se) {
    LOG(WARNING) << "Skipping malformed control frame: " << se.what();
  }
}

void SessionOrchestrator::handleControlFrame(const Frame& frame) {
  VLOG(2) << "Got control frame " << frame.getType();
  switch (frame.getType()) {
    case FrameType::STDIN: {
      string data = frame.isBinary() ? frame.getBinaryData()
                                     : frame.getData().value_or("");
      try {
        session->writeInput(data);
      } catch (const IoError& ioe) {
        LOG(ERROR) << "Cannot write input to child: " << ioe.what();
      }
      break;
    }
    case FrameType::RESIZE:
      if (!frame.getCols() || !frame.getRows()) {
        LOG(WARNING) << "Ignoring resize frame without cols and rows";
        break;
      }
      try {
        session->resize(*frame.getCols(), *frame.getRows());
      } catch (const IoError& ioe) {
        LOG(ERROR) << "Cannot resize terminal: " << ioe.what();
      }
      break;
    case FrameType::PING:
      emitFrame(Frame(FrameType::PONG));
      break;
    case FrameType::RESIZE_ACK:
      VLOG(1) << "Client acknowledged resize";
      break;
    default:
      LOG(WARNING) << "Ignoring control frame of type " << frame.getType();
      break;
  }
}

void SessionOrchestrator::shutdown() {
  if (shutdownDone) {
    return;
  }
  shutdownDone = true;

  for (const Frame& frame : processor->flush()) {
    if (!emitFrame(frame)) {
      break;
    }
  }

  session->cancel();
  if (sessionThread.joinable()) {
    sessionThread.join();
  }

  if (recording) {
    try {
      recording->stopRecording();
    } catch (const RecordingError& re) {
      LOG(ERROR) << "Cannot finalize recording: " << re.what();
    }
  }
  VLOG(1) << "Orchestrator shut down";
}
}  // namespace specter
