#include "PtySession.hpp"

#include "SpecterErrors.hpp"
#include "Utf8Decoder.hpp"

namespace specter {
namespace {
// How long an exited child's remaining output may take to drain before the
// exit frame is sent anyway.
const std::chrono::milliseconds EXIT_DRAIN_TIMEOUT(250);

uint64_t toMillis(std::chrono::steady_clock::duration d) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(d).count();
}
}  // namespace

ReaderState::ReaderState()
    : lastActivity(
          std::chrono::steady_clock::now().time_since_epoch().count()),
      outputClosed(false),
      muted(false) {}

void ReaderState::markActivity() {
  lastActivity = std::chrono::steady_clock::now().time_since_epoch().count();
}

std::chrono::steady_clock::time_point ReaderState::getLastActivity() const {
  return std::chrono::steady_clock::time_point(
      std::chrono::steady_clock::duration(lastActivity.load()));
}

void ReaderState::setOutputClosed() {
  {
    lock_guard<std::mutex> guard(closedMutex);
    outputClosed = true;
  }
  closedCv.notify_all();
}

bool ReaderState::waitForOutputClosed(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(closedMutex);
  return closedCv.wait_for(lock, timeout, [this] { return outputClosed.load(); });
}

PtySession::PtySession(shared_ptr<ChildTerminal> _terminal,
                       const SessionOptions& _options)
    : terminal(_terminal),
      options(_options),
      channel(new FrameChannel()),
      readerState(new ReaderState()),
      childExited(false),
      finished(false),
      nextLivenessCheck(std::chrono::steady_clock::now()),
      killIssued(false),
      cancelled(false) {
  if (options.cols == 0 || options.rows == 0) {
    throw ConfigurationError("Window size must be greater than 0");
  }
  if (options.idleTimeout.count() <= 0) {
    throw ConfigurationError("Idle timeout must be greater than 0");
  }
  if (options.maxBufferedBytes == 0) {
    throw ConfigurationError("Buffer size must be greater than 0");
  }
  if (options.command.empty()) {
    throw ConfigurationError("No command to run");
  }
  promptMatcher.reset(new PromptMatcher(options.promptPatterns));

  terminal->spawn(options.command, options.args, options.cols, options.rows);
  readerState->markActivity();
  LOG(INFO) << "PTY session started with pid " << terminal->getPid();
}

PtySession::~PtySession() { cancel(); }

void PtySession::startReader() {
  if (readerThread.joinable()) {
    return;
  }
  readerThread =
      std::thread(&PtySession::readerLoop, terminal, channel, readerState);
}

void PtySession::readerLoop(shared_ptr<ChildTerminal> terminal,
                            shared_ptr<FrameChannel> channel,
                            shared_ptr<ReaderState> state) {
  el::Helpers::setThreadName("pty-reader");
  Utf8Decoder decoder;
  char buf[PTY_READ_CHUNK_SIZE];
  while (true) {
    ssize_t rc = terminal->read(buf, sizeof(buf));
    if (rc > 0) {
      state->markActivity();
      string text = decoder.decode(buf, rc);
      if (!text.empty() && !state->isMuted()) {
        channel->push(Frame(FrameType::STDOUT).withData(text));
      }
      continue;
    }
    if (rc == 0) {
      VLOG(1) << "PTY output stream closed";
    } else {
      LOG(ERROR) << "Error reading from PTY: " << strerror(GetErrno());
    }
    break;
  }
  string tail = decoder.finish();
  if (!tail.empty() && !state->isMuted()) {
    channel->push(Frame(FrameType::STDOUT).withData(tail));
  }
  state->setOutputClosed();
}

void PtySession::run() {
  startReader();
  std::unique_lock<std::mutex> lock(runMutex);
  while (!cancelled && !finished) {
    lock.unlock();
    auto now = std::chrono::steady_clock::now();
    tick(now);
    auto wakeup = nextWakeup(now);
    lock.lock();
    if (cancelled || finished) {
      break;
    }
    runCv.wait_until(lock, wakeup, [this] { return cancelled; });
  }
  VLOG(1) << "PTY session supervisor stopped";
}

void PtySession::tick(std::chrono::steady_clock::time_point now) {
  if (finished) {
    return;
  }
  if (now >= nextLivenessCheck) {
    nextLivenessCheck =
        now + std::chrono::milliseconds(LIVENESS_POLL_INTERVAL_MS);
    checkChildStatus();
    if (finished) {
      return;
    }
  }
  checkIdle(now);
  checkOverflow(now);
}

std::chrono::steady_clock::time_point PtySession::nextWakeup(
    std::chrono::steady_clock::time_point now) const {
  auto wakeup = nextLivenessCheck;
  auto lastActivity = readerState->getLastActivity();
  if (!idleReportedFor || *idleReportedFor != lastActivity) {
    wakeup = std::min(wakeup, lastActivity + options.idleTimeout);
  }
  if (overflowSince && !killIssued) {
    wakeup = std::min(wakeup, *overflowSince + options.overflowGrace);
  }
  return std::max(wakeup, now);
}

void PtySession::checkChildStatus() {
  optional<ChildStatus> status;
  try {
    status = terminal->pollStatus();
  } catch (const IoError& ioe) {
    LOG(ERROR) << "Error checking child status: " << ioe.what();
    childExited = true;
    readerState->mute();
    finished = true;
    channel->close();
    return;
  }
  if (!status) {
    return;
  }

  switch (status->kind) {
    case ChildStatus::STOPPED:
      LOG(INFO) << "Child stopped by " << SignalName(status->value);
      channel->push(
          Frame(FrameType::STOPPED).withSignal(SignalName(status->value)));
      return;
    case ChildStatus::CONTINUED:
      LOG(INFO) << "Child continued";
      channel->push(
          Frame(FrameType::CONTINUED).withSignal(SignalName(status->value)));
      return;
    case ChildStatus::EXITED:
    case ChildStatus::SIGNALED:
      break;
  }

  childExited = true;
  // Let output that was written before the exit reach the channel first.
  if (!readerState->waitForOutputClosed(EXIT_DRAIN_TIMEOUT)) {
    VLOG(1) << "Output still open after child exit, not waiting for it";
  }
  if (status->kind == ChildStatus::EXITED) {
    LOG(INFO) << "Child process exited with code: " << status->value;
    finishSession(Frame(FrameType::EXIT).withExitCode(status->value));
  } else {
    LOG(INFO) << "Child process killed by " << SignalName(status->value);
    finishSession(
        Frame(FrameType::SIGNAL).withSignal(SignalName(status->value)));
  }
}

void PtySession::checkIdle(std::chrono::steady_clock::time_point now) {
  auto lastActivity = readerState->getLastActivity();
  if (idleReportedFor && *idleReportedFor == lastActivity) {
    // Already reported; only new activity re-arms the timer.
    return;
  }
  if (now < lastActivity) {
    return;
  }
  auto elapsed = now - lastActivity;
  if (elapsed >= options.idleTimeout) {
    VLOG(2) << "Idle for " << toMillis(elapsed) << " ms";
    channel->push(Frame(FrameType::IDLE).withDuration(toMillis(elapsed)));
    idleReportedFor = lastActivity;
  }
}

void PtySession::checkOverflow(std::chrono::steady_clock::time_point now) {
  size_t pendingBytes = channel->pendingBytes();
  if (pendingBytes <= options.maxBufferedBytes) {
    if (overflowSince) {
      LOG(INFO) << "Frame backlog drained to " << pendingBytes << " bytes";
      overflowSince.reset();
    }
    return;
  }

  if (!overflowSince) {
    overflowSince = now;
    LOG(WARNING) << "Frame backlog of " << pendingBytes
                 << " bytes exceeds budget of " << options.maxBufferedBytes;
    channel->push(Frame(FrameType::OVERFLOW)
                      .withReason(to_string(pendingBytes) +
                                  " bytes buffered, limit is " +
                                  to_string(options.maxBufferedBytes)));
    return;
  }

  if (!killIssued && now - *overflowSince >= options.overflowGrace) {
    killIssued = true;
    string reason = "consumer did not drain " + to_string(pendingBytes) +
                    " buffered bytes within " +
                    to_string(options.overflowGrace.count()) + " ms";
    LOG(ERROR) << "Killing child: " << reason;
    terminal->kill();
    channel->push(Frame(FrameType::CAPSULE_KILL).withReason(reason));
  }
}

void PtySession::finishSession(const Frame& lastFrame) {
  readerState->mute();
  channel->push(lastFrame);
  finished = true;
  channel->close();
  runCv.notify_all();
}

void PtySession::writeInput(const string& data) {
  terminal->write(data);
  readerState->markActivity();
  if (Utf8Decoder::isValid(data)) {
    channel->push(Frame(FrameType::STDIN).withData(data));
  } else {
    channel->push(Frame(FrameType::STDIN).withBinaryData(data));
  }
}

void PtySession::resize(uint16_t cols, uint16_t rows) {
  if (cols == 0 || rows == 0) {
    throw IoError("Cannot resize pty to " + to_string(cols) + "x" +
                      to_string(rows),
                  EINVAL);
  }
  terminal->setWindowSize(cols, rows);
  readerState->markActivity();
  channel->push(Frame(FrameType::RESIZE).withSize(cols, rows));
}

void PtySession::cancel() {
  {
    lock_guard<std::mutex> guard(runMutex);
    cancelled = true;
  }
  runCv.notify_all();
  readerState->mute();
  if (readerThread.joinable()) {
    // A blocked read cannot be interrupted; the thread keeps its own
    // references and ends with the process.
    readerThread.detach();
  }
}
}  // namespace specter
