#ifndef __SPECTER_PTY_SESSION__
#define __SPECTER_PTY_SESSION__

#include "ChildTerminal.hpp"
#include "FrameChannel.hpp"
#include "PromptMatcher.hpp"

namespace specter {
/**
 * @brief Everything needed to start one session.
 */
struct SessionOptions {
  string command;
  vector<string> args;
  uint16_t cols = 120;
  uint16_t rows = 40;
  std::chrono::milliseconds idleTimeout = std::chrono::milliseconds(200);
  vector<string> promptPatterns;
  /** @brief Undelivered payload bytes tolerated before reporting overflow. */
  size_t maxBufferedBytes = 8 * 1024 * 1024;
  /** @brief How long an overflow may last before the child is killed. */
  std::chrono::milliseconds overflowGrace = std::chrono::milliseconds(5000);
};

/**
 * @brief State shared between a session and its reader thread. The reader
 * owns a reference so a cancelled session can be destroyed while a read is
 * still blocked.
 */
class ReaderState {
 public:
  ReaderState();

  void markActivity();
  std::chrono::steady_clock::time_point getLastActivity() const;

  void setOutputClosed();
  /** @brief Waits for the reader to hit end of stream. */
  bool waitForOutputClosed(std::chrono::milliseconds timeout);

  /** @brief Once muted, the reader drops everything it reads. */
  void mute() { muted = true; }
  bool isMuted() const { return muted; }

 protected:
  std::atomic<int64_t> lastActivity;
  std::atomic<bool> outputClosed;
  std::atomic<bool> muted;
  std::mutex closedMutex;
  std::condition_variable closedCv;
};

/**
 * @brief Owns the child terminal and turns everything it does into frames.
 *
 * Output is read on a dedicated thread because pty reads block. Idle
 * detection, liveness polling and overflow enforcement happen in `tick()`,
 * which `run()` calls on the supervisor thread. `writeInput()` and
 * `resize()` may be called from another thread. All frames land in a single
 * `FrameChannel`.
 */
class PtySession {
 public:
  /**
   * @brief Validates the options and spawns the command.
   * @throws ConfigurationError for zero sizes, timeouts or buffer budget, or
   * an invalid prompt pattern.
   * @throws SpawnError if the child cannot be launched.
   */
  PtySession(shared_ptr<ChildTerminal> _terminal,
             const SessionOptions& _options);
  ~PtySession();

  /**
   * @brief Starts the reader and supervises the child until it exits or
   * the session is cancelled.
   */
  void run();

  /** @brief Starts the reader thread; later calls do nothing. */
  void startReader();

  /**
   * @brief Runs the periodic checks as of `now`: liveness (at most every
   * LIVENESS_POLL_INTERVAL_MS), idle crossing and back-pressure.
   */
  void tick(std::chrono::steady_clock::time_point now);

  /** @brief Earliest time the next `tick()` has something to do. */
  std::chrono::steady_clock::time_point nextWakeup(
      std::chrono::steady_clock::time_point now) const;

  /**
   * @brief Writes input verbatim to the child and mirrors it as a stdin
   * frame.
   * @throws IoError if the write fails.
   */
  void writeInput(const string& data);

  /**
   * @brief Resizes the terminal and emits a resize frame.
   * @throws IoError if the OS rejects the new size.
   */
  void resize(uint16_t cols, uint16_t rows);

  /** @brief True until the child has been observed to exit. */
  bool isAlive() const { return !childExited; }

  /** @brief True once the session stopped producing frames. */
  bool isFinished() const { return finished; }

  /** @brief Stops supervision; an in-flight read is abandoned. */
  void cancel();

  shared_ptr<FrameChannel> getFrameChannel() { return channel; }
  shared_ptr<PromptMatcher> getPromptMatcher() { return promptMatcher; }

 protected:
  static void readerLoop(shared_ptr<ChildTerminal> terminal,
                         shared_ptr<FrameChannel> channel,
                         shared_ptr<ReaderState> state);

  void checkChildStatus();
  void checkIdle(std::chrono::steady_clock::time_point now);
  void checkOverflow(std::chrono::steady_clock::time_point now);
  void finishSession(const Frame& lastFrame);

  shared_ptr<ChildTerminal> terminal;
  SessionOptions options;
  shared_ptr<PromptMatcher> promptMatcher;
  shared_ptr<FrameChannel> channel;
  shared_ptr<ReaderState> readerState;
  std::thread readerThread;

  std::atomic<bool> childExited;
  std::atomic<bool> finished;

  std::chrono::steady_clock::time_point nextLivenessCheck;
  /** @brief Activity timestamp already reported idle, if any. */
  optional<std::chrono::steady_clock::time_point> idleReportedFor;
  optional<std::chrono::steady_clock::time_point> overflowSince;
  bool killIssued;

  std::mutex runMutex;
  std::condition_variable runCv;
  bool cancelled;
};
}  // namespace specter

#endif  // __SPECTER_PTY_SESSION__
