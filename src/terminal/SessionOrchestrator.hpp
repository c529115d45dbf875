#ifndef __SPECTER_SESSION_ORCHESTRATOR__
#define __SPECTER_SESSION_ORCHESTRATOR__

#include "FrameSink.hpp"
#include "OutputProcessor.hpp"
#include "PtySession.hpp"
#include "RecordingManager.hpp"

namespace specter {
/**
 * @brief Top-level event loop of one invocation.
 *
 * Multiplexes the session's frame channel, termination signals and the
 * control input with select(). Every frame goes through the processor, then
 * the recording, then the sink, one batch at a time.
 */
class SessionOrchestrator {
 public:
  /**
   * @param _inputFd descriptor carrying control input, or -1 to ignore
   * input.
   * @param _jsonInput when true each input line is a JSON frame, otherwise
   * input bytes are forwarded to the child verbatim.
   */
  SessionOrchestrator(shared_ptr<PtySession> _session,
                      shared_ptr<OutputProcessor> _processor,
                      shared_ptr<FrameSink> _sink,
                      shared_ptr<RecordingManager> _recording, int _inputFd,
                      bool _jsonInput);
  ~SessionOrchestrator();

  /**
   * @brief Routes SIGINT and SIGTERM into this loop. Only one orchestrator
   * may own the handlers at a time.
   */
  void installSignalHandlers();

  /**
   * @brief Runs until the session finishes, a termination signal arrives or
   * the sink stops accepting output, then shuts everything down.
   */
  void run();

  /** @brief Asks the loop to stop; safe to call from any thread. */
  void requestShutdown();

 protected:
  /** @return false once the sink failed. */
  bool drainFrames();
  bool dispatch(const Frame& frame);
  bool emitFrame(const Frame& frame);
  void handleInput();
  void handleControlLine(const string& line);
  void handleControlFrame(const Frame& frame);
  void shutdown();

  shared_ptr<PtySession> session;
  shared_ptr<OutputProcessor> processor;
  shared_ptr<FrameSink> sink;
  shared_ptr<RecordingManager> recording;
  shared_ptr<FrameChannel> channel;
  int inputFd;
  bool jsonInput;
  string inputBuffer;
  int shutdownPipe[2];
  bool signalHandlersInstalled;
  bool sinkFailed;
  bool shutdownDone;
  std::thread sessionThread;
};
}  // namespace specter

#endif  // __SPECTER_SESSION_ORCHESTRATOR__
