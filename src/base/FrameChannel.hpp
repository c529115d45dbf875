#ifndef __SPECTER_FRAME_CHANNEL__
#define __SPECTER_FRAME_CHANNEL__

#include "Frame.hpp"

namespace specter {
/**
 * @brief Multi-producer, single-consumer queue of frames.
 *
 * Producers (the pty reader thread, the session supervisor, input and resize
 * calls) push from any thread. The single consumer either blocks in
 * `waitPop` or selects on `getWakeFd()` alongside other descriptors. The
 * channel tracks how many payload bytes are waiting so the session can apply
 * back-pressure when the consumer falls behind.
 */
class FrameChannel {
 public:
  FrameChannel();
  ~FrameChannel();

  /**
   * @brief Appends a frame to the tail of the queue.
   * @return false if the channel was already closed and the frame dropped.
   */
  bool push(const Frame &frame);

  /** @brief Removes the head frame without blocking. */
  bool pop(Frame *frame);

  /**
   * @brief Waits up to `timeout` for a frame.
   * @return false on timeout or when the channel is closed and empty.
   */
  bool waitPop(Frame *frame, std::chrono::milliseconds timeout);

  /** @brief Marks the end of the stream; queued frames stay poppable. */
  void close();

  bool isClosed() const;

  /** @brief True once the channel is closed and every frame was consumed. */
  bool isDrained() const;

  size_t size() const;

  /** @brief Payload bytes pushed but not yet popped. */
  size_t pendingBytes() const;

  /** @brief Readable whenever frames may be waiting or the channel closed. */
  int getWakeFd() const { return wakePipe[0]; }

  /** @brief Consumes pending wakeup bytes after select() fired. */
  void drainWakeFd();

 protected:
  void wake();

  mutable std::mutex channelMutex;
  std::condition_variable frameReady;
  std::deque<Frame> pending;
  size_t totalBytes;
  bool closed;
  int wakePipe[2];
};
}  // namespace specter

#endif  // __SPECTER_FRAME_CHANNEL__
