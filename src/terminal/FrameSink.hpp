#ifndef __SPECTER_FRAME_SINK__
#define __SPECTER_FRAME_SINK__

#include "Frame.hpp"

namespace specter {
/**
 * @brief Final destination of processed frames.
 */
class FrameSink {
 public:
  virtual ~FrameSink() {}

  /**
   * @brief Delivers one frame and flushes it.
   * @throws IoError if the destination stopped accepting output.
   */
  virtual void emit(const Frame& frame) = 0;
};

/**
 * @brief Writes each frame as one JSON line, flushed immediately so
 * line-oriented consumers see it at once.
 */
class JsonLineSink : public FrameSink {
 public:
  explicit JsonLineSink(std::ostream& _out) : out(_out) {}
  virtual void emit(const Frame& frame);

 protected:
  std::ostream& out;
};

/**
 * @brief Writes output payloads verbatim and ignores every other frame.
 */
class PassthroughSink : public FrameSink {
 public:
  explicit PassthroughSink(std::ostream& _out) : out(_out) {}
  virtual void emit(const Frame& frame);

 protected:
  std::ostream& out;
};
}  // namespace specter

#endif  // __SPECTER_FRAME_SINK__
