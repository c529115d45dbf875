#ifndef __SPECTER_RECORDING_MANAGER__
#define __SPECTER_RECORDING_MANAGER__

#include "Frame.hpp"

namespace specter {
/**
 * @brief Header fields of an asciinema v2 recording.
 */
struct RecordingHeader {
  uint16_t width = 80;
  uint16_t height = 24;
  optional<string> title;
  optional<string> command;
};

/**
 * @brief Writes frames to an asciinema v2 file: one JSON header line, then
 * one `[elapsed, code, data]` line per recorded event.
 *
 * stdout/stderr frames become "o" events and stdin frames "i" events. A
 * resize has no event of its own in the format and is written as a comment
 * on the output stream. Every other frame type is skipped.
 */
class AsciinemaRecorder {
 public:
  static const int FORMAT_VERSION = 2;

  /**
   * @brief Creates (or truncates) `path` and writes the header.
   * @throws RecordingError if the file cannot be created or written.
   */
  AsciinemaRecorder(const string& path, const RecordingHeader& header);
  ~AsciinemaRecorder();

  /**
   * @brief Appends the frame if its type is recorded and flushes.
   * @return true if a line was written.
   * @throws RecordingError if the write fails.
   */
  bool recordFrame(const Frame& frame);

  /** @brief Flushes and closes the file. Later calls do nothing. */
  void finish();

  bool isFinished() const { return finished; }
  const string& getPath() const { return path; }

 protected:
  void writeLine(const string& line);

  string path;
  std::ofstream out;
  std::chrono::steady_clock::time_point startTime;
  double lastElapsed;
  bool finished;
};

/**
 * @brief Owns at most one active recorder for the session.
 */
class RecordingManager {
 public:
  RecordingManager() {}

  /**
   * @brief Opens a recording at `path`.
   * @throws RecordingError if one is already active or the file cannot be
   * written.
   */
  void startRecording(const string& path, const RecordingHeader& header);

  /**
   * @brief Records the frame if a recording is active.
   * @throws RecordingError if the write fails; the recording is closed and
   * inactive afterwards.
   */
  void recordFrame(const Frame& frame);

  /** @brief Finishes the active recording, if any. */
  void stopRecording();

  bool isRecording() const { return recorder.get() != nullptr; }

 protected:
  unique_ptr<AsciinemaRecorder> recorder;
};
}  // namespace specter

#endif  // __SPECTER_RECORDING_MANAGER__
