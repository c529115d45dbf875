#ifndef __SPECTER_OUTPUT_PROCESSOR__
#define __SPECTER_OUTPUT_PROCESSOR__

#include "Frame.hpp"
#include "PromptMatcher.hpp"

namespace specter {
/**
 * @brief How terminal output is transformed before it reaches the client.
 */
enum class TokenMode {
  /** Frames pass through untouched. */
  RAW,
  /** ANSI stripping, line coalescing and progress de-duplication. */
  COMPACT,
  /** COMPACT plus prompt detection. */
  PARSED,
};

string tokenModeToString(TokenMode mode);
/** @throws ConfigurationError for names other than raw/compact/parsed. */
TokenMode tokenModeFromString(const string& name);

/**
 * @brief Stateful frame transform; each input frame yields zero or more
 * output frames.
 */
class OutputProcessor {
 public:
  /** @brief Output is coalesced until a newline or more than this many bytes. */
  static constexpr size_t LINE_BUFFER_THRESHOLD = 512;

  explicit OutputProcessor(TokenMode _mode,
                           shared_ptr<PromptMatcher> _promptMatcher = nullptr);

  vector<Frame> processFrame(const Frame& frame);

  /**
   * @brief Emits any buffered partial line as a final stdout frame. Must be
   * called before shutdown.
   */
  vector<Frame> flush();

  TokenMode getMode() const { return mode; }
  const string& getLineBuffer() const { return lineBuffer; }

  /** @brief Removes CSI escape sequences (ESC [ params letter). */
  static string stripAnsi(const string& data);

  /**
   * @brief Strips ANSI sequences, turns \r\n and lone \r into \n and trims
   * trailing whitespace from every line.
   */
  static string cleanOutput(const string& data);

  /**
   * @brief True for spinner glyphs, percentages, bracket progress bars,
   * progress keywords, or more than two carriage returns.
   */
  static bool isProgressUpdate(const string& cleaned, int carriageReturns);

 protected:
  vector<Frame> processCompact(const Frame& frame);
  vector<Frame> processParsed(const Frame& frame);
  vector<Frame> takeLineBuffer();
  vector<Frame> handleProgressUpdate(const Frame& frame,
                                     const string& cleaned);
  void matchPrompts(const Frame& frame, bool skipFirstLine,
                    vector<Frame>* out);

  TokenMode mode;
  shared_ptr<PromptMatcher> promptMatcher;
  /** @brief Output not yet terminated by a newline. */
  string lineBuffer;
  /** @brief Text of the last line_update, for de-duplication. */
  optional<string> lastLineUpdate;
  /** @brief Start of an escape sequence whose end has not arrived yet. */
  string pendingEscape;
  /** @brief The partial line in `lineBuffer` already produced a prompt. */
  bool bufferPromptReported;
};
}  // namespace specter

#endif  // __SPECTER_OUTPUT_PROCESSOR__
