#ifndef __SPECTER_UTF8_DECODER__
#define __SPECTER_UTF8_DECODER__

#include "Headers.hpp"

namespace specter {
/**
 * @brief Streaming, lossy UTF-8 decoder.
 *
 * Invalid sequences become U+FFFD. A multi-byte sequence that is cut off at
 * the end of one chunk is held back and completed by the next chunk, so
 * splitting a stream at arbitrary byte offsets never corrupts characters.
 */
class Utf8Decoder {
 public:
  Utf8Decoder() {}

  /** @brief Decodes the next chunk, returning only complete characters. */
  string decode(const char* buf, size_t count);
  string decode(const string& s) { return decode(s.data(), s.size()); }

  /** @brief Flushes any held-back partial sequence as U+FFFD. */
  string finish();

  bool hasPartialSequence() const { return !carry.empty(); }

  /** @brief One-shot lossy decode of a complete buffer. */
  static string decodeLossy(const string& s);

  /** @brief True if the buffer is complete, well-formed UTF-8. */
  static bool isValid(const string& s);

 protected:
  string carry;
};
}  // namespace specter

#endif  // __SPECTER_UTF8_DECODER__
