#ifndef __SPECTER_FRAME__
#define __SPECTER_FRAME__

#include "Headers.hpp"
#include "SpecterErrors.hpp"

namespace specter {
/**
 * @brief Closed set of event tags carried in the `type` field of a frame.
 */
enum class FrameType {
  STDOUT,
  STDIN,
  STDERR,
  CURSOR,
  RESIZE,
  RESIZE_ACK,
  PROMPT,
  IDLE,
  LINE_UPDATE,
  OVERFLOW,
  SIGNAL,
  EXIT,
  STOPPED,
  CONTINUED,
  CAPSULE_KILL,
  PING,
  PONG,
};

/** @brief Returns the wire name of a frame type (e.g. "line_update"). */
string frameTypeToString(FrameType type);

/**
 * @brief Parses a wire name back into a frame type.
 * @throws SerializationError for names outside the protocol.
 */
FrameType frameTypeFromString(const string& name);

/**
 * @brief One discrete, typed protocol event.
 *
 * Frames are values: the `with*` methods return a modified copy and are only
 * meant to be chained while the frame is being built. Optional fields that
 * were never set are left out of the wire form entirely.
 */
class Frame {
 public:
  /** @brief Creates a frame stamped with the current wall-clock time. */
  explicit Frame(FrameType _type);
  Frame(FrameType _type, double _ts);

  Frame withData(const string& _data) const;
  /** @brief Base64-encodes raw bytes into `data` and sets `binary`. */
  Frame withBinaryData(const string& bytes) const;
  Frame withSize(uint16_t _cols, uint16_t _rows) const;
  Frame withExitCode(int32_t _code) const;
  Frame withSignal(const string& _signal) const;
  Frame withRegex(const string& _regex) const;
  Frame withDuration(uint64_t _durMs) const;
  Frame withReason(const string& _reason) const;

  FrameType getType() const { return type; }
  double getTimestamp() const { return ts; }
  const optional<string>& getData() const { return data; }
  bool isBinary() const { return binary.value_or(false); }
  const optional<uint16_t>& getCols() const { return cols; }
  const optional<uint16_t>& getRows() const { return rows; }
  const optional<int32_t>& getCode() const { return code; }
  const optional<string>& getSignal() const { return signal; }
  const optional<string>& getRegex() const { return regex; }
  const optional<uint64_t>& getDurationMs() const { return durMs; }
  const optional<string>& getReason() const { return reason; }

  /**
   * @brief Returns the payload bytes, decoding base64 when `binary` is set.
   * @throws SerializationError if a binary payload is not valid base64.
   */
  string getBinaryData() const;

  /** @brief Number of payload bytes this frame holds (0 without data). */
  size_t payloadSize() const { return data ? data->size() : 0; }

  json toJsonObject() const;
  /**
   * @brief Encodes the frame as a single-line JSON object.
   * @throws SerializationError if the payload cannot be encoded.
   */
  string toJson() const;

  static Frame fromJsonObject(const json& j);
  /**
   * @brief Decodes a frame from its wire form.
   * @throws SerializationError on malformed JSON, unknown types or
   * mistyped fields.
   */
  static Frame fromJson(const string& s);

  bool operator==(const Frame& other) const;
  bool operator!=(const Frame& other) const { return !(*this == other); }

 protected:
  double ts;
  FrameType type;
  optional<string> data;
  optional<bool> binary;
  optional<uint16_t> cols;
  optional<uint16_t> rows;
  optional<int32_t> code;
  optional<string> signal;
  optional<string> regex;
  optional<uint64_t> durMs;
  optional<string> reason;
};

inline std::ostream& operator<<(std::ostream& os, FrameType type) {
  os << frameTypeToString(type);
  return os;
}
}  // namespace specter

#endif  // __SPECTER_FRAME__
