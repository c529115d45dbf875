#include "Frame.hpp"

namespace specter {
namespace {
const std::array<pair<FrameType, const char*>, 17> FRAME_TYPE_NAMES = {{
    {FrameType::STDOUT, "stdout"},
    {FrameType::STDIN, "stdin"},
    {FrameType::STDERR, "stderr"},
    {FrameType::CURSOR, "cursor"},
    {FrameType::RESIZE, "resize"},
    {FrameType::RESIZE_ACK, "resize_ack"},
    {FrameType::PROMPT, "prompt"},
    {FrameType::IDLE, "idle"},
    {FrameType::LINE_UPDATE, "line_update"},
    {FrameType::OVERFLOW, "overflow"},
    {FrameType::SIGNAL, "signal"},
    {FrameType::EXIT, "exit"},
    {FrameType::STOPPED, "stopped"},
    {FrameType::CONTINUED, "continued"},
    {FrameType::CAPSULE_KILL, "capsule_kill"},
    {FrameType::PING, "ping"},
    {FrameType::PONG, "pong"},
}};

template <typename T>
optional<T> readUnsigned(const json& j, const char* key, uint64_t maxValue) {
  auto it = j.find(key);
  if (it == j.end()) {
    return {};
  }
  if (!it->is_number_unsigned() || it->get<uint64_t>() > maxValue) {
    throw SerializationError(string("Invalid value for field '") + key + "'");
  }
  return static_cast<T>(it->get<uint64_t>());
}

optional<string> readString(const json& j, const char* key) {
  auto it = j.find(key);
  if (it == j.end()) {
    return {};
  }
  if (!it->is_string()) {
    throw SerializationError(string("Field '") + key + "' must be a string");
  }
  return it->get<string>();
}
}  // namespace

string frameTypeToString(FrameType type) {
  for (const auto& it : FRAME_TYPE_NAMES) {
    if (it.first == type) {
      return it.second;
    }
  }
  STFATAL << "Unhandled frame type: " << static_cast<int>(type);
  return "";
}

FrameType frameTypeFromString(const string& name) {
  for (const auto& it : FRAME_TYPE_NAMES) {
    if (name == it.second) {
      return it.first;
    }
  }
  throw SerializationError("Unknown frame type: " + name);
}

Frame::Frame(FrameType _type) : ts(WallClockSeconds()), type(_type) {}

Frame::Frame(FrameType _type, double _ts) : ts(_ts), type(_type) {}

Frame Frame::withData(const string& _data) const {
  Frame f(*this);
  f.data = _data;
  return f;
}

Frame Frame::withBinaryData(const string& bytes) const {
  string encoded;
  if (!Base64::Encode(bytes, &encoded)) {
    throw SerializationError("Could not base64 encode frame payload");
  }
  Frame f(*this);
  f.data = encoded;
  f.binary = true;
  return f;
}

Frame Frame::withSize(uint16_t _cols, uint16_t _rows) const {
  Frame f(*this);
  f.cols = _cols;
  f.rows = _rows;
  return f;
}

Frame Frame::withExitCode(int32_t _code) const {
  Frame f(*this);
  f.code = _code;
  return f;
}

Frame Frame::withSignal(const string& _signal) const {
  Frame f(*this);
  f.signal = _signal;
  return f;
}

Frame Frame::withRegex(const string& _regex) const {
  Frame f(*this);
  f.regex = _regex;
  return f;
}

Frame Frame::withDuration(uint64_t _durMs) const {
  Frame f(*this);
  f.durMs = _durMs;
  return f;
}

Frame Frame::withReason(const string& _reason) const {
  Frame f(*this);
  f.reason = _reason;
  return f;
}

string Frame::getBinaryData() const {
  if (!data) {
    return string();
  }
  if (!isBinary()) {
    return *data;
  }
  string decoded;
  if (!Base64::Decode(*data, &decoded)) {
    throw SerializationError("Frame payload is not valid base64");
  }
  return decoded;
}

json Frame::toJsonObject() const {
  json j;
  j["ts"] = ts;
  j["type"] = frameTypeToString(type);
  if (data) j["data"] = *data;
  if (binary) j["binary"] = *binary;
  if (cols) j["cols"] = *cols;
  if (rows) j["rows"] = *rows;
  if (code) j["code"] = *code;
  if (signal) j["signal"] = *signal;
  if (regex) j["regex"] = *regex;
  if (durMs) j["dur_ms"] = *durMs;
  if (reason) j["reason"] = *reason;
  return j;
}

string Frame::toJson() const {
  try {
    return toJsonObject().dump();
  } catch (const json::exception& ex) {
    throw SerializationError(string("Cannot encode ") +
                             frameTypeToString(type) +
                             " frame: " + ex.what());
  }
}

Frame Frame::fromJsonObject(const json& j) {
  if (!j.is_object()) {
    throw SerializationError("Frame must be a JSON object");
  }
  auto typeName = readString(j, "type");
  if (!typeName) {
    throw SerializationError("Frame is missing 'type'");
  }
  Frame f(frameTypeFromString(*typeName));
  auto tsIt = j.find("ts");
  if (tsIt != j.end()) {
    if (!tsIt->is_number()) {
      throw SerializationError("Field 'ts' must be a number");
    }
    f.ts = tsIt->get<double>();
  }
  f.data = readString(j, "data");
  auto binaryIt = j.find("binary");
  if (binaryIt != j.end()) {
    if (!binaryIt->is_boolean()) {
      throw SerializationError("Field 'binary' must be a boolean");
    }
    f.binary = binaryIt->get<bool>();
  }
  f.cols = readUnsigned<uint16_t>(j, "cols", UINT16_MAX);
  f.rows = readUnsigned<uint16_t>(j, "rows", UINT16_MAX);
  auto codeIt = j.find("code");
  if (codeIt != j.end()) {
    if (!codeIt->is_number_integer() || codeIt->get<int64_t>() > INT32_MAX ||
        codeIt->get<int64_t>() < INT32_MIN) {
      throw SerializationError("Invalid value for field 'code'");
    }
    f.code = static_cast<int32_t>(codeIt->get<int64_t>());
  }
  f.signal = readString(j, "signal");
  f.regex = readString(j, "regex");
  f.durMs = readUnsigned<uint64_t>(j, "dur_ms", UINT64_MAX);
  f.reason = readString(j, "reason");
  return f;
}

Frame Frame::fromJson(const string& s) {
  json j;
  try {
    j = json::parse(s);
  } catch (const json::parse_error& ex) {
    throw SerializationError(string("Malformed frame: ") + ex.what());
  }
  return fromJsonObject(j);
}

bool Frame::operator==(const Frame& other) const {
  return ts == other.ts && type == other.type && data == other.data &&
         binary == other.binary && cols == other.cols && rows == other.rows &&
         code == other.code && signal == other.signal &&
         regex == other.regex && durMs == other.durMs &&
         reason == other.reason;
}
}  // namespace specter
