#include "FrameSink.hpp"

namespace specter {
void JsonLineSink::emit(const Frame& frame) {
  string line = frame.toJson();
  out << line << '\n';
  out.flush();
  if (out.fail()) {
    throw IoError("Cannot write frame to sink", EPIPE);
  }
}

void PassthroughSink::emit(const Frame& frame) {
  switch (frame.getType()) {
    case FrameType::STDOUT:
    case FrameType::STDERR:
      out << frame.getBinaryData();
      break;
    case FrameType::LINE_UPDATE:
      // Redraw the status line in place.
      out << '\r' << frame.getData().value_or("");
      break;
    default:
      return;
  }
  out.flush();
  if (out.fail()) {
    throw IoError("Cannot write output to sink", EPIPE);
  }
}
}  // namespace specter
