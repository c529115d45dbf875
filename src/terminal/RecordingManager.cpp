#include "RecordingManager.hpp"

namespace specter {
namespace {
string dumpLine(const json& j) {
  // Payloads are already lossy-decoded; replace anything that still slips
  // through rather than losing the line.
  return j.dump(-1, ' ', false, json::error_handler_t::replace);
}
}  // namespace

AsciinemaRecorder::AsciinemaRecorder(const string& _path,
                                     const RecordingHeader& header)
    : path(_path), lastElapsed(0), finished(false) {
  out.open(path, std::ios::out | std::ios::trunc | std::ios::binary);
  if (!out.is_open()) {
    throw RecordingError("Cannot create recording " + path + ": " +
                         strerror(GetErrno()));
  }

  json h;
  h["version"] = FORMAT_VERSION;
  h["width"] = header.width;
  h["height"] = header.height;
  h["timestamp"] = static_cast<int64_t>(::time(NULL));
  if (header.title) {
    h["title"] = *header.title;
  }
  if (header.command) {
    h["command"] = *header.command;
  }
  h["env"] = {{"SHELL", GetEnvOrDefault("SHELL", "/bin/sh")},
              {"TERM", GetEnvOrDefault("TERM", "xterm-256color")}};
  writeLine(dumpLine(h));

  startTime = std::chrono::steady_clock::now();
  VLOG(1) << "Recording to " << path;
}

AsciinemaRecorder::~AsciinemaRecorder() {
  try {
    finish();
  } catch (const std::exception& ex) {
    LOG(ERROR) << "Error closing recording " << path << ": " << ex.what();
  }
}

bool AsciinemaRecorder::recordFrame(const Frame& frame) {
  if (finished) {
    return false;
  }

  const char* eventCode;
  string payload;
  switch (frame.getType()) {
    case FrameType::STDOUT:
    case FrameType::STDERR:
      // asciinema has a single output stream
      eventCode = "o";
      payload = frame.getData().value_or("");
      break;
    case FrameType::STDIN:
      eventCode = "i";
      payload = frame.getData().value_or("");
      break;
    case FrameType::RESIZE:
      if (!frame.getCols() || !frame.getRows()) {
        return false;
      }
      eventCode = "o";
      payload = "# Terminal resized to " + to_string(*frame.getCols()) + "x" +
                to_string(*frame.getRows()) + "\r\n";
      break;
    default:
      return false;
  }
  if (frame.isBinary()) {
    payload = frame.getBinaryData();
  }

  double elapsed = std::chrono::duration<double>(
                       std::chrono::steady_clock::now() - startTime)
                       .count();
  elapsed = std::max(elapsed, lastElapsed);
  writeLine(dumpLine(json::array({elapsed, eventCode, payload})));
  lastElapsed = elapsed;
  return true;
}

void AsciinemaRecorder::finish() {
  if (finished) {
    return;
  }
  finished = true;
  out.flush();
  bool failed = out.fail();
  out.close();
  if (failed) {
    throw RecordingError("Cannot flush recording " + path);
  }
  VLOG(1) << "Recording " << path << " finished";
}

void AsciinemaRecorder::writeLine(const string& line) {
  out << line << '\n';
  out.flush();
  if (out.fail()) {
    throw RecordingError("Cannot write to recording " + path);
  }
}

void RecordingManager::startRecording(const string& path,
                                      const RecordingHeader& header) {
  if (recorder) {
    throw RecordingError("Already recording to " + recorder->getPath());
  }
  recorder.reset(new AsciinemaRecorder(path, header));
}

void RecordingManager::recordFrame(const Frame& frame) {
  if (!recorder) {
    return;
  }
  try {
    recorder->recordFrame(frame);
  } catch (const RecordingError& re) {
    // The session keeps running without a recording.
    unique_ptr<AsciinemaRecorder> failed = std::move(recorder);
    try {
      failed->finish();
    } catch (const RecordingError& closeError) {
      LOG(ERROR) << closeError.what();
    }
    throw;
  }
}

void RecordingManager::stopRecording() {
  if (!recorder) {
    return;
  }
  unique_ptr<AsciinemaRecorder> finishing = std::move(recorder);
  finishing->finish();
}
}  // namespace specter
