#include "SessionConfig.hpp"

#include "SimpleIni.h"

namespace specter {
namespace {
const char CAPSULE_LAUNCHER[] = "capsule-run";
const char DEFAULT_RECORDING_TITLE[] = "SpecterTTY Recording";

int64_t parseIniNumber(const CSimpleIniA& ini, const char* section,
                       const char* key, int64_t fallback) {
  const char* value = ini.GetValue(section, key, NULL);
  if (value == NULL) {
    return fallback;
  }
  try {
    size_t consumed = 0;
    int64_t parsed = std::stoll(value, &consumed);
    if (consumed != strlen(value)) {
      throw std::invalid_argument(value);
    }
    return parsed;
  } catch (const std::logic_error&) {
    throw ConfigurationError(string("Invalid number for [") + section + "] " +
                             key + ": " + value);
  }
}

void checkRange(const string& name, int64_t value, int64_t minValue,
                int64_t maxValue) {
  if (value < minValue || value > maxValue) {
    throw ConfigurationError(name + " must be between " + to_string(minValue) +
                             " and " + to_string(maxValue) + ", got " +
                             to_string(value));
  }
}
}  // namespace

void SessionConfig::addOptions(cxxopts::Options* options) {
  options->add_options()         //
      ("h,help", "Print help")   //
      ("version", "Print version")  //
      ("json", "Output frames to stdout as JSON lines")  //
      ("socket", "Unix socket transport", cxxopts::value<string>(),
       "PATH")  //
      ("bind", "TCP transport", cxxopts::value<string>(),
       "HOST:PORT")  //
      ("cols", "Initial window columns (default 120)",
       cxxopts::value<int64_t>())  //
      ("rows", "Initial window rows (default 40)",
       cxxopts::value<int64_t>())  //
      ("idle", "Idle duration before an idle frame in ms (default 200)",
       cxxopts::value<int64_t>())  //
      ("token-mode", "Token processing mode: raw, compact or parsed",
       cxxopts::value<string>())  //
      ("prompt-regex", "Register a prompt matcher (repeatable)",
       cxxopts::value<vector<string>>())  //
      ("buffer",
       "Max buffered frame bytes before back-pressure (default 8388608)",
       cxxopts::value<int64_t>())  //
      ("overflow-timeout",
       "Grace before killing the child on overflow in ms (default 5000)",
       cxxopts::value<int64_t>())  //
      ("record", "asciinema v2 output file", cxxopts::value<string>(),
       "PATH")  //
      ("record-title", "Title stored in the recording header",
       cxxopts::value<string>())  //
      ("capsule", "Run the target through capsule-run")  //
      ("sandbox-profile", "Sandbox profile for capsule-run",
       cxxopts::value<string>())  //
      ("state-dir", "Directory for session resurrection",
       cxxopts::value<string>())  //
      ("compress", "Compress frame payloads: none or zstd",
       cxxopts::value<string>())  //
      ("cfgfile", "Location of the config file", cxxopts::value<string>())  //
      ("logtostderr", "Mirror log output to stderr")  //
      ("logdir", "Directory for log files", cxxopts::value<string>())  //
      ("v,verbose", "Enable verbose logging", cxxopts::value<int>(),
       "LEVEL")  //
      ("command", "Command to execute", cxxopts::value<string>())  //
      ("args", "Arguments for the command",
       cxxopts::value<vector<string>>())  //
      ;
  options->parse_positional({"command", "args"});
  options->positional_help("[--] COMMAND [ARGS...]");
}

vector<string> SessionConfig::splitTrailingCommand(int* argc, char** argv) {
  vector<string> trailing;
  for (int a = 1; a < *argc; a++) {
    if (strcmp(argv[a], "--") == 0) {
      for (int b = a + 1; b < *argc; b++) {
        trailing.push_back(argv[b]);
      }
      *argc = a;
      break;
    }
  }
  return trailing;
}

SessionConfig SessionConfig::fromParseResult(
    const cxxopts::ParseResult& result, const vector<string>& trailing) {
  SessionConfig config;
  if (result.count("cfgfile")) {
    config.loadIniFile(result["cfgfile"].as<string>());
  }

  if (result.count("json")) config.json = true;
  if (result.count("socket")) config.socketPath = result["socket"].as<string>();
  if (result.count("bind")) config.bindAddress = result["bind"].as<string>();
  if (result.count("cols")) config.cols = result["cols"].as<int64_t>();
  if (result.count("rows")) config.rows = result["rows"].as<int64_t>();
  if (result.count("idle")) config.idleMs = result["idle"].as<int64_t>();
  if (result.count("token-mode")) {
    config.tokenMode = result["token-mode"].as<string>();
  }
  if (result.count("prompt-regex")) {
    config.promptRegexes = result["prompt-regex"].as<vector<string>>();
  }
  if (result.count("buffer")) {
    config.bufferBytes = result["buffer"].as<int64_t>();
  }
  if (result.count("overflow-timeout")) {
    config.overflowTimeoutMs = result["overflow-timeout"].as<int64_t>();
  }
  if (result.count("record")) config.recordPath = result["record"].as<string>();
  if (result.count("record-title")) {
    config.recordTitle = result["record-title"].as<string>();
  }
  if (result.count("capsule")) config.capsule = true;
  if (result.count("sandbox-profile")) {
    config.sandboxProfile = result["sandbox-profile"].as<string>();
  }
  if (result.count("state-dir")) {
    config.stateDir = result["state-dir"].as<string>();
  }
  if (result.count("compress")) {
    config.compress = result["compress"].as<string>();
  }
  if (result.count("logtostderr")) config.logToStderr = true;
  if (result.count("logdir")) config.logDir = result["logdir"].as<string>();
  if (result.count("verbose")) config.verbose = result["verbose"].as<int>();
  if (result.count("command")) {
    config.command = result["command"].as<string>();
  }
  if (result.count("args")) {
    config.args = result["args"].as<vector<string>>();
  }
  if (!trailing.empty()) {
    if (config.command.empty()) {
      config.command = trailing[0];
      config.args.assign(trailing.begin() + 1, trailing.end());
    } else {
      config.args.insert(config.args.end(), trailing.begin(), trailing.end());
    }
  }
  return config;
}

void SessionConfig::loadIniFile(const string& path) {
  CSimpleIniA ini(true, false, false);
  SI_Error rc = ini.LoadFile(path.c_str());
  if (rc < 0) {
    throw ConfigurationError("Invalid config file: " + path);
  }

  cols = parseIniNumber(ini, "Session", "cols", cols);
  rows = parseIniNumber(ini, "Session", "rows", rows);
  idleMs = parseIniNumber(ini, "Session", "idle_ms", idleMs);
  bufferBytes = parseIniNumber(ini, "Session", "buffer", bufferBytes);
  overflowTimeoutMs = parseIniNumber(ini, "Session", "overflow_timeout_ms",
                                     overflowTimeoutMs);
  const char* mode = ini.GetValue("Session", "token_mode", NULL);
  if (mode) {
    tokenMode = mode;
  }

  const char* recordingPath = ini.GetValue("Recording", "path", NULL);
  if (recordingPath) {
    recordPath = string(recordingPath);
  }
  const char* title = ini.GetValue("Recording", "title", NULL);
  if (title) {
    recordTitle = string(title);
  }

  verbose = static_cast<int>(parseIniNumber(ini, "Debug", "verbose", verbose));
  logToStderr =
      parseIniNumber(ini, "Debug", "logtostderr", logToStderr ? 1 : 0) != 0;
}

void SessionConfig::validate() const {
  if (cols < 1 || rows < 1) {
    throw ConfigurationError("Window size must be greater than 0");
  }
  checkRange("cols", cols, 1, UINT16_MAX);
  checkRange("rows", rows, 1, UINT16_MAX);
  if (idleMs <= 0) {
    throw ConfigurationError("Idle timeout must be greater than 0");
  }
  if (bufferBytes <= 0) {
    throw ConfigurationError("Buffer size must be greater than 0");
  }
  if (overflowTimeoutMs < 0) {
    throw ConfigurationError("Overflow timeout must not be negative");
  }
  tokenModeFromString(tokenMode);
  if (compress != "none" && compress != "zstd") {
    throw ConfigurationError("Invalid compression mode '" + compress +
                             "' (expected none or zstd)");
  }
  if (command.empty()) {
    throw ConfigurationError("No command given");
  }
  PromptMatcher matcher(promptRegexes);
}

SessionOptions SessionConfig::toSessionOptions() const {
  SessionOptions options;
  if (capsule) {
    options.command = CAPSULE_LAUNCHER;
    if (sandboxProfile) {
      options.args.push_back("--profile");
      options.args.push_back(*sandboxProfile);
    }
    options.args.push_back("--");
    options.args.push_back(command);
    options.args.insert(options.args.end(), args.begin(), args.end());
  } else {
    options.command = command;
    options.args = args;
  }
  options.cols = static_cast<uint16_t>(cols);
  options.rows = static_cast<uint16_t>(rows);
  options.idleTimeout = std::chrono::milliseconds(idleMs);
  options.promptPatterns = promptRegexes;
  options.maxBufferedBytes = static_cast<size_t>(bufferBytes);
  options.overflowGrace = std::chrono::milliseconds(overflowTimeoutMs);
  return options;
}

RecordingHeader SessionConfig::toRecordingHeader() const {
  RecordingHeader header;
  header.width = static_cast<uint16_t>(cols);
  header.height = static_cast<uint16_t>(rows);
  header.title = recordTitle.value_or(DEFAULT_RECORDING_TITLE);
  header.command = joinArgs(command, args);
  return header;
}
}  // namespace specter
