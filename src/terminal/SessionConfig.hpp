#ifndef __SPECTER_SESSION_CONFIG__
#define __SPECTER_SESSION_CONFIG__

#include <cxxopts.hpp>

#include "OutputProcessor.hpp"
#include "PtySession.hpp"
#include "RecordingManager.hpp"

namespace specter {
/**
 * @brief Everything the command line and config file can set.
 *
 * Defaults live here rather than in cxxopts so that a value present in the
 * config file is only overridden by an option that was actually passed.
 */
struct SessionConfig {
  bool json = false;
  optional<string> socketPath;
  optional<string> bindAddress;
  int64_t cols = 120;
  int64_t rows = 40;
  int64_t idleMs = 200;
  string tokenMode = "raw";
  vector<string> promptRegexes;
  int64_t bufferBytes = 8388608;
  int64_t overflowTimeoutMs = 5000;
  optional<string> recordPath;
  optional<string> recordTitle;
  bool capsule = false;
  optional<string> sandboxProfile;
  optional<string> stateDir;
  string compress = "none";
  bool logToStderr = false;
  string logDir;
  int verbose = 0;
  string command;
  vector<string> args;

  /** @brief Registers every option on the parser. */
  static void addOptions(cxxopts::Options* options);

  /**
   * @brief Cuts argv at the first "--" so the command line after it is kept
   * verbatim instead of going through option parsing.
   * @return The words after "--"; `*argc` is reduced to exclude them.
   */
  static vector<string> splitTrailingCommand(int* argc, char** argv);

  /**
   * @brief Builds a config from parsed options, loading `--cfgfile` first
   * when given. `trailing` is the command line that followed "--".
   * @throws ConfigurationError if the config file cannot be read.
   */
  static SessionConfig fromParseResult(const cxxopts::ParseResult& result,
                                       const vector<string>& trailing = {});

  /**
   * @brief Overlays values from an INI file ([Session], [Recording],
   * [Debug] sections).
   * @throws ConfigurationError if the file is missing or holds bad numbers.
   */
  void loadIniFile(const string& path);

  /**
   * @brief Rejects zero or out-of-range sizes and timeouts, unknown modes,
   * a missing command and prompt patterns that do not compile.
   * @throws ConfigurationError
   */
  void validate() const;

  TokenMode getTokenMode() const { return tokenModeFromString(tokenMode); }

  /** @brief Session options, with the command wrapped by the sandbox
   * launcher when `capsule` is set. */
  SessionOptions toSessionOptions() const;

  RecordingHeader toRecordingHeader() const;
};
}  // namespace specter

#endif  // __SPECTER_SESSION_CONFIG__
