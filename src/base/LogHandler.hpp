#ifndef __SPECTER_LOG_HANDLER__
#define __SPECTER_LOG_HANDLER__

#include "Headers.hpp"

namespace specter {
/**
 * @brief Configures easylogging++ so SpecterTTY can control log files.
 *
 * Standard output carries the frame stream, so console logging is built
 * with ELPP_CUSTOM_COUT pointing at std::cerr.
 */
class LogHandler {
 public:
  /**
   * @brief Initializes logging using the supplied `argc/argv` parameters.
   * @return A default configuration that callers can further customize.
   */
  static el::Configurations setupLogHandler(int *argc, char ***argv);

  /**
   * @brief Sets up file-based logging, optionally mirroring to the console.
   * @param defaultConf Base easylogging configuration that will be mutated.
   * @return Full path of the created log file.
   */
  static string setupLogFiles(el::Configurations *defaultConf,
                              const string &path, const string &filenamePrefix,
                              bool logToConsole = false, bool appendPid = false,
                              string maxlogsize = "20971520");

  /**
   * @brief Performs log rotation by removing the supplied filename.
   */
  static void rolloutHandler(const char *filename, std::size_t size);

  /**
   * @brief Reconfigures the "stdout" logger so it just writes messages.
   */
  static void setupStdoutLogger();

 private:
  /**
   * @brief Ensures the directory exists and creates a new log file.
   */
  static string createLogFile(const string &path, const string &filename);
};
}  // namespace specter
#endif  // __SPECTER_LOG_HANDLER__
