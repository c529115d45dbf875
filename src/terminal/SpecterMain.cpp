#include <cxxopts.hpp>

#include "LogHandler.hpp"
#include "PseudoChildTerminal.hpp"
#include "SessionConfig.hpp"
#include "SessionOrchestrator.hpp"

using namespace specter;

int main(int argc, char **argv) {
  // Setup easylogging configurations
  el::Configurations defaultConf = LogHandler::setupLogHandler(&argc, &argv);
  LogHandler::setupStdoutLogger();

  specter::HandleTerminate();

  cxxopts::Options options(
      "spectertty", "Run a program in a pty and stream its behavior as frames");
  SessionConfig config;
  try {
    SessionConfig::addOptions(&options);
    vector<string> trailing = SessionConfig::splitTrailingCommand(&argc, argv);
    auto result = options.parse(argc, argv);

    if (result.count("help")) {
      CLOG(INFO, "stdout") << options.help({}) << endl;
      exit(0);
    }
    if (result.count("version")) {
      CLOG(INFO, "stdout") << "spectertty version " << SPECTER_VERSION << endl;
      exit(0);
    }

    config = SessionConfig::fromParseResult(result, trailing);
    config.validate();
  } catch (cxxopts::OptionException &oe) {
    CLOG(INFO, "stdout") << "Exception: " << oe.what() << "\n" << endl;
    CLOG(INFO, "stdout") << options.help({}) << endl;
    exit(1);
  } catch (const ConfigurationError &ce) {
    CLOG(INFO, "stdout") << "Configuration error: " << ce.what() << endl;
    exit(1);
  }

  if (config.verbose) {
    el::Loggers::setVerboseLevel(config.verbose);
  }
  string logDir =
      config.logDir.empty() ? GetTempDirectory() + "specter" : config.logDir;
  LogHandler::setupLogFiles(&defaultConf, logDir, "spectertty",
                            config.logToStderr, true);
  // Reconfigure default logger to apply settings above
  el::Loggers::reconfigureLogger("default", defaultConf);
  // set thread name
  el::Helpers::setThreadName("spectertty-main");
  // Install log rotation callback
  el::Helpers::installPreRollOutCallback(LogHandler::rolloutHandler);

  if (config.socketPath) {
    LOG(WARNING) << "Unix socket transport is not available in this build, "
                    "emitting on stdout instead of "
                 << *config.socketPath;
  }
  if (config.bindAddress) {
    LOG(WARNING) << "TCP transport is not available in this build, "
                    "emitting on stdout instead of "
                 << *config.bindAddress;
  }
  if (config.stateDir) {
    LOG(WARNING) << "Session resurrection is not available, ignoring "
                 << *config.stateDir;
  }
  if (config.compress != "none") {
    LOG(WARNING) << "Compression '" << config.compress
                 << "' is not available, frames are sent uncompressed";
  }

  // A consumer that goes away shows up as a failed write, not a signal.
  ::signal(SIGPIPE, SIG_IGN);

  int exitCode = 0;
  try {
    shared_ptr<ChildTerminal> terminal(new PseudoChildTerminal());
    shared_ptr<PtySession> session(
        new PtySession(terminal, config.toSessionOptions()));

    shared_ptr<OutputProcessor> processor(new OutputProcessor(
        config.getTokenMode(), session->getPromptMatcher()));
    shared_ptr<FrameSink> sink;
    if (config.json) {
      sink.reset(new JsonLineSink(std::cout));
    } else {
      sink.reset(new PassthroughSink(std::cout));
    }

    shared_ptr<RecordingManager> recording(new RecordingManager());
    if (config.recordPath) {
      try {
        recording->startRecording(*config.recordPath,
                                  config.toRecordingHeader());
        LOG(INFO) << "Recording session to " << *config.recordPath;
      } catch (const RecordingError &re) {
        LOG(ERROR) << "Continuing without recording: " << re.what();
      }
    }

    SessionOrchestrator orchestrator(session, processor, sink, recording,
                                     STDIN_FILENO, config.json);
    orchestrator.installSignalHandlers();
    orchestrator.run();
  } catch (const ConfigurationError &ce) {
    LOG(ERROR) << ce.what();
    CLOG(INFO, "stdout") << "Configuration error: " << ce.what() << endl;
    exitCode = 1;
  } catch (const SpawnError &se) {
    LOG(ERROR) << se.what();
    CLOG(INFO, "stdout") << "Cannot start " << config.command << ": "
                         << se.what() << endl;
    exitCode = 1;
  } catch (const IoError &ioe) {
    STERROR << "Unrecoverable I/O error: " << ioe.what();
    exitCode = 1;
  }

  // Uninstall log rotation callback
  el::Helpers::uninstallPreRollOutCallback();
  return exitCode;
}
