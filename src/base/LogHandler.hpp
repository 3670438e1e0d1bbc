#ifndef __RT_LOG_HANDLER__
#define __RT_LOG_HANDLER__

#include "Headers.hpp"

namespace rt {
/**
 * @brief easylogging++ setup shared by rterm and its test runner.
 */
class LogHandler {
 public:
  /**
   * @brief Starts easylogging++ from the command line and returns the
   * default configuration for the caller to adjust.
   */
  static el::Configurations setupLogHandler(int *argc, char ***argv);

  /**
   * @brief Points the default logger at a fresh file under `path`.
   *
   * The file is named `<prefix>-<timestamp>[_<pid>].log`. When
   * `redirectStderrToFile` is set, stderr goes to a sibling
   * `<prefix>-stderr-...` file. Files roll once they reach `maxlogsize`
   * bytes.
   * @return Path of the log file that was created.
   */
  static string setupLogFiles(el::Configurations *defaultConf,
                              const string &path, const string &filenamePrefix,
                              bool logToStdout = false,
                              bool redirectStderrToFile = false,
                              bool appendPid = false,
                              string maxlogsize = "20971520");

  // Deletes a rolled log instead of keeping it around.
  static void rolloutHandler(const char *filename, std::size_t size);

  // The "stdout" logger prints bare messages for user-facing output.
  static void setupStdoutLogger();

 private:
  static void stderrToFile(const string &path, const string &stderrFilename);

  static string createLogFile(const string &path, const string &filename);
};
}  // namespace rt
#endif  // __RT_LOG_HANDLER__
