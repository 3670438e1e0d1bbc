#include "LogHandler.hpp"

INITIALIZE_EASYLOGGINGPP

namespace rt {
namespace {
// <prefix>[-<kind>]-<YYYY-mm-dd_HH-MM-SS>[_<pid>].log
string logFilename(const string &prefix, const string &kind,
                   const string &timestamp, bool appendPid) {
  string name = prefix + (kind.empty() ? "" : "-" + kind) + "-" + timestamp;
  if (appendPid) {
    name += "_" + to_string(getpid());
  }
  return name + ".log";
}

string startTimestamp() {
  time_t now = time(NULL);
  ostringstream ss;
  ss << std::put_time(localtime(&now), "%Y-%m-%d_%H-%M-%S");
  return ss.str();
}
}  // namespace

el::Configurations LogHandler::setupLogHandler(int *argc, char ***argv) {
  START_EASYLOGGINGPP(*argc, *argv);

  el::Configurations defaultConf;
  defaultConf.setToDefault();
  // %thread prints the name given to el::Helpers::setThreadName
  defaultConf.setGlobally(el::ConfigurationType::Format,
                          "[%level %datetime %thread %fbase:%line] %msg");
  defaultConf.set(el::Level::Verbose, el::ConfigurationType::Format,
                  "[%levshort%vlevel %datetime %thread %fbase:%line] %msg");
  defaultConf.setGlobally(el::ConfigurationType::Enabled, "true");
  defaultConf.setGlobally(el::ConfigurationType::SubsecondPrecision, "3");
  defaultConf.setGlobally(el::ConfigurationType::PerformanceTracking, "false");
  defaultConf.setGlobally(el::ConfigurationType::LogFlushThreshold, "1");
  // Remote terminal output owns stdout
  defaultConf.setGlobally(el::ConfigurationType::ToStandardOutput, "false");
  return defaultConf;
}

string LogHandler::setupLogFiles(el::Configurations *defaultConf,
                                 const string &path,
                                 const string &filenamePrefix,
                                 bool logToStdout, bool redirectStderrToFile,
                                 bool appendPid, string maxlogsize) {
  string timestamp = startTimestamp();
  string logPath = createLogFile(
      path, logFilename(filenamePrefix, "", timestamp, appendPid));

  el::Loggers::addFlag(el::LoggingFlag::StrictLogFileSizeCheck);
  defaultConf->setGlobally(el::ConfigurationType::Filename, logPath);
  defaultConf->setGlobally(el::ConfigurationType::ToFile, "true");
  defaultConf->setGlobally(el::ConfigurationType::MaxLogFileSize, maxlogsize);
  defaultConf->setGlobally(el::ConfigurationType::ToStandardOutput,
                           logToStdout ? "true" : "false");

  if (redirectStderrToFile) {
    stderrToFile(path,
                 logFilename(filenamePrefix, "stderr", timestamp, appendPid));
  }
  return logPath;
}

void LogHandler::rolloutHandler(const char *filename, std::size_t size) {
  // The log file is closed at this point, nothing may be logged here
  remove(filename);
}

void LogHandler::setupStdoutLogger() {
  el::Configurations stdoutConf;
  stdoutConf.setToDefault();
  stdoutConf.setGlobally(el::ConfigurationType::Format, "%msg");
  stdoutConf.setGlobally(el::ConfigurationType::ToStandardOutput, "true");
  stdoutConf.setGlobally(el::ConfigurationType::ToFile, "false");
  el::Loggers::reconfigureLogger(el::Loggers::getLogger("stdout"),
                                 stdoutConf);
}

string LogHandler::createLogFile(const string &path, const string &filename) {
  std::error_code ec;
  fs::create_directories(path, ec);
  if (ec) {
    CLOG(ERROR, "stdout") << "Cannot create log directory " << path << ": "
                          << ec.message() << endl;
    throw std::runtime_error("Cannot create log directory " + path);
  }
  string fullPath = (fs::path(path) / filename).string();
  // Refuse to follow or reuse anything already at that path
  int fd = ::open(fullPath.c_str(), O_NOFOLLOW | O_EXCL | O_CREAT, 0600);
  if (fd == -1) {
    throw std::runtime_error("Cannot create log file " + fullPath + ": " +
                             strerror(errno));
  }
  ::close(fd);
  return fullPath;
}

void LogHandler::stderrToFile(const string &path,
                              const string &stderrFilename) {
  string fullPath = createLogFile(path, stderrFilename);
  FILE *stream = freopen(fullPath.c_str(), "w", stderr);
  if (!stream) {
    STFATAL << "Cannot redirect stderr to " << fullPath;
  }
  setvbuf(stream, NULL, _IOLBF, BUFSIZ);
}
}  // namespace rt
