#include <cxxopts.hpp>

#include "ClientConfig.hpp"
#include "CommandExecutor.hpp"
#include "Errors.hpp"
#include "Headers.hpp"
#include "InteractiveSession.hpp"
#include "LogHandler.hpp"
#include "PseudoTerminalConsole.hpp"
#include "SessionDirectory.hpp"
#include "SessionRpc.hpp"
#include "SocketTransport.hpp"
#include "TerminalStream.hpp"
#include "transfer/DownloadService.hpp"

using namespace rt;

namespace {
const int LOCAL_FAILURE_EXIT_CODE = -1;

void handleParseException(std::exception& e, cxxopts::Options& options) {
  CLOG(INFO, "stdout") << "Exception: " << e.what() << "\n" << endl;
  CLOG(INFO, "stdout") << options.help({}) << endl;
  exit(1);
}

struct ClientContext {
  ClientConfig config;
  shared_ptr<Transport> transport;
  std::chrono::seconds timeout;
};

shared_ptr<Transport> createTransport(const ClientConfig& config,
                                      bool useLocal) {
  CallMetadata metadata;
  metadata.credential = config.apiKey;
  metadata.clientVersion = config.stream.clientVersion;
  if (useLocal) {
    return SocketTransport::local(config.localSocket, metadata);
  }
  return SocketTransport::relay(config.relayEndpoint(), metadata);
}

optional<string> resolveSessionId(const ClientContext& context,
                                  const string& hostname) {
  SessionDirectory directory(context.transport);
  SessionLookup lookup = directory.resolve(hostname);
  if (!lookup.found) {
    CLOG(INFO, "stdout") << lookup.error << endl;
    if (lookup.ambiguous) {
      for (const auto& session : lookup.matches) {
        CLOG(INFO, "stdout") << "  " << session.machine_hostname() << " ("
                             << session.session_id() << ")" << endl;
      }
    }
    return nullopt;
  }
  return lookup.session.session_id();
}

int runCommand(const ClientContext& context, const string& hostname,
               const string& command) {
  auto sessionId = resolveSessionId(context, hostname);
  if (!sessionId) {
    return LOCAL_FAILURE_EXIT_CODE;
  }
  auto rpc = make_shared<SessionRpc>(context.transport, *sessionId);
  CommandExecutor executor(rpc, context.config.exec);
  CommandResult result = executor.execute(command, context.timeout);
  if (!result.output.empty()) {
    CLOG(INFO, "stdout") << result.output << endl;
  }
  return result.exitCode;
}

int runInteractive(const ClientContext& context, const string& hostname) {
  auto sessionId = resolveSessionId(context, hostname);
  if (!sessionId) {
    return LOCAL_FAILURE_EXIT_CODE;
  }
  auto stream = make_shared<TerminalStream>(context.transport,
                                            context.config.stream);
  auto console = make_shared<PseudoTerminalConsole>();
  InteractiveSession session(stream, console);
  string reason = session.run(*sessionId, context.timeout);
  CLOG(INFO, "stdout") << endl << "Session ended: " << reason << endl;
  return 0;
}

int runSessions(const ClientContext& context, const string& hostnameFilter,
                const string& statusFilter) {
  SessionDirectory directory(context.transport);
  auto sessions = directory.listSessions(hostnameFilter, statusFilter);
  if (sessions.empty()) {
    CLOG(INFO, "stdout") << "No sessions found" << endl;
    return 0;
  }
  for (const auto& session : sessions) {
    CLOG(INFO, "stdout") << std::left << std::setw(24)
                         << session.machine_hostname() << " "
                         << std::setw(10) << session.status() << " "
                         << std::setw(8) << session.os() << " "
                         << session.session_id()
                         << (session.has_shell() ? "" : " (no shell)")
                         << endl;
  }
  return 0;
}

int runDownload(const ClientContext& context, const string& hostname,
                const string& source, const string& localPath, bool isUrl) {
  auto sessionId = resolveSessionId(context, hostname);
  if (!sessionId) {
    return LOCAL_FAILURE_EXIT_CODE;
  }
  auto rpc = make_shared<SessionRpc>(context.transport, *sessionId);
  auto executor = make_shared<CommandExecutor>(rpc, context.config.exec);
  DownloadService service(rpc, executor,
                          context.config.relayTransportFactory(),
                          context.config.apiKey, context.config.transfer);
  auto progress = [](int64_t transferred, int64_t total) {
    VLOG(1) << "Transferred " << transferred << " of " << total << " bytes";
  };
  DownloadResult result =
      isUrl ? service.downloadUrl(source, localPath, progress)
            : service.downloadFile(source, localPath, progress);
  if (!result.success) {
    CLOG(INFO, "stdout") << "Download failed: " << result.error << endl;
    return LOCAL_FAILURE_EXIT_CODE;
  }
  CLOG(INFO, "stdout") << "Saved " << result.localPath << endl
                       << result.metrics.summary() << endl;
  return 0;
}

string joinArguments(const vector<string>& args, size_t first) {
  string joined;
  for (size_t i = first; i < args.size(); i++) {
    if (i > first) {
      joined += " ";
    }
    joined += args[i];
  }
  return joined;
}
}  // namespace

int main(int argc, char** argv) {
  // Setup easylogging configurations
  el::Configurations defaultConf = LogHandler::setupLogHandler(&argc, &argv);
  LogHandler::setupStdoutLogger();

  rt::HandleTerminate();

  // Override easylogging handler for sigint
  ::signal(SIGINT, rt::InterruptSignalHandler);

  cxxopts::Options options("rterm", "Terminal access to relayed machines");
  try {
    options.positional_help("COMMAND [ARGS...]");
    options.custom_help(
        "[OPTION...] COMMAND [ARGS...]\n\n"
        "  Commands:\n"
        "    ssh HOSTNAME                    interactive terminal\n"
        "    exec HOSTNAME COMMAND...        run one command\n"
        "    sessions                        list sessions\n"
        "    download HOSTNAME REMOTE LOCAL  copy a remote file\n"
        "    download HOSTNAME LOCAL --url URL");

    options.add_options()             //
        ("h,help", "Print help")      //
        ("version", "Print version")  //
        ("command", "Subcommand", cxxopts::value<std::string>())  //
        ("args", "Subcommand arguments",
         cxxopts::value<std::vector<std::string>>())  //
        ("config", "Config file",
         cxxopts::value<std::string>()->default_value(
             ClientConfig::defaultPath()))  //
        ("api-key", "API key (overrides RTERM_API_KEY and the config file)",
         cxxopts::value<std::string>())  //
        ("local", "Talk to the co-located agent socket instead of the relay")  //
        ("timeout", "Timeout in seconds", cxxopts::value<int>())  //
        ("exec", "With ssh: run this command and exit",
         cxxopts::value<std::string>())  //
        ("url", "With download: fetch this URL on the remote host",
         cxxopts::value<std::string>())  //
        ("hostname", "With sessions: hostname filter",
         cxxopts::value<std::string>()->default_value(""))  //
        ("status", "With sessions: status filter",
         cxxopts::value<std::string>()->default_value(""))  //
        ("v,verbose", "Enable verbose logging", cxxopts::value<int>())  //
        ("l,logdir", "Base directory for log files.",
         cxxopts::value<std::string>())     //
        ("logtostdout", "Write log to stdout")  //
        ("silent", "Disable logging");

    options.parse_positional({"command", "args"});
    auto result = options.parse(argc, argv);

    if (result.count("version")) {
      CLOG(INFO, "stdout") << "rterm version " << RT_VERSION << endl;
      exit(0);
    }

    if (result.count("help") || !result.count("command")) {
      CLOG(INFO, "stdout") << options.help({}) << endl;
      exit(0);
    }

    ClientContext context;
    context.config = ClientConfig::load(result["config"].as<string>());
    context.config.applyEnvironment();
    if (result.count("api-key")) {
      context.config.apiKey = result["api-key"].as<string>();
    }
    if (result.count("verbose")) {
      context.config.verbose = result["verbose"].as<int>();
    }
    if (result.count("logdir")) {
      context.config.logDir = result["logdir"].as<string>();
    }
    if (result.count("silent")) {
      context.config.silent = true;
    }
    context.config.validate();
    context.timeout = result.count("timeout")
                          ? std::chrono::seconds(result["timeout"].as<int>())
                          : context.config.execTimeout;

    el::Loggers::setVerboseLevel(context.config.verbose);
    if (context.config.silent) {
      defaultConf.setGlobally(el::ConfigurationType::Enabled, "false");
    }
    LogHandler::setupLogFiles(&defaultConf, context.config.logDir, "rterm",
                              result.count("logtostdout"),
                              !result.count("logtostdout"), false,
                              context.config.maxLogSize);
    el::Loggers::reconfigureLogger("default", defaultConf);
    // set thread name
    el::Helpers::setThreadName("rterm-main");

    // Install log rotation callback
    el::Helpers::installPreRollOutCallback(LogHandler::rolloutHandler);

    GOOGLE_PROTOBUF_VERIFY_VERSION;
    if (sodium_init() == -1) {
      STFATAL << "libsodium init failed";
    }

    context.transport = createTransport(context.config, result.count("local"));

    string command = result["command"].as<string>();
    vector<string> args;
    if (result.count("args")) {
      args = result["args"].as<vector<string>>();
    }

    int exitCode = LOCAL_FAILURE_EXIT_CODE;
    if (command == "ssh" && args.size() == 1) {
      if (result.count("exec")) {
        exitCode = runCommand(context, args[0], result["exec"].as<string>());
      } else {
        exitCode = runInteractive(context, args[0]);
      }
    } else if (command == "exec" && args.size() >= 2) {
      exitCode = runCommand(context, args[0], joinArguments(args, 1));
    } else if (command == "sessions" && args.empty()) {
      exitCode = runSessions(context, result["hostname"].as<string>(),
                             result["status"].as<string>());
    } else if (command == "download" && result.count("url") &&
               args.size() == 2) {
      exitCode = runDownload(context, args[0], result["url"].as<string>(),
                             args[1], true);
    } else if (command == "download" && args.size() == 3) {
      exitCode = runDownload(context, args[0], args[1], args[2], false);
    } else {
      CLOG(INFO, "stdout") << "Invalid command: " << command << endl;
      CLOG(INFO, "stdout") << options.help({}) << endl;
      exit(1);
    }
    return exitCode;
  } catch (cxxopts::exceptions::exception& oe) {
    handleParseException(oe, options);
  } catch (const ConfigurationError& ce) {
    CLOG(INFO, "stdout") << "Configuration error: " << ce.what() << endl;
  } catch (const std::runtime_error& re) {
    LOG(ERROR) << re.what();
    CLOG(INFO, "stdout") << "Error: " << re.what() << endl;
  }
  return LOCAL_FAILURE_EXIT_CODE;
}
