#include "ClientConfig.hpp"

#include "Errors.hpp"
#include "SocketTransport.hpp"

namespace rt {
namespace {
int64_t readInteger(const CSimpleIniA& ini, const char* section,
                    const char* key, int64_t defaultValue) {
  const char* value = ini.GetValue(section, key, NULL);
  if (!value) {
    return defaultValue;
  }
  try {
    size_t used = 0;
    int64_t parsed = stoll(value, &used);
    if (used != strlen(value)) {
      throw std::invalid_argument(value);
    }
    return parsed;
  } catch (const std::logic_error&) {
    throw ConfigurationError(string("Invalid integer for [") + section +
                             "] " + key + ": " + value);
  }
}

string readString(const CSimpleIniA& ini, const char* section,
                  const char* key, const string& defaultValue) {
  const char* value = ini.GetValue(section, key, NULL);
  return value ? string(value) : defaultValue;
}
}  // namespace

ClientConfig::ClientConfig()
    : relayHost("relay.rterm.dev"),
      relayPort(7443),
      localSocket("/tmp/rterm-agent.sock"),
      execTimeout(30),
      verbose(0),
      logDir(GetTempDirectory()),
      silent(false),
      maxLogSize("20971520") {}

string ClientConfig::defaultPath() {
  return sago::getConfigHome() + "/rterm/rterm.ini";
}

void ClientConfig::readFrom(const CSimpleIniA& ini) {
  relayHost = readString(ini, "Relay", "host", relayHost);
  relayPort = readInteger(ini, "Relay", "port", relayPort);
  localSocket = readString(ini, "Local", "socket", localSocket);
  apiKey = readString(ini, "Auth", "api_key", apiKey);

  stream.keepaliveInterval = std::chrono::seconds(readInteger(
      ini, "Stream", "keepalive_seconds",
      std::chrono::duration_cast<std::chrono::seconds>(
          stream.keepaliveInterval)
          .count()));
  stream.queueMaxSize =
      readInteger(ini, "Stream", "queue_max_size", stream.queueMaxSize);
  stream.queuePutTimeout = std::chrono::seconds(readInteger(
      ini, "Stream", "queue_put_timeout_seconds",
      std::chrono::duration_cast<std::chrono::seconds>(stream.queuePutTimeout)
          .count()));
  stream.legacyStatusEncoding =
      readInteger(ini, "Stream", "legacy_status_encoding",
                  stream.legacyStatusEncoding) != 0;

  exec.pollInterval = std::chrono::milliseconds(readInteger(
      ini, "Exec", "poll_interval_ms", exec.pollInterval.count()));
  exec.readWindow =
      readInteger(ini, "Exec", "read_window_bytes", exec.readWindow);
  execTimeout = std::chrono::seconds(readInteger(
      ini, "Exec", "default_timeout_seconds", execTimeout.count()));

  transfer.chunkSize =
      readInteger(ini, "Transfer", "chunk_size", transfer.chunkSize);
  transfer.largeFileThreshold = readInteger(
      ini, "Transfer", "large_file_threshold", transfer.largeFileThreshold);
  transfer.splitPartSize =
      readInteger(ini, "Transfer", "split_part_size", transfer.splitPartSize);
  transfer.maxParallelParts = readInteger(ini, "Transfer", "max_parallel_parts",
                                          transfer.maxParallelParts);
  transfer.maxRetries =
      readInteger(ini, "Transfer", "max_retries", transfer.maxRetries);

  verbose = readInteger(ini, "Debug", "verbose", verbose);
  logDir = readString(ini, "Debug", "logdir", logDir);
  silent = readInteger(ini, "Debug", "silent", silent) != 0;
  int64_t logsize = readInteger(ini, "Debug", "logsize", 0);
  if (logsize != 0) {
    maxLogSize = to_string(logsize);
  }
}

ClientConfig ClientConfig::parse(const string& iniText) {
  CSimpleIniA ini(true, false, false);
  SI_Error rc = ini.LoadData(iniText);
  if (rc < 0) {
    throw ConfigurationError("Invalid config data");
  }
  ClientConfig config;
  config.readFrom(ini);
  return config;
}

ClientConfig ClientConfig::load(const string& path) {
  ClientConfig config;
  if (!fs::exists(path)) {
    VLOG(1) << "No config file at " << path << ", using defaults";
    return config;
  }
  CSimpleIniA ini(true, false, false);
  SI_Error rc = ini.LoadFile(path.c_str());
  if (rc < 0) {
    throw ConfigurationError("Invalid config file: " + path);
  }
  config.readFrom(ini);
  return config;
}

void ClientConfig::applyEnvironment() {
  const char* key = ::getenv("RTERM_API_KEY");
  if (key && *key) {
    apiKey = key;
  }
}

void ClientConfig::validate() const {
  if (relayHost.empty()) {
    throw ConfigurationError("Relay host must not be empty");
  }
  if (relayPort <= 0 || relayPort > 65535) {
    throw ConfigurationError("Invalid relay port: " + to_string(relayPort));
  }
  if (stream.keepaliveInterval.count() <= 0 ||
      stream.keepaliveInterval >=
          std::chrono::seconds(RELAY_IDLE_TIMEOUT_SECONDS)) {
    throw ConfigurationError(
        "Keepalive interval must be positive and below the relay idle "
        "timeout of " +
        to_string(RELAY_IDLE_TIMEOUT_SECONDS) + "s");
  }
  if (stream.queueMaxSize == 0 || stream.queuePutTimeout.count() <= 0) {
    throw ConfigurationError("Queue size and put timeout must be positive");
  }
  if (exec.pollInterval.count() <= 0 || exec.readWindow <= 0 ||
      execTimeout.count() <= 0) {
    throw ConfigurationError("Exec poll interval, window and timeout must "
                             "be positive");
  }
  if (transfer.chunkSize <= 0 || transfer.largeFileThreshold <= 0 ||
      transfer.splitPartSize <= 0 || transfer.maxParallelParts <= 0 ||
      transfer.maxRetries < 0) {
    throw ConfigurationError("Invalid transfer settings");
  }
}

TransportFactory ClientConfig::relayTransportFactory() const {
  SocketEndpoint endpoint = relayEndpoint();
  string clientVersion = stream.clientVersion;
  return [endpoint, clientVersion](const string& credential) {
    CallMetadata metadata;
    metadata.credential = credential;
    metadata.clientVersion = clientVersion;
    return shared_ptr<Transport>(SocketTransport::relay(endpoint, metadata));
  };
}
}  // namespace rt
