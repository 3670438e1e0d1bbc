#ifndef __RT_CLIENT_CONFIG__
#define __RT_CLIENT_CONFIG__

#include "CommandExecutor.hpp"
#include "Headers.hpp"
#include "SimpleIni.h"
#include "SocketEndpoint.hpp"
#include "TerminalStream.hpp"
#include "Transport.hpp"
#include "transfer/TransferTypes.hpp"

namespace rt {
/**
 * @brief Client settings read from rterm.ini, with environment overrides.
 */
class ClientConfig {
 public:
  ClientConfig();

  /** @brief Location used when no --config is given. */
  static string defaultPath();

  /**
   * @brief Reads `path`.  A missing file leaves the defaults in place.
   * @throws ConfigurationError for a malformed file or bad values.
   */
  static ClientConfig load(const string& path);

  /** @brief Parses ini text; used by load() and tests. */
  static ClientConfig parse(const string& iniText);

  /** @brief RTERM_API_KEY replaces the configured api key. */
  void applyEnvironment();

  /** @throws ConfigurationError on the first invalid value. */
  void validate() const;

  SocketEndpoint relayEndpoint() const {
    return SocketEndpoint(relayHost, relayPort);
  }

  /** @brief Relay transports authenticated with a given credential. */
  TransportFactory relayTransportFactory() const;

  string relayHost;
  int relayPort;
  string localSocket;
  string apiKey;

  StreamOptions stream;
  ExecOptions exec;
  std::chrono::seconds execTimeout;
  TransferOptions transfer;

  int verbose;
  string logDir;
  bool silent;
  string maxLogSize;

 protected:
  void readFrom(const CSimpleIniA& ini);
};
}  // namespace rt

#endif  // __RT_CLIENT_CONFIG__
