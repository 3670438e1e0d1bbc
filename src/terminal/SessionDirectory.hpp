#ifndef __RT_SESSION_DIRECTORY__
#define __RT_SESSION_DIRECTORY__

#include "Headers.hpp"
#include "Transport.hpp"

namespace rt {
struct SessionLookup {
  bool found = false;
  bool ambiguous = false;
  int matchCount = 0;
  string error;
  SessionSummary session;
  // Every match when the lookup was ambiguous
  vector<SessionSummary> matches;
};

/**
 * @brief Finds remote terminal sessions by machine hostname.
 */
class SessionDirectory {
 public:
  explicit SessionDirectory(shared_ptr<Transport> _transport,
                            std::chrono::milliseconds _timeout =
                                std::chrono::seconds(30));

  vector<SessionSummary> listSessions(const string& hostnameFilter = "",
                                      const string& statusFilter = "",
                                      int limit = 50);

  /**
   * @brief Resolves a hostname to exactly one session.  Several matches are
   * reported as ambiguous, listing them, and never guessed.
   */
  SessionLookup resolve(const string& hostname, bool partialMatch = true);

  optional<SessionSummary> getActiveSession(const string& hostname);

 protected:
  RpcResponse invoke(const RpcRequest& request);

  shared_ptr<Transport> transport;
  std::chrono::milliseconds timeout;
};
}  // namespace rt

#endif  // __RT_SESSION_DIRECTORY__
