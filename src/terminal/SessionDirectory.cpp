#include "SessionDirectory.hpp"

#include "Errors.hpp"

namespace rt {
SessionDirectory::SessionDirectory(shared_ptr<Transport> _transport,
                                   std::chrono::milliseconds _timeout)
    : transport(_transport), timeout(_timeout) {}

RpcResponse SessionDirectory::invoke(const RpcRequest& request) {
  RpcResponse response = transport->call(request, timeout);
  if (response.has_error() && !response.error().empty()) {
    throw RemoteCallError(response.error());
  }
  return response;
}

vector<SessionSummary> SessionDirectory::listSessions(
    const string& hostnameFilter, const string& statusFilter, int limit) {
  RpcRequest request;
  auto* call = request.mutable_list_sessions();
  if (!hostnameFilter.empty()) {
    call->set_hostname_filter(hostnameFilter);
  }
  if (!statusFilter.empty()) {
    call->set_status_filter(statusFilter);
  }
  call->set_limit(limit);
  RpcResponse response = invoke(request);
  return vector<SessionSummary>(response.sessions().sessions().begin(),
                                response.sessions().sessions().end());
}

SessionLookup SessionDirectory::resolve(const string& hostname,
                                        bool partialMatch) {
  RpcRequest request;
  auto* call = request.mutable_resolve_session();
  call->set_hostname(hostname);
  call->set_partial_match(partialMatch);
  RpcResponse response = invoke(request);

  SessionLookup lookup;
  const auto& sessions = response.sessions().sessions();
  lookup.matchCount = sessions.size();
  if (sessions.size() == 1) {
    lookup.found = true;
    lookup.session = sessions.Get(0);
    VLOG(1) << "Resolved " << hostname << " to session "
            << lookup.session.session_id();
    return lookup;
  }
  if (sessions.empty()) {
    lookup.error = "No active session found for hostname: " + hostname;
    return lookup;
  }

  lookup.ambiguous = true;
  lookup.matches.assign(sessions.begin(), sessions.end());
  string names;
  for (const auto& session : lookup.matches) {
    if (!names.empty()) {
      names += ", ";
    }
    names += session.machine_hostname();
  }
  lookup.error = "Ambiguous hostname '" + hostname + "' matches " +
                 to_string(lookup.matchCount) + " machines (" + names +
                 "). Use a more specific hostname or exact matching.";
  return lookup;
}

optional<SessionSummary> SessionDirectory::getActiveSession(
    const string& hostname) {
  SessionLookup lookup = resolve(hostname, true);
  if (!lookup.found) {
    LOG(INFO) << lookup.error;
    return nullopt;
  }
  return lookup.session;
}
}  // namespace rt
