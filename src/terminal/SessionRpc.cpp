#include "SessionRpc.hpp"

#include "Errors.hpp"

namespace rt {
SessionRpc::SessionRpc(shared_ptr<Transport> _transport,
                       const string& _sessionId,
                       std::chrono::milliseconds _defaultTimeout)
    : transport(_transport),
      sessionId(_sessionId),
      defaultTimeout(_defaultTimeout) {}

RpcResponse SessionRpc::invoke(RpcRequest* request,
                               std::chrono::milliseconds timeout) {
  request->set_session_id(sessionId);
  RpcResponse response = transport->call(*request, timeout);
  if (response.has_error() && !response.error().empty()) {
    throw RemoteCallError(response.error());
  }
  return response;
}

void SessionRpc::sendInput(const string& data) {
  RpcRequest request;
  request.mutable_send_input()->set_data(data);
  invoke(&request, defaultTimeout);
}

string SessionRpc::getOutput(int64_t limit, int64_t offset) {
  RpcRequest request;
  auto* call = request.mutable_get_output();
  call->set_limit(limit);
  call->set_offset(offset);
  return invoke(&request, defaultTimeout).output().data();
}

string SessionRpc::readFile(const string& path, int64_t offset, int64_t length,
                            std::chrono::milliseconds timeout) {
  RpcRequest request;
  auto* call = request.mutable_read_file();
  call->set_path(path);
  call->set_offset(offset);
  call->set_length(length);
  return invoke(&request, timeout).file_chunk().data();
}

vector<FileEntry> SessionRpc::listDirectory(const string& path) {
  RpcRequest request;
  request.mutable_list_directory()->set_path(path);
  RpcResponse response = invoke(&request, defaultTimeout);
  return vector<FileEntry>(response.listing().entries().begin(),
                           response.listing().entries().end());
}

FileEntry SessionRpc::fileInfo(const string& path) {
  RpcRequest request;
  request.mutable_file_info()->set_path(path);
  RpcResponse response = invoke(&request, defaultTimeout);
  if (!response.has_file_info()) {
    throw RemoteCallError("No such file: " + path);
  }
  return response.file_info();
}

void SessionRpc::deleteFile(const string& path) {
  RpcRequest request;
  request.mutable_delete_file()->set_path(path);
  invoke(&request, defaultTimeout);
}
}  // namespace rt
