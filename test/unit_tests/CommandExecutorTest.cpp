#include "CommandExecutor.hpp"
#include "FakeRemoteHost.hpp"
#include "TestHeaders.hpp"

using namespace rt;

namespace {
ExecOptions fastPolling() {
  ExecOptions options;
  options.pollInterval = std::chrono::milliseconds(20);
  return options;
}

string markerId(const string& input) {
  size_t idStart = input.find("<<CMD:") + 6;
  return input.substr(idStart, input.find(':', idStart) - idStart);
}
}  // namespace

TEST_CASE("A finished command returns its output and status",
          "[CommandExecutor]") {
  FakeRemoteHost host;
  host.commandHandler = [](const string& command) {
    REQUIRE(command == "echo X; exit 7");
    return make_pair(string("X"), 7);
  };
  auto rpc = make_shared<SessionRpc>(host.newTransport(), "session-1");
  CommandExecutor executor(rpc, fastPolling());

  CommandResult result =
      executor.execute("echo X; exit 7", std::chrono::seconds(5));
  REQUIRE(result.output == "X");
  REQUIRE(result.exitCode == 7);
  REQUIRE_FALSE(result.timedOut);

  auto inputs = host.getInputs();
  REQUIRE(inputs.size() == 1);
  REQUIRE(inputs[0].find("echo X; exit 7") != string::npos);
}

TEST_CASE("Each execution uses a fresh marker id", "[CommandExecutor]") {
  FakeRemoteHost host;
  host.commandHandler = [](const string&) { return make_pair(string("ok"), 0); };
  auto rpc = make_shared<SessionRpc>(host.newTransport(), "session-1");
  CommandExecutor executor(rpc, fastPolling());

  REQUIRE(executor.execute("true", std::chrono::seconds(5)).exitCode == 0);
  REQUIRE(executor.execute("true", std::chrono::seconds(5)).exitCode == 0);
  auto inputs = host.getInputs();
  REQUIRE(inputs.size() == 2);
  REQUIRE(markerId(inputs[0]).length() == 12);
  REQUIRE(markerId(inputs[0]) != markerId(inputs[1]));
}

TEST_CASE("A command that never ends times out with a report",
          "[CommandExecutor]") {
  auto transport = make_shared<FakeTransport>();
  mutex bufferMutex;
  string buffer;
  transport->handler = [&](const RpcRequest& request) {
    lock_guard<mutex> guard(bufferMutex);
    RpcResponse response;
    if (request.has_send_input()) {
      string id = markerId(request.send_input().data());
      buffer += "\n<<CMD:" + id + ":START>>\nDownloading... 40%\n";
      response.mutable_ack();
    } else if (request.has_get_output()) {
      response.mutable_output()->set_data(buffer);
    }
    return response;
  };
  auto rpc = make_shared<SessionRpc>(transport, "session-1");
  CommandExecutor executor(rpc, fastPolling());

  auto began = std::chrono::steady_clock::now();
  CommandResult result =
      executor.execute("wget big.iso", std::chrono::milliseconds(300));
  auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - began);

  REQUIRE(result.exitCode == -1);
  REQUIRE(result.timedOut);
  REQUIRE(result.output.find("missing end marker") != string::npos);
  REQUIRE(result.output.find("Downloading... 40%") != string::npos);
  REQUIRE(elapsed >= std::chrono::milliseconds(300));
  REQUIRE(elapsed < std::chrono::milliseconds(1000));
}

TEST_CASE("No markers at all is reported differently", "[CommandExecutor]") {
  FakeRemoteHost host;
  host.respondToCommands = false;
  host.appendOutput("unrelated noise\n");
  auto rpc = make_shared<SessionRpc>(host.newTransport(), "session-1");
  CommandExecutor executor(rpc, fastPolling());

  CommandResult result = executor.execute("ls", std::chrono::milliseconds(100));
  REQUIRE(result.exitCode == -1);
  REQUIRE(result.output.find("No markers found") != string::npos);
  REQUIRE(result.output.find("unrelated noise") != string::npos);
  REQUIRE(host.outputReads >= 1);
}

TEST_CASE("Partial output is capped", "[CommandExecutor]") {
  FakeRemoteHost host;
  host.respondToCommands = false;
  host.appendOutput(string(5000, 'a') + "THE END");
  auto rpc = make_shared<SessionRpc>(host.newTransport(), "session-1");
  ExecOptions options = fastPolling();
  options.partialOutputCap = 100;
  CommandExecutor executor(rpc, options);

  CommandResult result = executor.execute("ls", std::chrono::milliseconds(50));
  REQUIRE(result.output.find("...") != string::npos);
  REQUIRE(result.output.find("THE END") != string::npos);
  REQUIRE(result.output.find(string(101, 'a')) == string::npos);
}

TEST_CASE("A failed send is reported, not thrown", "[CommandExecutor]") {
  // No handler installed: every call fails
  auto transport = make_shared<FakeTransport>();
  auto rpc = make_shared<SessionRpc>(transport, "session-1");
  CommandExecutor executor(rpc, fastPolling());

  CommandResult result;
  REQUIRE_NOTHROW(result = executor.execute("ls", std::chrono::seconds(1)));
  REQUIRE(result.exitCode == -1);
  REQUIRE(result.output.find("Failed to send command") == 0);
  REQUIRE(transport->callCount == 1);
}

TEST_CASE("An end marker without its start marker is not a result",
          "[CommandExecutor]") {
  // The start sentinel scrolled out of the read window
  auto transport = make_shared<FakeTransport>();
  mutex bufferMutex;
  string buffer;
  transport->handler = [&](const RpcRequest& request) {
    lock_guard<mutex> guard(bufferMutex);
    RpcResponse response;
    if (request.has_send_input()) {
      string id = markerId(request.send_input().data());
      buffer += string(3000, 'y') + "\n<<CMD:" + id + ":END:0>>\n";
      response.mutable_ack();
    } else if (request.has_get_output()) {
      response.mutable_output()->set_data(buffer);
    }
    return response;
  };
  auto rpc = make_shared<SessionRpc>(transport, "session-1");
  CommandExecutor executor(rpc, fastPolling());

  CommandResult result =
      executor.execute("cat huge.log", std::chrono::milliseconds(200));
  REQUIRE(result.exitCode == -1);
  REQUIRE(result.timedOut);
  REQUIRE(result.output.find("timed out") != string::npos);
  REQUIRE(result.output.find("read window") != string::npos);
  REQUIRE(result.output.find("yyyy") != string::npos);
}
