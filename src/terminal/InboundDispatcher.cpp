#include "InboundDispatcher.hpp"

namespace rt {
void InboundDispatcher::dispatch(const InboundMessage& message) {
  switch (message.payload_case()) {
    case InboundMessage::kOutput:
      listeners->emitOutput(message.output().data());
      break;
    case InboundMessage::kSessionStarted:
      target->markSessionReady(message.session_started().session_id());
      break;
    case InboundMessage::kSessionClosed: {
      string reason = message.session_closed().reason();
      LOG(INFO) << "Session closed by agent: " << reason;
      target->closeFromRemote(reason.empty() ? "session_closed" : reason);
      break;
    }
    case InboundMessage::kPing:
      VLOG(2) << "Got ping";
      target->answerPing();
      break;
    case InboundMessage::kResizeEcho: {
      const auto& size = message.resize_echo().size();
      StreamState state = target->currentState();
      listeners->emitStatus(state, state,
                            "resize:" + to_string(size.cols()) + "x" +
                                to_string(size.rows()));
      break;
    }
    case InboundMessage::kHistory: {
      const auto& history = message.history();
      vector<string> commands(history.commands().begin(),
                              history.commands().end());
      listeners->emitHistory(commands, history.total());
      break;
    }
    case InboundMessage::kSignalEcho:
      VLOG(1) << "Agent delivered signal "
              << message.signal_echo().signal_number();
      break;
    case InboundMessage::kConfigUpdate:
      LOG(INFO) << "Agent sent a config update with "
                << message.config_update().entries_size() << " entries";
      break;
    case InboundMessage::kCancel:
      LOG(INFO) << "Agent cancelled command "
                << message.cancel().command_id();
      break;
    case InboundMessage::PAYLOAD_NOT_SET:
      LOG(WARNING) << "Dropping inbound message " << message.message_id()
                   << " with unknown payload";
      break;
  }
}
}  // namespace rt
