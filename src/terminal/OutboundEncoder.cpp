#include "OutboundEncoder.hpp"

namespace rt {
namespace {
bool parseInt(const string& s, int* out) {
  if (s.empty()) {
    return false;
  }
  try {
    size_t used = 0;
    int value = stoi(s, &used);
    if (used != s.length()) {
      return false;
    }
    *out = value;
    return true;
  } catch (const std::logic_error&) {
    return false;
  }
}
}  // namespace

void OutboundEncoder::encodeResize(OutboundMessage* message, int cols,
                                   int rows) const {
  if (legacyStatusEncoding) {
    message->mutable_status()->set_reason("resize:" + to_string(cols) + "x" +
                                          to_string(rows));
    return;
  }
  auto* size = message->mutable_resize()->mutable_size();
  size->set_cols(cols);
  size->set_rows(rows);
}

void OutboundEncoder::encodeSignal(OutboundMessage* message,
                                   int signalNumber) const {
  if (legacyStatusEncoding) {
    message->mutable_status()->set_reason("signal:" + to_string(signalNumber));
    return;
  }
  message->mutable_signal_request()->set_signal_number(signalNumber);
}

void OutboundEncoder::encodeHistoryRequest(OutboundMessage* message, int limit,
                                           int offset) const {
  if (legacyStatusEncoding) {
    message->mutable_status()->set_reason("history:" + to_string(limit) + ":" +
                                          to_string(offset));
    return;
  }
  auto* history = message->mutable_history_request();
  history->set_limit(limit);
  history->set_offset(offset);
}

void OutboundEncoder::encodeDetach(OutboundMessage* message) const {
  if (legacyStatusEncoding) {
    message->mutable_status()->set_reason("detach");
    return;
  }
  message->mutable_detach();
}

OutboundEncoder::ControlRequest OutboundEncoder::parseStatusReason(
    const string& reason) {
  ControlRequest request;
  if (reason == "detach") {
    request.kind = ControlRequest::DETACH;
    return request;
  }
  auto tokens = split(reason, ':');
  if (tokens.size() == 2 && tokens[0] == "resize") {
    auto dims = split(tokens[1], 'x');
    if (dims.size() == 2 && parseInt(dims[0], &request.first) &&
        parseInt(dims[1], &request.second)) {
      request.kind = ControlRequest::RESIZE;
    }
  } else if (tokens.size() == 2 && tokens[0] == "signal") {
    if (parseInt(tokens[1], &request.first)) {
      request.kind = ControlRequest::SIGNAL;
    }
  } else if (tokens.size() == 3 && tokens[0] == "history") {
    if (parseInt(tokens[1], &request.first) &&
        parseInt(tokens[2], &request.second)) {
      request.kind = ControlRequest::HISTORY;
    }
  }
  return request;
}

OutboundEncoder::ControlRequest OutboundEncoder::decode(
    const OutboundMessage& message) {
  ControlRequest request;
  switch (message.payload_case()) {
    case OutboundMessage::kStatus:
      return parseStatusReason(message.status().reason());
    case OutboundMessage::kResize:
      request.kind = ControlRequest::RESIZE;
      request.first = message.resize().size().cols();
      request.second = message.resize().size().rows();
      break;
    case OutboundMessage::kSignalRequest:
      request.kind = ControlRequest::SIGNAL;
      request.first = message.signal_request().signal_number();
      break;
    case OutboundMessage::kHistoryRequest:
      request.kind = ControlRequest::HISTORY;
      request.first = message.history_request().limit();
      request.second = message.history_request().offset();
      break;
    case OutboundMessage::kDetach:
      request.kind = ControlRequest::DETACH;
      break;
    default:
      break;
  }
  return request;
}

string OutboundEncoder::describe(const OutboundMessage& message) {
  ControlRequest request = decode(message);
  switch (request.kind) {
    case ControlRequest::RESIZE:
      return "resize " + to_string(request.first) + "x" +
             to_string(request.second);
    case ControlRequest::SIGNAL:
      return "signal " + to_string(request.first);
    case ControlRequest::HISTORY:
      return "history " + to_string(request.first) + "@" +
             to_string(request.second);
    case ControlRequest::DETACH:
      return "detach";
    case ControlRequest::NONE:
      break;
  }
  switch (message.payload_case()) {
    case OutboundMessage::kRegistration:
      return "register " + message.registration().version();
    case OutboundMessage::kInput:
      return "input (" + to_string(message.input().data().size()) + " bytes)";
    case OutboundMessage::kStatus:
      return "status " + message.status().reason();
    case OutboundMessage::kHeartbeat:
      return "heartbeat";
    default:
      return "empty";
  }
}
}  // namespace rt
