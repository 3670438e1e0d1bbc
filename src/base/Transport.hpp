#ifndef __RT_TRANSPORT__
#define __RT_TRANSPORT__

#include "Headers.hpp"

namespace rt {
/** @brief Authentication data attached to every connection. */
struct CallMetadata {
  string credential;
  string clientVersion;
};

/**
 * @brief One bidirectional message stream to a remote terminal session.
 *
 * write() is called from a single sending thread and read() from a single
 * receiving thread; cancel() may be called from any thread.
 */
class StreamChannel {
 public:
  virtual ~StreamChannel() {}

  virtual void write(const OutboundMessage& message) = 0;
  /**
   * @brief Blocks until the next inbound message arrives.
   * @return false when the far end finished the stream or cancel() was called.
   * @throws std::runtime_error when the channel breaks or a frame can't be
   * decoded.
   */
  virtual bool read(InboundMessage* message) = 0;
  /** @brief Tells the far end that no more messages will be written. */
  virtual void doneWriting() = 0;
  /** @brief Makes a pending or future read() return false. */
  virtual void cancel() = 0;
};

/**
 * @brief Connection to the remote side: the relay (streaming capable) or a
 * co-located agent (request/response only).
 */
class Transport {
 public:
  virtual ~Transport() {}

  virtual bool isStreamingCapable() const = 0;
  /**
   * @brief Opens a new bidirectional channel.
   * @throws ConnectionError when the channel can't be established.
   */
  virtual shared_ptr<StreamChannel> openStream() = 0;
  /**
   * @brief Issues one request/response call.
   * @throws TimeoutError when no response arrives within `timeout`.
   * @throws ConnectionError on connection or handshake failures.
   */
  virtual RpcResponse call(const RpcRequest& request,
                           std::chrono::milliseconds timeout) = 0;
  virtual const CallMetadata& getMetadata() const = 0;
};

/** @brief Builds a freshly authenticated transport for a credential. */
typedef std::function<shared_ptr<Transport>(const string& credential)>
    TransportFactory;
}  // namespace rt

#endif  // __RT_TRANSPORT__
