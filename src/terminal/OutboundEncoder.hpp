#ifndef __RT_OUTBOUND_ENCODER__
#define __RT_OUTBOUND_ENCODER__

#include "Headers.hpp"

namespace rt {
/**
 * @brief Fills the payload of control messages (resize, signal, history,
 * detach).
 *
 * Deployed agents only understand these as a colon-delimited
 * StatusUpdate.reason ("resize:120x40", "signal:2", "history:100:0",
 * "detach").  With legacy encoding off the first-class variants are used.
 */
class OutboundEncoder {
 public:
  struct ControlRequest {
    enum Kind { NONE, RESIZE, SIGNAL, HISTORY, DETACH };
    Kind kind = NONE;
    int first = 0;   // cols, signal number or limit
    int second = 0;  // rows or offset
  };

  explicit OutboundEncoder(bool _legacyStatusEncoding)
      : legacyStatusEncoding(_legacyStatusEncoding) {}

  void encodeResize(OutboundMessage* message, int cols, int rows) const;
  void encodeSignal(OutboundMessage* message, int signalNumber) const;
  void encodeHistoryRequest(OutboundMessage* message, int limit,
                            int offset) const;
  void encodeDetach(OutboundMessage* message) const;

  bool usesLegacyEncoding() const { return legacyStatusEncoding; }

  /**
   * @brief Reads a control request out of either encoding.
   * @return kind NONE for plain status reasons and other payloads.
   */
  static ControlRequest decode(const OutboundMessage& message);
  /** @brief Parses a legacy status reason. */
  static ControlRequest parseStatusReason(const string& reason);
  /** @brief Short human readable form used in verbose logs. */
  static string describe(const OutboundMessage& message);

 protected:
  bool legacyStatusEncoding;
};
}  // namespace rt

#endif  // __RT_OUTBOUND_ENCODER__
