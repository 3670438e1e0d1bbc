#ifndef __RT_PACKET_H__
#define __RT_PACKET_H__

#include "Headers.hpp"

namespace rt {
/**
 * @brief A typed frame on a relay connection: one header byte (an
 * RtPacketType) followed by an opaque payload.
 */
class Packet {
 public:
  Packet() : header(255) {}
  Packet(uint8_t _header, const string& _payload)
      : header(_header), payload(_payload) {}
  /**
   * @brief Deserializes a packet from its raw byte representation.
   */
  explicit Packet(const string& serializedPacket) {
    if (serializedPacket.empty()) {
      throw std::runtime_error("Empty packet");
    }
    header = serializedPacket[0];
    payload = serializedPacket.substr(1);
  }

  uint8_t getHeader() const { return header; }
  const string& getPayload() const { return payload; }

  ssize_t length() const { return HEADER_SIZE + payload.length(); }

  string serialize() const {
    string s = "0" + payload;
    s[0] = header;
    return s;
  }

 protected:
  static const int HEADER_SIZE = 1;
  uint8_t header;
  string payload;
};
}  // namespace rt

#endif
