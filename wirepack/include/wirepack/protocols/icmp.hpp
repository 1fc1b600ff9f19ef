// Copyright (c) 2025 The Wirepack Authors
/**
 * @file icmp.hpp
 * @brief ICMP echo-style message (RFC 792).
 */
#pragma once

#include <cstdint>
#include <ostream>
#include <vector>

#include "wirepack/export.hpp"
#include "wirepack/schema.hpp"

namespace wirepack {

/**
 * ICMP message with the echo header layout (type, code, checksum,
 * identifier, sequence) followed by data. The checksum covers the whole
 * message and is computed on encode while it is zero.
 */
struct WIREPACK_API IcmpPacket {
  static constexpr size_t kHeaderSize = 8;
  static constexpr uint8_t kTypeEchoReply = 0;
  static constexpr uint8_t kTypeDestinationUnreachable = 3;
  static constexpr uint8_t kTypeEchoRequest = 8;
  static constexpr uint8_t kTypeTimeExceeded = 11;

  uint8_t type = kTypeEchoRequest;
  uint8_t code = 0;
  uint16_t checksum = 0;
  uint16_t identifier = 0;
  uint16_t sequence_number = 0;
  std::vector<uint8_t> data;

  static void Describe(SchemaBuilder<IcmpPacket>* b);

  static IcmpPacket EchoRequest(uint16_t identifier, uint16_t sequence,
                                std::vector<uint8_t> data);
  /** Reply mirroring a request's identifier, sequence and data. */
  static IcmpPacket EchoReply(const IcmpPacket& request);

  bool IsEchoRequest() const { return type == kTypeEchoRequest && code == 0; }
  bool IsEchoReply() const { return type == kTypeEchoReply && code == 0; }
};

WIREPACK_API bool operator==(const IcmpPacket& a, const IcmpPacket& b);
inline bool operator!=(const IcmpPacket& a, const IcmpPacket& b) {
  return !(a == b);
}
WIREPACK_API std::ostream& operator<<(std::ostream& os, const IcmpPacket& p);

}  // namespace wirepack
