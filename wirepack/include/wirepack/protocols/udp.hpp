// Copyright (c) 2025 The Wirepack Authors
/**
 * @file udp.hpp
 * @brief UDP datagram (RFC 768).
 */
#pragma once

#include <cstdint>
#include <ostream>
#include <vector>

#include "wirepack/export.hpp"
#include "wirepack/schema.hpp"

namespace wirepack {

struct WIREPACK_API UdpDatagram {
  static constexpr size_t kHeaderSize = 8;

  uint16_t source_port = 0;
  uint16_t destination_port = 0;
  uint16_t length = kHeaderSize;  ///< Header plus payload
  uint16_t checksum = 0;
  std::vector<uint8_t> payload;

  static void Describe(SchemaBuilder<UdpDatagram>* b);

  /** Builds a datagram with length filled from the payload. */
  static UdpDatagram Make(uint16_t source_port, uint16_t destination_port,
                          std::vector<uint8_t> payload);

  /** Sets checksum from the IPv4 pseudo-header. */
  bool FillChecksum(uint32_t source, uint32_t destination,
                    Error* err = nullptr);
};

WIREPACK_API bool operator==(const UdpDatagram& a, const UdpDatagram& b);
inline bool operator!=(const UdpDatagram& a, const UdpDatagram& b) {
  return !(a == b);
}
WIREPACK_API std::ostream& operator<<(std::ostream& os, const UdpDatagram& d);

}  // namespace wirepack
