// Copyright (c) 2025 The Wirepack Authors
/**
 * @file ipv4.hpp
 * @brief IPv4 datagram (RFC 791).
 */
#pragma once

#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

#include "wirepack/export.hpp"
#include "wirepack/schema.hpp"

namespace wirepack {

constexpr uint8_t kProtocolIcmp = 1;
constexpr uint8_t kProtocolTcp = 6;
constexpr uint8_t kProtocolUdp = 17;

/** Returns "ICMP", "TCP", "UDP", ... or "Unknown(<n>)". */
WIREPACK_API std::string ProtocolName(uint8_t protocol);

/** Parses dotted-quad text into a host-order address. */
WIREPACK_API bool ParseIpv4Address(const std::string& text, uint32_t* out);
WIREPACK_API std::string FormatIpv4Address(uint32_t address);

/**
 * IPv4 header followed by the payload.
 *
 * Header options (ihl > 5) are not split out; they stay at the front of
 * payload. The header checksum covers ihl * 4 bytes, options included, and
 * is computed on encode while it is zero.
 */
struct WIREPACK_API Ipv4Packet {
  static constexpr size_t kHeaderSize = 20;
  static constexpr uint8_t kFlagDontFragment = 0x2;
  static constexpr uint8_t kFlagMoreFragments = 0x1;

  uint8_t version = 4;
  uint8_t ihl = 5;  ///< Header length in 32-bit words
  uint8_t tos = 0;
  uint16_t total_length = 0;
  uint16_t identification = 0;
  uint8_t flags = 0;             ///< 3 bits
  uint16_t fragment_offset = 0;  ///< 13 bits, in 8-byte units
  uint8_t ttl = 64;
  uint8_t protocol = 0;
  uint16_t header_checksum = 0;
  uint32_t source = 0;
  uint32_t destination = 0;
  std::vector<uint8_t> payload;

  static void Describe(SchemaBuilder<Ipv4Packet>* b);

  /** Builds a datagram with total_length filled from the payload. */
  static Ipv4Packet Make(uint32_t source, uint32_t destination,
                         uint8_t protocol, std::vector<uint8_t> payload,
                         uint8_t ttl = 64);
};

WIREPACK_API bool operator==(const Ipv4Packet& a, const Ipv4Packet& b);
inline bool operator!=(const Ipv4Packet& a, const Ipv4Packet& b) {
  return !(a == b);
}
WIREPACK_API std::ostream& operator<<(std::ostream& os, const Ipv4Packet& p);

}  // namespace wirepack
