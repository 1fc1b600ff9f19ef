// Copyright (c) 2025 The Wirepack Authors
/**
 * @file arp.hpp
 * @brief ARP packet for Ethernet/IPv4 (RFC 826).
 */
#pragma once

#include <array>
#include <cstdint>
#include <ostream>
#include <string>

#include "wirepack/export.hpp"
#include "wirepack/schema.hpp"

namespace wirepack {

using MacAddress = std::array<uint8_t, 6>;

/** Parses "aa:bb:cc:dd:ee:ff" (':' or '-' separated). */
WIREPACK_API bool MacFromString(const std::string& text, MacAddress* out);
/** Formats as lowercase "aa:bb:cc:dd:ee:ff". */
WIREPACK_API std::string MacToString(const MacAddress& mac);

struct WIREPACK_API ArpPacket {
  static constexpr size_t kSize = 28;
  static constexpr uint16_t kHardwareEthernet = 1;
  static constexpr uint16_t kProtocolIpv4 = 0x0800;
  static constexpr uint16_t kOperationRequest = 1;
  static constexpr uint16_t kOperationReply = 2;

  uint16_t hardware_type = kHardwareEthernet;
  uint16_t protocol_type = kProtocolIpv4;
  uint8_t hardware_length = 6;
  uint8_t protocol_length = 4;
  uint16_t operation = kOperationRequest;
  MacAddress sender_mac{};
  uint32_t sender_ip = 0;
  MacAddress target_mac{};
  uint32_t target_ip = 0;

  static void Describe(SchemaBuilder<ArpPacket>* b);

  /** Who-has request for target_ip. */
  static ArpPacket Request(const MacAddress& sender_mac, uint32_t sender_ip,
                           uint32_t target_ip);
  /** Reply to request announcing sender_mac for the requested address. */
  static ArpPacket Reply(const ArpPacket& request,
                         const MacAddress& sender_mac);
};

WIREPACK_API bool operator==(const ArpPacket& a, const ArpPacket& b);
inline bool operator!=(const ArpPacket& a, const ArpPacket& b) {
  return !(a == b);
}
WIREPACK_API std::ostream& operator<<(std::ostream& os, const ArpPacket& p);

}  // namespace wirepack
