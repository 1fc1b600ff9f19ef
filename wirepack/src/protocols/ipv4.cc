// Copyright (c) 2025 The Wirepack Authors
#include "wirepack/protocols/ipv4.hpp"

#include <arpa/inet.h>

#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace wirepack {

void Ipv4Packet::Describe(SchemaBuilder<Ipv4Packet>* b) {
  b->Name("Ipv4Packet")
      .Bits("version", &Ipv4Packet::version, 4)
      .Validate(Constraint::OneOf({4}))
      .Bits("ihl", &Ipv4Packet::ihl, 4)
      .Validate(Constraint::Min(5))
      .Int("tos", &Ipv4Packet::tos)
      .Int("total_length", &Ipv4Packet::total_length)
      .Int("identification", &Ipv4Packet::identification)
      .Bits("flags", &Ipv4Packet::flags, 3)
      .Bits("fragment_offset", &Ipv4Packet::fragment_offset, 13)
      .Int("ttl", &Ipv4Packet::ttl)
      .Int("protocol", &Ipv4Packet::protocol)
      .Int("header_checksum", &Ipv4Packet::header_checksum)
      .AutoChecksum(ChecksumScope::kHeaderWords, "ihl")
      .Int("source", &Ipv4Packet::source)
      .Int("destination", &Ipv4Packet::destination)
      .Bytes("payload", &Ipv4Packet::payload);
}

Ipv4Packet Ipv4Packet::Make(uint32_t source, uint32_t destination,
                            uint8_t protocol, std::vector<uint8_t> payload,
                            uint8_t ttl) {
  Ipv4Packet p;
  p.source = source;
  p.destination = destination;
  p.protocol = protocol;
  p.ttl = ttl;
  p.total_length = static_cast<uint16_t>(kHeaderSize + payload.size());
  p.payload = std::move(payload);
  return p;
}

std::string ProtocolName(uint8_t protocol) {
  switch (protocol) {
    case kProtocolIcmp:
      return "ICMP";
    case 2:
      return "IGMP";
    case kProtocolTcp:
      return "TCP";
    case kProtocolUdp:
      return "UDP";
    case 41:
      return "IPv6";
    case 47:
      return "GRE";
    case 50:
      return "ESP";
    case 51:
      return "AH";
    case 58:
      return "ICMPv6";
    case 89:
      return "OSPF";
    case 132:
      return "SCTP";
    default:
      return "Unknown(" + std::to_string(protocol) + ")";
  }
}

bool ParseIpv4Address(const std::string& text, uint32_t* out) {
  in_addr addr{};
  if (inet_pton(AF_INET, text.c_str(), &addr) != 1) return false;
  *out = ntohl(addr.s_addr);
  return true;
}

std::string FormatIpv4Address(uint32_t address) {
  std::ostringstream oss;
  oss << ((address >> 24) & 0xffU) << '.' << ((address >> 16) & 0xffU) << '.'
      << ((address >> 8) & 0xffU) << '.' << (address & 0xffU);
  return oss.str();
}

bool operator==(const Ipv4Packet& a, const Ipv4Packet& b) {
  return a.version == b.version && a.ihl == b.ihl && a.tos == b.tos &&
         a.total_length == b.total_length &&
         a.identification == b.identification && a.flags == b.flags &&
         a.fragment_offset == b.fragment_offset && a.ttl == b.ttl &&
         a.protocol == b.protocol && a.header_checksum == b.header_checksum &&
         a.source == b.source && a.destination == b.destination &&
         a.payload == b.payload;
}

std::ostream& operator<<(std::ostream& os, const Ipv4Packet& p) {
  os << "IPv4{" << FormatIpv4Address(p.source) << " -> "
     << FormatIpv4Address(p.destination)
     << " proto=" << ProtocolName(p.protocol)
     << " ttl=" << static_cast<int>(p.ttl) << " len=" << p.total_length
     << " id=" << p.identification << " flags=" << static_cast<int>(p.flags)
     << " frag=" << p.fragment_offset << " csum=0x" << std::hex
     << p.header_checksum << std::dec << " payload=" << p.payload.size()
     << "B}";
  return os;
}

}  // namespace wirepack
