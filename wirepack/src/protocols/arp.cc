// Copyright (c) 2025 The Wirepack Authors
#include "wirepack/protocols/arp.hpp"

#include <cctype>
#include <cstdio>
#include <ostream>
#include <string>

#include "wirepack/protocols/ipv4.hpp"

namespace wirepack {

namespace {

int HexValue(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

}  // namespace

bool MacFromString(const std::string& text, MacAddress* out) {
  MacAddress mac{};
  size_t pos = 0;
  for (size_t i = 0; i < mac.size(); ++i) {
    if (i != 0) {
      if (pos >= text.size() || (text[pos] != ':' && text[pos] != '-')) {
        return false;
      }
      ++pos;
    }
    // One or two hex digits per octet.
    int value = 0;
    size_t digits = 0;
    while (pos < text.size() && digits < 2 && HexValue(text[pos]) >= 0) {
      value = value * 16 + HexValue(text[pos]);
      ++pos;
      ++digits;
    }
    if (digits == 0) return false;
    mac[i] = static_cast<uint8_t>(value);
  }
  if (pos != text.size()) return false;
  *out = mac;
  return true;
}

std::string MacToString(const MacAddress& mac) {
  char buf[18];
  std::snprintf(buf, sizeof(buf), "%02x:%02x:%02x:%02x:%02x:%02x", mac[0],
                mac[1], mac[2], mac[3], mac[4], mac[5]);
  return buf;
}

void ArpPacket::Describe(SchemaBuilder<ArpPacket>* b) {
  b->Name("ArpPacket")
      .Int("hardware_type", &ArpPacket::hardware_type)
      .Int("protocol_type", &ArpPacket::protocol_type)
      .Int("hardware_length", &ArpPacket::hardware_length)
      .Int("protocol_length", &ArpPacket::protocol_length)
      .Int("operation", &ArpPacket::operation)
      .Validate(Constraint::OneOf({kOperationRequest, kOperationReply}))
      .FixedBytes("sender_mac", &ArpPacket::sender_mac)
      .Int("sender_ip", &ArpPacket::sender_ip)
      .FixedBytes("target_mac", &ArpPacket::target_mac)
      .Int("target_ip", &ArpPacket::target_ip);
}

ArpPacket ArpPacket::Request(const MacAddress& sender_mac, uint32_t sender_ip,
                             uint32_t target_ip) {
  ArpPacket p;
  p.operation = kOperationRequest;
  p.sender_mac = sender_mac;
  p.sender_ip = sender_ip;
  p.target_ip = target_ip;
  return p;
}

ArpPacket ArpPacket::Reply(const ArpPacket& request,
                           const MacAddress& sender_mac) {
  ArpPacket p;
  p.operation = kOperationReply;
  p.sender_mac = sender_mac;
  p.sender_ip = request.target_ip;
  p.target_mac = request.sender_mac;
  p.target_ip = request.sender_ip;
  return p;
}

bool operator==(const ArpPacket& a, const ArpPacket& b) {
  return a.hardware_type == b.hardware_type &&
         a.protocol_type == b.protocol_type &&
         a.hardware_length == b.hardware_length &&
         a.protocol_length == b.protocol_length &&
         a.operation == b.operation && a.sender_mac == b.sender_mac &&
         a.sender_ip == b.sender_ip && a.target_mac == b.target_mac &&
         a.target_ip == b.target_ip;
}

std::ostream& operator<<(std::ostream& os, const ArpPacket& p) {
  if (p.operation == ArpPacket::kOperationRequest) {
    os << "ARP{who-has " << FormatIpv4Address(p.target_ip) << " tell "
       << FormatIpv4Address(p.sender_ip) << " (" << MacToString(p.sender_mac)
       << ")}";
  } else {
    os << "ARP{" << FormatIpv4Address(p.sender_ip) << " is-at "
       << MacToString(p.sender_mac) << "}";
  }
  return os;
}

}  // namespace wirepack
