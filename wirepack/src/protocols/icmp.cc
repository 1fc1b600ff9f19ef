// Copyright (c) 2025 The Wirepack Authors
#include "wirepack/protocols/icmp.hpp"

#include <ostream>
#include <utility>
#include <vector>

namespace wirepack {

void IcmpPacket::Describe(SchemaBuilder<IcmpPacket>* b) {
  b->Name("IcmpPacket")
      .Int("type", &IcmpPacket::type)
      .Int("code", &IcmpPacket::code)
      .Int("checksum", &IcmpPacket::checksum)
      .AutoChecksum()
      .Int("identifier", &IcmpPacket::identifier)
      .Int("sequence_number", &IcmpPacket::sequence_number)
      .Bytes("data", &IcmpPacket::data);
}

IcmpPacket IcmpPacket::EchoRequest(uint16_t identifier, uint16_t sequence,
                                   std::vector<uint8_t> data) {
  IcmpPacket p;
  p.type = kTypeEchoRequest;
  p.identifier = identifier;
  p.sequence_number = sequence;
  p.data = std::move(data);
  return p;
}

IcmpPacket IcmpPacket::EchoReply(const IcmpPacket& request) {
  IcmpPacket p;
  p.type = kTypeEchoReply;
  p.identifier = request.identifier;
  p.sequence_number = request.sequence_number;
  p.data = request.data;
  return p;
}

bool operator==(const IcmpPacket& a, const IcmpPacket& b) {
  return a.type == b.type && a.code == b.code && a.checksum == b.checksum &&
         a.identifier == b.identifier &&
         a.sequence_number == b.sequence_number && a.data == b.data;
}

std::ostream& operator<<(std::ostream& os, const IcmpPacket& p) {
  const char* kind = p.IsEchoRequest()  ? "echo-request"
                     : p.IsEchoReply() ? "echo-reply"
                                       : "type";
  os << "ICMP{" << kind << " type=" << static_cast<int>(p.type)
     << " code=" << static_cast<int>(p.code) << " id=" << p.identifier
     << " seq=" << p.sequence_number << " csum=0x" << std::hex << p.checksum
     << std::dec << " data=" << p.data.size() << "B}";
  return os;
}

}  // namespace wirepack
