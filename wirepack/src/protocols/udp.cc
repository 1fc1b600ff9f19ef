// Copyright (c) 2025 The Wirepack Authors
#include "wirepack/protocols/udp.hpp"

#include <ostream>
#include <utility>
#include <vector>

#include "wirepack/checksum.hpp"
#include "wirepack/codec.hpp"
#include "wirepack/protocols/ipv4.hpp"

namespace wirepack {

void UdpDatagram::Describe(SchemaBuilder<UdpDatagram>* b) {
  b->Name("UdpDatagram")
      .Int("source_port", &UdpDatagram::source_port)
      .Int("destination_port", &UdpDatagram::destination_port)
      .Int("length", &UdpDatagram::length)
      .Validate(Constraint::Min(kHeaderSize))
      .Int("checksum", &UdpDatagram::checksum)
      .AutoChecksum()
      .Bytes("payload", &UdpDatagram::payload);
}

UdpDatagram UdpDatagram::Make(uint16_t source_port, uint16_t destination_port,
                              std::vector<uint8_t> payload) {
  UdpDatagram d;
  d.source_port = source_port;
  d.destination_port = destination_port;
  d.length = static_cast<uint16_t>(kHeaderSize + payload.size());
  d.payload = std::move(payload);
  return d;
}

bool UdpDatagram::FillChecksum(uint32_t source, uint32_t destination,
                               Error* err) {
  UdpDatagram copy = *this;
  copy.checksum = 0;
  std::vector<uint8_t> bytes;
  if (!Encode(copy, &bytes, err)) return false;
  bytes[6] = 0;
  bytes[7] = 0;
  const uint16_t sum =
      TransportChecksum(source, destination, kProtocolUdp, bytes);
  // RFC 768: a computed zero is transmitted as all ones.
  checksum = sum == 0 ? 0xffff : sum;
  return true;
}

bool operator==(const UdpDatagram& a, const UdpDatagram& b) {
  return a.source_port == b.source_port &&
         a.destination_port == b.destination_port && a.length == b.length &&
         a.checksum == b.checksum && a.payload == b.payload;
}

std::ostream& operator<<(std::ostream& os, const UdpDatagram& d) {
  os << "UDP{" << d.source_port << " -> " << d.destination_port
     << " len=" << d.length << " csum=0x" << std::hex << d.checksum << std::dec
     << " payload=" << d.payload.size() << "B}";
  return os;
}

}  // namespace wirepack
