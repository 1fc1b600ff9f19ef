// Copyright (c) 2025 The Wirepack Authors
#include "wirepack/protocols/tcp.hpp"

#include <ostream>
#include <vector>

#include "wirepack/checksum.hpp"
#include "wirepack/codec.hpp"
#include "wirepack/protocols/ipv4.hpp"

namespace wirepack {

namespace {

// The checksum field must stay 0xffff when the computed sum is 0, or the
// encoder would overwrite it with the segment-only sum.
uint16_t NonZeroChecksum(uint16_t sum) { return sum == 0 ? 0xffff : sum; }

}  // namespace

void TcpSegment::Describe(SchemaBuilder<TcpSegment>* b) {
  b->Name("TcpSegment")
      .Int("source_port", &TcpSegment::source_port)
      .Int("destination_port", &TcpSegment::destination_port)
      .Int("sequence_number", &TcpSegment::sequence_number)
      .Int("acknowledgment_number", &TcpSegment::acknowledgment_number)
      .Bits("data_offset", &TcpSegment::data_offset, 4)
      .Validate(Constraint::Min(5))
      .Bits("reserved", &TcpSegment::reserved, 3)
      .Bits("flags", &TcpSegment::flags, 9)
      .Int("window_size", &TcpSegment::window_size)
      .Int("checksum", &TcpSegment::checksum)
      .AutoChecksum()
      .Int("urgent_pointer", &TcpSegment::urgent_pointer)
      .Bytes("data", &TcpSegment::data);
}

bool TcpSegment::FillChecksum(uint32_t source, uint32_t destination,
                              Error* err) {
  TcpSegment copy = *this;
  copy.checksum = 0;
  std::vector<uint8_t> bytes;
  if (!Encode(copy, &bytes, err)) return false;
  // Zero the field the encoder filled in.
  bytes[16] = 0;
  bytes[17] = 0;
  checksum = NonZeroChecksum(
      TransportChecksum(source, destination, kProtocolTcp, bytes));
  return true;
}

bool operator==(const TcpSegment& a, const TcpSegment& b) {
  return a.source_port == b.source_port &&
         a.destination_port == b.destination_port &&
         a.sequence_number == b.sequence_number &&
         a.acknowledgment_number == b.acknowledgment_number &&
         a.data_offset == b.data_offset && a.reserved == b.reserved &&
         a.flags == b.flags && a.window_size == b.window_size &&
         a.checksum == b.checksum && a.urgent_pointer == b.urgent_pointer &&
         a.data == b.data;
}

std::ostream& operator<<(std::ostream& os, const TcpSegment& s) {
  os << "TCP{" << s.source_port << " -> " << s.destination_port
     << " seq=" << s.sequence_number << " ack=" << s.acknowledgment_number
     << " flags=";
  const struct {
    uint16_t bit;
    char tag;
  } kTags[] = {{TcpSegment::kSyn, 'S'}, {TcpSegment::kAck, 'A'},
               {TcpSegment::kFin, 'F'}, {TcpSegment::kRst, 'R'},
               {TcpSegment::kPsh, 'P'}, {TcpSegment::kUrg, 'U'}};
  bool any = false;
  for (const auto& t : kTags) {
    if (s.HasFlag(t.bit)) {
      os << t.tag;
      any = true;
    }
  }
  if (!any) os << '-';
  os << " win=" << s.window_size << " data=" << s.data.size() << "B}";
  return os;
}

}  // namespace wirepack
