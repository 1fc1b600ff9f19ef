// Copyright (c) 2025 The Wirepack Authors
/**
 * @file tcp.hpp
 * @brief TCP segment (RFC 793).
 */
#pragma once

#include <cstdint>
#include <ostream>
#include <vector>

#include "wirepack/export.hpp"
#include "wirepack/schema.hpp"

namespace wirepack {

/**
 * TCP header followed by options and payload as one data tail.
 *
 * The wire checksum needs the IPv4 pseudo-header; set it with
 * FillChecksum() before encoding. A zero checksum is filled with the
 * segment-only sum.
 */
struct WIREPACK_API TcpSegment {
  static constexpr size_t kHeaderSize = 20;

  // 9 flag bits, NS is the most significant.
  static constexpr uint16_t kFin = 0x001;
  static constexpr uint16_t kSyn = 0x002;
  static constexpr uint16_t kRst = 0x004;
  static constexpr uint16_t kPsh = 0x008;
  static constexpr uint16_t kAck = 0x010;
  static constexpr uint16_t kUrg = 0x020;
  static constexpr uint16_t kEce = 0x040;
  static constexpr uint16_t kCwr = 0x080;
  static constexpr uint16_t kNs = 0x100;

  uint16_t source_port = 0;
  uint16_t destination_port = 0;
  uint32_t sequence_number = 0;
  uint32_t acknowledgment_number = 0;
  uint8_t data_offset = 5;  ///< Header length in 32-bit words
  uint8_t reserved = 0;
  uint16_t flags = 0;
  uint16_t window_size = 65535;
  uint16_t checksum = 0;
  uint16_t urgent_pointer = 0;
  std::vector<uint8_t> data;

  static void Describe(SchemaBuilder<TcpSegment>* b);

  void SetFlags(uint16_t mask) { flags = mask & 0x1ffU; }
  bool HasFlag(uint16_t flag) const { return (flags & flag) != 0; }
  bool IsSyn() const { return HasFlag(kSyn); }
  bool IsAck() const { return HasFlag(kAck); }
  bool IsFin() const { return HasFlag(kFin); }
  bool IsRst() const { return HasFlag(kRst); }

  /**
   * @brief Sets checksum from the IPv4 pseudo-header.
   * @return false when the segment cannot be encoded.
   */
  bool FillChecksum(uint32_t source, uint32_t destination,
                    Error* err = nullptr);
};

WIREPACK_API bool operator==(const TcpSegment& a, const TcpSegment& b);
inline bool operator!=(const TcpSegment& a, const TcpSegment& b) {
  return !(a == b);
}
WIREPACK_API std::ostream& operator<<(std::ostream& os, const TcpSegment& s);

}  // namespace wirepack
