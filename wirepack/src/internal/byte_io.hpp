// Copyright (c) 2025 The Wirepack Authors
/**
 * @file byte_io.hpp
 * @brief Big-endian integer helpers used by the codec.
 */
#ifndef WIREPACK_INTERNAL_BYTE_IO_HPP_
#define WIREPACK_INTERNAL_BYTE_IO_HPP_

#include <cstddef>
#include <cstdint>
#include <vector>

namespace wirepack {
namespace internal {

/** Appends the low `bytes` bytes of v in network order. */
inline void AppendBe(std::vector<uint8_t>* out, uint32_t v, size_t bytes) {
  for (size_t i = bytes; i > 0; --i) {
    out->push_back(static_cast<uint8_t>((v >> (8 * (i - 1))) & 0xffU));
  }
}

/** Reads `bytes` bytes (1..4) at p as an unsigned big-endian value. */
inline uint32_t ReadBe(const uint8_t* p, size_t bytes) {
  uint32_t v = 0;
  for (size_t i = 0; i < bytes; ++i) v = (v << 8) | p[i];
  return v;
}

inline void WriteBe16(uint8_t* p, uint16_t v) {
  p[0] = static_cast<uint8_t>((v >> 8) & 0xffU);
  p[1] = static_cast<uint8_t>(v & 0xffU);
}

/** Sign-extends the low `bits` bits of raw. */
inline int64_t SignExtend(uint32_t raw, uint32_t bits) {
  if (bits >= 32) return static_cast<int64_t>(static_cast<int32_t>(raw));
  const uint32_t sign = 1U << (bits - 1);
  const int64_t v = static_cast<int64_t>(raw & ((1U << bits) - 1U));
  return (raw & sign) != 0U ? v - (static_cast<int64_t>(1) << bits) : v;
}

/** True when v is representable in `bits` bits with the given signedness. */
inline bool FitsWidth(int64_t v, uint32_t bits, bool is_signed) {
  if (is_signed) {
    const int64_t lo = -(static_cast<int64_t>(1) << (bits - 1));
    const int64_t hi = (static_cast<int64_t>(1) << (bits - 1)) - 1;
    return v >= lo && v <= hi;
  }
  return v >= 0 && v <= ((static_cast<int64_t>(1) << bits) - 1);
}

}  // namespace internal
}  // namespace wirepack

#endif  // WIREPACK_INTERNAL_BYTE_IO_HPP_
