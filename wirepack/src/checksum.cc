// Copyright (c) 2025 The Wirepack Authors
#include "wirepack/checksum.hpp"

#include <vector>

#include "internal/byte_io.hpp"

namespace wirepack {

namespace {

uint32_t Accumulate(uint32_t sum, const uint8_t* data, size_t size) {
  size_t i = 0;
  for (; i + 1 < size; i += 2) {
    sum += (static_cast<uint32_t>(data[i]) << 8) | data[i + 1];
    if ((sum & 0x80000000U) != 0U) sum = (sum & 0xffffU) + (sum >> 16);
  }
  if (i < size) sum += static_cast<uint32_t>(data[i]) << 8;
  return sum;
}

uint16_t Finish(uint32_t sum) {
  while ((sum >> 16) != 0U) sum = (sum & 0xffffU) + (sum >> 16);
  return static_cast<uint16_t>(~sum & 0xffffU);
}

}  // namespace

uint16_t InternetChecksum(const uint8_t* data, size_t size) {
  return Finish(Accumulate(0, data, size));
}

uint16_t TransportChecksum(uint32_t src, uint32_t dst, uint8_t protocol,
                           const std::vector<uint8_t>& segment) {
  std::vector<uint8_t> pseudo;
  pseudo.reserve(12);
  internal::AppendBe(&pseudo, src, 4);
  internal::AppendBe(&pseudo, dst, 4);
  pseudo.push_back(0);
  pseudo.push_back(protocol);
  internal::AppendBe(&pseudo, static_cast<uint32_t>(segment.size()), 2);
  uint32_t sum = Accumulate(0, pseudo.data(), pseudo.size());
  sum = Accumulate(sum, segment.data(), segment.size());
  return Finish(sum);
}

}  // namespace wirepack
