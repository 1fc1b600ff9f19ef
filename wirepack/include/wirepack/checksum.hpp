// Copyright (c) 2025 The Wirepack Authors
/**
 * @file checksum.hpp
 * @brief RFC 1071 Internet checksum.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "wirepack/export.hpp"

namespace wirepack {

/**
 * @brief One's-complement of the one's-complement sum of 16-bit words.
 *
 * Odd-length input is padded with a zero byte. A buffer whose checksum
 * field holds this value sums to zero (InternetChecksum() == 0).
 */
WIREPACK_API uint16_t InternetChecksum(const uint8_t* data, size_t size);

inline uint16_t InternetChecksum(const std::vector<uint8_t>& data) {
  return InternetChecksum(data.data(), data.size());
}

/**
 * @brief TCP/UDP checksum including the IPv4 pseudo-header.
 * @param src Source address (host order).
 * @param dst Destination address (host order).
 * @param protocol IP protocol number (6 for TCP, 17 for UDP).
 * @param segment Encoded transport header and payload, checksum field zero.
 */
WIREPACK_API uint16_t TransportChecksum(uint32_t src, uint32_t dst,
                                        uint8_t protocol,
                                        const std::vector<uint8_t>& segment);

}  // namespace wirepack
