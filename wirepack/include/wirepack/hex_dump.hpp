// Copyright (c) 2025 The Wirepack Authors
/**
 * @file hex_dump.hpp
 * @brief Hex formatting and parsing for packet inspection.
 */
#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "wirepack/error.hpp"
#include "wirepack/export.hpp"

namespace wirepack {

/** Lowercase hex pairs joined by separator: "45 00 00 1c". */
WIREPACK_API std::string ToHex(const std::vector<uint8_t>& bytes,
                               const std::string& separator = " ");

/**
 * @brief Parses hex text, ignoring whitespace, ':', '.' and '-'.
 * @return false with kInvalidArgument on non-hex characters or an odd
 *         number of digits.
 */
WIREPACK_API bool FromHex(const std::string& text, std::vector<uint8_t>* out,
                          Error* err = nullptr);

/**
 * @brief Classic hex dump, one line per bytes_per_line bytes:
 *
 *     00000000  45 00 00 1c 00 00 00 00  |E.......|
 */
WIREPACK_API std::string Dump(const std::vector<uint8_t>& bytes,
                              size_t bytes_per_line = 16);

/** 32-bit hex blocks, blocks_per_line per line: "4500001c 00000000". */
WIREPACK_API std::string ToBlocks(const std::vector<uint8_t>& bytes,
                                  size_t blocks_per_line = 4);

}  // namespace wirepack
