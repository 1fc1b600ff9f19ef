// Copyright (c) 2025 The Wirepack Authors
#include "wirepack/hex_dump.hpp"

#include <cctype>
#include <cstdio>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace wirepack {

namespace {

const char kDigits[] = "0123456789abcdef";

void AppendByte(std::string* s, uint8_t b) {
  s->push_back(kDigits[b >> 4]);
  s->push_back(kDigits[b & 0x0f]);
}

int Nibble(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

}  // namespace

std::string ToHex(const std::vector<uint8_t>& bytes,
                  const std::string& separator) {
  std::string out;
  out.reserve(bytes.size() * (2 + separator.size()));
  for (size_t i = 0; i < bytes.size(); ++i) {
    if (i != 0) out += separator;
    AppendByte(&out, bytes[i]);
  }
  return out;
}

bool FromHex(const std::string& text, std::vector<uint8_t>* out, Error* err) {
  std::string digits;
  digits.reserve(text.size());
  for (char c : text) {
    if (std::isspace(static_cast<unsigned char>(c)) || c == ':' || c == '.' ||
        c == '-') {
      continue;
    }
    if (Nibble(c) < 0) {
      return Fail(err, Error::InvalidArgument(
                           std::string("Invalid hexadecimal character '") + c +
                           "'"));
    }
    digits.push_back(c);
  }
  if (digits.size() % 2 != 0) {
    return Fail(err, Error::InvalidArgument(
                         "Hexadecimal string must have even length"));
  }
  std::vector<uint8_t> bytes;
  bytes.reserve(digits.size() / 2);
  for (size_t i = 0; i < digits.size(); i += 2) {
    bytes.push_back(
        static_cast<uint8_t>((Nibble(digits[i]) << 4) | Nibble(digits[i + 1])));
  }
  *out = std::move(bytes);
  return true;
}

std::string Dump(const std::vector<uint8_t>& bytes, size_t bytes_per_line) {
  if (bytes_per_line == 0) bytes_per_line = 16;
  std::ostringstream oss;
  for (size_t off = 0; off < bytes.size(); off += bytes_per_line) {
    if (off != 0) oss << '\n';
    char offset[16];
    std::snprintf(offset, sizeof(offset), "%08zx", off);
    std::string hex;
    std::string ascii;
    for (size_t j = 0; j < bytes_per_line; ++j) {
      if (j != 0) hex.push_back(' ');
      if (off + j < bytes.size()) {
        const uint8_t b = bytes[off + j];
        AppendByte(&hex, b);
        ascii.push_back(b >= 32 && b <= 126 ? static_cast<char>(b) : '.');
      } else {
        hex += "  ";
      }
    }
    oss << offset << "  " << hex << "  |" << ascii << '|';
  }
  return oss.str();
}

std::string ToBlocks(const std::vector<uint8_t>& bytes,
                     size_t blocks_per_line) {
  if (blocks_per_line == 0) blocks_per_line = 4;
  std::string out;
  size_t in_line = 0;
  for (size_t i = 0; i < bytes.size(); i += 4) {
    if (in_line == blocks_per_line) {
      out.push_back('\n');
      in_line = 0;
    } else if (in_line != 0) {
      out.push_back(' ');
    }
    for (size_t j = i; j < i + 4 && j < bytes.size(); ++j) {
      AppendByte(&out, bytes[j]);
    }
    ++in_line;
  }
  return out;
}

}  // namespace wirepack
