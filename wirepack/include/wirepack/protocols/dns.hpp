// Copyright (c) 2025 The Wirepack Authors
/**
 * @file dns.hpp
 * @brief DNS message header (RFC 1035) with raw sections.
 */
#pragma once

#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

#include "wirepack/error.hpp"
#include "wirepack/export.hpp"
#include "wirepack/schema.hpp"

namespace wirepack {

/**
 * @brief Appends name in DNS label format (length-prefixed labels, 0 end).
 *
 * Rejects empty inner labels, labels over 63 bytes and names over 255
 * encoded bytes with kInvalidArgument. A single trailing dot is allowed.
 */
WIREPACK_API bool EncodeDomainName(const std::string& name,
                                   std::vector<uint8_t>* out,
                                   Error* err = nullptr);

struct WIREPACK_API DnsMessage {
  static constexpr size_t kHeaderSize = 12;

  static constexpr uint8_t kOpcodeQuery = 0;
  static constexpr uint8_t kOpcodeInverseQuery = 1;
  static constexpr uint8_t kOpcodeStatus = 2;

  static constexpr uint8_t kRcodeNoError = 0;
  static constexpr uint8_t kRcodeFormatError = 1;
  static constexpr uint8_t kRcodeServerFailure = 2;
  static constexpr uint8_t kRcodeNameError = 3;
  static constexpr uint8_t kRcodeNotImplemented = 4;
  static constexpr uint8_t kRcodeRefused = 5;

  static constexpr uint16_t kTypeA = 1;
  static constexpr uint16_t kTypeNs = 2;
  static constexpr uint16_t kTypeCname = 5;
  static constexpr uint16_t kTypeMx = 15;
  static constexpr uint16_t kTypeTxt = 16;
  static constexpr uint16_t kTypeAaaa = 28;
  static constexpr uint16_t kClassIn = 1;

  uint16_t id = 0;
  uint8_t qr = 0;  ///< 0 query, 1 response
  uint8_t opcode = kOpcodeQuery;
  uint8_t aa = 0;
  uint8_t tc = 0;
  uint8_t rd = 1;
  uint8_t ra = 0;
  uint8_t z = 0;
  uint8_t rcode = kRcodeNoError;
  uint16_t question_count = 0;
  uint16_t answer_count = 0;
  uint16_t authority_count = 0;
  uint16_t additional_count = 0;
  std::vector<uint8_t> sections;  ///< Question/answer/... records, raw

  static void Describe(SchemaBuilder<DnsMessage>* b);

  /** Appends a question record and bumps question_count. */
  bool AppendQuestion(const std::string& name, uint16_t qtype,
                      uint16_t qclass = kClassIn, Error* err = nullptr);

  /** Standard recursive query with a single question. */
  static bool BuildQuery(uint16_t id, const std::string& name, uint16_t qtype,
                         DnsMessage* out, Error* err = nullptr);

  bool IsResponse() const { return qr != 0; }
};

WIREPACK_API bool operator==(const DnsMessage& a, const DnsMessage& b);
inline bool operator!=(const DnsMessage& a, const DnsMessage& b) {
  return !(a == b);
}
WIREPACK_API std::ostream& operator<<(std::ostream& os, const DnsMessage& m);

}  // namespace wirepack
