// Copyright (c) 2025 The Wirepack Authors
#include "wirepack/protocols/dns.hpp"

#include <ostream>
#include <string>
#include <utility>
#include <vector>

#include "internal/byte_io.hpp"

namespace wirepack {

namespace {

constexpr size_t kMaxLabel = 63;
constexpr size_t kMaxName = 255;

}  // namespace

bool EncodeDomainName(const std::string& name, std::vector<uint8_t>* out,
                      Error* err) {
  std::string trimmed = name;
  if (!trimmed.empty() && trimmed.back() == '.') trimmed.pop_back();

  std::vector<uint8_t> encoded;
  size_t start = 0;
  while (!trimmed.empty() && start <= trimmed.size()) {
    size_t dot = trimmed.find('.', start);
    if (dot == std::string::npos) dot = trimmed.size();
    const size_t len = dot - start;
    if (len == 0) {
      return Fail(err, Error::InvalidArgument("empty label in domain name '" +
                                              name + "'"));
    }
    if (len > kMaxLabel) {
      return Fail(err, Error::InvalidArgument(
                           "label longer than 63 bytes in '" + name + "'"));
    }
    encoded.push_back(static_cast<uint8_t>(len));
    encoded.insert(encoded.end(), trimmed.begin() + start,
                   trimmed.begin() + dot);
    start = dot + 1;
  }
  encoded.push_back(0);
  if (encoded.size() > kMaxName) {
    return Fail(err, Error::InvalidArgument("domain name longer than 255 "
                                            "bytes"));
  }
  out->insert(out->end(), encoded.begin(), encoded.end());
  return true;
}

void DnsMessage::Describe(SchemaBuilder<DnsMessage>* b) {
  b->Name("DnsMessage")
      .Int("id", &DnsMessage::id)
      .Bits("qr", &DnsMessage::qr, 1)
      .Bits("opcode", &DnsMessage::opcode, 4)
      .Bits("aa", &DnsMessage::aa, 1)
      .Bits("tc", &DnsMessage::tc, 1)
      .Bits("rd", &DnsMessage::rd, 1)
      .Bits("ra", &DnsMessage::ra, 1)
      .Bits("z", &DnsMessage::z, 3)
      .Bits("rcode", &DnsMessage::rcode, 4)
      .Int("question_count", &DnsMessage::question_count)
      .Int("answer_count", &DnsMessage::answer_count)
      .Int("authority_count", &DnsMessage::authority_count)
      .Int("additional_count", &DnsMessage::additional_count)
      .Bytes("sections", &DnsMessage::sections);
}

bool DnsMessage::AppendQuestion(const std::string& name, uint16_t qtype,
                                uint16_t qclass, Error* err) {
  std::vector<uint8_t> record;
  if (!EncodeDomainName(name, &record, err)) return false;
  internal::AppendBe(&record, qtype, 2);
  internal::AppendBe(&record, qclass, 2);
  sections.insert(sections.end(), record.begin(), record.end());
  ++question_count;
  return true;
}

bool DnsMessage::BuildQuery(uint16_t id, const std::string& name,
                            uint16_t qtype, DnsMessage* out, Error* err) {
  DnsMessage m;
  m.id = id;
  m.rd = 1;
  if (!m.AppendQuestion(name, qtype, kClassIn, err)) return false;
  *out = std::move(m);
  return true;
}

bool operator==(const DnsMessage& a, const DnsMessage& b) {
  return a.id == b.id && a.qr == b.qr && a.opcode == b.opcode &&
         a.aa == b.aa && a.tc == b.tc && a.rd == b.rd && a.ra == b.ra &&
         a.z == b.z && a.rcode == b.rcode &&
         a.question_count == b.question_count &&
         a.answer_count == b.answer_count &&
         a.authority_count == b.authority_count &&
         a.additional_count == b.additional_count && a.sections == b.sections;
}

std::ostream& operator<<(std::ostream& os, const DnsMessage& m) {
  os << "DNS{id=" << m.id << (m.IsResponse() ? " response" : " query")
     << " opcode=" << static_cast<int>(m.opcode)
     << " rcode=" << static_cast<int>(m.rcode) << (m.rd ? " rd" : "")
     << (m.ra ? " ra" : "") << (m.aa ? " aa" : "") << (m.tc ? " tc" : "")
     << " qd=" << m.question_count << " an=" << m.answer_count
     << " ns=" << m.authority_count << " ar=" << m.additional_count << "}";
  return os;
}

}  // namespace wirepack
