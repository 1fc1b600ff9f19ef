// Copyright (c) 2025 The Wirepack Authors
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>

#include "wirepack/codec.hpp"
#include "wirepack/hex_dump.hpp"
#include "wirepack/packet_capture.hpp"
#include "wirepack/protocols/arp.hpp"
#include "wirepack/protocols/dns.hpp"
#include "wirepack/protocols/icmp.hpp"
#include "wirepack/protocols/ipv4.hpp"
#include "wirepack/protocols/tcp.hpp"
#include "wirepack/protocols/udp.hpp"
#include "wirepack/security_audit.hpp"
#include "wirepack/security_guard.hpp"

namespace {
/**
 * @brief Thread-safe logger for debug messages.
 */
class Logger {
 public:
  explicit Logger(bool enabled) : enabled_(enabled) {}

  void Log(const std::string& msg) {
    if (!enabled_) return;
    std::lock_guard<std::mutex> lock(mutex_);
    std::fprintf(stderr, "%s\n", msg.c_str());
  }

 private:
  bool enabled_;
  std::mutex mutex_;
};

void PrintUsage() {
  std::fprintf(
      stderr,
      "Usage: wirepack_example [--max-buffer N] [--max-depth N] [--debug] "
      "COMMAND\n"
      "  decode ipv4|icmp|tcp|udp|arp|dns HEX   decode and print a packet\n"
      "  echo ID SEQ TEXT                        build an ICMP echo request\n"
      "  dns ID NAME                             build a DNS A query\n"
      "  audit                                   print the security report\n"
      "  capture icmp|tcp|udp COUNT SECONDS      print received datagrams "
      "(root)\n");
}

template <typename T>
int DecodeAndPrint(const std::vector<uint8_t>& bytes, Logger* logger) {
  T packet;
  wirepack::Error err;
  if (!wirepack::Decode(bytes, &packet, &err)) {
    std::ostringstream oss;
    oss << "decode failed: " << err;
    logger->Log(oss.str());
    std::fprintf(stderr, "%s\n", oss.str().c_str());
    return 1;
  }
  std::cout << packet << "\n" << wirepack::Dump(bytes) << std::endl;
  return 0;
}

int Decode(const std::string& proto, const std::string& hex, Logger* logger) {
  std::vector<uint8_t> bytes;
  wirepack::Error err;
  if (!wirepack::FromHex(hex, &bytes, &err)) {
    std::cerr << err << std::endl;
    return 2;
  }
  logger->Log("decoding " + std::to_string(bytes.size()) + " bytes as " +
              proto);
  using wirepack::ArpPacket;
  using wirepack::DnsMessage;
  using wirepack::IcmpPacket;
  using wirepack::Ipv4Packet;
  using wirepack::TcpSegment;
  using wirepack::UdpDatagram;
  if (proto == "ipv4") return DecodeAndPrint<Ipv4Packet>(bytes, logger);
  if (proto == "icmp") return DecodeAndPrint<IcmpPacket>(bytes, logger);
  if (proto == "tcp") return DecodeAndPrint<TcpSegment>(bytes, logger);
  if (proto == "udp") return DecodeAndPrint<UdpDatagram>(bytes, logger);
  if (proto == "arp") return DecodeAndPrint<ArpPacket>(bytes, logger);
  if (proto == "dns") return DecodeAndPrint<DnsMessage>(bytes, logger);
  std::fprintf(stderr, "Unknown protocol: %s\n", proto.c_str());
  return 2;
}

template <typename T>
int EncodeAndPrint(const T& packet) {
  std::vector<uint8_t> bytes;
  wirepack::Error err;
  if (!wirepack::Encode(packet, &bytes, &err)) {
    std::cerr << "encode failed: " << err << std::endl;
    return 1;
  }
  std::cout << packet << "\n" << wirepack::Dump(bytes) << std::endl;
  return 0;
}
int Capture(const std::string& proto, size_t count, double seconds,
            Logger* logger) {
  wirepack::PacketCapture::Options::Builder b;
  if (proto == "icmp") {
    b.Protocol(wirepack::kProtocolIcmp);
  } else if (proto == "tcp") {
    b.Protocol(wirepack::kProtocolTcp);
  } else if (proto == "udp") {
    b.Protocol(wirepack::kProtocolUdp);
  } else {
    std::fprintf(stderr, "Unknown protocol: %s\n", proto.c_str());
    return 2;
  }
  b.LogSink([logger](const std::string& s) { logger->Log(s); });

  wirepack::PacketCapture capture;
  capture.OnPacket([](const wirepack::CapturedPacket& p) {
    std::cout << p.Summary() << std::endl;
  });
  wirepack::Error err;
  if (!capture.Start(b.Build(), &err)) {
    std::cerr << err << std::endl;
    return 1;
  }
  std::vector<wirepack::CapturedPacket> packets;
  if (!capture.Capture(count, seconds, &packets, &err)) {
    std::cerr << err << std::endl;
    return 1;
  }
  std::cout << capture.GetStats() << std::endl;
  return 0;
}
}  // namespace

int main(int argc, char** argv) {
  bool debug = false;
  std::vector<std::string> args;
  auto& guard = wirepack::SecurityGuard::Instance();

  for (int i = 1; i < argc; ++i) {
    std::string a(argv[i]);
    auto need = [&](int n) { return i + n < argc; };
    wirepack::Error err;
    if (a == "--max-buffer" && need(1)) {
      if (!guard.SetMaxBufferSize(std::atoll(argv[++i]), &err)) {
        std::cerr << err << std::endl;
        return 2;
      }
    } else if (a == "--max-depth" && need(1)) {
      if (!guard.SetMaxNestingDepth(std::atoll(argv[++i]), &err)) {
        std::cerr << err << std::endl;
        return 2;
      }
    } else if (a == "--debug") {
      debug = true;
    } else if (a == "-h" || a == "--help") {
      PrintUsage();
      return 0;
    } else {
      args.push_back(a);
    }
  }

  Logger logger(debug);
  {
    std::ostringstream oss;
    oss << guard.Limits();
    logger.Log(oss.str());
  }

  if (args.empty()) {
    PrintUsage();
    return 2;
  }
  const std::string& cmd = args[0];
  if (cmd == "decode" && args.size() == 3) {
    return Decode(args[1], args[2], &logger);
  }
  if (cmd == "echo" && args.size() == 4) {
    const std::vector<uint8_t> data(args[3].begin(), args[3].end());
    return EncodeAndPrint(wirepack::IcmpPacket::EchoRequest(
        static_cast<uint16_t>(std::atoi(args[1].c_str())),
        static_cast<uint16_t>(std::atoi(args[2].c_str())), data));
  }
  if (cmd == "dns" && args.size() == 3) {
    wirepack::DnsMessage query;
    wirepack::Error err;
    if (!wirepack::DnsMessage::BuildQuery(
            static_cast<uint16_t>(std::atoi(args[1].c_str())), args[2],
            wirepack::DnsMessage::kTypeA, &query, &err)) {
      std::cerr << err << std::endl;
      return 1;
    }
    return EncodeAndPrint(query);
  }
  if (cmd == "capture" && args.size() == 4) {
    return Capture(args[1],
                   static_cast<size_t>(std::atoll(args[2].c_str())),
                   std::atof(args[3].c_str()), &logger);
  }
  if (cmd == "audit") {
    std::cout << wirepack::GenerateReport();
    return 0;
  }
  std::fprintf(stderr, "Unknown command: %s\n", cmd.c_str());
  PrintUsage();
  return 2;
}
