// Copyright (c) 2025 The Wirepack Authors
#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "wirepack/export.hpp"

namespace wirepack {
namespace platform {

// Endpoint information (IPv4 address and port)
struct Endpoint {
  std::string address;  // Dotted-quad IPv4 address (e.g. "192.168.1.1")
  uint16_t port;        // Ignored for raw sockets

  Endpoint() : port(0) {}
  Endpoint(const std::string& addr, uint16_t p) : address(addr), port(p) {}
};

enum class SocketType {
  kDatagram,  // UDP
  kRaw,       // Raw IPv4 for one protocol number; needs privileges
};

WIREPACK_API const char* ToString(SocketType type);

// Platform-independent datagram socket interface
class ISocket {
 public:
  virtual ~ISocket() = default;

  // Creates the socket.
  // type: datagram (UDP) or raw IPv4
  // protocol: IP protocol number for raw sockets (e.g. 1 for ICMP)
  // Returns true on success
  virtual bool Initialize(SocketType type, int protocol) = 0;

  // Binds to address:port
  // address: dotted-quad local address; empty binds all interfaces
  // port: 0 lets the kernel pick an ephemeral port (see LocalPort)
  // Returns true on success
  virtual bool Bind(const std::string& address, uint16_t port) = 0;

  // Locally bound port, 0 when unbound or for raw sockets
  virtual uint16_t LocalPort() const = 0;

  // Waits until data is readable
  // timeout_us: timeout in microseconds, rounded up to the poll granularity
  // Returns true if data is ready, false on timeout or error
  virtual bool WaitReadable(int64_t timeout_us) = 0;

  // Receives one datagram
  // from: sender endpoint (output)
  // data: received bytes (output); raw IPv4 sockets include the IP header
  // max_size: maximum bytes to receive
  // Returns false when the datagram was longer than max_size; the
  // datagram is consumed and GetLastError() names the truncation
  virtual bool Receive(Endpoint* from, std::vector<uint8_t>* data,
                       size_t max_size) = 0;

  // Sends one datagram
  // Returns true when every byte was sent
  virtual bool Send(const Endpoint& to, const std::vector<uint8_t>& data) = 0;

  // Closes the socket. Safe to call more than once.
  virtual void Close() = 0;

  // Description of the last error
  virtual std::string GetLastError() const = 0;

  // True while the socket is open
  virtual bool IsValid() const = 0;
};

// Creates the socket implementation for this platform
WIREPACK_API std::unique_ptr<ISocket> CreatePlatformSocket();

}  // namespace platform
}  // namespace wirepack
