// Copyright (c) 2025 The Wirepack Authors
/**
 * @file socket_posix.cc
 * @brief POSIX datagram and raw IPv4 sockets behind ISocket.
 */
#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/uio.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <cstring>
#include <memory>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "platform/common/socket_utils.hpp"
#include "wirepack/platform/socket_interface.hpp"

namespace wirepack {
namespace platform {

const char* ToString(SocketType type) {
  switch (type) {
    case SocketType::kDatagram:
      return "datagram";
    case SocketType::kRaw:
      return "raw";
  }
  return "unknown";
}

namespace {

/** Microseconds to poll() milliseconds, rounding partial milliseconds up. */
int PollMillis(int64_t timeout_us) {
  if (timeout_us <= 0) return 0;
  const int64_t ms = (timeout_us + 999) / 1000;
  return ms > 0x7fffffff ? 0x7fffffff : static_cast<int>(ms);
}

}  // namespace

class SocketPosix : public ISocket {
 public:
  SocketPosix() = default;
  ~SocketPosix() override { Close(); }

  bool Initialize(SocketType type, int protocol) override {
    Close();
    type_ = type;
    if (type == SocketType::kRaw) {
      fd_ = socket(AF_INET, SOCK_RAW, protocol);
    } else {
      fd_ = socket(AF_INET, SOCK_DGRAM,
                   protocol != 0 ? protocol : IPPROTO_UDP);
    }
    if (fd_ < 0) {
      CaptureErrno(std::string(ToString(type)) + " socket creation failed");
      return false;
    }
    // Not inherited across exec.
    if (fcntl(fd_, F_SETFD, FD_CLOEXEC) < 0) {
      CaptureErrno("fcntl(FD_CLOEXEC) failed");
      Close();
      return false;
    }
    return true;
  }

  bool Bind(const std::string& address, uint16_t port) override {
    if (!CheckOpen()) return false;
    sockaddr_in addr{};
    if (address.empty()) {
      addr.sin_family = AF_INET;
      addr.sin_addr.s_addr = htonl(INADDR_ANY);
      addr.sin_port = htons(port);
    } else if (!EndpointToSockaddr(Endpoint(address, port), &addr)) {
      last_error_ = "Invalid bind address: " + address;
      return false;
    }
    if (bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
      CaptureErrno("bind to " + (address.empty() ? "*" : address) + ":" +
                   std::to_string(port) + " failed");
      return false;
    }
    return true;
  }

  uint16_t LocalPort() const override {
    if (fd_ < 0 || type_ == SocketType::kRaw) return 0;
    sockaddr_in addr{};
    socklen_t len = sizeof(addr);
    if (getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &len) < 0) {
      return 0;
    }
    return ntohs(addr.sin_port);
  }

  bool WaitReadable(int64_t timeout_us) override {
    if (!CheckOpen()) return false;
    const auto deadline = std::chrono::steady_clock::now() +
                          std::chrono::microseconds(timeout_us);
    for (;;) {
      pollfd pfd{};
      pfd.fd = fd_;
      pfd.events = POLLIN;
      const int64_t left_us =
          std::chrono::duration_cast<std::chrono::microseconds>(
              deadline - std::chrono::steady_clock::now())
              .count();
      const int ready = poll(&pfd, 1, PollMillis(left_us));
      if (ready < 0) {
        if (errno == EINTR) continue;
        CaptureErrno("poll failed");
        return false;
      }
      if (ready == 0) {
        last_error_ = "no datagram within " + std::to_string(timeout_us) +
                      " us";
        return false;
      }
      return (pfd.revents & POLLIN) != 0;
    }
  }

  bool Receive(Endpoint* from, std::vector<uint8_t>* data,
               size_t max_size) override {
    if (!CheckOpen()) return false;
    std::vector<uint8_t> buf(max_size);
    sockaddr_in addr{};
    iovec iov{};
    iov.iov_base = buf.data();
    iov.iov_len = buf.size();
    msghdr msg{};
    msg.msg_name = &addr;
    msg.msg_namelen = sizeof(addr);
    msg.msg_iov = &iov;
    msg.msg_iovlen = 1;

    ssize_t n;
    do {
      n = recvmsg(fd_, &msg, 0);
    } while (n < 0 && errno == EINTR);
    if (n < 0) {
      CaptureErrno("recvmsg failed");
      return false;
    }
    if (msg.msg_flags & MSG_TRUNC) {
      last_error_ = "datagram truncated: longer than the " +
                    std::to_string(max_size) + "-byte receive buffer";
      return false;
    }
    buf.resize(static_cast<size_t>(n));
    *data = std::move(buf);
    *from = SockaddrToEndpoint(addr);
    return true;
  }

  bool Send(const Endpoint& to, const std::vector<uint8_t>& data) override {
    if (!CheckOpen()) return false;
    sockaddr_in addr{};
    if (!EndpointToSockaddr(to, &addr)) {
      last_error_ = "Invalid IP address: " + to.address;
      return false;
    }
    ssize_t sent;
    do {
      sent = sendto(fd_, data.data(), data.size(), 0,
                    reinterpret_cast<const sockaddr*>(&addr), sizeof(addr));
    } while (sent < 0 && errno == EINTR);
    if (sent < 0) {
      CaptureErrno("sendto " + to.address + " failed");
      return false;
    }
    if (static_cast<size_t>(sent) != data.size()) {
      std::ostringstream oss;
      oss << "Partial send: sent " << sent << " of " << data.size() << " bytes";
      last_error_ = oss.str();
      return false;
    }
    return true;
  }

  void Close() override {
    if (fd_ >= 0) {
      close(fd_);
      fd_ = -1;
    }
  }

  std::string GetLastError() const override { return last_error_; }
  bool IsValid() const override { return fd_ >= 0; }

 private:
  bool CheckOpen() {
    if (fd_ >= 0) return true;
    last_error_ = "Socket not initialized";
    return false;
  }

  void CaptureErrno(const std::string& context) {
    const int e = errno;
    std::ostringstream oss;
    oss << context << " (errno " << e << ": " << std::strerror(e) << ")";
    last_error_ = oss.str();
  }

  int fd_ = -1;
  SocketType type_ = SocketType::kDatagram;
  std::string last_error_;
};

std::unique_ptr<ISocket> CreatePlatformSocket() {
  return std::make_unique<SocketPosix>();
}

}  // namespace platform
}  // namespace wirepack
