// Copyright (c) 2025 The Wirepack Authors
/**
 * @file socket_utils.hpp
 * @brief Endpoint <-> sockaddr_in conversion helpers.
 */
#ifndef WIREPACK_PLATFORM_COMMON_SOCKET_UTILS_HPP_
#define WIREPACK_PLATFORM_COMMON_SOCKET_UTILS_HPP_

#include <arpa/inet.h>
#include <netinet/in.h>

#include <cstring>

#include "wirepack/platform/socket_interface.hpp"

namespace wirepack {
namespace platform {

/**
 * @brief Convert Endpoint to sockaddr_in
 * @return true on success, false if IP address is invalid
 */
inline bool EndpointToSockaddr(const Endpoint& endpoint, sockaddr_in* addr) {
  std::memset(addr, 0, sizeof(*addr));
  addr->sin_family = AF_INET;
  addr->sin_port = htons(endpoint.port);

  if (inet_pton(AF_INET, endpoint.address.c_str(), &addr->sin_addr) != 1) {
    return false;
  }

  return true;
}

/** Convert sockaddr_in to Endpoint */
inline Endpoint SockaddrToEndpoint(const sockaddr_in& addr) {
  Endpoint endpoint;

  char ip[INET_ADDRSTRLEN];
  if (inet_ntop(AF_INET, &addr.sin_addr, ip, sizeof(ip)) != nullptr) {
    endpoint.address = ip;
  }

  endpoint.port = ntohs(addr.sin_port);

  return endpoint;
}

}  // namespace platform
}  // namespace wirepack

#endif  // WIREPACK_PLATFORM_COMMON_SOCKET_UTILS_HPP_
