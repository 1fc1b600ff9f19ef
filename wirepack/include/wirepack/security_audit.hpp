// Copyright (c) 2025 The Wirepack Authors
/**
 * @file security_audit.hpp
 * @brief Static review of schemas, limits and channels.
 */
#pragma once

#include <ostream>
#include <string>
#include <vector>

#include "wirepack/export.hpp"
#include "wirepack/packet_channel.hpp"
#include "wirepack/schema.hpp"

namespace wirepack {

enum class Severity { kSuccess, kInfo, kWarning, kCritical };

WIREPACK_API const char* ToString(Severity severity);

struct Finding {
  Severity severity = Severity::kInfo;
  std::string message;
  std::string recommendation;  ///< Empty when there is nothing to do
};

WIREPACK_API std::ostream& operator<<(std::ostream& os, const Finding& f);

/** Flags unbounded variable tails (warning) and nested fields (info). */
WIREPACK_API std::vector<Finding> AuditSchema(const StructureSchema& schema);

/**
 * @brief Reviews the SecurityGuard configuration.
 *
 * Reports a buffer limit over 100 MiB, a nesting limit over 1000 and
 * disabled strict mode; a single success finding when none apply.
 */
WIREPACK_API std::vector<Finding> AuditConfiguration();

/** Flags a missing or disabled rate limiter and raw socket use. */
WIREPACK_API std::vector<Finding> AuditChannel(const PacketChannel& channel);

/** Markdown report of AuditConfiguration() plus general guidance. */
WIREPACK_API std::string GenerateReport();

}  // namespace wirepack
