// Copyright (c) 2025 The Wirepack Authors
#include "wirepack/security_audit.hpp"

#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "wirepack/security_guard.hpp"

namespace wirepack {

namespace {

constexpr size_t kLargeBufferSize = 100 * 1024 * 1024;
constexpr size_t kDeepNesting = 1000;

Finding MakeFinding(Severity severity, std::string message,
                    std::string recommendation) {
  Finding f;
  f.severity = severity;
  f.message = std::move(message);
  f.recommendation = std::move(recommendation);
  return f;
}

bool HasLengthBound(const FieldDescriptor& f) {
  for (const Constraint& c : f.constraints) {
    if (c.AppliesToLength()) return true;
  }
  return false;
}

}  // namespace

const char* ToString(Severity severity) {
  switch (severity) {
    case Severity::kSuccess:
      return "success";
    case Severity::kInfo:
      return "info";
    case Severity::kWarning:
      return "warning";
    case Severity::kCritical:
      return "critical";
  }
  return "unknown";
}

std::ostream& operator<<(std::ostream& os, const Finding& f) {
  os << "[" << ToString(f.severity) << "] " << f.message;
  if (!f.recommendation.empty()) os << " (" << f.recommendation << ")";
  return os;
}

std::vector<Finding> AuditSchema(const StructureSchema& schema) {
  std::vector<Finding> findings;
  for (const FieldDescriptor& f : schema.Fields()) {
    if (f.kind == FieldKind::kVariableBytes && !HasLengthBound(f)) {
      findings.push_back(MakeFinding(
          Severity::kWarning,
          "Field '" + f.name + "' of " + schema.Name() +
              " is an unbounded variable-length tail",
          "Attach a LengthRange constraint or rely on the SecurityGuard "
          "buffer limit"));
    }
    if (f.kind == FieldKind::kNested) {
      findings.push_back(MakeFinding(
          Severity::kInfo,
          "Field '" + f.name + "' of " + schema.Name() +
              " contains nested structure " + f.nested->Name(),
          "Ensure nesting depth limits are configured"));
    }
  }
  return findings;
}

std::vector<Finding> AuditConfiguration() {
  const SecurityLimits limits = SecurityGuard::Instance().Limits();
  std::vector<Finding> findings;
  if (limits.max_buffer_size > kLargeBufferSize) {
    findings.push_back(MakeFinding(
        Severity::kWarning, "Max buffer size is very large",
        "Current: " + std::to_string(limits.max_buffer_size) +
            " bytes. Consider reducing to prevent memory exhaustion"));
  }
  if (limits.max_nesting_depth > kDeepNesting) {
    findings.push_back(MakeFinding(
        Severity::kWarning, "Max nesting depth is very high",
        "Current: " + std::to_string(limits.max_nesting_depth) +
            ". Consider reducing to prevent stack exhaustion"));
  }
  if (!limits.strict_mode) {
    findings.push_back(
        MakeFinding(Severity::kInfo, "Strict mode is disabled",
                    "Enable strict mode for production environments"));
  }
  if (findings.empty()) {
    findings.push_back(
        MakeFinding(Severity::kSuccess,
                    "Security configuration is within recommended limits", ""));
  }
  return findings;
}

std::vector<Finding> AuditChannel(const PacketChannel& channel) {
  std::vector<Finding> findings;
  const auto limiter = channel.GetRateLimiter();
  if (!limiter) {
    findings.push_back(
        MakeFinding(Severity::kWarning,
                    "Channel does not have rate limiting configured",
                    "Attach a RateLimiter with SetRateLimiter()"));
  } else if (!limiter->IsEnabled()) {
    findings.push_back(
        MakeFinding(Severity::kInfo, "Channel rate limiter is disabled",
                    "Enable rate limiting for production use"));
  }
  if (channel.Type() == platform::SocketType::kRaw) {
    findings.push_back(MakeFinding(
        Severity::kCritical,
        "Using raw socket which requires elevated privileges",
        "Validate input, rate limit, and run with minimum privileges"));
  }
  return findings;
}

std::string GenerateReport() {
  std::ostringstream oss;
  oss << "# Security Audit Report\n\n";
  oss << "## Configuration\n\n";
  oss << "- " << SecurityGuard::Instance().Limits() << "\n\n";
  for (const Finding& f : AuditConfiguration()) {
    oss << "- **" << ToString(f.severity) << "**: " << f.message << "\n";
    if (!f.recommendation.empty()) oss << "  " << f.recommendation << "\n";
  }
  oss << "\n## Recommendations\n\n";
  oss << "1. Always use rate limiting for network operations\n";
  oss << "2. Set buffer size limits appropriate to the protocols in use\n";
  oss << "3. Validate all input data before decoding\n";
  oss << "4. Use strict mode in production environments\n";
  oss << "5. Audit structures with AuditSchema()\n";
  oss << "6. Run raw socket operations with minimum required privileges\n";
  return oss.str();
}

}  // namespace wirepack
