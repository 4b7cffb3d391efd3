#include "docuchat_core/llm/service_result.hpp"

#include <algorithm>
#include <array>
#include <cctype>

namespace docuchat_core {

std::string to_string(FailureKind kind) {
  switch (kind) {
    case FailureKind::None:
      return "none";
    case FailureKind::Transient:
      return "transient";
    case FailureKind::Permanent:
      return "permanent";
    default:
      return "unknown";
  }
}

FailureKind classify_service_error(const std::string &message) {
  std::string lowered = message;
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  // Overload and connectivity conditions clear up on their own, whatever else the message says
  static const std::array<const char *, 13> transient_markers = {
      "server busy",       "try again",        "rate limit",        "too many requests",
      "timeout",           "timed out",        "connection",        "unavailable",
      "temporarily",       "overloaded",       "pending requests",  "bad gateway",
      "internal server error"};
  for (const char *marker : transient_markers) {
    if (lowered.find(marker) != std::string::npos) {
      return FailureKind::Transient;
    }
  }

  // Credentials, unknown models and rejected input will not change on retry
  static const std::array<const char *, 12> permanent_markers = {
      "invalid api key",    "authentication",       "unauthorized",    "forbidden",
      "model not found",    "not found, try pulling", "invalid input", "invalid request",
      "invalid model",      "validation",           "too long",        "context length"};
  for (const char *marker : permanent_markers) {
    if (lowered.find(marker) != std::string::npos) {
      return FailureKind::Permanent;
    }
  }
  return FailureKind::Transient;
}

}  // namespace docuchat_core
