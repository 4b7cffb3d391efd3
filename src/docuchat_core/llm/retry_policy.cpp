#include "docuchat_core/llm/retry_policy.hpp"

#include <algorithm>

namespace docuchat_core {

RetryPolicy::RetryPolicy(int max_retries, std::chrono::milliseconds base_delay)
    : max_retries_(max_retries), base_delay_(base_delay) {
  if (max_retries_ < 0 || max_retries_ > kMaxRetries) {
    throw ConfigurationError("max_retries must be between 0 and " + std::to_string(kMaxRetries));
  }
  if (base_delay_.count() < 0) {
    throw ConfigurationError("retry base delay cannot be negative");
  }
}

// Doubles from base_delay and saturates at kMaxBackoff
std::chrono::milliseconds RetryPolicy::delay_for_attempt(int attempt) const {
  std::chrono::milliseconds delay = std::min(base_delay_, kMaxBackoff);
  for (int i = 0; i < attempt && delay < kMaxBackoff; ++i) {
    delay = std::min(delay * 2, kMaxBackoff);
  }
  return delay;
}

std::chrono::milliseconds RetryPolicy::max_total_delay() const {
  std::chrono::milliseconds total{0};
  for (int i = 0; i < max_retries_; ++i) {
    total += delay_for_attempt(i);
  }
  return total;
}

}  // namespace docuchat_core
