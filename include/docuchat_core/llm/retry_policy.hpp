#pragma once

#include <chrono>
#include <iostream>
#include <string>
#include <thread>
#include <type_traits>
#include <utility>

#include "docuchat_core/errors.hpp"
#include "docuchat_core/llm/service_result.hpp"

namespace docuchat_core {

/**
 * Exponential backoff around a fallible call.
 *
 * An attempt that reports a transient failure is retried up to max_retries times,
 * sleeping base_delay * 2^attempt before retry number attempt + 1. A permanent failure
 * surfaces immediately as PermanentServiceError; exhausted retries surface as
 * TransientServiceError. The policy holds no mutable state and can be shared.
 * max_retries is bounded by kMaxRetries and a single backoff sleep by kMaxBackoff.
 */
class RetryPolicy {
 public:
  static constexpr int kMaxRetries = 10;
  static constexpr std::chrono::milliseconds kMaxBackoff{std::chrono::minutes(5)};

  explicit RetryPolicy(int max_retries = 3,
                       std::chrono::milliseconds base_delay = std::chrono::milliseconds(1000));

  int max_retries() const {
    return max_retries_;
  }
  std::chrono::milliseconds base_delay() const {
    return base_delay_;
  }

  std::chrono::milliseconds delay_for_attempt(int attempt) const;
  // Longest a caller can be blocked in backoff sleeps
  std::chrono::milliseconds max_total_delay() const;

  template <typename Fn>
  auto run(const std::string &operation, Fn &&attempt) const {
    using Result = std::invoke_result_t<Fn &>;
    std::string last_error;
    for (int i = 0; i <= max_retries_; ++i) {
      Result result = attempt();
      if (result.ok()) {
        return std::move(result.value);
      }
      if (result.failure == FailureKind::Permanent) {
        throw PermanentServiceError(operation + " failed: " + result.error_message);
      }
      last_error = result.error_message;
      if (i == max_retries_)
        break;

      std::chrono::milliseconds delay = delay_for_attempt(i);
      std::cerr << "Warning: " << operation << " attempt " << (i + 1) << " failed, retrying in "
                << delay.count() << "ms: " << last_error << std::endl;
      std::this_thread::sleep_for(delay);
    }
    throw TransientServiceError(operation + " failed after " + std::to_string(max_retries_ + 1) +
                                " attempts: " + last_error);
  }

 private:
  int max_retries_;
  std::chrono::milliseconds base_delay_;
};

}  // namespace docuchat_core
