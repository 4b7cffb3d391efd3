#pragma once

#include <string>
#include <utility>

namespace docuchat_core {

enum class FailureKind { None, Transient, Permanent };

std::string to_string(FailureKind kind);

// Sorts a raw service error message into transient or permanent
FailureKind classify_service_error(const std::string &message);

// Outcome of one call to an external service, inspected by RetryPolicy
template <typename T>
struct ServiceResult {
  T value{};
  FailureKind failure = FailureKind::None;
  std::string error_message;

  bool ok() const {
    return failure == FailureKind::None;
  }

  static ServiceResult success_response(T value) {
    ServiceResult result;
    result.value = std::move(value);
    return result;
  }

  static ServiceResult transient_failure(const std::string &message) {
    ServiceResult result;
    result.failure = FailureKind::Transient;
    result.error_message = message;
    return result;
  }

  static ServiceResult permanent_failure(const std::string &message) {
    ServiceResult result;
    result.failure = FailureKind::Permanent;
    result.error_message = message;
    return result;
  }

  // Failure whose kind is read from the service's own error text
  static ServiceResult from_error(const std::string &service_error, const std::string &context) {
    const std::string message = context + ": " + service_error;
    if (classify_service_error(service_error) == FailureKind::Permanent) {
      return permanent_failure(message);
    }
    return transient_failure(message);
  }
};


}  // namespace docuchat_core
