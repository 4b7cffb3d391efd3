#pragma once

#include <stdexcept>
#include <string>

namespace docuchat_core {

class DocuchatError : public std::exception {
 public:
  explicit DocuchatError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// Malformed input. Never retried.
class ValidationError : public DocuchatError {
 public:
  using DocuchatError::DocuchatError;
};

// Invalid construction parameters (e.g. chunk overlap >= window size)
class ConfigurationError : public DocuchatError {
 public:
  using DocuchatError::DocuchatError;
};

// Timeout, rate limit or 5xx from an external service. Retried before it surfaces.
class TransientServiceError : public DocuchatError {
 public:
  using DocuchatError::DocuchatError;
};

// Bad credentials or a semantically invalid request/response. Never retried.
class PermanentServiceError : public DocuchatError {
 public:
  using DocuchatError::DocuchatError;
};

class NotFoundError : public DocuchatError {
 public:
  using DocuchatError::DocuchatError;
};

class ConflictError : public DocuchatError {
 public:
  using DocuchatError::DocuchatError;
};

class ChunkStoreError : public DocuchatError {
 public:
  using DocuchatError::DocuchatError;
};

}  // namespace docuchat_core
