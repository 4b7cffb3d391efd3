#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "docuchat_core/llm/embedding_provider.hpp"
#include "docuchat_core/llm/retry_policy.hpp"

namespace docuchat_core {

struct EmbeddingLimits {
  size_t max_text_chars = 8000;
  size_t max_batch_size = 100;
  int dimension = 384;
};

/**
 * Validating, retrying front for an EmbeddingProvider.
 *
 * Oversized texts or batches fail with ValidationError before any call is made.
 * Transient provider failures are retried per the RetryPolicy; a response with the
 * wrong number of vectors or the wrong dimension is a PermanentServiceError.
 */
class EmbeddingClient {
 public:
  EmbeddingClient(std::shared_ptr<EmbeddingProvider> provider,
                  EmbeddingLimits limits = {},
                  RetryPolicy retry_policy = RetryPolicy());

  std::vector<float> embed_one(const std::string &text) const;
  std::vector<std::vector<float>> embed_batch(const std::vector<std::string> &texts) const;

  bool is_available() const;

  const EmbeddingLimits &limits() const {
    return limits_;
  }

 private:
  void validate_text(const std::string &text, size_t position) const;
  ServiceResult<std::vector<std::vector<float>>> attempt(
      const std::vector<std::string> &texts) const;

  std::shared_ptr<EmbeddingProvider> provider_;
  EmbeddingLimits limits_;
  RetryPolicy retry_policy_;
};

}  // namespace docuchat_core
