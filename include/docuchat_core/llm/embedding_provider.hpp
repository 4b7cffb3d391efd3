#pragma once

#include <string>
#include <vector>

#include "docuchat_core/llm/service_result.hpp"

namespace docuchat_core {

// Single outbound call to an embedding service, no retries or validation
class EmbeddingProvider {
 public:
  virtual ~EmbeddingProvider() = default;

  // One vector per input text, in input order
  virtual ServiceResult<std::vector<std::vector<float>>> embed(
      const std::vector<std::string> &texts) = 0;

  virtual bool is_available() = 0;
};

}  // namespace docuchat_core
