#pragma once

#include <string>
#include <vector>

#include "docuchat_core/llm/embedding_provider.hpp"

namespace docuchat_core {

class OllamaEmbeddingProvider : public EmbeddingProvider {
 public:
  OllamaEmbeddingProvider(const std::string &ollama_url,
                          const std::string &embedding_model,
                          int timeout_seconds = 60);

  // Disable copy constructor and assignment
  OllamaEmbeddingProvider(const OllamaEmbeddingProvider &) = delete;
  OllamaEmbeddingProvider &operator=(const OllamaEmbeddingProvider &) = delete;

  ServiceResult<std::vector<std::vector<float>>> embed(
      const std::vector<std::string> &texts) override;

  bool is_available() override;

 private:
  std::string ollama_url_;
  std::string embedding_model_;
  int timeout_seconds_;
};

}  // namespace docuchat_core
