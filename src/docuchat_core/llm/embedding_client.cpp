#include "docuchat_core/llm/embedding_client.hpp"

#include <utf8.h>

namespace docuchat_core {

EmbeddingClient::EmbeddingClient(std::shared_ptr<EmbeddingProvider> provider,
                                 EmbeddingLimits limits,
                                 RetryPolicy retry_policy)
    : provider_(std::move(provider)), limits_(limits), retry_policy_(retry_policy) {
  if (!provider_) {
    throw ConfigurationError("EmbeddingClient requires a provider");
  }
  if (limits_.dimension <= 0 || limits_.max_batch_size == 0 || limits_.max_text_chars == 0) {
    throw ConfigurationError("Embedding limits must be positive");
  }
}

std::vector<float> EmbeddingClient::embed_one(const std::string &text) const {
  std::vector<std::vector<float>> vectors = embed_batch({text});
  return std::move(vectors.front());
}

std::vector<std::vector<float>> EmbeddingClient::embed_batch(
    const std::vector<std::string> &texts) const {
  if (texts.size() > limits_.max_batch_size) {
    throw ValidationError("Embedding batch of " + std::to_string(texts.size()) +
                          " texts exceeds the maximum of " +
                          std::to_string(limits_.max_batch_size));
  }
  for (size_t i = 0; i < texts.size(); ++i) {
    validate_text(texts[i], i);
  }
  if (texts.empty()) {
    return {};
  }

  return retry_policy_.run("Embedding request", [&]() { return attempt(texts); });
}

bool EmbeddingClient::is_available() const {
  return provider_->is_available();
}

void EmbeddingClient::validate_text(const std::string &text, size_t position) const {
  if (text.empty()) {
    throw ValidationError("Cannot embed empty text (batch position " + std::to_string(position) +
                          ")");
  }
  if (!utf8::is_valid(text.begin(), text.end())) {
    throw ValidationError("Text to embed is not valid UTF-8 (batch position " +
                          std::to_string(position) + ")");
  }
  const auto length = static_cast<size_t>(utf8::distance(text.begin(), text.end()));
  if (length > limits_.max_text_chars) {
    throw ValidationError("Text too long to embed: " + std::to_string(length) +
                          " characters, maximum is " + std::to_string(limits_.max_text_chars));
  }
}

ServiceResult<std::vector<std::vector<float>>> EmbeddingClient::attempt(
    const std::vector<std::string> &texts) const {
  using Result = ServiceResult<std::vector<std::vector<float>>>;
  Result result = provider_->embed(texts);
  if (!result.ok()) {
    return result;
  }

  if (result.value.size() != texts.size()) {
    return Result::permanent_failure("Embedding service returned " +
                                     std::to_string(result.value.size()) + " vectors for " +
                                     std::to_string(texts.size()) + " texts");
  }
  for (const auto &vector : result.value) {
    if (vector.size() != static_cast<size_t>(limits_.dimension)) {
      return Result::permanent_failure("Embedding dimension mismatch. Expected " +
                                       std::to_string(limits_.dimension) + ", got " +
                                       std::to_string(vector.size()));
    }
  }
  return result;
}

}  // namespace docuchat_core
