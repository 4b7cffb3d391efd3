#include "docuchat_core/llm/ollama_embedding_provider.hpp"

#include "ollama.hpp"

namespace docuchat_core {

OllamaEmbeddingProvider::OllamaEmbeddingProvider(const std::string &ollama_url,
                                                 const std::string &embedding_model,
                                                 int timeout_seconds)
    : ollama_url_(ollama_url), embedding_model_(embedding_model), timeout_seconds_(timeout_seconds) {}

// A fresh client per call keeps concurrent ingestion and query requests independent
ServiceResult<std::vector<std::vector<float>>> OllamaEmbeddingProvider::embed(
    const std::vector<std::string> &texts) {
  using Result = ServiceResult<std::vector<std::vector<float>>>;
  if (texts.empty()) {
    return Result::success_response({});
  }

  try {
    Ollama client(ollama_url_);
    client.setReadTimeout(timeout_seconds_);
    client.setWriteTimeout(timeout_seconds_);

    // /api/embed takes either a string or an array of strings as input
    ollama::request request = ollama::request::from_embedding(embedding_model_, texts.front());
    request["input"] = texts;

    ollama::response response = client.generate_embeddings(request);
    nlohmann::json json_response = response.as_json();

    if (!json_response.contains("embeddings") || !json_response["embeddings"].is_array()) {
      return Result::permanent_failure("Response does not contain an embeddings array");
    }
    return Result::success_response(
        json_response["embeddings"].get<std::vector<std::vector<float>>>());
  } catch (const ollama::exception &e) {
    return Result::from_error(e.what(), "Embedding generation failed");
  } catch (const nlohmann::json::exception &e) {
    return Result::permanent_failure("Malformed embedding response: " + std::string(e.what()));
  }
}

bool OllamaEmbeddingProvider::is_available() {
  Ollama client(ollama_url_);
  return client.is_running();
}

}  // namespace docuchat_core
