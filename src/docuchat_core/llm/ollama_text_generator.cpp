#include "docuchat_core/llm/ollama_text_generator.hpp"

#include "ollama.hpp"

namespace docuchat_core {

OllamaTextGenerator::OllamaTextGenerator(const std::string &ollama_url,
                                         const std::string &generation_model,
                                         int timeout_seconds)
    : ollama_url_(ollama_url), generation_model_(generation_model), timeout_seconds_(timeout_seconds) {}

ServiceResult<std::string> OllamaTextGenerator::generate(const std::string &prompt) {
  using Result = ServiceResult<std::string>;
  try {
    Ollama client(ollama_url_);
    client.setReadTimeout(timeout_seconds_);
    client.setWriteTimeout(timeout_seconds_);

    ollama::response response = client.generate(generation_model_, prompt);
    std::string text = response.as_simple_string();
    if (text.empty()) {
      return Result::transient_failure("Generation returned an empty response");
    }
    return Result::success_response(std::move(text));
  } catch (const ollama::exception &e) {
    return Result::from_error(e.what(), "Text generation failed");
  }
}

}  // namespace docuchat_core
