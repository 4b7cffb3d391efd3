#pragma once

#include <string>

#include "docuchat_core/llm/text_generator.hpp"

namespace docuchat_core {

class OllamaTextGenerator : public TextGenerator {
 public:
  OllamaTextGenerator(const std::string &ollama_url,
                      const std::string &generation_model,
                      int timeout_seconds = 60);

  // Disable copy constructor and assignment
  OllamaTextGenerator(const OllamaTextGenerator &) = delete;
  OllamaTextGenerator &operator=(const OllamaTextGenerator &) = delete;

  ServiceResult<std::string> generate(const std::string &prompt) override;

 private:
  std::string ollama_url_;
  std::string generation_model_;
  int timeout_seconds_;
};

}  // namespace docuchat_core
