#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "docuchat_core/services/generation_service.hpp"
#include "docuchat_core/services/retrieval_service.hpp"

namespace docuchat_core {

struct Answer {
  std::string response;
  std::vector<SearchResult> sources;
  AgentMode mode = AgentMode::DocumentSearch;
};

// Retrieval, context assembly and generation for one user prompt
class AnswerService {
 public:
  AnswerService(std::shared_ptr<RetrievalService> retrieval,
                std::shared_ptr<GenerationService> generation,
                size_t max_context_chars);

  Answer answer(const std::string &prompt, AgentMode mode, std::optional<int> k = std::nullopt);

 private:
  std::shared_ptr<RetrievalService> retrieval_;
  std::shared_ptr<GenerationService> generation_;
  size_t max_context_chars_;
};

}  // namespace docuchat_core
