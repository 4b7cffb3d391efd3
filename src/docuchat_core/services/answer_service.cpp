#include "docuchat_core/services/answer_service.hpp"

#include "docuchat_core/errors.hpp"
#include "docuchat_core/services/context_assembler.hpp"

namespace docuchat_core {

AnswerService::AnswerService(std::shared_ptr<RetrievalService> retrieval,
                             std::shared_ptr<GenerationService> generation,
                             size_t max_context_chars)
    : retrieval_(std::move(retrieval)),
      generation_(std::move(generation)),
      max_context_chars_(max_context_chars) {
  if (!retrieval_ || !generation_) {
    throw ConfigurationError("AnswerService requires retrieval and generation services");
  }
}

Answer AnswerService::answer(const std::string &prompt, AgentMode mode, std::optional<int> k) {
  Answer answer;
  answer.mode = mode;
  // The creator drafts new text and only looks documents up when asked to
  if (mode == AgentMode::DocumentSearch || k) {
    answer.sources = retrieval_->search(prompt, k);
  }
  const std::string context = ContextAssembler::build_context(answer.sources, max_context_chars_);
  answer.response = generation_->respond(prompt, context, mode);
  return answer;
}

}  // namespace docuchat_core
