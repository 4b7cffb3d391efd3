#pragma once

#include <memory>
#include <string>

#include "docuchat_core/llm/retry_policy.hpp"
#include "docuchat_core/llm/text_generator.hpp"

namespace docuchat_core {

enum class AgentMode { DocumentSearch, DocumentCreator };

std::string to_string(AgentMode mode);
// Accepts "document-search" and "document-creator", anything else is a ValidationError
AgentMode agent_mode_from_string(const std::string &str);

class GenerationService {
 public:
  GenerationService(std::shared_ptr<TextGenerator> generator, RetryPolicy retry_policy = RetryPolicy());

  // Failures are raised to the caller, never replaced by a canned reply
  std::string respond(const std::string &prompt, const std::string &context, AgentMode mode) const;

  static std::string build_prompt(const std::string &prompt, const std::string &context, AgentMode mode);

 private:
  std::shared_ptr<TextGenerator> generator_;
  RetryPolicy retry_policy_;
};

}  // namespace docuchat_core
