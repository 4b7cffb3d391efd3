#include "docuchat_core/services/generation_service.hpp"

#include "docuchat_core/errors.hpp"

namespace docuchat_core {

namespace {

const char *instructions_for(AgentMode mode) {
  switch (mode) {
    case AgentMode::DocumentCreator:
      return "You are a document writing assistant. Draft a complete, well structured document "
             "with headings that fulfils the user's request. Follow the style and facts of the "
             "reference documents when they are provided.";
    case AgentMode::DocumentSearch:
    default:
      return "You are a document search assistant. Answer the user's question using only the "
             "document excerpts below and name the documents you relied on. If the excerpts do "
             "not contain the answer, say so.";
  }
}

}  // namespace

std::string to_string(AgentMode mode) {
  switch (mode) {
    case AgentMode::DocumentSearch:
      return "document-search";
    case AgentMode::DocumentCreator:
      return "document-creator";
    default:
      return "unknown";
  }
}

AgentMode agent_mode_from_string(const std::string &str) {
  if (str == "document-search")
    return AgentMode::DocumentSearch;
  if (str == "document-creator")
    return AgentMode::DocumentCreator;
  throw ValidationError("Agent type must be 'document-search' or 'document-creator' (got '" + str +
                        "')");
}

GenerationService::GenerationService(std::shared_ptr<TextGenerator> generator,
                                     RetryPolicy retry_policy)
    : generator_(std::move(generator)), retry_policy_(retry_policy) {
  if (!generator_) {
    throw ConfigurationError("GenerationService requires a text generator");
  }
}

std::string GenerationService::build_prompt(const std::string &prompt,
                                            const std::string &context,
                                            AgentMode mode) {
  std::string full_prompt = instructions_for(mode);
  if (!context.empty()) {
    full_prompt += "\n\nReference documents:\n" + context;
  }
  full_prompt += "\n\nUser request:\n" + prompt;
  return full_prompt;
}

std::string GenerationService::respond(const std::string &prompt,
                                       const std::string &context,
                                       AgentMode mode) const {
  if (prompt.find_first_not_of(" \t\r\n") == std::string::npos) {
    throw ValidationError("Prompt must not be empty");
  }
  const std::string full_prompt = build_prompt(prompt, context, mode);
  return retry_policy_.run("Text generation", [&]() { return generator_->generate(full_prompt); });
}

}  // namespace docuchat_core
