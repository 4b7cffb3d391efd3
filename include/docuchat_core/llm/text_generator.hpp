#pragma once

#include <string>

#include "docuchat_core/llm/service_result.hpp"

namespace docuchat_core {

// Single outbound completion call to a generative model
class TextGenerator {
 public:
  virtual ~TextGenerator() = default;

  virtual ServiceResult<std::string> generate(const std::string &prompt) = 0;
};

}  // namespace docuchat_core
