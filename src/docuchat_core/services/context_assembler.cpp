#include "docuchat_core/services/context_assembler.hpp"

#include <utf8.h>

namespace docuchat_core {

std::string ContextAssembler::build_context(const std::vector<SearchResult> &results,
                                            size_t max_chars) {
  std::string context;
  for (size_t i = 0; i < results.size(); ++i) {
    if (i > 0)
      context += kBlockSeparator;
    const SearchResult &result = results[i];
    context += "Document: " + result.document.title + " (" + to_string(result.document.category) +
               ")\nContent: " + result.chunk.content;
  }

  auto it = context.begin();
  size_t count = 0;
  while (it != context.end() && count < max_chars) {
    utf8::next(it, context.end());
    ++count;
  }
  context.erase(it, context.end());
  return context;
}

}  // namespace docuchat_core
