#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "docuchat_core/types/search_result.hpp"

namespace docuchat_core {

class ContextAssembler {
 public:
  static constexpr const char *kBlockSeparator = "\n\n---\n\n";

  /**
   * @brief Formats results, in the order given, into the context handed to generation.
   * @param results Retrieved chunks; each becomes "Document: <title> (<category>)\nContent: <text>".
   * @param max_chars Hard cap in code points; everything past it is cut off.
   */
  static std::string build_context(const std::vector<SearchResult> &results, size_t max_chars);
};

}  // namespace docuchat_core
