#pragma once

#include <string>
#include <vector>

#include "docuchat_core/types/chunk.hpp"

namespace docuchat_core {

/**
 * Deterministic sliding-window splitter.
 *
 * Windows are measured in Unicode code points of UTF-8 input. Window i starts at
 * code point i * (window_size - overlap); splitting stops with the first window that
 * reaches the end of the text, so the last chunk may be shorter than the window.
 * Whitespace-only windows are dropped but keep their slot in the index sequence.
 */
class Chunker {
 public:
  // Throws ConfigurationError unless window_size > 0 and 0 <= overlap < window_size
  Chunker(int window_size, int overlap);

  // Throws ValidationError if text is not valid UTF-8
  std::vector<TextChunk> split(const std::string &text) const;

  static std::vector<TextChunk> chunk(const std::string &text, int window_size, int overlap);

  int window_size() const {
    return window_size_;
  }
  int overlap() const {
    return overlap_;
  }
  int step() const {
    return window_size_ - overlap_;
  }

 private:
  static bool is_blank(const std::string &text);

  int window_size_;
  int overlap_;
};

}  // namespace docuchat_core
