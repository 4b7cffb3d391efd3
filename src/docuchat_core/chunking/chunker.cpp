#include "docuchat_core/chunking/chunker.hpp"

#include <utf8.h>

#include <algorithm>
#include <cctype>

#include "docuchat_core/errors.hpp"

namespace docuchat_core {

Chunker::Chunker(int window_size, int overlap) : window_size_(window_size), overlap_(overlap) {
  if (window_size_ <= 0) {
    throw ConfigurationError("Chunk window size must be greater than 0, got " +
                             std::to_string(window_size_));
  }
  if (overlap_ < 0 || overlap_ >= window_size_) {
    throw ConfigurationError("Chunk overlap must satisfy 0 <= overlap < window size (overlap=" +
                             std::to_string(overlap_) +
                             ", window=" + std::to_string(window_size_) + ")");
  }
}

std::vector<TextChunk> Chunker::chunk(const std::string &text, int window_size, int overlap) {
  return Chunker(window_size, overlap).split(text);
}

std::vector<TextChunk> Chunker::split(const std::string &text) const {
  std::vector<TextChunk> out;
  if (text.empty())
    return out;

  if (!utf8::is_valid(text.begin(), text.end())) {
    throw ValidationError("Document text is not valid UTF-8");
  }

  // Byte offset of every code point, plus one past the end
  std::vector<size_t> offsets;
  offsets.reserve(text.size() + 1);
  for (auto it = text.begin(); it != text.end(); utf8::next(it, text.end())) {
    offsets.push_back(static_cast<size_t>(it - text.begin()));
  }
  const size_t length = offsets.size();
  offsets.push_back(text.size());

  const size_t stride = static_cast<size_t>(step());
  for (size_t start = 0; start < length; start += stride) {
    const size_t end = std::min(start + static_cast<size_t>(window_size_), length);
    std::string window = text.substr(offsets[start], offsets[end] - offsets[start]);
    if (!is_blank(window)) {
      out.push_back({std::move(window), static_cast<int>(start / stride)});
    }
    if (end == length)
      break;
  }
  return out;
}

bool Chunker::is_blank(const std::string &text) {
  return std::all_of(text.begin(), text.end(),
                     [](unsigned char c) { return c < 0x80 && std::isspace(c); });
}

}  // namespace docuchat_core
