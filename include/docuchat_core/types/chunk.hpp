#pragma once

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace docuchat_core {

struct Unembedded {};

struct Embedded {
  std::vector<float> values;
};

// A chunk either carries a vector of the deployment dimension or explicitly none.
using ChunkEmbedding = std::variant<Unembedded, Embedded>;

inline bool is_embedded(const ChunkEmbedding &embedding) {
  return std::holds_alternative<Embedded>(embedding);
}

// Output of the chunker, before it belongs to a stored document
struct TextChunk {
  std::string content;
  int chunk_index = 0;
};

struct ChunkDraft {
  std::string content;
  int chunk_index = 0;
  ChunkEmbedding embedding = Unembedded{};
};

struct Chunk {
  int64_t id = 0;
  std::string document_id;
  std::string content;
  int chunk_index = 0;
  ChunkEmbedding embedding = Unembedded{};
};

}  // namespace docuchat_core
