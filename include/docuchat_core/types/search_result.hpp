#pragma once

#include <string>
#include <vector>

#include "docuchat_core/types/chunk.hpp"
#include "docuchat_core/types/document.hpp"

namespace docuchat_core {

// Assembled at query time, never persisted
struct SearchResult {
  Chunk chunk;
  DocumentMetadata document;
  float similarity_score = 0.0f;
};

struct VectorQuery {
  std::vector<float> embedding;
  // Carried along so a backend without a vector index can rank lexically
  std::string text;
};

enum class VectorSearchStatus {
  Ok,
  NoEmbeddedChunks,
  LexicalProxy,
};

struct VectorSearchOutcome {
  VectorSearchStatus status = VectorSearchStatus::Ok;
  std::vector<SearchResult> results;
};

// Non-increasing score; ties by chunk index, upload time, document id, chunk id.
void sort_by_relevance(std::vector<SearchResult> &results);

}  // namespace docuchat_core
