#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "docuchat_core/llm/embedding_client.hpp"
#include "docuchat_core/store/chunk_store.hpp"

namespace docuchat_core {

// How a result set was produced
enum class RetrievalMode { Vector, Lexical, LexicalProxy };
std::string to_string(RetrievalMode mode);

struct RetrievalOutcome {
  std::vector<SearchResult> results;
  RetrievalMode mode = RetrievalMode::Lexical;
};

struct RetrievalOptions {
  size_t default_top_k = 5;
  size_t max_top_k = 50;
};

class RetrievalService {
 public:
  // embedding_client may be null, in which case every search is lexical
  RetrievalService(std::shared_ptr<ChunkStore> chunk_store,
                   std::shared_ptr<EmbeddingClient> embedding_client,
                   RetrievalOptions options = {});

  /**
   * Ranked chunks for the query, at most k of them, best first.
   *
   * Falls back to lexical matching when the query cannot be embedded or the store
   * holds no embedded chunks. Only a permanent embedding failure is raised.
   * @throws ValidationError on an empty query or a non-positive k
   */
  std::vector<SearchResult> search(const std::string &query, std::optional<int> k = std::nullopt);
  RetrievalOutcome search_detailed(const std::string &query, std::optional<int> k = std::nullopt);

  const RetrievalOptions &options() const {
    return options_;
  }

 private:
  size_t resolve_k(std::optional<int> k) const;
  std::optional<std::vector<float>> try_embed(const std::string &query) const;

  std::shared_ptr<ChunkStore> chunk_store_;
  std::shared_ptr<EmbeddingClient> embedding_client_;
  RetrievalOptions options_;
};

}  // namespace docuchat_core
