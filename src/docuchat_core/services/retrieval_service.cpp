#include "docuchat_core/services/retrieval_service.hpp"

#include <algorithm>
#include <iostream>

#include "docuchat_core/errors.hpp"

namespace docuchat_core {

std::string to_string(RetrievalMode mode) {
  switch (mode) {
    case RetrievalMode::Vector:
      return "vector";
    case RetrievalMode::Lexical:
      return "lexical";
    case RetrievalMode::LexicalProxy:
      return "lexical_proxy";
    default:
      return "unknown";
  }
}

RetrievalService::RetrievalService(std::shared_ptr<ChunkStore> chunk_store,
                                   std::shared_ptr<EmbeddingClient> embedding_client,
                                   RetrievalOptions options)
    : chunk_store_(std::move(chunk_store)),
      embedding_client_(std::move(embedding_client)),
      options_(options) {
  if (!chunk_store_) {
    throw ConfigurationError("RetrievalService requires a chunk store");
  }
  if (options_.default_top_k == 0 || options_.default_top_k > options_.max_top_k) {
    throw ConfigurationError("default_top_k must be in [1, max_top_k]");
  }
}

std::vector<SearchResult> RetrievalService::search(const std::string &query, std::optional<int> k) {
  return search_detailed(query, k).results;
}

RetrievalOutcome RetrievalService::search_detailed(const std::string &query,
                                                   std::optional<int> k) {
  if (query.find_first_not_of(" \t\r\n\f\v") == std::string::npos) {
    throw ValidationError("Search query must not be empty");
  }
  const size_t limit = resolve_k(k);

  RetrievalOutcome outcome;
  bool need_lexical = true;
  if (std::optional<std::vector<float>> embedding = try_embed(query)) {
    VectorSearchOutcome vector_outcome = chunk_store_->vector_search({std::move(*embedding), query}, limit);
    switch (vector_outcome.status) {
      case VectorSearchStatus::Ok:
        outcome.mode = RetrievalMode::Vector;
        outcome.results = std::move(vector_outcome.results);
        need_lexical = false;
        break;
      case VectorSearchStatus::LexicalProxy:
        outcome.mode = RetrievalMode::LexicalProxy;
        outcome.results = std::move(vector_outcome.results);
        need_lexical = false;
        break;
      case VectorSearchStatus::NoEmbeddedChunks:
        std::cerr << "Warning: no embedded chunks in the " << chunk_store_->backend_name()
                  << " store, falling back to lexical search" << std::endl;
        break;
    }
  }

  if (need_lexical) {
    outcome.mode = RetrievalMode::Lexical;
    outcome.results = chunk_store_->lexical_search(query, limit);
  }

  sort_by_relevance(outcome.results);
  if (outcome.results.size() > limit)
    outcome.results.resize(limit);
  return outcome;
}

size_t RetrievalService::resolve_k(std::optional<int> k) const {
  if (!k)
    return options_.default_top_k;
  if (*k <= 0) {
    throw ValidationError("k must be greater than 0, got " + std::to_string(*k));
  }
  return std::min(static_cast<size_t>(*k), options_.max_top_k);
}

std::optional<std::vector<float>> RetrievalService::try_embed(const std::string &query) const {
  if (!embedding_client_)
    return std::nullopt;
  try {
    return embedding_client_->embed_one(query);
  } catch (const TransientServiceError &e) {
    std::cerr << "Warning: query embedding failed, falling back to lexical search: " << e.what()
              << std::endl;
  } catch (const ValidationError &e) {
    std::cerr << "Warning: query cannot be embedded, falling back to lexical search: " << e.what()
              << std::endl;
  }
  return std::nullopt;
}

}  // namespace docuchat_core
