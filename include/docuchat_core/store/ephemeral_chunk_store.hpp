#pragma once

#include <map>
#include <shared_mutex>
#include <string>
#include <vector>

#include "docuchat_core/store/chunk_store.hpp"

namespace docuchat_core {

/**
 * In-process store used when no durable database is configured. Contents are lost
 * on exit. There is no vector index: vector_search ranks by the lexical proxy score
 * and reports VectorSearchStatus::LexicalProxy.
 */
class EphemeralChunkStore : public ChunkStore {
 public:
  explicit EphemeralChunkStore(int embedding_dimension = 384);

  std::string backend_name() const override {
    return "ephemeral";
  }

  void create_document(const Document &document) override;
  std::optional<Document> get_document(const std::string &document_id) override;
  bool has_document(const std::string &document_id) override;
  std::vector<DocumentMetadata> list_documents(
      const std::optional<std::string> &owner_id = std::nullopt) override;

  size_t put_chunks(const std::string &document_id, const std::vector<ChunkDraft> &chunks) override;
  std::vector<Chunk> get_chunks_by_document(const std::string &document_id) override;

  VectorSearchOutcome vector_search(const VectorQuery &query, size_t k) override;
  std::vector<SearchResult> lexical_search(const std::string &query_text, size_t k) override;

  void delete_document(const std::string &document_id) override;

 private:
  struct Entry {
    Document document;
    std::vector<Chunk> chunks;
  };

  int embedding_dimension_;
  mutable std::shared_mutex mutex_;
  std::map<std::string, Entry> entries_;
  int64_t next_chunk_id_ = 1;
};

}  // namespace docuchat_core
