#pragma once
#include <faiss/IndexFlat.h>
#include <faiss/IndexIDMap.h>

#include <chrono>
#include <memory>
#include <shared_mutex>
#include <string>
#include <vector>

#include "docuchat_core/db/database_manager.hpp"
#include "docuchat_core/store/chunk_store.hpp"

namespace docuchat_core {

/**
 * Encrypted SQLite store with an in-memory faiss index over chunk embeddings.
 *
 * Vectors are L2-normalised before they enter the index, so the exact L2 search
 * ranks by cosine similarity. The index is rebuilt from the database on
 * construction and kept in step with put_chunks and delete_document.
 */
class DurableChunkStore : public ChunkStore {
 public:
  DurableChunkStore(std::shared_ptr<DatabaseManager> db_manager, int embedding_dimension);
  ~DurableChunkStore() override = default;

  DurableChunkStore(const DurableChunkStore &) = delete;
  DurableChunkStore &operator=(const DurableChunkStore &) = delete;

  std::string backend_name() const override {
    return "durable";
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

  void rebuild_index();
  size_t indexed_vector_count() const;

 private:
  std::unique_ptr<faiss::IndexIDMap> create_index() const;
  // Fetches chunks joined with their documents in one query
  std::vector<SearchResult> fetch_joined(const std::vector<int64_t> &chunk_ids);

  ChunkEmbedding embedding_from_blob(int64_t chunk_id, const std::vector<char> &blob) const;
  static std::vector<char> embedding_to_blob(const std::vector<float> &values);

  static int64_t to_epoch_ms(const std::chrono::system_clock::time_point &tp);
  static std::chrono::system_clock::time_point from_epoch_ms(int64_t ms);

  std::shared_ptr<DatabaseManager> db_manager_;
  int embedding_dimension_;

  mutable std::shared_mutex index_mutex_;
  std::unique_ptr<faiss::IndexIDMap> index_;
};

}  // namespace docuchat_core
