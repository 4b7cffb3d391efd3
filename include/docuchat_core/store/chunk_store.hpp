#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "docuchat_core/types/chunk.hpp"
#include "docuchat_core/types/document.hpp"
#include "docuchat_core/types/search_result.hpp"

namespace docuchat_core {

/**
 * Storage for documents and their chunks.
 *
 * Implementations are interchangeable and safe for concurrent use. A document's
 * chunk set becomes visible all at once or not at all, and deleting a document
 * removes its chunks.
 */
class ChunkStore {
 public:
  virtual ~ChunkStore() = default;

  virtual std::string backend_name() const = 0;

  // Throws ConflictError if a document with the same id exists
  virtual void create_document(const Document &document) = 0;
  virtual std::optional<Document> get_document(const std::string &document_id) = 0;
  // Existence check that does not load the document body
  virtual bool has_document(const std::string &document_id) = 0;
  // Newest first
  virtual std::vector<DocumentMetadata> list_documents(
      const std::optional<std::string> &owner_id = std::nullopt) = 0;

  /**
   * Stores all chunks of one document atomically.
   * @return number of chunks stored
   * @throws NotFoundError if the document does not exist
   * @throws ConflictError on a duplicate chunk index
   * @throws ValidationError on an embedding of the wrong dimension
   */
  virtual size_t put_chunks(const std::string &document_id,
                            const std::vector<ChunkDraft> &chunks) = 0;

  // Ordered by chunk index; empty for an unknown document
  virtual std::vector<Chunk> get_chunks_by_document(const std::string &document_id) = 0;

  virtual VectorSearchOutcome vector_search(const VectorQuery &query, size_t k) = 0;
  virtual std::vector<SearchResult> lexical_search(const std::string &query_text, size_t k) = 0;

  // Throws NotFoundError if the document does not exist
  virtual void delete_document(const std::string &document_id) = 0;
};

}  // namespace docuchat_core
